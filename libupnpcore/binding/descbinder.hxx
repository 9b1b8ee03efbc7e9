/* Copyright (C) 2006-2024 J.F.Dockes
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 *   02110-1301 USA
 */
#ifndef _UPNPCORE_DESCBINDER_HXX_INCLUDED_
#define _UPNPCORE_DESCBINDER_HXX_INCLUDED_

/**
 * Device description documents: parsing into a Device tree, and
 * generation for our local devices.
 */

#include <memory>
#include <string>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/model/device.hxx"
#include "libupnpcore/registry/namespace.hxx"

namespace UPnPCore {

/**
 * Strict device description binder. Any document which is not
 * well-formed, or does not follow the UDA schema closely enough to
 * build a valid device tree, is rejected.
 *
 * The binder has no state, and a single object can be used from
 * several threads.
 */
class UPNPCORE_API DeviceDescriptorBinder {
public:
    DeviceDescriptorBinder() {}
    virtual ~DeviceDescriptorBinder() {}

    /** The UDA device description namespace */
    static const std::string DEVICE_NAMESPACE;
    static const std::string DLNA_NAMESPACE;

    /**
     * Build a remote device tree from a description document.
     *
     * @param identity from discovery: the maxAge and descriptorURL
     *   fields are used for all the tree devices, the UDNs come from
     *   the document. descriptorURL is the base for relative URLs if
     *   the document has no usable URLBase.
     * @param xml the document text, already decoded.
     * @return the root device, validated.
     * @throw DescriptorBindingException
     */
    virtual std::shared_ptr<Device> describe(const DeviceIdentity& identity,
                                             const std::string& xml) const;

    /** Render the description document for the tree containing
     * device. Local services and icons are given their paths inside
     * ns, remote ones keep their URLs. */
    std::string generate(const Device& device, const Namespace& ns) const;

protected:
    /** Parse and build, with or without the structural tolerances
     * (misnested service or device elements, missing service id,
     * bad URLBase) */
    std::shared_ptr<Device> bind(const DeviceIdentity& identity,
                                 const std::string& xml,
                                 bool recovering) const;
};

/**
 * Binder for the real world. A document rejected by the strict
 * binder is fixed up and retried, the fixes accumulating:
 *  - garbage before the XML declaration or the root element,
 *  - garbage after </root>,
 *  - unescaped '&',
 *  - missing default namespace on <root>,
 *  - undeclared namespace prefixes (dlna: and friends),
 * and the parse itself tolerates misnested service and device
 * elements, a missing serviceId (derived from the service type) and
 * an unusable URLBase.
 *
 * If nothing works, the exception from the first attempt is thrown.
 */
class UPNPCORE_API RecoveringDeviceDescriptorBinder
    : public DeviceDescriptorBinder {
public:
    std::shared_ptr<Device> describe(const DeviceIdentity& identity,
                                     const std::string& xml) const override;

    /** Maximum number of undeclared prefixes we are going to declare */
    static const int MAX_FIXED_PREFIXES = 5;

    /** The individual fixes. Each returns false if it did not apply
     * (and then leaves out alone). Public for testing. */
    static bool fixLeadingGarbage(const std::string& in, std::string& out);
    static bool fixTrailingGarbage(const std::string& in, std::string& out);
    static bool fixEntities(const std::string& in, std::string& out);
    static bool fixMissingNamespace(const std::string& in, std::string& out);
    static bool fixUndeclaredPrefixes(const std::string& in,
                                      std::string& out);
};

} // namespace UPnPCore

#endif /* _UPNPCORE_DESCBINDER_HXX_INCLUDED_ */
