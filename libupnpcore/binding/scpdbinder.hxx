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
#ifndef _UPNPCORE_SCPDBINDER_HXX_INCLUDED_
#define _UPNPCORE_SCPDBINDER_HXX_INCLUDED_

#include <memory>
#include <string>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/model/service.hxx"

namespace UPnPCore {

/**
 * Service description (SCPD) documents: parse the action list and the
 * state table, and generate the document for a service.
 */
class UPNPCORE_API ServiceDescriptorBinder {
public:
    static const std::string SERVICE_NAMESPACE;

    /**
     * Describe a service from its SCPD document.
     *
     * @param undescribed the service as known from the device
     *    description: type, id and URLs are copied from it.
     * @return a new described service, not attached to a device. Use
     *    Device::replaceService() to install it.
     * @throw DescriptorBindingException if the document can't be parsed
     *    or the result does not validate.
     */
    std::shared_ptr<Service> describe(const Service& undescribed,
                                      const std::string& xml) const;

    std::string generate(const Service& service) const;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_SCPDBINDER_HXX_INCLUDED_ */
