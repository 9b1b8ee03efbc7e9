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
#ifndef _UPNPCORE_NAMESPACE_HXX_INCLUDED_
#define _UPNPCORE_NAMESPACE_HXX_INCLUDED_

#include <memory>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

class Device;
class Service;
class Resource;

/**
 * Builds the URI paths for the resources of our devices and for the
 * event callbacks of the remote services we use:
 *
 *  <base>/dev/<udn>/desc                        root device description
 *  <base>/dev/<udn>/icon/<n>                    icons
 *  <base>/dev/<udn>/svc/<ns>/<id>/desc          service description
 *  <base>/dev/<udn>/svc/<ns>/<id>/action        control
 *  <base>/dev/<udn>/svc/<ns>/<id>/event         event subscription
 *  <base>/dev/<udn>/svc/<ns>/<id>/event/cb      remote service events
 *
 * <udn> is the UDN identifier without "uuid:", <ns> and <id> are the
 * service id namespace and id. Segments are percent-encoded as needed.
 */
class UPNPCORE_API Namespace {
public:
    explicit Namespace(const std::string& basePath = std::string());

    /** Normalized: empty or "/something" without a trailing slash */
    const std::string& getBasePath() const {
        return m_base;
    }

    std::string getPath(const Device& device) const;
    /** The service must belong to a device, else this returns "" */
    std::string getPath(const Service& service) const;
    /** Description of the root of the tree the device belongs to */
    std::string getDescriptorPath(const Device& device) const;
    std::string getDescriptorPath(const Service& service) const;
    std::string getControlPath(const Service& service) const;
    std::string getEventSubscriptionPath(const Service& service) const;
    std::string getEventCallbackPath(const Service& service) const;
    std::string getIconPath(const Device& device, size_t index) const;

    /** Paths under our namespace (e.g. for a request dispatcher) */
    bool isOurPath(const std::string& path) const;

    /** Compute the resources of a whole tree. Local devices: root
     * description, icons, service description, control and event
     * subscription. Remote devices: the event callbacks. */
    std::vector<std::shared_ptr<Resource> > getResources(
        const std::shared_ptr<Device>& root) const;

    static const std::string DEVICE;
    static const std::string SERVICE;
    static const std::string ICON;
    static const std::string CONTROL;
    static const std::string EVENTS;
    static const std::string DESCRIPTOR_FILE;
    static const std::string CALLBACK_FILE;

    /** Percent-encode what is not allowed in a path segment */
    static std::string encodeSegment(const std::string& in);

private:
    void collectResources(const std::shared_ptr<Device>& device,
                          std::vector<std::shared_ptr<Resource> >& out)
        const;
    std::string m_base;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_NAMESPACE_HXX_INCLUDED_ */
