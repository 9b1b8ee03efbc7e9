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
#ifndef _UPNPCORE_RESOURCE_HXX_INCLUDED_
#define _UPNPCORE_RESOURCE_HXX_INCLUDED_

#include <memory>
#include <string>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/model/device.hxx"
#include "libupnpcore/registry/namespace.hxx"

namespace UPnPCore {

/**
 * Something addressable by an URI path on our side: a description
 * document we serve, a control or eventing endpoint, or an event
 * callback for a remote service we subscribed to.
 *
 * The registry derives the resources of a device tree from its
 * Namespace when the device is added. Free-standing resources can be
 * added directly, for paths the application serves itself.
 */
class UPNPCORE_API Resource {
public:
    enum Kind {DEVICE_DESCRIPTOR, ICON, SERVICE_DESCRIPTOR, SERVICE_CONTROL,
               SERVICE_EVENT_SUBSCRIPTION, SERVICE_EVENT_CALLBACK, OTHER};

    explicit Resource(const std::string& path, Kind kind = OTHER)
        : m_path(path), m_kind(kind) {}
    virtual ~Resource() {}

    const std::string& getPath() const {
        return m_path;
    }
    Kind getKind() const {
        return m_kind;
    }

    /** Exact path match. A trailing slash on either side is ignored */
    bool matches(const std::string& path) const;

    virtual std::string dump() const;

    static const char *kindName(Kind kind);

private:
    std::string m_path;
    Kind m_kind;
};

/** Resources belonging to a device */
class UPNPCORE_API DeviceResource : public Resource {
public:
    DeviceResource(const std::string& path, Kind kind,
                   std::shared_ptr<Device> device)
        : Resource(path, kind), m_device(device) {}
    const std::shared_ptr<Device>& getDevice() const {
        return m_device;
    }
    std::string dump() const override;
private:
    std::shared_ptr<Device> m_device;
};

/** The description document of a local root device. getDescriptor()
 * renders the XML for the whole tree. */
class UPNPCORE_API DeviceDescriptorResource : public DeviceResource {
public:
    DeviceDescriptorResource(const std::string& path,
                             std::shared_ptr<Device> device,
                             const Namespace& ns)
        : DeviceResource(path, DEVICE_DESCRIPTOR, device), m_namespace(ns) {}
    std::string getDescriptor() const;
private:
    Namespace m_namespace;
};

class UPNPCORE_API IconResource : public DeviceResource {
public:
    IconResource(const std::string& path, std::shared_ptr<Device> device,
                 const Icon& icon)
        : DeviceResource(path, ICON, device), m_icon(icon) {}
    const Icon& getIcon() const {
        return m_icon;
    }
private:
    Icon m_icon;
};

/** Resources belonging to a service */
class UPNPCORE_API ServiceResource : public Resource {
public:
    ServiceResource(const std::string& path, Kind kind,
                    std::shared_ptr<Service> service)
        : Resource(path, kind), m_service(service) {}
    const std::shared_ptr<Service>& getService() const {
        return m_service;
    }
    std::string dump() const override;
private:
    std::shared_ptr<Service> m_service;
};

class UPNPCORE_API ServiceDescriptorResource : public ServiceResource {
public:
    ServiceDescriptorResource(const std::string& path,
                              std::shared_ptr<Service> service)
        : ServiceResource(path, SERVICE_DESCRIPTOR, service) {}
    /** SCPD XML for the service */
    std::string getDescriptor() const;
};

class UPNPCORE_API ServiceControlResource : public ServiceResource {
public:
    ServiceControlResource(const std::string& path,
                           std::shared_ptr<Service> service)
        : ServiceResource(path, SERVICE_CONTROL, service) {}
};

class UPNPCORE_API ServiceEventSubscriptionResource : public ServiceResource {
public:
    ServiceEventSubscriptionResource(const std::string& path,
                                     std::shared_ptr<Service> service)
        : ServiceResource(path, SERVICE_EVENT_SUBSCRIPTION, service) {}
};

/** Where a remote service sends its events to us */
class UPNPCORE_API ServiceEventCallbackResource : public ServiceResource {
public:
    ServiceEventCallbackResource(const std::string& path,
                                 std::shared_ptr<Service> service)
        : ServiceResource(path, SERVICE_EVENT_CALLBACK, service) {}
};

} // namespace UPnPCore

#endif /* _UPNPCORE_RESOURCE_HXX_INCLUDED_ */
