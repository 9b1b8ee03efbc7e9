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
#ifndef _UPNPCORE_REGISTRYLISTENER_HXX_INCLUDED_
#define _UPNPCORE_REGISTRYLISTENER_HXX_INCLUDED_

#include <memory>
#include <string>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

class Device;
class Registry;

/**
 * Registry event interface. The calls are made from the thread which
 * performed the change (the maintainer thread for expirations), never
 * with the registry lock held, so that a listener can call back into
 * the registry.
 *
 * Exceptions thrown by a listener are logged and otherwise ignored.
 */
class UPNPCORE_API RegistryListener {
public:
    virtual ~RegistryListener() {}

    /** A remote device was discovered and its description is being
     * retrieved */
    virtual void remoteDeviceDiscoveryStarted(
        Registry& registry, std::shared_ptr<Device> device) = 0;
    /** Retrieving or binding the description failed */
    virtual void remoteDeviceDiscoveryFailed(
        Registry& registry, std::shared_ptr<Device> device,
        const std::string& reason) = 0;
    virtual void remoteDeviceAdded(Registry& registry,
                                   std::shared_ptr<Device> device) = 0;
    /** Lease refresh */
    virtual void remoteDeviceUpdated(Registry& registry,
                                     std::shared_ptr<Device> device) = 0;
    /** Removed, expired, or registry shutdown */
    virtual void remoteDeviceRemoved(Registry& registry,
                                     std::shared_ptr<Device> device) = 0;
    virtual void localDeviceAdded(Registry& registry,
                                  std::shared_ptr<Device> device) = 0;
    virtual void localDeviceRemoved(Registry& registry,
                                    std::shared_ptr<Device> device) = 0;
    /** Devices are still there at this point */
    virtual void beforeShutdown(Registry& registry) = 0;
    virtual void afterShutdown() = 0;
};

/**
 * Convenience listener: no-op discovery and shutdown handlers, local
 * and remote additions and removals folded into deviceAdded() and
 * deviceRemoved().
 */
class UPNPCORE_API DefaultRegistryListener : public RegistryListener {
public:
    void remoteDeviceDiscoveryStarted(Registry&,
                                      std::shared_ptr<Device>) override {}
    void remoteDeviceDiscoveryFailed(Registry&, std::shared_ptr<Device>,
                                     const std::string&) override {}
    void remoteDeviceAdded(Registry& registry,
                           std::shared_ptr<Device> device) override {
        deviceAdded(registry, device);
    }
    void remoteDeviceUpdated(Registry&, std::shared_ptr<Device>) override {}
    void remoteDeviceRemoved(Registry& registry,
                             std::shared_ptr<Device> device) override {
        deviceRemoved(registry, device);
    }
    void localDeviceAdded(Registry& registry,
                          std::shared_ptr<Device> device) override {
        deviceAdded(registry, device);
    }
    void localDeviceRemoved(Registry& registry,
                            std::shared_ptr<Device> device) override {
        deviceRemoved(registry, device);
    }
    void beforeShutdown(Registry&) override {}
    void afterShutdown() override {}

    virtual void deviceAdded(Registry&, std::shared_ptr<Device>) {}
    virtual void deviceRemoved(Registry&, std::shared_ptr<Device>) {}
};

} // namespace UPnPCore

#endif /* _UPNPCORE_REGISTRYLISTENER_HXX_INCLUDED_ */
