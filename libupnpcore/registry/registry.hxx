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
#ifndef _UPNPCORE_REGISTRY_HXX_INCLUDED_
#define _UPNPCORE_REGISTRY_HXX_INCLUDED_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/model/device.hxx"
#include "libupnpcore/registry/namespace.hxx"
#include "libupnpcore/registry/registrylistener.hxx"
#include "libupnpcore/registry/resource.hxx"

namespace UPnPCore {

/**
 * Directory of our local devices and of the remote devices we know
 * about, with their resources.
 *
 * Only root devices are added and removed, the embedded devices and
 * the services come along. All the lookup structures (by UDN, by
 * device type, by service type, by resource path) are updated together
 * under a single lock, so a reader never sees a device in one and not
 * in another.
 *
 * Remote devices expire when their lease (max-age) runs out without
 * an update(). A maintainer thread does the periodic sweep, unless
 * disabled in the options, in which case maintain() must be called.
 *
 * Lookups return null pointers or empty vectors when nothing matches.
 */
class UPNPCORE_API Registry {
public:
    typedef std::chrono::steady_clock Clock;

    struct Options {
        /** The host we serve resources on. Absolute URIs given to
         * getResource() must use it */
        std::string host;
        int port{0};
        /** Prefix for all our resource paths, e.g. "/upnp" */
        std::string basePath;
        /** Maintainer sweep interval */
        int maintenanceIntervalMillis{1000};
        /** If >= 0, use this instead of the remote devices leases */
        int remoteMaxAgeSeconds{-1};
        bool startMaintainer{true};
        /** Time source, for testing. Default: Clock::now */
        std::function<Clock::time_point ()> clock;
    };

    Registry();
    explicit Registry(const Options& options);
    /** Calls shutdown() */
    ~Registry();
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    const Options& getOptions() const;
    const Namespace& getNamespace() const;

    void addListener(std::shared_ptr<RegistryListener> listener);
    void removeListener(std::shared_ptr<RegistryListener> listener);
    std::vector<std::shared_ptr<RegistryListener> > getListeners() const;

    /** Relay discovery progress for a remote device to the listeners */
    void notifyDiscoveryStart(std::shared_ptr<Device> device);
    void notifyDiscoveryFailure(std::shared_ptr<Device> device,
                                const std::string& reason);

    /**
     * Add a root device. A remote device which is already there
     * (same root UDN) just gets its lease refreshed. A remote device
     * with the UDN of one of our local devices is ignored.
     *
     * @throw RegistrationException if the device is not a root device,
     *   does not validate, is local and already registered, has a UDN
     *   already used in another tree, or would use a resource path
     *   which is already taken.
     */
    void addDevice(std::shared_ptr<Device> device);

    /** Refresh the lease of a remote root device, using the identity
     * maxAge. @return false if the device is unknown. */
    bool update(const DeviceIdentity& identity);

    /** Remove a root device and its tree. Removing a device which is
     * not registered is a no-op. @return true if something was
     * removed */
    bool removeDevice(std::shared_ptr<Device> device);
    bool removeDevice(const UDN& udn);
    void removeAllLocalDevices();
    void removeAllRemoteDevices();

    /** Device (root or embedded unless rootOnly) by UDN */
    std::shared_ptr<Device> getDevice(const UDN& udn, bool rootOnly) const;
    std::shared_ptr<Device> getLocalDevice(const UDN& udn,
                                           bool rootOnly) const;
    std::shared_ptr<Device> getRemoteDevice(const UDN& udn,
                                            bool rootOnly) const;
    /** Root devices */
    std::vector<std::shared_ptr<Device> > getDevices() const;
    std::vector<std::shared_ptr<Device> > getLocalDevices() const;
    std::vector<std::shared_ptr<Device> > getRemoteDevices() const;
    /** Devices, root or embedded, of exactly this type */
    std::vector<std::shared_ptr<Device> > getDevices(
        const DeviceType& type) const;
    /** Devices, root or embedded, with a service of exactly this type */
    std::vector<std::shared_ptr<Device> > getDevices(
        const ServiceType& type) const;
    std::shared_ptr<Service> getService(const ServiceReference& ref) const;

    /**
     * Look up a resource by path (/dev/...) or by absolute URI on our
     * host. A trailing slash is ignored.
     *
     * @return the resource or null if there is none at this path.
     * @throw std::invalid_argument for an absolute URI on another host
     *   or a relative reference which is not an absolute path.
     */
    std::shared_ptr<Resource> getResource(const std::string& uri) const;
    /** Same, null also if the resource is not a T */
    template <class T> std::shared_ptr<T> getResource(
        const std::string& uri) const {
        return std::dynamic_pointer_cast<T>(getResource(uri));
    }
    std::vector<std::shared_ptr<Resource> > getResources() const;
    template <class T> std::vector<std::shared_ptr<T> > getResources() const {
        std::vector<std::shared_ptr<T> > out;
        for (const auto& res : getResources()) {
            auto tres = std::dynamic_pointer_cast<T>(res);
            if (tres)
                out.push_back(tres);
        }
        return out;
    }

    /** Add a free-standing resource, replacing a free-standing one at
     * the same path. It is removed by the maintenance after
     * maxAgeSeconds if this is > 0.
     * @throw RegistrationException if a device resource has the path */
    void addResource(std::shared_ptr<Resource> resource,
                     int maxAgeSeconds = 0);
    bool removeResource(std::shared_ptr<Resource> resource);

    /** Suspend/restart the periodic maintenance */
    void pause();
    void resume();
    bool isPaused() const;

    /** Run one maintenance sweep: expire remote devices and
     * resources */
    void maintain();

    /** Stop the maintainer and remove all devices, notifying the
     * listeners. Further calls do nothing. */
    void shutdown();

    class Internal;
private:
    Internal *m{nullptr};
};

} // namespace UPnPCore

#endif /* _UPNPCORE_REGISTRY_HXX_INCLUDED_ */
