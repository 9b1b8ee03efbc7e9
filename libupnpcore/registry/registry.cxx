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
#include "libupnpcore/config.h"

#include "libupnpcore/registry/registry.hxx"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include "libupnpcore/log.hxx"
#include "libupnpcore/upnpcore_p.hxx"

using namespace std;

namespace UPnPCore {

class Registry::Internal {
public:
    Internal(Registry *reg, const Options& opts)
        : registry(reg), options(opts), ns(opts.basePath) {
        if (!options.clock) {
            options.clock = &Clock::now;
        }
        if (options.maintenanceIntervalMillis <= 0) {
            options.maintenanceIntervalMillis = 1000;
        }
    }

    struct DeviceEntry {
        shared_ptr<Device> device;
        // Remote devices: lease
        int maxAgeSeconds{0};
        bool expires{false};
        Clock::time_point expiration;
    };

    struct ResourceEntry {
        shared_ptr<Resource> resource;
        // Root device UDN, empty for a free-standing resource
        UDN owner;
        bool expires{false};
        Clock::time_point expiration;
    };

    Clock::time_point now() const {
        return options.clock();
    }

    void setExpiration(DeviceEntry& entry, int maxage) {
        entry.maxAgeSeconds = options.remoteMaxAgeSeconds >= 0 ?
            options.remoteMaxAgeSeconds : maxage;
        entry.expires = entry.maxAgeSeconds > 0;
        if (entry.expires) {
            entry.expiration = now() + chrono::seconds(entry.maxAgeSeconds);
        }
    }

    void indexTree(const shared_ptr<Device>& root,
                   const vector<shared_ptr<Resource> >& resources);
    void unindexTree(const shared_ptr<Device>& root);
    void notify(const function<void (RegistryListener&)>& func);
    void maintainerLoop();

    Registry *registry;
    Options options;
    Namespace ns;

    // The registry state, all under this
    mutable std::mutex mutex;
    map<UDN, DeviceEntry> local;
    map<UDN, DeviceEntry> remote;
    // All devices, root and embedded
    map<UDN, shared_ptr<Device> > udnindex;
    multimap<DeviceType, shared_ptr<Device> > devtypeindex;
    multimap<ServiceType, shared_ptr<Device> > svctypeindex;
    map<string, ResourceEntry> resources;
    vector<shared_ptr<RegistryListener> > listeners;
    bool shuttingdown{false};

    std::thread maintainer;
    std::mutex thmutex;
    std::condition_variable thcond;
    bool stopping{false};
    bool paused{false};
};

static vector<shared_ptr<Device> > treeDevices(const shared_ptr<Device>& root)
{
    vector<shared_ptr<Device> > devices = root->findEmbeddedDevices();
    devices.insert(devices.begin(), root);
    return devices;
}

template <class K> static void eraseValue(
    multimap<K, shared_ptr<Device> >& index, const shared_ptr<Device>& dev)
{
    for (auto it = index.begin(); it != index.end();) {
        if (it->second == dev) {
            it = index.erase(it);
        } else {
            it++;
        }
    }
}

static string normalizePath(const string& path)
{
    if (path.size() > 1 && path.back() == '/')
        return path.substr(0, path.size() - 1);
    return path;
}

void Registry::Internal::indexTree(const shared_ptr<Device>& root,
                                   const vector<shared_ptr<Resource> >& res)
{
    for (const auto& dev : treeDevices(root)) {
        udnindex[dev->getUdn()] = dev;
        devtypeindex.insert(make_pair(dev->getType(), dev));
        set<ServiceType> seen;
        for (const auto& service : dev->getServices()) {
            if (seen.insert(service->getServiceType()).second) {
                svctypeindex.insert(make_pair(service->getServiceType(), dev));
            }
        }
    }
    for (const auto& resource : res) {
        ResourceEntry entry;
        entry.resource = resource;
        entry.owner = root->getUdn();
        resources[normalizePath(resource->getPath())] = entry;
    }
}

void Registry::Internal::unindexTree(const shared_ptr<Device>& root)
{
    for (const auto& dev : treeDevices(root)) {
        udnindex.erase(dev->getUdn());
        eraseValue(devtypeindex, dev);
        eraseValue(svctypeindex, dev);
    }
    for (auto it = resources.begin(); it != resources.end();) {
        if (it->second.owner == root->getUdn()) {
            it = resources.erase(it);
        } else {
            it++;
        }
    }
}

void Registry::Internal::notify(const function<void (RegistryListener&)>& func)
{
    vector<shared_ptr<RegistryListener> > current;
    {
        std::unique_lock<std::mutex> lock(mutex);
        current = listeners;
    }
    for (const auto& listener : current) {
        try {
            func(*listener);
        } catch (const std::exception& ex) {
            LOGERR("Registry: listener failed: " << ex.what() << "\n");
        }
    }
}

void Registry::Internal::maintainerLoop()
{
    LOGDEB("Registry: maintainer starting, interval " <<
           options.maintenanceIntervalMillis << " ms\n");
    std::unique_lock<std::mutex> lock(thmutex);
    for (;;) {
        thcond.wait_for(lock, chrono::milliseconds(
                            options.maintenanceIntervalMillis),
                        [this] {return stopping;});
        if (stopping) {
            break;
        }
        if (paused) {
            continue;
        }
        lock.unlock();
        registry->maintain();
        lock.lock();
    }
    LOGDEB("Registry: maintainer exiting\n");
}

Registry::Registry()
    : Registry(Options())
{
}

Registry::Registry(const Options& options)
{
    m = new Internal(this, options);
    if (m->options.startMaintainer) {
        m->maintainer = std::thread(&Internal::maintainerLoop, m);
    }
}

Registry::~Registry()
{
    shutdown();
    delete m;
}

const Registry::Options& Registry::getOptions() const
{
    return m->options;
}

const Namespace& Registry::getNamespace() const
{
    return m->ns;
}

void Registry::addListener(shared_ptr<RegistryListener> listener)
{
    if (!listener)
        return;
    std::unique_lock<std::mutex> lock(m->mutex);
    if (find(m->listeners.begin(), m->listeners.end(), listener) ==
        m->listeners.end()) {
        m->listeners.push_back(listener);
    }
}

void Registry::removeListener(shared_ptr<RegistryListener> listener)
{
    std::unique_lock<std::mutex> lock(m->mutex);
    m->listeners.erase(remove(m->listeners.begin(), m->listeners.end(),
                              listener), m->listeners.end());
}

vector<shared_ptr<RegistryListener> > Registry::getListeners() const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->listeners;
}

void Registry::notifyDiscoveryStart(shared_ptr<Device> device)
{
    m->notify([this, device](RegistryListener& l) {
            l.remoteDeviceDiscoveryStarted(*this, device);
        });
}

void Registry::notifyDiscoveryFailure(shared_ptr<Device> device,
                                      const string& reason)
{
    LOGINF("Registry: discovery failed for " <<
           (device ? device->getUdn().toString() : string("?")) << ": " <<
           reason << "\n");
    m->notify([this, device, &reason](RegistryListener& l) {
            l.remoteDeviceDiscoveryFailed(*this, device, reason);
        });
}

void Registry::addDevice(shared_ptr<Device> device)
{
    if (!device) {
        throw RegistrationException("Null device");
    }
    const UDN udn = device->getUdn();
    if (!device->isRoot()) {
        throw RegistrationException("Not a root device: " + udn.toString());
    }
    auto errors = device->validate();
    if (!errors.empty()) {
        throw RegistrationException("Device " + device->getDisplayString() +
                                    " failed validation", errors);
    }
    auto devices = treeDevices(device);
    auto resources = m->ns.getResources(device);

    bool refreshed = false;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (m->shuttingdown) {
            throw RegistrationException("Registry is shut down");
        }
        if (device->isRemote()) {
            for (const auto& dev : devices) {
                auto it = m->udnindex.find(dev->getUdn());
                if (it != m->udnindex.end() && it->second->isLocal()) {
                    LOGDEB("Registry: ignoring remote device with local UDN "
                           << dev->getUdn().toString() << "\n");
                    return;
                }
            }
            auto it = m->remote.find(udn);
            if (it != m->remote.end()) {
                LOGDEB1("Registry: refreshing " << udn.toString() << "\n");
                m->setExpiration(it->second,
                                 device->getIdentity().maxAgeSeconds);
                device = it->second.device;
                refreshed = true;
            }
        } else if (m->local.find(udn) != m->local.end()) {
            throw RegistrationException("Local device already registered: " +
                                        udn.toString());
        }

        if (!refreshed) {
            for (const auto& dev : devices) {
                if (m->udnindex.find(dev->getUdn()) != m->udnindex.end()) {
                    throw RegistrationException(
                        "UDN already registered: " + dev->getUdn().toString());
                }
            }
            for (const auto& resource : resources) {
                if (m->resources.find(normalizePath(resource->getPath())) !=
                    m->resources.end()) {
                    throw RegistrationException(
                        "Resource path already registered: " +
                        resource->getPath());
                }
            }
            Internal::DeviceEntry entry;
            entry.device = device;
            if (device->isRemote()) {
                m->setExpiration(entry, device->getIdentity().maxAgeSeconds);
                m->remote[udn] = entry;
            } else {
                m->local[udn] = entry;
            }
            m->indexTree(device, resources);
            LOGDEB("Registry: added " << (device->isRemote() ? "remote" :
                                          "local") << " device " <<
                   device->getDisplayString() << " " << udn.toString() <<
                   " with " << resources.size() << " resources\n");
        }
    }

    if (refreshed) {
        m->notify([this, device](RegistryListener& l) {
                l.remoteDeviceUpdated(*this, device);
            });
    } else if (device->isRemote()) {
        m->notify([this, device](RegistryListener& l) {
                l.remoteDeviceAdded(*this, device);
            });
    } else {
        m->notify([this, device](RegistryListener& l) {
                l.localDeviceAdded(*this, device);
            });
    }
}

bool Registry::update(const DeviceIdentity& identity)
{
    shared_ptr<Device> device;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        auto it = m->remote.find(identity.udn);
        if (it == m->remote.end()) {
            return false;
        }
        m->setExpiration(it->second, identity.maxAgeSeconds);
        device = it->second.device;
    }
    m->notify([this, device](RegistryListener& l) {
            l.remoteDeviceUpdated(*this, device);
        });
    return true;
}

bool Registry::removeDevice(shared_ptr<Device> device)
{
    if (!device) {
        return false;
    }
    return removeDevice(device->getUdn());
}

bool Registry::removeDevice(const UDN& udn)
{
    shared_ptr<Device> device;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        auto it = m->remote.find(udn);
        if (it != m->remote.end()) {
            device = it->second.device;
            m->remote.erase(it);
        } else if ((it = m->local.find(udn)) != m->local.end()) {
            device = it->second.device;
            m->local.erase(it);
        } else {
            LOGDEB1("Registry::removeDevice: " << udn.toString() <<
                    " not registered\n");
            return false;
        }
        m->unindexTree(device);
    }
    LOGDEB("Registry: removed device " << udn.toString() << "\n");
    if (device->isRemote()) {
        m->notify([this, device](RegistryListener& l) {
                l.remoteDeviceRemoved(*this, device);
            });
    } else {
        m->notify([this, device](RegistryListener& l) {
                l.localDeviceRemoved(*this, device);
            });
    }
    return true;
}

void Registry::removeAllLocalDevices()
{
    for (const auto& device : getLocalDevices()) {
        removeDevice(device->getUdn());
    }
}

void Registry::removeAllRemoteDevices()
{
    for (const auto& device : getRemoteDevices()) {
        removeDevice(device->getUdn());
    }
}

shared_ptr<Device> Registry::getDevice(const UDN& udn, bool rootOnly) const
{
    std::unique_lock<std::mutex> lock(m->mutex);
    auto it = m->udnindex.find(udn);
    if (it == m->udnindex.end() || (rootOnly && !it->second->isRoot())) {
        return shared_ptr<Device>();
    }
    return it->second;
}

shared_ptr<Device> Registry::getLocalDevice(const UDN& udn,
                                            bool rootOnly) const
{
    auto device = getDevice(udn, rootOnly);
    return device && device->isLocal() ? device : shared_ptr<Device>();
}

shared_ptr<Device> Registry::getRemoteDevice(const UDN& udn,
                                             bool rootOnly) const
{
    auto device = getDevice(udn, rootOnly);
    return device && device->isRemote() ? device : shared_ptr<Device>();
}

vector<shared_ptr<Device> > Registry::getDevices() const
{
    vector<shared_ptr<Device> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    for (const auto& ent : m->local) {
        out.push_back(ent.second.device);
    }
    for (const auto& ent : m->remote) {
        out.push_back(ent.second.device);
    }
    return out;
}

vector<shared_ptr<Device> > Registry::getLocalDevices() const
{
    vector<shared_ptr<Device> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    for (const auto& ent : m->local) {
        out.push_back(ent.second.device);
    }
    return out;
}

vector<shared_ptr<Device> > Registry::getRemoteDevices() const
{
    vector<shared_ptr<Device> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    for (const auto& ent : m->remote) {
        out.push_back(ent.second.device);
    }
    return out;
}

vector<shared_ptr<Device> > Registry::getDevices(const DeviceType& type) const
{
    vector<shared_ptr<Device> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    auto range = m->devtypeindex.equal_range(type);
    for (auto it = range.first; it != range.second; it++) {
        out.push_back(it->second);
    }
    return out;
}

vector<shared_ptr<Device> > Registry::getDevices(const ServiceType& type) const
{
    vector<shared_ptr<Device> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    auto range = m->svctypeindex.equal_range(type);
    for (auto it = range.first; it != range.second; it++) {
        out.push_back(it->second);
    }
    return out;
}

shared_ptr<Service> Registry::getService(const ServiceReference& ref) const
{
    auto device = getDevice(ref.getUdn(), false);
    if (!device) {
        return shared_ptr<Service>();
    }
    return device->getService(ref.getServiceId());
}

shared_ptr<Resource> Registry::getResource(const string& uri) const
{
    string path(uri);
    trimstring(path);
    if (urlisabsolute(path)) {
        string host = urlhost(path);
        if (host.empty() || m->options.host.empty() ||
            stringtolower(host) != stringtolower(m->options.host)) {
            throw std::invalid_argument("Resource URI is not on our host [" +
                                        m->options.host + "]: " + uri);
        }
        path = urlpath(path);
    }
    string::size_type pos = path.find_first_of("?#");
    if (pos != string::npos) {
        path.erase(pos);
    }
    if (path.empty() || path[0] != '/') {
        throw std::invalid_argument("Resource path is not absolute: " + uri);
    }
    path = normalizePath(path);

    std::unique_lock<std::mutex> lock(m->mutex);
    auto it = m->resources.find(path);
    if (it == m->resources.end()) {
        return shared_ptr<Resource>();
    }
    return it->second.resource;
}

vector<shared_ptr<Resource> > Registry::getResources() const
{
    vector<shared_ptr<Resource> > out;
    std::unique_lock<std::mutex> lock(m->mutex);
    for (const auto& ent : m->resources) {
        out.push_back(ent.second.resource);
    }
    return out;
}

void Registry::addResource(shared_ptr<Resource> resource, int maxAgeSeconds)
{
    if (!resource) {
        throw RegistrationException("Null resource");
    }
    string path = normalizePath(resource->getPath());
    if (path.empty() || path[0] != '/') {
        throw RegistrationException("Resource path is not absolute: " + path);
    }
    std::unique_lock<std::mutex> lock(m->mutex);
    auto it = m->resources.find(path);
    if (it != m->resources.end() && !it->second.owner.empty()) {
        throw RegistrationException("Resource path used by device " +
                                    it->second.owner.toString() + ": " + path);
    }
    Internal::ResourceEntry entry;
    entry.resource = resource;
    entry.expires = maxAgeSeconds > 0;
    if (entry.expires) {
        entry.expiration = m->now() + chrono::seconds(maxAgeSeconds);
    }
    m->resources[path] = entry;
    LOGDEB("Registry: added resource " << resource->dump() << "\n");
}

bool Registry::removeResource(shared_ptr<Resource> resource)
{
    if (!resource) {
        return false;
    }
    std::unique_lock<std::mutex> lock(m->mutex);
    auto it = m->resources.find(normalizePath(resource->getPath()));
    if (it == m->resources.end() || !it->second.owner.empty() ||
        it->second.resource != resource) {
        return false;
    }
    m->resources.erase(it);
    return true;
}

void Registry::pause()
{
    std::unique_lock<std::mutex> lock(m->thmutex);
    if (!m->paused) {
        LOGDEB("Registry: pausing maintenance\n");
        m->paused = true;
    }
}

void Registry::resume()
{
    std::unique_lock<std::mutex> lock(m->thmutex);
    if (m->paused) {
        LOGDEB("Registry: resuming maintenance\n");
        m->paused = false;
    }
}

bool Registry::isPaused() const
{
    std::unique_lock<std::mutex> lock(m->thmutex);
    return m->paused;
}

void Registry::maintain()
{
    vector<shared_ptr<Device> > expired;
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        auto now = m->now();
        for (auto it = m->remote.begin(); it != m->remote.end();) {
            if (it->second.expires && now > it->second.expiration) {
                LOGDEB("Registry: expired remote device " <<
                       it->first.toString() << " (max age " <<
                       it->second.maxAgeSeconds << " s)\n");
                expired.push_back(it->second.device);
                m->unindexTree(it->second.device);
                it = m->remote.erase(it);
            } else {
                it++;
            }
        }
        for (auto it = m->resources.begin(); it != m->resources.end();) {
            if (it->second.expires && now > it->second.expiration) {
                LOGDEB("Registry: expired resource " << it->first << "\n");
                it = m->resources.erase(it);
            } else {
                it++;
            }
        }
    }
    for (const auto& device : expired) {
        m->notify([this, device](RegistryListener& l) {
                l.remoteDeviceRemoved(*this, device);
            });
    }
}

void Registry::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (m->shuttingdown) {
            return;
        }
        m->shuttingdown = true;
    }
    LOGDEB("Registry: shutting down\n");
    m->notify([this](RegistryListener& l) {
            l.beforeShutdown(*this);
        });

    {
        std::unique_lock<std::mutex> lock(m->thmutex);
        m->stopping = true;
    }
    m->thcond.notify_all();
    if (m->maintainer.joinable()) {
        m->maintainer.join();
    }

    removeAllRemoteDevices();
    removeAllLocalDevices();
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        m->resources.clear();
    }
    m->notify([](RegistryListener& l) {
            l.afterShutdown();
        });
}

} // namespace UPnPCore
