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
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "libupnpcore/registry/registry.hxx"
#include "libupnpcore/registry/registrylistener.hxx"
#include "libupnpcore/registry/resource.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

#include "sampledevices.hxx"

using namespace UPnPCore;
using namespace SampleDevices;

namespace {

// Records the calls as "event udn" strings
class RecordingListener : public RegistryListener {
public:
    void remoteDeviceDiscoveryStarted(Registry&,
                                      std::shared_ptr<Device> dev) override {
        record("discoveryStarted", dev);
    }
    void remoteDeviceDiscoveryFailed(Registry&, std::shared_ptr<Device> dev,
                                     const std::string& reason) override {
        record("discoveryFailed", dev);
        lastReason = reason;
    }
    void remoteDeviceAdded(Registry&, std::shared_ptr<Device> dev) override {
        record("remoteAdded", dev);
    }
    void remoteDeviceUpdated(Registry&, std::shared_ptr<Device> dev) override {
        record("remoteUpdated", dev);
    }
    void remoteDeviceRemoved(Registry&, std::shared_ptr<Device> dev) override {
        record("remoteRemoved", dev);
    }
    void localDeviceAdded(Registry&, std::shared_ptr<Device> dev) override {
        record("localAdded", dev);
    }
    void localDeviceRemoved(Registry&, std::shared_ptr<Device> dev) override {
        record("localRemoved", dev);
    }
    void beforeShutdown(Registry& registry) override {
        std::unique_lock<std::mutex> lock(mutex);
        events.push_back("beforeShutdown");
        devicesAtShutdown = registry.getDevices().size();
    }
    void afterShutdown() override {
        std::unique_lock<std::mutex> lock(mutex);
        events.push_back("afterShutdown");
    }

    std::vector<std::string> getEvents() {
        std::unique_lock<std::mutex> lock(mutex);
        return events;
    }

    std::string lastReason;
    size_t devicesAtShutdown{0};

private:
    void record(const std::string& what, const std::shared_ptr<Device>& dev) {
        std::unique_lock<std::mutex> lock(mutex);
        events.push_back(what + " " +
                         (dev ? dev->getUdn().getIdentifierString() : "-"));
    }
    std::mutex mutex;
    std::vector<std::string> events;
};

class ThrowingListener : public DefaultRegistryListener {
public:
    void deviceAdded(Registry&, std::shared_ptr<Device>) override {
        throw std::runtime_error("listener failure");
    }
};

class CountingListener : public DefaultRegistryListener {
public:
    void deviceAdded(Registry&, std::shared_ptr<Device>) override {
        added++;
    }
    void deviceRemoved(Registry&, std::shared_ptr<Device>) override {
        removed++;
    }
    int added{0};
    int removed{0};
};

} // namespace

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = Registry::Clock::now();
        Registry::Options options;
        options.host = "10.0.0.2";
        options.port = 8080;
        options.startMaintainer = false;
        options.clock = [this] {return now;};
        registry.reset(new Registry(options));
        listener = std::make_shared<RecordingListener>();
        registry->addListener(listener);
    }

    void advance(int seconds) {
        now += std::chrono::seconds(seconds);
    }

    Registry::Clock::time_point now;
    std::unique_ptr<Registry> registry;
    std::shared_ptr<RecordingListener> listener;
};

TEST_F(RegistryTest, AddLocalDevice)
{
    auto device = makeDevice(false);
    registry->addDevice(device);

    EXPECT_EQ(device, registry->getDevice(UDN("MY-DEVICE-123"), true));
    EXPECT_EQ(device, registry->getLocalDevice(UDN("MY-DEVICE-123"), true));
    EXPECT_FALSE(registry->getRemoteDevice(UDN("MY-DEVICE-123"), false));
    EXPECT_EQ(1U, registry->getDevices().size());
    EXPECT_EQ(1U, registry->getLocalDevices().size());
    EXPECT_TRUE(registry->getRemoteDevices().empty());

    // Embedded devices are indexed but are not roots
    auto embedded = registry->getDevice(UDN("MY-DEVICE-123-EMBEDDED"), false);
    ASSERT_TRUE(embedded);
    EXPECT_FALSE(embedded->isRoot());
    EXPECT_FALSE(registry->getDevice(UDN("MY-DEVICE-123-EMBEDDED"), true));

    auto service = registry->getService(
        ServiceReference(UDN("MY-DEVICE-123"), UDAServiceId("MY-SERVICE-123")));
    ASSERT_TRUE(service);
    EXPECT_EQ(device->getServices()[0], service);
    EXPECT_TRUE(registry->getService(
                    ServiceReference(UDN("MY-DEVICE-123-EMBEDDED"),
                                     UDAServiceId("MY-SERVICE-456"))));
    // The embedded service is not on the root device
    EXPECT_FALSE(registry->getService(
                     ServiceReference(UDN("MY-DEVICE-123"),
                                      UDAServiceId("MY-SERVICE-456"))));

    ASSERT_EQ(1U, listener->getEvents().size());
    EXPECT_EQ("localAdded MY-DEVICE-123", listener->getEvents()[0]);
}

TEST_F(RegistryTest, FindByType)
{
    registry->addDevice(makeDevice(false));
    registry->addDevice(makeDevice(true, "OTHER-DEVICE"));

    EXPECT_EQ(2U, registry->getDevices(
                  UDADeviceType("MY-DEVICE-TYPE", 1)).size());
    EXPECT_EQ(2U, registry->getDevices(
                  UDADeviceType("MY-EMBEDDED-TYPE", 2)).size());
    // Exact match only
    EXPECT_TRUE(registry->getDevices(
                    UDADeviceType("MY-EMBEDDED-TYPE", 1)).empty());
    EXPECT_TRUE(registry->getDevices(
                    UDADeviceType("NO-SUCH-TYPE", 1)).empty());

    auto devices = registry->getDevices(
        UDAServiceType("MY-SERVICE-TYPE-TWO", 1));
    ASSERT_EQ(2U, devices.size());
    for (const auto& dev : devices) {
        EXPECT_FALSE(dev->isRoot());
    }
    registry->removeDevice(UDN("OTHER-DEVICE"));
    EXPECT_EQ(1U, registry->getDevices(
                  UDADeviceType("MY-DEVICE-TYPE", 1)).size());
    EXPECT_EQ(1U, registry->getDevices(
                  UDAServiceType("MY-SERVICE-TYPE-ONE", 1)).size());
}

TEST_F(RegistryTest, LocalDeviceResources)
{
    auto device = makeDevice(false);
    registry->addDevice(device);

    // Root description, icon, 3 per service
    EXPECT_EQ(8U, registry->getResources().size());
    EXPECT_EQ(2U, registry->getResources<ServiceControlResource>().size());

    auto desc = registry->getResource<DeviceDescriptorResource>(
        "/dev/MY-DEVICE-123/desc");
    ASSERT_TRUE(desc);
    EXPECT_EQ(device, desc->getDevice());
    std::string xml = desc->getDescriptor();
    EXPECT_NE(std::string::npos, xml.find("<UDN>uuid:MY-DEVICE-123</UDN>"));
    EXPECT_NE(std::string::npos, xml.find(
                  "<UDN>uuid:MY-DEVICE-123-EMBEDDED</UDN>"));
    EXPECT_NE(std::string::npos, xml.find(
                  "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/desc"));
    EXPECT_NE(std::string::npos, xml.find("/dev/MY-DEVICE-123/icon/0"));

    auto icon = registry->getResource<IconResource>(
        "/dev/MY-DEVICE-123/icon/0");
    ASSERT_TRUE(icon);
    EXPECT_EQ(48, icon->getIcon().width);

    auto scpd = registry->getResource<ServiceDescriptorResource>(
        "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/desc");
    ASSERT_TRUE(scpd);
    EXPECT_NE(std::string::npos, scpd->getDescriptor().find("SetVolume"));

    auto control = registry->getResource<ServiceControlResource>(
        "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/action");
    ASSERT_TRUE(control);
    EXPECT_EQ(device->getServices()[0], control->getService());

    EXPECT_TRUE(registry->getResource<ServiceEventSubscriptionResource>(
                    "/dev/MY-DEVICE-123-EMBEDDED/svc/upnp-org/"
                    "MY-SERVICE-456/event"));
    // Local services have no event callback
    EXPECT_FALSE(registry->getResource(
                     "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/"
                     "event/cb"));
    // Wrong type
    EXPECT_FALSE(registry->getResource<IconResource>(
                     "/dev/MY-DEVICE-123/desc"));
}

TEST_F(RegistryTest, ResourceLookupForms)
{
    registry->addDevice(makeDevice(false));

    EXPECT_TRUE(registry->getResource("/dev/MY-DEVICE-123/desc/"));
    EXPECT_TRUE(registry->getResource("/dev/MY-DEVICE-123/desc?x=1"));
    EXPECT_TRUE(registry->getResource(
                    "http://10.0.0.2:8080/dev/MY-DEVICE-123/desc"));
    EXPECT_FALSE(registry->getResource("/dev/MY-DEVICE-123/nothing"));
    EXPECT_FALSE(registry->getResource("http://10.0.0.2/nothing"));

    EXPECT_THROW(registry->getResource("http://host/invalid/absolute/URI"),
                 std::invalid_argument);
    EXPECT_THROW(registry->getResource("dev/MY-DEVICE-123/desc"),
                 std::invalid_argument);
    EXPECT_THROW(registry->getResource(""), std::invalid_argument);
}

TEST(RegistryNoHost, AbsoluteURIRejected)
{
    Registry::Options options;
    options.startMaintainer = false;
    Registry registry(options);
    registry.addDevice(makeDevice(false));
    EXPECT_TRUE(registry.getResource("/dev/MY-DEVICE-123/desc"));
    EXPECT_THROW(registry.getResource(
                     "http://10.0.0.2/dev/MY-DEVICE-123/desc"),
                 std::invalid_argument);
}

TEST(RegistryBasePath, PathsUseBase)
{
    Registry::Options options;
    options.basePath = "/upnp/";
    options.startMaintainer = false;
    Registry registry(options);
    EXPECT_EQ("/upnp", registry.getNamespace().getBasePath());
    EXPECT_EQ("/upnp/", registry.getOptions().basePath);
    EXPECT_EQ(1000, registry.getOptions().maintenanceIntervalMillis);
    EXPECT_TRUE(registry.getNamespace().isOurPath(
                    "/upnp/dev/MY-DEVICE-123/desc"));
    EXPECT_FALSE(registry.getNamespace().isOurPath("/other/dev/x"));
    registry.addDevice(makeDevice(false));
    EXPECT_TRUE(registry.getResource("/upnp/dev/MY-DEVICE-123/desc"));
    EXPECT_FALSE(registry.getResource("/dev/MY-DEVICE-123/desc"));
}

TEST_F(RegistryTest, RemoteDeviceResources)
{
    registry->addDevice(makeDevice(true));

    // Only the event callbacks of the two services
    EXPECT_EQ(2U, registry->getResources().size());
    auto callback = registry->getResource<ServiceEventCallbackResource>(
        "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/event/cb");
    ASSERT_TRUE(callback);
    EXPECT_EQ(Resource::SERVICE_EVENT_CALLBACK, callback->getKind());
    EXPECT_FALSE(registry->getResource("/dev/MY-DEVICE-123/desc"));

    auto device = registry->getDevice(UDN("MY-DEVICE-123"), true);
    ASSERT_TRUE(device);
    EXPECT_TRUE(registry->removeDevice(device));
    EXPECT_FALSE(registry->getDevice(UDN("MY-DEVICE-123"), true));
    EXPECT_FALSE(registry->getResource(
                     "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/"
                     "event/cb"));
    EXPECT_FALSE(registry->removeDevice(device));
    EXPECT_TRUE(registry->getDevices().empty());
    EXPECT_TRUE(registry->getResources().empty());
}

TEST_F(RegistryTest, DuplicateLocalDevice)
{
    registry->addDevice(makeDevice(false));
    EXPECT_THROW(registry->addDevice(makeDevice(false)),
                 RegistrationException);
    EXPECT_EQ(1U, registry->getDevices().size());
}

TEST_F(RegistryTest, Rejected)
{
    auto root = makeDevice(false);
    EXPECT_THROW(registry->addDevice(root->getEmbeddedDevices()[0]),
                 RegistrationException);
    EXPECT_THROW(registry->addDevice(std::shared_ptr<Device>()),
                 RegistrationException);

    auto broken = makeDevice(true, "BROKEN");
    broken->getServices()[0]->controlURL.clear();
    try {
        registry->addDevice(broken);
        FAIL() << "invalid device accepted";
    } catch (const RegistrationException& ex) {
        ASSERT_EQ(1U, ex.errors().size());
        EXPECT_EQ("controlURL", ex.errors()[0].propertyName);
    }

    // Embedded UDN used by another tree
    registry->addDevice(root);
    auto other = makeDevice(false, "OTHER");
    auto clash = std::make_shared<Device>(
        DeviceIdentity(UDN("MY-DEVICE-123-EMBEDDED")),
        UDADeviceType("MY-EMBEDDED-TYPE", 2), DeviceDetails(), false);
    other->addEmbeddedDevice(clash);
    EXPECT_THROW(registry->addDevice(other), RegistrationException);
    EXPECT_FALSE(registry->getDevice(UDN("OTHER"), false));

    EXPECT_EQ(1U, registry->getDevices().size());
    ASSERT_EQ(1U, listener->getEvents().size());
}

TEST_F(RegistryTest, RemoteWithLocalUDNIgnored)
{
    registry->addDevice(makeDevice(false));
    EXPECT_NO_THROW(registry->addDevice(makeDevice(true)));
    EXPECT_TRUE(registry->getRemoteDevices().empty());
    EXPECT_TRUE(registry->getLocalDevice(UDN("MY-DEVICE-123"), true));
    EXPECT_EQ(1U, listener->getEvents().size());
}

TEST_F(RegistryTest, RemoteReAddRefreshesLease)
{
    auto first = makeDevice(true, "MY-DEVICE-123", 100);
    registry->addDevice(first);
    advance(80);
    auto second = makeDevice(true, "MY-DEVICE-123", 100);
    registry->addDevice(second);

    // The first tree is kept
    EXPECT_EQ(first, registry->getRemoteDevice(UDN("MY-DEVICE-123"), true));
    auto events = listener->getEvents();
    ASSERT_EQ(2U, events.size());
    EXPECT_EQ("remoteAdded MY-DEVICE-123", events[0]);
    EXPECT_EQ("remoteUpdated MY-DEVICE-123", events[1]);

    advance(80);
    registry->maintain();
    EXPECT_TRUE(registry->getRemoteDevice(UDN("MY-DEVICE-123"), true));
    advance(21);
    registry->maintain();
    EXPECT_FALSE(registry->getRemoteDevice(UDN("MY-DEVICE-123"), true));
}

TEST_F(RegistryTest, Expiration)
{
    registry->addDevice(makeDevice(true, "MY-DEVICE-123", 1800));
    registry->addDevice(makeDevice(true, "FOREVER", 0));

    advance(1800);
    registry->maintain();
    EXPECT_EQ(2U, registry->getRemoteDevices().size());

    advance(1);
    registry->maintain();
    auto remaining = registry->getRemoteDevices();
    ASSERT_EQ(1U, remaining.size());
    EXPECT_EQ(UDN("FOREVER"), remaining[0]->getUdn());
    // The tree and its resources are gone
    EXPECT_FALSE(registry->getDevice(UDN("MY-DEVICE-123-EMBEDDED"), false));
    EXPECT_FALSE(registry->getResource(
                     "/dev/MY-DEVICE-123/svc/upnp-org/MY-SERVICE-123/"
                     "event/cb"));
    EXPECT_TRUE(registry->getDevices(
                    UDAServiceType("MY-SERVICE-TYPE-ONE", 1)).size() == 1);

    auto events = listener->getEvents();
    ASSERT_EQ(3U, events.size());
    EXPECT_EQ("remoteRemoved MY-DEVICE-123", events[2]);

    advance(1000000);
    registry->maintain();
    EXPECT_EQ(1U, registry->getRemoteDevices().size());
}

TEST_F(RegistryTest, Update)
{
    EXPECT_FALSE(registry->update(DeviceIdentity(UDN("MY-DEVICE-123"), 600)));
    registry->addDevice(makeDevice(true, "MY-DEVICE-123", 100));
    EXPECT_TRUE(registry->update(DeviceIdentity(UDN("MY-DEVICE-123"), 600)));

    advance(500);
    registry->maintain();
    EXPECT_TRUE(registry->getRemoteDevice(UDN("MY-DEVICE-123"), true));
    advance(101);
    registry->maintain();
    EXPECT_FALSE(registry->getRemoteDevice(UDN("MY-DEVICE-123"), true));

    auto events = listener->getEvents();
    ASSERT_EQ(3U, events.size());
    EXPECT_EQ("remoteUpdated MY-DEVICE-123", events[1]);
    EXPECT_EQ("remoteRemoved MY-DEVICE-123", events[2]);
}

TEST(RegistryMaxAge, OverrideFromOptions)
{
    auto now = Registry::Clock::now();
    Registry::Options options;
    options.startMaintainer = false;
    options.remoteMaxAgeSeconds = 0;
    options.clock = [&now] {return now;};
    Registry registry(options);
    registry.addDevice(makeDevice(true, "MY-DEVICE-123", 10));
    now += std::chrono::hours(24);
    registry.maintain();
    EXPECT_EQ(1U, registry.getRemoteDevices().size());
}

TEST_F(RegistryTest, RemoveDevice)
{
    auto local = makeDevice(false);
    registry->addDevice(local);
    registry->addDevice(makeDevice(true, "REMOTE"));

    // Embedded devices can't be removed alone
    EXPECT_FALSE(registry->removeDevice(UDN("MY-DEVICE-123-EMBEDDED")));
    EXPECT_TRUE(registry->removeDevice(local));
    EXPECT_FALSE(registry->removeDevice(local));
    EXPECT_FALSE(registry->removeDevice(UDN("NOT-THERE")));
    EXPECT_FALSE(registry->removeDevice(std::shared_ptr<Device>()));

    EXPECT_FALSE(registry->getDevice(UDN("MY-DEVICE-123"), false));
    EXPECT_FALSE(registry->getDevice(UDN("MY-DEVICE-123-EMBEDDED"), false));
    EXPECT_FALSE(registry->getResource("/dev/MY-DEVICE-123/desc"));
    EXPECT_TRUE(registry->getDevices(
                    UDADeviceType("MY-EMBEDDED-TYPE", 2)).size() == 1);

    // Can be added again
    registry->addDevice(makeDevice(false));
    registry->removeAllLocalDevices();
    EXPECT_TRUE(registry->getLocalDevices().empty());
    registry->removeAllRemoteDevices();
    EXPECT_TRUE(registry->getDevices().empty());
    EXPECT_TRUE(registry->getResources().empty());

    auto events = listener->getEvents();
    ASSERT_EQ(6U, events.size());
    EXPECT_EQ("localRemoved MY-DEVICE-123", events[2]);
    EXPECT_EQ("localRemoved MY-DEVICE-123", events[4]);
    EXPECT_EQ("remoteRemoved REMOTE", events[5]);
}

TEST_F(RegistryTest, FreeStandingResources)
{
    registry->addDevice(makeDevice(false));
    auto res = std::make_shared<Resource>("/custom/thing");
    registry->addResource(res, 60);
    auto permanent = std::make_shared<Resource>("/custom/permanent");
    registry->addResource(permanent);
    EXPECT_EQ(res, registry->getResource("/custom/thing"));
    EXPECT_EQ(Resource::OTHER, res->getKind());

    // Can't shadow a device resource
    EXPECT_THROW(registry->addResource(
                     std::make_shared<Resource>("/dev/MY-DEVICE-123/desc")),
                 RegistrationException);
    EXPECT_THROW(registry->addResource(
                     std::make_shared<Resource>("relative")),
                 RegistrationException);

    // Replacing a free-standing one is fine
    auto replacement = std::make_shared<Resource>("/custom/thing/");
    registry->addResource(replacement, 60);
    EXPECT_EQ(replacement, registry->getResource("/custom/thing"));
    EXPECT_FALSE(registry->removeResource(res));

    advance(61);
    registry->maintain();
    EXPECT_FALSE(registry->getResource("/custom/thing"));
    EXPECT_TRUE(registry->getResource("/custom/permanent"));
    EXPECT_TRUE(registry->getResource("/dev/MY-DEVICE-123/desc"));

    EXPECT_TRUE(registry->removeResource(permanent));
    EXPECT_FALSE(registry->getResource("/custom/permanent"));
    // Device resources go with the device only
    auto desc = registry->getResource("/dev/MY-DEVICE-123/desc");
    EXPECT_FALSE(registry->removeResource(desc));
}

TEST_F(RegistryTest, Listeners)
{
    auto counting = std::make_shared<CountingListener>();
    registry->addListener(counting);
    registry->addListener(counting);
    registry->addListener(std::make_shared<ThrowingListener>());
    EXPECT_EQ(3U, registry->getListeners().size());

    // A failing listener does not prevent the others from being called
    registry->addDevice(makeDevice(false));
    registry->addDevice(makeDevice(true, "REMOTE"));
    EXPECT_EQ(2, counting->added);
    EXPECT_EQ(2U, listener->getEvents().size());

    registry->removeListener(counting);
    registry->removeDevice(UDN("REMOTE"));
    EXPECT_EQ(0, counting->removed);
    EXPECT_EQ(2U, registry->getListeners().size());
}

TEST_F(RegistryTest, DiscoveryNotifications)
{
    auto device = makeDevice(true);
    registry->notifyDiscoveryStart(device);
    registry->notifyDiscoveryFailure(device, "bad descriptor");
    auto events = listener->getEvents();
    ASSERT_EQ(2U, events.size());
    EXPECT_EQ("discoveryStarted MY-DEVICE-123", events[0]);
    EXPECT_EQ("discoveryFailed MY-DEVICE-123", events[1]);
    EXPECT_EQ("bad descriptor", listener->lastReason);
    // Nothing registered
    EXPECT_TRUE(registry->getDevices().empty());
}

TEST_F(RegistryTest, PauseResume)
{
    EXPECT_FALSE(registry->isPaused());
    registry->pause();
    registry->pause();
    EXPECT_TRUE(registry->isPaused());
    registry->resume();
    EXPECT_FALSE(registry->isPaused());
}

TEST_F(RegistryTest, Shutdown)
{
    registry->addDevice(makeDevice(false));
    registry->addDevice(makeDevice(true, "REMOTE"));
    registry->addResource(std::make_shared<Resource>("/custom/thing"));

    registry->shutdown();
    EXPECT_TRUE(registry->getDevices().empty());
    EXPECT_TRUE(registry->getResources().empty());
    EXPECT_EQ(2U, listener->devicesAtShutdown);

    auto events = listener->getEvents();
    ASSERT_EQ(6U, events.size());
    EXPECT_EQ("beforeShutdown", events[2]);
    EXPECT_EQ("remoteRemoved REMOTE", events[3]);
    EXPECT_EQ("localRemoved MY-DEVICE-123", events[4]);
    EXPECT_EQ("afterShutdown", events[5]);

    EXPECT_THROW(registry->addDevice(makeDevice(false)),
                 RegistrationException);
    // Second call is a no-op
    registry->shutdown();
    EXPECT_EQ(6U, listener->getEvents().size());
}

TEST(RegistryMaintainer, ExpiresInBackground)
{
    std::mutex mutex;
    auto now = Registry::Clock::now();
    Registry::Options options;
    options.maintenanceIntervalMillis = 10;
    options.clock = [&mutex, &now] {
        std::unique_lock<std::mutex> lock(mutex);
        return now;
    };
    Registry registry(options);
    registry.addDevice(makeDevice(true, "MY-DEVICE-123", 5));
    {
        std::unique_lock<std::mutex> lock(mutex);
        now += std::chrono::seconds(6);
    }
    for (int i = 0; i < 500; i++) {
        if (registry.getRemoteDevices().empty())
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(registry.getRemoteDevices().empty());
    registry.shutdown();
}

// Each UDN has a single writer which bumps its generation before and
// after every add or remove. When a reader sees the same even
// generation around its lookups, the device, its callback resource and
// the service type index must agree.
TEST(RegistryConcurrency, IndicesStayCoherent)
{
    const int nwriters = 4;
    const int nreaders = 4;
    const int iterations = 200;
    Registry::Options options;
    options.host = "10.0.0.2";
    options.port = 8080;
    options.startMaintainer = false;
    Registry registry(options);

    std::vector<std::string> udns;
    for (int i = 0; i < nwriters; i++) {
        udns.push_back("DEV-" + std::to_string(i));
    }
    std::vector<std::atomic<unsigned int> > generations(nwriters);
    for (auto& gen : generations) {
        gen = 0;
    }
    std::atomic<bool> done(false);
    std::atomic<int> checked(0);
    std::atomic<int> incoherent(0);

    auto checkOne = [&](int i) {
        const std::string& udn = udns[i];
        unsigned int g1 = generations[i].load();
        if (g1 & 1) {
            return;
        }
        bool hasdev = registry.getDevice(UDN(udn), true) != nullptr;
        bool hascb = registry.getResource(
            "/dev/" + udn + "/svc/upnp-org/MY-SERVICE-123/event/cb") !=
            nullptr;
        bool hastype = false;
        for (const auto& dev : registry.getDevices(
                 UDAServiceType("MY-SERVICE-TYPE-ONE", 1))) {
            if (dev->getUdn() == UDN(udn)) {
                hastype = true;
            }
        }
        if (generations[i].load() != g1) {
            return;
        }
        checked++;
        if (hasdev != hascb || hasdev != hastype) {
            incoherent++;
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < nwriters; i++) {
        threads.emplace_back([&, i] {
            for (int j = 0; j < iterations; j++) {
                generations[i]++;
                if (j % 2 == 0) {
                    registry.addDevice(makeDevice(true, udns[i]));
                } else if (!registry.removeDevice(UDN(udns[i]))) {
                    incoherent++;
                }
                generations[i]++;
            }
        });
    }
    std::vector<std::thread> readers;
    for (int r = 0; r < nreaders; r++) {
        readers.emplace_back([&] {
            while (!done) {
                for (int i = 0; i < nwriters; i++) {
                    checkOne(i);
                }
            }
            // Writers are finished, this pass always counts
            for (int i = 0; i < nwriters; i++) {
                checkOne(i);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    done = true;
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(0, incoherent.load());
    EXPECT_GE(checked.load(), nreaders * nwriters);
    // Even iteration count: every device was removed last
    EXPECT_TRUE(registry.getDevices().empty());
    EXPECT_TRUE(registry.getResources().empty());
    registry.shutdown();
}
