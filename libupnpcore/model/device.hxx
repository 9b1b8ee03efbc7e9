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
#ifndef _UPNPCORE_DEVICE_HXX_INCLUDED_
#define _UPNPCORE_DEVICE_HXX_INCLUDED_

#include <memory>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/types/upnptypes.hxx"
#include "libupnpcore/model/service.hxx"

namespace UPnPCore {

/** UPnP Device Architecture version from the specVersion element */
struct UPNPCORE_API UDAVersion {
    int majorVersion{1};
    int minorVersion{0};
    std::vector<ValidationError> validate() const;
};

struct UPNPCORE_API Icon {
    std::string mimeType;
    int width{0};
    int height{0};
    int depth{0};
    // Absolute for remote devices, relative to the device for local ones
    std::string url;

    std::vector<ValidationError> validate() const;
};

/** Descriptive data from the device description */
struct UPNPCORE_API DeviceDetails {
    /// URLBase element, or what we used in its place
    std::string baseURL;
    std::string friendlyName;
    std::string manufacturer;
    std::string manufacturerURL;
    std::string modelName;
    std::string modelDescription;
    std::string modelNumber;
    std::string modelURL;
    std::string serialNumber;
    std::string upc;
    std::string presentationURL;
    /// dlna:X_DLNADOC values, e.g. DMS-1.50
    std::vector<std::string> dlnaDocs;
    /// dlna:X_DLNACAP value
    std::string dlnaCaps;

    std::vector<ValidationError> validate() const;
};

/**
 * Identity of a device. For remote devices, the lease length
 * (max-age) comes from the discovery message, and descriptorURL is
 * where the description was fetched from. Local devices use maxAge
 * for their own announcements.
 */
struct UPNPCORE_API DeviceIdentity {
    DeviceIdentity() {}
    DeviceIdentity(const UDN& u, int maxage = 1800,
                   const std::string& descurl = std::string())
        : udn(u), maxAgeSeconds(maxage), descriptorURL(descurl) {}

    UDN udn;
    int maxAgeSeconds{1800};
    std::string descriptorURL;
};

/**
 * A local or remote device. Devices form a tree: a root device owns its
 * embedded devices and its services. Build the tree with
 * addService()/addEmbeddedDevice() on shared_ptr-managed objects
 * (std::make_shared), then treat it as immutable.
 *
 * The find*() helpers walk this device and its embedded devices,
 * depth first, and match types with implementsVersion().
 */
class UPNPCORE_API Device : public std::enable_shared_from_this<Device> {
public:
    Device(const DeviceIdentity& identity, const DeviceType& type,
           const DeviceDetails& details, bool remote,
           const UDAVersion& version = UDAVersion())
        : m_identity(identity), m_type(type), m_details(details),
          m_remote(remote), m_version(version) {}
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const DeviceIdentity& getIdentity() const {
        return m_identity;
    }
    const UDN& getUdn() const {
        return m_identity.udn;
    }
    const DeviceType& getType() const {
        return m_type;
    }
    const DeviceDetails& getDetails() const {
        return m_details;
    }
    const UDAVersion& getVersion() const {
        return m_version;
    }
    bool isRemote() const {
        return m_remote;
    }
    bool isLocal() const {
        return !m_remote;
    }

    void addIcon(const Icon& icon) {
        m_icons.push_back(icon);
    }
    const std::vector<Icon>& getIcons() const {
        return m_icons;
    }

    void addService(std::shared_ptr<Service> service);
    /** Replace the service with the same id, e.g. by a copy described
     * from its SCPD. @return false if there is no such service */
    bool replaceService(std::shared_ptr<Service> service);
    const std::vector<std::shared_ptr<Service> >& getServices() const {
        return m_services;
    }
    bool hasServices() const {
        return !m_services.empty();
    }

    void addEmbeddedDevice(std::shared_ptr<Device> device);
    const std::vector<std::shared_ptr<Device> >& getEmbeddedDevices() const {
        return m_embedded;
    }
    bool hasEmbeddedDevices() const {
        return !m_embedded.empty();
    }

    bool isRoot() const {
        return !m_isembedded;
    }
    std::shared_ptr<Device> getParentDevice() const {
        return m_parent.lock();
    }
    std::shared_ptr<Device> getRoot();
    std::shared_ptr<const Device> getRoot() const;

    /** This device or a descendant with the given UDN */
    std::shared_ptr<Device> findDevice(const UDN& udn);
    /** All descendants, not including this */
    std::vector<std::shared_ptr<Device> > findEmbeddedDevices();
    std::vector<std::shared_ptr<Device> > findDevices(const DeviceType& tp);
    /** Devices having a service implementing the type */
    std::vector<std::shared_ptr<Device> > findDevices(const ServiceType& tp);
    /** All the services of the tree */
    std::vector<std::shared_ptr<Service> > findServices() const;
    std::vector<std::shared_ptr<Service> > findServices(
        const ServiceType& tp) const;
    std::shared_ptr<Service> findService(const ServiceId& id) const;
    /** Service of this device only (no descent) */
    std::shared_ptr<Service> getService(const ServiceId& id) const;
    std::vector<Icon> findIcons() const;

    /** Check this device and the tree below it. */
    std::vector<ValidationError> validate() const;

    /** friendlyName, or model name and number, or the device type */
    std::string getDisplayString() const;
    std::string dump() const;

private:
    void collectDevices(std::vector<std::shared_ptr<Device> >& out);
    void validateTree(std::vector<ValidationError>& errors) const;
    void collectUdns(std::vector<UDN>& udns) const;

    DeviceIdentity m_identity;
    DeviceType m_type;
    DeviceDetails m_details;
    bool m_remote;
    UDAVersion m_version;
    std::vector<Icon> m_icons;
    std::vector<std::shared_ptr<Service> > m_services;
    std::vector<std::shared_ptr<Device> > m_embedded;
    std::weak_ptr<Device> m_parent;
    bool m_isembedded{false};
};

} // namespace UPnPCore

#endif /* _UPNPCORE_DEVICE_HXX_INCLUDED_ */
