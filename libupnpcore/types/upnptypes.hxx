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
#ifndef _UPNPCORE_UPNPTYPES_HXX_INCLUDED_
#define _UPNPCORE_UPNPTYPES_HXX_INCLUDED_

#include <string>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/** Unique Device Name. Stored without the "uuid:" prefix. */
class UPNPCORE_API UDN {
public:
    UDN() {}
    explicit UDN(const std::string& identifier) : m_id(identifier) {}

    /** Build from the descriptor form. The "uuid:" prefix is optional */
    static UDN valueOf(const std::string& s);

    /** Identifier string, without prefix. Used in resource paths */
    const std::string& getIdentifierString() const {
        return m_id;
    }
    /** "uuid:" + identifier */
    std::string toString() const {
        return std::string("uuid:") + m_id;
    }
    bool empty() const {
        return m_id.empty();
    }
    /** True if the identifier is a RFC 4122 textual UUID */
    bool isUDAConform() const;

    bool operator==(const UDN& o) const {
        return m_id == o.m_id;
    }
    bool operator!=(const UDN& o) const {
        return m_id != o.m_id;
    }
    bool operator<(const UDN& o) const {
        return m_id < o.m_id;
    }
private:
    std::string m_id;
};

/** urn:<namespace>:device:<type>:<version> */
class UPNPCORE_API DeviceType {
public:
    DeviceType() {}
    DeviceType(const std::string& ns, const std::string& tp, int version = 1)
        : m_namespace(ns), m_type(tp), m_version(version) {}

    /** Parse, tolerating the known vendor errors.
     * @return false if s can't be made sense of */
    static bool parse(const std::string& s, DeviceType *out);
    /** Same as parse() but throws InvalidValueException */
    static DeviceType valueOf(const std::string& s);

    const std::string& getNamespace() const {
        return m_namespace;
    }
    const std::string& getType() const {
        return m_type;
    }
    int getVersion() const {
        return m_version;
    }
    bool empty() const {
        return m_type.empty();
    }
    /** Same namespace and type, and our version is >= that's */
    bool implementsVersion(const DeviceType& that) const;
    std::string getDisplayString() const {
        return m_type;
    }
    std::string toString() const;

    bool operator==(const DeviceType& o) const;
    bool operator!=(const DeviceType& o) const {
        return !(*this == o);
    }
    bool operator<(const DeviceType& o) const {
        return toString() < o.toString();
    }

    static const std::string UDA_NAMESPACE;
private:
    std::string m_namespace;
    std::string m_type;
    int m_version{1};
};

/** A device type in the schemas-upnp-org namespace */
class UPNPCORE_API UDADeviceType : public DeviceType {
public:
    UDADeviceType(const std::string& tp, int version = 1)
        : DeviceType(UDA_NAMESPACE, tp, version) {}
};

/** urn:<namespace>:service:<type>:<version> */
class UPNPCORE_API ServiceType {
public:
    ServiceType() {}
    ServiceType(const std::string& ns, const std::string& tp, int version = 1)
        : m_namespace(ns), m_type(tp), m_version(version) {}

    static bool parse(const std::string& s, ServiceType *out);
    /** @throw InvalidValueException */
    static ServiceType valueOf(const std::string& s);

    const std::string& getNamespace() const {
        return m_namespace;
    }
    const std::string& getType() const {
        return m_type;
    }
    int getVersion() const {
        return m_version;
    }
    bool empty() const {
        return m_type.empty();
    }
    bool implementsVersion(const ServiceType& that) const;
    std::string toString() const;

    bool operator==(const ServiceType& o) const;
    bool operator!=(const ServiceType& o) const {
        return !(*this == o);
    }
    bool operator<(const ServiceType& o) const {
        return toString() < o.toString();
    }

    static const std::string UDA_NAMESPACE;
private:
    std::string m_namespace;
    std::string m_type;
    int m_version{1};
};

class UPNPCORE_API UDAServiceType : public ServiceType {
public:
    UDAServiceType(const std::string& tp, int version = 1)
        : ServiceType(UDA_NAMESPACE, tp, version) {}
};

/** urn:<namespace>:serviceId:<id> */
class UPNPCORE_API ServiceId {
public:
    ServiceId() {}
    ServiceId(const std::string& ns, const std::string& id)
        : m_namespace(ns), m_id(id) {}

    static bool parse(const std::string& s, ServiceId *out);
    /** @throw InvalidValueException */
    static ServiceId valueOf(const std::string& s);

    const std::string& getNamespace() const {
        return m_namespace;
    }
    const std::string& getId() const {
        return m_id;
    }
    bool empty() const {
        return m_id.empty();
    }
    std::string toString() const;

    bool operator==(const ServiceId& o) const {
        return m_namespace == o.m_namespace && m_id == o.m_id;
    }
    bool operator!=(const ServiceId& o) const {
        return !(*this == o);
    }
    bool operator<(const ServiceId& o) const {
        return toString() < o.toString();
    }

    // Namespace for UDA service ids, this is not the same as the type
    // namespace
    static const std::string UDA_NAMESPACE;
private:
    std::string m_namespace;
    std::string m_id;
};

class UPNPCORE_API UDAServiceId : public ServiceId {
public:
    UDAServiceId(const std::string& id) : ServiceId(UDA_NAMESPACE, id) {}
};

/** Identifies a service in a registry: <udn>/<serviceId> */
class UPNPCORE_API ServiceReference {
public:
    ServiceReference() {}
    ServiceReference(const UDN& udn, const ServiceId& sid)
        : m_udn(udn), m_sid(sid) {}

    /** Parse "uuid:xxx/urn:..." or "xxx/urn:..." */
    static bool parse(const std::string& s, ServiceReference *out);

    const UDN& getUdn() const {
        return m_udn;
    }
    const ServiceId& getServiceId() const {
        return m_sid;
    }
    std::string toString() const;

    bool operator==(const ServiceReference& o) const {
        return m_udn == o.m_udn && m_sid == o.m_sid;
    }
private:
    UDN m_udn;
    ServiceId m_sid;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_UPNPTYPES_HXX_INCLUDED_ */
