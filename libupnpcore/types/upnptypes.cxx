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
#include "libupnpcore/types/upnptypes.hxx"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

#include <vector>

#include "libupnpcore/log.hxx"
#include "libupnpcore/upnpcore_p.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

using namespace std;

namespace UPnPCore {

const string DeviceType::UDA_NAMESPACE("schemas-upnp-org");
const string ServiceType::UDA_NAMESPACE("schemas-upnp-org");
const string ServiceId::UDA_NAMESPACE("upnp-org");

static string removeWhiteSpace(const string& in)
{
    string out;
    for (auto c : in) {
        if (!isspace(static_cast<unsigned char>(c)))
            out += c;
    }
    return out;
}

static bool namespaceOk(const string& ns)
{
    if (ns.empty())
        return false;
    for (auto c : ns) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.')
            return false;
    }
    return true;
}

static bool serviceIdOk(const string& id)
{
    if (id.empty() || id.size() > 64)
        return false;
    for (auto c : id) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '-' &&
            c != '_' && c != ':' && c != '.')
            return false;
    }
    return true;
}

// Parse urn:ns:<kind>:type:version[anything]. The type token is
// normally a single token, but some devices put colons inside
// (urn:schemas-microsoft-com:service:pbda:tuner:1), and some leave it
// empty (urn:schemas-upnp-org:device::1).
static bool parseTypeUrn(const string& in, const string& kind,
                         const string& altkind, string& ns, string& tp,
                         int& version)
{
    string s = removeWhiteSpace(in);
    vector<string> toks;
    stringSplit(s, ':', toks);
    if (toks.size() < 5 || toks[0] != "urn" || !namespaceOk(toks[1])) {
        return false;
    }
    if (toks[2] != kind && (altkind.empty() || toks[2] != altkind)) {
        return false;
    }
    vector<string>::size_type j;
    for (j = 4; j < toks.size(); j++) {
        if (!toks[j].empty() && isdigit(static_cast<unsigned char>(toks[j][0])))
            break;
    }
    if (j >= toks.size()) {
        return false;
    }
    string type;
    for (auto i = 3U; i < j; i++) {
        if (i > 3)
            type += "-";
        type += toks[i];
    }
    if (type.empty()) {
        LOGDEB("parseTypeUrn: no type token in [" << in << "]\n");
        type = "UNKNOWN";
    } else if (j > 4) {
        LOGDEB("parseTypeUrn: colons in type token in [" << in << "]\n");
    }
    // Trailing garbage after the digits is tolerated ("1.0")
    errno = 0;
    long v = strtol(toks[j].c_str(), nullptr, 10);
    if (errno == ERANGE || v > INT_MAX) {
        LOGDEB("parseTypeUrn: version out of range in [" << in << "]\n");
        return false;
    }
    ns = toks[1];
    tp = type;
    version = static_cast<int>(v);
    return true;
}

/////////////////// UDN

UDN UDN::valueOf(const string& in)
{
    string s(in);
    trimstring(s);
    if (beginswith(stringtolower(s), "uuid:")) {
        s = s.substr(5);
    }
    return UDN(s);
}

bool UDN::isUDAConform() const
{
    if (m_id.size() != 36)
        return false;
    for (unsigned int i = 0; i < m_id.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (m_id[i] != '-')
                return false;
        } else if (!isxdigit(static_cast<unsigned char>(m_id[i]))) {
            return false;
        }
    }
    return true;
}

/////////////////// DeviceType

bool DeviceType::parse(const string& s, DeviceType *out)
{
    string ns, tp;
    int version;
    if (!parseTypeUrn(s, "device", string(), ns, tp, version)) {
        return false;
    }
    *out = DeviceType(ns, tp, version);
    return true;
}

DeviceType DeviceType::valueOf(const string& s)
{
    DeviceType dt;
    if (!parse(s, &dt)) {
        throw InvalidValueException("Can't parse device type string "
                                    "(namespace/type/version): " + s, s);
    }
    return dt;
}

bool DeviceType::implementsVersion(const DeviceType& that) const
{
    return m_namespace == that.m_namespace && m_type == that.m_type &&
        m_version >= that.m_version;
}

string DeviceType::toString() const
{
    return "urn:" + m_namespace + ":device:" + m_type + ":" +
        to_string(m_version);
}

bool DeviceType::operator==(const DeviceType& o) const
{
    return m_namespace == o.m_namespace && m_type == o.m_type &&
        m_version == o.m_version;
}

/////////////////// ServiceType

bool ServiceType::parse(const string& s, ServiceType *out)
{
    string ns, tp;
    int version;
    // Some devices use serviceId instead of service
    if (!parseTypeUrn(s, "service", "serviceId", ns, tp, version)) {
        return false;
    }
    *out = ServiceType(ns, tp, version);
    return true;
}

ServiceType ServiceType::valueOf(const string& s)
{
    ServiceType st;
    if (!parse(s, &st)) {
        throw InvalidValueException("Can't parse service type string "
                                    "(namespace/type/version): " + s, s);
    }
    return st;
}

bool ServiceType::implementsVersion(const ServiceType& that) const
{
    return m_namespace == that.m_namespace && m_type == that.m_type &&
        m_version >= that.m_version;
}

string ServiceType::toString() const
{
    return "urn:" + m_namespace + ":service:" + m_type + ":" +
        to_string(m_version);
}

bool ServiceType::operator==(const ServiceType& o) const
{
    return m_namespace == o.m_namespace && m_type == o.m_type &&
        m_version == o.m_version;
}

/////////////////// ServiceId

bool ServiceId::parse(const string& in, ServiceId *out)
{
    string s = removeWhiteSpace(in);

    // The UDA forms, including the broken ones, all result in the
    // upnp-org namespace.
    static const string cetonpref(
        "urn:upnp-org:serviceId:urn:schemas-upnp-org:service:");
    static const string udapref("urn:upnp-org:serviceId:");
    static const string brokenpref("urn:schemas-upnp-org:serviceId:");
    if (beginswith(s, cetonpref) && serviceIdOk(s.substr(cetonpref.size()))) {
        *out = UDAServiceId(s.substr(cetonpref.size()));
        return true;
    }
    if (beginswith(s, udapref) && serviceIdOk(s.substr(udapref.size()))) {
        *out = UDAServiceId(s.substr(udapref.size()));
        return true;
    }
    if (beginswith(s, brokenpref) && serviceIdOk(s.substr(brokenpref.size()))) {
        LOGDEB("ServiceId::parse: UDA service id with type namespace: " <<
               s << "\n");
        *out = UDAServiceId(s.substr(brokenpref.size()));
        return true;
    }

    vector<string> toks;
    stringSplit(s, ':', toks);
    if (toks.size() >= 4 && toks[0] == "urn" && namespaceOk(toks[1]) &&
        (toks[2] == "serviceId" || toks[2] == "service")) {
        string id;
        for (auto i = 3U; i < toks.size(); i++) {
            if (i > 3)
                id += ":";
            id += toks[i];
        }
        if (id.empty() && toks[2] == "serviceId") {
            LOGDEB("ServiceId::parse: no id token in " << s << "\n");
            id = "UNKNOWN";
        }
        if (serviceIdOk(id)) {
            *out = ServiceId(toks[1], id);
            return true;
        }
    }
    if (toks.size() == 4 && !toks[1].empty() && !toks[3].empty()) {
        LOGDEB("ServiceId::parse: using tokens 1 and 3 of " << s << "\n");
        *out = ServiceId(toks[1], toks[3]);
        return true;
    }
    return false;
}

ServiceId ServiceId::valueOf(const string& s)
{
    ServiceId sid;
    if (!parse(s, &sid)) {
        throw InvalidValueException("Can't parse service ID string "
                                    "(namespace/id): " + s, s);
    }
    return sid;
}

string ServiceId::toString() const
{
    return "urn:" + m_namespace + ":serviceId:" + m_id;
}

/////////////////// ServiceReference

bool ServiceReference::parse(const string& s, ServiceReference *out)
{
    string::size_type slash = s.find('/');
    if (slash == string::npos || slash == 0) {
        return false;
    }
    ServiceId sid;
    if (!ServiceId::parse(s.substr(slash + 1), &sid)) {
        return false;
    }
    UDN udn = UDN::valueOf(s.substr(0, slash));
    if (udn.empty()) {
        return false;
    }
    *out = ServiceReference(udn, sid);
    return true;
}

string ServiceReference::toString() const
{
    return m_udn.toString() + "/" + m_sid.toString();
}

} // namespace UPnPCore
