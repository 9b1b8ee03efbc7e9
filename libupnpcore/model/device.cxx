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
#include "libupnpcore/model/device.hxx"

#include <cctype>
#include <set>
#include <sstream>

#include "libupnpcore/log.hxx"

using namespace std;

namespace UPnPCore {

vector<ValidationError> UDAVersion::validate() const
{
    vector<ValidationError> errors;
    if (majorVersion != 1) {
        errors.push_back(ValidationError("UDAVersion", "major",
                                         "UDA specVersion major must be 1, "
                                         "not: " + to_string(majorVersion)));
    }
    if (minorVersion < 0) {
        errors.push_back(ValidationError("UDAVersion", "minor",
                                         "Bad UDA minor version: " +
                                         to_string(minorVersion)));
    }
    return errors;
}

vector<ValidationError> Icon::validate() const
{
    vector<ValidationError> errors;
    if (url.empty()) {
        errors.push_back(ValidationError("Icon", "url", "URL is required"));
    }
    if (mimeType.empty() || width <= 0 || height <= 0 || depth <= 0) {
        LOGDEB("Icon::validate: incomplete icon data for [" << url <<
               "] mime [" << mimeType << "] " << width << "x" << height <<
               "x" << depth << "\n");
    }
    return errors;
}

vector<ValidationError> DeviceDetails::validate() const
{
    if (!upc.empty()) {
        bool alldigits = upc.size() == 12;
        for (auto c : upc) {
            if (!isdigit(static_cast<unsigned char>(c)))
                alldigits = false;
        }
        if (!alldigits) {
            LOGDEB("DeviceDetails: UPC is not 12 digits: [" << upc << "]\n");
        }
    }
    return vector<ValidationError>();
}

void Device::addService(shared_ptr<Service> service)
{
    service->m_device = shared_from_this();
    m_services.push_back(service);
}

bool Device::replaceService(shared_ptr<Service> service)
{
    for (auto& sp : m_services) {
        if (sp->getServiceId() == service->getServiceId()) {
            service->m_device = shared_from_this();
            sp = service;
            return true;
        }
    }
    return false;
}

void Device::addEmbeddedDevice(shared_ptr<Device> device)
{
    device->m_parent = shared_from_this();
    device->m_isembedded = true;
    m_embedded.push_back(device);
}

shared_ptr<Device> Device::getRoot()
{
    shared_ptr<Device> cur = shared_from_this();
    for (;;) {
        shared_ptr<Device> parent = cur->m_parent.lock();
        if (!parent)
            break;
        cur = parent;
    }
    return cur;
}

shared_ptr<const Device> Device::getRoot() const
{
    shared_ptr<const Device> cur = shared_from_this();
    for (;;) {
        shared_ptr<const Device> parent = cur->m_parent.lock();
        if (!parent)
            break;
        cur = parent;
    }
    return cur;
}

void Device::collectDevices(vector<shared_ptr<Device> >& out)
{
    out.push_back(shared_from_this());
    for (auto& dev : m_embedded) {
        dev->collectDevices(out);
    }
}

shared_ptr<Device> Device::findDevice(const UDN& udn)
{
    if (getUdn() == udn) {
        return shared_from_this();
    }
    for (auto& dev : m_embedded) {
        auto found = dev->findDevice(udn);
        if (found)
            return found;
    }
    return shared_ptr<Device>();
}

vector<shared_ptr<Device> > Device::findEmbeddedDevices()
{
    vector<shared_ptr<Device> > out;
    for (auto& dev : m_embedded) {
        dev->collectDevices(out);
    }
    return out;
}

vector<shared_ptr<Device> > Device::findDevices(const DeviceType& tp)
{
    vector<shared_ptr<Device> > all, out;
    collectDevices(all);
    for (auto& dev : all) {
        if (dev->getType().implementsVersion(tp))
            out.push_back(dev);
    }
    return out;
}

vector<shared_ptr<Device> > Device::findDevices(const ServiceType& tp)
{
    vector<shared_ptr<Device> > all, out;
    collectDevices(all);
    for (auto& dev : all) {
        for (const auto& service : dev->getServices()) {
            if (service->getServiceType().implementsVersion(tp)) {
                out.push_back(dev);
                break;
            }
        }
    }
    return out;
}

vector<shared_ptr<Service> > Device::findServices() const
{
    vector<shared_ptr<Service> > out(m_services);
    for (const auto& dev : m_embedded) {
        auto sub = dev->findServices();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

vector<shared_ptr<Service> > Device::findServices(const ServiceType& tp) const
{
    vector<shared_ptr<Service> > out;
    for (const auto& service : findServices()) {
        if (service->getServiceType().implementsVersion(tp))
            out.push_back(service);
    }
    return out;
}

shared_ptr<Service> Device::findService(const ServiceId& id) const
{
    for (const auto& service : findServices()) {
        if (service->getServiceId() == id)
            return service;
    }
    return shared_ptr<Service>();
}

shared_ptr<Service> Device::getService(const ServiceId& id) const
{
    for (const auto& service : m_services) {
        if (service->getServiceId() == id)
            return service;
    }
    return shared_ptr<Service>();
}

vector<Icon> Device::findIcons() const
{
    vector<Icon> out(m_icons);
    for (const auto& dev : m_embedded) {
        auto sub = dev->findIcons();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

void Device::collectUdns(vector<UDN>& udns) const
{
    udns.push_back(getUdn());
    for (const auto& dev : m_embedded) {
        dev->collectUdns(udns);
    }
}

void Device::validateTree(vector<ValidationError>& errors) const
{
    if (m_type.empty()) {
        errors.push_back(ValidationError("Device", "type",
                                         "Device has no type"));
    }
    if (getUdn().empty()) {
        errors.push_back(ValidationError("DeviceIdentity", "udn",
                                         "Device has no UDN"));
    }
    auto verrs = m_version.validate();
    errors.insert(errors.end(), verrs.begin(), verrs.end());
    auto derrs = m_details.validate();
    errors.insert(errors.end(), derrs.begin(), derrs.end());
    for (const auto& icon : m_icons) {
        auto ierrs = icon.validate();
        errors.insert(errors.end(), ierrs.begin(), ierrs.end());
    }
    for (const auto& service : m_services) {
        auto serrs = service->validate();
        errors.insert(errors.end(), serrs.begin(), serrs.end());
    }
    for (const auto& dev : m_embedded) {
        dev->validateTree(errors);
    }
}

vector<ValidationError> Device::validate() const
{
    vector<ValidationError> errors;
    validateTree(errors);

    vector<UDN> udns;
    collectUdns(udns);
    set<UDN> seen;
    for (const auto& udn : udns) {
        if (udn.empty())
            continue;
        if (!seen.insert(udn).second) {
            errors.push_back(ValidationError("Device", "embeddedDevices",
                                             "Duplicate UDN in device tree: " +
                                             udn.toString()));
        }
    }
    return errors;
}

string Device::getDisplayString() const
{
    if (!m_details.friendlyName.empty()) {
        return m_details.friendlyName;
    }
    if (!m_details.modelName.empty()) {
        string s(m_details.modelName);
        if (!m_details.modelNumber.empty())
            s += " " + m_details.modelNumber;
        return s;
    }
    return m_type.getDisplayString();
}

string Device::dump() const
{
    ostringstream os;
    os << (m_remote ? "REMOTE" : "LOCAL") << " DEVICE {deviceType [" <<
        m_type.toString() << "] friendlyName [" << m_details.friendlyName <<
        "] UDN [" << getUdn().toString() << "] URLBase [" <<
        m_details.baseURL << "] Services:" << endl;
    for (const auto& service : m_services) {
        os << "    " << service->dump();
    }
    for (const auto& dev : m_embedded) {
        os << dev->dump();
    }
    os << "}" << endl;
    return os.str();
}

} // namespace UPnPCore
