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

#include "libupnpcore/registry/namespace.hxx"

#include <cctype>
#include <cstring>

#include "libupnpcore/log.hxx"
#include "libupnpcore/model/device.hxx"
#include "libupnpcore/model/service.hxx"
#include "libupnpcore/registry/resource.hxx"
#include "libupnpcore/upnpcore_p.hxx"

using namespace std;

namespace UPnPCore {

const string Namespace::DEVICE("/dev");
const string Namespace::SERVICE("/svc");
const string Namespace::ICON("/icon");
const string Namespace::CONTROL("/action");
const string Namespace::EVENTS("/event");
const string Namespace::DESCRIPTOR_FILE("/desc");
const string Namespace::CALLBACK_FILE("/cb");

Namespace::Namespace(const string& basePath)
    : m_base(basePath)
{
    trimstring(m_base);
    while (!m_base.empty() && m_base.back() == '/')
        m_base.pop_back();
    if (!m_base.empty() && m_base[0] != '/')
        m_base.insert(0, "/");
}

string Namespace::encodeSegment(const string& in)
{
    static const char *hex = "0123456789ABCDEF";
    // RFC 3986 pchar, minus '%' which we always escape
    static const char *ok = "-._~!$&'()*+,;=:@";
    string out;
    for (unsigned char c : in) {
        if (isalnum(c) || (c != 0 && strchr(ok, c))) {
            out += c;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xf];
        }
    }
    return out;
}

string Namespace::getPath(const Device& device) const
{
    return m_base + DEVICE + "/" +
        encodeSegment(device.getUdn().getIdentifierString());
}

string Namespace::getPath(const Service& service) const
{
    auto device = service.getDevice();
    if (!device) {
        LOGERR("Namespace::getPath: service " <<
               service.getServiceId().toString() << " has no device\n");
        return string();
    }
    return getPath(*device) + SERVICE + "/" +
        encodeSegment(service.getServiceId().getNamespace()) + "/" +
        encodeSegment(service.getServiceId().getId());
}

string Namespace::getDescriptorPath(const Device& device) const
{
    auto root = device.getRoot();
    return getPath(root ? *root : device) + DESCRIPTOR_FILE;
}

string Namespace::getDescriptorPath(const Service& service) const
{
    string path = getPath(service);
    return path.empty() ? path : path + DESCRIPTOR_FILE;
}

string Namespace::getControlPath(const Service& service) const
{
    string path = getPath(service);
    return path.empty() ? path : path + CONTROL;
}

string Namespace::getEventSubscriptionPath(const Service& service) const
{
    string path = getPath(service);
    return path.empty() ? path : path + EVENTS;
}

string Namespace::getEventCallbackPath(const Service& service) const
{
    string path = getPath(service);
    return path.empty() ? path : path + EVENTS + CALLBACK_FILE;
}

string Namespace::getIconPath(const Device& device, size_t index) const
{
    return getPath(device) + ICON + "/" + to_string(index);
}

bool Namespace::isOurPath(const string& path) const
{
    return beginswith(path, m_base + DEVICE + "/");
}

vector<shared_ptr<Resource> > Namespace::getResources(
    const shared_ptr<Device>& root) const
{
    vector<shared_ptr<Resource> > out;
    if (!root)
        return out;
    if (root->isLocal() && root->isRoot()) {
        out.push_back(make_shared<DeviceDescriptorResource>(
                          getDescriptorPath(*root), root, *this));
    }
    collectResources(root, out);
    return out;
}

void Namespace::collectResources(const shared_ptr<Device>& device,
                                 vector<shared_ptr<Resource> >& out) const
{
    if (device->isLocal()) {
        const auto& icons = device->getIcons();
        for (size_t i = 0; i < icons.size(); i++) {
            out.push_back(make_shared<IconResource>(
                              getIconPath(*device, i), device, icons[i]));
        }
    }
    for (const auto& service : device->getServices()) {
        if (device->isLocal()) {
            out.push_back(make_shared<ServiceDescriptorResource>(
                              getDescriptorPath(*service), service));
            out.push_back(make_shared<ServiceControlResource>(
                              getControlPath(*service), service));
            out.push_back(make_shared<ServiceEventSubscriptionResource>(
                              getEventSubscriptionPath(*service), service));
        } else {
            out.push_back(make_shared<ServiceEventCallbackResource>(
                              getEventCallbackPath(*service), service));
        }
    }
    for (const auto& embedded : device->getEmbeddedDevices()) {
        collectResources(embedded, out);
    }
}

} // namespace UPnPCore
