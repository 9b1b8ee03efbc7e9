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

#include "libupnpcore/registry/resource.hxx"

#include <sstream>

#include "libupnpcore/binding/descbinder.hxx"
#include "libupnpcore/binding/scpdbinder.hxx"

using namespace std;

namespace UPnPCore {

static string stripslash(const string& path)
{
    if (path.size() > 1 && path.back() == '/')
        return path.substr(0, path.size() - 1);
    return path;
}

bool Resource::matches(const string& path) const
{
    return stripslash(m_path) == stripslash(path);
}

const char *Resource::kindName(Kind kind)
{
    switch (kind) {
    case DEVICE_DESCRIPTOR: return "DeviceDescriptor";
    case ICON: return "Icon";
    case SERVICE_DESCRIPTOR: return "ServiceDescriptor";
    case SERVICE_CONTROL: return "ServiceControl";
    case SERVICE_EVENT_SUBSCRIPTION: return "ServiceEventSubscription";
    case SERVICE_EVENT_CALLBACK: return "ServiceEventCallback";
    default: return "Other";
    }
}

string Resource::dump() const
{
    return string("(") + kindName(m_kind) + ") " + m_path;
}

string DeviceResource::dump() const
{
    ostringstream os;
    os << Resource::dump();
    if (m_device)
        os << " -> " << m_device->getUdn().toString();
    return os.str();
}

string ServiceResource::dump() const
{
    ostringstream os;
    os << Resource::dump();
    if (m_service)
        os << " -> " << m_service->getServiceId().toString();
    return os.str();
}

string DeviceDescriptorResource::getDescriptor() const
{
    DeviceDescriptorBinder binder;
    return binder.generate(*getDevice(), m_namespace);
}

string ServiceDescriptorResource::getDescriptor() const
{
    ServiceDescriptorBinder binder;
    return binder.generate(*getService());
}

} // namespace UPnPCore
