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
#ifndef _UPNPCORE_SAMPLEDEVICES_HXX_INCLUDED_
#define _UPNPCORE_SAMPLEDEVICES_HXX_INCLUDED_

// Device trees shared by the model and registry tests

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "libupnpcore/model/device.hxx"
#include "libupnpcore/model/service.hxx"
#include "libupnpcore/types/datatype.hxx"

namespace SampleDevices {

using namespace UPnPCore;

inline StateVariable stringVariable(const std::string& name)
{
    StateVariable sv;
    sv.name = name;
    sv.typeDetails.datatype = Datatype::builtin(Datatype::STRING);
    return sv;
}

inline StateVariable volumeVariable()
{
    StateVariable sv;
    sv.name = "Volume";
    sv.typeDetails.datatype = Datatype::builtin(Datatype::UI2);
    sv.typeDetails.hasAllowedValueRange = true;
    sv.typeDetails.allowedValueRange.minimum = 0;
    sv.typeDetails.allowedValueRange.maximum = 100;
    sv.eventDetails.sendEvents = false;
    return sv;
}

inline StateVariable statusVariable()
{
    StateVariable sv = stringVariable("Status");
    sv.typeDetails.allowedValues = {"Foo", "Bar", "Baz"};
    sv.typeDetails.defaultValue = "Foo";
    return sv;
}

/** Service one: Status/Volume variables and a SetVolume action */
inline std::shared_ptr<Service> serviceOne(const std::string& id)
{
    auto service = std::make_shared<Service>(
        UDAServiceType("MY-SERVICE-TYPE-ONE", 1), UDAServiceId(id));
    service->stateVariables.push_back(statusVariable());
    service->stateVariables.push_back(volumeVariable());
    Action action;
    action.name = "SetVolume";
    ActionArgument arg;
    arg.name = "DesiredVolume";
    arg.relatedStateVariableName = "Volume";
    action.arguments.push_back(arg);
    ActionArgument out;
    out.name = "CurrentStatus";
    out.relatedStateVariableName = "Status";
    out.direction = ActionArgument::OUT;
    out.returnValue = true;
    action.arguments.push_back(out);
    service->actions.push_back(action);
    return service;
}

inline void setRemoteURLs(Service& service, const std::string& base)
{
    service.descriptorURL = base + "/scpd.xml";
    service.controlURL = base + "/control";
    service.eventSubscriptionURL = base + "/event";
}

/**
 * Root "MY-DEVICE-123" of type MY-DEVICE-TYPE, with service
 * MY-SERVICE-123 (MY-SERVICE-TYPE-ONE) and an icon. Embedded device
 * "<udn>-EMBEDDED" of type MY-EMBEDDED-TYPE has service MY-SERVICE-456
 * (MY-SERVICE-TYPE-TWO).
 */
inline std::shared_ptr<Device> makeDevice(
    bool remote, const std::string& udn = "MY-DEVICE-123", int maxAge = 1800)
{
    const std::string base = "http://10.0.0.1:1234/" + udn;
    DeviceDetails details;
    details.friendlyName = "Test device " + udn;
    details.manufacturer = "Test manufacturer";
    details.modelName = "Model";
    if (remote)
        details.baseURL = base + "/";
    auto root = std::make_shared<Device>(
        DeviceIdentity(UDN(udn), maxAge, remote ? base + "/desc.xml" : ""),
        UDADeviceType("MY-DEVICE-TYPE", 1), details, remote);
    Icon icon;
    icon.mimeType = "image/png";
    icon.width = icon.height = 48;
    icon.depth = 24;
    icon.url = remote ? base + "/icon.png" : "icon.png";
    root->addIcon(icon);

    auto one = serviceOne("MY-SERVICE-123");
    if (remote)
        setRemoteURLs(*one, base + "/one");
    root->addService(one);

    DeviceDetails edetails;
    edetails.friendlyName = "Embedded device";
    auto embedded = std::make_shared<Device>(
        DeviceIdentity(UDN(udn + "-EMBEDDED"), maxAge),
        UDADeviceType("MY-EMBEDDED-TYPE", 2), edetails, remote);
    auto two = std::make_shared<Service>(
        UDAServiceType("MY-SERVICE-TYPE-TWO", 1),
        UDAServiceId("MY-SERVICE-456"));
    two->stateVariables.push_back(stringVariable("Name"));
    if (remote)
        setRemoteURLs(*two, base + "/two");
    root->addEmbeddedDevice(embedded);
    embedded->addService(two);
    return root;
}

inline std::string readDataFile(const std::string& name)
{
    std::ifstream input(std::string(UPNPCORE_TEST_DATA_DIR) + "/" + name,
                        std::ios::binary);
    std::ostringstream os;
    os << input.rdbuf();
    return os.str();
}

} // namespace SampleDevices

#endif /* _UPNPCORE_SAMPLEDEVICES_HXX_INCLUDED_ */
