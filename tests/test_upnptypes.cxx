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

#include "libupnpcore/types/upnptypes.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

using namespace UPnPCore;

TEST(UDN, Prefix)
{
    UDN udn = UDN::valueOf("uuid:2fac1234-31f8-11b4-a222-08002b34c003");
    EXPECT_EQ("2fac1234-31f8-11b4-a222-08002b34c003",
              udn.getIdentifierString());
    EXPECT_EQ("uuid:2fac1234-31f8-11b4-a222-08002b34c003", udn.toString());
    EXPECT_TRUE(udn.isUDAConform());
    EXPECT_EQ(udn, UDN::valueOf("2fac1234-31f8-11b4-a222-08002b34c003"));
    EXPECT_EQ(udn, UDN::valueOf(" UUID:2fac1234-31f8-11b4-a222-08002b34c003"));

    UDN other("MY-DEVICE-123");
    EXPECT_FALSE(other.isUDAConform());
    EXPECT_EQ("uuid:MY-DEVICE-123", other.toString());
    EXPECT_NE(udn, other);
}

TEST(DeviceType, Parse)
{
    DeviceType dt =
        DeviceType::valueOf("urn:schemas-upnp-org:device:MediaRenderer:2");
    EXPECT_EQ("schemas-upnp-org", dt.getNamespace());
    EXPECT_EQ("MediaRenderer", dt.getType());
    EXPECT_EQ(2, dt.getVersion());
    EXPECT_EQ("urn:schemas-upnp-org:device:MediaRenderer:2", dt.toString());
    EXPECT_EQ(UDADeviceType("MediaRenderer", 2), dt);
    EXPECT_TRUE(dt.implementsVersion(UDADeviceType("MediaRenderer", 1)));
    EXPECT_FALSE(dt.implementsVersion(UDADeviceType("MediaRenderer", 3)));
    EXPECT_FALSE(dt.implementsVersion(UDADeviceType("MediaServer", 1)));
}

TEST(DeviceType, BrokenVendorForms)
{
    DeviceType dt;
    ASSERT_TRUE(DeviceType::parse("urn:schemas-upnp-org:device::1", &dt));
    EXPECT_EQ("UNKNOWN", dt.getType());
    EXPECT_EQ(1, dt.getVersion());

    ASSERT_TRUE(DeviceType::parse(
                    "urn:schemas-microsoft-com:device:pbda:tuner:1", &dt));
    EXPECT_EQ("schemas-microsoft-com", dt.getNamespace());
    EXPECT_EQ("pbda-tuner", dt.getType());

    ASSERT_TRUE(DeviceType::parse(
                    " urn:schemas-upnp-org:device:Basic:1 ", &dt));
    EXPECT_EQ("Basic", dt.getType());

    EXPECT_FALSE(DeviceType::parse("urn:schemas-upnp-org:service:Basic:1",
                                   &dt));
    EXPECT_FALSE(DeviceType::parse("not a type", &dt));
    EXPECT_THROW(DeviceType::valueOf("urn:x:device:Basic"),
                 InvalidValueException);
}

TEST(DeviceType, VersionRange)
{
    DeviceType dt;
    ASSERT_TRUE(DeviceType::parse(
                    "urn:schemas-upnp-org:device:Basic:2147483647", &dt));
    EXPECT_EQ(2147483647, dt.getVersion());
    ASSERT_TRUE(DeviceType::parse("urn:schemas-upnp-org:device:Basic:1.0",
                                  &dt));
    EXPECT_EQ(1, dt.getVersion());

    EXPECT_FALSE(DeviceType::parse(
                     "urn:schemas-upnp-org:device:Basic:2147483648", &dt));
    EXPECT_FALSE(DeviceType::parse(
                     "urn:schemas-upnp-org:device:X:99999999999", &dt));
    EXPECT_THROW(DeviceType::valueOf(
                     "urn:schemas-upnp-org:device:X:99999999999999999999999"),
                 InvalidValueException);
    ServiceType st;
    EXPECT_FALSE(ServiceType::parse(
                     "urn:schemas-upnp-org:service:X:99999999999", &st));
}

TEST(ServiceType, Parse)
{
    ServiceType st = ServiceType::valueOf(
        "urn:schemas-upnp-org:service:ContentDirectory:1");
    EXPECT_EQ(UDAServiceType("ContentDirectory"), st);
    EXPECT_EQ("urn:schemas-upnp-org:service:ContentDirectory:1",
              st.toString());

    // Some devices use serviceId in place of service
    ASSERT_TRUE(ServiceType::parse(
                    "urn:schemas-upnp-org:serviceId:RenderingControl:1", &st));
    EXPECT_EQ(UDAServiceType("RenderingControl"), st);

    ASSERT_TRUE(ServiceType::parse(
                    "urn:schemas-microsoft-com:service:pbda:tuner:1", &st));
    EXPECT_EQ("pbda-tuner", st.getType());

    EXPECT_THROW(ServiceType::valueOf("urn:schemas-upnp-org:device:X:1"),
                 InvalidValueException);
    EXPECT_THROW(ServiceType::valueOf(""), InvalidValueException);
}

TEST(ServiceId, Parse)
{
    ServiceId sid = ServiceId::valueOf("urn:upnp-org:serviceId:AVTransport");
    EXPECT_EQ(UDAServiceId("AVTransport"), sid);
    EXPECT_EQ("urn:upnp-org:serviceId:AVTransport", sid.toString());

    sid = ServiceId::valueOf("urn:schemas-upnp-org:serviceId:AVTransport");
    EXPECT_EQ(UDAServiceId("AVTransport"), sid);

    sid = ServiceId::valueOf(
        "urn:upnp-org:serviceId:urn:schemas-upnp-org:service:ConnectionManager");
    EXPECT_EQ(UDAServiceId("ConnectionManager"), sid);

    sid = ServiceId::valueOf("urn:microsoft.com:serviceId:X_MS_MediaReceiver");
    EXPECT_EQ("microsoft.com", sid.getNamespace());
    EXPECT_EQ("X_MS_MediaReceiver", sid.getId());

    sid = ServiceId::valueOf("urn:upnp-org:serviceId:");
    EXPECT_EQ("UNKNOWN", sid.getId());

    EXPECT_THROW(ServiceId::valueOf("AVTransport"), InvalidValueException);
}

TEST(ServiceReference, Parse)
{
    ServiceReference ref;
    ASSERT_TRUE(ServiceReference::parse(
                    "uuid:MY-DEVICE-123/urn:upnp-org:serviceId:MY-SERVICE-123",
                    &ref));
    EXPECT_EQ(UDN("MY-DEVICE-123"), ref.getUdn());
    EXPECT_EQ(UDAServiceId("MY-SERVICE-123"), ref.getServiceId());
    EXPECT_EQ("uuid:MY-DEVICE-123/urn:upnp-org:serviceId:MY-SERVICE-123",
              ref.toString());

    ServiceReference ref2;
    ASSERT_TRUE(ServiceReference::parse(
                    "MY-DEVICE-123/urn:upnp-org:serviceId:MY-SERVICE-123",
                    &ref2));
    EXPECT_EQ(ref, ref2);

    EXPECT_FALSE(ServiceReference::parse("MY-DEVICE-123", &ref));
    EXPECT_FALSE(ServiceReference::parse("/urn:upnp-org:serviceId:X", &ref));
    EXPECT_FALSE(ServiceReference::parse("uuid:/urn:upnp-org:serviceId:X",
                                         &ref));
}
