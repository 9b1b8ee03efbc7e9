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

#include <map>
#include <string>

#include "libupnpcore/lastchange/eventedvalue.hxx"
#include "libupnpcore/lastchange/lastchange.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

using namespace UPnPCore;

static const char *rcsDoc =
    "<Event xmlns=\"urn:schemas-upnp-org:metadata-1-0/RCS/\">\n"
    "  <InstanceID val=\"0\">\n"
    "    <Volume channel=\"Master\" val=\"24\"/>\n"
    "    <Volume channel=\"LF\" val=\"30\"/>\n"
    "    <Mute channel=\"Master\" val=\"1\"/>\n"
    "    <VendorThing val=\"whatever\"/>\n"
    "    <PresetNameList val=\"FactoryDefaults, InstallationDefaults\"/>\n"
    "  </InstanceID>\n"
    "  <InstanceID val=\"1\">\n"
    "    <VolumeDB val=\"-512\"/>\n"
    "  </InstanceID>\n"
    "</Event>\n";

static EventedValue emptyValue()
{
    return EventedValue("none", EventedKind::STRING, Value());
}

TEST(EventedValue, Kinds)
{
    EXPECT_EQ(Datatype::UI2,
              EventedValue::builtinFor(EventedKind::CHANNEL_VOLUME));
    EXPECT_EQ(Datatype::I2_SHORT,
              EventedValue::builtinFor(EventedKind::CHANNEL_VOLUME_DB));
    EXPECT_EQ(Datatype::UI4,
              EventedValue::builtinFor(
                  EventedKind::UNSIGNED_INTEGER_FOUR_BYTES));
    EXPECT_EQ(Datatype::URI, EventedValue::builtinFor(EventedKind::URI));
    EXPECT_TRUE(EventedValue::isChannelKind(EventedKind::CHANNEL_MUTE));
    EXPECT_FALSE(EventedValue::isChannelKind(EventedKind::ENUM));
}

TEST(EventedValue, FromAttributes)
{
    std::map<std::string, std::string> attrs{{"val", "42"},
                                             {"channel", "RF"}};
    EventedValue ev("Volume", EventedKind::CHANNEL_VOLUME, attrs);
    EXPECT_EQ(42U, ev.getValue().asUInt());
    EXPECT_EQ(Channel::RF, ev.getChannel());
    EXPECT_EQ("42", ev.toString());

    // No channel means Master, no val means null
    EventedValue ev1("Mute", EventedKind::CHANNEL_MUTE,
                     std::map<std::string, std::string>());
    EXPECT_EQ(Channel::Master, ev1.getChannel());
    EXPECT_TRUE(ev1.getValue().isNull());
    EXPECT_TRUE(ev1.getValues().empty());

    attrs["channel"] = "XX";
    EXPECT_THROW(EventedValue("Volume", EventedKind::CHANNEL_VOLUME, attrs),
                 InvalidValueException);
    attrs["channel"] = "LF";
    attrs["val"] = "70000";
    EXPECT_THROW(EventedValue("Volume", EventedKind::CHANNEL_VOLUME, attrs),
                 InvalidValueException);
}

TEST(EventedValue, TypedConstruction)
{
    EventedValue ev("Volume", EventedKind::CHANNEL_VOLUME, Value::ofUInt(5),
                    Channel::LFE);
    auto attrs = ev.getAttributes();
    ASSERT_EQ(2U, attrs.size());
    EXPECT_EQ("val", attrs[0].first);
    EXPECT_EQ("5", attrs[0].second);
    EXPECT_EQ("channel", attrs[1].first);
    EXPECT_EQ("LFE", attrs[1].second);

    EXPECT_THROW(EventedValue("Volume", EventedKind::CHANNEL_VOLUME,
                              Value::ofString("5")),
                 InvalidValueException);
    EXPECT_THROW(EventedValue("Volume", EventedKind::CHANNEL_VOLUME,
                              Value::ofInt(-1)),
                 InvalidValueException);
}

TEST(EventedValue, EnumArray)
{
    EventedValue ev("CurrentTransportActions", EventedKind::ENUM_ARRAY,
                    Value::ofString("Play,Stop,Seek"));
    auto values = ev.getValues();
    ASSERT_EQ(3U, values.size());
    EXPECT_EQ("Play", values[0]);
    EXPECT_EQ("Seek", values[2]);

    // A trailing escape leaves no usable values
    EventedValue bad("CurrentTransportActions", EventedKind::ENUM_ARRAY,
                     Value::ofString("Play,Stop\\"));
    EXPECT_TRUE(bad.getValues().empty());
}

TEST(LastChange, ParseRenderingControl)
{
    LastChange lc(LastChangeSchema::renderingControl(), rcsDoc);
    auto ids = lc.getInstanceIDs();
    ASSERT_EQ(2U, ids.size());
    EXPECT_EQ(0U, ids[0]);
    EXPECT_EQ(1U, ids[1]);

    // The unknown variable is skipped
    EXPECT_EQ(4U, lc.getEventedValues(0).size());

    EventedValue ev = emptyValue();
    ASSERT_TRUE(lc.getEventedValue(0, "Volume", &ev));
    EXPECT_EQ(24U, ev.getValue().asUInt());
    ASSERT_TRUE(lc.getChannelEventedValue(0, "Volume", Channel::LF, &ev));
    EXPECT_EQ(30U, ev.getValue().asUInt());
    EXPECT_FALSE(lc.getChannelEventedValue(0, "Volume", Channel::RF, &ev));
    ASSERT_TRUE(lc.getEventedValue(0, "Mute", &ev));
    EXPECT_TRUE(ev.getValue().asBool());
    ASSERT_TRUE(lc.getEventedValue(0, "PresetNameList", &ev));
    EXPECT_EQ("FactoryDefaults, InstallationDefaults",
              ev.getValue().asString());
    ASSERT_TRUE(lc.getEventedValue(1, "VolumeDB", &ev));
    EXPECT_EQ(-512, ev.getValue().asInt());
    EXPECT_FALSE(lc.getEventedValue(0, "VendorThing", &ev));
    EXPECT_FALSE(lc.getEventedValue(5, "Volume", &ev));
    EXPECT_TRUE(lc.hasChanges());
}

TEST(LastChange, PrefixedElements)
{
    const char *doc =
        "<rcs:Event xmlns:rcs=\"urn:schemas-upnp-org:metadata-1-0/RCS/\">"
        "<rcs:InstanceID val=\"0\"><rcs:Volume channel=\"Master\" val=\"3\"/>"
        "</rcs:InstanceID></rcs:Event>";
    LastChange lc(LastChangeSchema::renderingControl(), doc);
    EventedValue ev = emptyValue();
    ASSERT_TRUE(lc.getEventedValue(0, "Volume", &ev));
    EXPECT_EQ(3U, ev.getValue().asUInt());
}

TEST(LastChange, ParseAVTransport)
{
    const char *doc =
        "<Event xmlns=\"urn:schemas-upnp-org:metadata-1-0/AVT/\">"
        "<InstanceID val=\"0\">"
        "<TransportState val=\"PLAYING\"/>"
        "<CurrentTransportActions val=\"Play,Stop\"/>"
        "<CurrentTrackURI val=\"http://10.0.0.2/track.flac\"/>"
        "<NumberOfTracks val=\"12\"/>"
        "</InstanceID></Event>";
    LastChange lc(LastChangeSchema::avTransport(), doc);
    EventedValue ev = emptyValue();
    ASSERT_TRUE(lc.getEventedValue(0, "TransportState", &ev));
    EXPECT_EQ(EventedKind::ENUM, ev.getKind());
    EXPECT_EQ("PLAYING", ev.toString());
    ASSERT_TRUE(lc.getEventedValue(0, "CurrentTransportActions", &ev));
    EXPECT_EQ(2U, ev.getValues().size());
    ASSERT_TRUE(lc.getEventedValue(0, "CurrentTrackURI", &ev));
    EXPECT_EQ("http://10.0.0.2/track.flac", ev.getValue().asString());
    ASSERT_TRUE(lc.getEventedValue(0, "NumberOfTracks", &ev));
    EXPECT_EQ(12U, ev.getValue().asUInt());
}

TEST(LastChange, BadDocuments)
{
    const LastChangeSchema& avt = LastChangeSchema::avTransport();
    const LastChangeSchema& rcs = LastChangeSchema::renderingControl();
    // Not XML
    EXPECT_THROW(LastChange(rcs, "<Event><InstanceID val=\"0\">"),
                 InvalidValueException);
    // Wrong root
    EXPECT_THROW(LastChange(rcs, "<Foo/>"), InvalidValueException);
    // No instance id
    EXPECT_THROW(LastChange(rcs, "<Event><InstanceID><Volume val=\"1\"/>"
                            "</InstanceID></Event>"),
                 InvalidValueException);
    // Instance id past the unsigned int range
    EXPECT_THROW(LastChange(rcs, "<Event><InstanceID val=\"4294967296\">"
                            "<Volume val=\"1\"/></InstanceID></Event>"),
                 InvalidValueException);
    EXPECT_THROW(LastChange(rcs, "<Event><InstanceID val=\"99999999999999999"
                            "999999\"/></Event>"),
                 InvalidValueException);
    LastChange maxid(rcs, "<Event><InstanceID val=\"4294967295\">"
                     "<Volume val=\"1\"/></InstanceID></Event>");
    ASSERT_EQ(1U, maxid.getInstanceIDs().size());
    EXPECT_EQ(4294967295U, maxid.getInstanceIDs()[0]);
    // Value the datatype can't decode
    EXPECT_THROW(LastChange(rcs, "<Event><InstanceID val=\"0\">"
                            "<Volume val=\"loud\"/></InstanceID></Event>"),
                 InvalidValueException);
    // Value not in the enum list
    EXPECT_THROW(LastChange(avt, "<Event><InstanceID val=\"0\">"
                            "<TransportState val=\"DANCING\"/>"
                            "</InstanceID></Event>"),
                 InvalidValueException);
}

TEST(LastChange, SetAndRender)
{
    LastChange lc(LastChangeSchema::renderingControl());
    EXPECT_FALSE(lc.hasChanges());
    EXPECT_EQ("<Event xmlns=\"urn:schemas-upnp-org:metadata-1-0/RCS/\">"
              "</Event>", lc.toString());

    lc.setEventedValue(0, EventedValue("Volume", EventedKind::CHANNEL_VOLUME,
                                       Value::ofUInt(10)));
    lc.setEventedValue(0, EventedValue("Volume", EventedKind::CHANNEL_VOLUME,
                                       Value::ofUInt(20), Channel::LF));
    // Replaces the Master value
    lc.setEventedValue(0, EventedValue("Volume", EventedKind::CHANNEL_VOLUME,
                                       Value::ofUInt(15)));
    lc.setEventedValue(0, EventedValue("PresetNameList", EventedKind::STRING,
                                       Value::ofString("A&B")));
    EXPECT_TRUE(lc.hasChanges());
    EXPECT_EQ(3U, lc.getEventedValues(0).size());

    std::string expected =
        "<Event xmlns=\"urn:schemas-upnp-org:metadata-1-0/RCS/\">"
        "<InstanceID val=\"0\">"
        "<Volume val=\"15\" channel=\"Master\"/>"
        "<Volume val=\"20\" channel=\"LF\"/>"
        "<PresetNameList val=\"A&amp;B\"/>"
        "</InstanceID></Event>";
    EXPECT_EQ(expected, lc.toString());

    // The rendered document parses back to the same values
    LastChange lc1(LastChangeSchema::renderingControl(), lc.toString());
    EventedValue ev = emptyValue();
    ASSERT_TRUE(lc1.getChannelEventedValue(0, "Volume", Channel::LF, &ev));
    EXPECT_EQ(20U, ev.getValue().asUInt());
    ASSERT_TRUE(lc1.getEventedValue(0, "PresetNameList", &ev));
    EXPECT_EQ("A&B", ev.getValue().asString());

    lc.reset();
    EXPECT_FALSE(lc.hasChanges());
    EXPECT_TRUE(lc.getInstanceIDs().empty());
}

static LastChangeSchema fooSchema()
{
    LastChangeSchema schema("urn:example-com:metadata-1-0/FOO/");
    schema.add("Foo", EventedKind::STRING);
    return schema;
}

TEST(LastChange, TemporarySchema)
{
    const char *doc =
        "<Event xmlns=\"urn:example-com:metadata-1-0/FOO/\">"
        "<InstanceID val=\"0\"><Foo val=\"bar\"/></InstanceID></Event>";
    LastChange lc(fooSchema(), doc);
    EventedValue ev = emptyValue();
    ASSERT_TRUE(lc.getEventedValue(0, "Foo", &ev));
    EXPECT_EQ("bar", ev.getValue().asString());
    EXPECT_EQ(doc, lc.toString());

    LastChange empty{fooSchema()};
    empty.setEventedValue(3, EventedValue("Foo", EventedKind::STRING,
                                          Value::ofString("baz")));
    EXPECT_EQ("<Event xmlns=\"urn:example-com:metadata-1-0/FOO/\">"
              "<InstanceID val=\"3\"><Foo val=\"baz\"/></InstanceID>"
              "</Event>", empty.toString());
}
