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
#include "libupnpcore/lastchange/eventedvalue.hxx"

#include "libupnpcore/log.hxx"
#include "libupnpcore/upnpcore_p.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

using namespace std;

namespace UPnPCore {

static const struct KindDef {
    EventedKind kind;
    Datatype::Builtin builtin;
    bool channel;
    const char *name;
} kindDefs[] = {
    {EventedKind::STRING, Datatype::STRING, false, "String"},
    {EventedKind::SHORT, Datatype::I2_SHORT, false, "Short"},
    {EventedKind::UNSIGNED_INTEGER_TWO_BYTES, Datatype::UI2, false,
     "UnsignedIntegerTwoBytes"},
    {EventedKind::UNSIGNED_INTEGER_FOUR_BYTES, Datatype::UI4, false,
     "UnsignedIntegerFourBytes"},
    {EventedKind::BOOLEAN, Datatype::BOOLEAN, false, "Boolean"},
    {EventedKind::URI, Datatype::URI, false, "URI"},
    {EventedKind::ENUM, Datatype::STRING, false, "Enum"},
    {EventedKind::ENUM_ARRAY, Datatype::STRING, false, "EnumArray"},
    {EventedKind::CHANNEL_VOLUME, Datatype::UI2, true, "ChannelVolume"},
    {EventedKind::CHANNEL_VOLUME_DB, Datatype::I2_SHORT, true,
     "ChannelVolumeDB"},
    {EventedKind::CHANNEL_MUTE, Datatype::BOOLEAN, true, "ChannelMute"},
    {EventedKind::CHANNEL_LOUDNESS, Datatype::BOOLEAN, true,
     "ChannelLoudness"},
};

static const KindDef *findKind(EventedKind kind)
{
    for (const auto& def : kindDefs) {
        if (def.kind == kind)
            return &def;
    }
    return nullptr;
}

static const struct ChannelName {
    Channel channel;
    const char *name;
} channelNames[] = {
    {Channel::Master, "Master"}, {Channel::LF, "LF"}, {Channel::RF, "RF"},
    {Channel::CF, "CF"}, {Channel::LFE, "LFE"}, {Channel::LS, "LS"},
    {Channel::RS, "RS"}, {Channel::LFC, "LFC"}, {Channel::RFC, "RFC"},
    {Channel::SD, "SD"}, {Channel::SL, "SL"}, {Channel::SR, "SR"},
    {Channel::T, "T"}, {Channel::B, "B"},
};

bool channelFromString(const string& s, Channel *ch)
{
    for (const auto& ent : channelNames) {
        if (s == ent.name) {
            *ch = ent.channel;
            return true;
        }
    }
    return false;
}

string channelToString(Channel ch)
{
    for (const auto& ent : channelNames) {
        if (ch == ent.channel)
            return ent.name;
    }
    return string();
}

Datatype::Builtin EventedValue::builtinFor(EventedKind kind)
{
    const KindDef *def = findKind(kind);
    return def ? def->builtin : Datatype::STRING;
}

bool EventedValue::isChannelKind(EventedKind kind)
{
    const KindDef *def = findKind(kind);
    return def && def->channel;
}

string EventedValue::kindName(EventedKind kind)
{
    const KindDef *def = findKind(kind);
    return def ? def->name : "";
}

EventedValue::EventedValue(const string& name, EventedKind kind,
                           const Value& value, Channel channel)
    : m_name(name), m_kind(kind), m_value(value), m_channel(channel)
{
    if (!getDatatype()->isValid(value)) {
        throw InvalidValueException("Invalid value for " + kindName(kind) +
                                    " " + name, value.dump());
    }
}

EventedValue::EventedValue(const string& name, EventedKind kind,
                           const map<string, string>& attributes)
    : m_name(name), m_kind(kind)
{
    auto it = attributes.find("val");
    if (it != attributes.end()) {
        m_value = getDatatype()->valueOf(it->second);
    }
    if (hasChannel()) {
        it = attributes.find("channel");
        if (it != attributes.end() && !channelFromString(it->second,
                                                          &m_channel)) {
            throw InvalidValueException("Invalid channel for " + name + ": " +
                                        it->second, it->second);
        }
    }
}

string EventedValue::toString() const
{
    return getDatatype()->toString(m_value);
}

vector<string> EventedValue::getValues() const
{
    vector<string> out;
    if (m_value.isNull()) {
        return out;
    }
    if (m_kind == EventedKind::ENUM_ARRAY) {
        if (!csvToStrings(m_value.asString(), out)) {
            LOGINF("EventedValue: " << m_name << ": bad CSV value [" <<
                   m_value.asString() << "]\n");
            out.clear();
        }
        return out;
    }
    out.push_back(toString());
    return out;
}

vector<pair<string, string> > EventedValue::getAttributes() const
{
    vector<pair<string, string> > out;
    out.push_back(pair<string, string>("val", toString()));
    if (hasChannel()) {
        out.push_back(pair<string, string>("channel",
                                           channelToString(m_channel)));
    }
    return out;
}

} // namespace UPnPCore
