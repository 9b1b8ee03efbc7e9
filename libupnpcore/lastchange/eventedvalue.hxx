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
#ifndef _UPNPCORE_EVENTEDVALUE_HXX_INCLUDED_
#define _UPNPCORE_EVENTEDVALUE_HXX_INCLUDED_

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/types/datatype.hxx"
#include "libupnpcore/types/value.hxx"

namespace UPnPCore {

/** The closed set of evented value kinds. Each one has a fixed
 * datatype, see EventedValue::builtinFor() */
enum class EventedKind {
    STRING,
    SHORT,
    UNSIGNED_INTEGER_TWO_BYTES,
    UNSIGNED_INTEGER_FOUR_BYTES,
    BOOLEAN,
    URI,
    ENUM,
    // Comma-separated list of enum values
    ENUM_ARRAY,
    CHANNEL_VOLUME,
    CHANNEL_VOLUME_DB,
    CHANNEL_MUTE,
    CHANNEL_LOUDNESS
};

/** RenderingControl audio channels */
enum class Channel {Master, LF, RF, CF, LFE, LS, RS, LFC, RFC, SD, SL, SR,
        T, B};

UPNPCORE_API bool channelFromString(const std::string& s, Channel *ch);
UPNPCORE_API std::string channelToString(Channel ch);

/**
 * A value carried by a LastChange event: variable name, kind, decoded
 * value, and channel for the channel kinds. Immutable once built.
 */
class UPNPCORE_API EventedValue {
public:
    /** Build from a typed value. The value must be valid for the
     * kind's datatype. @throw InvalidValueException */
    EventedValue(const std::string& name, EventedKind kind,
                 const Value& value, Channel channel = Channel::Master);

    /** Build from the element attributes (val, channel). The val
     * attribute is decoded by the kind's datatype, and decoding errors
     * are not caught. A missing val gives a null value, a missing
     * channel means Master. @throw InvalidValueException */
    EventedValue(const std::string& name, EventedKind kind,
                 const std::map<std::string, std::string>& attributes);

    const std::string& getName() const {
        return m_name;
    }
    EventedKind getKind() const {
        return m_kind;
    }
    const Value& getValue() const {
        return m_value;
    }
    bool hasChannel() const {
        return isChannelKind(m_kind);
    }
    Channel getChannel() const {
        return m_channel;
    }
    std::shared_ptr<const Datatype> getDatatype() const {
        return Datatype::builtin(builtinFor(m_kind));
    }
    /** Wire string for the val attribute */
    std::string toString() const;
    /** ENUM_ARRAY: split values. Others: the single value, if any */
    std::vector<std::string> getValues() const;
    /** Attributes for rendering, val first */
    std::vector<std::pair<std::string, std::string> > getAttributes() const;

    /** Fixed kind to datatype binding */
    static Datatype::Builtin builtinFor(EventedKind kind);
    static bool isChannelKind(EventedKind kind);
    static std::string kindName(EventedKind kind);

private:
    std::string m_name;
    EventedKind m_kind;
    Value m_value;
    Channel m_channel{Channel::Master};
};

} // namespace UPnPCore

#endif /* _UPNPCORE_EVENTEDVALUE_HXX_INCLUDED_ */
