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
#ifndef _UPNPCORE_VALUE_HXX_INCLUDED_
#define _UPNPCORE_VALUE_HXX_INCLUDED_

#include <cstdint>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/** Broken-down date and/or time, as carried by the date, dateTime,
 * dateTime.tz, time and time.tz types. There is no normalization:
 * two values are equal if all the fields are. */
struct UPNPCORE_API DateTime {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
    int second{0};
    bool hasDate{false};
    bool hasTime{false};
    bool hasTZ{false};
    // Offset from UTC in minutes, if hasTZ
    int tzOffsetMinutes{0};

    bool operator==(const DateTime& o) const;
    bool operator!=(const DateTime& o) const {
        return !(*this == o);
    }
};

/**
 * Decoded value of an UPnP datatype. A default-constructed Value is
 * null (absent), which is what the empty string decodes to.
 */
class UPNPCORE_API Value {
public:
    enum Kind {NONE, BOOL, INT, UINT, FLOAT, DOUBLE, CHAR, STRING, BYTES,
               DATETIME};

    Value() {}

    static Value ofBool(bool b);
    static Value ofInt(int64_t i);
    static Value ofUInt(uint64_t u);
    static Value ofFloat(float f);
    static Value ofDouble(double d);
    static Value ofChar(char c);
    static Value ofString(const std::string& s);
    static Value ofBytes(const std::vector<unsigned char>& b);
    static Value ofDateTime(const DateTime& dt);

    Kind kind() const {
        return m_kind;
    }
    bool isNull() const {
        return m_kind == NONE;
    }
    bool isInteger() const {
        return m_kind == INT || m_kind == UINT;
    }

    bool asBool() const;
    // Numeric accessors convert between the numeric kinds.
    int64_t asInt() const;
    uint64_t asUInt() const;
    float asFloat() const;
    double asDouble() const;
    char asChar() const;
    // Empty string if the value is not of STRING kind.
    const std::string& asString() const;
    const std::vector<unsigned char>& asBytes() const;
    const DateTime& asDateTime() const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const {
        return !(*this == o);
    }

    /** Debug representation, not the UPnP wire format */
    std::string dump() const;

private:
    Kind m_kind{NONE};
    union {
        bool b;
        int64_t i;
        uint64_t u;
        float f;
        double d;
        char c;
    } m_num{};
    std::string m_str;
    std::vector<unsigned char> m_bytes;
    DateTime m_dt;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_VALUE_HXX_INCLUDED_ */
