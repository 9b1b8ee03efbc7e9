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
#include "libupnpcore/types/value.hxx"

#include <iomanip>
#include <limits>
#include <sstream>

using namespace std;

namespace UPnPCore {

bool DateTime::operator==(const DateTime& o) const
{
    if (hasDate != o.hasDate || hasTime != o.hasTime || hasTZ != o.hasTZ) {
        return false;
    }
    if (hasDate && (year != o.year || month != o.month || day != o.day)) {
        return false;
    }
    if (hasTime && (hour != o.hour || minute != o.minute ||
                    second != o.second)) {
        return false;
    }
    if (hasTZ && tzOffsetMinutes != o.tzOffsetMinutes) {
        return false;
    }
    return true;
}

Value Value::ofBool(bool b)
{
    Value v;
    v.m_kind = BOOL;
    v.m_num.b = b;
    return v;
}

Value Value::ofInt(int64_t i)
{
    Value v;
    v.m_kind = INT;
    v.m_num.i = i;
    return v;
}

Value Value::ofUInt(uint64_t u)
{
    Value v;
    v.m_kind = UINT;
    v.m_num.u = u;
    return v;
}

Value Value::ofFloat(float f)
{
    Value v;
    v.m_kind = FLOAT;
    v.m_num.f = f;
    return v;
}

Value Value::ofDouble(double d)
{
    Value v;
    v.m_kind = DOUBLE;
    v.m_num.d = d;
    return v;
}

Value Value::ofChar(char c)
{
    Value v;
    v.m_kind = CHAR;
    v.m_num.c = c;
    return v;
}

Value Value::ofString(const std::string& s)
{
    Value v;
    v.m_kind = STRING;
    v.m_str = s;
    return v;
}

Value Value::ofBytes(const vector<unsigned char>& b)
{
    Value v;
    v.m_kind = BYTES;
    v.m_bytes = b;
    return v;
}

Value Value::ofDateTime(const DateTime& dt)
{
    Value v;
    v.m_kind = DATETIME;
    v.m_dt = dt;
    return v;
}

bool Value::asBool() const
{
    switch (m_kind) {
    case BOOL: return m_num.b;
    case INT: return m_num.i != 0;
    case UINT: return m_num.u != 0;
    default: return false;
    }
}

int64_t Value::asInt() const
{
    switch (m_kind) {
    case BOOL: return m_num.b ? 1 : 0;
    case INT: return m_num.i;
    case UINT: return static_cast<int64_t>(m_num.u);
    case FLOAT: return static_cast<int64_t>(m_num.f);
    case DOUBLE: return static_cast<int64_t>(m_num.d);
    case CHAR: return m_num.c;
    default: return 0;
    }
}

uint64_t Value::asUInt() const
{
    switch (m_kind) {
    case UINT: return m_num.u;
    default: return static_cast<uint64_t>(asInt());
    }
}

float Value::asFloat() const
{
    return static_cast<float>(asDouble());
}

double Value::asDouble() const
{
    switch (m_kind) {
    case INT: return static_cast<double>(m_num.i);
    case UINT: return static_cast<double>(m_num.u);
    case FLOAT: return m_num.f;
    case DOUBLE: return m_num.d;
    default: return 0.0;
    }
}

char Value::asChar() const
{
    return m_kind == CHAR ? m_num.c : 0;
}

const string& Value::asString() const
{
    static const string empty;
    return m_kind == STRING ? m_str : empty;
}

const vector<unsigned char>& Value::asBytes() const
{
    static const vector<unsigned char> empty;
    return m_kind == BYTES ? m_bytes : empty;
}

const DateTime& Value::asDateTime() const
{
    static const DateTime empty;
    return m_kind == DATETIME ? m_dt : empty;
}

bool Value::operator==(const Value& o) const
{
    if (m_kind != o.m_kind) {
        return false;
    }
    switch (m_kind) {
    case NONE: return true;
    case BOOL: return m_num.b == o.m_num.b;
    case INT: return m_num.i == o.m_num.i;
    case UINT: return m_num.u == o.m_num.u;
    case FLOAT: return m_num.f == o.m_num.f;
    case DOUBLE: return m_num.d == o.m_num.d;
    case CHAR: return m_num.c == o.m_num.c;
    case STRING: return m_str == o.m_str;
    case BYTES: return m_bytes == o.m_bytes;
    case DATETIME: return m_dt == o.m_dt;
    }
    return false;
}

string Value::dump() const
{
    ostringstream out;
    out.imbue(std::locale::classic());
    switch (m_kind) {
    case NONE: out << "(null)"; break;
    case BOOL: out << "bool:" << (m_num.b ? "true" : "false"); break;
    case INT: out << "int:" << m_num.i; break;
    case UINT: out << "uint:" << m_num.u; break;
    case FLOAT:
        out << "float:" <<
            setprecision(numeric_limits<float>::max_digits10) << m_num.f;
        break;
    case DOUBLE:
        out << "double:" <<
            setprecision(numeric_limits<double>::max_digits10) << m_num.d;
        break;
    case CHAR: out << "char:" << m_num.c; break;
    case STRING: out << "string:[" << m_str << "]"; break;
    case BYTES: out << "bytes:" << m_bytes.size(); break;
    case DATETIME:
        out << "datetime:" << m_dt.year << "-" << m_dt.month << "-" <<
            m_dt.day << " " << m_dt.hour << ":" << m_dt.minute << ":" <<
            m_dt.second;
        if (m_dt.hasTZ)
            out << " tz " << m_dt.tzOffsetMinutes;
        break;
    }
    return out.str();
}

} // namespace UPnPCore
