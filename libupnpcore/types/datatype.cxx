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
#include "libupnpcore/types/datatype.hxx"

#include <cerrno>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <vector>

#include "libupnpcore/base64.hxx"
#include "libupnpcore/upnpcore_p.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"

using namespace std;

namespace UPnPCore {

static const struct BuiltinName {
    Datatype::Builtin builtin;
    const char *name;
} builtinNames[] = {
    {Datatype::UI1, "ui1"},
    {Datatype::UI2, "ui2"},
    {Datatype::UI4, "ui4"},
    {Datatype::I1, "i1"},
    {Datatype::I2, "i2"},
    {Datatype::I2_SHORT, "i2"},
    {Datatype::I4, "i4"},
    {Datatype::INT, "int"},
    {Datatype::R4, "r4"},
    {Datatype::R8, "r8"},
    {Datatype::NUMBER, "number"},
    {Datatype::FIXED144, "fixed.14.4"},
    {Datatype::FLOAT, "float"},
    {Datatype::CHAR, "char"},
    {Datatype::STRING, "string"},
    {Datatype::DATE, "date"},
    {Datatype::DATETIME, "dateTime"},
    {Datatype::DATETIME_TZ, "dateTime.tz"},
    {Datatype::TIME, "time"},
    {Datatype::TIME_TZ, "time.tz"},
    {Datatype::BOOLEAN, "boolean"},
    {Datatype::BIN_BASE64, "bin.base64"},
    {Datatype::BIN_HEX, "bin.hex"},
    {Datatype::URI, "uri"},
    {Datatype::UUID, "uuid"},
};

static InvalidValueException badValue(const Datatype *dt, const string& s,
                                      const string& cause)
{
    return InvalidValueException(
        string("Invalid ") + dt->getDescriptorName() + " value [" + s +
        "]: " + cause, s, cause);
}

/////////////// Integers

IntegerDatatype::IntegerDatatype(Builtin b, long long min, long long max)
    : m_builtin(b), m_min(min), m_max(max)
{
}

Value IntegerDatatype::valueOf(const string& s) const
{
    if (s.empty()) {
        return Value();
    }
    string t(s);
    trimstring(t);
    string::size_type i = 0;
    if (!t.empty() && (t[0] == '+' || t[0] == '-')) {
        i = 1;
    }
    if (i >= t.size()) {
        throw badValue(this, s, "not a decimal integer");
    }
    for (string::size_type j = i; j < t.size(); j++) {
        if (!isdigit(static_cast<unsigned char>(t[j]))) {
            throw badValue(this, s, "not a decimal integer");
        }
    }
    errno = 0;
    long long v = strtoll(t.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        throw badValue(this, s, "integer overflow");
    }
    if (v < m_min || v > m_max) {
        throw badValue(this, s, "out of range [" + to_string(m_min) + "," +
                       to_string(m_max) + "]");
    }
    if (isUnsigned()) {
        return Value::ofUInt(static_cast<uint64_t>(v));
    }
    return Value::ofInt(v);
}

bool IntegerDatatype::isValid(const Value& v) const
{
    switch (v.kind()) {
    case Value::NONE:
        return true;
    case Value::INT:
        return v.asInt() >= m_min && v.asInt() <= m_max;
    case Value::UINT:
        return v.asUInt() <= static_cast<unsigned long long>(m_max);
    default:
        return false;
    }
}

string IntegerDatatype::encode(const Value& v) const
{
    if (v.kind() == Value::UINT) {
        return to_string(v.asUInt());
    }
    return to_string(v.asInt());
}

bool IntegerDatatype::isHandlingType(NativeType tp) const
{
    switch (m_builtin) {
    case UI1:
        return tp == NativeType::UNSIGNED_ONE_BYTE;
    case UI2:
        return tp == NativeType::UNSIGNED_TWO_BYTES;
    case UI4:
        return tp == NativeType::UNSIGNED_FOUR_BYTES;
    case I2_SHORT:
        return tp == NativeType::SHORT;
    default:
        return tp == NativeType::BYTE || tp == NativeType::SHORT ||
            tp == NativeType::INTEGER;
    }
}

string IntegerDatatype::getDisplayString() const
{
    return "(IntegerDatatype) " + getDescriptorName() + " [" +
        to_string(m_min) + "," + to_string(m_max) + "]";
}

/////////////// Floating point

namespace {

template <class T> bool parseReal(const string& in, T *v)
{
    string t(in);
    trimstring(t);
    if (t.empty()) {
        return false;
    }
    istringstream str(t);
    str.imbue(std::locale::classic());
    str >> *v;
    return !str.fail() && str.eof() && std::isfinite(*v);
}

template <class T> string formatReal(T v)
{
    ostringstream str;
    str.imbue(std::locale::classic());
    str << setprecision(numeric_limits<T>::max_digits10) << v;
    return str.str();
}

// r4
class FloatDatatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return R4;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        float f;
        if (!parseReal(s, &f)) {
            throw badValue(this, s, "Can't convert string to number");
        }
        return Value::ofFloat(f);
    }
    bool isValid(const Value& v) const override {
        return v.isNull() ||
            (v.kind() == Value::FLOAT && std::isfinite(v.asFloat()));
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::FLOAT;
    }
protected:
    string encode(const Value& v) const override {
        return formatReal(v.asFloat());
    }
};

// r8, number, fixed.14.4, float
class DoubleDatatype : public Datatype {
public:
    DoubleDatatype(Builtin b) : m_builtin(b) {}
    Builtin getBuiltin() const override {
        return m_builtin;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        double d;
        if (!parseReal(s, &d)) {
            throw badValue(this, s, "Can't convert string to number");
        }
        return Value::ofDouble(d);
    }
    bool isValid(const Value& v) const override {
        return v.isNull() ||
            (v.kind() == Value::DOUBLE && std::isfinite(v.asDouble()));
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::DOUBLE;
    }
protected:
    string encode(const Value& v) const override {
        return formatReal(v.asDouble());
    }
private:
    Builtin m_builtin;
};

/////////////// Text

class CharacterDatatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return CHAR;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        if (s.size() != 1) {
            throw badValue(this, s, "not a single character");
        }
        return Value::ofChar(s[0]);
    }
    bool isValid(const Value& v) const override {
        return v.isNull() || (v.kind() == Value::CHAR && v.asChar() != 0);
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::CHARACTER;
    }
protected:
    string encode(const Value& v) const override {
        return string(1, v.asChar());
    }
};

// string, uuid
class StringDatatype : public Datatype {
public:
    StringDatatype(Builtin b) : m_builtin(b) {}
    Builtin getBuiltin() const override {
        return m_builtin;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        return Value::ofString(s);
    }
    bool isValid(const Value& v) const override {
        return v.isNull() || v.kind() == Value::STRING;
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::STRING;
    }
protected:
    string encode(const Value& v) const override {
        return v.asString();
    }
private:
    Builtin m_builtin;
};

class BooleanDatatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return BOOLEAN;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        string t(s);
        trimstring(t);
        t = stringtolower(t);
        if (t == "1" || t == "true" || t == "yes" || t == "on") {
            return Value::ofBool(true);
        } else if (t == "0" || t == "false" || t == "no" || t == "off") {
            return Value::ofBool(false);
        }
        throw badValue(this, s, "not a boolean");
    }
    bool isValid(const Value& v) const override {
        return v.isNull() || v.kind() == Value::BOOL;
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::BOOLEAN;
    }
protected:
    string encode(const Value& v) const override {
        return v.asBool() ? "1" : "0";
    }
};

/////////////// Dates and times

class DateTimeDatatype : public Datatype {
public:
    DateTimeDatatype(Builtin b) : m_builtin(b) {}
    Builtin getBuiltin() const override {
        return m_builtin;
    }
    Value valueOf(const string& s) const override;
    bool isValid(const Value& v) const override;
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::DATE;
    }
protected:
    string encode(const Value& v) const override;
private:
    bool wantsDate() const {
        return m_builtin == DATE || m_builtin == DATETIME ||
            m_builtin == DATETIME_TZ;
    }
    bool allowsTZ() const {
        return m_builtin == DATETIME_TZ || m_builtin == TIME_TZ;
    }
    Builtin m_builtin;
};

// Read exactly n digits at pos
static bool getDigits(const string& s, string::size_type& pos, int n, int *v)
{
    if (pos + n > s.size()) {
        return false;
    }
    int out = 0;
    for (int i = 0; i < n; i++) {
        char c = s[pos + i];
        if (!isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    pos += n;
    *v = out;
    return true;
}

static bool getChar(const string& s, string::size_type& pos, char c)
{
    if (pos < s.size() && s[pos] == c) {
        pos++;
        return true;
    }
    return false;
}

static int daysInMonth(int year, int month)
{
    static const int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) ||
                       year % 400 == 0)) {
        return 29;
    }
    return days[month - 1];
}

static bool fieldsValid(const DateTime& dt)
{
    if (dt.hasDate) {
        if (dt.year < 0 || dt.year > 9999 || dt.month < 1 || dt.month > 12 ||
            dt.day < 1 || dt.day > daysInMonth(dt.year, dt.month)) {
            return false;
        }
    }
    if (dt.hasTime) {
        if (dt.hour < 0 || dt.hour > 23 || dt.minute < 0 || dt.minute > 59 ||
            dt.second < 0 || dt.second > 59) {
            return false;
        }
    }
    if (dt.hasTZ && (dt.tzOffsetMinutes < -14 * 60 ||
                     dt.tzOffsetMinutes > 14 * 60)) {
        return false;
    }
    return true;
}

Value DateTimeDatatype::valueOf(const string& s) const
{
    if (s.empty()) {
        return Value();
    }
    string t(s);
    trimstring(t);
    DateTime dt;
    string::size_type pos = 0;
    if (wantsDate()) {
        if (!getDigits(t, pos, 4, &dt.year) || !getChar(t, pos, '-') ||
            !getDigits(t, pos, 2, &dt.month) || !getChar(t, pos, '-') ||
            !getDigits(t, pos, 2, &dt.day)) {
            throw badValue(this, s, "bad date, expected YYYY-MM-DD");
        }
        dt.hasDate = true;
    }
    bool timeallowed = m_builtin != DATE;
    bool timeneeded = m_builtin == TIME || m_builtin == TIME_TZ;
    if (timeallowed && (timeneeded || getChar(t, pos, 'T'))) {
        if (!getDigits(t, pos, 2, &dt.hour) || !getChar(t, pos, ':') ||
            !getDigits(t, pos, 2, &dt.minute) || !getChar(t, pos, ':') ||
            !getDigits(t, pos, 2, &dt.second)) {
            throw badValue(this, s, "bad time, expected HH:MM:SS");
        }
        dt.hasTime = true;
    }
    if (allowsTZ() && pos < t.size()) {
        if (getChar(t, pos, 'Z')) {
            dt.hasTZ = true;
        } else if (t[pos] == '+' || t[pos] == '-') {
            int sign = t[pos] == '-' ? -1 : 1;
            pos++;
            int hh, mm;
            if (!getDigits(t, pos, 2, &hh)) {
                throw badValue(this, s, "bad time zone");
            }
            getChar(t, pos, ':');
            if (!getDigits(t, pos, 2, &mm) || mm > 59) {
                throw badValue(this, s, "bad time zone");
            }
            dt.hasTZ = true;
            dt.tzOffsetMinutes = sign * (hh * 60 + mm);
        }
    }
    if (pos != t.size()) {
        throw badValue(this, s, "trailing characters");
    }
    if (!fieldsValid(dt)) {
        throw badValue(this, s, "field out of range");
    }
    return Value::ofDateTime(dt);
}

bool DateTimeDatatype::isValid(const Value& v) const
{
    if (v.isNull()) {
        return true;
    }
    if (v.kind() != Value::DATETIME) {
        return false;
    }
    const DateTime& dt = v.asDateTime();
    if (dt.hasDate != wantsDate()) {
        return false;
    }
    switch (m_builtin) {
    case DATE:
        if (dt.hasTime || dt.hasTZ)
            return false;
        break;
    case DATETIME:
        if (dt.hasTZ)
            return false;
        break;
    case TIME:
        if (!dt.hasTime || dt.hasTZ)
            return false;
        break;
    case TIME_TZ:
        if (!dt.hasTime)
            return false;
        break;
    default:
        break;
    }
    return fieldsValid(dt);
}

string DateTimeDatatype::encode(const Value& v) const
{
    const DateTime& dt = v.asDateTime();
    char buf[64];
    string out;
    if (dt.hasDate) {
        snprintf(buf, sizeof(buf), "%04d-%02d-%02d", dt.year, dt.month,
                 dt.day);
        out += buf;
    }
    if (dt.hasTime) {
        if (dt.hasDate)
            out += "T";
        snprintf(buf, sizeof(buf), "%02d:%02d:%02d", dt.hour, dt.minute,
                 dt.second);
        out += buf;
    }
    if (dt.hasTZ) {
        if (dt.tzOffsetMinutes == 0) {
            out += "Z";
        } else {
            int off = dt.tzOffsetMinutes;
            char sign = off < 0 ? '-' : '+';
            off = off < 0 ? -off : off;
            snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, off / 60, off % 60);
            out += buf;
        }
    }
    return out;
}

/////////////// Binary

class Base64Datatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return BIN_BASE64;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        string decoded;
        if (!base64_decode(s, decoded)) {
            throw badValue(this, s, "bad base64 data");
        }
        return Value::ofBytes(vector<unsigned char>(decoded.begin(),
                                                    decoded.end()));
    }
    bool isValid(const Value& v) const override {
        return v.isNull() || v.kind() == Value::BYTES;
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::BYTE_ARRAY;
    }
protected:
    string encode(const Value& v) const override {
        const auto& b = v.asBytes();
        return base64_encode(string(b.begin(), b.end()));
    }
};

static int hexval(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

class BinHexDatatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return BIN_HEX;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        string t(s);
        trimstring(t);
        if (t.size() % 2) {
            throw badValue(this, s, "odd number of hex digits");
        }
        vector<unsigned char> out;
        for (string::size_type i = 0; i < t.size(); i += 2) {
            int hi = hexval(t[i]);
            int lo = hexval(t[i+1]);
            if (hi < 0 || lo < 0) {
                throw badValue(this, s, "bad hex digit");
            }
            out.push_back(static_cast<unsigned char>(hi * 16 + lo));
        }
        return Value::ofBytes(out);
    }
    bool isValid(const Value& v) const override {
        return v.isNull() || v.kind() == Value::BYTES;
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::BYTE_ARRAY;
    }
protected:
    string encode(const Value& v) const override {
        static const char digits[] = "0123456789abcdef";
        string out;
        for (auto b : v.asBytes()) {
            out += digits[b >> 4];
            out += digits[b & 0xf];
        }
        return out;
    }
};

/////////////// URI

// Check the characters of an URI reference (RFC 3986), and the scheme
// if there is one. Non-ASCII bytes are accepted (IRIs).
static bool uriSyntaxOk(const string& s, string *reason)
{
    static const string allowed(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
        "-._~:/?#[]@!$&'()*+,;=");
    for (string::size_type i = 0; i < s.size(); i++) {
        if (s[i] == '%') {
            if (i + 2 >= s.size() || hexval(s[i+1]) < 0 ||
                hexval(s[i+2]) < 0) {
                *reason = "bad percent escape";
                return false;
            }
            i += 2;
        } else if (allowed.find(s[i]) == string::npos &&
                   static_cast<unsigned char>(s[i]) < 0x80) {
            *reason = "illegal character";
            return false;
        }
    }
    string::size_type colon = s.find_first_of(":/?#");
    if (colon != string::npos && s[colon] == ':') {
        if (colon == 0 || !isalpha(static_cast<unsigned char>(s[0]))) {
            *reason = "bad scheme";
            return false;
        }
        for (string::size_type i = 1; i < colon; i++) {
            unsigned char c = s[i];
            if (!isalnum(c) && c != '+' && c != '-' && c != '.') {
                *reason = "bad scheme";
                return false;
            }
        }
    }
    return true;
}

class URIDatatype : public Datatype {
public:
    Builtin getBuiltin() const override {
        return URI;
    }
    Value valueOf(const string& s) const override {
        if (s.empty()) {
            return Value();
        }
        string reason;
        if (!uriSyntaxOk(s, &reason)) {
            throw badValue(this, s, reason);
        }
        return Value::ofString(s);
    }
    bool isValid(const Value& v) const override {
        if (v.isNull())
            return true;
        string reason;
        return v.kind() == Value::STRING && uriSyntaxOk(v.asString(), &reason);
    }
    bool isHandlingType(NativeType tp) const override {
        return tp == NativeType::URI;
    }
protected:
    string encode(const Value& v) const override {
        return v.asString();
    }
};

} // anonymous namespace

/////////////// Custom

Value CustomDatatype::valueOf(const string& s) const
{
    if (s.empty()) {
        return Value();
    }
    return Value::ofString(s);
}

bool CustomDatatype::isValid(const Value& v) const
{
    return v.isNull() || v.kind() == Value::STRING;
}

string CustomDatatype::encode(const Value& v) const
{
    return v.asString();
}

string CustomDatatype::getDisplayString() const
{
    return "(CustomDatatype) " + m_name;
}

/////////////// Datatype

string Datatype::getDescriptorName() const
{
    return builtinName(getBuiltin());
}

string Datatype::toString(const Value& v) const
{
    if (v.isNull()) {
        return string();
    }
    if (!isValid(v)) {
        throw InvalidValueException(
            "Value " + v.dump() + " is not valid for " + getDisplayString(),
            v.dump());
    }
    return encode(v);
}

string Datatype::getDisplayString() const
{
    return getDescriptorName();
}

bool Datatype::isNumeric() const
{
    switch (getBuiltin()) {
    case UI1: case UI2: case UI4: case I1: case I2: case I2_SHORT: case I4:
    case INT: case R4: case R8: case NUMBER: case FIXED144: case FLOAT:
        return true;
    default:
        return false;
    }
}

string Datatype::builtinName(Builtin b)
{
    for (const auto& ent : builtinNames) {
        if (ent.builtin == b) {
            return ent.name;
        }
    }
    return string();
}

bool Datatype::getBuiltinByName(const string& nm, Builtin *b)
{
    for (const auto& ent : builtinNames) {
        if (nm == ent.name) {
            *b = ent.builtin;
            return true;
        }
    }
    // Some devices don't get the case right (Boolean, String...)
    string lnm = stringtolower(nm);
    for (const auto& ent : builtinNames) {
        if (lnm == stringtolower(ent.name)) {
            *b = ent.builtin;
            return true;
        }
    }
    return false;
}

static vector<shared_ptr<const Datatype> > makeBuiltins()
{
    vector<shared_ptr<const Datatype> > v(Datatype::CUSTOM + 1);
    v[Datatype::UI1] = make_shared<IntegerDatatype>(Datatype::UI1, 0, 255);
    v[Datatype::UI2] = make_shared<IntegerDatatype>(Datatype::UI2, 0, 65535);
    v[Datatype::UI4] =
        make_shared<IntegerDatatype>(Datatype::UI4, 0, 4294967295LL);
    v[Datatype::I1] = make_shared<IntegerDatatype>(Datatype::I1, -128, 127);
    v[Datatype::I2] =
        make_shared<IntegerDatatype>(Datatype::I2, -32768, 32767);
    v[Datatype::I2_SHORT] =
        make_shared<IntegerDatatype>(Datatype::I2_SHORT, -32768, 32767);
    v[Datatype::I4] =
        make_shared<IntegerDatatype>(Datatype::I4, -2147483648LL, 2147483647LL);
    v[Datatype::INT] =
        make_shared<IntegerDatatype>(Datatype::INT, -2147483648LL, 2147483647LL);
    v[Datatype::R4] = make_shared<FloatDatatype>();
    v[Datatype::R8] = make_shared<DoubleDatatype>(Datatype::R8);
    v[Datatype::NUMBER] = make_shared<DoubleDatatype>(Datatype::NUMBER);
    v[Datatype::FIXED144] = make_shared<DoubleDatatype>(Datatype::FIXED144);
    v[Datatype::FLOAT] = make_shared<DoubleDatatype>(Datatype::FLOAT);
    v[Datatype::CHAR] = make_shared<CharacterDatatype>();
    v[Datatype::STRING] = make_shared<StringDatatype>(Datatype::STRING);
    v[Datatype::UUID] = make_shared<StringDatatype>(Datatype::UUID);
    v[Datatype::DATE] = make_shared<DateTimeDatatype>(Datatype::DATE);
    v[Datatype::DATETIME] = make_shared<DateTimeDatatype>(Datatype::DATETIME);
    v[Datatype::DATETIME_TZ] =
        make_shared<DateTimeDatatype>(Datatype::DATETIME_TZ);
    v[Datatype::TIME] = make_shared<DateTimeDatatype>(Datatype::TIME);
    v[Datatype::TIME_TZ] = make_shared<DateTimeDatatype>(Datatype::TIME_TZ);
    v[Datatype::BOOLEAN] = make_shared<BooleanDatatype>();
    v[Datatype::BIN_BASE64] = make_shared<Base64Datatype>();
    v[Datatype::BIN_HEX] = make_shared<BinHexDatatype>();
    v[Datatype::URI] = make_shared<URIDatatype>();
    v[Datatype::CUSTOM] = make_shared<CustomDatatype>(string());
    return v;
}

shared_ptr<const Datatype> Datatype::builtin(Builtin b)
{
    static const vector<shared_ptr<const Datatype> > builtins(makeBuiltins());
    if (b < 0 || b > CUSTOM) {
        return shared_ptr<const Datatype>();
    }
    return builtins[b];
}

shared_ptr<const Datatype> Datatype::fromDescriptorName(const string& nm)
{
    Builtin b;
    if (getBuiltinByName(nm, &b)) {
        return builtin(b);
    }
    return make_shared<CustomDatatype>(nm);
}

Datatype::Builtin Datatype::defaultBuiltin(NativeType tp)
{
    switch (tp) {
    case NativeType::BOOLEAN: return BOOLEAN;
    case NativeType::CHARACTER: return CHAR;
    case NativeType::BYTE: return I1;
    case NativeType::SHORT: return I2_SHORT;
    case NativeType::INTEGER: return I4;
    case NativeType::UNSIGNED_ONE_BYTE: return UI1;
    case NativeType::UNSIGNED_TWO_BYTES: return UI2;
    case NativeType::UNSIGNED_FOUR_BYTES: return UI4;
    case NativeType::FLOAT: return R4;
    case NativeType::DOUBLE: return R8;
    case NativeType::STRING: return STRING;
    case NativeType::BYTE_ARRAY: return BIN_BASE64;
    case NativeType::DATE: return DATETIME;
    case NativeType::URI: return URI;
    }
    return STRING;
}

} // namespace UPnPCore
