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
#ifndef _UPNPCORE_DATATYPE_HXX_INCLUDED_
#define _UPNPCORE_DATATYPE_HXX_INCLUDED_

#include <memory>
#include <string>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/types/value.hxx"

namespace UPnPCore {

/** Native types that a datatype may be asked to handle. Stands in for
 * the reflection used by annotation-driven service binders. */
enum class NativeType {BOOLEAN, CHARACTER, BYTE, SHORT, INTEGER,
        UNSIGNED_ONE_BYTE, UNSIGNED_TWO_BYTES, UNSIGNED_FOUR_BYTES,
        FLOAT, DOUBLE, STRING, BYTE_ARRAY, DATE, URI};

/**
 * An UPnP state variable datatype. The builtin datatypes are
 * immutable singletons, obtained through builtin() or
 * fromDescriptorName().
 *
 * valueOf() decodes the wire string. The empty string always
 * decodes to a null Value. Other undecodable or out of range input
 * throws InvalidValueException. toString() is the exact inverse.
 */
class UPNPCORE_API Datatype {
public:
    enum Builtin {UI1, UI2, UI4, I1, I2, I2_SHORT, I4, INT, R4, R8, NUMBER,
                  FIXED144, FLOAT, CHAR, STRING, DATE, DATETIME,
                  DATETIME_TZ, TIME, TIME_TZ, BOOLEAN, BIN_BASE64, BIN_HEX,
                  URI, UUID, CUSTOM};

    virtual ~Datatype() {}

    virtual Builtin getBuiltin() const = 0;

    /** Name used in the dataType element of a service description */
    virtual std::string getDescriptorName() const;

    /** Decode a wire string. @throw InvalidValueException */
    virtual Value valueOf(const std::string& s) const = 0;

    /** Encode a value. Null gives the empty string.
     * @throw InvalidValueException if isValid() fails */
    virtual std::string toString(const Value& v) const;

    /** Check kind and range. A null value is valid. */
    virtual bool isValid(const Value& v) const = 0;

    virtual bool isHandlingType(NativeType tp) const = 0;

    /** Human readable description, for error messages and dumps */
    virtual std::string getDisplayString() const;

    bool isNumeric() const;

    /** Return the shared instance for a builtin type. CUSTOM gives an
     * unnamed custom type. */
    static std::shared_ptr<const Datatype> builtin(Builtin b);

    /** Map a descriptor name (ui2, string, dateTime.tz...) to a
     * builtin. @return false for unknown names */
    static bool getBuiltinByName(const std::string& nm, Builtin *b);

    /** Return the builtin datatype for a known descriptor name, else a
     * new CustomDatatype carrying the name. */
    static std::shared_ptr<const Datatype>
    fromDescriptorName(const std::string& nm);

    /** The default builtin used for a native type */
    static Builtin defaultBuiltin(NativeType tp);

    static std::string builtinName(Builtin b);

protected:
    // Encode a valid, non-null value
    virtual std::string encode(const Value& v) const = 0;
};

/** Signed or unsigned integers with a fixed range */
class UPNPCORE_API IntegerDatatype : public Datatype {
public:
    IntegerDatatype(Builtin b, long long min, long long max);
    Builtin getBuiltin() const override {
        return m_builtin;
    }
    Value valueOf(const std::string& s) const override;
    bool isValid(const Value& v) const override;
    bool isHandlingType(NativeType tp) const override;
    std::string getDisplayString() const override;
    long long getMinValue() const {
        return m_min;
    }
    long long getMaxValue() const {
        return m_max;
    }
    bool isUnsigned() const {
        return m_min >= 0;
    }
protected:
    std::string encode(const Value& v) const override;
private:
    Builtin m_builtin;
    long long m_min;
    long long m_max;
};

/** Datatype for dataType names we don't know about. Values are
 * handled as strings. */
class UPNPCORE_API CustomDatatype : public Datatype {
public:
    CustomDatatype(const std::string& name) : m_name(name) {}
    Builtin getBuiltin() const override {
        return CUSTOM;
    }
    std::string getDescriptorName() const override {
        return m_name;
    }
    const std::string& getName() const {
        return m_name;
    }
    Value valueOf(const std::string& s) const override;
    bool isValid(const Value& v) const override;
    bool isHandlingType(NativeType) const override {
        return false;
    }
    std::string getDisplayString() const override;
protected:
    std::string encode(const Value& v) const override;
private:
    std::string m_name;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_DATATYPE_HXX_INCLUDED_ */
