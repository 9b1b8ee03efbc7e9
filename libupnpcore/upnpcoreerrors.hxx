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
#ifndef _UPNPCOREERRORS_HXX_INCLUDED_
#define _UPNPCOREERRORS_HXX_INCLUDED_

#include <stdexcept>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/** A string could not be decoded by its datatype (bad format, out of
 * range, not in the allowed value list...). */
class UPNPCORE_API InvalidValueException : public std::runtime_error {
public:
    InvalidValueException(const std::string& msg, const std::string& text,
                          const std::string& cause = std::string())
        : std::runtime_error(msg), m_text(text), m_cause(cause) {}

    /** The offending input */
    const std::string& text() const {
        return m_text;
    }
    /** Underlying parse error, if any */
    const std::string& cause() const {
        return m_cause;
    }

private:
    std::string m_text;
    std::string m_cause;
};

/** One model constraint violation, found by a validate() call. */
struct UPNPCORE_API ValidationError {
    ValidationError(const std::string& cls, const std::string& prop,
                    const std::string& msg)
        : className(cls), propertyName(prop), message(msg) {}
    std::string className;
    std::string propertyName;
    std::string message;
    std::string toString() const;
};

/** A descriptor document violates the schema in a way that the active
 * binder can't deal with. */
class UPNPCORE_API DescriptorBindingException : public std::runtime_error {
public:
    DescriptorBindingException(const std::string& msg,
                               const std::string& path = std::string())
        : std::runtime_error(path.empty() ? msg : msg + " at " + path),
          m_path(path) {}

    DescriptorBindingException(const std::string& msg,
                               const std::string& path,
                               const std::vector<ValidationError>& errors)
        : std::runtime_error(path.empty() ? msg : msg + " at " + path),
          m_path(path), m_errors(errors) {}

    /** Element path (/root/device/UDN) or line:column of the fault */
    const std::string& path() const {
        return m_path;
    }
    /** Model validation errors, if this was a validation failure */
    const std::vector<ValidationError>& errors() const {
        return m_errors;
    }
private:
    std::string m_path;
    std::vector<ValidationError> m_errors;
};

/** A registry mutation would break a registry invariant */
class UPNPCORE_API RegistrationException : public std::runtime_error {
public:
    RegistrationException(const std::string& msg)
        : std::runtime_error(msg) {}
    RegistrationException(const std::string& msg,
                          const std::vector<ValidationError>& errors)
        : std::runtime_error(msg), m_errors(errors) {}
    const std::vector<ValidationError>& errors() const {
        return m_errors;
    }
private:
    std::vector<ValidationError> m_errors;
};

} // namespace UPnPCore

#endif /* _UPNPCOREERRORS_HXX_INCLUDED_ */
