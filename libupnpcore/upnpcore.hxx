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
#ifndef _UPNPCORE_HXX_INCLUDED_
#define _UPNPCORE_HXX_INCLUDED_

#include <string>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/** Initialisation flags. */
enum InitFlags {
    UPNPCORE_FLAG_NONE = 0,
    /** Do not touch the log configuration at all (the application
     * manages Logger itself). */
    UPNPCORE_FLAG_NOLOG = 0x1,
};

/** Option identifiers for init(). Each option is followed by its
 * value in the argument list, which must be terminated by
 * UPNPCORE_OPTION_END. */
enum InitOption {
    UPNPCORE_OPTION_END = 0,
    /** std::string* : log file name. "stderr" or empty: standard error. */
    UPNPCORE_OPTION_LOGFILENAME,
    /** int : log level, see Logger::LogLevel. */
    UPNPCORE_OPTION_LOGLEVEL,
};

/** Set the library-wide options. Must be called once before any other
 * call if non-default values are wanted, else the defaults apply
 * (log to stderr, errors only).
 *
 * Example:
 *     std::string logfn("/tmp/upnp.log");
 *     UPnPCore::init(0, UPNPCORE_OPTION_LOGFILENAME, &logfn,
 *                    UPNPCORE_OPTION_LOGLEVEL, 4, UPNPCORE_OPTION_END);
 *
 * @return false if called twice or if an option is bad.
 */
UPNPCORE_API bool init(unsigned int flags, ...);

/** Returns something like "libupnpcore 1.0.0" */
UPNPCORE_API std::string versionString();

} // namespace UPnPCore

#endif /* _UPNPCORE_HXX_INCLUDED_ */
