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
#ifndef _UPNPCORE_P_HXX_INCLUDED_
#define _UPNPCORE_P_HXX_INCLUDED_

/* Private shared defs for the library. Clients need not and should
   not include this */

#include <string>
#include <vector>

namespace UPnPCore {

// Return the host part of an absolute url (no port), or an empty string
extern std::string urlhost(const std::string& url);
// Return the path[?query] part of an absolute url, or input if it is
// not absolute
extern std::string urlpath(const std::string& url);
extern bool urlisabsolute(const std::string& url);
// Resolve a possibly relative reference against an absolute base url:
// "/x" replaces the base path, "x" replaces its last segment.
extern std::string resolveurl(const std::string& base,
                              const std::string& rel);
template <class T> bool csvToStrings(const std::string& s, T &tokens);

extern void trimstring(std::string& s, const char *ws = " \t\r\n");
extern std::string stringtolower(const std::string& in);
extern bool beginswith(const std::string& bg, const std::string& pref);
// Split on single char, no quoting or escaping
extern void stringSplit(const std::string& s, char sep,
                        std::vector<std::string>& tokens);

} // namespace UPnPCore

#endif /* _UPNPCORE_P_HXX_INCLUDED_ */
