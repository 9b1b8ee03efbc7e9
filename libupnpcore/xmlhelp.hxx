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
#ifndef _UPNPCORE_XMLHELP_HXX_INCLUDED_
#define _UPNPCORE_XMLHELP_HXX_INCLUDED_

#include <string>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

namespace XMLHelp {
/** Quote an XML text or attribute value */
UPNPCORE_API std::string xmlQuote(const std::string& in);
/** Escape the '&' characters which do not start a character or
 * predefined entity reference. Returns the input if nothing needs
 * fixing. */
UPNPCORE_API std::string fixXMLEntities(const std::string& in);
/** Build "<nm>quoted value</nm>" */
UPNPCORE_API std::string textElement(const std::string& nm,
                                     const std::string& value);
}

} // namespace UPnPCore

#endif /* _UPNPCORE_XMLHELP_HXX_INCLUDED_ */
