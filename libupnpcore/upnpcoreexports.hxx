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
#ifndef _UPNPCOREEXPORTS_HXX_INCLUDED_
#define _UPNPCOREEXPORTS_HXX_INCLUDED_

// Symbol visibility. The library is built with -fvisibility=hidden,
// only the classes and functions marked UPNPCORE_API are exported.
#if defined _WIN32 || defined __CYGWIN__
#  ifdef UPNPCORE_BUILDING
#    define UPNPCORE_API __declspec(dllexport)
#  else
#    define UPNPCORE_API __declspec(dllimport)
#  endif
#  define UPNPCORE_LOCAL
#else
#  if __GNUC__ >= 4
#    define UPNPCORE_API __attribute__ ((visibility ("default")))
#    define UPNPCORE_LOCAL  __attribute__ ((visibility ("hidden")))
#  else
#    define UPNPCORE_API
#    define UPNPCORE_LOCAL
#  endif
#endif

#endif /* _UPNPCOREEXPORTS_HXX_INCLUDED_ */
