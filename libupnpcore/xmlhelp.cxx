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
#include "libupnpcore/xmlhelp.hxx"

#include <cctype>

using namespace std;

namespace UPnPCore {

string XMLHelp::xmlQuote(const string& in)
{
    string out;
    for (auto c : in) {
        switch (c) {
        case '"':
            out += "&quot;";
            break;
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

// Does the text at pos (just after an '&') look like a reference we
// should leave alone: &name; &#123; &#x1F;
static bool isEntityRef(const string& in, string::size_type pos)
{
    string::size_type i = pos;
    if (i < in.size() && in[i] == '#') {
        i++;
        bool hex = false;
        if (i < in.size() && (in[i] == 'x' || in[i] == 'X')) {
            hex = true;
            i++;
        }
        string::size_type start = i;
        while (i < in.size() &&
               (hex ? isxdigit((unsigned char)in[i]) :
                isdigit((unsigned char)in[i]))) {
            i++;
        }
        return i > start && i < in.size() && in[i] == ';';
    }
    string::size_type start = i;
    while (i < in.size() &&
           (isalnum((unsigned char)in[i]) || in[i] == '_' || in[i] == '-' ||
            in[i] == '.')) {
        i++;
    }
    return i > start && i < in.size() && in[i] == ';';
}

string XMLHelp::fixXMLEntities(const string& in)
{
    string out;
    out.reserve(in.size() + 16);
    for (string::size_type i = 0; i < in.size(); i++) {
        if (in[i] == '&' && !isEntityRef(in, i + 1)) {
            out += "&amp;";
        } else {
            out += in[i];
        }
    }
    return out;
}

string XMLHelp::textElement(const string& nm, const string& value)
{
    return string("<") + nm + ">" + xmlQuote(value) + "</" + nm + ">";
}

} // namespace UPnPCore
