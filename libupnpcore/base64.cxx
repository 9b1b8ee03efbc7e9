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
#include "libupnpcore/base64.hxx"

using std::string;

namespace UPnPCore {

static const char Base64[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static const char Pad64 = '=';

// Reverse table. 0xff: invalid, 0xfe: white space
static const unsigned char b64values[256] = {
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xfe, 0xfe, 0xff, 0xff, 0xfe, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 62,   0xff, 0xff, 0xff, 63,
    52,   53,   54,   55,   56,   57,   58,   59,
    60,   61,   0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0,    1,    2,    3,    4,    5,    6,
    7,    8,    9,    10,   11,   12,   13,   14,
    15,   16,   17,   18,   19,   20,   21,   22,
    23,   24,   25,   0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 26,   27,   28,   29,   30,   31,   32,
    33,   34,   35,   36,   37,   38,   39,   40,
    41,   42,   43,   44,   45,   46,   47,   48,
    49,   50,   51,   0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
};

bool base64_decode(const string& in, string& out)
{
    out.clear();
    out.reserve(in.size() * 3 / 4);
    unsigned int acc = 0;
    int nbits = 0;
    int npad = 0;
    for (auto ch : in) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == Pad64) {
            npad++;
            continue;
        }
        unsigned char v = b64values[c];
        if (v == 0xfe) {
            continue;
        }
        // Data after padding, or garbage
        if (v == 0xff || npad) {
            return false;
        }
        acc = (acc << 6) | v;
        nbits += 6;
        if (nbits >= 8) {
            nbits -= 8;
            out += static_cast<char>((acc >> nbits) & 0xff);
        }
    }
    // Leftover bits must be zero fill from an incomplete quantum
    if (nbits >= 6 || npad > 2 || (acc & ((1u << nbits) - 1)) != 0) {
        return false;
    }
    return true;
}

void base64_encode(const string& in, string& out)
{
    out.clear();
    out.reserve(((in.size() + 2) / 3) * 4);
    string::size_type i = 0;
    for (; i + 2 < in.size(); i += 3) {
        unsigned int n = (static_cast<unsigned char>(in[i]) << 16) |
            (static_cast<unsigned char>(in[i+1]) << 8) |
            static_cast<unsigned char>(in[i+2]);
        out += Base64[(n >> 18) & 0x3f];
        out += Base64[(n >> 12) & 0x3f];
        out += Base64[(n >> 6) & 0x3f];
        out += Base64[n & 0x3f];
    }
    if (i < in.size()) {
        unsigned int n = static_cast<unsigned char>(in[i]) << 16;
        bool two = i + 1 < in.size();
        if (two) {
            n |= static_cast<unsigned char>(in[i+1]) << 8;
        }
        out += Base64[(n >> 18) & 0x3f];
        out += Base64[(n >> 12) & 0x3f];
        out += two ? Base64[(n >> 6) & 0x3f] : Pad64;
        out += Pad64;
    }
}

} // namespace UPnPCore
