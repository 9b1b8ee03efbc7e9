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
#include "libupnpcore/config.h"

#include "libupnpcore/upnpcore.hxx"

#include <cstdarg>
#include <cctype>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "libupnpcore/log.hxx"
#include "libupnpcore/upnpcore_p.hxx"

using namespace std;

namespace UPnPCore {

struct UPnPCoreOptions {
    unsigned int flags{0};
    std::string logfilename;
    int loglevel{Logger::LLERR};
};
static UPnPCoreOptions options;
static bool o_initdone{false};

bool init(unsigned int flags, ...)
{
    va_list ap;

    if (o_initdone) {
        std::cerr << "UPnPCore::init: lib already initialized\n";
        return false;
    }
    options.flags = flags;

    bool ok = true;
    va_start(ap, flags);
    for (;;) {
        int option = static_cast<InitOption>(va_arg(ap, int));
        if (option == UPNPCORE_OPTION_END) {
            break;
        }
        switch (option) {
        case UPNPCORE_OPTION_LOGFILENAME:
            options.logfilename = *((std::string*)(va_arg(ap, std::string*)));
            break;
        case UPNPCORE_OPTION_LOGLEVEL:
            options.loglevel = va_arg(ap, int);
            break;
        default:
            std::cerr << "UPnPCore::init: unknown option value " << option <<"\n";
            ok = false;
        }
        if (!ok) {
            break;
        }
    }
    va_end(ap);
    if (!ok) {
        return false;
    }

    if (0 == (options.flags & UPNPCORE_FLAG_NOLOG)) {
        if (options.loglevel < Logger::LLNON ||
            options.loglevel > Logger::LLDEB2) {
            std::cerr << "UPnPCore::init: bad log level " <<
                options.loglevel << "\n";
            return false;
        }
        Logger *log = Logger::getTheLog(options.logfilename);
        log->setLogLevel(Logger::LogLevel(options.loglevel));
    }
    o_initdone = true;
    LOGDEB("UPnPCore::init: " << versionString() << " log [" <<
           options.logfilename << "] level " << options.loglevel << '\n');
    return true;
}

string versionString()
{
    return string("libupnpcore ") + UPNPCORE_PACKAGE_VERSION;
}

/////////////////////// Small global helpers

bool urlisabsolute(const string& url)
{
    string::size_type pos = url.find("://");
    if (pos == string::npos || pos == 0)
        return false;
    // The scheme must come before any path or query character
    return url.find_first_of("/?#") > pos;
}

string urlhost(const string& url)
{
    if (!urlisabsolute(url))
        return string();
    string::size_type start = url.find("://") + 3;
    string::size_type end = url.find_first_of("/?#", start);
    string hostport = url.substr(start, end == string::npos ?
                                 string::npos : end - start);
    // Strip user info
    string::size_type at = hostport.rfind('@');
    if (at != string::npos)
        hostport.erase(0, at + 1);
    if (!hostport.empty() && hostport[0] == '[') {
        // IPV6 literal
        string::size_type close = hostport.find(']');
        if (close == string::npos)
            return string();
        return hostport.substr(1, close - 1);
    }
    string::size_type colon = hostport.find(':');
    if (colon != string::npos)
        hostport.erase(colon);
    return hostport;
}

string urlpath(const string& url)
{
    if (!urlisabsolute(url))
        return url;
    string::size_type start = url.find("://") + 3;
    string::size_type pos = url.find_first_of("/?#", start);
    if (pos == string::npos)
        return "/";
    string path = url.substr(pos);
    if (path[0] != '/')
        path.insert(0, "/");
    return path;
}

string resolveurl(const string& base, const string& rel)
{
    if (urlisabsolute(rel) || !urlisabsolute(base))
        return rel;
    if (rel.empty())
        return base;
    string::size_type hstart = base.find("://") + 3;
    string::size_type pstart = base.find_first_of("/?#", hstart);
    string hostpart = base.substr(0, pstart);
    if (rel[0] == '/')
        return hostpart + rel;
    if (pstart == string::npos || base[pstart] != '/')
        return hostpart + "/" + rel;
    // Directory of the base path, query and fragment ignored
    string::size_type pend = base.find_first_of("?#", pstart);
    string path = base.substr(pstart, pend == string::npos ?
                              string::npos : pend - pstart);
    return hostpart + path.substr(0, path.rfind('/') + 1) + rel;
}

template <class T> bool csvToStrings(const string &s, T &tokens)
{
    string current;
    tokens.clear();
    enum states {TOKEN, ESCAPE};
    states state = TOKEN;
    for (char i : s) {
        switch (i) {
        case ',':
            switch(state) {
            case TOKEN:
                tokens.insert(tokens.end(), current);
                current.clear();
                continue;
            case ESCAPE:
                current.push_back(',');
                state = TOKEN;
                continue;
            }
            break;
        case '\\':
            switch(state) {
            case TOKEN:
                state=ESCAPE;
                continue;
            case ESCAPE:
                current.push_back('\\');
                state = TOKEN;
                continue;
            }
            break;

        default:
            switch(state) {
            case ESCAPE:
                state = TOKEN;
                break;
            case TOKEN:
                break;
            }
            current.push_back(i);
        }
    }
    switch(state) {
    case TOKEN:
        tokens.insert(tokens.end(), current);
        break;
    case ESCAPE:
        return false;
    }
    return true;
}

template bool csvToStrings<vector<string> >(const string &, vector<string> &);

void trimstring(string& s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());
    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length()-1)
        s.replace(pos + 1, string::npos, string());
}

string stringtolower(const string& in)
{
    string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) {return char(::tolower(c));});
    return out;
}

bool beginswith(const string& bg, const string& pref)
{
    return bg.compare(0, pref.size(), pref) == 0;
}

void stringSplit(const string& s, char sep, vector<string>& tokens)
{
    tokens.clear();
    string::size_type start = 0;
    for (;;) {
        string::size_type pos = s.find(sep, start);
        if (pos == string::npos) {
            tokens.push_back(s.substr(start));
            break;
        }
        tokens.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace UPnPCore
