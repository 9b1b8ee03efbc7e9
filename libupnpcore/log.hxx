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
#ifndef _UPNPCORE_LOG_HXX_INCLUDED_
#define _UPNPCORE_LOG_HXX_INCLUDED_

#include <fstream>
#include <iostream>
#include <string>
#include <mutex>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/** Process-wide log. Messages go to stderr unless a file name was set. */
class UPNPCORE_API Logger {
public:
    /** Initialize logging to file if fn is not empty, or return the
     * existing log. "stderr" is special and means stderr. */
    static Logger *getTheLog(const std::string& fn = std::string());

    /** Close and reopen the output file. For rotating logs. An empty
     * fn reopens the current file */
    bool reopen(const std::string& fn);

    std::ostream& getstream() {
        return m_tocerr ? std::cerr : m_stream;
    }

    enum LogLevel {LLNON=0, LLFAT=1, LLERR=2, LLINF=3, LLDEB=4,
                   LLDEB0=5, LLDEB1=6, LLDEB2=7};

    void setLogLevel(LogLevel level) {
        m_loglevel = level;
    }
    int getloglevel() const {
        return m_loglevel;
    }
    const std::string& getlogfilename() const {
        return m_fn;
    }
    bool logisstderr() const {
        return m_tocerr;
    }

    std::recursive_mutex& getmutex() {
        return m_mutex;
    }

private:
    bool m_tocerr{false};
    int m_loglevel{LLERR};
    std::string m_fn;
    std::ofstream m_stream;
    std::recursive_mutex m_mutex;

    Logger(const std::string& fn);
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace UPnPCore

#define LOGGER_PRT (UPnPCore::Logger::getTheLog()->getstream())

#define LOGGER_LOCK                                                     \
    std::unique_lock<std::recursive_mutex> lock(                        \
        UPnPCore::Logger::getTheLog()->getmutex())

#ifndef LOGGER_LOCAL_LOGINC
#define LOGGER_LOCAL_LOGINC 0
#endif

#define LOGGER_LEVEL (UPnPCore::Logger::getTheLog()->getloglevel() +    \
                      LOGGER_LOCAL_LOGINC)

#define LOGGER_DOLOG(L,X) LOGGER_PRT << ":" << L << ":" <<              \
        __FILE__ << ":" << __LINE__ << "::" << X << std::flush

#define LOGGER_LOG(L,X) do {                                            \
        if (LOGGER_LEVEL >= L) {                                        \
            LOGGER_LOCK; LOGGER_DOLOG(L,X);                             \
        }                                                               \
    } while (0)

#define LOGFATAL(X) LOGGER_LOG(UPnPCore::Logger::LLFAT, X)
#define LOGFAT(X) LOGFATAL(X)
#define LOGERR(X) LOGGER_LOG(UPnPCore::Logger::LLERR, X)
#define LOGINF(X) LOGGER_LOG(UPnPCore::Logger::LLINF, X)
#define LOGINFO(X) LOGINF(X)
#define LOGDEB(X) LOGGER_LOG(UPnPCore::Logger::LLDEB, X)
#define LOGDEB0(X) LOGGER_LOG(UPnPCore::Logger::LLDEB0, X)
#define LOGDEB1(X) LOGGER_LOG(UPnPCore::Logger::LLDEB1, X)
#define LOGDEB2(X) LOGGER_LOG(UPnPCore::Logger::LLDEB2, X)

#endif /* _UPNPCORE_LOG_HXX_INCLUDED_ */
