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
#ifndef _UPNPCORE_EXPATPARSER_HXX_INCLUDED_
#define _UPNPCORE_EXPATPARSER_HXX_INCLUDED_

#include <map>
#include <string>
#include <vector>

#include <expat.h>

#include "libupnpcore/upnpcoreexports.hxx"

namespace UPnPCore {

/**
 * Thin expat wrapper parsing an in-memory document. Derived classes
 * override the element callbacks. The element stack (m_path) is
 * maintained here, including the accumulated character data for the
 * current element, so that EndElement() implementations can just look
 * at m_path.back().
 *
 * If nssep is not 0, the parser is namespace-aware: element names are
 * reported as "uri<nssep>local" (or just "local" when the element has
 * no namespace), and an undeclared prefix is a fatal parse error
 * (XML_ERROR_UNBOUND_PREFIX).
 */
class UPNPCORE_API ExpatXMLParser {
public:
    ExpatXMLParser(const std::string& input, char nssep = 0);
    virtual ~ExpatXMLParser();
    ExpatXMLParser(const ExpatXMLParser&) = delete;
    ExpatXMLParser& operator=(const ExpatXMLParser&) = delete;

    /** Parse the whole input. Returns false for an XML error, or if
     * a derived class called stopParser() */
    bool Parse();

    /** Error description: expat's message, or the one given to
     * stopParser() */
    const std::string& getLastErrorMessage() const {
        return m_errmsg;
    }
    int getLastErrorLine() const {
        return m_errline;
    }
    int getLastErrorColumn() const {
        return m_errcol;
    }
    /** True if the failure came from stopParser(), not from expat */
    bool wasStopped() const {
        return m_stopped;
    }

    struct StackEl {
        StackEl(const std::string& nm) : name(nm) {}
        // Local name (namespace part stripped if namespace-aware)
        std::string name;
        // Namespace URI or empty
        std::string uri;
        std::map<std::string, std::string> attributes;
        std::string data;
    };

protected:
    virtual void StartElement(const XML_Char *, const XML_Char **) {}
    virtual void EndElement(const XML_Char *) {}
    virtual void CharacterData(const XML_Char *, int) {}

    /** Abort the parse from inside a callback. Parse() will return
     * false with msg as error message. */
    void stopParser(const std::string& msg);

    /** Current parse position, as "line:column" */
    std::string position() const;

    /** Slash-separated local names of the current stack, like
     * /root/device/UDN */
    std::string pathString() const;

    std::vector<StackEl> m_path;
    char m_nssep;

private:
    static void startElementCB(void *ud, const XML_Char *name,
                               const XML_Char **attrs);
    static void endElementCB(void *ud, const XML_Char *name);
    static void characterDataCB(void *ud, const XML_Char *s, int len);

    const std::string& m_input;
    XML_Parser m_parser{nullptr};
    std::string m_errmsg;
    int m_errline{0};
    int m_errcol{0};
    bool m_stopped{false};
};

} // namespace UPnPCore

#endif /* _UPNPCORE_EXPATPARSER_HXX_INCLUDED_ */
