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

#include "libupnpcore/expatparser.hxx"

#include <sstream>

#include "libupnpcore/log.hxx"

using namespace std;

namespace UPnPCore {

ExpatXMLParser::ExpatXMLParser(const string& input, char nssep)
    : m_nssep(nssep), m_input(input)
{
    if (m_nssep) {
        m_parser = XML_ParserCreateNS(nullptr, m_nssep);
    } else {
        m_parser = XML_ParserCreate(nullptr);
    }
    if (nullptr == m_parser) {
        LOGERR("ExpatXMLParser: XML_ParserCreate failed\n");
        return;
    }
    XML_SetUserData(m_parser, this);
    XML_SetElementHandler(m_parser, startElementCB, endElementCB);
    XML_SetCharacterDataHandler(m_parser, characterDataCB);
}

ExpatXMLParser::~ExpatXMLParser()
{
    if (m_parser) {
        XML_ParserFree(m_parser);
    }
}

bool ExpatXMLParser::Parse()
{
    if (nullptr == m_parser) {
        m_errmsg = "no parser";
        return false;
    }
    XML_Status st = XML_Parse(m_parser, m_input.c_str(),
                              static_cast<int>(m_input.size()), XML_TRUE);
    if (m_stopped) {
        return false;
    }
    if (st != XML_STATUS_OK) {
        m_errline = static_cast<int>(XML_GetCurrentLineNumber(m_parser));
        m_errcol = static_cast<int>(XML_GetCurrentColumnNumber(m_parser));
        m_errmsg = XML_ErrorString(XML_GetErrorCode(m_parser));
        LOGDEB("ExpatXMLParser::Parse: " << m_errmsg << " at " <<
               m_errline << ":" << m_errcol << "\n");
        return false;
    }
    return true;
}

void ExpatXMLParser::stopParser(const string& msg)
{
    if (m_stopped) {
        return;
    }
    m_stopped = true;
    m_errmsg = msg;
    m_errline = static_cast<int>(XML_GetCurrentLineNumber(m_parser));
    m_errcol = static_cast<int>(XML_GetCurrentColumnNumber(m_parser));
    XML_StopParser(m_parser, XML_FALSE);
}

string ExpatXMLParser::position() const
{
    ostringstream str;
    str << XML_GetCurrentLineNumber(m_parser) << ":" <<
        XML_GetCurrentColumnNumber(m_parser);
    return str.str();
}

string ExpatXMLParser::pathString() const
{
    string out;
    for (const auto& el : m_path) {
        out += "/" + el.name;
    }
    return out;
}

void ExpatXMLParser::startElementCB(void *ud, const XML_Char *name,
                                    const XML_Char **attrs)
{
    auto me = static_cast<ExpatXMLParser*>(ud);
    if (me->m_stopped) {
        return;
    }
    string nm(name);
    string uri;
    if (me->m_nssep) {
        string::size_type pos = nm.rfind(me->m_nssep);
        if (pos != string::npos) {
            uri = nm.substr(0, pos);
            nm = nm.substr(pos + 1);
        }
    }
    me->m_path.push_back(StackEl(nm));
    me->m_path.back().uri = uri;
    for (int i = 0; attrs[i] != 0; i += 2) {
        me->m_path.back().attributes[attrs[i]] = attrs[i+1];
    }
    me->StartElement(name, attrs);
}

void ExpatXMLParser::endElementCB(void *ud, const XML_Char *name)
{
    auto me = static_cast<ExpatXMLParser*>(ud);
    if (me->m_stopped) {
        return;
    }
    me->EndElement(name);
    if (!me->m_path.empty()) {
        me->m_path.pop_back();
    }
}

void ExpatXMLParser::characterDataCB(void *ud, const XML_Char *s, int len)
{
    auto me = static_cast<ExpatXMLParser*>(ud);
    if (me->m_stopped || nullptr == s || len <= 0) {
        return;
    }
    if (!me->m_path.empty()) {
        me->m_path.back().data.append(s, len);
    }
    me->CharacterData(s, len);
}

} // namespace UPnPCore
