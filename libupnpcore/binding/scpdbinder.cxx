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

#include "libupnpcore/binding/scpdbinder.hxx"

#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

#include "libupnpcore/expatparser.hxx"
#include "libupnpcore/log.hxx"
#include "libupnpcore/types/datatype.hxx"
#include "libupnpcore/upnpcore_p.hxx"
#include "libupnpcore/xmlhelp.hxx"

using namespace std;

namespace UPnPCore {

const string ServiceDescriptorBinder::SERVICE_NAMESPACE(
    "urn:schemas-upnp-org:service-1-0");

static string localName(const string& nm)
{
    string::size_type colon = nm.find(':');
    return colon == string::npos ? nm : nm.substr(colon + 1);
}

static bool parseRangeValue(const string& s, long long *out)
{
    if (s.empty())
        return false;
    char *endptr;
    // Some devices write "100.0"
    double d = strtod(s.c_str(), &endptr);
    if (*endptr != 0)
        return false;
    // Bounds must be integral and fit a long long. 2^63 is exact in
    // a double, LLONG_MAX is not.
    if (!std::isfinite(d) || d != std::floor(d) ||
        d < -9223372036854775808.0 || d >= 9223372036854775808.0)
        return false;
    *out = static_cast<long long>(d);
    return true;
}

// The parse is done on qualified names with the prefixes ignored: the
// SCPD namespace is not checked, devices get it wrong often enough.
class SCPDParser : public ExpatXMLParser {
public:
    SCPDParser(const string& input)
        : ExpatXMLParser(input) {}

    vector<Action> actions;
    vector<StateVariable> stateVariables;
    string errpath;

protected:
    void StartElement(const XML_Char *name, const XML_Char **) override {
        string nm = localName(name);
        const string parent = parentName();
        if (m_path.size() == 1) {
            if (nm != "scpd") {
                error("Root element is <" + nm + ">, not <scpd>");
            }
        } else if (nm == "action" && parent == "actionList") {
            m_action = Action();
            m_inaction = true;
        } else if (nm == "argument" && parent == "argumentList" &&
                   m_inaction) {
            m_arg = ActionArgument();
            m_inarg = true;
        } else if (nm == "stateVariable" && parent == "serviceStateTable") {
            m_sv = StateVariable();
            m_insv = true;
            m_rangeok = true;
            const auto& attrs = m_path.back().attributes;
            auto it = attrs.find("sendEvents");
            if (it != attrs.end()) {
                m_sv.eventDetails.sendEvents =
                    stringtolower(it->second) != "no";
            }
        } else if (nm == "allowedValueRange" && m_insv) {
            m_sv.typeDetails.hasAllowedValueRange = true;
        }
    }

    void EndElement(const XML_Char *name) override {
        if (m_stop) {
            return;
        }
        string nm = localName(name);
        const string parent = parentName();
        string data(m_path.back().data);
        trimstring(data);

        if (m_inarg) {
            if (nm == "argument") {
                m_action.arguments.push_back(m_arg);
                m_inarg = false;
            } else if (nm == "name") {
                m_arg.name = data;
            } else if (nm == "direction") {
                string dir = stringtolower(data);
                if (dir == "in") {
                    m_arg.direction = ActionArgument::IN;
                } else if (dir == "out") {
                    m_arg.direction = ActionArgument::OUT;
                } else {
                    error("Invalid argument direction [" + data + "]");
                }
            } else if (nm == "relatedStateVariable") {
                m_arg.relatedStateVariableName = data;
            } else if (nm == "retval") {
                m_arg.returnValue = true;
            }
        } else if (m_inaction) {
            if (nm == "action") {
                actions.push_back(m_action);
                m_inaction = false;
            } else if (nm == "name" && parent == "action") {
                m_action.name = data;
            }
        } else if (m_insv) {
            TypeDetails& td = m_sv.typeDetails;
            if (nm == "stateVariable") {
                endStateVariable();
            } else if (nm == "name") {
                m_sv.name = data;
            } else if (nm == "dataType") {
                if (!data.empty())
                    td.datatype = Datatype::fromDescriptorName(data);
            } else if (nm == "defaultValue") {
                td.defaultValue = data;
            } else if (nm == "allowedValue") {
                td.allowedValues.push_back(data);
            } else if (parent == "allowedValueRange") {
                long long v = 0;
                bool ok = parseRangeValue(data, &v);
                if (nm == "minimum") {
                    m_rangeok = m_rangeok && ok;
                    td.allowedValueRange.minimum = v;
                } else if (nm == "maximum") {
                    m_rangeok = m_rangeok && ok;
                    td.allowedValueRange.maximum = v;
                } else if (nm == "step" && ok) {
                    td.allowedValueRange.step = v;
                }
            }
        }
    }

private:
    const string parentName() const {
        return m_path.size() < 2 ? string() :
            localName(m_path[m_path.size() - 2].name);
    }

    void error(const string& msg) {
        m_stop = true;
        errpath = pathString();
        stopParser(msg);
    }

    void endStateVariable() {
        TypeDetails& td = m_sv.typeDetails;
        if (td.hasAllowedValueRange) {
            AllowedValueRange& range = td.allowedValueRange;
            if (!m_rangeok) {
                LOGINF("SCPDParser: " << m_sv.name <<
                       ": ignoring unparseable allowedValueRange\n");
                td.hasAllowedValueRange = false;
                range = AllowedValueRange();
            } else if (range.minimum > range.maximum) {
                LOGINF("SCPDParser: " << m_sv.name <<
                       ": allowedValueRange minimum > maximum, swapping\n");
                std::swap(range.minimum, range.maximum);
            }
        }
        stateVariables.push_back(m_sv);
        m_insv = false;
    }

    bool m_stop{false};
    bool m_inaction{false};
    bool m_inarg{false};
    bool m_insv{false};
    bool m_rangeok{true};
    Action m_action;
    ActionArgument m_arg;
    StateVariable m_sv;
};

shared_ptr<Service> ServiceDescriptorBinder::describe(
    const Service& undescribed, const string& xml) const
{
    SCPDParser parser(xml);
    if (!parser.Parse()) {
        if (parser.wasStopped()) {
            throw DescriptorBindingException(parser.getLastErrorMessage(),
                                             parser.errpath);
        }
        throw DescriptorBindingException(
            "Could not parse service descriptor: " +
            parser.getLastErrorMessage(),
            to_string(parser.getLastErrorLine()) + ":" +
            to_string(parser.getLastErrorColumn()));
    }

    auto service = make_shared<Service>(undescribed.getServiceType(),
                                        undescribed.getServiceId());
    service->descriptorURL = undescribed.descriptorURL;
    service->controlURL = undescribed.controlURL;
    service->eventSubscriptionURL = undescribed.eventSubscriptionURL;
    service->actions.swap(parser.actions);
    service->stateVariables.swap(parser.stateVariables);

    auto errors = service->validate();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            LOGDEB("ServiceDescriptorBinder: " << err.toString() << "\n");
        }
        throw DescriptorBindingException("Validation of service model failed",
                                         "/scpd", errors);
    }
    return service;
}

string ServiceDescriptorBinder::generate(const Service& service) const
{
    using XMLHelp::textElement;
    string out("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
               "<scpd xmlns=\"" + SERVICE_NAMESPACE + "\">\n"
               "  <specVersion>\n"
               "    <major>1</major>\n"
               "    <minor>0</minor>\n"
               "  </specVersion>\n");

    if (service.hasActions()) {
        out += "  <actionList>\n";
        for (const auto& action : service.actions) {
            out += "    <action>\n";
            out += "      " + textElement("name", action.name) + "\n";
            if (!action.arguments.empty()) {
                out += "      <argumentList>\n";
                for (const auto& arg : action.arguments) {
                    out += "        <argument>\n";
                    out += "          " + textElement("name", arg.name) + "\n";
                    out += "          " + textElement(
                        "direction",
                        arg.direction == ActionArgument::IN ? "in" : "out") +
                        "\n";
                    if (arg.returnValue)
                        out += "          <retval/>\n";
                    out += "          " + textElement(
                        "relatedStateVariable",
                        arg.relatedStateVariableName) + "\n";
                    out += "        </argument>\n";
                }
                out += "      </argumentList>\n";
            }
            out += "    </action>\n";
        }
        out += "  </actionList>\n";
    }

    out += "  <serviceStateTable>\n";
    for (const auto& sv : service.stateVariables) {
        const TypeDetails& td = sv.typeDetails;
        out += string("    <stateVariable sendEvents=\"") +
            (sv.eventDetails.sendEvents ? "yes" : "no") + "\">\n";
        out += "      " + textElement("name", sv.name) + "\n";
        if (td.datatype)
            out += "      " + textElement("dataType",
                                          td.datatype->getDescriptorName()) +
                "\n";
        if (!td.defaultValue.empty())
            out += "      " + textElement("defaultValue", td.defaultValue) +
                "\n";
        if (!td.allowedValues.empty()) {
            out += "      <allowedValueList>\n";
            for (const auto& val : td.allowedValues) {
                out += "        " + textElement("allowedValue", val) + "\n";
            }
            out += "      </allowedValueList>\n";
        }
        if (td.hasAllowedValueRange) {
            const AllowedValueRange& range = td.allowedValueRange;
            out += "      <allowedValueRange>\n";
            out += "        " +
                textElement("minimum", to_string(range.minimum)) + "\n";
            out += "        " +
                textElement("maximum", to_string(range.maximum)) + "\n";
            out += "        " +
                textElement("step", to_string(range.step)) + "\n";
            out += "      </allowedValueRange>\n";
        }
        out += "    </stateVariable>\n";
    }
    out += "  </serviceStateTable>\n";
    out += "</scpd>\n";
    return out;
}

} // namespace UPnPCore
