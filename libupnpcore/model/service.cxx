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
#include "libupnpcore/model/service.hxx"

#include <algorithm>
#include <sstream>

#include "libupnpcore/log.hxx"
#include "libupnpcore/model/device.hxx"

using namespace std;

namespace UPnPCore {

vector<ValidationError> AllowedValueRange::validate() const
{
    vector<ValidationError> errors;
    if (minimum > maximum) {
        errors.push_back(ValidationError(
                             "AllowedValueRange", "minimum",
                             "Allowed value range minimum " +
                             to_string(minimum) + " is greater than maximum "
                             + to_string(maximum)));
    }
    return errors;
}

vector<ValidationError> TypeDetails::validate() const
{
    vector<ValidationError> errors;
    if (!datatype) {
        errors.push_back(ValidationError("TypeDetails", "datatype",
                                         "Service state variable has no "
                                         "datatype"));
        return errors;
    }
    if (!allowedValues.empty()) {
        if (hasAllowedValueRange) {
            errors.push_back(ValidationError(
                                 "TypeDetails", "allowedValues",
                                 "Allowed value list and range of state "
                                 "variable are mutually exclusive"));
        }
        if (datatype->getBuiltin() != Datatype::STRING) {
            errors.push_back(ValidationError(
                                 "TypeDetails", "allowedValues",
                                 "Allowed value list of state variable only "
                                 "available for string datatype, not: " +
                                 datatype->getDisplayString()));
        }
        if (!defaultValue.empty() &&
            find(allowedValues.begin(), allowedValues.end(), defaultValue) ==
            allowedValues.end()) {
            errors.push_back(ValidationError(
                                 "TypeDetails", "defaultValue",
                                 "Default value '" + defaultValue +
                                 "' is not in allowed values"));
        }
    }
    if (hasAllowedValueRange) {
        if (!datatype->isNumeric()) {
            errors.push_back(ValidationError(
                                 "TypeDetails", "allowedValueRange",
                                 "Allowed value range on non-numeric type " +
                                 datatype->getDisplayString()));
        }
        auto rerrs = allowedValueRange.validate();
        errors.insert(errors.end(), rerrs.begin(), rerrs.end());
    }
    return errors;
}

bool StateVariable::isModeratedNumericType() const
{
    return typeDetails.datatype && typeDetails.datatype->isNumeric() &&
        (eventDetails.maximumRateMillis > 0 || eventDetails.minimumDelta > 0);
}

vector<ValidationError> StateVariable::validate() const
{
    vector<ValidationError> errors;
    if (name.empty()) {
        errors.push_back(ValidationError("StateVariable", "name",
                                         "StateVariable without name"));
    }
    auto terrs = typeDetails.validate();
    for (auto& err : terrs) {
        err.message = "State variable '" + name + "': " + err.message;
        errors.push_back(err);
    }
    return errors;
}

vector<ValidationError> ActionArgument::validate() const
{
    vector<ValidationError> errors;
    if (name.empty()) {
        errors.push_back(ValidationError("ActionArgument", "name",
                                         "Argument without name"));
    }
    if (relatedStateVariableName.empty()) {
        errors.push_back(ValidationError("ActionArgument",
                                         "relatedStateVariableName",
                                         "Argument '" + name + "' without "
                                         "related state variable"));
    }
    if (returnValue && direction != OUT) {
        LOGDEB("ActionArgument: input argument " << name <<
               " flagged as return value\n");
    }
    return errors;
}

const ActionArgument *Action::getInputArgument(const string& nm) const
{
    for (const auto& arg : arguments) {
        if (arg.direction == ActionArgument::IN && arg.name == nm)
            return &arg;
    }
    return nullptr;
}

const ActionArgument *Action::getOutputArgument(const string& nm) const
{
    for (const auto& arg : arguments) {
        if (arg.direction == ActionArgument::OUT && arg.name == nm)
            return &arg;
    }
    return nullptr;
}

vector<const ActionArgument*> Action::getInputArguments() const
{
    vector<const ActionArgument*> out;
    for (const auto& arg : arguments) {
        if (arg.direction == ActionArgument::IN)
            out.push_back(&arg);
    }
    return out;
}

vector<const ActionArgument*> Action::getOutputArguments() const
{
    vector<const ActionArgument*> out;
    for (const auto& arg : arguments) {
        if (arg.direction == ActionArgument::OUT)
            out.push_back(&arg);
    }
    return out;
}

vector<ValidationError> Action::validate() const
{
    vector<ValidationError> errors;
    if (name.empty()) {
        errors.push_back(ValidationError("Action", "name",
                                         "Action without name"));
    }
    for (const auto& arg : arguments) {
        auto aerrs = arg.validate();
        errors.insert(errors.end(), aerrs.begin(), aerrs.end());
    }
    return errors;
}

/////////////////// StateVariableValue

StateVariableValue::StateVariableValue(const StateVariable& sv,
                                       const Value& value)
    : m_name(sv.name), m_datatype(sv.typeDetails.datatype), m_value(value)
{
    if (!m_datatype) {
        throw InvalidValueException("State variable " + m_name +
                                    " has no datatype", value.dump());
    }
    if (!m_datatype->isValid(value)) {
        throw InvalidValueException("Invalid value for state variable " +
                                    m_name + " of type " +
                                    m_datatype->getDisplayString(),
                                    value.dump());
    }
    if (value.isNull()) {
        return;
    }
    const TypeDetails& td = sv.typeDetails;
    if (!td.allowedValues.empty()) {
        string s = m_datatype->toString(value);
        if (find(td.allowedValues.begin(), td.allowedValues.end(), s) ==
            td.allowedValues.end()) {
            throw InvalidValueException("Value '" + s + "' is not in the "
                                        "allowed value list of " + m_name, s);
        }
    }
    if (td.hasAllowedValueRange) {
        double d = value.asDouble();
        if (d < static_cast<double>(td.allowedValueRange.minimum) ||
            d > static_cast<double>(td.allowedValueRange.maximum)) {
            string s = m_datatype->toString(value);
            throw InvalidValueException(
                "Value " + s + " out of allowed range [" +
                to_string(td.allowedValueRange.minimum) + "," +
                to_string(td.allowedValueRange.maximum) + "] of " + m_name, s);
        }
    }
}

StateVariableValue StateVariableValue::fromString(const StateVariable& sv,
                                                  const string& text)
{
    if (!sv.typeDetails.datatype) {
        throw InvalidValueException("State variable " + sv.name +
                                    " has no datatype", text);
    }
    return StateVariableValue(sv, sv.typeDetails.datatype->valueOf(text));
}

string StateVariableValue::toString() const
{
    return m_datatype->toString(m_value);
}

/////////////////// Service

const Action *Service::getAction(const string& nm) const
{
    for (const auto& action : actions) {
        if (action.name == nm)
            return &action;
    }
    return nullptr;
}

const StateVariable *Service::getStateVariable(const string& nm) const
{
    for (const auto& sv : stateVariables) {
        if (sv.name == nm)
            return &sv;
    }
    return nullptr;
}

const StateVariable *Service::getRelatedStateVariable(
    const ActionArgument& arg) const
{
    return getStateVariable(arg.relatedStateVariableName);
}

shared_ptr<const Datatype> Service::getDatatype(const ActionArgument& arg) const
{
    const StateVariable *sv = getRelatedStateVariable(arg);
    if (nullptr == sv) {
        return shared_ptr<const Datatype>();
    }
    return sv->typeDetails.datatype;
}

ServiceReference Service::getReference() const
{
    auto dev = m_device.lock();
    return ServiceReference(dev ? dev->getUdn() : UDN(), m_id);
}

vector<ValidationError> Service::validate() const
{
    vector<ValidationError> errors;
    if (m_type.empty()) {
        errors.push_back(ValidationError("Service", "serviceType",
                                         "Missing serviceType"));
    }
    if (m_id.empty()) {
        errors.push_back(ValidationError("Service", "serviceId",
                                         "Missing serviceId"));
    }
    auto dev = m_device.lock();
    if (dev && dev->isRemote()) {
        if (descriptorURL.empty()) {
            errors.push_back(ValidationError(
                                 "Service", "descriptorURL",
                                 "Descriptor location (SCPDURL) is required"));
        }
        if (controlURL.empty()) {
            errors.push_back(ValidationError("Service", "controlURL",
                                             "Control URL is required"));
        }
        if (eventSubscriptionURL.empty()) {
            errors.push_back(ValidationError(
                                 "Service", "eventSubscriptionURL",
                                 "Event subscription URL is required"));
        }
    }
    for (const auto& sv : stateVariables) {
        auto verrs = sv.validate();
        errors.insert(errors.end(), verrs.begin(), verrs.end());
    }
    for (const auto& action : actions) {
        auto aerrs = action.validate();
        errors.insert(errors.end(), aerrs.begin(), aerrs.end());
        if (!hasStateVariables()) {
            continue;
        }
        for (const auto& arg : action.arguments) {
            if (!arg.relatedStateVariableName.empty() &&
                nullptr == getRelatedStateVariable(arg)) {
                errors.push_back(ValidationError(
                                     "Action", "arguments",
                                     "Argument '" + arg.name + "' of action '"
                                     + action.name + "' refers to unknown "
                                     "state variable '" +
                                     arg.relatedStateVariableName + "'"));
            }
        }
    }
    return errors;
}

bool Service::setCurrentValue(const string& varname, const string& text)
{
    const StateVariable *sv = getStateVariable(varname);
    if (nullptr == sv) {
        LOGDEB("Service::setCurrentValue: no variable " << varname <<
               " in " << m_id.toString() << "\n");
        return false;
    }
    StateVariableValue value = StateVariableValue::fromString(*sv, text);
    std::unique_lock<std::mutex> lock(m_valuesmutex);
    m_values[varname] = value.getValue();
    return true;
}

bool Service::setCurrentValue(const StateVariableValue& value)
{
    if (nullptr == getStateVariable(value.getName())) {
        return false;
    }
    std::unique_lock<std::mutex> lock(m_valuesmutex);
    m_values[value.getName()] = value.getValue();
    return true;
}

Value Service::getCurrentValue(const string& varname) const
{
    std::unique_lock<std::mutex> lock(m_valuesmutex);
    auto it = m_values.find(varname);
    if (it == m_values.end()) {
        return Value();
    }
    return it->second;
}

map<string, string> Service::getCurrentValues() const
{
    map<string, string> out;
    std::unique_lock<std::mutex> lock(m_valuesmutex);
    for (const auto& ent : m_values) {
        const StateVariable *sv = getStateVariable(ent.first);
        if (sv && sv->typeDetails.datatype) {
            out[ent.first] = sv->typeDetails.datatype->toString(ent.second);
        }
    }
    return out;
}

string Service::dump() const
{
    ostringstream os;
    os << "SERVICE {serviceType [" << m_type.toString() <<
        "] serviceId [" << m_id.toString() <<
        "] SCPDURL [" << descriptorURL <<
        "] controlURL [" << controlURL <<
        "] eventSubURL [" << eventSubscriptionURL <<
        "] actions " << actions.size() <<
        " variables " << stateVariables.size() << " }" << endl;
    return os.str();
}

} // namespace UPnPCore
