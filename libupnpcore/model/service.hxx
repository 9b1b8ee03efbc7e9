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
#ifndef _UPNPCORE_SERVICE_HXX_INCLUDED_
#define _UPNPCORE_SERVICE_HXX_INCLUDED_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/types/datatype.hxx"
#include "libupnpcore/types/upnptypes.hxx"
#include "libupnpcore/types/value.hxx"

namespace UPnPCore {

class Device;

/** Numeric range from the allowedValueRange element */
struct UPNPCORE_API AllowedValueRange {
    long long minimum{0};
    long long maximum{0};
    long long step{1};

    bool isInRange(long long v) const {
        return v >= minimum && v <= maximum;
    }
    std::vector<ValidationError> validate() const;
};

/** Eventing attributes of a state variable. maximumRateMillis and
 * minimumDelta are 0 when not moderated. */
struct UPNPCORE_API EventDetails {
    bool sendEvents{true};
    int maximumRateMillis{0};
    int minimumDelta{0};
};

/** Datatype and value constraints for a state variable */
struct UPNPCORE_API TypeDetails {
    std::shared_ptr<const Datatype> datatype;
    std::string defaultValue;
    /** Allowed value list, in document order. Only for strings */
    std::vector<std::string> allowedValues;
    bool hasAllowedValueRange{false};
    AllowedValueRange allowedValueRange;

    std::vector<ValidationError> validate() const;
};

struct UPNPCORE_API StateVariable {
    std::string name;
    TypeDetails typeDetails;
    EventDetails eventDetails;

    /** Numeric type with a maximum rate or minimum delta */
    bool isModeratedNumericType() const;
    std::vector<ValidationError> validate() const;
};

struct UPNPCORE_API ActionArgument {
    enum Direction {IN, OUT};
    std::string name;
    std::string relatedStateVariableName;
    Direction direction{IN};
    // The retval element was set. Only for out arguments.
    bool returnValue{false};

    std::vector<ValidationError> validate() const;
};

struct UPNPCORE_API Action {
    std::string name;
    std::vector<ActionArgument> arguments;

    const ActionArgument *getInputArgument(const std::string& nm) const;
    const ActionArgument *getOutputArgument(const std::string& nm) const;
    std::vector<const ActionArgument*> getInputArguments() const;
    std::vector<const ActionArgument*> getOutputArguments() const;
    std::vector<ValidationError> validate() const;
};

/**
 * A validated value for a state variable. Construction checks the
 * datatype and the allowed value list or range, and throws
 * InvalidValueException if the value does not fit.
 */
class UPNPCORE_API StateVariableValue {
public:
    StateVariableValue(const StateVariable& sv, const Value& value);
    /** Decode the wire string and check it */
    static StateVariableValue fromString(const StateVariable& sv,
                                         const std::string& text);

    const std::string& getName() const {
        return m_name;
    }
    const Value& getValue() const {
        return m_value;
    }
    const std::shared_ptr<const Datatype>& getDatatype() const {
        return m_datatype;
    }
    /** Wire format */
    std::string toString() const;

private:
    std::string m_name;
    std::shared_ptr<const Datatype> m_datatype;
    Value m_value;
};

/**
 * A service: type, id, and, once described from a service description
 * document, actions and state variables. Remote services also carry
 * the absolute SCPD, control and event subscription URLs.
 *
 * The metadata is not modified after the service is added to a device,
 * only the current state variable values are, under an internal lock.
 */
class UPNPCORE_API Service {
public:
    Service(const ServiceType& tp, const ServiceId& id)
        : m_type(tp), m_id(id) {}
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    const ServiceType& getServiceType() const {
        return m_type;
    }
    const ServiceId& getServiceId() const {
        return m_id;
    }

    /// Remote service URLs, absolute after binding
    std::string descriptorURL;
    std::string controlURL;
    std::string eventSubscriptionURL;

    std::vector<Action> actions;
    std::vector<StateVariable> stateVariables;

    bool hasActions() const {
        return !actions.empty();
    }
    bool hasStateVariables() const {
        return !stateVariables.empty();
    }
    const Action *getAction(const std::string& nm) const;
    const StateVariable *getStateVariable(const std::string& nm) const;
    const StateVariable *getRelatedStateVariable(
        const ActionArgument& arg) const;
    /** Datatype of an action argument, through its related variable.
     * Null if the variable is not found */
    std::shared_ptr<const Datatype> getDatatype(
        const ActionArgument& arg) const;

    /** Owning device, null if not added to a device yet */
    std::shared_ptr<Device> getDevice() const {
        return m_device.lock();
    }
    /** Needs an owning device */
    ServiceReference getReference() const;

    std::vector<ValidationError> validate() const;

    /** Decode and check, then store a current value.
     * @throw InvalidValueException for a bad value
     * @return false if there is no such state variable */
    bool setCurrentValue(const std::string& varname, const std::string& text);
    bool setCurrentValue(const StateVariableValue& value);
    /** Returns a null Value if nothing is set or the variable is unknown */
    Value getCurrentValue(const std::string& varname) const;
    /** All set values, as wire strings */
    std::map<std::string, std::string> getCurrentValues() const;

    std::string dump() const;

private:
    friend class Device;
    ServiceType m_type;
    ServiceId m_id;
    std::weak_ptr<Device> m_device;
    mutable std::mutex m_valuesmutex;
    std::map<std::string, Value> m_values;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_SERVICE_HXX_INCLUDED_ */
