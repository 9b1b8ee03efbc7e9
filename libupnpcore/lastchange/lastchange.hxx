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
#ifndef _UPNPCORE_LASTCHANGE_HXX_INCLUDED_
#define _UPNPCORE_LASTCHANGE_HXX_INCLUDED_

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "libupnpcore/upnpcoreexports.hxx"
#include "libupnpcore/lastchange/eventedvalue.hxx"

namespace UPnPCore {

/**
 * Maps the variable names which may appear in a LastChange document
 * to their evented kinds. Names not in the schema are skipped when
 * parsing. An ENUM entry may list its allowed values.
 */
class UPNPCORE_API LastChangeSchema {
public:
    struct Entry {
        EventedKind kind;
        std::vector<std::string> allowedValues;
    };

    explicit LastChangeSchema(const std::string& nsuri) : m_ns(nsuri) {}

    void add(const std::string& varname, EventedKind kind,
             const std::vector<std::string>& allowed =
             std::vector<std::string>());
    const Entry *find(const std::string& varname) const;
    /** Namespace of the Event element */
    const std::string& getNamespace() const {
        return m_ns;
    }

    /** RenderingControl:1 (urn:schemas-upnp-org:metadata-1-0/RCS/) */
    static const LastChangeSchema& renderingControl();
    /** AVTransport:1 (urn:schemas-upnp-org:metadata-1-0/AVT/) */
    static const LastChangeSchema& avTransport();

private:
    std::string m_ns;
    std::map<std::string, Entry> m_entries;
};

/**
 * LastChange document contents: per instance id, the evented values.
 *
 * <Event xmlns="urn:schemas-upnp-org:metadata-1-0/RCS/">
 *   <InstanceID val="0">
 *     <Volume channel="Master" val="24"/>
 *   </InstanceID>
 * </Event>
 *
 * Accessors are serialized by an internal lock.
 */
class UPNPCORE_API LastChange {
public:
    /** The schema is copied */
    explicit LastChange(const LastChangeSchema& schema);
    /** Parse a document. Unknown variables are skipped.
     * @throw InvalidValueException for bad XML or undecodable values */
    LastChange(const LastChangeSchema& schema, const std::string& xml);
    LastChange(const LastChange&) = delete;
    LastChange& operator=(const LastChange&) = delete;

    /** Set a value, replacing the one with the same name and channel */
    void setEventedValue(unsigned int instanceId, const EventedValue& ev);
    /** Non-channel value, or Master channel value */
    bool getEventedValue(unsigned int instanceId, const std::string& name,
                         EventedValue *out) const;
    bool getChannelEventedValue(unsigned int instanceId,
                                const std::string& name, Channel channel,
                                EventedValue *out) const;
    std::vector<EventedValue> getEventedValues(unsigned int instanceId) const;
    std::vector<unsigned int> getInstanceIDs() const;
    bool hasChanges() const;
    void reset();

    /** Render the document. An empty LastChange gives an empty Event */
    std::string toString() const;

private:
    const LastChangeSchema m_schema;
    mutable std::mutex m_mutex;
    std::map<unsigned int, std::vector<EventedValue> > m_instances;
};

} // namespace UPnPCore

#endif /* _UPNPCORE_LASTCHANGE_HXX_INCLUDED_ */
