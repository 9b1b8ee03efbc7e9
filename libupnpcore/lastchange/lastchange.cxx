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
#include "libupnpcore/lastchange/lastchange.hxx"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

#include <algorithm>
#include <exception>
#include <sstream>

#include "libupnpcore/expatparser.hxx"
#include "libupnpcore/log.hxx"
#include "libupnpcore/upnpcoreerrors.hxx"
#include "libupnpcore/xmlhelp.hxx"

using namespace std;

namespace UPnPCore {

void LastChangeSchema::add(const string& varname, EventedKind kind,
                           const vector<string>& allowed)
{
    Entry entry;
    entry.kind = kind;
    entry.allowedValues = allowed;
    m_entries[varname] = entry;
}

const LastChangeSchema::Entry *LastChangeSchema::find(const string& nm) const
{
    auto it = m_entries.find(nm);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return &it->second;
}

static LastChangeSchema makeRenderingControlSchema()
{
    LastChangeSchema schema("urn:schemas-upnp-org:metadata-1-0/RCS/");
    schema.add("PresetNameList", EventedKind::STRING);
    for (const char *nm : {"Brightness", "Contrast", "Sharpness",
                "RedVideoGain", "GreenVideoGain", "BlueVideoGain",
                "RedVideoBlackLevel", "GreenVideoBlackLevel",
                "BlueVideoBlackLevel", "ColorTemperature"}) {
        schema.add(nm, EventedKind::UNSIGNED_INTEGER_TWO_BYTES);
    }
    schema.add("HorizontalKeystone", EventedKind::SHORT);
    schema.add("VerticalKeystone", EventedKind::SHORT);
    schema.add("Mute", EventedKind::CHANNEL_MUTE);
    schema.add("Volume", EventedKind::CHANNEL_VOLUME);
    schema.add("VolumeDB", EventedKind::CHANNEL_VOLUME_DB);
    schema.add("Loudness", EventedKind::CHANNEL_LOUDNESS);
    return schema;
}

static LastChangeSchema makeAVTransportSchema()
{
    LastChangeSchema schema("urn:schemas-upnp-org:metadata-1-0/AVT/");
    schema.add("TransportState", EventedKind::ENUM,
               {"STOPPED", "PLAYING", "TRANSITIONING", "PAUSED_PLAYBACK",
                       "PAUSED_RECORDING", "RECORDING", "NO_MEDIA_PRESENT",
                       "CUSTOM"});
    schema.add("TransportStatus", EventedKind::ENUM,
               {"OK", "ERROR_OCCURRED", "CUSTOM"});
    schema.add("CurrentPlayMode", EventedKind::ENUM,
               {"NORMAL", "SHUFFLE", "REPEAT_ONE", "REPEAT_ALL", "RANDOM",
                       "DIRECT_1", "INTRO"});
    schema.add("RecordMediumWriteStatus", EventedKind::ENUM,
               {"WRITABLE", "PROTECTED", "NOT_WRITABLE", "UNKNOWN",
                       "NOT_IMPLEMENTED"});
    schema.add("PlaybackStorageMedium", EventedKind::ENUM);
    schema.add("RecordStorageMedium", EventedKind::ENUM);
    schema.add("CurrentRecordQualityMode", EventedKind::ENUM);
    schema.add("PossiblePlaybackStorageMedia", EventedKind::ENUM_ARRAY);
    schema.add("PossibleRecordStorageMedia", EventedKind::ENUM_ARRAY);
    schema.add("PossibleRecordQualityModes", EventedKind::ENUM_ARRAY);
    schema.add("CurrentTransportActions", EventedKind::ENUM_ARRAY);
    schema.add("NumberOfTracks", EventedKind::UNSIGNED_INTEGER_FOUR_BYTES);
    schema.add("CurrentTrack", EventedKind::UNSIGNED_INTEGER_FOUR_BYTES);
    for (const char *nm : {"TransportPlaySpeed", "CurrentTrackDuration",
                "CurrentMediaDuration", "CurrentTrackMetaData",
                "AVTransportURIMetaData", "NextAVTransportURIMetaData",
                "RelativeTimePosition", "AbsoluteTimePosition"}) {
        schema.add(nm, EventedKind::STRING);
    }
    schema.add("CurrentTrackURI", EventedKind::URI);
    schema.add("AVTransportURI", EventedKind::URI);
    schema.add("NextAVTransportURI", EventedKind::URI);
    return schema;
}

const LastChangeSchema& LastChangeSchema::renderingControl()
{
    static const LastChangeSchema schema(makeRenderingControlSchema());
    return schema;
}

const LastChangeSchema& LastChangeSchema::avTransport()
{
    static const LastChangeSchema schema(makeAVTransportSchema());
    return schema;
}

// Replace the value with the same name (and channel), or append
static void putValue(vector<EventedValue>& values, const EventedValue& ev)
{
    for (auto& old : values) {
        if (old.getName() == ev.getName() &&
            (!ev.hasChannel() || old.getChannel() == ev.getChannel())) {
            old = ev;
            return;
        }
    }
    values.push_back(ev);
}

static string localName(const string& nm)
{
    string::size_type colon = nm.find(':');
    return colon == string::npos ? nm : nm.substr(colon + 1);
}

class LastChangeParser : public ExpatXMLParser {
public:
    LastChangeParser(const string& input, const LastChangeSchema& schema,
                     map<unsigned int, vector<EventedValue> >& instances)
        : ExpatXMLParser(input), m_schema(schema), m_instances(instances) {}

    exception_ptr m_exc;

protected:
    void StartElement(const XML_Char *name, const XML_Char **) override {
        string nm = localName(name);
        switch (m_path.size()) {
        case 1:
            if (nm != "Event") {
                stopParser("LastChange: root element is " + nm +
                           ", not Event");
            }
            break;
        case 2:
            m_ininstance = false;
            if (nm != "InstanceID") {
                LOGDEB("LastChangeParser: skipping " << nm << "\n");
                break;
            }
            if (!instanceId(m_path.back().attributes, &m_curid)) {
                stopParser("LastChange: bad or missing InstanceID val");
                break;
            }
            m_instances[m_curid];
            m_ininstance = true;
            break;
        case 3:
            if (m_ininstance) {
                addValue(nm, m_path.back().attributes);
            }
            break;
        default:
            break;
        }
    }

private:
    static bool instanceId(const map<string, string>& attrs, unsigned int *id) {
        auto it = attrs.find("val");
        if (it == attrs.end() || it->second.empty()) {
            return false;
        }
        for (auto c : it->second) {
            if (!isdigit(static_cast<unsigned char>(c)))
                return false;
        }
        errno = 0;
        unsigned long long v = strtoull(it->second.c_str(), nullptr, 10);
        if (errno == ERANGE || v > UINT_MAX) {
            return false;
        }
        *id = static_cast<unsigned int>(v);
        return true;
    }

    void addValue(const string& nm, const map<string, string>& attrs) {
        const LastChangeSchema::Entry *entry = m_schema.find(nm);
        if (nullptr == entry) {
            LOGDEB("LastChangeParser: unknown variable " << nm << "\n");
            return;
        }
        try {
            EventedValue ev(nm, entry->kind, attrs);
            if (!entry->allowedValues.empty() && !ev.getValue().isNull()) {
                const string& s = ev.getValue().asString();
                if (std::find(entry->allowedValues.begin(),
                              entry->allowedValues.end(), s) ==
                    entry->allowedValues.end()) {
                    throw InvalidValueException("Value " + s + " not allowed "
                                                "for " + nm, s);
                }
            }
            putValue(m_instances[m_curid], ev);
        } catch (const InvalidValueException&) {
            m_exc = current_exception();
            stopParser("LastChange: bad value for " + nm);
        }
    }

    const LastChangeSchema& m_schema;
    map<unsigned int, vector<EventedValue> >& m_instances;
    unsigned int m_curid{0};
    bool m_ininstance{false};
};

LastChange::LastChange(const LastChangeSchema& schema)
    : m_schema(schema)
{
}

LastChange::LastChange(const LastChangeSchema& schema, const string& xml)
    : m_schema(schema)
{
    LastChangeParser parser(xml, m_schema, m_instances);
    if (!parser.Parse()) {
        if (parser.m_exc) {
            rethrow_exception(parser.m_exc);
        }
        string pos = to_string(parser.getLastErrorLine()) + ":" +
            to_string(parser.getLastErrorColumn());
        throw InvalidValueException("Invalid LastChange document at " + pos +
                                    ": " + parser.getLastErrorMessage(), xml,
                                    parser.getLastErrorMessage());
    }
}

void LastChange::setEventedValue(unsigned int instanceId,
                                 const EventedValue& ev)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    putValue(m_instances[instanceId], ev);
}

bool LastChange::getEventedValue(unsigned int instanceId, const string& name,
                                 EventedValue *out) const
{
    return getChannelEventedValue(instanceId, name, Channel::Master, out);
}

bool LastChange::getChannelEventedValue(unsigned int instanceId,
                                        const string& name, Channel channel,
                                        EventedValue *out) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_instances.find(instanceId);
    if (it == m_instances.end()) {
        return false;
    }
    for (const auto& ev : it->second) {
        if (ev.getName() == name &&
            (!ev.hasChannel() || ev.getChannel() == channel)) {
            *out = ev;
            return true;
        }
    }
    return false;
}

vector<EventedValue> LastChange::getEventedValues(unsigned int instanceId) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_instances.find(instanceId);
    if (it == m_instances.end()) {
        return vector<EventedValue>();
    }
    return it->second;
}

vector<unsigned int> LastChange::getInstanceIDs() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    vector<unsigned int> ids;
    for (const auto& ent : m_instances) {
        ids.push_back(ent.first);
    }
    return ids;
}

bool LastChange::hasChanges() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    for (const auto& ent : m_instances) {
        if (!ent.second.empty())
            return true;
    }
    return false;
}

void LastChange::reset()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_instances.clear();
}

string LastChange::toString() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    ostringstream os;
    os << "<Event xmlns=\"" << XMLHelp::xmlQuote(m_schema.getNamespace()) <<
        "\">";
    for (const auto& ent : m_instances) {
        os << "<InstanceID val=\"" << ent.first << "\">";
        for (const auto& ev : ent.second) {
            os << "<" << ev.getName();
            for (const auto& attr : ev.getAttributes()) {
                os << " " << attr.first << "=\"" <<
                    XMLHelp::xmlQuote(attr.second) << "\"";
            }
            os << "/>";
        }
        os << "</InstanceID>";
    }
    os << "</Event>";
    return os.str();
}

} // namespace UPnPCore
