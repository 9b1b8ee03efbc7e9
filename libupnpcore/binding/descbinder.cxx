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

#include "libupnpcore/binding/descbinder.hxx"

#include <cctype>
#include <cstdlib>
#include <exception>
#include <set>
#include <vector>

#include "libupnpcore/expatparser.hxx"
#include "libupnpcore/log.hxx"
#include "libupnpcore/model/service.hxx"
#include "libupnpcore/upnpcore_p.hxx"
#include "libupnpcore/xmlhelp.hxx"

using namespace std;

namespace UPnPCore {

const string DeviceDescriptorBinder::DEVICE_NAMESPACE(
    "urn:schemas-upnp-org:device-1-0");
const string DeviceDescriptorBinder::DLNA_NAMESPACE(
    "urn:schemas-dlna-org:device-1-0");

namespace {

// What we collect during the parse. The model objects are only built
// once the whole document has been read.
struct MutableIcon {
    string mimeType;
    string width;
    string height;
    string depth;
    string url;
};

struct MutableService {
    string path;
    string serviceType;
    string serviceId;
    string SCPDURL;
    string controlURL;
    string eventSubURL;
};

struct MutableDevice {
    MutableDevice(const string& p, size_t d) : path(p), depth(d) {}
    // Element path, for error messages
    string path;
    // Depth of the <device> element in the parse stack
    size_t depth;
    string UDN;
    string deviceType;
    DeviceDetails details;
    vector<MutableIcon> icons;
    vector<MutableService> services;
    vector<shared_ptr<MutableDevice> > embedded;
};

class DeviceDescParser : public ExpatXMLParser {
public:
    enum State {START, READING_DEVICE, READING_SERVICE,
                READING_EMBEDDED_DEVICE, DONE, ERROR};

    DeviceDescParser(const string& input, bool recovering)
        : ExpatXMLParser(input, '|'), m_recovering(recovering) {}

    State state{START};
    // Where the parse was stopped
    string errpath;
    string URLBase;
    bool hasSpecVersion{false};
    string specMajor;
    string specMinor;
    shared_ptr<MutableDevice> root;

protected:
    void StartElement(const XML_Char *, const XML_Char **) override;
    void EndElement(const XML_Char *) override;

private:
    void error(const string& msg) {
        LOGDEB("DeviceDescParser: " << msg << " at " << pathString() << "\n");
        state = ERROR;
        errpath = pathString();
        stopParser(msg);
    }
    const string& parentName() const {
        static const string empty;
        return m_path.size() < 2 ? empty : m_path[m_path.size() - 2].name;
    }
    void readingState() {
        state = m_devstack.empty() ? DONE :
            (m_devstack.size() > 1 ? READING_EMBEDDED_DEVICE : READING_DEVICE);
    }
    void startDevice();
    void startService();
    void setDeviceField(MutableDevice& dev, const string& nm,
                        const string& value);
    void setServiceField(const string& nm, const string& value);
    void setIconField(const string& nm, const string& value);

    bool m_recovering;
    vector<shared_ptr<MutableDevice> > m_devstack;
    // Element being read, if any. Nothing gets added to the owning
    // vectors while these are set.
    MutableService *m_service{nullptr};
    size_t m_servicedepth{0};
    MutableIcon *m_icon{nullptr};
    size_t m_icondepth{0};
};

void DeviceDescParser::StartElement(const XML_Char *, const XML_Char **)
{
    if (state == ERROR) {
        return;
    }
    const StackEl& el = m_path.back();
    if (m_path.size() == 1) {
        if (el.name != "root") {
            error("Root element is <" + el.name + ">, not <root>");
        } else if (el.uri != DeviceDescriptorBinder::DEVICE_NAMESPACE) {
            error("Root element namespace is [" + el.uri + "], not " +
                  DeviceDescriptorBinder::DEVICE_NAMESPACE);
        }
        return;
    }
    if (el.name == "device") {
        startDevice();
    } else if (el.name == "service") {
        startService();
    } else if (el.name == "icon" && parentName() == "iconList" &&
               !m_devstack.empty() && nullptr == m_icon &&
               nullptr == m_service &&
               m_devstack.back()->depth == m_path.size() - 2) {
        m_devstack.back()->icons.push_back(MutableIcon());
        m_icon = &m_devstack.back()->icons.back();
        m_icondepth = m_path.size();
    }
}

void DeviceDescParser::startDevice()
{
    size_t depth = m_path.size();
    if (depth == 2) {
        if (root) {
            error("Multiple root <device> elements");
            return;
        }
        root = make_shared<MutableDevice>("/root/device", depth);
        m_devstack.push_back(root);
        state = READING_DEVICE;
        return;
    }
    if (m_devstack.empty() || m_service || m_icon) {
        error("Unexpected <device> element");
        return;
    }
    MutableDevice& current = *m_devstack.back();
    string idx = "[" + to_string(current.embedded.size() + 1) + "]";
    string path;
    if (parentName() == "deviceList" && current.depth == depth - 2) {
        path = current.path + "/deviceList/device" + idx;
    } else if (parentName() == "device" && current.depth == depth - 1) {
        if (!m_recovering) {
            error("<device> element outside of <deviceList>");
            return;
        }
        LOGINF("DeviceDescParser: accepting <device> without <deviceList> at "
               << pathString() << "\n");
        path = current.path + "/device" + idx;
    } else {
        error("Unexpected <device> element");
        return;
    }
    auto dev = make_shared<MutableDevice>(path, depth);
    current.embedded.push_back(dev);
    m_devstack.push_back(dev);
    state = READING_EMBEDDED_DEVICE;
}

void DeviceDescParser::startService()
{
    size_t depth = m_path.size();
    // Something else, e.g. in a vendor extension element: not ours
    if (m_devstack.empty() || m_service || m_icon) {
        return;
    }
    MutableDevice& current = *m_devstack.back();
    if (parentName() == "serviceList" && current.depth == depth - 2) {
        // Normal
    } else if (parentName() == "device" && current.depth == depth - 1) {
        if (!m_recovering) {
            error("<service> element outside of <serviceList>");
            return;
        }
        LOGINF("DeviceDescParser: accepting <service> without "
               "<serviceList> at " << pathString() << "\n");
    } else {
        return;
    }
    current.services.push_back(MutableService());
    m_service = &current.services.back();
    m_service->path = current.path + "/serviceList/service[" +
        to_string(current.services.size()) + "]";
    m_servicedepth = depth;
    state = READING_SERVICE;
}

void DeviceDescParser::setDeviceField(MutableDevice& dev, const string& nm,
                                      const string& value)
{
    DeviceDetails& det = dev.details;
    switch (nm[0]) {
    case 'd':
        if (nm == "deviceType")
            dev.deviceType = value;
        break;
    case 'f':
        if (nm == "friendlyName")
            det.friendlyName = value;
        break;
    case 'm':
        if (nm == "manufacturer")
            det.manufacturer = value;
        else if (nm == "manufacturerURL")
            det.manufacturerURL = value;
        else if (nm == "modelDescription")
            det.modelDescription = value;
        else if (nm == "modelName")
            det.modelName = value;
        else if (nm == "modelNumber")
            det.modelNumber = value;
        else if (nm == "modelURL")
            det.modelURL = value;
        break;
    case 'p':
        if (nm == "presentationURL")
            det.presentationURL = value;
        break;
    case 's':
        if (nm == "serialNumber")
            det.serialNumber = value;
        break;
    case 'U':
        if (nm == "UDN")
            dev.UDN = value;
        else if (nm == "UPC")
            det.upc = value;
        break;
    case 'X':
        // Whatever the prefix and namespace
        if (nm == "X_DLNADOC") {
            if (!value.empty())
                det.dlnaDocs.push_back(value);
        } else if (nm == "X_DLNACAP") {
            det.dlnaCaps = value;
        }
        break;
    default:
        break;
    }
}

void DeviceDescParser::setServiceField(const string& nm, const string& value)
{
    if (nm == "serviceType") {
        m_service->serviceType = value;
    } else if (nm == "serviceId") {
        m_service->serviceId = value;
    } else if (nm == "SCPDURL") {
        m_service->SCPDURL = value;
    } else if (nm == "controlURL") {
        m_service->controlURL = value;
    } else if (nm == "eventSubURL") {
        m_service->eventSubURL = value;
    }
}

void DeviceDescParser::setIconField(const string& nm, const string& value)
{
    if (nm == "mimetype") {
        m_icon->mimeType = value;
    } else if (nm == "width") {
        m_icon->width = value;
    } else if (nm == "height") {
        m_icon->height = value;
    } else if (nm == "depth") {
        m_icon->depth = value;
    } else if (nm == "url") {
        m_icon->url = value;
    }
}

void DeviceDescParser::EndElement(const XML_Char *)
{
    if (state == ERROR) {
        return;
    }
    const StackEl& el = m_path.back();
    size_t depth = m_path.size();
    string data(el.data);
    trimstring(data);

    if (m_icon) {
        if (depth == m_icondepth) {
            m_icon = nullptr;
        } else if (depth == m_icondepth + 1) {
            setIconField(el.name, data);
        }
        return;
    }
    if (m_service) {
        if (depth == m_servicedepth) {
            m_service = nullptr;
            readingState();
        } else if (depth == m_servicedepth + 1) {
            setServiceField(el.name, data);
        }
        return;
    }
    if (m_devstack.empty()) {
        if (depth == 2 && el.name == "URLBase") {
            URLBase = data;
        } else if (depth == 3 && parentName() == "specVersion") {
            hasSpecVersion = true;
            if (el.name == "major") {
                specMajor = data;
            } else if (el.name == "minor") {
                specMinor = data;
            }
        }
        return;
    }
    MutableDevice& current = *m_devstack.back();
    if (depth == current.depth) {
        m_devstack.pop_back();
        readingState();
    } else if (depth == current.depth + 1) {
        setDeviceField(current, el.name, data);
    }
}

bool isHttpURL(const string& url)
{
    if (!urlisabsolute(url) || urlhost(url).empty())
        return false;
    string lurl = stringtolower(url);
    return beginswith(lurl, "http://") || beginswith(lurl, "https://");
}

bool parseVersionNumber(const string& s, int *out)
{
    if (s.empty())
        return false;
    char *endptr;
    long v = strtol(s.c_str(), &endptr, 10);
    if (*endptr != 0 || v < 0 || v > 1000)
        return false;
    *out = static_cast<int>(v);
    return true;
}

string resolveIfSet(const string& base, const string& url)
{
    return url.empty() ? url : resolveurl(base, url);
}

shared_ptr<Device> buildDevice(const MutableDevice& md,
                               const DeviceIdentity& identity,
                               const UDAVersion& version,
                               const string& base, bool recovering)
{
    if (md.UDN.empty()) {
        throw DescriptorBindingException("Missing UDN", md.path + "/UDN");
    }
    UDN udn = UDN::valueOf(md.UDN);
    if (udn.empty()) {
        throw DescriptorBindingException("Empty UDN: " + md.UDN,
                                         md.path + "/UDN");
    }
    if (md.deviceType.empty()) {
        throw DescriptorBindingException("Missing deviceType",
                                         md.path + "/deviceType");
    }
    DeviceType type;
    if (!DeviceType::parse(md.deviceType, &type)) {
        throw DescriptorBindingException("Invalid deviceType: " +
                                         md.deviceType,
                                         md.path + "/deviceType");
    }

    DeviceDetails details(md.details);
    details.baseURL = base;
    details.presentationURL = resolveIfSet(base, details.presentationURL);

    auto device = make_shared<Device>(
        DeviceIdentity(udn, identity.maxAgeSeconds, identity.descriptorURL),
        type, details, true, version);

    for (const auto& mi : md.icons) {
        Icon icon;
        icon.mimeType = mi.mimeType;
        icon.width = atoi(mi.width.c_str());
        icon.height = atoi(mi.height.c_str());
        icon.depth = atoi(mi.depth.c_str());
        icon.url = resolveIfSet(base, mi.url);
        auto errors = icon.validate();
        if (!errors.empty()) {
            LOGINF("DeviceDescriptorBinder: " << udn.toString() <<
                   ": dropping invalid icon: " << errors[0].toString() <<
                   "\n");
            continue;
        }
        device->addIcon(icon);
    }

    for (const auto& ms : md.services) {
        ServiceType stype;
        if (ms.serviceType.empty() ||
            !ServiceType::parse(ms.serviceType, &stype)) {
            throw DescriptorBindingException(
                "Missing or invalid serviceType [" + ms.serviceType + "]",
                ms.path + "/serviceType");
        }
        ServiceId sid;
        if (ms.serviceId.empty()) {
            if (!recovering) {
                throw DescriptorBindingException("Missing serviceId",
                                                 ms.path + "/serviceId");
            }
            if (stype.getNamespace() == ServiceType::UDA_NAMESPACE) {
                sid = UDAServiceId(stype.getType());
            } else {
                sid = ServiceId(stype.getNamespace(), stype.getType());
            }
            LOGINF("DeviceDescriptorBinder: missing serviceId for " <<
                   stype.toString() << ", using " << sid.toString() << "\n");
        } else if (!ServiceId::parse(ms.serviceId, &sid)) {
            throw DescriptorBindingException(
                "Invalid serviceId: " + ms.serviceId,
                ms.path + "/serviceId");
        }
        auto service = make_shared<Service>(stype, sid);
        service->descriptorURL = resolveIfSet(base, ms.SCPDURL);
        service->controlURL = resolveIfSet(base, ms.controlURL);
        service->eventSubscriptionURL = resolveIfSet(base, ms.eventSubURL);
        device->addService(service);
    }

    for (const auto& emb : md.embedded) {
        device->addEmbeddedDevice(
            buildDevice(*emb, identity, version, base, recovering));
    }
    return device;
}

} // anonymous namespace

shared_ptr<Device> DeviceDescriptorBinder::describe(
    const DeviceIdentity& identity, const string& xml) const
{
    return bind(identity, xml, false);
}

shared_ptr<Device> DeviceDescriptorBinder::bind(
    const DeviceIdentity& identity, const string& xml, bool recovering) const
{
    DeviceDescParser parser(xml, recovering);
    if (!parser.Parse()) {
        if (parser.wasStopped()) {
            throw DescriptorBindingException(parser.getLastErrorMessage(),
                                             parser.errpath);
        }
        throw DescriptorBindingException(
            "Could not parse device descriptor: " +
            parser.getLastErrorMessage(),
            to_string(parser.getLastErrorLine()) + ":" +
            to_string(parser.getLastErrorColumn()));
    }
    if (!parser.root || parser.state != DeviceDescParser::DONE) {
        throw DescriptorBindingException("No <device> element", "/root");
    }

    UDAVersion version;
    if (parser.hasSpecVersion) {
        if (!parseVersionNumber(parser.specMajor, &version.majorVersion)) {
            throw DescriptorBindingException(
                "Bad specVersion major [" + parser.specMajor + "]",
                "/root/specVersion/major");
        }
        if (!parser.specMinor.empty() &&
            !parseVersionNumber(parser.specMinor, &version.minorVersion)) {
            throw DescriptorBindingException(
                "Bad specVersion minor [" + parser.specMinor + "]",
                "/root/specVersion/minor");
        }
    }

    string base = identity.descriptorURL;
    if (!parser.URLBase.empty()) {
        if (isHttpURL(parser.URLBase)) {
            base = parser.URLBase;
        } else if (recovering) {
            LOGINF("DeviceDescriptorBinder: ignoring bad URLBase [" <<
                   parser.URLBase << "], using [" << base << "]\n");
        } else {
            throw DescriptorBindingException("Invalid URLBase: " +
                                             parser.URLBase, "/root/URLBase");
        }
    }

    auto device = buildDevice(*parser.root, identity, version, base,
                              recovering);
    auto errors = device->validate();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            LOGDEB("DeviceDescriptorBinder: " << err.toString() << "\n");
        }
        throw DescriptorBindingException("Validation of device graph failed",
                                         "/root/device", errors);
    }
    LOGDEB1("DeviceDescriptorBinder: built " << device->dump() << "\n");
    return device;
}

//////////// Generation

static bool treeUsesDLNA(const Device& dev)
{
    if (!dev.getDetails().dlnaDocs.empty() ||
        !dev.getDetails().dlnaCaps.empty())
        return true;
    for (const auto& emb : dev.getEmbeddedDevices()) {
        if (treeUsesDLNA(*emb))
            return true;
    }
    return false;
}

static string deviceXML(const Device& dev, const Namespace& ns,
                        const string& indent)
{
    using XMLHelp::textElement;
    const DeviceDetails& det = dev.getDetails();
    const string in1 = indent + "  ";
    const string in2 = in1 + "  ";
    const string in3 = in2 + "  ";

    string out = indent + "<device>\n";
    out += in1 + textElement("deviceType", dev.getType().toString()) + "\n";
    out += in1 + textElement("friendlyName", det.friendlyName) + "\n";
    out += in1 + textElement("manufacturer", det.manufacturer) + "\n";
    if (!det.manufacturerURL.empty())
        out += in1 + textElement("manufacturerURL", det.manufacturerURL) +"\n";
    if (!det.modelDescription.empty())
        out += in1 + textElement("modelDescription", det.modelDescription) +
            "\n";
    out += in1 + textElement("modelName", det.modelName) + "\n";
    if (!det.modelNumber.empty())
        out += in1 + textElement("modelNumber", det.modelNumber) + "\n";
    if (!det.modelURL.empty())
        out += in1 + textElement("modelURL", det.modelURL) + "\n";
    if (!det.serialNumber.empty())
        out += in1 + textElement("serialNumber", det.serialNumber) + "\n";
    out += in1 + textElement("UDN", dev.getUdn().toString()) + "\n";
    if (!det.upc.empty())
        out += in1 + textElement("UPC", det.upc) + "\n";
    for (const auto& doc : det.dlnaDocs) {
        out += in1 + textElement("dlna:X_DLNADOC", doc) + "\n";
    }
    if (!det.dlnaCaps.empty())
        out += in1 + textElement("dlna:X_DLNACAP", det.dlnaCaps) + "\n";

    const auto& icons = dev.getIcons();
    if (!icons.empty()) {
        out += in1 + "<iconList>\n";
        for (size_t i = 0; i < icons.size(); i++) {
            const Icon& icon = icons[i];
            out += in2 + "<icon>\n";
            out += in3 + textElement("mimetype", icon.mimeType) + "\n";
            out += in3 + textElement("width", to_string(icon.width)) + "\n";
            out += in3 + textElement("height", to_string(icon.height)) + "\n";
            out += in3 + textElement("depth", to_string(icon.depth)) + "\n";
            out += in3 + textElement("url", dev.isLocal() ?
                                     ns.getIconPath(dev, i) : icon.url) + "\n";
            out += in2 + "</icon>\n";
        }
        out += in1 + "</iconList>\n";
    }

    if (dev.hasServices()) {
        out += in1 + "<serviceList>\n";
        for (const auto& service : dev.getServices()) {
            const Service& svc = *service;
            out += in2 + "<service>\n";
            out += in3 + textElement("serviceType",
                                     svc.getServiceType().toString()) + "\n";
            out += in3 + textElement("serviceId",
                                     svc.getServiceId().toString()) + "\n";
            if (dev.isLocal()) {
                out += in3 + textElement("SCPDURL",
                                         ns.getDescriptorPath(svc)) + "\n";
                out += in3 + textElement("controlURL",
                                         ns.getControlPath(svc)) + "\n";
                out += in3 + textElement("eventSubURL",
                                         ns.getEventSubscriptionPath(svc)) +
                    "\n";
            } else {
                out += in3 + textElement("SCPDURL", svc.descriptorURL) + "\n";
                out += in3 + textElement("controlURL", svc.controlURL) + "\n";
                out += in3 + textElement("eventSubURL",
                                         svc.eventSubscriptionURL) + "\n";
            }
            out += in2 + "</service>\n";
        }
        out += in1 + "</serviceList>\n";
    }

    if (dev.hasEmbeddedDevices()) {
        out += in1 + "<deviceList>\n";
        for (const auto& emb : dev.getEmbeddedDevices()) {
            out += deviceXML(*emb, ns, in2);
        }
        out += in1 + "</deviceList>\n";
    }
    if (!det.presentationURL.empty())
        out += in1 + textElement("presentationURL", det.presentationURL) +"\n";
    out += indent + "</device>\n";
    return out;
}

string DeviceDescriptorBinder::generate(const Device& device,
                                        const Namespace& ns) const
{
    auto root = device.getRoot();
    const Device& rdev = *root;

    string descxml("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                   "<root xmlns=\"" + DEVICE_NAMESPACE + "\"");
    if (treeUsesDLNA(rdev)) {
        descxml += " xmlns:dlna=\"" + DLNA_NAMESPACE + "\"";
    }
    descxml += ">\n";
    descxml += "  <specVersion>\n";
    descxml += "    <major>" + to_string(rdev.getVersion().majorVersion) +
        "</major>\n";
    descxml += "    <minor>" + to_string(rdev.getVersion().minorVersion) +
        "</minor>\n";
    descxml += "  </specVersion>\n";
    descxml += deviceXML(rdev, ns, "  ");
    descxml += "</root>\n";
    return descxml;
}

//////////// Recovery

// Position just after "<root" in the root start tag, or npos
static string::size_type findRootTag(const string& in)
{
    string::size_type pos = 0;
    while ((pos = in.find("<root", pos)) != string::npos) {
        pos += 5;
        if (pos < in.size() &&
            (isspace(static_cast<unsigned char>(in[pos])) ||
             in[pos] == '>' || in[pos] == '/'))
            return pos;
    }
    return string::npos;
}

bool RecoveringDeviceDescriptorBinder::fixLeadingGarbage(const string& in,
                                                         string& out)
{
    string::size_type pos = in.find("<?xml");
    if (pos == string::npos) {
        pos = findRootTag(in);
        if (pos != string::npos)
            pos -= 5;
    }
    if (pos == string::npos || pos == 0)
        return false;
    out = in.substr(pos);
    return true;
}

bool RecoveringDeviceDescriptorBinder::fixTrailingGarbage(const string& in,
                                                          string& out)
{
    static const string endtag("</root>");
    string::size_type pos = in.rfind(endtag);
    if (pos == string::npos)
        return false;
    pos += endtag.size();
    if (in.find_first_not_of(" \t\r\n", pos) == string::npos)
        return false;
    out = in.substr(0, pos);
    return true;
}

bool RecoveringDeviceDescriptorBinder::fixEntities(const string& in,
                                                   string& out)
{
    string fixed = XMLHelp::fixXMLEntities(in);
    if (fixed == in)
        return false;
    out.swap(fixed);
    return true;
}

bool RecoveringDeviceDescriptorBinder::fixMissingNamespace(const string& in,
                                                           string& out)
{
    string::size_type pos = findRootTag(in);
    if (pos == string::npos)
        return false;
    string::size_type close = in.find('>', pos);
    if (close == string::npos)
        return false;
    string tag = in.substr(pos, close - pos);
    string::size_type xpos = tag.find("xmlns");
    while (xpos != string::npos) {
        string::size_type i = xpos + 5;
        while (i < tag.size() && isspace(static_cast<unsigned char>(tag[i])))
            i++;
        if (i < tag.size() && tag[i] == '=')
            return false;
        xpos = tag.find("xmlns", xpos + 5);
    }
    out = in.substr(0, pos) + " xmlns=\"" + DEVICE_NAMESPACE + "\"" +
        in.substr(pos);
    return true;
}

static const char *knownPrefixURI(const string& prefix)
{
    static const struct {
        const char *prefix;
        const char *uri;
    } known[] = {
        {"dlna", "urn:schemas-dlna-org:device-1-0"},
        {"sec", "http://www.sec.co.kr/dlna"},
        {"pnpx", "http://schemas.microsoft.com/windows/pnpx/2005/11"},
        {"df", "http://schemas.microsoft.com/windows/2008/09/devicefoundation"},
    };
    for (const auto& ent : known) {
        if (prefix == ent.prefix)
            return ent.uri;
    }
    return nullptr;
}

static bool isNameChar(char c)
{
    return isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
        c == '.' || c == ':' || (c & 0x80);
}

// Collect the prefixes used in element and attribute names, and the
// ones declared by xmlns:p attributes.
static void scanPrefixes(const string& in, set<string>& used,
                         set<string>& declared)
{
    string::size_type pos = 0;
    while ((pos = in.find('<', pos)) != string::npos) {
        pos++;
        if (in.compare(pos, 3, "!--") == 0) {
            pos = in.find("-->", pos);
            continue;
        }
        if (in.compare(pos, 8, "![CDATA[") == 0) {
            pos = in.find("]]>", pos);
            continue;
        }
        if (pos < in.size() && (in[pos] == '?' || in[pos] == '!'))
            continue;
        if (pos < in.size() && in[pos] == '/')
            pos++;
        string::size_type end = in.find('>', pos);
        if (end == string::npos)
            break;
        string::size_type i = pos;
        // Element name, then attributes
        bool first = true;
        while (i < end) {
            string::size_type start = i;
            while (i < end && isNameChar(in[i]))
                i++;
            string name = in.substr(start, i - start);
            string::size_type colon = name.find(':');
            if (colon != string::npos && colon > 0) {
                string prefix = name.substr(0, colon);
                if (prefix == "xmlns") {
                    declared.insert(name.substr(colon + 1));
                } else if (prefix != "xml") {
                    used.insert(prefix);
                }
            }
            if (first) {
                first = false;
            } else if (i == start) {
                // Not a name: skip one char
                i++;
                continue;
            }
            while (i < end && (isspace(static_cast<unsigned char>(in[i])) ||
                               in[i] == '=' || in[i] == '/'))
                i++;
            if (i < end && (in[i] == '"' || in[i] == '\'')) {
                string::size_type q = in.find(in[i], i + 1);
                if (q == string::npos)
                    return;
                if (q > end) {
                    // '>' inside a quoted value
                    end = in.find('>', q);
                    if (end == string::npos)
                        return;
                }
                i = q + 1;
            }
        }
        pos = end + 1;
    }
}

bool RecoveringDeviceDescriptorBinder::fixUndeclaredPrefixes(const string& in,
                                                             string& out)
{
    set<string> used, declared;
    scanPrefixes(in, used, declared);
    vector<string> missing;
    for (const auto& prefix : used) {
        if (declared.find(prefix) == declared.end())
            missing.push_back(prefix);
    }
    if (missing.empty())
        return false;
    if (missing.size() > static_cast<size_t>(MAX_FIXED_PREFIXES)) {
        LOGINF("RecoveringDeviceDescriptorBinder: too many undeclared "
               "prefixes (" << missing.size() << ")\n");
        return false;
    }
    string::size_type pos = findRootTag(in);
    if (pos == string::npos)
        return false;
    string decls;
    for (const auto& prefix : missing) {
        const char *uri = knownPrefixURI(prefix);
        decls += " xmlns:" + prefix + "=\"" +
            (uri ? string(uri) : "urn:libupnpcore:prefix:" + prefix) + "\"";
        LOGDEB("RecoveringDeviceDescriptorBinder: declaring prefix " <<
               prefix << "\n");
    }
    out = in.substr(0, pos) + decls + in.substr(pos);
    return true;
}

shared_ptr<Device> RecoveringDeviceDescriptorBinder::describe(
    const DeviceIdentity& identity, const string& xml) const
{
    string doc(xml);
    trimstring(doc);
    exception_ptr original;
    try {
        return bind(identity, doc, true);
    } catch (const DescriptorBindingException& ex) {
        LOGINF("RecoveringDeviceDescriptorBinder: " << ex.what() <<
               ". Trying to fix the document\n");
        original = current_exception();
    }

    typedef bool (*Fixer)(const string&, string&);
    static const struct {
        const char *name;
        Fixer fix;
    } fixers[] = {
        {"leading garbage", fixLeadingGarbage},
        {"trailing garbage", fixTrailingGarbage},
        {"unescaped entities", fixEntities},
        {"missing namespace", fixMissingNamespace},
        {"undeclared prefixes", fixUndeclaredPrefixes},
    };
    for (const auto& fixer : fixers) {
        string fixed;
        if (!fixer.fix(doc, fixed))
            continue;
        LOGINF("RecoveringDeviceDescriptorBinder: fixed " << fixer.name <<
               "\n");
        doc.swap(fixed);
        try {
            return bind(identity, doc, true);
        } catch (const DescriptorBindingException& ex) {
            LOGDEB("RecoveringDeviceDescriptorBinder: still failing after " <<
                   fixer.name << " fix: " << ex.what() << "\n");
        }
    }
    LOGINF("RecoveringDeviceDescriptorBinder: could not fix the document\n");
    rethrow_exception(original);
}

} // namespace UPnPCore
