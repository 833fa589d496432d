// OnvifProbe.cpp: WS-Discovery multicast probe and device information query
#include "cw/OnvifProbe.hpp"
#include "cw/Log.hpp"
#include "cw/WsSecurity.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <random>
#include <set>
#include <sstream>
#include <sys/socket.h>
#include <tinyxml2.h>
#include <unistd.h>

namespace cw {

namespace {

using Clock = std::chrono::steady_clock;

// Vendor names that show up as scope path segments
const char* const kScopeVendors[] = {
    "hikvision", "dahua", "axis", "bosch", "panasonic", "samsung",
    "sony", "vivotek", "hanwha", "uniview", "reolink",
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string localName(const char* name) {
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

// First element with this local name at or below el, any namespace prefix
const tinyxml2::XMLElement* findElement(const tinyxml2::XMLElement* el, const char* name) {
    if (!el)
        return nullptr;
    if (localName(el->Name()) == name)
        return el;
    for (auto* c = el->FirstChildElement(); c; c = c->NextSiblingElement()) {
        if (auto* found = findElement(c, name))
            return found;
    }
    return nullptr;
}

std::optional<std::string> elementText(const tinyxml2::XMLElement* scope, const char* name) {
    auto* el = findElement(scope, name);
    if (!el)
        return std::nullopt;
    const char* text = el->GetText();
    return std::string(text ? text : "");
}

// Port of an http://host:port/path service address, 0 when absent
int addressPort(const std::string& address) {
    auto start = address.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    auto end = address.find('/', start);
    std::string authority = address.substr(start, end == std::string::npos ? std::string::npos : end - start);
    auto colon = authority.rfind(':');
    if (colon == std::string::npos || colon + 1 >= authority.size() || authority.size() - colon > 6)
        return 0;
    int port = 0;
    for (std::size_t i = colon + 1; i < authority.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(authority[i])))
            return 0;
        port = port * 10 + (authority[i] - '0');
    }
    return port;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> out;
    std::string token;
    while (in >> token)
        out.push_back(token);
    return out;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string afterMarker(const std::string& scope, const std::string& marker) {
    auto pos = lower(scope).rfind(marker);
    return scope.substr(pos + marker.size());
}

} // namespace

std::string urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

UdpMulticastTransport::UdpMulticastTransport(std::string group, std::uint16_t port)
    : group_(std::move(group)), port_(port) {}

UdpMulticastTransport::~UdpMulticastTransport() {
    if (fd_ >= 0)
        ::close(fd_);
}

bool UdpMulticastTransport::ensureSocket() {
    if (fd_ >= 0)
        return true;
    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd_ < 0) {
        log(LogLevel::Error, "Failed to create discovery socket: %s", std::strerror(errno));
        return false;
    }
    int reuse = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    unsigned char ttl = 4;
    ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    unsigned char loop = 0;
    ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
        log(LogLevel::Error, "Failed to bind discovery socket: %s", std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UdpMulticastTransport::send(const std::string& payload) {
    if (!ensureSocket())
        return false;
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port_);
    if (inet_pton(AF_INET, group_.c_str(), &dest.sin_addr) != 1) {
        log(LogLevel::Error, "Invalid multicast group: %s", group_.c_str());
        return false;
    }
    ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        log(LogLevel::Error, "Failed to send discovery probe: %s", std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<Datagram> UdpMulticastTransport::receive(std::chrono::milliseconds wait) {
    if (fd_ < 0)
        return std::nullopt;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(std::max<std::int64_t>(0, wait.count())));
    if (rc <= 0)
        return std::nullopt;

    char buffer[65536];
    sockaddr_in from{};
    socklen_t fromLen = sizeof(from);
    ssize_t n = ::recvfrom(fd_, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
    if (n <= 0)
        return std::nullopt;
    char ip[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip)))
        return std::nullopt;
    return Datagram{std::string(buffer, static_cast<std::size_t>(n)), ip};
}

DiscoveryTransportFactory udpDiscoveryTransportFactory(const DiscoveryOptions& options) {
    std::string group = options.multicastGroup;
    std::uint16_t port = options.port;
    return [group, port]() -> std::unique_ptr<DiscoveryTransport> {
        return std::make_unique<UdpMulticastTransport>(group, port);
    };
}

OnvifProbe::OnvifProbe(DiscoveryTransportFactory transports, std::shared_ptr<HttpClient> http,
                       const ProfileCatalog& catalog, DiscoveryOptions options)
    : transports_(std::move(transports)), http_(std::move(http)), catalog_(catalog),
      options_(std::move(options)) {}

std::string OnvifProbe::newMessageId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return buf;
}

std::string OnvifProbe::buildProbeMessage(const std::string& messageId) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<e:Envelope xmlns:e=\"http://www.w3.org/2003/05/soap-envelope\"\n"
           "    xmlns:w=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\"\n"
           "    xmlns:d=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\"\n"
           "    xmlns:dn=\"http://www.onvif.org/ver10/network/wsdl\">\n"
           "  <e:Header>\n"
           "    <w:MessageID>uuid:" + messageId + "</w:MessageID>\n"
           "    <w:To e:mustUnderstand=\"true\">urn:schemas-xmlsoap-org:ws:2005:04:discovery</w:To>\n"
           "    <w:Action e:mustUnderstand=\"true\">http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</w:Action>\n"
           "  </e:Header>\n"
           "  <e:Body>\n"
           "    <d:Probe>\n"
           "      <d:Types>dn:NetworkVideoTransmitter</d:Types>\n"
           "    </d:Probe>\n"
           "  </e:Body>\n"
           "</e:Envelope>";
}

std::string OnvifProbe::buildDeviceInfoRequest(const std::string& securityHeader) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<s:Envelope xmlns:s=\"http://www.w3.org/2003/05/soap-envelope\">" + securityHeader +
           "<s:Body xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" "
           "xmlns:xsd=\"http://www.w3.org/2001/XMLSchema\">"
           "<GetDeviceInformation xmlns=\"http://www.onvif.org/ver10/device/wsdl\"/>"
           "</s:Body></s:Envelope>";
}

std::optional<DeviceRecord> OnvifProbe::parseProbeMatch(const std::string& xml,
                                                        const std::string& sourceIp) const {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS)
        return std::nullopt;
    const tinyxml2::XMLElement* match = findElement(doc.RootElement(), "ProbeMatch");
    if (!match)
        return std::nullopt;

    DeviceRecord record;
    record.ip = sourceIp;
    record.viaDiscovery = true;
    record.servicePort = 80;
    record.openPorts.insert(80);

    if (auto xaddrs = elementText(match, "XAddrs")) {
        auto addrs = splitWhitespace(*xaddrs);
        if (!addrs.empty()) {
            record.serviceAddress = addrs.front();
            if (int port = addressPort(addrs.front())) {
                if (port <= 65535) {
                    record.openPorts.erase(80);
                    record.servicePort = static_cast<std::uint16_t>(port);
                    record.openPorts.insert(record.servicePort);
                }
            }
        }
    }

    if (auto scopes = elementText(match, "Scopes"))
        record.scopes = splitWhitespace(*scopes);

    for (const auto& scope : record.scopes) {
        const std::string lowerScope = lower(scope);
        if (lowerScope.find("/name/") != std::string::npos) {
            record.name = urlDecode(afterMarker(scope, "/name/"));
        } else if (lowerScope.find("/hardware/") != std::string::npos) {
            record.hardwareId = urlDecode(afterMarker(scope, "/hardware/"));
        } else if (lowerScope.find("/location/") != std::string::npos ||
                   lowerScope.find("onvif.org/type/") != std::string::npos) {
            continue;
        } else {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream segments(scope);
            while (std::getline(segments, part, '/'))
                parts.push_back(part);
            for (std::size_t i = 0; i < parts.size(); ++i) {
                const std::string p = lower(parts[i]);
                bool vendorSegment = false;
                for (const char* v : kScopeVendors) {
                    if (p == v) {
                        record.vendor = p;
                        vendorSegment = true;
                        break;
                    }
                }
                if (!vendorSegment && p.find("model") != std::string::npos && i + 1 < parts.size())
                    record.model = urlDecode(parts[i + 1]);
            }
        }
    }

    if (!record.vendor) {
        std::string text;
        if (record.name)
            text += *record.name + " ";
        if (record.hardwareId)
            text += *record.hardwareId;
        record.vendor = catalog_.matchVendorName(text);
    }
    if (!record.name)
        record.name = "Camera-" + sourceIp;
    record.type = DeviceType::Camera;
    return record;
}

std::vector<DeviceRecord> OnvifProbe::discover() {
    return discover(options_.timeout);
}

std::vector<DeviceRecord> OnvifProbe::discover(std::chrono::milliseconds timeout) {
    std::vector<DeviceRecord> devices;
    auto transport = transports_ ? transports_() : nullptr;
    if (!transport) {
        log(LogLevel::Error, "No discovery transport available");
        return devices;
    }

    const std::string messageId = newMessageId();
    if (!transport->send(buildProbeMessage(messageId))) {
        log(LogLevel::Warn, "WS-Discovery probe could not be sent");
        return devices;
    }
    log(LogLevel::Info, "WS-Discovery probe sent (uuid:%s), waiting %lld ms for replies",
        messageId.c_str(), static_cast<long long>(timeout.count()));

    std::set<std::string> seen;
    const auto deadline = Clock::now() + timeout;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            break;
        auto datagram = transport->receive(remaining);
        if (!datagram)
            continue;
        if (!seen.insert(datagram->sourceIp).second)
            continue;
        auto record = parseProbeMatch(datagram->payload, datagram->sourceIp);
        if (!record) {
            log(LogLevel::Debug, "Dropping unparseable discovery reply from %s",
                datagram->sourceIp.c_str());
            seen.erase(datagram->sourceIp);
            continue;
        }
        log(LogLevel::Info, "ONVIF device found: %s (%s)", record->ip.c_str(),
            record->name ? record->name->c_str() : "unnamed");
        devices.push_back(std::move(*record));
    }

    log(LogLevel::Info, "ONVIF discovery finished: %zu device(s)", devices.size());
    return mergeDeviceRecords(std::move(devices));
}

std::optional<DeviceRecord> OnvifProbe::parseDeviceInformation(const std::string& xml,
                                                               const std::string& ip,
                                                               std::uint16_t port) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS)
        return std::nullopt;
    const tinyxml2::XMLElement* response = findElement(doc.RootElement(), "GetDeviceInformationResponse");
    if (!response)
        return std::nullopt;

    auto field = [response](const char* name) -> std::optional<std::string> {
        auto text = elementText(response, name);
        if (!text)
            return std::nullopt;
        std::string value = trim(*text);
        if (value.empty())
            return std::nullopt;
        return value;
    };

    DeviceRecord record;
    record.ip = ip;
    record.servicePort = port;
    record.openPorts.insert(port);
    auto manufacturer = field("Manufacturer");
    record.model = field("Model");
    record.firmware = field("FirmwareVersion");
    record.hardwareId = field("HardwareId");
    std::string name = manufacturer.value_or("");
    if (record.model)
        name += (name.empty() ? "" : " ") + *record.model;
    if (!name.empty())
        record.name = name;
    if (manufacturer)
        record.vendor = lower(*manufacturer);
    record.type = DeviceType::Camera;
    return record;
}

std::optional<DeviceRecord> OnvifProbe::getDeviceInfo(const std::string& ip, std::uint16_t port,
                                                      const std::string& username,
                                                      const std::string& password) {
    if (!http_) {
        log(LogLevel::Error, "No HTTP client configured for device information query");
        return std::nullopt;
    }
    std::string security;
    if (!username.empty() && !password.empty())
        security = buildSecurityHeader(username, password, randomNonce(),
                                       formatCreated(std::chrono::system_clock::now()));

    HttpRequest request;
    request.url = "http://" + ip + ":" + std::to_string(port) + "/onvif/device_service";
    request.method = "POST";
    request.body = buildDeviceInfoRequest(security);
    request.contentType = "application/soap+xml; charset=utf-8";
    request.headers.emplace_back("SOAPAction",
                                 "\"http://www.onvif.org/ver10/device/wsdl/GetDeviceInformation\"");
    request.timeout = options_.deviceInfoTimeout;
    request.maxBytes = 256 * 1024;

    HttpResponse response = http_->fetch(request);
    if (response.errorKind == ErrorKind::AuthenticationRequired) {
        log(LogLevel::Warn, "Authentication required for %s", ip.c_str());
        return std::nullopt;
    }
    if (!response.ok()) {
        log(LogLevel::Error, "GetDeviceInformation failed for %s: %s", ip.c_str(),
            response.error.value_or("HTTP " + std::to_string(response.status)).c_str());
        return std::nullopt;
    }

    auto record = parseDeviceInformation(response.body, ip, port);
    if (!record) {
        log(LogLevel::Error, "Unparseable GetDeviceInformation reply from %s", ip.c_str());
        return std::nullopt;
    }
    if (record->vendor) {
        if (auto known = catalog_.matchVendorName(*record->vendor))
            record->vendor = known;
    }
    record->serviceAddress = request.url;
    return record;
}

} // namespace cw
