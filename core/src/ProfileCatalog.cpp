// ProfileCatalog.cpp: vendor connection templates and hardware-address prefixes
#include "cw/ProfileCatalog.hpp"
#include "cw/Log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace cw {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

const std::vector<ProbeMethod> kDiscoveryFirst = {ProbeMethod::Onvif, ProbeMethod::Stream, ProbeMethod::Http};
const std::vector<ProbeMethod> kStreamFirst = {ProbeMethod::Stream, ProbeMethod::Onvif, ProbeMethod::Http};

std::vector<VendorProfile> builtinProfiles() {
    std::vector<VendorProfile> out;

    VendorProfile hik;
    hik.id = "hikvision";
    hik.manufacturer = "Hikvision";
    hik.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/Streaming/Channels/{channel}01",
        "rtsp://{auth}{ip}:{port}/Streaming/Channels/{channel}02",
        "rtsp://{auth}{ip}:{port}/h264/ch{channel}/main/av_stream",
        "rtsp://{auth}{ip}:{port}/h264/ch{channel}/sub/av_stream",
    };
    hik.httpImageTemplates = {"http://{ip}:{port}/ISAPI/Streaming/channels/{channel}01/httpPreview"};
    hik.snapshotTemplates = {
        "http://{ip}:{port}/ISAPI/Streaming/channels/{channel}/picture",
        "http://{ip}:{port}/onvifsnapshot/media_service/snapshot?channel={channel}&subtype=0",
    };
    hik.capabilities = {"ptz", "audio", "alarm_io", "smart_events"};
    hik.priority = kDiscoveryFirst;
    out.push_back(hik);

    VendorProfile dahua;
    dahua.id = "dahua";
    dahua.manufacturer = "Dahua";
    dahua.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/cam/realmonitor?channel={channel}&subtype=0",
        "rtsp://{auth}{ip}:{port}/cam/realmonitor?channel={channel}&subtype=1",
        "rtsp://{auth}{ip}:{port}/live/ch{channel}",
    };
    dahua.httpImageTemplates = {"http://{ip}:{port}/cgi-bin/mjpg/video.cgi?channel={channel}&subtype=0"};
    dahua.snapshotTemplates = {"http://{ip}:{port}/cgi-bin/snapshot.cgi?channel={channel}"};
    dahua.capabilities = {"ptz", "audio", "alarm_io", "smart_codec"};
    dahua.priority = kDiscoveryFirst;
    out.push_back(dahua);

    VendorProfile axis;
    axis.id = "axis";
    axis.manufacturer = "Axis";
    axis.defaultUsername = "root";
    axis.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/axis-media/media.amp",
        "rtsp://{auth}{ip}:{port}/axis-media/media.amp?videocodec=h264",
        "rtsp://{auth}{ip}:{port}/axis-media/media.amp?resolution=1920x1080",
    };
    axis.httpImageTemplates = {
        "http://{ip}:{port}/axis-cgi/mjpg/video.cgi",
        "http://{ip}:{port}/mjpg/video.mjpg",
    };
    axis.snapshotTemplates = {"http://{ip}:{port}/axis-cgi/jpg/image.cgi"};
    axis.capabilities = {"ptz", "audio", "analytics", "zipstream"};
    axis.priority = kDiscoveryFirst;
    out.push_back(axis);

    VendorProfile foscam;
    foscam.id = "foscam";
    foscam.manufacturer = "Foscam";
    foscam.httpPort = 88;
    foscam.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/videoMain",
        "rtsp://{auth}{ip}:{port}/videoSub",
    };
    foscam.httpImageTemplates = {
        "http://{ip}:{port}/cgi-bin/CGIStream.cgi?cmd=GetMJStream&usr={username}&pwd={password}",
    };
    foscam.snapshotTemplates = {
        "http://{ip}:{port}/cgi-bin/CGIProxy.fcgi?cmd=snapPicture2&usr={username}&pwd={password}",
    };
    foscam.capabilities = {"ptz", "audio"};
    foscam.priority = kStreamFirst;
    out.push_back(foscam);

    VendorProfile vivotek;
    vivotek.id = "vivotek";
    vivotek.manufacturer = "Vivotek";
    vivotek.defaultUsername = "root";
    vivotek.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/live.sdp",
        "rtsp://{auth}{ip}:{port}/live/ch00_0",
    };
    vivotek.httpImageTemplates = {"http://{ip}:{port}/video.mjpg"};
    vivotek.snapshotTemplates = {"http://{ip}:{port}/cgi-bin/viewer/snapshot.jpg"};
    vivotek.capabilities = {"analytics", "audio"};
    out.push_back(vivotek);

    VendorProfile bosch;
    bosch.id = "bosch";
    bosch.manufacturer = "Bosch";
    bosch.defaultUsername = "service";
    bosch.streamTemplates = {"rtsp://{auth}{ip}:{port}/rtsp_tunnel"};
    bosch.snapshotTemplates = {
        "http://{ip}:{port}/snap.jpg?JpegCam={channel}",
        "http://{ip}:{port}/snap.jpg",
    };
    bosch.capabilities = {"analytics", "intelligent_tracking"};
    out.push_back(bosch);

    VendorProfile uniview;
    uniview.id = "uniview";
    uniview.manufacturer = "Uniview";
    uniview.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/unicast/c{channel}/s0/live",
        "rtsp://{auth}{ip}:{port}/unicast/c{channel}/s1/live",
    };
    uniview.snapshotTemplates = {"http://{ip}:{port}/cgi-bin/snapshot.cgi?channel={channel}"};
    uniview.capabilities = {"ptz", "smart_ir"};
    out.push_back(uniview);

    VendorProfile hanwha;
    hanwha.id = "hanwha";
    hanwha.manufacturer = "Hanwha";
    hanwha.streamTemplates = {"rtsp://{auth}{ip}:{port}/profile{stream}/media.smp"};
    hanwha.snapshotTemplates = {"http://{ip}:{port}/cgi-bin/snapshot.cgi"};
    hanwha.capabilities = {"wisenet", "analytics"};
    out.push_back(hanwha);

    VendorProfile reolink;
    reolink.id = "reolink";
    reolink.manufacturer = "Reolink";
    reolink.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/h264Preview_0{channel}_main",
        "rtsp://{auth}{ip}:{port}/h264Preview_0{channel}_sub",
    };
    reolink.snapshotTemplates = {
        "http://{ip}:{port}/cgi-bin/api.cgi?cmd=Snap&channel=0&rs=camwatch&user={username}&password={password}",
    };
    reolink.capabilities = {"ptz", "audio", "person_vehicle_detection"};
    out.push_back(reolink);

    VendorProfile tplink;
    tplink.id = "tplink";
    tplink.manufacturer = "TP-Link";
    tplink.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/stream1",
        "rtsp://{auth}{ip}:{port}/stream2",
    };
    tplink.capabilities = {"motion_detection", "audio"};
    out.push_back(tplink);

    VendorProfile xiaomi;
    xiaomi.id = "xiaomi";
    xiaomi.manufacturer = "Xiaomi";
    xiaomi.streamTemplates = {"rtsp://{auth}{ip}:{port}/live/ch00_0"};
    xiaomi.onvifSupported = false;
    xiaomi.capabilities = {"cloud", "ai_detection"};
    out.push_back(xiaomi);

    VendorProfile generic;
    generic.id = "generic";
    generic.manufacturer = "Generic";
    generic.streamTemplates = {
        "rtsp://{auth}{ip}:{port}/stream1",
        "rtsp://{auth}{ip}:{port}/stream",
        "rtsp://{auth}{ip}:{port}/live",
        "rtsp://{auth}{ip}:{port}/",
        "rtsp://{auth}{ip}:{port}/h264",
        "rtsp://{auth}{ip}:{port}/video",
    };
    generic.httpImageTemplates = {
        "http://{ip}:{port}/video.mjpg",
        "http://{ip}:{port}/mjpg/video.mjpg",
    };
    generic.snapshotTemplates = {
        "http://{ip}:{port}/snapshot.jpg",
        "http://{ip}:{port}/snap.jpg",
        "http://{ip}:{port}/image.jpg",
    };
    generic.priority = kStreamFirst;
    out.push_back(generic);

    return out;
}

// Organizationally unique identifiers of camera makers
const std::pair<const char*, const char*> kMacPrefixes[] = {
    {"001D7E", "hikvision"}, {"448544", "hikvision"}, {"2857BE", "hikvision"},
    {"C056E3", "hikvision"}, {"54C415", "hikvision"}, {"4419B6", "hikvision"},
    {"A4146B", "dahua"},     {"C03D46", "dahua"},     {"C42F90", "dahua"},
    {"3CEF8C", "dahua"},     {"A0BD1D", "dahua"},     {"E0508B", "dahua"},
    {"9002A9", "dahua"},     {"00408C", "axis"},      {"ACCC8C", "axis"},
    {"C4BE84", "foscam"},    {"98D6F7", "foscam"},    {"000D42", "vivotek"},
    {"00501E", "vivotek"},   {"00626E", "vivotek"},   {"0004F2", "bosch"},
    {"001921", "bosch"},     {"001FC6", "tplink"},    {"341863", "xiaomi"},
    {"001A07", "arecont"},   {"0080F0", "panasonic"}, {"0018AE", "tvt"},
    {"000F7C", "acti"},      {"003053", "basler"},    {"00047D", "pelco"},
    {"001122", "flir"},
};

// Vendor names recognised in free text that have no profile of their own
const char* const kExtraVendorNames[] = {
    "panasonic", "samsung", "sony", "pelco", "flir", "arecont", "acti", "basler", "tvt",
};

} // namespace

const std::vector<std::string>& CandidateUrls::forKind(ConnectionKind kind) const {
    switch (kind) {
        case ConnectionKind::Stream: return streaming;
        case ConnectionKind::HttpImage: return httpImage;
        case ConnectionKind::Snapshot: return snapshot;
    }
    return streaming;
}

std::string expandTemplate(const std::string& tpl, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tpl.size() + 32);
    size_t pos = 0;
    while (pos < tpl.size()) {
        size_t open = tpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        size_t close = tpl.find('}', open);
        if (close == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        out.append(tpl, pos, open - pos);
        auto it = values.find(tpl.substr(open + 1, close - open - 1));
        if (it != values.end())
            out += it->second;
        else
            out.append(tpl, open, close - open + 1);
        pos = close + 1;
    }
    return out;
}

std::string percentEncode(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

ProfileCatalog::ProfileCatalog() {
    for (auto& p : builtinProfiles())
        profiles_[p.id] = std::move(p);
    for (const auto& [prefix, vendor] : kMacPrefixes)
        macPrefixes_[prefix] = vendor;
}

const VendorProfile& ProfileCatalog::genericProfile() const {
    return profiles_.at("generic");
}

const VendorProfile& ProfileCatalog::getProfile(const std::string& vendorId) const {
    auto it = profiles_.find(lower(vendorId));
    if (it == profiles_.end())
        return genericProfile();
    return it->second;
}

bool ProfileCatalog::hasProfile(const std::string& vendorId) const {
    return profiles_.count(lower(vendorId)) > 0;
}

CandidateUrls ProfileCatalog::expandUrls(const VendorProfile& profile, const std::string& ip,
                                         const std::string& username, const std::string& password,
                                         int channel, int stream) const {
    const VendorProfile& generic = genericProfile();
    std::string user = percentEncode(username);
    std::string pass = percentEncode(password);

    std::map<std::string, std::string> values = {
        {"ip", ip},
        {"channel", std::to_string(channel)},
        {"stream", std::to_string(stream)},
        {"username", user},
        {"password", pass},
        {"auth", username.empty() ? std::string() : user + ":" + pass + "@"},
    };

    auto expandAll = [&values](const std::vector<std::string>& templates, std::uint16_t port) {
        values["port"] = std::to_string(port);
        std::vector<std::string> urls;
        for (const auto& tpl : templates) {
            std::string url = expandTemplate(tpl, values);
            if (std::find(urls.begin(), urls.end(), url) == urls.end())
                urls.push_back(std::move(url));
        }
        return urls;
    };

    CandidateUrls out;
    out.streaming = expandAll(profile.streamTemplates.empty() ? generic.streamTemplates
                                                              : profile.streamTemplates,
                              profile.streamPort);
    out.httpImage = expandAll(profile.httpImageTemplates.empty() ? generic.httpImageTemplates
                                                                 : profile.httpImageTemplates,
                              profile.httpPort);
    out.snapshot = expandAll(profile.snapshotTemplates.empty() ? generic.snapshotTemplates
                                                               : profile.snapshotTemplates,
                             profile.httpPort);
    return out;
}

CandidateUrls ProfileCatalog::expandUrls(const std::string& vendorId, const std::string& ip,
                                         const std::string& username, const std::string& password,
                                         int channel, int stream) const {
    return expandUrls(getProfile(vendorId), ip, username, password, channel, stream);
}

std::string ProfileCatalog::normalizeMac(const std::string& mac) {
    std::string hex;
    for (unsigned char c : mac) {
        if (std::isxdigit(c))
            hex.push_back(static_cast<char>(std::toupper(c)));
        else if (c != ':' && c != '-' && c != '.' && c != ' ')
            return {};
    }
    return hex;
}

std::optional<std::string> ProfileCatalog::detectVendorFromMac(const std::string& mac) const {
    std::string hex = normalizeMac(mac);
    if (hex.size() < 6)
        return std::nullopt;
    auto it = macPrefixes_.find(hex.substr(0, 6));
    if (it == macPrefixes_.end())
        return std::nullopt;
    return it->second;
}

std::vector<ProbeMethod> ProfileCatalog::priorityOrder(const std::string& vendorId) const {
    auto it = profiles_.find(lower(vendorId));
    if (it == profiles_.end() || it->second.priority.empty())
        return kStreamFirst;
    return it->second.priority;
}

std::optional<std::string> ProfileCatalog::matchVendorName(const std::string& text) const {
    std::string haystack = lower(text);
    if (haystack.empty())
        return std::nullopt;
    for (const auto& [id, profile] : profiles_) {
        if (id == "generic")
            continue;
        if (haystack.find(id) != std::string::npos ||
            haystack.find(lower(profile.manufacturer)) != std::string::npos)
            return id;
    }
    if (haystack.find("tp-link") != std::string::npos || haystack.find("tp_link") != std::string::npos)
        return std::string("tplink");
    for (const char* name : kExtraVendorNames) {
        if (haystack.find(name) != std::string::npos)
            return std::string(name);
    }
    return std::nullopt;
}

std::vector<std::string> ProfileCatalog::vendorIds() const {
    std::vector<std::string> ids;
    for (const auto& [id, profile] : profiles_)
        ids.push_back(id);
    return ids;
}

std::vector<VendorProfile> ProfileCatalog::profiles() const {
    std::vector<VendorProfile> out;
    for (const auto& [id, profile] : profiles_)
        out.push_back(profile);
    return out;
}

void ProfileCatalog::addProfile(VendorProfile profile) {
    profile.id = lower(profile.id);
    if (profile.id.empty())
        return;
    std::string id = profile.id;
    profiles_[id] = std::move(profile);
}

void ProfileCatalog::addMacPrefix(const std::string& prefix, const std::string& vendorId) {
    std::string hex = normalizeMac(prefix);
    if (hex.size() < 6)
        return;
    macPrefixes_[hex.substr(0, 6)] = lower(vendorId);
}

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null())
        field = j[key].get<T>();
}

std::vector<ProbeMethod> parsePriority(const nlohmann::json& arr) {
    std::vector<ProbeMethod> out;
    for (const auto& v : arr) {
        std::string name = lower(v.get<std::string>());
        if (name == "onvif")
            out.push_back(ProbeMethod::Onvif);
        else if (name == "rtsp" || name == "stream")
            out.push_back(ProbeMethod::Stream);
        else if (name == "http")
            out.push_back(ProbeMethod::Http);
        else
            log(LogLevel::Warn, "Ignoring unknown probe method '%s' in profile", name.c_str());
    }
    return out;
}

} // namespace

bool ProfileCatalog::loadProfiles(const nlohmann::json& root) {
    // Entries land in a copy; the catalog changes only when the whole document is valid
    ProfileCatalog staged = *this;
    try {
        auto apply = [&staged](const std::string& rawId, const nlohmann::json& entry) {
            if (!entry.is_object()) {
                log(LogLevel::Warn, "Profile entry '%s' is not an object", rawId.c_str());
                return;
            }
            std::string id = lower(rawId);
            if (id.empty()) {
                log(LogLevel::Warn, "Profile entry without id skipped");
                return;
            }
            VendorProfile profile;
            auto it = staged.profiles_.find(id);
            if (it != staged.profiles_.end()) {
                profile = it->second;
            } else {
                profile.id = id;
                profile.manufacturer = rawId;
            }
            readField(entry, "manufacturer", profile.manufacturer);
            readField(entry, "stream_port", profile.streamPort);
            readField(entry, "http_port", profile.httpPort);
            readField(entry, "onvif_port", profile.onvifPort);
            readField(entry, "default_username", profile.defaultUsername);
            readField(entry, "default_password", profile.defaultPassword);
            readField(entry, "stream_templates", profile.streamTemplates);
            readField(entry, "http_templates", profile.httpImageTemplates);
            readField(entry, "snapshot_templates", profile.snapshotTemplates);
            readField(entry, "onvif_supported", profile.onvifSupported);
            readField(entry, "capabilities", profile.capabilities);
            if (entry.contains("priority") && entry["priority"].is_array())
                profile.priority = parsePriority(entry["priority"]);
            if (entry.contains("mac_prefixes") && entry["mac_prefixes"].is_array()) {
                for (const auto& p : entry["mac_prefixes"])
                    staged.addMacPrefix(p.get<std::string>(), id);
            }
            staged.addProfile(std::move(profile));
            log(LogLevel::Debug, "Loaded vendor profile '%s'", id.c_str());
        };

        if (root.is_array()) {
            for (const auto& entry : root) {
                if (!entry.is_object() || !entry.contains("id")) {
                    log(LogLevel::Warn, "Profile entry without id skipped");
                    continue;
                }
                apply(entry["id"].get<std::string>(), entry);
            }
        } else if (root.is_object()) {
            for (const auto& [id, entry] : root.items())
                apply(id, entry);
        } else {
            log(LogLevel::Error, "Profiles JSON must be an array or an object");
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::Error, "Invalid vendor profile data: %s", e.what());
        return false;
    }

    const VendorProfile& generic = staged.genericProfile();
    if (generic.streamTemplates.empty() || generic.httpImageTemplates.empty() ||
        generic.snapshotTemplates.empty()) {
        log(LogLevel::Error, "Vendor profiles rejected: generic profile needs stream, http and snapshot templates");
        return false;
    }
    profiles_ = std::move(staged.profiles_);
    macPrefixes_ = std::move(staged.macPrefixes_);
    return true;
}

bool ProfileCatalog::loadProfilesFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        log(LogLevel::Error, "Cannot open profiles file: %s", path.c_str());
        return false;
    }
    nlohmann::json root;
    try {
        f >> root;
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::Error, "Exception parsing JSON %s: %s", path.c_str(), e.what());
        return false;
    }
    return loadProfiles(root);
}

} // namespace cw
