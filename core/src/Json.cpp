#include "cw/Json.hpp"

#include <ctime>

namespace cw {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value)
        j[key] = *value;
    else
        j[key] = nullptr;
}

void putTime(nlohmann::json& j, const char* key,
             const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp)
        j[key] = formatTimestamp(*tp);
    else
        j[key] = nullptr;
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void to_json(nlohmann::json& j, const Resolution& r) {
    j = r.toString();
}

void to_json(nlohmann::json& j, const DeviceRecord& d) {
    j = nlohmann::json{
        {"ip", d.ip},
        {"type", toString(d.type)},
        {"open_ports", d.openPorts},
        {"via_discovery", d.viaDiscovery},
    };
    putOptional(j, "hostname", d.hostname);
    putOptional(j, "mac", d.mac);
    putOptional(j, "vendor", d.vendor);
    putOptional(j, "name", d.name);
    putOptional(j, "model", d.model);
    putOptional(j, "firmware", d.firmware);
    putOptional(j, "hardware_id", d.hardwareId);
    putOptional(j, "service_address", d.serviceAddress);
    if (d.servicePort)
        j["service_port"] = d.servicePort;
    if (!d.scopes.empty())
        j["scopes"] = d.scopes;
    if (!d.streamUrls.empty())
        j["stream_urls"] = d.streamUrls;
    putOptional(j, "resolution", d.resolution);
}

void to_json(nlohmann::json& j, const ConnectionTestResult& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"kind", toString(r.kind)},
        {"url", r.url},
        {"response_time_ms", r.responseTimeMs},
    };
    putOptional(j, "resolution", r.resolution);
    putOptional(j, "fps", r.fps);
    putOptional(j, "codec", r.codec);
    putOptional(j, "error", r.error);
    if (r.errorKind != ErrorKind::None)
        j["error_kind"] = toString(r.errorKind);
}

void to_json(nlohmann::json& j, const HealthCheckResult& r) {
    j = nlohmann::json{
        {"online", r.online},
        {"health", toString(r.tier)},
        {"response_time_ms", r.responseTimeMs},
    };
    putOptional(j, "resolution", r.resolution);
    putOptional(j, "fps", r.fps);
    putOptional(j, "error", r.error);
    if (r.errorKind != ErrorKind::None)
        j["error_kind"] = toString(r.errorKind);
}

void to_json(nlohmann::json& j, const CandidateUrls& urls) {
    j = nlohmann::json{
        {toString(ConnectionKind::Stream), urls.streaming},
        {toString(ConnectionKind::HttpImage), urls.httpImage},
        {toString(ConnectionKind::Snapshot), urls.snapshot},
    };
}

void to_json(nlohmann::json& j, const VendorProfile& p) {
    std::vector<std::string> priority;
    for (ProbeMethod m : p.priority)
        priority.push_back(toString(m));
    j = nlohmann::json{
        {"id", p.id},
        {"manufacturer", p.manufacturer},
        {"stream_port", p.streamPort},
        {"http_port", p.httpPort},
        {"onvif_port", p.onvifPort},
        {"default_username", p.defaultUsername},
        {"onvif_supported", p.onvifSupported},
        {"capabilities", p.capabilities},
        {"priority", priority},
    };
}

void to_json(nlohmann::json& j, const ManagedDevice& d) {
    j = nlohmann::json{
        {"id", d.id},
        {"name", d.name},
        {"ip", d.ip},
        {"url", d.url},
        {"kind", toString(d.kind)},
        {"username", d.credentials.username},
        {"vendor", d.vendorHint},
        {"active", d.active},
        {"online", d.online},
        {"health", toString(d.health)},
        {"failure_count", d.failureCount},
    };
    putTime(j, "last_seen", d.lastSeen);
    putOptional(j, "last_error", d.lastError);
}

void to_json(nlohmann::json& j, const CameraHealthStatus& s) {
    j = nlohmann::json{
        {"camera_id", s.deviceId},
        {"name", s.name},
        {"url", s.url},
        {"kind", toString(s.kind)},
        {"online", s.online},
        {"health", toString(s.tier)},
        {"response_time_ms", s.responseTimeMs},
        {"uptime_percentage", s.uptimePercentage},
        {"failed_attempts", s.failedAttempts},
        {"next_check_in_seconds", s.nextCheckInSeconds},
        {"retries_exhausted", s.retriesExhausted},
    };
    putTime(j, "last_check", s.lastCheck);
    putOptional(j, "last_error", s.lastError);
    if (s.errorKind != ErrorKind::None)
        j["error_kind"] = toString(s.errorKind);
}

void to_json(nlohmann::json& j, const SystemHealthSummary& s) {
    nlohmann::json tiers = nlohmann::json::object();
    for (const auto& [tier, count] : s.byTier)
        tiers[toString(tier)] = count;
    j = nlohmann::json{
        {"total_cameras", s.total},
        {"online", s.online},
        {"offline", s.offline},
        {"retries_exhausted", s.retriesExhausted},
        {"by_health", tiers},
        {"average_uptime", s.averageUptime},
        {"monitoring", s.running},
    };
    putTime(j, "last_sweep", s.lastSweep);
}

void to_json(nlohmann::json& j, const ReconnectionStatus& s) {
    j = nlohmann::json{
        {"camera_id", s.deviceId},
        {"attempts", s.attempts},
        {"max_attempts", s.maxAttempts},
        {"next_retry_in_seconds", s.nextRetryInSeconds},
        {"exhausted", s.exhausted},
    };
    putTime(j, "last_attempt", s.lastAttempt);
}

void to_json(nlohmann::json& j, const StreamInfo& s) {
    j = nlohmann::json{
        {"camera_id", s.cameraId},
        {"name", s.name},
        {"url", s.url},
        {"running", s.running},
        {"width", s.width},
        {"height", s.height},
        {"fps", s.fps},
        {"reconnect_attempts", s.reconnectAttempts},
        {"subscribers", s.subscribers},
        {"frames_captured", s.framesCaptured},
    };
    putOptional(j, "error", s.error);
    putOptional(j, "last_frame_age_seconds", s.lastFrameAgeSeconds);
}

void to_json(nlohmann::json& j, const AutoDetectReport& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"ip", r.ip},
        {"vendor", r.vendor},
        {"results", r.results},
    };
    putOptional(j, "recommended", r.recommended);
    putOptional(j, "device_info", r.deviceInfo);
}

} // namespace cw
