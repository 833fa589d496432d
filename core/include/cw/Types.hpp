#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cw {

using DeviceId = std::int64_t;

// The three ways imagery can be pulled from a device
enum class ConnectionKind {
    Stream,     // RTSP and other container streams
    HttpImage,  // multipart MJPEG over HTTP
    Snapshot    // single still image over HTTP
};

// Probing paths considered per vendor; Onvif means "ask the device first"
enum class ProbeMethod {
    Onvif,
    Stream,
    Http
};

enum class HealthTier {
    Unknown,
    Excellent,
    Good,
    Fair,
    Poor,
    Offline
};

enum class ErrorKind {
    None,
    Unreachable,
    ProtocolMismatch,
    AuthenticationRequired,
    DecodeFailure,
    ExhaustedRetries
};

enum class DeviceType {
    Unknown,
    Camera,
    Nvr
};

const char* toString(ConnectionKind kind);
const char* toString(ProbeMethod method);
const char* toString(HealthTier tier);
const char* toString(ErrorKind kind);
const char* toString(DeviceType type);

std::optional<ConnectionKind> parseConnectionKind(const std::string& name);
std::optional<HealthTier> parseHealthTier(const std::string& name);

// Tier thresholds: <500ms excellent, <1500ms good, <3000ms fair, else poor
HealthTier healthTierFor(bool online, double latencyMs);

struct Resolution {
    int width = 0;
    int height = 0;

    std::string toString() const;
    bool operator==(const Resolution& other) const {
        return width == other.width && height == other.height;
    }
};

// A discovered network endpoint and the evidence gathered about it
struct DeviceRecord {
    std::string ip;
    std::optional<std::string> hostname;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;       // catalog vendor id when known
    std::optional<std::string> name;
    std::optional<std::string> model;
    std::optional<std::string> firmware;
    std::optional<std::string> hardwareId;
    std::optional<std::string> serviceAddress; // ONVIF XAddr
    std::uint16_t servicePort = 0;
    std::set<std::uint16_t> openPorts;
    DeviceType type = DeviceType::Unknown;
    bool viaDiscovery = false;
    std::vector<std::string> scopes;
    std::vector<std::string> streamUrls;
    std::optional<std::string> resolution;
};

// Merge records describing the same address; output ordered by numeric IPv4
std::vector<DeviceRecord> mergeDeviceRecords(std::vector<DeviceRecord> records);
void mergeInto(DeviceRecord& target, const DeviceRecord& other);

struct ConnectionTestResult {
    bool success = false;
    ConnectionKind kind = ConnectionKind::Stream;
    std::string url;
    double responseTimeMs = 0.0;
    std::optional<Resolution> resolution;
    std::optional<double> fps;
    std::optional<std::string> codec;
    std::optional<std::string> error;
    ErrorKind errorKind = ErrorKind::None;
};

struct HealthCheckResult {
    bool online = false;
    HealthTier tier = HealthTier::Offline;
    double responseTimeMs = 0.0;
    std::optional<Resolution> resolution;
    std::optional<double> fps;
    std::optional<std::string> error;
    ErrorKind errorKind = ErrorKind::None;
};

struct Credentials {
    std::string username;
    std::string password;
};

} // namespace cw
