// Config.cpp: JSON configuration loader
#include "cw/Config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace cw {

namespace {

template <typename T>
void readValue(const nlohmann::json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null())
        out = it->get<T>();
}

template <typename Duration>
void readDuration(const nlohmann::json& obj, const char* key, Duration& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null())
        out = Duration(it->get<typename Duration::rep>());
}

void readPorts(const nlohmann::json& obj, const char* key, std::vector<std::uint16_t>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array())
        return;
    out.clear();
    for (const auto& port : *it)
        out.push_back(port.get<std::uint16_t>());
}

const nlohmann::json& section(const nlohmann::json& root, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = root.find(key);
    if (it == root.end() || !it->is_object())
        return empty;
    return *it;
}

void applyJson(const nlohmann::json& root, Config& cfg) {
    if (root.contains("log_level"))
        cfg.logLevel = parseLogLevel(root["log_level"].get<std::string>(), cfg.logLevel);
    readValue(root, "database", cfg.database);
    if (root.contains("profiles_file"))
        cfg.profilesFile = root["profiles_file"].get<std::string>();

    const auto& scanner = section(root, "scanner");
    if (scanner.contains("network"))
        cfg.network = scanner["network"].get<std::string>();
    readDuration(scanner, "timeout_ms", cfg.scanner.timeout);
    readValue(scanner, "concurrency", cfg.scanner.concurrency);
    readPorts(scanner, "quick_ports", cfg.scanner.quickPorts);
    readPorts(scanner, "ports", cfg.scanner.ports);
    readValue(scanner, "resolve_names", cfg.scanner.resolveNames);
    readValue(scanner, "resolve_hardware", cfg.scanner.resolveHardware);

    const auto& discovery = section(root, "discovery");
    readDuration(discovery, "timeout_ms", cfg.discovery.timeout);
    readValue(discovery, "multicast_group", cfg.discovery.multicastGroup);
    readValue(discovery, "port", cfg.discovery.port);
    readDuration(discovery, "device_info_timeout_ms", cfg.discovery.deviceInfoTimeout);

    const auto& connection = section(root, "connection");
    readDuration(connection, "timeout_ms", cfg.connection.timeout);
    readDuration(connection, "pause_ms", cfg.connection.pause);
    readValue(connection, "http_prefix_bytes", cfg.connection.httpPrefixBytes);
    readValue(connection, "channel", cfg.connection.channel);
    readValue(connection, "stream", cfg.connection.stream);

    const auto& health = section(root, "health");
    readDuration(health, "interval_s", cfg.health.interval);
    readValue(health, "batch_size", cfg.health.batchSize);
    readDuration(health, "batch_pause_ms", cfg.health.batchPause);
    readValue(health, "uptime_samples", cfg.health.uptimeSamples);
    const auto& reconnect = section(health, "reconnect");
    readValue(reconnect, "max_attempts", cfg.health.reconnect.maxAttempts);
    readValue(reconnect, "initial_delay_s", cfg.health.reconnect.initialDelaySeconds);
    readValue(reconnect, "backoff_factor", cfg.health.reconnect.backoffFactor);
    readValue(reconnect, "max_delay_s", cfg.health.reconnect.maxDelaySeconds);

    const auto& streaming = section(root, "streaming");
    readValue(streaming, "max_reconnect_attempts", cfg.streaming.maxReconnectAttempts);
    readDuration(streaming, "reconnect_delay_ms", cfg.streaming.reconnectDelay);
    readDuration(streaming, "open_timeout_ms", cfg.streaming.openTimeout);
    readValue(streaming, "queue_size", cfg.streaming.queueSize);
    readValue(streaming, "jpeg_quality", cfg.streaming.jpegQuality);
    if (streaming.contains("overflow")) {
        auto policy = streaming["overflow"].get<std::string>();
        if (policy == "drop_oldest")
            cfg.streaming.overflow = OverflowPolicy::DropOldest;
        else if (policy == "drop_newest")
            cfg.streaming.overflow = OverflowPolicy::DropNewest;
        else
            log(LogLevel::Warn, "Unknown streaming.overflow \"%s\", keeping drop_newest", policy.c_str());
    }
}

} // namespace

ConfigLoader::ConfigLoader(std::string path) : path_(std::move(path)) {}

bool ConfigLoader::load() {
    std::ifstream f(path_);
    if (!f) {
        log(LogLevel::Error, "Cannot open config file: %s", path_.c_str());
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return loadString(text);
}

bool ConfigLoader::loadString(const std::string& text) {
    Config cfg;
    try {
        auto root = nlohmann::json::parse(text);
        if (!root.is_object()) {
            log(LogLevel::Error, "Config root is not an object in %s", path_.c_str());
            return false;
        }
        applyJson(root, cfg);
    } catch (const std::exception& e) {
        log(LogLevel::Error, "Exception parsing config %s: %s", path_.c_str(), e.what());
        return false;
    }
    config_ = std::move(cfg);
    return true;
}

} // namespace cw
