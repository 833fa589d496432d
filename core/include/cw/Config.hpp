#pragma once

#include "cw/ConnectionTester.hpp"
#include "cw/HealthMonitor.hpp"
#include "cw/Log.hpp"
#include "cw/NetworkScanner.hpp"
#include "cw/OnvifProbe.hpp"
#include "cw/StreamBroadcaster.hpp"

#include <optional>
#include <string>

namespace cw {

struct Config {
    LogLevel logLevel = LogLevel::Info;
    std::string database = "camwatch.db";
    std::optional<std::string> profilesFile;
    std::optional<std::string> network; // scan range; local /24 when unset

    ScanOptions scanner;
    DiscoveryOptions discovery;
    ConnectionOptions connection;
    HealthOptions health;
    StreamOptions streaming;
};

// Reads a JSON configuration file; every key is optional
class ConfigLoader {
public:
    explicit ConfigLoader(std::string path);

    bool load();
    // Parse from text already in memory
    bool loadString(const std::string& text);

    const Config& config() const { return config_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    Config config_;
};

} // namespace cw
