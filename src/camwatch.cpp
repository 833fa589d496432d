// camwatch.cpp - command line runner for the camera fleet core
#include "cw/Config.hpp"
#include "cw/FleetService.hpp"
#include "cw/ImageCodec.hpp"
#include "cw/Json.hpp"
#include "cw/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace cw;

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop = true;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  scan [range]          sweep a range (CIDR, a-b, or single address)\n"
              << "  discover              ONVIF WS-Discovery plus port sweep\n"
              << "  vendors               list the vendor profiles\n"
              << "  urls <ip>             candidate URLs for a device\n"
              << "  probe <ip>            find the best working connection\n"
              << "  add <name> <ip>       probe and store a device\n"
              << "  devices               list stored devices\n"
              << "  monitor               run the health loop until interrupted\n"
              << "  snapshot <url> <file> save one JPEG from a stream or image URL\n"
              << "Options:\n"
              << "  --config <file>  --user <name>  --pass <password>  --vendor <id>\n";
}

void printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

bool writeFile(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        log(LogLevel::Error, "Cannot write %s", path.c_str());
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

int snapshot(const Config& config, const std::string& url, const std::string& file,
             const Credentials& creds) {
    std::optional<std::string> jpeg;
    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        AvioHttpClient http;
        HttpRequest req;
        req.url = url;
        req.credentials = creds;
        req.timeout = config.connection.timeout;
        auto resp = http.fetch(req);
        if (!resp.ok()) {
            log(LogLevel::Error, "Fetch failed: %s", resp.error.value_or("HTTP error").c_str());
            return 1;
        }
        if (!looksLikeImage(resp.body)) {
            log(LogLevel::Error, "%s did not return an image (%s)", url.c_str(),
                resp.contentType.c_str());
            return 1;
        }
        jpeg = resp.body;
    } else {
        auto source = makeFfmpegMediaSource();
        if (!source->open(withCredentials(url, creds), config.connection.timeout)) {
            log(LogLevel::Error, "Open failed: %s", source->lastError().c_str());
            return 1;
        }
        Frame frame;
        bool ok = source->read(frame);
        source->close();
        if (!ok) {
            log(LogLevel::Error, "No frame decoded: %s", source->lastError().c_str());
            return 1;
        }
        jpeg = encodeJpeg(frame, config.streaming.jpegQuality);
    }
    if (!jpeg || !writeFile(file, *jpeg))
        return 1;
    printJson({{"url", url}, {"file", file}, {"bytes", jpeg->size()}});
    return 0;
}

int monitor(FleetService& fleet) {
    auto token = fleet.events().subscribe(kCameraStatusChannel, [](const std::string& msg) {
        std::cout << msg << std::endl;
    });
    if (!fleet.startMonitoring()) {
        fleet.events().unsubscribe(token);
        return 1;
    }
    log(LogLevel::Info, "Monitoring running. Press Ctrl+C to exit.");
    while (!g_stop)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    fleet.stopMonitoring();
    fleet.events().unsubscribe(token);
    if (auto summary = fleet.getSystemHealthSummary())
        printJson(*summary);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string configFile;
    std::optional<std::string> user;
    std::optional<std::string> pass;
    std::string vendor;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configFile = argv[++i];
        else if (arg == "--user" && i + 1 < argc) user = argv[++i];
        else if (arg == "--pass" && i + 1 < argc) pass = argv[++i];
        else if (arg == "--vendor" && i + 1 < argc) vendor = argv[++i];
        else if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return 0; }
        else args.push_back(arg);
    }
    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Config config;
    if (!configFile.empty()) {
        ConfigLoader loader(configFile);
        if (!loader.load()) {
            std::cerr << "Failed to load config: " << configFile << std::endl;
            return 2;
        }
        config = loader.config();
    }
    setLogLevel(config.logLevel);
    installFfmpegLogBridge();

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string& cmd = args[0];
    auto need = [&](std::size_t n) {
        if (args.size() < n + 1) {
            print_usage(argv[0]);
            return false;
        }
        return true;
    };

    if (cmd == "snapshot") {
        if (!need(2))
            return 1;
        return snapshot(config, args[1], args[2], Credentials{user.value_or(""), pass.value_or("")});
    }

    FleetService fleet(config, makeDefaultComponents(config));

    // Vendor defaults fill in credentials the user did not give
    auto credentialsFor = [&](const std::string& vendorId) {
        const auto& profile = fleet.catalog().getProfile(vendorId);
        return Credentials{user.value_or(profile.defaultUsername),
                           pass.value_or(profile.defaultPassword)};
    };

    if (cmd == "scan") {
        std::optional<std::string> range;
        if (args.size() > 1)
            range = args[1];
        auto devices = fleet.scanNetwork(range, [](std::size_t done, std::size_t total, const std::string&) {
            if (done % 32 == 0 || done == total)
                log(LogLevel::Info, "Scanned %zu/%zu", done, total);
        }, &g_stop);
        printJson(devices);
    } else if (cmd == "discover") {
        std::optional<std::string> range;
        if (args.size() > 1)
            range = args[1];
        printJson(fleet.discoverAll(range));
    } else if (cmd == "vendors") {
        printJson(fleet.catalog().profiles());
    } else if (cmd == "urls") {
        if (!need(1))
            return 1;
        auto creds = credentialsFor(vendor);
        printJson(fleet.generateCandidateUrls(args[1], vendor, creds.username, creds.password));
    } else if (cmd == "probe") {
        if (!need(1))
            return 1;
        auto creds = credentialsFor(vendor);
        auto report = fleet.autoDetect(args[1], creds.username, creds.password, vendor);
        printJson(report);
        return report.success ? 0 : 3;
    } else if (cmd == "add") {
        if (!need(2))
            return 1;
        auto id = fleet.addCamera(args[1], args[2], credentialsFor(vendor), vendor);
        if (!id)
            return 3;
        printJson({{"id", *id}, {"name", args[1]}, {"ip", args[2]}});
    } else if (cmd == "devices") {
        printJson(fleet.listDevices());
    } else if (cmd == "monitor") {
        return monitor(fleet);
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    return 0;
}
