#pragma once

#include "cw/Types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace cw {

// A device under management: where to reach it and its last known status
struct ManagedDevice {
    DeviceId id = 0;
    std::string name;
    std::string ip;
    std::string url;
    ConnectionKind kind = ConnectionKind::Stream;
    Credentials credentials;
    std::string vendorHint;
    bool active = true;

    bool online = false;
    std::optional<std::chrono::system_clock::time_point> lastSeen;
    HealthTier health = HealthTier::Unknown;
    int failureCount = 0;
    std::optional<std::string> lastError;
};

struct DeviceStatusUpdate {
    bool online = false;
    std::optional<std::chrono::system_clock::time_point> lastSeen;
    HealthTier health = HealthTier::Unknown;
    int failureCount = 0;
    std::optional<std::string> lastError;
};

// Persistence collaborator consulted and updated by the health sweep
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::optional<DeviceId> addDevice(const ManagedDevice& device) = 0;
    virtual std::optional<ManagedDevice> getDevice(DeviceId id) = 0;
    virtual std::vector<ManagedDevice> listDevices() = 0;
    virtual std::vector<ManagedDevice> listActiveDevices() = 0;
    virtual bool updateDeviceConnection(DeviceId id, const std::string& url, ConnectionKind kind) = 0;
    virtual bool updateDeviceStatus(DeviceId id, const DeviceStatusUpdate& status) = 0;
};

class SqliteDeviceStore : public DeviceStore {
public:
    // ":memory:" gives a private in-memory database
    explicit SqliteDeviceStore(std::string path);
    ~SqliteDeviceStore() override;

    SqliteDeviceStore(const SqliteDeviceStore&) = delete;
    SqliteDeviceStore& operator=(const SqliteDeviceStore&) = delete;

    // Opens the database and creates the schema if missing
    bool open();
    bool isOpen() const { return db_ != nullptr; }

    bool setActive(DeviceId id, bool active);
    bool removeDevice(DeviceId id);

    std::optional<DeviceId> addDevice(const ManagedDevice& device) override;
    std::optional<ManagedDevice> getDevice(DeviceId id) override;
    std::vector<ManagedDevice> listDevices() override;

    std::vector<ManagedDevice> listActiveDevices() override;
    bool updateDeviceConnection(DeviceId id, const std::string& url, ConnectionKind kind) override;
    bool updateDeviceStatus(DeviceId id, const DeviceStatusUpdate& status) override;

private:
    std::vector<ManagedDevice> query(const char* sql);
    bool exec(const char* sql);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace cw
