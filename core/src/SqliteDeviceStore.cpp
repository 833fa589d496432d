// SqliteDeviceStore.cpp: device table persisted with SQLite
#include "cw/DeviceStore.hpp"
#include "cw/Log.hpp"

#include <ctime>
#include <sqlite3.h>

namespace cw {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS devices ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " name TEXT NOT NULL DEFAULT '',"
    " ip TEXT NOT NULL DEFAULT '',"
    " url TEXT NOT NULL DEFAULT '',"
    " kind TEXT NOT NULL DEFAULT 'rtsp',"
    " username TEXT NOT NULL DEFAULT '',"
    " password TEXT NOT NULL DEFAULT '',"
    " vendor TEXT NOT NULL DEFAULT '',"
    " active INTEGER NOT NULL DEFAULT 1,"
    " online INTEGER NOT NULL DEFAULT 0,"
    " last_seen INTEGER,"
    " health TEXT NOT NULL DEFAULT 'unknown',"
    " failure_count INTEGER NOT NULL DEFAULT 0,"
    " last_error TEXT"
    ");";

const char* kColumns =
    "SELECT id, name, ip, url, kind, username, password, vendor, active, online,"
    " last_seen, health, failure_count, last_error FROM devices ";

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

ManagedDevice readRow(sqlite3_stmt* stmt) {
    ManagedDevice d;
    d.id = sqlite3_column_int64(stmt, 0);
    d.name = columnText(stmt, 1);
    d.ip = columnText(stmt, 2);
    d.url = columnText(stmt, 3);
    d.kind = parseConnectionKind(columnText(stmt, 4)).value_or(ConnectionKind::Stream);
    d.credentials.username = columnText(stmt, 5);
    d.credentials.password = columnText(stmt, 6);
    d.vendorHint = columnText(stmt, 7);
    d.active = sqlite3_column_int(stmt, 8) != 0;
    d.online = sqlite3_column_int(stmt, 9) != 0;
    if (sqlite3_column_type(stmt, 10) != SQLITE_NULL)
        d.lastSeen = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(sqlite3_column_int64(stmt, 10)));
    d.health = parseHealthTier(columnText(stmt, 11)).value_or(HealthTier::Unknown);
    d.failureCount = sqlite3_column_int(stmt, 12);
    if (sqlite3_column_type(stmt, 13) != SQLITE_NULL)
        d.lastError = columnText(stmt, 13);
    return d;
}

// Finalizes the statement on scope exit
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() {
        if (stmt)
            sqlite3_finalize(stmt);
    }
};

} // namespace

SqliteDeviceStore::SqliteDeviceStore(std::string path) : path_(std::move(path)) {}

SqliteDeviceStore::~SqliteDeviceStore() {
    if (db_)
        sqlite3_close(db_);
}

bool SqliteDeviceStore::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log(LogLevel::Error, "SQL error: %s", err ? err : sqlite3_errmsg(db_));
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SqliteDeviceStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_)
        return true;
    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        log(LogLevel::Error, "Cannot open DB %s: %s", path_.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, 2000);
    if (!exec(kSchema)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

std::optional<DeviceId> SqliteDeviceStore::addDevice(const ManagedDevice& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return std::nullopt;
    const char* sql =
        "INSERT INTO devices (name, ip, url, kind, username, password, vendor, active)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    Statement s;
    if (sqlite3_prepare_v2(db_, sql, -1, &s.stmt, nullptr) != SQLITE_OK) {
        log(LogLevel::Error, "Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_text(s.stmt, 1, device.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 2, device.ip.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 3, device.url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 4, toString(device.kind), -1, SQLITE_STATIC);
    sqlite3_bind_text(s.stmt, 5, device.credentials.username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 6, device.credentials.password.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 7, device.vendorHint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(s.stmt, 8, device.active ? 1 : 0);
    if (sqlite3_step(s.stmt) != SQLITE_DONE) {
        log(LogLevel::Error, "Failed to insert device: %s", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return static_cast<DeviceId>(sqlite3_last_insert_rowid(db_));
}

std::optional<ManagedDevice> SqliteDeviceStore::getDevice(DeviceId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return std::nullopt;
    std::string sql = std::string(kColumns) + "WHERE id = ?;";
    Statement s;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &s.stmt, nullptr) != SQLITE_OK) {
        log(LogLevel::Error, "Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_int64(s.stmt, 1, id);
    if (sqlite3_step(s.stmt) != SQLITE_ROW)
        return std::nullopt;
    return readRow(s.stmt);
}

std::vector<ManagedDevice> SqliteDeviceStore::query(const char* where) {
    std::vector<ManagedDevice> out;
    if (!db_)
        return out;
    std::string sql = std::string(kColumns) + where;
    Statement s;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &s.stmt, nullptr) != SQLITE_OK) {
        log(LogLevel::Error, "Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return out;
    }
    int rc;
    while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW)
        out.push_back(readRow(s.stmt));
    if (rc != SQLITE_DONE)
        log(LogLevel::Error, "Device query failed: %s", sqlite3_errmsg(db_));
    return out;
}

std::vector<ManagedDevice> SqliteDeviceStore::listDevices() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query("ORDER BY id;");
}

std::vector<ManagedDevice> SqliteDeviceStore::listActiveDevices() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query("WHERE active = 1 ORDER BY id;");
}

bool SqliteDeviceStore::setActive(DeviceId id, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return false;
    Statement s;
    if (sqlite3_prepare_v2(db_, "UPDATE devices SET active = ? WHERE id = ?;", -1, &s.stmt, nullptr) != SQLITE_OK)
        return false;
    sqlite3_bind_int(s.stmt, 1, active ? 1 : 0);
    sqlite3_bind_int64(s.stmt, 2, id);
    return sqlite3_step(s.stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool SqliteDeviceStore::removeDevice(DeviceId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return false;
    Statement s;
    if (sqlite3_prepare_v2(db_, "DELETE FROM devices WHERE id = ?;", -1, &s.stmt, nullptr) != SQLITE_OK)
        return false;
    sqlite3_bind_int64(s.stmt, 1, id);
    return sqlite3_step(s.stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool SqliteDeviceStore::updateDeviceConnection(DeviceId id, const std::string& url, ConnectionKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return false;
    Statement s;
    if (sqlite3_prepare_v2(db_, "UPDATE devices SET url = ?, kind = ? WHERE id = ?;", -1, &s.stmt,
                           nullptr) != SQLITE_OK) {
        log(LogLevel::Error, "Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(s.stmt, 1, url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.stmt, 2, toString(kind), -1, SQLITE_STATIC);
    sqlite3_bind_int64(s.stmt, 3, id);
    if (sqlite3_step(s.stmt) != SQLITE_DONE) {
        log(LogLevel::Error, "Failed to update device %lld: %s", static_cast<long long>(id), sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteDeviceStore::updateDeviceStatus(DeviceId id, const DeviceStatusUpdate& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return false;
    const char* sql =
        "UPDATE devices SET online = ?, last_seen = COALESCE(?, last_seen), health = ?,"
        " failure_count = ?, last_error = ? WHERE id = ?;";
    Statement s;
    if (sqlite3_prepare_v2(db_, sql, -1, &s.stmt, nullptr) != SQLITE_OK) {
        log(LogLevel::Error, "Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_int(s.stmt, 1, status.online ? 1 : 0);
    if (status.lastSeen)
        sqlite3_bind_int64(s.stmt, 2, static_cast<sqlite3_int64>(
                                          std::chrono::system_clock::to_time_t(*status.lastSeen)));
    else
        sqlite3_bind_null(s.stmt, 2);
    sqlite3_bind_text(s.stmt, 3, toString(status.health), -1, SQLITE_STATIC);
    sqlite3_bind_int(s.stmt, 4, status.failureCount);
    if (status.lastError)
        sqlite3_bind_text(s.stmt, 5, status.lastError->c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(s.stmt, 5);
    sqlite3_bind_int64(s.stmt, 6, id);
    if (sqlite3_step(s.stmt) != SQLITE_DONE) {
        log(LogLevel::Error, "Failed to update device %lld: %s", static_cast<long long>(id), sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

} // namespace cw
