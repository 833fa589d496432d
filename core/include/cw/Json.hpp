#pragma once

#include "cw/FleetService.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace cw {

// "2024-05-01T12:00:00Z"
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const Resolution& r);
void to_json(nlohmann::json& j, const DeviceRecord& d);
void to_json(nlohmann::json& j, const ConnectionTestResult& r);
void to_json(nlohmann::json& j, const HealthCheckResult& r);
void to_json(nlohmann::json& j, const CandidateUrls& urls);
void to_json(nlohmann::json& j, const VendorProfile& p);
void to_json(nlohmann::json& j, const ManagedDevice& d); // password omitted
void to_json(nlohmann::json& j, const CameraHealthStatus& s);
void to_json(nlohmann::json& j, const SystemHealthSummary& s);
void to_json(nlohmann::json& j, const ReconnectionStatus& s);
void to_json(nlohmann::json& j, const StreamInfo& s);
void to_json(nlohmann::json& j, const AutoDetectReport& r);

} // namespace cw
