#pragma once

#include "cw/Types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace cw {

// Connection knowledge for one manufacturer.
// Stream templates may use {auth} {ip} {port} {channel} {stream} {username} {password};
// HTTP and snapshot templates get {port} bound to httpPort.
struct VendorProfile {
    std::string id;
    std::string manufacturer;
    std::uint16_t streamPort = 554;
    std::uint16_t httpPort = 80;
    std::uint16_t onvifPort = 80;
    std::string defaultUsername = "admin";
    std::string defaultPassword;
    std::vector<std::string> streamTemplates;
    std::vector<std::string> httpImageTemplates;
    std::vector<std::string> snapshotTemplates;
    bool onvifSupported = true;
    std::vector<std::string> capabilities;
    std::vector<ProbeMethod> priority; // empty means the default order
};

struct CandidateUrls {
    std::vector<std::string> streaming;
    std::vector<std::string> httpImage;
    std::vector<std::string> snapshot;

    const std::vector<std::string>& forKind(ConnectionKind kind) const;
    std::size_t total() const { return streaming.size() + httpImage.size() + snapshot.size(); }
};

class ProfileCatalog {
public:
    // Catalog preloaded with the built-in vendor table
    ProfileCatalog();

    // Unknown ids (case-insensitive) resolve to the generic profile
    const VendorProfile& getProfile(const std::string& vendorId) const;
    bool hasProfile(const std::string& vendorId) const;
    const VendorProfile& genericProfile() const;

    // Kinds the profile leaves empty are filled from the generic templates
    CandidateUrls expandUrls(const VendorProfile& profile, const std::string& ip,
                             const std::string& username, const std::string& password,
                             int channel = 1, int stream = 1) const;
    CandidateUrls expandUrls(const std::string& vendorId, const std::string& ip,
                             const std::string& username, const std::string& password,
                             int channel = 1, int stream = 1) const;

    // Looks up the first 6 hex digits of a hardware address in any common notation
    std::optional<std::string> detectVendorFromMac(const std::string& mac) const;

    std::vector<ProbeMethod> priorityOrder(const std::string& vendorId) const;

    // Case-insensitive substring match of free text against known vendor ids
    // and manufacturer names (e.g. "HIKVISION DS-2CD2042" -> "hikvision")
    std::optional<std::string> matchVendorName(const std::string& text) const;

    std::vector<std::string> vendorIds() const;
    std::vector<VendorProfile> profiles() const;

    // Adds or replaces a profile
    void addProfile(VendorProfile profile);
    void addMacPrefix(const std::string& prefix, const std::string& vendorId);

    // Merge profiles from JSON: either an array of objects with "id", or an
    // object keyed by id. Fields not given keep their existing values.
    bool loadProfiles(const nlohmann::json& root);
    bool loadProfilesFile(const std::string& path);

    static std::string normalizeMac(const std::string& mac);

private:
    std::map<std::string, VendorProfile> profiles_;
    std::map<std::string, std::string> macPrefixes_; // "001D7E" -> vendor id
};

// Substitute {name} placeholders; unknown placeholders are left in place
std::string expandTemplate(const std::string& tpl, const std::map<std::string, std::string>& values);

// Percent-encode everything outside RFC 3986 unreserved characters
std::string percentEncode(const std::string& text);

} // namespace cw
