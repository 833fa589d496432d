#pragma once

#include <chrono>
#include <string>

namespace cw {

// base64(SHA-1(nonce || created || password)); nonce is raw bytes
std::string passwordDigest(const std::string& nonce, const std::string& created,
                           const std::string& password);

// <s:Header> block with a UsernameToken carrying the digest above
std::string buildSecurityHeader(const std::string& username, const std::string& password,
                                const std::string& nonce, const std::string& created);

// UTC timestamp formatted as 2024-01-31T12:34:56.000Z
std::string formatCreated(std::chrono::system_clock::time_point when);

std::string randomNonce(std::size_t bytes = 16);
std::string base64Encode(const std::string& data);

// Escape the five XML special characters
std::string xmlEscape(const std::string& text);

} // namespace cw
