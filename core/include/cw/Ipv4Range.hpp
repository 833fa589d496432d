#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cw {

// Inclusive range of IPv4 host addresses (host byte order)
class Ipv4Range {
public:
    Ipv4Range() = default;
    Ipv4Range(std::uint32_t first, std::uint32_t last);

    // Accepts "a.b.c.d/nn", "a.b.c.d-e.f.g.h", "a.b.c.d-h" or a single address.
    // Throws std::invalid_argument on malformed input or ranges wider than /16.
    static Ipv4Range parse(const std::string& text);

    std::uint32_t first() const { return first_; }
    std::uint32_t last() const { return last_; }
    std::size_t size() const { return static_cast<std::size_t>(last_ - first_) + 1; }

    std::vector<std::string> hosts() const;
    std::string toString() const;

    static constexpr std::size_t MAX_HOSTS = 65536;

private:
    std::uint32_t first_ = 0;
    std::uint32_t last_ = 0;
};

std::string formatIpv4(std::uint32_t addr);
bool parseIpv4(const std::string& text, std::uint32_t& out);

} // namespace cw
