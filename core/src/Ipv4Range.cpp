#include "cw/Ipv4Range.hpp"

#include <arpa/inet.h>
#include <stdexcept>

namespace cw {

bool parseIpv4(const std::string& text, std::uint32_t& out) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
        return false;
    out = ntohl(addr.s_addr);
    return true;
}

std::string formatIpv4(std::uint32_t addr) {
    in_addr a{};
    a.s_addr = htonl(addr);
    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &a, buf, sizeof(buf)))
        return {};
    return buf;
}

Ipv4Range::Ipv4Range(std::uint32_t first, std::uint32_t last)
    : first_(first), last_(last) {
    if (last_ < first_)
        throw std::invalid_argument("range end precedes start");
    if (size() > MAX_HOSTS)
        throw std::invalid_argument("range too large");
}

Ipv4Range Ipv4Range::parse(const std::string& input) {
    std::string text;
    for (char c : input) {
        if (c != ' ' && c != '\t')
            text.push_back(c);
    }
    if (text.empty())
        throw std::invalid_argument("empty address range");

    auto slash = text.find('/');
    if (slash != std::string::npos) {
        std::uint32_t base = 0;
        if (!parseIpv4(text.substr(0, slash), base))
            throw std::invalid_argument("invalid network address: " + text);
        int prefix = -1;
        try {
            size_t used = 0;
            prefix = std::stoi(text.substr(slash + 1), &used);
            if (used != text.size() - slash - 1)
                prefix = -1;
        } catch (const std::exception&) {
            prefix = -1;
        }
        if (prefix < 16 || prefix > 32)
            throw std::invalid_argument("unsupported prefix length: " + text);
        std::uint32_t mask = prefix == 32 ? 0xFFFFFFFFu : ~(0xFFFFFFFFu >> prefix);
        std::uint32_t network = base & mask;
        std::uint32_t broadcast = network | ~mask;
        // Skip network and broadcast addresses where the block has room for hosts
        if (prefix <= 30)
            return Ipv4Range(network + 1, broadcast - 1);
        return Ipv4Range(network, broadcast);
    }

    auto dash = text.find('-');
    if (dash != std::string::npos) {
        std::uint32_t first = 0;
        if (!parseIpv4(text.substr(0, dash), first))
            throw std::invalid_argument("invalid range start: " + text);
        std::string tail = text.substr(dash + 1);
        std::uint32_t last = 0;
        if (tail.find('.') == std::string::npos) {
            // Short form: 192.168.1.10-20
            int octet = -1;
            try {
                size_t used = 0;
                octet = std::stoi(tail, &used);
                if (used != tail.size())
                    octet = -1;
            } catch (const std::exception&) {
                octet = -1;
            }
            if (octet < 0 || octet > 255)
                throw std::invalid_argument("invalid range end: " + text);
            last = (first & 0xFFFFFF00u) | static_cast<std::uint32_t>(octet);
        } else if (!parseIpv4(tail, last)) {
            throw std::invalid_argument("invalid range end: " + text);
        }
        return Ipv4Range(first, last);
    }

    std::uint32_t single = 0;
    if (!parseIpv4(text, single))
        throw std::invalid_argument("invalid address: " + text);
    return Ipv4Range(single, single);
}

std::vector<std::string> Ipv4Range::hosts() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (std::uint64_t addr = first_; addr <= last_; ++addr)
        out.push_back(formatIpv4(static_cast<std::uint32_t>(addr)));
    return out;
}

std::string Ipv4Range::toString() const {
    if (first_ == last_)
        return formatIpv4(first_);
    return formatIpv4(first_) + "-" + formatIpv4(last_);
}

} // namespace cw
