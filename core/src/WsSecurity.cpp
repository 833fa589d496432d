// WsSecurity.cpp: WS-Security UsernameToken with PasswordDigest
#include "cw/WsSecurity.hpp"

#include <ctime>
#include <memory>
#include <random>

extern "C" {
#include <libavutil/base64.h>
#include <libavutil/mem.h>
#include <libavutil/sha.h>
}

namespace cw {

std::string base64Encode(const std::string& data) {
    std::string out(AV_BASE64_SIZE(data.size()), '\0');
    if (!av_base64_encode(out.data(), static_cast<int>(out.size()),
                          reinterpret_cast<const uint8_t*>(data.data()), static_cast<int>(data.size())))
        return {};
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

std::string passwordDigest(const std::string& nonce, const std::string& created,
                           const std::string& password) {
    std::unique_ptr<AVSHA, decltype(&av_free)> sha(av_sha_alloc(), &av_free);
    if (!sha)
        return {};
    av_sha_init(sha.get(), 160);
    av_sha_update(sha.get(), reinterpret_cast<const uint8_t*>(nonce.data()), nonce.size());
    av_sha_update(sha.get(), reinterpret_cast<const uint8_t*>(created.data()), created.size());
    av_sha_update(sha.get(), reinterpret_cast<const uint8_t*>(password.data()), password.size());
    uint8_t digest[20];
    av_sha_final(sha.get(), digest);
    return base64Encode(std::string(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

std::string xmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string buildSecurityHeader(const std::string& username, const std::string& password,
                                const std::string& nonce, const std::string& created) {
    std::string header;
    header += "<s:Header>";
    header += "<Security s:mustUnderstand=\"1\" xmlns=\"http://docs.oasis-open.org/wss/2004/01/"
              "oasis-200401-wss-wssecurity-secext-1.0.xsd\">";
    header += "<UsernameToken>";
    header += "<Username>" + xmlEscape(username) + "</Username>";
    header += "<Password Type=\"http://docs.oasis-open.org/wss/2004/01/"
              "oasis-200401-wss-username-token-profile-1.0#PasswordDigest\">";
    header += passwordDigest(nonce, created, password);
    header += "</Password>";
    header += "<Nonce EncodingType=\"http://docs.oasis-open.org/wss/2004/01/"
              "oasis-200401-wss-soap-message-security-1.0#Base64Binary\">";
    header += base64Encode(nonce);
    header += "</Nonce>";
    header += "<Created xmlns=\"http://docs.oasis-open.org/wss/2004/01/"
              "oasis-200401-wss-wssecurity-utility-1.0.xsd\">";
    header += created;
    header += "</Created>";
    header += "</UsernameToken></Security></s:Header>";
    return header;
}

std::string formatCreated(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S.000Z", &utc);
    return buf;
}

std::string randomNonce(std::size_t bytes) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(bytes, '\0');
    for (auto& c : out)
        c = static_cast<char>(dist(gen));
    return out;
}

} // namespace cw
