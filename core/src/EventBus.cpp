// Implementation for EventBus
#include "cw/EventBus.hpp"
#include "cw/Log.hpp"

#include <algorithm>
#include <exception>

namespace cw {

EventBus::Token EventBus::subscribe(const std::string& channel, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = nextToken_++;
    subscribers_[channel].push_back(Entry{token, std::move(cb)});
    return token;
}

void EventBus::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [channel, entries] : subscribers_) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [token](const Entry& e) { return e.token == token; }),
                      entries.end());
    }
}

void EventBus::publish(const std::string& channel, const std::string& message) {
    std::vector<Callback> toCall;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(channel);
        if (it != subscribers_.end()) {
            for (const auto& e : it->second)
                toCall.push_back(e.cb);
        }
    }
    for (auto& cb : toCall) {
        try {
            cb(message);
        } catch (const std::exception& e) {
            log(LogLevel::Warn, "Subscriber on %s threw: %s", channel.c_str(), e.what());
        }
    }
}

std::size_t EventBus::subscriberCount(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel);
    return it == subscribers_.end() ? 0 : it->second.size();
}

} // namespace cw
