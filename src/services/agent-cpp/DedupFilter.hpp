#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <utility>

// Suppresses repeated messages for one monitoring run. Owned by a single
// MonitorLoop; not thread-safe.
class DedupFilter {
public:
    using Clock = std::chrono::steady_clock;

    // maxEntries == 0 keeps every message for the session; ttl == 0 never expires.
    explicit DedupFilter(size_t maxEntries = 0, std::chrono::seconds ttl = std::chrono::seconds(0));

    bool ShouldEmit(const std::string& message);
    bool ShouldEmit(const std::string& message, Clock::time_point now);

    size_t Size() const;

private:
    void Evict(Clock::time_point now);

    size_t maxEntries_;
    std::chrono::seconds ttl_;
    std::unordered_map<std::string, Clock::time_point> seen_;
    std::deque<std::pair<std::string, Clock::time_point>> order_;
};
