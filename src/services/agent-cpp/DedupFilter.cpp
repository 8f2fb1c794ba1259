#include "DedupFilter.hpp"

DedupFilter::DedupFilter(size_t maxEntries, std::chrono::seconds ttl)
    : maxEntries_(maxEntries),
      ttl_(ttl) {}

bool DedupFilter::ShouldEmit(const std::string& message) {
    return ShouldEmit(message, Clock::now());
}

bool DedupFilter::ShouldEmit(const std::string& message, Clock::time_point now) {
    if (message.empty()) {
        return false;
    }

    Evict(now);

    auto it = seen_.find(message);
    if (it != seen_.end()) {
        return false;
    }

    seen_.emplace(message, now);
    order_.emplace_back(message, now);

    while (maxEntries_ > 0 && seen_.size() > maxEntries_ && !order_.empty()) {
        const auto oldest = order_.front();
        order_.pop_front();
        auto found = seen_.find(oldest.first);
        if (found != seen_.end() && found->second == oldest.second) {
            seen_.erase(found);
        }
    }

    return true;
}

size_t DedupFilter::Size() const {
    return seen_.size();
}

void DedupFilter::Evict(Clock::time_point now) {
    if (ttl_.count() <= 0) {
        return;
    }

    while (!order_.empty() && now - order_.front().second >= ttl_) {
        auto found = seen_.find(order_.front().first);
        if (found != seen_.end() && found->second == order_.front().second) {
            seen_.erase(found);
        }
        order_.pop_front();
    }
}
