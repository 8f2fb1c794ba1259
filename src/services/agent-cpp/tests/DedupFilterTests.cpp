#include "DedupFilter.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    DedupFilter session;
    if (!session.ShouldEmit("disk full")) {
        return Fail("First sighting should be emitted.");
    }
    if (session.ShouldEmit("disk full")) {
        return Fail("Repeat should be suppressed.");
    }
    if (!session.ShouldEmit("Disk full")) {
        return Fail("Comparison is exact; a different message is new.");
    }
    if (session.ShouldEmit("") || session.ShouldEmit("")) {
        return Fail("Empty messages are never emitted.");
    }
    if (session.Size() != 2) {
        return Fail("Empty messages should not be remembered.");
    }

    DedupFilter bounded(2);
    bounded.ShouldEmit("a");
    bounded.ShouldEmit("b");
    bounded.ShouldEmit("c");
    if (bounded.Size() != 2) {
        return Fail("Bounded filter grew past its limit.");
    }
    if (!bounded.ShouldEmit("a")) {
        return Fail("Oldest entry should have been evicted.");
    }
    if (bounded.ShouldEmit("c")) {
        return Fail("Recent entry should still be suppressed.");
    }

    const auto start = DedupFilter::Clock::now();
    DedupFilter expiring(0, std::chrono::seconds(60));
    if (!expiring.ShouldEmit("kernel oops", start)) {
        return Fail("First sighting should be emitted.");
    }
    if (expiring.ShouldEmit("kernel oops", start + std::chrono::seconds(59))) {
        return Fail("Repeat inside the TTL should be suppressed.");
    }
    if (!expiring.ShouldEmit("kernel oops", start + std::chrono::seconds(61))) {
        return Fail("Repeat after the TTL should be emitted again.");
    }

    return 0;
}
