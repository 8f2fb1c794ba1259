#pragma once

#include "MonitorLoop.hpp"

#include <atomic>
#include <chrono>
#include <vector>

// Runs every registered loop cooperatively on the calling thread. Loops yield at
// their wait points (descriptor readiness or timer deadline); the stop flag is
// consulted once per cycle and at least every kMaxWait.
class MonitorScheduler {
public:
    static constexpr std::chrono::milliseconds kMaxWait{1000};

    // Milliseconds until deadline, rounded up so a wait never ends before it is due.
    static std::chrono::milliseconds TimeUntil(MonitorLoop::Clock::time_point deadline, MonitorLoop::Clock::time_point now);

    void Add(MonitorLoop& loop);
    void Run(const std::atomic<bool>& stopRequested);

private:
    void StopAll();

    std::vector<MonitorLoop*> loops_;
};
