#include "MonitorScheduler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <poll.h>

std::chrono::milliseconds MonitorScheduler::TimeUntil(MonitorLoop::Clock::time_point deadline, MonitorLoop::Clock::time_point now) {
    if (deadline <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

void MonitorScheduler::Add(MonitorLoop& loop) {
    loops_.push_back(&loop);
}

void MonitorScheduler::Run(const std::atomic<bool>& stopRequested) {
    for (auto* loop : loops_) {
        loop->Start();
    }
    std::cout << "[Scheduler] Running " << loops_.size() << " monitor(s)" << std::endl;

    std::vector<pollfd> fds;
    std::vector<int> fdOwner;
    while (!stopRequested) {
        fds.clear();
        fdOwner.assign(loops_.size(), -1);

        auto now = MonitorLoop::Clock::now();
        auto wait = kMaxWait;
        for (size_t i = 0; i < loops_.size(); ++i) {
            const WaitSpec spec = loops_[i]->NextWait();
            if (spec.fd >= 0) {
                fdOwner[i] = static_cast<int>(fds.size());
                fds.push_back(pollfd{spec.fd, POLLIN, 0});
            }
            if (spec.deadline) {
                wait = std::min(wait, TimeUntil(*spec.deadline, now));
            }
        }

        const int rc = poll(fds.empty() ? nullptr : fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (rc < 0 && errno != EINTR) {
            std::cerr << "[Scheduler] poll failed: " << std::strerror(errno) << std::endl;
        }

        if (stopRequested) {
            break;
        }

        now = MonitorLoop::Clock::now();
        for (size_t i = 0; i < loops_.size(); ++i) {
            const WaitSpec spec = loops_[i]->NextWait();
            const bool fdReady = rc > 0 && fdOwner[i] >= 0
                && (fds[static_cast<size_t>(fdOwner[i])].revents & (POLLIN | POLLHUP | POLLERR)) != 0;
            const bool due = spec.deadline && now >= *spec.deadline;
            if (fdReady || due) {
                loops_[i]->Step(fdReady);
            }
        }
    }

    StopAll();
}

void MonitorScheduler::StopAll() {
    for (auto* loop : loops_) {
        loop->Stop();
    }
    std::cout << "[Scheduler] All monitors stopped" << std::endl;
}
