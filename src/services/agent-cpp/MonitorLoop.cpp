#include "MonitorLoop.hpp"

#include <exception>
#include <iostream>
#include <utility>

std::string ToString(MonitorState state) {
    switch (state) {
    case MonitorState::IDLE:
        return "idle";
    case MonitorState::WAITING:
        return "waiting";
    case MonitorState::PROCESSING:
        return "processing";
    case MonitorState::STOPPED:
        return "stopped";
    }
    return "unknown";
}

MonitorLoop::MonitorLoop(std::string name)
    : name_(std::move(name)) {}

const std::string& MonitorLoop::Name() const {
    return name_;
}

MonitorState MonitorLoop::State() const {
    return state_;
}

void MonitorLoop::Start() {
    if (state_ != MonitorState::IDLE) {
        return;
    }

    OnStart(Clock::now());
    state_ = MonitorState::WAITING;
}

WaitSpec MonitorLoop::NextWait() const {
    if (state_ != MonitorState::WAITING) {
        return {};
    }
    return OnWait();
}

void MonitorLoop::Step(bool fdReady) {
    if (state_ != MonitorState::WAITING) {
        return;
    }

    state_ = MonitorState::PROCESSING;
    try {
        OnReady(fdReady, Clock::now());
    } catch (const std::exception& ex) {
        std::cerr << "[Scheduler] " << name_ << " step failed: " << ex.what() << std::endl;
    }
    state_ = MonitorState::WAITING;
}

void MonitorLoop::Stop() {
    if (state_ == MonitorState::STOPPED) {
        return;
    }

    if (state_ != MonitorState::IDLE) {
        OnStop();
    }
    state_ = MonitorState::STOPPED;
}

SubscribedMonitor::SubscribedMonitor(
    std::string name,
    std::unique_ptr<EventSource> source,
    Normalizer normalizer,
    DeliveryClient& client,
    std::string ingestUrl,
    std::unique_ptr<DedupFilter> dedup,
    std::string dedupField)
    : MonitorLoop(std::move(name)),
      source_(std::move(source)),
      normalizer_(std::move(normalizer)),
      client_(client),
      ingestUrl_(std::move(ingestUrl)),
      dedup_(std::move(dedup)),
      dedupField_(std::move(dedupField)) {}

const SubscribedMonitorStats& SubscribedMonitor::Stats() const {
    return stats_;
}

void SubscribedMonitor::OnStart(Clock::time_point now) {
    TryOpen(now);
}

WaitSpec SubscribedMonitor::OnWait() const {
    WaitSpec wait;
    if (source_->IsOpen()) {
        wait.fd = source_->WaitFd();
    } else {
        wait.deadline = reopenAt_;
    }
    return wait;
}

void SubscribedMonitor::OnReady(bool fdReady, Clock::time_point now) {
    if (!source_->IsOpen()) {
        if (now >= reopenAt_) {
            TryOpen(now);
        }
        return;
    }

    if (!fdReady) {
        return;
    }

    while (auto raw = source_->PollNext()) {
        Relay(*raw);
    }

    if (!source_->IsOpen()) {
        reopenAt_ = now + kReopenDelay;
    }
}

void SubscribedMonitor::OnStop() {
    source_->Close();
    std::cout << "[" << Name() << "] Stopped after " << stats_.received << " record(s): "
              << stats_.delivered << " delivered, " << stats_.suppressed << " suppressed, "
              << stats_.dropped << " dropped" << std::endl;
}

void SubscribedMonitor::TryOpen(Clock::time_point now) {
    if (source_->Open()) {
        std::cout << "[" << Name() << "] Subscribed to " << source_->Name() << std::endl;
        return;
    }

    std::cerr << "[" << Name() << "] Unable to subscribe to " << source_->Name()
              << "; retrying in " << kReopenDelay.count() << "s" << std::endl;
    reopenAt_ = now + kReopenDelay;
}

void SubscribedMonitor::Relay(const RawEvent& raw) {
    ++stats_.received;

    if (dedup_) {
        const auto message = FindField(raw, dedupField_);
        if (!message || !dedup_->ShouldEmit(*message)) {
            ++stats_.suppressed;
            return;
        }
    }

    const LogEvent event = normalizer_(raw);
    const std::string payload = Serialize(ToJson(event));
    const DeliveryResult result = client_.Deliver(ingestUrl_, payload, Name() + " event");
    if (result.delivered) {
        ++stats_.delivered;
    } else {
        ++stats_.dropped;
    }
}

TimerMonitor::TimerMonitor(std::string name, std::chrono::milliseconds interval, std::function<void()> action, bool runImmediately)
    : MonitorLoop(std::move(name)),
      interval_(interval),
      action_(std::move(action)),
      runImmediately_(runImmediately) {}

int TimerMonitor::Runs() const {
    return runs_;
}

void TimerMonitor::OnStart(Clock::time_point now) {
    nextRun_ = runImmediately_ ? now : now + interval_;
}

WaitSpec TimerMonitor::OnWait() const {
    WaitSpec wait;
    wait.deadline = nextRun_;
    return wait;
}

void TimerMonitor::OnReady(bool, Clock::time_point now) {
    if (now < nextRun_) {
        return;
    }

    ++runs_;
    try {
        action_();
    } catch (const std::exception& ex) {
        std::cerr << "[" << Name() << "] run failed: " << ex.what() << std::endl;
    }
    nextRun_ = Clock::now() + interval_;
}
