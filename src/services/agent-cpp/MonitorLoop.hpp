#pragma once

#include "DedupFilter.hpp"
#include "DeliveryClient.hpp"
#include "EventSource.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class MonitorState {
    IDLE,
    WAITING,
    PROCESSING,
    STOPPED
};

std::string ToString(MonitorState state);

// What a loop is suspended on: a readable descriptor, a deadline, or both.
struct WaitSpec {
    int fd = -1;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

// One long-lived observer. The scheduler calls Step() when the loop's descriptor is
// readable or its deadline passed; a step always runs to completion.
class MonitorLoop {
public:
    using Clock = std::chrono::steady_clock;

    explicit MonitorLoop(std::string name);
    virtual ~MonitorLoop() = default;

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    const std::string& Name() const;
    MonitorState State() const;

    void Start();
    WaitSpec NextWait() const;
    void Step(bool fdReady);
    void Stop();

protected:
    virtual void OnStart(Clock::time_point now) = 0;
    virtual WaitSpec OnWait() const = 0;
    virtual void OnReady(bool fdReady, Clock::time_point now) = 0;
    virtual void OnStop() {}

private:
    std::string name_;
    MonitorState state_ = MonitorState::IDLE;
};

struct SubscribedMonitorStats {
    int received = 0;
    int suppressed = 0;
    int delivered = 0;
    int dropped = 0;
};

// Push-style monitor: drains its source on wakeup and relays every record through
// normalize -> dedup -> deliver, in arrival order.
class SubscribedMonitor : public MonitorLoop {
public:
    using Normalizer = std::function<LogEvent(const RawEvent&)>;

    static constexpr std::chrono::seconds kReopenDelay{5};

    // dedup may be null. When set, records without a non-empty dedupField are skipped.
    SubscribedMonitor(
        std::string name,
        std::unique_ptr<EventSource> source,
        Normalizer normalizer,
        DeliveryClient& client,
        std::string ingestUrl,
        std::unique_ptr<DedupFilter> dedup = nullptr,
        std::string dedupField = "MESSAGE");

    const SubscribedMonitorStats& Stats() const;

protected:
    void OnStart(Clock::time_point now) override;
    WaitSpec OnWait() const override;
    void OnReady(bool fdReady, Clock::time_point now) override;
    void OnStop() override;

private:
    void TryOpen(Clock::time_point now);
    void Relay(const RawEvent& raw);

    std::unique_ptr<EventSource> source_;
    Normalizer normalizer_;
    DeliveryClient& client_;
    std::string ingestUrl_;
    std::unique_ptr<DedupFilter> dedup_;
    std::string dedupField_;
    Clock::time_point reopenAt_;
    SubscribedMonitorStats stats_;
};

// Timer-driven monitor: runs its action once per interval, re-arming after the
// action returns so slow actions never overlap.
class TimerMonitor : public MonitorLoop {
public:
    TimerMonitor(std::string name, std::chrono::milliseconds interval, std::function<void()> action, bool runImmediately = true);

    int Runs() const;

protected:
    void OnStart(Clock::time_point now) override;
    WaitSpec OnWait() const override;
    void OnReady(bool fdReady, Clock::time_point now) override;

private:
    std::chrono::milliseconds interval_;
    std::function<void()> action_;
    bool runImmediately_;
    Clock::time_point nextRun_;
    int runs_ = 0;
};
