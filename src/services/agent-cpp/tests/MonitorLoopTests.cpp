#include "MonitorLoop.hpp"
#include "MonitorScheduler.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const std::string kIngestUrl = "https://iq.example/api/v1/logs/";

// Queue-backed source whose descriptor is always readable while open.
class QueueSource : public EventSource {
public:
    QueueSource() {
        if (pipe(fds_) == 0) {
            const char byte = 'x';
            ssize_t written = write(fds_[1], &byte, 1);
            (void)written;
        }
    }

    ~QueueSource() override {
        close(fds_[0]);
        close(fds_[1]);
    }

    const std::string& Name() const override { return name_; }

    bool Open() override {
        ++opens;
        open_ = openSucceeds;
        return open_;
    }

    bool IsOpen() const override { return open_; }
    int WaitFd() const override { return open_ ? fds_[0] : -1; }

    std::optional<RawEvent> PollNext() override {
        if (records.empty()) {
            if (closeWhenDrained) {
                open_ = false;
            }
            return std::nullopt;
        }
        RawEvent next = records.front();
        records.pop_front();
        return next;
    }

    void Close() override {
        open_ = false;
        ++closes;
    }

    std::deque<RawEvent> records;
    bool openSucceeds = true;
    bool closeWhenDrained = false;
    int opens = 0;
    int closes = 0;

private:
    std::string name_ = "queue";
    int fds_[2] = {-1, -1};
    bool open_ = false;
};

RawEvent Record(const std::string& message) {
    return {{"MESSAGE", message}, {"PRIORITY", std::int64_t(3)}};
}

std::string MessageOf(const RecordedRequest& request) {
    const auto body = nlohmann::json::parse(request.body);
    for (const auto& property : body["properties"]) {
        if (property["name"] == "message") {
            return property["value"].get<std::string>();
        }
    }
    return {};
}
} // namespace

int main() {
    SecurityProvider security("token", "client", GenerateClientSecret());

    {
        FakeTransport transport;
        DeliveryClient client(transport, security);
        auto owned = std::make_unique<QueueSource>();
        QueueSource* source = owned.get();
        source->records = {Record("disk full"), Record("link down"), Record("disk full"), Record(""), RawEvent{RawField{"PRIORITY", std::int64_t(2)}}, Record("fan failure")};

        SubscribedMonitor monitor(
            "Journal",
            std::move(owned),
            [](const RawEvent& raw) { return NormalizeRecord(kJournalSource, raw); },
            client,
            kIngestUrl,
            std::make_unique<DedupFilter>());

        if (monitor.State() != MonitorState::IDLE) {
            return Fail("A new monitor should be idle.");
        }
        monitor.Start();
        if (monitor.State() != MonitorState::WAITING || source->opens != 1) {
            return Fail("Start should subscribe and wait.");
        }
        if (monitor.NextWait().fd < 0) {
            return Fail("An open source should be waited on by descriptor.");
        }

        monitor.Step(true);
        if (transport.CountPosts() != 3) {
            return Fail("Expected three unique messages delivered, got " + std::to_string(transport.CountPosts()));
        }
        if (MessageOf(transport.requests[0]) != "disk full"
            || MessageOf(transport.requests[1]) != "link down"
            || MessageOf(transport.requests[2]) != "fan failure") {
            return Fail("Records must be delivered in arrival order.");
        }
        const auto body = nlohmann::json::parse(transport.requests[0].body);
        if (body["source"] != "journald" || transport.requests[0].url != kIngestUrl) {
            return Fail("Unexpected journal payload.");
        }

        const SubscribedMonitorStats& stats = monitor.Stats();
        if (stats.received != 6 || stats.suppressed != 3 || stats.delivered != 3 || stats.dropped != 0) {
            return Fail("Unexpected monitor statistics.");
        }

        monitor.Stop();
        if (monitor.State() != MonitorState::STOPPED || source->closes != 1) {
            return Fail("Stop should close the source.");
        }
        monitor.Step(true);
        if (transport.CountPosts() != 3) {
            return Fail("A stopped monitor must not process records.");
        }
    }

    {
        FakeTransport transport;
        transport.fallback = MakeResponse(500);
        DeliveryClient client(transport, security);
        auto owned = std::make_unique<QueueSource>();
        QueueSource* source = owned.get();
        source->records = {Record("one"), Record("two")};
        source->closeWhenDrained = true;

        SubscribedMonitor monitor(
            "Journal",
            std::move(owned),
            [](const RawEvent& raw) { return NormalizeRecord(kJournalSource, raw); },
            client,
            kIngestUrl);
        monitor.Start();
        monitor.Step(true);

        if (monitor.Stats().dropped != 2 || transport.CountPosts() != 6) {
            return Fail("Undeliverable records are retried then dropped without stopping the loop.");
        }
        if (monitor.State() != MonitorState::WAITING) {
            return Fail("Monitor should keep waiting after delivery failures.");
        }
        const WaitSpec wait = monitor.NextWait();
        if (wait.fd != -1 || !wait.deadline) {
            return Fail("A closed source should be retried on a deadline.");
        }
        monitor.Stop();
    }

    {
        FakeTransport transport;
        DeliveryClient client(transport, security);
        auto owned = std::make_unique<QueueSource>();
        QueueSource* source = owned.get();
        source->records = {Record("bad byte \xff here"), Record("after")};

        SubscribedMonitor monitor(
            "Journal",
            std::move(owned),
            [](const RawEvent& raw) { return NormalizeRecord(kJournalSource, raw); },
            client,
            kIngestUrl);
        monitor.Start();
        monitor.Step(true);
        if (monitor.Stats().delivered != 2 || MessageOf(transport.requests[1]) != "after") {
            return Fail("A record with invalid UTF-8 must be delivered without blocking the next one.");
        }
        if (MessageOf(transport.requests[0]).find("\xEF\xBF\xBD") == std::string::npos) {
            return Fail("Invalid bytes should be replaced in the payload.");
        }
        monitor.Stop();
    }

    {
        FakeTransport transport;
        DeliveryClient client(transport, security);
        auto owned = std::make_unique<QueueSource>();
        QueueSource* source = owned.get();
        source->openSucceeds = false;

        SubscribedMonitor monitor(
            "Journal",
            std::move(owned),
            [](const RawEvent& raw) { return NormalizeRecord(kJournalSource, raw); },
            client,
            kIngestUrl);
        monitor.Start();
        if (monitor.State() != MonitorState::WAITING || !monitor.NextWait().deadline) {
            return Fail("A failed subscription should schedule a reopen.");
        }
        monitor.Stop();
    }

    {
        std::atomic<bool> stop{false};
        int ticks = 0;
        TimerMonitor timer("Ticker", std::chrono::milliseconds(10), [&]() {
            if (++ticks == 3) {
                stop = true;
            }
        });
        TimerMonitor failing("Failing", std::chrono::milliseconds(10), []() {
            throw std::runtime_error("probe exploded");
        });

        MonitorScheduler scheduler;
        scheduler.Add(timer);
        scheduler.Add(failing);

        const auto started = std::chrono::steady_clock::now();
        scheduler.Run(stop);
        if (ticks != 3 || timer.Runs() != 3) {
            return Fail("Timer should run until the stop flag is raised.");
        }
        if (failing.Runs() < 1) {
            return Fail("A throwing action must not stop its monitor from running.");
        }
        if (timer.State() != MonitorState::STOPPED || failing.State() != MonitorState::STOPPED) {
            return Fail("Every loop should be stopped when the scheduler returns.");
        }
        if (std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
            return Fail("Scheduler took too long to honour the stop flag.");
        }
    }

    {
        std::atomic<bool> stop{true};
        TimerMonitor idle("Idle", std::chrono::hours(1), []() {}, false);
        MonitorScheduler scheduler;
        scheduler.Add(idle);
        scheduler.Run(stop);
        if (idle.Runs() != 0 || idle.State() != MonitorState::STOPPED) {
            return Fail("A pre-raised stop flag should stop without running anything.");
        }
    }

    {
        const auto now = MonitorLoop::Clock::now();
        if (MonitorScheduler::TimeUntil(now + std::chrono::microseconds(300), now) != std::chrono::milliseconds(1)) {
            return Fail("A deadline under a millisecond away should wait a full millisecond.");
        }
        if (MonitorScheduler::TimeUntil(now + std::chrono::microseconds(2500), now) != std::chrono::milliseconds(3)) {
            return Fail("Waits should round up to the next millisecond.");
        }
        if (MonitorScheduler::TimeUntil(now - std::chrono::seconds(1), now) != std::chrono::milliseconds(0)) {
            return Fail("A past deadline should not wait.");
        }
    }

    if (ToString(MonitorState::PROCESSING) != "processing") {
        return Fail("Unexpected state name.");
    }

    return 0;
}
