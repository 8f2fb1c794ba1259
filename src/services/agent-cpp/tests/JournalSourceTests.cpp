#include "JournalSource.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <poll.h>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

// Reads until the child exits or the deadline passes.
std::vector<RawEvent> DrainSource(JournalSource& source) {
    std::vector<RawEvent> records;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (source.IsOpen() && std::chrono::steady_clock::now() < deadline) {
        pollfd fd{source.WaitFd(), POLLIN, 0};
        poll(&fd, 1, 100);
        while (auto raw = source.PollNext()) {
            records.push_back(std::move(*raw));
        }
    }
    while (auto raw = source.PollNext()) {
        records.push_back(std::move(*raw));
    }
    return records;
}
} // namespace

int main() {
    const auto command = JournalSource::BuildCommand("warning");
    const std::vector<std::string> expected = {"journalctl", "--follow", "--lines=0", "--output=json", "--priority=warning"};
    if (command != expected) {
        return Fail("Unexpected journalctl invocation.");
    }
    if (JournalSource::BuildCommand("").back() != "--priority=err") {
        return Fail("Priority should default to err.");
    }

    const auto parsed = JournalSource::ParseLine(
        R"({"__REALTIME_TIMESTAMP":"1709288130000123","PRIORITY":"3","MESSAGE":"Out of memory","_PID":"812","MESSAGE_ID":null,"_CMDLINE":[104,105]})");
    if (!parsed || parsed->size() != 6) {
        return Fail("Journal line not parsed.");
    }
    const RawEvent& raw = *parsed;
    if (raw[0].name != "__REALTIME_TIMESTAMP" || !std::holds_alternative<TimePoint>(raw[0].value)) {
        return Fail("Realtime timestamp should become a time point.");
    }
    if (FormatIsoTimestamp(std::get<TimePoint>(raw[0].value)) != "2024-03-01T10:15:30.000123+00:00") {
        return Fail("Realtime timestamp decoded to the wrong instant.");
    }
    if (!std::holds_alternative<std::int64_t>(raw[1].value) || std::get<std::int64_t>(raw[1].value) != 3) {
        return Fail("PRIORITY should become an integer.");
    }
    if (raw[2].name != "MESSAGE" || std::get<std::string>(raw[2].value) != "Out of memory") {
        return Fail("Field order must follow the journal record.");
    }
    if (std::get<std::int64_t>(raw[3].value) != 812) {
        return Fail("_PID should become an integer.");
    }
    if (std::get<std::string>(raw[4].value) != "" || std::get<std::string>(raw[5].value) != "[104,105]") {
        return Fail("Null and binary fields should render as text.");
    }

    if (JournalSource::ParseLine("not json") || JournalSource::ParseLine("[1,2]")) {
        return Fail("Malformed lines should be rejected.");
    }

    JournalSource source({
        "/bin/sh",
        "-c",
        "printf '%s\\n' '{\"MESSAGE\":\"first\",\"PRIORITY\":\"2\"}' 'garbage' '{\"MESSAGE\":\"second\",\"PRIORITY\":\"3\"}'"
    });
    if (!source.Open() || !source.IsOpen() || source.WaitFd() < 0) {
        return Fail("Reader process did not start.");
    }

    const std::vector<RawEvent> records = DrainSource(source);
    if (records.size() != 2) {
        return Fail("Expected two records, got " + std::to_string(records.size()));
    }
    if (FindField(records[0], "MESSAGE") != std::optional<std::string>("first")
        || FindField(records[1], "MESSAGE") != std::optional<std::string>("second")) {
        return Fail("Records must arrive in order with the bad line skipped.");
    }
    if (source.IsOpen() || source.WaitFd() != -1) {
        return Fail("Source should close once the reader exits.");
    }

    if (!source.Open()) {
        return Fail("A closed source should reopen.");
    }
    source.Close();

    JournalSource missing({"/nonexistent/journalctl"});
    if (!missing.Open()) {
        return Fail("Open only fails when the process cannot be forked.");
    }
    if (!DrainSource(missing).empty() || missing.IsOpen()) {
        return Fail("A reader that fails to exec closes with no records.");
    }

    return 0;
}
