#include "Models.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

TimePoint FromMicros(long long micros) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros)));
}
} // namespace

int main() {
    const std::string stamp = FormatIsoTimestamp(FromMicros(1709288130000123LL));
    if (stamp != "2024-03-01T10:15:30.000123+00:00") {
        return Fail("Unexpected timestamp: " + stamp);
    }
    if (FormatIsoTimestamp(FromMicros(0)) != "1970-01-01T00:00:00.000000+00:00") {
        return Fail("Epoch should render with zero microseconds.");
    }

    LogEvent event;
    event.eventDate = FromMicros(1709288130000123LL);
    event.source = "journald";
    event.properties = {{"message", "disk full"}, {"priority", "3"}};
    const nlohmann::json eventJson = ToJson(event);
    if (eventJson["event_date"] != stamp || eventJson["source"] != "journald") {
        return Fail("Unexpected log event header: " + eventJson.dump());
    }
    if (eventJson["properties"].size() != 2
        || eventJson["properties"][0]["name"] != "message"
        || eventJson["properties"][1]["value"] != "3") {
        return Fail("Properties must keep their order: " + eventJson.dump());
    }

    VitalsEvent vitals;
    vitals.vitals = "{\n    \"boot_time\": {}\n}";
    if (ToJson(vitals).dump() != R"({"vitals":"{\n    \"boot_time\": {}\n}"})") {
        return Fail("Vitals must be carried as a string.");
    }

    const nlohmann::json item = {
        {"id", "9f1c"},
        {"create_date", "2024-03-01T10:15:30+00:00"},
        {"channel_id", "c1"},
        {"server_id", "s1"},
        {"thread_id", nullptr},
        {"user_id", "u1"},
        {"channel_name", "ops"},
        {"server_name", "lab"},
        {"user_name", "operator"},
        {"query", "uptime please"},
        {"command", "uptime"},
        {"status", "pending"},
        {"notification_url", "https://hooks.example/1"}
    };
    ServerCommand command;
    std::string error;
    if (!FromJson(item, command, error)) {
        return Fail("Valid command rejected: " + error);
    }
    if (command.id != "9f1c" || command.command != "uptime" || command.status != ServerCommandStatus::PENDING) {
        return Fail("Command fields not decoded.");
    }
    if (command.threadId || !command.notificationUrl || *command.notificationUrl != "https://hooks.example/1") {
        return Fail("Optional fields not decoded.");
    }

    nlohmann::json unknownStatus = item;
    unknownStatus["status"] = "paused";
    if (FromJson(unknownStatus, command, error) || error.find("paused") == std::string::npos) {
        return Fail("Unknown status should be rejected.");
    }

    nlohmann::json noCommand = item;
    noCommand.erase("command");
    if (FromJson(noCommand, command, error)) {
        return Fail("Missing command text should be rejected.");
    }

    for (const auto status : {ServerCommandStatus::REQUESTED, ServerCommandStatus::PENDING, ServerCommandStatus::COMPLETED,
             ServerCommandStatus::CANCELED, ServerCommandStatus::REJECTED}) {
        if (ParseServerCommandStatus(ToString(status)) != status) {
            return Fail("Status did not survive its string form: " + ToString(status));
        }
    }

    ServerCommandResult result;
    result.startDate = FromMicros(1000000);
    result.endDate = FromMicros(3500000);
    result.totalTime = 2.5;
    result.exitCode = 1;
    result.stdoutText = "";
    result.stderrText = "failed";
    const nlohmann::json resultJson = ToJson(result);
    if (resultJson["start_date"] != "1970-01-01T00:00:01.000000+00:00"
        || resultJson["total_time"] != 2.5
        || resultJson["exit_code"] != 1
        || resultJson["stdout"] != ""
        || resultJson["stderr"] != "failed") {
        return Fail("Unexpected result encoding: " + resultJson.dump());
    }

    return 0;
}
