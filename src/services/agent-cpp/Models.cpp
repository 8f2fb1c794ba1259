#include "Models.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
std::optional<std::string> OptionalString(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string StringOrEmpty(const nlohmann::json& item, const char* key) {
    return OptionalString(item, key).value_or("");
}
} // namespace

std::string FormatIsoTimestamp(TimePoint time) {
    const auto sinceEpoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(sinceEpoch - seconds).count();
    if (micros < 0) {
        seconds -= std::chrono::seconds(1);
        micros += 1000000;
    }

    const std::time_t raw = static_cast<std::time_t>(seconds.count());
    std::tm tm = {};
#ifdef _WIN32
    gmtime_s(&tm, &raw);
#else
    gmtime_r(&raw, &tm);
#endif

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros
        << "+00:00";
    return out.str();
}

std::string ToString(ServerCommandStatus status) {
    switch (status) {
    case ServerCommandStatus::REQUESTED:
        return "requested";
    case ServerCommandStatus::PENDING:
        return "pending";
    case ServerCommandStatus::COMPLETED:
        return "completed";
    case ServerCommandStatus::CANCELED:
        return "canceled";
    case ServerCommandStatus::REJECTED:
        return "rejected";
    }
    return "pending";
}

std::optional<ServerCommandStatus> ParseServerCommandStatus(const std::string& value) {
    if (value == "requested") {
        return ServerCommandStatus::REQUESTED;
    }
    if (value == "pending") {
        return ServerCommandStatus::PENDING;
    }
    if (value == "completed") {
        return ServerCommandStatus::COMPLETED;
    }
    if (value == "canceled") {
        return ServerCommandStatus::CANCELED;
    }
    if (value == "rejected") {
        return ServerCommandStatus::REJECTED;
    }
    return std::nullopt;
}

std::string Serialize(const nlohmann::json& body, int indent) {
    return body.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ToJson(const LogEvent& event) {
    nlohmann::json properties = nlohmann::json::array();
    for (const auto& property : event.properties) {
        properties.push_back({{"name", property.name}, {"value", property.value}});
    }

    return {
        {"event_date", FormatIsoTimestamp(event.eventDate)},
        {"source", event.source},
        {"properties", properties}
    };
}

nlohmann::json ToJson(const VitalsEvent& event) {
    return {{"vitals", event.vitals}};
}

nlohmann::json ToJson(const ServerCommandResult& result) {
    nlohmann::json json = {
        {"start_date", FormatIsoTimestamp(result.startDate)},
        {"end_date", FormatIsoTimestamp(result.endDate)},
        {"total_time", result.totalTime},
        {"exit_code", result.exitCode}
    };
    json["stdout"] = result.stdoutText ? nlohmann::json(*result.stdoutText) : nlohmann::json(nullptr);
    json["stderr"] = result.stderrText ? nlohmann::json(*result.stderrText) : nlohmann::json(nullptr);
    return json;
}

bool FromJson(const nlohmann::json& item, ServerCommand& outCommand, std::string& outError) {
    if (!item.is_object()) {
        outError = "command entry is not an object";
        return false;
    }

    ServerCommand command;
    command.id = StringOrEmpty(item, "id");
    command.command = StringOrEmpty(item, "command");
    if (command.id.empty()) {
        outError = "command entry missing id";
        return false;
    }
    if (command.command.empty()) {
        outError = "command " + command.id + " missing command text";
        return false;
    }

    const std::string status = StringOrEmpty(item, "status");
    const auto parsedStatus = ParseServerCommandStatus(status);
    if (!parsedStatus) {
        outError = "command " + command.id + " has unknown status '" + status + "'";
        return false;
    }

    command.status = *parsedStatus;
    command.createDate = StringOrEmpty(item, "create_date");
    command.channelId = StringOrEmpty(item, "channel_id");
    command.serverId = StringOrEmpty(item, "server_id");
    command.threadId = OptionalString(item, "thread_id");
    command.userId = StringOrEmpty(item, "user_id");
    command.channelName = StringOrEmpty(item, "channel_name");
    command.serverName = StringOrEmpty(item, "server_name");
    command.userName = StringOrEmpty(item, "user_name");
    command.query = StringOrEmpty(item, "query");
    command.notificationUrl = OptionalString(item, "notification_url");

    outCommand = std::move(command);
    return true;
}
