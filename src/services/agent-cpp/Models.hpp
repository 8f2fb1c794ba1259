#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

struct LogProperty {
    std::string name;
    std::string value;
};

struct LogEvent {
    TimePoint eventDate = std::chrono::system_clock::now();
    std::string source;
    std::vector<LogProperty> properties;
};

struct VitalsEvent {
    std::string vitals;
};

enum class ServerCommandStatus {
    REQUESTED,
    PENDING,
    COMPLETED,
    CANCELED,
    REJECTED
};

struct ServerCommand {
    std::string id;
    std::string createDate;
    std::string channelId;
    std::string serverId;
    std::optional<std::string> threadId;
    std::string userId;
    std::string channelName;
    std::string serverName;
    std::string userName;
    std::string query;
    std::string command;
    ServerCommandStatus status = ServerCommandStatus::PENDING;
    std::optional<std::string> notificationUrl;
};

struct ServerCommandResult {
    TimePoint startDate;
    TimePoint endDate;
    double totalTime = 0.0;
    int exitCode = 0;
    std::optional<std::string> stdoutText;
    std::optional<std::string> stderrText;
};

// ISO-8601 in UTC with microseconds, e.g. 2024-03-01T10:15:30.000123+00:00.
std::string FormatIsoTimestamp(TimePoint time);

std::string ToString(ServerCommandStatus status);
std::optional<ServerCommandStatus> ParseServerCommandStatus(const std::string& value);

// Serializes a payload, replacing invalid UTF-8 bytes with U+FFFD instead of throwing.
std::string Serialize(const nlohmann::json& body, int indent = -1);

nlohmann::json ToJson(const LogEvent& event);
nlohmann::json ToJson(const VitalsEvent& event);
nlohmann::json ToJson(const ServerCommandResult& result);

// Returns false when a required member is missing or the status is unknown.
bool FromJson(const nlohmann::json& item, ServerCommand& outCommand, std::string& outError);
