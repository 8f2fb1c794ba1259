#pragma once

#include "Models.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using RawValue = std::variant<std::string, std::int64_t, double, bool, TimePoint>;

struct RawField {
    std::string name;
    RawValue value;
};

// Fields in the order the source produced them.
using RawEvent = std::vector<RawField>;

constexpr const char* kJournalSource = "journald";
constexpr const char* kEventLogSource = "eventlog";

std::string RenderValue(const RawValue& value);
std::string ToLower(std::string value);

// Rendered value of the first field called name (exact match), if any.
std::optional<std::string> FindField(const RawEvent& raw, const std::string& name);

// Every field, lower-cased name, encounter order.
LogEvent NormalizeRecord(const std::string& source, const RawEvent& raw);

// Windows event-log records only carry the well-known members listed by
// EventLogMembers(); message and priority lead the property list.
LogEvent NormalizeEventLogRecord(const RawEvent& raw, const std::string& message, const std::string& level);
const std::vector<std::string>& EventLogMembers();
