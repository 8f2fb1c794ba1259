#include "EventNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace {
LogProperty ToProperty(const RawField& field) {
    return LogProperty{ToLower(field.name), RenderValue(field.value)};
}
} // namespace

std::string RenderValue(const RawValue& value) {
    return std::visit([](const auto& item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return item;
        } else if constexpr (std::is_same_v<T, TimePoint>) {
            return FormatIsoTimestamp(item);
        } else if constexpr (std::is_same_v<T, bool>) {
            return item ? "true" : "false";
        } else {
            std::ostringstream out;
            out << item;
            return out.str();
        }
    }, value);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::optional<std::string> FindField(const RawEvent& raw, const std::string& name) {
    for (const auto& field : raw) {
        if (field.name == name) {
            return RenderValue(field.value);
        }
    }
    return std::nullopt;
}

LogEvent NormalizeRecord(const std::string& source, const RawEvent& raw) {
    LogEvent event;
    event.source = source;
    event.properties.reserve(raw.size());
    for (const auto& field : raw) {
        event.properties.push_back(ToProperty(field));
    }
    return event;
}

LogEvent NormalizeEventLogRecord(const RawEvent& raw, const std::string& message, const std::string& level) {
    const auto& members = EventLogMembers();

    LogEvent event;
    event.source = kEventLogSource;
    event.properties.push_back(LogProperty{"message", message});
    event.properties.push_back(LogProperty{"priority", level});
    for (const auto& field : raw) {
        if (std::find(members.begin(), members.end(), field.name) == members.end()) {
            continue;
        }
        event.properties.push_back(ToProperty(field));
    }
    return event;
}

const std::vector<std::string>& EventLogMembers() {
    static const std::vector<std::string> members = {
        "ClosingRecordNumber",
        "Data",
        "EventCategory",
        "EventID",
        "EventType",
        "RecordNumber",
        "Reserved",
        "ReservedFlags",
        "Sid",
        "SourceName",
        "TimeGenerated",
        "TimeWritten"
    };
    return members;
}
