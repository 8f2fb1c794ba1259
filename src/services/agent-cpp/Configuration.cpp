#include "Configuration.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
std::string Lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}
} // namespace

Configuration::Configuration(nlohmann::json data)
    : data_(std::move(data)) {}

bool Configuration::LoadFile(const std::string& path, std::string& outError) {
    std::ifstream input(path);
    if (!input) {
        outError = "unable to open " + path;
        return false;
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (!LoadString(buffer.str(), outError)) {
        outError = path + ": " + outError;
        return false;
    }
    return true;
}

bool Configuration::LoadString(const std::string& text, std::string& outError) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        outError = "settings are not valid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        outError = "settings root must be an object";
        return false;
    }

    data_ = std::move(parsed);
    return true;
}

bool Configuration::Has(const std::string& key) const {
    return Find(key) != nullptr;
}

std::optional<nlohmann::json> Configuration::Get(const std::string& key) const {
    const nlohmann::json* node = Find(key);
    if (node == nullptr) {
        return std::nullopt;
    }
    return *node;
}

std::optional<bool> Configuration::GetBool(const std::string& key) const {
    const nlohmann::json* node = Find(key);
    if (node == nullptr) {
        return std::nullopt;
    }

    if (node->is_boolean()) {
        return node->get<bool>();
    }
    if (node->is_number_integer()) {
        return node->get<long long>() == 1;
    }
    if (node->is_string()) {
        const std::string value = Lowercase(node->get<std::string>());
        return value == "true" || value == "1";
    }

    throw ConfigError("The value for key \"" + key + "\" is not a boolean value.");
}

std::optional<long long> Configuration::GetInt(const std::string& key) const {
    const nlohmann::json* node = Find(key);
    if (node == nullptr) {
        return std::nullopt;
    }

    if (node->is_number()) {
        return node->get<long long>();
    }
    if (node->is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = node->get<std::string>();
            const long long value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::exception&) {
            throw ConfigError("The value for key \"" + key + "\" is not an integer value.");
        }
    }

    throw ConfigError("The value for key \"" + key + "\" is not an integer value.");
}

std::optional<double> Configuration::GetFloat(const std::string& key) const {
    const nlohmann::json* node = Find(key);
    if (node == nullptr) {
        return std::nullopt;
    }

    if (node->is_number()) {
        return node->get<double>();
    }
    if (node->is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = node->get<std::string>();
            const double value = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::exception&) {
            throw ConfigError("The value for key \"" + key + "\" is not a float value.");
        }
    }

    throw ConfigError("The value for key \"" + key + "\" is not a float value.");
}

std::optional<std::string> Configuration::GetString(const std::string& key) const {
    const nlohmann::json* node = Find(key);
    if (node == nullptr) {
        return std::nullopt;
    }

    if (node->is_string()) {
        return node->get<std::string>();
    }
    return node->dump();
}

bool Configuration::BoolOr(const std::string& key, bool fallback) const {
    return GetBool(key).value_or(fallback);
}

long long Configuration::IntOr(const std::string& key, long long fallback) const {
    return GetInt(key).value_or(fallback);
}

std::string Configuration::StringOr(const std::string& key, const std::string& fallback) const {
    return GetString(key).value_or(fallback);
}

long long Configuration::IntAtLeast(const std::string& key, long long fallback, long long minimum) const {
    const long long value = IntOr(key, fallback);
    if (value < minimum) {
        throw ConfigError("The value for key \"" + key + "\" must be at least " + std::to_string(minimum) + ".");
    }
    return value;
}

const nlohmann::json* Configuration::Find(const std::string& key) const {
    if (key.empty()) {
        return nullptr;
    }

    const nlohmann::json* node = &data_;
    std::istringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}
