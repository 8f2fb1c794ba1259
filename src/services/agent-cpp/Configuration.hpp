#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Settings tree with dotted-key lookup ("delivery.max_attempts").
// Every getter returns std::nullopt when the key is absent.
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(nlohmann::json data);

    bool LoadFile(const std::string& path, std::string& outError);
    bool LoadString(const std::string& text, std::string& outError);

    bool Has(const std::string& key) const;
    std::optional<nlohmann::json> Get(const std::string& key) const;

    // Throw ConfigError when the key exists but cannot be converted.
    std::optional<bool> GetBool(const std::string& key) const;
    std::optional<long long> GetInt(const std::string& key) const;
    std::optional<double> GetFloat(const std::string& key) const;
    std::optional<std::string> GetString(const std::string& key) const;

    bool BoolOr(const std::string& key, bool fallback) const;
    long long IntOr(const std::string& key, long long fallback) const;
    std::string StringOr(const std::string& key, const std::string& fallback) const;

    // Like IntOr, but a stored value below minimum is a ConfigError.
    long long IntAtLeast(const std::string& key, long long fallback, long long minimum) const;

private:
    const nlohmann::json* Find(const std::string& key) const;

    nlohmann::json data_ = nlohmann::json::object();
};
