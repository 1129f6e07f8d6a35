#pragma once

/// @file config.h
/// @brief Plotwise configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "common/logging.h"

namespace plotwise {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<bool, int64_t, double, std::string>;

/// @brief YAML-backed configuration with dot-notation access
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the recognised PLOTWISE_* environment variables
    static Config LoadFromEnvironment(std::string_view prefix = "PLOTWISE_");

    /// @brief Deep-merge another configuration into this one (other wins)
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (dot notation, e.g. "history.max_undo_levels")
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;

    /// @brief Scalar at `key` converted to T; default when absent or unconvertible
    template <typename T>
    T GetScalar(std::string_view key, T default_value) const;
};

/// @brief Typed application settings resolved from a Config
struct Settings {
    size_t max_undo_levels = 10;

    LogLevel log_level = LogLevel::kInfo;
    std::optional<std::string> log_file;

    std::string default_project_name = "Untitled Project";

    /// LOWESS fraction used when an analysis request does not carry one
    double lowess_fraction = 0.2;

    /// Rolling window used when LOWESS falls back to a rolling mean
    int rolling_window = 5;
};

/// @brief Resolve typed settings, rejecting out-of-range values
absl::StatusOr<Settings> LoadSettings(const Config& config);

/// @brief Build the logging configuration matching the settings
LogConfig MakeLogConfig(const Settings& settings);

/// @brief Global configuration instance
Config& GlobalConfig();

/// @brief Initialize global configuration from file and environment
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "PLOTWISE_"
);

}  // namespace plotwise
