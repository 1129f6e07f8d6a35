#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace plotwise {

namespace {

Config g_global_config;

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(prefix, suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("MAX_UNDO_LEVELS")) {
        int64_t levels = 0;
        if (absl::SimpleAtoi(*val, &levels)) {
            config.Set("history.max_undo_levels", levels);
        } else {
            PLOTWISE_LOG_WARN("Ignoring non-integer {}MAX_UNDO_LEVELS='{}'", prefix, *val);
        }
    }
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = get_env("LOG_FILE")) {
        config.Set("logging.file", *val);
    }
    if (auto val = get_env("PROJECT_NAME")) {
        config.Set("project.default_name", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current = YAML::Clone(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        current = current[part];
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

template <typename T>
T Config::GetScalar(std::string_view key, T default_value) const {
    auto node = GetNestedNode(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    try {
        return node->as<T>();
    } catch (const YAML::BadConversion&) {
        PLOTWISE_LOG_WARN("Config key '{}' has unusable value '{}', using default", key,
                          node->Scalar());
        return default_value;
    }
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    return GetScalar<std::string>(key, std::string(default_value));
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    return GetScalar<int64_t>(key, default_value);
}

double Config::GetDouble(std::string_view key, double default_value) const {
    return GetScalar<double>(key, default_value);
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    return GetScalar<bool>(key, default_value);
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // yaml-cpp nodes are handles; walking with copies keeps writes attached to root_
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current = current[parts[i]];
    }

    std::visit([&](const auto& val) { current[parts.back()] = val; }, value);
}

absl::StatusOr<Settings> LoadSettings(const Config& config) {
    Settings settings;

    const int64_t levels = config.GetInt("history.max_undo_levels",
                                         static_cast<int64_t>(settings.max_undo_levels));
    if (levels < 1) {
        return absl::InvalidArgumentError(
            absl::StrCat("history.max_undo_levels must be >= 1, got ", levels));
    }
    settings.max_undo_levels = static_cast<size_t>(levels);

    const std::string level_name = config.GetString("logging.level", "info");
    auto level = ParseLogLevel(level_name);
    if (!level) {
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown logging.level: ", level_name));
    }
    settings.log_level = *level;

    if (config.HasKey("logging.file")) {
        settings.log_file = config.GetString("logging.file");
    }

    settings.default_project_name =
        config.GetString("project.default_name", settings.default_project_name);

    settings.lowess_fraction =
        config.GetDouble("analysis.lowess_fraction", settings.lowess_fraction);
    if (settings.lowess_fraction <= 0.0 || settings.lowess_fraction > 1.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("analysis.lowess_fraction must be in (0, 1], got ",
                         settings.lowess_fraction));
    }

    settings.rolling_window = static_cast<int>(
        config.GetInt("analysis.rolling_window", settings.rolling_window));
    if (settings.rolling_window < 1) {
        return absl::InvalidArgumentError(
            absl::StrCat("analysis.rolling_window must be >= 1, got ",
                         settings.rolling_window));
    }

    return settings;
}

LogConfig MakeLogConfig(const Settings& settings) {
    LogConfig log_config;
    log_config.level = settings.log_level;
    log_config.file_path = settings.log_file;
    return log_config;
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    g_global_config = Config();

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        g_global_config.Merge(*file_config);
    }

    // Environment overrides the file
    Config env_config = Config::LoadFromEnvironment(env_prefix);
    g_global_config.Merge(env_config);

    return absl::OkStatus();
}

}  // namespace plotwise
