#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/errors.hpp"

namespace lrunbox::config {
namespace {

using options::Json;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        const auto parsed = std::stoll(value);
        return parsed < 0 ? fallback : static_cast<std::size_t>(parsed);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

void ApplyLrunConfig(LrunConfig& target, const Json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("binary") && source["binary"].is_string()) {
        target.binary = source["binary"].get<std::string>();
    }
    if (source.contains("path") && source["path"].is_string()) {
        target.path = source["path"].get<std::string>();
    }
    if (source.contains("truncate") && source["truncate"].is_number_unsigned()) {
        target.truncate = source["truncate"].get<std::size_t>();
    }
    if (source.contains("tempDir") && source["tempDir"].is_string()) {
        target.temp_dir = source["tempDir"].get<std::string>();
    }
    if (source.contains("exactExceedMatch") && source["exactExceedMatch"].is_boolean()) {
        target.exact_exceed_match = source["exactExceedMatch"].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const Json& data) {
    if (!data.is_object()) {
        utils::Log(utils::LogLevel::kWarn, "config", "top level value is not an object; ignored");
        return;
    }

    if (data.contains("lrun")) {
        ApplyLrunConfig(config.lrun, data["lrun"]);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.min_level = utils::ParseLogLevel(
                logging["level"].get<std::string>(),
                config.logging.min_level);
        }
    }

    if (data.contains("defaults")) {
        try {
            config.defaults = options::Merge(config.defaults, data["defaults"]);
        } catch (const utils::TypeMismatch& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", std::string("defaults ignored: ") + ex.what());
        }
    }
}

void ApplyEnvironment(Config& config) {
    const auto binary = GetEnvFallback("LRUNBOX_LRUN__BINARY", "LRUNBOX_LRUN_BINARY");
    if (!binary.empty()) {
        config.lrun.binary = binary;
    }

    const auto path = GetEnvFallback("LRUNBOX_LRUN__PATH", "LRUNBOX_LRUN_PATH");
    if (!path.empty()) {
        config.lrun.path = path;
    }

    const auto truncate = GetEnvFallback("LRUNBOX_LRUN__TRUNCATE", "LRUNBOX_LRUN_TRUNCATE");
    if (!truncate.empty()) {
        config.lrun.truncate = ParseSize(truncate, config.lrun.truncate);
    }

    const auto temp_dir = GetEnvFallback("LRUNBOX_LRUN__TEMP_DIR", "LRUNBOX_LRUN_TEMP_DIR");
    if (!temp_dir.empty()) {
        config.lrun.temp_dir = temp_dir;
    }

    const auto exact_match = GetEnvFallback(
        "LRUNBOX_LRUN__EXACT_EXCEED_MATCH",
        "LRUNBOX_LRUN_EXACT_EXCEED_MATCH");
    if (!exact_match.empty()) {
        config.lrun.exact_exceed_match = ParseBool(exact_match);
    }

    const auto log_level = GetEnv("LRUNBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.min_level = utils::ParseLogLevel(log_level, config.logging.min_level);
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".lrunbox" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        try {
            Json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "failed to parse " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvironment(config);
    return config;
}

}  // namespace lrunbox::config
