#include "core/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace chunkdump {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        int result = std::stoi(*value, &used);
        if (used != value->size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (result < min_val || result > max_val) {
            spdlog::warn("{} value {} out of range [{}, {}], ignoring", name, result, min_val, max_val);
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

/// Get environment variable as boolean: 1/0, true/false, yes/no
std::optional<bool> get_env_bool(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    if (*value == "1" || *value == "true" || *value == "yes") {
        return true;
    }
    if (*value == "0" || *value == "false" || *value == "no") {
        return false;
    }
    spdlog::warn("Invalid boolean value for {}: {}, ignoring", name, *value);
    return std::nullopt;
}

bool is_log_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "warning" || level == "error" || level == "critical" || level == "off";
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Storage overrides
    if (auto v = get_env("CHUNKDUMP_OUTPUT_DIR")) {
        config.storage.output_dir = *v;
    }
    if (auto v = get_env("CHUNKDUMP_STATE_SUFFIX")) {
        if (!v->empty()) {
            config.storage.state_suffix = *v;
        }
    }
    if (auto v = get_env_bool("CHUNKDUMP_FLUSH_EACH_RECORD")) {
        config.storage.flush_each_record = *v;
    }

    // Replay overrides; port 0 lets the OS choose
    if (auto v = get_env("CHUNKDUMP_REPLAY_HOST")) {
        config.replay.host = *v;
    }
    if (auto v = get_env_int("CHUNKDUMP_REPLAY_PORT", 0, 65535)) {
        config.replay.port = static_cast<std::uint16_t>(*v);
    }

    if (auto v = get_env("CHUNKDUMP_LOG_LEVEL")) {
        if (is_log_level(*v)) {
            config.logging.level = *v;
        } else {
            spdlog::warn("Unknown log level in CHUNKDUMP_LOG_LEVEL: {}, ignoring", *v);
        }
    }
}

}  // namespace

Result<Config> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::Err(Error{ErrorCode::Io, "Failed to open config file: " + path});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config>::Err(Error{ErrorCode::Decode, "Failed to parse JSON: " + std::string(e.what())});
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        if (j.contains("storage")) {
            const auto& st = j["storage"];
            if (st.contains("output_dir")) {
                config.storage.output_dir = st["output_dir"].get<std::string>();
            }
            if (st.contains("state_suffix")) {
                config.storage.state_suffix = st["state_suffix"].get<std::string>();
            }
            if (st.contains("flush_each_record")) {
                config.storage.flush_each_record = st["flush_each_record"].get<bool>();
            }
        }

        if (j.contains("replay")) {
            const auto& rp = j["replay"];
            if (rp.contains("host")) {
                config.replay.host = rp["host"].get<std::string>();
            }
            if (rp.contains("port")) {
                config.replay.port = rp["port"].get<std::uint16_t>();
            }
        }

        if (j.contains("logging")) {
            const auto& lg = j["logging"];
            if (lg.contains("level")) {
                auto level = lg["level"].get<std::string>();
                if (!is_log_level(level)) {
                    return Result<Config>::Err(Error{ErrorCode::InvalidArgument, "Unknown log level: " + level});
                }
                config.logging.level = level;
            }
        }
    } catch (const json::exception& e) {
        return Result<Config>::Err(Error{ErrorCode::Decode, "Error reading config field: " + std::string(e.what())});
    }

    return Result<Config>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            spdlog::warn("Failed to load config from '{}': {} (using defaults with env overrides)",
                         *config_path, result.error().to_string());
        }
    }

    // Environment variables have the highest priority
    apply_env_overrides(config);

    return config;
}

std::string Config::log_path(const std::string& file_name) const {
    std::filesystem::path p(file_name);
    if (p.is_absolute() || storage.output_dir.empty()) {
        return p.string();
    }
    return (std::filesystem::path(storage.output_dir) / p).string();
}

}  // namespace chunkdump
