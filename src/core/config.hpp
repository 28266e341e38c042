#pragma once

#include "core/status.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chunkdump {

/// Immutable configuration for chunkdump
struct Config {
    /// Chunk log storage
    struct Storage {
        std::string output_dir = ".";
        std::string state_suffix = ".state";
        bool flush_each_record = true;
    };

    /// Replay server
    struct Replay {
        std::string host = "127.0.0.1";
        std::uint16_t port = 8089;  // 0 = any free port
    };

    struct Logging {
        std::string level = "info";  // spdlog level name
    };

    Storage storage;
    Replay replay;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error on failure
    [[nodiscard]] static Result<Config> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Resolve a log file name against storage.output_dir (absolute names are kept)
    [[nodiscard]] std::string log_path(const std::string& file_name) const;

    /// State file path for a log
    [[nodiscard]] std::string state_path(const std::string& log_path) const {
        return log_path + storage.state_suffix;
    }
};

}  // namespace chunkdump
