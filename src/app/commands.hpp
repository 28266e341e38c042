#pragma once

#include "app/streamer.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include <atomic>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkdump::app {

/// record: stream channels into a fresh log, then write the state file next to it
struct RecordOptions {
    std::string output;                 // log file name, resolved against storage.output_dir
    std::vector<ChannelId> channels;
};

/// @return Path of the written log
[[nodiscard]] Result<std::string> run_record(const Config& config,
                                             const RecordOptions& options,
                                             ConversationStreamer& streamer);

/// record state: index a log and print its state as indented JSON
[[nodiscard]] Status run_record_state(const std::string& log_path, std::ostream& out);

/// channels: print the plain channel ids of a log, one per line
[[nodiscard]] Status run_channels(const std::string& log_path, std::ostream& out);

/// replay: serve a log through the replay server until stop is set
[[nodiscard]] Status run_replay(const Config& config,
                                const std::string& log_path,
                                const std::atomic<bool>& stop);

}  // namespace chunkdump::app
