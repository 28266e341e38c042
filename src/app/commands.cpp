#include "app/commands.hpp"
#include "chunk/player.hpp"
#include "chunk/recorder.hpp"
#include "replay/api_emulator.hpp"
#include "replay/replay_server.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace chunkdump::app {

Result<std::string> run_record(const Config& config,
                               const RecordOptions& options,
                               ConversationStreamer& streamer) {
    if (options.channels.empty()) {
        return Result<std::string>::Err(Error{ErrorCode::InvalidArgument, "missing channel argument"});
    }
    if (options.output.empty()) {
        return Result<std::string>::Err(Error{ErrorCode::InvalidArgument, "missing output file"});
    }

    const auto log_path = config.log_path(options.output);
    auto created = chunk::ChunkRecorder::create(log_path);
    if (created.is_err()) {
        return Result<std::string>::Err(created.error());
    }
    auto recorder = std::move(created).take_value();
    recorder->set_flush_each_record(config.storage.flush_each_record);

    for (const auto& channel : options.channels) {
        spdlog::info("Streaming channel {}", channel);
        auto streamed = streamer.stream(channel, *recorder);
        if (streamed.is_err()) {
            auto closed = recorder->close();
            if (closed.is_err()) {
                spdlog::error("Error closing recorder: {}", closed.error().to_string());
            }
            return Result<std::string>::Err(Error{
                streamed.error().code,
                "error streaming channel " + channel + ": " + streamed.error().message
            });
        }
    }

    auto closed = recorder->close();
    if (closed.is_err()) {
        return Result<std::string>::Err(closed.error());
    }

    const auto state_path = config.state_path(log_path);
    auto saved = recorder->state().save(state_path);
    if (saved.is_err()) {
        return Result<std::string>::Err(saved.error());
    }

    spdlog::info("Recorded {} chunks to {}, state in {}", recorder->record_count(), log_path, state_path);
    return Result<std::string>::Ok(log_path);
}

Status run_record_state(const std::string& log_path, std::ostream& out) {
    auto opened = chunk::Player::open(log_path);
    if (opened.is_err()) {
        return Status::Err(opened.error());
    }
    auto player = std::move(opened).take_value();

    auto state = player->state();
    if (state.is_err()) {
        return Status::Err(state.error());
    }
    out << state.value().to_json().dump(2) << '\n';
    return ok_status();
}

Status run_channels(const std::string& log_path, std::ostream& out) {
    auto opened = chunk::Player::open(log_path);
    if (opened.is_err()) {
        return Status::Err(opened.error());
    }
    for (const auto& id : opened.value()->channel_ids()) {
        out << id << '\n';
    }
    return ok_status();
}

Status run_replay(const Config& config, const std::string& log_path, const std::atomic<bool>& stop) {
    auto opened = chunk::Player::open(log_path);
    if (opened.is_err()) {
        return Status::Err(opened.error());
    }
    auto player = std::move(opened).take_value();
    spdlog::info("Loaded {}: {} records in {} groups",
                 log_path, player->index().record_count(), player->index().size());

    replay::ApiEmulator emulator(*player);
    replay::ReplayServer server(emulator, config.replay.host, config.replay.port);
    try {
        server.start();
    } catch (const std::exception& e) {
        return error_status(ErrorCode::Io, std::string("failed to start replay server: ") + e.what());
    }

    while (!stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server.stop();
    return ok_status();
}

}  // namespace chunkdump::app
