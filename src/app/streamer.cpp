#include "app/streamer.hpp"
#include <spdlog/spdlog.h>

namespace chunkdump::app {

ArchiveStreamer::ArchiveStreamer(chunk::Player& source)
    : source_(source)
{}

Status ArchiveStreamer::stream(const ChannelId& channel_id, chunk::ChunkRecorder& recorder) {
    std::size_t copied = 0;
    auto scanned = source_.for_each([&](const chunk::Chunk& c) {
        if (c.channel_id != channel_id) {
            return ok_status();
        }
        ++copied;
        return recorder.record(c);
    });
    if (scanned.is_err()) {
        return scanned;
    }
    if (copied == 0) {
        return error_status(ErrorCode::NotFound, "no records for channel " + channel_id);
    }
    spdlog::info("Streamed {} chunks of channel {}", copied, channel_id);
    return ok_status();
}

}  // namespace chunkdump::app
