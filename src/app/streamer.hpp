#pragma once

#include "chunk/player.hpp"
#include "chunk/recorder.hpp"
#include "core/status.hpp"
#include "core/types.hpp"

namespace chunkdump::app {

/// Source of conversation data for the record command.
/// The live API session implements this outside the core; it hands every
/// response page to the recorder as it arrives.
class ConversationStreamer {
public:
    virtual ~ConversationStreamer() = default;

    /// Record every chunk of one conversation, in capture order
    [[nodiscard]] virtual Status stream(const ChannelId& channel_id, chunk::ChunkRecorder& recorder) = 0;
};

/// Streams conversations out of an existing chunk log, keeping record order
/// and capture stamps. Used to cut channels out of a larger archive.
class ArchiveStreamer : public ConversationStreamer {
public:
    /// @param source Player over the source log, must outlive the streamer
    explicit ArchiveStreamer(chunk::Player& source);

    /// Err(NotFound) when the source has no record for the channel
    [[nodiscard]] Status stream(const ChannelId& channel_id, chunk::ChunkRecorder& recorder) override;

private:
    chunk::Player& source_;
};

}  // namespace chunkdump::app
