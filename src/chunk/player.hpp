#pragma once

#include "chunk/chunk.hpp"
#include "chunk/index.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "state/state.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkdump::chunk {

/// Indexed random access over one chunk log.
///
/// Every group key has its own cursor: next(id) returns the records of
/// that key one by one in file order. The stream position is shared by
/// all keys, so seek and decode run as one step under the exclusive lock.
class Player {
    // Restricts construction to the factories while allowing make_unique
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using ChunkHandler = std::function<Status(const Chunk&)>;

    /// Open and index a log file; the player is named after the file
    [[nodiscard]] static Result<std::unique_ptr<Player>> open(const std::filesystem::path& path);

    /// Index a seekable stream
    /// @param in Stream positioned at the start of the log
    /// @param name Label for derived state, empty when the stream has no name
    [[nodiscard]] static Result<std::unique_ptr<Player>> from_stream(std::unique_ptr<std::istream> in,
                                                                     std::string name = "");

    Player(PrivateTag, std::unique_ptr<std::istream> in, Index index, std::string name);

    // Non-copyable, non-movable
    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    /// Next unread record of a key.
    /// Err(NotFound) if the key is not in the log, Err(Exhausted) once all
    /// of its records were read.
    [[nodiscard]] Result<Chunk> next(const GroupId& id);

    /// True while the key has unread records (or was never read)
    [[nodiscard]] bool has_more(const GroupId& id) const;

    /// Offset of the record returned by the last successful next()
    [[nodiscard]] Offset offset() const;

    // Typed accessors, each returns the next record of its key

    [[nodiscard]] Result<std::vector<slack::Message>> messages(const ChannelId& channel_id);
    [[nodiscard]] Result<std::vector<slack::Message>> thread(const ChannelId& channel_id,
                                                             const MessageTs& thread_ts);
    [[nodiscard]] Result<std::vector<slack::File>> files(const ChannelId& channel_id,
                                                         const MessageTs& parent_ts);
    [[nodiscard]] Result<std::vector<slack::User>> users();
    [[nodiscard]] Result<std::vector<slack::Channel>> channels();
    [[nodiscard]] Result<slack::Channel> channel_info(const ChannelId& channel_id);
    [[nodiscard]] Result<std::vector<std::string>> channel_users(const ChannelId& channel_id);
    [[nodiscard]] Result<slack::WorkspaceInfo> workspace_info();
    [[nodiscard]] Result<std::vector<slack::StarredItem>> starred_items();
    [[nodiscard]] Result<std::vector<slack::Bookmark>> bookmarks(const ChannelId& channel_id);

    [[nodiscard]] bool has_more_messages(const ChannelId& channel_id) const;
    [[nodiscard]] bool has_more_threads(const ChannelId& channel_id, const MessageTs& thread_ts) const;
    [[nodiscard]] bool has_more_channels() const;
    [[nodiscard]] bool has_users() const;
    [[nodiscard]] bool has_channels() const;

    // Drain accessors: reset the cursors, then concatenate every record of
    // the key in file order. A key absent from the log yields Err(NotFound).

    [[nodiscard]] Result<std::vector<slack::Message>> all_messages(const ChannelId& channel_id);
    [[nodiscard]] Result<std::vector<slack::Message>> all_thread_messages(const ChannelId& channel_id,
                                                                          const MessageTs& thread_ts);
    [[nodiscard]] Result<std::vector<slack::File>> all_files(const ChannelId& channel_id,
                                                             const MessageTs& parent_ts);
    [[nodiscard]] Result<std::vector<slack::User>> all_users();
    [[nodiscard]] Result<std::vector<slack::Channel>> all_channels();
    [[nodiscard]] Result<std::vector<std::string>> all_channel_users(const ChannelId& channel_id);
    [[nodiscard]] Result<std::vector<slack::Bookmark>> all_bookmarks(const ChannelId& channel_id);

    /// Visit every record of the log in file order, starting at offset 0.
    /// Resets all cursors; the stream is back at the start afterwards.
    /// Stops at the first error returned by fn.
    [[nodiscard]] Status for_each(const ChunkHandler& fn);

    /// Forget all cursors and rewind the stream. The index is kept.
    [[nodiscard]] Status reset();

    /// Keys of plain channel message streams, sorted
    [[nodiscard]] std::vector<ChannelId> channel_ids() const;

    /// Build the state ledger with a full scan (resets cursors)
    [[nodiscard]] Result<state::State> state();

    /// Label of the source, empty when unnamed
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const Index& index() const noexcept { return index_; }

private:
    // Callers hold mutex_ exclusively
    [[nodiscard]] Result<Chunk> next_locked(const GroupId& id);
    [[nodiscard]] Result<Chunk> read_at(Offset offset);
    [[nodiscard]] Status rewind_locked();

    /// next() narrowed to the payload kind the key is expected to hold
    template <typename P>
    [[nodiscard]] Result<P> next_payload(const GroupId& id);

    template <typename P, typename T>
    [[nodiscard]] Result<std::vector<T>> drain(const GroupId& id, std::vector<T> P::*field);

    std::unique_ptr<std::istream> in_;
    const Index index_;
    const std::string name_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<GroupId, std::size_t> cursors_;   // absent key = position 0
    std::atomic<Offset> last_offset_{0};
};

}  // namespace chunkdump::chunk
