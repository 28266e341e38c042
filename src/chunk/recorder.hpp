#pragma once

#include "chunk/chunk.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "state/state.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkdump::chunk {

/// Appends chunks to a log, one complete record per call.
/// Thread-safe; records keep the order in which calls acquire the lock.
class ChunkRecorder {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Record into a stream owned by the caller
    /// @param out Destination, must outlive the recorder
    /// @param name Label for the state ledger (base name of the log)
    explicit ChunkRecorder(std::ostream& out, std::string name = "");

    /// Create (truncate) a log file and record into it
    [[nodiscard]] static Result<std::unique_ptr<ChunkRecorder>> create(const std::filesystem::path& path);

    /// Used by create(); the recorder owns the file
    ChunkRecorder(PrivateTag, std::unique_ptr<std::ofstream> file, std::filesystem::path path);

    ~ChunkRecorder();

    // Non-copyable, non-movable
    ChunkRecorder(const ChunkRecorder&) = delete;
    ChunkRecorder& operator=(const ChunkRecorder&) = delete;

    /// Append one chunk.
    /// The record is encoded in full before the single write; after a
    /// failed write every further call fails with Io.
    [[nodiscard]] Status record(const Chunk& chunk);

    /// Flush after every record (default true)
    void set_flush_each_record(bool flush) noexcept { flush_each_record_ = flush; }

    // Typed helpers: build the chunk, stamp capture time and count, record.

    [[nodiscard]] Status messages(const ChannelId& channel_id,
                                  std::vector<slack::Message> messages,
                                  bool is_last, int num_threads = 0);
    [[nodiscard]] Status thread_messages(const ChannelId& channel_id,
                                         slack::Message parent,
                                         std::vector<slack::Message> replies,
                                         bool is_last);
    [[nodiscard]] Status files(const ChannelId& channel_id,
                               slack::Message parent,
                               std::vector<slack::File> files,
                               std::optional<slack::Channel> channel = std::nullopt);
    [[nodiscard]] Status users(std::vector<slack::User> users);
    [[nodiscard]] Status channels(std::vector<slack::Channel> channels);
    [[nodiscard]] Status channel_info(slack::Channel channel);
    [[nodiscard]] Status channel_users(const ChannelId& channel_id, std::vector<std::string> user_ids);
    [[nodiscard]] Status workspace_info(slack::WorkspaceInfo info);
    [[nodiscard]] Status starred_items(std::vector<slack::StarredItem> items);
    [[nodiscard]] Status bookmarks(const ChannelId& channel_id, std::vector<slack::Bookmark> bookmarks);

    /// Flush and, for owned files, close. Idempotent.
    [[nodiscard]] Status close();

    /// Ledger of everything recorded so far
    [[nodiscard]] state::State state() const;

    /// Records successfully written
    [[nodiscard]] std::size_t record_count() const;

private:
    [[nodiscard]] Status stamp_and_record(Chunk chunk);

    std::unique_ptr<std::ofstream> file_;   // set when the recorder owns the log
    std::filesystem::path path_;
    std::ostream& out_;
    bool flush_each_record_{true};

    mutable std::mutex mutex_;
    bool closed_{false};
    bool failed_{false};
    std::size_t records_{0};
    state::State state_;
};

}  // namespace chunkdump::chunk
