#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "slack/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chunkdump::chunk {

/// Kind of API response captured in a chunk.
/// Numeric values are the wire type tags and must stay stable.
enum class ChunkType : std::uint8_t {
    Messages = 0,
    ThreadMessages = 1,
    Files = 2,
    Users = 3,
    Channels = 4,
    ChannelInfo = 5,
    WorkspaceInfo = 6,
    ChannelUsers = 7,
    StarredItems = 8,
    Bookmarks = 9
};

[[nodiscard]] std::string_view chunk_type_name(ChunkType type) noexcept;

/// Parse a wire tag, nullopt for tags this build does not know
[[nodiscard]] std::optional<ChunkType> chunk_type_from_tag(int tag) noexcept;

// Group keys of the kinds that occur once per archive
inline constexpr std::string_view kUsersGroupId = "lusr";
inline constexpr std::string_view kChannelsGroupId = "lch";
inline constexpr std::string_view kStarredGroupId = "ls";
inline constexpr std::string_view kWorkspaceInfoGroupId = "iw";

[[nodiscard]] GroupId thread_group_id(std::string_view channel_id, std::string_view thread_ts);
[[nodiscard]] GroupId file_group_id(std::string_view channel_id, std::string_view parent_ts);
[[nodiscard]] GroupId channel_info_group_id(std::string_view channel_id);
[[nodiscard]] GroupId channel_users_group_id(std::string_view channel_id);
[[nodiscard]] GroupId bookmarks_group_id(std::string_view channel_id);

/// True for keys that address a plain channel's message stream
[[nodiscard]] bool is_channel_group_id(std::string_view id) noexcept;

/// One page of conversations.history
struct MessagesPayload {
    std::vector<slack::Message> messages;
    bool is_last = false;     // last page of the channel
    int num_threads = 0;      // threads discovered on this page

    friend bool operator==(const MessagesPayload&, const MessagesPayload&) = default;
};

/// One page of conversations.replies
struct ThreadMessagesPayload {
    slack::Message parent;
    std::vector<slack::Message> messages;
    bool is_last = false;

    friend bool operator==(const ThreadMessagesPayload&, const ThreadMessagesPayload&) = default;
};

/// Files attached to the parent message
struct FilesPayload {
    std::optional<slack::Channel> channel;
    slack::Message parent;
    std::vector<slack::File> files;

    friend bool operator==(const FilesPayload&, const FilesPayload&) = default;
};

struct UsersPayload {
    std::vector<slack::User> users;

    friend bool operator==(const UsersPayload&, const UsersPayload&) = default;
};

struct ChannelsPayload {
    std::vector<slack::Channel> channels;

    friend bool operator==(const ChannelsPayload&, const ChannelsPayload&) = default;
};

struct ChannelInfoPayload {
    slack::Channel channel;

    friend bool operator==(const ChannelInfoPayload&, const ChannelInfoPayload&) = default;
};

struct WorkspaceInfoPayload {
    slack::WorkspaceInfo info;

    friend bool operator==(const WorkspaceInfoPayload&, const WorkspaceInfoPayload&) = default;
};

struct ChannelUsersPayload {
    std::vector<std::string> user_ids;

    friend bool operator==(const ChannelUsersPayload&, const ChannelUsersPayload&) = default;
};

struct StarredItemsPayload {
    std::vector<slack::StarredItem> items;

    friend bool operator==(const StarredItemsPayload&, const StarredItemsPayload&) = default;
};

struct BookmarksPayload {
    std::vector<slack::Bookmark> bookmarks;

    friend bool operator==(const BookmarksPayload&, const BookmarksPayload&) = default;
};

/// Alternative order follows ChunkType, so index() == wire tag
using Payload = std::variant<
    MessagesPayload,
    ThreadMessagesPayload,
    FilesPayload,
    UsersPayload,
    ChannelsPayload,
    ChannelInfoPayload,
    WorkspaceInfoPayload,
    ChannelUsersPayload,
    StarredItemsPayload,
    BookmarksPayload
>;

/// A single recorded API response.
/// The header addresses the record, the payload carries the data.
struct Chunk {
    std::int64_t timestamp = 0;   // capture time, epoch microseconds
    ChannelId channel_id;
    int count = 0;                // messages or files in this chunk
    MessageTs thread_ts;
    Payload payload;

    [[nodiscard]] ChunkType type() const noexcept {
        return static_cast<ChunkType>(payload.index());
    }

    /// Group key this chunk queues under.
    /// Err(UnsupportedAddress) when the addressing fields are missing.
    [[nodiscard]] Result<GroupId> group_id() const;

    /// Timestamps of the messages of a Messages or ThreadMessages chunk
    [[nodiscard]] Result<std::vector<MessageTs>> message_timestamps() const;

    /// "<Type>: <group id>" for log lines
    [[nodiscard]] std::string describe() const;

    /// Typed payload access, nullptr when the chunk is of another kind
    template <typename P>
    [[nodiscard]] const P* as() const noexcept {
        return std::get_if<P>(&payload);
    }

    friend bool operator==(const Chunk&, const Chunk&) = default;
};

}  // namespace chunkdump::chunk
