#include "chunk/chunk.hpp"
#include <type_traits>

namespace chunkdump::chunk {

namespace {

constexpr std::string_view kThreadPrefix = "t";
constexpr std::string_view kFilePrefix = "f";
constexpr std::string_view kChannelInfoPrefix = "ic";
constexpr std::string_view kChannelUsersPrefix = "lcu";
constexpr std::string_view kBookmarksPrefix = "lb";

GroupId join_id(std::string_view prefix, std::string_view a) {
    GroupId id;
    id.reserve(prefix.size() + 1 + a.size());
    id.append(prefix).append(":").append(a);
    return id;
}

GroupId join_id(std::string_view prefix, std::string_view a, std::string_view b) {
    GroupId id = join_id(prefix, a);
    id.append(":").append(b);
    return id;
}

Result<GroupId> unaddressable(const Chunk& c, std::string_view what) {
    return Result<GroupId>::Err(Error{
        ErrorCode::UnsupportedAddress,
        std::string(chunk_type_name(c.type())) + " chunk without " + std::string(what)
    });
}

}  // namespace

std::string_view chunk_type_name(ChunkType type) noexcept {
    switch (type) {
        case ChunkType::Messages: return "Messages";
        case ChunkType::ThreadMessages: return "ThreadMessages";
        case ChunkType::Files: return "Files";
        case ChunkType::Users: return "Users";
        case ChunkType::Channels: return "Channels";
        case ChunkType::ChannelInfo: return "ChannelInfo";
        case ChunkType::WorkspaceInfo: return "WorkspaceInfo";
        case ChunkType::ChannelUsers: return "ChannelUsers";
        case ChunkType::StarredItems: return "StarredItems";
        case ChunkType::Bookmarks: return "Bookmarks";
    }
    return "Unknown";
}

std::optional<ChunkType> chunk_type_from_tag(int tag) noexcept {
    if (tag < 0 || tag >= static_cast<int>(std::variant_size_v<Payload>)) {
        return std::nullopt;
    }
    return static_cast<ChunkType>(tag);
}

GroupId thread_group_id(std::string_view channel_id, std::string_view thread_ts) {
    return join_id(kThreadPrefix, channel_id, thread_ts);
}

GroupId file_group_id(std::string_view channel_id, std::string_view parent_ts) {
    return join_id(kFilePrefix, channel_id, parent_ts);
}

GroupId channel_info_group_id(std::string_view channel_id) {
    return join_id(kChannelInfoPrefix, channel_id);
}

GroupId channel_users_group_id(std::string_view channel_id) {
    return join_id(kChannelUsersPrefix, channel_id);
}

GroupId bookmarks_group_id(std::string_view channel_id) {
    return join_id(kBookmarksPrefix, channel_id);
}

bool is_channel_group_id(std::string_view id) noexcept {
    // Composite keys contain ':', singleton keys are the reserved constants.
    if (id.empty() || id.find(':') != std::string_view::npos) {
        return false;
    }
    return id != kUsersGroupId && id != kChannelsGroupId &&
           id != kStarredGroupId && id != kWorkspaceInfoGroupId;
}

Result<GroupId> Chunk::group_id() const {
    return std::visit([this](const auto& p) -> Result<GroupId> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, MessagesPayload>) {
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            return Result<GroupId>::Ok(channel_id);
        } else if constexpr (std::is_same_v<T, ThreadMessagesPayload>) {
            const auto& ts = p.parent.thread_ts.empty() ? thread_ts : p.parent.thread_ts;
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            if (ts.empty()) return unaddressable(*this, "thread timestamp");
            return Result<GroupId>::Ok(thread_group_id(channel_id, ts));
        } else if constexpr (std::is_same_v<T, FilesPayload>) {
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            if (p.parent.ts.empty()) return unaddressable(*this, "parent message");
            return Result<GroupId>::Ok(file_group_id(channel_id, p.parent.ts));
        } else if constexpr (std::is_same_v<T, ChannelInfoPayload>) {
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            return Result<GroupId>::Ok(channel_info_group_id(channel_id));
        } else if constexpr (std::is_same_v<T, ChannelUsersPayload>) {
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            return Result<GroupId>::Ok(channel_users_group_id(channel_id));
        } else if constexpr (std::is_same_v<T, BookmarksPayload>) {
            if (channel_id.empty()) return unaddressable(*this, "channel id");
            return Result<GroupId>::Ok(bookmarks_group_id(channel_id));
        } else if constexpr (std::is_same_v<T, UsersPayload>) {
            return Result<GroupId>::Ok(GroupId(kUsersGroupId));
        } else if constexpr (std::is_same_v<T, ChannelsPayload>) {
            return Result<GroupId>::Ok(GroupId(kChannelsGroupId));
        } else if constexpr (std::is_same_v<T, WorkspaceInfoPayload>) {
            return Result<GroupId>::Ok(GroupId(kWorkspaceInfoGroupId));
        } else if constexpr (std::is_same_v<T, StarredItemsPayload>) {
            return Result<GroupId>::Ok(GroupId(kStarredGroupId));
        } else {
            static_assert(std::is_void_v<T>, "group_id: unhandled payload kind");
        }
    }, payload);
}

Result<std::vector<MessageTs>> Chunk::message_timestamps() const {
    const std::vector<slack::Message>* messages = nullptr;
    if (const auto* m = as<MessagesPayload>()) {
        messages = &m->messages;
    } else if (const auto* t = as<ThreadMessagesPayload>()) {
        messages = &t->messages;
    } else {
        return Result<std::vector<MessageTs>>::Err(Error{
            ErrorCode::UnsupportedAddress,
            std::string(chunk_type_name(type())) + " chunk has no messages"
        });
    }

    std::vector<MessageTs> out;
    out.reserve(messages->size());
    for (const auto& msg : *messages) {
        out.push_back(msg.ts);
    }
    return Result<std::vector<MessageTs>>::Ok(std::move(out));
}

std::string Chunk::describe() const {
    auto id = group_id();
    return std::string(chunk_type_name(type())) + ": " +
           (id.is_ok() ? id.value() : std::string("<unaddressable>"));
}

}  // namespace chunkdump::chunk
