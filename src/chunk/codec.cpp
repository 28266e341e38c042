#include "chunk/codec.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

namespace chunkdump::chunk {

using json = nlohmann::json;

namespace {

// Record keys
constexpr const char* kType = "t";
constexpr const char* kTimestamp = "ts";
constexpr const char* kChannelId = "id";
constexpr const char* kCount = "n";
constexpr const char* kThreadTs = "r";
constexpr const char* kIsLast = "l";
constexpr const char* kNumThreads = "nt";
constexpr const char* kChannel = "ci";
constexpr const char* kChannelUsers = "cu";
constexpr const char* kParent = "p";
constexpr const char* kMessages = "m";
constexpr const char* kFiles = "f";
constexpr const char* kUsers = "u";
constexpr const char* kChannels = "ch";
constexpr const char* kWorkspaceInfo = "w";
constexpr const char* kStarredItems = "st";
constexpr const char* kBookmarks = "b";

template <typename T>
void put_list(json& j, const char* key, const std::vector<T>& list) {
    if (!list.empty()) {
        j[key] = list;
    }
}

template <typename T>
void take(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

json payload_to_json(const Payload& payload) {
    json j = json::object();
    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, MessagesPayload>) {
            if (p.is_last) j[kIsLast] = true;
            if (p.num_threads != 0) j[kNumThreads] = p.num_threads;
            put_list(j, kMessages, p.messages);
        } else if constexpr (std::is_same_v<T, ThreadMessagesPayload>) {
            if (p.is_last) j[kIsLast] = true;
            j[kParent] = p.parent;
            put_list(j, kMessages, p.messages);
        } else if constexpr (std::is_same_v<T, FilesPayload>) {
            if (p.channel) j[kChannel] = *p.channel;
            j[kParent] = p.parent;
            put_list(j, kFiles, p.files);
        } else if constexpr (std::is_same_v<T, UsersPayload>) {
            put_list(j, kUsers, p.users);
        } else if constexpr (std::is_same_v<T, ChannelsPayload>) {
            put_list(j, kChannels, p.channels);
        } else if constexpr (std::is_same_v<T, ChannelInfoPayload>) {
            j[kChannel] = p.channel;
        } else if constexpr (std::is_same_v<T, WorkspaceInfoPayload>) {
            j[kWorkspaceInfo] = p.info;
        } else if constexpr (std::is_same_v<T, ChannelUsersPayload>) {
            put_list(j, kChannelUsers, p.user_ids);
        } else if constexpr (std::is_same_v<T, StarredItemsPayload>) {
            put_list(j, kStarredItems, p.items);
        } else if constexpr (std::is_same_v<T, BookmarksPayload>) {
            put_list(j, kBookmarks, p.bookmarks);
        } else {
            static_assert(std::is_void_v<T>, "encode: unhandled payload kind");
        }
    }, payload);
    return j;
}

Payload payload_from_json(ChunkType type, const json& j) {
    switch (type) {
        case ChunkType::Messages: {
            MessagesPayload p;
            take(j, kIsLast, p.is_last);
            take(j, kNumThreads, p.num_threads);
            take(j, kMessages, p.messages);
            return p;
        }
        case ChunkType::ThreadMessages: {
            ThreadMessagesPayload p;
            take(j, kIsLast, p.is_last);
            take(j, kParent, p.parent);
            take(j, kMessages, p.messages);
            return p;
        }
        case ChunkType::Files: {
            FilesPayload p;
            if (auto it = j.find(kChannel); it != j.end() && !it->is_null()) {
                p.channel = it->get<slack::Channel>();
            }
            take(j, kParent, p.parent);
            take(j, kFiles, p.files);
            return p;
        }
        case ChunkType::Users: {
            UsersPayload p;
            take(j, kUsers, p.users);
            return p;
        }
        case ChunkType::Channels: {
            ChannelsPayload p;
            take(j, kChannels, p.channels);
            return p;
        }
        case ChunkType::ChannelInfo: {
            ChannelInfoPayload p;
            take(j, kChannel, p.channel);
            return p;
        }
        case ChunkType::WorkspaceInfo: {
            WorkspaceInfoPayload p;
            take(j, kWorkspaceInfo, p.info);
            return p;
        }
        case ChunkType::ChannelUsers: {
            ChannelUsersPayload p;
            take(j, kChannelUsers, p.user_ids);
            return p;
        }
        case ChunkType::StarredItems: {
            StarredItemsPayload p;
            take(j, kStarredItems, p.items);
            return p;
        }
        case ChunkType::Bookmarks: {
            BookmarksPayload p;
            take(j, kBookmarks, p.bookmarks);
            return p;
        }
    }
    // chunk_type_from_tag only yields enumerated values
    return MessagesPayload{};
}

}  // namespace

Result<std::string> ChunkCodec::encode(const Chunk& chunk) {
    json j = payload_to_json(chunk.payload);
    j[kType] = static_cast<int>(chunk.type());
    j[kTimestamp] = chunk.timestamp;
    if (!chunk.channel_id.empty()) j[kChannelId] = chunk.channel_id;
    if (chunk.count != 0) j[kCount] = chunk.count;
    if (!chunk.thread_ts.empty()) j[kThreadTs] = chunk.thread_ts;

    try {
        std::string out = j.dump();
        out.push_back('\n');
        return Result<std::string>::Ok(std::move(out));
    } catch (const json::exception& e) {
        // Strings that are not valid UTF-8 cannot be written as JSON
        return Result<std::string>::Err(Error{
            ErrorCode::InvalidArgument,
            "cannot encode " + chunk.describe() + ": " + e.what()
        });
    }
}

Result<Chunk> ChunkCodec::decode(std::string_view record) {
    try {
        auto j = json::parse(record);
        if (!j.is_object()) {
            return Result<Chunk>::Err(Error{ErrorCode::Decode, "record is not a JSON object"});
        }
        if (!j.contains(kType)) {
            return Result<Chunk>::Err(Error{ErrorCode::Decode, "record without type tag"});
        }

        int tag = j[kType].get<int>();
        auto type = chunk_type_from_tag(tag);
        if (!type) {
            return Result<Chunk>::Err(Error{
                ErrorCode::UnsupportedAddress,
                "unsupported chunk type tag " + std::to_string(tag)
            });
        }

        Chunk chunk;
        take(j, kTimestamp, chunk.timestamp);
        take(j, kChannelId, chunk.channel_id);
        take(j, kCount, chunk.count);
        take(j, kThreadTs, chunk.thread_ts);
        chunk.payload = payload_from_json(*type, j);

        return Result<Chunk>::Ok(std::move(chunk));

    } catch (const json::exception& e) {
        return Result<Chunk>::Err(Error{
            ErrorCode::Decode,
            std::string("JSON parse error: ") + e.what()
        });
    }
}

}  // namespace chunkdump::chunk
