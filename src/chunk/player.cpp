#include "chunk/player.hpp"
#include "chunk/codec.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <spdlog/spdlog.h>

namespace chunkdump::chunk {

namespace {

Error at_offset(const Error& e, Offset offset) {
    return Error{e.code, "chunk at offset " + std::to_string(offset) + ": " + e.message};
}

}  // namespace

Player::Player(PrivateTag, std::unique_ptr<std::istream> in, Index index, std::string name)
    : in_(std::move(in))
    , index_(std::move(index))
    , name_(std::move(name))
{}

Result<std::unique_ptr<Player>> Player::open(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        return Result<std::unique_ptr<Player>>::Err(Error{
            ErrorCode::Io,
            "Failed to open chunk log: " + path.string()
        });
    }
    return from_stream(std::move(file), path.filename().string());
}

Result<std::unique_ptr<Player>> Player::from_stream(std::unique_ptr<std::istream> in, std::string name) {
    if (!in) {
        return Result<std::unique_ptr<Player>>::Err(Error{ErrorCode::InvalidArgument, "null stream"});
    }

    auto index = Index::build(*in);
    if (index.is_err()) {
        return Result<std::unique_ptr<Player>>::Err(index.error());
    }

    return Result<std::unique_ptr<Player>>::Ok(
        std::make_unique<Player>(PrivateTag{}, std::move(in), std::move(index).take_value(), std::move(name))
    );
}

Result<Chunk> Player::read_at(Offset offset) {
    in_->clear();
    in_->seekg(offset, std::ios::beg);
    if (in_->fail()) {
        return Result<Chunk>::Err(Error{ErrorCode::Io, "failed to seek to offset " + std::to_string(offset)});
    }

    std::string line;
    Offset found = offset;
    if (!read_record(*in_, line, found)) {
        if (in_->bad()) {
            return Result<Chunk>::Err(Error{ErrorCode::Io, "read error at offset " + std::to_string(offset)});
        }
        return Result<Chunk>::Err(Error{
            ErrorCode::Decode,
            "failed to decode chunk at offset " + std::to_string(offset) + ": unexpected end of log"
        });
    }

    auto chunk = ChunkCodec::decode(line);
    if (chunk.is_err()) {
        return Result<Chunk>::Err(Error{
            chunk.error().code,
            "failed to decode chunk at offset " + std::to_string(offset) + ": " + chunk.error().message
        });
    }
    return chunk;
}

Result<Chunk> Player::next_locked(const GroupId& id) {
    const auto* offsets = index_.find(id);
    if (offsets == nullptr) {
        return Result<Chunk>::Err(Error{ErrorCode::NotFound, "no records for " + id});
    }

    auto& cursor = cursors_[id];   // first access starts at 0
    if (cursor >= offsets->size()) {
        return Result<Chunk>::Err(Error{ErrorCode::Exhausted, "all records read for " + id});
    }

    const Offset offset = (*offsets)[cursor];
    auto chunk = read_at(offset);
    if (chunk.is_err()) {
        return chunk;
    }

    last_offset_.store(offset);
    ++cursor;
    return chunk;
}

Result<Chunk> Player::next(const GroupId& id) {
    std::unique_lock lock(mutex_);
    return next_locked(id);
}

bool Player::has_more(const GroupId& id) const {
    std::shared_lock lock(mutex_);
    const auto* offsets = index_.find(id);
    if (offsets == nullptr) {
        return false;
    }
    auto it = cursors_.find(id);
    if (it == cursors_.end()) {
        return true;   // never accessed
    }
    return it->second < offsets->size();
}

Offset Player::offset() const {
    std::shared_lock lock(mutex_);
    return last_offset_.load();
}

template <typename P>
Result<P> Player::next_payload(const GroupId& id) {
    Offset offset = 0;
    Result<Chunk> chunk = [&] {
        std::unique_lock lock(mutex_);
        auto r = next_locked(id);
        offset = last_offset_.load();
        return r;
    }();
    if (chunk.is_err()) {
        return Result<P>::Err(chunk.error());
    }

    Chunk c = std::move(chunk).take_value();
    if (auto* p = std::get_if<P>(&c.payload)) {
        return Result<P>::Ok(std::move(*p));
    }
    return Result<P>::Err(at_offset(Error{
        ErrorCode::Decode,
        "unexpected " + std::string(chunk_type_name(c.type())) + " record under " + id
    }, offset));
}

template <typename P, typename T>
Result<std::vector<T>> Player::drain(const GroupId& id, std::vector<T> P::*field) {
    std::unique_lock lock(mutex_);
    auto rewound = rewind_locked();
    if (rewound.is_err()) {
        return Result<std::vector<T>>::Err(rewound.error());
    }

    std::vector<T> out;
    while (true) {
        auto chunk = next_locked(id);
        if (chunk.is_err()) {
            if (chunk.error().is(ErrorCode::Exhausted)) {
                break;
            }
            return Result<std::vector<T>>::Err(chunk.error());
        }
        const auto* p = chunk.value().template as<P>();
        if (p == nullptr) {
            return Result<std::vector<T>>::Err(at_offset(Error{
                ErrorCode::Decode,
                "unexpected " + std::string(chunk_type_name(chunk.value().type())) + " record under " + id
            }, last_offset_.load()));
        }
        const auto& slice = p->*field;
        out.insert(out.end(), slice.begin(), slice.end());
    }
    return Result<std::vector<T>>::Ok(std::move(out));
}

Result<std::vector<slack::Message>> Player::messages(const ChannelId& channel_id) {
    return next_payload<MessagesPayload>(channel_id)
        .map([](const MessagesPayload& p) { return p.messages; });
}

Result<std::vector<slack::Message>> Player::thread(const ChannelId& channel_id, const MessageTs& thread_ts) {
    return next_payload<ThreadMessagesPayload>(thread_group_id(channel_id, thread_ts))
        .map([](const ThreadMessagesPayload& p) { return p.messages; });
}

Result<std::vector<slack::File>> Player::files(const ChannelId& channel_id, const MessageTs& parent_ts) {
    return next_payload<FilesPayload>(file_group_id(channel_id, parent_ts))
        .map([](const FilesPayload& p) { return p.files; });
}

Result<std::vector<slack::User>> Player::users() {
    return next_payload<UsersPayload>(GroupId(kUsersGroupId))
        .map([](const UsersPayload& p) { return p.users; });
}

Result<std::vector<slack::Channel>> Player::channels() {
    return next_payload<ChannelsPayload>(GroupId(kChannelsGroupId))
        .map([](const ChannelsPayload& p) { return p.channels; });
}

Result<slack::Channel> Player::channel_info(const ChannelId& channel_id) {
    return next_payload<ChannelInfoPayload>(channel_info_group_id(channel_id))
        .map([](const ChannelInfoPayload& p) { return p.channel; });
}

Result<std::vector<std::string>> Player::channel_users(const ChannelId& channel_id) {
    return next_payload<ChannelUsersPayload>(channel_users_group_id(channel_id))
        .map([](const ChannelUsersPayload& p) { return p.user_ids; });
}

Result<slack::WorkspaceInfo> Player::workspace_info() {
    return next_payload<WorkspaceInfoPayload>(GroupId(kWorkspaceInfoGroupId))
        .map([](const WorkspaceInfoPayload& p) { return p.info; });
}

Result<std::vector<slack::StarredItem>> Player::starred_items() {
    return next_payload<StarredItemsPayload>(GroupId(kStarredGroupId))
        .map([](const StarredItemsPayload& p) { return p.items; });
}

Result<std::vector<slack::Bookmark>> Player::bookmarks(const ChannelId& channel_id) {
    return next_payload<BookmarksPayload>(bookmarks_group_id(channel_id))
        .map([](const BookmarksPayload& p) { return p.bookmarks; });
}

bool Player::has_more_messages(const ChannelId& channel_id) const {
    return has_more(channel_id);
}

bool Player::has_more_threads(const ChannelId& channel_id, const MessageTs& thread_ts) const {
    return has_more(thread_group_id(channel_id, thread_ts));
}

bool Player::has_more_channels() const {
    return has_more(GroupId(kChannelsGroupId));
}

bool Player::has_users() const {
    return has_more(GroupId(kUsersGroupId));
}

bool Player::has_channels() const {
    return has_more(GroupId(kChannelsGroupId));
}

Result<std::vector<slack::Message>> Player::all_messages(const ChannelId& channel_id) {
    return drain(channel_id, &MessagesPayload::messages);
}

Result<std::vector<slack::Message>> Player::all_thread_messages(const ChannelId& channel_id,
                                                                const MessageTs& thread_ts) {
    return drain(thread_group_id(channel_id, thread_ts), &ThreadMessagesPayload::messages);
}

Result<std::vector<slack::File>> Player::all_files(const ChannelId& channel_id, const MessageTs& parent_ts) {
    return drain(file_group_id(channel_id, parent_ts), &FilesPayload::files);
}

Result<std::vector<slack::User>> Player::all_users() {
    return drain(GroupId(kUsersGroupId), &UsersPayload::users);
}

Result<std::vector<slack::Channel>> Player::all_channels() {
    return drain(GroupId(kChannelsGroupId), &ChannelsPayload::channels);
}

Result<std::vector<std::string>> Player::all_channel_users(const ChannelId& channel_id) {
    return drain(channel_users_group_id(channel_id), &ChannelUsersPayload::user_ids);
}

Result<std::vector<slack::Bookmark>> Player::all_bookmarks(const ChannelId& channel_id) {
    return drain(bookmarks_group_id(channel_id), &BookmarksPayload::bookmarks);
}

Status Player::rewind_locked() {
    cursors_.clear();
    in_->clear();
    in_->seekg(0, std::ios::beg);
    if (in_->fail()) {
        return error_status(ErrorCode::Io, "failed to rewind chunk log");
    }
    return ok_status();
}

Status Player::reset() {
    std::unique_lock lock(mutex_);
    spdlog::debug("Player {}: reset", name_.empty() ? "<stream>" : name_);
    return rewind_locked();
}

Status Player::for_each(const ChunkHandler& fn) {
    std::unique_lock lock(mutex_);
    auto rewound = rewind_locked();
    if (rewound.is_err()) {
        return rewound;
    }

    Status result = ok_status();
    std::string line;
    Offset offset = 0;
    while (read_record(*in_, line, offset)) {
        auto chunk = ChunkCodec::decode(line);
        if (chunk.is_err()) {
            result = Status::Err(at_offset(chunk.error(), offset));
            break;
        }
        auto handled = fn(chunk.value());
        if (handled.is_err()) {
            result = handled;
            break;
        }
    }
    if (result.is_ok() && in_->bad()) {
        result = error_status(ErrorCode::Io, "read error during full scan");
    }

    // Leave the stream at the start, whatever happened
    auto restored = rewind_locked();
    if (result.is_ok() && restored.is_err()) {
        return restored;
    }
    return result;
}

std::vector<ChannelId> Player::channel_ids() const {
    std::vector<ChannelId> ids;
    for (auto& id : index_.keys()) {
        if (is_channel_group_id(id)) {
            ids.push_back(std::move(id));
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Result<state::State> Player::state() {
    state::State s(name_);
    auto scanned = for_each([&s](const Chunk& c) {
        s.apply(c);
        return ok_status();
    });
    if (scanned.is_err()) {
        return Result<state::State>::Err(scanned.error());
    }
    return Result<state::State>::Ok(std::move(s));
}

}  // namespace chunkdump::chunk
