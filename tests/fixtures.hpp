#pragma once

#include "chunk/chunk.hpp"
#include "chunk/codec.hpp"
#include "chunk/player.hpp"
#include "slack/types.hpp"
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace chunkdump::fixtures {

inline slack::Message make_message(const std::string& ts, const std::string& text = "hello") {
    slack::Message m;
    m.user = "U100";
    m.text = text;
    m.ts = ts;
    return m;
}

/// n messages with timestamps "<base>.000001", "<base>.000002", ...
inline std::vector<slack::Message> make_messages(int n, int base = 1000) {
    std::vector<slack::Message> out;
    for (int i = 1; i <= n; ++i) {
        out.push_back(make_message(std::to_string(base) + ".00000" + std::to_string(i)));
    }
    return out;
}

inline slack::Message make_thread_parent(const std::string& thread_ts) {
    slack::Message m = make_message(thread_ts, "thread root");
    m.thread_ts = thread_ts;
    m.reply_count = 2;
    return m;
}

inline slack::Channel make_channel(const std::string& id, const std::string& name) {
    slack::Channel c;
    c.id = id;
    c.name = name;
    c.is_channel = true;
    c.created = 1600000000;
    return c;
}

inline slack::User make_user(const std::string& id, const std::string& name) {
    slack::User u;
    u.id = id;
    u.team_id = "T1";
    u.name = name;
    return u;
}

inline slack::File make_file(const std::string& id) {
    slack::File f;
    f.id = id;
    f.name = id + ".txt";
    f.mimetype = "text/plain";
    f.size = 42;
    return f;
}

inline chunk::Chunk messages_chunk(const std::string& channel, std::vector<slack::Message> msgs,
                                   bool is_last = false) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.channel_id = channel;
    c.count = static_cast<int>(msgs.size());
    c.payload = chunk::MessagesPayload{std::move(msgs), is_last, 0};
    return c;
}

inline chunk::Chunk thread_chunk(const std::string& channel, const std::string& thread_ts,
                                 std::vector<slack::Message> replies, bool is_last = true) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.channel_id = channel;
    c.thread_ts = thread_ts;
    c.count = static_cast<int>(replies.size());
    c.payload = chunk::ThreadMessagesPayload{make_thread_parent(thread_ts), std::move(replies), is_last};
    return c;
}

inline chunk::Chunk files_chunk(const std::string& channel, const std::string& parent_ts,
                                std::vector<slack::File> files) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.channel_id = channel;
    c.count = static_cast<int>(files.size());
    c.payload = chunk::FilesPayload{std::nullopt, make_message(parent_ts), std::move(files)};
    return c;
}

inline chunk::Chunk channel_info_chunk(const std::string& channel, const std::string& name) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.channel_id = channel;
    c.payload = chunk::ChannelInfoPayload{make_channel(channel, name)};
    return c;
}

inline chunk::Chunk users_chunk(std::vector<slack::User> users) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.count = static_cast<int>(users.size());
    c.payload = chunk::UsersPayload{std::move(users)};
    return c;
}

inline chunk::Chunk channels_chunk(std::vector<slack::Channel> channels) {
    chunk::Chunk c;
    c.timestamp = 1700000000000000;
    c.count = static_cast<int>(channels.size());
    c.payload = chunk::ChannelsPayload{std::move(channels)};
    return c;
}

/// Encode chunks into one log text
inline std::string make_log(std::initializer_list<chunk::Chunk> chunks) {
    std::string out;
    for (const auto& c : chunks) {
        out += chunk::ChunkCodec::encode(c).value();
    }
    return out;
}

/// Player over an in-memory log, nullptr when indexing fails
inline std::unique_ptr<chunk::Player> make_player(const std::string& log) {
    auto player = chunk::Player::from_stream(std::make_unique<std::istringstream>(log));
    if (player.is_err()) {
        return nullptr;
    }
    return std::move(player).take_value();
}

}  // namespace chunkdump::fixtures
