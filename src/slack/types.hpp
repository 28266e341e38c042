#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chunkdump::slack {

/// Uploaded file, as returned by files.info / attached to messages
struct File {
    std::string id;
    std::string name;
    std::string title;
    std::string mimetype;
    std::string filetype;
    std::int64_t size = 0;
    std::string url_private_download;
    std::int64_t timestamp = 0;   // upload time, epoch seconds

    friend bool operator==(const File&, const File&) = default;
};

/// Conversation message (channel message or thread reply)
struct Message {
    std::string type = "message";
    std::string subtype;
    std::string user;
    std::string text;
    std::string ts;               // message timestamp, unique per channel
    std::string thread_ts;        // set on thread parents and replies
    int reply_count = 0;
    std::vector<File> files;

    friend bool operator==(const Message&, const Message&) = default;
};

struct User {
    std::string id;
    std::string team_id;
    std::string name;
    std::string real_name;
    bool deleted = false;
    bool is_bot = false;

    friend bool operator==(const User&, const User&) = default;
};

/// Channel topic or purpose
struct Topic {
    std::string value;
    std::string creator;
    std::int64_t last_set = 0;

    friend bool operator==(const Topic&, const Topic&) = default;
};

struct Channel {
    std::string id;
    std::string name;
    std::int64_t created = 0;
    std::string creator;
    bool is_channel = false;
    bool is_group = false;
    bool is_im = false;
    bool is_private = false;
    bool is_archived = false;
    std::string user;             // IM counterpart
    Topic topic;
    Topic purpose;
    int num_members = 0;

    friend bool operator==(const Channel&, const Channel&) = default;
};

/// auth.test response of the archived workspace
struct WorkspaceInfo {
    std::string url;
    std::string team;
    std::string user;
    std::string team_id;
    std::string user_id;
    std::string bot_id;

    friend bool operator==(const WorkspaceInfo&, const WorkspaceInfo&) = default;
};

struct StarredItem {
    std::string type;             // "message", "file", "channel", ...
    std::string channel;
    std::optional<Message> message;
    std::optional<File> file;

    friend bool operator==(const StarredItem&, const StarredItem&) = default;
};

struct Bookmark {
    std::string id;
    std::string channel_id;
    std::string title;
    std::string link;
    std::string emoji;
    std::string type;
    std::int64_t date_created = 0;

    friend bool operator==(const Bookmark&, const Bookmark&) = default;
};

// JSON conversion, service field names, empty fields omitted.
// Throws nlohmann::json::exception on type mismatches.
void to_json(nlohmann::json& j, const File& v);
void from_json(const nlohmann::json& j, File& v);
void to_json(nlohmann::json& j, const Message& v);
void from_json(const nlohmann::json& j, Message& v);
void to_json(nlohmann::json& j, const User& v);
void from_json(const nlohmann::json& j, User& v);
void to_json(nlohmann::json& j, const Topic& v);
void from_json(const nlohmann::json& j, Topic& v);
void to_json(nlohmann::json& j, const Channel& v);
void from_json(const nlohmann::json& j, Channel& v);
void to_json(nlohmann::json& j, const WorkspaceInfo& v);
void from_json(const nlohmann::json& j, WorkspaceInfo& v);
void to_json(nlohmann::json& j, const StarredItem& v);
void from_json(const nlohmann::json& j, StarredItem& v);
void to_json(nlohmann::json& j, const Bookmark& v);
void from_json(const nlohmann::json& j, Bookmark& v);

}  // namespace chunkdump::slack
