#include "slack/types.hpp"
#include <nlohmann/json.hpp>

namespace chunkdump::slack {

using json = nlohmann::json;

namespace {

bool is_empty(const std::string& v) { return v.empty(); }
bool is_empty(std::int64_t v) { return v == 0; }
bool is_empty(int v) { return v == 0; }
bool is_empty(bool v) { return !v; }
template <typename T>
bool is_empty(const std::vector<T>& v) { return v.empty(); }

/// Set key only for non-empty values
template <typename T>
void put(json& j, const char* key, const T& value) {
    if (!is_empty(value)) {
        j[key] = value;
    }
}

/// Read key if present and not null, keep default otherwise
template <typename T>
void take(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

}  // namespace

void to_json(json& j, const File& v) {
    j = json::object();
    j["id"] = v.id;
    put(j, "name", v.name);
    put(j, "title", v.title);
    put(j, "mimetype", v.mimetype);
    put(j, "filetype", v.filetype);
    put(j, "size", v.size);
    put(j, "url_private_download", v.url_private_download);
    put(j, "timestamp", v.timestamp);
}

void from_json(const json& j, File& v) {
    take(j, "id", v.id);
    take(j, "name", v.name);
    take(j, "title", v.title);
    take(j, "mimetype", v.mimetype);
    take(j, "filetype", v.filetype);
    take(j, "size", v.size);
    take(j, "url_private_download", v.url_private_download);
    take(j, "timestamp", v.timestamp);
}

void to_json(json& j, const Message& v) {
    j = json::object();
    put(j, "type", v.type);
    put(j, "subtype", v.subtype);
    put(j, "user", v.user);
    put(j, "text", v.text);
    j["ts"] = v.ts;
    put(j, "thread_ts", v.thread_ts);
    put(j, "reply_count", v.reply_count);
    put(j, "files", v.files);
}

void from_json(const json& j, Message& v) {
    take(j, "type", v.type);
    take(j, "subtype", v.subtype);
    take(j, "user", v.user);
    take(j, "text", v.text);
    take(j, "ts", v.ts);
    take(j, "thread_ts", v.thread_ts);
    take(j, "reply_count", v.reply_count);
    take(j, "files", v.files);
}

void to_json(json& j, const User& v) {
    j = json::object();
    j["id"] = v.id;
    put(j, "team_id", v.team_id);
    put(j, "name", v.name);
    put(j, "real_name", v.real_name);
    put(j, "deleted", v.deleted);
    put(j, "is_bot", v.is_bot);
}

void from_json(const json& j, User& v) {
    take(j, "id", v.id);
    take(j, "team_id", v.team_id);
    take(j, "name", v.name);
    take(j, "real_name", v.real_name);
    take(j, "deleted", v.deleted);
    take(j, "is_bot", v.is_bot);
}

void to_json(json& j, const Topic& v) {
    j = json{
        {"value", v.value},
        {"creator", v.creator},
        {"last_set", v.last_set}
    };
}

void from_json(const json& j, Topic& v) {
    take(j, "value", v.value);
    take(j, "creator", v.creator);
    take(j, "last_set", v.last_set);
}

void to_json(json& j, const Channel& v) {
    j = json::object();
    j["id"] = v.id;
    put(j, "name", v.name);
    put(j, "created", v.created);
    put(j, "creator", v.creator);
    put(j, "is_channel", v.is_channel);
    put(j, "is_group", v.is_group);
    put(j, "is_im", v.is_im);
    put(j, "is_private", v.is_private);
    put(j, "is_archived", v.is_archived);
    put(j, "user", v.user);
    if (v.topic != Topic{}) {
        j["topic"] = v.topic;
    }
    if (v.purpose != Topic{}) {
        j["purpose"] = v.purpose;
    }
    put(j, "num_members", v.num_members);
}

void from_json(const json& j, Channel& v) {
    take(j, "id", v.id);
    take(j, "name", v.name);
    take(j, "created", v.created);
    take(j, "creator", v.creator);
    take(j, "is_channel", v.is_channel);
    take(j, "is_group", v.is_group);
    take(j, "is_im", v.is_im);
    take(j, "is_private", v.is_private);
    take(j, "is_archived", v.is_archived);
    take(j, "user", v.user);
    take(j, "topic", v.topic);
    take(j, "purpose", v.purpose);
    take(j, "num_members", v.num_members);
}

void to_json(json& j, const WorkspaceInfo& v) {
    j = json::object();
    put(j, "url", v.url);
    put(j, "team", v.team);
    put(j, "user", v.user);
    put(j, "team_id", v.team_id);
    put(j, "user_id", v.user_id);
    put(j, "bot_id", v.bot_id);
}

void from_json(const json& j, WorkspaceInfo& v) {
    take(j, "url", v.url);
    take(j, "team", v.team);
    take(j, "user", v.user);
    take(j, "team_id", v.team_id);
    take(j, "user_id", v.user_id);
    take(j, "bot_id", v.bot_id);
}

void to_json(json& j, const StarredItem& v) {
    j = json::object();
    j["type"] = v.type;
    put(j, "channel", v.channel);
    if (v.message) {
        j["message"] = *v.message;
    }
    if (v.file) {
        j["file"] = *v.file;
    }
}

void from_json(const json& j, StarredItem& v) {
    take(j, "type", v.type);
    take(j, "channel", v.channel);
    if (auto it = j.find("message"); it != j.end() && !it->is_null()) {
        v.message = it->get<Message>();
    }
    if (auto it = j.find("file"); it != j.end() && !it->is_null()) {
        v.file = it->get<File>();
    }
}

void to_json(json& j, const Bookmark& v) {
    j = json::object();
    j["id"] = v.id;
    put(j, "channel_id", v.channel_id);
    put(j, "title", v.title);
    put(j, "link", v.link);
    put(j, "emoji", v.emoji);
    put(j, "type", v.type);
    put(j, "date_created", v.date_created);
}

void from_json(const json& j, Bookmark& v) {
    take(j, "id", v.id);
    take(j, "channel_id", v.channel_id);
    take(j, "title", v.title);
    take(j, "link", v.link);
    take(j, "emoji", v.emoji);
    take(j, "type", v.type);
    take(j, "date_created", v.date_created);
}

}  // namespace chunkdump::slack
