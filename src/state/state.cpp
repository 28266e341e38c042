#include "state/state.hpp"
#include "chunk/chunk.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace chunkdump::state {

using json = nlohmann::json;

State::State(std::string name)
    : name_(std::move(name))
{}

std::string State::thread_key(const ChannelId& channel_id, const MessageTs& thread_ts) {
    return channel_id + ":" + thread_ts;
}

void State::add_message(const ChannelId& channel_id, const MessageTs& ts) {
    messages_[channel_id].insert(ts);
}

void State::add_thread(const ChannelId& channel_id, const MessageTs& thread_ts, const MessageTs& ts) {
    threads_[thread_key(channel_id, thread_ts)].insert(ts);
}

void State::add_file(const ChannelId& channel_id, const std::string& file_id, const std::string& path) {
    auto& files = files_[channel_id];
    auto it = files.find(file_id);
    // A known path is never overwritten by an unknown one.
    if (it == files.end()) {
        files.emplace(file_id, path);
    } else if (!path.empty()) {
        it->second = path;
    }
}

void State::apply(const chunk::Chunk& c) {
    if (const auto* m = c.as<chunk::MessagesPayload>()) {
        for (const auto& msg : m->messages) {
            add_message(c.channel_id, msg.ts);
        }
    } else if (const auto* t = c.as<chunk::ThreadMessagesPayload>()) {
        const auto& thread_ts = t->parent.thread_ts.empty() ? c.thread_ts : t->parent.thread_ts;
        for (const auto& msg : t->messages) {
            add_thread(c.channel_id, thread_ts, msg.ts);
        }
    } else if (const auto* f = c.as<chunk::FilesPayload>()) {
        // The log cannot tell whether a file was downloaded afterwards.
        for (const auto& file : f->files) {
            add_file(c.channel_id, file.id, "");
        }
    }
}

bool State::has_message(const ChannelId& channel_id, const MessageTs& ts) const {
    auto it = messages_.find(channel_id);
    return it != messages_.end() && it->second.count(ts) > 0;
}

bool State::has_thread_message(const ChannelId& channel_id,
                               const MessageTs& thread_ts,
                               const MessageTs& ts) const {
    auto it = threads_.find(thread_key(channel_id, thread_ts));
    return it != threads_.end() && it->second.count(ts) > 0;
}

bool State::has_file(const ChannelId& channel_id, const std::string& file_id) const {
    return file_path(channel_id, file_id).has_value();
}

std::optional<std::string> State::file_path(const ChannelId& channel_id,
                                            const std::string& file_id) const {
    auto ch = files_.find(channel_id);
    if (ch == files_.end()) {
        return std::nullopt;
    }
    auto it = ch->second.find(file_id);
    if (it == ch->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t State::message_count() const noexcept {
    std::size_t n = 0;
    for (const auto& [_, ts] : messages_) {
        n += ts.size();
    }
    return n;
}

std::size_t State::thread_message_count() const noexcept {
    std::size_t n = 0;
    for (const auto& [_, ts] : threads_) {
        n += ts.size();
    }
    return n;
}

std::size_t State::file_count() const noexcept {
    std::size_t n = 0;
    for (const auto& [_, files] : files_) {
        n += files.size();
    }
    return n;
}

std::set<ChannelId> State::channels() const {
    std::set<ChannelId> out;
    for (const auto& [id, _] : messages_) {
        out.insert(id);
    }
    return out;
}

json State::to_json() const {
    return json{
        {"version", kVersion},
        {"name", name_},
        {"channels", messages_},
        {"threads", threads_},
        {"files", files_}
    };
}

Result<State> State::from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return Result<State>::Err(Error{ErrorCode::Decode, "state is not a JSON object"});
        }
        int version = j.value("version", 0);
        if (version != kVersion) {
            return Result<State>::Err(Error{
                ErrorCode::Decode,
                "unsupported state version " + std::to_string(version)
            });
        }

        State s(j.value("name", std::string{}));
        if (j.contains("channels")) {
            s.messages_ = j["channels"].get<std::map<ChannelId, std::set<MessageTs>>>();
        }
        if (j.contains("threads")) {
            s.threads_ = j["threads"].get<std::map<std::string, std::set<MessageTs>>>();
        }
        if (j.contains("files")) {
            s.files_ = j["files"].get<std::map<ChannelId, std::map<std::string, std::string>>>();
        }
        return Result<State>::Ok(std::move(s));

    } catch (const json::exception& e) {
        return Result<State>::Err(Error{
            ErrorCode::Decode,
            std::string("Error reading state field: ") + e.what()
        });
    }
}

Status State::save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return error_status(ErrorCode::Io, "Failed to create state file: " + path);
    }
    file << to_json().dump(2) << '\n';
    file.close();
    if (file.fail()) {
        return error_status(ErrorCode::Io, "Failed to write state file: " + path);
    }
    return ok_status();
}

Result<State> State::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<State>::Err(Error{ErrorCode::Io, "Failed to open state file: " + path});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<State>::Err(Error{
            ErrorCode::Decode,
            "Failed to parse state " + path + ": " + e.what()
        });
    }
    return from_json(j);
}

std::string state_path_for(const std::string& log_path, std::string_view suffix) {
    return log_path + std::string(suffix);
}

}  // namespace chunkdump::state
