#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace chunkdump::chunk {
struct Chunk;
}

namespace chunkdump::state {

/// Default suffix of the state file written next to a chunk log
inline constexpr std::string_view kDefaultStateSuffix = ".state";

/// Summary of what a chunk log contains: message timestamps per channel,
/// reply timestamps per thread and file ids per channel.
/// Derived data, can always be rebuilt from the log.
class State {
public:
    static constexpr int kVersion = 1;

    State() = default;

    /// @param name Base name of the source log, empty if unknown
    explicit State(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    void add_message(const ChannelId& channel_id, const MessageTs& ts);
    void add_thread(const ChannelId& channel_id, const MessageTs& thread_ts, const MessageTs& ts);

    /// @param path Local path of the downloaded file, empty when unknown
    void add_file(const ChannelId& channel_id, const std::string& file_id, const std::string& path);

    /// Record everything a chunk contributes: messages, thread replies, files.
    /// Other chunk kinds leave the state unchanged.
    void apply(const chunk::Chunk& chunk);

    [[nodiscard]] bool has_message(const ChannelId& channel_id, const MessageTs& ts) const;
    [[nodiscard]] bool has_thread_message(const ChannelId& channel_id,
                                          const MessageTs& thread_ts,
                                          const MessageTs& ts) const;
    [[nodiscard]] bool has_file(const ChannelId& channel_id, const std::string& file_id) const;

    /// Local path recorded for a file; empty string when captured but not downloaded,
    /// nullopt when the file is not in the state at all.
    [[nodiscard]] std::optional<std::string> file_path(const ChannelId& channel_id,
                                                       const std::string& file_id) const;

    [[nodiscard]] std::size_t message_count() const noexcept;
    [[nodiscard]] std::size_t thread_message_count() const noexcept;
    [[nodiscard]] std::size_t file_count() const noexcept;

    /// Channel ids with at least one captured message, sorted
    [[nodiscard]] std::set<ChannelId> channels() const;

    [[nodiscard]] nlohmann::json to_json() const;
    [[nodiscard]] static Result<State> from_json(const nlohmann::json& j);

    /// Write the state as indented JSON
    [[nodiscard]] Status save(const std::string& path) const;

    [[nodiscard]] static Result<State> load(const std::string& path);

    friend bool operator==(const State&, const State&) = default;

private:
    static std::string thread_key(const ChannelId& channel_id, const MessageTs& thread_ts);

    std::string name_;
    std::map<ChannelId, std::set<MessageTs>> messages_;
    std::map<std::string, std::set<MessageTs>> threads_;   // "channel:thread_ts"
    std::map<ChannelId, std::map<std::string, std::string>> files_;
};

/// Conventional state file path for a chunk log
[[nodiscard]] std::string state_path_for(const std::string& log_path,
                                         std::string_view suffix = kDefaultStateSuffix);

}  // namespace chunkdump::state
