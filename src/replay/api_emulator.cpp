#include "replay/api_emulator.hpp"
#include <spdlog/spdlog.h>

namespace chunkdump::replay {

using json = nlohmann::json;

namespace {

ApiResponse not_found(const std::string& error) {
    return ApiResponse{404, json{{"ok", false}, {"error", error}}};
}

ApiResponse bad_request(const std::string& error) {
    return ApiResponse{400, json{{"ok", false}, {"error", error}}};
}

/// Turn one player read into the service's response shape.
/// @param empty_items Value of items_field once the key is exhausted
template <typename T>
ApiResponse translate(const char* endpoint,
                      const GroupId& key,
                      const Result<T>& result,
                      const char* items_field,
                      json empty_items,
                      const chunk::Player& player) {
    if (result.is_ok()) {
        return ApiResponse{200, json{
            {"ok", true},
            {items_field, result.value()},
            {"has_more", player.has_more(key)},
            {"response_metadata", {{"next_cursor", std::to_string(player.offset())}}}
        }};
    }

    const auto& err = result.error();
    switch (err.code) {
        case ErrorCode::NotFound:
            spdlog::debug("{}: {} not found", endpoint, key);
            return not_found("not_found");

        case ErrorCode::Exhausted:
            // End of pagination is not an error for the client
            return ApiResponse{200, json{
                {"ok", true},
                {items_field, std::move(empty_items)},
                {"has_more", false},
                {"response_metadata", {{"next_cursor", ""}}}
            }};

        default:
            spdlog::error("{}: failed to read {}: {}", endpoint, key, err.to_string());
            return ApiResponse{500, json{{"ok", false}, {"error", err.to_string()}}};
    }
}

}  // namespace

ApiEmulator::ApiEmulator(chunk::Player& player)
    : player_(player)
{}

ApiResponse ApiEmulator::handle(const ApiRequest& request) {
    if (spdlog::should_log(spdlog::level::debug)) {
        // Client parameters are not guaranteed to be valid UTF-8
        spdlog::debug("replay {} {}", request.method,
                      json(request.params).dump(-1, ' ', false, json::error_handler_t::replace));
    }

    if (request.method == "conversations.history") return conversations_history(request);
    if (request.method == "conversations.replies") return conversations_replies(request);
    if (request.method == "conversations.info") return conversations_info(request);
    if (request.method == "conversations.list") return conversations_list(request);
    if (request.method == "users.list") return users_list(request);

    return not_found("unknown_method");
}

ApiResponse ApiEmulator::conversations_history(const ApiRequest& request) {
    const auto channel = request.param("channel");
    if (channel.empty()) {
        return not_found("channel_not_found");
    }
    return translate("conversations.history", channel, player_.messages(channel), "messages", json::array(), player_);
}

ApiResponse ApiEmulator::conversations_replies(const ApiRequest& request) {
    const auto channel = request.param("channel");
    const auto ts = request.param("ts");
    if (ts.empty()) {
        return bad_request("ts is required");
    }
    if (channel.empty()) {
        return bad_request("channel is required");
    }
    return translate("conversations.replies", chunk::thread_group_id(channel, ts),
                     player_.thread(channel, ts), "messages", json::array(), player_);
}

ApiResponse ApiEmulator::conversations_info(const ApiRequest& request) {
    const auto channel = request.param("channel");
    if (channel.empty()) {
        return bad_request("channel is required");
    }
    return translate("conversations.info", chunk::channel_info_group_id(channel),
                     player_.channel_info(channel), "channel", json::object(), player_);
}

ApiResponse ApiEmulator::conversations_list(const ApiRequest& /*request*/) {
    return translate("conversations.list", GroupId(chunk::kChannelsGroupId),
                     player_.channels(), "channels", json::array(), player_);
}

ApiResponse ApiEmulator::users_list(const ApiRequest& /*request*/) {
    return translate("users.list", GroupId(chunk::kUsersGroupId),
                     player_.users(), "members", json::array(), player_);
}

Status ApiEmulator::reset() {
    return player_.reset();
}

}  // namespace chunkdump::replay
