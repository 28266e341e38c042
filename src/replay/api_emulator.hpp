#pragma once

#include "chunk/player.hpp"
#include "core/status.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace chunkdump::replay {

/// Transport independent API request: method name ("conversations.history")
/// plus decoded form / query parameters
struct ApiRequest {
    std::string method;
    std::map<std::string, std::string> params;

    [[nodiscard]] std::string param(const std::string& key) const {
        auto it = params.find(key);
        return it == params.end() ? std::string{} : it->second;
    }
};

/// HTTP status plus JSON body
struct ApiResponse {
    unsigned status = 200;
    nlohmann::json body;
};

/// Answers API-shaped requests from a Player.
///
/// Every call consumes the next record of the addressed key:
///   success   -> 200, payload, has_more, next_cursor = record offset
///   not found -> 404
///   exhausted -> 200, no items, has_more = false
///   other     -> 500
class ApiEmulator {
public:
    /// @param player Backing player, must outlive the emulator
    explicit ApiEmulator(chunk::Player& player);

    /// Dispatch on request.method; unknown methods are 404
    [[nodiscard]] ApiResponse handle(const ApiRequest& request);

    [[nodiscard]] ApiResponse conversations_history(const ApiRequest& request);
    [[nodiscard]] ApiResponse conversations_replies(const ApiRequest& request);
    [[nodiscard]] ApiResponse conversations_info(const ApiRequest& request);
    [[nodiscard]] ApiResponse conversations_list(const ApiRequest& request);
    [[nodiscard]] ApiResponse users_list(const ApiRequest& request);

    /// Rewind the backing player so every key replays from its first record
    [[nodiscard]] Status reset();

private:
    chunk::Player& player_;
};

}  // namespace chunkdump::replay
