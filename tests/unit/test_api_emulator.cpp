#include <gtest/gtest.h>
#include "replay/api_emulator.hpp"
#include "replay/replay_server.hpp"
#include "fixtures.hpp"
#include <spdlog/spdlog.h>

using namespace chunkdump;
using namespace chunkdump::fixtures;
using namespace chunkdump::replay;

class ApiEmulatorTest : public ::testing::Test {
protected:
    std::unique_ptr<chunk::Player> player;
    std::unique_ptr<ApiEmulator> emulator;

    void SetUp() override {
        player = make_player(make_log({
            messages_chunk("C1", make_messages(2, 1000)),
            thread_chunk("C1", "1000.000001", make_messages(2, 1001)),
            messages_chunk("C1", make_messages(1, 2000), true),
            channel_info_chunk("C1", "general"),
            channels_chunk({make_channel("C1", "general")}),
            users_chunk({make_user("U1", "ann")}),
        }));
        ASSERT_NE(player, nullptr);
        emulator = std::make_unique<ApiEmulator>(*player);
    }

    ApiResponse call(const std::string& method, std::map<std::string, std::string> params = {}) {
        return emulator->handle(ApiRequest{method, std::move(params)});
    }
};

TEST_F(ApiEmulatorTest, HistoryPagesThroughChannel) {
    auto first = call("conversations.history", {{"channel", "C1"}});
    EXPECT_EQ(first.status, 200u);
    EXPECT_TRUE(first.body["ok"].get<bool>());
    EXPECT_EQ(first.body["messages"].size(), 2u);
    EXPECT_TRUE(first.body["has_more"].get<bool>());
    EXPECT_EQ(first.body["response_metadata"]["next_cursor"].get<std::string>(), "0");

    auto second = call("conversations.history", {{"channel", "C1"}});
    EXPECT_EQ(second.status, 200u);
    EXPECT_EQ(second.body["messages"].size(), 1u);
    EXPECT_FALSE(second.body["has_more"].get<bool>());

    auto done = call("conversations.history", {{"channel", "C1"}});
    EXPECT_EQ(done.status, 200u);
    EXPECT_TRUE(done.body["ok"].get<bool>());
    EXPECT_TRUE(done.body["messages"].empty());
    EXPECT_FALSE(done.body["has_more"].get<bool>());
    EXPECT_EQ(done.body["response_metadata"]["next_cursor"].get<std::string>(), "");
}

TEST_F(ApiEmulatorTest, HistoryOfUnknownChannelIsNotFound) {
    auto resp = call("conversations.history", {{"channel", "C404"}});

    EXPECT_EQ(resp.status, 404u);
    EXPECT_FALSE(resp.body["ok"].get<bool>());
    EXPECT_EQ(resp.body["error"].get<std::string>(), "not_found");
}

TEST_F(ApiEmulatorTest, RepliesOfRecordedThread) {
    auto resp = call("conversations.replies", {{"channel", "C1"}, {"ts", "1000.000001"}});

    EXPECT_EQ(resp.status, 200u);
    ASSERT_EQ(resp.body["messages"].size(), 2u);
    EXPECT_EQ(resp.body["messages"][0]["ts"].get<std::string>(), "1001.000001");
    EXPECT_FALSE(resp.body["has_more"].get<bool>());
}

TEST_F(ApiEmulatorTest, RepliesOfUnrecordedThreadAfterReset) {
    auto first = call("conversations.replies", {{"channel", "C1"}, {"ts", "9999.999"}});
    EXPECT_EQ(first.status, 404u);

    // Drain another key, then reset; the missing thread answers exactly as before
    (void)call("conversations.history", {{"channel", "C1"}});
    ASSERT_TRUE(emulator->reset().is_ok());

    auto again = call("conversations.replies", {{"channel", "C1"}, {"ts", "9999.999"}});
    EXPECT_EQ(again.status, first.status);
    EXPECT_EQ(again.body, first.body);

    auto history = call("conversations.history", {{"channel", "C1"}});
    EXPECT_EQ(history.body["messages"].size(), 2u);
}

TEST_F(ApiEmulatorTest, RepliesRequireTsAndChannel) {
    EXPECT_EQ(call("conversations.replies", {{"channel", "C1"}}).status, 400u);
    EXPECT_EQ(call("conversations.replies", {{"ts", "1.1"}}).status, 400u);
}

TEST_F(ApiEmulatorTest, InfoListAndUsers) {
    auto info = call("conversations.info", {{"channel", "C1"}});
    EXPECT_EQ(info.status, 200u);
    EXPECT_EQ(info.body["channel"]["name"].get<std::string>(), "general");

    auto list = call("conversations.list");
    EXPECT_EQ(list.status, 200u);
    EXPECT_EQ(list.body["channels"].size(), 1u);

    auto users = call("users.list");
    EXPECT_EQ(users.status, 200u);
    EXPECT_EQ(users.body["members"][0]["name"].get<std::string>(), "ann");

    EXPECT_EQ(call("conversations.info").status, 400u);
}

TEST_F(ApiEmulatorTest, ExhaustedInfoKeepsObjectShape) {
    ASSERT_EQ(call("conversations.info", {{"channel", "C1"}}).status, 200u);

    auto done = call("conversations.info", {{"channel", "C1"}});

    EXPECT_EQ(done.status, 200u);
    EXPECT_TRUE(done.body["ok"].get<bool>());
    EXPECT_TRUE(done.body["channel"].is_object());
    EXPECT_TRUE(done.body["channel"].empty());
    EXPECT_FALSE(done.body["has_more"].get<bool>());
}

TEST_F(ApiEmulatorTest, NonUtf8ParameterIsNotFound) {
    // Debug level so the request log line is formatted
    const auto level = spdlog::get_level();
    spdlog::set_level(spdlog::level::debug);
    auto resp = call("conversations.history", {{"channel", "\xff"}});
    spdlog::set_level(level);

    EXPECT_EQ(resp.status, 404u);
    EXPECT_EQ(resp.body["error"].get<std::string>(), "not_found");
}

TEST_F(ApiEmulatorTest, UnknownMethod) {
    auto resp = call("chat.postMessage");

    EXPECT_EQ(resp.status, 404u);
    EXPECT_EQ(resp.body["error"].get<std::string>(), "unknown_method");
}

// ============================================================================
// Request parsing
// ============================================================================

TEST(RequestParsingTest, ParseFormDecodes) {
    auto form = parse_form("channel=C1&text=hello%20world&q=a+b&flag");

    EXPECT_EQ(form["channel"], "C1");
    EXPECT_EQ(form["text"], "hello world");
    EXPECT_EQ(form["q"], "a b");
    EXPECT_EQ(form.count("flag"), 1u);
}

TEST(RequestParsingTest, MethodFromTarget) {
    auto req = make_api_request("/api/conversations.history?channel=C1&limit=100", "", "");

    EXPECT_EQ(req.method, "conversations.history");
    EXPECT_EQ(req.param("channel"), "C1");
    EXPECT_EQ(req.param("limit"), "100");
    EXPECT_EQ(req.param("cursor"), "");
}

TEST(RequestParsingTest, FormBodyOverridesQuery) {
    auto req = make_api_request("/api/conversations.replies?channel=C1",
                                "channel=C2&ts=1.1",
                                "application/x-www-form-urlencoded; charset=utf-8");

    EXPECT_EQ(req.method, "conversations.replies");
    EXPECT_EQ(req.param("channel"), "C2");
    EXPECT_EQ(req.param("ts"), "1.1");
}
