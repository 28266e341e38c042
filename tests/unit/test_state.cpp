#include <gtest/gtest.h>
#include "state/state.hpp"
#include "fixtures.hpp"
#include <cstdio>
#include <nlohmann/json.hpp>

using namespace chunkdump;
using namespace chunkdump::fixtures;
using chunkdump::state::State;

TEST(StateTest, LedgerFromLog) {
    auto player = make_player(make_log({
        messages_chunk("C1", {make_message("1.0")}),
        messages_chunk("C1", {make_message("2.0")}),
        files_chunk("C1", "1.0", {make_file("F1")}),
    }));
    ASSERT_NE(player, nullptr);

    auto result = player->state();

    ASSERT_TRUE(result.is_ok());
    const auto& s = result.value();
    EXPECT_TRUE(s.has_message("C1", "1.0"));
    EXPECT_TRUE(s.has_message("C1", "2.0"));
    EXPECT_EQ(s.message_count(), 2u);
    EXPECT_EQ(s.channels(), (std::set<ChannelId>{"C1"}));

    EXPECT_TRUE(s.has_file("C1", "F1"));
    auto path = s.file_path("C1", "F1");
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->empty());
}

TEST(StateTest, ThreadsAreKeyedByParent) {
    State s("chunks.jsonl");
    s.apply(thread_chunk("C1", "1000.001", {make_message("1000.002"), make_message("1000.003")}));

    EXPECT_TRUE(s.has_thread_message("C1", "1000.001", "1000.003"));
    EXPECT_FALSE(s.has_thread_message("C1", "1000.002", "1000.003"));
    EXPECT_FALSE(s.has_message("C1", "1000.002"));
    EXPECT_EQ(s.thread_message_count(), 2u);
}

TEST(StateTest, OtherKindsLeaveStateUnchanged) {
    State s;
    s.apply(users_chunk({make_user("U1", "ann")}));
    s.apply(channel_info_chunk("C1", "general"));

    EXPECT_EQ(s, State{});
}

TEST(StateTest, DuplicateTimestampsCountOnce) {
    State s;
    s.add_message("C1", "1.0");
    s.add_message("C1", "1.0");

    EXPECT_EQ(s.message_count(), 1u);
}

TEST(StateTest, KnownFilePathIsKept) {
    State s;
    s.add_file("C1", "F1", "attachments/F1.txt");
    s.add_file("C1", "F1", "");

    EXPECT_EQ(s.file_path("C1", "F1"), std::optional<std::string>("attachments/F1.txt"));
    EXPECT_FALSE(s.file_path("C1", "F2").has_value());
    EXPECT_FALSE(s.has_file("C2", "F1"));
    EXPECT_EQ(s.file_count(), 1u);
}

TEST(StateTest, JsonDocument) {
    State s("chunks.jsonl");
    s.add_message("C1", "1.0");
    s.add_thread("C1", "1.0", "1.1");
    s.add_file("C1", "F1", "");

    auto j = s.to_json();

    EXPECT_EQ(j["version"], State::kVersion);
    EXPECT_EQ(j["name"], "chunks.jsonl");
    EXPECT_EQ(j["channels"]["C1"][0], "1.0");
    EXPECT_EQ(j["threads"]["C1:1.0"][0], "1.1");
    EXPECT_EQ(j["files"]["C1"]["F1"], "");

    auto back = State::from_json(j);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), s);
}

TEST(StateTest, FromJsonRejectsUnknownVersion) {
    auto result = State::from_json(nlohmann::json{{"version", 99}});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, ErrorCode::Decode);
}

TEST(StateTest, SaveAndLoad) {
    const std::string path = "test_state_temp.json";
    State s("chunks.jsonl");
    s.add_message("C1", "1.0");
    s.add_file("C1", "F1", "F1.txt");

    ASSERT_TRUE(s.save(path).is_ok());
    auto loaded = State::load(path);
    std::remove(path.c_str());

    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), s);
}

TEST(StateTest, LoadMissingFile) {
    auto loaded = State::load("nonexistent_state.json");

    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.error().code, ErrorCode::Io);
}

TEST(StateTest, StatePathForLog) {
    EXPECT_EQ(state::state_path_for("/data/chunks.jsonl"), "/data/chunks.jsonl.state");
    EXPECT_EQ(state::state_path_for("chunks.jsonl", ".ledger"), "chunks.jsonl.ledger");
}
