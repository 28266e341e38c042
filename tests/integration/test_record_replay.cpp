#include <gtest/gtest.h>
#include "app/commands.hpp"
#include "app/streamer.hpp"
#include "chunk/recorder.hpp"
#include "state/state.hpp"
#include "fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace chunkdump;
using namespace chunkdump::fixtures;

/// Full cycle: archive log -> record (channel cut) -> state file -> player
class RecordReplayTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::filesystem::path source_path;
    Config config;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("chunkdump_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir);
        source_path = dir / "source.jsonl";

        std::ofstream out(source_path, std::ios::binary);
        out << make_log({
            users_chunk({make_user("U1", "ann")}),
            messages_chunk("C1", {make_message("1.0"), make_message("2.0")}),
            messages_chunk("C2", {make_message("5.0")}, true),
            thread_chunk("C1", "1.0", {make_message("1.1")}),
            files_chunk("C1", "2.0", {make_file("F1")}),
            messages_chunk("C1", {make_message("3.0")}, true),
        });

        config = Config::defaults();
        config.storage.output_dir = dir.string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

TEST_F(RecordReplayTest, RecordCutsOneChannel) {
    auto source = chunk::Player::open(source_path);
    ASSERT_TRUE(source.is_ok());
    app::ArchiveStreamer streamer(*source.value());

    app::RecordOptions options;
    options.output = "cut.jsonl";
    options.channels = {"C1"};

    auto recorded = app::run_record(config, options, streamer);
    ASSERT_TRUE(recorded.is_ok()) << recorded.error().to_string();
    EXPECT_EQ(recorded.value(), (dir / "cut.jsonl").string());

    auto player = chunk::Player::open(recorded.value());
    ASSERT_TRUE(player.is_ok());
    auto& p = *player.value();

    EXPECT_EQ(p.channel_ids(), (std::vector<ChannelId>{"C1"}));
    EXPECT_EQ(p.messages("C1").value().size(), 2u);
    EXPECT_EQ(p.messages("C1").value().size(), 1u);
    EXPECT_EQ(p.messages("C1").error().code, ErrorCode::Exhausted);
    EXPECT_EQ(p.thread("C1", "1.0").value().size(), 1u);
    EXPECT_EQ(p.files("C1", "2.0").value()[0].id, "F1");
    EXPECT_EQ(p.messages("C2").error().code, ErrorCode::NotFound);
}

TEST_F(RecordReplayTest, RecordWritesStateNextToLog) {
    auto source = chunk::Player::open(source_path);
    ASSERT_TRUE(source.is_ok());
    app::ArchiveStreamer streamer(*source.value());

    app::RecordOptions options;
    options.output = "cut.jsonl";
    options.channels = {"C1", "C2"};

    auto recorded = app::run_record(config, options, streamer);
    ASSERT_TRUE(recorded.is_ok());

    auto saved = state::State::load(config.state_path(recorded.value()));
    ASSERT_TRUE(saved.is_ok());
    const auto& s = saved.value();
    EXPECT_EQ(s.name(), "cut.jsonl");
    EXPECT_TRUE(s.has_message("C1", "3.0"));
    EXPECT_TRUE(s.has_message("C2", "5.0"));
    EXPECT_TRUE(s.has_thread_message("C1", "1.0", "1.1"));
    EXPECT_TRUE(s.has_file("C1", "F1"));

    // The ledger derived from the log agrees with the one written while recording
    auto player = chunk::Player::open(recorded.value());
    ASSERT_TRUE(player.is_ok());
    auto derived = player.value()->state();
    ASSERT_TRUE(derived.is_ok());
    EXPECT_EQ(derived.value(), s);
}

TEST_F(RecordReplayTest, RecordUnknownChannelFails) {
    auto source = chunk::Player::open(source_path);
    ASSERT_TRUE(source.is_ok());
    app::ArchiveStreamer streamer(*source.value());

    app::RecordOptions options;
    options.output = "cut.jsonl";
    options.channels = {"C404"};

    auto recorded = app::run_record(config, options, streamer);

    ASSERT_TRUE(recorded.is_err());
    EXPECT_EQ(recorded.error().code, ErrorCode::NotFound);
}

TEST_F(RecordReplayTest, RecordNeedsChannels) {
    auto source = chunk::Player::open(source_path);
    ASSERT_TRUE(source.is_ok());
    app::ArchiveStreamer streamer(*source.value());

    app::RecordOptions options;
    options.output = "cut.jsonl";

    auto recorded = app::run_record(config, options, streamer);

    ASSERT_TRUE(recorded.is_err());
    EXPECT_EQ(recorded.error().code, ErrorCode::InvalidArgument);
}

TEST_F(RecordReplayTest, RecordStatePrintsLedger) {
    std::ostringstream out;

    auto status = app::run_record_state(source_path.string(), out);

    ASSERT_TRUE(status.is_ok());
    auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j["name"].get<std::string>(), "source.jsonl");
    EXPECT_EQ(j["channels"]["C1"].size(), 3u);
    EXPECT_EQ(j["channels"]["C2"].size(), 1u);
    EXPECT_EQ(j["files"]["C1"]["F1"].get<std::string>(), "");
}

TEST_F(RecordReplayTest, RecordStateOfMissingLog) {
    std::ostringstream out;

    auto status = app::run_record_state((dir / "missing.jsonl").string(), out);

    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error().code, ErrorCode::Io);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RecordReplayTest, ChannelsListsPlainChannels) {
    std::ostringstream out;

    auto status = app::run_channels(source_path.string(), out);

    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(out.str(), "C1\nC2\n");
}
