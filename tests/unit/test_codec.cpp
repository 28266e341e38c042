#include <gtest/gtest.h>
#include "chunk/codec.hpp"
#include "fixtures.hpp"
#include <nlohmann/json.hpp>

using namespace chunkdump;
using namespace chunkdump::chunk;
using namespace chunkdump::fixtures;

// ============================================================================
// Record format
// ============================================================================

TEST(CodecTest, EncodeIsOneLine) {
    auto line = ChunkCodec::encode(messages_chunk("C1", make_messages(3))).value();

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(CodecTest, EncodeUsesAbbreviatedKeys) {
    auto line = ChunkCodec::encode(thread_chunk("C1", "1000.001", make_messages(1, 1001))).value();
    auto j = nlohmann::json::parse(line);

    EXPECT_EQ(j["t"], 1);
    EXPECT_EQ(j["id"], "C1");
    EXPECT_EQ(j["r"], "1000.001");
    EXPECT_EQ(j["n"], 1);
    EXPECT_TRUE(j["l"].get<bool>());
    EXPECT_EQ(j["p"]["ts"], "1000.001");
    ASSERT_EQ(j["m"].size(), 1u);
    EXPECT_EQ(j["m"][0]["ts"], "1001.000001");
}

TEST(CodecTest, EncodeOmitsEmptyFields) {
    auto j = nlohmann::json::parse(ChunkCodec::encode(users_chunk({})).value());

    EXPECT_EQ(j["t"], 3);
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("n"));
    EXPECT_FALSE(j.contains("r"));
    EXPECT_FALSE(j.contains("u"));
}

TEST(CodecTest, DecodeRestoresMessages) {
    auto written = messages_chunk("C1", make_messages(2), true);

    auto decoded = ChunkCodec::decode(ChunkCodec::encode(written).value());

    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), written);
}

TEST(CodecTest, DecodeRestoresFilesWithChannel) {
    auto written = files_chunk("C1", "1000.5", {make_file("F1"), make_file("F2")});
    std::get<FilesPayload>(written.payload).channel = make_channel("C1", "general");

    auto decoded = ChunkCodec::decode(ChunkCodec::encode(written).value());

    ASSERT_TRUE(decoded.is_ok());
    const auto* files = decoded.value().as<FilesPayload>();
    ASSERT_NE(files, nullptr);
    ASSERT_TRUE(files->channel.has_value());
    EXPECT_EQ(files->channel->name, "general");
    ASSERT_EQ(files->files.size(), 2u);
    EXPECT_EQ(files->files[1].id, "F2");
}

TEST(CodecTest, DecodeRecordWithoutNewline) {
    auto decoded = ChunkCodec::decode(R"({"t":4,"ts":1,"ch":[{"id":"C1","name":"general"}]})");

    ASSERT_TRUE(decoded.is_ok());
    const auto* channels = decoded.value().as<ChannelsPayload>();
    ASSERT_NE(channels, nullptr);
    ASSERT_EQ(channels->channels.size(), 1u);
    EXPECT_EQ(channels->channels[0].id, "C1");
}

TEST(CodecTest, DecodeIgnoresUnknownKeys) {
    auto decoded = ChunkCodec::decode(R"({"t":0,"id":"C1","extra":{"x":1},"m":[{"ts":"1.1","text":"hi"}]})");

    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().as<MessagesPayload>()->messages[0].text, "hi");
}

// ============================================================================
// Errors
// ============================================================================

TEST(CodecTest, MalformedJsonIsDecodeError) {
    auto decoded = ChunkCodec::decode("{\"t\":0, ");

    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, ErrorCode::Decode);
}

TEST(CodecTest, NonObjectIsDecodeError) {
    auto decoded = ChunkCodec::decode("[1,2,3]");

    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, ErrorCode::Decode);
}

TEST(CodecTest, MissingTypeIsDecodeError) {
    auto decoded = ChunkCodec::decode(R"({"id":"C1"})");

    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, ErrorCode::Decode);
}

TEST(CodecTest, UnknownTypeTagIsUnsupported) {
    auto decoded = ChunkCodec::decode(R"({"t":42,"id":"C1"})");

    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, ErrorCode::UnsupportedAddress);
}

TEST(CodecTest, WrongFieldTypeIsDecodeError) {
    auto decoded = ChunkCodec::decode(R"({"t":0,"id":"C1","m":"not a list"})");

    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, ErrorCode::Decode);
}

TEST(CodecTest, InvalidUtf8IsRejectedOnEncode) {
    auto chunk = messages_chunk("C1", {make_message("1.0", "bad\xff\xfe")});

    auto encoded = ChunkCodec::encode(chunk);

    ASSERT_TRUE(encoded.is_err());
    EXPECT_EQ(encoded.error().code, ErrorCode::InvalidArgument);
}
