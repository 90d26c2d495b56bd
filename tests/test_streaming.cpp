// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "test_helpers.hpp"

#include <acp/streaming.hpp>
#include <acp/utf8.hpp>
#include <gtest/gtest.h>

using namespace acp;
using acp::test::RecordingSink;

namespace
{

std::vector<std::string> drain(ChunkSource& source)
{
    std::vector<std::string> chunks;
    while (auto chunk = source.next())
        chunks.push_back(*chunk);
    return chunks;
}

StreamingOptions no_delay(size_t chunk_size = 50)
{
    StreamingOptions options;
    options.chunk_size = chunk_size;
    options.chunk_delay = std::chrono::milliseconds{0};
    return options;
}

/// Yields pre-built chunks, standing in for an incremental source
class ListSource : public ChunkSource
{
  public:
    explicit ListSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

    std::optional<std::string> next() override
    {
        if (index_ >= chunks_.size())
            return std::nullopt;
        return chunks_[index_++];
    }

  private:
    std::vector<std::string> chunks_;
    size_t index_ = 0;
};

} // namespace

// =============================================================================
// FixedSizeChunker Tests
// =============================================================================

TEST(FixedSizeChunkerTest, EmptyTextYieldsNoChunks)
{
    FixedSizeChunker chunker("", 50);
    EXPECT_FALSE(chunker.next().has_value());
}

TEST(FixedSizeChunkerTest, ShortTextIsOneChunk)
{
    FixedSizeChunker chunker("hello", 50);
    EXPECT_EQ(drain(chunker), (std::vector<std::string>{"hello"}));
}

TEST(FixedSizeChunkerTest, ExactMultipleHasNoEmptyTail)
{
    FixedSizeChunker chunker(std::string(100, 'a'), 50);
    auto chunks = drain(chunker);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].size(), 50u);
    EXPECT_EQ(chunks[1].size(), 50u);
}

TEST(FixedSizeChunkerTest, FinalChunkMayBeShorter)
{
    FixedSizeChunker chunker(std::string(123, 'b'), 50);
    auto chunks = drain(chunker);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].size(), 23u);
}

TEST(FixedSizeChunkerTest, CountsCodePointsNotBytes)
{
    // 3 x U+00E9 followed by 2 x U+20AC
    std::string text = "\xc3\xa9\xc3\xa9\xc3\xa9\xe2\x82\xac\xe2\x82\xac";
    FixedSizeChunker chunker(text, 2);
    auto chunks = drain(chunker);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], "\xc3\xa9\xc3\xa9");
    EXPECT_EQ(chunks[1], "\xc3\xa9\xe2\x82\xac");
    EXPECT_EQ(chunks[2], "\xe2\x82\xac");
}

TEST(FixedSizeChunkerTest, ZeroChunkSizeKeepsTextWhole)
{
    FixedSizeChunker chunker("abcdef", 0);
    EXPECT_EQ(drain(chunker), (std::vector<std::string>{"abcdef"}));
}

TEST(FixedSizeChunkerTest, ExhaustedSourceStaysExhausted)
{
    FixedSizeChunker chunker("ab", 1);
    drain(chunker);
    EXPECT_FALSE(chunker.next().has_value());
    EXPECT_FALSE(chunker.next().has_value());
}

// =============================================================================
// NotificationEmitter Tests
// =============================================================================

TEST(NotificationEmitterTest, EmitsSessionUpdatePerChunk)
{
    RecordingSink sink;
    NotificationEmitter emitter(sink, no_delay());

    std::string reply(120, 'z');
    EXPECT_EQ(emitter.emit_text("s-1", reply), 3u);
    ASSERT_EQ(sink.messages.size(), 3u);

    for (const auto& message : sink.messages)
    {
        EXPECT_EQ(message["jsonrpc"], "2.0");
        EXPECT_EQ(message["method"], "session/update");
        EXPECT_FALSE(message.contains("id"));
        EXPECT_EQ(message["params"]["sessionId"], "s-1");
        EXPECT_EQ(message["params"]["sessionUpdate"], "agent_message_chunk");
        EXPECT_EQ(message["params"]["content"]["type"], "text");
    }
}

TEST(NotificationEmitterTest, ConcatenatedChunksReconstructReply)
{
    RecordingSink sink;
    NotificationEmitter emitter(sink, no_delay());

    std::string reply;
    for (int i = 0; i < 40; ++i)
        reply += "word" + std::to_string(i) + " \xe2\x9c\x93 ";

    auto sent = emitter.emit_text("s", reply);
    auto expected = (utf8::length(reply) + 49) / 50;
    EXPECT_EQ(sent, expected);
    ASSERT_EQ(sink.messages.size(), expected);

    std::string rebuilt;
    for (const auto& message : sink.messages)
        rebuilt += message["params"]["content"]["text"].get<std::string>();
    EXPECT_EQ(rebuilt, reply);
}

TEST(NotificationEmitterTest, EmptyReplySendsNothing)
{
    RecordingSink sink;
    NotificationEmitter emitter(sink, no_delay());

    EXPECT_EQ(emitter.emit_text("s", ""), 0u);
    EXPECT_TRUE(sink.messages.empty());
}

TEST(NotificationEmitterTest, PausesOnlyBetweenChunks)
{
    RecordingSink sink;
    std::vector<std::chrono::milliseconds> pauses;
    StreamingOptions options;
    options.chunk_size = 10;
    options.chunk_delay = std::chrono::milliseconds{25};

    NotificationEmitter emitter(
        sink, options, [&](std::chrono::milliseconds delay) { pauses.push_back(delay); }
    );

    emitter.emit_text("s", std::string(35, 'q'));
    EXPECT_EQ(sink.messages.size(), 4u);
    ASSERT_EQ(pauses.size(), 3u);
    for (auto pause : pauses)
        EXPECT_EQ(pause.count(), 25);
}

TEST(NotificationEmitterTest, AcceptsAnyChunkSource)
{
    RecordingSink sink;
    NotificationEmitter emitter(sink, no_delay());
    ListSource source({"alpha ", "beta ", "gamma"});

    EXPECT_EQ(emitter.emit("s", source), 3u);
    ASSERT_EQ(sink.messages.size(), 3u);
    EXPECT_EQ(sink.messages[0]["params"]["content"]["text"], "alpha ");
    EXPECT_EQ(sink.messages[1]["params"]["content"]["text"], "beta ");
    EXPECT_EQ(sink.messages[2]["params"]["content"]["text"], "gamma");
}
