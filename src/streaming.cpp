// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/streaming.hpp>
#include <acp/utf8.hpp>

#include <thread>

namespace acp
{

// =============================================================================
// FixedSizeChunker
// =============================================================================

FixedSizeChunker::FixedSizeChunker(std::string text, size_t chunk_size)
    : text_(std::move(text)), chunk_size_(chunk_size)
{
}

std::optional<std::string> FixedSizeChunker::next()
{
    if (pos_ >= text_.size())
        return std::nullopt;

    size_t end = chunk_size_ == 0 ? text_.size() : utf8::advance(text_, pos_, chunk_size_);
    std::string chunk = text_.substr(pos_, end - pos_);
    pos_ = end;
    return chunk;
}

// =============================================================================
// NotificationEmitter
// =============================================================================

NotificationEmitter::NotificationEmitter(
    MessageSink& sink, StreamingOptions options, Sleeper sleep
)
    : sink_(sink), options_(options), sleep_(std::move(sleep))
{
    if (!sleep_)
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

size_t NotificationEmitter::emit(const std::string& session_id, ChunkSource& source)
{
    size_t sent = 0;
    while (auto chunk = source.next())
    {
        if (sent > 0 && options_.chunk_delay.count() > 0)
            sleep_(options_.chunk_delay);

        sink_.send(make_notification("session/update", AgentMessageChunk{session_id, *chunk}));
        ++sent;
    }
    return sent;
}

size_t NotificationEmitter::emit_text(const std::string& session_id, const std::string& text)
{
    FixedSizeChunker chunker(text, options_.chunk_size);
    return emit(session_id, chunker);
}

} // namespace acp
