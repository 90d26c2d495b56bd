// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file streaming.hpp
/// @brief Delivery of assistant replies as session/update notifications

#include <acp/config.hpp>
#include <acp/jsonrpc.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace acp
{

// =============================================================================
// Chunk Sources
// =============================================================================

/// A finite, forward-only sequence of text chunks
///
/// next() returns chunks in order and nullopt once exhausted. A source cannot
/// be restarted.
class ChunkSource
{
  public:
    virtual ~ChunkSource() = default;
    virtual std::optional<std::string> next() = 0;
};

/// Splits a completed reply into slices of at most `chunk_size` code points
///
/// Multi-byte UTF-8 sequences are never split. Empty text yields no chunks; a
/// chunk size of 0 yields the whole text as one chunk.
class FixedSizeChunker final : public ChunkSource
{
  public:
    FixedSizeChunker(std::string text, size_t chunk_size);

    std::optional<std::string> next() override;

  private:
    std::string text_;
    size_t chunk_size_;
    size_t pos_ = 0;
};

// =============================================================================
// NotificationEmitter
// =============================================================================

/// Emits one agent_message_chunk notification per chunk
///
/// Every chunk is sent, in order, before emit() returns; the caller writes its
/// final response afterwards. The emitter pauses for the configured delay
/// between consecutive chunks.
class NotificationEmitter
{
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// @param sink Output channel shared with the transport loop
    /// @param options Chunk size and pacing delay
    /// @param sleep Pacing function (defaults to std::this_thread::sleep_for)
    NotificationEmitter(MessageSink& sink, StreamingOptions options, Sleeper sleep = {});

    /// Drain `source`, sending each chunk as a session/update notification
    /// @return Number of notifications sent
    size_t emit(const std::string& session_id, ChunkSource& source);

    /// Chunk `text` with FixedSizeChunker and emit it
    size_t emit_text(const std::string& session_id, const std::string& text);

    const StreamingOptions& options() const
    {
        return options_;
    }

  private:
    MessageSink& sink_;
    StreamingOptions options_;
    Sleeper sleep_;
};

} // namespace acp
