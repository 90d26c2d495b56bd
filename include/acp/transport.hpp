// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when connection is closed
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the underlying byte stream (stdin/stdout, in-memory
/// buffers in tests). Framing is handled separately by LineFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @param buffer Destination buffer
    /// @param size Maximum bytes to read
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    ///
    /// The bytes must be handed to the peer before returning; implementations
    /// that buffer flush here.
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Newline-Delimited Message Framer
// =============================================================================

/// Handles newline framing for JSON-RPC messages
///
/// Message format:
/// ```
/// <json-rpc-message>\n
/// ```
///
/// A trailing `\r` is stripped from each line. A final line without a
/// terminating newline is still delivered before end-of-stream is reported.
class LineFramer
{
  public:
    explicit LineFramer(ITransport& transport) : transport_(transport) {}

    /// Read the next line
    /// @return The line without its terminator, or nullopt at end-of-stream
    /// @throws TransportError on read failure
    std::optional<std::string> read_message();

    /// Write a message followed by a newline in a single transport write
    /// @throws TransportError on write failure
    void write_message(const std::string& message);

  private:
    ITransport& transport_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
    bool eof_ = false;

    /// Refill the buffer from the transport; false at end-of-stream
    bool fill_buffer();
};

} // namespace acp
