// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <acp/transport.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include <string>

namespace acp
{

/// Transport over a pair of POSIX file descriptors (stdin/stdout by default)
///
/// Writes go straight to the descriptor with ::write, so every message is
/// visible to the peer as soon as write() returns.
class StdioTransport : public ITransport
{
  public:
    using Handle = int;
    static constexpr Handle invalid_handle()
    {
        return -1;
    }

    /// Construct from read/write handles
    /// @param read_handle Descriptor to read requests from
    /// @param write_handle Descriptor to write responses to
    /// @param owns_handles If true, handles will be closed on destruction
    StdioTransport(
        Handle read_handle = STDIN_FILENO,
        Handle write_handle = STDOUT_FILENO,
        bool owns_handles = false
    )
        : read_handle_(read_handle), write_handle_(write_handle), owns_handles_(owns_handles),
          open_(true)
    {
    }

    ~StdioTransport() override
    {
        close();
    }

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

  private:
    Handle read_handle_;
    Handle write_handle_;
    bool owns_handles_;
    bool open_;
};

inline size_t StdioTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    ssize_t bytes_read = 0;
    do
    {
        bytes_read = ::read(read_handle_, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EPIPE || errno == EBADF)
            return 0;
        throw TransportError("read() failed: " + std::string(strerror(errno)));
    }
    return static_cast<size_t>(bytes_read);
}

inline void StdioTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_handle_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            throw TransportError("write() failed: " + std::string(strerror(errno)));
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

inline void StdioTransport::close()
{
    if (!open_)
        return;
    open_ = false;

    if (owns_handles_)
    {
        if (read_handle_ != invalid_handle())
            ::close(read_handle_);
        if (write_handle_ != invalid_handle() && write_handle_ != read_handle_)
            ::close(write_handle_);
    }
    read_handle_ = invalid_handle();
    write_handle_ = invalid_handle();
}

} // namespace acp
