// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/transport.hpp>

namespace acp
{

std::optional<std::string> LineFramer::read_message()
{
    std::string line;
    bool have_data = false;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_)
        {
            if (!fill_buffer())
            {
                // EOF: deliver an unterminated last line, then report end-of-stream
                if (have_data)
                    break;
                return std::nullopt;
            }
        }

        char c = buffer_[buffer_pos_++];
        have_data = true;

        if (c == '\n')
            break;

        line += c;
    }

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

void LineFramer::write_message(const std::string& message)
{
    std::string frame;
    frame.reserve(message.size() + 1);
    frame += message;
    frame += '\n';
    transport_.write(frame);
}

bool LineFramer::fill_buffer()
{
    if (eof_)
        return false;

    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    if (buffer_len_ == 0)
    {
        eof_ = true;
        return false;
    }
    return true;
}

} // namespace acp
