// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/file_accessor.hpp>
#include <acp/logger.hpp>
#include <acp/utf8.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace acp
{

namespace
{

std::string errno_message()
{
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("I/O error");
}

} // namespace

// =============================================================================
// LocalFileAccessor
// =============================================================================

Result<std::string> LocalFileAccessor::read_text(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        if (ec && ec != std::errc::no_such_file_or_directory)
            return Error{ErrorKind::Io, ec.message()};
        return Error{ErrorKind::NotFound, "No such file: " + path.string()};
    }

    if (std::filesystem::is_directory(path, ec))
        return Error{ErrorKind::Io, "Is a directory: " + path.string()};

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorKind::Io, errno_message() + ": " + path.string()};

    std::ostringstream bytes;
    bytes << in.rdbuf();
    if (in.bad())
        return Error{ErrorKind::Io, errno_message() + ": " + path.string()};

    auto raw = bytes.str();
    LOG4CPLUS_DEBUG(fs_logger(), "read " << raw.size() << " bytes from " << path.string());
    return utf8::sanitize(raw);
}

Status LocalFileAccessor::write_text(const std::filesystem::path& path, const std::string& content)
{
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
            return Error{ErrorKind::Io, ec.message() + ": " + parent.string()};
    }

    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorKind::Io, errno_message() + ": " + path.string()};

    auto text = utf8::sanitize(content);
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        return Error{ErrorKind::Io, errno_message() + ": " + path.string()};

    LOG4CPLUS_DEBUG(fs_logger(), "wrote " << text.size() << " bytes to " << path.string());
    return Status::success();
}

// =============================================================================
// Line Selection
// =============================================================================

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\n' || c == '\r')
        {
            lines.push_back(std::move(current));
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            continue;
        }
        current += c;
    }

    if (!current.empty())
        lines.push_back(std::move(current));
    return lines;
}

std::string select_lines(
    const std::string& text, std::optional<int64_t> line, std::optional<int64_t> limit
)
{
    if (!line)
        return text;

    auto lines = split_lines(text);
    const auto total = static_cast<int64_t>(lines.size());

    int64_t start = *line <= 1 ? 0 : std::min(*line - 1, total);
    int64_t end = total;
    if (limit && *limit >= 0)
    {
        if (*limit < total - start)
            end = start + *limit;
    }
    else if (limit)
    {
        // A negative limit counts back from the end of the file
        end = start + *limit;
        if (end < 0)
            end = std::max<int64_t>(end + total, 0);
    }

    std::string out;
    for (int64_t i = start; i < end; ++i)
    {
        if (i > start)
            out += '\n';
        out += lines[static_cast<size_t>(i)];
    }
    return out;
}

} // namespace acp
