// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file file_accessor.hpp
/// @brief Text file access for the fs/* methods

#include <acp/result.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// FileAccessor - byte-oriented read/write capability
// =============================================================================

/// Reads and writes UTF-8 text files
///
/// Paths are already resolved against the session's project root by the
/// caller.
class FileAccessor
{
  public:
    virtual ~FileAccessor() = default;

    /// Read a whole file as UTF-8 text, dropping ill-formed byte sequences
    /// @return The text; ErrorKind::NotFound if nothing exists at `path`,
    ///         ErrorKind::Io for any other failure
    virtual Result<std::string> read_text(const std::filesystem::path& path) = 0;

    /// Write `content` to `path`, creating missing parent directories
    ///
    /// Ill-formed byte sequences in `content` are dropped before writing.
    /// @return ErrorKind::Io on failure
    virtual Status write_text(const std::filesystem::path& path, const std::string& content) = 0;
};

/// FileAccessor backed by the local filesystem
class LocalFileAccessor final : public FileAccessor
{
  public:
    Result<std::string> read_text(const std::filesystem::path& path) override;
    Status write_text(const std::filesystem::path& path, const std::string& content) override;
};

// =============================================================================
// Line Selection
// =============================================================================

/// Split text into lines on `\n`, `\r\n` or `\r`
///
/// Terminators are not kept. A trailing terminator does not produce an extra
/// empty line, and empty text yields no lines.
std::vector<std::string> split_lines(const std::string& text);

/// Select a window of lines and join them with `\n`
///
/// @param line 1-based first line; values below 1 are clamped to the start.
///             When absent the text is returned unchanged.
/// @param limit Maximum number of lines; absent means to the end. A negative
///              limit moves the end of the window back from `line + limit`,
///              wrapping around from the end of the file, so `-1` with `line`
///              1 drops the last line.
std::string select_lines(
    const std::string& text, std::optional<int64_t> line, std::optional<int64_t> limit
);

} // namespace acp
