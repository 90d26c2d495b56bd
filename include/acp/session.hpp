// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session.hpp
/// @brief Session holding the single conversation served by the bridge

#include <acp/result.hpp>
#include <acp/types.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// Session - the one conversation of this process
// =============================================================================

/// The conversation state shared by all handlers
///
/// Exactly one Session exists per process. It is created before the first
/// request and passed by reference to the dispatcher. History is append-only
/// and is replayed in full to the completion client on every prompt.
///
/// Not thread-safe: the transport loop processes one request at a time.
class Session
{
  public:
    /// Create a session rooted at the current working directory
    Session();

    /// Create a session rooted at `project_root` (made absolute)
    explicit Session(
        const std::filesystem::path& project_root, std::string session_id = kDefaultSessionId
    );

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // =========================================================================
    // Session Properties
    // =========================================================================

    const std::string& session_id() const
    {
        return session_id_;
    }

    const std::filesystem::path& project_root() const
    {
        return project_root_;
    }

    const std::string& current_mode() const
    {
        return current_mode_;
    }

    /// Resolve `path` to an absolute location and make it the project root
    ///
    /// Symlinks in the existing part of the path are resolved; the path need
    /// not exist. History is left untouched.
    Status set_project_root(const std::filesystem::path& path);

    /// Resolve a client-supplied path against the project root
    ///
    /// Absolute paths are returned unchanged.
    std::filesystem::path resolve(const std::string& path) const;

    // =========================================================================
    // Conversation History
    // =========================================================================

    const std::vector<Turn>& history() const
    {
        return history_;
    }

    void append_user(std::string content);
    void append_assistant(std::string content);

  private:
    std::string session_id_;
    std::filesystem::path project_root_;
    std::string current_mode_ = kChatModeId;
    std::vector<Turn> history_;
};

} // namespace acp
