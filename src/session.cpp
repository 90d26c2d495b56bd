// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/session.hpp>
#include <system_error>

namespace acp
{

namespace
{

Result<std::filesystem::path> absolute_path(const std::filesystem::path& path)
{
    std::error_code ec;
    // An empty path names the working directory
    auto absolute = std::filesystem::absolute(path.empty() ? "." : path, ec);
    if (ec)
        return Error{ErrorKind::Io, "Cannot resolve " + path.string() + ": " + ec.message()};

    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec)
        return Error{ErrorKind::Io, "Cannot resolve " + path.string() + ": " + ec.message()};
    return canonical;
}

} // namespace

// =============================================================================
// Constructors
// =============================================================================

Session::Session() : Session(std::filesystem::current_path()) {}

Session::Session(const std::filesystem::path& project_root, std::string session_id)
    : session_id_(std::move(session_id))
{
    auto resolved = absolute_path(project_root);
    project_root_ = resolved ? resolved.value() : project_root;
}

// =============================================================================
// Project Root
// =============================================================================

Status Session::set_project_root(const std::filesystem::path& path)
{
    auto resolved = absolute_path(path);
    if (!resolved)
        return resolved.error();
    project_root_ = std::move(resolved).value();
    return Status::success();
}

std::filesystem::path Session::resolve(const std::string& path) const
{
    return project_root_ / path;
}

// =============================================================================
// History
// =============================================================================

void Session::append_user(std::string content)
{
    history_.push_back(Turn{Role::User, std::move(content)});
}

void Session::append_assistant(std::string content)
{
    history_.push_back(Turn{Role::Assistant, std::move(content)});
}

} // namespace acp
