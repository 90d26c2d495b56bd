// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file dispatcher.hpp
/// @brief Maps ACP method names onto handlers

#include <acp/completion.hpp>
#include <acp/file_accessor.hpp>
#include <acp/jsonrpc.hpp>
#include <acp/session.hpp>
#include <acp/streaming.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace acp
{

// =============================================================================
// Dispatcher
// =============================================================================

/// Routes each request to its handler and shapes every outcome as a response
///
/// Recognized methods:
/// - `initialize`
/// - `session/new`, `session/prompt`, `session/cancel`, `session/set_mode`
/// - `fs/read_text_file`, `fs/write_text_file`
///
/// dispatch() always returns exactly one response carrying the request id.
/// Handler failures become error responses; only TransportError, raised when
/// the output channel itself fails, propagates to the caller.
class Dispatcher
{
  public:
    using Handler =
        std::function<JsonRpcResponse(const json& params, const std::optional<JsonRpcId>& id)>;

    Dispatcher(
        Session& session,
        CompletionClient& completion,
        FileAccessor& files,
        NotificationEmitter& emitter
    );

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Run the handler for `request.method`
    /// @throws TransportError if notifications cannot be written
    JsonRpcResponse dispatch(const JsonRpcRequest& request);

  private:
    JsonRpcResponse handle_initialize(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_session_new(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_session_prompt(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_session_cancel(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_session_set_mode(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_read_text_file(const json& params, const std::optional<JsonRpcId>& id);
    JsonRpcResponse handle_write_text_file(const json& params, const std::optional<JsonRpcId>& id);

    Session& session_;
    CompletionClient& completion_;
    FileAccessor& files_;
    NotificationEmitter& emitter_;
    std::map<std::string, Handler> handlers_;
};

} // namespace acp
