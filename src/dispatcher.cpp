// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/dispatcher.hpp>
#include <acp/logger.hpp>
#include <acp/transport.hpp>

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace acp
{

namespace
{

using Id = std::optional<JsonRpcId>;

JsonRpcResponse internal_error(const Id& id, const std::string& message)
{
    return JsonRpcResponse::failure(id, JsonRpcErrorCode::InternalError, message);
}

/// Decode params for a handler that reads them
template <typename T>
T params_as(const json& params)
{
    if (!params.is_object())
        throw std::invalid_argument(
            std::string("params must be an object, got ") + params.type_name()
        );
    return params.get<T>();
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Dispatcher::Dispatcher(
    Session& session, CompletionClient& completion, FileAccessor& files, NotificationEmitter& emitter
)
    : session_(session), completion_(completion), files_(files), emitter_(emitter)
{
    auto bind = [this](JsonRpcResponse (Dispatcher::*fn)(const json&, const Id&))
    { return [this, fn](const json& params, const Id& id) { return (this->*fn)(params, id); }; };

    handlers_["initialize"] = bind(&Dispatcher::handle_initialize);
    handlers_["session/new"] = bind(&Dispatcher::handle_session_new);
    handlers_["session/prompt"] = bind(&Dispatcher::handle_session_prompt);
    handlers_["session/cancel"] = bind(&Dispatcher::handle_session_cancel);
    handlers_["session/set_mode"] = bind(&Dispatcher::handle_session_set_mode);
    handlers_["fs/read_text_file"] = bind(&Dispatcher::handle_read_text_file);
    handlers_["fs/write_text_file"] = bind(&Dispatcher::handle_write_text_file);
}

// =============================================================================
// Dispatch
// =============================================================================

JsonRpcResponse Dispatcher::dispatch(const JsonRpcRequest& request)
{
    LOG4CPLUS_DEBUG(
        dispatch_logger(), request.method << " id=" << id_to_json(request.id).dump()
    );

    auto it = handlers_.find(request.method);
    if (it == handlers_.end())
    {
        LOG4CPLUS_WARN(dispatch_logger(), "unknown method " << request.method);
        return JsonRpcResponse::failure(
            request.id, JsonRpcErrorCode::MethodNotFound, "Method not found: " + request.method
        );
    }

    try
    {
        auto response = it->second(request.params, request.id);
        if (response.is_error())
        {
            LOG4CPLUS_WARN(
                dispatch_logger(),
                request.method << " failed (" << response.error->code
                               << "): " << response.error->message
            );
        }
        return response;
    }
    catch (const TransportError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        LOG4CPLUS_ERROR(dispatch_logger(), request.method << " threw: " << e.what());
        return internal_error(request.id, std::string("Internal error: ") + e.what());
    }
}

// =============================================================================
// initialize
// =============================================================================

JsonRpcResponse Dispatcher::handle_initialize(const json&, const Id& id)
{
    return JsonRpcResponse::success(id, InitializeResult{});
}

// =============================================================================
// session/*
// =============================================================================

JsonRpcResponse Dispatcher::handle_session_new(const json& params, const Id& id)
{
    auto new_params = params_as<NewSessionParams>(params);

    if (new_params.project_path)
    {
        auto status = session_.set_project_root(*new_params.project_path);
        if (!status)
            return internal_error(id, "Internal error: " + status.error().message);
    }
    LOG4CPLUS_INFO(dispatch_logger(), "project root " << session_.project_root().string());

    NewSessionResult result;
    result.session_id = session_.session_id();
    result.modes.current_mode_id = session_.current_mode();
    result.modes.available_modes.push_back(
        SessionMode{kChatModeId, "Chat", "General conversation mode"}
    );
    return JsonRpcResponse::success(id, result);
}

JsonRpcResponse Dispatcher::handle_session_prompt(const json& params, const Id& id)
{
    auto prompt = params_as<PromptParams>(params);
    auto message = collect_prompt_text(prompt.content);
    if (message.empty())
    {
        return JsonRpcResponse::failure(
            id, JsonRpcErrorCode::InvalidParams, "No message content provided"
        );
    }

    // The user turn stays in history even if the remote call fails
    session_.append_user(std::move(message));

    auto reply = completion_.complete(session_.history());
    if (!reply)
        return internal_error(id, "Remote API error: " + reply.error().message);

    session_.append_assistant(reply.value());
    auto chunks = emitter_.emit_text(session_.session_id(), reply.value());
    LOG4CPLUS_DEBUG(dispatch_logger(), "streamed " << chunks << " chunks");

    return JsonRpcResponse::success(id, PromptResult{});
}

JsonRpcResponse Dispatcher::handle_session_cancel(const json&, const Id& id)
{
    // Requests run to completion one at a time, so there is never anything to cancel
    return JsonRpcResponse::success(id, json::object());
}

JsonRpcResponse Dispatcher::handle_session_set_mode(const json& params, const Id& id)
{
    auto mode = params_as<SetModeParams>(params);
    LOG4CPLUS_DEBUG(dispatch_logger(), "set_mode " << mode.mode_id << " ignored");
    return JsonRpcResponse::success(id, json::object());
}

// =============================================================================
// fs/*
// =============================================================================

JsonRpcResponse Dispatcher::handle_read_text_file(const json& params, const Id& id)
{
    auto read = params_as<ReadTextFileParams>(params);

    auto content = files_.read_text(session_.resolve(read.path));
    if (!content)
    {
        if (content.error().kind == ErrorKind::NotFound)
        {
            return JsonRpcResponse::failure(
                id, JsonRpcErrorCode::InvalidParams, "File not found: " + read.path
            );
        }
        return internal_error(id, "Error reading file: " + content.error().message);
    }

    ReadTextFileResult result{select_lines(content.value(), read.line, read.limit)};
    return JsonRpcResponse::success(id, result);
}

JsonRpcResponse Dispatcher::handle_write_text_file(const json& params, const Id& id)
{
    auto write = params_as<WriteTextFileParams>(params);

    auto status = files_.write_text(session_.resolve(write.path), write.content);
    if (!status)
        return internal_error(id, "Error writing file: " + status.error().message);

    return JsonRpcResponse::success(id, json::object());
}

} // namespace acp
