// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <acp/result.hpp>
#include <acp/types.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace acp
{

// =============================================================================
// JSON-RPC 2.0 Error Codes
// =============================================================================

/// JSON-RPC error codes used by the bridge
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC request ID
///
/// Held as the raw JSON value (string, integer of either sign, float, even an
/// object) so it is echoed back exactly as the client sent it.
using JsonRpcId = json;

/// Convert an optional JsonRpcId to JSON (null when absent)
inline json id_to_json(const std::optional<JsonRpcId>& id)
{
    if (!id)
        return nullptr;
    return *id;
}

/// JSON-RPC 2.0 Request
struct JsonRpcRequest
{
    std::string method;
    json params = json::object();
    std::optional<JsonRpcId> id; // nullopt for notifications

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        if (id)
            j["id"] = *id;
        return j;
    }

    /// Decode a parsed envelope
    ///
    /// Only a value that is not a JSON object is rejected. A missing `method`
    /// decodes as `"null"` and a non-string one as its JSON text, so neither
    /// matches a handler and the caller still answers with the request id. A
    /// missing or null `params` becomes an empty object; a missing or null
    /// `id` marks a notification.
    static Result<JsonRpcRequest> from_json(const json& j)
    {
        if (!j.is_object())
            return Error{ErrorKind::InvalidArgument, "Request is not a JSON object"};

        JsonRpcRequest req;
        auto method = j.find("method");
        if (method == j.end())
            req.method = "null";
        else if (method->is_string())
            req.method = method->get<std::string>();
        else
            req.method = method->dump();

        if (j.contains("params") && !j.at("params").is_null())
            req.params = j.at("params");
        if (j.contains("id") && !j.at("id").is_null())
            req.id.emplace(j.at("id"));
        return req;
    }

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code = static_cast<int>(JsonRpcErrorCode::InternalError);
    std::string message;

    json to_json() const
    {
        return json{{"code", code}, {"message", message}};
    }
};

/// JSON-RPC 2.0 Response
///
/// Holds exactly one of result or error. The id is null for framing failures
/// and for requests that arrived without one.
struct JsonRpcResponse
{
    std::optional<JsonRpcId> id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    static JsonRpcResponse success(const std::optional<JsonRpcId>& id, json result)
    {
        return JsonRpcResponse{id, std::move(result), std::nullopt};
    }

    static JsonRpcResponse failure(
        const std::optional<JsonRpcId>& id, JsonRpcErrorCode code, std::string message
    )
    {
        return JsonRpcResponse{
            id, std::nullopt, JsonRpcErrorObject{static_cast<int>(code), std::move(message)}
        };
    }

    json to_json() const
    {
        json j = {{"jsonrpc", "2.0"}, {"id", id_to_json(id)}};
        if (error)
            j["error"] = error->to_json();
        else
            j["result"] = result.value_or(json::object());
        return j;
    }

    bool is_error() const
    {
        return error.has_value();
    }
};

/// Build a server-to-client notification (no id, no response expected)
inline json make_notification(const std::string& method, const json& params)
{
    return JsonRpcRequest{method, params, std::nullopt}.to_json();
}

// =============================================================================
// Outbound Channel
// =============================================================================

/// Destination for messages written to the client
///
/// send() returns only after the message has been handed to the output
/// channel, so messages arrive in call order.
class MessageSink
{
  public:
    virtual ~MessageSink() = default;

    /// @throws TransportError if the output channel fails
    virtual void send(const json& message) = 0;
};

} // namespace acp
