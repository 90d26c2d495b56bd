// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file server.hpp
/// @brief The line-oriented transport loop

#include <acp/dispatcher.hpp>
#include <acp/jsonrpc.hpp>
#include <acp/transport.hpp>
#include <optional>
#include <string>

namespace acp
{

// =============================================================================
// Server - newline-delimited JSON-RPC loop
// =============================================================================

/// Reads requests one line at a time and writes one response line per request
///
/// Processing is strictly sequential: a line is not read until the previous
/// request's handler, including its streamed notifications, has returned.
/// The server is also the MessageSink the notification emitter writes to, so
/// notifications and responses share one ordered output channel.
///
/// Example usage:
/// @code
/// StdioTransport transport;
/// Server server(transport);
/// NotificationEmitter emitter(server, config.streaming);
/// Dispatcher dispatcher(session, completion, files, emitter);
/// server.run(dispatcher);
/// @endcode
class Server : public MessageSink
{
  public:
    explicit Server(ITransport& transport) : transport_(transport), framer_(transport) {}

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Serialize `message` as compact JSON and write it as one line
    /// @throws TransportError if the output channel fails
    void send(const json& message) override;

    /// Process lines until end-of-stream
    /// @return Number of responses written
    /// @throws TransportError on unrecoverable channel failure
    size_t run(Dispatcher& dispatcher);

    /// Turn one input line into its response
    ///
    /// Whitespace-only lines yield nullopt. Lines that are not JSON yield a
    /// ParseError response with a null id; JSON that is not an object yields
    /// an InvalidRequest response with a null id. Anything else is dispatched
    /// and answered with the request's own id.
    std::optional<JsonRpcResponse> handle_line(const std::string& line, Dispatcher& dispatcher);

  private:
    ITransport& transport_;
    LineFramer framer_;
};

} // namespace acp
