// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/logger.hpp>
#include <acp/server.hpp>

#include <log4cplus/loggingmacros.h>

namespace acp
{

namespace
{

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // namespace

void Server::send(const json& message)
{
    framer_.write_message(message.dump(-1, ' ', false, json::error_handler_t::replace));
}

std::optional<JsonRpcResponse> Server::handle_line(const std::string& line, Dispatcher& dispatcher)
{
    if (is_blank(line))
        return std::nullopt;

    auto message = json::parse(line, nullptr, false);
    if (message.is_discarded())
    {
        LOG4CPLUS_WARN(server_logger(), "discarding line that is not JSON");
        return JsonRpcResponse::failure(std::nullopt, JsonRpcErrorCode::ParseError, "Parse error");
    }

    auto request = JsonRpcRequest::from_json(message);
    if (!request)
    {
        LOG4CPLUS_WARN(server_logger(), "invalid request: " << request.error().message);
        return JsonRpcResponse::failure(
            std::nullopt, JsonRpcErrorCode::InvalidRequest, "Invalid Request"
        );
    }

    return dispatcher.dispatch(request.value());
}

size_t Server::run(Dispatcher& dispatcher)
{
    LOG4CPLUS_INFO(server_logger(), "serving ACP over stdio");

    size_t responses = 0;
    while (auto line = framer_.read_message())
    {
        auto response = handle_line(*line, dispatcher);
        if (!response)
            continue;

        send(response->to_json());
        ++responses;
    }

    LOG4CPLUS_INFO(server_logger(), "input closed after " << responses << " responses");
    transport_.close();
    return responses;
}

} // namespace acp
