// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file completion.hpp
/// @brief Client for the hosted chat-completion API

#include <acp/config.hpp>
#include <acp/result.hpp>
#include <acp/types.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// HTTP
// =============================================================================

/// Outcome of an HTTP exchange
///
/// Transport failures are reported through the flags rather than thrown.
struct HttpResponse
{
    uint16_t status = 0;
    std::string body;
    bool timeout = false;
    bool network_error = false;
    std::string network_error_message;
};

/// Minimal HTTP client used by the completion client
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// POST a JSON body and wait for the full response
    virtual HttpResponse post_json(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        const std::string& body,
        std::chrono::milliseconds timeout
    ) = 0;
};

/// HttpClient backed by libcurl's easy interface
class CurlHttpClient final : public HttpClient
{
  public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post_json(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        const std::string& body,
        std::chrono::milliseconds timeout
    ) override;
};

// =============================================================================
// Completion Request
// =============================================================================

/// Body of a chat/completions call
struct CompletionRequest
{
    std::string model;
    std::vector<Turn> messages;
    double temperature = 0.7;
    uint32_t max_tokens = 1024;
};

inline void to_json(json& j, const CompletionRequest& r)
{
    j = json{
        {"model", r.model},
        {"messages", r.messages},
        {"temperature", r.temperature},
        {"max_tokens", r.max_tokens}
    };
}

/// Extract `choices[0].message.content` from a completion response
///
/// Any missing or mistyped element yields an empty string.
std::string extract_message_content(const json& response);

// =============================================================================
// CompletionClient
// =============================================================================

/// Produces the next assistant turn for a conversation
class CompletionClient
{
  public:
    virtual ~CompletionClient() = default;

    /// Request a completion for the full conversation `history`
    /// @return The assistant text, or an error describing the failure
    virtual Result<std::string> complete(const std::vector<Turn>& history) = 0;
};

/// CompletionClient speaking the OpenAI-compatible chat/completions API
///
/// Example usage:
/// @code
/// CompletionOptions opts;
/// opts.api_key = "...";
/// ChatCompletionClient client(opts, std::make_unique<CurlHttpClient>());
/// auto reply = client.complete({Turn{Role::User, "hi"}});
/// @endcode
class ChatCompletionClient final : public CompletionClient
{
  public:
    ChatCompletionClient(CompletionOptions options, std::unique_ptr<HttpClient> http);

    Result<std::string> complete(const std::vector<Turn>& history) override;

    /// Full URL of the chat/completions endpoint
    const std::string& endpoint() const
    {
        return endpoint_;
    }

  private:
    CompletionOptions options_;
    std::unique_ptr<HttpClient> http_;
    std::string endpoint_;
};

} // namespace acp
