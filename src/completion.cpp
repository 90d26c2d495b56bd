// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/completion.hpp>
#include <acp/logger.hpp>

#include <curl/curl.h>
#include <log4cplus/loggingmacros.h>

namespace acp
{

namespace
{

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    const auto total = size * nmemb;
    auto* output = static_cast<std::string*>(userdata);
    output->append(ptr, total);
    return total;
}

std::string join_url(std::string base, const std::string& path)
{
    if (!base.empty() && base.back() != '/')
        base += '/';
    return base + path;
}

} // namespace

// =============================================================================
// CurlHttpClient
// =============================================================================

CurlHttpClient::CurlHttpClient()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient()
{
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::post_json(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    const std::string& body,
    std::chrono::milliseconds timeout
)
{
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (curl == nullptr)
    {
        response.network_error = true;
        response.network_error_message = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "acp-bridge/0.1");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers)
    {
        const std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list != nullptr)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK)
    {
        response.network_error = true;
        response.network_error_message = curl_easy_strerror(code);
        response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    }
    else
    {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<uint16_t>(status);
    }

    if (header_list != nullptr)
        curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return response;
}

// =============================================================================
// Response Parsing
// =============================================================================

std::string extract_message_content(const json& response)
{
    if (!response.is_object())
        return {};

    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty())
        return {};

    const auto& first = choices->front();
    if (!first.is_object())
        return {};

    auto message = first.find("message");
    if (message == first.end() || !message->is_object())
        return {};

    auto content = message->find("content");
    if (content == message->end() || !content->is_string())
        return {};

    return content->get<std::string>();
}

// =============================================================================
// ChatCompletionClient
// =============================================================================

ChatCompletionClient::ChatCompletionClient(
    CompletionOptions options, std::unique_ptr<HttpClient> http
)
    : options_(std::move(options)), http_(std::move(http)),
      endpoint_(join_url(options_.base_url, "chat/completions"))
{
}

Result<std::string> ChatCompletionClient::complete(const std::vector<Turn>& history)
{
    CompletionRequest request{
        options_.model, history, options_.temperature, options_.max_tokens
    };

    std::map<std::string, std::string> headers{
        {"Authorization", "Bearer " + options_.api_key},
        {"Content-Type", "application/json"},
    };

    LOG4CPLUS_INFO(
        completion_logger(),
        "POST " << endpoint_ << " model=" << options_.model << " turns=" << history.size()
    );

    auto response = http_->post_json(endpoint_, headers, json(request).dump(), options_.timeout);

    if (response.timeout)
    {
        LOG4CPLUS_ERROR(completion_logger(), "completion request timed out");
        return Error{ErrorKind::Timeout, "request timed out"};
    }
    if (response.network_error)
    {
        LOG4CPLUS_ERROR(
            completion_logger(), "completion request failed: " << response.network_error_message
        );
        return Error{ErrorKind::Network, response.network_error_message};
    }
    if (response.status < 200 || response.status >= 300)
    {
        LOG4CPLUS_ERROR(completion_logger(), "completion request returned HTTP " << response.status);
        return Error{
            ErrorKind::Remote, "HTTP " + std::to_string(response.status) + ": " + response.body
        };
    }

    auto parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded())
    {
        LOG4CPLUS_ERROR(completion_logger(), "completion response is not JSON");
        return Error{ErrorKind::InvalidResponse, "invalid JSON in response"};
    }

    auto content = extract_message_content(parsed);
    LOG4CPLUS_INFO(
        completion_logger(),
        "completion returned HTTP " << response.status << " with " << content.size() << " bytes"
    );
    return content;
}

} // namespace acp
