// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Process configuration loaded from the environment

#include <acp/result.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace acp
{

// =============================================================================
// Completion Options
// =============================================================================

/// Parameters for calls to the hosted chat-completion API
struct CompletionOptions
{
    std::string api_key;
    std::string base_url = "https://open.bigmodel.cn/api/paas/v4/";
    std::string model = "glm-4.6";
    double temperature = 0.7;
    uint32_t max_tokens = 1024;
    std::chrono::milliseconds timeout{60000};
};

// =============================================================================
// Streaming Options
// =============================================================================

/// Controls how assistant replies are split into session/update notifications
struct StreamingOptions
{
    size_t chunk_size = 50; // in characters (Unicode code points)
    std::chrono::milliseconds chunk_delay{100};
};

// =============================================================================
// Config
// =============================================================================

struct Config
{
    CompletionOptions completion;
    StreamingOptions streaming;
    std::string log_config = "log4cplus.properties";

    /// Environment variable names
    static constexpr const char* ENV_API_KEY = "GLM_API_KEY";
    static constexpr const char* ENV_BASE_URL = "GLM_API_BASE";
    static constexpr const char* ENV_MODEL = "GLM_MODEL";
    static constexpr const char* ENV_LOG_CONFIG = "ACP_LOG_CONFIG";

    /// Build a Config from the process environment
    /// @return The config, or an InvalidArgument error if GLM_API_KEY is unset or empty
    static Result<Config> from_env();
};

/// Load KEY=VALUE pairs from a dotenv file into the process environment
///
/// Blank lines and lines starting with `#` are skipped. Keys and values are
/// trimmed and split on the first `=`. Values override variables that are
/// already set.
/// @return Number of variables set; 0 if the file does not exist
size_t load_dotenv(const std::filesystem::path& path);

} // namespace acp
