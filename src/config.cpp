// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/config.hpp>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace acp
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

const char* non_empty_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0')
        return value;
    return nullptr;
}

} // namespace

Result<Config> Config::from_env()
{
    Config config;

    const char* key = non_empty_env(ENV_API_KEY);
    if (key == nullptr)
    {
        return Error{
            ErrorKind::InvalidArgument,
            std::string(ENV_API_KEY) + " environment variable not set"
        };
    }
    config.completion.api_key = key;

    if (const char* url = non_empty_env(ENV_BASE_URL))
        config.completion.base_url = url;
    if (const char* model = non_empty_env(ENV_MODEL))
        config.completion.model = model;
    if (const char* log_config = non_empty_env(ENV_LOG_CONFIG))
        config.log_config = log_config;

    return config;
}

size_t load_dotenv(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return 0;

    std::ifstream in(path);
    if (!in)
        return 0;

    size_t count = 0;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty())
            continue;

        if (::setenv(key.c_str(), value.c_str(), 1) == 0)
            ++count;
    }
    return count;
}

} // namespace acp
