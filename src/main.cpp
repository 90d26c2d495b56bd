// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file main.cpp
/// @brief acp-bridge entry point: ACP over stdio, completions over HTTPS

#include <acp/acp.hpp>

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace
{

std::filesystem::path executable_dir(const char* argv0)
{
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
        exe = std::filesystem::absolute(argv0, ec);
    return exe.parent_path();
}

void print_usage()
{
    std::cerr << "Usage: acp-bridge [--log-config PATH] [--env-file PATH] [--version]\n";
}

} // namespace

int main(int argc, char** argv)
{
    log4cplus::Initializer log_initializer;

    std::string log_config;
    std::filesystem::path env_file = executable_dir(argv[0]) / ".env";

    for (int i = 1; i < argc; ++i)
    {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0)
        {
            std::cerr << "acp-bridge " << acp::kVersion << "\n";
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0)
        {
            print_usage();
            return 0;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc)
        {
            log_config = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-config=", 13) == 0)
        {
            log_config = argv[i] + 13;
            continue;
        }

        if (strcmp(argv[i], "--env-file") == 0 && i + 1 < argc)
        {
            env_file = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--env-file=", 11) == 0)
        {
            env_file = argv[i] + 11;
            continue;
        }

        print_usage();
        return 2;
    }

    auto dotenv_count = acp::load_dotenv(env_file);

    auto config = acp::Config::from_env();
    if (!config)
    {
        std::cerr << "Error: " << config.error().message << "\n";
        return 1;
    }
    if (!log_config.empty())
        config.value().log_config = log_config;

    acp::init_logging(config.value().log_config);

    LOG4CPLUS_INFO(acp::core_logger(), "acp-bridge " << acp::kVersion << " starting");
    LOG4CPLUS_INFO(
        acp::core_logger(),
        "model " << config.value().completion.model << " at " << config.value().completion.base_url
    );
    if (dotenv_count > 0)
        LOG4CPLUS_INFO(acp::core_logger(), dotenv_count << " variables loaded from " << env_file);

    // Broken pipes surface as write errors instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        acp::StdioTransport transport;
        acp::Server server(transport);

        acp::Session session;
        acp::ChatCompletionClient completion(
            config.value().completion, std::make_unique<acp::CurlHttpClient>()
        );
        acp::LocalFileAccessor files;
        acp::NotificationEmitter emitter(server, config.value().streaming);
        acp::Dispatcher dispatcher(session, completion, files, emitter);

        server.run(dispatcher);
    }
    catch (const acp::TransportError& e)
    {
        LOG4CPLUS_FATAL(acp::core_logger(), "channel failure: " << e.what());
        return 1;
    }

    LOG4CPLUS_INFO(acp::core_logger(), "acp-bridge exiting");
    return 0;
}
