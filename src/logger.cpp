// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/logger.hpp>

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace acp
{

log4cplus::Logger& core_logger()
{
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("acp"));
    return logger;
}

log4cplus::Logger& server_logger()
{
    static log4cplus::Logger logger =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("acp.server"));
    return logger;
}

log4cplus::Logger& dispatch_logger()
{
    static log4cplus::Logger logger =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("acp.dispatch"));
    return logger;
}

log4cplus::Logger& completion_logger()
{
    static log4cplus::Logger logger =
        log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("acp.completion"));
    return logger;
}

log4cplus::Logger& fs_logger()
{
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("acp.fs"));
    return logger;
}

namespace
{

std::filesystem::path resolve_config_path(const std::string& config_path)
{
    std::filesystem::path path(config_path);
    if (path.is_absolute())
        return path;
    return std::filesystem::current_path() / path;
}

} // namespace

void init_logging(const std::string& config_path)
{
    if (!config_path.empty())
    {
        std::error_code ec;
        auto resolved = resolve_config_path(config_path);
        if (std::filesystem::is_regular_file(resolved, ec))
        {
            try
            {
                log4cplus::PropertyConfigurator::doConfigure(
                    LOG4CPLUS_STRING_TO_TSTRING(resolved.string())
                );
                return;
            }
            catch (const std::exception& e)
            {
                log4cplus::helpers::LogLog::getLogLog()->error(
                    LOG4CPLUS_TEXT("Failed to load logging config: ") +
                    LOG4CPLUS_STRING_TO_TSTRING(std::string(e.what()))
                );
            }
        }
    }

    // Log to stderr; stdout carries the protocol
    log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace acp
