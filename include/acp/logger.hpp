// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <log4cplus/logger.h>
#include <string>

namespace acp
{

log4cplus::Logger& core_logger();
log4cplus::Logger& server_logger();
log4cplus::Logger& dispatch_logger();
log4cplus::Logger& completion_logger();
log4cplus::Logger& fs_logger();

/// Configure log4cplus from a properties file
///
/// Falls back to a basic stderr configuration at INFO level when the file is
/// missing or unreadable. Standard output is reserved for protocol messages,
/// so no appender may target it.
void init_logging(const std::string& config_path);

} // namespace acp
