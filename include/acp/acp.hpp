// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file acp.hpp
/// @brief Master include for the ACP bridge library

#include <acp/completion.hpp>
#include <acp/config.hpp>
#include <acp/dispatcher.hpp>
#include <acp/file_accessor.hpp>
#include <acp/jsonrpc.hpp>
#include <acp/logger.hpp>
#include <acp/result.hpp>
#include <acp/server.hpp>
#include <acp/session.hpp>
#include <acp/streaming.hpp>
#include <acp/transport.hpp>
#include <acp/transport_stdio.hpp>
#include <acp/types.hpp>
#include <acp/utf8.hpp>

namespace acp
{

/// Bridge version string
inline constexpr const char* kVersion = "0.1.0";

} // namespace acp
