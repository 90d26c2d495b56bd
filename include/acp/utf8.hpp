// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for text crossing the file and chunking boundaries

#include <cstddef>
#include <string>
#include <string_view>

namespace acp::utf8
{

/// Copy `input`, dropping every byte that is not part of a well-formed sequence
///
/// Overlong encodings, surrogates and code points above U+10FFFF count as
/// ill-formed.
std::string sanitize(std::string_view input);

/// Length in bytes of the well-formed sequence starting at `pos`, or 0
size_t sequence_length(std::string_view input, size_t pos);

/// Number of code points in well-formed `input`
size_t length(std::string_view input);

/// Byte offset reached by advancing `count` code points from `pos`
///
/// Stops at the end of the input. Stray bytes count as one code point each.
size_t advance(std::string_view input, size_t pos, size_t count);

} // namespace acp::utf8
