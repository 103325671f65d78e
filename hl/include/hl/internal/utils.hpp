/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace hl::internal {

void trim_inplace(std::string& s);
std::string trim_copy(std::string s);
bool is_blank(const std::string& s);
int  hexval(char c);
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Percent-encode everything outside A-Z a-z 0-9 - . _ ~ (uppercase hex).
std::string url_encode(const std::string& s);

// "k=v&k=v" with keys sorted, both sides percent-encoded.
std::string encode_query(const std::unordered_map<std::string,std::string>& params);

// Non-negative decimal integer, surrounding whitespace allowed.
std::optional<std::uint64_t> parse_decimal(const std::string& s);

// Chunk-size line: hex digits, optional ";ext" suffix, surrounding whitespace.
std::optional<std::uint64_t> parse_chunk_size(const std::string& line);

} // namespace hl::internal
