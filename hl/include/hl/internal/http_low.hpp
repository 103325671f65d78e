/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "hl/client_config.hpp"
#include "hl/header_map.hpp"
#include "hl/http_request.hpp"
#include "hl/transport.hpp"
#include "hl/types.hpp"

namespace hl::internal {

// --- request side ---

std::string resolve_method(const RequestSpec& spec);
std::string resolve_path(const ConnectionConfig& conf, const RequestSpec& spec);
std::string resolve_query(const RequestSpec& spec);

// Request line + header block + blank line. The body is not included.
std::string build_request_head(const ConnectionConfig& conf,
                               const RequestSpec& spec,
                               const std::string& user_agent);

// --- response side ---

// Code from characters 10-12 of "HTTP/1.1 200 OK"; nullopt if not 3 digits.
std::optional<int> parse_status_code(const std::string& line);
std::string parse_status_text(const std::string& line);

bool read_status_line(Transport& t,
                      std::optional<int>& status,
                      std::string& status_text,
                      Error& err);

// "Name: value" -> true; anything else is skipped by parse_headers.
bool parse_header_line(const std::string& line, std::string& name, std::string& value);

// Reads header lines up to the blank line, merging duplicates.
bool parse_headers(Transport& t, HeaderMap& out, Error& err);

// --- body ---

bool receive_length(Transport& t, std::size_t length, std::size_t chunk_size,
                    std::string& out, Error& err);
bool receive_chunked(Transport& t, std::string& out, Error& err);

// Picks Content-Length, chunked or read-to-close. The last one forces
// "Connection: close" into `headers`.
bool decode_body(Transport& t, HeaderMap& headers, std::size_t chunk_size,
                 std::string& out, Error& err);

// HEAD requests and 1xx/204/304 responses carry no body.
bool response_has_body(const std::string& method, const std::optional<int>& status);

// --- connection state ---

bool wants_close(const HeaderMap& headers);

} // namespace hl::internal
