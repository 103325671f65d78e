/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include "hl/header_map.hpp"

namespace hl {

using QueryParams = std::unordered_map<std::string, std::string>;

// Either nothing, an already-encoded query string, or parameters to encode.
using Query = std::variant<std::monostate, std::string, QueryParams>;

// Caller's description of one request. Never modified by the engine.
struct RequestSpec {
    std::optional<std::string> method;  // default "GET", sent uppercase
    std::optional<std::string> path;    // default conf.path, else "/"
    Query                      query;
    HeaderMap                  headers;
    std::optional<std::string> body;    // Content-Length is derived from it
};

} // namespace hl
