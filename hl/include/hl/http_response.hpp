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
#include "hl/header_map.hpp"

namespace hl {

struct HttpResponse {
    std::optional<int> status;   // absent when the status line is malformed
    std::string status_text;
    HeaderMap   headers;         // duplicates already merged
    std::string body;
};

} // namespace hl
