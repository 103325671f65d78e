/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/types.hpp"
#include <utility>

namespace hl {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "none";
        case ErrorKind::NotInitialized: return "not initialized";
        case ErrorKind::NotConnected:   return "not connected";
        case ErrorKind::TransportError: return "transport error";
        case ErrorKind::TruncatedBody:  return "truncated body";
    }
    return "unknown";
}

bool fail(Error& err, ErrorKind kind, std::string message) {
    err.kind = kind;
    err.message = std::move(message);
    return false;
}

} // namespace hl
