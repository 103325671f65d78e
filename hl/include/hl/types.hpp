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

namespace hl {

enum class ErrorKind {
    None,
    NotInitialized,  // no transport bound
    NotConnected,    // request before connect()
    TransportError,  // read/write/connect failure, message passed through
    TruncatedBody    // stream ended before a declared length or chunk
};

// Error value returned next to a `false` result. Never thrown.
struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    void clear() { kind = ErrorKind::None; message.clear(); }
};

const char* to_string(ErrorKind kind);

// Helpers used by every layer to fill the out-parameter and return false.
bool fail(Error& err, ErrorKind kind, std::string message);

} // namespace hl
