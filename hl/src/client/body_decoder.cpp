/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/internal/http_low.hpp"
#include "hl/internal/utils.hpp"

#include <algorithm>
#include <limits>

namespace hl::internal {

bool receive_length(Transport& t, std::size_t length, std::size_t chunk_size,
                    std::string& out, Error& err)
{
    if (chunk_size == 0) chunk_size = kDefaultReadChunk;
    out.clear();
    out.reserve(std::min(length, chunk_size));

    std::size_t remaining = length;
    while (remaining > 0) {
        const std::size_t n = std::min(remaining, chunk_size);
        std::string seg;
        if (!t.receive_exactly(n, seg, err)) return false;
        out += seg;
        remaining -= n;
    }
    return true;
}

bool receive_chunked(Transport& t, std::string& out, Error& err) {
    out.clear();
    for (;;) {
        std::string line;
        if (!t.receive_line(line, err)) return false;

        // zero, negative or unparsable size ends the body
        const auto size = parse_chunk_size(line);
        if (!size || *size < 1) break;
        if (*size > std::numeric_limits<std::size_t>::max() - 2) {
            return fail(err, ErrorKind::TransportError, "chunk size too large");
        }

        std::string seg;
        if (!t.receive_exactly((std::size_t)*size + 2, seg, err)) return false;
        out.append(seg, 0, (std::size_t)*size);
    }

    // optional trailer fields, then the terminating CRLF
    for (;;) {
        std::string line;
        if (!t.receive_line(line, err)) return false;
        if (is_blank(line)) break;
    }
    return true;
}

bool decode_body(Transport& t, HeaderMap& headers, std::size_t chunk_size,
                 std::string& out, Error& err)
{
    if (const auto cl = headers.get("Content-Length")) {
        if (const auto length = parse_decimal(*cl)) {
            return receive_length(t, (std::size_t)*length, chunk_size, out, err);
        }
    }

    const auto te = headers.get("Transfer-Encoding");
    if (te && lower_copy(trim_copy(*te)) == "chunked") {
        return receive_chunked(t, out, err);
    }

    // No declared length: only the close delimits the body.
    headers.set("Connection", "close");
    out.clear();
    return t.receive_all(out, err);
}

} // namespace hl::internal
