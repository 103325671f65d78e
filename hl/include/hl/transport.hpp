/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include "hl/client_config.hpp"
#include "hl/types.hpp"

namespace hl {

// Blocking duplex byte stream the protocol engine runs on.
// Every call returns false and fills `err` on failure.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool connect(const ConnectionConfig& conf, Error& err) = 0;

    virtual bool send(const std::string& data, std::size_t& written, Error& err) = 0;

    // One line without its trailing CRLF (or bare LF).
    virtual bool receive_line(std::string& line, Error& err) = 0;

    // Exactly n bytes; ending early is ErrorKind::TruncatedBody.
    virtual bool receive_exactly(std::size_t n, std::string& out, Error& err) = 0;

    // Everything until the peer closes.
    virtual bool receive_all(std::string& out, Error& err) = 0;

    virtual bool set_timeout(std::chrono::milliseconds timeout, Error& err) = 0;

    // Hand the stream back for reuse. The transport is detached afterwards.
    virtual bool set_keepalive(std::chrono::milliseconds idle, std::size_t pool_size, Error& err) = 0;

    virtual bool close(Error& err) = 0;

    // How many times the current stream was taken from a keep-alive pool.
    virtual bool reuse_count(int& out, Error& err) = 0;
};

} // namespace hl
