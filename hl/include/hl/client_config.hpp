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

namespace hl {

inline constexpr const char* kDefaultUserAgent = "HttpLink/1.0 (C++)";
inline constexpr std::size_t kDefaultReadChunk = 1u << 20; // 1 MiB

// Public client configuration. Per-connection; copied at construction.
struct ClientConfig {
    // Request defaults
    std::string user_agent = kDefaultUserAgent;

    // Content-Length bodies are read in segments of at most this size
    std::size_t read_chunk_size = kDefaultReadChunk;

    // Timeouts (SocketTransport)
    int connect_timeout_ms = 5000;
    int io_timeout_ms      = 5000;

    // Keep-alive hand-back defaults
    int         keepalive_idle_ms   = 60000;
    std::size_t keepalive_pool_size = 30;

    // TLS: system trust store + host name check
    bool tls_verify_peer = true;

    // Logging
    std::string log_file;      // empty: no log file
    bool        log_stdout = false;
};

// Per-connection endpoint, fixed at connect() time.
struct ConnectionConfig {
    std::string   host;
    std::uint16_t port = 80;
    std::string   scheme;               // "https" for port 443 unless set
    std::optional<std::string> path;    // default request path
};

} // namespace hl
