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
#include <memory>
#include <string>
#include "hl/client_config.hpp"
#include "hl/http_request.hpp"
#include "hl/http_response.hpp"
#include "hl/transport.hpp"
#include "hl/types.hpp"

namespace hl {

// One HTTP/1.1 client connection: serializes a request onto its transport,
// reads the response back and then either closes the stream or hands it to
// the transport's keep-alive pool. One exchange at a time; not thread-safe.
class Connection {
public:
    // No transport: every call fails with ErrorKind::NotInitialized.
    Connection();
    explicit Connection(std::unique_ptr<Transport> transport,
                        const ClientConfig& cfg = ClientConfig{});
    ~Connection();

    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Port outside 1..65535 falls back to 80. Scheme is "https" for 443
    // unless `conf.scheme` is set; `conf.path` becomes the default path.
    bool connect(const std::string& host, int port, Error& err);
    bool connect(const std::string& host, int port, const ConnectionConfig& conf, Error& err);

    // Full exchange. On failure the connection is closed and `err` holds
    // the first error seen.
    bool request(const RequestSpec& spec, HttpResponse& out, Error& err);

    bool set_timeout(std::chrono::milliseconds timeout, Error& err);

    // Hand the stream back using the ClientConfig keep-alive defaults.
    bool set_keepalive(Error& err);
    bool set_keepalive(std::chrono::milliseconds idle, std::size_t pool_size, Error& err);

    bool get_reuse_count(int& out, Error& err);

    // Releases the stream and forgets the connection config.
    bool close(Error& err);

    // nullptr when not connected
    const ConnectionConfig* config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// Connection over a SocketTransport (TCP, TLS for https).
Connection new_connection(const ClientConfig& cfg = ClientConfig{});

} // namespace hl
