/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include "hl/client_config.hpp"
#include "hl/transport.hpp"

namespace hl {

// TCP transport with timeouts, TLS for the "https" scheme and a
// process-wide keep-alive pool behind set_keepalive()/connect().
class SocketTransport : public Transport {
public:
    explicit SocketTransport(const ClientConfig& cfg = ClientConfig{});
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    bool connect(const ConnectionConfig& conf, Error& err) override;
    bool send(const std::string& data, std::size_t& written, Error& err) override;
    bool receive_line(std::string& line, Error& err) override;
    bool receive_exactly(std::size_t n, std::string& out, Error& err) override;
    bool receive_all(std::string& out, Error& err) override;
    bool set_timeout(std::chrono::milliseconds timeout, Error& err) override;
    bool set_keepalive(std::chrono::milliseconds idle, std::size_t pool_size, Error& err) override;
    bool close(Error& err) override;
    bool reuse_count(int& out, Error& err) override;

    int fd() const;

    // Lines longer than this are rejected rather than buffered forever.
    static constexpr std::size_t kMaxLineBytes = 1u << 20;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace hl
