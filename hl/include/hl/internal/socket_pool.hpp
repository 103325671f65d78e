/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hl::internal {

// Idle connected socket parked for keep-alive reuse. Owns fd and ssl.
struct PooledSocket {
    int  fd = -1;
    SSL* ssl = nullptr;
    int  reused = 0;
    std::chrono::steady_clock::time_point expires_at{};
};

// Pool key for an endpoint. https keys also carry the peer-verification
// mode so an unverified TLS session never serves a verifying caller.
std::string pool_key(const std::string& scheme, const std::string& host,
                     std::uint16_t port, bool verify_peer);

// Process-wide keep-alive pool keyed by pool_key().
class SocketPool {
public:
    static SocketPool& instance();

    // Most recently parked live socket for `key`; expired or peer-closed
    // entries are discarded on the way.
    bool acquire(const std::string& key, PooledSocket& out);

    // Park `s`; the oldest entry is closed once `max_per_key` is exceeded.
    void release(const std::string& key, PooledSocket s, std::size_t max_per_key);

    std::size_t count(const std::string& key) const;
    void clear();

    ~SocketPool();

    SocketPool(const SocketPool&) = delete;
    SocketPool& operator=(const SocketPool&) = delete;

    static void dispose(PooledSocket& s);

private:
    SocketPool() = default;
    static bool still_usable(int fd);

    mutable std::mutex _mtx;
    std::unordered_map<std::string, std::deque<PooledSocket>> _pools;
};

} // namespace hl::internal
