/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/internal/socket_pool.hpp"
#include "hl/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace hl::internal {

std::string pool_key(const std::string& scheme, const std::string& host,
                     std::uint16_t port, bool verify_peer) {
    std::string key = scheme + "://" + host + ":" + std::to_string(port);
    if (scheme == "https") key += verify_peer ? "|verify" : "|noverify";
    return key;
}

SocketPool& SocketPool::instance() {
    static SocketPool pool;
    return pool;
}

SocketPool::~SocketPool() {
    clear();
}

void SocketPool::dispose(PooledSocket& s) {
    if (s.ssl) {
        SSL_free(s.ssl);
        s.ssl = nullptr;
    }
    if (s.fd >= 0) {
        ::close(s.fd);
        s.fd = -1;
    }
}

bool SocketPool::still_usable(int fd) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, 0);
    } while (pr < 0 && errno == EINTR);

    // Readable while idle: peer closed, or sent something we never asked for.
    return pr == 0;
}

bool SocketPool::acquire(const std::string& key, PooledSocket& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _pools.find(key);
    if (it == _pools.end()) return false;

    auto& q = it->second;
    const auto now = std::chrono::steady_clock::now();
    while (!q.empty()) {
        // LIFO: the most recently parked socket is the least likely to be stale
        PooledSocket s = q.back();
        q.pop_back();
        if (s.expires_at <= now || !still_usable(s.fd)) {
            hl::log_line("[POOL] dropping stale socket for " + key);
            dispose(s);
            continue;
        }
        out = s;
        return true;
    }
    return false;
}

void SocketPool::release(const std::string& key, PooledSocket s, std::size_t max_per_key) {
    if (max_per_key == 0) {
        dispose(s);
        return;
    }
    std::lock_guard<std::mutex> lk(_mtx);
    auto& q = _pools[key];
    while (q.size() >= max_per_key) {
        hl::log_line("[POOL] evicting oldest socket for " + key);
        dispose(q.front());
        q.pop_front();
    }
    q.push_back(s);
}

std::size_t SocketPool::count(const std::string& key) const {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _pools.find(key);
    return it == _pools.end() ? 0 : it->second.size();
}

void SocketPool::clear() {
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto& kv : _pools) {
        for (auto& s : kv.second) dispose(s);
    }
    _pools.clear();
}

} // namespace hl::internal
