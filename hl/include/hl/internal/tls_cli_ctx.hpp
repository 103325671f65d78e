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
#include <memory>
#include <string>

namespace hl::internal {

// TLS client context backed by the system trust store.
class TlsClientContext {
public:
    explicit TlsClientContext(bool verify_peer);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify_peer() const { return _verify; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

    // Process-wide instance per verification mode, created on first use.
    static std::shared_ptr<TlsClientContext> shared(bool verify_peer);

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify = true;
    void log_last_error(const char* where);
};

// Drain the OpenSSL error queue into one line ("" when empty).
std::string openssl_error_string();

} // namespace hl::internal
