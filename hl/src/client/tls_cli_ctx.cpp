/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/internal/tls_cli_ctx.hpp"
#include "hl/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <mutex>

namespace hl::internal {

TlsClientContext::TlsClientContext(bool verify_peer) : _verify(verify_peer) {
    OPENSSL_init_ssl(0, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_last_error("set_min_proto");
    }

    // HTTP/1.1 only
    static const unsigned char alpn[] = { 8, 'h','t','t','p','/','1','.','1' };
    if (SSL_CTX_set_alpn_protos(_ctx, alpn, sizeof(alpn)) != 0) {
        log_last_error("set_alpn_protos");
    }

    if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
        log_last_error("set_default_verify_paths");
    }

    SSL_CTX_set_verify(_ctx, _verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Keep-alive pool reconnects benefit from resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

std::shared_ptr<TlsClientContext> TlsClientContext::shared(bool verify_peer) {
    static std::mutex mtx;
    static std::shared_ptr<TlsClientContext> verified;
    static std::shared_ptr<TlsClientContext> unverified;

    std::lock_guard<std::mutex> lk(mtx);
    auto& slot = verify_peer ? verified : unverified;
    if (!slot) {
        slot = std::make_shared<TlsClientContext>(verify_peer);
    }
    return slot;
}

void TlsClientContext::log_last_error(const char* where) {
    hl::log_line(std::string("[TLS-CLI] error at ") + where + ": " + openssl_error_string());
}

std::string openssl_error_string() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

} // namespace hl::internal
