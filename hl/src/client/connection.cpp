/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/connection.hpp"
#include "hl/log.hpp"
#include "hl/socket_transport.hpp"

#include "hl/internal/http_low.hpp"

#include <optional>
#include <utility>

namespace hl {

struct Connection::Impl {
    ClientConfig cfg;
    std::unique_ptr<Transport> transport;
    std::optional<ConnectionConfig> conf;

    Impl(std::unique_ptr<Transport> t, const ClientConfig& c)
        : cfg(c), transport(std::move(t)) {
        if (!cfg.log_file.empty()) hl::set_log_file(cfg.log_file);
        if (cfg.log_stdout) hl::set_log_stdout(true);
    }

    bool bound(Error& err) const {
        if (!transport) return fail(err, ErrorKind::NotInitialized, "not initialized");
        return true;
    }

    void drop_stream(const char* why) {
        conf.reset();
        Error e;
        if (!transport->close(e)) {
            hl::log_line(std::string("[CONN] close after ") + why + " failed: " + e.message);
        }
    }

    // A failed exchange leaves the stream at an unknown position.
    bool abort_exchange(const Error& err) {
        hl::log_line(std::string("[CONN] exchange failed (") + to_string(err.kind) + "): " + err.message);
        drop_stream("failed exchange");
        return false;
    }

    void finish_exchange(const HeaderMap& headers) {
        if (internal::wants_close(headers)) {
            drop_stream("Connection: close");
            return;
        }
        Error e;
        if (!transport->set_keepalive(std::chrono::milliseconds(cfg.keepalive_idle_ms),
                                      cfg.keepalive_pool_size, e)) {
            hl::log_line("[CONN] keep-alive refused: " + e.message);
            drop_stream("refused keep-alive");
        }
    }
};

Connection::Connection()
    : _p(std::make_unique<Connection::Impl>(nullptr, ClientConfig{})) {}

Connection::Connection(std::unique_ptr<Transport> transport, const ClientConfig& cfg)
    : _p(std::make_unique<Connection::Impl>(std::move(transport), cfg)) {}

Connection::~Connection() = default;
Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

bool Connection::connect(const std::string& host, int port, Error& err) {
    return connect(host, port, ConnectionConfig{}, err);
}

bool Connection::connect(const std::string& host, int port,
                         const ConnectionConfig& conf, Error& err)
{
    err.clear();
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");

    ConnectionConfig c = conf;
    c.host = host;
    c.port = (port > 0 && port <= 65535) ? static_cast<std::uint16_t>(port) : 80;
    if (c.scheme.empty()) {
        c.scheme = (c.port == 443) ? "https" : "http";
    }

    if (!_p->transport->connect(c, err)) {
        _p->conf.reset();
        return false;
    }
    _p->conf = std::move(c);
    return true;
}

bool Connection::request(const RequestSpec& spec, HttpResponse& out, Error& err) {
    err.clear();
    out = HttpResponse{};
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");
    if (!_p->conf) return fail(err, ErrorKind::NotConnected, "not connected");

    Transport& t = *_p->transport;

    // Head and body go out as two writes.
    const std::string head = internal::build_request_head(*_p->conf, spec, _p->cfg.user_agent);
    std::size_t written = 0;
    if (!t.send(head, written, err)) return _p->abort_exchange(err);
    if (spec.body && !spec.body->empty()) {
        if (!t.send(*spec.body, written, err)) return _p->abort_exchange(err);
    }

    if (!internal::read_status_line(t, out.status, out.status_text, err)) return _p->abort_exchange(err);
    if (!internal::parse_headers(t, out.headers, err)) return _p->abort_exchange(err);

    if (internal::response_has_body(internal::resolve_method(spec), out.status)) {
        if (!internal::decode_body(t, out.headers, _p->cfg.read_chunk_size, out.body, err)) {
            return _p->abort_exchange(err);
        }
    }

    _p->finish_exchange(out.headers);
    return true;
}

bool Connection::set_timeout(std::chrono::milliseconds timeout, Error& err) {
    err.clear();
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");
    return _p->transport->set_timeout(timeout, err);
}

bool Connection::set_keepalive(Error& err) {
    if (!_p) return fail(err, ErrorKind::NotInitialized, "not initialized");
    return set_keepalive(std::chrono::milliseconds(_p->cfg.keepalive_idle_ms),
                         _p->cfg.keepalive_pool_size, err);
}

bool Connection::set_keepalive(std::chrono::milliseconds idle, std::size_t pool_size, Error& err) {
    err.clear();
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");
    return _p->transport->set_keepalive(idle, pool_size, err);
}

bool Connection::get_reuse_count(int& out, Error& err) {
    err.clear();
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");
    return _p->transport->reuse_count(out, err);
}

bool Connection::close(Error& err) {
    err.clear();
    if (!_p || !_p->bound(err)) return fail(err, ErrorKind::NotInitialized, "not initialized");
    _p->conf.reset();
    return _p->transport->close(err);
}

const ConnectionConfig* Connection::config() const {
    if (!_p || !_p->conf) return nullptr;
    return &*_p->conf;
}

Connection new_connection(const ClientConfig& cfg) {
    return Connection(std::make_unique<SocketTransport>(cfg), cfg);
}

} // namespace hl
