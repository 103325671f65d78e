/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/socket_transport.hpp"
#include "hl/log.hpp"

#include "hl/internal/socket_pool.hpp"
#include "hl/internal/tls_cli_ctx.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <limits>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

std::string errno_message(int e) {
    if (e == EAGAIN || e == EWOULDBLOCK) return "timeout";
    return std::strerror(e);
}

// TLS handshake that handles WANT_READ/WANT_WRITE within a bounded deadline.
// Expects a non-blocking socket.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_ms, std::string& why) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(std::max(1, timeout_ms));

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);
        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) ev = POLLIN;
        else if (ssl_err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
        else if (ssl_err == SSL_ERROR_SYSCALL && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) ev = POLLIN;

        if (ev == 0) {
            why = hl::internal::openssl_error_string();
            if (why.empty()) {
                why = (ssl_err == SSL_ERROR_SYSCALL && errno != 0) ? std::strerror(errno) : "handshake failed";
            }
            return false;
        }

        const int ms = remaining_ms(deadline);
        if (ms <= 0) {
            why = "timeout";
            return false;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = ev;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, ms);
        } while (pr < 0 && errno == EINTR);
        if (pr <= 0) {
            why = "timeout";
            return false;
        }
    }
}

} // namespace

namespace hl {

struct SocketTransport::Impl {
    ClientConfig cfg;
    int fd = -1;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
    std::shared_ptr<internal::TlsClientContext> tls;

    // Read buffer: bytes [rpos, rbuf.size()) are unread.
    std::string rbuf;
    std::size_t rpos = 0;

    std::string pool_key;
    int reused = 0;

    explicit Impl(const ClientConfig& c) : cfg(c) {}

    std::size_t buffered() const { return rbuf.size() - rpos; }

    void consume(std::size_t n) {
        rpos += n;
        if (rpos >= rbuf.size()) { rbuf.clear(); rpos = 0; }
    }

    void take(std::size_t n, std::string& out) {
        out.append(rbuf, rpos, n);
        consume(n);
    }

    void reset_buffer() { rbuf.clear(); rpos = 0; }

    void apply_io_timeout() {
        const int ms = std::max(0, cfg.io_timeout_ms);
        timeval tv{};
        tv.tv_sec  = ms / 1000;
        tv.tv_usec = (ms % 1000) * 1000;
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    void close_fd() {
        if (ssl) {
            // best effort close_notify; the socket goes away regardless
            (void)SSL_shutdown(ssl.get());
            ssl.reset(nullptr);
        }
        if (fd >= 0) { ::close(fd); fd = -1; }
        reset_buffer();
        reused = 0;
    }

    bool open_tcp(const ConnectionConfig& conf, Error& err) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int rc = getaddrinfo(conf.host.c_str(), std::to_string(conf.port).c_str(), &hints, &res);
        if (rc != 0 || !res) {
            const std::string why = gai_strerror(rc);
            hl::log_line("[TCP] getaddrinfo(" + conf.host + ") failed: " + why);
            return fail(err, ErrorKind::TransportError, why);
        }

        const int connect_timeout_ms = std::max(1, cfg.connect_timeout_ms);

        int s_ok = -1;
        int last_errno = 0;
        bool timed_out = false;
        for (auto* p = res; p; p = p->ai_next) {
            int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
            if (s < 0) { last_errno = errno; continue; }

            // Non-blocking for a bounded-time connect
            int flags = fcntl(s, F_GETFL, 0);
            if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
                last_errno = errno;
                ::close(s);
                continue;
            }

            int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
            if (ret < 0 && errno == EINPROGRESS) {
                struct pollfd pfd;
                pfd.fd     = s;
                pfd.events = POLLOUT;
                pfd.revents = 0;

                int pr = 0;
                do {
                    pr = ::poll(&pfd, 1, connect_timeout_ms);
                } while (pr < 0 && errno == EINTR);
                if (pr == 0) {
                    timed_out = true;
                    ::close(s);
                    continue;
                }
                if (pr < 0) {
                    last_errno = errno;
                    ::close(s);
                    continue;
                }
                int soerr = 0;
                socklen_t slen = sizeof(soerr);
                if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                    last_errno = soerr ? soerr : errno;
                    ::close(s);
                    continue;
                }
            } else if (ret < 0) {
                last_errno = errno;
                ::close(s);
                continue;
            }

            // Back to blocking mode; SO_*TIMEO bounds every later call
            (void)fcntl(s, F_SETFL, flags);

            int one = 1;
            setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

            s_ok = s;
            break;
        }
        freeaddrinfo(res);

        if (s_ok < 0) {
            const std::string why = timed_out ? "timeout"
                                  : (last_errno ? std::strerror(last_errno) : "connect failed");
            hl::log_line("[TCP] connect to " + conf.host + ":" + std::to_string(conf.port) + " failed: " + why);
            return fail(err, ErrorKind::TransportError, why);
        }

        fd = s_ok;
        apply_io_timeout();
        return true;
    }

    bool start_tls(const ConnectionConfig& conf, Error& err) {
        tls = internal::TlsClientContext::shared(cfg.tls_verify_peer);
        if (!tls || !tls->ctx()) {
            close_fd();
            return fail(err, ErrorKind::TransportError, "tls context not ready");
        }

        SSL* s = SSL_new(tls->ctx());
        if (!s) {
            close_fd();
            return fail(err, ErrorKind::TransportError, "SSL_new failed");
        }
        ssl.reset(s);
        SSL_set_fd(s, fd);
        SSL_set_tlsext_host_name(s, conf.host.c_str());

        if (cfg.tls_verify_peer) {
            // IP literals are checked against IP SANs, names against DNS SANs.
            unsigned char tmp[16];
            const bool is_ip = (::inet_pton(AF_INET, conf.host.c_str(), tmp) == 1) ||
                               (::inet_pton(AF_INET6, conf.host.c_str(), tmp) == 1);
            int ok = 0;
            if (is_ip) {
                X509_VERIFY_PARAM* param = SSL_get0_param(s);
                ok = param ? X509_VERIFY_PARAM_set1_ip_asc(param, conf.host.c_str()) : 0;
            } else {
                ok = SSL_set1_host(s, conf.host.c_str());
            }
            if (ok != 1) {
                close_fd();
                hl::log_line("[TLS-CLI] cannot set expected peer name " + conf.host);
                return fail(err, ErrorKind::TransportError, "cannot set expected peer name");
            }
        }

        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            const std::string why = std::strerror(errno);
            close_fd();
            return fail(err, ErrorKind::TransportError, why);
        }

        std::string why;
        const bool hs_ok = ssl_connect_with_deadline(s, fd, cfg.connect_timeout_ms, why);
        (void)::fcntl(fd, F_SETFL, old_flags);

        if (!hs_ok) {
            hl::log_line("[TLS-CLI] handshake with " + conf.host + " failed: " + why);
            ssl.reset(nullptr);
            close_fd();
            return fail(err, ErrorKind::TransportError, why);
        }

        if (cfg.tls_verify_peer) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                const std::string reason = X509_verify_cert_error_string(vr);
                hl::log_line("[TLS-CLI] verify failed for " + conf.host + ": " + reason);
                close_fd();
                return fail(err, ErrorKind::TransportError, reason);
            }
        }
        return true;
    }

    // Appends to rbuf. >0 bytes read, 0 on orderly close, -1 on error.
    int fill(Error& err) {
        char buf[16384];
        if (ssl) {
            for (;;) {
                ::ERR_clear_error();
                const int n = SSL_read(ssl.get(), buf, sizeof(buf));
                if (n > 0) {
                    rbuf.append(buf, static_cast<std::size_t>(n));
                    return n;
                }
                const int e = SSL_get_error(ssl.get(), n);
                if (e == SSL_ERROR_ZERO_RETURN) return 0;
                if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                    fail(err, ErrorKind::TransportError, "timeout");
                    return -1;
                }
                if (e == SSL_ERROR_SYSCALL) {
                    const int en = errno;
                    if (en == EINTR) continue;
                    if (n == 0 || en == 0) return 0; // EOF without close_notify
                    fail(err, ErrorKind::TransportError, errno_message(en));
                    return -1;
                }
                const std::string why = internal::openssl_error_string();
                // OpenSSL 3 reports a missing close_notify as a protocol error
                if (why.find("unexpected eof") != std::string::npos) return 0;
                fail(err, ErrorKind::TransportError, why.empty() ? "ssl read failed" : why);
                return -1;
            }
        }

        ssize_t n = 0;
        do {
            n = ::recv(fd, buf, sizeof(buf), 0);
        } while (n < 0 && errno == EINTR);
        if (n > 0) {
            rbuf.append(buf, static_cast<std::size_t>(n));
            return static_cast<int>(n);
        }
        if (n == 0) return 0;
        fail(err, ErrorKind::TransportError, errno_message(errno));
        return -1;
    }
};

SocketTransport::SocketTransport(const ClientConfig& cfg)
    : _p(std::make_unique<SocketTransport::Impl>(cfg)) {}

SocketTransport::~SocketTransport() {
    if (_p && _p->fd >= 0) _p->close_fd();
}

int SocketTransport::fd() const { return _p->fd; }

bool SocketTransport::connect(const ConnectionConfig& conf, Error& err) {
    if (_p->fd >= 0) _p->close_fd();
    _p->reset_buffer();
    _p->pool_key = internal::pool_key(conf.scheme, conf.host, conf.port, _p->cfg.tls_verify_peer);

    internal::PooledSocket ps;
    if (internal::SocketPool::instance().acquire(_p->pool_key, ps)) {
        _p->fd = ps.fd;
        _p->ssl.reset(ps.ssl);
        _p->reused = ps.reused + 1;
        _p->apply_io_timeout();
        hl::log_line("[POOL] reusing socket for " + _p->pool_key +
                     " (reuse " + std::to_string(_p->reused) + ")");
        return true;
    }

    if (!_p->open_tcp(conf, err)) return false;
    if (conf.scheme == "https" && !_p->start_tls(conf, err)) return false;
    _p->reused = 0;
    return true;
}

bool SocketTransport::send(const std::string& data, std::size_t& written, Error& err) {
    written = 0;
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");

    std::size_t off = 0;
    while (off < data.size()) {
        const std::size_t left = data.size() - off;
        if (_p->ssl) {
            ::ERR_clear_error();
            const int n = SSL_write(_p->ssl.get(), data.data() + off,
                                    static_cast<int>(std::min<std::size_t>(left, INT_MAX)));
            if (n <= 0) {
                const int e = SSL_get_error(_p->ssl.get(), n);
                if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) {
                    return fail(err, ErrorKind::TransportError, "timeout");
                }
                const std::string why = internal::openssl_error_string();
                return fail(err, ErrorKind::TransportError, why.empty() ? errno_message(errno) : why);
            }
            off += static_cast<std::size_t>(n);
        } else {
            const ssize_t n = ::send(_p->fd, data.data() + off, left, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) return fail(err, ErrorKind::TransportError, errno_message(errno));
            if (n == 0) return fail(err, ErrorKind::TransportError, "closed");
            off += static_cast<std::size_t>(n);
        }
        written = off;
    }
    return true;
}

bool SocketTransport::receive_line(std::string& line, Error& err) {
    line.clear();
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");

    std::size_t scanned = _p->rpos;
    for (;;) {
        const std::size_t nl = _p->rbuf.find('\n', scanned);
        if (nl != std::string::npos) {
            _p->take(nl - _p->rpos, line);
            _p->consume(1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        scanned = _p->rbuf.size();
        if (_p->buffered() > kMaxLineBytes) {
            return fail(err, ErrorKind::TransportError, "line too long");
        }
        const int n = _p->fill(err);
        if (n < 0) return false;
        if (n == 0) return fail(err, ErrorKind::TransportError, "closed");
    }
}

bool SocketTransport::receive_exactly(std::size_t n, std::string& out, Error& err) {
    out.clear();
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");

    _p->take(std::min(n, _p->buffered()), out);
    while (out.size() < n) {
        const int r = _p->fill(err);
        if (r < 0) return false;
        if (r == 0) {
            return fail(err, ErrorKind::TruncatedBody,
                        "closed after " + std::to_string(out.size()) + " of " + std::to_string(n) + " bytes");
        }
        _p->take(std::min(n - out.size(), _p->buffered()), out);
    }
    return true;
}

bool SocketTransport::receive_all(std::string& out, Error& err) {
    out.clear();
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");

    for (;;) {
        _p->take(_p->buffered(), out);
        const int r = _p->fill(err);
        if (r < 0) return false;
        if (r == 0) return true;
    }
}

bool SocketTransport::set_timeout(std::chrono::milliseconds timeout, Error& err) {
    if (timeout.count() < 0) return fail(err, ErrorKind::TransportError, "negative timeout");
    const int ms = static_cast<int>(std::min<long long>(timeout.count(), std::numeric_limits<int>::max()));
    _p->cfg.io_timeout_ms = ms;
    _p->cfg.connect_timeout_ms = ms;
    if (_p->fd >= 0) _p->apply_io_timeout();
    return true;
}

bool SocketTransport::set_keepalive(std::chrono::milliseconds idle, std::size_t pool_size, Error& err) {
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");
    if (_p->buffered() > 0) return fail(err, ErrorKind::TransportError, "unread data in buffer");

    internal::PooledSocket ps;
    ps.fd = _p->fd;
    ps.ssl = _p->ssl.release();
    ps.reused = _p->reused;
    ps.expires_at = std::chrono::steady_clock::now() + idle;
    internal::SocketPool::instance().release(_p->pool_key, ps, pool_size);

    _p->fd = -1;
    _p->reused = 0;
    _p->reset_buffer();
    return true;
}

bool SocketTransport::close(Error& err) {
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");
    _p->close_fd();
    return true;
}

bool SocketTransport::reuse_count(int& out, Error& err) {
    if (_p->fd < 0) return fail(err, ErrorKind::TransportError, "closed");
    out = _p->reused;
    return true;
}

} // namespace hl
