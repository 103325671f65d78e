/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/connection.hpp"
#include "hl/socket_transport.hpp"
#include "hl/internal/socket_pool.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace hl;

namespace {

struct Reply {
    std::string bytes;
    bool close_after = false;
};

// Single-threaded HTTP-ish peer on 127.0.0.1. Each request head it reads
// is answered with the next scripted reply; connections are served one at
// a time so a reused socket keeps talking to the same accept().
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<Reply> replies) : _replies(std::move(replies)) {
        _lfd = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(_lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(_lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            ::listen(_lfd, 8) == 0) {
            socklen_t len = sizeof(addr);
            ::getsockname(_lfd, reinterpret_cast<sockaddr*>(&addr), &len);
            _port = ntohs(addr.sin_port);
        }
        _thread = std::thread([this]{ run(); });
    }

    ~LoopbackServer() {
        _stop = true;
        ::shutdown(_lfd, SHUT_RDWR);
        const int c = _active.load();
        if (c >= 0) ::shutdown(c, SHUT_RDWR);
        if (_thread.joinable()) _thread.join();
        ::close(_lfd);
    }

    int port() const { return _port; }
    int accepts() const { return _accepts.load(); }

private:
    void run() {
        std::size_t next = 0;
        while (!_stop && next < _replies.size()) {
            const int c = ::accept(_lfd, nullptr, nullptr);
            if (c < 0) {
                if (errno == EINTR) continue;
                return;
            }
            _accepts++;
            _active = c;

            std::string buf;
            bool open = true;
            while (open && !_stop) {
                const auto end = buf.find("\r\n\r\n");
                if (end == std::string::npos) {
                    char tmp[4096];
                    const ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
                    if (n <= 0) { open = false; break; }
                    buf.append(tmp, static_cast<std::size_t>(n));
                    continue;
                }
                buf.erase(0, end + 4);

                if (next >= _replies.size()) { open = false; break; }
                const Reply& r = _replies[next++];
                ::send(c, r.bytes.data(), r.bytes.size(), MSG_NOSIGNAL);
                if (r.close_after) open = false;
            }
            _active = -1;
            ::close(c);
        }
    }

    std::vector<Reply> _replies;
    int _lfd = -1;
    int _port = 0;
    std::atomic<int> _accepts{0};
    std::atomic<int> _active{-1};
    std::atomic<bool> _stop{false};
    std::thread _thread;
};

ClientConfig fast_config() {
    ClientConfig cfg;
    cfg.connect_timeout_ms = 2000;
    cfg.io_timeout_ms = 2000;
    return cfg;
}

ConnectionConfig loopback(int port) {
    ConnectionConfig c;
    c.host = "127.0.0.1";
    c.port = static_cast<std::uint16_t>(port);
    c.scheme = "http";
    return c;
}

const char* const kRequest = "GET / HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n";

class SocketTransportTest : public ::testing::Test {
protected:
    void TearDown() override { internal::SocketPool::instance().clear(); }
};

} // namespace

TEST_F(SocketTransportTest, LinesThenExactBytes) {
    LoopbackServer srv({{"HTTP/1.1 200 OK\r\nX-A: 1\nX-B: 2\r\n\r\nabcdef"}});
    ASSERT_NE(srv.port(), 0);

    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(loopback(srv.port()), err)) << err.message;

    std::size_t written = 0;
    ASSERT_TRUE(t.send(kRequest, written, err)) << err.message;
    EXPECT_EQ(written, std::string(kRequest).size());

    std::string line;
    ASSERT_TRUE(t.receive_line(line, err)) << err.message;
    EXPECT_EQ(line, "HTTP/1.1 200 OK");
    ASSERT_TRUE(t.receive_line(line, err));
    EXPECT_EQ(line, "X-A: 1");
    ASSERT_TRUE(t.receive_line(line, err));
    EXPECT_EQ(line, "X-B: 2");
    ASSERT_TRUE(t.receive_line(line, err));
    EXPECT_EQ(line, "");

    std::string body;
    ASSERT_TRUE(t.receive_exactly(6, body, err)) << err.message;
    EXPECT_EQ(body, "abcdef");

    int reused = -1;
    ASSERT_TRUE(t.reuse_count(reused, err));
    EXPECT_EQ(reused, 0);
    ASSERT_TRUE(t.close(err));
    EXPECT_EQ(t.fd(), -1);
}

TEST_F(SocketTransportTest, ShortBodyIsTruncated) {
    LoopbackServer srv({{"abc", true}});
    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(loopback(srv.port()), err)) << err.message;

    std::size_t written = 0;
    ASSERT_TRUE(t.send(kRequest, written, err));

    std::string body;
    EXPECT_FALSE(t.receive_exactly(10, body, err));
    EXPECT_EQ(err.kind, ErrorKind::TruncatedBody);
    EXPECT_EQ(body, "abc");
}

TEST_F(SocketTransportTest, ReceiveAllReadsUntilPeerCloses) {
    LoopbackServer srv({{"everything up to the close", true}});
    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(loopback(srv.port()), err)) << err.message;

    std::size_t written = 0;
    ASSERT_TRUE(t.send(kRequest, written, err));

    std::string body;
    ASSERT_TRUE(t.receive_all(body, err)) << err.message;
    EXPECT_EQ(body, "everything up to the close");
}

TEST_F(SocketTransportTest, LineOnClosedStreamFails) {
    LoopbackServer srv({{"no newline", true}});
    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(loopback(srv.port()), err)) << err.message;

    std::size_t written = 0;
    ASSERT_TRUE(t.send(kRequest, written, err));

    std::string line;
    EXPECT_FALSE(t.receive_line(line, err));
    EXPECT_EQ(err.kind, ErrorKind::TransportError);
    EXPECT_EQ(err.message, "closed");
}

TEST_F(SocketTransportTest, OperationsOnUnconnectedTransportFail) {
    SocketTransport t(fast_config());
    Error err;
    std::string s;
    std::size_t written = 0;
    int reused = 0;

    EXPECT_FALSE(t.send("x", written, err));
    EXPECT_EQ(err.message, "closed");
    EXPECT_FALSE(t.receive_line(s, err));
    EXPECT_FALSE(t.receive_exactly(1, s, err));
    EXPECT_FALSE(t.receive_all(s, err));
    EXPECT_FALSE(t.set_keepalive(std::chrono::milliseconds(100), 1, err));
    EXPECT_FALSE(t.close(err));
    EXPECT_FALSE(t.reuse_count(reused, err));
    EXPECT_EQ(err.kind, ErrorKind::TransportError);
}

TEST_F(SocketTransportTest, ConnectRefused) {
    // grab a free port, then release it so nothing listens there
    int port = 0;
    {
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
        ::close(fd);
    }

    SocketTransport t(fast_config());
    Error err;
    EXPECT_FALSE(t.connect(loopback(port), err));
    EXPECT_EQ(err.kind, ErrorKind::TransportError);
    EXPECT_FALSE(err.message.empty());
    EXPECT_EQ(t.fd(), -1);
}

TEST_F(SocketTransportTest, KeepAliveParksAndReconnectReuses) {
    const std::string ok = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";
    LoopbackServer srv({{ok}, {ok}});
    const auto conf = loopback(srv.port());
    const std::string key = "http://127.0.0.1:" + std::to_string(srv.port());

    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(conf, err)) << err.message;

    std::size_t written = 0;
    std::string line, body;
    ASSERT_TRUE(t.send(kRequest, written, err));
    do { ASSERT_TRUE(t.receive_line(line, err)) << err.message; } while (!line.empty());
    ASSERT_TRUE(t.receive_exactly(2, body, err));

    ASSERT_TRUE(t.set_keepalive(std::chrono::seconds(60), 4, err)) << err.message;
    EXPECT_EQ(t.fd(), -1);
    EXPECT_EQ(internal::SocketPool::instance().count(key), 1u);

    // a second transport picks the parked socket up
    SocketTransport t2(fast_config());
    ASSERT_TRUE(t2.connect(conf, err)) << err.message;
    EXPECT_EQ(internal::SocketPool::instance().count(key), 0u);
    int reused = -1;
    ASSERT_TRUE(t2.reuse_count(reused, err));
    EXPECT_EQ(reused, 1);

    ASSERT_TRUE(t2.send(kRequest, written, err));
    do { ASSERT_TRUE(t2.receive_line(line, err)) << err.message; } while (!line.empty());
    ASSERT_TRUE(t2.receive_exactly(2, body, err));
    EXPECT_EQ(body, "ok");
    EXPECT_EQ(srv.accepts(), 1);
    ASSERT_TRUE(t2.close(err));
}

TEST_F(SocketTransportTest, KeepAliveRefusedWithUnreadData) {
    LoopbackServer srv({{"HTTP/1.1 200 OK\r\n\r\nextra-bytes"}});
    SocketTransport t(fast_config());
    Error err;
    ASSERT_TRUE(t.connect(loopback(srv.port()), err)) << err.message;

    std::size_t written = 0;
    ASSERT_TRUE(t.send(kRequest, written, err));
    std::string line;
    ASSERT_TRUE(t.receive_line(line, err));
    ASSERT_TRUE(t.receive_line(line, err));
    // the rest of the reply arrived with the head and is still buffered
    std::string one;
    ASSERT_TRUE(t.receive_exactly(1, one, err));

    EXPECT_FALSE(t.set_keepalive(std::chrono::seconds(60), 4, err));
    EXPECT_EQ(err.message, "unread data in buffer");
    ASSERT_TRUE(t.close(err));
}

TEST_F(SocketTransportTest, ConnectionEndToEndOverLoopback) {
    LoopbackServer srv({
        {"HTTP/1.1 200 OK\r\nContent-Length: 5\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\n\r\nhello"},
        {"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n"},
        {"HTTP/1.1 404 Not Found\r\nConnection: close\r\nContent-Length: 4\r\n\r\nnope", true},
    });

    Connection conn = new_connection(fast_config());
    Error err;
    HttpResponse resp;
    int reused = -1;

    ASSERT_TRUE(conn.connect("127.0.0.1", srv.port(), err)) << err.message;
    ASSERT_TRUE(conn.get_reuse_count(reused, err));
    EXPECT_EQ(reused, 0);
    ASSERT_TRUE(conn.request(RequestSpec{}, resp, err)) << err.message;
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "hello");
    EXPECT_EQ(resp.headers.get("Set-Cookie").value(), "a=1; b=2");

    ASSERT_TRUE(conn.connect("127.0.0.1", srv.port(), err)) << err.message;
    ASSERT_TRUE(conn.get_reuse_count(reused, err));
    EXPECT_EQ(reused, 1);
    RequestSpec spec;
    spec.path = "wiki";
    ASSERT_TRUE(conn.request(spec, resp, err)) << err.message;
    EXPECT_EQ(resp.body, "Wikipedia");

    ASSERT_TRUE(conn.connect("127.0.0.1", srv.port(), err)) << err.message;
    ASSERT_TRUE(conn.get_reuse_count(reused, err));
    EXPECT_EQ(reused, 2);
    ASSERT_TRUE(conn.request(RequestSpec{}, resp, err)) << err.message;
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.status_text, "Not Found");
    EXPECT_EQ(resp.body, "nope");
    EXPECT_EQ(conn.config(), nullptr);

    EXPECT_EQ(srv.accepts(), 1);
}

TEST_F(SocketTransportTest, PoolKeySeparatesTlsVerifyModes) {
    EXPECT_EQ(internal::pool_key("http", "h", 80, true), "http://h:80");
    EXPECT_EQ(internal::pool_key("http", "h", 80, false), "http://h:80");
    EXPECT_NE(internal::pool_key("https", "h", 443, true),
              internal::pool_key("https", "h", 443, false));
}

TEST_F(SocketTransportTest, UnverifiedSocketNotReusedByVerifyingTransport) {
    // Listener that never speaks TLS: the kernel completes the TCP
    // handshake from the backlog, so a fresh TLS handshake times out.
    LoopbackServer srv(std::vector<Reply>{});
    ASSERT_NE(srv.port(), 0);

    ConnectionConfig conf = loopback(srv.port());
    conf.scheme = "https";
    const std::string insecure_key = internal::pool_key("https", conf.host, conf.port, false);

    // park a connected socket as if an --insecure exchange had finished
    {
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(static_cast<std::uint16_t>(srv.port()));
        ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        internal::PooledSocket ps;
        ps.fd = fd;
        ps.expires_at = std::chrono::steady_clock::now() + std::chrono::seconds(60);
        internal::SocketPool::instance().release(insecure_key, ps, 4);
    }
    ASSERT_EQ(internal::SocketPool::instance().count(insecure_key), 1u);

    ClientConfig verifying = fast_config();
    verifying.connect_timeout_ms = 300;
    verifying.tls_verify_peer = true;
    SocketTransport t(verifying);
    Error err;
    EXPECT_FALSE(t.connect(conf, err));
    EXPECT_EQ(err.kind, ErrorKind::TransportError);
    EXPECT_EQ(internal::SocketPool::instance().count(insecure_key), 1u);

    ClientConfig insecure = verifying;
    insecure.tls_verify_peer = false;
    SocketTransport t2(insecure);
    ASSERT_TRUE(t2.connect(conf, err)) << err.message;
    int reused = -1;
    ASSERT_TRUE(t2.reuse_count(reused, err));
    EXPECT_EQ(reused, 1);
    EXPECT_EQ(internal::SocketPool::instance().count(insecure_key), 0u);
}
