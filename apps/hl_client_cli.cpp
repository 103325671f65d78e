// SPDX-License-Identifier: Apache-2.0
// Part of the HttpLink (HL) project.
// apps/hl_client_cli.cpp

#include "hl/connection.hpp"
#include "hl/http_response.hpp"
#include "hl/internal/http_low.hpp"

#include <iostream>
#include <string>
#include <chrono>
#include <algorithm>
#include <stdexcept>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --host example.com [--port 80] [--method GET] [--path /]\n"
      "      [--query k=v]... [--header \"Name: value\"]... [--data STRING]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <ms>    TCP/TLS connect timeout (default 5000)\n"
      "  --io_timeout <ms>         per-op I/O timeout (default 5000)\n"
      "\n"
      "Connection reuse:\n"
      "  --repeat <n>              send the request n times, reconnecting through\n"
      "                            the keep-alive pool between exchanges (default 1)\n"
      "  --insecure 0|1            skip TLS peer verification (default 0)\n"
      "\n"
      "Logging:\n"
      "  --log <file>              append engine log lines to <file>\n"
      "  --verbose                 echo engine log lines to stdout\n";
}

static void print_response(const hl::HttpResponse& resp, bool head_only){
    std::cout << "HTTP ";
    if (resp.status) std::cout << *resp.status;
    else std::cout << "???";
    std::cout << " " << resp.status_text << "\n";
    for (const auto& e : resp.headers){
        for (const auto& v : e.values){
            std::cout << e.name << ": " << v << "\n";
        }
    }
    if (!head_only) std::cout << "\n" << resp.body << "\n";
}

int main(int argc, char** argv){
    hl::ClientConfig cfg;
    std::string host;
    int port = 80;
    int repeat = 1;
    hl::RequestSpec spec;
    hl::QueryParams query;

    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        try {
            if(a=="--host" && i+1<argc) host = argv[++i];
            else if(a=="--port" && i+1<argc) port = std::stoi(argv[++i]);
            else if(a=="--method" && i+1<argc) spec.method = argv[++i];
            else if(a=="--path" && i+1<argc) spec.path = argv[++i];
            else if(a=="--data" && i+1<argc) spec.body = argv[++i];
            else if(a=="--query" && i+1<argc) {
                const std::string kv = argv[++i];
                const auto eq = kv.find('=');
                if (eq == std::string::npos) query[kv] = "";
                else query[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            else if(a=="--header" && i+1<argc) {
                const std::string h = argv[++i];
                const auto c = h.find(':');
                if (c == std::string::npos) { usage(argv[0]); return 2; }
                std::string v = h.substr(c + 1);
                v.erase(0, std::min(v.find_first_not_of(' '), v.size()));
                spec.headers.add(h.substr(0, c), v);
            }
            else if(a=="--repeat" && i+1<argc) repeat = std::max(1, std::stoi(argv[++i]));
            else if(a=="--insecure" && i+1<argc) cfg.tls_verify_peer = (std::stoi(argv[++i])==0);
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_ms = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      cfg.io_timeout_ms      = std::max(1, std::stoi(argv[++i]));
            else if(a=="--log" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--verbose") cfg.log_stdout = true;
            else { usage(argv[0]); return 2; }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << a << "\n";
            return 2;
        }
    }

    if (host.empty()) { usage(argv[0]); return 2; }
    if (!query.empty()) spec.query = query;

    hl::Connection conn = hl::new_connection(cfg);
    const bool head_only = hl::internal::resolve_method(spec) == "HEAD";

    for (int n = 0; n < repeat; ++n) {
        hl::Error err;
        if (!conn.connect(host, port, err)) {
            std::cerr << "connect() failed: " << err.message << "\n";
            return 1;
        }

        int reused = 0;
        if (!conn.get_reuse_count(reused, err)) {
            std::cerr << "get_reuse_count() failed: " << err.message << "\n";
            return 1;
        }

        const auto t0 = std::chrono::steady_clock::now();
        hl::HttpResponse resp;
        if (!conn.request(spec, resp, err)) {
            std::cerr << "request() failed (" << hl::to_string(err.kind) << "): " << err.message << "\n";
            return 1;
        }
        const auto t1 = std::chrono::steady_clock::now();

        if (repeat > 1) {
            const double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
            std::cout << "=== exchange " << (n + 1) << " (reused " << reused << "x, "
                      << ms << " ms) ===\n";
        }
        print_response(resp, head_only);
    }
    return 0;
}
