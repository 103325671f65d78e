/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/internal/http_low.hpp"
#include "hl/internal/utils.hpp"

#include <cctype>
#include <sstream>

namespace hl::internal {

static const char* const kHttp11 = " HTTP/1.1\r\n";

std::string resolve_method(const RequestSpec& spec) {
    if (!spec.method || spec.method->empty()) return "GET";
    return upper_copy(*spec.method);
}

std::string resolve_path(const ConnectionConfig& conf, const RequestSpec& spec) {
    std::string path;
    if (spec.path) path = *spec.path;
    else if (conf.path) path = *conf.path;
    else return "/";

    if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
    return path;
}

std::string resolve_query(const RequestSpec& spec) {
    if (const auto* s = std::get_if<std::string>(&spec.query)) return *s;
    if (const auto* m = std::get_if<QueryParams>(&spec.query)) return encode_query(*m);
    return {};
}

std::string build_request_head(const ConnectionConfig& conf,
                               const RequestSpec& spec,
                               const std::string& user_agent)
{
    std::ostringstream req;
    req << resolve_method(spec) << ' ' << resolve_path(conf, spec);
    const std::string q = resolve_query(spec);
    if (!q.empty()) req << '?' << q;
    req << kHttp11;

    // Working copy; caller values win except for Content-Length.
    HeaderMap headers = spec.headers;
    if (spec.body) {
        headers.set("Content-Length", std::to_string(spec.body->size()));
    }
    if (!headers.has("Host")) {
        headers.set("Host", conf.host);
    }
    if (!headers.has("User-Agent")) {
        headers.set("User-Agent", user_agent);
    }
    if (!headers.has("Accept")) {
        headers.set("Accept", "*/*");
    }

    for (const auto& e : headers) {
        for (const auto& v : e.values) {
            req << e.name << ": " << v << "\r\n";
        }
    }
    req << "\r\n";
    return req.str();
}

std::optional<int> parse_status_code(const std::string& line) {
    // "HTTP/1.1 200 OK"
    //           ^^^ characters 10..12
    if (line.size() < 12) return std::nullopt;
    int code = 0;
    for (std::size_t i = 9; i < 12; ++i) {
        const unsigned char c = (unsigned char)line[i];
        if (!std::isdigit(c)) return std::nullopt;
        code = code * 10 + (c - '0');
    }
    return code;
}

std::string parse_status_text(const std::string& line) {
    if (line.size() <= 13 || line[12] != ' ') return {};
    return trim_copy(line.substr(13));
}

bool read_status_line(Transport& t,
                      std::optional<int>& status,
                      std::string& status_text,
                      Error& err)
{
    std::string line;
    if (!t.receive_line(line, err)) return false;
    status = parse_status_code(line);
    status_text = parse_status_text(line);
    return true;
}

bool parse_header_line(const std::string& line, std::string& name, std::string& value) {
    auto is_name_char = [](unsigned char c){ return std::isalnum(c) || c == '-'; };
    auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };

    std::size_t i = 0;
    while (i < line.size() && is_name_char((unsigned char)line[i])) ++i;
    if (i == 0) return false;

    std::size_t j = i;
    while (j < line.size() && is_space((unsigned char)line[j])) ++j;
    if (j >= line.size() || line[j] != ':') return false;
    ++j;
    while (j < line.size() && is_space((unsigned char)line[j])) ++j;
    if (j >= line.size()) return false;

    name = line.substr(0, i);
    value = line.substr(j);
    return true;
}

bool parse_headers(Transport& t, HeaderMap& out, Error& err) {
    for (;;) {
        std::string line;
        if (!t.receive_line(line, err)) return false;
        if (is_blank(line)) break;

        std::string name, value;
        if (parse_header_line(line, name, value)) {
            out.merge(name, value);
        }
    }
    return true;
}

bool response_has_body(const std::string& method, const std::optional<int>& status) {
    if (upper_copy(method) == "HEAD") return false;
    if (!status) return true;
    const int sc = *status;
    return !((sc >= 100 && sc < 200) || sc == 204 || sc == 304);
}

bool wants_close(const HeaderMap& headers) {
    const auto conn = headers.get("Connection");
    return conn && lower_copy(trim_copy(*conn)) == "close";
}

} // namespace hl::internal
