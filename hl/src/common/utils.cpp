/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <vector>

namespace hl::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string trim_copy(std::string s) {
    trim_inplace(s);
    return s;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string url_encode(const std::string& s) {
    static const char* H = "0123456789ABCDEF";
    auto is_unreserved = [](unsigned char c){
        return std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~';
    };
    std::string out; out.reserve(s.size()*3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(H[c>>4]);
            out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string encode_query(const std::unordered_map<std::string,std::string>& params){
    std::vector<std::pair<std::string,std::string>> v(params.begin(), params.end());
    std::sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        return a.first < b.first;
    });
    std::ostringstream oss;
    bool first=true;
    for(const auto& kv: v){
        if(!first) oss << '&';
        first=false;
        oss << url_encode(kv.first) << '=' << url_encode(kv.second);
    }
    return oss.str();
}

std::optional<std::uint64_t> parse_decimal(const std::string& s) {
    const std::string t = trim_copy(s);
    if (t.empty()) return std::nullopt;
    std::uint64_t v = 0;
    for (char c : t) {
        if (c < '0' || c > '9') return std::nullopt;
        const std::uint64_t d = (std::uint64_t)(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}

std::optional<std::uint64_t> parse_chunk_size(const std::string& line) {
    std::string t = line.substr(0, line.find(';'));
    trim_inplace(t);
    if (t.empty() || t.size() > 16) return std::nullopt;
    std::uint64_t v = 0;
    for (char c : t) {
        const int h = hexval(c);
        if (h < 0) return std::nullopt;
        v = (v << 4) | (std::uint64_t)h;
    }
    return v;
}

} // namespace hl::internal
