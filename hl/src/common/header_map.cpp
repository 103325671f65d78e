/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/header_map.hpp"
#include "hl/internal/utils.hpp"

#include <algorithm>
#include <cctype>

namespace {

// Names whose canonical form does not follow the capitalize-after-hyphen rule
// (ETag) or that are common enough to be worth a direct hit.
const char* const kCommonHeaders[] = {
    "Cache-Control",
    "Content-Length",
    "Content-Type",
    "Date",
    "ETag",
    "Expires",
    "Host",
    "Location",
    "User-Agent",
};

std::string join_values(const std::vector<std::string>& values, const char* delim) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) out += delim;
        out += values[i];
    }
    return out;
}

} // namespace

namespace hl {

std::string canonicalize_header(const std::string& name) {
    std::string key = internal::lower_copy(name);
    for (const char* common : kCommonHeaders) {
        if (internal::lower_copy(common) == key) return common;
    }

    bool cap = true;
    for (char& c : key) {
        if (cap) c = (char)std::toupper((unsigned char)c);
        cap = (c == '-');
    }
    return key;
}

const char* header_join_delimiter(const std::string& canonical_name) {
    return canonical_name == "Set-Cookie" ? "; " : ", ";
}

HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init) {
    for (const auto& kv : init) add(kv.first, kv.second);
}

HeaderMap::Entry* HeaderMap::find(const std::string& canonical) {
    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [&](const Entry& e){ return e.name == canonical; });
    return it == _entries.end() ? nullptr : &*it;
}

const HeaderMap::Entry* HeaderMap::find(const std::string& canonical) const {
    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [&](const Entry& e){ return e.name == canonical; });
    return it == _entries.end() ? nullptr : &*it;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    const std::string key = canonicalize_header(name);
    if (Entry* e = find(key)) {
        e->values.assign(1, value);
        return;
    }
    _entries.push_back(Entry{key, {value}});
}

void HeaderMap::add(const std::string& name, const std::string& value) {
    const std::string key = canonicalize_header(name);
    if (Entry* e = find(key)) {
        e->values.push_back(value);
        return;
    }
    _entries.push_back(Entry{key, {value}});
}

void HeaderMap::merge(const std::string& name, const std::string& value) {
    const std::string key = canonicalize_header(name);
    Entry* e = find(key);
    if (!e) {
        _entries.push_back(Entry{key, {value}});
        return;
    }
    const char* delim = header_join_delimiter(key);
    std::string joined = join_values(e->values, delim);
    joined += delim;
    joined += value;
    e->values.assign(1, std::move(joined));
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    const std::string key = canonicalize_header(name);
    const Entry* e = find(key);
    if (!e) return std::nullopt;
    return join_values(e->values, header_join_delimiter(key));
}

std::vector<std::string> HeaderMap::values(const std::string& name) const {
    const Entry* e = find(canonicalize_header(name));
    if (!e) return {};
    return e->values;
}

bool HeaderMap::has(const std::string& name) const {
    return find(canonicalize_header(name)) != nullptr;
}

void HeaderMap::remove(const std::string& name) {
    const std::string key = canonicalize_header(name);
    _entries.erase(std::remove_if(_entries.begin(), _entries.end(),
                                  [&](const Entry& e){ return e.name == key; }),
                   _entries.end());
}

} // namespace hl
