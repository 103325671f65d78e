/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hl {

// Canonical spelling of a header name ("content-length" -> "Content-Length",
// "x-my-header" -> "X-My-Header"). Pure; derived names are never cached.
std::string canonicalize_header(const std::string& name);

// Delimiter used when several occurrences of `canonical_name` are merged
// into one value: "; " for Set-Cookie, ", " for everything else.
const char* header_join_delimiter(const std::string& canonical_name);

// Insertion-ordered header container keyed by canonical name.
// Every name passed in is canonicalized first.
class HeaderMap {
public:
    struct Entry {
        std::string name;                // canonical
        std::vector<std::string> values; // one wire line per value
    };
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init);

    // Replace all values of `name`.
    void set(const std::string& name, const std::string& value);
    // Keep `value` as an additional, separate value of `name`.
    void add(const std::string& name, const std::string& value);
    // Fold `value` into the existing single value using the join delimiter.
    void merge(const std::string& name, const std::string& value);

    // All values joined with the header's delimiter.
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);

    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }
    const_iterator begin() const { return _entries.begin(); }
    const_iterator end() const { return _entries.end(); }

private:
    Entry* find(const std::string& canonical);
    const Entry* find(const std::string& canonical) const;

    std::vector<Entry> _entries;
};

} // namespace hl
