/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#include "hl/log.hpp"
#include <ctime>
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
bool g_log_stdout = false;

// "2025-01-31T12:00:00Z"
std::string utc_stamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace hl {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (path == g_log_path && g_log_ofs.is_open()) return;
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void set_log_stdout(bool enabled) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_stdout = enabled;
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (!g_log_ofs.is_open() && !g_log_stdout) return;

    const std::string stamped = utc_stamp() + " " + line;
    if (g_log_ofs.is_open()) {
        g_log_ofs << stamped << '\n';
        g_log_ofs.flush();
    }
    if (g_log_stdout) {
        std::cout << stamped << '\n';
    }
}

} // namespace hl
