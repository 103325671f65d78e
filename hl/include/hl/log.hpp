/*
 * Part of the HttpLink (HL) project.
 *
 * SPDX-FileCopyrightText: 2025 HttpLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HttpLink (HL). See LICENSE for details.
 */

#pragma once
#include <string>

namespace hl {

// Thread-safe logging (to file and/or stdout).
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void set_log_stdout(bool enabled);
void log_line(const std::string& line);

} // namespace hl
