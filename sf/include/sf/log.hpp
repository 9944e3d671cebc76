/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include "sf/types.hpp"

namespace sf {

// Thread-safe logging (to optional file + stderr). stdout is left to callers.
void set_log_file(const std::string& path);   // empty path disables the file sink
void set_log_level(LogLevel level);
void log_line(LogLevel level, const std::string& line);
void log_line(const std::string& line);        // LogLevel::Info

} // namespace sf
