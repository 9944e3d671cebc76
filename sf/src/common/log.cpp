/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
sf::LogLevel g_log_level = sf::LogLevel::Warn;

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}

const char* level_tag(sf::LogLevel level) {
    switch (level) {
        case sf::LogLevel::Debug: return "D ";
        case sf::LogLevel::Info:  return "I ";
        case sf::LogLevel::Warn:  return "W ";
        case sf::LogLevel::Error: return "E ";
        case sf::LogLevel::Off:   break;
    }
    return "";
}
} // namespace

namespace sf {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_level = level;
}

void log_line(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (level == LogLevel::Off || level < g_log_level) return;
    open_if_needed_unlocked();
    if (g_log_ofs.is_open()) {
        g_log_ofs << level_tag(level) << line << '\n';
        g_log_ofs.flush();
    }
    std::cerr << level_tag(level) << line << '\n';
}

void log_line(const std::string& line) {
    log_line(LogLevel::Info, line);
}

} // namespace sf
