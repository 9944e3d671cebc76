/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <unordered_map>
#include <cstddef>
#include <cstdint>
#include "sf/fetch_config.hpp"
#include "sf/types.hpp"

namespace sf::internal {

// RAII TCP connection with a bounded connect and per-op I/O timeouts.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port. Resolve and connect failures are
    // reported with distinct kinds.
    bool open(const std::string& host, std::uint16_t port,
              const sf::FetchConfig& cfg, sf::FetchError& err);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);

private:
    int _fd = -1;
};

// Parse an HTTP/1.x status line and header block (everything before the
// blank line). Header names keep their case; duplicates keep the last value.
bool parse_http_head(const std::string& head,
                     int& status_code,
                     std::string& status_text,
                     std::unordered_map<std::string,std::string>& headers);

} // namespace sf::internal
