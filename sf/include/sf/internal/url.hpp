/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <cstdint>

namespace sf::internal {

struct Url {
    std::string   scheme;        // "http" or "https", lower case
    std::string   host;          // no brackets for IPv6 literals
    std::uint16_t port = 0;      // always set (scheme default when omitted)
    std::string   target = "/";  // path plus "?query", never empty

    bool tls() const { return scheme == "https"; }
    std::uint16_t default_port() const { return tls() ? 443 : 80; }

    // "host" or "host:port" (brackets around IPv6), as sent in Host:
    std::string host_header() const;
    std::string to_string() const;
};

// Parse an absolute http(s) URL. Fragments are dropped.
bool parse_url(const std::string& text, Url& out, std::string& err);

// Resolve a Location header value against the URL that produced it.
bool resolve_reference(const Url& base, const std::string& ref, Url& out, std::string& err);

} // namespace sf::internal
