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

namespace sf::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string lower_copy(std::string s);

// Case-insensitive header lookup; empty string when absent.
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

// Strict unsigned decimal / hex parsing (no sign, no whitespace, no overflow).
bool parse_u64_dec(const std::string& s, std::uint64_t& out);
bool parse_u64_hex(const std::string& s, std::uint64_t& out);

// True when s is an IPv4 or IPv6 literal (no brackets).
bool is_ip_literal(const std::string& s);

} // namespace sf::internal
