/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <strings.h> // strcasecmp
#include <arpa/inet.h>

namespace sf::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool parse_u64_dec(const std::string& s, std::uint64_t& out){
    if (s.empty() || s.size() > 20) return false;
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const std::uint64_t d = (std::uint64_t)(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parse_u64_hex(const std::string& s, std::uint64_t& out){
    if (s.empty() || s.size() > 16) return false;
    std::uint64_t v = 0;
    for (char c : s) {
        const int h = hexval(c);
        if (h < 0) return false;
        v = (v << 4) | (std::uint64_t)h;
    }
    out = v;
    return true;
}

bool is_ip_literal(const std::string& s){
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, s.c_str(), tmp) == 1 ||
           ::inet_pton(AF_INET6, s.c_str(), tmp) == 1;
}

} // namespace sf::internal
