/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/url.hpp"
#include "sf/internal/utils.hpp"

#include <cctype>
#include <vector>

namespace sf::internal {
namespace {

bool has_bad_chars(const std::string& s) {
    for (unsigned char c : s) {
        if (c <= 0x20 || c == 0x7f) return true;
    }
    return false;
}

bool looks_like_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha((unsigned char)s[0])) return false;
    for (unsigned char c : s) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

// RFC 3986 5.2.4, applied to the path part only.
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::size_t pos = 1; // path always starts with '/'
    bool trailing_slash = false;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        const std::string seg = path.substr(pos, next - pos);
        trailing_slash = (next == path.size()) && (seg == "." || seg == "..");
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
        } else if (seg != ".") {
            out.push_back(seg);
        }
        pos = next + 1;
    }
    std::string r;
    for (const auto& seg : out) r += "/" + seg;
    if (r.empty() || trailing_slash) r += "/";
    return r;
}

std::string normalize_target(const std::string& target) {
    const std::size_t q = target.find('?');
    const std::string path  = target.substr(0, q);
    const std::string query = (q == std::string::npos) ? "" : target.substr(q);
    return remove_dot_segments(path) + query;
}

} // namespace

std::string Url::host_header() const {
    std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    if (port != default_port()) h += ":" + std::to_string(port);
    return h;
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

bool parse_url(const std::string& text, Url& out, std::string& err) {
    if (text.empty()) { err = "empty URL"; return false; }
    if (has_bad_chars(text)) { err = "invalid character in URL"; return false; }

    const std::size_t sep = text.find("://");
    if (sep == std::string::npos || !looks_like_scheme(text.substr(0, sep))) {
        err = "missing protocol scheme";
        return false;
    }
    Url u;
    u.scheme = lower_copy(text.substr(0, sep));
    if (u.scheme != "http" && u.scheme != "https") {
        err = "unsupported protocol scheme \"" + u.scheme + "\"";
        return false;
    }

    std::string rest = text.substr(sep + 3);
    const std::size_t frag = rest.find('#');
    if (frag != std::string::npos) rest.erase(frag);

    const std::size_t auth_end = rest.find_first_of("/?");
    const std::string authority = rest.substr(0, auth_end);
    std::string target = (auth_end == std::string::npos) ? "" : rest.substr(auth_end);

    if (authority.find('@') != std::string::npos) {
        err = "user info in URL is not supported";
        return false;
    }

    std::string port_s;
    if (!authority.empty() && authority[0] == '[') {
        const std::size_t rb = authority.find(']');
        if (rb == std::string::npos) { err = "missing ']' in host"; return false; }
        u.host = authority.substr(1, rb - 1);
        const std::string after = authority.substr(rb + 1);
        if (!after.empty()) {
            if (after[0] != ':') { err = "invalid port \"" + after + "\" after host"; return false; }
            port_s = after.substr(1);
        }
        if (!is_ip_literal(u.host) || u.host.find(':') == std::string::npos) {
            err = "invalid IPv6 literal \"" + u.host + "\"";
            return false;
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        u.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_s = authority.substr(colon + 1);
    }

    if (u.host.empty()) { err = "missing host in URL"; return false; }
    u.host = lower_copy(u.host);

    u.port = u.default_port();
    if (!port_s.empty()) {
        std::uint64_t p = 0;
        if (!parse_u64_dec(port_s, p) || p == 0 || p > 65535) {
            err = "invalid port \":" + port_s + "\"";
            return false;
        }
        u.port = (std::uint16_t)p;
    }

    if (target.empty() || target[0] == '?') target = "/" + target;
    u.target = normalize_target(target);

    out = u;
    return true;
}

bool resolve_reference(const Url& base, const std::string& ref_in, Url& out, std::string& err) {
    std::string ref = ref_in;
    trim_inplace(ref);
    const std::size_t frag = ref.find('#');
    if (frag != std::string::npos) ref.erase(frag);

    if (ref.empty()) { out = base; return true; }
    if (has_bad_chars(ref)) { err = "invalid character in redirect location"; return false; }

    // absolute
    const std::size_t colon = ref.find(':');
    const std::size_t first_delim = ref.find_first_of("/?");
    if (colon != std::string::npos && (first_delim == std::string::npos || colon < first_delim) &&
        looks_like_scheme(ref.substr(0, colon))) {
        return parse_url(ref, out, err);
    }

    // scheme-relative
    if (ref.size() >= 2 && ref[0] == '/' && ref[1] == '/') {
        return parse_url(base.scheme + ":" + ref, out, err);
    }

    Url u = base;
    const std::size_t q = base.target.find('?');
    const std::string base_path = base.target.substr(0, q);

    if (ref[0] == '/') {
        u.target = normalize_target(ref);
    } else if (ref[0] == '?') {
        u.target = base_path + ref;
    } else {
        const std::size_t slash = base_path.rfind('/');
        const std::string dir = base_path.substr(0, slash + 1);
        u.target = normalize_target(dir + ref);
    }
    out = u;
    return true;
}

} // namespace sf::internal
