/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/response_reader.hpp"
#include "sf/internal/http_low.hpp"
#include "sf/internal/utils.hpp"
#include "sf/log.hpp"

#include <algorithm>

namespace sf::internal {
namespace {

constexpr std::size_t kReadChunk = 16384;
constexpr std::size_t kMaxLine = 8192;
constexpr int kMaxInterim = 16;

void set_err(sf::FetchError& err, sf::ErrorKind kind, const std::string& msg) {
    err.kind = kind;
    err.message = msg;
}

bool bodyless_status(int code) {
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}

} // namespace

bool ResponseReader::fill(sf::FetchError& err, bool& eof) {
    if (_pos > 0 && _pos == _buf.size()) {
        _buf.clear();
        _pos = 0;
    }
    char tmp[kReadChunk];
    const long n = _s.read_some(tmp, sizeof(tmp), err);
    if (n < 0) return false;
    eof = (n == 0);
    if (n > 0) _buf.append(tmp, tmp + n);
    return true;
}

bool ResponseReader::read_head(std::string& head, sf::FetchError& err) {
    std::size_t scanned = 0; // bytes past _pos already searched
    while (true) {
        // The head ends at an empty line; lines end in CRLF or a bare LF.
        std::size_t nl = _buf.find('\n', _pos + scanned);
        while (nl != std::string::npos && nl + 1 < _buf.size()) {
            std::size_t end = std::string::npos;
            if (_buf[nl + 1] == '\n') end = nl + 2;
            else if (_buf[nl + 1] == '\r' && nl + 2 < _buf.size() && _buf[nl + 2] == '\n') end = nl + 3;
            if (end != std::string::npos) {
                std::size_t last = nl;
                if (last > _pos && _buf[last - 1] == '\r') --last;
                head.assign(_buf, _pos, last - _pos);
                _pos = end;
                return true;
            }
            nl = _buf.find('\n', nl + 1);
        }
        if (_buf.size() - _pos > _max_header) {
            set_err(err, sf::ErrorKind::Protocol, "server response headers exceeded " +
                    std::to_string(_max_header) + " bytes");
            return false;
        }
        const std::size_t pending = _buf.size() - _pos;
        scanned = pending >= 3 ? pending - 3 : 0;
        bool eof = false;
        if (!fill(err, eof)) return false;
        if (eof) {
            set_err(err, sf::ErrorKind::Io, _buf.size() == _pos
                    ? "server closed connection before sending a response (EOF)"
                    : "unexpected EOF while reading response headers");
            return false;
        }
    }
}

bool ResponseReader::read_line(std::string& line, sf::FetchError& err) {
    while (true) {
        const std::size_t at = _buf.find("\r\n", _pos);
        if (at != std::string::npos) {
            line.assign(_buf, _pos, at - _pos);
            _pos = at + 2;
            return true;
        }
        if (_buf.size() - _pos > kMaxLine) {
            set_err(err, sf::ErrorKind::Protocol, "chunk header line too long");
            return false;
        }
        bool eof = false;
        if (!fill(err, eof)) return false;
        if (eof) {
            set_err(err, sf::ErrorKind::Io, "unexpected EOF in chunked body");
            return false;
        }
    }
}

bool ResponseReader::read_exact(std::size_t n, std::string& out, sf::FetchError& err) {
    std::size_t got = 0;
    while (got < n) {
        if (_pos == _buf.size()) {
            bool eof = false;
            if (!fill(err, eof)) return false;
            if (eof) {
                set_err(err, sf::ErrorKind::Io, "unexpected EOF: got " + std::to_string(got) +
                        " of " + std::to_string(n) + " body bytes");
                return false;
            }
        }
        const std::size_t take = std::min(n - got, _buf.size() - _pos);
        out.append(_buf, _pos, take);
        _pos += take;
        got += take;
    }
    return true;
}

bool ResponseReader::read_to_eof(std::string& out, sf::FetchError& err) {
    while (true) {
        out.append(_buf, _pos, std::string::npos);
        _pos = _buf.size();
        bool eof = false;
        if (!fill(err, eof)) return false;
        if (eof) return true;
    }
}

bool ResponseReader::read_chunked(std::string& out, sf::FetchError& err) {
    std::string line;
    while (true) {
        if (!read_line(line, err)) return false;
        const std::size_t semi = line.find(';');
        std::string size_s = line.substr(0, semi);
        trim_inplace(size_s);
        std::uint64_t size = 0;
        if (!parse_u64_hex(size_s, size)) {
            set_err(err, sf::ErrorKind::Protocol, "malformed chunk size \"" + size_s + "\"");
            return false;
        }
        if (size == 0) break;
        if (!read_exact((std::size_t)size, out, err)) return false;
        if (!read_line(line, err)) return false;
        if (!line.empty()) {
            set_err(err, sf::ErrorKind::Protocol, "missing CRLF after chunk data");
            return false;
        }
    }
    // trailers, up to the terminating blank line
    while (true) {
        if (!read_line(line, err)) return false;
        if (line.empty()) return true;
    }
}

bool ResponseReader::read(sf::HttpResponse& out, sf::FetchError& err) {
    std::string head;
    for (int interim = 0; ; ++interim) {
        if (!read_head(head, err)) return false;
        if (!parse_http_head(head, out.status_code, out.status_text, out.headers)) {
            set_err(err, sf::ErrorKind::Protocol, "malformed HTTP response \"" +
                    head.substr(0, head.find_first_of("\r\n")) + "\"");
            return false;
        }
        // 101 is never expected: no Upgrade is sent.
        if (out.status_code < 100 || out.status_code >= 200 || out.status_code == 101) break;
        if (interim >= kMaxInterim) {
            set_err(err, sf::ErrorKind::Protocol, "too many interim 1xx responses");
            return false;
        }
        sf::log_line(sf::LogLevel::Debug, "[HTTP] skipping interim " + std::to_string(out.status_code));
    }

    out.body.clear();
    if (bodyless_status(out.status_code)) return true;

    const std::string te = lower_copy(hdr_ci(out.headers, "Transfer-Encoding"));
    if (!te.empty()) {
        std::string last = te.substr(te.rfind(',') == std::string::npos ? 0 : te.rfind(',') + 1);
        trim_inplace(last);
        if (last == "chunked") return read_chunked(out.body, err);
        return read_to_eof(out.body, err);
    }

    const std::string cl = hdr_ci(out.headers, "Content-Length");
    if (!cl.empty()) {
        std::uint64_t n = 0;
        if (!parse_u64_dec(cl, n)) {
            set_err(err, sf::ErrorKind::Protocol, "bad Content-Length \"" + cl + "\"");
            return false;
        }
        out.body.reserve((std::size_t)std::min<std::uint64_t>(n, 1u << 24));
        return read_exact((std::size_t)n, out.body, err);
    }

    return read_to_eof(out.body, err);
}

} // namespace sf::internal
