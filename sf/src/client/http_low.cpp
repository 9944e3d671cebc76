// SPDX-License-Identifier: Apache-2.0
// Part of the StaticFetch (SF) project.
// sf/src/client/http_low.cpp

#include "sf/internal/http_low.hpp"
#include "sf/log.hpp"
#include "sf/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace sf::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   const sf::FetchConfig& cfg, sf::FetchError& err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        const std::string why = (rc == EAI_SYSTEM) ? std::strerror(errno) : gai_strerror(rc);
        err.kind = sf::ErrorKind::Resolve;
        err.message = "dial tcp: lookup " + host + ": " + why;
        sf::log_line(sf::LogLevel::Error, "[TCP] getaddrinfo failed: " + why);
        if (res) freeaddrinfo(res);
        return false;
    }

    const int connect_timeout_ms = std::max(1, cfg.connect_timeout_sec) * 1000;

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd     = s;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr == 0) {
                last_errno = ETIMEDOUT;
                ::close(s);
                continue;
            }
            if (pr < 0) {
                last_errno = errno;
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr != 0 ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        if (fcntl(s, F_SETFL, flags) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, cfg.io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        const std::string why = last_errno ? std::strerror(last_errno) : "no usable address";
        err.kind = sf::ErrorKind::Connect;
        err.message = "dial tcp " + host + ":" + std::to_string(port) + ": connect: " + why;
        sf::log_line(sf::LogLevel::Error, "[TCP] connect failed: " + why);
        return false;
    }

    sf::log_line(sf::LogLevel::Debug, "[TCP] connected to " + host + ":" + std::to_string(port));
    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

bool parse_http_head(const std::string& head,
                     int& status_code,
                     std::string& status_text,
                     std::unordered_map<std::string,std::string>& headers)
{
    // Lines end in CRLF or a bare LF.
    std::size_t line_end = head.find('\n');
    if (line_end == std::string::npos) line_end = head.size();
    std::string status = head.substr(0, line_end);
    if (!status.empty() && status.back() == '\r') status.pop_back();

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver, code;
    if (!(iss >> httpver >> code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::uint64_t c = 0;
    if (code.size() != 3 || !parse_u64_dec(code, c) || c < 100) return false;
    status_code = (int)c;
    std::getline(iss, status_text);
    trim_inplace(status_text);

    headers.clear();
    std::size_t pos = line_end + 1;
    while (pos < head.size()) {
        std::size_t next = head.find('\n', pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        std::string k = line.substr(0, colon), v = line.substr(colon + 1);
        trim_inplace(k);
        trim_inplace(v);
        headers[k] = v;
    }
    return true;
}

} // namespace sf::internal
