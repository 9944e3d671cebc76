/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/stream.hpp"
#include "sf/internal/http_low.hpp"
#include "sf/internal/tls_cli_ctx.hpp"
#include "sf/log.hpp"

#include <openssl/err.h>
#include <sys/socket.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <algorithm>

namespace sf::internal {

std::string tls_syscall_error(bool reading, int sys) {
    const std::string prefix = reading ? "read tls: " : "write tls: ";
    if (sys == EAGAIN || sys == EWOULDBLOCK) return prefix + "i/o timeout";
    if (sys != 0) return prefix + std::strerror(sys);
    const std::string first = drain_openssl_errors(reading ? "SSL_read" : "SSL_write");
    return prefix + (first.empty() ? std::string("unexpected EOF") : first);
}

bool PlainStream::write_all(const char* d, std::size_t len, sf::FetchError& err) {
    if (!_conn.send_all(d, len)) {
        err.kind = sf::ErrorKind::Io;
        err.message = std::string("write tcp: ") + std::strerror(errno);
        return false;
    }
    return true;
}

long PlainStream::read_some(char* d, std::size_t len, sf::FetchError& err) {
    while (true) {
        ssize_t n = ::recv(_conn.fd(), d, len, 0);
        if (n >= 0) return (long)n;
        if (errno == EINTR) continue;
        err.kind = sf::ErrorKind::Io;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            err.message = "read tcp: i/o timeout";
        } else {
            err.message = std::string("read tcp: ") + std::strerror(errno);
        }
        return -1;
    }
}

bool TlsStream::write_all(const char* d, std::size_t len, sf::FetchError& err) {
    std::size_t off = 0;
    while (off < len) {
        const int chunk = (int)std::min<std::size_t>(len - off, INT_MAX);
        ::ERR_clear_error();
        errno = 0;
        int n = SSL_write(_ssl, d + off, chunk);
        if (n <= 0) {
            const int e = SSL_get_error(_ssl, n);
            if (e == SSL_ERROR_SYSCALL) {
                const int sys = errno;
                err.kind = sf::ErrorKind::Io;
                err.message = tls_syscall_error(false, sys);
                return false;
            }
            const std::string first = drain_openssl_errors("SSL_write");
            err.kind = sf::ErrorKind::Io;
            err.message = "write tls: ssl_error=" + std::to_string(e);
            if (!first.empty()) err.message += " (" + first + ")";
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

long TlsStream::read_some(char* d, std::size_t len, sf::FetchError& err) {
    const int chunk = (int)std::min<std::size_t>(len, INT_MAX);
    while (true) {
        ::ERR_clear_error();
        errno = 0;
        int n = SSL_read(_ssl, d, chunk);
        if (n > 0) return n;

        const int e = SSL_get_error(_ssl, n);
        if (e == SSL_ERROR_ZERO_RETURN) return 0;          // close_notify
        if (e == SSL_ERROR_SYSCALL) {
            if (errno == EINTR) continue;
            const int sys = errno;
            if (sys == 0 && ::ERR_peek_error() == 0) return 0; // bare TCP EOF
            err.kind = sf::ErrorKind::Io;
            err.message = tls_syscall_error(true, sys);
            return -1;
        }
        const std::string first = drain_openssl_errors("SSL_read");
        err.kind = sf::ErrorKind::Io;
        err.message = "read tls: ssl_error=" + std::to_string(e);
        if (!first.empty()) err.message += " (" + first + ")";
        return -1;
    }
}

} // namespace sf::internal
