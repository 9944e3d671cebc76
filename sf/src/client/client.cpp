/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/client.hpp"
#include "sf/log.hpp"
#include "sf/http_response.hpp"

#include "sf/internal/utils.hpp"
#include "sf/internal/url.hpp"
#include "sf/internal/tls_cli_ctx.hpp"
#include "sf/internal/http_low.hpp"
#include "sf/internal/stream.hpp"
#include "sf/internal/response_reader.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <sstream>
#include <algorithm>
#include <memory>
#include <utility>

#include <chrono>
#include <limits>
#include <cstring>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

[[nodiscard]] bool wait_fd(int fd, short ev, std::chrono::steady_clock::time_point deadline) {
    const int ms = remaining_ms(deadline);
    if (ms <= 0) return false;
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = ev;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    return pr > 0;
}

// TLS handshake on a non-blocking socket with a bounded deadline.
// Certificate rejections are reported as TlsVerify, everything else as
// TlsHandshake.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec, sf::FetchError& err) {
    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        errno = 0;
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            if (!wait_fd(fd, ev, deadline)) {
                err.kind = sf::ErrorKind::TlsHandshake;
                err.message = "net/http: TLS handshake timeout";
                sf::log_line(sf::LogLevel::Error, "[CLIENT] SSL_connect timeout");
                return false;
            }
            continue;
        }

        // Certificate chain / hostname rejected by the verifier.
        const long vr = ::SSL_get_verify_result(ssl);
        if (vr != X509_V_OK) {
            (void)sf::internal::drain_openssl_errors("SSL_connect");
            err.kind = sf::ErrorKind::TlsVerify;
            err.message = std::string("tls: certificate verify failed: ") + ::X509_verify_cert_error_string(vr);
            sf::log_line(sf::LogLevel::Error, "[CLIENT] " + err.message);
            return false;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) {
                continue;
            }
            if (e == EAGAIN || e == EWOULDBLOCK) {
                if (!wait_fd(fd, POLLIN, deadline)) {
                    err.kind = sf::ErrorKind::TlsHandshake;
                    err.message = "net/http: TLS handshake timeout";
                    return false;
                }
                continue;
            }
            const std::string first = sf::internal::drain_openssl_errors("SSL_connect");
            err.kind = sf::ErrorKind::TlsHandshake;
            if (e != 0) {
                err.message = std::string("tls handshake: ") + std::strerror(e);
            } else if (!first.empty()) {
                err.message = "tls handshake: " + first;
            } else {
                err.message = "tls handshake: connection closed by peer (EOF)";
            }
            sf::log_line(sf::LogLevel::Error, "[CLIENT] " + err.message);
            return false;
        }

        const std::string first = sf::internal::drain_openssl_errors("SSL_connect");
        err.kind = sf::ErrorKind::TlsHandshake;
        err.message = "tls handshake failed: ssl_error=" + std::to_string(ssl_err);
        if (!first.empty()) err.message += " (" + first + ")";
        sf::log_line(sf::LogLevel::Error, "[CLIENT] " + err.message);
        return false;
    }
}

bool is_redirect(int code) {
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

} // namespace

namespace sf {

struct Client::Impl {
    FetchConfig cfg;
    FetchError  last;

    std::unique_ptr<internal::TlsClientContext> tls; // created on first https hop

    explicit Impl(const FetchConfig& c): cfg(c) {
        set_log_level(cfg.log_level);
        set_log_file(cfg.log_file);
    }

    bool ensure_tls() {
        if (!tls) {
            tls = std::make_unique<internal::TlsClientContext>(cfg);
            if (tls->ok()) log_line("[TLS-CLI] trust roots from " + tls->trust_source());
        }
        if (!tls->ok()) {
            last.kind = ErrorKind::TlsSetup;
            last.message = tls->error();
            return false;
        }
        return true;
    }

    std::string build_request(const internal::Url& u) const {
        std::ostringstream req;
        req << "GET " << u.target << " HTTP/1.1\r\n";
        req << "Host: " << u.host_header() << "\r\n";
        req << "User-Agent: " << cfg.user_agent << "\r\n";
        req << "Accept: */*\r\n";
        req << "Accept-Encoding: identity\r\n";
        req << "Connection: close\r\n";
        req << "\r\n";
        return req.str();
    }

    // One request on a fresh connection.
    bool fetch_once(const internal::Url& u, HttpResponse& out) {
        internal::TcpConn conn;
        if (!conn.open(u.host, u.port, cfg, last)) return false;

        std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
        std::unique_ptr<internal::ByteStream> stream;

        if (u.tls()) {
            if (!ensure_tls()) return false;
            ssl.reset(SSL_new(tls->ctx()));
            if (!ssl) {
                last.kind = ErrorKind::TlsSetup;
                last.message = "tls: SSL_new failed";
                const std::string first = internal::drain_openssl_errors("SSL_new");
                if (!first.empty()) last.message += ": " + first;
                return false;
            }
            if (SSL_set_fd(ssl.get(), conn.fd()) != 1) {
                last.kind = ErrorKind::TlsSetup;
                last.message = "tls: SSL_set_fd failed";
                return false;
            }

            const bool ip_host = internal::is_ip_literal(u.host);
            // SNI must not carry IP literals.
            if (!ip_host && SSL_set_tlsext_host_name(ssl.get(), u.host.c_str()) != 1) {
                last.kind = ErrorKind::TlsSetup;
                last.message = "tls: cannot set SNI " + u.host;
                return false;
            }

            // Chain validation alone does not bind the certificate to the host.
            if (cfg.tls_verify_peer) {
                X509_VERIFY_PARAM* param = SSL_get0_param(ssl.get());
                const int ok = ip_host ? X509_VERIFY_PARAM_set1_ip_asc(param, u.host.c_str())
                                       : SSL_set1_host(ssl.get(), u.host.c_str());
                if (ok != 1) {
                    last.kind = ErrorKind::TlsSetup;
                    last.message = "tls: cannot set expected peer name " + u.host;
                    return false;
                }
            }

            const int fd = conn.fd();
            const int old_flags = ::fcntl(fd, F_GETFL, 0);
            if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
                last.kind = ErrorKind::TlsSetup;
                last.message = std::string("tls: fcntl(O_NONBLOCK): ") + std::strerror(errno);
                return false;
            }
            const bool hs_ok = ssl_connect_with_deadline(ssl.get(), fd, cfg.connect_timeout_sec, last);
            if (::fcntl(fd, F_SETFL, old_flags) < 0 && hs_ok) {
                last.kind = ErrorKind::Io;
                last.message = std::string("fcntl(restore): ") + std::strerror(errno);
                return false;
            }
            if (!hs_ok) return false;

            // Enforce verification result explicitly.
            if (cfg.tls_verify_peer) {
                const long vr = SSL_get_verify_result(ssl.get());
                if (vr != X509_V_OK) {
                    last.kind = ErrorKind::TlsVerify;
                    last.message = std::string("tls: certificate verify failed: ") + X509_verify_cert_error_string(vr);
                    return false;
                }
            }
            log_line(LogLevel::Debug, std::string("[CLIENT] TLS established: ") + SSL_get_version(ssl.get()) +
                     " " + SSL_get_cipher_name(ssl.get()));
            stream = std::make_unique<internal::TlsStream>(ssl.get());
        } else {
            stream = std::make_unique<internal::PlainStream>(conn);
        }

        const std::string req = build_request(u);
        if (!stream->write_all(req.data(), req.size(), last)) return false;

        internal::ResponseReader reader(*stream, cfg.max_header_bytes);
        if (!reader.read(out, last)) return false;

        if (ssl) {
            // Best effort: the response is complete whatever the peer does now.
            (void)SSL_shutdown(ssl.get());
            ::ERR_clear_error();
        }
        log_line(LogLevel::Debug, "[CLIENT] " + u.to_string() + " -> " + std::to_string(out.status_code) +
                 " (" + std::to_string(out.body.size()) + " bytes)");
        return true;
    }

    bool get(const std::string& url, HttpResponse& out) {
        last.clear();

        internal::Url cur;
        std::string perr;
        if (!internal::parse_url(url, cur, perr)) {
            last.kind = ErrorKind::InvalidUrl;
            last.message = perr;
            return false;
        }

        for (int hop = 0; ; ++hop) {
            HttpResponse resp;
            if (!fetch_once(cur, resp)) return false;

            const std::string loc = internal::hdr_ci(resp.headers, "Location");
            if (is_redirect(resp.status_code) && !loc.empty()) {
                // max_redirects bounds the number of requests in the chain,
                // so the redirect answering the last allowed request fails.
                if (hop + 1 >= cfg.max_redirects) {
                    last.kind = ErrorKind::TooManyRedirects;
                    last.message = "stopped after " + std::to_string(cfg.max_redirects) + " redirects";
                    log_line(LogLevel::Error, "[CLIENT] " + last.message);
                    return false;
                }
                internal::Url next;
                if (!internal::resolve_reference(cur, loc, next, perr)) {
                    last.kind = ErrorKind::InvalidUrl;
                    last.message = "failed to follow redirect to \"" + loc + "\": " + perr;
                    return false;
                }
                log_line(LogLevel::Debug, "[CLIENT] redirect " + std::to_string(resp.status_code) +
                         " -> " + next.to_string());
                cur = next;
                continue;
            }

            resp.final_url = cur.to_string();
            resp.redirects = hop;
            out = std::move(resp);
            return true;
        }
    }
};

Client::Client(const FetchConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

bool Client::get(const std::string& url, HttpResponse& out) {
    if (_p->get(url, out)) return true;
    _p->last.message = "Get \"" + url + "\": " + _p->last.message;
    return false;
}

const FetchError& Client::last_error() const {
    return _p->last;
}

} // namespace sf
