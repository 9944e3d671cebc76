/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/tls_cli_ctx.hpp"
#include "sf/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <unistd.h>

namespace sf::internal {
namespace {

bool readable(const std::string& path) {
    return !path.empty() && ::access(path.c_str(), R_OK) == 0;
}

} // namespace

std::string drain_openssl_errors(const char* where) {
    std::string first;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        if (first.empty()) first = buf;
        sf::log_line(sf::LogLevel::Debug, std::string("[TLS-CLI] ") + where + ": " + buf);
    }
    return first;
}

TlsClientContext::TlsClientContext(const sf::FetchConfig& cfg) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        fail("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        fail("set_min_proto");
        return;
    }

    // Trust store
    if (readable(cfg.tls_ca_file)) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            fail("load_verify_locations(CA file)");
            return;
        }
        _trust_source = "file:" + cfg.tls_ca_file;
    } else if (readable(cfg.tls_ca_dir)) {
        if (SSL_CTX_load_verify_locations(_ctx, nullptr, cfg.tls_ca_dir.c_str()) != 1) {
            fail("load_verify_locations(CA dir)");
            return;
        }
        _trust_source = "dir:" + cfg.tls_ca_dir;
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            fail("set_default_verify_paths");
            return;
        }
        _trust_source = "default";
        if (!cfg.tls_ca_file.empty()) {
            sf::log_line(sf::LogLevel::Warn, "[TLS-CLI] CA bundle " + cfg.tls_ca_file +
                         " not readable, using OpenSSL default verify paths");
        }
    }

    // Verification
    if (cfg.tls_verify_peer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

    // Peers that close without close_notify are judged by HTTP framing.
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::fail(const char* where) {
    const std::string first = drain_openssl_errors(where);
    _error = std::string("tls: ") + where + " failed";
    if (!first.empty()) _error += ": " + first;
    sf::log_line(sf::LogLevel::Error, "[TLS-CLI] " + _error);
}

} // namespace sf::internal
