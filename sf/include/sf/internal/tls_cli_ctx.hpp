/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "sf/fetch_config.hpp"

namespace sf::internal {

// Minimal TLS client context. Loads the configured CA bundle (or the
// OpenSSL defaults) and enables peer verification.
class TlsClientContext {
public:
    explicit TlsClientContext(const sf::FetchConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool ok() const { return _ctx != nullptr && _error.empty(); }
    const std::string& error() const { return _error; }

    // Where the trust roots came from ("file:<path>", "dir:<path>", "default").
    const std::string& trust_source() const { return _trust_source; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    std::string _error;
    std::string _trust_source;
    void fail(const char* where);
};

// Drain the OpenSSL error queue into the log. Returns the first entry.
std::string drain_openssl_errors(const char* where);

} // namespace sf::internal
