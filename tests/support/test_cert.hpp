/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <openssl/ssl.h>
#include <string>

namespace sf::test {

// Self-signed RSA certificate generated at runtime, plus a matching
// server SSL_CTX. The PEM certificate is written to a temporary file so
// it can be used as a client CA bundle.
class TestCert {
public:
    // san: e.g. "DNS:localhost,IP:127.0.0.1"
    explicit TestCert(const std::string& san = "DNS:localhost,IP:127.0.0.1");
    ~TestCert();

    TestCert(const TestCert&) = delete;
    TestCert& operator=(const TestCert&) = delete;

    const std::string& ca_file() const { return _pem_path; }
    SSL_CTX* server_ctx() const { return _ctx; }

private:
    EVP_PKEY* _key = nullptr;
    X509* _cert = nullptr;
    SSL_CTX* _ctx = nullptr;
    std::string _pem_path;
};

} // namespace sf::test
