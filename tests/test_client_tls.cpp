/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <string>

#include "sf/client.hpp"
#include "support/loopback_server.hpp"
#include "support/test_cert.hpp"

using sf::Client;
using sf::ErrorKind;
using sf::FetchConfig;
using sf::HttpResponse;
using sf::test::LoopbackServer;
using sf::test::TestCert;
using sf::test::http_response;

namespace {

FetchConfig tls_config(const std::string& ca_file) {
    FetchConfig cfg;
    cfg.connect_timeout_sec = 5;
    cfg.io_timeout_sec = 5;
    cfg.tls_ca_file = ca_file;
    cfg.tls_ca_dir.clear();
    cfg.log_level = sf::LogLevel::Off;
    return cfg;
}

// Neither path exists: the client falls back to the OpenSSL default
// store, which never contains a certificate generated by the test.
FetchConfig no_roots_config() {
    FetchConfig cfg = tls_config("/nonexistent/sf-test/ca-certificates.crt");
    cfg.tls_ca_dir = "/nonexistent/sf-test/certs";
    return cfg;
}

} // namespace

TEST(ClientTlsTest, TrustedCertificate) {
    TestCert cert;
    const std::string body(4321, 'q');
    LoopbackServer srv([&](const std::string&) { return http_response(200, "OK", body); },
                       cert.server_ctx());

    Client cli(tls_config(cert.ca_file()));
    HttpResponse resp;
    ASSERT_TRUE(cli.get(srv.url("/fixed"), resp)) << cli.last_error().message;
    EXPECT_EQ(200, resp.status_code);
    EXPECT_EQ(body.size(), resp.body.size());
    EXPECT_EQ(0u, srv.url().find("https://"));
}

TEST(ClientTlsTest, ChunkedOverTls) {
    TestCert cert;
    LoopbackServer srv([](const std::string&) {
        return std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "3\r\nabc\r\n0\r\n\r\n");
    }, cert.server_ctx());

    Client cli(tls_config(cert.ca_file()));
    HttpResponse resp;
    ASSERT_TRUE(cli.get(srv.url(), resp)) << cli.last_error().message;
    EXPECT_EQ("abc", resp.body);
}

TEST(ClientTlsTest, NoTrustRoots) {
    TestCert cert;
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); },
                       cert.server_ctx());

    Client cli(no_roots_config());
    HttpResponse resp;
    ASSERT_FALSE(cli.get(srv.url(), resp));
    EXPECT_EQ(ErrorKind::TlsVerify, cli.last_error().kind);
    EXPECT_NE(std::string::npos, cli.last_error().message.find("certificate verify failed"))
        << cli.last_error().message;
    EXPECT_TRUE(srv.requests().empty());
}

TEST(ClientTlsTest, UntrustedIssuer) {
    TestCert server_cert;
    TestCert other;
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); },
                       server_cert.server_ctx());

    Client cli(tls_config(other.ca_file()));
    HttpResponse resp;
    ASSERT_FALSE(cli.get(srv.url(), resp));
    EXPECT_EQ(ErrorKind::TlsVerify, cli.last_error().kind);
}

TEST(ClientTlsTest, HostnameMismatch) {
    TestCert cert("DNS:elsewhere.example");
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); },
                       cert.server_ctx());

    Client cli(tls_config(cert.ca_file()));
    HttpResponse resp;
    ASSERT_FALSE(cli.get(srv.url(), resp));
    EXPECT_EQ(ErrorKind::TlsVerify, cli.last_error().kind);
    EXPECT_NE(std::string::npos, cli.last_error().message.find("certificate verify failed"));
}

TEST(ClientTlsTest, VerificationDisabled) {
    TestCert cert("DNS:elsewhere.example");
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "insecure"); },
                       cert.server_ctx());

    FetchConfig cfg = no_roots_config();
    cfg.tls_verify_peer = false;
    Client cli(cfg);
    HttpResponse resp;
    ASSERT_TRUE(cli.get(srv.url(), resp)) << cli.last_error().message;
    EXPECT_EQ("insecure", resp.body);
}

TEST(ClientTlsTest, PlainServerIsHandshakeFailure) {
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); });

    // The plain server waits for an HTTP head that never comes.
    FetchConfig cfg = tls_config("");
    cfg.connect_timeout_sec = 1;
    Client cli(cfg);
    HttpResponse resp;
    const std::string url = "https://127.0.0.1:" + std::to_string(srv.port()) + "/";
    ASSERT_FALSE(cli.get(url, resp));
    EXPECT_EQ(ErrorKind::TlsHandshake, cli.last_error().kind);
}

TEST(ClientTlsTest, TrustFailureIsDistinctFromConnectFailure) {
    TestCert cert;
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); },
                       cert.server_ctx());

    Client trust(no_roots_config());
    HttpResponse resp;
    ASSERT_FALSE(trust.get(srv.url(), resp));

    Client refused(no_roots_config());
    ASSERT_FALSE(refused.get("https://127.0.0.1:" + std::to_string(LoopbackServer::unused_port()) + "/", resp));

    EXPECT_NE(trust.last_error().kind, refused.last_error().kind);
    EXPECT_NE(std::string::npos, trust.last_error().message.find("certificate"));
    EXPECT_EQ(std::string::npos, refused.last_error().message.find("certificate"));
}
