/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "sf/report.hpp"
#include "support/loopback_server.hpp"
#include "support/test_cert.hpp"

using sf::FetchConfig;
using sf::run_fetch_report;
using sf::test::LoopbackServer;
using sf::test::TestCert;
using sf::test::http_response;

namespace {

FetchConfig report_config(const std::string& url) {
    FetchConfig cfg;
    cfg.url = url;
    cfg.connect_timeout_sec = 5;
    cfg.io_timeout_sec = 5;
    cfg.log_level = sf::LogLevel::Off;
    return cfg;
}

} // namespace

TEST(ReportTest, DefaultTargetIsHttps) {
    FetchConfig cfg;
    EXPECT_EQ(0u, cfg.url.find("https://"));
    EXPECT_EQ(SF_CA_FILE, cfg.tls_ca_file);
    EXPECT_EQ(10, cfg.max_redirects);
}

TEST(ReportTest, PrintsBodyLengthOverHttps) {
    TestCert cert;
    const std::string body(10240, 'b');
    LoopbackServer srv([&](const std::string&) { return http_response(200, "OK", body); },
                       cert.server_ctx());

    FetchConfig cfg = report_config(srv.url("/file"));
    cfg.tls_ca_file = cert.ca_file();

    std::ostringstream out;
    EXPECT_EQ(0, run_fetch_report(cfg, out));
    EXPECT_EQ("10240\n", out.str());
}

TEST(ReportTest, EmptyBodyPrintsZero) {
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", ""); });

    std::ostringstream out;
    EXPECT_EQ(0, run_fetch_report(report_config(srv.url()), out));
    EXPECT_EQ("0\n", out.str());
}

TEST(ReportTest, MeasuresFinalBodyAfterRedirect) {
    LoopbackServer srv([](const std::string& head) {
        if (head.compare(0, 8, "GET /old") == 0) return sf::test::redirect_response(301, "/new");
        return http_response(200, "OK", "0123456789");
    });

    std::ostringstream out;
    EXPECT_EQ(0, run_fetch_report(report_config(srv.url("/old")), out));
    EXPECT_EQ("10\n", out.str());
}

TEST(ReportTest, UnreachableHostExitsOne) {
    std::ostringstream out;
    const std::string url = "https://127.0.0.1:" + std::to_string(LoopbackServer::unused_port()) + "/";
    EXPECT_EQ(1, run_fetch_report(report_config(url), out));

    const std::string text = out.str();
    ASSERT_GT(text.size(), 1u);
    EXPECT_EQ('\n', text.back());
    EXPECT_EQ(std::string::npos, text.find("certificate"));
}

TEST(ReportTest, TrustFailureExitsOneWithCertificateMessage) {
    TestCert cert;
    LoopbackServer srv([](const std::string&) { return http_response(200, "OK", "x"); },
                       cert.server_ctx());

    FetchConfig cfg = report_config(srv.url());
    cfg.tls_ca_file = "/nonexistent/sf-test/ca-certificates.crt";
    cfg.tls_ca_dir = "/nonexistent/sf-test/certs";

    std::ostringstream out;
    EXPECT_EQ(1, run_fetch_report(cfg, out));
    EXPECT_NE(std::string::npos, out.str().find("certificate verify failed")) << out.str();
}

TEST(ReportTest, InvalidUrlExitsOne) {
    std::ostringstream out;
    EXPECT_EQ(1, run_fetch_report(report_config("gopher://x/"), out));
    EXPECT_NE(std::string::npos, out.str().find("unsupported protocol scheme"));
}
