/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <cstddef>
#include "sf/types.hpp"

#ifndef SF_TARGET_URL
#define SF_TARGET_URL "https://google.com/"
#endif

#ifndef SF_CA_FILE
#define SF_CA_FILE "/etc/ssl/certs/ca-certificates.crt"
#endif

namespace sf {

// Fetch configuration. Everything has a compile-time default; sf_fetch
// takes no flags and reads no environment.
struct FetchConfig {
    // Target
    std::string url = SF_TARGET_URL;

    // Timeouts (keep the one-shot run bounded)
    int connect_timeout_sec = 10;  // TCP connect and TLS handshake
    int io_timeout_sec      = 30;  // recv/send timeout

    // HTTP
    int         max_redirects    = 10;
    std::size_t max_header_bytes = 1u << 20;
    std::string user_agent       = "sf-fetch/1";

    // TLS trust store. tls_ca_file wins when it exists, then tls_ca_dir,
    // then the OpenSSL default verify paths.
    bool        tls_verify_peer = true;
    std::string tls_ca_file     = SF_CA_FILE;
    std::string tls_ca_dir;

    // Logging (stderr + optional file; stdout is the report line only)
    LogLevel    log_level = LogLevel::Warn;
    std::string log_file;
};

} // namespace sf
