/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>

namespace sf {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

// Failure classes. The process exit code never depends on these;
// they only tag log lines and let tests tell failures apart.
enum class ErrorKind {
    None,
    InvalidUrl,
    Resolve,          // name lookup
    Connect,          // refused / unreachable / timed out
    TlsSetup,         // SSL_CTX or SSL object could not be prepared
    TlsHandshake,     // handshake failed for a non-certificate reason
    TlsVerify,        // peer certificate rejected by the trust store
    Io,               // send/recv failure or truncated body
    Protocol,         // malformed HTTP
    TooManyRedirects
};

struct FetchError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }
    void clear() { kind = ErrorKind::None; message.clear(); }
};

const char* error_kind_name(ErrorKind k);

} // namespace sf
