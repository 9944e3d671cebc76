/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <openssl/ssl.h>
#include <cstddef>
#include <string>
#include "sf/types.hpp"

namespace sf::internal {

class TcpConn;

// Blocking byte stream the response reader pulls from.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual bool write_all(const char* d, std::size_t len, sf::FetchError& err) = 0;

    // >0 bytes read, 0 on end of stream, -1 on error (err filled).
    virtual long read_some(char* d, std::size_t len, sf::FetchError& err) = 0;
};

class PlainStream : public ByteStream {
public:
    explicit PlainStream(TcpConn& conn) : _conn(conn) {}

    bool write_all(const char* d, std::size_t len, sf::FetchError& err) override;
    long read_some(char* d, std::size_t len, sf::FetchError& err) override;

private:
    TcpConn& _conn;
};

// Does not own the SSL object.
class TlsStream : public ByteStream {
public:
    explicit TlsStream(SSL* ssl) : _ssl(ssl) {}

    bool write_all(const char* d, std::size_t len, sf::FetchError& err) override;
    long read_some(char* d, std::size_t len, sf::FetchError& err) override;

private:
    SSL* _ssl;
};

// Message for an SSL_read/SSL_write that failed with SSL_ERROR_SYSCALL.
// sys is the errno observed at the failure; when it is 0 the cause is
// taken from the OpenSSL error queue, which is drained.
std::string tls_syscall_error(bool reading, int sys);

} // namespace sf::internal
