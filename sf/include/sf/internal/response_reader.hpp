/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <cstddef>
#include "sf/http_response.hpp"
#include "sf/types.hpp"
#include "sf/internal/stream.hpp"

namespace sf::internal {

// Buffered HTTP/1.1 response reader: head, then body framed by
// chunked encoding, Content-Length or connection close.
class ResponseReader {
public:
    ResponseReader(ByteStream& s, std::size_t max_header_bytes)
        : _s(s), _max_header(max_header_bytes) {}

    // Reads one final response (interim 1xx responses are skipped).
    bool read(sf::HttpResponse& out, sf::FetchError& err);

private:
    bool fill(sf::FetchError& err, bool& eof);
    bool read_head(std::string& head, sf::FetchError& err);
    bool read_line(std::string& line, sf::FetchError& err);
    bool read_exact(std::size_t n, std::string& out, sf::FetchError& err);
    bool read_to_eof(std::string& out, sf::FetchError& err);
    bool read_chunked(std::string& out, sf::FetchError& err);

    ByteStream& _s;
    std::size_t _max_header;
    std::string _buf;
    std::size_t _pos = 0;
};

} // namespace sf::internal
