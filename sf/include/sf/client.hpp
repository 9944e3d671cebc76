/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <memory>
#include "sf/fetch_config.hpp"
#include "sf/http_response.hpp"
#include "sf/types.hpp"

namespace sf {

// HTTP(S) GET client. One connection per request, redirects followed
// up to cfg.max_redirects, no retries.
class Client {
public:
    explicit Client(const FetchConfig& cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Fetches url (following redirects). On false, last_error() says why.
    bool get(const std::string& url, HttpResponse& out);

    const FetchError& last_error() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace sf
