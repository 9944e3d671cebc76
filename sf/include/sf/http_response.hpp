/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <unordered_map>

namespace sf {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;        // decoded (de-chunked) payload
    std::string final_url;   // URL of the response after redirects
    int redirects = 0;
};

} // namespace sf
