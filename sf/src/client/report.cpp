/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/report.hpp"
#include "sf/client.hpp"
#include "sf/log.hpp"

namespace sf {

int run_fetch_report(const FetchConfig& cfg, std::ostream& out) {
    Client cli(cfg);
    HttpResponse resp;
    if (!cli.get(cfg.url, resp)) {
        const FetchError& e = cli.last_error();
        log_line(LogLevel::Debug, std::string("[REPORT] failed (") + error_kind_name(e.kind) + ")");
        out << (e.message.empty() ? std::string("fetch failed") : e.message) << '\n';
        out.flush();
        return 1;
    }
    out << resp.body.size() << '\n';
    out.flush();
    return out ? 0 : 1;
}

} // namespace sf
