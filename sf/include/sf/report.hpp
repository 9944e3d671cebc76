/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <ostream>
#include "sf/fetch_config.hpp"

namespace sf {

// Fetch cfg.url once and write the body length (decimal, newline
// terminated) to out. On any failure the error description is written
// instead. Returns the process exit status: 0 on success, 1 on failure.
int run_fetch_report(const FetchConfig& cfg, std::ostream& out);

} // namespace sf
