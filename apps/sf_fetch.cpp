// SPDX-License-Identifier: Apache-2.0
// Part of the StaticFetch (SF) project.
// apps/sf_fetch.cpp

#include "sf/fetch_config.hpp"
#include "sf/report.hpp"

#include <csignal>
#include <iostream>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << "\n"
      "\n"
      "Fetches " SF_TARGET_URL " and prints the body length in bytes.\n"
      "Takes no arguments. Exit status: 0 on success, 1 on any failure.\n";
}

int main(int argc, char** argv){
    if (argc > 1) {
        usage(argv[0]);
        return 1;
    }

    // A peer reset must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    sf::FetchConfig cfg;
    return sf::run_fetch_report(cfg, std::cout);
}
