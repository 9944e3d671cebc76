// SPDX-License-Identifier: Apache-2.0
// Part of the StaticFetch (SF) project.
// apps/sf_elfcheck.cpp

#include "sf/internal/elf_check.hpp"

#include <iostream>
#include <string>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " <executable>\n"
      "\n"
      "Exit status: 0 static executable, 1 dynamic executable, shared\n"
      "library, object file or unreadable, 2 usage.\n";
}

int main(int argc, char** argv){
    if (argc != 2) {
        usage(argv[0]);
        return 2;
    }

    sf::internal::ElfInfo info;
    std::string err;
    if (!sf::internal::inspect_elf(argv[1], info, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    std::cout << argv[1] << ": "
              << (info.is_64bit ? "ELF64 " : "ELF32 ")
              << sf::internal::elf_machine_name(info.machine) << ", ";
    if (sf::internal::is_static_executable(info)) {
        std::cout << "static" << (info.has_dynamic ? " (static-pie)" : "") << "\n";
        return 0;
    }
    if (!info.has_interp) {
        std::cout << "not an executable\n";
        return 1;
    }
    std::cout << "dynamic (interpreter " << info.interpreter << ")\n";
    return 1;
}
