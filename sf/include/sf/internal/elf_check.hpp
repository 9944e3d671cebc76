/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <string>
#include <cstdint>

namespace sf::internal {

struct ElfInfo {
    bool is_64bit = false;
    bool little_endian = true;
    std::uint16_t type = 0;       // ET_EXEC / ET_DYN ...
    std::uint16_t machine = 0;    // EM_X86_64 ...
    bool has_interp = false;      // PT_INTERP present
    bool has_dynamic = false;     // PT_DYNAMIC present
    bool pie_flag = false;        // DT_FLAGS_1 carries DF_1_PIE
    std::uint64_t entry = 0;      // e_entry
    std::string interpreter;      // PT_INTERP contents, if any
};

// Read the ELF header and program headers of path.
bool inspect_elf(const std::string& path, ElfInfo& out, std::string& err);

// An executable with no program interpreter: the kernel starts it without
// ld.so or any shared library. ET_DYN counts only as static-pie (an entry
// point or DF_1_PIE); a shared library is not an executable.
bool is_static_executable(const ElfInfo& info);

const char* elf_machine_name(std::uint16_t machine);

} // namespace sf::internal
