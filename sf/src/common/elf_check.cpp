/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/internal/elf_check.hpp"

#include <elf.h>
#include <fstream>
#include <vector>
#include <cstring>
#include <cstddef>

#ifndef DF_1_PIE
#define DF_1_PIE 0x08000000
#endif

namespace sf::internal {
namespace {

std::uint64_t load(const unsigned char* p, std::size_t n, bool le) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t idx = le ? (n - 1 - i) : i;
        v = (v << 8) | p[idx];
    }
    return v;
}

bool read_at(std::ifstream& in, std::uint64_t off, unsigned char* d, std::size_t n) {
    in.clear();
    in.seekg((std::streamoff)off, std::ios::beg);
    if (!in) return false;
    in.read((char*)d, (std::streamsize)n);
    return (std::size_t)in.gcount() == n;
}

// Scans the dynamic section for DT_FLAGS_1.
bool dynamic_has_pie_flag(std::ifstream& in, std::uint64_t off, std::uint64_t size, bool is64, bool le) {
    const std::size_t word = is64 ? 8 : 4;
    const std::size_t ent = 2 * word;
    if (size == 0 || size > (1u << 20)) return false;
    std::vector<unsigned char> dyn((std::size_t)size);
    if (!read_at(in, off, dyn.data(), dyn.size())) return false;
    for (std::size_t i = 0; i + ent <= dyn.size(); i += ent) {
        const std::uint64_t tag = load(dyn.data() + i, word, le);
        if (tag == DT_NULL) break;
        if (tag == DT_FLAGS_1) return (load(dyn.data() + i + word, word, le) & DF_1_PIE) != 0;
    }
    return false;
}

} // namespace

bool inspect_elf(const std::string& path, ElfInfo& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "cannot open " + path;
        return false;
    }

    unsigned char eh[sizeof(Elf64_Ehdr)];
    std::memset(eh, 0, sizeof(eh));
    if (!read_at(in, 0, eh, EI_NIDENT) || std::memcmp(eh, ELFMAG, SELFMAG) != 0) {
        err = path + ": not an ELF file";
        return false;
    }

    ElfInfo info;
    if (eh[EI_CLASS] == ELFCLASS64) info.is_64bit = true;
    else if (eh[EI_CLASS] != ELFCLASS32) { err = path + ": unknown ELF class"; return false; }

    if (eh[EI_DATA] == ELFDATA2LSB) info.little_endian = true;
    else if (eh[EI_DATA] == ELFDATA2MSB) info.little_endian = false;
    else { err = path + ": unknown ELF data encoding"; return false; }

    const std::size_t ehsize = info.is_64bit ? sizeof(Elf64_Ehdr) : sizeof(Elf32_Ehdr);
    if (!read_at(in, 0, eh, ehsize)) {
        err = path + ": truncated ELF header";
        return false;
    }
    const bool le = info.little_endian;

    std::uint64_t phoff = 0;
    std::uint64_t phentsize = 0, phnum = 0;
    if (info.is_64bit) {
        info.type    = (std::uint16_t)load(eh + offsetof(Elf64_Ehdr, e_type), 2, le);
        info.machine = (std::uint16_t)load(eh + offsetof(Elf64_Ehdr, e_machine), 2, le);
        info.entry   = load(eh + offsetof(Elf64_Ehdr, e_entry), 8, le);
        phoff     = load(eh + offsetof(Elf64_Ehdr, e_phoff), 8, le);
        phentsize = load(eh + offsetof(Elf64_Ehdr, e_phentsize), 2, le);
        phnum     = load(eh + offsetof(Elf64_Ehdr, e_phnum), 2, le);
    } else {
        info.type    = (std::uint16_t)load(eh + offsetof(Elf32_Ehdr, e_type), 2, le);
        info.machine = (std::uint16_t)load(eh + offsetof(Elf32_Ehdr, e_machine), 2, le);
        info.entry   = load(eh + offsetof(Elf32_Ehdr, e_entry), 4, le);
        phoff     = load(eh + offsetof(Elf32_Ehdr, e_phoff), 4, le);
        phentsize = load(eh + offsetof(Elf32_Ehdr, e_phentsize), 2, le);
        phnum     = load(eh + offsetof(Elf32_Ehdr, e_phnum), 2, le);
    }

    const std::size_t min_ph = info.is_64bit ? sizeof(Elf64_Phdr) : sizeof(Elf32_Phdr);
    if (phnum > 0 && phentsize < min_ph) {
        err = path + ": bad program header size";
        return false;
    }

    std::vector<unsigned char> ph(phentsize);
    for (std::uint64_t i = 0; i < phnum; ++i) {
        if (!read_at(in, phoff + i * phentsize, ph.data(), ph.size())) {
            err = path + ": truncated program headers";
            return false;
        }
        std::uint32_t p_type = 0;
        std::uint64_t p_offset = 0, p_filesz = 0;
        if (info.is_64bit) {
            p_type   = (std::uint32_t)load(ph.data() + offsetof(Elf64_Phdr, p_type), 4, le);
            p_offset = load(ph.data() + offsetof(Elf64_Phdr, p_offset), 8, le);
            p_filesz = load(ph.data() + offsetof(Elf64_Phdr, p_filesz), 8, le);
        } else {
            p_type   = (std::uint32_t)load(ph.data() + offsetof(Elf32_Phdr, p_type), 4, le);
            p_offset = load(ph.data() + offsetof(Elf32_Phdr, p_offset), 4, le);
            p_filesz = load(ph.data() + offsetof(Elf32_Phdr, p_filesz), 4, le);
        }

        if (p_type == PT_DYNAMIC) {
            info.has_dynamic = true;
            if (dynamic_has_pie_flag(in, p_offset, p_filesz, info.is_64bit, le)) info.pie_flag = true;
        } else if (p_type == PT_INTERP) {
            info.has_interp = true;
            if (p_filesz > 0 && p_filesz < 4096) {
                std::string s((std::size_t)p_filesz, '\0');
                if (read_at(in, p_offset, (unsigned char*)&s[0], s.size())) {
                    const std::size_t nul = s.find('\0');
                    if (nul != std::string::npos) s.erase(nul);
                    info.interpreter = s;
                }
            }
        }
    }

    out = info;
    return true;
}

bool is_static_executable(const ElfInfo& info) {
    if (info.has_interp) return false;
    if (info.type == ET_EXEC) return true;
    return info.type == ET_DYN && (info.entry != 0 || info.pie_flag);
}

const char* elf_machine_name(std::uint16_t machine) {
    switch (machine) {
        case EM_X86_64:  return "x86-64";
        case EM_386:     return "i386";
        case EM_AARCH64: return "aarch64";
        case EM_ARM:     return "arm";
        case EM_RISCV:   return "riscv";
        default:         return "other";
    }
}

} // namespace sf::internal
