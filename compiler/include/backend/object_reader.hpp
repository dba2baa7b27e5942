//! # Object File Reader
//!
//! Reads sections, symbols and relocations out of an object file or a
//! shared library through the LLVM C Object API. Everything is copied
//! into plain structs before the LLVM binary is disposed, so results can
//! outlive the input buffer.
//!
//! Relocations are read for code sections only (`.text*` on ELF and COFF,
//! `__text` on Mach-O). ELF `RELA` addends are taken from the matching
//! `.rela<section>` entries; other formats store addends in the
//! instruction bytes and report 0.

#ifndef WAOT_BACKEND_OBJECT_READER_HPP
#define WAOT_BACKEND_OBJECT_READER_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace waot::backend {

enum class BinaryKind : uint8_t {
    ELF,
    COFF,
    MachO,
    Other,
};

struct ObjectSection {
    std::string name;
    uint64_t address = 0;
    uint64_t size = 0;
    std::vector<uint8_t> contents;
};

struct ObjectSymbol {
    std::string name;
    uint64_t address = 0;
    uint64_t size = 0;
    std::string section; ///< Containing section; empty when undefined
    bool defined = false;
};

struct ObjectRelocation {
    std::string section; ///< Section the relocation patches
    uint64_t offset = 0; ///< Offset within that section
    std::string symbol;  ///< Target symbol (or section) name
    uint64_t type = 0;
    std::string type_name;
    int64_t addend = 0;
};

struct ObjectFileInfo {
    BinaryKind kind = BinaryKind::Other;
    std::vector<ObjectSection> sections;
    std::vector<ObjectSymbol> symbols;
    std::vector<ObjectRelocation> relocations;

    [[nodiscard]] auto find_section(std::string_view name) const -> const ObjectSection*;

    /// Finds a defined symbol, skipping undefined references of the same name.
    [[nodiscard]] auto find_symbol(std::string_view name) const -> const ObjectSymbol*;

    /// Bytes of a defined symbol, read from its section contents.
    [[nodiscard]] auto symbol_bytes(const ObjectSymbol& symbol) const
        -> std::optional<std::vector<uint8_t>>;
};

class ObjectReader {
public:
    /// Parses an object file or shared library. On failure returns the
    /// LLVM error message.
    [[nodiscard]] static auto read(std::span<const uint8_t> bytes)
        -> Result<ObjectFileInfo, std::string>;

    /// True if `name` is a code section whose relocations are collected.
    [[nodiscard]] static auto is_code_section(std::string_view name) -> bool;
};

} // namespace waot::backend

#endif // WAOT_BACKEND_OBJECT_READER_HPP
