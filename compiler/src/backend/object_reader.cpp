#include "backend/object_reader.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <cstring>

#include <llvm-c/Core.h>
#include <llvm-c/Object.h>

namespace waot::backend {

// ============================================================================
// ObjectFileInfo
// ============================================================================

auto ObjectFileInfo::find_section(std::string_view name) const -> const ObjectSection* {
    for (const auto& section : sections) {
        if (section.name == name)
            return &section;
    }
    return nullptr;
}

auto ObjectFileInfo::find_symbol(std::string_view name) const -> const ObjectSymbol* {
    for (const auto& symbol : symbols) {
        if (symbol.defined && symbol.name == name)
            return &symbol;
    }
    return nullptr;
}

auto ObjectFileInfo::symbol_bytes(const ObjectSymbol& symbol) const
    -> std::optional<std::vector<uint8_t>> {
    const ObjectSection* section = find_section(symbol.section);
    if (!section || symbol.address < section->address) {
        return std::nullopt;
    }
    uint64_t start = symbol.address - section->address;
    if (start > section->contents.size() || symbol.size > section->contents.size() - start) {
        return std::nullopt;
    }
    auto first = section->contents.begin() + static_cast<std::ptrdiff_t>(start);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(symbol.size));
}

// ============================================================================
// Helpers
// ============================================================================

static auto binary_kind(LLVMBinaryType type) -> BinaryKind {
    switch (type) {
    case LLVMBinaryTypeELF32L:
    case LLVMBinaryTypeELF32B:
    case LLVMBinaryTypeELF64L:
    case LLVMBinaryTypeELF64B:
        return BinaryKind::ELF;
    case LLVMBinaryTypeCOFF:
        return BinaryKind::COFF;
    case LLVMBinaryTypeMachO32L:
    case LLVMBinaryTypeMachO32B:
    case LLVMBinaryTypeMachO64L:
    case LLVMBinaryTypeMachO64B:
        return BinaryKind::MachO;
    default:
        return BinaryKind::Other;
    }
}

static auto safe_string(const char* s) -> std::string {
    return s ? std::string(s) : std::string();
}

/// Reads the explicit addend of the n-th entry of an ELF64 RELA section.
static auto rela_addend(const ObjectSection* rela, size_t n) -> int64_t {
    constexpr size_t ENTRY_SIZE = 24;
    constexpr size_t ADDEND_OFFSET = 16;
    if (!rela || (n + 1) * ENTRY_SIZE > rela->contents.size()) {
        return 0;
    }
    uint64_t raw = 0;
    for (int i = 7; i >= 0; --i) {
        raw = (raw << 8) | rela->contents[n * ENTRY_SIZE + ADDEND_OFFSET + static_cast<size_t>(i)];
    }
    return static_cast<int64_t>(raw);
}

// ============================================================================
// ObjectReader
// ============================================================================

auto ObjectReader::is_code_section(std::string_view name) -> bool {
    return name.starts_with(".text") || name == "__text";
}

auto ObjectReader::read(std::span<const uint8_t> bytes) -> Result<ObjectFileInfo, std::string> {
    if (bytes.empty()) {
        return std::string("empty input");
    }

    // The binary references the buffer, so the buffer is disposed last.
    LLVMMemoryBufferRef buffer = LLVMCreateMemoryBufferWithMemoryRange(
        reinterpret_cast<const char*>(bytes.data()), bytes.size(), "object", 0);
    if (!buffer) {
        return std::string("failed to create memory buffer");
    }

    char* error = nullptr;
    LLVMBinaryRef binary = LLVMCreateBinary(buffer, nullptr, &error);
    if (!binary) {
        std::string msg = safe_string(error);
        if (error) {
            LLVMDisposeMessage(error);
        }
        LLVMDisposeMemoryBuffer(buffer);
        return msg.empty() ? std::string("not an object file") : msg;
    }

    ObjectFileInfo info;
    info.kind = binary_kind(LLVMBinaryGetType(binary));
    if (info.kind == BinaryKind::Other) {
        LLVMDisposeBinary(binary);
        LLVMDisposeMemoryBuffer(buffer);
        return std::string("unsupported binary type");
    }

    // Sections, with their contents.
    LLVMSectionIteratorRef sect = LLVMObjectFileCopySectionIterator(binary);
    while (!LLVMObjectFileIsSectionIteratorAtEnd(binary, sect)) {
        ObjectSection section;
        section.name = safe_string(LLVMGetSectionName(sect));
        section.address = LLVMGetSectionAddress(sect);
        section.size = LLVMGetSectionSize(sect);
        const auto* first = reinterpret_cast<const uint8_t*>(LLVMGetSectionContents(sect));
        if (first && section.size > 0 && first >= bytes.data() &&
            section.size <= static_cast<uint64_t>(bytes.data() + bytes.size() - first)) {
            section.contents.assign(first, first + section.size);
        }
        info.sections.push_back(std::move(section));
        LLVMMoveToNextSection(sect);
    }
    LLVMDisposeSectionIterator(sect);

    // Symbols, each with its containing section.
    LLVMSymbolIteratorRef sym = LLVMObjectFileCopySymbolIterator(binary);
    LLVMSectionIteratorRef containing = LLVMObjectFileCopySectionIterator(binary);
    while (!LLVMObjectFileIsSymbolIteratorAtEnd(binary, sym)) {
        ObjectSymbol symbol;
        symbol.name = safe_string(LLVMGetSymbolName(sym));
        if (!symbol.name.empty()) {
            symbol.address = LLVMGetSymbolAddress(sym);
            symbol.size = LLVMGetSymbolSize(sym);
            LLVMMoveToContainingSection(containing, sym);
            if (!LLVMObjectFileIsSectionIteratorAtEnd(binary, containing)) {
                symbol.section = safe_string(LLVMGetSectionName(containing));
                symbol.defined = true;
            }
            info.symbols.push_back(std::move(symbol));
        }
        LLVMMoveToNextSymbol(sym);
    }
    LLVMDisposeSectionIterator(containing);
    LLVMDisposeSymbolIterator(sym);

    // Relocations of code sections.
    sect = LLVMObjectFileCopySectionIterator(binary);
    while (!LLVMObjectFileIsSectionIteratorAtEnd(binary, sect)) {
        std::string section_name = safe_string(LLVMGetSectionName(sect));
        if (!is_code_section(section_name)) {
            LLVMMoveToNextSection(sect);
            continue;
        }

        const ObjectSection* rela =
            info.kind == BinaryKind::ELF ? info.find_section(".rela" + section_name) : nullptr;

        size_t index = 0;
        LLVMRelocationIteratorRef reloc = LLVMGetRelocations(sect);
        while (!LLVMIsRelocationIteratorAtEnd(sect, reloc)) {
            ObjectRelocation entry;
            entry.section = section_name;
            entry.offset = LLVMGetRelocationOffset(reloc);
            entry.type = LLVMGetRelocationType(reloc);

            const char* type_name = LLVMGetRelocationTypeName(reloc);
            entry.type_name = safe_string(type_name);
            std::free(const_cast<char*>(type_name));

            LLVMSymbolIteratorRef target = LLVMGetRelocationSymbol(reloc);
            if (target) {
                entry.symbol = safe_string(LLVMGetSymbolName(target));
                LLVMDisposeSymbolIterator(target);
            }

            entry.addend = rela_addend(rela, index);
            info.relocations.push_back(std::move(entry));

            ++index;
            LLVMMoveToNextRelocation(reloc);
        }
        LLVMDisposeRelocationIterator(reloc);
        LLVMMoveToNextSection(sect);
    }
    LLVMDisposeSectionIterator(sect);

    LLVMDisposeBinary(binary);
    LLVMDisposeMemoryBuffer(buffer);

    WAOT_LOG_TRACE("codegen", "read object: " << info.sections.size() << " sections, "
                                              << info.symbols.size() << " symbols, "
                                              << info.relocations.size() << " relocations");
    return info;
}

} // namespace waot::backend
