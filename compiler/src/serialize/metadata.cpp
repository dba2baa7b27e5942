//! # Artifact Metadata Encoding

#include "serialize/metadata.hpp"

#include "common/binary_io.hpp"
#include "common/crc32c.hpp"
#include "log/log.hpp"

#include <cstring>
#include <zstd.h>

namespace waot::serialize {

using artifact::CompiledFunction;
using artifact::ImportEntry;
using artifact::RelocationEntry;
using artifact::RelocationTarget;

auto metadata_section_name(MetadataSection section) -> const char* {
    switch (section) {
    case MetadataSection::ModuleInfo:
        return "module";
    case MetadataSection::Functions:
        return "functions";
    case MetadataSection::Exports:
        return "exports";
    case MetadataSection::Imports:
        return "imports";
    case MetadataSection::Memories:
        return "memories";
    case MetadataSection::Tables:
        return "tables";
    case MetadataSection::Globals:
        return "globals";
    case MetadataSection::Data:
        return "data";
    case MetadataSection::Elements:
        return "elements";
    case MetadataSection::Start:
        return "start";
    case MetadataSection::Trampolines:
        return "trampolines";
    }
    return "?";
}

// ============================================================================
// Section Writers
// ============================================================================

static void write_u32_list(ByteWriter& w, const std::vector<uint32_t>& values) {
    w.write_u32(static_cast<uint32_t>(values.size()));
    for (uint32_t v : values) {
        w.write_u32(v);
    }
}

static void write_function(ByteWriter& w, const CompiledFunction& fn) {
    w.write_u32(fn.index);
    ir::write_sig(w, fn.sig);
    w.write_string(fn.symbol);
    w.write_u64(fn.code_size);
    write_u32_list(w, fn.import_calls);
    write_u32_list(w, fn.libcalls);
    w.write_u32(static_cast<uint32_t>(fn.relocations.size()));
    for (const auto& reloc : fn.relocations) {
        w.write_u64(reloc.offset);
        w.write_u8(static_cast<uint8_t>(reloc.target));
        w.write_string(reloc.symbol);
        w.write_string(reloc.type_name);
        w.write_i64(reloc.addend);
    }
}

static void write_import(ByteWriter& w, const ImportEntry& import) {
    w.write_string(import.module);
    w.write_string(import.name);
    w.write_u8(static_cast<uint8_t>(import.kind));
    switch (import.kind) {
    case ir::ExternKind::Function:
        ir::write_sig(w, import.sig);
        break;
    case ir::ExternKind::Memory:
        ir::write_limits(w, import.memory.limits);
        break;
    case ir::ExternKind::Table:
        ir::write_limits(w, import.table.limits);
        break;
    case ir::ExternKind::Global:
        ir::write_global_type(w, import.global);
        break;
    }
}

static void write_section(ByteWriter& payload, MetadataSection id, const artifact::DylibArtifact& a) {
    const artifact::ModuleInfo& info = a.info();
    ByteWriter w;
    switch (id) {
    case MetadataSection::ModuleInfo:
        w.write_string(info.name);
        w.write_u64(info.fingerprint.high);
        w.write_u64(info.fingerprint.low);
        break;
    case MetadataSection::Functions:
        w.write_u32(static_cast<uint32_t>(a.functions().size()));
        for (const auto& fn : a.functions()) {
            write_function(w, fn);
        }
        break;
    case MetadataSection::Exports:
        w.write_u32(static_cast<uint32_t>(info.exports.size()));
        for (const auto& e : info.exports) {
            w.write_string(e.name);
            w.write_u8(static_cast<uint8_t>(e.kind));
            w.write_u32(e.index);
        }
        break;
    case MetadataSection::Imports:
        w.write_u32(static_cast<uint32_t>(info.imports.size()));
        for (const auto& import : info.imports) {
            write_import(w, import);
        }
        break;
    case MetadataSection::Memories:
        w.write_u32(static_cast<uint32_t>(info.memories.size()));
        for (const auto& mem : info.memories) {
            ir::write_limits(w, mem.limits);
        }
        break;
    case MetadataSection::Tables:
        w.write_u32(static_cast<uint32_t>(info.tables.size()));
        for (const auto& table : info.tables) {
            ir::write_limits(w, table.limits);
        }
        break;
    case MetadataSection::Globals:
        w.write_u32(static_cast<uint32_t>(info.globals.size()));
        for (const auto& global : info.globals) {
            ir::write_global_type(w, global.type);
            ir::write_const_expr(w, global.init);
        }
        break;
    case MetadataSection::Data:
        w.write_u32(static_cast<uint32_t>(info.data.size()));
        for (const auto& seg : info.data) {
            ir::write_const_expr(w, seg.offset);
            w.write_bytes(seg.bytes);
        }
        break;
    case MetadataSection::Elements:
        w.write_u32(static_cast<uint32_t>(info.elements.size()));
        for (const auto& seg : info.elements) {
            ir::write_const_expr(w, seg.offset);
            write_u32_list(w, seg.functions);
        }
        break;
    case MetadataSection::Start:
        w.write_bool(info.start.has_value());
        w.write_u32(info.start.value_or(0));
        break;
    case MetadataSection::Trampolines:
        w.write_u32(static_cast<uint32_t>(a.trampolines().size()));
        for (const auto& key : a.trampolines()) {
            w.write_u8(static_cast<uint8_t>(key.kind));
            ir::write_sig(w, key.sig);
        }
        break;
    }
    payload.write_u32(static_cast<uint32_t>(id));
    payload.write_bytes(w.data());
}

auto MetadataWriter::encode_payload(const artifact::DylibArtifact& artifact)
    -> std::vector<uint8_t> {
    ByteWriter payload;
    for (uint32_t id = 1; id <= METADATA_SECTION_COUNT; ++id) {
        write_section(payload, static_cast<MetadataSection>(id), artifact);
    }
    return payload.take();
}

auto MetadataWriter::encode(const artifact::DylibArtifact& artifact, bool compress,
                            int compression_level) -> Result<std::vector<uint8_t>, Error> {
    std::vector<uint8_t> payload = encode_payload(artifact);
    if (payload.size() > METADATA_MAX_PAYLOAD) {
        return Error::serialization("metadata payload of " + std::to_string(payload.size()) +
                                    " bytes exceeds the format limit");
    }

    std::vector<uint8_t> stored;
    if (compress) {
        stored.resize(ZSTD_compressBound(payload.size()));
        size_t n = ZSTD_compress(stored.data(), stored.size(), payload.data(), payload.size(),
                                 compression_level);
        if (ZSTD_isError(n)) {
            return Error::serialization(std::string("zstd compression failed: ") +
                                        ZSTD_getErrorName(n));
        }
        stored.resize(n);
    } else {
        stored = payload;
    }

    const target::TargetConfig& target = artifact.target();
    ByteWriter w;
    w.write_raw(METADATA_MAGIC.data(), METADATA_MAGIC.size());
    w.write_u32(METADATA_VERSION);
    w.write_u8(static_cast<uint8_t>(target.arch()));
    w.write_u8(static_cast<uint8_t>(target.calling_convention()));
    w.write_u8(target.pointer_width());
    w.write_u8(0);
    w.write_u64(target.features());
    w.write_u32(compress ? METADATA_FLAG_ZSTD : 0);
    w.write_u32(METADATA_SECTION_COUNT);
    w.write_u32(static_cast<uint32_t>(payload.size()));
    w.write_u32(static_cast<uint32_t>(stored.size()));
    w.write_u32(crc32c(stored.data(), stored.size()));
    w.write_raw(stored.data(), stored.size());

    WAOT_LOG_TRACE("serialize", "metadata for '" << artifact.name() << "': " << payload.size()
                                                 << " payload bytes, " << stored.size()
                                                 << " stored");
    return w.take();
}

// ============================================================================
// Header
// ============================================================================

auto MetadataReader::read_header(std::span<const uint8_t> blob) -> Result<MetadataHeader, Error> {
    if (blob.size() < METADATA_HEADER_SIZE) {
        return Error::serialization("metadata truncated: " + std::to_string(blob.size()) +
                                    " bytes, header needs " +
                                    std::to_string(METADATA_HEADER_SIZE));
    }
    if (std::memcmp(blob.data(), METADATA_MAGIC.data(), METADATA_MAGIC.size()) != 0) {
        return Error::serialization("bad metadata magic");
    }

    ByteReader r(blob.subspan(METADATA_MAGIC.size()));
    MetadataHeader h;
    h.version = r.read_u32();
    if (h.version != METADATA_VERSION) {
        return Error::serialization("unsupported metadata version " + std::to_string(h.version) +
                                    " (expected " + std::to_string(METADATA_VERSION) + ")");
    }
    h.arch = r.read_u8();
    h.calling_convention = r.read_u8();
    h.pointer_width = r.read_u8();
    uint8_t reserved = r.read_u8();
    h.feature_bits = r.read_u64();
    h.flags = r.read_u32();
    h.section_count = r.read_u32();
    h.payload_size = r.read_u32();
    h.stored_size = r.read_u32();
    h.payload_crc32c = r.read_u32();
    if (r.has_error()) {
        return Error::serialization("metadata header: " + r.error_message());
    }

    if (h.arch > static_cast<uint8_t>(target::Arch::Aarch64)) {
        return Error::serialization("unknown architecture id " + std::to_string(h.arch));
    }
    if (h.calling_convention > static_cast<uint8_t>(target::CallingConvention::AppleAarch64)) {
        return Error::serialization("unknown calling convention id " +
                                    std::to_string(h.calling_convention));
    }
    if (reserved != 0 || (h.flags & ~METADATA_FLAG_ZSTD) != 0) {
        return Error::serialization("unknown metadata flags");
    }
    if (h.payload_size > METADATA_MAX_PAYLOAD) {
        return Error::serialization("metadata payload size " + std::to_string(h.payload_size) +
                                    " exceeds the format limit");
    }
    if (h.stored_size > blob.size() - METADATA_HEADER_SIZE) {
        return Error::serialization("metadata truncated: header announces " +
                                    std::to_string(h.stored_size) + " stored bytes, " +
                                    std::to_string(blob.size() - METADATA_HEADER_SIZE) +
                                    " present");
    }
    if (!h.is_compressed() && h.stored_size != h.payload_size) {
        return Error::serialization("uncompressed metadata with stored size " +
                                    std::to_string(h.stored_size) + " != payload size " +
                                    std::to_string(h.payload_size));
    }
    return h;
}

// ============================================================================
// Section Readers
// ============================================================================

static auto read_u32_list(ByteReader& r) -> std::vector<uint32_t> {
    std::vector<uint32_t> values;
    uint32_t n = r.read_count(4);
    values.reserve(n);
    for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
        values.push_back(r.read_u32());
    }
    return values;
}

static auto read_extern_kind(ByteReader& r) -> ir::ExternKind {
    uint8_t raw = r.read_u8();
    if (raw > static_cast<uint8_t>(ir::ExternKind::Global)) {
        r.set_error("invalid extern kind " + std::to_string(raw));
        return ir::ExternKind::Function;
    }
    return static_cast<ir::ExternKind>(raw);
}

static auto read_function(ByteReader& r) -> CompiledFunction {
    CompiledFunction fn;
    fn.index = r.read_u32();
    fn.sig = ir::read_sig(r);
    fn.symbol = r.read_string();
    fn.code_size = r.read_u64();
    fn.import_calls = read_u32_list(r);
    fn.libcalls = read_u32_list(r);
    // offset, target, two empty strings, addend
    uint32_t n = r.read_count(8 + 1 + 4 + 4 + 8);
    for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
        RelocationEntry reloc;
        reloc.offset = r.read_u64();
        uint8_t target = r.read_u8();
        if (target > static_cast<uint8_t>(RelocationTarget::Data)) {
            r.set_error("invalid relocation target " + std::to_string(target));
        }
        reloc.target = static_cast<RelocationTarget>(target);
        reloc.symbol = r.read_string();
        reloc.type_name = r.read_string();
        reloc.addend = r.read_i64();
        fn.relocations.push_back(std::move(reloc));
    }
    return fn;
}

static auto read_import(ByteReader& r) -> ImportEntry {
    ImportEntry import;
    import.module = r.read_string();
    import.name = r.read_string();
    import.kind = read_extern_kind(r);
    switch (import.kind) {
    case ir::ExternKind::Function:
        import.sig = ir::read_sig(r);
        break;
    case ir::ExternKind::Memory:
        import.memory.limits = ir::read_limits(r);
        break;
    case ir::ExternKind::Table:
        import.table.limits = ir::read_limits(r);
        break;
    case ir::ExternKind::Global:
        import.global = ir::read_global_type(r);
        break;
    }
    return import;
}

static void read_section(ByteReader& r, MetadataSection id, DecodedMetadata& out) {
    artifact::ModuleInfo& info = out.info;
    switch (id) {
    case MetadataSection::ModuleInfo:
        info.name = r.read_string();
        info.fingerprint.high = r.read_u64();
        info.fingerprint.low = r.read_u64();
        return;
    case MetadataSection::Functions: {
        uint32_t n = r.read_count(4 + 8 + 4 + 8 + 4 + 4 + 4);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            out.functions.push_back(read_function(r));
        }
        return;
    }
    case MetadataSection::Exports: {
        uint32_t n = r.read_count(4 + 1 + 4);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            ir::Export e;
            e.name = r.read_string();
            e.kind = read_extern_kind(r);
            e.index = r.read_u32();
            info.exports.push_back(std::move(e));
        }
        return;
    }
    case MetadataSection::Imports: {
        uint32_t n = r.read_count(4 + 4 + 1);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            info.imports.push_back(read_import(r));
        }
        return;
    }
    case MetadataSection::Memories: {
        uint32_t n = r.read_count(9);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            info.memories.push_back(ir::MemoryType{ir::read_limits(r)});
        }
        return;
    }
    case MetadataSection::Tables: {
        uint32_t n = r.read_count(9);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            info.tables.push_back(ir::TableType{ir::read_limits(r)});
        }
        return;
    }
    case MetadataSection::Globals: {
        uint32_t n = r.read_count(2 + 13);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            ir::GlobalDef global;
            global.type = ir::read_global_type(r);
            global.init = ir::read_const_expr(r);
            info.globals.push_back(global);
        }
        return;
    }
    case MetadataSection::Data: {
        uint32_t n = r.read_count(13 + 4);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            ir::DataSegment seg;
            seg.offset = ir::read_const_expr(r);
            seg.bytes = r.read_bytes();
            info.data.push_back(std::move(seg));
        }
        return;
    }
    case MetadataSection::Elements: {
        uint32_t n = r.read_count(13 + 4);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            ir::ElementSegment seg;
            seg.offset = ir::read_const_expr(r);
            seg.functions = read_u32_list(r);
            info.elements.push_back(std::move(seg));
        }
        return;
    }
    case MetadataSection::Start: {
        bool has_start = r.read_bool();
        uint32_t start = r.read_u32();
        if (has_start) {
            info.start = start;
        }
        return;
    }
    case MetadataSection::Trampolines: {
        uint32_t n = r.read_count(1 + 8);
        for (uint32_t i = 0; i < n && !r.has_error(); ++i) {
            trampoline::TrampolineKey key;
            uint8_t kind = r.read_u8();
            if (kind > static_cast<uint8_t>(trampoline::TrampolineKind::WasmToHost)) {
                r.set_error("invalid trampoline kind " + std::to_string(kind));
            }
            key.kind = static_cast<trampoline::TrampolineKind>(kind);
            key.sig = ir::read_sig(r);
            out.trampolines.push_back(std::move(key));
        }
        return;
    }
    }
}

// ============================================================================
// Decode
// ============================================================================

auto MetadataReader::decode(std::span<const uint8_t> blob) -> Result<DecodedMetadata, Error> {
    auto header = read_header(blob);
    if (is_err(header)) {
        return unwrap_err(header);
    }
    const MetadataHeader& h = unwrap(header);

    auto stored = blob.subspan(METADATA_HEADER_SIZE, h.stored_size);
    uint32_t crc = crc32c(stored.data(), stored.size());
    if (crc != h.payload_crc32c) {
        return Error::serialization("metadata checksum mismatch");
    }

    std::vector<uint8_t> payload;
    if (h.is_compressed()) {
        payload.resize(h.payload_size);
        size_t n = ZSTD_decompress(payload.data(), payload.size(), stored.data(), stored.size());
        if (ZSTD_isError(n)) {
            return Error::serialization(std::string("zstd decompression failed: ") +
                                        ZSTD_getErrorName(n));
        }
        if (n != h.payload_size) {
            return Error::serialization("decompressed metadata is " + std::to_string(n) +
                                        " bytes, header announces " +
                                        std::to_string(h.payload_size));
        }
    } else {
        payload.assign(stored.begin(), stored.end());
    }

    if (h.section_count != METADATA_SECTION_COUNT) {
        return Error::serialization("metadata has " + std::to_string(h.section_count) +
                                    " sections, expected " +
                                    std::to_string(METADATA_SECTION_COUNT));
    }

    DecodedMetadata out{
        h,
        target::TargetConfig(static_cast<target::Arch>(h.arch), h.feature_bits, h.pointer_width,
                             static_cast<target::CallingConvention>(h.calling_convention)),
        {},
        {},
        {},
    };

    ByteReader r(payload);
    for (uint32_t expected = 1; expected <= METADATA_SECTION_COUNT; ++expected) {
        uint32_t id = r.read_u32();
        uint32_t length = r.read_u32();
        if (r.has_error()) {
            return Error::serialization("metadata section table: " + r.error_message());
        }
        auto section_name = metadata_section_name(static_cast<MetadataSection>(expected));
        if (id != expected) {
            return Error::serialization("metadata section " + std::to_string(id) +
                                        " found where '" + section_name + "' was expected");
        }
        if (length > r.remaining()) {
            return Error::serialization(std::string("metadata section '") + section_name +
                                        "' length " + std::to_string(length) +
                                        " exceeds the payload");
        }

        ByteReader section(r.read_span(length));
        read_section(section, static_cast<MetadataSection>(id), out);
        if (section.has_error()) {
            return Error::serialization(std::string("metadata section '") + section_name +
                                        "': " + section.error_message());
        }
        if (!section.at_end()) {
            return Error::serialization(std::string("metadata section '") + section_name +
                                        "' has " + std::to_string(section.remaining()) +
                                        " trailing bytes");
        }
    }
    if (!r.at_end()) {
        return Error::serialization("metadata payload has " + std::to_string(r.remaining()) +
                                    " trailing bytes");
    }

    return out;
}

} // namespace waot::serialize
