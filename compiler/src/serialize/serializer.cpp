//! # Artifact Serializer Implementation

#include "serialize/serializer.hpp"

#include "backend/lld_linker.hpp"
#include "backend/object_reader.hpp"
#include "codegen/code_generator.hpp"
#include "codegen/ir_writer.hpp"
#include "common/temp_path.hpp"
#include "log/log.hpp"

#include <chrono>
#include <fstream>
#include <iterator>

namespace waot::serialize {

namespace fs = std::filesystem;

auto metadata_container_section(target::ObjectFormat format) -> const char* {
    switch (format) {
    case target::ObjectFormat::ELF:
        return ".waot_meta";
    case target::ObjectFormat::COFF:
        return ".waotmd";
    case target::ObjectFormat::MachO:
        return "__waot_meta";
    }
    return ".waot_meta";
}

// ============================================================================
// Helper Functions
// ============================================================================

static auto library_extension(target::ObjectFormat format) -> const char* {
    switch (format) {
    case target::ObjectFormat::COFF:
        return ".dll";
    case target::ObjectFormat::MachO:
        return ".dylib";
    case target::ObjectFormat::ELF:
        return ".so";
    }
    return ".so";
}

static auto format_of(backend::BinaryKind kind) -> std::optional<target::ObjectFormat> {
    switch (kind) {
    case backend::BinaryKind::ELF:
        return target::ObjectFormat::ELF;
    case backend::BinaryKind::COFF:
        return target::ObjectFormat::COFF;
    case backend::BinaryKind::MachO:
        return target::ObjectFormat::MachO;
    case backend::BinaryKind::Other:
        break;
    }
    return std::nullopt;
}

static auto write_file(const fs::path& path, const std::vector<uint8_t>& bytes) -> bool {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

static auto read_file(const fs::path& path) -> std::optional<std::vector<uint8_t>> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Removes a scratch directory and its contents when it goes out of scope.
class ScratchDir {
public:
    explicit ScratchDir(fs::path path) : path_(std::move(path)) {}
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            WAOT_LOG_WARN("serialize", "could not remove " << path_.string() << ": " << ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

private:
    fs::path path_;
};

// ============================================================================
// Serializer
// ============================================================================

Serializer::Serializer(target::TargetConfig target, trampoline::TrampolineCache& trampolines,
                       SerializerOptions options)
    : target_(std::move(target)), trampolines_(trampolines), options_(std::move(options)) {
    if (options_.work_dir.empty()) {
        options_.work_dir = fs::temp_directory_path() / "waot";
    }
}

auto Serializer::metadata_object(const artifact::DylibArtifact& artifact)
    -> Result<std::vector<uint8_t>, Error> {
    auto blob = MetadataWriter::encode(artifact, options_.compress_metadata);
    if (is_err(blob)) {
        return unwrap_err(blob);
    }
    const std::vector<uint8_t>& bytes = unwrap(blob);

    target::ObjectFormat format = target_.object_format();
    std::string section = metadata_container_section(format);
    if (format == target::ObjectFormat::MachO) {
        section = "__DATA," + section;
    }

    codegen::IRWriter writer;
    writer.emit_global("@" + std::string(codegen::METADATA_SYMBOL) + " = " +
                       (format == target::ObjectFormat::COFF ? "dllexport " : "") + "constant [" +
                       std::to_string(bytes.size()) + " x i8] c\"" +
                       codegen::llvm_escape_bytes(bytes) + "\", section \"" + section +
                       "\", align 8");
    std::string ir = writer.finish_module(artifact.name() + ".metadata");

    std::lock_guard<std::mutex> lock(backend_mutex_);
    if (!backend_.is_initialized() && !backend_.initialize()) {
        return Error::serialization("LLVM backend unavailable: " + backend_.get_last_error());
    }

    backend::LLVMCompileOptions opts;
    opts.optimization_level = 0;
    opts.target_triple = target_.to_triple();
    opts.cpu = target_.llvm_cpu();
    opts.features = target_.llvm_features();
    opts.position_independent = true;

    auto compiled = backend_.compile_ir_to_buffer(ir, opts);
    if (!compiled.success) {
        return Error::serialization("metadata object: " + compiled.error_message);
    }
    return std::move(compiled.object_data);
}

auto Serializer::link_objects(const artifact::DylibArtifact& artifact,
                              const std::vector<uint8_t>& metadata)
    -> Result<std::vector<uint8_t>, Error> {
    std::error_code ec;
    fs::create_directories(options_.work_dir, ec);
    if (ec) {
        return Error::link("cannot create work directory " + options_.work_dir.string() + ": " +
                           ec.message());
    }
    ScratchDir scratch(unique_path(options_.work_dir, "link"));
    fs::create_directory(scratch.path(), ec);
    if (ec) {
        return Error::link("cannot create " + scratch.path().string() + ": " + ec.message());
    }

    std::vector<fs::path> objects;
    auto add_object = [&](const std::string& stem, const std::vector<uint8_t>& bytes) -> bool {
        fs::path path = scratch.path() / (stem + ".o");
        if (!write_file(path, bytes)) {
            return false;
        }
        objects.push_back(std::move(path));
        return true;
    };

    for (const auto& fn : artifact.functions()) {
        if (fn.object.empty()) {
            return Error::link("function " + std::to_string(fn.index) +
                               " has no object code to link");
        }
        if (!add_object(fn.symbol, fn.object)) {
            return Error::link("cannot write object for " + fn.symbol);
        }
    }
    for (const auto& key : artifact.trampolines()) {
        auto stub = trampolines_.get_or_create(key);
        if (is_err(stub)) {
            return unwrap_err(stub);
        }
        if (!add_object(unwrap(stub)->symbol, unwrap(stub)->object)) {
            return Error::link("cannot write object for " + unwrap(stub)->symbol);
        }
    }
    if (!add_object(std::string(codegen::METADATA_SYMBOL), metadata)) {
        return Error::link("cannot write the metadata object");
    }

    backend::LLDLinker linker;
    if (!linker.initialize(target_.object_format())) {
        return Error::link(linker.get_last_error());
    }

    backend::LLDLinkOptions link_opts;
    link_opts.arch = target_.arch();
    if (target_.object_format() == target::ObjectFormat::ELF) {
        link_opts.extra_flags.push_back("--no-undefined");
    }

    fs::path output = scratch.path() / ("lib" + file_stem(artifact.name()) +
                                        library_extension(target_.object_format()));
    auto linked = linker.link(objects, output, link_opts);
    if (!linked.success) {
        return Error::link(linked.error_message);
    }

    auto bytes = read_file(linked.output_file);
    if (!bytes) {
        return Error::link("cannot read linked library " + linked.output_file.string());
    }
    return std::move(*bytes);
}

auto Serializer::link(artifact::DylibArtifact& artifact)
    -> Result<Rc<const std::vector<uint8_t>>, Error> {
    if (auto cached = artifact.linked_bytes()) {
        return cached;
    }
    if (artifact.target() != target_) {
        return Error::target_mismatch("artifact '" + artifact.name() + "' targets " +
                                      artifact.target().to_string() + ", serializer targets " +
                                      target_.to_string());
    }

    auto start_time = std::chrono::steady_clock::now();

    auto metadata = metadata_object(artifact);
    if (is_err(metadata)) {
        return unwrap_err(metadata);
    }
    auto bytes = link_objects(artifact, unwrap(metadata));
    if (is_err(bytes)) {
        WAOT_LOG_WARN("serialize", "linking '" << artifact.name() << "' failed: "
                                               << unwrap_err(bytes).message);
        return unwrap_err(bytes);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start_time)
                       .count();
    WAOT_LOG_DEBUG("serialize", "linked '" << artifact.name() << "': " << unwrap(bytes).size()
                                           << " bytes in " << elapsed << " ms");

    // Another thread may have linked concurrently; the first result is kept.
    return artifact.set_linked_bytes(std::move(unwrap(bytes)));
}

auto Serializer::serialize(artifact::DylibArtifact& artifact)
    -> Result<std::vector<uint8_t>, Error> {
    auto linked = link(artifact);
    if (is_err(linked)) {
        return unwrap_err(linked);
    }
    return *unwrap(linked);
}

// ============================================================================
// Deserialization
// ============================================================================

static auto symbol_in(const backend::ObjectFileInfo& object, const std::string& symbol)
    -> const backend::ObjectSymbol* {
    if (object.kind == backend::BinaryKind::MachO) {
        return object.find_symbol("_" + symbol);
    }
    return object.find_symbol(symbol);
}

static auto locate_metadata(const backend::ObjectFileInfo& object)
    -> Result<const backend::ObjectSection*, Error> {
    auto format = format_of(object.kind);
    if (!format) {
        return Error::serialization("unsupported container format");
    }
    const backend::ObjectSection* section =
        object.find_section(metadata_container_section(*format));
    if (!section) {
        return Error::serialization("container has no waot metadata section");
    }
    return section;
}

auto Serializer::extract_metadata(std::span<const uint8_t> bytes)
    -> Result<std::vector<uint8_t>, Error> {
    auto parsed = backend::ObjectReader::read(bytes);
    if (is_err(parsed)) {
        return Error::serialization("not a readable shared library: " + unwrap_err(parsed));
    }
    auto section = locate_metadata(unwrap(parsed));
    if (is_err(section)) {
        return unwrap_err(section);
    }
    return unwrap(section)->contents;
}

auto Serializer::deserialize(std::span<const uint8_t> bytes)
    -> Result<Rc<artifact::DylibArtifact>, Error> {
    auto parsed = backend::ObjectReader::read(bytes);
    if (is_err(parsed)) {
        return Error::serialization("not a readable shared library: " + unwrap_err(parsed));
    }
    const backend::ObjectFileInfo& object = unwrap(parsed);
    auto section = locate_metadata(object);
    if (is_err(section)) {
        return unwrap_err(section);
    }

    auto decoded = MetadataReader::decode(unwrap(section)->contents);
    if (is_err(decoded)) {
        return unwrap_err(decoded);
    }
    DecodedMetadata& meta = unwrap(decoded);

    uint32_t num_imported = meta.info.num_imported(ir::ExternKind::Function);
    for (size_t i = 0; i < meta.functions.size(); ++i) {
        const auto& fn = meta.functions[i];
        if (fn.index != num_imported + i) {
            return Error::serialization("function entry " + std::to_string(i) + " has index " +
                                        std::to_string(fn.index) + ", expected " +
                                        std::to_string(num_imported + i));
        }
        const backend::ObjectSymbol* sym = symbol_in(object, fn.symbol);
        if (!sym) {
            return Error::serialization("library does not define " + fn.symbol);
        }
        // Mach-O symbols carry no size.
        if (sym->size != 0 && sym->size != fn.code_size) {
            return Error::serialization(fn.symbol + " is " + std::to_string(sym->size) +
                                        " bytes, metadata records " +
                                        std::to_string(fn.code_size));
        }
    }
    for (const auto& key : meta.trampolines) {
        if (!symbol_in(object, key.symbol())) {
            return Error::serialization("library does not define " + key.symbol());
        }
    }

    auto artifact = make_rc<artifact::DylibArtifact>(std::move(meta.info), meta.target,
                                                     std::move(meta.functions),
                                                     std::move(meta.trampolines));
    if (auto err = artifact->check_indices()) {
        return Error::serialization("inconsistent metadata: " + *err);
    }
    artifact->set_linked_bytes(std::vector<uint8_t>(bytes.begin(), bytes.end()));

    WAOT_LOG_DEBUG("serialize", "deserialized '" << artifact->name() << "': "
                                                 << artifact->functions().size() << " functions, "
                                                 << bytes.size() << " bytes");
    return artifact;
}

} // namespace waot::serialize
