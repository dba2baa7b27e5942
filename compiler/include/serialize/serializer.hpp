//! # Artifact Serializer
//!
//! Converts a `DylibArtifact` to and from a native shared library.
//!
//! The library is linked from the function objects, the objects of the
//! artifact's trampoline set and one metadata object. The metadata object
//! holds a single constant, `waot_metadata`, placed in its own section:
//!
//! | Format | Section              |
//! |--------|----------------------|
//! | ELF    | `.waot_meta`         |
//! | COFF   | `.waotmd`            |
//! | Mach-O | `__DATA,__waot_meta` |
//!
//! Deserialization never maps the library. It reads the container with the
//! LLVM object API, decodes the metadata and checks every function symbol
//! against it.

#ifndef WAOT_SERIALIZE_SERIALIZER_HPP
#define WAOT_SERIALIZE_SERIALIZER_HPP

#include "artifact/artifact.hpp"
#include "backend/llvm_backend.hpp"
#include "serialize/metadata.hpp"
#include "trampoline/trampoline.hpp"

#include <filesystem>
#include <mutex>
#include <span>

namespace waot::serialize {

/// Section holding the metadata for an object format, as the object
/// reader reports it.
[[nodiscard]] auto metadata_container_section(target::ObjectFormat format) -> const char*;

struct SerializerOptions {
    /// Scratch space for objects and linked libraries.
    std::filesystem::path work_dir;

    bool compress_metadata = true;

    int optimization_level = 2;
};

class Serializer {
public:
    Serializer(target::TargetConfig target, trampoline::TrampolineCache& trampolines,
               SerializerOptions options);

    Serializer(const Serializer&) = delete;
    Serializer& operator=(const Serializer&) = delete;

    /// Links the artifact's library once and caches it on the artifact.
    [[nodiscard]] auto link(artifact::DylibArtifact& artifact)
        -> Result<Rc<const std::vector<uint8_t>>, Error>;

    /// The linked library bytes.
    [[nodiscard]] auto serialize(artifact::DylibArtifact& artifact)
        -> Result<std::vector<uint8_t>, Error>;

    /// Parses a library produced by `serialize`. The returned artifact
    /// carries the bytes but no loaded code.
    [[nodiscard]] auto deserialize(std::span<const uint8_t> bytes)
        -> Result<Rc<artifact::DylibArtifact>, Error>;

    /// Relocatable object defining `waot_metadata`.
    [[nodiscard]] auto metadata_object(const artifact::DylibArtifact& artifact)
        -> Result<std::vector<uint8_t>, Error>;

    /// The raw metadata blob of a serialized library.
    [[nodiscard]] static auto extract_metadata(std::span<const uint8_t> bytes)
        -> Result<std::vector<uint8_t>, Error>;

private:
    target::TargetConfig target_;
    trampoline::TrampolineCache& trampolines_;
    SerializerOptions options_;

    std::mutex backend_mutex_;
    backend::LLVMBackend backend_;

    auto link_objects(const artifact::DylibArtifact& artifact, const std::vector<uint8_t>& metadata)
        -> Result<std::vector<uint8_t>, Error>;
};

} // namespace waot::serialize

#endif // WAOT_SERIALIZE_SERIALIZER_HPP
