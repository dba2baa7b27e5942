//! # Artifact Metadata
//!
//! The binary blob embedded in every serialized artifact. It describes the
//! module so an artifact can be instantiated without the original
//! `ModuleIR`.
//!
//! ## Layout
//!
//! ```text
//! offset  size  field
//!      0     4  magic "WAOT"
//!      4     4  version (1)
//!      8     1  arch
//!      9     1  calling convention
//!     10     1  pointer width
//!     11     1  reserved (0)
//!     12     8  CPU feature bits
//!     20     4  flags (bit 0: payload is zstd-compressed)
//!     24     4  section count
//!     28     4  payload size (uncompressed)
//!     32     4  stored size (bytes following the header)
//!     36     4  CRC32C of the stored bytes
//!     40        stored payload
//! ```
//!
//! The payload is a sequence of `{id u32, length u32, bytes}` sections, one
//! of each `MetadataSection`, in id order. All integers are little-endian.

#ifndef WAOT_SERIALIZE_METADATA_HPP
#define WAOT_SERIALIZE_METADATA_HPP

#include "artifact/artifact.hpp"
#include "common.hpp"
#include "common/error.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace waot::serialize {

constexpr std::array<uint8_t, 4> METADATA_MAGIC = {'W', 'A', 'O', 'T'};
constexpr uint32_t METADATA_VERSION = 1;
constexpr size_t METADATA_HEADER_SIZE = 40;
constexpr uint32_t METADATA_FLAG_ZSTD = 1u << 0;

/// Upper bound on the uncompressed payload a reader accepts.
constexpr uint32_t METADATA_MAX_PAYLOAD = 256u << 20;

enum class MetadataSection : uint32_t {
    ModuleInfo = 1,
    Functions = 2,
    Exports = 3,
    Imports = 4,
    Memories = 5,
    Tables = 6,
    Globals = 7,
    Data = 8,
    Elements = 9,
    Start = 10,
    Trampolines = 11,
};

constexpr uint32_t METADATA_SECTION_COUNT = 11;

[[nodiscard]] auto metadata_section_name(MetadataSection section) -> const char*;

struct MetadataHeader {
    uint32_t version = METADATA_VERSION;
    uint8_t arch = 0;
    uint8_t calling_convention = 0;
    uint8_t pointer_width = 64;
    uint64_t feature_bits = 0;
    uint32_t flags = 0;
    uint32_t section_count = 0;
    uint32_t payload_size = 0;
    uint32_t stored_size = 0;
    uint32_t payload_crc32c = 0;

    [[nodiscard]] auto is_compressed() const -> bool {
        return (flags & METADATA_FLAG_ZSTD) != 0;
    }
};

/// Artifact contents recovered from metadata.
struct DecodedMetadata {
    MetadataHeader header;
    target::TargetConfig target;
    artifact::ModuleInfo info;
    std::vector<artifact::CompiledFunction> functions;
    std::vector<trampoline::TrampolineKey> trampolines;
};

class MetadataWriter {
public:
    /// Encodes header and payload. With `compress`, the payload is stored
    /// zstd-compressed at `compression_level`.
    [[nodiscard]] static auto encode(const artifact::DylibArtifact& artifact, bool compress,
                                     int compression_level = 3)
        -> Result<std::vector<uint8_t>, Error>;

    /// The uncompressed payload (all sections).
    [[nodiscard]] static auto encode_payload(const artifact::DylibArtifact& artifact)
        -> std::vector<uint8_t>;
};

class MetadataReader {
public:
    /// Parses and checks the fixed header: magic and version first, then
    /// the target fields and sizes against `blob`.
    [[nodiscard]] static auto read_header(std::span<const uint8_t> blob)
        -> Result<MetadataHeader, Error>;

    /// Full decode: header, checksum, decompression, sections.
    [[nodiscard]] static auto decode(std::span<const uint8_t> blob)
        -> Result<DecodedMetadata, Error>;
};

} // namespace waot::serialize

#endif // WAOT_SERIALIZE_METADATA_HPP
