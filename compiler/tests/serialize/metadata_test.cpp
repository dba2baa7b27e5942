//! # Artifact Metadata Tests
//!
//! Encoding and decoding of the metadata blob without any toolchain: the
//! artifact is assembled by hand, so only the blob format is exercised.

#include "artifact/artifact_compiler.hpp"
#include "common/crc32c.hpp"
#include "serialize/metadata.hpp"
#include "test_modules.hpp"

#include <gtest/gtest.h>

using namespace waot;
using namespace waot::serialize;

namespace {

auto hand_built_artifact() -> Rc<artifact::DylibArtifact> {
    ir::ModuleIR module = test::memory_module();
    auto info = artifact::ModuleInfo::from_module(module);

    std::vector<artifact::CompiledFunction> functions;
    for (uint32_t i = 0; i < module.functions.size(); ++i) {
        artifact::CompiledFunction fn;
        fn.index = i;
        fn.sig = *module.function_sig(i);
        fn.symbol = "waot_func_" + std::to_string(i);
        fn.code_size = 16 + i;
        fn.object = {0xC3};
        if (i == 0) {
            fn.relocations.push_back(
                {4, artifact::RelocationTarget::Trampoline, "waot_w2h_i_i", "R_X86_64_PLT32", -4});
            fn.libcalls = {static_cast<uint32_t>(runtime::LibCall::MemoryGrow)};
        }
        functions.push_back(std::move(fn));
    }

    return make_rc<artifact::DylibArtifact>(
        std::move(info), target::TargetConfig::host(), std::move(functions),
        artifact::ArtifactCompiler::required_trampolines(module));
}

void put_u32(std::vector<uint8_t>& bytes, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

auto encode(const artifact::DylibArtifact& artifact, bool compress) -> std::vector<uint8_t> {
    auto blob = MetadataWriter::encode(artifact, compress);
    EXPECT_TRUE(is_ok(blob));
    return is_ok(blob) ? unwrap(blob) : std::vector<uint8_t>{};
}

auto decode_error(const std::vector<uint8_t>& blob) -> std::string {
    auto decoded = MetadataReader::decode(blob);
    if (is_ok(decoded)) {
        return "";
    }
    EXPECT_EQ(unwrap_err(decoded).kind, ErrorKind::Serialization);
    return unwrap_err(decoded).message;
}

} // namespace

class MetadataTest : public ::testing::TestWithParam<bool> {
protected:
    Rc<artifact::DylibArtifact> artifact_ = hand_built_artifact();
};

// ============================================================================
// Round Trip
// ============================================================================

TEST_P(MetadataTest, DecodesWhatWasEncoded) {
    auto blob = encode(*artifact_, GetParam());
    auto decoded = MetadataReader::decode(blob);
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded).to_string();
    const DecodedMetadata& meta = unwrap(decoded);

    EXPECT_EQ(meta.header.is_compressed(), GetParam());
    EXPECT_EQ(meta.header.section_count, METADATA_SECTION_COUNT);
    EXPECT_EQ(meta.target, artifact_->target());
    EXPECT_EQ(meta.info.name, "memory");
    EXPECT_EQ(meta.info.fingerprint, artifact_->fingerprint());
    EXPECT_EQ(meta.info.imports, artifact_->info().imports);
    EXPECT_EQ(meta.info.memories, artifact_->info().memories);
    ASSERT_EQ(meta.info.data.size(), 1u);
    EXPECT_EQ(meta.info.data[0].bytes, (std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o'}));
    ASSERT_EQ(meta.info.exports.size(), artifact_->info().exports.size());
    EXPECT_EQ(meta.info.exports[0].name, artifact_->info().exports[0].name);
    EXPECT_EQ(meta.info.start, std::nullopt);
    EXPECT_EQ(meta.trampolines, artifact_->trampolines());

    ASSERT_EQ(meta.functions.size(), artifact_->functions().size());
    for (size_t i = 0; i < meta.functions.size(); ++i) {
        const auto& got = meta.functions[i];
        const auto& want = artifact_->functions()[i];
        EXPECT_EQ(got.index, want.index);
        EXPECT_EQ(got.sig, want.sig);
        EXPECT_EQ(got.symbol, want.symbol);
        EXPECT_EQ(got.code_size, want.code_size);
        EXPECT_EQ(got.relocations, want.relocations);
        EXPECT_EQ(got.libcalls, want.libcalls);
        EXPECT_TRUE(got.object.empty());
    }
}

TEST_P(MetadataTest, EncodingIsDeterministic) {
    EXPECT_EQ(encode(*artifact_, GetParam()), encode(*artifact_, GetParam()));
}

TEST_P(MetadataTest, HeaderFields) {
    auto blob = encode(*artifact_, GetParam());
    ASSERT_GE(blob.size(), METADATA_HEADER_SIZE);
    EXPECT_EQ(blob[0], 'W');
    EXPECT_EQ(blob[3], 'T');

    auto header = MetadataReader::read_header(blob);
    ASSERT_TRUE(is_ok(header));
    const MetadataHeader& h = unwrap(header);
    EXPECT_EQ(h.version, METADATA_VERSION);
    EXPECT_EQ(h.stored_size, blob.size() - METADATA_HEADER_SIZE);
    EXPECT_EQ(h.payload_size, MetadataWriter::encode_payload(*artifact_).size());
    EXPECT_EQ(h.payload_crc32c,
              crc32c(blob.data() + METADATA_HEADER_SIZE, blob.size() - METADATA_HEADER_SIZE));
}

// ============================================================================
// Corruption
// ============================================================================

TEST_P(MetadataTest, RejectsBadMagic) {
    auto blob = encode(*artifact_, GetParam());
    blob[0] = 'X';
    EXPECT_EQ(decode_error(blob), "bad metadata magic");
}

TEST_P(MetadataTest, RejectsOtherVersion) {
    auto blob = encode(*artifact_, GetParam());
    put_u32(blob, 4, METADATA_VERSION + 1);
    EXPECT_NE(decode_error(blob).find("unsupported metadata version 2"), std::string::npos);
}

TEST_P(MetadataTest, RejectsUnknownTargetFields) {
    auto bad_arch = encode(*artifact_, GetParam());
    bad_arch[8] = 0x7F;
    EXPECT_NE(decode_error(bad_arch).find("unknown architecture id 127"), std::string::npos);

    auto bad_cc = encode(*artifact_, GetParam());
    bad_cc[9] = 0x7F;
    EXPECT_NE(decode_error(bad_cc).find("unknown calling convention"), std::string::npos);

    auto reserved = encode(*artifact_, GetParam());
    reserved[11] = 1;
    EXPECT_EQ(decode_error(reserved), "unknown metadata flags");
}

TEST_P(MetadataTest, RejectsTruncation) {
    auto blob = encode(*artifact_, GetParam());
    std::vector<uint8_t> header_only(blob.begin(), blob.begin() + 20);
    EXPECT_NE(decode_error(header_only).find("header needs 40"), std::string::npos);

    blob.pop_back();
    EXPECT_NE(decode_error(blob).find("metadata truncated: header announces"), std::string::npos);
}

TEST_P(MetadataTest, RejectsChecksumMismatch) {
    auto blob = encode(*artifact_, GetParam());
    blob[METADATA_HEADER_SIZE + 2] ^= 0x40;
    EXPECT_EQ(decode_error(blob), "metadata checksum mismatch");
}

TEST_P(MetadataTest, RejectsWrongSectionCount) {
    auto blob = encode(*artifact_, GetParam());
    put_u32(blob, 24, METADATA_SECTION_COUNT - 1);
    EXPECT_NE(decode_error(blob).find("sections, expected 11"), std::string::npos);
}

INSTANTIATE_TEST_SUITE_P(Storage, MetadataTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Zstd") : std::string("Raw");
                         });

// ============================================================================
// Section Contents
// ============================================================================

TEST(MetadataSectionTest, TrailingBytesInSectionAreRejected) {
    auto artifact = hand_built_artifact();
    std::vector<uint8_t> payload = MetadataWriter::encode_payload(*artifact);

    // The first section is ModuleInfo: grow it by one byte and shift the rest.
    uint32_t length = payload[4] | (payload[5] << 8) | (payload[6] << 16) |
                      (static_cast<uint32_t>(payload[7]) << 24);
    payload.insert(payload.begin() + 8 + length, 0);
    put_u32(payload, 4, length + 1);

    auto blob = encode(*artifact, false);
    blob.resize(METADATA_HEADER_SIZE);
    put_u32(blob, 28, static_cast<uint32_t>(payload.size()));
    put_u32(blob, 32, static_cast<uint32_t>(payload.size()));
    put_u32(blob, 36, crc32c(payload.data(), payload.size()));
    blob.insert(blob.end(), payload.begin(), payload.end());

    EXPECT_NE(decode_error(blob).find("trailing bytes"), std::string::npos);
}

TEST(MetadataSectionTest, SectionNames) {
    EXPECT_STREQ(metadata_section_name(MetadataSection::ModuleInfo), "module");
    EXPECT_STREQ(metadata_section_name(MetadataSection::Trampolines), "trampolines");
}
