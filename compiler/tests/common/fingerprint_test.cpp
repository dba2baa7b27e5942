//! # Fingerprint Tests
//!
//! Content fingerprints and the CRC32C they are built on.

#include "common/crc32c.hpp"
#include "common/fingerprint.hpp"

#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

using namespace waot;

// ============================================================================
// CRC32C
// ============================================================================

TEST(Crc32cTest, KnownVector) {
    // Standard check value for CRC-32C.
    EXPECT_EQ(crc32c("123456789"), 0xE3069283u);
}

TEST(Crc32cTest, EmptyInput) {
    EXPECT_EQ(crc32c("", 0), 0u);
}

TEST(Crc32cTest, IncrementalMatchesOneShot) {
    std::string text = "the quick brown fox jumps over the lazy dog";
    uint32_t crc = 0xFFFFFFFF;
    crc = crc32c_update(crc, text.data(), 10);
    crc = crc32c_update(crc, text.data() + 10, text.size() - 10);
    EXPECT_EQ(crc32c_finish(crc), crc32c(text));
}

// ============================================================================
// Fingerprint
// ============================================================================

TEST(FingerprintTest, Deterministic) {
    auto a = fingerprint_string("module contents");
    auto b = fingerprint_string("module contents");
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.is_zero());
}

TEST(FingerprintTest, EmptyIsZero) {
    EXPECT_TRUE(fingerprint_string("").is_zero());
    EXPECT_TRUE(fingerprint_bytes(nullptr, 0).is_zero());
}

TEST(FingerprintTest, SingleByteChangeAnywhereDiffers) {
    std::string base(64, 'a');
    auto reference = fingerprint_string(base);
    for (size_t i = 0; i < base.size(); ++i) {
        std::string changed = base;
        changed[i] = 'b';
        EXPECT_NE(fingerprint_string(changed), reference) << "byte " << i;
    }
}

TEST(FingerprintTest, LengthMatters) {
    EXPECT_NE(fingerprint_string("abc"), fingerprint_string("abcd"));
}

TEST(FingerprintTest, HexIs32Chars) {
    auto hex = fingerprint_string("x").to_hex();
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(Fingerprint{}.to_hex(), std::string(32, '0'));
}

TEST(FingerprintTest, CombineIsOrderDependent) {
    auto a = fingerprint_string("left");
    auto b = fingerprint_string("right");
    EXPECT_NE(fingerprint_combine(a, b), fingerprint_combine(b, a));
    EXPECT_EQ(fingerprint_combine(a, b), fingerprint_combine(a, b));
}

TEST(FingerprintTest, UsableAsHashKey) {
    std::unordered_set<Fingerprint, FingerprintHash> set;
    set.insert(fingerprint_string("one"));
    set.insert(fingerprint_string("two"));
    set.insert(fingerprint_string("one"));
    EXPECT_EQ(set.size(), 2u);
}
