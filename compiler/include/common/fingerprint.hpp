//! # Content Fingerprints
//!
//! 128-bit fingerprints of byte content. The engine keys its compile cache
//! on the fingerprint of a module's canonical encoding, so two modules with
//! identical content map to one artifact.
//!
//! Uses CRC32C (Castagnoli) from `common/crc32c.hpp` for fast hashing.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace waot {

/// 128-bit content fingerprint.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;
    bool operator!=(const Fingerprint& other) const = default;

    /// Returns true if this fingerprint has not been computed yet.
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character hex string representation.
    [[nodiscard]] std::string to_hex() const;
};

/// Hash functor so fingerprints can key unordered containers.
struct FingerprintHash {
    size_t operator()(const Fingerprint& fp) const noexcept {
        return std::hash<uint64_t>{}(fp.high ^ (fp.low * 0x9E3779B97F4A7C15ULL));
    }
};

/// Compute a fingerprint from raw bytes.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

/// Compute a fingerprint from a string.
[[nodiscard]] Fingerprint fingerprint_string(std::string_view str);

/// Combine two fingerprints into one. Order dependent.
[[nodiscard]] Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b);

} // namespace waot
