//! # Target Configuration
//!
//! Describes the machine an artifact is compiled for: architecture, CPU
//! feature set, pointer width and calling convention. A `TargetConfig` is
//! an immutable value; two configurations are compatible only when every
//! field matches exactly. A feature superset is *not* compatible, because
//! code compiled for more features may use instructions the narrower
//! machine lacks.
//!
//! ## Feature Encoding
//!
//! CPU features are stored as a 64-bit set. Bits 0-31 belong to x86_64,
//! bits 32-63 to aarch64, so the set alone says which architecture a
//! feature was meant for.
//!
//! | Arch    | Features                                                   |
//! |---------|------------------------------------------------------------|
//! | x86_64  | sse2 sse3 ssse3 sse4.1 sse4.2 popcnt avx avx2 bmi1 bmi2 lzcnt fma |
//! | aarch64 | neon lse crc                                               |

#ifndef WAOT_TARGET_TARGET_HPP
#define WAOT_TARGET_TARGET_HPP

#include "common.hpp"
#include "common/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waot::target {

enum class Arch : uint8_t {
    X86_64 = 0,
    Aarch64 = 1,
};

enum class CallingConvention : uint8_t {
    SystemV = 0,      ///< x86_64 Linux/BSD
    WindowsX64 = 1,   ///< x86_64 Windows
    Aapcs64 = 2,      ///< aarch64 Linux
    AppleAarch64 = 3, ///< aarch64 macOS
};

enum class ObjectFormat : uint8_t {
    ELF,
    COFF,
    MachO,
};

/// Set of CPU features, one bit per known feature.
using CpuFeatures = uint64_t;

/// One known CPU feature.
struct FeatureInfo {
    const char* name;      ///< Name used in the public API ("sse4.1")
    const char* llvm_name; ///< LLVM subtarget feature ("sse4.1", "bmi")
    Arch arch;
    uint32_t bit;
};

/// All known features, both architectures.
[[nodiscard]] auto known_features() -> const std::vector<FeatureInfo>&;

/// Looks up a feature by its public name.
[[nodiscard]] auto find_feature(std::string_view name) -> const FeatureInfo*;

/// WebAssembly proposals the engine may enable.
struct WasmFeatures {
    bool multi_value = true;     ///< Blocks and functions with several results
    bool bulk_memory = true;     ///< memory.copy / memory.fill
    bool reference_types = true; ///< `ref` values, ref.null / ref.is_null / ref.func
    bool simd = false;           ///< Requires sse4.1 (x86_64) or neon (aarch64)

    bool operator==(const WasmFeatures& other) const = default;
};

/// Immutable compilation target.
class TargetConfig {
public:
    TargetConfig(Arch arch, CpuFeatures features, uint8_t pointer_width, CallingConvention cc)
        : arch_(arch), features_(features), pointer_width_(pointer_width), cc_(cc) {}

    /// Builds a configuration from feature names. Fails with a
    /// ConfigurationError on unknown names. Cross-field consistency is
    /// checked by `validate()`.
    [[nodiscard]] static auto create(Arch arch, const std::vector<std::string>& feature_names,
                                     uint8_t pointer_width, CallingConvention cc)
        -> Result<TargetConfig, Error>;

    /// The configuration matching the build host with baseline features
    /// only (sse2 on x86_64, neon on aarch64).
    [[nodiscard]] static auto host() -> TargetConfig;

    /// Checks that the fields agree with each other: 64-bit pointers, a
    /// calling convention of the same architecture, no features of the
    /// other architecture.
    [[nodiscard]] auto validate() const -> std::optional<Error>;

    [[nodiscard]] auto arch() const -> Arch {
        return arch_;
    }
    [[nodiscard]] auto features() const -> CpuFeatures {
        return features_;
    }
    [[nodiscard]] auto pointer_width() const -> uint8_t {
        return pointer_width_;
    }
    [[nodiscard]] auto calling_convention() const -> CallingConvention {
        return cc_;
    }

    [[nodiscard]] auto has_feature(std::string_view name) const -> bool;

    /// Public feature names, in bit order.
    [[nodiscard]] auto feature_names() const -> std::vector<std::string>;

    /// LLVM target triple (e.g. "x86_64-unknown-linux-gnu").
    [[nodiscard]] auto to_triple() const -> std::string;

    /// LLVM CPU name; always a generic model so output does not depend on
    /// the compiling machine.
    [[nodiscard]] auto llvm_cpu() const -> std::string;

    /// LLVM feature string ("+sse2,+sse4.1").
    [[nodiscard]] auto llvm_features() const -> std::string;

    [[nodiscard]] auto object_format() const -> ObjectFormat;

    /// "x86_64/system_v/64 [sse2,sse4.1]"
    [[nodiscard]] auto to_string() const -> std::string;

    bool operator==(const TargetConfig& other) const = default;

private:
    Arch arch_;
    CpuFeatures features_;
    uint8_t pointer_width_;
    CallingConvention cc_;
};

[[nodiscard]] auto arch_to_string(Arch arch) -> std::string;
[[nodiscard]] auto cc_to_string(CallingConvention cc) -> std::string;
[[nodiscard]] auto string_to_arch(std::string_view s) -> std::optional<Arch>;
[[nodiscard]] auto string_to_cc(std::string_view s) -> std::optional<CallingConvention>;

/// Architecture a calling convention belongs to.
[[nodiscard]] auto cc_arch(CallingConvention cc) -> Arch;

} // namespace waot::target

#endif // WAOT_TARGET_TARGET_HPP
