#include "target/target.hpp"

#include <sstream>

namespace waot::target {

// ============================================================================
// Feature Table
// ============================================================================

auto known_features() -> const std::vector<FeatureInfo>& {
    static const std::vector<FeatureInfo> features = {
        {"sse2", "sse2", Arch::X86_64, 0},
        {"sse3", "sse3", Arch::X86_64, 1},
        {"ssse3", "ssse3", Arch::X86_64, 2},
        {"sse4.1", "sse4.1", Arch::X86_64, 3},
        {"sse4.2", "sse4.2", Arch::X86_64, 4},
        {"popcnt", "popcnt", Arch::X86_64, 5},
        {"avx", "avx", Arch::X86_64, 6},
        {"avx2", "avx2", Arch::X86_64, 7},
        {"bmi1", "bmi", Arch::X86_64, 8},
        {"bmi2", "bmi2", Arch::X86_64, 9},
        {"lzcnt", "lzcnt", Arch::X86_64, 10},
        {"fma", "fma", Arch::X86_64, 11},
        {"neon", "neon", Arch::Aarch64, 32},
        {"lse", "lse", Arch::Aarch64, 33},
        {"crc", "crc", Arch::Aarch64, 34},
    };
    return features;
}

auto find_feature(std::string_view name) -> const FeatureInfo* {
    for (const auto& info : known_features()) {
        if (name == info.name) {
            return &info;
        }
    }
    return nullptr;
}

static constexpr CpuFeatures X86_64_MASK = 0x00000000FFFFFFFFULL;
static constexpr CpuFeatures AARCH64_MASK = 0xFFFFFFFF00000000ULL;

static auto arch_mask(Arch arch) -> CpuFeatures {
    return arch == Arch::X86_64 ? X86_64_MASK : AARCH64_MASK;
}

static auto all_known_bits() -> CpuFeatures {
    CpuFeatures bits = 0;
    for (const auto& info : known_features()) {
        bits |= CpuFeatures{1} << info.bit;
    }
    return bits;
}

// ============================================================================
// Enum Conversions
// ============================================================================

auto arch_to_string(Arch arch) -> std::string {
    switch (arch) {
    case Arch::X86_64:
        return "x86_64";
    case Arch::Aarch64:
        return "aarch64";
    }
    return "unknown";
}

auto cc_to_string(CallingConvention cc) -> std::string {
    switch (cc) {
    case CallingConvention::SystemV:
        return "system_v";
    case CallingConvention::WindowsX64:
        return "windows_x64";
    case CallingConvention::Aapcs64:
        return "aapcs64";
    case CallingConvention::AppleAarch64:
        return "apple_aarch64";
    }
    return "unknown";
}

auto string_to_arch(std::string_view s) -> std::optional<Arch> {
    if (s == "x86_64" || s == "amd64" || s == "x64")
        return Arch::X86_64;
    if (s == "aarch64" || s == "arm64")
        return Arch::Aarch64;
    return std::nullopt;
}

auto string_to_cc(std::string_view s) -> std::optional<CallingConvention> {
    if (s == "system_v")
        return CallingConvention::SystemV;
    if (s == "windows_x64")
        return CallingConvention::WindowsX64;
    if (s == "aapcs64")
        return CallingConvention::Aapcs64;
    if (s == "apple_aarch64")
        return CallingConvention::AppleAarch64;
    return std::nullopt;
}

auto cc_arch(CallingConvention cc) -> Arch {
    switch (cc) {
    case CallingConvention::SystemV:
    case CallingConvention::WindowsX64:
        return Arch::X86_64;
    case CallingConvention::Aapcs64:
    case CallingConvention::AppleAarch64:
        return Arch::Aarch64;
    }
    return Arch::X86_64;
}

// ============================================================================
// TargetConfig
// ============================================================================

auto TargetConfig::create(Arch arch, const std::vector<std::string>& feature_names,
                          uint8_t pointer_width, CallingConvention cc)
    -> Result<TargetConfig, Error> {
    CpuFeatures bits = 0;
    for (const auto& name : feature_names) {
        const FeatureInfo* info = find_feature(name);
        if (!info) {
            return Error::configuration("unknown CPU feature '" + name + "'");
        }
        bits |= CpuFeatures{1} << info->bit;
    }
    return TargetConfig(arch, bits, pointer_width, cc);
}

auto TargetConfig::host() -> TargetConfig {
#if defined(__aarch64__) || defined(_M_ARM64)
    const FeatureInfo* neon = find_feature("neon");
#if defined(__APPLE__)
    return TargetConfig(Arch::Aarch64, CpuFeatures{1} << neon->bit, 64,
                        CallingConvention::AppleAarch64);
#else
    return TargetConfig(Arch::Aarch64, CpuFeatures{1} << neon->bit, 64, CallingConvention::Aapcs64);
#endif
#else
    const FeatureInfo* sse2 = find_feature("sse2");
#if defined(_WIN32)
    return TargetConfig(Arch::X86_64, CpuFeatures{1} << sse2->bit, 64,
                        CallingConvention::WindowsX64);
#else
    return TargetConfig(Arch::X86_64, CpuFeatures{1} << sse2->bit, 64, CallingConvention::SystemV);
#endif
#endif
}

auto TargetConfig::validate() const -> std::optional<Error> {
    if (pointer_width_ != 64) {
        return Error::configuration("pointer width " + std::to_string(pointer_width_) +
                                    " is not supported on " + arch_to_string(arch_) +
                                    " (only 64)");
    }

    if (cc_arch(cc_) != arch_) {
        return Error::configuration("calling convention " + cc_to_string(cc_) +
                                    " does not belong to " + arch_to_string(arch_));
    }

    CpuFeatures unknown = features_ & ~all_known_bits();
    if (unknown != 0) {
        std::ostringstream oss;
        oss << "unknown CPU feature bits 0x" << std::hex << unknown;
        return Error::configuration(oss.str());
    }

    CpuFeatures foreign = features_ & ~arch_mask(arch_);
    if (foreign != 0) {
        for (const auto& info : known_features()) {
            if (foreign & (CpuFeatures{1} << info.bit)) {
                return Error::configuration("CPU feature '" + std::string(info.name) +
                                            "' is not available on " + arch_to_string(arch_));
            }
        }
    }

    return std::nullopt;
}

auto TargetConfig::has_feature(std::string_view name) const -> bool {
    const FeatureInfo* info = find_feature(name);
    return info && (features_ & (CpuFeatures{1} << info->bit)) != 0;
}

auto TargetConfig::feature_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& info : known_features()) {
        if (features_ & (CpuFeatures{1} << info.bit)) {
            names.push_back(info.name);
        }
    }
    return names;
}

auto TargetConfig::to_triple() const -> std::string {
    switch (cc_) {
    case CallingConvention::SystemV:
        return "x86_64-unknown-linux-gnu";
    case CallingConvention::WindowsX64:
        return "x86_64-pc-windows-msvc";
    case CallingConvention::Aapcs64:
        return "aarch64-unknown-linux-gnu";
    case CallingConvention::AppleAarch64:
        return "arm64-apple-macosx11.0.0";
    }
    return "x86_64-unknown-linux-gnu";
}

auto TargetConfig::llvm_cpu() const -> std::string {
    return arch_ == Arch::X86_64 ? "x86-64" : "generic";
}

auto TargetConfig::llvm_features() const -> std::string {
    std::string out;
    for (const auto& info : known_features()) {
        if (info.arch != arch_ || !(features_ & (CpuFeatures{1} << info.bit))) {
            continue;
        }
        if (!out.empty()) {
            out += ",";
        }
        out += "+";
        out += info.llvm_name;
    }
    return out;
}

auto TargetConfig::object_format() const -> ObjectFormat {
    switch (cc_) {
    case CallingConvention::WindowsX64:
        return ObjectFormat::COFF;
    case CallingConvention::AppleAarch64:
        return ObjectFormat::MachO;
    default:
        return ObjectFormat::ELF;
    }
}

auto TargetConfig::to_string() const -> std::string {
    std::ostringstream oss;
    oss << arch_to_string(arch_) << "/" << cc_to_string(cc_) << "/"
        << static_cast<int>(pointer_width_) << " [";
    bool first = true;
    for (const auto& name : feature_names()) {
        if (!first)
            oss << ",";
        oss << name;
        first = false;
    }
    oss << "]";
    return oss.str();
}

} // namespace waot::target
