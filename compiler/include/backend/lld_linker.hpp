//! # LLD Linker Interface
//!
//! Wraps LLD (LLVM's linker) to turn relocatable objects into the shared
//! library that carries an artifact.
//!
//! ## Supported Formats
//!
//! | Format | Linker      | Fallback          |
//! |--------|-------------|-------------------|
//! | COFF   | lld-link    | none              |
//! | ELF    | ld.lld      | system `ld`       |
//! | Mach-O | ld64.lld    | system `ld`       |
//!
//! The linker binary is looked up in `WAOT_LLD` (an exact path), then
//! `$LLVM_DIR/bin`, the usual LLVM install directories and `PATH`.
//!
//! ## Usage
//!
//! ```cpp
//! LLDLinker linker;
//! if (!linker.initialize(target::ObjectFormat::ELF)) {
//!     // Handle error - no linker found
//! }
//!
//! LLDLinkOptions opts;
//! auto result = linker.link({obj1, obj2}, "module.so", opts);
//! ```

#pragma once

#include "target/target.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace waot::backend {

/// Options for LLD linking. Artifacts are self-contained: no C library
/// and no other libraries are linked.
struct LLDLinkOptions {
    /// Additional linker flags.
    std::vector<std::string> extra_flags;

    /// Target architecture, used for the Mach-O `-arch` and COFF `/MACHINE`.
    target::Arch arch = target::Arch::X86_64;
};

/// Result of LLD linking.
struct LLDLinkResult {
    /// Whether linking succeeded.
    bool success = false;

    /// Path to the output file.
    fs::path output_file;

    /// Error message if linking failed, including the linker's stderr.
    std::string error_message;
};

/// LLD Linker wrapper producing shared libraries.
class LLDLinker {
public:
    LLDLinker();
    ~LLDLinker() = default;

    // Non-copyable
    LLDLinker(const LLDLinker&) = delete;
    LLDLinker& operator=(const LLDLinker&) = delete;

    /// Finds a linker for the given object format.
    /// @return true if a linker was found
    [[nodiscard]] auto initialize(target::ObjectFormat format) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_;
    }

    /// Link object files into a shared library.
    [[nodiscard]] auto link(const std::vector<fs::path>& object_files, const fs::path& output_path,
                            const LLDLinkOptions& options) -> LLDLinkResult;

    /// Path to the linker executable being used.
    [[nodiscard]] auto get_lld_path() const -> const fs::path& {
        return lld_path_;
    }

    /// True if the platform linker is used instead of LLD.
    [[nodiscard]] auto is_fallback() const -> bool {
        return fallback_;
    }

    [[nodiscard]] auto get_last_error() const -> const std::string& {
        return last_error_;
    }

private:
    bool initialized_ = false;
    bool fallback_ = false;
    target::ObjectFormat format_ = target::ObjectFormat::ELF;
    fs::path lld_path_;
    std::string last_error_;

    auto find_lld() -> bool;

    auto build_coff_args(const std::vector<fs::path>& object_files, const fs::path& output_path,
                         const LLDLinkOptions& options) -> std::vector<std::string>;

    auto build_elf_args(const std::vector<fs::path>& object_files, const fs::path& output_path,
                        const LLDLinkOptions& options) -> std::vector<std::string>;

    auto build_macho_args(const std::vector<fs::path>& object_files, const fs::path& output_path,
                          const LLDLinkOptions& options) -> std::vector<std::string>;

    /// Join argv into a single command string for subprocess execution.
    static auto join_args(const std::vector<std::string>& args) -> std::string;
};

/// Check if a linker for the host object format is available.
[[nodiscard]] auto is_lld_available() -> bool;

} // namespace waot::backend
