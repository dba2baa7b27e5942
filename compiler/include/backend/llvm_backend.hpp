//! # LLVM Backend
//!
//! Compiles textual LLVM IR to relocatable object bytes in memory through
//! the LLVM C API, without external tools.
//!
//! ## Usage
//!
//! ```cpp
//! LLVMBackend backend;
//! if (!backend.initialize()) {
//!     // Handle initialization error
//! }
//!
//! LLVMCompileOptions opts;
//! opts.target_triple = target.to_triple();
//! opts.cpu = target.llvm_cpu();
//! opts.features = target.llvm_features();
//! auto result = backend.compile_ir_to_buffer(ir_string, opts);
//! ```
//!
//! ## Threading
//!
//! Target registration happens once per process. Each `LLVMBackend` owns
//! its own `LLVMContext`, so one backend per worker thread compiles in
//! parallel without sharing LLVM state.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace waot::backend {

/// Options for LLVM IR compilation.
struct LLVMCompileOptions {
    /// Optimization level (0-3).
    int optimization_level = 0;

    /// Target triple (e.g., "x86_64-unknown-linux-gnu").
    /// Empty means use native target.
    std::string target_triple;

    /// CPU name. Empty means the host CPU.
    std::string cpu;

    /// CPU features (e.g., "+sse2,+sse4.1").
    std::string features;

    /// Generate position-independent code (for shared libraries).
    bool position_independent = true;
};

/// Result of LLVM IR compilation.
struct LLVMCompileResult {
    /// Whether compilation succeeded.
    bool success = false;

    /// In-memory object data.
    std::vector<uint8_t> object_data;

    /// Error message if compilation failed.
    std::string error_message;
};

/// LLVM Backend for direct IR compilation.
class LLVMBackend {
public:
    LLVMBackend();
    ~LLVMBackend();

    // Non-copyable
    LLVMBackend(const LLVMBackend&) = delete;
    LLVMBackend& operator=(const LLVMBackend&) = delete;

    /// Registers the LLVM targets (once per process) and creates this
    /// backend's context.
    ///
    /// @return true if initialization succeeded
    [[nodiscard]] auto initialize() -> bool;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_;
    }

    /// Compile LLVM IR text to an in-memory object buffer.
    ///
    /// The module is verified first; IR that fails verification is an
    /// error, not a warning.
    ///
    /// @param ir_content The LLVM IR text content
    /// @param options Compilation options
    /// @return Compilation result with object_data populated
    [[nodiscard]] auto compile_ir_to_buffer(const std::string& ir_content,
                                            const LLVMCompileOptions& options) -> LLVMCompileResult;

    /// Get the default target triple for the host.
    [[nodiscard]] auto get_default_target_triple() const -> std::string;

    /// Get the last error message.
    [[nodiscard]] auto get_last_error() const -> const std::string& {
        return last_error_;
    }

private:
    bool initialized_ = false;
    std::string last_error_;

    // LLVM context handle (opaque pointer to LLVMContextRef)
    void* context_ = nullptr;
};

/// Check if LLVM backend is available on this system.
[[nodiscard]] auto is_llvm_backend_available() -> bool;

/// Get the LLVM version string.
[[nodiscard]] auto get_llvm_version() -> std::string;

/// LLVM feature names the host CPU supports (the '+' entries of
/// LLVMGetHostCPUFeatures, without the sign).
[[nodiscard]] auto host_cpu_features() -> std::vector<std::string>;

} // namespace waot::backend
