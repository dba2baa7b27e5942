//! # Code Generator Interface
//!
//! The collaborator that turns one validated function body into a
//! relocatable object. The artifact compiler only talks to this interface,
//! so embedders can plug in another backend through
//! `Builder::code_generator`.
//!
//! ## Architecture
//!
//! ```text
//!     CodeGenerator (abstract)
//!     └── compile_function()  → CodegenOutput (object bytes + call summary)
//!            │
//!     LLVMCodeGenerator (IR text → LLVM C API → object)
//! ```
//!
//! ## Symbols
//!
//! | Symbol                | Defined by                         |
//! |-----------------------|------------------------------------|
//! | `waot_func_<index>`   | one per defined function           |
//! | `waot_h2w_<sig key>`  | host-calls-wasm trampoline         |
//! | `waot_w2h_<sig key>`  | wasm-calls-host trampoline         |
//! | `waot_metadata`       | artifact metadata blob             |
//!
//! A function object may only reference other `waot_func_*` symbols and
//! `waot_w2h_*` trampolines; everything else must be defined in the object.
//! Generator instances are used by one thread at a time; the compiler
//! creates one per worker through the factory.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "ir/module_ir.hpp"
#include "target/target.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace waot::codegen {

constexpr std::string_view FUNCTION_SYMBOL_PREFIX = "waot_func_";
constexpr std::string_view H2W_SYMBOL_PREFIX = "waot_h2w_";
constexpr std::string_view W2H_SYMBOL_PREFIX = "waot_w2h_";
constexpr std::string_view METADATA_SYMBOL = "waot_metadata";

[[nodiscard]] auto function_symbol(uint32_t func_index) -> std::string;
[[nodiscard]] auto h2w_symbol(const ir::FuncSig& sig) -> std::string;
[[nodiscard]] auto w2h_symbol(const ir::FuncSig& sig) -> std::string;

/// Options for one function compile.
struct CodegenOptions {
    int optimization_level = 2;
    target::WasmFeatures features;

    /// Bodies longer than this many instructions are rejected.
    uint32_t max_function_instructions = 1u << 20;
};

/// Result of compiling one function.
struct CodegenOutput {
    std::vector<uint8_t> object; ///< Relocatable object bytes
    std::string symbol;          ///< Symbol of the function in `object`
    std::vector<uint32_t> import_calls; ///< Imported functions called, ascending
    std::vector<uint32_t> libcalls;     ///< `runtime::LibCall`s called, ascending
    std::string ir;                     ///< Generator-specific listing, may be empty
};

/// Abstract behavior for function code generators.
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;

    /// Generator name (e.g. "llvm").
    virtual auto name() const -> std::string_view = 0;

    /// Compiles defined function `func_index` (function-space index).
    /// Failures are `ErrorKind::Compile` errors naming the function.
    virtual auto compile_function(const ir::ModuleIR& module, uint32_t func_index,
                                  const target::TargetConfig& target,
                                  const CodegenOptions& options)
        -> Result<CodegenOutput, Error> = 0;
};

using CodeGeneratorFactory = std::function<Box<CodeGenerator>()>;

/// Factory producing `LLVMCodeGenerator`s.
[[nodiscard]] auto default_code_generator_factory() -> CodeGeneratorFactory;

} // namespace waot::codegen
