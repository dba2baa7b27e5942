//! # LLVM IR Text Writer
//!
//! Small helper shared by everything that produces LLVM IR text: the
//! function code generator, the trampoline generator and the metadata
//! object writer.
//!
//! | Method             | Returns / effect                           |
//! |--------------------|--------------------------------------------|
//! | `fresh_reg`        | Unique register (`%t0`, `%t1`)             |
//! | `fresh_label`      | Unique label (`block0`, `trap3`)           |
//! | `emit_line`        | Appends one line to the body               |
//! | `emit_alloca`      | Hoists an alloca into the entry block      |
//! | `declare`          | Records a declaration (deduplicated)       |
//! | `finish`           | Assembles header, function, declarations   |
//!
//! Pointers are written as typed pointers with explicit bitcasts, which
//! parse both with typed-pointer LLVM and with opaque-pointer LLVM.

#pragma once

#include "ir/module_ir.hpp"

#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace waot::codegen {

/// LLVM type of a value kind: i32, i64, float, double, i8* (ref).
[[nodiscard]] auto llvm_value_type(ir::ValueKind kind) -> std::string;

/// LLVM return type: void, the single result, or a literal struct.
[[nodiscard]] auto llvm_return_type(const std::vector<ir::ValueKind>& results) -> std::string;

/// LLVM function type of a wasm function: `ret (i8*, params...)`.
[[nodiscard]] auto llvm_wasm_fn_type(const ir::FuncSig& sig) -> std::string;

/// Escapes bytes as an LLVM `c"..."` string body.
[[nodiscard]] auto llvm_escape_bytes(const std::vector<uint8_t>& bytes) -> std::string;

class IRWriter {
public:
    IRWriter() = default;

    auto fresh_reg() -> std::string;
    auto fresh_label(const std::string& prefix = "L") -> std::string;

    void emit(const std::string& code);
    void emit_line(const std::string& code);

    /// Starts a basic block.
    void emit_label(const std::string& label);

    /// Emits an alloca in the entry block; returns the pointer register.
    auto emit_alloca(const std::string& type) -> std::string;

    /// Records a declaration keyed by symbol; later duplicates are ignored.
    void declare(const std::string& symbol, const std::string& declaration);

    /// Adds a module-level line (globals) placed before the function.
    void emit_global(const std::string& line);

    /// Assembles the module: header lines, globals, the function whose
    /// body was emitted (entry allocas first), declarations, attributes.
    ///
    /// @param signature  "define i32 @name(i8* %vmctx, i32 %p0) #0"
    [[nodiscard]] auto finish(const std::string& module_id, const std::string& signature) const
        -> std::string;

    /// Assembles a module without a function.
    [[nodiscard]] auto finish_module(const std::string& module_id) const -> std::string;

    /// Number of lines emitted into the body so far.
    [[nodiscard]] auto line_count() const -> size_t {
        return line_count_;
    }

private:
    std::ostringstream body_;
    std::vector<std::string> entry_allocas_;
    std::vector<std::string> globals_;
    std::map<std::string, std::string> declarations_;
    uint32_t temp_counter_ = 0;
    uint32_t label_counter_ = 0;
    size_t line_count_ = 0;
};

} // namespace waot::codegen
