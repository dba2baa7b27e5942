//! # LLVM Function Code Generator
//!
//! Lowers one wasm function body to LLVM IR text and compiles it with the
//! LLVM backend.
//!
//! ## Lowering Model
//!
//! - Locals, block results and loop parameters live in entry-block
//!   allocas; there are no phis. `mem2reg` cleans this up at -O1 and up.
//! - Each structured construct pushes a `Frame` with its branch target and
//!   result slots. Branches store the carried values into the target's
//!   slots and jump.
//! - Instructions after an unconditional transfer are skipped until the
//!   `else`/`end` closing the current frame.
//! - Every trap check branches to one shared block per trap code that
//!   calls the `RaiseTrap` libcall and ends in `unreachable`.
//!
//! ## Function ABI
//!
//! `ret waot_func_<i>(i8* vmctx, params...)` where `ret` is void, the
//! single result, or a literal struct of the results.

#pragma once

#include "backend/llvm_backend.hpp"
#include "codegen/code_generator.hpp"
#include "codegen/ir_writer.hpp"
#include "runtime/trap.hpp"
#include "runtime/vmcontext.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace waot::codegen {

/// IR and call summary of one lowered function.
struct LoweredFunction {
    std::string ir;
    std::string symbol;
    std::vector<uint32_t> import_calls;
    std::vector<uint32_t> libcalls;
};

/// Lowers a single function. One-shot: construct, call `lower()` once.
class FunctionLowering {
public:
    FunctionLowering(const ir::ModuleIR& module, uint32_t func_index,
                     const target::TargetConfig& target, const CodegenOptions& options);

    [[nodiscard]] auto lower() -> Result<LoweredFunction, Error>;

private:
    struct StackValue {
        std::string reg; ///< Register or literal operand
        ir::ValueKind kind;
    };

    enum class FrameKind { Function, Block, Loop, If };

    struct Frame {
        FrameKind kind;
        ir::FuncSig sig;
        std::string branch_label; ///< Loop header, or the end label
        std::string end_label;
        std::string else_label;              ///< If only
        std::vector<std::string> result_slots;
        std::vector<std::string> param_slots; ///< Loop only
        std::vector<StackValue> if_params;    ///< If only, re-pushed at else
        size_t stack_height = 0;
        bool unreachable = false;
        bool has_else = false;
    };

    const ir::ModuleIR& module_;
    uint32_t func_index_;
    const target::TargetConfig& target_;
    const CodegenOptions& options_;
    const ir::Function* func_ = nullptr;
    const ir::FuncSig* sig_ = nullptr;

    IRWriter w_;
    std::vector<StackValue> stack_;
    std::vector<Frame> frames_;
    std::vector<std::string> local_slots_;
    std::vector<ir::ValueKind> local_kinds_;
    std::map<runtime::TrapCode, std::string> trap_labels_;
    std::set<uint32_t> import_calls_;
    std::set<uint32_t> libcalls_;
    uint32_t skip_depth_ = 0;
    std::optional<std::string> error_;
    size_t instr_index_ = 0;

    // ---- driver (llvm_codegen.cpp) ----
    void fail(const std::string& message);
    [[nodiscard]] auto failed() const -> bool {
        return error_.has_value();
    }
    void emit_prologue();
    void emit_trap_blocks();
    auto function_signature() const -> std::string;
    void lower_instr(const ir::Instr& instr);
    auto check_features(const ir::Instr& instr) -> bool;

    // ---- value stack ----
    void push(std::string reg, ir::ValueKind kind);
    auto pop() -> StackValue;
    auto pop_n(size_t n) -> std::vector<StackValue>;
    auto top_n(size_t n) -> std::vector<StackValue>;

    // ---- control ----
    void push_frame(FrameKind kind, const ir::FuncSig& sig);
    void lower_block(const ir::Instr& instr);
    void lower_loop(const ir::Instr& instr);
    void lower_if(const ir::Instr& instr);
    void lower_else();
    void lower_end();
    void lower_br(uint32_t depth);
    void lower_br_if(uint32_t depth);
    void lower_br_table(const ir::Instr& instr);
    void lower_return();
    void mark_unreachable();
    auto frame_at(uint32_t depth) -> Frame*;
    auto branch_kinds(const Frame& frame) const -> const std::vector<ir::ValueKind>&;
    auto branch_slots(const Frame& frame) const -> const std::vector<std::string>&;
    void store_to_slots(const std::vector<std::string>& slots, const std::vector<StackValue>& values);
    auto alloc_slots(const std::vector<ir::ValueKind>& kinds) -> std::vector<std::string>;
    void load_from_slots(const std::vector<std::string>& slots,
                         const std::vector<ir::ValueKind>& kinds);
    void emit_function_return();

    // ---- calls ----
    void lower_call(uint32_t callee);
    void lower_call_indirect(uint32_t type_index);
    void emit_call_results(const std::string& call_expr, const std::vector<ir::ValueKind>& results);
    auto call_args(const ir::FuncSig& sig) -> std::string;
    auto libcall_callee(runtime::LibCall call) -> std::string;
    void call_libcall(runtime::LibCall call, const std::vector<StackValue>& args,
                      bool has_result);

    // ---- variables and memory ----
    void lower_local(const ir::Instr& instr);
    void lower_global(const ir::Instr& instr);
    auto global_cell(uint32_t global_index) -> std::string;
    auto lower_memory(const ir::Instr& instr) -> bool;
    auto heap_address(const std::string& addr, uint64_t offset, uint32_t size) -> std::string;
    void lower_memory_size();
    void lower_ref(const ir::Instr& instr);

    // ---- vmctx access ----
    auto load_ptr_at(const std::string& base, uint32_t offset) -> std::string;
    auto load_i64_at(const std::string& base, uint32_t offset) -> std::string;
    auto gep(const std::string& base, const std::string& offset) -> std::string;

    // ---- traps ----
    auto trap_label(runtime::TrapCode code) -> std::string;
    void trap_if(const std::string& cond, runtime::TrapCode code);

    // ---- numeric (llvm_codegen_ops.cpp) ----
    auto lower_numeric(const ir::Instr& instr) -> bool;
    void lower_const(const ir::Instr& instr);
    void lower_int_binary(const std::string& op, ir::ValueKind kind);
    void lower_int_compare(const std::string& pred, ir::ValueKind kind);
    void lower_float_compare(const std::string& pred, ir::ValueKind kind);
    void lower_shift(const std::string& op, ir::ValueKind kind);
    void lower_rotate(const std::string& intrinsic, ir::ValueKind kind);
    void lower_div(bool is_signed, bool is_rem, ir::ValueKind kind);
    void lower_bit_count(const std::string& intrinsic, ir::ValueKind kind, bool has_flag);
    void lower_float_binary(const std::string& op, ir::ValueKind kind);
    void lower_float_unary_intrinsic(const std::string& intrinsic, ir::ValueKind kind);
    void lower_float_minmax(bool is_min, ir::ValueKind kind);
    void lower_copysign(ir::ValueKind kind);
    void lower_cast(const std::string& op, ir::ValueKind from, ir::ValueKind to);
    void lower_trunc(ir::ValueKind from, ir::ValueKind to, bool is_signed);
    void lower_sign_extend(ir::ValueKind kind, uint32_t bits);
    void lower_select();
    auto declare_intrinsic(const std::string& name, const std::string& ret,
                           const std::string& params) -> std::string;
};

/// Converts a 64-bit slot value (i64 register or literal) to a typed value.
/// Emits into `w`; returns the result register.
auto slot_to_value(IRWriter& w, const std::string& slot, ir::ValueKind kind) -> std::string;

/// Converts a typed value to its 64-bit slot encoding.
auto value_to_slot(IRWriter& w, const std::string& value, ir::ValueKind kind) -> std::string;

/// LLVM hex literal of a double, usable for float and double operands
/// when the value is exactly representable.
[[nodiscard]] auto llvm_fp_literal(double value) -> std::string;

/// `CodeGenerator` backed by the LLVM C API.
class LLVMCodeGenerator : public CodeGenerator {
public:
    LLVMCodeGenerator();

    auto name() const -> std::string_view override {
        return "llvm";
    }

    auto compile_function(const ir::ModuleIR& module, uint32_t func_index,
                          const target::TargetConfig& target, const CodegenOptions& options)
        -> Result<CodegenOutput, Error> override;

private:
    backend::LLVMBackend backend_;
};

} // namespace waot::codegen
