//! # Module Builder
//!
//! Convenience API for assembling a `ModuleIR` by hand, used by embedders
//! that produce modules programmatically and throughout the tests.
//!
//! ```cpp
//! ir::ModuleBuilder b("math");
//! auto add = b.add_function({{ValueKind::I32, ValueKind::I32}, {ValueKind::I32}}, {},
//!                           {op::local_get(0), op::local_get(1), op::instr(Opcode::I32Add)});
//! b.export_function("add", add);
//! ir::ModuleIR module = b.build();
//! ```
//!
//! The builder does not validate; the artifact compiler does.

#pragma once

#include "ir/module_ir.hpp"

namespace waot::ir {

class ModuleBuilder {
public:
    explicit ModuleBuilder(std::string name);

    /// Returns the index of `sig` in the type section, adding it if new.
    auto add_type(const FuncSig& sig) -> uint32_t;

    /// Imports must be added before the first defined function/global so
    /// the returned indices stay valid.
    auto import_function(std::string module, std::string name, const FuncSig& sig) -> uint32_t;
    void import_memory(std::string module, std::string name, Limits limits);
    void import_table(std::string module, std::string name, Limits limits);
    auto import_global(std::string module, std::string name, GlobalType type) -> uint32_t;

    /// Adds a defined function; returns its function-space index.
    auto add_function(const FuncSig& sig, std::vector<ValueKind> locals, std::vector<Instr> body,
                      std::string name = {}) -> uint32_t;

    void add_memory(Limits limits);
    void add_table(Limits limits);

    /// Adds a defined global; returns its global-space index.
    auto add_global(GlobalType type, ConstExpr init) -> uint32_t;

    void export_function(std::string name, uint32_t func_index);
    void export_memory(std::string name);
    void export_table(std::string name);
    void export_global(std::string name, uint32_t global_index);

    void add_data(uint32_t offset, std::vector<uint8_t> bytes);
    void add_data(ConstExpr offset, std::vector<uint8_t> bytes);
    void add_element(uint32_t offset, std::vector<uint32_t> functions);

    void set_start(uint32_t func_index);

    [[nodiscard]] auto module() const -> const ModuleIR& {
        return module_;
    }

    /// Returns the finished module; the builder is left empty.
    [[nodiscard]] auto build() -> ModuleIR;

private:
    ModuleIR module_;
};

// ============================================================================
// Instruction Helpers
// ============================================================================

namespace op {

[[nodiscard]] auto instr(Opcode op) -> Instr;

[[nodiscard]] auto i32_const(int32_t value) -> Instr;
[[nodiscard]] auto i64_const(int64_t value) -> Instr;
[[nodiscard]] auto f32_const(float value) -> Instr;
[[nodiscard]] auto f64_const(double value) -> Instr;

[[nodiscard]] auto local_get(uint32_t index) -> Instr;
[[nodiscard]] auto local_set(uint32_t index) -> Instr;
[[nodiscard]] auto local_tee(uint32_t index) -> Instr;
[[nodiscard]] auto global_get(uint32_t index) -> Instr;
[[nodiscard]] auto global_set(uint32_t index) -> Instr;

[[nodiscard]] auto block(FuncSig sig = {}) -> Instr;
[[nodiscard]] auto loop(FuncSig sig = {}) -> Instr;
[[nodiscard]] auto if_(FuncSig sig = {}) -> Instr;
[[nodiscard]] auto else_() -> Instr;
[[nodiscard]] auto end() -> Instr;

[[nodiscard]] auto br(uint32_t depth) -> Instr;
[[nodiscard]] auto br_if(uint32_t depth) -> Instr;
[[nodiscard]] auto br_table(std::vector<uint32_t> depths, uint32_t default_depth) -> Instr;

[[nodiscard]] auto call(uint32_t func_index) -> Instr;
[[nodiscard]] auto call_indirect(uint32_t type_index) -> Instr;
[[nodiscard]] auto ref_func(uint32_t func_index) -> Instr;

/// Memory access with a static offset; `op` must be a load or store.
[[nodiscard]] auto mem(Opcode op, uint64_t offset = 0) -> Instr;

} // namespace op

} // namespace waot::ir
