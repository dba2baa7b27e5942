#include "ir/module_builder.hpp"

#include <cstring>

namespace waot::ir {

ModuleBuilder::ModuleBuilder(std::string name) {
    module_.name = std::move(name);
}

auto ModuleBuilder::add_type(const FuncSig& sig) -> uint32_t {
    for (size_t i = 0; i < module_.types.size(); ++i) {
        if (module_.types[i] == sig) {
            return static_cast<uint32_t>(i);
        }
    }
    module_.types.push_back(sig);
    return static_cast<uint32_t>(module_.types.size() - 1);
}

auto ModuleBuilder::import_function(std::string module, std::string name, const FuncSig& sig)
    -> uint32_t {
    Import imp;
    imp.module = std::move(module);
    imp.name = std::move(name);
    imp.kind = ExternKind::Function;
    imp.type_index = add_type(sig);
    uint32_t index = module_.num_imported_functions();
    module_.imports.push_back(std::move(imp));
    return index;
}

void ModuleBuilder::import_memory(std::string module, std::string name, Limits limits) {
    Import imp;
    imp.module = std::move(module);
    imp.name = std::move(name);
    imp.kind = ExternKind::Memory;
    imp.memory.limits = limits;
    module_.imports.push_back(std::move(imp));
}

void ModuleBuilder::import_table(std::string module, std::string name, Limits limits) {
    Import imp;
    imp.module = std::move(module);
    imp.name = std::move(name);
    imp.kind = ExternKind::Table;
    imp.table.limits = limits;
    module_.imports.push_back(std::move(imp));
}

auto ModuleBuilder::import_global(std::string module, std::string name, GlobalType type)
    -> uint32_t {
    Import imp;
    imp.module = std::move(module);
    imp.name = std::move(name);
    imp.kind = ExternKind::Global;
    imp.global = type;
    uint32_t index = module_.num_imported_globals();
    module_.imports.push_back(std::move(imp));
    return index;
}

auto ModuleBuilder::add_function(const FuncSig& sig, std::vector<ValueKind> locals,
                                 std::vector<Instr> body, std::string name) -> uint32_t {
    Function func;
    func.type_index = add_type(sig);
    func.locals = std::move(locals);
    func.body = std::move(body);
    func.name = std::move(name);
    module_.functions.push_back(std::move(func));
    return module_.total_functions() - 1;
}

void ModuleBuilder::add_memory(Limits limits) {
    module_.memories.push_back(MemoryType{limits});
}

void ModuleBuilder::add_table(Limits limits) {
    module_.tables.push_back(TableType{limits});
}

auto ModuleBuilder::add_global(GlobalType type, ConstExpr init) -> uint32_t {
    module_.globals.push_back(GlobalDef{type, init});
    return module_.total_globals() - 1;
}

void ModuleBuilder::export_function(std::string name, uint32_t func_index) {
    module_.exports.push_back(Export{std::move(name), ExternKind::Function, func_index});
}

void ModuleBuilder::export_memory(std::string name) {
    module_.exports.push_back(Export{std::move(name), ExternKind::Memory, 0});
}

void ModuleBuilder::export_table(std::string name) {
    module_.exports.push_back(Export{std::move(name), ExternKind::Table, 0});
}

void ModuleBuilder::export_global(std::string name, uint32_t global_index) {
    module_.exports.push_back(Export{std::move(name), ExternKind::Global, global_index});
}

void ModuleBuilder::add_data(uint32_t offset, std::vector<uint8_t> bytes) {
    add_data(ConstExpr::value(offset), std::move(bytes));
}

void ModuleBuilder::add_data(ConstExpr offset, std::vector<uint8_t> bytes) {
    module_.data.push_back(DataSegment{offset, std::move(bytes)});
}

void ModuleBuilder::add_element(uint32_t offset, std::vector<uint32_t> functions) {
    module_.elements.push_back(ElementSegment{ConstExpr::value(offset), std::move(functions)});
}

void ModuleBuilder::set_start(uint32_t func_index) {
    module_.start = func_index;
}

auto ModuleBuilder::build() -> ModuleIR {
    ModuleIR out = std::move(module_);
    module_ = ModuleIR{};
    return out;
}

// ============================================================================
// Instruction Helpers
// ============================================================================

namespace op {

auto instr(Opcode op) -> Instr {
    Instr i;
    i.op = op;
    return i;
}

static auto with_index(Opcode op, uint32_t index) -> Instr {
    Instr i;
    i.op = op;
    i.index = index;
    return i;
}

static auto with_imm(Opcode op, uint64_t imm) -> Instr {
    Instr i;
    i.op = op;
    i.imm = imm;
    return i;
}

static auto with_sig(Opcode op, FuncSig sig) -> Instr {
    Instr i;
    i.op = op;
    i.block_sig = std::move(sig);
    return i;
}

auto i32_const(int32_t value) -> Instr {
    return with_imm(Opcode::I32Const, static_cast<uint32_t>(value));
}

auto i64_const(int64_t value) -> Instr {
    return with_imm(Opcode::I64Const, static_cast<uint64_t>(value));
}

auto f32_const(float value) -> Instr {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return with_imm(Opcode::F32Const, bits);
}

auto f64_const(double value) -> Instr {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return with_imm(Opcode::F64Const, bits);
}

auto local_get(uint32_t index) -> Instr {
    return with_index(Opcode::LocalGet, index);
}
auto local_set(uint32_t index) -> Instr {
    return with_index(Opcode::LocalSet, index);
}
auto local_tee(uint32_t index) -> Instr {
    return with_index(Opcode::LocalTee, index);
}
auto global_get(uint32_t index) -> Instr {
    return with_index(Opcode::GlobalGet, index);
}
auto global_set(uint32_t index) -> Instr {
    return with_index(Opcode::GlobalSet, index);
}

auto block(FuncSig sig) -> Instr {
    return with_sig(Opcode::Block, std::move(sig));
}
auto loop(FuncSig sig) -> Instr {
    return with_sig(Opcode::Loop, std::move(sig));
}
auto if_(FuncSig sig) -> Instr {
    return with_sig(Opcode::If, std::move(sig));
}
auto else_() -> Instr {
    return instr(Opcode::Else);
}
auto end() -> Instr {
    return instr(Opcode::End);
}

auto br(uint32_t depth) -> Instr {
    return with_index(Opcode::Br, depth);
}
auto br_if(uint32_t depth) -> Instr {
    return with_index(Opcode::BrIf, depth);
}

auto br_table(std::vector<uint32_t> depths, uint32_t default_depth) -> Instr {
    Instr i = with_index(Opcode::BrTable, default_depth);
    i.targets = std::move(depths);
    return i;
}

auto call(uint32_t func_index) -> Instr {
    return with_index(Opcode::Call, func_index);
}
auto call_indirect(uint32_t type_index) -> Instr {
    return with_index(Opcode::CallIndirect, type_index);
}
auto ref_func(uint32_t func_index) -> Instr {
    return with_index(Opcode::RefFunc, func_index);
}

auto mem(Opcode op, uint64_t offset) -> Instr {
    return with_imm(op, offset);
}

} // namespace op

} // namespace waot::ir
