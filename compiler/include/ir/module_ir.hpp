//! # Module IR
//!
//! The validated-module data model the engine compiles. This is what a
//! WebAssembly frontend hands over after decoding and validation: type
//! signatures, function bodies as flat instruction lists, and the section
//! metadata (imports, exports, memories, tables, globals, segments, start).
//!
//! ## Index Spaces
//!
//! Function and global indices follow WebAssembly numbering: imported
//! entities come first, then the ones the module defines. So the first
//! defined function has index `num_imported_functions()`.
//!
//! ## Function Bodies
//!
//! A body is the instruction sequence of the function *without* the final
//! `end`. Structured control (`block`, `loop`, `if`) carries its block
//! signature inline and is closed by `End`.

#ifndef WAOT_IR_MODULE_IR_HPP
#define WAOT_IR_MODULE_IR_HPP

#include "common.hpp"
#include "common/binary_io.hpp"
#include "common/fingerprint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waot::ir {

// ============================================================================
// Value Kinds and Signatures
// ============================================================================

enum class ValueKind : uint8_t {
    I32 = 0,
    I64 = 1,
    F32 = 2,
    F64 = 3,
    Ref = 4,
    V128 = 5, ///< Representable, but no component accepts it
};

/// Key letter: i, l, f, d, r, x.
[[nodiscard]] auto value_kind_letter(ValueKind kind) -> char;
[[nodiscard]] auto value_kind_name(ValueKind kind) -> const char*;
[[nodiscard]] auto value_kind_from_letter(char c) -> std::optional<ValueKind>;

/// Function signature, compared structurally.
struct FuncSig {
    std::vector<ValueKind> params;
    std::vector<ValueKind> results;

    bool operator==(const FuncSig& other) const = default;

    /// Canonical key: parameter letters, '_', result letters; an empty list
    /// is written "v". `(i32, i64) -> f64` is "il_d".
    [[nodiscard]] auto key() const -> std::string;

    /// "(i32, i64) -> (f64)"
    [[nodiscard]] auto to_string() const -> std::string;

    /// True if any parameter or result has the given kind.
    [[nodiscard]] auto uses(ValueKind kind) const -> bool;
};

/// Parses a canonical key back into a signature.
[[nodiscard]] auto sig_from_key(std::string_view key) -> std::optional<FuncSig>;

void write_sig(ByteWriter& w, const FuncSig& sig);
[[nodiscard]] auto read_sig(ByteReader& r) -> FuncSig;

// ============================================================================
// Opcodes
// ============================================================================

// X(enum name, wasm text name)
#define WAOT_IR_OPCODES(X)                                                                         \
    X(Unreachable, "unreachable")                                                                  \
    X(Nop, "nop")                                                                                  \
    X(Block, "block")                                                                              \
    X(Loop, "loop")                                                                                \
    X(If, "if")                                                                                    \
    X(Else, "else")                                                                                \
    X(End, "end")                                                                                  \
    X(Br, "br")                                                                                    \
    X(BrIf, "br_if")                                                                               \
    X(BrTable, "br_table")                                                                         \
    X(Return, "return")                                                                            \
    X(Call, "call")                                                                                \
    X(CallIndirect, "call_indirect")                                                               \
    X(Drop, "drop")                                                                                \
    X(Select, "select")                                                                            \
    X(LocalGet, "local.get")                                                                       \
    X(LocalSet, "local.set")                                                                       \
    X(LocalTee, "local.tee")                                                                       \
    X(GlobalGet, "global.get")                                                                     \
    X(GlobalSet, "global.set")                                                                     \
    X(I32Load, "i32.load")                                                                         \
    X(I64Load, "i64.load")                                                                         \
    X(F32Load, "f32.load")                                                                         \
    X(F64Load, "f64.load")                                                                         \
    X(I32Load8S, "i32.load8_s")                                                                    \
    X(I32Load8U, "i32.load8_u")                                                                    \
    X(I32Load16S, "i32.load16_s")                                                                  \
    X(I32Load16U, "i32.load16_u")                                                                  \
    X(I64Load8S, "i64.load8_s")                                                                    \
    X(I64Load8U, "i64.load8_u")                                                                    \
    X(I64Load16S, "i64.load16_s")                                                                  \
    X(I64Load16U, "i64.load16_u")                                                                  \
    X(I64Load32S, "i64.load32_s")                                                                  \
    X(I64Load32U, "i64.load32_u")                                                                  \
    X(I32Store, "i32.store")                                                                       \
    X(I64Store, "i64.store")                                                                       \
    X(F32Store, "f32.store")                                                                       \
    X(F64Store, "f64.store")                                                                       \
    X(I32Store8, "i32.store8")                                                                     \
    X(I32Store16, "i32.store16")                                                                   \
    X(I64Store8, "i64.store8")                                                                     \
    X(I64Store16, "i64.store16")                                                                   \
    X(I64Store32, "i64.store32")                                                                   \
    X(MemorySize, "memory.size")                                                                   \
    X(MemoryGrow, "memory.grow")                                                                   \
    X(MemoryCopy, "memory.copy")                                                                   \
    X(MemoryFill, "memory.fill")                                                                   \
    X(I32Const, "i32.const")                                                                       \
    X(I64Const, "i64.const")                                                                       \
    X(F32Const, "f32.const")                                                                       \
    X(F64Const, "f64.const")                                                                       \
    X(I32Eqz, "i32.eqz")                                                                           \
    X(I32Eq, "i32.eq")                                                                             \
    X(I32Ne, "i32.ne")                                                                             \
    X(I32LtS, "i32.lt_s")                                                                          \
    X(I32LtU, "i32.lt_u")                                                                          \
    X(I32GtS, "i32.gt_s")                                                                          \
    X(I32GtU, "i32.gt_u")                                                                          \
    X(I32LeS, "i32.le_s")                                                                          \
    X(I32LeU, "i32.le_u")                                                                          \
    X(I32GeS, "i32.ge_s")                                                                          \
    X(I32GeU, "i32.ge_u")                                                                          \
    X(I64Eqz, "i64.eqz")                                                                           \
    X(I64Eq, "i64.eq")                                                                             \
    X(I64Ne, "i64.ne")                                                                             \
    X(I64LtS, "i64.lt_s")                                                                          \
    X(I64LtU, "i64.lt_u")                                                                          \
    X(I64GtS, "i64.gt_s")                                                                          \
    X(I64GtU, "i64.gt_u")                                                                          \
    X(I64LeS, "i64.le_s")                                                                          \
    X(I64LeU, "i64.le_u")                                                                          \
    X(I64GeS, "i64.ge_s")                                                                          \
    X(I64GeU, "i64.ge_u")                                                                          \
    X(F32Eq, "f32.eq")                                                                             \
    X(F32Ne, "f32.ne")                                                                             \
    X(F32Lt, "f32.lt")                                                                             \
    X(F32Gt, "f32.gt")                                                                             \
    X(F32Le, "f32.le")                                                                             \
    X(F32Ge, "f32.ge")                                                                             \
    X(F64Eq, "f64.eq")                                                                             \
    X(F64Ne, "f64.ne")                                                                             \
    X(F64Lt, "f64.lt")                                                                             \
    X(F64Gt, "f64.gt")                                                                             \
    X(F64Le, "f64.le")                                                                             \
    X(F64Ge, "f64.ge")                                                                             \
    X(I32Clz, "i32.clz")                                                                           \
    X(I32Ctz, "i32.ctz")                                                                           \
    X(I32Popcnt, "i32.popcnt")                                                                     \
    X(I32Add, "i32.add")                                                                           \
    X(I32Sub, "i32.sub")                                                                           \
    X(I32Mul, "i32.mul")                                                                           \
    X(I32DivS, "i32.div_s")                                                                        \
    X(I32DivU, "i32.div_u")                                                                        \
    X(I32RemS, "i32.rem_s")                                                                        \
    X(I32RemU, "i32.rem_u")                                                                        \
    X(I32And, "i32.and")                                                                           \
    X(I32Or, "i32.or")                                                                             \
    X(I32Xor, "i32.xor")                                                                           \
    X(I32Shl, "i32.shl")                                                                           \
    X(I32ShrS, "i32.shr_s")                                                                        \
    X(I32ShrU, "i32.shr_u")                                                                        \
    X(I32Rotl, "i32.rotl")                                                                         \
    X(I32Rotr, "i32.rotr")                                                                         \
    X(I64Clz, "i64.clz")                                                                           \
    X(I64Ctz, "i64.ctz")                                                                           \
    X(I64Popcnt, "i64.popcnt")                                                                     \
    X(I64Add, "i64.add")                                                                           \
    X(I64Sub, "i64.sub")                                                                           \
    X(I64Mul, "i64.mul")                                                                           \
    X(I64DivS, "i64.div_s")                                                                        \
    X(I64DivU, "i64.div_u")                                                                        \
    X(I64RemS, "i64.rem_s")                                                                        \
    X(I64RemU, "i64.rem_u")                                                                        \
    X(I64And, "i64.and")                                                                           \
    X(I64Or, "i64.or")                                                                             \
    X(I64Xor, "i64.xor")                                                                           \
    X(I64Shl, "i64.shl")                                                                           \
    X(I64ShrS, "i64.shr_s")                                                                        \
    X(I64ShrU, "i64.shr_u")                                                                        \
    X(I64Rotl, "i64.rotl")                                                                         \
    X(I64Rotr, "i64.rotr")                                                                         \
    X(F32Abs, "f32.abs")                                                                           \
    X(F32Neg, "f32.neg")                                                                           \
    X(F32Sqrt, "f32.sqrt")                                                                         \
    X(F32Add, "f32.add")                                                                           \
    X(F32Sub, "f32.sub")                                                                           \
    X(F32Mul, "f32.mul")                                                                           \
    X(F32Div, "f32.div")                                                                           \
    X(F32Min, "f32.min")                                                                           \
    X(F32Max, "f32.max")                                                                           \
    X(F32Copysign, "f32.copysign")                                                                 \
    X(F64Abs, "f64.abs")                                                                           \
    X(F64Neg, "f64.neg")                                                                           \
    X(F64Sqrt, "f64.sqrt")                                                                         \
    X(F64Add, "f64.add")                                                                           \
    X(F64Sub, "f64.sub")                                                                           \
    X(F64Mul, "f64.mul")                                                                           \
    X(F64Div, "f64.div")                                                                           \
    X(F64Min, "f64.min")                                                                           \
    X(F64Max, "f64.max")                                                                           \
    X(F64Copysign, "f64.copysign")                                                                 \
    X(I32WrapI64, "i32.wrap_i64")                                                                  \
    X(I32TruncF32S, "i32.trunc_f32_s")                                                             \
    X(I32TruncF32U, "i32.trunc_f32_u")                                                             \
    X(I32TruncF64S, "i32.trunc_f64_s")                                                             \
    X(I32TruncF64U, "i32.trunc_f64_u")                                                             \
    X(I64ExtendI32S, "i64.extend_i32_s")                                                           \
    X(I64ExtendI32U, "i64.extend_i32_u")                                                           \
    X(I64TruncF32S, "i64.trunc_f32_s")                                                             \
    X(I64TruncF32U, "i64.trunc_f32_u")                                                             \
    X(I64TruncF64S, "i64.trunc_f64_s")                                                             \
    X(I64TruncF64U, "i64.trunc_f64_u")                                                             \
    X(F32ConvertI32S, "f32.convert_i32_s")                                                         \
    X(F32ConvertI32U, "f32.convert_i32_u")                                                         \
    X(F32ConvertI64S, "f32.convert_i64_s")                                                         \
    X(F32ConvertI64U, "f32.convert_i64_u")                                                         \
    X(F32DemoteF64, "f32.demote_f64")                                                              \
    X(F64ConvertI32S, "f64.convert_i32_s")                                                         \
    X(F64ConvertI32U, "f64.convert_i32_u")                                                         \
    X(F64ConvertI64S, "f64.convert_i64_s")                                                         \
    X(F64ConvertI64U, "f64.convert_i64_u")                                                         \
    X(F64PromoteF32, "f64.promote_f32")                                                            \
    X(I32ReinterpretF32, "i32.reinterpret_f32")                                                    \
    X(I64ReinterpretF64, "i64.reinterpret_f64")                                                    \
    X(F32ReinterpretI32, "f32.reinterpret_i32")                                                    \
    X(F64ReinterpretI64, "f64.reinterpret_i64")                                                    \
    X(I32Extend8S, "i32.extend8_s")                                                                \
    X(I32Extend16S, "i32.extend16_s")                                                              \
    X(I64Extend8S, "i64.extend8_s")                                                                \
    X(I64Extend16S, "i64.extend16_s")                                                              \
    X(I64Extend32S, "i64.extend32_s")                                                              \
    X(RefNull, "ref.null")                                                                         \
    X(RefIsNull, "ref.is_null")                                                                    \
    X(RefFunc, "ref.func")

enum class Opcode : uint16_t {
#define WAOT_IR_OPCODE_ENUM(name, text) name,
    WAOT_IR_OPCODES(WAOT_IR_OPCODE_ENUM)
#undef WAOT_IR_OPCODE_ENUM
};

[[nodiscard]] auto opcode_name(Opcode op) -> const char*;

/// One instruction. Which fields are meaningful depends on the opcode:
///
/// | Opcode group              | Fields                                    |
/// |---------------------------|-------------------------------------------|
/// | block / loop / if         | `block_sig`                               |
/// | br / br_if                | `index` = label depth                     |
/// | br_table                  | `targets` (depths), `index` = default     |
/// | call / ref.func           | `index` = function index                  |
/// | call_indirect             | `index` = type index                      |
/// | local.* / global.*        | `index`                                   |
/// | loads / stores            | `imm` = static offset                     |
/// | *.const                   | `imm` = value bits (zero-extended)        |
struct Instr {
    Opcode op = Opcode::Nop;
    uint32_t index = 0;
    uint64_t imm = 0;
    FuncSig block_sig;
    std::vector<uint32_t> targets;

    bool operator==(const Instr& other) const = default;
};

// ============================================================================
// Module Entities
// ============================================================================

enum class ExternKind : uint8_t {
    Function = 0,
    Memory = 1,
    Table = 2,
    Global = 3,
};

[[nodiscard]] auto extern_kind_name(ExternKind kind) -> const char*;

struct Limits {
    uint32_t min = 0;
    std::optional<uint32_t> max;

    bool operator==(const Limits& other) const = default;
};

/// Linear memory, in 64 KiB pages.
struct MemoryType {
    Limits limits;

    bool operator==(const MemoryType& other) const = default;
};

/// Funcref table, in elements.
struct TableType {
    Limits limits;

    bool operator==(const TableType& other) const = default;
};

struct GlobalType {
    ValueKind kind = ValueKind::I32;
    bool is_mutable = false;

    bool operator==(const GlobalType& other) const = default;
};

void write_limits(ByteWriter& w, const Limits& limits);
[[nodiscard]] auto read_limits(ByteReader& r) -> Limits;
void write_global_type(ByteWriter& w, const GlobalType& type);
[[nodiscard]] auto read_global_type(ByteReader& r) -> GlobalType;

/// Constant initializer expression.
struct ConstExpr {
    enum class Kind : uint8_t {
        Value = 0,     ///< `bits` holds the constant
        GlobalGet = 1, ///< value of imported global `index`
        RefFunc = 2,   ///< funcref to function `index`
        RefNull = 3,
    };

    Kind kind = Kind::Value;
    uint64_t bits = 0;
    uint32_t index = 0;

    bool operator==(const ConstExpr& other) const = default;

    [[nodiscard]] static auto value(uint64_t bits) -> ConstExpr {
        return {Kind::Value, bits, 0};
    }
    [[nodiscard]] static auto global_get(uint32_t index) -> ConstExpr {
        return {Kind::GlobalGet, 0, index};
    }
    [[nodiscard]] static auto ref_func(uint32_t index) -> ConstExpr {
        return {Kind::RefFunc, 0, index};
    }
    [[nodiscard]] static auto ref_null() -> ConstExpr {
        return {Kind::RefNull, 0, 0};
    }
};

void write_const_expr(ByteWriter& w, const ConstExpr& expr);
[[nodiscard]] auto read_const_expr(ByteReader& r) -> ConstExpr;

struct Import {
    std::string module;
    std::string name;
    ExternKind kind = ExternKind::Function;
    uint32_t type_index = 0; ///< Function imports
    MemoryType memory;       ///< Memory imports
    TableType table;         ///< Table imports
    GlobalType global;       ///< Global imports
};

struct Export {
    std::string name;
    ExternKind kind = ExternKind::Function;
    uint32_t index = 0;
};

struct Function {
    uint32_t type_index = 0;
    std::vector<ValueKind> locals; ///< Declared locals, after the parameters
    std::vector<Instr> body;       ///< Without the final `end`
    std::string name;              ///< Debug name, may be empty
};

struct GlobalDef {
    GlobalType type;
    ConstExpr init;
};

/// Active data segment for memory 0.
struct DataSegment {
    ConstExpr offset;
    std::vector<uint8_t> bytes;
};

/// Active element segment for table 0. Entries are function indices.
struct ElementSegment {
    ConstExpr offset;
    std::vector<uint32_t> functions;
};

// ============================================================================
// ModuleIR
// ============================================================================

struct ModuleIR {
    std::string name;
    std::vector<FuncSig> types;
    std::vector<Import> imports;
    std::vector<Function> functions;
    std::vector<MemoryType> memories;
    std::vector<TableType> tables;
    std::vector<GlobalDef> globals;
    std::vector<Export> exports;
    std::vector<DataSegment> data;
    std::vector<ElementSegment> elements;
    std::optional<uint32_t> start;

    [[nodiscard]] auto num_imported(ExternKind kind) const -> uint32_t;

    [[nodiscard]] auto num_imported_functions() const -> uint32_t {
        return num_imported(ExternKind::Function);
    }
    [[nodiscard]] auto num_imported_globals() const -> uint32_t {
        return num_imported(ExternKind::Global);
    }

    /// Imported plus defined functions.
    [[nodiscard]] auto total_functions() const -> uint32_t;
    [[nodiscard]] auto total_globals() const -> uint32_t;
    [[nodiscard]] auto total_memories() const -> uint32_t;
    [[nodiscard]] auto total_tables() const -> uint32_t;

    /// Signature of a function-space index, or nullptr when out of range.
    [[nodiscard]] auto function_sig(uint32_t func_index) const -> const FuncSig*;

    /// Type of a global-space index, or nullptr when out of range.
    [[nodiscard]] auto global_type(uint32_t global_index) const -> const GlobalType*;

    /// The n-th import of the given kind.
    [[nodiscard]] auto imported(ExternKind kind, uint32_t n) const -> const Import*;

    /// The memory, imported or defined, if the module has one.
    [[nodiscard]] auto memory_type() const -> std::optional<MemoryType>;
    [[nodiscard]] auto table_type() const -> std::optional<TableType>;

    [[nodiscard]] auto find_export(std::string_view name) const -> const Export*;

    /// Canonical binary encoding of the whole module.
    [[nodiscard]] auto encode() const -> std::vector<uint8_t>;

    /// Fingerprint of `encode()`; the compile cache key.
    [[nodiscard]] auto content_hash() const -> Fingerprint;
};

} // namespace waot::ir

#endif // WAOT_IR_MODULE_IR_HPP
