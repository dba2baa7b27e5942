//! # LLVM Function Code Generator: Numeric Instructions
//!
//! Constants, comparisons, integer and float arithmetic, conversions and
//! `select`. Every instruction that can trap in wasm gets an explicit check
//! in front of the LLVM instruction, since LLVM leaves those cases
//! undefined.

#include "codegen/llvm_codegen.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>

namespace waot::codegen {

using ir::Opcode;
using ir::ValueKind;
using runtime::TrapCode;

auto llvm_fp_literal(double value) -> std::string {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%016" PRIX64, bits);
    return buf;
}

static auto int_bits(ValueKind kind) -> uint32_t {
    return kind == ValueKind::I64 ? 64 : 32;
}

static auto intrinsic_suffix(ValueKind kind) -> std::string {
    switch (kind) {
    case ValueKind::I32:
        return "i32";
    case ValueKind::I64:
        return "i64";
    case ValueKind::F32:
        return "f32";
    case ValueKind::F64:
        return "f64";
    default:
        return "i64";
    }
}

static auto int_for_float(ValueKind kind) -> std::string {
    return kind == ValueKind::F32 ? "i32" : "i64";
}

auto FunctionLowering::declare_intrinsic(const std::string& name, const std::string& ret,
                                         const std::string& params) -> std::string {
    w_.declare(name, "declare " + ret + " @" + name + "(" + params + ")");
    return "@" + name;
}

// ============================================================================
// Dispatch
// ============================================================================

auto FunctionLowering::lower_numeric(const ir::Instr& instr) -> bool {
    constexpr auto I32 = ValueKind::I32;
    constexpr auto I64 = ValueKind::I64;
    constexpr auto F32 = ValueKind::F32;
    constexpr auto F64 = ValueKind::F64;

    switch (instr.op) {
    case Opcode::I32Const:
    case Opcode::I64Const:
    case Opcode::F32Const:
    case Opcode::F64Const:
        lower_const(instr);
        return true;

    // Integer comparisons
    case Opcode::I32Eqz:
    case Opcode::I64Eqz: {
        ValueKind kind = instr.op == Opcode::I32Eqz ? I32 : I64;
        StackValue a = pop();
        std::string c = w_.fresh_reg();
        w_.emit_line("  " + c + " = icmp eq " + llvm_value_type(kind) + " " + a.reg + ", 0");
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = zext i1 " + c + " to i32");
        push(r, I32);
        return true;
    }
    case Opcode::I32Eq: lower_int_compare("eq", I32); return true;
    case Opcode::I32Ne: lower_int_compare("ne", I32); return true;
    case Opcode::I32LtS: lower_int_compare("slt", I32); return true;
    case Opcode::I32LtU: lower_int_compare("ult", I32); return true;
    case Opcode::I32GtS: lower_int_compare("sgt", I32); return true;
    case Opcode::I32GtU: lower_int_compare("ugt", I32); return true;
    case Opcode::I32LeS: lower_int_compare("sle", I32); return true;
    case Opcode::I32LeU: lower_int_compare("ule", I32); return true;
    case Opcode::I32GeS: lower_int_compare("sge", I32); return true;
    case Opcode::I32GeU: lower_int_compare("uge", I32); return true;
    case Opcode::I64Eq: lower_int_compare("eq", I64); return true;
    case Opcode::I64Ne: lower_int_compare("ne", I64); return true;
    case Opcode::I64LtS: lower_int_compare("slt", I64); return true;
    case Opcode::I64LtU: lower_int_compare("ult", I64); return true;
    case Opcode::I64GtS: lower_int_compare("sgt", I64); return true;
    case Opcode::I64GtU: lower_int_compare("ugt", I64); return true;
    case Opcode::I64LeS: lower_int_compare("sle", I64); return true;
    case Opcode::I64LeU: lower_int_compare("ule", I64); return true;
    case Opcode::I64GeS: lower_int_compare("sge", I64); return true;
    case Opcode::I64GeU: lower_int_compare("uge", I64); return true;

    // Float comparisons (ne is unordered so NaN != NaN holds)
    case Opcode::F32Eq: lower_float_compare("oeq", F32); return true;
    case Opcode::F32Ne: lower_float_compare("une", F32); return true;
    case Opcode::F32Lt: lower_float_compare("olt", F32); return true;
    case Opcode::F32Gt: lower_float_compare("ogt", F32); return true;
    case Opcode::F32Le: lower_float_compare("ole", F32); return true;
    case Opcode::F32Ge: lower_float_compare("oge", F32); return true;
    case Opcode::F64Eq: lower_float_compare("oeq", F64); return true;
    case Opcode::F64Ne: lower_float_compare("une", F64); return true;
    case Opcode::F64Lt: lower_float_compare("olt", F64); return true;
    case Opcode::F64Gt: lower_float_compare("ogt", F64); return true;
    case Opcode::F64Le: lower_float_compare("ole", F64); return true;
    case Opcode::F64Ge: lower_float_compare("oge", F64); return true;

    // Integer arithmetic
    case Opcode::I32Clz: lower_bit_count("ctlz", I32, true); return true;
    case Opcode::I32Ctz: lower_bit_count("cttz", I32, true); return true;
    case Opcode::I32Popcnt: lower_bit_count("ctpop", I32, false); return true;
    case Opcode::I32Add: lower_int_binary("add", I32); return true;
    case Opcode::I32Sub: lower_int_binary("sub", I32); return true;
    case Opcode::I32Mul: lower_int_binary("mul", I32); return true;
    case Opcode::I32DivS: lower_div(true, false, I32); return true;
    case Opcode::I32DivU: lower_div(false, false, I32); return true;
    case Opcode::I32RemS: lower_div(true, true, I32); return true;
    case Opcode::I32RemU: lower_div(false, true, I32); return true;
    case Opcode::I32And: lower_int_binary("and", I32); return true;
    case Opcode::I32Or: lower_int_binary("or", I32); return true;
    case Opcode::I32Xor: lower_int_binary("xor", I32); return true;
    case Opcode::I32Shl: lower_shift("shl", I32); return true;
    case Opcode::I32ShrS: lower_shift("ashr", I32); return true;
    case Opcode::I32ShrU: lower_shift("lshr", I32); return true;
    case Opcode::I32Rotl: lower_rotate("fshl", I32); return true;
    case Opcode::I32Rotr: lower_rotate("fshr", I32); return true;
    case Opcode::I64Clz: lower_bit_count("ctlz", I64, true); return true;
    case Opcode::I64Ctz: lower_bit_count("cttz", I64, true); return true;
    case Opcode::I64Popcnt: lower_bit_count("ctpop", I64, false); return true;
    case Opcode::I64Add: lower_int_binary("add", I64); return true;
    case Opcode::I64Sub: lower_int_binary("sub", I64); return true;
    case Opcode::I64Mul: lower_int_binary("mul", I64); return true;
    case Opcode::I64DivS: lower_div(true, false, I64); return true;
    case Opcode::I64DivU: lower_div(false, false, I64); return true;
    case Opcode::I64RemS: lower_div(true, true, I64); return true;
    case Opcode::I64RemU: lower_div(false, true, I64); return true;
    case Opcode::I64And: lower_int_binary("and", I64); return true;
    case Opcode::I64Or: lower_int_binary("or", I64); return true;
    case Opcode::I64Xor: lower_int_binary("xor", I64); return true;
    case Opcode::I64Shl: lower_shift("shl", I64); return true;
    case Opcode::I64ShrS: lower_shift("ashr", I64); return true;
    case Opcode::I64ShrU: lower_shift("lshr", I64); return true;
    case Opcode::I64Rotl: lower_rotate("fshl", I64); return true;
    case Opcode::I64Rotr: lower_rotate("fshr", I64); return true;

    // Float arithmetic
    case Opcode::F32Abs: lower_float_unary_intrinsic("fabs", F32); return true;
    case Opcode::F32Sqrt: lower_float_unary_intrinsic("sqrt", F32); return true;
    case Opcode::F32Add: lower_float_binary("fadd", F32); return true;
    case Opcode::F32Sub: lower_float_binary("fsub", F32); return true;
    case Opcode::F32Mul: lower_float_binary("fmul", F32); return true;
    case Opcode::F32Div: lower_float_binary("fdiv", F32); return true;
    case Opcode::F32Min: lower_float_minmax(true, F32); return true;
    case Opcode::F32Max: lower_float_minmax(false, F32); return true;
    case Opcode::F32Copysign: lower_copysign(F32); return true;
    case Opcode::F64Abs: lower_float_unary_intrinsic("fabs", F64); return true;
    case Opcode::F64Sqrt: lower_float_unary_intrinsic("sqrt", F64); return true;
    case Opcode::F64Add: lower_float_binary("fadd", F64); return true;
    case Opcode::F64Sub: lower_float_binary("fsub", F64); return true;
    case Opcode::F64Mul: lower_float_binary("fmul", F64); return true;
    case Opcode::F64Div: lower_float_binary("fdiv", F64); return true;
    case Opcode::F64Min: lower_float_minmax(true, F64); return true;
    case Opcode::F64Max: lower_float_minmax(false, F64); return true;
    case Opcode::F64Copysign: lower_copysign(F64); return true;
    case Opcode::F32Neg:
    case Opcode::F64Neg: {
        ValueKind kind = instr.op == Opcode::F32Neg ? F32 : F64;
        StackValue a = pop();
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = fneg " + llvm_value_type(kind) + " " + a.reg);
        push(r, kind);
        return true;
    }

    // Conversions
    case Opcode::I32WrapI64: lower_cast("trunc", I64, I32); return true;
    case Opcode::I64ExtendI32S: lower_cast("sext", I32, I64); return true;
    case Opcode::I64ExtendI32U: lower_cast("zext", I32, I64); return true;
    case Opcode::I32TruncF32S: lower_trunc(F32, I32, true); return true;
    case Opcode::I32TruncF32U: lower_trunc(F32, I32, false); return true;
    case Opcode::I32TruncF64S: lower_trunc(F64, I32, true); return true;
    case Opcode::I32TruncF64U: lower_trunc(F64, I32, false); return true;
    case Opcode::I64TruncF32S: lower_trunc(F32, I64, true); return true;
    case Opcode::I64TruncF32U: lower_trunc(F32, I64, false); return true;
    case Opcode::I64TruncF64S: lower_trunc(F64, I64, true); return true;
    case Opcode::I64TruncF64U: lower_trunc(F64, I64, false); return true;
    case Opcode::F32ConvertI32S: lower_cast("sitofp", I32, F32); return true;
    case Opcode::F32ConvertI32U: lower_cast("uitofp", I32, F32); return true;
    case Opcode::F32ConvertI64S: lower_cast("sitofp", I64, F32); return true;
    case Opcode::F32ConvertI64U: lower_cast("uitofp", I64, F32); return true;
    case Opcode::F32DemoteF64: lower_cast("fptrunc", F64, F32); return true;
    case Opcode::F64ConvertI32S: lower_cast("sitofp", I32, F64); return true;
    case Opcode::F64ConvertI32U: lower_cast("uitofp", I32, F64); return true;
    case Opcode::F64ConvertI64S: lower_cast("sitofp", I64, F64); return true;
    case Opcode::F64ConvertI64U: lower_cast("uitofp", I64, F64); return true;
    case Opcode::F64PromoteF32: lower_cast("fpext", F32, F64); return true;
    case Opcode::I32ReinterpretF32: lower_cast("bitcast", F32, I32); return true;
    case Opcode::I64ReinterpretF64: lower_cast("bitcast", F64, I64); return true;
    case Opcode::F32ReinterpretI32: lower_cast("bitcast", I32, F32); return true;
    case Opcode::F64ReinterpretI64: lower_cast("bitcast", I64, F64); return true;
    case Opcode::I32Extend8S: lower_sign_extend(I32, 8); return true;
    case Opcode::I32Extend16S: lower_sign_extend(I32, 16); return true;
    case Opcode::I64Extend8S: lower_sign_extend(I64, 8); return true;
    case Opcode::I64Extend16S: lower_sign_extend(I64, 16); return true;
    case Opcode::I64Extend32S: lower_sign_extend(I64, 32); return true;

    default:
        return false;
    }
}

// ============================================================================
// Constants and Select
// ============================================================================

void FunctionLowering::lower_const(const ir::Instr& instr) {
    switch (instr.op) {
    case Opcode::I32Const:
        push(std::to_string(static_cast<int32_t>(static_cast<uint32_t>(instr.imm))),
             ValueKind::I32);
        return;
    case Opcode::I64Const:
        push(std::to_string(static_cast<int64_t>(instr.imm)), ValueKind::I64);
        return;
    case Opcode::F32Const: {
        // Through the bit pattern, so NaN payloads survive.
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = bitcast i32 " +
                     std::to_string(static_cast<int32_t>(static_cast<uint32_t>(instr.imm))) +
                     " to float");
        push(r, ValueKind::F32);
        return;
    }
    case Opcode::F64Const: {
        std::string r = w_.fresh_reg();
        w_.emit_line("  " + r + " = bitcast i64 " +
                     std::to_string(static_cast<int64_t>(instr.imm)) + " to double");
        push(r, ValueKind::F64);
        return;
    }
    default:
        return;
    }
}

void FunctionLowering::lower_select() {
    StackValue cond = pop();
    StackValue b = pop();
    StackValue a = pop();
    if (failed()) {
        return;
    }
    std::string c = w_.fresh_reg();
    w_.emit_line("  " + c + " = icmp ne i32 " + cond.reg + ", 0");
    std::string type = llvm_value_type(a.kind);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = select i1 " + c + ", " + type + " " + a.reg + ", " + type + " " +
                 b.reg);
    push(r, a.kind);
}

// ============================================================================
// Integer Operations
// ============================================================================

void FunctionLowering::lower_int_binary(const std::string& op, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + op + " " + llvm_value_type(kind) + " " + a.reg + ", " + b.reg);
    push(r, kind);
}

void FunctionLowering::lower_int_compare(const std::string& pred, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string c = w_.fresh_reg();
    w_.emit_line("  " + c + " = icmp " + pred + " " + llvm_value_type(kind) + " " + a.reg + ", " +
                 b.reg);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = zext i1 " + c + " to i32");
    push(r, ValueKind::I32);
}

void FunctionLowering::lower_shift(const std::string& op, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string masked = w_.fresh_reg();
    w_.emit_line("  " + masked + " = and " + type + " " + b.reg + ", " +
                 std::to_string(int_bits(kind) - 1));
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + op + " " + type + " " + a.reg + ", " + masked);
    push(r, kind);
}

void FunctionLowering::lower_rotate(const std::string& intrinsic, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string fn = declare_intrinsic("llvm." + intrinsic + "." + intrinsic_suffix(kind), type,
                                       type + ", " + type + ", " + type);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = call " + type + " " + fn + "(" + type + " " + a.reg + ", " + type +
                 " " + a.reg + ", " + type + " " + b.reg + ")");
    push(r, kind);
}

void FunctionLowering::lower_div(bool is_signed, bool is_rem, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    if (failed()) {
        return;
    }
    std::string type = llvm_value_type(kind);

    std::string is_zero = w_.fresh_reg();
    w_.emit_line("  " + is_zero + " = icmp eq " + type + " " + b.reg + ", 0");
    trap_if(is_zero, TrapCode::IntegerDivisionByZero);

    std::string divisor = b.reg;
    if (is_signed) {
        std::string minus_one = w_.fresh_reg();
        w_.emit_line("  " + minus_one + " = icmp eq " + type + " " + b.reg + ", -1");
        if (is_rem) {
            // INT_MIN rem -1 is 0; remainder by 1 gives the same without
            // the hardware fault.
            divisor = w_.fresh_reg();
            w_.emit_line("  " + divisor + " = select i1 " + minus_one + ", " + type + " 1, " +
                         type + " " + b.reg);
        } else {
            std::string min_value =
                kind == ValueKind::I64 ? "-9223372036854775808" : "-2147483648";
            std::string is_min = w_.fresh_reg();
            w_.emit_line("  " + is_min + " = icmp eq " + type + " " + a.reg + ", " + min_value);
            std::string overflow = w_.fresh_reg();
            w_.emit_line("  " + overflow + " = and i1 " + is_min + ", " + minus_one);
            trap_if(overflow, TrapCode::IntegerOverflow);
        }
    }

    std::string op = is_rem ? (is_signed ? "srem" : "urem") : (is_signed ? "sdiv" : "udiv");
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + op + " " + type + " " + a.reg + ", " + divisor);
    push(r, kind);
}

void FunctionLowering::lower_bit_count(const std::string& intrinsic, ValueKind kind,
                                       bool has_flag) {
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string fn = declare_intrinsic("llvm." + intrinsic + "." + intrinsic_suffix(kind), type,
                                       has_flag ? type + ", i1" : type);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = call " + type + " " + fn + "(" + type + " " + a.reg +
                 (has_flag ? ", i1 false" : "") + ")");
    push(r, kind);
}

void FunctionLowering::lower_sign_extend(ValueKind kind, uint32_t bits) {
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string narrow = "i" + std::to_string(bits);
    std::string t = w_.fresh_reg();
    w_.emit_line("  " + t + " = trunc " + type + " " + a.reg + " to " + narrow);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = sext " + narrow + " " + t + " to " + type);
    push(r, kind);
}

// ============================================================================
// Float Operations
// ============================================================================

void FunctionLowering::lower_float_compare(const std::string& pred, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string c = w_.fresh_reg();
    w_.emit_line("  " + c + " = fcmp " + pred + " " + llvm_value_type(kind) + " " + a.reg + ", " +
                 b.reg);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = zext i1 " + c + " to i32");
    push(r, ValueKind::I32);
}

void FunctionLowering::lower_float_binary(const std::string& op, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + op + " " + llvm_value_type(kind) + " " + a.reg + ", " + b.reg);
    push(r, kind);
}

void FunctionLowering::lower_float_unary_intrinsic(const std::string& intrinsic, ValueKind kind) {
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string fn = declare_intrinsic("llvm." + intrinsic + "." + intrinsic_suffix(kind), type,
                                       type);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = call " + type + " " + fn + "(" + type + " " + a.reg + ")");
    push(r, kind);
}

void FunctionLowering::lower_float_minmax(bool is_min, ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    if (failed()) {
        return;
    }
    std::string type = llvm_value_type(kind);
    std::string itype = int_for_float(kind);

    std::string ordered = w_.fresh_reg();
    w_.emit_line("  " + ordered + " = fcmp " + (is_min ? "olt " : "ogt ") + type + " " + a.reg +
                 ", " + b.reg);
    std::string picked = w_.fresh_reg();
    w_.emit_line("  " + picked + " = select i1 " + ordered + ", " + type + " " + a.reg + ", " +
                 type + " " + b.reg);

    // Equal operands differ at most in sign: min prefers -0, max +0.
    std::string a_bits = w_.fresh_reg();
    w_.emit_line("  " + a_bits + " = bitcast " + type + " " + a.reg + " to " + itype);
    std::string b_bits = w_.fresh_reg();
    w_.emit_line("  " + b_bits + " = bitcast " + type + " " + b.reg + " to " + itype);
    std::string merged_bits = w_.fresh_reg();
    w_.emit_line("  " + merged_bits + " = " + (is_min ? "or " : "and ") + itype + " " + a_bits +
                 ", " + b_bits);
    std::string merged = w_.fresh_reg();
    w_.emit_line("  " + merged + " = bitcast " + itype + " " + merged_bits + " to " + type);
    std::string equal = w_.fresh_reg();
    w_.emit_line("  " + equal + " = fcmp oeq " + type + " " + a.reg + ", " + b.reg);
    std::string non_nan = w_.fresh_reg();
    w_.emit_line("  " + non_nan + " = select i1 " + equal + ", " + type + " " + merged + ", " +
                 type + " " + picked);

    // Any NaN operand yields a quiet NaN.
    std::string unordered = w_.fresh_reg();
    w_.emit_line("  " + unordered + " = fcmp uno " + type + " " + a.reg + ", " + b.reg);
    std::string nan = w_.fresh_reg();
    w_.emit_line("  " + nan + " = fadd " + type + " " + a.reg + ", " + b.reg);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = select i1 " + unordered + ", " + type + " " + nan + ", " + type +
                 " " + non_nan);
    push(r, kind);
}

void FunctionLowering::lower_copysign(ValueKind kind) {
    StackValue b = pop();
    StackValue a = pop();
    std::string type = llvm_value_type(kind);
    std::string fn = declare_intrinsic("llvm.copysign." + intrinsic_suffix(kind), type,
                                       type + ", " + type);
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = call " + type + " " + fn + "(" + type + " " + a.reg + ", " + type +
                 " " + b.reg + ")");
    push(r, kind);
}

// ============================================================================
// Conversions
// ============================================================================

void FunctionLowering::lower_cast(const std::string& op, ValueKind from, ValueKind to) {
    StackValue a = pop();
    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + op + " " + llvm_value_type(from) + " " + a.reg + " to " +
                 llvm_value_type(to));
    push(r, to);
}

void FunctionLowering::lower_trunc(ValueKind from, ValueKind to, bool is_signed) {
    StackValue a = pop();
    if (failed()) {
        return;
    }
    std::string type = llvm_value_type(from);

    std::string nan = w_.fresh_reg();
    w_.emit_line("  " + nan + " = fcmp uno " + type + " " + a.reg + ", " + a.reg);
    trap_if(nan, TrapCode::BadConversionToInteger);

    // Exclusive bounds: values strictly between them truncate into range.
    // The lower bound is inclusive-invalid ("ole") unless it is itself the
    // smallest valid value ("olt").
    std::string low_pred = "ole";
    double low = -1.0;
    double high = 0.0;
    if (to == ValueKind::I32) {
        high = is_signed ? 2147483648.0 : 4294967296.0;
        if (is_signed) {
            low = from == ValueKind::F32 ? -2147483904.0 : -2147483649.0;
        }
    } else {
        high = is_signed ? 9223372036854775808.0 : 18446744073709551616.0;
        if (is_signed) {
            low = -9223372036854775808.0;
            low_pred = "olt";
        }
    }

    std::string too_low = w_.fresh_reg();
    w_.emit_line("  " + too_low + " = fcmp " + low_pred + " " + type + " " + a.reg + ", " +
                 llvm_fp_literal(low));
    std::string too_high = w_.fresh_reg();
    w_.emit_line("  " + too_high + " = fcmp oge " + type + " " + a.reg + ", " +
                 llvm_fp_literal(high));
    std::string out_of_range = w_.fresh_reg();
    w_.emit_line("  " + out_of_range + " = or i1 " + too_low + ", " + too_high);
    trap_if(out_of_range, TrapCode::IntegerOverflow);

    std::string r = w_.fresh_reg();
    w_.emit_line("  " + r + " = " + (is_signed ? "fptosi " : "fptoui ") + type + " " + a.reg +
                 " to " + llvm_value_type(to));
    push(r, to);
}

} // namespace waot::codegen
