#include "ir/module_ir.hpp"

namespace waot::ir {

// ============================================================================
// Value Kinds and Signatures
// ============================================================================

auto value_kind_letter(ValueKind kind) -> char {
    switch (kind) {
    case ValueKind::I32:
        return 'i';
    case ValueKind::I64:
        return 'l';
    case ValueKind::F32:
        return 'f';
    case ValueKind::F64:
        return 'd';
    case ValueKind::Ref:
        return 'r';
    case ValueKind::V128:
        return 'x';
    }
    return '?';
}

auto value_kind_name(ValueKind kind) -> const char* {
    switch (kind) {
    case ValueKind::I32:
        return "i32";
    case ValueKind::I64:
        return "i64";
    case ValueKind::F32:
        return "f32";
    case ValueKind::F64:
        return "f64";
    case ValueKind::Ref:
        return "ref";
    case ValueKind::V128:
        return "v128";
    }
    return "?";
}

auto value_kind_from_letter(char c) -> std::optional<ValueKind> {
    switch (c) {
    case 'i':
        return ValueKind::I32;
    case 'l':
        return ValueKind::I64;
    case 'f':
        return ValueKind::F32;
    case 'd':
        return ValueKind::F64;
    case 'r':
        return ValueKind::Ref;
    case 'x':
        return ValueKind::V128;
    default:
        return std::nullopt;
    }
}

static void append_kinds(std::string& out, const std::vector<ValueKind>& kinds) {
    if (kinds.empty()) {
        out += 'v';
        return;
    }
    for (ValueKind kind : kinds) {
        out += value_kind_letter(kind);
    }
}

auto FuncSig::key() const -> std::string {
    std::string out;
    out.reserve(params.size() + results.size() + 3);
    append_kinds(out, params);
    out += '_';
    append_kinds(out, results);
    return out;
}

auto FuncSig::to_string() const -> std::string {
    std::string out = "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += value_kind_name(params[i]);
    }
    out += ") -> (";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += value_kind_name(results[i]);
    }
    out += ")";
    return out;
}

auto FuncSig::uses(ValueKind kind) const -> bool {
    for (ValueKind k : params) {
        if (k == kind)
            return true;
    }
    for (ValueKind k : results) {
        if (k == kind)
            return true;
    }
    return false;
}

static auto parse_kinds(std::string_view s) -> std::optional<std::vector<ValueKind>> {
    std::vector<ValueKind> kinds;
    if (s == "v") {
        return kinds;
    }
    if (s.empty()) {
        return std::nullopt;
    }
    for (char c : s) {
        auto kind = value_kind_from_letter(c);
        if (!kind) {
            return std::nullopt;
        }
        kinds.push_back(*kind);
    }
    return kinds;
}

auto sig_from_key(std::string_view key) -> std::optional<FuncSig> {
    size_t sep = key.find('_');
    if (sep == std::string_view::npos || key.find('_', sep + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    auto params = parse_kinds(key.substr(0, sep));
    auto results = parse_kinds(key.substr(sep + 1));
    if (!params || !results) {
        return std::nullopt;
    }
    return FuncSig{std::move(*params), std::move(*results)};
}

void write_sig(ByteWriter& w, const FuncSig& sig) {
    w.write_u32(static_cast<uint32_t>(sig.params.size()));
    for (ValueKind k : sig.params) {
        w.write_u8(static_cast<uint8_t>(k));
    }
    w.write_u32(static_cast<uint32_t>(sig.results.size()));
    for (ValueKind k : sig.results) {
        w.write_u8(static_cast<uint8_t>(k));
    }
}

static auto read_kind(ByteReader& r) -> ValueKind {
    uint8_t raw = r.read_u8();
    if (raw > static_cast<uint8_t>(ValueKind::V128)) {
        r.set_error("invalid value kind " + std::to_string(raw));
        return ValueKind::I32;
    }
    return static_cast<ValueKind>(raw);
}

auto read_sig(ByteReader& r) -> FuncSig {
    FuncSig sig;
    uint32_t n_params = r.read_count(1);
    for (uint32_t i = 0; i < n_params && !r.has_error(); ++i) {
        sig.params.push_back(read_kind(r));
    }
    uint32_t n_results = r.read_count(1);
    for (uint32_t i = 0; i < n_results && !r.has_error(); ++i) {
        sig.results.push_back(read_kind(r));
    }
    return sig;
}

// ============================================================================
// Opcodes
// ============================================================================

auto opcode_name(Opcode op) -> const char* {
    switch (op) {
#define WAOT_IR_OPCODE_NAME(name, text)                                                            \
    case Opcode::name:                                                                             \
        return text;
        WAOT_IR_OPCODES(WAOT_IR_OPCODE_NAME)
#undef WAOT_IR_OPCODE_NAME
    }
    return "<invalid>";
}

auto extern_kind_name(ExternKind kind) -> const char* {
    switch (kind) {
    case ExternKind::Function:
        return "function";
    case ExternKind::Memory:
        return "memory";
    case ExternKind::Table:
        return "table";
    case ExternKind::Global:
        return "global";
    }
    return "?";
}

// ============================================================================
// ModuleIR Queries
// ============================================================================

auto ModuleIR::num_imported(ExternKind kind) const -> uint32_t {
    uint32_t n = 0;
    for (const auto& imp : imports) {
        if (imp.kind == kind)
            ++n;
    }
    return n;
}

auto ModuleIR::total_functions() const -> uint32_t {
    return num_imported_functions() + static_cast<uint32_t>(functions.size());
}

auto ModuleIR::total_globals() const -> uint32_t {
    return num_imported_globals() + static_cast<uint32_t>(globals.size());
}

auto ModuleIR::total_memories() const -> uint32_t {
    return num_imported(ExternKind::Memory) + static_cast<uint32_t>(memories.size());
}

auto ModuleIR::total_tables() const -> uint32_t {
    return num_imported(ExternKind::Table) + static_cast<uint32_t>(tables.size());
}

auto ModuleIR::imported(ExternKind kind, uint32_t n) const -> const Import* {
    for (const auto& imp : imports) {
        if (imp.kind != kind)
            continue;
        if (n == 0)
            return &imp;
        --n;
    }
    return nullptr;
}

auto ModuleIR::function_sig(uint32_t func_index) const -> const FuncSig* {
    uint32_t n_imported = num_imported_functions();
    uint32_t type_index;
    if (func_index < n_imported) {
        type_index = imported(ExternKind::Function, func_index)->type_index;
    } else if (func_index - n_imported < functions.size()) {
        type_index = functions[func_index - n_imported].type_index;
    } else {
        return nullptr;
    }
    if (type_index >= types.size()) {
        return nullptr;
    }
    return &types[type_index];
}

auto ModuleIR::global_type(uint32_t global_index) const -> const GlobalType* {
    uint32_t n_imported = num_imported_globals();
    if (global_index < n_imported) {
        return &imported(ExternKind::Global, global_index)->global;
    }
    if (global_index - n_imported < globals.size()) {
        return &globals[global_index - n_imported].type;
    }
    return nullptr;
}

auto ModuleIR::memory_type() const -> std::optional<MemoryType> {
    if (const Import* imp = imported(ExternKind::Memory, 0)) {
        return imp->memory;
    }
    if (!memories.empty()) {
        return memories[0];
    }
    return std::nullopt;
}

auto ModuleIR::table_type() const -> std::optional<TableType> {
    if (const Import* imp = imported(ExternKind::Table, 0)) {
        return imp->table;
    }
    if (!tables.empty()) {
        return tables[0];
    }
    return std::nullopt;
}

auto ModuleIR::find_export(std::string_view export_name) const -> const Export* {
    for (const auto& exp : exports) {
        if (exp.name == export_name)
            return &exp;
    }
    return nullptr;
}

// ============================================================================
// Canonical Encoding
// ============================================================================

void write_limits(ByteWriter& w, const Limits& limits) {
    w.write_u32(limits.min);
    w.write_bool(limits.max.has_value());
    w.write_u32(limits.max.value_or(0));
}

auto read_limits(ByteReader& r) -> Limits {
    Limits limits;
    limits.min = r.read_u32();
    bool has_max = r.read_bool();
    uint32_t max = r.read_u32();
    if (has_max) {
        limits.max = max;
    }
    return limits;
}

void write_const_expr(ByteWriter& w, const ConstExpr& expr) {
    w.write_u8(static_cast<uint8_t>(expr.kind));
    w.write_u64(expr.bits);
    w.write_u32(expr.index);
}

auto read_const_expr(ByteReader& r) -> ConstExpr {
    ConstExpr expr;
    uint8_t kind = r.read_u8();
    if (kind > static_cast<uint8_t>(ConstExpr::Kind::RefNull)) {
        r.set_error("invalid constant expression kind " + std::to_string(kind));
    } else {
        expr.kind = static_cast<ConstExpr::Kind>(kind);
    }
    expr.bits = r.read_u64();
    expr.index = r.read_u32();
    return expr;
}

void write_global_type(ByteWriter& w, const GlobalType& type) {
    w.write_u8(static_cast<uint8_t>(type.kind));
    w.write_bool(type.is_mutable);
}

auto read_global_type(ByteReader& r) -> GlobalType {
    GlobalType type;
    type.kind = read_kind(r);
    type.is_mutable = r.read_bool();
    return type;
}

static void write_instr(ByteWriter& w, const Instr& instr) {
    w.write_u16(static_cast<uint16_t>(instr.op));
    w.write_u32(instr.index);
    w.write_u64(instr.imm);
    switch (instr.op) {
    case Opcode::Block:
    case Opcode::Loop:
    case Opcode::If:
        write_sig(w, instr.block_sig);
        break;
    case Opcode::BrTable:
        w.write_u32(static_cast<uint32_t>(instr.targets.size()));
        for (uint32_t t : instr.targets) {
            w.write_u32(t);
        }
        break;
    default:
        break;
    }
}

auto ModuleIR::encode() const -> std::vector<uint8_t> {
    ByteWriter w;
    w.write_string(name);

    w.write_u32(static_cast<uint32_t>(types.size()));
    for (const auto& sig : types) {
        write_sig(w, sig);
    }

    w.write_u32(static_cast<uint32_t>(imports.size()));
    for (const auto& imp : imports) {
        w.write_string(imp.module);
        w.write_string(imp.name);
        w.write_u8(static_cast<uint8_t>(imp.kind));
        switch (imp.kind) {
        case ExternKind::Function:
            w.write_u32(imp.type_index);
            break;
        case ExternKind::Memory:
            write_limits(w, imp.memory.limits);
            break;
        case ExternKind::Table:
            write_limits(w, imp.table.limits);
            break;
        case ExternKind::Global:
            write_global_type(w, imp.global);
            break;
        }
    }

    w.write_u32(static_cast<uint32_t>(functions.size()));
    for (const auto& func : functions) {
        w.write_u32(func.type_index);
        w.write_string(func.name);
        w.write_u32(static_cast<uint32_t>(func.locals.size()));
        for (ValueKind k : func.locals) {
            w.write_u8(static_cast<uint8_t>(k));
        }
        w.write_u32(static_cast<uint32_t>(func.body.size()));
        for (const auto& instr : func.body) {
            write_instr(w, instr);
        }
    }

    w.write_u32(static_cast<uint32_t>(memories.size()));
    for (const auto& mem : memories) {
        write_limits(w, mem.limits);
    }

    w.write_u32(static_cast<uint32_t>(tables.size()));
    for (const auto& table : tables) {
        write_limits(w, table.limits);
    }

    w.write_u32(static_cast<uint32_t>(globals.size()));
    for (const auto& global : globals) {
        write_global_type(w, global.type);
        write_const_expr(w, global.init);
    }

    w.write_u32(static_cast<uint32_t>(exports.size()));
    for (const auto& exp : exports) {
        w.write_string(exp.name);
        w.write_u8(static_cast<uint8_t>(exp.kind));
        w.write_u32(exp.index);
    }

    w.write_u32(static_cast<uint32_t>(data.size()));
    for (const auto& seg : data) {
        write_const_expr(w, seg.offset);
        w.write_bytes(seg.bytes);
    }

    w.write_u32(static_cast<uint32_t>(elements.size()));
    for (const auto& seg : elements) {
        write_const_expr(w, seg.offset);
        w.write_u32(static_cast<uint32_t>(seg.functions.size()));
        for (uint32_t f : seg.functions) {
            w.write_u32(f);
        }
    }

    w.write_bool(start.has_value());
    w.write_u32(start.value_or(0));

    return w.take();
}

auto ModuleIR::content_hash() const -> Fingerprint {
    auto bytes = encode();
    return fingerprint_bytes(bytes.data(), bytes.size());
}

} // namespace waot::ir
