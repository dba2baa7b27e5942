//! # LLVM IR Text Writer
//!
//! Register and label allocation plus final module assembly. Function
//! bodies are written to a buffer while entry-block allocas are collected
//! separately and spliced in at `finish`, so allocas can be requested at
//! any point during lowering.

#include "codegen/ir_writer.hpp"

#include <cstdio>

namespace waot::codegen {

auto llvm_value_type(ir::ValueKind kind) -> std::string {
    switch (kind) {
    case ir::ValueKind::I32:
        return "i32";
    case ir::ValueKind::I64:
        return "i64";
    case ir::ValueKind::F32:
        return "float";
    case ir::ValueKind::F64:
        return "double";
    case ir::ValueKind::Ref:
        return "i8*";
    case ir::ValueKind::V128:
        return "<4 x i32>";
    }
    return "i64";
}

auto llvm_return_type(const std::vector<ir::ValueKind>& results) -> std::string {
    if (results.empty()) {
        return "void";
    }
    if (results.size() == 1) {
        return llvm_value_type(results[0]);
    }
    std::string out = "{ ";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += llvm_value_type(results[i]);
    }
    out += " }";
    return out;
}

auto llvm_wasm_fn_type(const ir::FuncSig& sig) -> std::string {
    std::string out = llvm_return_type(sig.results) + " (i8*";
    for (ir::ValueKind kind : sig.params) {
        out += ", " + llvm_value_type(kind);
    }
    out += ")";
    return out;
}

auto llvm_escape_bytes(const std::vector<uint8_t>& bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (uint8_t b : bytes) {
        if (b >= 0x20 && b < 0x7F && b != '"' && b != '\\') {
            out += static_cast<char>(b);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "\\%02X", b);
            out += buf;
        }
    }
    return out;
}

// ============================================================================
// IRWriter
// ============================================================================

auto IRWriter::fresh_reg() -> std::string {
    return "%t" + std::to_string(temp_counter_++);
}

auto IRWriter::fresh_label(const std::string& prefix) -> std::string {
    return prefix + std::to_string(label_counter_++);
}

void IRWriter::emit(const std::string& code) {
    body_ << code;
}

void IRWriter::emit_line(const std::string& code) {
    body_ << code << "\n";
    ++line_count_;
}

void IRWriter::emit_label(const std::string& label) {
    body_ << label << ":\n";
}

auto IRWriter::emit_alloca(const std::string& type) -> std::string {
    std::string reg = fresh_reg();
    entry_allocas_.push_back("  " + reg + " = alloca " + type + ", align 8");
    return reg;
}

void IRWriter::declare(const std::string& symbol, const std::string& declaration) {
    declarations_.emplace(symbol, declaration);
}

void IRWriter::emit_global(const std::string& line) {
    globals_.push_back(line);
}

auto IRWriter::finish(const std::string& module_id, const std::string& signature) const
    -> std::string {
    std::ostringstream out;
    out << "; ModuleID = '" << module_id << "'\n";
    out << "source_filename = \"" << module_id << "\"\n\n";

    for (const auto& line : globals_) {
        out << line << "\n";
    }
    if (!globals_.empty()) {
        out << "\n";
    }

    out << signature << " {\n";
    out << "entry:\n";
    for (const auto& line : entry_allocas_) {
        out << line << "\n";
    }
    out << body_.str();
    out << "}\n\n";

    for (const auto& [symbol, decl] : declarations_) {
        out << decl << "\n";
    }
    out << "\nattributes #0 = { nounwind \"no-builtins\" }\n";
    return out.str();
}

auto IRWriter::finish_module(const std::string& module_id) const -> std::string {
    std::ostringstream out;
    out << "; ModuleID = '" << module_id << "'\n";
    out << "source_filename = \"" << module_id << "\"\n\n";
    for (const auto& line : globals_) {
        out << line << "\n";
    }
    for (const auto& [symbol, decl] : declarations_) {
        out << decl << "\n";
    }
    return out.str();
}

} // namespace waot::codegen
