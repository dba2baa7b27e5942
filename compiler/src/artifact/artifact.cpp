//! # Dylib Artifact Implementation

#include "artifact/artifact.hpp"

#include "codegen/code_generator.hpp"

#include <charconv>
#include <set>
#include <sstream>

namespace waot::artifact {

auto relocation_target_name(RelocationTarget target) -> const char* {
    switch (target) {
    case RelocationTarget::LocalFunction:
        return "local_function";
    case RelocationTarget::Trampoline:
        return "trampoline";
    case RelocationTarget::Data:
        return "data";
    }
    return "?";
}

static auto describe_limits(const ir::Limits& limits) -> std::string {
    std::string out = std::to_string(limits.min);
    if (limits.max) {
        out += ".." + std::to_string(*limits.max);
    } else {
        out += "..";
    }
    return out;
}

auto ImportEntry::describe() const -> std::string {
    switch (kind) {
    case ir::ExternKind::Function:
        return "function " + sig.to_string();
    case ir::ExternKind::Memory:
        return "memory " + describe_limits(memory.limits) + " pages";
    case ir::ExternKind::Table:
        return "table " + describe_limits(table.limits) + " elements";
    case ir::ExternKind::Global:
        return std::string("global ") + (global.is_mutable ? "mut " : "") +
               ir::value_kind_name(global.kind);
    }
    return "?";
}

// ============================================================================
// ModuleInfo
// ============================================================================

auto ModuleInfo::from_module(const ir::ModuleIR& module) -> ModuleInfo {
    ModuleInfo info;
    info.name = module.name;
    info.fingerprint = module.content_hash();

    for (const auto& import : module.imports) {
        ImportEntry entry;
        entry.module = import.module;
        entry.name = import.name;
        entry.kind = import.kind;
        if (import.kind == ir::ExternKind::Function && import.type_index < module.types.size()) {
            entry.sig = module.types[import.type_index];
        }
        entry.memory = import.memory;
        entry.table = import.table;
        entry.global = import.global;
        info.imports.push_back(std::move(entry));
    }

    info.exports = module.exports;
    info.memories = module.memories;
    info.tables = module.tables;
    info.globals = module.globals;
    info.data = module.data;
    info.elements = module.elements;
    info.start = module.start;
    return info;
}

auto ModuleInfo::num_imported(ir::ExternKind kind) const -> uint32_t {
    uint32_t n = 0;
    for (const auto& import : imports) {
        if (import.kind == kind) {
            ++n;
        }
    }
    return n;
}

// ============================================================================
// DylibArtifact
// ============================================================================

DylibArtifact::DylibArtifact(ModuleInfo info, target::TargetConfig target,
                             std::vector<CompiledFunction> functions,
                             std::vector<trampoline::TrampolineKey> trampolines)
    : info_(std::move(info)), target_(target), functions_(std::move(functions)),
      trampolines_(std::move(trampolines)) {}

auto DylibArtifact::function_sig(uint32_t func_index) const -> const ir::FuncSig* {
    uint32_t n = 0;
    for (const auto& import : info_.imports) {
        if (import.kind != ir::ExternKind::Function) {
            continue;
        }
        if (n == func_index) {
            return &import.sig;
        }
        ++n;
    }
    const CompiledFunction* fn = defined_function(func_index);
    return fn ? &fn->sig : nullptr;
}

auto DylibArtifact::defined_function(uint32_t func_index) const -> const CompiledFunction* {
    uint32_t n_imported = num_imported_functions();
    if (func_index < n_imported || func_index - n_imported >= functions_.size()) {
        return nullptr;
    }
    return &functions_[func_index - n_imported];
}

auto DylibArtifact::find_export(std::string_view name) const -> const ir::Export* {
    for (const auto& e : info_.exports) {
        if (e.name == name) {
            return &e;
        }
    }
    return nullptr;
}

auto DylibArtifact::global_type(uint32_t global_index) const -> std::optional<ir::GlobalType> {
    uint32_t n = 0;
    for (const auto& import : info_.imports) {
        if (import.kind != ir::ExternKind::Global) {
            continue;
        }
        if (n == global_index) {
            return import.global;
        }
        ++n;
    }
    if (global_index - n < info_.globals.size()) {
        return info_.globals[global_index - n].type;
    }
    return std::nullopt;
}

auto DylibArtifact::memory_type() const -> std::optional<ir::MemoryType> {
    for (const auto& import : info_.imports) {
        if (import.kind == ir::ExternKind::Memory) {
            return import.memory;
        }
    }
    if (!info_.memories.empty()) {
        return info_.memories.front();
    }
    return std::nullopt;
}

auto DylibArtifact::table_type() const -> std::optional<ir::TableType> {
    for (const auto& import : info_.imports) {
        if (import.kind == ir::ExternKind::Table) {
            return import.table;
        }
    }
    if (!info_.tables.empty()) {
        return info_.tables.front();
    }
    return std::nullopt;
}

auto DylibArtifact::code_size() const -> uint64_t {
    uint64_t total = 0;
    for (const auto& fn : functions_) {
        total += fn.code_size;
    }
    return total;
}

// ============================================================================
// Index Checks
// ============================================================================

/// A segment offset is a constant or the value of an imported i32 global.
static auto check_offset(const ir::ConstExpr& offset, const std::vector<ImportEntry>& imports,
                         const std::string& what) -> std::optional<std::string> {
    switch (offset.kind) {
    case ir::ConstExpr::Kind::Value:
        return std::nullopt;
    case ir::ConstExpr::Kind::GlobalGet: {
        uint32_t n = 0;
        for (const auto& import : imports) {
            if (import.kind != ir::ExternKind::Global) {
                continue;
            }
            if (n++ != offset.index) {
                continue;
            }
            if (import.global.kind != ir::ValueKind::I32) {
                return what + " offset reads global " + std::to_string(offset.index) +
                       ", which is not i32";
            }
            return std::nullopt;
        }
        return what + " offset reads global " + std::to_string(offset.index) +
               ", which is not an imported global";
    }
    case ir::ConstExpr::Kind::RefFunc:
    case ir::ConstExpr::Kind::RefNull:
        break;
    }
    return what + " offset must be a constant or global.get";
}

/// Strips the Mach-O underscore when the bare name is not one of ours.
static auto plain_symbol(const std::string& symbol) -> std::string {
    if (symbol.size() > 1 && symbol[0] == '_' && symbol.rfind("waot_", 0) != 0) {
        return symbol.substr(1);
    }
    return symbol;
}

auto DylibArtifact::check_indices() const -> std::optional<std::string> {
    uint32_t n_funcs = num_imported_functions();
    uint32_t total_funcs = total_functions();
    uint32_t n_globals = num_imported_globals();
    auto defined = [&](uint32_t f) { return f >= n_funcs && f < total_funcs; };

    uint32_t total_memories =
        info_.num_imported(ir::ExternKind::Memory) + static_cast<uint32_t>(info_.memories.size());
    uint32_t total_tables =
        info_.num_imported(ir::ExternKind::Table) + static_cast<uint32_t>(info_.tables.size());
    uint32_t total_globals = n_globals + static_cast<uint32_t>(info_.globals.size());
    if (total_memories > 1 || total_tables > 1) {
        return "more than one memory or table";
    }

    for (const auto& e : info_.exports) {
        uint32_t limit = 0;
        switch (e.kind) {
        case ir::ExternKind::Function:
            limit = total_funcs;
            break;
        case ir::ExternKind::Memory:
            limit = total_memories;
            break;
        case ir::ExternKind::Table:
            limit = total_tables;
            break;
        case ir::ExternKind::Global:
            limit = total_globals;
            break;
        }
        if (e.index >= limit) {
            return "export '" + e.name + "' refers to " + ir::extern_kind_name(e.kind) + " " +
                   std::to_string(e.index) + ", which does not exist";
        }
    }

    if (info_.start) {
        const ir::FuncSig* sig = function_sig(*info_.start);
        if (!sig || !sig->params.empty() || !sig->results.empty()) {
            return "start function " + std::to_string(*info_.start) +
                   " is missing or not of type () -> ()";
        }
    }

    for (size_t i = 0; i < info_.globals.size(); ++i) {
        const auto& init = info_.globals[i].init;
        std::string what = "global " + std::to_string(n_globals + i);
        if (init.kind == ir::ConstExpr::Kind::GlobalGet && init.index >= n_globals) {
            return what + " initializer reads global " + std::to_string(init.index) +
                   ", which is not an imported global";
        }
        if (init.kind == ir::ConstExpr::Kind::RefFunc && !defined(init.index)) {
            return what + " initializer references function " + std::to_string(init.index) +
                   ", which the module does not define";
        }
    }

    if (!info_.data.empty() && total_memories == 0) {
        return "data segments in a module without a memory";
    }
    for (size_t i = 0; i < info_.data.size(); ++i) {
        if (auto err = check_offset(info_.data[i].offset, info_.imports,
                                    "data segment " + std::to_string(i))) {
            return err;
        }
    }

    if (!info_.elements.empty() && total_tables == 0) {
        return "element segments in a module without a table";
    }
    for (size_t i = 0; i < info_.elements.size(); ++i) {
        std::string what = "element segment " + std::to_string(i);
        if (auto err = check_offset(info_.elements[i].offset, info_.imports, what)) {
            return err;
        }
        for (uint32_t f : info_.elements[i].functions) {
            if (!defined(f)) {
                return what + " references function " + std::to_string(f) +
                       ", which the module does not define";
            }
        }
    }

    std::set<std::string> trampoline_symbols;
    for (const auto& key : trampolines_) {
        trampoline_symbols.insert(key.symbol());
    }
    for (const auto& fn : functions_) {
        std::string what = "function " + std::to_string(fn.index);
        for (uint32_t callee : fn.import_calls) {
            if (callee >= n_funcs) {
                return what + " calls import " + std::to_string(callee) +
                       ", which the module does not import";
            }
        }
        for (const auto& reloc : fn.relocations) {
            std::string symbol = plain_symbol(reloc.symbol);
            if (reloc.target == RelocationTarget::Trampoline &&
                trampoline_symbols.count(symbol) == 0) {
                return what + " relocates against '" + symbol +
                       "', which is not in the trampoline set";
            }
            if (reloc.target == RelocationTarget::LocalFunction) {
                std::string_view digits(symbol);
                uint32_t callee = 0;
                bool named = digits.substr(0, codegen::FUNCTION_SYMBOL_PREFIX.size()) ==
                             codegen::FUNCTION_SYMBOL_PREFIX;
                digits.remove_prefix(named ? codegen::FUNCTION_SYMBOL_PREFIX.size() : 0);
                auto [ptr, ec] =
                    std::from_chars(digits.data(), digits.data() + digits.size(), callee);
                if (!named || digits.empty() || ec != std::errc() ||
                    ptr != digits.data() + digits.size() || !defined(callee)) {
                    return what + " relocates against '" + symbol +
                           "', which is not a function of the artifact";
                }
            }
        }
    }
    return std::nullopt;
}

auto DylibArtifact::linked_bytes() const -> Rc<const std::vector<uint8_t>> {
    std::lock_guard<std::mutex> lock(mutex_);
    return linked_;
}

auto DylibArtifact::set_linked_bytes(std::vector<uint8_t> bytes)
    -> Rc<const std::vector<uint8_t>> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!linked_) {
        linked_ = make_rc<const std::vector<uint8_t>>(std::move(bytes));
    }
    return linked_;
}

auto DylibArtifact::loaded_library() const -> Rc<runtime::LoadedLibrary> {
    std::lock_guard<std::mutex> lock(mutex_);
    return library_;
}

auto DylibArtifact::set_loaded_library(Rc<runtime::LoadedLibrary> library)
    -> Rc<runtime::LoadedLibrary> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!library_) {
        library_ = std::move(library);
    }
    return library_;
}

auto DylibArtifact::release_library() -> bool {
    Rc<runtime::LoadedLibrary> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = std::move(library_);
        library_.reset();
    }
    // The last reference may unload the library; do that outside the lock.
    return released != nullptr;
}

} // namespace waot::artifact
