//! # Artifact Compiler Implementation

#include "artifact/artifact_compiler.hpp"

#include "log/log.hpp"
#include "runtime/vmcontext.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <charconv>
#include <map>
#include <mutex>
#include <thread>

namespace waot::artifact {

using ir::ExternKind;
using ir::ValueKind;
using trampoline::TrampolineKey;
using trampoline::TrampolineKind;

// ============================================================================
// Relocation Classification
// ============================================================================

static auto starts_with(const std::string& s, std::string_view prefix) -> bool {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

auto classify_relocation(const std::string& raw_symbol, const backend::ObjectFileInfo& object,
                         const std::set<std::string>& allowed_trampolines, uint32_t num_imported,
                         uint32_t total_functions) -> Result<RelocationTarget, std::string> {
    if (raw_symbol.empty()) {
        return RelocationTarget::Data;
    }

    // Mach-O prefixes C symbols with an underscore.
    std::string symbol = raw_symbol;
    if (object.kind == backend::BinaryKind::MachO && symbol.size() > 1 && symbol[0] == '_') {
        symbol.erase(0, 1);
    }

    if (starts_with(symbol, codegen::FUNCTION_SYMBOL_PREFIX)) {
        std::string_view digits =
            std::string_view(symbol).substr(codegen::FUNCTION_SYMBOL_PREFIX.size());
        uint32_t index = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (ec != std::errc() || ptr != digits.data() + digits.size() || digits.empty()) {
            return "malformed function symbol '" + symbol + "'";
        }
        if (index < num_imported || index >= total_functions) {
            return "relocation to function " + std::to_string(index) +
                   " which the module does not define";
        }
        return RelocationTarget::LocalFunction;
    }

    if (starts_with(symbol, codegen::W2H_SYMBOL_PREFIX) ||
        starts_with(symbol, codegen::H2W_SYMBOL_PREFIX)) {
        if (allowed_trampolines.count(symbol) == 0) {
            return "relocation to trampoline '" + symbol + "' outside the artifact's trampoline set";
        }
        return RelocationTarget::Trampoline;
    }

    if (object.find_symbol(raw_symbol) || object.find_section(raw_symbol)) {
        return RelocationTarget::Data;
    }

    return "unresolved external symbol '" + symbol + "'";
}

// ============================================================================
// Trampoline Set
// ============================================================================

auto ArtifactCompiler::required_trampolines(const ir::ModuleIR& module)
    -> std::vector<TrampolineKey> {
    std::map<std::string, TrampolineKey> keys;
    auto add = [&](TrampolineKind kind, const ir::FuncSig& sig) {
        TrampolineKey key{kind, sig};
        keys.emplace(key.symbol(), std::move(key));
    };

    uint32_t n_imported = module.num_imported_functions();
    for (uint32_t i = 0; i < module.total_functions(); ++i) {
        const ir::FuncSig* sig = module.function_sig(i);
        if (!sig) {
            continue;
        }
        add(i < n_imported ? TrampolineKind::WasmToHost : TrampolineKind::HostToWasm, *sig);
    }
    for (uint32_t c = 0; c < static_cast<uint32_t>(runtime::LibCall::Count); ++c) {
        add(TrampolineKind::WasmToHost, runtime::libcall_sig(static_cast<runtime::LibCall>(c)));
    }

    std::vector<TrampolineKey> out;
    out.reserve(keys.size());
    for (auto& [symbol, key] : keys) {
        out.push_back(std::move(key));
    }
    return out;
}

// ============================================================================
// Validation
// ============================================================================

ArtifactCompiler::ArtifactCompiler(target::TargetConfig target,
                                   codegen::CodeGeneratorFactory factory,
                                   trampoline::TrampolineCache& trampolines,
                                   ArtifactCompilerOptions options)
    : target_(target), factory_(std::move(factory)), trampolines_(trampolines),
      options_(std::move(options)) {}

static auto check_limits(const ir::Limits& limits, uint32_t ceiling, const std::string& what)
    -> std::optional<Error> {
    if (limits.max && *limits.max < limits.min) {
        return Error::compile(what + " maximum " + std::to_string(*limits.max) +
                              " is below its minimum " + std::to_string(limits.min));
    }
    if (limits.min > ceiling || (limits.max && *limits.max > ceiling)) {
        return Error::compile(what + " limits exceed " + std::to_string(ceiling));
    }
    return std::nullopt;
}

/// Segment offsets are constants or reads of an imported i32 global.
static auto check_segment_offset(const ir::ModuleIR& module, const ir::ConstExpr& offset,
                                 const std::string& what) -> std::optional<Error> {
    if (offset.kind == ir::ConstExpr::Kind::Value) {
        return std::nullopt;
    }
    if (offset.kind != ir::ConstExpr::Kind::GlobalGet) {
        return Error::compile(what + " offset must be a constant or global.get");
    }
    uint32_t n = 0;
    for (const auto& import : module.imports) {
        if (import.kind != ExternKind::Global || n++ != offset.index) {
            continue;
        }
        if (import.global.kind != ValueKind::I32) {
            return Error::compile(what + " offset reads global " + std::to_string(offset.index) +
                                  ", which is not i32");
        }
        return std::nullopt;
    }
    return Error::compile(what + " offset reads global " + std::to_string(offset.index) +
                          ", which is not an imported global");
}

auto ArtifactCompiler::validate(const ir::ModuleIR& module) const -> std::optional<Error> {
    const auto& features = options_.codegen.features;

    for (const auto& sig : module.types) {
        if (sig.uses(ValueKind::V128)) {
            return Error::compile("type " + sig.to_string() + " uses v128, which is not supported");
        }
        if (sig.results.size() > 1 && !features.multi_value) {
            return Error::compile("type " + sig.to_string() +
                                  " has several results but multi_value is disabled");
        }
        if (sig.uses(ValueKind::Ref) && !features.reference_types) {
            return Error::compile("type " + sig.to_string() +
                                  " uses ref but reference_types is disabled");
        }
    }

    std::set<std::pair<std::string, std::string>> import_names;
    for (const auto& import : module.imports) {
        if (!import_names.emplace(import.module, import.name).second) {
            return Error::compile("duplicate import " + import.module + "." + import.name);
        }
        if (import.kind == ExternKind::Function && import.type_index >= module.types.size()) {
            return Error::compile("import " + import.module + "." + import.name +
                                  " has invalid type index " + std::to_string(import.type_index));
        }
        if (import.kind == ExternKind::Global && import.global.kind == ValueKind::V128) {
            return Error::compile("import " + import.module + "." + import.name +
                                  " is a v128 global, which is not supported");
        }
    }

    for (size_t i = 0; i < module.functions.size(); ++i) {
        if (module.functions[i].type_index >= module.types.size()) {
            return Error::compile_function(
                module.num_imported_functions() + static_cast<uint32_t>(i),
                "invalid type index " + std::to_string(module.functions[i].type_index));
        }
    }

    if (module.total_memories() > 1) {
        return Error::compile("at most one memory is supported, module has " +
                              std::to_string(module.total_memories()));
    }
    if (module.total_tables() > 1) {
        return Error::compile("at most one table is supported, module has " +
                              std::to_string(module.total_tables()));
    }
    if (auto mem = module.memory_type()) {
        if (auto err = check_limits(mem->limits, runtime::WASM_MAX_PAGES, "memory")) {
            return err;
        }
    }
    if (auto table = module.table_type()) {
        if (auto err = check_limits(table->limits, UINT32_MAX, "table")) {
            return err;
        }
    }

    uint32_t n_imported_globals = module.num_imported_globals();
    for (size_t i = 0; i < module.globals.size(); ++i) {
        const auto& global = module.globals[i];
        std::string what = "global " + std::to_string(n_imported_globals + i);
        if (global.type.kind == ValueKind::V128) {
            return Error::compile(what + " is v128, which is not supported");
        }
        if (global.type.kind == ValueKind::Ref && !features.reference_types) {
            return Error::compile(what + " is a ref but reference_types is disabled");
        }
        if (global.init.kind == ir::ConstExpr::Kind::GlobalGet &&
            global.init.index >= n_imported_globals) {
            return Error::compile(what + " initializer reads global " +
                                  std::to_string(global.init.index) +
                                  ", which is not an imported global");
        }
        if (global.init.kind == ir::ConstExpr::Kind::RefFunc &&
            (global.init.index < module.num_imported_functions() ||
             global.init.index >= module.total_functions())) {
            return Error::compile(what + " initializer references function " +
                                  std::to_string(global.init.index) +
                                  ", which the module does not define");
        }
    }

    std::set<std::string> export_names;
    for (const auto& e : module.exports) {
        if (!export_names.insert(e.name).second) {
            return Error::compile("duplicate export '" + e.name + "'");
        }
        uint32_t limit = 0;
        switch (e.kind) {
        case ExternKind::Function:
            limit = module.total_functions();
            break;
        case ExternKind::Memory:
            limit = module.total_memories();
            break;
        case ExternKind::Table:
            limit = module.total_tables();
            break;
        case ExternKind::Global:
            limit = module.total_globals();
            break;
        }
        if (e.index >= limit) {
            return Error::compile("export '" + e.name + "' refers to " +
                                  ir::extern_kind_name(e.kind) + " " + std::to_string(e.index) +
                                  ", which does not exist");
        }
    }

    if (module.start) {
        const ir::FuncSig* sig = module.function_sig(*module.start);
        if (!sig) {
            return Error::compile("start function " + std::to_string(*module.start) +
                                  " does not exist");
        }
        if (!sig->params.empty() || !sig->results.empty()) {
            return Error::compile("start function must have type () -> (), has " +
                                  sig->to_string());
        }
    }

    if (!module.data.empty() && !module.memory_type()) {
        return Error::compile("data segments in a module without a memory");
    }
    if (!module.elements.empty() && !module.table_type()) {
        return Error::compile("element segments in a module without a table");
    }
    for (size_t s = 0; s < module.elements.size(); ++s) {
        for (uint32_t f : module.elements[s].functions) {
            if (f < module.num_imported_functions() || f >= module.total_functions()) {
                return Error::compile("element segment " + std::to_string(s) +
                                      " references function " + std::to_string(f) +
                                      ", which the module does not define");
            }
        }
    }
    for (size_t s = 0; s < module.data.size(); ++s) {
        if (auto err = check_segment_offset(module, module.data[s].offset,
                                            "data segment " + std::to_string(s))) {
            return err;
        }
    }
    for (size_t s = 0; s < module.elements.size(); ++s) {
        if (auto err = check_segment_offset(module, module.elements[s].offset,
                                            "element segment " + std::to_string(s))) {
            return err;
        }
    }

    return std::nullopt;
}

// ============================================================================
// Compilation
// ============================================================================

auto ArtifactCompiler::compile_functions(const ir::ModuleIR& module)
    -> Result<std::vector<codegen::CodegenOutput>, Error> {
    size_t count = module.functions.size();
    uint32_t n_imported = module.num_imported_functions();

    std::vector<std::optional<codegen::CodegenOutput>> outputs(count);
    std::vector<std::optional<Error>> errors(count);

    size_t num_threads = options_.worker_threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0)
            num_threads = 4;
    }
    num_threads = std::min(num_threads, std::max<size_t>(count, 1));

    std::atomic<size_t> current_index{0};
    std::atomic<bool> any_failure{false};

    auto worker = [&]() {
        Box<codegen::CodeGenerator> generator = factory_();
        while (true) {
            size_t i = current_index.fetch_add(1);
            if (i >= count) {
                break;
            }
            uint32_t func_index = n_imported + static_cast<uint32_t>(i);
            if (!generator) {
                errors[i] = Error::compile_function(func_index, "no code generator");
                any_failure.store(true, std::memory_order_relaxed);
                continue;
            }
            auto result = generator->compile_function(module, func_index, target_, options_.codegen);
            if (is_err(result)) {
                errors[i] = std::move(unwrap_err(result));
                any_failure.store(true, std::memory_order_relaxed);
            } else {
                outputs[i] = std::move(unwrap(result));
            }
        }
    };

    WAOT_LOG_DEBUG("compiler", "compiling " << count << " functions of '" << module.name
                                            << "' on " << num_threads << " threads");

    if (num_threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        for (size_t t = 0; t < num_threads; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    if (any_failure.load()) {
        for (auto& err : errors) {
            if (err) {
                return std::move(*err);
            }
        }
    }

    std::vector<codegen::CodegenOutput> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        if (!outputs[i]) {
            return Error::compile_function(n_imported + static_cast<uint32_t>(i),
                                           "code generator produced no output");
        }
        result.push_back(std::move(*outputs[i]));
    }
    return result;
}

auto ArtifactCompiler::build_function(const ir::ModuleIR& module, uint32_t func_index,
                                      codegen::CodegenOutput output,
                                      const std::set<std::string>& allowed)
    -> Result<CompiledFunction, Error> {
    auto parsed = backend::ObjectReader::read(output.object);
    if (is_err(parsed)) {
        return Error::compile_function(func_index,
                                       "unreadable object from code generator: " +
                                           unwrap_err(parsed));
    }
    const backend::ObjectFileInfo& object = unwrap(parsed);

    CompiledFunction fn;
    fn.index = func_index;
    fn.sig = *module.function_sig(func_index);
    fn.symbol = output.symbol;

    std::string lookup = object.kind == backend::BinaryKind::MachO ? "_" + output.symbol
                                                                   : output.symbol;
    const backend::ObjectSymbol* sym = object.find_symbol(lookup);
    if (!sym) {
        return Error::compile_function(func_index, "object does not define " + output.symbol);
    }
    fn.code_size = sym->size;
    if (fn.code_size == 0) {
        for (const auto& section : object.sections) {
            if (backend::ObjectReader::is_code_section(section.name)) {
                fn.code_size += section.size;
            }
        }
    }

    for (const auto& reloc : object.relocations) {
        auto target = classify_relocation(reloc.symbol, object, allowed,
                                          module.num_imported_functions(),
                                          module.total_functions());
        if (is_err(target)) {
            return Error::compile_function(func_index, unwrap_err(target));
        }
        RelocationEntry entry;
        entry.offset = reloc.offset;
        entry.target = unwrap(target);
        entry.symbol = reloc.symbol;
        entry.type_name = reloc.type_name;
        entry.addend = reloc.addend;
        fn.relocations.push_back(std::move(entry));
    }

    fn.object = std::move(output.object);
    fn.import_calls = std::move(output.import_calls);
    fn.libcalls = std::move(output.libcalls);
    return fn;
}

auto ArtifactCompiler::compile(const ir::ModuleIR& module) -> Result<Rc<DylibArtifact>, Error> {
    auto start_time = std::chrono::steady_clock::now();

    if (auto err = validate(module)) {
        return *err;
    }

    auto keys = required_trampolines(module);
    std::set<std::string> allowed;
    for (const auto& key : keys) {
        auto tramp = trampolines_.get_or_create(key);
        if (is_err(tramp)) {
            return unwrap_err(tramp);
        }
        allowed.insert(key.symbol());
    }

    auto outputs = compile_functions(module);
    if (is_err(outputs)) {
        WAOT_LOG_WARN("compiler", unwrap_err(outputs).to_string());
        return unwrap_err(outputs);
    }

    std::vector<CompiledFunction> functions;
    functions.reserve(unwrap(outputs).size());
    uint32_t n_imported = module.num_imported_functions();
    for (size_t i = 0; i < unwrap(outputs).size(); ++i) {
        uint32_t func_index = n_imported + static_cast<uint32_t>(i);
        auto fn = build_function(module, func_index, std::move(unwrap(outputs)[i]), allowed);
        if (is_err(fn)) {
            WAOT_LOG_WARN("compiler", unwrap_err(fn).to_string());
            return unwrap_err(fn);
        }
        functions.push_back(std::move(unwrap(fn)));
    }

    auto artifact = make_rc<DylibArtifact>(ModuleInfo::from_module(module), target_,
                                           std::move(functions), std::move(keys));
    if (auto err = artifact->check_indices()) {
        return Error::compile(*err);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start_time)
                       .count();
    WAOT_LOG_INFO("compiler", "compiled '" << module.name << "': " << artifact->functions().size()
                                           << " functions, " << artifact->code_size()
                                           << " code bytes, " << artifact->trampolines().size()
                                           << " trampolines in " << elapsed << " ms");
    return artifact;
}

} // namespace waot::artifact
