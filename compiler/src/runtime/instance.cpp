//! # Instance Implementation

#include "runtime/instance.hpp"

#include "log/log.hpp"
#include "trampoline/trampoline.hpp"

#include <algorithm>

namespace waot::runtime {

// ============================================================================
// Import Checks
// ============================================================================

/// Import subtyping: the provided object must be at least as large as
/// required and may not grow past the required maximum.
static auto limits_match(uint32_t provided_min, const std::optional<uint32_t>& provided_max,
                         const ir::Limits& required) -> bool {
    if (provided_min < required.min) {
        return false;
    }
    if (required.max) {
        return provided_max && *provided_max <= *required.max;
    }
    return true;
}

static auto check_import(const artifact::ImportEntry& import, const Extern& ext) -> bool {
    switch (import.kind) {
    case ir::ExternKind::Function: {
        auto fn = std::get_if<Rc<HostFunction>>(&ext);
        return fn && (*fn)->sig() == import.sig;
    }
    case ir::ExternKind::Memory: {
        auto mem = std::get_if<Rc<LinearMemory>>(&ext);
        return mem && limits_match((*mem)->pages(), (*mem)->type().limits.max,
                                   import.memory.limits);
    }
    case ir::ExternKind::Table: {
        auto table = std::get_if<Rc<Table>>(&ext);
        return table &&
               limits_match((*table)->size(), (*table)->type().limits.max, import.table.limits);
    }
    case ir::ExternKind::Global: {
        auto global = std::get_if<Rc<Global>>(&ext);
        return global && (*global)->type() == import.global;
    }
    }
    return false;
}

auto check_imports(const artifact::DylibArtifact& artifact, const Imports& imports)
    -> std::optional<Error> {
    for (const auto& import : artifact.info().imports) {
        const Extern* ext = imports.find(import.module, import.name);
        if (!ext) {
            return Error::link("unknown import: " + import.qualified_name() +
                               " has not been defined");
        }
        if (!check_import(import, *ext)) {
            return Error::link("incompatible import type for " + import.qualified_name() +
                               ": expected " + import.describe() + ", found " +
                               describe_extern(*ext));
        }
    }
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

Instance::Instance(Token, Rc<artifact::DylibArtifact> artifact, Rc<LoadedLibrary> library,
                   const InstanceConfig& config)
    : artifact_(std::move(artifact)), library_(std::move(library)), config_(config) {}

Instance::~Instance() {
    WAOT_LOG_TRACE("instance", "dropping instance of '" << artifact_->name() << "'");
}

auto Instance::create(Rc<artifact::DylibArtifact> artifact, Rc<LoadedLibrary> library,
                      const Imports& imports, const InstanceConfig& config)
    -> Result<Box<Instance>, Error> {
    if (auto err = check_imports(*artifact, imports)) {
        return *err;
    }
    if (!library) {
        return Error::instantiation("artifact '" + artifact->name() + "' has no loaded code");
    }

    auto instance = make_box<Instance>(Token{}, std::move(artifact), std::move(library), config);
    if (auto err = instance->bind_imports(imports)) {
        return *err;
    }
    if (auto err = instance->bind_code()) {
        return *err;
    }
    if (auto err = instance->allocate()) {
        return *err;
    }

    VMContext& ctx = instance->vmctx_;
    ctx.memory = instance->memory_ ? instance->memory_->definition() : nullptr;
    ctx.table = instance->table_ ? instance->table_->definition() : nullptr;
    ctx.globals = instance->global_cells_.data();
    ctx.imported_functions = instance->imported_callees_.data();
    ctx.libcalls = instance->libcalls_.data();
    ctx.funcrefs = instance->funcrefs_.data();
    ctx.stack_limit = 0;
    ctx.instance = instance.get();

    if (auto err = instance->initialize_segments()) {
        return *err;
    }

    const auto& start = instance->artifact_->info().start;
    if (start) {
        auto result = instance->call_function(*start, {});
        if (is_err(result)) {
            return Error::instantiation("start function trapped: " +
                                        unwrap_err(result).to_string());
        }
    }

    WAOT_LOG_DEBUG("instance", "instantiated '" << instance->artifact_->name() << "'");
    return instance;
}

auto Instance::bind_imports(const Imports& imports) -> std::optional<Error> {
    for (const auto& import : artifact_->info().imports) {
        const Extern& ext = *imports.find(import.module, import.name);
        switch (import.kind) {
        case ir::ExternKind::Function: {
            const auto& fn = std::get<Rc<HostFunction>>(ext);
            host_functions_.push_back(fn);
            imported_callees_.push_back(VMCallee{&host_function_dispatch, fn.get()});
            break;
        }
        case ir::ExternKind::Memory:
            memory_ = std::get<Rc<LinearMemory>>(ext);
            break;
        case ir::ExternKind::Table:
            table_ = std::get<Rc<Table>>(ext);
            break;
        case ir::ExternKind::Global:
            globals_.push_back(std::get<Rc<Global>>(ext));
            break;
        }
    }
    return std::nullopt;
}

auto Instance::bind_code() -> std::optional<Error> {
    const auto& functions = artifact_->functions();
    funcrefs_.reserve(functions.size());
    entry_trampolines_.reserve(functions.size());

    for (const auto& fn : functions) {
        void* code = library_->symbol(fn.symbol);
        if (!code) {
            return Error::instantiation("loaded library does not export " + fn.symbol);
        }
        std::string entry = trampoline::TrampolineKey{trampoline::TrampolineKind::HostToWasm,
                                                      fn.sig}
                                .symbol();
        void* stub = library_->symbol(entry);
        if (!stub) {
            return Error::instantiation("loaded library does not export " + entry);
        }
        funcrefs_.push_back(VMFuncRef{code, signature_id(fn.sig), &vmctx_});
        entry_trampolines_.push_back(reinterpret_cast<VMTrampoline>(stub));
    }

    libcalls_[static_cast<size_t>(LibCall::RaiseTrap)] = {&Instance::libcall_raise_trap, this};
    libcalls_[static_cast<size_t>(LibCall::MemoryGrow)] = {&Instance::libcall_memory_grow, this};
    libcalls_[static_cast<size_t>(LibCall::MemoryCopy)] = {&Instance::libcall_memory_copy, this};
    libcalls_[static_cast<size_t>(LibCall::MemoryFill)] = {&Instance::libcall_memory_fill, this};
    return std::nullopt;
}

auto Instance::allocate() -> std::optional<Error> {
    const artifact::ModuleInfo& info = artifact_->info();

    if (!info.memories.empty()) {
        auto memory = LinearMemory::create(info.memories.front(), config_.max_memory_pages);
        if (is_err(memory)) {
            return Error::instantiation(unwrap_err(memory));
        }
        memory_ = unwrap(memory);
        if (config_.counters) {
            config_.counters->memories.fetch_add(1);
        }
    }
    if (!info.tables.empty()) {
        auto table = Table::create(info.tables.front());
        if (is_err(table)) {
            return Error::instantiation(unwrap_err(table));
        }
        table_ = unwrap(table);
        if (config_.counters) {
            config_.counters->tables.fetch_add(1);
        }
    }

    for (const auto& def : info.globals) {
        auto bits = eval_const(def.init, def.type.kind);
        if (is_err(bits)) {
            return unwrap_err(bits);
        }
        Value init{def.type.kind, unwrap(bits)};
        auto global = Global::create(def.type, init);
        if (is_err(global)) {
            return Error::instantiation(unwrap_err(global));
        }
        globals_.push_back(unwrap(global));
    }

    global_cells_.reserve(globals_.size());
    for (const auto& global : globals_) {
        global_cells_.push_back(global->cell());
    }
    return std::nullopt;
}

auto Instance::eval_const(const ir::ConstExpr& expr, ir::ValueKind kind) const
    -> Result<uint64_t, Error> {
    uint32_t n_imported = artifact_->num_imported_functions();
    uint64_t bits = 0;
    switch (expr.kind) {
    case ir::ConstExpr::Kind::Value:
        bits = expr.bits;
        break;
    case ir::ConstExpr::Kind::GlobalGet:
        if (expr.index >= globals_.size()) {
            return Error::instantiation("constant expression reads global " +
                                        std::to_string(expr.index) + ", which is not available");
        }
        bits = globals_[expr.index]->get().bits;
        break;
    case ir::ConstExpr::Kind::RefFunc:
        if (expr.index < n_imported || expr.index - n_imported >= funcrefs_.size()) {
            return Error::instantiation("constant expression references function " +
                                        std::to_string(expr.index) +
                                        ", which the module does not define");
        }
        bits = reinterpret_cast<uintptr_t>(&funcrefs_[expr.index - n_imported]);
        break;
    case ir::ConstExpr::Kind::RefNull:
        bits = 0;
        break;
    }
    if (kind == ir::ValueKind::I32 || kind == ir::ValueKind::F32) {
        bits &= 0xFFFFFFFFu;
    }
    return bits;
}

auto Instance::initialize_segments() -> std::optional<Error> {
    const artifact::ModuleInfo& info = artifact_->info();
    uint32_t n_imported = artifact_->num_imported_functions();

    std::vector<uint32_t> data_offsets;
    for (size_t i = 0; i < info.data.size(); ++i) {
        const auto& seg = info.data[i];
        auto evaluated = eval_const(seg.offset, ir::ValueKind::I32);
        if (is_err(evaluated)) {
            return unwrap_err(evaluated);
        }
        auto offset = static_cast<uint32_t>(unwrap(evaluated));
        if (!memory_ || !memory_->in_bounds(offset, seg.bytes.size())) {
            return Error::instantiation("data segment " + std::to_string(i) + " (" +
                                        std::to_string(seg.bytes.size()) + " bytes at " +
                                        std::to_string(offset) + ") does not fit in memory");
        }
        data_offsets.push_back(offset);
    }

    std::vector<uint32_t> element_offsets;
    for (size_t i = 0; i < info.elements.size(); ++i) {
        const auto& seg = info.elements[i];
        auto evaluated = eval_const(seg.offset, ir::ValueKind::I32);
        if (is_err(evaluated)) {
            return unwrap_err(evaluated);
        }
        auto offset = static_cast<uint32_t>(unwrap(evaluated));
        if (!table_ || offset > table_->size() ||
            seg.functions.size() > table_->size() - offset) {
            return Error::instantiation("element segment " + std::to_string(i) + " (" +
                                        std::to_string(seg.functions.size()) + " entries at " +
                                        std::to_string(offset) + ") does not fit in the table");
        }
        for (uint32_t f : seg.functions) {
            if (f < n_imported || f - n_imported >= funcrefs_.size()) {
                return Error::instantiation("element segment " + std::to_string(i) +
                                            " references function " + std::to_string(f) +
                                            ", which the module does not define");
            }
        }
        element_offsets.push_back(offset);
    }

    for (size_t i = 0; i < info.data.size(); ++i) {
        if (!memory_->write(data_offsets[i], info.data[i].bytes)) {
            return Error::instantiation("data segment " + std::to_string(i) + " write failed");
        }
    }
    for (size_t i = 0; i < info.elements.size(); ++i) {
        const auto& funcs = info.elements[i].functions;
        for (size_t k = 0; k < funcs.size(); ++k) {
            VMFuncRef* ref = &funcrefs_[funcs[k] - n_imported];
            if (!table_->set(element_offsets[i] + static_cast<uint32_t>(k), ref)) {
                return Error::instantiation("element segment " + std::to_string(i) +
                                            " write failed");
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Calls
// ============================================================================

auto Instance::call(const std::string& export_name, std::span<const Value> args)
    -> Result<std::vector<Value>, Trap> {
    const ir::Export* exp = artifact_->find_export(export_name);
    if (!exp || exp->kind != ir::ExternKind::Function) {
        return Trap::user("no exported function named '" + export_name + "'");
    }
    return call_function(exp->index, args);
}

auto Instance::call_function(uint32_t func_index, std::span<const Value> args)
    -> Result<std::vector<Value>, Trap> {
    const ir::FuncSig* sig = artifact_->function_sig(func_index);
    if (!sig) {
        return Trap::user("function index " + std::to_string(func_index) + " out of range");
    }
    if (args.size() != sig->params.size()) {
        return Trap::user("expected " + std::to_string(sig->params.size()) + " arguments for " +
                          sig->to_string() + ", got " + std::to_string(args.size()));
    }
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].kind != sig->params[i]) {
            return Trap::user("argument " + std::to_string(i) + " is " +
                              ir::value_kind_name(args[i].kind) + ", expected " +
                              ir::value_kind_name(sig->params[i]));
        }
    }

    uint32_t n_imported = artifact_->num_imported_functions();
    if (func_index < n_imported) {
        return host_functions_[func_index]->invoke(args);
    }

    size_t defined = func_index - n_imported;
    std::vector<uint64_t> values(std::max<size_t>({sig->params.size(), sig->results.size(), 1}));
    for (size_t i = 0; i < args.size(); ++i) {
        values[i] = args[i].bits;
    }

    VMTrampoline entry = entry_trampolines_[defined];
    void* code = funcrefs_[defined].code;
    uint64_t* slots = values.data();
    VMContext* ctx = &vmctx_;
    auto body = [entry, code, slots, ctx] {
        ctx->stack_limit = current_stack_limit();
        entry(ctx, code, slots);
    };
    if (auto trap = catch_traps(body, config_.max_wasm_stack)) {
        return std::move(*trap);
    }

    std::vector<Value> results;
    results.reserve(sig->results.size());
    for (size_t i = 0; i < sig->results.size(); ++i) {
        uint64_t bits = values[i];
        if (sig->results[i] == ir::ValueKind::I32 || sig->results[i] == ir::ValueKind::F32) {
            bits &= 0xFFFFFFFFu;
        }
        results.push_back(Value{sig->results[i], bits});
    }
    return results;
}

auto Instance::global(const std::string& export_name) const -> Rc<Global> {
    const ir::Export* exp = artifact_->find_export(export_name);
    if (!exp || exp->kind != ir::ExternKind::Global || exp->index >= globals_.size()) {
        return nullptr;
    }
    return globals_[exp->index];
}

auto Instance::funcref(uint32_t func_index) -> VMFuncRef* {
    uint32_t n_imported = artifact_->num_imported_functions();
    if (func_index < n_imported || func_index - n_imported >= funcrefs_.size()) {
        return nullptr;
    }
    return &funcrefs_[func_index - n_imported];
}

// ============================================================================
// Libcalls
// ============================================================================

// Each helper returns before the caller jumps, so the trap it built is
// already owned by the pending slot.

static void set_trap_for_code(uint32_t code) {
    if (code < TRAP_CODE_COUNT) {
        set_pending_trap(Trap::from_code(static_cast<TrapCode>(code)));
    } else {
        set_pending_trap(Trap::user("unknown trap code " + std::to_string(code)));
    }
}

void Instance::libcall_raise_trap(void* /*env*/, VMContext* /*vmctx*/, uint64_t* values) {
    set_trap_for_code(static_cast<uint32_t>(values[0]));
    raise_pending_trap();
}

void Instance::libcall_memory_grow(void* env, VMContext* /*vmctx*/, uint64_t* values) {
    auto* self = static_cast<Instance*>(env);
    auto delta = static_cast<uint32_t>(values[0]);
    std::optional<uint32_t> old_pages;
    if (self->memory_) {
        old_pages = self->memory_->grow(delta);
    }
    values[0] = old_pages ? *old_pages : 0xFFFFFFFFu;
}

void Instance::libcall_memory_copy(void* env, VMContext* /*vmctx*/, uint64_t* values) {
    auto* self = static_cast<Instance*>(env);
    auto dst = static_cast<uint32_t>(values[0]);
    auto src = static_cast<uint32_t>(values[1]);
    auto len = static_cast<uint32_t>(values[2]);
    if (!self->memory_ || !self->memory_->copy_within(dst, src, len)) {
        set_trap_for_code(static_cast<uint32_t>(TrapCode::HeapAccessOutOfBounds));
        raise_pending_trap();
    }
}

void Instance::libcall_memory_fill(void* env, VMContext* /*vmctx*/, uint64_t* values) {
    auto* self = static_cast<Instance*>(env);
    auto dst = static_cast<uint32_t>(values[0]);
    auto value = static_cast<uint8_t>(values[1]);
    auto len = static_cast<uint32_t>(values[2]);
    if (!self->memory_ || !self->memory_->fill(dst, value, len)) {
        set_trap_for_code(static_cast<uint32_t>(TrapCode::HeapAccessOutOfBounds));
        raise_pending_trap();
    }
}

} // namespace waot::runtime
