//! # Imports

#include "runtime/imports.hpp"

#include "log/log.hpp"

#include <exception>

namespace waot::runtime {

// ============================================================================
// HostFunction
// ============================================================================

HostFunction::HostFunction(ir::FuncSig sig, HostCallback callback)
    : sig_(std::move(sig)), callback_(std::move(callback)) {}

auto HostFunction::create(ir::FuncSig sig, HostCallback callback) -> Rc<HostFunction> {
    return make_rc<HostFunction>(std::move(sig), std::move(callback));
}

auto HostFunction::invoke(std::span<const Value> args) const -> HostResult {
    HostResult result = Trap::user("host function has no callback");
    if (!callback_) {
        return result;
    }
    try {
        result = callback_(args);
    } catch (const std::exception& e) {
        return Trap::user(std::string("host function threw: ") + e.what());
    } catch (...) {
        return Trap::user("host function threw a non-standard exception");
    }
    if (is_err(result)) {
        return result;
    }

    const auto& values = unwrap(result);
    if (values.size() != sig_.results.size()) {
        return Trap::user("host function returned " + std::to_string(values.size()) +
                          " values, signature " + sig_.to_string() + " expects " +
                          std::to_string(sig_.results.size()));
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i].kind != sig_.results[i]) {
            return Trap::user("host function result " + std::to_string(i) + " is " +
                              ir::value_kind_name(values[i].kind) + ", expected " +
                              ir::value_kind_name(sig_.results[i]));
        }
    }
    return result;
}

/// Every object with a destructor lives in this frame, so it is gone
/// before the caller jumps.
static auto dispatch_host_call(const HostFunction& fn, uint64_t* values) -> bool {
    const ir::FuncSig& sig = fn.sig();
    std::vector<Value> args;
    args.reserve(sig.params.size());
    for (size_t i = 0; i < sig.params.size(); ++i) {
        uint64_t bits = values[i];
        if (sig.params[i] == ir::ValueKind::I32 || sig.params[i] == ir::ValueKind::F32) {
            bits &= 0xFFFFFFFFu;
        }
        args.push_back(Value{sig.params[i], bits});
    }

    HostResult result = fn.invoke(args);
    if (is_err(result)) {
        set_pending_trap(std::move(unwrap_err(result)));
        return false;
    }
    const auto& results = unwrap(result);
    for (size_t i = 0; i < results.size(); ++i) {
        values[i] = results[i].bits;
    }
    return true;
}

void host_function_dispatch(void* env, VMContext* /*vmctx*/, uint64_t* values) {
    if (!dispatch_host_call(*static_cast<const HostFunction*>(env), values)) {
        raise_pending_trap();
    }
}

// ============================================================================
// Externs
// ============================================================================

auto extern_kind(const Extern& ext) -> ir::ExternKind {
    switch (ext.index()) {
    case 0:
        return ir::ExternKind::Function;
    case 1:
        return ir::ExternKind::Memory;
    case 2:
        return ir::ExternKind::Table;
    default:
        return ir::ExternKind::Global;
    }
}

static auto describe_limits(const ir::Limits& limits, const char* unit) -> std::string {
    std::string out = std::to_string(limits.min) + "..";
    if (limits.max) {
        out += std::to_string(*limits.max);
    }
    return out + " " + unit;
}

auto describe_extern(const Extern& ext) -> std::string {
    if (auto fn = std::get_if<Rc<HostFunction>>(&ext)) {
        return "function " + (*fn)->sig().to_string();
    }
    if (auto mem = std::get_if<Rc<LinearMemory>>(&ext)) {
        return "memory " + describe_limits((*mem)->type().limits, "pages");
    }
    if (auto table = std::get_if<Rc<Table>>(&ext)) {
        return "table " + describe_limits((*table)->type().limits, "elements");
    }
    const auto& global = std::get<Rc<Global>>(ext);
    return std::string("global ") + (global->type().is_mutable ? "mut " : "") +
           ir::value_kind_name(global->type().kind);
}

// ============================================================================
// Imports
// ============================================================================

void Imports::define(const std::string& module, const std::string& name, Extern value) {
    entries_.insert_or_assign({module, name}, std::move(value));
}

auto Imports::find(const std::string& module, const std::string& name) const -> const Extern* {
    auto it = entries_.find({module, name});
    return it == entries_.end() ? nullptr : &it->second;
}

} // namespace waot::runtime
