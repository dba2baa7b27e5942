//! # Imports
//!
//! Host-provided objects an instance links against, keyed by
//! `(module, name)`.
//!
//! ## Host Functions
//!
//! A `HostFunction` wraps a callback with a fixed signature. Generated code
//! reaches it through the wasm-calls-host trampoline of that signature,
//! which spills the arguments into 64-bit slots and calls
//! `host_function_dispatch`. The callback may return a `Trap`; exceptions
//! escaping it are turned into user traps.
//!
//! ```cpp
//! Imports imports;
//! imports.define("env", "add", HostFunction::create(
//!     {{ValueKind::I32, ValueKind::I32}, {ValueKind::I32}},
//!     [](std::span<const Value> args) -> HostResult {
//!         return std::vector<Value>{Value::i32(args[0].as_i32() + args[1].as_i32())};
//!     }));
//! ```

#ifndef WAOT_RUNTIME_IMPORTS_HPP
#define WAOT_RUNTIME_IMPORTS_HPP

#include "common.hpp"
#include "ir/module_ir.hpp"
#include "runtime/memory.hpp"
#include "runtime/trap.hpp"
#include "runtime/value.hpp"
#include "runtime/vmcontext.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace waot::runtime {

using HostResult = Result<std::vector<Value>, Trap>;
using HostCallback = std::function<HostResult(std::span<const Value> args)>;

class HostFunction {
public:
    [[nodiscard]] static auto create(ir::FuncSig sig, HostCallback callback) -> Rc<HostFunction>;

    HostFunction(ir::FuncSig sig, HostCallback callback);

    [[nodiscard]] auto sig() const -> const ir::FuncSig& {
        return sig_;
    }

    /// Runs the callback and checks its results against the signature.
    [[nodiscard]] auto invoke(std::span<const Value> args) const -> HostResult;

private:
    ir::FuncSig sig_;
    HostCallback callback_;
};

/// Entry point stored in `VMCallee::call` for host functions. `env` is the
/// `HostFunction*`. Traps unwind from here.
void host_function_dispatch(void* env, VMContext* vmctx, uint64_t* values);

/// Anything that can satisfy an import.
using Extern = std::variant<Rc<HostFunction>, Rc<LinearMemory>, Rc<Table>, Rc<Global>>;

[[nodiscard]] auto extern_kind(const Extern& ext) -> ir::ExternKind;

/// "function (i32) -> ()", "memory 1..16 pages", "table 4 elements",
/// "global mut i64"
[[nodiscard]] auto describe_extern(const Extern& ext) -> std::string;

class Imports {
public:
    /// Adds or replaces a definition.
    void define(const std::string& module, const std::string& name, Extern value);

    [[nodiscard]] auto find(const std::string& module, const std::string& name) const
        -> const Extern*;

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

private:
    std::map<std::pair<std::string, std::string>, Extern> entries_;
};

} // namespace waot::runtime

#endif // WAOT_RUNTIME_IMPORTS_HPP
