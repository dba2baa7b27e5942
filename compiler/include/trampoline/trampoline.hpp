//! # Trampolines
//!
//! Native stubs bridging the host calling convention and the convention of
//! generated wasm functions. One stub exists per (direction, signature).
//!
//! | Direction    | Symbol              | Native signature                                  |
//! |--------------|---------------------|---------------------------------------------------|
//! | HostToWasm   | `waot_h2w_<key>`    | `void(VMContext*, void* callee, uint64_t* values)` |
//! | WasmToHost   | `waot_w2h_<key>`    | `R(VMCallee*, VMContext*, params...)`             |
//!
//! `values` is an array of 64-bit slots, one per parameter on entry and one
//! per result on return. i32 and f32 occupy the low 32 bits of their slot,
//! references hold the `VMFuncRef*`.
//!
//! Stubs are emitted as LLVM IR and compiled with the target's triple, so
//! register and stack assignment of mixed integer and float parameters is
//! whatever the platform convention says.

#ifndef WAOT_TRAMPOLINE_TRAMPOLINE_HPP
#define WAOT_TRAMPOLINE_TRAMPOLINE_HPP

#include "backend/llvm_backend.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "ir/module_ir.hpp"
#include "target/target.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace waot::trampoline {

enum class TrampolineKind : uint8_t {
    HostToWasm = 0,
    WasmToHost = 1,
};

[[nodiscard]] auto trampoline_kind_name(TrampolineKind kind) -> const char*;

struct TrampolineKey {
    TrampolineKind kind = TrampolineKind::HostToWasm;
    ir::FuncSig sig;

    bool operator==(const TrampolineKey& other) const = default;

    /// `waot_h2w_il_d` / `waot_w2h_il_d`
    [[nodiscard]] auto symbol() const -> std::string;
};

/// A compiled stub. Immutable once produced.
struct Trampoline {
    TrampolineKey key;
    std::string symbol;
    std::vector<uint8_t> object;
    std::string ir;
};

/// Emits and compiles trampolines. Not thread-safe.
class TrampolineGenerator {
public:
    TrampolineGenerator(target::TargetConfig target, int optimization_level);

    /// LLVM IR of the stub. Fails for value kinds no stub can carry.
    [[nodiscard]] auto generate_ir(const TrampolineKey& key) const -> Result<std::string, Error>;

    [[nodiscard]] auto generate(const TrampolineKey& key) -> Result<Trampoline, Error>;

    [[nodiscard]] auto target() const -> const target::TargetConfig& {
        return target_;
    }

private:
    target::TargetConfig target_;
    int optimization_level_;
    backend::LLVMBackend backend_;

    auto host_to_wasm_ir(const ir::FuncSig& sig) const -> std::string;
    auto wasm_to_host_ir(const ir::FuncSig& sig) const -> std::string;
};

/// Engine-wide trampoline store. Each key is generated once, under the
/// lock, and shared read-only afterwards.
class TrampolineCache {
public:
    TrampolineCache(target::TargetConfig target, int optimization_level);

    TrampolineCache(const TrampolineCache&) = delete;
    TrampolineCache& operator=(const TrampolineCache&) = delete;

    [[nodiscard]] auto get_or_create(const TrampolineKey& key)
        -> Result<Rc<const Trampoline>, Error>;

    [[nodiscard]] auto host_to_wasm(const ir::FuncSig& sig) -> Result<Rc<const Trampoline>, Error> {
        return get_or_create({TrampolineKind::HostToWasm, sig});
    }

    [[nodiscard]] auto wasm_to_host(const ir::FuncSig& sig) -> Result<Rc<const Trampoline>, Error> {
        return get_or_create({TrampolineKind::WasmToHost, sig});
    }

    /// Cached trampoline or nullptr; never generates.
    [[nodiscard]] auto find(const TrampolineKey& key) const -> Rc<const Trampoline>;

    [[nodiscard]] auto size() const -> size_t;

    /// Number of stubs actually generated (cache misses).
    [[nodiscard]] auto generated_count() const -> size_t;

private:
    mutable std::mutex mutex_;
    TrampolineGenerator generator_;
    std::map<std::string, Rc<const Trampoline>> entries_;
    size_t generated_ = 0;
};

} // namespace waot::trampoline

#endif // WAOT_TRAMPOLINE_TRAMPOLINE_HPP
