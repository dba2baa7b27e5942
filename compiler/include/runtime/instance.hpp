//! # Instances
//!
//! A live binding of an artifact to its imports. The instance owns its
//! VMContext and everything the VMContext points into (callee arrays,
//! funcrefs, global cells) and shares the artifact's loaded code region.
//!
//! ## Instantiation Order
//!
//! 1. Import resolution and shape checks. Nothing is allocated before all
//!    imports match.
//! 2. Symbol binding against the loaded library.
//! 3. Memory, table and global allocation.
//! 4. Data and element segments, bounds-checked before anything is
//!    written.
//! 5. The start function.
//!
//! Instances are not thread-safe and never move once created.

#ifndef WAOT_RUNTIME_INSTANCE_HPP
#define WAOT_RUNTIME_INSTANCE_HPP

#include "artifact/artifact.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "runtime/imports.hpp"
#include "runtime/loaded_library.hpp"
#include "runtime/memory.hpp"
#include "runtime/trap.hpp"
#include "runtime/value.hpp"
#include "runtime/vmcontext.hpp"

#include <array>
#include <atomic>
#include <span>
#include <string>
#include <vector>

namespace waot::runtime {

/// Counts runtime objects instances allocate for themselves (imported ones
/// are not counted).
struct AllocationCounters {
    std::atomic<uint64_t> memories{0};
    std::atomic<uint64_t> tables{0};
};

struct InstanceConfig {
    /// Native stack budget for wasm frames, in bytes.
    size_t max_wasm_stack = 1024 * 1024;

    /// Growth ceiling for memories the instance defines.
    uint32_t max_memory_pages = WASM_MAX_PAGES;

    AllocationCounters* counters = nullptr;
};

/// Checks every import of `artifact` against `imports` without allocating
/// anything. Returns the first mismatch as a Link error.
[[nodiscard]] auto check_imports(const artifact::DylibArtifact& artifact, const Imports& imports)
    -> std::optional<Error>;

class Instance {
    struct Token {
        explicit Token() = default;
    };

public:
    /// `library` must be the artifact's loaded code region.
    [[nodiscard]] static auto create(Rc<artifact::DylibArtifact> artifact,
                                     Rc<LoadedLibrary> library, const Imports& imports,
                                     const InstanceConfig& config) -> Result<Box<Instance>, Error>;

    /// Use `create`.
    Instance(Token, Rc<artifact::DylibArtifact> artifact, Rc<LoadedLibrary> library,
             const InstanceConfig& config);
    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;
    Instance(Instance&&) = delete;
    Instance& operator=(Instance&&) = delete;

    /// Calls an exported function. Argument count and kinds must match its
    /// signature.
    [[nodiscard]] auto call(const std::string& export_name, std::span<const Value> args)
        -> Result<std::vector<Value>, Trap>;

    [[nodiscard]] auto call(const std::string& export_name, std::initializer_list<Value> args)
        -> Result<std::vector<Value>, Trap> {
        return call(export_name, std::span<const Value>(args.begin(), args.size()));
    }

    /// The instance's memory (defined or imported), nullptr if none.
    [[nodiscard]] auto memory() const -> Rc<LinearMemory> {
        return memory_;
    }

    [[nodiscard]] auto table() const -> Rc<Table> {
        return table_;
    }

    /// Exported global by export name, nullptr if there is none.
    [[nodiscard]] auto global(const std::string& export_name) const -> Rc<Global>;

    [[nodiscard]] auto artifact() const -> const Rc<artifact::DylibArtifact>& {
        return artifact_;
    }

    [[nodiscard]] auto library() const -> const Rc<LoadedLibrary>& {
        return library_;
    }

    /// Funcref of a defined function, for host code that fills tables.
    [[nodiscard]] auto funcref(uint32_t func_index) -> VMFuncRef*;

    [[nodiscard]] auto vmctx() -> VMContext* {
        return &vmctx_;
    }

private:
    auto bind_imports(const Imports& imports) -> std::optional<Error>;
    auto bind_code() -> std::optional<Error>;
    auto allocate() -> std::optional<Error>;
    auto initialize_segments() -> std::optional<Error>;

    auto eval_const(const ir::ConstExpr& expr, ir::ValueKind kind) const
        -> Result<uint64_t, Error>;

    auto call_function(uint32_t func_index, std::span<const Value> args)
        -> Result<std::vector<Value>, Trap>;

    static void libcall_raise_trap(void* env, VMContext* vmctx, uint64_t* values);
    static void libcall_memory_grow(void* env, VMContext* vmctx, uint64_t* values);
    static void libcall_memory_copy(void* env, VMContext* vmctx, uint64_t* values);
    static void libcall_memory_fill(void* env, VMContext* vmctx, uint64_t* values);

    Rc<artifact::DylibArtifact> artifact_;
    Rc<LoadedLibrary> library_;
    InstanceConfig config_;

    VMContext vmctx_{};
    Rc<LinearMemory> memory_;
    Rc<Table> table_;
    std::vector<Rc<Global>> globals_;
    std::vector<uint64_t*> global_cells_;
    std::vector<Rc<HostFunction>> host_functions_;
    std::vector<VMCallee> imported_callees_;
    std::array<VMCallee, static_cast<size_t>(LibCall::Count)> libcalls_{};
    std::vector<VMFuncRef> funcrefs_;
    std::vector<VMTrampoline> entry_trampolines_;
};

} // namespace waot::runtime

#endif // WAOT_RUNTIME_INSTANCE_HPP
