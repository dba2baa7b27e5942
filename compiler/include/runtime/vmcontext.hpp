//! # VMContext Layout
//!
//! The per-instance context block generated code receives as its first
//! argument. Generated code reads it at fixed byte offsets, so the layout
//! here and the offsets in `vmoffsets` are the contract between the code
//! generator and the runtime.
//!
//! ```text
//! offset  field               type
//!      0  memory              VMMemoryDefinition*
//!      8  table               VMTableDefinition*
//!     16  globals             uint64_t** (one cell pointer per global)
//!     24  imported_functions  VMCallee[num imported functions]
//!     32  libcalls            VMCallee[LibCall::Count]
//!     40  funcrefs            VMFuncRef[num defined functions]
//!     48  stack_limit         uint64_t (lowest allowed native sp)
//!     56  instance            InstanceState*
//! ```
//!
//! Reference values (`ref`) are `VMFuncRef*`; null is the null reference.

#ifndef WAOT_RUNTIME_VMCONTEXT_HPP
#define WAOT_RUNTIME_VMCONTEXT_HPP

#include "common/crc32c.hpp"
#include "ir/module_ir.hpp"

#include <cstddef>
#include <cstdint>

namespace waot::runtime {

struct VMContext;

/// Bounds of the linear memory. `length` is in bytes.
struct VMMemoryDefinition {
    uint8_t* base;
    uint64_t length;
};

/// A function reference: native entry point, signature id, and the
/// context to pass it.
struct VMFuncRef {
    void* code;
    uint64_t type_id;
    VMContext* vmctx;
};

struct VMTableDefinition {
    VMFuncRef** elements;
    uint64_t size;
};

/// Host entry point reached through a wasm-calls-host trampoline.
/// `values` holds the arguments on entry and the results on return, one
/// 64-bit slot each.
using VMHostCall = void (*)(void* env, VMContext* vmctx, uint64_t* values);

struct VMCallee {
    VMHostCall call;
    void* env;
};

struct VMContext {
    VMMemoryDefinition* memory;
    VMTableDefinition* table;
    uint64_t** globals;
    VMCallee* imported_functions;
    VMCallee* libcalls;
    VMFuncRef* funcrefs;
    uint64_t stack_limit;
    void* instance;
};

/// Host-calls-wasm trampoline entry: `(vmctx, wasm function, values)`.
using VMTrampoline = void (*)(VMContext* vmctx, void* callee, uint64_t* values);

namespace vmoffsets {

constexpr uint32_t MEMORY = 0;
constexpr uint32_t TABLE = 8;
constexpr uint32_t GLOBALS = 16;
constexpr uint32_t IMPORTED_FUNCTIONS = 24;
constexpr uint32_t LIBCALLS = 32;
constexpr uint32_t FUNCREFS = 40;
constexpr uint32_t STACK_LIMIT = 48;
constexpr uint32_t INSTANCE = 56;
constexpr uint32_t VMCONTEXT_SIZE = 64;

constexpr uint32_t MEMORY_BASE = 0;
constexpr uint32_t MEMORY_LENGTH = 8;

constexpr uint32_t TABLE_ELEMENTS = 0;
constexpr uint32_t TABLE_SIZE = 8;

constexpr uint32_t CALLEE_CALL = 0;
constexpr uint32_t CALLEE_ENV = 8;
constexpr uint32_t CALLEE_SIZE = 16;

constexpr uint32_t FUNCREF_CODE = 0;
constexpr uint32_t FUNCREF_TYPE_ID = 8;
constexpr uint32_t FUNCREF_VMCTX = 16;
constexpr uint32_t FUNCREF_SIZE = 24;

} // namespace vmoffsets

static_assert(offsetof(VMContext, memory) == vmoffsets::MEMORY);
static_assert(offsetof(VMContext, table) == vmoffsets::TABLE);
static_assert(offsetof(VMContext, globals) == vmoffsets::GLOBALS);
static_assert(offsetof(VMContext, imported_functions) == vmoffsets::IMPORTED_FUNCTIONS);
static_assert(offsetof(VMContext, libcalls) == vmoffsets::LIBCALLS);
static_assert(offsetof(VMContext, funcrefs) == vmoffsets::FUNCREFS);
static_assert(offsetof(VMContext, stack_limit) == vmoffsets::STACK_LIMIT);
static_assert(offsetof(VMContext, instance) == vmoffsets::INSTANCE);
static_assert(sizeof(VMContext) == vmoffsets::VMCONTEXT_SIZE);
static_assert(offsetof(VMMemoryDefinition, length) == vmoffsets::MEMORY_LENGTH);
static_assert(offsetof(VMTableDefinition, size) == vmoffsets::TABLE_SIZE);
static_assert(sizeof(VMCallee) == vmoffsets::CALLEE_SIZE);
static_assert(offsetof(VMFuncRef, type_id) == vmoffsets::FUNCREF_TYPE_ID);
static_assert(offsetof(VMFuncRef, vmctx) == vmoffsets::FUNCREF_VMCTX);
static_assert(sizeof(VMFuncRef) == vmoffsets::FUNCREF_SIZE);

/// Wasm page size in bytes.
constexpr uint64_t WASM_PAGE_SIZE = 65536;

/// Maximum number of pages a 32-bit memory can have.
constexpr uint32_t WASM_MAX_PAGES = 65536;

// ============================================================================
// Libcalls
// ============================================================================

/// Runtime services generated code calls through `VMContext::libcalls`.
/// Each is reached via the wasm-calls-host trampoline of its signature.
enum class LibCall : uint32_t {
    RaiseTrap = 0,  ///< (i32 trap code) -> ()
    MemoryGrow = 1, ///< (i32 delta pages) -> (i32 old pages or -1)
    MemoryCopy = 2, ///< (i32 dst, i32 src, i32 len) -> ()
    MemoryFill = 3, ///< (i32 dst, i32 value, i32 len) -> ()
    Count = 4,
};

[[nodiscard]] inline auto libcall_name(LibCall call) -> const char* {
    switch (call) {
    case LibCall::RaiseTrap:
        return "raise_trap";
    case LibCall::MemoryGrow:
        return "memory_grow";
    case LibCall::MemoryCopy:
        return "memory_copy";
    case LibCall::MemoryFill:
        return "memory_fill";
    case LibCall::Count:
        break;
    }
    return "?";
}

[[nodiscard]] inline auto libcall_sig(LibCall call) -> ir::FuncSig {
    using ir::ValueKind;
    switch (call) {
    case LibCall::RaiseTrap:
        return {{ValueKind::I32}, {}};
    case LibCall::MemoryGrow:
        return {{ValueKind::I32}, {ValueKind::I32}};
    case LibCall::MemoryCopy:
    case LibCall::MemoryFill:
        return {{ValueKind::I32, ValueKind::I32, ValueKind::I32}, {}};
    case LibCall::Count:
        break;
    }
    return {};
}

/// Signature id stored in funcrefs and compared by `call_indirect`.
[[nodiscard]] inline auto signature_id(const ir::FuncSig& sig) -> uint64_t {
    return crc32c(sig.key());
}

} // namespace waot::runtime

#endif // WAOT_RUNTIME_VMCONTEXT_HPP
