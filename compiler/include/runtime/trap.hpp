//! # Traps
//!
//! Runtime traps and the unwinding machinery behind them.
//!
//! A trap raised in generated code (through the `RaiseTrap` libcall) or
//! by a host function unwinds every native frame back to the innermost
//! `catch_traps` on the current thread with `longjmp`. Frames skipped by
//! the jump belong to generated code, trampolines and the extern "C"
//! dispatch functions, none of which hold objects with destructors.
//!
//! ## Stack Budget
//!
//! The outermost `catch_traps` on a thread records a stack limit of
//! `sp - max_wasm_stack`. Callers store `current_stack_limit()` into the
//! VMContext before entering generated code, and every generated function
//! compares its frame address against it in the prologue.

#ifndef WAOT_RUNTIME_TRAP_HPP
#define WAOT_RUNTIME_TRAP_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace waot::runtime {

/// A trap code describing the reason for a trap.
enum class TrapCode : uint32_t {
    StackOverflow = 0,          ///< Native stack budget exhausted
    HeapAccessOutOfBounds = 1,  ///< Memory access outside the linear memory
    HeapMisaligned = 2,         ///< Misaligned heap access
    TableAccessOutOfBounds = 3, ///< Table index outside the table
    OutOfBounds = 4,            ///< Other bounds checks (segments)
    IndirectCallToNull = 5,     ///< call_indirect through a null entry
    BadSignature = 6,           ///< call_indirect signature mismatch
    IntegerOverflow = 7,        ///< INT_MIN / -1, float-to-int out of range
    IntegerDivisionByZero = 8,  ///< Division or remainder by zero
    BadConversionToInteger = 9, ///< NaN float-to-int
    UnreachableCodeReached = 10,
    UnalignedAtomic = 11,
};

constexpr uint32_t TRAP_CODE_COUNT = 12;

/// Human-readable message ("out of bounds memory access").
[[nodiscard]] auto trap_code_message(TrapCode code) -> const char*;

/// Short identifier ("heap_get_oob").
[[nodiscard]] auto trap_code_identifier(TrapCode code) -> const char*;

[[nodiscard]] auto trap_code_from_identifier(std::string_view id) -> std::optional<TrapCode>;

/// A trap. `code` is empty for user traps raised by host functions.
struct Trap {
    std::optional<TrapCode> code;
    std::string message;

    [[nodiscard]] static auto from_code(TrapCode code) -> Trap;
    [[nodiscard]] static auto user(std::string message) -> Trap;

    [[nodiscard]] auto is_user() const -> bool {
        return !code.has_value();
    }

    /// "trap (heap_get_oob): out of bounds memory access"
    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Unwinding
// ============================================================================

/// Runs `body(data)`; returns the trap if one was raised inside it.
/// `max_wasm_stack` sets the stack budget when this is the outermost call
/// on the thread and is ignored otherwise.
[[nodiscard]] auto catch_traps(void (*body)(void*), void* data, size_t max_wasm_stack)
    -> std::optional<Trap>;

/// Convenience wrapper for callables. The callable must not own objects
/// with destructors across the call into generated code.
template <typename F>
[[nodiscard]] auto catch_traps(F& body, size_t max_wasm_stack) -> std::optional<Trap> {
    return catch_traps([](void* p) { (*static_cast<F*>(p))(); }, &body, max_wasm_stack);
}

/// Stores the trap to deliver. Returns normally so its argument is
/// destroyed before `raise_pending_trap()` jumps.
void set_pending_trap(Trap trap);

/// Jumps to the innermost `catch_traps` with the pending trap.
[[noreturn]] void raise_pending_trap();

/// True while the current thread is inside `catch_traps`.
[[nodiscard]] auto in_trap_handler() -> bool;

/// Stack limit of the current thread, 0 outside `catch_traps`.
[[nodiscard]] auto current_stack_limit() -> uint64_t;

} // namespace waot::runtime

#endif // WAOT_RUNTIME_TRAP_HPP
