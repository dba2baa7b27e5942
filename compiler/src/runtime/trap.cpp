#include "runtime/trap.hpp"

#include "log/log.hpp"

#include <csetjmp>
#include <exception>

namespace waot::runtime {

// ============================================================================
// Trap Codes
// ============================================================================

auto trap_code_message(TrapCode code) -> const char* {
    switch (code) {
    case TrapCode::StackOverflow:
        return "call stack exhausted";
    case TrapCode::HeapAccessOutOfBounds:
        return "out of bounds memory access";
    case TrapCode::HeapMisaligned:
        return "misaligned heap";
    case TrapCode::TableAccessOutOfBounds:
        return "undefined element: out of bounds table access";
    case TrapCode::OutOfBounds:
        return "out of bounds";
    case TrapCode::IndirectCallToNull:
        return "uninitialized element";
    case TrapCode::BadSignature:
        return "indirect call type mismatch";
    case TrapCode::IntegerOverflow:
        return "integer overflow";
    case TrapCode::IntegerDivisionByZero:
        return "integer divide by zero";
    case TrapCode::BadConversionToInteger:
        return "invalid conversion to integer";
    case TrapCode::UnreachableCodeReached:
        return "unreachable";
    case TrapCode::UnalignedAtomic:
        return "unaligned atomic access";
    }
    return "unknown trap";
}

auto trap_code_identifier(TrapCode code) -> const char* {
    switch (code) {
    case TrapCode::StackOverflow:
        return "stk_ovf";
    case TrapCode::HeapAccessOutOfBounds:
        return "heap_get_oob";
    case TrapCode::HeapMisaligned:
        return "heap_misaligned";
    case TrapCode::TableAccessOutOfBounds:
        return "table_get_oob";
    case TrapCode::OutOfBounds:
        return "oob";
    case TrapCode::IndirectCallToNull:
        return "icall_null";
    case TrapCode::BadSignature:
        return "bad_sig";
    case TrapCode::IntegerOverflow:
        return "int_ovf";
    case TrapCode::IntegerDivisionByZero:
        return "int_divz";
    case TrapCode::BadConversionToInteger:
        return "bad_toint";
    case TrapCode::UnreachableCodeReached:
        return "unreachable";
    case TrapCode::UnalignedAtomic:
        return "unalign_atom";
    }
    return "?";
}

auto trap_code_from_identifier(std::string_view id) -> std::optional<TrapCode> {
    for (uint32_t i = 0; i < TRAP_CODE_COUNT; ++i) {
        auto code = static_cast<TrapCode>(i);
        if (id == trap_code_identifier(code)) {
            return code;
        }
    }
    return std::nullopt;
}

auto Trap::from_code(TrapCode code) -> Trap {
    return Trap{code, trap_code_message(code)};
}

auto Trap::user(std::string message) -> Trap {
    return Trap{std::nullopt, std::move(message)};
}

auto Trap::to_string() const -> std::string {
    if (code) {
        return std::string("trap (") + trap_code_identifier(*code) + "): " + message;
    }
    return "trap (user): " + message;
}

// ============================================================================
// Unwinding
// ============================================================================

namespace {

struct TrapFrame {
    std::jmp_buf buf;
    TrapFrame* prev;
};

thread_local TrapFrame* tls_top_frame = nullptr;
thread_local std::optional<Trap> tls_pending_trap;
thread_local uint64_t tls_stack_limit = 0;

} // namespace

auto catch_traps(void (*body)(void*), void* data, size_t max_wasm_stack) -> std::optional<Trap> {
    TrapFrame frame;
    frame.prev = tls_top_frame;

    if (frame.prev == nullptr) {
        char marker = 0;
        auto sp = reinterpret_cast<uintptr_t>(&marker);
        tls_stack_limit = sp > max_wasm_stack ? sp - max_wasm_stack : 0;
    }
    tls_top_frame = &frame;

    if (setjmp(frame.buf) == 0) {
        body(data);
        tls_top_frame = frame.prev;
        if (tls_top_frame == nullptr) {
            tls_stack_limit = 0;
        }
        return std::nullopt;
    }

    tls_top_frame = frame.prev;
    if (tls_top_frame == nullptr) {
        tls_stack_limit = 0;
    }

    if (!tls_pending_trap) {
        return Trap::user("trap raised without a pending trap");
    }
    Trap trap = std::move(*tls_pending_trap);
    tls_pending_trap.reset();
    WAOT_LOG_DEBUG("instance", "caught " << trap.to_string());
    return trap;
}

void set_pending_trap(Trap trap) {
    tls_pending_trap = std::move(trap);
}

void raise_pending_trap() {
    if (tls_top_frame == nullptr) {
        WAOT_LOG_FATAL("instance", "trap raised outside of generated code");
        std::terminate();
    }
    std::longjmp(tls_top_frame->buf, 1);
}

auto in_trap_handler() -> bool {
    return tls_top_frame != nullptr;
}

auto current_stack_limit() -> uint64_t {
    return tls_stack_limit;
}

} // namespace waot::runtime
