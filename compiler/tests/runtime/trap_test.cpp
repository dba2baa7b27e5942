//! # Trap Tests
//!
//! Trap code tables and the catch_traps / raise_pending_trap unwinding.

#include "runtime/trap.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>

using namespace waot::runtime;

namespace {

void raise_divide_by_zero(void* /*data*/) {
    set_pending_trap(Trap::from_code(TrapCode::IntegerDivisionByZero));
    raise_pending_trap();
}

void raise_user(void* /*data*/) {
    set_pending_trap(Trap::user("host said no"));
    raise_pending_trap();
}

void count(void* data) {
    ++*static_cast<int*>(data);
}

/// Raises after `depth` nested frames of plain recursion.
void nested(int depth) {
    if (depth == 0) {
        set_pending_trap(Trap::from_code(TrapCode::UnreachableCodeReached));
        raise_pending_trap();
    }
    nested(depth - 1);
}

void raise_nested(void* /*data*/) {
    nested(50);
}

struct InnerOuter {
    bool inner_trapped = false;
    bool reached_after_inner = false;
};

void inner_then_continue(void* data) {
    auto* state = static_cast<InnerOuter*>(data);
    auto trap = catch_traps(raise_divide_by_zero, nullptr, 1 << 20);
    state->inner_trapped = trap.has_value();
    state->reached_after_inner = true;
}

} // namespace

// ============================================================================
// Trap Codes
// ============================================================================

TEST(TrapCodeTest, MessagesAndIdentifiers) {
    EXPECT_STREQ(trap_code_message(TrapCode::IntegerDivisionByZero), "integer divide by zero");
    EXPECT_STREQ(trap_code_message(TrapCode::HeapAccessOutOfBounds),
                 "out of bounds memory access");
    EXPECT_STREQ(trap_code_identifier(TrapCode::StackOverflow), "stk_ovf");
    EXPECT_STREQ(trap_code_identifier(TrapCode::IndirectCallToNull), "icall_null");
}

TEST(TrapCodeTest, IdentifiersAreUniqueAndParse) {
    std::set<std::string> seen;
    for (uint32_t i = 0; i < TRAP_CODE_COUNT; ++i) {
        auto code = static_cast<TrapCode>(i);
        std::string id = trap_code_identifier(code);
        EXPECT_TRUE(seen.insert(id).second) << id;
        EXPECT_EQ(trap_code_from_identifier(id), code);
    }
    EXPECT_EQ(trap_code_from_identifier("nope"), std::nullopt);
}

TEST(TrapCodeTest, ToString) {
    EXPECT_EQ(Trap::from_code(TrapCode::HeapAccessOutOfBounds).to_string(),
              "trap (heap_get_oob): out of bounds memory access");
    Trap user = Trap::user("bad input");
    EXPECT_TRUE(user.is_user());
    EXPECT_EQ(user.to_string(), "trap (user): bad input");
}

// ============================================================================
// Unwinding
// ============================================================================

TEST(CatchTrapsTest, NoTrap) {
    int calls = 0;
    auto trap = catch_traps(count, &calls, 1 << 20);
    EXPECT_FALSE(trap.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(in_trap_handler());
    EXPECT_EQ(current_stack_limit(), 0u);
}

TEST(CatchTrapsTest, CatchesCodeTrap) {
    auto trap = catch_traps(raise_divide_by_zero, nullptr, 1 << 20);
    ASSERT_TRUE(trap.has_value());
    EXPECT_EQ(trap->code, TrapCode::IntegerDivisionByZero);
    EXPECT_EQ(trap->message, "integer divide by zero");
    EXPECT_FALSE(in_trap_handler());
}

TEST(CatchTrapsTest, CatchesUserTrap) {
    auto trap = catch_traps(raise_user, nullptr, 1 << 20);
    ASSERT_TRUE(trap.has_value());
    EXPECT_TRUE(trap->is_user());
    EXPECT_EQ(trap->message, "host said no");
}

TEST(CatchTrapsTest, UnwindsDeepFrames) {
    auto trap = catch_traps(raise_nested, nullptr, 1 << 20);
    ASSERT_TRUE(trap.has_value());
    EXPECT_EQ(trap->code, TrapCode::UnreachableCodeReached);
}

TEST(CatchTrapsTest, InnermostHandlerWins) {
    InnerOuter state;
    auto outer = catch_traps(inner_then_continue, &state, 1 << 20);
    EXPECT_FALSE(outer.has_value());
    EXPECT_TRUE(state.inner_trapped);
    EXPECT_TRUE(state.reached_after_inner);
}

TEST(CatchTrapsTest, StackLimitInsideHandler) {
    uint64_t limit = 0;
    bool inside = false;
    auto body = [&]() {
        limit = current_stack_limit();
        inside = in_trap_handler();
    };
    auto trap = catch_traps(body, 1 << 20);
    EXPECT_FALSE(trap.has_value());
    EXPECT_TRUE(inside);
    EXPECT_GT(limit, 0u);

    char marker = 0;
    auto sp = reinterpret_cast<uintptr_t>(&marker);
    EXPECT_LT(limit, sp);
    EXPECT_GT(limit + (2u << 20), sp);
}

TEST(CatchTrapsTest, PendingTrapIsPerThread) {
    std::optional<Trap> a;
    std::optional<Trap> b;
    std::thread t1([&] { a = catch_traps(raise_divide_by_zero, nullptr, 1 << 20); });
    std::thread t2([&] { b = catch_traps(raise_user, nullptr, 1 << 20); });
    t1.join();
    t2.join();
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_EQ(a->code, TrapCode::IntegerDivisionByZero);
    EXPECT_TRUE(b->is_user());
}
