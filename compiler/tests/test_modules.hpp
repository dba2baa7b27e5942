//! # Test Modules
//!
//! Hand-built modules shared by the test suites, plus helpers for suites
//! that need the native toolchain.

#pragma once

#include "engine/builder.hpp"
#include "ir/module_builder.hpp"

#include <filesystem>
#include <gtest/gtest.h>

namespace waot::test {

using ir::FuncSig;
using ir::ValueKind;

inline auto sig(std::vector<ValueKind> params, std::vector<ValueKind> results) -> FuncSig {
    return FuncSig{std::move(params), std::move(results)};
}

/// True when objects can be emitted and linked on this machine.
[[nodiscard]] auto toolchain_available() -> bool;

/// Scratch directory for the suites, `<temp>/waot-tests`.
[[nodiscard]] auto test_work_dir() -> std::filesystem::path;

/// Host engine writing to `test_work_dir()` at optimization level 1.
[[nodiscard]] auto host_builder() -> engine::Builder;

/// add(i32, i32) -> i32, sub64(i64, i64) -> i64, fac(i64) -> i64,
/// sum_to(i32) -> i32 (loop), max_f64(f64, f64) -> f64,
/// mix(i32, f64, i64, f32) -> f64.
[[nodiscard]] auto math_module() -> ir::ModuleIR;

/// One memory of 1..4 pages exported as "memory", "hello" at offset 16.
/// load8(i32) -> i32, load32(i32) -> i32, store32(i32, i32),
/// grow(i32) -> i32, size() -> i32, fill(i32, i32, i32), copy(i32, i32, i32).
[[nodiscard]] auto memory_module() -> ir::ModuleIR;

/// Imports env.add_one (i32) -> i32 and env.record (i64) -> ().
/// call_add_one(i32) -> i32 returns add_one(x) * 2; report(i64) forwards
/// to record.
[[nodiscard]] auto import_module() -> ir::ModuleIR;

/// div_s(i32, i32) -> i32, boom() (unreachable), recurse() (unbounded
/// recursion), oob() -> i32 (load past the end), to_int(f64) -> i32.
[[nodiscard]] auto trap_module() -> ir::ModuleIR;

/// Table of 4 slots: [double, square, seven, null].
/// dispatch(i32 x, i32 slot) -> i32 calls slot with x via call_indirect.
[[nodiscard]] auto table_module() -> ir::ModuleIR;

/// Mutable global "counter" (i32, starts at 10), inc() -> i32, and a
/// start function that adds 5 to it.
[[nodiscard]] auto global_module() -> ir::ModuleIR;

/// swap(i32, i64) -> (i64, i32), divmod(i32, i32) -> (i32, i32).
[[nodiscard]] auto multi_value_module() -> ir::ModuleIR;

/// Imports env.add_one (i32) -> i32 and defines a 1-page memory and a
/// 2-slot table holding call(i32) -> i32, which forwards to add_one.
[[nodiscard]] auto stateful_import_module() -> ir::ModuleIR;

/// Number of parameters of `wide_sig()`.
constexpr size_t WIDE_PARAMS = 20;

/// (i64, f64, i64, f64, ...) -> f64 with `WIDE_PARAMS` parameters.
[[nodiscard]] auto wide_sig() -> FuncSig;

/// Imports env.wide with `wide_sig()`; wide(...) passes every argument to
/// it and returns its result plus 0.25.
[[nodiscard]] auto wide_module() -> ir::ModuleIR;

} // namespace waot::test

#define WAOT_REQUIRE_TOOLCHAIN()                                                                   \
    do {                                                                                           \
        if (!::waot::test::toolchain_available()) {                                                \
            GTEST_SKIP() << "LLVM backend or linker not available";                                \
        }                                                                                          \
    } while (0)
