//! # Runtime Object Tests
//!
//! Linear memories, tables, globals, values and the libcall table.

#include "runtime/memory.hpp"

#include <gtest/gtest.h>

using namespace waot;
using namespace waot::runtime;
using ir::ValueKind;

namespace {

auto memory(uint32_t min, std::optional<uint32_t> max, uint32_t page_limit = WASM_MAX_PAGES)
    -> Rc<LinearMemory> {
    auto created = LinearMemory::create(ir::MemoryType{ir::Limits{min, max}}, page_limit);
    EXPECT_TRUE(is_ok(created)) << (is_err(created) ? unwrap_err(created) : "");
    return is_ok(created) ? unwrap(created) : nullptr;
}

} // namespace

// ============================================================================
// LinearMemory
// ============================================================================

TEST(LinearMemoryTest, StartsZeroed) {
    auto mem = memory(1, 2);
    ASSERT_NE(mem, nullptr);
    EXPECT_EQ(mem->pages(), 1u);
    EXPECT_EQ(mem->size_bytes(), WASM_PAGE_SIZE);
    EXPECT_EQ(mem->max_pages(), 2u);

    std::vector<uint8_t> out(64, 0xFF);
    ASSERT_TRUE(mem->read(WASM_PAGE_SIZE - 64, out));
    EXPECT_EQ(out, std::vector<uint8_t>(64, 0));
}

TEST(LinearMemoryTest, DefinitionTracksBuffer) {
    auto mem = memory(1, std::nullopt);
    ASSERT_NE(mem, nullptr);
    EXPECT_EQ(mem->definition()->base, mem->data());
    EXPECT_EQ(mem->definition()->length, WASM_PAGE_SIZE);

    ASSERT_EQ(mem->grow(3), 1u);
    EXPECT_EQ(mem->definition()->base, mem->data());
    EXPECT_EQ(mem->definition()->length, 4 * WASM_PAGE_SIZE);
}

TEST(LinearMemoryTest, GrowKeepsContents) {
    auto mem = memory(1, 4);
    ASSERT_NE(mem, nullptr);
    std::vector<uint8_t> hello = {'h', 'i'};
    ASSERT_TRUE(mem->write(100, hello));

    EXPECT_EQ(mem->grow(0), 1u);
    EXPECT_EQ(mem->grow(2), 1u);
    EXPECT_EQ(mem->pages(), 3u);

    std::vector<uint8_t> out(2);
    ASSERT_TRUE(mem->read(100, out));
    EXPECT_EQ(out, hello);
}

TEST(LinearMemoryTest, GrowPastMaximumFails) {
    auto mem = memory(1, 2);
    ASSERT_NE(mem, nullptr);
    EXPECT_EQ(mem->grow(2), std::nullopt);
    EXPECT_EQ(mem->pages(), 1u);
    EXPECT_EQ(mem->grow(1), 1u);
    EXPECT_EQ(mem->grow(1), std::nullopt);
}

TEST(LinearMemoryTest, PageLimitCapsGrowth) {
    auto mem = memory(1, std::nullopt, 3);
    ASSERT_NE(mem, nullptr);
    EXPECT_EQ(mem->max_pages(), 3u);
    EXPECT_EQ(mem->grow(3), std::nullopt);
    EXPECT_EQ(mem->grow(2), 1u);
}

TEST(LinearMemoryTest, CreateRejectsBadLimits) {
    auto inverted = LinearMemory::create(ir::MemoryType{ir::Limits{3, 2}});
    ASSERT_TRUE(is_err(inverted));
    EXPECT_NE(unwrap_err(inverted).find("below minimum"), std::string::npos);

    auto too_big = LinearMemory::create(ir::MemoryType{ir::Limits{10, std::nullopt}}, 4);
    ASSERT_TRUE(is_err(too_big));
    EXPECT_NE(unwrap_err(too_big).find("exceeds the limit of 4 pages"), std::string::npos);
}

TEST(LinearMemoryTest, BoundsChecks) {
    auto mem = memory(1, 1);
    ASSERT_NE(mem, nullptr);
    std::vector<uint8_t> four(4, 7);

    EXPECT_TRUE(mem->write(WASM_PAGE_SIZE - 4, four));
    EXPECT_FALSE(mem->write(WASM_PAGE_SIZE - 3, four));
    EXPECT_FALSE(mem->write(UINT64_MAX, four));
    EXPECT_TRUE(mem->write(WASM_PAGE_SIZE, std::span<const uint8_t>()));
    EXPECT_FALSE(mem->write(WASM_PAGE_SIZE + 1, std::span<const uint8_t>()));

    // A failed write leaves memory untouched.
    std::vector<uint8_t> tail(3);
    ASSERT_TRUE(mem->read(WASM_PAGE_SIZE - 3, tail));
    EXPECT_EQ(tail, std::vector<uint8_t>(3, 7));
}

TEST(LinearMemoryTest, CopyAndFill) {
    auto mem = memory(1, 1);
    ASSERT_NE(mem, nullptr);
    ASSERT_TRUE(mem->fill(0, 0xAB, 8));
    ASSERT_TRUE(mem->copy_within(4, 0, 8)); // overlapping
    std::vector<uint8_t> out(12);
    ASSERT_TRUE(mem->read(0, out));
    EXPECT_EQ(out, std::vector<uint8_t>(12, 0xAB));

    EXPECT_FALSE(mem->fill(WASM_PAGE_SIZE - 1, 0, 2));
    EXPECT_FALSE(mem->copy_within(0, WASM_PAGE_SIZE - 1, 2));
    EXPECT_TRUE(mem->copy_within(WASM_PAGE_SIZE, 0, 0));
}

// ============================================================================
// Table
// ============================================================================

TEST(TableTest, GetAndSet) {
    auto created = Table::create(ir::TableType{ir::Limits{2, 4}});
    ASSERT_TRUE(is_ok(created));
    auto table = unwrap(created);
    EXPECT_EQ(table->size(), 2u);
    EXPECT_EQ(table->definition()->size, 2u);

    EXPECT_EQ(table->get(0), std::optional<VMFuncRef*>(nullptr));
    EXPECT_EQ(table->get(2), std::nullopt);

    VMFuncRef ref{nullptr, 42, nullptr};
    EXPECT_TRUE(table->set(1, &ref));
    EXPECT_FALSE(table->set(2, &ref));
    EXPECT_EQ(table->get(1), std::optional<VMFuncRef*>(&ref));
    EXPECT_EQ(table->definition()->elements[1], &ref);
}

TEST(TableTest, RejectsInvertedLimits) {
    auto created = Table::create(ir::TableType{ir::Limits{5, 1}});
    ASSERT_TRUE(is_err(created));
    EXPECT_NE(unwrap_err(created).find("below minimum"), std::string::npos);
}

// ============================================================================
// Global
// ============================================================================

TEST(GlobalTest, MutableGlobal) {
    auto created = Global::create(ir::GlobalType{ValueKind::I64, true}, Value::i64(-5));
    ASSERT_TRUE(is_ok(created));
    auto global = unwrap(created);
    EXPECT_EQ(global->get(), Value::i64(-5));

    EXPECT_TRUE(global->set(Value::i64(9)));
    EXPECT_EQ(global->get().as_i64(), 9);
    EXPECT_EQ(*global->cell(), 9u);

    EXPECT_FALSE(global->set(Value::i32(1)));
    EXPECT_EQ(global->get().as_i64(), 9);
}

TEST(GlobalTest, ImmutableGlobalRejectsWrites) {
    auto created = Global::create(ir::GlobalType{ValueKind::F64, false}, Value::f64(1.5));
    ASSERT_TRUE(is_ok(created));
    auto global = unwrap(created);
    EXPECT_FALSE(global->set(Value::f64(2.5)));
    EXPECT_DOUBLE_EQ(global->get().as_f64(), 1.5);
}

TEST(GlobalTest, RejectsKindMismatch) {
    auto created = Global::create(ir::GlobalType{ValueKind::I32, true}, Value::f32(1.0f));
    ASSERT_TRUE(is_err(created));
    EXPECT_EQ(unwrap_err(created), "global of kind i32 initialized with f32");
}

// ============================================================================
// Values and Libcalls
// ============================================================================

TEST(ValueTest, Encoding) {
    EXPECT_EQ(Value::i32(-1).bits, 0xFFFFFFFFu);
    EXPECT_EQ(Value::i32(-1).as_i32(), -1);
    EXPECT_EQ(Value::f32(1.0f).bits, 0x3F800000u);
    EXPECT_EQ(Value::f64(-0.0).bits, 0x8000000000000000ull);
    EXPECT_TRUE(Value::null_ref().is_null());
    EXPECT_FALSE(Value::zero(ValueKind::I32).is_null());
    EXPECT_EQ(Value::i32(42).to_string(), "i32:42");
    EXPECT_EQ(Value::null_ref().to_string(), "ref:null");
}

TEST(LibCallTest, Signatures) {
    EXPECT_EQ(libcall_sig(LibCall::RaiseTrap).key(), "i_v");
    EXPECT_EQ(libcall_sig(LibCall::MemoryGrow).key(), "i_i");
    EXPECT_EQ(libcall_sig(LibCall::MemoryCopy).key(), "iii_v");
    EXPECT_EQ(libcall_sig(LibCall::MemoryFill).key(), "iii_v");
    EXPECT_STREQ(libcall_name(LibCall::MemoryGrow), "memory_grow");
}

TEST(LibCallTest, SignatureIds) {
    auto a = signature_id(libcall_sig(LibCall::MemoryGrow));
    auto b = signature_id(ir::FuncSig{{ValueKind::I32}, {ValueKind::I32}});
    auto c = signature_id(ir::FuncSig{{ValueKind::I64}, {ValueKind::I32}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
