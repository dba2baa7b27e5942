//! # Module IR Tests
//!
//! Signature keys, index spaces and the canonical module encoding.

#include "ir/module_builder.hpp"
#include "test_modules.hpp"

#include <gtest/gtest.h>

using namespace waot;
using namespace waot::ir;
using waot::test::sig;

// ============================================================================
// Signatures
// ============================================================================

TEST(FuncSigTest, Key) {
    EXPECT_EQ(sig({ValueKind::I32, ValueKind::I64}, {ValueKind::F64}).key(), "il_d");
    EXPECT_EQ(sig({}, {}).key(), "v_v");
    EXPECT_EQ(sig({ValueKind::F32, ValueKind::Ref}, {ValueKind::I32, ValueKind::I32}).key(),
              "fr_ii");
}

TEST(FuncSigTest, KeyParsesBack) {
    auto s = sig({ValueKind::I64, ValueKind::F32}, {});
    auto parsed = sig_from_key(s.key());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, s);

    EXPECT_FALSE(sig_from_key("iq_v").has_value());
    EXPECT_FALSE(sig_from_key("ii").has_value());
    EXPECT_FALSE(sig_from_key("i_i_i").has_value());
    EXPECT_FALSE(sig_from_key("_i").has_value());
}

TEST(FuncSigTest, ToStringAndUses) {
    auto s = sig({ValueKind::I32, ValueKind::I64}, {ValueKind::F64});
    EXPECT_EQ(s.to_string(), "(i32, i64) -> (f64)");
    EXPECT_TRUE(s.uses(ValueKind::I64));
    EXPECT_FALSE(s.uses(ValueKind::V128));
}

TEST(FuncSigTest, BinaryReadBack) {
    auto s = sig({ValueKind::F32}, {ValueKind::Ref, ValueKind::I64});
    ByteWriter w;
    write_sig(w, s);
    ByteReader r(w.data());
    EXPECT_EQ(read_sig(r), s);
    EXPECT_TRUE(r.at_end());
}

TEST(FuncSigTest, InvalidKindByteIsError) {
    std::vector<uint8_t> bytes = {1, 0, 0, 0, 9, 0, 0, 0, 0};
    ByteReader r(bytes);
    (void)read_sig(r);
    EXPECT_TRUE(r.has_error());
}

// ============================================================================
// Index Spaces
// ============================================================================

TEST(ModuleIRTest, ImportsComeFirst) {
    auto module = test::import_module();
    EXPECT_EQ(module.num_imported_functions(), 2u);
    EXPECT_EQ(module.total_functions(), 4u);

    const FuncSig* first_defined = module.function_sig(2);
    ASSERT_NE(first_defined, nullptr);
    EXPECT_EQ(first_defined->key(), "i_i");
    EXPECT_EQ(module.function_sig(1)->key(), "l_v");
    EXPECT_EQ(module.function_sig(4), nullptr);

    const Import* add_one = module.imported(ExternKind::Function, 0);
    ASSERT_NE(add_one, nullptr);
    EXPECT_EQ(add_one->name, "add_one");
}

TEST(ModuleIRTest, MemoryAndTableLookups) {
    auto memory = test::memory_module();
    ASSERT_TRUE(memory.memory_type().has_value());
    EXPECT_EQ(memory.memory_type()->limits.min, 1u);
    EXPECT_EQ(memory.memory_type()->limits.max, 4u);
    EXPECT_FALSE(memory.table_type().has_value());

    auto table = test::table_module();
    ASSERT_TRUE(table.table_type().has_value());
    EXPECT_EQ(table.table_type()->limits.min, 4u);
}

TEST(ModuleIRTest, GlobalsAndStart) {
    auto module = test::global_module();
    EXPECT_EQ(module.total_globals(), 1u);
    ASSERT_NE(module.global_type(0), nullptr);
    EXPECT_TRUE(module.global_type(0)->is_mutable);
    EXPECT_EQ(module.start, 1u);
}

TEST(ModuleIRTest, FindExport) {
    auto module = test::math_module();
    const Export* fac = module.find_export("fac");
    ASSERT_NE(fac, nullptr);
    EXPECT_EQ(fac->kind, ExternKind::Function);
    EXPECT_EQ(fac->index, 2u);
    EXPECT_EQ(module.find_export("missing"), nullptr);
}

TEST(ModuleBuilderTest, AddTypeDeduplicates) {
    ModuleBuilder b("dedupe");
    auto s = sig({ValueKind::I32}, {ValueKind::I32});
    EXPECT_EQ(b.add_type(s), 0u);
    EXPECT_EQ(b.add_type(sig({}, {})), 1u);
    EXPECT_EQ(b.add_type(s), 0u);
    EXPECT_EQ(b.module().types.size(), 2u);
}

// ============================================================================
// Encoding
// ============================================================================

TEST(ModuleIRTest, EncodingIsDeterministic) {
    EXPECT_EQ(test::math_module().encode(), test::math_module().encode());
    EXPECT_EQ(test::math_module().content_hash(), test::math_module().content_hash());
}

TEST(ModuleIRTest, ContentHashTracksBodies) {
    auto a = test::math_module();
    auto b = test::math_module();
    b.functions[0].body[2].op = Opcode::I32Sub;
    EXPECT_NE(a.content_hash(), b.content_hash());

    auto c = test::math_module();
    c.exports[0].name = "plus";
    EXPECT_NE(a.content_hash(), c.content_hash());
}

TEST(OpcodeTest, Names) {
    EXPECT_STREQ(opcode_name(Opcode::I32Add), "i32.add");
    EXPECT_STREQ(opcode_name(Opcode::CallIndirect), "call_indirect");
    EXPECT_STREQ(extern_kind_name(ExternKind::Global), "global");
}
