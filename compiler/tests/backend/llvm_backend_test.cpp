// LLVM Backend tests
//
// IR to object compilation and reading the objects back with ObjectReader.

#include "backend/llvm_backend.hpp"
#include "backend/object_reader.hpp"
#include "target/target.hpp"

#include <gtest/gtest.h>

using namespace waot;
using namespace waot::backend;

class LLVMBackendTest : public ::testing::Test {
protected:
    target::TargetConfig host_ = target::TargetConfig::host();

    LLVMCompileOptions host_options(int opt_level = 0) const {
        LLVMCompileOptions opts;
        opts.optimization_level = opt_level;
        opts.target_triple = host_.to_triple();
        opts.cpu = host_.llvm_cpu();
        opts.features = host_.llvm_features();
        return opts;
    }

    std::string symbol(const std::string& name) const {
        return host_.object_format() == target::ObjectFormat::MachO ? "_" + name : name;
    }

    static std::string caller_ir() {
        return R"(
declare i32 @external_helper(i32)

define i32 @waot_func_0(i32 %x) {
entry:
    %r = call i32 @external_helper(i32 %x)
    %s = add i32 %r, 1
    ret i32 %s
}
)";
    }
};

// ============================================================================
// Availability
// ============================================================================

TEST_F(LLVMBackendTest, IsAvailable) {
    EXPECT_TRUE(is_llvm_backend_available());
    EXPECT_FALSE(get_llvm_version().empty());
}

TEST_F(LLVMBackendTest, InitializeSucceeds) {
    LLVMBackend backend;
    EXPECT_FALSE(backend.is_initialized());
    EXPECT_TRUE(backend.initialize());
    EXPECT_TRUE(backend.is_initialized());
    EXPECT_FALSE(backend.get_default_target_triple().empty());
}

TEST_F(LLVMBackendTest, HostFeaturesHaveNoSign) {
    for (const auto& feature : host_cpu_features()) {
        ASSERT_FALSE(feature.empty());
        EXPECT_NE(feature[0], '+');
        EXPECT_NE(feature[0], '-');
    }
}

// ============================================================================
// Compilation
// ============================================================================

TEST_F(LLVMBackendTest, CompileWithoutInitializeFails) {
    LLVMBackend backend;
    auto result = backend.compile_ir_to_buffer(caller_ir(), host_options());
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(LLVMBackendTest, CompileToBuffer) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    auto result = backend.compile_ir_to_buffer(caller_ir(), host_options(2));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(result.object_data.empty());
}

TEST_F(LLVMBackendTest, SyntaxErrorIsReported) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    auto result = backend.compile_ir_to_buffer("define i32 @broken( {", host_options());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("parse"), std::string::npos);
}

TEST_F(LLVMBackendTest, VerifierErrorIsReported) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    // Block without a terminator.
    auto result = backend.compile_ir_to_buffer(R"(
define i32 @no_terminator() {
entry:
    %x = add i32 1, 2
}
)",
                                               host_options());
    EXPECT_FALSE(result.success);
}

TEST_F(LLVMBackendTest, OutputIsDeterministic) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    auto a = backend.compile_ir_to_buffer(caller_ir(), host_options(2));
    auto b = backend.compile_ir_to_buffer(caller_ir(), host_options(2));
    ASSERT_TRUE(a.success && b.success);
    EXPECT_EQ(a.object_data, b.object_data);
}

// ============================================================================
// Object Reader
// ============================================================================

TEST_F(LLVMBackendTest, ReadSymbolsAndRelocations) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    auto compiled = backend.compile_ir_to_buffer(caller_ir(), host_options());
    ASSERT_TRUE(compiled.success) << compiled.error_message;

    auto read = ObjectReader::read(compiled.object_data);
    ASSERT_TRUE(is_ok(read)) << unwrap_err(read);
    const auto& info = unwrap(read);

    const ObjectSymbol* func = info.find_symbol(symbol("waot_func_0"));
    ASSERT_NE(func, nullptr);
    EXPECT_TRUE(func->defined);
    EXPECT_TRUE(ObjectReader::is_code_section(func->section));
    EXPECT_EQ(info.find_symbol(symbol("external_helper")), nullptr);

    bool found = false;
    for (const auto& reloc : info.relocations) {
        if (reloc.symbol == symbol("external_helper")) {
            found = true;
            EXPECT_TRUE(ObjectReader::is_code_section(reloc.section));
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(LLVMBackendTest, SymbolBytesOfDataGlobal) {
    LLVMBackend backend;
    ASSERT_TRUE(backend.initialize());
    auto compiled = backend.compile_ir_to_buffer(
        "@blob = constant [4 x i8] c\"wasm\", align 8\n", host_options());
    ASSERT_TRUE(compiled.success) << compiled.error_message;

    auto read = ObjectReader::read(compiled.object_data);
    ASSERT_TRUE(is_ok(read));
    const auto& info = unwrap(read);
    const ObjectSymbol* blob = info.find_symbol(symbol("blob"));
    ASSERT_NE(blob, nullptr);
    if (blob->size == 0) {
        GTEST_SKIP() << "object format does not record symbol sizes";
    }
    auto bytes = info.symbol_bytes(*blob);
    ASSERT_TRUE(bytes.has_value());
    ASSERT_GE(bytes->size(), 4u);
    EXPECT_EQ((*bytes)[0], 'w');
    EXPECT_EQ((*bytes)[3], 'm');
}

TEST(ObjectReaderTest, RejectsGarbage) {
    std::vector<uint8_t> garbage(64, 0xAB);
    auto read = ObjectReader::read(garbage);
    EXPECT_TRUE(is_err(read));
}

TEST(ObjectReaderTest, CodeSectionNames) {
    EXPECT_TRUE(ObjectReader::is_code_section(".text"));
    EXPECT_TRUE(ObjectReader::is_code_section(".text.waot_func_3"));
    EXPECT_TRUE(ObjectReader::is_code_section("__text"));
    EXPECT_FALSE(ObjectReader::is_code_section(".data"));
    EXPECT_FALSE(ObjectReader::is_code_section(".rela.text"));
}
