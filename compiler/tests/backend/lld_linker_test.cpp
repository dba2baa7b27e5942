// LLD Linker tests
//
// Linking emitted objects into a shared library.

#include "backend/lld_linker.hpp"
#include "backend/llvm_backend.hpp"
#include "backend/object_reader.hpp"
#include "test_modules.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace waot;
using namespace waot::backend;

class LLDLinkerTest : public ::testing::Test {
protected:
    fs::path temp_dir_;
    target::TargetConfig host_ = target::TargetConfig::host();

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "waot_lld_linker_test";
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    // Compile IR to an object file for linking tests
    fs::path compile_obj(const std::string& ir, const std::string& name) {
        LLVMBackend backend;
        if (!backend.initialize())
            return {};

        LLVMCompileOptions opts;
        opts.target_triple = host_.to_triple();
        opts.cpu = host_.llvm_cpu();
        auto result = backend.compile_ir_to_buffer(ir, opts);
        if (!result.success)
            return {};

        auto path = temp_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(result.object_data.data()),
                  static_cast<std::streamsize>(result.object_data.size()));
        return path;
    }

    LLDLinkOptions options() const {
        LLDLinkOptions opts;
        opts.arch = host_.arch();
        return opts;
    }
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LLDLinkerTest, LinkBeforeInitializeFails) {
    LLDLinker linker;
    EXPECT_FALSE(linker.is_initialized());
    auto result = linker.link({temp_dir_ / "a.o"}, temp_dir_ / "out.so", options());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("not initialized"), std::string::npos);
}

TEST_F(LLDLinkerTest, InitializeFindsLinker) {
    WAOT_REQUIRE_TOOLCHAIN();
    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format())) << linker.get_last_error();
    EXPECT_FALSE(linker.get_lld_path().empty());
}

// ============================================================================
// Linking
// ============================================================================

TEST_F(LLDLinkerTest, RejectsEmptyInput) {
    WAOT_REQUIRE_TOOLCHAIN();
    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format()));
    auto result = linker.link({}, temp_dir_ / "out.so", options());
    EXPECT_FALSE(result.success);
}

TEST_F(LLDLinkerTest, MissingObjectIsReported) {
    WAOT_REQUIRE_TOOLCHAIN();
    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format()));
    auto result = linker.link({temp_dir_ / "missing.o"}, temp_dir_ / "out.so", options());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("missing.o"), std::string::npos);
}

TEST_F(LLDLinkerTest, LinksSharedLibrary) {
    WAOT_REQUIRE_TOOLCHAIN();
    auto a = compile_obj("define i32 @waot_func_0() {\nentry:\n  ret i32 7\n}\n", "a.o");
    auto b = compile_obj("declare i32 @waot_func_0()\n"
                         "define i32 @waot_func_1() {\nentry:\n"
                         "  %v = call i32 @waot_func_0()\n  ret i32 %v\n}\n",
                         "b.o");
    ASSERT_FALSE(a.empty());
    ASSERT_FALSE(b.empty());

    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format()));
    auto out = temp_dir_ / "liblinked.so";
    auto result = linker.link({a, b}, out, options());
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.output_file, out);

    std::ifstream in(out, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    auto read = ObjectReader::read(bytes);
    ASSERT_TRUE(is_ok(read)) << unwrap_err(read);
    std::string prefix = host_.object_format() == target::ObjectFormat::MachO ? "_" : "";
    EXPECT_NE(unwrap(read).find_symbol(prefix + "waot_func_1"), nullptr);
}

TEST_F(LLDLinkerTest, LinkedLibraryNeedsNoOtherLibraries) {
    WAOT_REQUIRE_TOOLCHAIN();
    if (host_.object_format() != target::ObjectFormat::ELF) {
        GTEST_SKIP() << "checks the ELF dynamic string table";
    }
    auto a = compile_obj("define i32 @waot_func_0() {\nentry:\n  ret i32 7\n}\n", "a.o");
    ASSERT_FALSE(a.empty());

    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format()));
    auto out = temp_dir_ / "libalone.so";
    auto result = linker.link({a}, out, options());
    ASSERT_TRUE(result.success) << result.error_message;

    std::ifstream in(out, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    auto read = ObjectReader::read(bytes);
    ASSERT_TRUE(is_ok(read)) << unwrap_err(read);
    const ObjectSection* dynstr = unwrap(read).find_section(".dynstr");
    ASSERT_NE(dynstr, nullptr);
    std::string strings(dynstr->contents.begin(), dynstr->contents.end());
    EXPECT_EQ(strings.find(".so"), std::string::npos);
}

TEST_F(LLDLinkerTest, UnresolvedSymbolFailsWithDiagnostics) {
    WAOT_REQUIRE_TOOLCHAIN();
    if (host_.object_format() != target::ObjectFormat::ELF) {
        GTEST_SKIP() << "--no-undefined is an ELF flag";
    }
    auto obj = compile_obj("declare i32 @nowhere()\n"
                           "define i32 @f() {\nentry:\n  %v = call i32 @nowhere()\n  ret i32 %v\n}\n",
                           "c.o");
    ASSERT_FALSE(obj.empty());

    LLDLinker linker;
    ASSERT_TRUE(linker.initialize(host_.object_format()));
    auto opts = options();
    opts.extra_flags.push_back("--no-undefined");
    auto result = linker.link({obj}, temp_dir_ / "libbad.so", opts);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("nowhere"), std::string::npos);
}
