//! # Engine Builder Tests
//!
//! Configuration checks performed by Builder::build. None of these need a
//! toolchain: a failing build must not touch the compiler or linker.

#include "engine/builder.hpp"

#include <gtest/gtest.h>

using namespace waot;
using namespace waot::engine;

namespace {

auto build_error(const Builder& builder) -> std::optional<Error> {
    auto result = builder.build();
    if (is_ok(result)) {
        return std::nullopt;
    }
    return unwrap_err(result);
}

auto host_arch() -> target::Arch {
    return target::TargetConfig::host().arch();
}

auto host_cc() -> target::CallingConvention {
    return target::TargetConfig::host().calling_convention();
}

} // namespace

// ============================================================================
// Target Checks
// ============================================================================

TEST(BuilderTest, HostBuilds) {
    auto result = Builder::host().build();
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& engine = unwrap(result);
    EXPECT_EQ(engine->target(), target::TargetConfig::host());
    EXPECT_EQ(engine->features(), Features{});
    EXPECT_EQ(engine->config().optimization_level, 2);
    EXPECT_TRUE(engine->config().enable_cache);

    EngineStats stats = engine->stats();
    EXPECT_EQ(stats.compiles, 0u);
    EXPECT_EQ(stats.instances_created, 0u);
}

TEST(BuilderTest, UnknownFeatureName) {
    Builder builder(host_arch(), {"warp-drive"}, 64, host_cc());
    auto err = build_error(builder);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Configuration);
    EXPECT_NE(err->message.find("unknown CPU feature 'warp-drive'"), std::string::npos);
}

TEST(BuilderTest, ThirtyTwoBitTarget) {
    Builder builder(host_arch(), {}, 32, host_cc());
    auto err = build_error(builder);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::Configuration);
    EXPECT_NE(err->message.find("pointer width 32"), std::string::npos);
}

TEST(BuilderTest, CallingConventionOfOtherArch) {
    auto cc = host_arch() == target::Arch::X86_64 ? target::CallingConvention::Aapcs64
                                                  : target::CallingConvention::SystemV;
    auto err = build_error(Builder(host_arch(), {}, 64, cc));
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("does not belong to"), std::string::npos);
}

TEST(BuilderTest, SimdNeedsBaselineFeature) {
    Features simd;
    simd.simd = true;
    if (host_arch() == target::Arch::X86_64) {
        auto err = build_error(Builder(host_arch(), {"sse2"}, 64, host_cc(), simd));
        ASSERT_TRUE(err.has_value());
        EXPECT_NE(err->message.find("simd requires the 'sse4.1'"), std::string::npos);

        EXPECT_FALSE(build_error(Builder(host_arch(), {"sse2", "sse4.1"}, 64, host_cc(), simd)));
    } else {
        EXPECT_TRUE(build_error(Builder(host_arch(), {}, 64, host_cc(), simd)).has_value());
        EXPECT_FALSE(build_error(Builder(host_arch(), {"neon"}, 64, host_cc(), simd)));
    }
}

// ============================================================================
// Option Checks
// ============================================================================

TEST(BuilderTest, OptimizationLevelRange) {
    for (int level : {0, 1, 2, 3}) {
        EXPECT_FALSE(build_error(Builder::host().optimization_level(level))) << level;
    }
    auto err = build_error(Builder::host().optimization_level(4));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "optimization level 4 is outside 0..3");
    EXPECT_TRUE(build_error(Builder::host().optimization_level(-1)).has_value());
}

TEST(BuilderTest, MemoryPageLimitRange) {
    EXPECT_TRUE(build_error(Builder::host().max_memory_pages(0)).has_value());
    EXPECT_TRUE(build_error(Builder::host().max_memory_pages(runtime::WASM_MAX_PAGES + 1)));
    EXPECT_FALSE(build_error(Builder::host().max_memory_pages(1)));
    EXPECT_FALSE(build_error(Builder::host().max_memory_pages(runtime::WASM_MAX_PAGES)));
}

TEST(BuilderTest, StackBudgetMinimum) {
    auto err = build_error(Builder::host().max_wasm_stack(MIN_WASM_STACK - 1));
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("below the minimum"), std::string::npos);
    EXPECT_FALSE(build_error(Builder::host().max_wasm_stack(MIN_WASM_STACK)));
}

TEST(BuilderTest, OptionsReachEngine) {
    auto result = Builder::host()
                      .optimization_level(0)
                      .enable_cache(false)
                      .worker_threads(3)
                      .compress_metadata(false)
                      .max_memory_pages(16)
                      .max_wasm_stack(256 * 1024)
                      .work_dir("/tmp/waot-builder-test")
                      .build();
    ASSERT_TRUE(is_ok(result));
    const EngineConfig& config = unwrap(result)->config();
    EXPECT_EQ(config.optimization_level, 0);
    EXPECT_FALSE(config.enable_cache);
    EXPECT_EQ(config.worker_threads, 3u);
    EXPECT_FALSE(config.compress_metadata);
    EXPECT_EQ(config.max_memory_pages, 16u);
    EXPECT_EQ(config.max_wasm_stack, 256u * 1024);
    EXPECT_EQ(config.work_dir, std::filesystem::path("/tmp/waot-builder-test"));
}

TEST(BuilderTest, DefaultWorkDir) {
    EXPECT_FALSE(default_work_dir().empty());
}
