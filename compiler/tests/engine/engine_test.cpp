//! # Engine Tests
//!
//! Compile cache, serialization through the engine, target checks, import
//! checks and code unloading. Skipped without LLVM and a linker.

#include "codegen/code_generator.hpp"
#include "engine/builder.hpp"
#include "test_modules.hpp"

#include <atomic>
#include <fstream>
#include <gtest/gtest.h>
#include <new>
#include <thread>

using namespace waot;
using namespace waot::engine;
using namespace waot::runtime;
using ir::ValueKind;
using waot::test::sig;

namespace {

auto add_one_imports(int* calls = nullptr) -> Imports {
    Imports imports;
    imports.define("env", "add_one",
                   HostFunction::create(sig({ValueKind::I32}, {ValueKind::I32}),
                                        [calls](std::span<const Value> args) -> HostResult {
                                            if (calls) {
                                                ++*calls;
                                            }
                                            return std::vector<Value>{
                                                Value::i32(args[0].as_i32() + 1)};
                                        }));
    imports.define("env", "record",
                   HostFunction::create(sig({ValueKind::I64}, {}),
                                        [](std::span<const Value>) -> HostResult {
                                            return std::vector<Value>{};
                                        }));
    return imports;
}

/// Throws `std::bad_alloc` while `fail` is set, otherwise compiles with LLVM.
class ThrowingGenerator : public codegen::CodeGenerator {
public:
    explicit ThrowingGenerator(std::atomic<bool>& fail)
        : fail_(fail), inner_(codegen::default_code_generator_factory()()) {}

    auto name() const -> std::string_view override {
        return "throwing";
    }

    auto compile_function(const ir::ModuleIR& module, uint32_t func_index,
                          const target::TargetConfig& target,
                          const codegen::CodegenOptions& options)
        -> Result<codegen::CodegenOutput, Error> override {
        if (fail_.load()) {
            throw std::bad_alloc();
        }
        return inner_->compile_function(module, func_index, target, options);
    }

private:
    std::atomic<bool>& fail_;
    Box<codegen::CodeGenerator> inner_;
};

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        WAOT_REQUIRE_TOOLCHAIN();
        temp_dir_ = test::test_work_dir() / "engine";
        std::filesystem::create_directories(temp_dir_);

        auto built = test::host_builder().work_dir(temp_dir_).build();
        ASSERT_TRUE(is_ok(built)) << unwrap_err(built).to_string();
        engine_ = std::move(unwrap(built));
    }

    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }

    auto compile(const ir::ModuleIR& module) -> Rc<artifact::DylibArtifact> {
        auto result = engine_->compile(module);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? unwrap(result) : nullptr;
    }

    std::filesystem::path temp_dir_;
    Box<Engine> engine_;
};

// ============================================================================
// Compile Cache
// ============================================================================

TEST_F(EngineTest, SameModuleCompilesOnce) {
    auto first = compile(test::math_module());
    auto second = compile(test::math_module());
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());

    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.compiles, 1u);
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cached_artifacts, 1u);
}

TEST_F(EngineTest, ConcurrentCompilesShareOneArtifact) {
    constexpr int kThreads = 8;
    ir::ModuleIR module = test::table_module();
    std::vector<Rc<artifact::DylibArtifact>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto result = engine_->compile(module);
            if (is_ok(result)) {
                results[i] = unwrap(result);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& r : results) {
        ASSERT_NE(r, nullptr);
        EXPECT_EQ(r.get(), results[0].get());
    }
    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.compiles, 1u);
    EXPECT_EQ(stats.cache_hits, static_cast<uint64_t>(kThreads - 1));
}

TEST_F(EngineTest, DifferentModulesCompileSeparately) {
    auto a = compile(test::math_module());
    auto b = compile(test::memory_module());
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(engine_->stats().compiles, 2u);
}

TEST_F(EngineTest, FailedCompileIsNotCached) {
    auto module = test::math_module();
    module.exports.push_back(module.exports[0]);
    auto first = engine_->compile(module);
    auto second = engine_->compile(module);
    ASSERT_TRUE(is_err(first));
    ASSERT_TRUE(is_err(second));
    EXPECT_EQ(unwrap_err(first).kind, ErrorKind::Compile);
    EXPECT_EQ(engine_->stats().compiles, 2u);
    EXPECT_EQ(engine_->stats().cached_artifacts, 0u);
}

TEST_F(EngineTest, ThrowingCompileLeavesNoCacheEntry) {
    std::atomic<bool> fail{true};
    auto built = test::host_builder()
                     .work_dir(temp_dir_)
                     .worker_threads(1)
                     .code_generator([&fail]() -> Box<codegen::CodeGenerator> {
                         return make_box<ThrowingGenerator>(fail);
                     })
                     .build();
    ASSERT_TRUE(is_ok(built)) << unwrap_err(built).to_string();
    auto& engine = unwrap(built);

    EXPECT_THROW((void)engine->compile(test::math_module()), std::bad_alloc);
    EXPECT_EQ(engine->stats().cached_artifacts, 0u);

    fail.store(false);
    auto retried = engine->compile(test::math_module());
    ASSERT_TRUE(is_ok(retried)) << unwrap_err(retried).to_string();
    EXPECT_EQ(engine->stats().compiles, 2u);
    EXPECT_EQ(engine->stats().cache_hits, 0u);
    EXPECT_EQ(engine->stats().cached_artifacts, 1u);
}

TEST_F(EngineTest, CacheCanBeDisabled) {
    auto built = test::host_builder().work_dir(temp_dir_).enable_cache(false).build();
    ASSERT_TRUE(is_ok(built));
    auto& engine = unwrap(built);
    auto a = engine->compile(test::math_module());
    auto b = engine->compile(test::math_module());
    ASSERT_TRUE(is_ok(a) && is_ok(b));
    EXPECT_NE(unwrap(a).get(), unwrap(b).get());
    EXPECT_EQ(engine->stats().compiles, 2u);
}

TEST_F(EngineTest, TrampolinesAreSharedAcrossModules) {
    ASSERT_NE(compile(test::math_module()), nullptr);
    uint64_t after_first = engine_->stats().trampolines_generated;
    ASSERT_NE(compile(test::trap_module()), nullptr);
    uint64_t after_second = engine_->stats().trampolines_generated;

    // Both modules need the libcall stubs and (i32, i32) -> (i32).
    EXPECT_GT(after_first, 0u);
    EXPECT_LT(after_second - after_first, after_first);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(EngineTest, SerializeDeserializeInstantiate) {
    auto artifact = compile(test::math_module());
    ASSERT_NE(artifact, nullptr);
    auto bytes = engine_->serialize(artifact);
    ASSERT_TRUE(is_ok(bytes)) << unwrap_err(bytes).to_string();

    auto restored = engine_->deserialize(unwrap(bytes));
    ASSERT_TRUE(is_ok(restored)) << unwrap_err(restored).to_string();

    auto instance = engine_->instantiate(unwrap(restored), Imports{});
    ASSERT_TRUE(is_ok(instance)) << unwrap_err(instance).to_string();
    auto result = unwrap(instance)->call("add", {Value::i32(40), Value::i32(2)});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result)[0].as_i32(), 42);
}

TEST_F(EngineTest, RestoredArtifactBehavesLikeFreshOne) {
    for (const auto& module : {test::memory_module(), test::global_module()}) {
        SCOPED_TRACE(module.name);
        auto artifact = compile(module);
        ASSERT_NE(artifact, nullptr);
        auto bytes = engine_->serialize(artifact);
        ASSERT_TRUE(is_ok(bytes)) << unwrap_err(bytes).to_string();
        auto restored = engine_->deserialize(unwrap(bytes));
        ASSERT_TRUE(is_ok(restored)) << unwrap_err(restored).to_string();

        const auto& fresh_exports = artifact->info().exports;
        const auto& restored_exports = unwrap(restored)->info().exports;
        ASSERT_EQ(fresh_exports.size(), restored_exports.size());
        for (size_t i = 0; i < fresh_exports.size(); ++i) {
            EXPECT_EQ(fresh_exports[i].name, restored_exports[i].name);
            EXPECT_EQ(fresh_exports[i].kind, restored_exports[i].kind);
            EXPECT_EQ(fresh_exports[i].index, restored_exports[i].index);
        }

        auto fresh = engine_->instantiate(artifact, Imports{});
        auto reloaded = engine_->instantiate(unwrap(restored), Imports{});
        ASSERT_TRUE(is_ok(fresh)) << unwrap_err(fresh).to_string();
        ASSERT_TRUE(is_ok(reloaded)) << unwrap_err(reloaded).to_string();
        Instance& a = *unwrap(fresh);
        Instance& b = *unwrap(reloaded);

        ASSERT_EQ(a.memory() == nullptr, b.memory() == nullptr);
        if (a.memory()) {
            ASSERT_EQ(a.memory()->size_bytes(), b.memory()->size_bytes());
            std::vector<uint8_t> mem_a(a.memory()->size_bytes());
            std::vector<uint8_t> mem_b(b.memory()->size_bytes());
            ASSERT_TRUE(a.memory()->read(0, mem_a));
            ASSERT_TRUE(b.memory()->read(0, mem_b));
            EXPECT_EQ(mem_a, mem_b);
        }

        for (const auto& e : fresh_exports) {
            if (e.kind == ir::ExternKind::Global) {
                ASSERT_NE(a.global(e.name), nullptr);
                ASSERT_NE(b.global(e.name), nullptr);
                EXPECT_EQ(a.global(e.name)->get(), b.global(e.name)->get()) << e.name;
            }
        }
    }
}

TEST_F(EngineTest, RestoredArtifactComputesTheSameResults) {
    auto artifact = compile(test::memory_module());
    ASSERT_NE(artifact, nullptr);
    auto bytes = engine_->serialize(artifact);
    ASSERT_TRUE(is_ok(bytes));
    auto restored = engine_->deserialize(unwrap(bytes));
    ASSERT_TRUE(is_ok(restored)) << unwrap_err(restored).to_string();

    auto fresh = engine_->instantiate(artifact, Imports{});
    auto reloaded = engine_->instantiate(unwrap(restored), Imports{});
    ASSERT_TRUE(is_ok(fresh) && is_ok(reloaded));

    for (auto* inst : {unwrap(fresh).get(), unwrap(reloaded).get()}) {
        ASSERT_TRUE(is_ok(inst->call("store32", {Value::i32(64), Value::i32(-5)})));
        ASSERT_TRUE(is_ok(inst->call("grow", {Value::i32(1)})));
    }
    for (int32_t addr : {16, 17, 64, 65536}) {
        auto a = unwrap(fresh)->call("load32", {Value::i32(addr)});
        auto b = unwrap(reloaded)->call("load32", {Value::i32(addr)});
        ASSERT_TRUE(is_ok(a) && is_ok(b));
        EXPECT_EQ(unwrap(a), unwrap(b)) << addr;
    }
    auto size_a = unwrap(fresh)->call("size", {});
    auto size_b = unwrap(reloaded)->call("size", {});
    ASSERT_TRUE(is_ok(size_a) && is_ok(size_b));
    EXPECT_EQ(unwrap(size_a), unwrap(size_b));
}

TEST_F(EngineTest, SerializeToFile) {
    auto artifact = compile(test::global_module());
    ASSERT_NE(artifact, nullptr);
    auto path = temp_dir_ / "globals.waot";
    ASSERT_FALSE(engine_->serialize_file(artifact, path).has_value());
    EXPECT_GT(std::filesystem::file_size(path), 0u);

    auto restored = engine_->deserialize_file(path);
    ASSERT_TRUE(is_ok(restored)) << unwrap_err(restored).to_string();
    EXPECT_EQ(unwrap(restored)->fingerprint(), artifact->fingerprint());

    auto missing = engine_->deserialize_file(temp_dir_ / "missing.waot");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, ErrorKind::Serialization);
}

TEST_F(EngineTest, DeserializeRejectsOtherTarget) {
    auto artifact = compile(test::math_module());
    ASSERT_NE(artifact, nullptr);
    auto bytes = engine_->serialize(artifact);
    ASSERT_TRUE(is_ok(bytes));

    // Same architecture, one more CPU feature: a different target.
    auto host = target::TargetConfig::host();
    std::vector<std::string> features = host.feature_names();
    features.push_back(host.arch() == target::Arch::X86_64 ? "sse4.1" : "crc");
    auto other = Builder(host.arch(), features, 64, host.calling_convention())
                     .work_dir(temp_dir_)
                     .build();
    ASSERT_TRUE(is_ok(other)) << unwrap_err(other).to_string();

    auto restored = unwrap(other)->deserialize(unwrap(bytes));
    ASSERT_TRUE(is_err(restored));
    EXPECT_EQ(unwrap_err(restored).kind, ErrorKind::TargetMismatch);

    auto serialized = unwrap(other)->serialize(artifact);
    ASSERT_TRUE(is_err(serialized));
    EXPECT_EQ(unwrap_err(serialized).kind, ErrorKind::TargetMismatch);
}

TEST_F(EngineTest, DeserializeRejectsGarbage) {
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', ' ', 'l', 'i', 'b'};
    auto result = engine_->deserialize(garbage);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Serialization);
}

// ============================================================================
// Instantiation
// ============================================================================

TEST_F(EngineTest, MissingImportAllocatesNothing) {
    auto artifact = compile(test::stateful_import_module());
    ASSERT_NE(artifact, nullptr);

    auto instance = engine_->instantiate(artifact, Imports{});
    ASSERT_TRUE(is_err(instance));
    const Error& err = unwrap_err(instance);
    EXPECT_EQ(err.kind, ErrorKind::Link);
    EXPECT_EQ(err.message, "unknown import: env.add_one has not been defined");

    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.libraries_loaded, 0u);
    EXPECT_EQ(stats.instances_created, 0u);
    EXPECT_EQ(stats.memories_allocated, 0u);
    EXPECT_EQ(stats.tables_allocated, 0u);
}

TEST_F(EngineTest, IncompatibleImportAllocatesNothing) {
    auto artifact = compile(test::stateful_import_module());
    ASSERT_NE(artifact, nullptr);

    Imports imports;
    imports.define("env", "add_one",
                   HostFunction::create(sig({ValueKind::I64}, {ValueKind::I32}),
                                        [](std::span<const Value> args) -> HostResult {
                                            return std::vector<Value>{
                                                Value::i32(static_cast<int32_t>(args[0].as_i64()))};
                                        }));
    auto instance = engine_->instantiate(artifact, imports);
    ASSERT_TRUE(is_err(instance));
    EXPECT_EQ(unwrap_err(instance).kind, ErrorKind::Link);
    EXPECT_EQ(unwrap_err(instance).message,
              "incompatible import type for env.add_one: expected function (i32) -> (i32), "
              "found function (i64) -> (i32)");

    auto memory = LinearMemory::create(ir::MemoryType{ir::Limits{1, 1}});
    ASSERT_TRUE(is_ok(memory));
    imports.define("env", "add_one", unwrap(memory));
    instance = engine_->instantiate(artifact, imports);
    ASSERT_TRUE(is_err(instance));
    EXPECT_NE(unwrap_err(instance).message.find("found memory"), std::string::npos);

    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.libraries_loaded, 0u);
    EXPECT_EQ(stats.instances_created, 0u);
    EXPECT_EQ(stats.memories_allocated, 0u);
    EXPECT_EQ(stats.tables_allocated, 0u);

    // The same artifact instantiates once the import is right, and then
    // allocates its memory and table.
    auto fixed = engine_->instantiate(artifact, add_one_imports());
    ASSERT_TRUE(is_ok(fixed)) << unwrap_err(fixed).to_string();
    EXPECT_EQ(engine_->stats().memories_allocated, 1u);
    EXPECT_EQ(engine_->stats().tables_allocated, 1u);
    auto result = unwrap(fixed)->call("call", {Value::i32(4)});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result)[0].as_i32(), 5);
}

TEST_F(EngineTest, InstancesShareLoadedCode) {
    auto artifact = compile(test::memory_module());
    ASSERT_NE(artifact, nullptr);

    auto a = engine_->instantiate(artifact, Imports{});
    auto b = engine_->instantiate(artifact, Imports{});
    ASSERT_TRUE(is_ok(a) && is_ok(b));
    EXPECT_EQ(unwrap(a)->library().get(), unwrap(b)->library().get());
    EXPECT_NE(unwrap(a)->memory().get(), unwrap(b)->memory().get());

    EngineStats stats = engine_->stats();
    EXPECT_EQ(stats.libraries_loaded, 1u);
    EXPECT_EQ(stats.instances_created, 2u);
    EXPECT_EQ(stats.memories_allocated, 2u);
}

TEST_F(EngineTest, UnloadKeepsLiveInstancesWorking) {
    auto artifact = compile(test::math_module());
    ASSERT_NE(artifact, nullptr);
    auto instance = engine_->instantiate(artifact, Imports{});
    ASSERT_TRUE(is_ok(instance));

    EXPECT_TRUE(engine_->unload(artifact));
    EXPECT_FALSE(engine_->unload(artifact));
    EXPECT_EQ(artifact->loaded_library(), nullptr);

    auto result = unwrap(instance)->call("sub64", {Value::i64(10), Value::i64(3)});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result)[0].as_i64(), 7);

    // Instantiating again loads the code anew.
    auto again = engine_->instantiate(artifact, Imports{});
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(engine_->stats().libraries_loaded, 2u);
}

TEST_F(EngineTest, HostCallsCountThroughImports) {
    auto artifact = compile(test::import_module());
    ASSERT_NE(artifact, nullptr);
    int calls = 0;
    auto instance = engine_->instantiate(artifact, add_one_imports(&calls));
    ASSERT_TRUE(is_ok(instance)) << unwrap_err(instance).to_string();

    auto result = unwrap(instance)->call("call_add_one", {Value::i32(20)});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result)[0].as_i32(), 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(EngineTest, WideMixedSignatureCrossesBothTrampolines) {
    const size_t n = test::WIDE_PARAMS;
    std::vector<Value> seen;
    Imports imports;
    imports.define("env", "wide",
                   HostFunction::create(test::wide_sig(),
                                        [&seen](std::span<const Value> args) -> HostResult {
                                            seen.assign(args.begin(), args.end());
                                            double sum = 0;
                                            for (size_t i = 0; i < args.size(); ++i) {
                                                double v = args[i].kind == ValueKind::I64
                                                               ? static_cast<double>(args[i].as_i64())
                                                               : args[i].as_f64();
                                                sum += v * static_cast<double>(i + 1);
                                            }
                                            return std::vector<Value>{Value::f64(sum)};
                                        }));

    auto artifact = compile(test::wide_module());
    ASSERT_NE(artifact, nullptr);
    auto instance = engine_->instantiate(artifact, imports);
    ASSERT_TRUE(is_ok(instance)) << unwrap_err(instance).to_string();

    std::vector<Value> args;
    double expected = 0.25;
    for (size_t i = 0; i < n; ++i) {
        if (i % 2 == 0) {
            args.push_back(Value::i64(static_cast<int64_t>(i) * 1000 + 7));
            expected += static_cast<double>(i * 1000 + 7) * static_cast<double>(i + 1);
        } else {
            args.push_back(Value::f64(static_cast<double>(i) + 0.5));
            expected += (static_cast<double>(i) + 0.5) * static_cast<double>(i + 1);
        }
    }

    auto result = unwrap(instance)->call("wide", args);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    ASSERT_EQ(unwrap(result).size(), 1u);
    EXPECT_EQ(unwrap(result)[0].kind, ValueKind::F64);
    EXPECT_DOUBLE_EQ(unwrap(result)[0].as_f64(), expected);

    // Every argument reached the host in its own slot and kind.
    ASSERT_EQ(seen.size(), n);
    for (size_t i = 0; i < n; ++i) {
        EXPECT_EQ(seen[i], args[i]) << "argument " << i;
    }
}

TEST_F(EngineTest, ModuleNameWithPathCharactersLoads) {
    auto module = test::math_module();
    module.name = "../dir/with spaces";
    auto artifact = compile(module);
    ASSERT_NE(artifact, nullptr);

    auto instance = engine_->instantiate(artifact, Imports{});
    ASSERT_TRUE(is_ok(instance)) << unwrap_err(instance).to_string();
    auto result = unwrap(instance)->call("add", {Value::i32(1), Value::i32(2)});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result)[0].as_i32(), 3);

    // Nothing escaped the work directory.
    EXPECT_FALSE(std::filesystem::exists(temp_dir_.parent_path() / "dir"));
}

TEST_F(EngineTest, DanglingGlobalInitializerFailsInstantiation) {
    auto compiled = compile(test::global_module());
    ASSERT_NE(compiled, nullptr);

    artifact::ModuleInfo info = compiled->info();
    info.globals.push_back({ir::GlobalType{ValueKind::I32, false}, ir::ConstExpr::global_get(9)});
    auto forged = make_rc<artifact::DylibArtifact>(std::move(info), compiled->target(),
                                                   compiled->functions(), compiled->trampolines());

    auto instance = engine_->instantiate(forged, Imports{});
    ASSERT_TRUE(is_err(instance));
    EXPECT_EQ(unwrap_err(instance).kind, ErrorKind::Instantiation);
    EXPECT_NE(unwrap_err(instance).message.find("reads global 9"), std::string::npos)
        << unwrap_err(instance).message;
}
