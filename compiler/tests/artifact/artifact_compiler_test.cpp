//! # Artifact Compiler Tests
//!
//! Module validation, relocation classification, parallel function
//! compilation with a scripted code generator, and the LLVM generator end
//! to end (without linking).

#include "artifact/artifact_compiler.hpp"
#include "backend/llvm_backend.hpp"
#include "runtime/vmcontext.hpp"
#include "test_modules.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace waot;
using namespace waot::artifact;
using ir::ExternKind;
using ir::ValueKind;
using waot::test::sig;

namespace {

/// Emits an empty function per index. Indices in `failing` fail, and
/// `external` makes every function call an undefined symbol.
class ScriptedGenerator : public codegen::CodeGenerator {
public:
    ScriptedGenerator(std::set<uint32_t> failing, bool external)
        : failing_(std::move(failing)), external_(external) {}

    auto name() const -> std::string_view override {
        return "scripted";
    }

    auto compile_function(const ir::ModuleIR& /*module*/, uint32_t func_index,
                          const target::TargetConfig& target,
                          const codegen::CodegenOptions& /*options*/)
        -> Result<codegen::CodegenOutput, Error> override {
        if (failing_.count(func_index)) {
            // Later indices finish first so ordering is not an accident.
            std::this_thread::sleep_for(std::chrono::milliseconds(func_index < 4 ? 20 : 0));
            return Error::compile_function(func_index, "scripted failure");
        }

        std::string symbol = codegen::function_symbol(func_index);
        std::string ir;
        if (external_) {
            ir = "declare void @mystery()\n"
                 "define void @" + symbol + "(i8* %vmctx) {\nentry:\n"
                 "  call void @mystery()\n  ret void\n}\n";
        } else {
            ir = "define void @" + symbol + "(i8* %vmctx) {\nentry:\n  ret void\n}\n";
        }

        if (!backend_.is_initialized() && !backend_.initialize()) {
            return Error::compile_function(func_index, "no LLVM");
        }
        backend::LLVMCompileOptions opts;
        opts.target_triple = target.to_triple();
        opts.cpu = target.llvm_cpu();
        auto compiled = backend_.compile_ir_to_buffer(ir, opts);
        if (!compiled.success) {
            return Error::compile_function(func_index, compiled.error_message);
        }

        codegen::CodegenOutput out;
        out.object = std::move(compiled.object_data);
        out.symbol = symbol;
        return out;
    }

private:
    std::set<uint32_t> failing_;
    bool external_;
    backend::LLVMBackend backend_;
};

auto scripted_factory(std::set<uint32_t> failing = {}, bool external = false)
    -> codegen::CodeGeneratorFactory {
    return [failing, external]() -> Box<codegen::CodeGenerator> {
        return make_box<ScriptedGenerator>(failing, external);
    };
}

/// Six defined functions of type () -> (), all exported.
auto six_functions() -> ir::ModuleIR {
    ir::ModuleBuilder b("six");
    for (int i = 0; i < 6; ++i) {
        auto f = b.add_function(sig({}, {}), {}, {});
        b.export_function("f" + std::to_string(i), f);
    }
    return b.build();
}

} // namespace

class ArtifactCompilerTest : public ::testing::Test {
protected:
    target::TargetConfig host_ = target::TargetConfig::host();
    trampoline::TrampolineCache trampolines_{host_, 0};

    auto compiler(codegen::CodeGeneratorFactory factory, uint32_t threads = 4,
                  target::WasmFeatures features = {}) -> ArtifactCompiler {
        ArtifactCompilerOptions options;
        options.worker_threads = threads;
        options.codegen.optimization_level = 0;
        options.codegen.features = features;
        return ArtifactCompiler(host_, std::move(factory), trampolines_, options);
    }

    auto validation_error(const ir::ModuleIR& module, target::WasmFeatures features = {})
        -> std::string {
        auto err = compiler(scripted_factory(), 1, features).validate(module);
        return err ? err->message : "";
    }
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(ArtifactCompilerTest, ValidModulesPass) {
    EXPECT_EQ(validation_error(test::math_module()), "");
    EXPECT_EQ(validation_error(test::memory_module()), "");
    EXPECT_EQ(validation_error(test::import_module()), "");
    EXPECT_EQ(validation_error(test::table_module()), "");
    EXPECT_EQ(validation_error(test::global_module()), "");
    EXPECT_EQ(validation_error(test::multi_value_module()), "");
}

TEST_F(ArtifactCompilerTest, RejectsDuplicateExport) {
    auto module = test::math_module();
    module.exports.push_back({"add", ExternKind::Function, 1});
    EXPECT_NE(validation_error(module).find("duplicate export 'add'"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsDanglingExport) {
    auto module = test::math_module();
    module.exports.push_back({"mem", ExternKind::Memory, 0});
    EXPECT_NE(validation_error(module).find("does not exist"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsStartWithParameters) {
    auto module = test::math_module();
    module.start = 0;
    EXPECT_NE(validation_error(module).find("start function"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsV128) {
    ir::ModuleBuilder b("v128");
    b.add_function(sig({ValueKind::V128}, {}), {}, {});
    EXPECT_NE(validation_error(b.build()).find("v128"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsDisabledMultiValue) {
    target::WasmFeatures features;
    features.multi_value = false;
    EXPECT_NE(validation_error(test::multi_value_module(), features).find("multi_value"),
              std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsBadLimits) {
    ir::ModuleBuilder b("limits");
    b.add_memory(ir::Limits{4, 2});
    EXPECT_NE(validation_error(b.build()).find("below its minimum"), std::string::npos);

    ir::ModuleBuilder huge("huge");
    huge.add_memory(ir::Limits{1, runtime::WASM_MAX_PAGES + 1});
    EXPECT_NE(validation_error(huge.build()).find("exceed"), std::string::npos);

    ir::ModuleBuilder two("two");
    two.add_memory(ir::Limits{1, std::nullopt});
    two.add_memory(ir::Limits{1, std::nullopt});
    EXPECT_NE(validation_error(two.build()).find("at most one memory"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsSegmentsWithoutStorage) {
    ir::ModuleBuilder data("data");
    data.add_data(0, {1, 2, 3});
    EXPECT_NE(validation_error(data.build()).find("without a memory"), std::string::npos);

    auto module = test::table_module();
    module.elements[0].functions.push_back(99);
    EXPECT_NE(validation_error(module).find("references function 99"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsSegmentOffsetReadingMissingGlobal) {
    auto data = test::memory_module();
    data.data[0].offset = ir::ConstExpr::global_get(5);
    EXPECT_EQ(validation_error(data),
              "data segment 0 offset reads global 5, which is not an imported global");

    auto elements = test::table_module();
    elements.elements[0].offset = ir::ConstExpr::global_get(2);
    EXPECT_EQ(validation_error(elements),
              "element segment 0 offset reads global 2, which is not an imported global");
}

TEST_F(ArtifactCompilerTest, RejectsSegmentOffsetOfWrongKind) {
    ir::ModuleBuilder b("offsets");
    b.import_global("env", "base64", ir::GlobalType{ValueKind::I64, false});
    b.add_memory(ir::Limits{1, 1});
    b.add_data(ir::ConstExpr::global_get(0), {1});
    EXPECT_EQ(validation_error(b.build()),
              "data segment 0 offset reads global 0, which is not i32");

    auto elements = test::table_module();
    elements.elements[0].offset = ir::ConstExpr::ref_func(0);
    EXPECT_EQ(validation_error(elements),
              "element segment 0 offset must be a constant or global.get");
}

TEST_F(ArtifactCompilerTest, AcceptsOffsetFromImportedGlobal) {
    ir::ModuleBuilder b("imported_base");
    b.import_global("env", "base", ir::GlobalType{ValueKind::I32, false});
    b.add_memory(ir::Limits{1, 1});
    b.add_data(ir::ConstExpr::global_get(0), {1, 2});
    EXPECT_EQ(validation_error(b.build()), "");
}

TEST_F(ArtifactCompilerTest, RejectsElementPointingAtImport) {
    ir::ModuleBuilder b("imported_elem");
    auto imported = b.import_function("env", "f", sig({}, {}));
    b.add_table(ir::Limits{1, 1});
    b.add_element(0, {imported});
    EXPECT_NE(validation_error(b.build()).find("does not define"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, RejectsDuplicateImport) {
    ir::ModuleBuilder b("dup");
    b.import_function("env", "f", sig({}, {}));
    b.import_function("env", "f", sig({ValueKind::I32}, {}));
    EXPECT_NE(validation_error(b.build()).find("duplicate import env.f"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, InvalidTypeIndexNamesFunction) {
    auto module = test::math_module();
    module.functions[3].type_index = 100;
    auto err = compiler(scripted_factory()).validate(module);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->function_index, 3u);
}

// ============================================================================
// Trampoline Set
// ============================================================================

TEST_F(ArtifactCompilerTest, RequiredTrampolines) {
    auto keys = ArtifactCompiler::required_trampolines(test::import_module());
    std::set<std::string> symbols;
    std::string previous;
    for (const auto& key : keys) {
        EXPECT_LT(previous, key.symbol());
        previous = key.symbol();
        symbols.insert(key.symbol());
    }
    // Imports are called through wasm-to-host stubs, defined functions
    // are entered through host-to-wasm stubs.
    EXPECT_TRUE(symbols.count("waot_w2h_i_i"));
    EXPECT_TRUE(symbols.count("waot_w2h_l_v"));
    EXPECT_TRUE(symbols.count("waot_h2w_i_i"));
    EXPECT_TRUE(symbols.count("waot_h2w_l_v"));
    // Libcalls
    EXPECT_TRUE(symbols.count("waot_w2h_i_v"));
    EXPECT_TRUE(symbols.count("waot_w2h_iii_v"));
    EXPECT_EQ(symbols.size(), keys.size());
}

// ============================================================================
// Relocation Classification
// ============================================================================

TEST(ClassifyRelocationTest, Targets) {
    backend::ObjectFileInfo object;
    object.kind = backend::BinaryKind::ELF;
    object.sections.push_back({".rodata", 0, 16, {}});
    std::set<std::string> allowed = {"waot_w2h_i_v"};

    auto local = classify_relocation("waot_func_3", object, allowed, 1, 5);
    ASSERT_TRUE(is_ok(local));
    EXPECT_EQ(unwrap(local), RelocationTarget::LocalFunction);

    auto tramp = classify_relocation("waot_w2h_i_v", object, allowed, 1, 5);
    ASSERT_TRUE(is_ok(tramp));
    EXPECT_EQ(unwrap(tramp), RelocationTarget::Trampoline);

    auto data = classify_relocation(".rodata", object, allowed, 1, 5);
    ASSERT_TRUE(is_ok(data));
    EXPECT_EQ(unwrap(data), RelocationTarget::Data);
}

TEST(ClassifyRelocationTest, Rejections) {
    backend::ObjectFileInfo object;
    object.kind = backend::BinaryKind::ELF;
    std::set<std::string> allowed = {"waot_w2h_i_v"};

    // Imported function 0 may only be reached through its trampoline.
    EXPECT_TRUE(is_err(classify_relocation("waot_func_0", object, allowed, 1, 5)));
    EXPECT_TRUE(is_err(classify_relocation("waot_func_5", object, allowed, 1, 5)));
    EXPECT_TRUE(is_err(classify_relocation("waot_func_x", object, allowed, 1, 5)));
    EXPECT_TRUE(is_err(classify_relocation("waot_h2w_d_d", object, allowed, 1, 5)));

    auto external = classify_relocation("memcpy", object, allowed, 1, 5);
    ASSERT_TRUE(is_err(external));
    EXPECT_NE(unwrap_err(external).find("unresolved external symbol 'memcpy'"),
              std::string::npos);
}

TEST(ClassifyRelocationTest, MachOUnderscore) {
    backend::ObjectFileInfo object;
    object.kind = backend::BinaryKind::MachO;
    auto local = classify_relocation("_waot_func_1", object, {}, 0, 2);
    ASSERT_TRUE(is_ok(local));
    EXPECT_EQ(unwrap(local), RelocationTarget::LocalFunction);
}

// ============================================================================
// Compilation
// ============================================================================

TEST_F(ArtifactCompilerTest, CompilesEveryFunction) {
    auto module = six_functions();
    auto result = compiler(scripted_factory()).compile(module);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& artifact = *unwrap(result);

    ASSERT_EQ(artifact.functions().size(), 6u);
    for (uint32_t i = 0; i < 6; ++i) {
        const CompiledFunction& fn = artifact.functions()[i];
        EXPECT_EQ(fn.index, i);
        EXPECT_EQ(fn.symbol, "waot_func_" + std::to_string(i));
        EXPECT_GT(fn.code_size, 0u);
        EXPECT_FALSE(fn.object.empty());
    }
    EXPECT_EQ(artifact.fingerprint(), module.content_hash());
    EXPECT_EQ(artifact.target(), host_);
    EXPECT_EQ(artifact.trampolines(), ArtifactCompiler::required_trampolines(module));
    EXPECT_EQ(artifact.linked_bytes(), nullptr);
}

TEST_F(ArtifactCompilerTest, ReportsLowestFailingFunction) {
    auto result = compiler(scripted_factory({3, 5}), 4).compile(six_functions());
    ASSERT_TRUE(is_err(result));
    const Error& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::Compile);
    EXPECT_EQ(err.function_index, 3u);
}

TEST_F(ArtifactCompilerTest, SingleThreadedMatchesParallel) {
    auto serial = compiler(scripted_factory(), 1).compile(six_functions());
    auto parallel = compiler(scripted_factory(), 8).compile(six_functions());
    ASSERT_TRUE(is_ok(serial) && is_ok(parallel));
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(unwrap(serial)->functions()[i].object, unwrap(parallel)->functions()[i].object);
    }
}

TEST_F(ArtifactCompilerTest, ExternalSymbolIsCompileError) {
    auto result = compiler(scripted_factory({}, true)).compile(six_functions());
    ASSERT_TRUE(is_err(result));
    const Error& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::Compile);
    EXPECT_EQ(err.function_index, 0u);
    EXPECT_NE(err.message.find("mystery"), std::string::npos);
}

TEST_F(ArtifactCompilerTest, MissingGeneratorIsCompileError) {
    auto result =
        compiler([]() -> Box<codegen::CodeGenerator> { return nullptr; }).compile(six_functions());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).function_index, 0u);
}

TEST_F(ArtifactCompilerTest, LlvmGeneratorRecordsImportCalls) {
    auto result = compiler(codegen::default_code_generator_factory()).compile(test::import_module());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& artifact = *unwrap(result);

    const CompiledFunction* call_add_one = artifact.defined_function(2);
    ASSERT_NE(call_add_one, nullptr);
    EXPECT_EQ(call_add_one->import_calls, (std::vector<uint32_t>{0}));

    bool through_trampoline = false;
    for (const auto& reloc : call_add_one->relocations) {
        EXPECT_NE(reloc.target, RelocationTarget::LocalFunction);
        if (reloc.target == RelocationTarget::Trampoline) {
            through_trampoline = true;
        }
    }
    EXPECT_TRUE(through_trampoline);
    EXPECT_EQ(artifact.info().imports[0].describe(), "function (i32) -> (i32)");
}

TEST_F(ArtifactCompilerTest, LlvmGeneratorRecordsLibcalls) {
    auto result = compiler(codegen::default_code_generator_factory()).compile(test::memory_module());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& artifact = *unwrap(result);

    const auto* grow = artifact.find_export("grow");
    ASSERT_NE(grow, nullptr);
    const CompiledFunction* fn = artifact.defined_function(grow->index);
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->libcalls,
              (std::vector<uint32_t>{static_cast<uint32_t>(runtime::LibCall::MemoryGrow)}));
    EXPECT_EQ(artifact.memory_type()->limits.max, 4u);
}

// ============================================================================
// Index Checks
// ============================================================================

namespace {

auto forge(const DylibArtifact& artifact, ModuleInfo info) -> Rc<DylibArtifact> {
    return make_rc<DylibArtifact>(std::move(info), artifact.target(), artifact.functions(),
                                  artifact.trampolines());
}

} // namespace

TEST_F(ArtifactCompilerTest, CompiledArtifactsPassIndexChecks) {
    for (const auto& module : {test::math_module(), test::memory_module(), test::table_module(),
                               test::global_module(), test::stateful_import_module()}) {
        auto result = compiler(scripted_factory()).compile(module);
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
        auto err = unwrap(result)->check_indices();
        EXPECT_FALSE(err.has_value()) << module.name << ": " << err.value_or("");
    }
}

TEST_F(ArtifactCompilerTest, IndexChecksCatchForgedMetadata) {
    auto compiled = compiler(scripted_factory()).compile(test::table_module());
    ASSERT_TRUE(is_ok(compiled)) << unwrap_err(compiled).to_string();
    const DylibArtifact& artifact = *unwrap(compiled);

    ModuleInfo global_info = artifact.info();
    global_info.globals.push_back(
        {ir::GlobalType{ValueKind::I32, false}, ir::ConstExpr::global_get(9)});
    auto err = forge(artifact, global_info)->check_indices();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("reads global 9"), std::string::npos) << *err;

    ModuleInfo element_info = artifact.info();
    element_info.elements[0].functions.push_back(99);
    err = forge(artifact, element_info)->check_indices();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("references function 99"), std::string::npos) << *err;

    ModuleInfo export_info = artifact.info();
    export_info.exports.push_back({"ghost", ExternKind::Function, 40});
    err = forge(artifact, export_info)->check_indices();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("export 'ghost'"), std::string::npos) << *err;

    ModuleInfo offset_info = artifact.info();
    offset_info.elements[0].offset = ir::ConstExpr::global_get(0);
    err = forge(artifact, offset_info)->check_indices();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("not an imported global"), std::string::npos) << *err;
}
