//! # Artifact Compiler
//!
//! Turns a validated `ir::ModuleIR` into a `DylibArtifact`:
//!
//! 1. Module-level checks (unique names, index ranges, feature gates).
//! 2. The trampoline set: host-to-wasm stubs for every defined signature,
//!    wasm-to-host stubs for every imported signature and every libcall.
//! 3. Parallel code generation, one `CodeGenerator` per worker thread,
//!    results collected in function-index order.
//! 4. Relocation extraction from each object and classification. A
//!    relocation must resolve inside the artifact or to the trampoline set;
//!    anything else fails the compile.
//!
//! Any failing function fails the whole compile with the error of the
//! lowest failing function index.

#ifndef WAOT_ARTIFACT_ARTIFACT_COMPILER_HPP
#define WAOT_ARTIFACT_ARTIFACT_COMPILER_HPP

#include "artifact/artifact.hpp"
#include "backend/object_reader.hpp"
#include "codegen/code_generator.hpp"
#include "trampoline/trampoline.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace waot::artifact {

struct ArtifactCompilerOptions {
    codegen::CodegenOptions codegen;

    /// 0 uses the hardware concurrency.
    uint32_t worker_threads = 0;
};

class ArtifactCompiler {
public:
    ArtifactCompiler(target::TargetConfig target, codegen::CodeGeneratorFactory factory,
                     trampoline::TrampolineCache& trampolines, ArtifactCompilerOptions options);

    /// Module-level checks run before any code generation.
    [[nodiscard]] auto validate(const ir::ModuleIR& module) const -> std::optional<Error>;

    [[nodiscard]] auto compile(const ir::ModuleIR& module) -> Result<Rc<DylibArtifact>, Error>;

    /// The trampolines an artifact of `module` links, sorted by symbol.
    [[nodiscard]] static auto required_trampolines(const ir::ModuleIR& module)
        -> std::vector<trampoline::TrampolineKey>;

private:
    target::TargetConfig target_;
    codegen::CodeGeneratorFactory factory_;
    trampoline::TrampolineCache& trampolines_;
    ArtifactCompilerOptions options_;

    auto compile_functions(const ir::ModuleIR& module)
        -> Result<std::vector<codegen::CodegenOutput>, Error>;

    auto build_function(const ir::ModuleIR& module, uint32_t func_index,
                        codegen::CodegenOutput output, const std::set<std::string>& allowed)
        -> Result<CompiledFunction, Error>;
};

/// Classifies a relocation target symbol of a function object.
///
/// @param allowed_trampolines  symbols of the artifact's trampoline set
/// @param total_functions      size of the function index space
/// @param num_imported         imported functions (not callable directly)
[[nodiscard]] auto classify_relocation(const std::string& symbol,
                                       const backend::ObjectFileInfo& object,
                                       const std::set<std::string>& allowed_trampolines,
                                       uint32_t num_imported, uint32_t total_functions)
    -> Result<RelocationTarget, std::string>;

} // namespace waot::artifact

#endif // WAOT_ARTIFACT_ARTIFACT_COMPILER_HPP
