//! # Dylib Artifact
//!
//! The in-memory form of a compiled module: per-function code and
//! relocations plus the module metadata instantiation needs. An artifact
//! comes from either the artifact compiler (objects present, not linked
//! yet) or the serializer (linked library bytes present, no objects).
//!
//! Artifacts are shared through `Rc<DylibArtifact>`. Everything is
//! immutable except the two lazily filled slots, the linked library bytes
//! and the loaded code region, which are guarded by the artifact's mutex.

#ifndef WAOT_ARTIFACT_ARTIFACT_HPP
#define WAOT_ARTIFACT_ARTIFACT_HPP

#include "common.hpp"
#include "common/fingerprint.hpp"
#include "ir/module_ir.hpp"
#include "target/target.hpp"
#include "trampoline/trampoline.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waot::runtime {
class LoadedLibrary;
}

namespace waot::artifact {

// ============================================================================
// Compiled Functions
// ============================================================================

enum class RelocationTarget : uint8_t {
    LocalFunction = 0, ///< Another function of the same artifact
    Trampoline = 1,    ///< A stub of the artifact's trampoline set
    Data = 2,          ///< A section or symbol defined in the same object
};

[[nodiscard]] auto relocation_target_name(RelocationTarget target) -> const char*;

struct RelocationEntry {
    uint64_t offset = 0; ///< Offset in the function's code section
    RelocationTarget target = RelocationTarget::Data;
    std::string symbol;
    std::string type_name;
    int64_t addend = 0;

    bool operator==(const RelocationEntry& other) const = default;
};

struct CompiledFunction {
    uint32_t index = 0; ///< Function-space index
    ir::FuncSig sig;
    std::string symbol;
    uint64_t code_size = 0;
    std::vector<uint8_t> object; ///< Relocatable object; empty once deserialized
    std::vector<RelocationEntry> relocations;
    std::vector<uint32_t> import_calls;
    std::vector<uint32_t> libcalls;
};

// ============================================================================
// Module Metadata
// ============================================================================

/// An import with its required shape resolved (signature for functions).
struct ImportEntry {
    std::string module;
    std::string name;
    ir::ExternKind kind = ir::ExternKind::Function;
    ir::FuncSig sig;
    ir::MemoryType memory;
    ir::TableType table;
    ir::GlobalType global;

    bool operator==(const ImportEntry& other) const = default;

    /// "env.print"
    [[nodiscard]] auto qualified_name() const -> std::string {
        return module + "." + name;
    }

    /// "function (i32) -> ()", "memory 1..16 pages", "global mut i64"
    [[nodiscard]] auto describe() const -> std::string;
};

/// Everything about the module except code.
struct ModuleInfo {
    std::string name;
    Fingerprint fingerprint;
    std::vector<ImportEntry> imports;
    std::vector<ir::Export> exports;
    std::vector<ir::MemoryType> memories; ///< Defined memories
    std::vector<ir::TableType> tables;    ///< Defined tables
    std::vector<ir::GlobalDef> globals;   ///< Defined globals
    std::vector<ir::DataSegment> data;
    std::vector<ir::ElementSegment> elements;
    std::optional<uint32_t> start;

    [[nodiscard]] static auto from_module(const ir::ModuleIR& module) -> ModuleInfo;

    [[nodiscard]] auto num_imported(ir::ExternKind kind) const -> uint32_t;
};

// ============================================================================
// DylibArtifact
// ============================================================================

class DylibArtifact {
public:
    DylibArtifact(ModuleInfo info, target::TargetConfig target,
                  std::vector<CompiledFunction> functions,
                  std::vector<trampoline::TrampolineKey> trampolines);

    DylibArtifact(const DylibArtifact&) = delete;
    DylibArtifact& operator=(const DylibArtifact&) = delete;

    [[nodiscard]] auto name() const -> const std::string& {
        return info_.name;
    }
    [[nodiscard]] auto fingerprint() const -> const Fingerprint& {
        return info_.fingerprint;
    }
    [[nodiscard]] auto target() const -> const target::TargetConfig& {
        return target_;
    }
    [[nodiscard]] auto info() const -> const ModuleInfo& {
        return info_;
    }
    [[nodiscard]] auto functions() const -> const std::vector<CompiledFunction>& {
        return functions_;
    }
    [[nodiscard]] auto trampolines() const -> const std::vector<trampoline::TrampolineKey>& {
        return trampolines_;
    }

    [[nodiscard]] auto num_imported_functions() const -> uint32_t {
        return info_.num_imported(ir::ExternKind::Function);
    }
    [[nodiscard]] auto num_imported_globals() const -> uint32_t {
        return info_.num_imported(ir::ExternKind::Global);
    }
    [[nodiscard]] auto total_functions() const -> uint32_t {
        return num_imported_functions() + static_cast<uint32_t>(functions_.size());
    }

    /// Signature of a function-space index, or nullptr.
    [[nodiscard]] auto function_sig(uint32_t func_index) const -> const ir::FuncSig*;

    /// The defined function with a function-space index, or nullptr.
    [[nodiscard]] auto defined_function(uint32_t func_index) const -> const CompiledFunction*;

    [[nodiscard]] auto find_export(std::string_view name) const -> const ir::Export*;

    /// Type of a global-space index, imported or defined.
    [[nodiscard]] auto global_type(uint32_t global_index) const -> std::optional<ir::GlobalType>;

    [[nodiscard]] auto memory_type() const -> std::optional<ir::MemoryType>;
    [[nodiscard]] auto table_type() const -> std::optional<ir::TableType>;

    /// Total code bytes over all functions.
    [[nodiscard]] auto code_size() const -> uint64_t;

    /// Checks that every index the metadata holds (exports, start, global
    /// initializers, segment offsets, element entries, import calls and
    /// relocation targets) names something the artifact has. Returns the
    /// first violation.
    [[nodiscard]] auto check_indices() const -> std::optional<std::string>;

    // ---- linked library ----

    /// The linked shared library, or nullptr when not linked yet.
    [[nodiscard]] auto linked_bytes() const -> Rc<const std::vector<uint8_t>>;

    /// Stores the linked library unless one is already stored; returns the
    /// stored one.
    auto set_linked_bytes(std::vector<uint8_t> bytes) -> Rc<const std::vector<uint8_t>>;

    // ---- loaded code region ----

    [[nodiscard]] auto loaded_library() const -> Rc<runtime::LoadedLibrary>;

    /// Stores the loaded region unless one is already stored; returns the
    /// stored one.
    auto set_loaded_library(Rc<runtime::LoadedLibrary> library) -> Rc<runtime::LoadedLibrary>;

    /// Drops the artifact's reference to its code region. Returns false if
    /// there was none.
    auto release_library() -> bool;

private:
    ModuleInfo info_;
    target::TargetConfig target_;
    std::vector<CompiledFunction> functions_;
    std::vector<trampoline::TrampolineKey> trampolines_;

    mutable std::mutex mutex_;
    Rc<const std::vector<uint8_t>> linked_;
    Rc<runtime::LoadedLibrary> library_;
};

} // namespace waot::artifact

#endif // WAOT_ARTIFACT_ARTIFACT_HPP
