//! # Engine
//!
//! The façade embedders use. An engine is bound to one target and one set
//! of features for its lifetime and owns:
//!
//! - the compile cache (one compilation per distinct module content;
//!   concurrent requests share the in-flight compile),
//! - the trampoline cache,
//! - the serializer and the loading of code regions,
//! - allocation and compile counters.
//!
//! ## Usage
//!
//! ```cpp
//! auto engine = unwrap(Builder(target::TargetConfig::host()).build());
//! auto artifact = engine->compile(module);
//! auto instance = engine->instantiate(unwrap(artifact), imports);
//! auto result = unwrap(instance)->call("add", {Value::i32(1), Value::i32(2)});
//! ```
//!
//! Every method is thread-safe. Instances are not.

#ifndef WAOT_ENGINE_ENGINE_HPP
#define WAOT_ENGINE_ENGINE_HPP

#include "artifact/artifact.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "common/fingerprint.hpp"
#include "engine/config.hpp"
#include "ir/module_ir.hpp"
#include "runtime/imports.hpp"
#include "runtime/instance.hpp"
#include "serialize/serializer.hpp"
#include "trampoline/trampoline.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace waot::engine {

struct EngineStats {
    uint64_t compiles = 0;   ///< Compilations actually run
    uint64_t cache_hits = 0; ///< Requests served by a cached or in-flight compile
    uint64_t cached_artifacts = 0;
    uint64_t trampolines_generated = 0;
    uint64_t memories_allocated = 0;
    uint64_t tables_allocated = 0;
    uint64_t instances_created = 0;
    uint64_t libraries_loaded = 0;
};

class Engine {
public:
    /// Use `Builder`, which checks the configuration first.
    Engine(target::TargetConfig target, Features features, EngineConfig config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] auto compile(const ir::ModuleIR& module)
        -> Result<Rc<artifact::DylibArtifact>, Error>;

    [[nodiscard]] auto serialize(const Rc<artifact::DylibArtifact>& artifact)
        -> Result<std::vector<uint8_t>, Error>;

    [[nodiscard]] auto serialize_file(const Rc<artifact::DylibArtifact>& artifact,
                                      const std::filesystem::path& path) -> std::optional<Error>;

    /// Fails with a TargetMismatch error when the artifact was built for
    /// another target.
    [[nodiscard]] auto deserialize(std::span<const uint8_t> bytes)
        -> Result<Rc<artifact::DylibArtifact>, Error>;

    [[nodiscard]] auto deserialize_file(const std::filesystem::path& path)
        -> Result<Rc<artifact::DylibArtifact>, Error>;

    [[nodiscard]] auto instantiate(const Rc<artifact::DylibArtifact>& artifact,
                                   const runtime::Imports& imports)
        -> Result<Box<runtime::Instance>, Error>;

    /// Drops the artifact's reference to its loaded code. Live instances
    /// keep theirs. Returns false when nothing was loaded.
    auto unload(const Rc<artifact::DylibArtifact>& artifact) -> bool;

    [[nodiscard]] auto stats() const -> EngineStats;

    [[nodiscard]] auto trampolines() -> trampoline::TrampolineCache& {
        return trampolines_;
    }

    [[nodiscard]] auto target() const -> const target::TargetConfig& {
        return target_;
    }

    [[nodiscard]] auto features() const -> const Features& {
        return features_;
    }

    [[nodiscard]] auto config() const -> const EngineConfig& {
        return config_;
    }

private:
    using CompileResult = Result<Rc<artifact::DylibArtifact>, Error>;

    target::TargetConfig target_;
    Features features_;
    EngineConfig config_;

    trampoline::TrampolineCache trampolines_;
    serialize::Serializer serializer_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<Fingerprint, std::shared_future<CompileResult>, FingerprintHash> cache_;

    std::atomic<uint64_t> compiles_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> instances_{0};
    std::atomic<uint64_t> libraries_loaded_{0};
    runtime::AllocationCounters allocations_;

    auto compile_uncached(const ir::ModuleIR& module) -> CompileResult;
    auto check_target(const artifact::DylibArtifact& artifact) const -> std::optional<Error>;
    auto ensure_loaded(const Rc<artifact::DylibArtifact>& artifact)
        -> Result<Rc<runtime::LoadedLibrary>, Error>;
};

} // namespace waot::engine

#endif // WAOT_ENGINE_ENGINE_HPP
