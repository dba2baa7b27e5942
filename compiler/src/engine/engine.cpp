//! # Engine Implementation

#include "engine/engine.hpp"

#include "artifact/artifact_compiler.hpp"
#include "backend/llvm_backend.hpp"
#include "common/temp_path.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>

namespace waot::engine {

// ============================================================================
// Configuration
// ============================================================================

static std::string read_env(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

auto default_work_dir() -> std::filesystem::path {
    std::string env = read_env("WAOT_WORK_DIR");
    if (!env.empty()) {
        return env;
    }
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::filesystem::path("waot");
    }
    return temp / "waot";
}

/// Generated code may only run on a host that has every CPU feature it was
/// compiled for.
static auto check_host_can_run(const target::TargetConfig& target) -> std::optional<Error> {
    target::TargetConfig host = target::TargetConfig::host();
    if (target.arch() != host.arch() || target.calling_convention() != host.calling_convention()) {
        return Error::instantiation("code for " + target.to_string() + " cannot run on host " +
                                    host.to_string());
    }

    std::vector<std::string> available = backend::host_cpu_features();
    for (const auto& info : target::known_features()) {
        if (!target.has_feature(info.name)) {
            continue;
        }
        if (std::find(available.begin(), available.end(), info.llvm_name) == available.end()) {
            return Error::instantiation("host CPU lacks feature '" + std::string(info.name) +
                                        "' required by the artifact");
        }
    }
    return std::nullopt;
}

// ============================================================================
// Engine
// ============================================================================

static auto serializer_options(const EngineConfig& config) -> serialize::SerializerOptions {
    serialize::SerializerOptions options;
    options.work_dir = config.work_dir;
    options.compress_metadata = config.compress_metadata;
    options.optimization_level = config.optimization_level;
    return options;
}

static auto with_defaults(EngineConfig config) -> EngineConfig {
    if (config.work_dir.empty()) {
        config.work_dir = default_work_dir();
    }
    if (!config.code_generator) {
        config.code_generator = codegen::default_code_generator_factory();
    }
    return config;
}

Engine::Engine(target::TargetConfig target, Features features, EngineConfig config)
    : target_(std::move(target)), features_(features), config_(with_defaults(std::move(config))),
      trampolines_(target_, config_.optimization_level),
      serializer_(target_, trampolines_, serializer_options(config_)) {
    WAOT_LOG_INFO("engine", "engine for " << target_.to_string() << ", opt level "
                                          << config_.optimization_level << ", work dir "
                                          << config_.work_dir.string());
}

Engine::~Engine() {
    WAOT_LOG_DEBUG("engine", "engine shut down after " << compiles_.load() << " compiles");
}

auto Engine::compile_uncached(const ir::ModuleIR& module) -> CompileResult {
    compiles_.fetch_add(1);

    artifact::ArtifactCompilerOptions options;
    options.codegen.optimization_level = config_.optimization_level;
    options.codegen.features = features_;
    options.worker_threads = config_.worker_threads;

    artifact::ArtifactCompiler compiler(target_, config_.code_generator, trampolines_, options);
    return compiler.compile(module);
}

auto Engine::compile(const ir::ModuleIR& module) -> Result<Rc<artifact::DylibArtifact>, Error> {
    if (!config_.enable_cache) {
        return compile_uncached(module);
    }

    Fingerprint key = module.content_hash();
    std::promise<CompileResult> promise;
    std::shared_future<CompileResult> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            cache_.emplace(key, future);
            owner = true;
        }
    }

    if (!owner) {
        cache_hits_.fetch_add(1);
        WAOT_LOG_DEBUG("engine", "compile cache hit for '" << module.name << "' ("
                                                           << key.to_hex() << ")");
        return future.get();
    }

    CompileResult result = Error::compile("compile did not run");
    try {
        result = compile_uncached(module);
    } catch (...) {
        // Waiters see the same exception; the entry must not outlive it.
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.erase(key);
        throw;
    }
    promise.set_value(result);

    if (is_err(result)) {
        // Failed compiles are not cached; waiters already hold the error.
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.erase(key);
    }
    return result;
}

auto Engine::check_target(const artifact::DylibArtifact& artifact) const -> std::optional<Error> {
    if (artifact.target() != target_) {
        return Error::target_mismatch("artifact '" + artifact.name() + "' targets " +
                                      artifact.target().to_string() + ", engine targets " +
                                      target_.to_string());
    }
    return std::nullopt;
}

auto Engine::serialize(const Rc<artifact::DylibArtifact>& artifact)
    -> Result<std::vector<uint8_t>, Error> {
    if (auto err = check_target(*artifact)) {
        return *err;
    }
    return serializer_.serialize(*artifact);
}

auto Engine::serialize_file(const Rc<artifact::DylibArtifact>& artifact,
                            const std::filesystem::path& path) -> std::optional<Error> {
    auto bytes = serialize(artifact);
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(unwrap(bytes).data()),
              static_cast<std::streamsize>(unwrap(bytes).size()));
    if (!out) {
        return Error::serialization("cannot write " + path.string());
    }
    return std::nullopt;
}

auto Engine::deserialize(std::span<const uint8_t> bytes)
    -> Result<Rc<artifact::DylibArtifact>, Error> {
    auto artifact = serializer_.deserialize(bytes);
    if (is_err(artifact)) {
        WAOT_LOG_WARN("engine", "deserialize failed: " << unwrap_err(artifact).to_string());
        return artifact;
    }
    if (auto err = check_target(*unwrap(artifact))) {
        WAOT_LOG_WARN("engine", err->to_string());
        return *err;
    }
    return artifact;
}

auto Engine::deserialize_file(const std::filesystem::path& path)
    -> Result<Rc<artifact::DylibArtifact>, Error> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error::serialization("cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    return deserialize(bytes);
}

auto Engine::ensure_loaded(const Rc<artifact::DylibArtifact>& artifact)
    -> Result<Rc<runtime::LoadedLibrary>, Error> {
    if (auto library = artifact->loaded_library()) {
        return library;
    }
    if (auto err = check_host_can_run(artifact->target())) {
        return *err;
    }

    auto bytes = serializer_.link(*artifact);
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }
    auto library = runtime::LoadedLibrary::load(*unwrap(bytes), config_.work_dir,
                                                "lib" + file_stem(artifact->name()));
    if (is_err(library)) {
        return Error::instantiation(unwrap_err(library));
    }
    libraries_loaded_.fetch_add(1);
    return artifact->set_loaded_library(unwrap(library));
}

auto Engine::instantiate(const Rc<artifact::DylibArtifact>& artifact,
                         const runtime::Imports& imports)
    -> Result<Box<runtime::Instance>, Error> {
    if (auto err = check_target(*artifact)) {
        return *err;
    }
    if (auto err = runtime::check_imports(*artifact, imports)) {
        WAOT_LOG_DEBUG("engine", "instantiating '" << artifact->name()
                                                   << "': " << err->to_string());
        return *err;
    }

    auto library = ensure_loaded(artifact);
    if (is_err(library)) {
        return unwrap_err(library);
    }

    runtime::InstanceConfig config;
    config.max_wasm_stack = config_.max_wasm_stack;
    config.max_memory_pages = config_.max_memory_pages;
    config.counters = &allocations_;

    auto instance = runtime::Instance::create(artifact, unwrap(library), imports, config);
    if (is_err(instance)) {
        WAOT_LOG_WARN("engine", "instantiating '" << artifact->name()
                                                  << "' failed: " << unwrap_err(instance).to_string());
        return instance;
    }
    instances_.fetch_add(1);
    return instance;
}

auto Engine::unload(const Rc<artifact::DylibArtifact>& artifact) -> bool {
    bool released = artifact->release_library();
    if (released) {
        WAOT_LOG_DEBUG("engine", "unloaded code of '" << artifact->name() << "'");
    }
    return released;
}

auto Engine::stats() const -> EngineStats {
    EngineStats stats;
    stats.compiles = compiles_.load();
    stats.cache_hits = cache_hits_.load();
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        stats.cached_artifacts = cache_.size();
    }
    stats.trampolines_generated = trampolines_.generated_count();
    stats.memories_allocated = allocations_.memories.load();
    stats.tables_allocated = allocations_.tables.load();
    stats.instances_created = instances_.load();
    stats.libraries_loaded = libraries_loaded_.load();
    return stats;
}

} // namespace waot::engine
