//! # Engine Configuration
//!
//! Options an `Engine` is built with. `Builder` fills and checks them.
//!
//! | Option               | Default            | Range          |
//! |----------------------|--------------------|----------------|
//! | `optimization_level` | 2                  | 0..3           |
//! | `enable_cache`       | true               |                |
//! | `worker_threads`     | 0 (hardware)       |                |
//! | `work_dir`           | `<temp>/waot`      |                |
//! | `compress_metadata`  | true               |                |
//! | `max_memory_pages`   | 65536              | 1..65536       |
//! | `max_wasm_stack`     | 1 MiB              | at least 64 KiB |
//!
//! `WAOT_WORK_DIR` overrides the default work directory.

#ifndef WAOT_ENGINE_CONFIG_HPP
#define WAOT_ENGINE_CONFIG_HPP

#include "codegen/code_generator.hpp"
#include "runtime/vmcontext.hpp"
#include "target/target.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace waot::engine {

/// WebAssembly proposals the engine accepts.
using Features = target::WasmFeatures;

constexpr size_t MIN_WASM_STACK = 64 * 1024;

struct EngineConfig {
    int optimization_level = 2;
    bool enable_cache = true;
    uint32_t worker_threads = 0;
    std::filesystem::path work_dir;
    bool compress_metadata = true;
    uint32_t max_memory_pages = runtime::WASM_MAX_PAGES;
    size_t max_wasm_stack = 1024 * 1024;

    /// Empty means `codegen::default_code_generator_factory()`.
    codegen::CodeGeneratorFactory code_generator;
};

/// `$WAOT_WORK_DIR`, or `<temp>/waot`.
[[nodiscard]] auto default_work_dir() -> std::filesystem::path;

} // namespace waot::engine

#endif // WAOT_ENGINE_CONFIG_HPP
