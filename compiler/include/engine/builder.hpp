//! # Engine Builder
//!
//! Assembles an `Engine` from a target, feature flags and engine options.
//! `build()` is the only place configurations are checked; a failed build
//! allocates nothing.

#ifndef WAOT_ENGINE_BUILDER_HPP
#define WAOT_ENGINE_BUILDER_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "target/target.hpp"

#include <optional>
#include <string>
#include <vector>

namespace waot::engine {

class Builder {
public:
    explicit Builder(target::TargetConfig target, Features features = {});

    /// Target from feature names. Unknown names are reported by `build()`.
    Builder(target::Arch arch, const std::vector<std::string>& feature_names,
            uint8_t pointer_width, target::CallingConvention cc, Features features = {});

    /// Host target with baseline CPU features.
    [[nodiscard]] static auto host(Features features = {}) -> Builder;

    auto optimization_level(int level) -> Builder&;
    auto enable_cache(bool enable) -> Builder&;
    auto worker_threads(uint32_t count) -> Builder&;
    auto work_dir(std::filesystem::path dir) -> Builder&;
    auto compress_metadata(bool compress) -> Builder&;
    auto max_memory_pages(uint32_t pages) -> Builder&;
    auto max_wasm_stack(size_t bytes) -> Builder&;
    auto code_generator(codegen::CodeGeneratorFactory factory) -> Builder&;

    /// Checks target, features and options; fails with a Configuration
    /// error naming the first problem.
    [[nodiscard]] auto validate() const -> std::optional<Error>;

    [[nodiscard]] auto build() const -> Result<Box<Engine>, Error>;

private:
    std::optional<target::TargetConfig> target_;
    std::optional<Error> target_error_;
    Features features_;
    EngineConfig config_;
};

} // namespace waot::engine

#endif // WAOT_ENGINE_BUILDER_HPP
