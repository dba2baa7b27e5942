//! # Engine Builder Implementation

#include "engine/builder.hpp"

#include "log/log.hpp"

namespace waot::engine {

Builder::Builder(target::TargetConfig target, Features features)
    : target_(std::move(target)), features_(features) {}

Builder::Builder(target::Arch arch, const std::vector<std::string>& feature_names,
                 uint8_t pointer_width, target::CallingConvention cc, Features features)
    : features_(features) {
    auto created = target::TargetConfig::create(arch, feature_names, pointer_width, cc);
    if (is_err(created)) {
        target_error_ = unwrap_err(created);
    } else {
        target_ = unwrap(created);
    }
}

auto Builder::host(Features features) -> Builder {
    return Builder(target::TargetConfig::host(), features);
}

auto Builder::optimization_level(int level) -> Builder& {
    config_.optimization_level = level;
    return *this;
}

auto Builder::enable_cache(bool enable) -> Builder& {
    config_.enable_cache = enable;
    return *this;
}

auto Builder::worker_threads(uint32_t count) -> Builder& {
    config_.worker_threads = count;
    return *this;
}

auto Builder::work_dir(std::filesystem::path dir) -> Builder& {
    config_.work_dir = std::move(dir);
    return *this;
}

auto Builder::compress_metadata(bool compress) -> Builder& {
    config_.compress_metadata = compress;
    return *this;
}

auto Builder::max_memory_pages(uint32_t pages) -> Builder& {
    config_.max_memory_pages = pages;
    return *this;
}

auto Builder::max_wasm_stack(size_t bytes) -> Builder& {
    config_.max_wasm_stack = bytes;
    return *this;
}

auto Builder::code_generator(codegen::CodeGeneratorFactory factory) -> Builder& {
    config_.code_generator = std::move(factory);
    return *this;
}

auto Builder::validate() const -> std::optional<Error> {
    if (target_error_) {
        return target_error_;
    }
    if (auto err = target_->validate()) {
        return err;
    }

    if (features_.simd) {
        const char* baseline = target_->arch() == target::Arch::X86_64 ? "sse4.1" : "neon";
        if (!target_->has_feature(baseline)) {
            return Error::configuration(std::string("simd requires the '") + baseline +
                                        "' CPU feature on " + target::arch_to_string(target_->arch()));
        }
    }

    if (config_.optimization_level < 0 || config_.optimization_level > 3) {
        return Error::configuration("optimization level " +
                                    std::to_string(config_.optimization_level) +
                                    " is outside 0..3");
    }
    if (config_.max_memory_pages == 0 || config_.max_memory_pages > runtime::WASM_MAX_PAGES) {
        return Error::configuration("max_memory_pages " + std::to_string(config_.max_memory_pages) +
                                    " is outside 1.." + std::to_string(runtime::WASM_MAX_PAGES));
    }
    if (config_.max_wasm_stack < MIN_WASM_STACK) {
        return Error::configuration("max_wasm_stack of " + std::to_string(config_.max_wasm_stack) +
                                    " bytes is below the minimum of " +
                                    std::to_string(MIN_WASM_STACK));
    }
    return std::nullopt;
}

auto Builder::build() const -> Result<Box<Engine>, Error> {
    if (auto err = validate()) {
        WAOT_LOG_WARN("engine", err->to_string());
        return *err;
    }
    return make_box<Engine>(*target_, features_, config_);
}

} // namespace waot::engine
