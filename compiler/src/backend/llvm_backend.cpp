//! # LLVM Backend Implementation
//!
//! Uses the LLVM C API for direct IR compilation to object buffers.

#include "backend/llvm_backend.hpp"

#include "log/log.hpp"

#include <mutex>

// LLVM C API headers
#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>
#include <llvm-c/Error.h>
#include <llvm-c/IRReader.h>
#include <llvm-c/Target.h>
#include <llvm-c/TargetMachine.h>
#include <llvm-c/Transforms/PassBuilder.h>
#include <llvm/Config/llvm-config.h>

namespace waot::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert LLVM error message to string and dispose it.
static std::string consume_error_message(char* error) {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

/// Convert an LLVMErrorRef to string and consume it.
static std::string consume_error(LLVMErrorRef error) {
    if (error == nullptr) {
        return "";
    }
    char* msg = LLVMGetErrorMessage(error);
    std::string result(msg);
    LLVMDisposeErrorMessage(msg);
    return result;
}

/// Get optimization level string for pass builder.
static const char* get_opt_level_string(int level) {
    switch (level) {
    case 0:
        return "default<O0>";
    case 1:
        return "default<O1>";
    case 2:
        return "default<O2>";
    case 3:
        return "default<O3>";
    default:
        return "default<O2>";
    }
}

static LLVMCodeGenOptLevel get_codegen_level(int level) {
    switch (level) {
    case 0:
        return LLVMCodeGenLevelNone;
    case 1:
        return LLVMCodeGenLevelLess;
    case 2:
        return LLVMCodeGenLevelDefault;
    default:
        return LLVMCodeGenLevelAggressive;
    }
}

static void initialize_targets_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        LLVMInitializeAllTargetInfos();
        LLVMInitializeAllTargets();
        LLVMInitializeAllTargetMCs();
        LLVMInitializeAllAsmParsers();
        LLVMInitializeAllAsmPrinters();
    });
}

// ============================================================================
// LLVMBackend Implementation
// ============================================================================

LLVMBackend::LLVMBackend() = default;

LLVMBackend::~LLVMBackend() {
    if (context_) {
        LLVMContextDispose(static_cast<LLVMContextRef>(context_));
        context_ = nullptr;
    }
}

auto LLVMBackend::initialize() -> bool {
    if (initialized_) {
        return true;
    }

    initialize_targets_once();

    context_ = LLVMContextCreate();
    if (!context_) {
        last_error_ = "Failed to create LLVM context";
        return false;
    }

    initialized_ = true;
    return true;
}

auto LLVMBackend::get_default_target_triple() const -> std::string {
    char* triple = LLVMGetDefaultTargetTriple();
    std::string result(triple);
    LLVMDisposeMessage(triple);
    return result;
}

auto LLVMBackend::compile_ir_to_buffer(const std::string& ir_content,
                                       const LLVMCompileOptions& options) -> LLVMCompileResult {
    LLVMCompileResult result;
    result.success = false;

    if (!initialized_) {
        result.error_message = "LLVM backend not initialized";
        return result;
    }

    auto ctx = static_cast<LLVMContextRef>(context_);

    // The parser takes ownership of the buffer.
    LLVMMemoryBufferRef buffer =
        LLVMCreateMemoryBufferWithMemoryRangeCopy(ir_content.c_str(), ir_content.size(), "ir");
    if (!buffer) {
        result.error_message = "Failed to create memory buffer for IR";
        return result;
    }

    LLVMModuleRef module = nullptr;
    char* error = nullptr;
    if (LLVMParseIRInContext(ctx, buffer, &module, &error) != 0) {
        result.error_message = "Failed to parse LLVM IR: " + consume_error_message(error);
        return result;
    }

    error = nullptr;
    if (LLVMVerifyModule(module, LLVMReturnStatusAction, &error) != 0) {
        result.error_message = "Module verification failed: " + consume_error_message(error);
        LLVMDisposeModule(module);
        return result;
    }
    consume_error_message(error);

    std::string target_triple = options.target_triple;
    if (target_triple.empty()) {
        target_triple = get_default_target_triple();
    }
    LLVMSetTarget(module, target_triple.c_str());

    LLVMTargetRef target = nullptr;
    error = nullptr;
    if (LLVMGetTargetFromTriple(target_triple.c_str(), &target, &error) != 0) {
        result.error_message = "Failed to get target: " + consume_error_message(error);
        LLVMDisposeModule(module);
        return result;
    }

    std::string cpu = options.cpu;
    if (cpu.empty()) {
        char* host_cpu = LLVMGetHostCPUName();
        cpu = host_cpu;
        LLVMDisposeMessage(host_cpu);
    }

    LLVMRelocMode reloc_mode = options.position_independent ? LLVMRelocPIC : LLVMRelocDefault;

    LLVMTargetMachineRef target_machine = LLVMCreateTargetMachine(
        target, target_triple.c_str(), cpu.c_str(), options.features.c_str(),
        get_codegen_level(options.optimization_level), reloc_mode, LLVMCodeModelDefault);
    if (!target_machine) {
        result.error_message = "Failed to create target machine for " + target_triple;
        LLVMDisposeModule(module);
        return result;
    }

    LLVMTargetDataRef data_layout = LLVMCreateTargetDataLayout(target_machine);
    char* data_layout_str = LLVMCopyStringRepOfTargetData(data_layout);
    LLVMSetDataLayout(module, data_layout_str);
    LLVMDisposeMessage(data_layout_str);
    LLVMDisposeTargetData(data_layout);

    if (options.optimization_level > 0) {
        LLVMPassBuilderOptionsRef pass_opts = LLVMCreatePassBuilderOptions();
        const char* passes = get_opt_level_string(options.optimization_level);
        LLVMErrorRef pass_error = LLVMRunPasses(module, passes, target_machine, pass_opts);
        LLVMDisposePassBuilderOptions(pass_opts);
        if (pass_error) {
            result.error_message = "Optimization pipeline failed: " + consume_error(pass_error);
            LLVMDisposeTargetMachine(target_machine);
            LLVMDisposeModule(module);
            return result;
        }
    }

    LLVMMemoryBufferRef out_buffer = nullptr;
    error = nullptr;
    if (LLVMTargetMachineEmitToMemoryBuffer(target_machine, module, LLVMObjectFile, &error,
                                            &out_buffer) != 0) {
        result.error_message = "Failed to emit object file: " + consume_error_message(error);
        LLVMDisposeTargetMachine(target_machine);
        LLVMDisposeModule(module);
        return result;
    }

    const auto* start = reinterpret_cast<const uint8_t*>(LLVMGetBufferStart(out_buffer));
    size_t size = LLVMGetBufferSize(out_buffer);
    result.object_data.assign(start, start + size);

    LLVMDisposeMemoryBuffer(out_buffer);
    LLVMDisposeTargetMachine(target_machine);
    LLVMDisposeModule(module);

    WAOT_LOG_TRACE("codegen", "emitted " << size << " object bytes for " << target_triple);

    result.success = true;
    return result;
}

// ============================================================================
// Module-level Functions
// ============================================================================

auto is_llvm_backend_available() -> bool {
    LLVMBackend backend;
    return backend.initialize();
}

auto get_llvm_version() -> std::string {
    unsigned major = LLVM_VERSION_MAJOR;
    unsigned minor = LLVM_VERSION_MINOR;
    unsigned patch = LLVM_VERSION_PATCH;
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

auto host_cpu_features() -> std::vector<std::string> {
    char* raw = LLVMGetHostCPUFeatures();
    std::string features = raw ? raw : "";
    if (raw) {
        LLVMDisposeMessage(raw);
    }

    std::vector<std::string> enabled;
    size_t pos = 0;
    while (pos < features.size()) {
        size_t comma = features.find(',', pos);
        if (comma == std::string::npos) {
            comma = features.size();
        }
        std::string entry = features.substr(pos, comma - pos);
        if (entry.size() > 1 && entry[0] == '+') {
            enabled.push_back(entry.substr(1));
        }
        pos = comma + 1;
    }
    return enabled;
}

} // namespace waot::backend
