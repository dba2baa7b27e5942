//! # LLD Linker Implementation
//!
//! Spawns lld-link / ld.lld / ld64.lld as a subprocess. The linker's
//! stderr is redirected to a file next to the output and folded into the
//! error message on failure.

// Suppress MSVC warnings about getenv
#define _CRT_SECURE_NO_WARNINGS

#include "backend/lld_linker.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace waot::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Quote a path if it contains spaces (for subprocess command lines).
static std::string quote_path(const std::string& str) {
    if (str.find(' ') != std::string::npos) {
        return "\"" + str + "\"";
    }
    return str;
}

/// Execute a command and return the exit code.
static int execute_command(const std::string& cmd) {
    WAOT_LOG_DEBUG("linker", cmd);
    return std::system(cmd.c_str());
}

/// Check if a file exists.
static bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

static std::string read_text_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

static const char* lld_name(target::ObjectFormat format) {
    switch (format) {
    case target::ObjectFormat::COFF:
#ifdef _WIN32
        return "lld-link.exe";
#else
        return "lld-link";
#endif
    case target::ObjectFormat::MachO:
        return "ld64.lld";
    case target::ObjectFormat::ELF:
        return "ld.lld";
    }
    return "ld.lld";
}

// ============================================================================
// LLDLinker Implementation
// ============================================================================

LLDLinker::LLDLinker() = default;

auto LLDLinker::initialize(target::ObjectFormat format) -> bool {
    if (initialized_ && format_ == format) {
        return true;
    }

    format_ = format;
    initialized_ = false;
    if (!find_lld()) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto LLDLinker::find_lld() -> bool {
    // An explicit choice wins and is not second-guessed.
    if (const char* explicit_path = std::getenv("WAOT_LLD")) {
        if (file_exists(explicit_path)) {
            lld_path_ = explicit_path;
            fallback_ = false;
            return true;
        }
        last_error_ = std::string("WAOT_LLD points to a missing file: ") + explicit_path;
        return false;
    }

    std::vector<fs::path> search_paths = {
        "/usr/bin",
        "/usr/local/bin",
        "/usr/lib/llvm-19/bin",
        "/usr/lib/llvm-18/bin",
        "/usr/lib/llvm-17/bin",
        "/usr/lib/llvm-16/bin",
        "/usr/lib/llvm-15/bin",
        "/usr/lib/llvm-14/bin",
        "/usr/local/opt/llvm/bin",
        "/opt/homebrew/opt/llvm/bin",
        "C:/Program Files/LLVM/bin",
        "C:/LLVM/bin",
    };

    if (const char* path_env = std::getenv("PATH")) {
        std::string path_str(path_env);
#ifdef _WIN32
        char delimiter = ';';
#else
        char delimiter = ':';
#endif
        std::istringstream iss(path_str);
        std::string path;
        while (std::getline(iss, path, delimiter)) {
            if (!path.empty()) {
                search_paths.push_back(path);
            }
        }
    }

    if (const char* llvm_dir = std::getenv("LLVM_DIR")) {
        search_paths.insert(search_paths.begin(), fs::path(llvm_dir) / "bin");
    }

    const std::string name = lld_name(format_);
    for (const auto& dir : search_paths) {
        fs::path candidate = dir / name;
        if (file_exists(candidate)) {
            lld_path_ = candidate;
            fallback_ = false;
            return true;
        }
    }

    // The platform linker understands the same flags we pass for
    // ELF and Mach-O shared libraries.
    if (format_ != target::ObjectFormat::COFF) {
        for (const auto& dir : search_paths) {
            fs::path candidate = dir / "ld";
            if (file_exists(candidate)) {
                lld_path_ = candidate;
                fallback_ = true;
                WAOT_LOG_INFO("linker", name << " not found, using " << candidate.string());
                return true;
            }
        }
    }

    last_error_ = "no linker found for " + name +
                  ". Set WAOT_LLD to the linker binary or LLVM_DIR to an LLVM installation";
    return false;
}

// ============================================================================
// Argument Builders (produce argv vectors)
// ============================================================================

auto LLDLinker::build_coff_args(const std::vector<fs::path>& object_files,
                                const fs::path& output_path, const LLDLinkOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.push_back("lld-link");
    args.push_back("/OUT:" + output_path.string());
    args.push_back("/DLL");
    args.push_back("/NOENTRY");
    args.push_back(options.arch == target::Arch::Aarch64 ? "/MACHINE:ARM64" : "/MACHINE:X64");

    args.push_back("/NODEFAULTLIB");

    for (const auto& obj : object_files) {
        args.push_back(obj.string());
    }
    for (const auto& flag : options.extra_flags) {
        args.push_back(flag);
    }

    args.push_back("/NOLOGO");
    return args;
}

auto LLDLinker::build_elf_args(const std::vector<fs::path>& object_files,
                               const fs::path& output_path, const LLDLinkOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.push_back("ld.lld");
    args.push_back("-o");
    args.push_back(output_path.string());
    args.push_back("-shared");
    args.push_back("--build-id=none");
    args.push_back("-z");
    args.push_back("noexecstack");

    for (const auto& obj : object_files) {
        args.push_back(obj.string());
    }
    for (const auto& flag : options.extra_flags) {
        args.push_back(flag);
    }
    return args;
}

auto LLDLinker::build_macho_args(const std::vector<fs::path>& object_files,
                                 const fs::path& output_path, const LLDLinkOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.push_back("ld64.lld");
    args.push_back("-dylib");
    args.push_back("-arch");
    args.push_back(options.arch == target::Arch::Aarch64 ? "arm64" : "x86_64");
    args.push_back("-platform_version");
    args.push_back("macos");
    args.push_back("11.0.0");
    args.push_back("11.0.0");
    args.push_back("-o");
    args.push_back(output_path.string());

    for (const auto& obj : object_files) {
        args.push_back(obj.string());
    }
    for (const auto& flag : options.extra_flags) {
        args.push_back(flag);
    }
    return args;
}

auto LLDLinker::join_args(const std::vector<std::string>& args) -> std::string {
    std::ostringstream cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0)
            cmd << ' ';
        cmd << quote_path(args[i]);
    }
    return cmd.str();
}

// ============================================================================
// Main Link Method
// ============================================================================

auto LLDLinker::link(const std::vector<fs::path>& object_files, const fs::path& output_path,
                     const LLDLinkOptions& options) -> LLDLinkResult {
    LLDLinkResult result;
    result.success = false;

    if (!initialized_) {
        result.error_message = "LLD linker not initialized";
        return result;
    }

    if (object_files.empty()) {
        result.error_message = "No object files provided for linking";
        return result;
    }

    for (const auto& obj : object_files) {
        if (!file_exists(obj)) {
            result.error_message = "Object file not found: " + obj.string();
            return result;
        }
    }

    std::vector<std::string> args;
    switch (format_) {
    case target::ObjectFormat::COFF:
        args = build_coff_args(object_files, output_path, options);
        break;
    case target::ObjectFormat::MachO:
        args = build_macho_args(object_files, output_path, options);
        break;
    case target::ObjectFormat::ELF:
        args = build_elf_args(object_files, output_path, options);
        break;
    }
    args[0] = lld_path_.string();

    fs::path log_path = output_path;
    log_path += ".link.log";
    std::string cmd = join_args(args) + " 2> " + quote_path(log_path.string());

    int ret = execute_command(cmd);
    std::string diagnostics = read_text_file(log_path);
    std::error_code ec;
    fs::remove(log_path, ec);

    if (ret != 0) {
        result.error_message = "Linking failed with exit code " + std::to_string(ret);
        if (!diagnostics.empty()) {
            result.error_message += ":\n" + diagnostics;
        }
        return result;
    }

    if (!file_exists(output_path)) {
        result.error_message = "Output file was not created: " + output_path.string();
        return result;
    }

    result.success = true;
    result.output_file = output_path;
    return result;
}

// ============================================================================
// Module-level Functions
// ============================================================================

auto is_lld_available() -> bool {
    LLDLinker linker;
    return linker.initialize(target::TargetConfig::host().object_format());
}

} // namespace waot::backend
