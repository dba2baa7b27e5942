//! # Loaded Library Implementation
//!
//! dlopen/dlsym/dlclose on POSIX, LoadLibrary/GetProcAddress/FreeLibrary on
//! Windows.

#include "runtime/loaded_library.hpp"

#include "common/temp_path.hpp"
#include "log/log.hpp"

#include <atomic>
#include <fstream>
#include <mutex>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace waot::runtime {

namespace {

std::mutex& loader_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<size_t> g_live_libraries{0};

} // namespace

// ============================================================================
// Platform-specific dynamic library operations
// ============================================================================

// Callers hold loader_mutex().

static auto dl_open(const fs::path& path) -> void* {
#ifdef _WIN32
    return static_cast<void*>(LoadLibraryW(path.wstring().c_str()));
#else
    return dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
}

static auto dl_sym(void* handle, const char* symbol) -> void* {
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle), symbol));
#else
    return dlsym(handle, symbol);
#endif
}

static auto dl_close(void* handle) -> bool {
#ifdef _WIN32
    return FreeLibrary(static_cast<HMODULE>(handle)) != 0;
#else
    return dlclose(handle) == 0;
#endif
}

static auto dl_error() -> std::string {
#ifdef _WIN32
    DWORD err = GetLastError();
    if (err == 0)
        return "";
    LPSTR buf = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM, nullptr, err, 0,
                   reinterpret_cast<LPSTR>(&buf), 0, nullptr);
    std::string msg = buf ? buf : "Unknown error";
    LocalFree(buf);
    return msg;
#else
    const char* err = dlerror();
    return err ? err : "";
#endif
}

// ============================================================================
// LoadedLibrary
// ============================================================================

LoadedLibrary::LoadedLibrary(Token, void* handle, fs::path path, bool owns_file)
    : handle_(handle), path_(std::move(path)), owns_file_(owns_file) {
    g_live_libraries.fetch_add(1);
}

LoadedLibrary::~LoadedLibrary() {
    {
        std::lock_guard<std::mutex> lock(loader_mutex());
        if (!dl_close(handle_)) {
            WAOT_LOG_WARN("loader", "closing " << path_.string() << " failed: " << dl_error());
        }
    }
    g_live_libraries.fetch_sub(1);

    if (owns_file_) {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            WAOT_LOG_WARN("loader", "could not remove " << path_.string() << ": " << ec.message());
        }
    }
    WAOT_LOG_DEBUG("loader", "unloaded " << path_.string());
}

auto LoadedLibrary::host_extension() -> const char* {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

auto LoadedLibrary::open(const fs::path& path) -> Result<Rc<LoadedLibrary>, std::string> {
    void* handle = nullptr;
    std::string error;
    {
        std::lock_guard<std::mutex> lock(loader_mutex());
        handle = dl_open(path);
        if (!handle) {
            error = dl_error();
        }
    }
    if (!handle) {
        return "cannot load " + path.string() + ": " + error;
    }
    WAOT_LOG_DEBUG("loader", "loaded " << path.string());
    return make_rc<LoadedLibrary>(Token{}, handle, path, false);
}

auto LoadedLibrary::load(std::span<const uint8_t> bytes, const fs::path& work_dir,
                         const std::string& stem) -> Result<Rc<LoadedLibrary>, std::string> {
    std::error_code ec;
    fs::create_directories(work_dir, ec);
    if (ec) {
        return "cannot create work directory " + work_dir.string() + ": " + ec.message();
    }

    fs::path path = unique_path(work_dir, stem, host_extension());
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return "cannot write " + path.string();
        }
    }

    auto opened = open(path);
    if (is_err(opened)) {
        fs::remove(path, ec);
        return unwrap_err(opened);
    }
    unwrap(opened)->owns_file_ = true;
    return unwrap(opened);
}

auto LoadedLibrary::symbol(const std::string& name) const -> void* {
    std::lock_guard<std::mutex> lock(loader_mutex());
    return dl_sym(handle_, name.c_str());
}

auto LoadedLibrary::live_count() -> size_t {
    return g_live_libraries.load();
}

} // namespace waot::runtime
