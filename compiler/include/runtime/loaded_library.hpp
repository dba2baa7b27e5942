//! # Loaded Libraries
//!
//! The OS dynamic loader behind a reference-counted handle. Every call into
//! the loader (open, symbol lookup, close) goes through one process-wide
//! mutex, and each successful open is paired with exactly one close when
//! the last `Rc<LoadedLibrary>` is dropped.
//!
//! Library bytes are written to a uniquely named file in the work
//! directory before opening, so two loads of the same artifact never share
//! a loader handle. The file is removed again on close.

#pragma once

#include "common.hpp"

#include <filesystem>
#include <span>
#include <string>

namespace fs = std::filesystem;

namespace waot::runtime {

class LoadedLibrary {
    struct Token {
        explicit Token() = default;
    };

public:
    /// Writes `bytes` to `<work_dir>/<stem>-<unique><ext>` and opens it.
    [[nodiscard]] static auto load(std::span<const uint8_t> bytes, const fs::path& work_dir,
                                   const std::string& stem) -> Result<Rc<LoadedLibrary>, std::string>;

    /// Opens an existing library file. The file is left in place on close.
    [[nodiscard]] static auto open(const fs::path& path) -> Result<Rc<LoadedLibrary>, std::string>;

    /// Use `load` or `open`.
    LoadedLibrary(Token, void* handle, fs::path path, bool owns_file);
    ~LoadedLibrary();

    LoadedLibrary(const LoadedLibrary&) = delete;
    LoadedLibrary& operator=(const LoadedLibrary&) = delete;

    /// Address of an exported symbol, nullptr if absent.
    [[nodiscard]] auto symbol(const std::string& name) const -> void*;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

    /// Number of libraries currently open in this process.
    [[nodiscard]] static auto live_count() -> size_t;

    /// Shared-library file extension of the host (".so", ".dylib", ".dll").
    [[nodiscard]] static auto host_extension() -> const char*;

private:
    void* handle_;
    fs::path path_;
    bool owns_file_;
};

} // namespace waot::runtime
