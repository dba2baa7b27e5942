//! # Scratch Paths
//!
//! Unique file and directory names under the engine's work directory.

#ifndef WAOT_COMMON_TEMP_PATH_HPP
#define WAOT_COMMON_TEMP_PATH_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <sstream>
#include <string>
#include <thread>

namespace waot {

/// A module name reduced to `[A-Za-z0-9_]` for use in a file name.
inline auto file_stem(const std::string& name) -> std::string {
    std::string stem;
    stem.reserve(name.size());
    for (char c : name) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_';
        stem.push_back(keep ? c : '_');
    }
    return stem.empty() ? "module" : stem;
}

/// `<dir>/<stem>-<unique><extension>`. Unique within the process and, with
/// overwhelming probability, across processes sharing `dir`.
inline auto unique_path(const std::filesystem::path& dir, const std::string& stem,
                        const std::string& extension = "") -> std::filesystem::path {
    static std::atomic<uint64_t> counter{0};
    uint64_t n = counter.fetch_add(1, std::memory_order_relaxed);
    auto ticks = static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    auto thread = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    std::ostringstream name;
    name << stem << '-' << std::hex << (ticks ^ (thread << 1)) << '-' << n << extension;
    return dir / name.str();
}

} // namespace waot

#endif // WAOT_COMMON_TEMP_PATH_HPP
