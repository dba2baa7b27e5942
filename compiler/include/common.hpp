//! # Common Definitions
//!
//! Types and helpers shared by every waot component.
//!
//! ## Overview
//!
//! - **Version Information**: engine and artifact format versions
//! - **Result Type**: error handling without exceptions
//! - **Smart Pointers**: aliases for unique and shared pointers
//!
//! The public API never throws: every fallible operation returns a
//! `Result<T, E>`. Unique ownership is spelled `Box<T>`, shared ownership
//! `Rc<T>`.

#ifndef WAOT_COMMON_HPP
#define WAOT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace waot {

// ============================================================================
// Version Information
// ============================================================================

/// The engine version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Rc<DylibArtifact>, Error> r = engine->compile(module);
/// if (is_err(r)) {
///     WAOT_LOG_ERROR("engine", unwrap_err(r).to_string());
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace waot

#endif // WAOT_COMMON_HPP
