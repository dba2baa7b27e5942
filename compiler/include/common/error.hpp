//! # Engine Errors
//!
//! Every fallible engine operation reports failure as an `Error` carried in
//! a `Result<T, Error>`. The `ErrorKind` tells the caller which stage failed
//! and therefore whether retrying can help:
//!
//! | Kind           | Raised by                          | Retryable |
//! |----------------|------------------------------------|-----------|
//! | Configuration  | `Builder::build`                   | no        |
//! | Compile        | artifact compiler, code generator  | no        |
//! | Trampoline     | trampoline generator               | no        |
//! | Serialization  | serializer (both directions)       | no        |
//! | TargetMismatch | `deserialize`, `instantiate`       | no        |
//! | Link           | import resolution in `instantiate` | yes       |
//! | Instantiation  | allocation, segments, start        | yes       |

#ifndef WAOT_COMMON_ERROR_HPP
#define WAOT_COMMON_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace waot {

enum class ErrorKind : uint8_t {
    Configuration,
    Compile,
    Trampoline,
    Serialization,
    TargetMismatch,
    Link,
    Instantiation,
};

/// Returns the display name of an error kind (e.g. "CompileError").
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

/// An engine error.
struct Error {
    ErrorKind kind = ErrorKind::Compile;
    std::string message;

    /// Function-space index of the function that failed, for compile errors.
    std::optional<uint32_t> function_index;

    [[nodiscard]] static auto configuration(std::string message) -> Error;
    [[nodiscard]] static auto compile(std::string message) -> Error;
    [[nodiscard]] static auto compile_function(uint32_t index, std::string message) -> Error;
    [[nodiscard]] static auto trampoline(std::string message) -> Error;
    [[nodiscard]] static auto serialization(std::string message) -> Error;
    [[nodiscard]] static auto target_mismatch(std::string message) -> Error;
    [[nodiscard]] static auto link(std::string message) -> Error;
    [[nodiscard]] static auto instantiation(std::string message) -> Error;

    /// "CompileError: function 3: unsupported opcode ..."
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace waot

#endif // WAOT_COMMON_ERROR_HPP
