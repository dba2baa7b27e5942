#include "common/error.hpp"

namespace waot {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Configuration:
        return "ConfigurationError";
    case ErrorKind::Compile:
        return "CompileError";
    case ErrorKind::Trampoline:
        return "TrampolineError";
    case ErrorKind::Serialization:
        return "SerializationError";
    case ErrorKind::TargetMismatch:
        return "TargetMismatch";
    case ErrorKind::Link:
        return "LinkError";
    case ErrorKind::Instantiation:
        return "InstantiationError";
    }
    return "Error";
}

auto Error::configuration(std::string message) -> Error {
    return Error{ErrorKind::Configuration, std::move(message), std::nullopt};
}

auto Error::compile(std::string message) -> Error {
    return Error{ErrorKind::Compile, std::move(message), std::nullopt};
}

auto Error::compile_function(uint32_t index, std::string message) -> Error {
    return Error{ErrorKind::Compile, std::move(message), index};
}

auto Error::trampoline(std::string message) -> Error {
    return Error{ErrorKind::Trampoline, std::move(message), std::nullopt};
}

auto Error::serialization(std::string message) -> Error {
    return Error{ErrorKind::Serialization, std::move(message), std::nullopt};
}

auto Error::target_mismatch(std::string message) -> Error {
    return Error{ErrorKind::TargetMismatch, std::move(message), std::nullopt};
}

auto Error::link(std::string message) -> Error {
    return Error{ErrorKind::Link, std::move(message), std::nullopt};
}

auto Error::instantiation(std::string message) -> Error {
    return Error{ErrorKind::Instantiation, std::move(message), std::nullopt};
}

auto Error::to_string() const -> std::string {
    std::string out = error_kind_name(kind);
    out += ": ";
    if (function_index) {
        out += "function " + std::to_string(*function_index) + ": ";
    }
    out += message;
    return out;
}

} // namespace waot
