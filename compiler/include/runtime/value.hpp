//! # Runtime Values
//!
//! A WebAssembly value as the embedder sees it: a kind plus 64 raw bits.
//! Integers are stored zero-extended, floats by bit pattern, references
//! as the `VMFuncRef*` address (0 for null). This is also the exact
//! encoding of one trampoline value slot.

#ifndef WAOT_RUNTIME_VALUE_HPP
#define WAOT_RUNTIME_VALUE_HPP

#include "ir/module_ir.hpp"

#include <cstdint>
#include <cstring>
#include <string>

namespace waot::runtime {

struct Value {
    ir::ValueKind kind = ir::ValueKind::I32;
    uint64_t bits = 0;

    [[nodiscard]] static auto i32(int32_t v) -> Value {
        return {ir::ValueKind::I32, static_cast<uint32_t>(v)};
    }
    [[nodiscard]] static auto i64(int64_t v) -> Value {
        return {ir::ValueKind::I64, static_cast<uint64_t>(v)};
    }
    [[nodiscard]] static auto f32(float v) -> Value {
        uint32_t raw;
        std::memcpy(&raw, &v, sizeof(raw));
        return {ir::ValueKind::F32, raw};
    }
    [[nodiscard]] static auto f64(double v) -> Value {
        uint64_t raw;
        std::memcpy(&raw, &v, sizeof(raw));
        return {ir::ValueKind::F64, raw};
    }
    [[nodiscard]] static auto ref(const void* p) -> Value {
        return {ir::ValueKind::Ref, reinterpret_cast<uintptr_t>(p)};
    }
    [[nodiscard]] static auto null_ref() -> Value {
        return {ir::ValueKind::Ref, 0};
    }

    /// A zero value of the given kind.
    [[nodiscard]] static auto zero(ir::ValueKind kind) -> Value {
        return {kind, 0};
    }

    [[nodiscard]] auto as_i32() const -> int32_t {
        return static_cast<int32_t>(static_cast<uint32_t>(bits));
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        return static_cast<int64_t>(bits);
    }
    [[nodiscard]] auto as_f32() const -> float {
        uint32_t raw = static_cast<uint32_t>(bits);
        float v;
        std::memcpy(&v, &raw, sizeof(v));
        return v;
    }
    [[nodiscard]] auto as_f64() const -> double {
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }
    [[nodiscard]] auto as_ref() const -> void* {
        return reinterpret_cast<void*>(static_cast<uintptr_t>(bits));
    }
    [[nodiscard]] auto is_null() const -> bool {
        return kind == ir::ValueKind::Ref && bits == 0;
    }

    bool operator==(const Value& other) const = default;

    /// "i32:42", "f64:1.5", "ref:null"
    [[nodiscard]] auto to_string() const -> std::string {
        switch (kind) {
        case ir::ValueKind::I32:
            return "i32:" + std::to_string(as_i32());
        case ir::ValueKind::I64:
            return "i64:" + std::to_string(as_i64());
        case ir::ValueKind::F32:
            return "f32:" + std::to_string(as_f32());
        case ir::ValueKind::F64:
            return "f64:" + std::to_string(as_f64());
        case ir::ValueKind::Ref:
            return bits == 0 ? "ref:null" : "ref:" + std::to_string(bits);
        case ir::ValueKind::V128:
            return "v128";
        }
        return "?";
    }
};

} // namespace waot::runtime

#endif // WAOT_RUNTIME_VALUE_HPP
