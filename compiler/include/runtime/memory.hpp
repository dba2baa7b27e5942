//! # Memories, Tables and Globals
//!
//! Runtime objects an instance defines or imports. Each owns the
//! definition block generated code reads through the VMContext, so an
//! imported object is shared by pointer between the instances using it.
//!
//! None of these types is thread-safe.

#ifndef WAOT_RUNTIME_MEMORY_HPP
#define WAOT_RUNTIME_MEMORY_HPP

#include "common.hpp"
#include "ir/module_ir.hpp"
#include "runtime/value.hpp"
#include "runtime/vmcontext.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace waot::runtime {

// ============================================================================
// LinearMemory
// ============================================================================

class LinearMemory {
public:
    /// Allocates `type.limits.min` zeroed pages. `page_limit` caps growth
    /// below the declared maximum.
    [[nodiscard]] static auto create(ir::MemoryType type, uint32_t page_limit = WASM_MAX_PAGES)
        -> Result<Rc<LinearMemory>, std::string>;

    LinearMemory(const LinearMemory&) = delete;
    LinearMemory& operator=(const LinearMemory&) = delete;

    [[nodiscard]] auto type() const -> const ir::MemoryType& {
        return type_;
    }

    [[nodiscard]] auto pages() const -> uint32_t {
        return static_cast<uint32_t>(bytes_.size() / WASM_PAGE_SIZE);
    }

    [[nodiscard]] auto size_bytes() const -> uint64_t {
        return bytes_.size();
    }

    /// Largest page count `grow` can reach.
    [[nodiscard]] auto max_pages() const -> uint32_t;

    [[nodiscard]] auto data() -> uint8_t* {
        return bytes_.data();
    }

    /// Grows by `delta` pages. Returns the previous page count, or nullopt
    /// when the result would exceed `max_pages()`.
    auto grow(uint32_t delta) -> std::optional<uint32_t>;

    /// Bounds-checked accessors. Return false without touching memory when
    /// the range is out of bounds.
    auto read(uint64_t offset, std::span<uint8_t> out) const -> bool;
    auto write(uint64_t offset, std::span<const uint8_t> bytes) -> bool;
    auto copy_within(uint64_t dst, uint64_t src, uint64_t len) -> bool;
    auto fill(uint64_t dst, uint8_t value, uint64_t len) -> bool;

    [[nodiscard]] auto in_bounds(uint64_t offset, uint64_t len) const -> bool {
        return offset <= bytes_.size() && len <= bytes_.size() - offset;
    }

    /// The block `VMContext::memory` points at.
    [[nodiscard]] auto definition() -> VMMemoryDefinition* {
        return &def_;
    }

private:
    LinearMemory(ir::MemoryType type, uint32_t page_limit);

    void sync_definition();

    ir::MemoryType type_;
    uint32_t page_limit_;
    std::vector<uint8_t> bytes_;
    VMMemoryDefinition def_{nullptr, 0};
};

// ============================================================================
// Table
// ============================================================================

/// A funcref table. Entries point at the funcref blocks of the instances
/// that stored them; those instances must outlive their entries' use.
class Table {
public:
    [[nodiscard]] static auto create(ir::TableType type) -> Result<Rc<Table>, std::string>;

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    [[nodiscard]] auto type() const -> const ir::TableType& {
        return type_;
    }

    [[nodiscard]] auto size() const -> uint32_t {
        return static_cast<uint32_t>(elements_.size());
    }

    /// nullopt when out of bounds; a null entry is `nullptr`.
    [[nodiscard]] auto get(uint32_t index) const -> std::optional<VMFuncRef*>;

    auto set(uint32_t index, VMFuncRef* ref) -> bool;

    [[nodiscard]] auto definition() -> VMTableDefinition* {
        return &def_;
    }

private:
    explicit Table(ir::TableType type);

    ir::TableType type_;
    std::vector<VMFuncRef*> elements_;
    VMTableDefinition def_{nullptr, 0};
};

// ============================================================================
// Global
// ============================================================================

class Global {
public:
    /// Fails when `init` does not have the global's kind.
    [[nodiscard]] static auto create(ir::GlobalType type, Value init)
        -> Result<Rc<Global>, std::string>;

    Global(const Global&) = delete;
    Global& operator=(const Global&) = delete;

    [[nodiscard]] auto type() const -> const ir::GlobalType& {
        return type_;
    }

    [[nodiscard]] auto get() const -> Value {
        return Value{type_.kind, cell_};
    }

    /// Host-side write. Immutable globals and values of another kind are
    /// rejected.
    auto set(Value value) -> bool;

    /// The cell generated code reads and writes.
    [[nodiscard]] auto cell() -> uint64_t* {
        return &cell_;
    }

private:
    Global(ir::GlobalType type, uint64_t bits);

    ir::GlobalType type_;
    uint64_t cell_;
};

} // namespace waot::runtime

#endif // WAOT_RUNTIME_MEMORY_HPP
