//! # Memories, Tables and Globals

#include "runtime/memory.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstring>
#include <new>

namespace waot::runtime {

// ============================================================================
// LinearMemory
// ============================================================================

LinearMemory::LinearMemory(ir::MemoryType type, uint32_t page_limit)
    : type_(type), page_limit_(page_limit) {}

auto LinearMemory::create(ir::MemoryType type, uint32_t page_limit)
    -> Result<Rc<LinearMemory>, std::string> {
    const ir::Limits& limits = type.limits;
    if (limits.max && *limits.max < limits.min) {
        return std::string("memory maximum ") + std::to_string(*limits.max) + " below minimum " +
               std::to_string(limits.min);
    }
    if (limits.min > std::min(page_limit, WASM_MAX_PAGES)) {
        return "memory of " + std::to_string(limits.min) + " pages exceeds the limit of " +
               std::to_string(std::min(page_limit, WASM_MAX_PAGES)) + " pages";
    }

    Rc<LinearMemory> memory(new LinearMemory(type, page_limit));
    try {
        memory->bytes_.resize(static_cast<size_t>(limits.min) * WASM_PAGE_SIZE);
    } catch (const std::bad_alloc&) {
        return "cannot allocate " + std::to_string(limits.min) + " memory pages";
    }
    memory->sync_definition();
    WAOT_LOG_TRACE("instance", "allocated memory of " << limits.min << " pages");
    return memory;
}

auto LinearMemory::max_pages() const -> uint32_t {
    uint32_t max = std::min(page_limit_, WASM_MAX_PAGES);
    if (type_.limits.max) {
        max = std::min(max, *type_.limits.max);
    }
    return max;
}

void LinearMemory::sync_definition() {
    def_.base = bytes_.data();
    def_.length = bytes_.size();
}

auto LinearMemory::grow(uint32_t delta) -> std::optional<uint32_t> {
    uint32_t old_pages = pages();
    if (delta == 0) {
        return old_pages;
    }
    if (static_cast<uint64_t>(old_pages) + delta > max_pages()) {
        return std::nullopt;
    }
    try {
        bytes_.resize(bytes_.size() + static_cast<size_t>(delta) * WASM_PAGE_SIZE);
    } catch (const std::bad_alloc&) {
        WAOT_LOG_WARN("instance", "memory.grow by " << delta << " pages: out of host memory");
        return std::nullopt;
    }
    sync_definition();
    return old_pages;
}

auto LinearMemory::read(uint64_t offset, std::span<uint8_t> out) const -> bool {
    if (!in_bounds(offset, out.size())) {
        return false;
    }
    if (!out.empty()) {
        std::memcpy(out.data(), bytes_.data() + offset, out.size());
    }
    return true;
}

auto LinearMemory::write(uint64_t offset, std::span<const uint8_t> bytes) -> bool {
    if (!in_bounds(offset, bytes.size())) {
        return false;
    }
    if (!bytes.empty()) {
        std::memcpy(bytes_.data() + offset, bytes.data(), bytes.size());
    }
    return true;
}

auto LinearMemory::copy_within(uint64_t dst, uint64_t src, uint64_t len) -> bool {
    if (!in_bounds(dst, len) || !in_bounds(src, len)) {
        return false;
    }
    if (len != 0) {
        std::memmove(bytes_.data() + dst, bytes_.data() + src, len);
    }
    return true;
}

auto LinearMemory::fill(uint64_t dst, uint8_t value, uint64_t len) -> bool {
    if (!in_bounds(dst, len)) {
        return false;
    }
    if (len != 0) {
        std::memset(bytes_.data() + dst, value, len);
    }
    return true;
}

// ============================================================================
// Table
// ============================================================================

Table::Table(ir::TableType type) : type_(type) {}

auto Table::create(ir::TableType type) -> Result<Rc<Table>, std::string> {
    const ir::Limits& limits = type.limits;
    if (limits.max && *limits.max < limits.min) {
        return std::string("table maximum ") + std::to_string(*limits.max) + " below minimum " +
               std::to_string(limits.min);
    }

    Rc<Table> table(new Table(type));
    try {
        table->elements_.assign(limits.min, nullptr);
    } catch (const std::bad_alloc&) {
        return "cannot allocate a table of " + std::to_string(limits.min) + " elements";
    }
    table->def_.elements = table->elements_.data();
    table->def_.size = table->elements_.size();
    return table;
}

auto Table::get(uint32_t index) const -> std::optional<VMFuncRef*> {
    if (index >= elements_.size()) {
        return std::nullopt;
    }
    return elements_[index];
}

auto Table::set(uint32_t index, VMFuncRef* ref) -> bool {
    if (index >= elements_.size()) {
        return false;
    }
    elements_[index] = ref;
    return true;
}

// ============================================================================
// Global
// ============================================================================

Global::Global(ir::GlobalType type, uint64_t bits) : type_(type), cell_(bits) {}

auto Global::create(ir::GlobalType type, Value init) -> Result<Rc<Global>, std::string> {
    if (init.kind != type.kind) {
        return std::string("global of kind ") + ir::value_kind_name(type.kind) +
               " initialized with " + ir::value_kind_name(init.kind);
    }
    if (type.kind == ir::ValueKind::V128) {
        return std::string("v128 globals are not supported");
    }
    return Rc<Global>(new Global(type, init.bits));
}

auto Global::set(Value value) -> bool {
    if (!type_.is_mutable || value.kind != type_.kind) {
        return false;
    }
    cell_ = value.bits;
    return true;
}

} // namespace waot::runtime
