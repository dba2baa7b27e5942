//! # Binary Buffers
//!
//! Little-endian primitive writer and reader over in-memory byte buffers.
//! Shared by the module content encoding (fingerprints) and the artifact
//! metadata format.
//!
//! Strings are length-prefixed (`u32` length + bytes), collections are
//! count-prefixed by the caller. The reader never throws: the first
//! out-of-bounds read latches an error, every later read returns zero, and
//! callers check `has_error()` once at the end of a logical unit.

#ifndef WAOT_COMMON_BINARY_IO_HPP
#define WAOT_COMMON_BINARY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace waot {

class ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_i64(int64_t value);
    void write_bool(bool value);
    void write_string(const std::string& str);
    void write_bytes(std::span<const uint8_t> bytes);

    /// Writes raw bytes with no length prefix.
    void write_raw(const void* data, size_t len);

    /// Overwrites a previously written u32 at `offset`.
    void patch_u32(size_t offset, uint32_t value);

    [[nodiscard]] auto size() const -> size_t {
        return buffer_.size();
    }
    [[nodiscard]] auto data() const -> const std::vector<uint8_t>& {
        return buffer_;
    }
    [[nodiscard]] auto take() -> std::vector<uint8_t> {
        return std::move(buffer_);
    }

private:
    std::vector<uint8_t> buffer_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    uint64_t read_u64();
    int64_t read_i64();
    bool read_bool();
    std::string read_string();
    std::vector<uint8_t> read_bytes();

    /// Reads a count prefix and checks that at least `count * min_element_size`
    /// bytes remain, so corrupt counts cannot trigger huge allocations.
    uint32_t read_count(size_t min_element_size);

    /// Returns a view of the next `len` bytes and advances past them.
    std::span<const uint8_t> read_span(size_t len);

    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }
    [[nodiscard]] auto remaining() const -> size_t {
        return data_.size() - pos_;
    }
    [[nodiscard]] auto at_end() const -> bool {
        return pos_ == data_.size();
    }

    [[nodiscard]] bool has_error() const {
        return has_error_;
    }
    [[nodiscard]] const std::string& error_message() const {
        return error_;
    }

    /// Latches an error (only the first one is kept).
    void set_error(const std::string& msg);

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
    bool has_error_ = false;
    std::string error_;

    bool ensure(size_t len);
};

} // namespace waot

#endif // WAOT_COMMON_BINARY_IO_HPP
