#include "common/binary_io.hpp"

namespace waot {

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void ByteWriter::write_u32(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteWriter::write_u64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteWriter::write_i64(int64_t value) {
    write_u64(static_cast<uint64_t>(value));
}

void ByteWriter::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void ByteWriter::write_string(const std::string& str) {
    write_u32(static_cast<uint32_t>(str.size()));
    write_raw(str.data(), str.size());
}

void ByteWriter::write_bytes(std::span<const uint8_t> bytes) {
    write_u32(static_cast<uint32_t>(bytes.size()));
    write_raw(bytes.data(), bytes.size());
}

void ByteWriter::write_raw(const void* data, size_t len) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), bytes, bytes + len);
}

void ByteWriter::patch_u32(size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_[offset + i] = static_cast<uint8_t>(value >> (i * 8));
    }
}

// ============================================================================
// ByteReader
// ============================================================================

void ByteReader::set_error(const std::string& msg) {
    if (!has_error_) {
        has_error_ = true;
        error_ = msg;
    }
}

bool ByteReader::ensure(size_t len) {
    if (has_error_) {
        return false;
    }
    if (len > remaining()) {
        set_error("unexpected end of data at offset " + std::to_string(pos_) + " (need " +
                  std::to_string(len) + " bytes, " + std::to_string(remaining()) + " left)");
        return false;
    }
    return true;
}

uint8_t ByteReader::read_u8() {
    if (!ensure(1))
        return 0;
    return data_[pos_++];
}

uint16_t ByteReader::read_u16() {
    if (!ensure(2))
        return 0;
    uint16_t value = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
    pos_ += 2;
    return value;
}

uint32_t ByteReader::read_u32() {
    if (!ensure(4))
        return 0;
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[pos_ + i]) << (i * 8);
    }
    pos_ += 4;
    return value;
}

uint64_t ByteReader::read_u64() {
    if (!ensure(8))
        return 0;
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[pos_ + i]) << (i * 8);
    }
    pos_ += 8;
    return value;
}

int64_t ByteReader::read_i64() {
    return static_cast<int64_t>(read_u64());
}

bool ByteReader::read_bool() {
    uint8_t v = read_u8();
    if (v > 1) {
        set_error("invalid boolean byte " + std::to_string(v));
    }
    return v == 1;
}

std::string ByteReader::read_string() {
    uint32_t len = read_u32();
    auto bytes = read_span(len);
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::vector<uint8_t> ByteReader::read_bytes() {
    uint32_t len = read_u32();
    auto bytes = read_span(len);
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

uint32_t ByteReader::read_count(size_t min_element_size) {
    uint32_t count = read_u32();
    if (has_error_) {
        return 0;
    }
    if (min_element_size > 0 && static_cast<uint64_t>(count) * min_element_size > remaining()) {
        set_error("element count " + std::to_string(count) + " exceeds remaining data at offset " +
                  std::to_string(pos_));
        return 0;
    }
    return count;
}

std::span<const uint8_t> ByteReader::read_span(size_t len) {
    if (!ensure(len))
        return {};
    auto view = data_.subspan(pos_, len);
    pos_ += len;
    return view;
}

} // namespace waot
