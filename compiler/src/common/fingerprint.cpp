#include "common/fingerprint.hpp"

#include "common/crc32c.hpp"

namespace waot {

std::string Fingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    char buf[33];
    uint64_t vals[2] = {high, low};
    for (int v = 0; v < 2; ++v) {
        uint64_t val = vals[v];
        for (int i = 15; i >= 0; --i) {
            buf[v * 16 + i] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    buf[32] = '\0';
    return std::string(buf);
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    if (!data || len == 0) {
        return {};
    }

    // Four independent CRC lanes, one per quarter of the input, so that a
    // change anywhere only has to survive one 32-bit checksum.
    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t quarter = len / 4;
    size_t bounds[5] = {0, quarter, quarter * 2, quarter * 3, len};

    uint32_t lanes[4];
    for (int i = 0; i < 4; ++i) {
        static constexpr uint32_t SEEDS[4] = {0xFFFFFFFF, 0x9E3779B9, 0x85EBCA6B, 0xC2B2AE35};
        uint32_t crc = crc32c_update(SEEDS[i], bytes + bounds[i], bounds[i + 1] - bounds[i]);
        lanes[i] = crc32c_finish(crc);
    }

    uint64_t hi = (static_cast<uint64_t>(lanes[0]) << 32) | lanes[1];
    uint64_t lo = (static_cast<uint64_t>(lanes[2]) << 32) | lanes[3];
    hi ^= static_cast<uint64_t>(len) * 0x9E3779B97F4A7C15ULL;
    return {hi, lo};
}

Fingerprint fingerprint_string(std::string_view str) {
    return fingerprint_bytes(str.data(), str.size());
}

Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b) {
    uint64_t hi = a.high ^ (b.high * 0x517CC1B727220A95ULL + 1);
    uint64_t lo = a.low ^ (b.low * 0x6C62272E07BB0142ULL + 1);
    return {hi, lo};
}

} // namespace waot
