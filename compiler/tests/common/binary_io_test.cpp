//! # Binary IO Tests
//!
//! Little-endian ByteWriter / ByteReader and the reader's error latching.

#include "common/binary_io.hpp"

#include <gtest/gtest.h>

using namespace waot;

TEST(ByteWriterTest, LittleEndianLayout) {
    ByteWriter w;
    w.write_u16(0x0102);
    w.write_u32(0x03040506);
    const auto& bytes = w.data();
    ASSERT_EQ(bytes.size(), 6u);
    EXPECT_EQ(bytes[0], 0x02);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(bytes[2], 0x06);
    EXPECT_EQ(bytes[5], 0x03);
}

TEST(ByteWriterTest, PatchU32) {
    ByteWriter w;
    w.write_u32(0);
    w.write_u8(7);
    w.patch_u32(0, 0xAABBCCDD);
    ByteReader r(w.data());
    EXPECT_EQ(r.read_u32(), 0xAABBCCDDu);
    EXPECT_EQ(r.read_u8(), 7);
    EXPECT_TRUE(r.at_end());
}

TEST(ByteReaderTest, ReadsWhatWasWritten) {
    ByteWriter w;
    w.write_u8(0xFF);
    w.write_u64(0x1122334455667788ULL);
    w.write_i64(-5);
    w.write_bool(true);
    w.write_string("waot");
    w.write_bytes(std::vector<uint8_t>{1, 2, 3});

    ByteReader r(w.data());
    EXPECT_EQ(r.read_u8(), 0xFF);
    EXPECT_EQ(r.read_u64(), 0x1122334455667788ULL);
    EXPECT_EQ(r.read_i64(), -5);
    EXPECT_TRUE(r.read_bool());
    EXPECT_EQ(r.read_string(), "waot");
    EXPECT_EQ(r.read_bytes(), (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_TRUE(r.at_end());
    EXPECT_FALSE(r.has_error());
}

TEST(ByteReaderTest, TruncationLatchesError) {
    std::vector<uint8_t> data = {1, 2};
    ByteReader r(data);
    EXPECT_EQ(r.read_u32(), 0u);
    EXPECT_TRUE(r.has_error());
    EXPECT_NE(r.error_message().find("unexpected end of data"), std::string::npos);

    // Later reads keep failing and the first message is kept.
    std::string first = r.error_message();
    EXPECT_EQ(r.read_u8(), 0);
    EXPECT_EQ(r.error_message(), first);
}

TEST(ByteReaderTest, InvalidBoolean) {
    std::vector<uint8_t> data = {2};
    ByteReader r(data);
    r.read_bool();
    EXPECT_TRUE(r.has_error());
}

TEST(ByteReaderTest, CountLargerThanRemainingIsRejected) {
    ByteWriter w;
    w.write_u32(1000000);
    w.write_u32(0);
    ByteReader r(w.data());
    EXPECT_EQ(r.read_count(4), 0u);
    EXPECT_TRUE(r.has_error());
}

TEST(ByteReaderTest, StringLengthPastEnd) {
    ByteWriter w;
    w.write_u32(100);
    w.write_raw("abc", 3);
    ByteReader r(w.data());
    EXPECT_TRUE(r.read_string().empty());
    EXPECT_TRUE(r.has_error());
}

TEST(ByteReaderTest, ReadSpanAdvances) {
    std::vector<uint8_t> data = {9, 8, 7, 6};
    ByteReader r(data);
    auto s = r.read_span(3);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[2], 7);
    EXPECT_EQ(r.position(), 3u);
    EXPECT_EQ(r.remaining(), 1u);
}
