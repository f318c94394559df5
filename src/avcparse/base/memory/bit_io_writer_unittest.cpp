#include "avcparse/base/memory/bit_io_writer.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

#include <limits>

namespace avcparse {
namespace test {

MY_TEST(BitWriterTest, SetOffsetValues) {
    uint8_t bytes[4] = {0};
    BitWriter bit_writer(bytes, 4);

    size_t byte_offset, bit_offset;
    // Bit offsets are [0,7].
    EXPECT_TRUE(bit_writer.Seek(0, 0));
    EXPECT_TRUE(bit_writer.Seek(0, 7));
    bit_writer.GetCurrentOffset(&byte_offset, &bit_offset);
    EXPECT_EQ(0u, byte_offset);
    EXPECT_EQ(7u, bit_offset);
    EXPECT_FALSE(bit_writer.Seek(0, 8));
    bit_writer.GetCurrentOffset(&byte_offset, &bit_offset);
    EXPECT_EQ(0u, byte_offset);
    EXPECT_EQ(7u, bit_offset);
    // Byte offsets are [0,length]. At byte offset length, the bit offset must be 0.
    EXPECT_TRUE(bit_writer.Seek(2, 4));
    bit_writer.GetCurrentOffset(&byte_offset, &bit_offset);
    EXPECT_EQ(2u, byte_offset);
    EXPECT_EQ(4u, bit_offset);
    EXPECT_TRUE(bit_writer.Seek(4, 0));
    EXPECT_FALSE(bit_writer.Seek(5, 0));
    EXPECT_FALSE(bit_writer.Seek(4, 1));
    EXPECT_EQ(0u, bit_writer.RemainingBitCount());
}

MY_TEST(BitWriterTest, WriteBits) {
    uint8_t bytes[3] = {0};
    BitWriter bit_writer(bytes, 3);
    EXPECT_TRUE(bit_writer.WriteBits(0x2, 3));
    EXPECT_TRUE(bit_writer.WriteBits(0x1, 2));
    EXPECT_TRUE(bit_writer.WriteBits(0x53, 7));
    EXPECT_TRUE(bit_writer.WriteBits(0x0, 2));
    EXPECT_TRUE(bit_writer.WriteBits(0x1, 1));
    EXPECT_TRUE(bit_writer.WriteBits(0x0, 1));
    EXPECT_EQ(0x4Du, bytes[0]);
    EXPECT_EQ(0x32u, bytes[1]);
    EXPECT_TRUE(bit_writer.WriteByte(static_cast<uint8_t>(0xAB)));
    EXPECT_EQ(0xABu, bytes[2]);
    EXPECT_FALSE(bit_writer.WriteBits(1, 1));
}

MY_TEST(BitWriterTest, SymmetricGolomb) {
    char test_string[] = "hello,world";
    uint8_t bytes[64] = {0};
    size_t w_byte_offset, w_bit_offset;
    size_t r_byte_offset, r_bit_offset;
    BitWriter bit_writer(bytes, 64);
    BitReader bit_reader(bytes, 64);
    for (size_t i = 0; i < 11; ++i) {
        EXPECT_TRUE(bit_writer.WriteExpGolomb(test_string[i]));
        bit_writer.GetCurrentOffset(&w_byte_offset, &w_bit_offset);
        
        uint32_t val;
        EXPECT_TRUE(bit_reader.ReadExpGolomb(val));
        bit_reader.GetCurrentOffset(&r_byte_offset, &r_bit_offset);
        EXPECT_EQ(test_string[i], static_cast<char>(val));

        EXPECT_EQ(w_byte_offset, r_byte_offset);
        EXPECT_EQ(w_bit_offset, r_bit_offset);
    }
}

MY_TEST(BitWriterTest, SignedGolombAndLargeValues) {
    uint8_t bytes[32] = {0};
    BitWriter bit_writer(bytes, sizeof(bytes));
    const int32_t signed_values[] = {0, 1, -1, 2, -3, 1000, -1000};
    for (int32_t value : signed_values) {
        EXPECT_TRUE(bit_writer.WriteSignedExpGolomb(value));
    }
    EXPECT_TRUE(bit_writer.WriteExpGolomb(std::numeric_limits<uint32_t>::max() - 1));

    BitReader bit_reader(bytes, sizeof(bytes));
    for (int32_t value : signed_values) {
        int32_t decoded = 0;
        EXPECT_TRUE(bit_reader.ReadSignedExpGolomb(decoded));
        EXPECT_EQ(value, decoded);
    }
    uint32_t decoded = 0;
    EXPECT_TRUE(bit_reader.ReadExpGolomb(decoded));
    EXPECT_EQ(std::numeric_limits<uint32_t>::max() - 1, decoded);
}

MY_TEST(BitWriterTest, WriteRbspTrailingBits) {
    uint8_t bytes[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    BitWriter bit_writer(bytes, 4);
    EXPECT_TRUE(bit_writer.WriteBits(0x5, 3));
    EXPECT_EQ(1u, bit_writer.WriteRbspTrailingBits());
    // 101 | 1 | 0000
    EXPECT_EQ(0xB0u, bytes[0]);

    // Already aligned: a whole byte of stop bit.
    EXPECT_EQ(2u, bit_writer.WriteRbspTrailingBits());
    EXPECT_EQ(0x80u, bytes[1]);
}
    
} // namespace test
} // namespace avcparse
