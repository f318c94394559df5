#include "avcparse/base/memory/bit_io_reader.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

#include <limits>
#include <vector>

namespace avcparse {
namespace test {

MY_TEST(BitReaderTest, ConsumeBits) {
    const uint8_t bytes[64] = {0};
    BitReader bit_reader(bytes, 32);
    uint64_t total_bits = 32 * 8;
    EXPECT_EQ(total_bits, bit_reader.RemainingBitCount());
    EXPECT_TRUE(bit_reader.ConsumeBits(3));
    total_bits -= 3;
    EXPECT_EQ(total_bits, bit_reader.RemainingBitCount());
    EXPECT_TRUE(bit_reader.ConsumeBits(15));
    total_bits -= 15;
    EXPECT_EQ(total_bits, bit_reader.RemainingBitCount());
    EXPECT_TRUE(bit_reader.ConsumeBits(37));
    total_bits -= 37;
    EXPECT_EQ(total_bits, bit_reader.RemainingBitCount());

    EXPECT_FALSE(bit_reader.ConsumeBits(32 * 8));
    EXPECT_EQ(total_bits, bit_reader.RemainingBitCount());
}

MY_TEST(BitReaderTest, ReadBytesOffset3) {
    // Counting down from 0b1111, offset by 3 bits, the last 5 bits unused.
    const uint8_t bytes[] = {0x1F, 0xDB, 0x97, 0x53, 0x0E, 0xCA, 0x86, 0x42};

    uint8_t val8;
    uint16_t val16;
    uint32_t val32;
    BitReader bit_reader(bytes, 8);
    EXPECT_TRUE(bit_reader.ConsumeBits(3));
    EXPECT_FALSE(bit_reader.IsByteAligned());
    EXPECT_TRUE(bit_reader.ReadByte(val8));
    EXPECT_EQ(0xFEu, val8);
    EXPECT_TRUE(bit_reader.ReadByte(val16));
    EXPECT_EQ(0xDCBAu, val16);
    EXPECT_TRUE(bit_reader.ReadByte(val32));
    EXPECT_EQ(0x98765432u, val32);
    // 5 bits left unread. Not enough to read a uint8_t.
    EXPECT_EQ(5u, bit_reader.RemainingBitCount());
    EXPECT_FALSE(bit_reader.ReadByte(val8));
}

MY_TEST(BitReaderTest, ReadBits) {
    // 0b01001101, 0b00110010
    const uint8_t bytes[] = {0x4D, 0x32};
    uint32_t val;
    BitReader bit_reader(bytes, 2);
    EXPECT_TRUE(bit_reader.ReadBits(3, val));
    EXPECT_EQ(0x2u, val);
    EXPECT_TRUE(bit_reader.ReadBits(2, val));
    EXPECT_EQ(0x1u, val);
    EXPECT_TRUE(bit_reader.ReadBits(7, val));
    EXPECT_EQ(0x53u, val);
    EXPECT_TRUE(bit_reader.ReadBits(0, val));
    EXPECT_EQ(0x0u, val);
    EXPECT_TRUE(bit_reader.ReadBits(2, val));
    EXPECT_EQ(0x0u, val);
    bool flag = false;
    EXPECT_TRUE(bit_reader.ReadBit(flag));
    EXPECT_TRUE(flag);
    EXPECT_TRUE(bit_reader.ReadBit(flag));
    EXPECT_FALSE(flag);

    EXPECT_FALSE(bit_reader.ReadBits(1, val));
    EXPECT_TRUE(bit_reader.ReadBits(0, val));
}

MY_TEST(BitReaderTest, ReadBits64) {
    const uint8_t bytes[] = {0x4D, 0x32, 0xAB, 0x54, 0x00, 0xFF, 0xFE, 0x01,
                             0xAB, 0xCD, 0xEF, 0x01, 0x23, 0x45, 0x67, 0x89};
    BitReader bit_reader(bytes, 16);
    uint64_t val;

    EXPECT_TRUE(bit_reader.PeekBits(33, val));
    EXPECT_EQ(0x4D32AB5400FFFE01ull >> (64 - 33), val);
    val = 0;
    EXPECT_TRUE(bit_reader.ReadBits(33, val));
    EXPECT_EQ(0x4D32AB5400FFFE01ull >> (64 - 33), val);

    constexpr uint64_t kMask31Bits = (1ull << 32) - 1;
    EXPECT_TRUE(bit_reader.ReadBits(31, val));
    EXPECT_EQ(0x4D32AB5400FFFE01ull & kMask31Bits, val);

    EXPECT_TRUE(bit_reader.PeekBits(64, val));
    EXPECT_EQ(0xABCDEF0123456789ull, val);
    val = 0;
    EXPECT_TRUE(bit_reader.ReadBits(64, val));
    EXPECT_EQ(0xABCDEF0123456789ull, val);

    EXPECT_FALSE(bit_reader.ReadBits(1, val));
}

MY_TEST(BitReaderTest, ByteAlign) {
    const uint8_t bytes[] = {0xFF, 0x5A};
    BitReader bit_reader(bytes, 2);
    bit_reader.ByteAlign();
    EXPECT_EQ(16u, bit_reader.RemainingBitCount());
    EXPECT_TRUE(bit_reader.ConsumeBits(1));
    bit_reader.ByteAlign();
    EXPECT_TRUE(bit_reader.IsByteAligned());
    uint8_t val;
    EXPECT_TRUE(bit_reader.ReadByte(val));
    EXPECT_EQ(0x5Au, val);
}

uint64_t GolombEncoded(uint32_t val) {
    uint64_t code = static_cast<uint64_t>(val) + 1;
    uint64_t bit_counter = code;
    uint64_t bit_count = 0;
    while (bit_counter > 0) {
        bit_count++;
        bit_counter >>= 1;
    }
    return code << (64 - (bit_count * 2 - 1));
}

MY_TEST(BitReaderTest, GolombUint32Values) {
    uint8_t bytes[16] = {0};
    BitReader bit_reader(bytes, sizeof(bytes));
    // Around 20,000 values over the uint32_t range.
    const uint32_t kStep = std::numeric_limits<uint32_t>::max() / 20000;
    for (uint32_t i = 0; i < std::numeric_limits<uint32_t>::max() - kStep; i += kStep) {
        uint64_t encoded_val = GolombEncoded(i);
        for (size_t k = 0; k < 8; ++k) {
            bytes[k] = static_cast<uint8_t>(encoded_val >> (56 - 8 * k));
        }
        uint32_t decoded_val;
        EXPECT_TRUE(bit_reader.Seek(0, 0));
        EXPECT_TRUE(bit_reader.ReadExpGolomb(decoded_val));
        EXPECT_EQ(i, decoded_val);
    }
}

MY_TEST(BitReaderTest, GolombMaxValue) {
    // 31 zeros, then 32 ones: 2^32 - 2.
    const uint8_t bytes[] = {0x00, 0x00, 0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFE};
    BitReader bit_reader(bytes, sizeof(bytes));
    uint32_t decoded_val;
    EXPECT_TRUE(bit_reader.ReadExpGolomb(decoded_val));
    EXPECT_EQ(0xFFFFFFFEu, decoded_val);
    EXPECT_EQ(1u, bit_reader.RemainingBitCount());
}

MY_TEST(BitReaderTest, GolombTooManyLeadingZeros) {
    // 32 leading zeros do not fit a uint32_t.
    const uint8_t bytes[] = {0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    BitReader bit_reader(bytes, sizeof(bytes));
    uint32_t decoded_val;
    EXPECT_FALSE(bit_reader.ReadExpGolomb(decoded_val));
    size_t byte_offset, bit_offset;
    bit_reader.GetCurrentOffset(&byte_offset, &bit_offset);
    EXPECT_EQ(0u, byte_offset);
    EXPECT_EQ(0u, bit_offset);
}

MY_TEST(BitReaderTest, SignedGolombValues) {
    uint8_t golomb_bits[] = {
        0x80,  // 1
        0x40,  // 010
        0x60,  // 011
        0x20,  // 00100
        0x38,  // 00111
    };
    int32_t expected[] = {0, 1, -1, 2, -3};
    for (size_t i = 0; i < sizeof(golomb_bits); ++i) {
        BitReader bit_reader(&golomb_bits[i], 1);
        int32_t decoded_val;
        ASSERT_TRUE(bit_reader.ReadSignedExpGolomb(decoded_val));
        EXPECT_EQ(expected[i], decoded_val)
            << "Mismatch in expected/decoded value for golomb_bits[" << i
            << "]: " << static_cast<int>(golomb_bits[i]);
    }
}

MY_TEST(BitReaderTest, NoGolombOverread) {
    const uint8_t bytes[] = {0x00, 0xFF, 0xFF};
    BitReader bit_reader(bytes, 1);
    uint32_t decoded_val;
    EXPECT_FALSE(bit_reader.ReadExpGolomb(decoded_val));

    BitReader longer_bit_reader(bytes, 2);
    EXPECT_FALSE(longer_bit_reader.ReadExpGolomb(decoded_val));

    BitReader longest_bit_reader(bytes, 3);
    EXPECT_TRUE(longest_bit_reader.ReadExpGolomb(decoded_val));
    // 9 bits read, 0x01FF - 1.
    EXPECT_EQ(0x01FEu, decoded_val);
}

MY_TEST(BitReaderTest, MoreRbspData) {
    // 1 | 010 | stop bit | 000
    const uint8_t bytes[] = {0xA8};
    BitReader bit_reader(bytes, 1);
    EXPECT_TRUE(bit_reader.MoreRbspData());
    uint32_t val;
    EXPECT_TRUE(bit_reader.ReadExpGolomb(val));
    EXPECT_EQ(0u, val);
    EXPECT_TRUE(bit_reader.MoreRbspData());
    EXPECT_TRUE(bit_reader.ReadExpGolomb(val));
    EXPECT_EQ(1u, val);
    EXPECT_FALSE(bit_reader.MoreRbspData());
}

MY_TEST(BitReaderTest, MoreRbspDataIgnoresTrailingZeroBytes) {
    const uint8_t bytes[] = {0x80, 0x00, 0x00};
    BitReader bit_reader(bytes, sizeof(bytes));
    EXPECT_FALSE(bit_reader.MoreRbspData());

    const uint8_t empty[] = {0x00, 0x00};
    BitReader empty_reader(empty, sizeof(empty));
    EXPECT_FALSE(empty_reader.MoreRbspData());

    const uint8_t more[] = {0x40, 0x80, 0x00};
    BitReader more_reader(more, sizeof(more));
    EXPECT_TRUE(more_reader.MoreRbspData());
    EXPECT_TRUE(more_reader.ConsumeBits(8));
    EXPECT_FALSE(more_reader.MoreRbspData());
}
    
} // namespace test
} // namespace avcparse
