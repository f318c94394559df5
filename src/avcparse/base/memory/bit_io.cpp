#include "avcparse/base/memory/bit_io.hpp"

namespace avcparse {

uint8_t RightMostBits(uint8_t byte, size_t bit_count) {
    if (bit_count >= 8) {
        return byte;
    }
    return byte & ((1 << bit_count) - 1);
}

uint8_t LeftMostBits(uint8_t byte, size_t bit_count) {
    if (bit_count == 0) {
        return 0;
    }
    if (bit_count >= 8) {
        return byte;
    }
    uint8_t shift = 8 - static_cast<uint8_t>(bit_count);
    return static_cast<uint8_t>(byte >> shift);
}

uint8_t LeftMostByte(uint64_t val) {
    return static_cast<uint8_t>(val >> 56);
}

size_t CountBits(uint64_t val) {
    size_t bit_count = 0;
    while (val != 0) {
        bit_count++;
        val >>= 1;
    }
    return bit_count;
}

size_t CountTrailingZeroBits(uint8_t byte) {
    if (byte == 0) {
        return 8;
    }
    size_t zero_count = 0;
    while ((byte & 0x01) == 0) {
        ++zero_count;
        byte >>= 1;
    }
    return zero_count;
}
    
} // namespace avcparse
