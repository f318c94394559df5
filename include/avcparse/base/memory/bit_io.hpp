#ifndef _AVCPARSE_BASE_MEMORY_BIT_IO_H_
#define _AVCPARSE_BASE_MEMORY_BIT_IO_H_

#include "avcparse/base/defines.hpp"

namespace avcparse {

// Returns the right-most `bit_count` bits in `byte`.
uint8_t RightMostBits(uint8_t byte, size_t bit_count);

// Returns the left-most `bit_count` bits in `byte`.
uint8_t LeftMostBits(uint8_t byte, size_t bit_count);

// Returns the left-most byte of `val` in a uint8_t.
uint8_t LeftMostByte(uint64_t val);

// Counts the number of bits used in the binary representation of val.
size_t CountBits(uint64_t val);

// Returns the number of zero bits below the lowest set bit of `byte`, 8 for zero.
size_t CountTrailingZeroBits(uint8_t byte);
    
} // namespace avcparse

#endif
