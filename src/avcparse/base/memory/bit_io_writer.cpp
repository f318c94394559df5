#include "avcparse/base/memory/bit_io_writer.hpp"

#include <algorithm>
#include <limits>

namespace avcparse {

BitWriter::BitWriter(uint8_t* bytes, size_t byte_count) 
    : bytes_(bytes),
      byte_count_(byte_count),
      byte_offset_(0),
      bit_offset_(0) {}

void BitWriter::GetCurrentOffset(size_t* out_byte_offset,
                                 size_t* out_bit_offset) const {
    if (out_byte_offset) {
        *out_byte_offset = byte_offset_;
    }
    if (out_bit_offset) {
        *out_bit_offset = bit_offset_;
    }
}

uint64_t BitWriter::RemainingBitCount() const {
    return (static_cast<uint64_t>(byte_count_) - byte_offset_) * 8 - bit_offset_;
}

bool BitWriter::WriteBits(uint64_t val, size_t bit_count) {
    if (bit_count > RemainingBitCount() || bit_count > 64) {
        return false;
    }
    if (bit_count == 0) {
        return true;
    }
    size_t total_bits = bit_count;
    // Push the bits to write to the highest bits of `val`.
    val <<= (sizeof(uint64_t) * 8 - bit_count);
    uint8_t* bytes = bytes_ + byte_offset_;
    // The first byte may be partially written already, and the bit count
    // may also end before the end of that byte.
    size_t remaining_bits_in_current_byte = 8 - bit_offset_;
    size_t bits_in_first_byte = std::min(bit_count, remaining_bits_in_current_byte);
    *bytes = WritePartialByte(LeftMostByte(val), bits_in_first_byte, *bytes, bit_offset_);
    if (bit_count <= remaining_bits_in_current_byte) {
        return ConsumeBits(total_bits);
    }

    val <<= bits_in_first_byte;
    bytes++;
    bit_count -= bits_in_first_byte;
    while (bit_count >= 8) {
        *bytes++ = LeftMostByte(val);
        val <<= 8;
        bit_count -= 8;
    }

    // Last byte may also be partial.
    if (bit_count > 0) {
        *bytes = WritePartialByte(LeftMostByte(val), bit_count, *bytes, 0);
    }

    return ConsumeBits(total_bits);
}

bool BitWriter::Seek(size_t byte_offset, size_t bit_offset) {
    if (byte_offset > byte_count_ || 
        bit_offset > 7 ||
        (byte_offset == byte_count_ && bit_offset > 0)) {
        return false;
    }
    byte_offset_ = byte_offset;
    bit_offset_ = bit_offset;
    return true;
}

bool BitWriter::WriteExpGolomb(uint32_t val) {
    // UINT32_MAX can not be read back into a uint32_t, so don't write it either.
    if (val == std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    uint64_t val_to_encode = static_cast<uint64_t>(val) + 1;

    // CountBits(val+1) - 1 zeros followed by val+1, which is exactly
    // val+1 written with twice its bit width minus one.
    return WriteBits(val_to_encode, CountBits(val_to_encode) * 2 - 1);
}

bool BitWriter::WriteSignedExpGolomb(int32_t val) {
    if (val == 0) {
        return WriteExpGolomb(0);
    } else if (val > 0) {
        uint32_t signed_val = val;
        return WriteExpGolomb((signed_val * 2) - 1);
    } else {
        if (val == std::numeric_limits<int32_t>::min()) {
            return false;
        }
        uint32_t signed_val = -val;
        return WriteExpGolomb(signed_val * 2);
    }
}

size_t BitWriter::WriteRbspTrailingBits() {
    if (WriteBits(1, 1) && bit_offset_ != 0) {
        WriteBits(0, 8 - bit_offset_);
    }
    return byte_offset_;
}

// Private methods
bool BitWriter::ConsumeBits(size_t bit_count) {
    if (bit_count > RemainingBitCount()) {
        return false;
    }
    size_t new_bit_offset = bit_offset_ + bit_count;
    byte_offset_ += new_bit_offset / 8;
    // in the range [0,7]
    bit_offset_ = new_bit_offset % 8;
    return true;
}

// Returns `target` with `source_bit_count` high bits of `source`
// written at `target_bit_offset` from its highest bit.
uint8_t BitWriter::WritePartialByte(uint8_t source,
                                    size_t source_bit_count,
                                    uint8_t target,
                                    size_t target_bit_offset) {
    uint8_t mask = static_cast<uint8_t>(0xFF << (8 - source_bit_count)) >> target_bit_offset;
    return (target & ~mask) | (source >> target_bit_offset);
}

} // namespace avcparse
