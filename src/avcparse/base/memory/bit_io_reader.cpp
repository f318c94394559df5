#include "avcparse/base/memory/bit_io_reader.hpp"

namespace avcparse {

BitReader::BitReader(const uint8_t* bytes, size_t byte_count) 
    : bytes_(bytes),
      byte_count_(byte_count),
      byte_offset_(0),
      bit_offset_(0) {}

BitReader::BitReader(ArrayView<const uint8_t> bytes) 
    : BitReader(bytes.data(), bytes.size()) {}

void BitReader::GetCurrentOffset(size_t* out_byte_offset,
                                 size_t* out_bit_offset) const {
    if (out_byte_offset) {
        *out_byte_offset = byte_offset_;
    }
    if (out_bit_offset) {
        *out_bit_offset = bit_offset_;
    }
}

uint64_t BitReader::RemainingBitCount() const {
    return (static_cast<uint64_t>(byte_count_) - byte_offset_) * 8 - bit_offset_;
}

bool BitReader::ReadBit(bool& val) {
    uint8_t bit = 0;
    if (!ReadBits(1, bit)) {
        return false;
    }
    val = bit != 0;
    return true;
}

// See https://en.wikipedia.org/wiki/Exponential-Golomb_coding
bool BitReader::ReadExpGolomb(uint32_t& value) {
    size_t original_byte_offset = byte_offset_;
    size_t original_bit_offset = bit_offset_;

    size_t zero_bit_count = 0;
    uint8_t peeked_bit = 0;
    // Count the number of leading 0 bits, bailing out as soon as
    // the code can no longer fit in 32 bits.
    while (PeekBits(1, peeked_bit) && peeked_bit == 0) {
        if (++zero_bit_count > kMaxExpGolombLeadingZeros) {
            Seek(original_byte_offset, original_bit_offset);
            return false;
        }
        ConsumeBits(1);
    }
    // The bit count of the value is the number of zeros + 1.
    size_t value_bit_count = zero_bit_count + 1;
    uint64_t code = 0;
    if (!ReadBits(value_bit_count, code)) {
        // Reset to original offset
        Seek(original_byte_offset, original_bit_offset);
        return false;
    }
    value = static_cast<uint32_t>(code - 1);
    return true;
}

bool BitReader::ReadSignedExpGolomb(int32_t& value) {
    uint32_t code_num;
    if (!ReadExpGolomb(code_num)) {
        return false;
    }
    // code_num = 2|k| (k ≤ 0)
    // code_num = 2|k| − 1 (k > 0)
    if ((code_num & 1) == 0) {
        value = -static_cast<int32_t>(code_num / 2);
    } else {
        value = static_cast<int32_t>((static_cast<uint64_t>(code_num) + 1) / 2);
    }
    return true;
}

bool BitReader::ConsumeBits(size_t bit_count) {
    if (bit_count > RemainingBitCount()) {
        return false;
    }
    size_t new_bit_offset = bit_offset_ + bit_count;
    byte_offset_ += new_bit_offset / 8;
    // in the range [0,7]
    bit_offset_ = new_bit_offset % 8;
    return true;
}

void BitReader::ByteAlign() {
    if (bit_offset_ != 0) {
        ++byte_offset_;
        bit_offset_ = 0;
    }
}

bool BitReader::MoreRbspData() const {
    // Trailing zero bytes (cabac_zero_word) follow the stop bit.
    size_t last_byte = byte_count_;
    while (last_byte > byte_offset_ && bytes_[last_byte - 1] == 0) {
        --last_byte;
    }
    if (last_byte == byte_offset_) {
        return false;
    }
    uint64_t stop_bit_position = static_cast<uint64_t>(last_byte) * 8 - 1 - CountTrailingZeroBits(bytes_[last_byte - 1]);
    uint64_t current_position = static_cast<uint64_t>(byte_offset_) * 8 + bit_offset_;
    return current_position < stop_bit_position;
}

bool BitReader::Seek(size_t byte_offset, size_t bit_offset) {
    if (byte_offset > byte_count_ || 
        bit_offset > 7 ||
        (byte_offset == byte_count_ && bit_offset > 0)) {
        return false;
    }
    byte_offset_ = byte_offset;
    bit_offset_ = bit_offset;
    return true;
}

} // namespace avcparse
