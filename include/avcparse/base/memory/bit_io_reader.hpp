#ifndef _AVCPARSE_BASE_MEMORY_BIT_IO_READER_H_
#define _AVCPARSE_BASE_MEMORY_BIT_IO_READER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io.hpp"
#include "avcparse/common/array_view.hpp"

#include <type_traits>

namespace avcparse {

// Byte order is assumend big-endian/network, bits are read MSB first.
class AVCPARSE_CPP_EXPORT BitReader {
public:
    // Upper bound of leading zero bits accepted in an Exp-Golomb code,
    // so that the decoded value still fits in a uint32_t.
    static constexpr size_t kMaxExpGolombLeadingZeros = 31;

    BitReader(const uint8_t* bytes, size_t byte_count);
    explicit BitReader(ArrayView<const uint8_t> bytes);

    void GetCurrentOffset(size_t* out_byte_offset, size_t* out_bit_offset) const;
    uint64_t RemainingBitCount() const;
    bool IsByteAligned() const { return bit_offset_ == 0; }

    // Reads bit-sized values from the buffer.
    // Return false if there isn't enough data left for the specified bit cout.
    template <typename T>
    bool ReadBits(size_t bit_count, T& val);

    template <typename T>
    bool ReadByte(T& val);

    bool ReadBit(bool& val);

    // ue(v), fails without moving the position if more than
    // `kMaxExpGolombLeadingZeros` leading zeros are found or the buffer runs out.
    bool ReadExpGolomb(uint32_t& val);
    // se(v)
    bool ReadSignedExpGolomb(int32_t& val);

    // Peeks bit-sized values from the buffer.
    // Return false if there isn't enough data left for the specified bit cout.
    template <typename T>
    bool PeekBits(size_t bit_count, T& val) const;

    // Moves current position `bit_count` bits forward. 
    // Returns false if there aren't enough bits left in the buffer.
    bool ConsumeBits(size_t bit_count);

    // Skips to the next byte boundary, no-op if already aligned.
    void ByteAlign();

    // more_rbsp_data(): true if there is syntax left before the
    // rbsp_stop_one_bit, i.e. the last set bit of the buffer.
    bool MoreRbspData() const;

    // Sets the current offset to the provided byte/bit offsets.
    // The bit offset is from the given byte, in the range [0,7]
    bool Seek(size_t byte_offset, size_t bit_offset);
  
private:
    const uint8_t* const bytes_;
    const size_t byte_count_;
    size_t byte_offset_;
    size_t bit_offset_;

    DISALLOW_COPY_AND_ASSIGN(BitReader);
};

template <typename T>
bool BitReader::ReadByte(T& val) {
    return ReadBits(sizeof(T) * 8, val);
}

template <typename T>
bool BitReader::ReadBits(size_t bit_count, T& val) {
    return PeekBits(bit_count, val) && ConsumeBits(bit_count);
}

template <typename T>
bool BitReader::PeekBits(size_t bit_count, T& val) const {
    static_assert(std::is_integral<T>::value && !std::is_same<T, bool>::value, 
                  "Type must be a non-bool integer.");
    if (bit_count > RemainingBitCount() || bit_count > (sizeof(T) * 8)) {
        return false;
    }
    if (bit_count == 0) {
        val = 0;
        return true;
    }
    const uint8_t* curr_bytes = bytes_ + byte_offset_;
    size_t remaining_bits_in_curr_byte = 8 - bit_offset_;
    uint64_t bits = RightMostBits(*curr_bytes++, remaining_bits_in_curr_byte);
    if (bit_count < remaining_bits_in_curr_byte) {
        // The remaining bits sit in the low end of the byte with
        // `bit_offset_` zero bits above them.
        val = static_cast<T>(LeftMostBits(static_cast<uint8_t>(bits), bit_offset_ + bit_count));
        return true;
    }
    bit_count -= remaining_bits_in_curr_byte;
    while (bit_count >= 8) {
        bits = (bits << 8) | *curr_bytes++;
        bit_count -= 8;
    }
    if (bit_count > 0) {
        bits <<= bit_count;
        bits |= LeftMostBits(*curr_bytes, bit_count);
    }
    val = static_cast<T>(bits);
    return true;
}

} // namespace avcparse

#endif
