#ifndef _AVCPARSE_BASE_MEMORY_BIT_IO_WRITER_H_
#define _AVCPARSE_BASE_MEMORY_BIT_IO_WRITER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io.hpp"

namespace avcparse {

// Writes MSB first into a caller provided buffer.
class AVCPARSE_CPP_EXPORT BitWriter {
public:
    BitWriter(uint8_t* bytes, size_t byte_count);

    void GetCurrentOffset(size_t* out_byte_offset, size_t* out_bit_offset) const;
    uint64_t RemainingBitCount() const;

    bool WriteBits(uint64_t val, size_t bit_count);

    template <typename T>
    bool WriteByte(T val);

    bool WriteExpGolomb(uint32_t val);
    bool WriteSignedExpGolomb(int32_t val);

    // rbsp_trailing_bits(): the stop bit followed by zero bits up to the byte boundary.
    // Returns the number of bytes written so far.
    size_t WriteRbspTrailingBits();

    bool Seek(size_t byte_offset, size_t bit_offset);

private:
    bool ConsumeBits(size_t bit_count);
    uint8_t WritePartialByte(uint8_t source,
                             size_t source_bit_count,
                             uint8_t target,
                             size_t target_bit_offset);
private:
    uint8_t* const bytes_;
    const size_t byte_count_;
    size_t byte_offset_;
    size_t bit_offset_;

    DISALLOW_COPY_AND_ASSIGN(BitWriter);
};

template <typename T>
bool BitWriter::WriteByte(T val) {
    return WriteBits(static_cast<uint64_t>(val), sizeof(T) * 8);
}
    
} // namespace avcparse

#endif
