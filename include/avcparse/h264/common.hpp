#ifndef _AVCPARSE_H264_COMMON_H_
#define _AVCPARSE_H264_COMMON_H_

#include "avcparse/base/defines.hpp"

#include <optional>

namespace avcparse {
namespace h264 {

// The size of a full NALU start sequence {0 0 0 1},
// used for the first NALU of an access unit, and for SPS and PPS block.
static constexpr size_t kNaluLongStartSequenceSize = 4;

// The size of a shortened NALU start sequence {0 0 1}, 
// that may be used if not the first NALU of an access unit or SPS or PPS blocks.
static constexpr size_t kNaluShortStartSequenceSize = 3;

struct AVCPARSE_CPP_EXPORT NaluIndex {
    // Offset of the start sequence in the stream.
    size_t start_offset;
    // Offset of the NALU header in the stream.
    size_t payload_start_offset;
    // Length of NALU, header included and trailing zero bytes excluded.
    size_t payload_size;

    size_t start_sequence_size() const { return payload_start_offset - start_offset; }
};

// nal_unit_type, Table 7-1.
enum class NaluType : uint8_t {
    UNSPECIFIED = 0,
    SLICE = 1,
    DATA_PARTITION_A = 2,
    DATA_PARTITION_B = 3,
    DATA_PARTITION_C = 4,
    IDR = 5,
    SEI = 6,
    SPS = 7,
    PPS = 8,
    AUD = 9,
    END_OF_SEQUENCE = 10,
    END_OF_STREAM = 11,
    FILLER = 12,
    SPS_EXTENSION = 13,
    PREFIX = 14,
    SUBSET_SPS = 15,
    DEPTH_PARAMETER_SET = 16,
    AUXILIARY_SLICE = 19,
    SLICE_EXTENSION = 20,
    // Reserved (17, 18, 21-23) and unspecified (24-31) values,
    // the raw code is kept in NalUnit::unit_type().
    UNKNOWN = 0xFF
};

AVCPARSE_CPP_EXPORT NaluType ToNaluType(uint8_t unit_type);
AVCPARSE_CPP_EXPORT const char* ToString(NaluType type);

// Coded slice units carrying primary picture data (types 1 to 5).
AVCPARSE_CPP_EXPORT bool IsVcl(NaluType type);

// slice_type % 5, Table 7-6.
enum class SliceType : uint8_t { 
    P = 0, 
    B = 1, 
    I = 2, 
    SP = 3, 
    SI = 4 
};

// Returns nullopt for values above 9.
AVCPARSE_CPP_EXPORT std::optional<SliceType> ToSliceType(uint32_t slice_type);
AVCPARSE_CPP_EXPORT const char* ToString(SliceType type);

} // namespace h264
} // namespace avcparse

#endif
