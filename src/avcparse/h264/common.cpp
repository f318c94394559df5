#include "avcparse/h264/common.hpp"

namespace avcparse {
namespace h264 {

NaluType ToNaluType(uint8_t unit_type) {
    switch (unit_type & 0x1F) {
    case 0:
    case 1:
    case 2:
    case 3:
    case 4:
    case 5:
    case 6:
    case 7:
    case 8:
    case 9:
    case 10:
    case 11:
    case 12:
    case 13:
    case 14:
    case 15:
    case 16:
    case 19:
    case 20:
        return static_cast<NaluType>(unit_type & 0x1F);
    default:
        return NaluType::UNKNOWN;
    }
}

const char* ToString(NaluType type) {
    switch (type) {
    case NaluType::UNSPECIFIED:
        return "Unspecified";
    case NaluType::SLICE:
        return "Slice";
    case NaluType::DATA_PARTITION_A:
        return "DataPartitionA";
    case NaluType::DATA_PARTITION_B:
        return "DataPartitionB";
    case NaluType::DATA_PARTITION_C:
        return "DataPartitionC";
    case NaluType::IDR:
        return "IDR";
    case NaluType::SEI:
        return "SEI";
    case NaluType::SPS:
        return "SPS";
    case NaluType::PPS:
        return "PPS";
    case NaluType::AUD:
        return "AUD";
    case NaluType::END_OF_SEQUENCE:
        return "EndOfSequence";
    case NaluType::END_OF_STREAM:
        return "EndOfStream";
    case NaluType::FILLER:
        return "Filler";
    case NaluType::SPS_EXTENSION:
        return "SpsExtension";
    case NaluType::PREFIX:
        return "Prefix";
    case NaluType::SUBSET_SPS:
        return "SubsetSPS";
    case NaluType::DEPTH_PARAMETER_SET:
        return "DepthParameterSet";
    case NaluType::AUXILIARY_SLICE:
        return "AuxiliarySlice";
    case NaluType::SLICE_EXTENSION:
        return "SliceExtension";
    case NaluType::UNKNOWN:
        return "Unknown";
    }
    return "Unknown";
}

bool IsVcl(NaluType type) {
    return type == NaluType::SLICE ||
           type == NaluType::DATA_PARTITION_A ||
           type == NaluType::DATA_PARTITION_B ||
           type == NaluType::DATA_PARTITION_C ||
           type == NaluType::IDR;
}

std::optional<SliceType> ToSliceType(uint32_t slice_type) {
    if (slice_type > 9) {
        return std::nullopt;
    }
    return static_cast<SliceType>(slice_type % 5);
}

const char* ToString(SliceType type) {
    switch (type) {
    case SliceType::P:
        return "P";
    case SliceType::B:
        return "B";
    case SliceType::I:
        return "I";
    case SliceType::SP:
        return "SP";
    case SliceType::SI:
        return "SI";
    }
    return "?";
}

} // namespace h264
} // namespace avcparse
