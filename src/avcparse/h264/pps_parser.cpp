#include "avcparse/h264/pps_parser.hpp"
#include "avcparse/h264/nalunit.hpp"
#include "avcparse/h264/sps_parser.hpp"

namespace avcparse {
namespace h264 {
namespace {
constexpr int32_t kMaxPicInitQpDeltaValue = 25;
constexpr int32_t kMinPicInitQpDeltaValue = -26;
constexpr int32_t kMaxChromaQpIndexOffset = 12;
constexpr int32_t kMinChromaQpIndexOffset = -12;
constexpr uint32_t kMaxPpsId = 255;
constexpr uint32_t kMaxSpsId = 31;
constexpr uint32_t kMaxRefIdxActiveMinus1 = 31;
constexpr uint32_t kMaxSliceGroupsMinus1 = 7;
constexpr uint32_t kMaxSliceGroupMapType = 6;
constexpr uint32_t kMaxPicSizeInMapUnits = 1 << 18;

bool InRange(int32_t value, int32_t min_value, int32_t max_value) {
    return value >= min_value && value <= max_value;
}

}  // namespace

std::optional<PpsParser::PpsState> PpsParser::ParsePps(const uint8_t* data, size_t size, uint32_t chroma_format_idc) {
    std::vector<uint8_t> rbsp_buffer = NalUnit::RetrieveRbspFromEbsp(data, size);
    BitReader bit_reader(rbsp_buffer.data(), rbsp_buffer.size());
    return ParsePps(bit_reader, chroma_format_idc);
}

bool PpsParser::ParsePpsIds(const uint8_t* data, size_t size, uint32_t* pps_id, uint32_t* sps_id) {
    std::vector<uint8_t> rbsp_buffer = NalUnit::RetrieveRbspFromEbsp(data, size);
    BitReader bit_reader(rbsp_buffer.data(), rbsp_buffer.size());
    return ParsePpsIds(bit_reader, pps_id, sps_id);
}

bool PpsParser::ParsePpsIds(BitReader& bit_reader, uint32_t* pps_id, uint32_t* sps_id) {
    // pic_parameter_set_id: ue(v)
    if (pps_id == nullptr || !bit_reader.ReadExpGolomb(*pps_id) || *pps_id > kMaxPpsId) {
        return false;
    }
    // seq_parameter_set_id: ue(v)
    if (sps_id == nullptr || !bit_reader.ReadExpGolomb(*sps_id) || *sps_id > kMaxSpsId) {
        return false;
    }
    return true;
}

std::optional<PpsParser::PpsState> PpsParser::ParsePps(BitReader& bit_reader, uint32_t chroma_format_idc) {
    PpsState pps;
    if (!ParsePpsIds(bit_reader, &pps.id, &pps.sps_id)) {
        return std::nullopt;
    }
    uint32_t bits_tmp;
    uint32_t golomb_ignored;
    // entropy_coding_mode_flag: u(1)
    if (!bit_reader.ReadBit(pps.entropy_coding_mode_flag)) {
        return std::nullopt;
    }
    // bottom_field_pic_order_in_frame_present_flag: u(1)
    if (!bit_reader.ReadBit(pps.bottom_field_pic_order_in_frame_present_flag)) {
        return std::nullopt;
    }
    // num_slice_groups_minus1: ue(v)
    if (!bit_reader.ReadExpGolomb(pps.num_slice_groups_minus1) || 
        pps.num_slice_groups_minus1 > kMaxSliceGroupsMinus1) {
        return std::nullopt;
    }

    if (pps.num_slice_groups_minus1 > 0) {
        // slice_group_map_type: ue(v)
        if (!bit_reader.ReadExpGolomb(pps.slice_group_map_type) ||
            pps.slice_group_map_type > kMaxSliceGroupMapType) {
            return std::nullopt;
        }
        if (pps.slice_group_map_type == 0) {
            for (uint32_t i_group = 0; i_group <= pps.num_slice_groups_minus1; ++i_group) {
                // run_length_minus1[iGroup]: ue(v)
                if (!bit_reader.ReadExpGolomb(golomb_ignored)) {
                    return std::nullopt;
                }
            }
        } else if (pps.slice_group_map_type == 2) {
            // The last group is the background, it has no rectangle.
            for (uint32_t i_group = 0; i_group < pps.num_slice_groups_minus1; ++i_group) {
                // top_left[iGroup]: ue(v)
                // bottom_right[iGroup]: ue(v)
                if (!bit_reader.ReadExpGolomb(golomb_ignored) ||
                    !bit_reader.ReadExpGolomb(golomb_ignored)) {
                    return std::nullopt;
                }
            }
        } else if (pps.slice_group_map_type == 3 || 
                   pps.slice_group_map_type == 4 ||
                   pps.slice_group_map_type == 5) {
            // slice_group_change_direction_flag: u(1)
            if (!bit_reader.ReadBits(1, bits_tmp)) {
                return std::nullopt;
            }
            // slice_group_change_rate_minus1: ue(v)
            if (!bit_reader.ReadExpGolomb(pps.slice_group_change_rate_minus1)) {
                return std::nullopt;
            }
        } else if (pps.slice_group_map_type == 6) {
            // pic_size_in_map_units_minus1: ue(v)
            uint32_t pic_size_in_map_units_minus1;
            if (!bit_reader.ReadExpGolomb(pic_size_in_map_units_minus1) ||
                pic_size_in_map_units_minus1 >= kMaxPicSizeInMapUnits) {
                return std::nullopt;
            }
            // Ceil(Log2(num_slice_groups_minus1 + 1))
            const uint32_t num_slice_groups = pps.num_slice_groups_minus1 + 1;
            size_t slice_group_id_bits = 0;
            while ((1u << slice_group_id_bits) < num_slice_groups) {
                ++slice_group_id_bits;
            }
            for (uint32_t i = 0; i <= pic_size_in_map_units_minus1; ++i) {
                // slice_group_id[i]: u(v)
                if (!bit_reader.ReadBits(slice_group_id_bits, bits_tmp)) {
                    return std::nullopt;
                }
            }
        }
    }
    
    // num_ref_idx_l0_default_active_minus1: ue(v)
    if (!bit_reader.ReadExpGolomb(pps.num_ref_idx_l0_default_active_minus1) ||
        pps.num_ref_idx_l0_default_active_minus1 > kMaxRefIdxActiveMinus1) {
        return std::nullopt;
    }
    // num_ref_idx_l1_default_active_minus1: ue(v)
    if (!bit_reader.ReadExpGolomb(pps.num_ref_idx_l1_default_active_minus1) ||
        pps.num_ref_idx_l1_default_active_minus1 > kMaxRefIdxActiveMinus1) {
        return std::nullopt;
    }
    // weighted_pred_flag: u(1)
    if (!bit_reader.ReadBit(pps.weighted_pred_flag)) {
        return std::nullopt;
    }
    // weighted_bipred_idc: u(2)
    if (!bit_reader.ReadBits(2, pps.weighted_bipred_idc) || pps.weighted_bipred_idc > 2) {
        return std::nullopt;
    }
    // pic_init_qp_minus26: se(v)
    if (!bit_reader.ReadSignedExpGolomb(pps.pic_init_qp_minus26) ||
        !InRange(pps.pic_init_qp_minus26, kMinPicInitQpDeltaValue, kMaxPicInitQpDeltaValue)) {
        return std::nullopt;
    }
    // pic_init_qs_minus26: se(v)
    if (!bit_reader.ReadSignedExpGolomb(pps.pic_init_qs_minus26) ||
        !InRange(pps.pic_init_qs_minus26, kMinPicInitQpDeltaValue, kMaxPicInitQpDeltaValue)) {
        return std::nullopt;
    }
    // chroma_qp_index_offset: se(v)
    if (!bit_reader.ReadSignedExpGolomb(pps.chroma_qp_index_offset) ||
        !InRange(pps.chroma_qp_index_offset, kMinChromaQpIndexOffset, kMaxChromaQpIndexOffset)) {
        return std::nullopt;
    }
    // deblocking_filter_control_present_flag: u(1)
    if (!bit_reader.ReadBit(pps.deblocking_filter_control_present_flag)) {
        return std::nullopt;
    }
    // constrained_intra_pred_flag: u(1)
    if (!bit_reader.ReadBit(pps.constrained_intra_pred_flag)) {
        return std::nullopt;
    }
    // redundant_pic_cnt_present_flag: u(1)
    if (!bit_reader.ReadBit(pps.redundant_pic_cnt_present_flag)) {
        return std::nullopt;
    }

    pps.second_chroma_qp_index_offset = pps.chroma_qp_index_offset;
    if (bit_reader.MoreRbspData()) {
        // transform_8x8_mode_flag: u(1)
        if (!bit_reader.ReadBit(pps.transform_8x8_mode_flag)) {
            return std::nullopt;
        }
        // pic_scaling_matrix_present_flag: u(1)
        if (!bit_reader.ReadBit(pps.pic_scaling_matrix_present_flag)) {
            return std::nullopt;
        }
        if (pps.pic_scaling_matrix_present_flag) {
            size_t scaling_list_count = 6 + (pps.transform_8x8_mode_flag ? (chroma_format_idc == 3 ? 6 : 2) : 0);
            for (size_t i = 0; i < scaling_list_count; ++i) {
                // pic_scaling_list_present_flag[i]: u(1)
                bool pic_scaling_list_present_flag;
                if (!bit_reader.ReadBit(pic_scaling_list_present_flag)) {
                    return std::nullopt;
                }
                if (pic_scaling_list_present_flag && 
                    !SpsParser::SkipScalingList(bit_reader, i < 6 ? 16 : 64)) {
                    return std::nullopt;
                }
            }
        }
        // second_chroma_qp_index_offset: se(v)
        if (!bit_reader.ReadSignedExpGolomb(pps.second_chroma_qp_index_offset) ||
            !InRange(pps.second_chroma_qp_index_offset, kMinChromaQpIndexOffset, kMaxChromaQpIndexOffset)) {
            return std::nullopt;
        }
    }
    
    return pps;
}
    
} // namespace h264
} // namespace avcparse
