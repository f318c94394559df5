#include "avcparse/h264/slice_header_parser.hpp"
#include "avcparse/h264/nalunit.hpp"

namespace avcparse {
namespace h264 {
namespace {
constexpr uint32_t kMaxPpsId = 255;
constexpr uint32_t kMaxRefIdxActiveMinus1 = 31;
constexpr uint32_t kMaxCabacInitIdc = 2;
constexpr uint32_t kMaxDisableDeblockingFilterIdc = 2;
// Upper bounds of the modification and marking loops, each
// entry refers to a distinct reference picture.
constexpr size_t kMaxRefPicListModifications = 2 * (kMaxRefIdxActiveMinus1 + 1) + 1;
constexpr size_t kMaxMemoryManagementOperations = 64;

bool IsPSlice(SliceType type) {
    return type == SliceType::P || type == SliceType::SP;
}

bool IsBSlice(SliceType type) {
    return type == SliceType::B;
}

// Ceil(Log2(PicSizeInMapUnits ÷ SliceGroupChangeRate + 1)), equation 7-35.
size_t SliceGroupChangeCycleBits(uint32_t pic_size_in_map_units, uint32_t slice_group_change_rate) {
    size_t bits = 0;
    while (((uint64_t(1) << bits) - 1) * slice_group_change_rate < pic_size_in_map_units) {
        ++bits;
    }
    return bits;
}

} // namespace

std::optional<SliceHeader> SliceHeaderParser::ParseLeadingFields(BitReader& bit_reader, 
                                                                 NaluType nalu_type, 
                                                                 uint8_t nal_ref_idc) {
    SliceHeader header;
    header.nal_ref_idc = nal_ref_idc;
    header.idr_pic_flag = nalu_type == NaluType::IDR;
    // first_mb_in_slice: ue(v)
    if (!bit_reader.ReadExpGolomb(header.first_mb_in_slice)) {
        return std::nullopt;
    }
    // slice_type: ue(v)
    if (!bit_reader.ReadExpGolomb(header.slice_type_value)) {
        return std::nullopt;
    }
    auto slice_type = ToSliceType(header.slice_type_value);
    if (!slice_type) {
        return std::nullopt;
    }
    header.slice_type = *slice_type;
    // pic_parameter_set_id: ue(v)
    if (!bit_reader.ReadExpGolomb(header.pic_parameter_set_id) ||
        header.pic_parameter_set_id > kMaxPpsId) {
        return std::nullopt;
    }
    return header;
}

std::optional<SliceHeader> SliceHeaderParser::Parse(const uint8_t* data, 
                                                    size_t size,
                                                    NaluType nalu_type,
                                                    uint8_t nal_ref_idc,
                                                    const SpsParser::SpsState& sps,
                                                    const PpsParser::PpsState& pps) {
    std::vector<uint8_t> rbsp_buffer = NalUnit::RetrieveRbspFromEbsp(data, size);
    BitReader bit_reader(rbsp_buffer.data(), rbsp_buffer.size());
    return Parse(bit_reader, nalu_type, nal_ref_idc, sps, pps);
}

std::optional<SliceHeader> SliceHeaderParser::Parse(BitReader& bit_reader,
                                                    NaluType nalu_type,
                                                    uint8_t nal_ref_idc,
                                                    const SpsParser::SpsState& sps,
                                                    const PpsParser::PpsState& pps) {
    auto leading = ParseLeadingFields(bit_reader, nalu_type, nal_ref_idc);
    if (!leading || leading->pic_parameter_set_id != pps.id) {
        return std::nullopt;
    }
    SliceHeader header = *leading;
    const SliceType slice_type = header.slice_type;

    if (sps.separate_colour_plane_flag) {
        // colour_plane_id: u(2)
        if (!bit_reader.ReadBits(2, header.colour_plane_id)) {
            return std::nullopt;
        }
    }
    // frame_num: u(v)
    if (!bit_reader.ReadBits(sps.log2_max_frame_num, header.frame_num)) {
        return std::nullopt;
    }
    if (!sps.frame_mbs_only_flag) {
        // field_pic_flag: u(1)
        if (!bit_reader.ReadBit(header.field_pic_flag)) {
            return std::nullopt;
        }
        if (header.field_pic_flag) {
            // bottom_field_flag: u(1)
            if (!bit_reader.ReadBit(header.bottom_field_flag)) {
                return std::nullopt;
            }
        }
    }
    if (header.idr_pic_flag) {
        // idr_pic_id: ue(v)
        if (!bit_reader.ReadExpGolomb(header.idr_pic_id) || header.idr_pic_id > 65535) {
            return std::nullopt;
        }
    }
    if (sps.pic_order_cnt_type == 0) {
        // pic_order_cnt_lsb: u(v)
        if (!bit_reader.ReadBits(sps.log2_max_pic_order_cnt_lsb, header.pic_order_cnt_lsb)) {
            return std::nullopt;
        }
        if (pps.bottom_field_pic_order_in_frame_present_flag && !header.field_pic_flag) {
            // delta_pic_order_cnt_bottom: se(v)
            if (!bit_reader.ReadSignedExpGolomb(header.delta_pic_order_cnt_bottom)) {
                return std::nullopt;
            }
        }
    }
    if (sps.pic_order_cnt_type == 1 && !sps.delta_pic_order_always_zero_flag) {
        // delta_pic_order_cnt[0]: se(v)
        if (!bit_reader.ReadSignedExpGolomb(header.delta_pic_order_cnt[0])) {
            return std::nullopt;
        }
        if (pps.bottom_field_pic_order_in_frame_present_flag && !header.field_pic_flag) {
            // delta_pic_order_cnt[1]: se(v)
            if (!bit_reader.ReadSignedExpGolomb(header.delta_pic_order_cnt[1])) {
                return std::nullopt;
            }
        }
    }
    if (pps.redundant_pic_cnt_present_flag) {
        // redundant_pic_cnt: ue(v)
        if (!bit_reader.ReadExpGolomb(header.redundant_pic_cnt) || header.redundant_pic_cnt > 127) {
            return std::nullopt;
        }
    }
    if (IsBSlice(slice_type)) {
        // direct_spatial_mv_pred_flag: u(1)
        if (!bit_reader.ReadBit(header.direct_spatial_mv_pred_flag)) {
            return std::nullopt;
        }
    }
    header.num_ref_idx_l0_active_minus1 = pps.num_ref_idx_l0_default_active_minus1;
    header.num_ref_idx_l1_active_minus1 = pps.num_ref_idx_l1_default_active_minus1;
    if (IsPSlice(slice_type) || IsBSlice(slice_type)) {
        // num_ref_idx_active_override_flag: u(1)
        if (!bit_reader.ReadBit(header.num_ref_idx_active_override_flag)) {
            return std::nullopt;
        }
        if (header.num_ref_idx_active_override_flag) {
            // num_ref_idx_l0_active_minus1: ue(v)
            if (!bit_reader.ReadExpGolomb(header.num_ref_idx_l0_active_minus1) ||
                header.num_ref_idx_l0_active_minus1 > kMaxRefIdxActiveMinus1) {
                return std::nullopt;
            }
            if (IsBSlice(slice_type)) {
                // num_ref_idx_l1_active_minus1: ue(v)
                if (!bit_reader.ReadExpGolomb(header.num_ref_idx_l1_active_minus1) ||
                    header.num_ref_idx_l1_active_minus1 > kMaxRefIdxActiveMinus1) {
                    return std::nullopt;
                }
            }
        }
    }
    if (!ParseRefPicListModification(bit_reader, header)) {
        return std::nullopt;
    }
    if ((pps.weighted_pred_flag && IsPSlice(slice_type)) ||
        (pps.weighted_bipred_idc == 1 && IsBSlice(slice_type))) {
        if (!ParsePredWeightTable(bit_reader, sps, header)) {
            return std::nullopt;
        }
    }
    if (nal_ref_idc != 0) {
        if (!ParseDecRefPicMarking(bit_reader, header)) {
            return std::nullopt;
        }
    }
    if (pps.entropy_coding_mode_flag && slice_type != SliceType::I && slice_type != SliceType::SI) {
        // cabac_init_idc: ue(v)
        if (!bit_reader.ReadExpGolomb(header.cabac_init_idc) || header.cabac_init_idc > kMaxCabacInitIdc) {
            return std::nullopt;
        }
    }
    // slice_qp_delta: se(v)
    if (!bit_reader.ReadSignedExpGolomb(header.slice_qp_delta)) {
        return std::nullopt;
    }
    if (slice_type == SliceType::SP || slice_type == SliceType::SI) {
        if (slice_type == SliceType::SP) {
            // sp_for_switch_flag: u(1)
            if (!bit_reader.ReadBit(header.sp_for_switch_flag)) {
                return std::nullopt;
            }
        }
        // slice_qs_delta: se(v)
        if (!bit_reader.ReadSignedExpGolomb(header.slice_qs_delta)) {
            return std::nullopt;
        }
    }
    if (pps.deblocking_filter_control_present_flag) {
        // disable_deblocking_filter_idc: ue(v)
        if (!bit_reader.ReadExpGolomb(header.disable_deblocking_filter_idc) ||
            header.disable_deblocking_filter_idc > kMaxDisableDeblockingFilterIdc) {
            return std::nullopt;
        }
        if (header.disable_deblocking_filter_idc != 1) {
            // slice_alpha_c0_offset_div2: se(v)
            // slice_beta_offset_div2: se(v)
            if (!bit_reader.ReadSignedExpGolomb(header.slice_alpha_c0_offset_div2) ||
                !bit_reader.ReadSignedExpGolomb(header.slice_beta_offset_div2)) {
                return std::nullopt;
            }
        }
    }
    if (pps.num_slice_groups_minus1 > 0 && 
        pps.slice_group_map_type >= 3 && 
        pps.slice_group_map_type <= 5) {
        // slice_group_change_cycle: u(v)
        size_t bit_count = SliceGroupChangeCycleBits(sps.pic_size_in_map_units(), 
                                                     pps.slice_group_change_rate_minus1 + 1);
        if (!bit_reader.ReadBits(bit_count, header.slice_group_change_cycle)) {
            return std::nullopt;
        }
    }
    header.fully_parsed = true;
    return header;
}

// Private methods
// ref_pic_list_modification(), 7.3.3.1
bool SliceHeaderParser::ParseRefPicListModification(BitReader& bit_reader, SliceHeader& header) {
    auto parse_list = [&bit_reader](bool& modification_flag) {
        // ref_pic_list_modification_flag_lX: u(1)
        if (!bit_reader.ReadBit(modification_flag)) {
            return false;
        }
        if (!modification_flag) {
            return true;
        }
        uint32_t modification_of_pic_nums_idc = 0;
        size_t count = 0;
        do {
            // modification_of_pic_nums_idc: ue(v)
            if (++count > kMaxRefPicListModifications ||
                !bit_reader.ReadExpGolomb(modification_of_pic_nums_idc) ||
                modification_of_pic_nums_idc > 5) {
                return false;
            }
            uint32_t golomb_ignored;
            if (modification_of_pic_nums_idc == 0 || 
                modification_of_pic_nums_idc == 1 ||
                modification_of_pic_nums_idc == 2) {
                // abs_diff_pic_num_minus1 or long_term_pic_num: ue(v)
                if (!bit_reader.ReadExpGolomb(golomb_ignored)) {
                    return false;
                }
            }
        } while (modification_of_pic_nums_idc != 3);
        return true;
    };

    if (header.slice_type != SliceType::I && header.slice_type != SliceType::SI) {
        if (!parse_list(header.ref_pic_list_modification_flag_l0)) {
            return false;
        }
    }
    if (IsBSlice(header.slice_type)) {
        if (!parse_list(header.ref_pic_list_modification_flag_l1)) {
            return false;
        }
    }
    return true;
}

// pred_weight_table(), 7.3.3.2
bool SliceHeaderParser::ParsePredWeightTable(BitReader& bit_reader, 
                                             const SpsParser::SpsState& sps, 
                                             SliceHeader& header) {
    const bool has_chroma = sps.chroma_array_type() != 0;
    // luma_log2_weight_denom: ue(v)
    if (!bit_reader.ReadExpGolomb(header.luma_log2_weight_denom) || header.luma_log2_weight_denom > 7) {
        return false;
    }
    if (has_chroma) {
        // chroma_log2_weight_denom: ue(v)
        if (!bit_reader.ReadExpGolomb(header.chroma_log2_weight_denom) || header.chroma_log2_weight_denom > 7) {
            return false;
        }
    }
    auto parse_weights = [&bit_reader, has_chroma](uint32_t num_ref_idx_active_minus1) {
        int32_t signed_ignored;
        for (uint32_t i = 0; i <= num_ref_idx_active_minus1; ++i) {
            // luma_weight_lX_flag: u(1)
            bool luma_weight_flag;
            if (!bit_reader.ReadBit(luma_weight_flag)) {
                return false;
            }
            if (luma_weight_flag) {
                // luma_weight_lX[i]: se(v)
                // luma_offset_lX[i]: se(v)
                if (!bit_reader.ReadSignedExpGolomb(signed_ignored) ||
                    !bit_reader.ReadSignedExpGolomb(signed_ignored)) {
                    return false;
                }
            }
            if (has_chroma) {
                // chroma_weight_lX_flag: u(1)
                bool chroma_weight_flag;
                if (!bit_reader.ReadBit(chroma_weight_flag)) {
                    return false;
                }
                if (chroma_weight_flag) {
                    for (int j = 0; j < 2; ++j) {
                        // chroma_weight_lX[i][j]: se(v)
                        // chroma_offset_lX[i][j]: se(v)
                        if (!bit_reader.ReadSignedExpGolomb(signed_ignored) ||
                            !bit_reader.ReadSignedExpGolomb(signed_ignored)) {
                            return false;
                        }
                    }
                }
            }
        }
        return true;
    };

    if (!parse_weights(header.num_ref_idx_l0_active_minus1)) {
        return false;
    }
    if (IsBSlice(header.slice_type) && !parse_weights(header.num_ref_idx_l1_active_minus1)) {
        return false;
    }
    return true;
}

// dec_ref_pic_marking(), 7.3.3.3
bool SliceHeaderParser::ParseDecRefPicMarking(BitReader& bit_reader, SliceHeader& header) {
    if (header.idr_pic_flag) {
        // no_output_of_prior_pics_flag: u(1)
        // long_term_reference_flag: u(1)
        return bit_reader.ReadBit(header.no_output_of_prior_pics_flag) &&
               bit_reader.ReadBit(header.long_term_reference_flag);
    }
    // adaptive_ref_pic_marking_mode_flag: u(1)
    if (!bit_reader.ReadBit(header.adaptive_ref_pic_marking_mode_flag)) {
        return false;
    }
    if (!header.adaptive_ref_pic_marking_mode_flag) {
        return true;
    }
    uint32_t memory_management_control_operation = 0;
    size_t count = 0;
    do {
        // memory_management_control_operation: ue(v)
        if (++count > kMaxMemoryManagementOperations ||
            !bit_reader.ReadExpGolomb(memory_management_control_operation) ||
            memory_management_control_operation > 6) {
            return false;
        }
        uint32_t golomb_ignored;
        switch (memory_management_control_operation) {
        case 1:
            // difference_of_pic_nums_minus1: ue(v)
        case 2:
            // long_term_pic_num: ue(v)
        case 4:
            // max_long_term_frame_idx_plus1: ue(v)
        case 6:
            // long_term_frame_idx: ue(v)
            if (!bit_reader.ReadExpGolomb(golomb_ignored)) {
                return false;
            }
            break;
        case 3:
            // difference_of_pic_nums_minus1: ue(v)
            // long_term_frame_idx: ue(v)
            if (!bit_reader.ReadExpGolomb(golomb_ignored) ||
                !bit_reader.ReadExpGolomb(golomb_ignored)) {
                return false;
            }
            break;
        case 5:
            header.has_mmco5 = true;
            break;
        default:
            break;
        }
    } while (memory_management_control_operation != 0);
    return true;
}
    
} // namespace h264
} // namespace avcparse
