#include "avcparse/h264/sps_parser.hpp"
#include "avcparse/h264/nalunit.hpp"

namespace avcparse {
namespace h264 {
namespace {
constexpr int32_t kScalingDeltaMin = -128;
constexpr int32_t kScalingDeltaMax = 127;
constexpr uint32_t kMaxSpsId = 31;
constexpr uint32_t kMaxChromaFormatIdc = 3;
constexpr uint32_t kMaxLog2Minus4 = 12;
constexpr uint32_t kMaxPicOrderCntType = 2;
constexpr uint32_t kMaxRefFramesInPicOrderCntCycle = 255;
constexpr uint32_t kMaxBitDepthMinus8 = 6;
constexpr uint32_t kMaxPicSizeInMbsMinus1 = 1 << 16;

bool HasChromaFormatInfo(uint32_t profile_idc) {
    return profile_idc == 100 || profile_idc == 110 || profile_idc == 122 ||
           profile_idc == 244 || profile_idc == 44 || profile_idc == 83 ||
           profile_idc == 86 || profile_idc == 118 || profile_idc == 128 ||
           profile_idc == 138 || profile_idc == 139 || profile_idc == 134 ||
           profile_idc == 135;
}

} // namespace

SpsParser::SpsState::SpsState() = default;
SpsParser::SpsState::SpsState(const SpsState&) = default;
SpsParser::SpsState::~SpsState() = default;

uint32_t SpsParser::SpsState::chroma_array_type() const {
    return separate_colour_plane_flag ? 0 : chroma_format_idc;
}

// Based off the 08/2021 version of the H.264 standard.
// See http://www.itu.int/rec/T-REC-H.264
std::optional<SpsParser::SpsState> SpsParser::ParseSps(const uint8_t* data, size_t length) {
    std::vector<uint8_t> rbsp_buffer = NalUnit::RetrieveRbspFromEbsp(data, length);
    BitReader bit_reader(rbsp_buffer.data(), rbsp_buffer.size());
    return ParseSpsUpToVui(bit_reader);
}

bool SpsParser::SkipScalingList(BitReader& bit_reader, size_t size) {
    int32_t last_scale = 8;
    int32_t next_scale = 8;
    for (size_t j = 0; j < size; ++j) {
        if (next_scale != 0) {
            // delta_scale: se(v)
            int32_t delta_scale;
            if (!bit_reader.ReadSignedExpGolomb(delta_scale) ||
                delta_scale < kScalingDeltaMin || 
                delta_scale > kScalingDeltaMax) {
                return false;
            }
            next_scale = (last_scale + delta_scale + 256) % 256;
        }
        if (next_scale != 0) {
            last_scale = next_scale;
        }
    }
    return true;
}

std::optional<SpsParser::SpsState> SpsParser::ParseSpsUpToVui(BitReader& bit_reader) {
    SpsState sps;

    // profile_idc: u(8). Unknown profiles are kept as they are.
    if (!bit_reader.ReadBits(8, sps.profile_idc)) {
        return std::nullopt;
    }
    // constraint_set0_flag through constraint_set5_flag + reserved_zero_2bits: u(8)
    if (!bit_reader.ReadBits(8, sps.constraint_flags)) {
        return std::nullopt;
    }
    // level_idc: u(8)
    if (!bit_reader.ReadBits(8, sps.level_idc)) {
        return std::nullopt;
    }
    // seq_parameter_set_id: ue(v)
    if (!bit_reader.ReadExpGolomb(sps.id) || sps.id > kMaxSpsId) {
        return std::nullopt;
    }
    if (HasChromaFormatInfo(sps.profile_idc)) {
        // chroma_format_idc: ue(v)
        if (!bit_reader.ReadExpGolomb(sps.chroma_format_idc) || 
            sps.chroma_format_idc > kMaxChromaFormatIdc) {
            return std::nullopt;
        }
        if (sps.chroma_format_idc == 3) {
            // separate_colour_plane_flag: u(1)
            if (!bit_reader.ReadBits(1, sps.separate_colour_plane_flag)) {
                return std::nullopt;
            }
        }
        // bit_depth_luma_minus8: ue(v)
        if (!bit_reader.ReadExpGolomb(sps.bit_depth_luma_minus8) ||
            sps.bit_depth_luma_minus8 > kMaxBitDepthMinus8) {
            return std::nullopt;
        }
        // bit_depth_chroma_minus8: ue(v)
        if (!bit_reader.ReadExpGolomb(sps.bit_depth_chroma_minus8) ||
            sps.bit_depth_chroma_minus8 > kMaxBitDepthMinus8) {
            return std::nullopt;
        }
        // qpprime_y_zero_transform_bypass_flag: u(1)
        if (!bit_reader.ReadBits(1, sps.qpprime_y_zero_transform_bypass_flag)) {
            return std::nullopt;
        }
        // seq_scaling_matrix_present_flag: u(1)
        if (!bit_reader.ReadBits(1, sps.seq_scaling_matrix_present_flag)) {
            return std::nullopt;
        }
        if (sps.seq_scaling_matrix_present_flag) {
            // Only skipped, the lists are not needed for framing.
            size_t scaling_list_count = (sps.chroma_format_idc == 3 ? 12 : 8);
            for (size_t i = 0; i < scaling_list_count; ++i) {
                // seq_scaling_list_present_flag[i]: u(1)
                bool seq_scaling_list_present_flag;
                if (!bit_reader.ReadBit(seq_scaling_list_present_flag)) {
                    return std::nullopt;
                }
                if (seq_scaling_list_present_flag && 
                    !SkipScalingList(bit_reader, i < 6 ? 16 : 64)) {
                    return std::nullopt;
                }
            }
        }
    }

    // log2_max_frame_num_minus4: ue(v)
    uint32_t log2_max_frame_num_minus4;
    if (!bit_reader.ReadExpGolomb(log2_max_frame_num_minus4) ||
        log2_max_frame_num_minus4 > kMaxLog2Minus4) {
        return std::nullopt;
    }
    sps.log2_max_frame_num = log2_max_frame_num_minus4 + 4;

    // pic_order_cnt_type: ue(v)
    if (!bit_reader.ReadExpGolomb(sps.pic_order_cnt_type) ||
        sps.pic_order_cnt_type > kMaxPicOrderCntType) {
        return std::nullopt;
    }
    if (sps.pic_order_cnt_type == 0) {
        // log2_max_pic_order_cnt_lsb_minus4: ue(v)
        uint32_t log2_max_pic_order_cnt_lsb_minus4;
        if (!bit_reader.ReadExpGolomb(log2_max_pic_order_cnt_lsb_minus4) ||
            log2_max_pic_order_cnt_lsb_minus4 > kMaxLog2Minus4) {
            return std::nullopt;
        }
        sps.log2_max_pic_order_cnt_lsb = log2_max_pic_order_cnt_lsb_minus4 + 4;
    } else if (sps.pic_order_cnt_type == 1) {
        // delta_pic_order_always_zero_flag: u(1)
        if (!bit_reader.ReadBits(1, sps.delta_pic_order_always_zero_flag)) {
            return std::nullopt;
        }
        // offset_for_non_ref_pic: se(v)
        if (!bit_reader.ReadSignedExpGolomb(sps.offset_for_non_ref_pic)) {
            return std::nullopt;
        }
        // offset_for_top_to_bottom_field: se(v)
        if (!bit_reader.ReadSignedExpGolomb(sps.offset_for_top_to_bottom_field)) {
            return std::nullopt;
        }
        // num_ref_frames_in_pic_order_cnt_cycle: ue(v)
        uint32_t num_ref_frames_in_pic_order_cnt_cycle;
        if (!bit_reader.ReadExpGolomb(num_ref_frames_in_pic_order_cnt_cycle) ||
            num_ref_frames_in_pic_order_cnt_cycle > kMaxRefFramesInPicOrderCntCycle) {
            return std::nullopt;
        }
        sps.offset_for_ref_frame.resize(num_ref_frames_in_pic_order_cnt_cycle);
        for (auto& offset_for_ref_frame : sps.offset_for_ref_frame) {
            // offset_for_ref_frame[i]: se(v)
            if (!bit_reader.ReadSignedExpGolomb(offset_for_ref_frame)) {
                return std::nullopt;
            }
        }
    }
    // max_num_ref_frames: ue(v)
    if (!bit_reader.ReadExpGolomb(sps.max_num_ref_frames)) {
        return std::nullopt;
    }
    // gaps_in_frame_num_value_allowed_flag: u(1)
    if (!bit_reader.ReadBits(1, sps.gaps_in_frame_num_value_allowed_flag)) {
        return std::nullopt;
    }
    // pic_width_in_mbs_minus1: ue(v)
    if (!bit_reader.ReadExpGolomb(sps.pic_width_in_mbs_minus1) ||
        sps.pic_width_in_mbs_minus1 > kMaxPicSizeInMbsMinus1) {
        return std::nullopt;
    }
    // pic_height_in_map_units_minus1: ue(v)
    if (!bit_reader.ReadExpGolomb(sps.pic_height_in_map_units_minus1) ||
        sps.pic_height_in_map_units_minus1 > kMaxPicSizeInMbsMinus1) {
        return std::nullopt;
    }
    // frame_mbs_only_flag: u(1)
    if (!bit_reader.ReadBits(1, sps.frame_mbs_only_flag)) {
        return std::nullopt;
    }
    if (!sps.frame_mbs_only_flag) {
        // mb_adaptive_frame_field_flag: u(1)
        if (!bit_reader.ReadBits(1, sps.mb_adaptive_frame_field_flag)) {
            return std::nullopt;
        }
    }
    // direct_8x8_inference_flag: u(1)
    if (!bit_reader.ReadBits(1, sps.direct_8x8_inference_flag)) {
        return std::nullopt;
    }
    // frame_cropping_flag: u(1)
    if (!bit_reader.ReadBits(1, sps.frame_cropping_flag)) {
        return std::nullopt;
    }
    if (sps.frame_cropping_flag) {
        // frame_crop_{left, right, top, bottom}_offset: ue(v)
        if (!bit_reader.ReadExpGolomb(sps.frame_crop_left_offset) ||
            !bit_reader.ReadExpGolomb(sps.frame_crop_right_offset) ||
            !bit_reader.ReadExpGolomb(sps.frame_crop_top_offset) ||
            !bit_reader.ReadExpGolomb(sps.frame_crop_bottom_offset)) {
            return std::nullopt;
        }
    }
    // vui_parameters_present_flag: u(1)
    if (!bit_reader.ReadBits(1, sps.vui_params_present)) {
        return std::nullopt;
    }

    // Far enough, the VUI is not needed to frame the stream.

    // Coded size, from the macroblock counts.
    uint64_t coded_width = 16ull * sps.pic_width_in_mbs();
    uint64_t coded_height = 16ull * (2 - sps.frame_mbs_only_flag) * sps.pic_height_in_map_units();

    // Crop units in luma samples, equations 7-19 to 7-22.
    uint64_t crop_unit_x = 1;
    uint64_t crop_unit_y = 2 - sps.frame_mbs_only_flag;
    const uint32_t chroma_array_type = sps.chroma_array_type();
    if (chroma_array_type != 0) {
        // SubWidthC and SubHeightC, Table 6-1.
        const uint64_t sub_width_c = chroma_array_type == 3 ? 1 : 2;
        const uint64_t sub_height_c = chroma_array_type == 1 ? 2 : 1;
        crop_unit_x = sub_width_c;
        crop_unit_y *= sub_height_c;
    }
    uint64_t crop_x = crop_unit_x * (static_cast<uint64_t>(sps.frame_crop_left_offset) + sps.frame_crop_right_offset);
    uint64_t crop_y = crop_unit_y * (static_cast<uint64_t>(sps.frame_crop_top_offset) + sps.frame_crop_bottom_offset);
    if (crop_x >= coded_width || crop_y >= coded_height) {
        return std::nullopt;
    }
    sps.width = static_cast<uint32_t>(coded_width - crop_x);
    sps.height = static_cast<uint32_t>(coded_height - crop_y);

    return sps;
}
    
} // namespace h264
} // namespace avcparse
