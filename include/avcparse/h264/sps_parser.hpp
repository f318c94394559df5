#ifndef _AVCPARSE_H264_SPS_PARSER_H_
#define _AVCPARSE_H264_SPS_PARSER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <optional>
#include <vector>

namespace avcparse {
namespace h264 {

class AVCPARSE_CPP_EXPORT SpsParser {
public:
    struct SpsState {
        SpsState();
        SpsState(const SpsState&);
        ~SpsState();

        // ChromaArrayType, 0 when the colour planes are coded separately.
        uint32_t chroma_array_type() const;
        uint32_t pic_width_in_mbs() const { return pic_width_in_mbs_minus1 + 1; }
        uint32_t pic_height_in_map_units() const { return pic_height_in_map_units_minus1 + 1; }
        uint32_t pic_size_in_map_units() const { return pic_width_in_mbs() * pic_height_in_map_units(); }

        uint32_t profile_idc = 0;
        // constraint_set0_flag (MSB) to constraint_set5_flag followed by reserved_zero_2bits.
        uint32_t constraint_flags = 0;
        uint32_t level_idc = 0;
        uint32_t id = 0;
        uint32_t chroma_format_idc = 1;
        uint32_t separate_colour_plane_flag = 0;
        uint32_t bit_depth_luma_minus8 = 0;
        uint32_t bit_depth_chroma_minus8 = 0;
        uint32_t qpprime_y_zero_transform_bypass_flag = 0;
        uint32_t seq_scaling_matrix_present_flag = 0;
        uint32_t log2_max_frame_num = 4;          // Smallest valid value.
        uint32_t pic_order_cnt_type = 0;
        uint32_t log2_max_pic_order_cnt_lsb = 4;  // Smallest valid value.
        uint32_t delta_pic_order_always_zero_flag = 0;
        int32_t offset_for_non_ref_pic = 0;
        int32_t offset_for_top_to_bottom_field = 0;
        std::vector<int32_t> offset_for_ref_frame;
        uint32_t max_num_ref_frames = 0;
        uint32_t gaps_in_frame_num_value_allowed_flag = 0;
        uint32_t pic_width_in_mbs_minus1 = 0;
        uint32_t pic_height_in_map_units_minus1 = 0;
        uint32_t frame_mbs_only_flag = 0;
        uint32_t mb_adaptive_frame_field_flag = 0;
        uint32_t direct_8x8_inference_flag = 0;
        uint32_t frame_cropping_flag = 0;
        uint32_t frame_crop_left_offset = 0;
        uint32_t frame_crop_right_offset = 0;
        uint32_t frame_crop_top_offset = 0;
        uint32_t frame_crop_bottom_offset = 0;
        uint32_t vui_params_present = 0;

        // Display size, cropping applied.
        uint32_t width = 0;
        uint32_t height = 0;
    };
public:
    // Unpack RBSP and parse SPS state from the supplied buffer,
    // which starts right after the NALU header.
    static std::optional<SpsState> ParseSps(const uint8_t* data, size_t length);

    // Parse the SPS state, up till the VUI part, for a bit buffer where RBSP
    // decoding has already been performed.
    static std::optional<SpsState> ParseSpsUpToVui(BitReader& bit_reader);

    // scaling_list(): consumes the delta_scale values of a list of `size` entries.
    static bool SkipScalingList(BitReader& bit_reader, size_t size);
};
    
} // namespace h264
} // namespace avcparse

#endif
