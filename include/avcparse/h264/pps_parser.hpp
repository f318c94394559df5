#ifndef _AVCPARSE_H264_PPS_PARSER_H_
#define _AVCPARSE_H264_PPS_PARSER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <optional>

namespace avcparse {
namespace h264 {

class AVCPARSE_CPP_EXPORT PpsParser {
public:
    struct PpsState {
        PpsState() = default;

        uint32_t id = 0;
        uint32_t sps_id = 0;
        bool entropy_coding_mode_flag = false;
        bool bottom_field_pic_order_in_frame_present_flag = false;
        uint32_t num_slice_groups_minus1 = 0;
        uint32_t slice_group_map_type = 0;
        uint32_t slice_group_change_rate_minus1 = 0;
        uint32_t num_ref_idx_l0_default_active_minus1 = 0;
        uint32_t num_ref_idx_l1_default_active_minus1 = 0;
        bool weighted_pred_flag = false;
        uint32_t weighted_bipred_idc = 0;
        int32_t pic_init_qp_minus26 = 0;
        int32_t pic_init_qs_minus26 = 0;
        int32_t chroma_qp_index_offset = 0;
        bool deblocking_filter_control_present_flag = false;
        bool constrained_intra_pred_flag = false;
        bool redundant_pic_cnt_present_flag = false;
        // Optional tail, present when more_rbsp_data() holds.
        bool transform_8x8_mode_flag = false;
        bool pic_scaling_matrix_present_flag = false;
        int32_t second_chroma_qp_index_offset = 0;
    };
public:
    // Unpack RBSP and parse PPS state from the supplied buffer, which starts right
    // after the NALU header. `chroma_format_idc` of the referenced SPS decides the 
    // number of scaling lists in the optional tail.
    static std::optional<PpsState> ParsePps(const uint8_t* data, size_t size, uint32_t chroma_format_idc = 1);
    static std::optional<PpsState> ParsePps(BitReader& bit_reader, uint32_t chroma_format_idc = 1);

    static bool ParsePpsIds(const uint8_t* data, size_t size, uint32_t* pps_id, uint32_t* sps_id);
    static bool ParsePpsIds(BitReader& bit_reader, uint32_t* pps_id, uint32_t* sps_id);
};
    
} // namespace h264
} // namespace avcparse

#endif
