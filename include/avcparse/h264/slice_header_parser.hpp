#ifndef _AVCPARSE_H264_SLICE_HEADER_PARSER_H_
#define _AVCPARSE_H264_SLICE_HEADER_PARSER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"
#include "avcparse/h264/common.hpp"
#include "avcparse/h264/sps_parser.hpp"
#include "avcparse/h264/pps_parser.hpp"

#include <optional>

namespace avcparse {
namespace h264 {

// slice_header(), 7.3.3. Fields not present in the bitstream keep their
// inferred or zero value, so two headers can be compared field by field.
struct AVCPARSE_CPP_EXPORT SliceHeader {
    // slice_type 5 to 9: all slices of the picture share the type.
    bool all_slices_same_type() const { return slice_type_value >= 5; }

    // Copied from the NALU header.
    uint8_t nal_ref_idc = 0;
    bool idr_pic_flag = false;
    // False when only the leading fields up to pic_parameter_set_id were decoded,
    // e.g. the referenced parameter sets are unknown.
    bool fully_parsed = false;

    uint32_t first_mb_in_slice = 0;
    uint32_t slice_type_value = 0;
    SliceType slice_type = SliceType::P;
    uint32_t pic_parameter_set_id = 0;
    uint32_t colour_plane_id = 0;
    uint32_t frame_num = 0;
    bool field_pic_flag = false;
    bool bottom_field_flag = false;
    uint32_t idr_pic_id = 0;
    uint32_t pic_order_cnt_lsb = 0;
    int32_t delta_pic_order_cnt_bottom = 0;
    int32_t delta_pic_order_cnt[2] = {0, 0};
    uint32_t redundant_pic_cnt = 0;
    bool direct_spatial_mv_pred_flag = false;
    bool num_ref_idx_active_override_flag = false;
    uint32_t num_ref_idx_l0_active_minus1 = 0;
    uint32_t num_ref_idx_l1_active_minus1 = 0;
    bool ref_pic_list_modification_flag_l0 = false;
    bool ref_pic_list_modification_flag_l1 = false;
    uint32_t luma_log2_weight_denom = 0;
    uint32_t chroma_log2_weight_denom = 0;
    // dec_ref_pic_marking()
    bool no_output_of_prior_pics_flag = false;
    bool long_term_reference_flag = false;
    bool adaptive_ref_pic_marking_mode_flag = false;
    // memory_management_control_operation 5 is present.
    bool has_mmco5 = false;
    uint32_t cabac_init_idc = 0;
    int32_t slice_qp_delta = 0;
    bool sp_for_switch_flag = false;
    int32_t slice_qs_delta = 0;
    uint32_t disable_deblocking_filter_idc = 0;
    int32_t slice_alpha_c0_offset_div2 = 0;
    int32_t slice_beta_offset_div2 = 0;
    uint32_t slice_group_change_cycle = 0;
};

class AVCPARSE_CPP_EXPORT SliceHeaderParser {
public:
    // Parses first_mb_in_slice, slice_type and pic_parameter_set_id, which
    // do not depend on any parameter set.
    static std::optional<SliceHeader> ParseLeadingFields(BitReader& bit_reader, 
                                                         NaluType nalu_type, 
                                                         uint8_t nal_ref_idc);

    // Parses the whole header against the parameter sets it refers to.
    static std::optional<SliceHeader> Parse(BitReader& bit_reader,
                                            NaluType nalu_type,
                                            uint8_t nal_ref_idc,
                                            const SpsParser::SpsState& sps,
                                            const PpsParser::PpsState& pps);

    // Unpack RBSP from `data`, which starts right after the NALU header, and parse.
    static std::optional<SliceHeader> Parse(const uint8_t* data, 
                                            size_t size,
                                            NaluType nalu_type,
                                            uint8_t nal_ref_idc,
                                            const SpsParser::SpsState& sps,
                                            const PpsParser::PpsState& pps);
private:
    static bool ParseRefPicListModification(BitReader& bit_reader, SliceHeader& header);
    static bool ParsePredWeightTable(BitReader& bit_reader, 
                                     const SpsParser::SpsState& sps, 
                                     SliceHeader& header);
    static bool ParseDecRefPicMarking(BitReader& bit_reader, SliceHeader& header);
};
    
} // namespace h264
} // namespace avcparse

#endif
