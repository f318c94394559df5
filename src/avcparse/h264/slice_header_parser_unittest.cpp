#include "avcparse/h264/slice_header_parser.hpp"
#include "avcparse/h264/nalunit.hpp"
#include "avcparse/base/memory/bit_io_writer.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {
// Contains enough of the image slice to contain slice QP.
const uint8_t kH264IdrSlice[] = {
    0x65, 0xb7, 0x40, 0xf0, 0x8c, 0x03, 0xf2,
    0x75, 0x67, 0xad, 0x41, 0x64, 0x24, 0x0e, 
    0xa0, 0xb2, 0x12, 0x1e, 0xf8,
};

constexpr size_t kSliceBufferMaxSize = 256;

bool IsP(const SliceHeader& header) {
    return header.slice_type == SliceType::P || header.slice_type == SliceType::SP;
}

bool IsB(const SliceHeader& header) {
    return header.slice_type == SliceType::B;
}

// Writes the header fields the parser reads, leaving every list, weight
// table and memory management operation out.
std::vector<uint8_t> WriteSliceHeader(const SliceHeader& header,
                                      const SpsParser::SpsState& sps,
                                      const PpsParser::PpsState& pps) {
    uint8_t data[kSliceBufferMaxSize] = {0};
    BitWriter bit_writer(data, kSliceBufferMaxSize);
    bit_writer.WriteExpGolomb(header.first_mb_in_slice);
    bit_writer.WriteExpGolomb(header.slice_type_value);
    bit_writer.WriteExpGolomb(header.pic_parameter_set_id);
    if (sps.separate_colour_plane_flag) {
        bit_writer.WriteBits(header.colour_plane_id, 2);
    }
    bit_writer.WriteBits(header.frame_num, sps.log2_max_frame_num);
    if (!sps.frame_mbs_only_flag) {
        bit_writer.WriteBits(header.field_pic_flag, 1);
        if (header.field_pic_flag) {
            bit_writer.WriteBits(header.bottom_field_flag, 1);
        }
    }
    if (header.idr_pic_flag) {
        bit_writer.WriteExpGolomb(header.idr_pic_id);
    }
    if (sps.pic_order_cnt_type == 0) {
        bit_writer.WriteBits(header.pic_order_cnt_lsb, sps.log2_max_pic_order_cnt_lsb);
        if (pps.bottom_field_pic_order_in_frame_present_flag && !header.field_pic_flag) {
            bit_writer.WriteSignedExpGolomb(header.delta_pic_order_cnt_bottom);
        }
    }
    if (sps.pic_order_cnt_type == 1 && !sps.delta_pic_order_always_zero_flag) {
        bit_writer.WriteSignedExpGolomb(header.delta_pic_order_cnt[0]);
        if (pps.bottom_field_pic_order_in_frame_present_flag && !header.field_pic_flag) {
            bit_writer.WriteSignedExpGolomb(header.delta_pic_order_cnt[1]);
        }
    }
    if (pps.redundant_pic_cnt_present_flag) {
        bit_writer.WriteExpGolomb(header.redundant_pic_cnt);
    }
    if (IsB(header)) {
        bit_writer.WriteBits(header.direct_spatial_mv_pred_flag, 1);
    }
    if (IsP(header) || IsB(header)) {
        bit_writer.WriteBits(header.num_ref_idx_active_override_flag, 1);
        if (header.num_ref_idx_active_override_flag) {
            bit_writer.WriteExpGolomb(header.num_ref_idx_l0_active_minus1);
            if (IsB(header)) {
                bit_writer.WriteExpGolomb(header.num_ref_idx_l1_active_minus1);
            }
        }
    }
    // ref_pic_list_modification_flag_l0/l1
    if (header.slice_type != SliceType::I && header.slice_type != SliceType::SI) {
        bit_writer.WriteBits(0, 1);
    }
    if (IsB(header)) {
        bit_writer.WriteBits(0, 1);
    }
    if (header.nal_ref_idc != 0) {
        if (header.idr_pic_flag) {
            bit_writer.WriteBits(header.no_output_of_prior_pics_flag, 1);
            bit_writer.WriteBits(header.long_term_reference_flag, 1);
        } else {
            bit_writer.WriteBits(0, 1);
        }
    }
    if (pps.entropy_coding_mode_flag && header.slice_type != SliceType::I && header.slice_type != SliceType::SI) {
        bit_writer.WriteExpGolomb(header.cabac_init_idc);
    }
    bit_writer.WriteSignedExpGolomb(header.slice_qp_delta);
    if (header.slice_type == SliceType::SP || header.slice_type == SliceType::SI) {
        if (header.slice_type == SliceType::SP) {
            bit_writer.WriteBits(header.sp_for_switch_flag, 1);
        }
        bit_writer.WriteSignedExpGolomb(header.slice_qs_delta);
    }
    if (pps.deblocking_filter_control_present_flag) {
        bit_writer.WriteExpGolomb(header.disable_deblocking_filter_idc);
        if (header.disable_deblocking_filter_idc != 1) {
            bit_writer.WriteSignedExpGolomb(header.slice_alpha_c0_offset_div2);
            bit_writer.WriteSignedExpGolomb(header.slice_beta_offset_div2);
        }
    }
    // Some slice data.
    bit_writer.WriteBits(0x5A5A, 16);
    size_t byte_count = bit_writer.WriteRbspTrailingBits();
    std::vector<uint8_t> ebsp;
    NalUnit::WriteRbsp(data, byte_count, ebsp);
    return ebsp;
}

} // namespace

class T(SliceHeaderParserTest) : public ::testing::Test {
public:
    T(SliceHeaderParserTest)() {
        sps_.log2_max_frame_num = 8;
        sps_.pic_order_cnt_type = 0;
        sps_.log2_max_pic_order_cnt_lsb = 6;
        sps_.frame_mbs_only_flag = 1;
        sps_.pic_width_in_mbs_minus1 = 19;
        sps_.pic_height_in_map_units_minus1 = 14;
        pps_.id = 3;
    }

    std::optional<SliceHeader> WriteAndParse(const SliceHeader& header, NaluType type) {
        std::vector<uint8_t> ebsp = WriteSliceHeader(header, sps_, pps_);
        return SliceHeaderParser::Parse(ebsp.data(), ebsp.size(), type, header.nal_ref_idc, sps_, pps_);
    }

protected:
    SpsParser::SpsState sps_;
    PpsParser::PpsState pps_;
};

MY_TEST_F(SliceHeaderParserTest, LeadingFields) {
    // 0xb7, 0x40,
    // 1011 0111 0100 0000
    // 1 - 011 - 011
    std::vector<uint8_t> rbsp = NalUnit::RetrieveRbspFromEbsp(&kH264IdrSlice[1], sizeof(kH264IdrSlice) - 1);
    BitReader bit_reader(rbsp.data(), rbsp.size());
    auto header = SliceHeaderParser::ParseLeadingFields(bit_reader, NaluType::IDR, 3);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(0u, header->first_mb_in_slice);
    EXPECT_EQ(SliceType::I, header->slice_type);
    EXPECT_EQ(2u, header->pic_parameter_set_id);
    EXPECT_EQ(3u, header->nal_ref_idc);
    EXPECT_TRUE(header->idr_pic_flag);
    EXPECT_FALSE(header->fully_parsed);
}

MY_TEST_F(SliceHeaderParserTest, InvalidSliceType) {
    // first_mb_in_slice 0, slice_type 10.
    uint8_t data[4] = {0};
    BitWriter bit_writer(data, sizeof(data));
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(10);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteRbspTrailingBits();
    BitReader bit_reader(data, sizeof(data));
    EXPECT_FALSE(SliceHeaderParser::ParseLeadingFields(bit_reader, NaluType::SLICE, 1).has_value());
}

MY_TEST_F(SliceHeaderParserTest, IdrSlice) {
    SliceHeader header;
    header.nal_ref_idc = 3;
    header.idr_pic_flag = true;
    header.slice_type_value = 7;
    header.slice_type = SliceType::I;
    header.pic_parameter_set_id = 3;
    header.idr_pic_id = 5;
    header.pic_order_cnt_lsb = 33;
    header.long_term_reference_flag = true;
    header.slice_qp_delta = -4;

    auto parsed = WriteAndParse(header, NaluType::IDR);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->fully_parsed);
    EXPECT_TRUE(parsed->idr_pic_flag);
    EXPECT_TRUE(parsed->all_slices_same_type());
    EXPECT_EQ(SliceType::I, parsed->slice_type);
    EXPECT_EQ(0u, parsed->frame_num);
    EXPECT_EQ(5u, parsed->idr_pic_id);
    EXPECT_EQ(33u, parsed->pic_order_cnt_lsb);
    EXPECT_FALSE(parsed->no_output_of_prior_pics_flag);
    EXPECT_TRUE(parsed->long_term_reference_flag);
    EXPECT_EQ(-4, parsed->slice_qp_delta);
}

MY_TEST_F(SliceHeaderParserTest, PSliceWithOverrides) {
    pps_.entropy_coding_mode_flag = true;
    pps_.deblocking_filter_control_present_flag = true;
    pps_.bottom_field_pic_order_in_frame_present_flag = true;
    pps_.num_ref_idx_l0_default_active_minus1 = 2;

    SliceHeader header;
    header.nal_ref_idc = 2;
    header.first_mb_in_slice = 120;
    header.slice_type_value = 0;
    header.slice_type = SliceType::P;
    header.pic_parameter_set_id = 3;
    header.frame_num = 200;
    header.pic_order_cnt_lsb = 63;
    header.delta_pic_order_cnt_bottom = -1;
    header.num_ref_idx_active_override_flag = true;
    header.num_ref_idx_l0_active_minus1 = 4;
    header.cabac_init_idc = 2;
    header.slice_qp_delta = 3;
    header.disable_deblocking_filter_idc = 0;
    header.slice_alpha_c0_offset_div2 = -2;
    header.slice_beta_offset_div2 = 1;

    auto parsed = WriteAndParse(header, NaluType::SLICE);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->idr_pic_flag);
    EXPECT_FALSE(parsed->all_slices_same_type());
    EXPECT_EQ(120u, parsed->first_mb_in_slice);
    EXPECT_EQ(200u, parsed->frame_num);
    EXPECT_EQ(63u, parsed->pic_order_cnt_lsb);
    EXPECT_EQ(-1, parsed->delta_pic_order_cnt_bottom);
    EXPECT_EQ(4u, parsed->num_ref_idx_l0_active_minus1);
    EXPECT_EQ(2u, parsed->cabac_init_idc);
    EXPECT_EQ(3, parsed->slice_qp_delta);
    EXPECT_EQ(-2, parsed->slice_alpha_c0_offset_div2);
    EXPECT_EQ(1, parsed->slice_beta_offset_div2);
}

MY_TEST_F(SliceHeaderParserTest, DefaultRefIdxFromPps) {
    pps_.num_ref_idx_l0_default_active_minus1 = 2;
    pps_.num_ref_idx_l1_default_active_minus1 = 1;
    SliceHeader header;
    header.slice_type_value = 1;
    header.slice_type = SliceType::B;
    header.pic_parameter_set_id = 3;
    header.direct_spatial_mv_pred_flag = true;

    auto parsed = WriteAndParse(header, NaluType::SLICE);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(SliceType::B, parsed->slice_type);
    EXPECT_EQ(0u, parsed->nal_ref_idc);
    EXPECT_TRUE(parsed->direct_spatial_mv_pred_flag);
    EXPECT_EQ(2u, parsed->num_ref_idx_l0_active_minus1);
    EXPECT_EQ(1u, parsed->num_ref_idx_l1_active_minus1);
}

MY_TEST_F(SliceHeaderParserTest, FieldPicture) {
    sps_.frame_mbs_only_flag = 0;
    pps_.bottom_field_pic_order_in_frame_present_flag = true;
    SliceHeader header;
    header.nal_ref_idc = 1;
    header.slice_type_value = 2;
    header.slice_type = SliceType::I;
    header.pic_parameter_set_id = 3;
    header.frame_num = 9;
    header.field_pic_flag = true;
    header.bottom_field_flag = true;
    header.pic_order_cnt_lsb = 19;

    auto parsed = WriteAndParse(header, NaluType::SLICE);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->field_pic_flag);
    EXPECT_TRUE(parsed->bottom_field_flag);
    EXPECT_EQ(9u, parsed->frame_num);
    EXPECT_EQ(19u, parsed->pic_order_cnt_lsb);
    // Not present for field pictures.
    EXPECT_EQ(0, parsed->delta_pic_order_cnt_bottom);
}

MY_TEST_F(SliceHeaderParserTest, PicOrderCntType1) {
    sps_.pic_order_cnt_type = 1;
    pps_.bottom_field_pic_order_in_frame_present_flag = true;
    pps_.redundant_pic_cnt_present_flag = true;
    SliceHeader header;
    header.nal_ref_idc = 1;
    header.slice_type_value = 2;
    header.slice_type = SliceType::I;
    header.pic_parameter_set_id = 3;
    header.delta_pic_order_cnt[0] = -7;
    header.delta_pic_order_cnt[1] = 4;
    header.redundant_pic_cnt = 1;

    auto parsed = WriteAndParse(header, NaluType::SLICE);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(-7, parsed->delta_pic_order_cnt[0]);
    EXPECT_EQ(4, parsed->delta_pic_order_cnt[1]);
    EXPECT_EQ(1u, parsed->redundant_pic_cnt);
    EXPECT_EQ(0u, parsed->pic_order_cnt_lsb);
}

MY_TEST_F(SliceHeaderParserTest, SpSlice) {
    SliceHeader header;
    header.nal_ref_idc = 0;
    header.slice_type_value = 3;
    header.slice_type = SliceType::SP;
    header.pic_parameter_set_id = 3;
    header.sp_for_switch_flag = true;
    header.slice_qs_delta = -5;

    auto parsed = WriteAndParse(header, NaluType::SLICE);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(SliceType::SP, parsed->slice_type);
    EXPECT_TRUE(parsed->sp_for_switch_flag);
    EXPECT_EQ(-5, parsed->slice_qs_delta);
}

MY_TEST_F(SliceHeaderParserTest, PpsIdMismatch) {
    SliceHeader header;
    header.slice_type_value = 2;
    header.slice_type = SliceType::I;
    header.pic_parameter_set_id = 4;
    std::vector<uint8_t> ebsp = WriteSliceHeader(header, sps_, pps_);
    EXPECT_FALSE(SliceHeaderParser::Parse(ebsp.data(), ebsp.size(), NaluType::SLICE, 0, sps_, pps_).has_value());
}

MY_TEST_F(SliceHeaderParserTest, TruncatedHeader) {
    SliceHeader header;
    header.nal_ref_idc = 1;
    header.slice_type_value = 0;
    header.slice_type = SliceType::P;
    header.pic_parameter_set_id = 3;
    header.frame_num = 17;
    std::vector<uint8_t> ebsp = WriteSliceHeader(header, sps_, pps_);
    // ue(0) x2, ue(3), 8 bits frame_num: byte 1 holds part of frame_num.
    EXPECT_FALSE(SliceHeaderParser::Parse(ebsp.data(), 1, NaluType::SLICE, 1, sps_, pps_).has_value());
    BitReader bit_reader(ebsp.data(), 1);
    EXPECT_TRUE(SliceHeaderParser::ParseLeadingFields(bit_reader, NaluType::SLICE, 1).has_value());
}

MY_TEST_F(SliceHeaderParserTest, RefPicListModificationAndMarking) {
    pps_.weighted_pred_flag = true;
    uint8_t data[kSliceBufferMaxSize] = {0};
    BitWriter bit_writer(data, kSliceBufferMaxSize);
    // first_mb_in_slice, slice_type P, pic_parameter_set_id
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(5);
    bit_writer.WriteExpGolomb(3);
    // frame_num, pic_order_cnt_lsb
    bit_writer.WriteBits(4, 8);
    bit_writer.WriteBits(8, 6);
    // num_ref_idx_active_override_flag, num_ref_idx_l0_active_minus1
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteExpGolomb(1);
    // ref_pic_list_modification_flag_l0, two modifications and the end.
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(3);
    bit_writer.WriteExpGolomb(2);
    bit_writer.WriteExpGolomb(1);
    bit_writer.WriteExpGolomb(3);
    // pred_weight_table: luma_log2_weight_denom, chroma_log2_weight_denom
    bit_writer.WriteExpGolomb(5);
    bit_writer.WriteExpGolomb(4);
    for (int i = 0; i < 2; ++i) {
        // luma_weight_l0_flag, weight and offset
        bit_writer.WriteBits(1, 1);
        bit_writer.WriteSignedExpGolomb(32);
        bit_writer.WriteSignedExpGolomb(-1);
        // chroma_weight_l0_flag
        bit_writer.WriteBits(i, 1);
        if (i) {
            for (int j = 0; j < 2; ++j) {
                bit_writer.WriteSignedExpGolomb(16);
                bit_writer.WriteSignedExpGolomb(0);
            }
        }
    }
    // adaptive_ref_pic_marking_mode_flag with mmco 1, 5 and the end.
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteExpGolomb(1);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(5);
    bit_writer.WriteExpGolomb(0);
    // slice_qp_delta
    bit_writer.WriteSignedExpGolomb(-12);
    size_t byte_count = bit_writer.WriteRbspTrailingBits();

    BitReader bit_reader(data, byte_count);
    auto parsed = SliceHeaderParser::Parse(bit_reader, NaluType::SLICE, 2, sps_, pps_);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->ref_pic_list_modification_flag_l0);
    EXPECT_FALSE(parsed->ref_pic_list_modification_flag_l1);
    EXPECT_EQ(1u, parsed->num_ref_idx_l0_active_minus1);
    EXPECT_EQ(5u, parsed->luma_log2_weight_denom);
    EXPECT_EQ(4u, parsed->chroma_log2_weight_denom);
    EXPECT_TRUE(parsed->adaptive_ref_pic_marking_mode_flag);
    EXPECT_TRUE(parsed->has_mmco5);
    EXPECT_EQ(-12, parsed->slice_qp_delta);
    EXPECT_FALSE(bit_reader.MoreRbspData());
}

MY_TEST_F(SliceHeaderParserTest, EndlessModificationListFails) {
    uint8_t data[kSliceBufferMaxSize] = {0};
    BitWriter bit_writer(data, kSliceBufferMaxSize);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(3);
    bit_writer.WriteBits(0, 8);
    bit_writer.WriteBits(0, 6);
    bit_writer.WriteBits(0, 1);
    bit_writer.WriteBits(1, 1);
    // 100 modifications without the closing 3.
    for (int i = 0; i < 100; ++i) {
        bit_writer.WriteExpGolomb(0);
        bit_writer.WriteExpGolomb(0);
    }
    size_t byte_count = bit_writer.WriteRbspTrailingBits();
    BitReader bit_reader(data, byte_count);
    EXPECT_FALSE(SliceHeaderParser::Parse(bit_reader, NaluType::SLICE, 0, sps_, pps_).has_value());
}

MY_TEST_F(SliceHeaderParserTest, SliceGroupChangeCycle) {
    pps_.num_slice_groups_minus1 = 1;
    pps_.slice_group_map_type = 4;
    pps_.slice_group_change_rate_minus1 = 9;
    // 300 map units, Ceil(Log2(300 / 10 + 1)) = 5 bits.
    SliceHeader header;
    header.slice_type_value = 2;
    header.slice_type = SliceType::I;
    header.pic_parameter_set_id = 3;
    std::vector<uint8_t> ebsp = WriteSliceHeader(header, sps_, pps_);
    // The 16 bits of slice data follow the header, its first 5 bits are the cycle.
    auto parsed = SliceHeaderParser::Parse(ebsp.data(), ebsp.size(), NaluType::SLICE, 0, sps_, pps_);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(0x5A5Au >> 11, parsed->slice_group_change_cycle);
}

} // namespace test
} // namespace avcparse
