#include "avcparse/h264/pps_parser.hpp"
#include "avcparse/h264/nalunit.hpp"
#include "avcparse/base/memory/bit_io_writer.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {

constexpr size_t kPpsBufferMaxSize = 256;
constexpr uint32_t kIgnored = 0;

// Optional trailing part of the PPS.
struct PpsTail {
    bool transform_8x8_mode_flag = false;
    // Number of pic_scaling_list_present_flag to write, 0 for no matrix.
    int scaling_list_count = 0;
    int32_t second_chroma_qp_index_offset = 0;
};

}  // namespace

void WritePps(const PpsParser::PpsState& pps,
              int slice_group_map_type,
              int num_slice_groups,
              int pic_size_in_map_units,
              std::vector<uint8_t>& out_buffer,
              const PpsTail* tail = nullptr) {
    uint8_t data[kPpsBufferMaxSize] = {0};
    BitWriter bit_writer(data, kPpsBufferMaxSize);

    // pic_parameter_set_id: ue(v)
    bit_writer.WriteExpGolomb(pps.id);
    // seq_parameter_set_id: ue(v)
    bit_writer.WriteExpGolomb(pps.sps_id);
    // entropy_coding_mode_flag: u(1)
    bit_writer.WriteBits(pps.entropy_coding_mode_flag, 1);
    // bottom_field_pic_order_in_frame_present_flag: u(1)
    bit_writer.WriteBits(pps.bottom_field_pic_order_in_frame_present_flag ? 1 : 0, 1);

    // num_slice_groups_minus1: ue(v)
    EXPECT_TRUE(num_slice_groups > 0);
    bit_writer.WriteExpGolomb(num_slice_groups - 1);

    if (num_slice_groups > 1) {
        // slice_group_map_type: ue(v)
        bit_writer.WriteExpGolomb(slice_group_map_type);
        switch (slice_group_map_type) {
        case 0:
            for (int i = 0; i < num_slice_groups; ++i) {
                // run_length_minus1[iGroup]: ue(v)
                bit_writer.WriteExpGolomb(kIgnored);
            }
            break;
        case 2:
            for (int i = 0; i < num_slice_groups - 1; ++i) {
                // top_left[iGroup]: ue(v)
                bit_writer.WriteExpGolomb(kIgnored);
                // bottom_right[iGroup]: ue(v)
                bit_writer.WriteExpGolomb(kIgnored);
            }
            break;
        case 3:
        case 4:
        case 5:
            // slice_group_change_direction_flag: u(1)
            bit_writer.WriteBits(kIgnored, 1);
            // slice_group_change_rate_minus1: ue(v)
            bit_writer.WriteExpGolomb(kIgnored);
            break;
        case 6: {
            bit_writer.WriteExpGolomb(pic_size_in_map_units - 1);
            // Ceil(Log2(num_slice_groups_minus1 + 1)) bits.
            uint32_t slice_group_id_bits = 0;
            while ((1 << slice_group_id_bits) < num_slice_groups) {
                ++slice_group_id_bits;
            }
            for (int i = 0; i < pic_size_in_map_units; ++i) {
                // slice_group_id[i]: u(v)
                bit_writer.WriteBits(num_slice_groups - 1, slice_group_id_bits);
            }
            break;
        }
        default:
            break;
        }
    }

    // num_ref_idx_l0_default_active_minus1: ue(v)
    bit_writer.WriteExpGolomb(pps.num_ref_idx_l0_default_active_minus1);
    // num_ref_idx_l1_default_active_minus1: ue(v)
    bit_writer.WriteExpGolomb(kIgnored);
    // weighted_pred_flag: u(1)
    bit_writer.WriteBits(pps.weighted_pred_flag ? 1 : 0, 1);
    // weighted_bipred_idc: u(2)
    bit_writer.WriteBits(pps.weighted_bipred_idc, 2);

    // pic_init_qp_minus26: se(v)
    bit_writer.WriteSignedExpGolomb(pps.pic_init_qp_minus26);
    // pic_init_qs_minus26: se(v)
    bit_writer.WriteExpGolomb(kIgnored);
    // chroma_qp_index_offset: se(v)
    bit_writer.WriteSignedExpGolomb(pps.chroma_qp_index_offset);
    // deblocking_filter_control_present_flag: u(1)
    bit_writer.WriteBits(pps.deblocking_filter_control_present_flag, 1);
    // constrained_intra_pred_flag: u(1)
    bit_writer.WriteBits(kIgnored, 1);
    // redundant_pic_cnt_present_flag: u(1)
    bit_writer.WriteBits(pps.redundant_pic_cnt_present_flag, 1);

    if (tail) {
        // transform_8x8_mode_flag: u(1)
        bit_writer.WriteBits(tail->transform_8x8_mode_flag, 1);
        // pic_scaling_matrix_present_flag: u(1)
        bit_writer.WriteBits(tail->scaling_list_count > 0, 1);
        for (int i = 0; i < tail->scaling_list_count; ++i) {
            // pic_scaling_list_present_flag[i]: u(1), with a list ended
            // by its first delta.
            bit_writer.WriteBits(1, 1);
            bit_writer.WriteSignedExpGolomb(-8);
        }
        // second_chroma_qp_index_offset: se(v)
        bit_writer.WriteSignedExpGolomb(tail->second_chroma_qp_index_offset);
    }

    size_t byte_count = bit_writer.WriteRbspTrailingBits();
    NalUnit::WriteRbsp(data, byte_count, out_buffer);
}

class T(PpsParserTest) : public ::testing::Test {
public:
    T(PpsParserTest)() {}
    ~T(PpsParserTest)() override {}

    void RunTest() {
        VerifyParsing(generated_pps_, 0, 1, 0);
        const int kMaxSliceGroups = 8;
        const int kMaxMapType = 6;
        for (int slice_group = 2; slice_group <= kMaxSliceGroups; ++slice_group) {
            for (int map_type = 0; map_type <= kMaxMapType; ++map_type) {
                if (map_type == 6) {
                    for (int pic_size = 1; pic_size < 2 * slice_group; ++pic_size) {
                        VerifyParsing(generated_pps_, map_type, slice_group, pic_size);
                    }
                } else {
                    VerifyParsing(generated_pps_, map_type, slice_group, 0);
                }
            }
        }
    }

    void VerifyParsing(const PpsParser::PpsState& pps,
                       int slice_group_map_type,
                       int num_slice_groups,
                       int pic_size_in_map_units) {
        buffer_.clear();
        WritePps(pps, slice_group_map_type, num_slice_groups, pic_size_in_map_units, buffer_);
        parsed_pps_ = PpsParser::ParsePps(buffer_.data(), buffer_.size());
        ASSERT_TRUE(parsed_pps_.has_value()) << "map type " << slice_group_map_type 
                                             << ", slice groups " << num_slice_groups;
        EXPECT_EQ(pps.bottom_field_pic_order_in_frame_present_flag,
                  parsed_pps_->bottom_field_pic_order_in_frame_present_flag);
        EXPECT_EQ(pps.weighted_pred_flag, parsed_pps_->weighted_pred_flag);
        EXPECT_EQ(pps.weighted_bipred_idc, parsed_pps_->weighted_bipred_idc);
        EXPECT_EQ(pps.entropy_coding_mode_flag, parsed_pps_->entropy_coding_mode_flag);
        EXPECT_EQ(pps.redundant_pic_cnt_present_flag, parsed_pps_->redundant_pic_cnt_present_flag);
        EXPECT_EQ(pps.pic_init_qp_minus26, parsed_pps_->pic_init_qp_minus26);
        EXPECT_EQ(pps.id, parsed_pps_->id);
        EXPECT_EQ(pps.sps_id, parsed_pps_->sps_id);
        EXPECT_EQ(static_cast<uint32_t>(num_slice_groups - 1), parsed_pps_->num_slice_groups_minus1);
        if (num_slice_groups > 1) {
            EXPECT_EQ(static_cast<uint32_t>(slice_group_map_type), parsed_pps_->slice_group_map_type);
        }
        EXPECT_FALSE(parsed_pps_->transform_8x8_mode_flag);
        EXPECT_EQ(parsed_pps_->chroma_qp_index_offset, parsed_pps_->second_chroma_qp_index_offset);
    }

public:
    PpsParser::PpsState generated_pps_;

private:
    std::vector<uint8_t> buffer_;
    std::optional<PpsParser::PpsState> parsed_pps_;
};

MY_TEST_F(PpsParserTest, ZeroPps) {
    RunTest();
}

MY_TEST_F(PpsParserTest, MaxPps) {
    generated_pps_.bottom_field_pic_order_in_frame_present_flag = true;
    generated_pps_.pic_init_qp_minus26 = 25;
    generated_pps_.redundant_pic_cnt_present_flag = true;
    generated_pps_.weighted_bipred_idc = 2;
    generated_pps_.weighted_pred_flag = true;
    generated_pps_.entropy_coding_mode_flag = true;
    generated_pps_.id = 255;
    generated_pps_.sps_id = 31;
    RunTest();

    generated_pps_.pic_init_qp_minus26 = -26;
    RunTest();
}

MY_TEST_F(PpsParserTest, ParsePpsIds) {
    PpsParser::PpsState pps;
    pps.id = 7;
    pps.sps_id = 3;
    std::vector<uint8_t> buffer;
    WritePps(pps, 0, 1, 0, buffer);
    uint32_t pps_id = 0;
    uint32_t sps_id = 0;
    ASSERT_TRUE(PpsParser::ParsePpsIds(buffer.data(), buffer.size(), &pps_id, &sps_id));
    EXPECT_EQ(7u, pps_id);
    EXPECT_EQ(3u, sps_id);
    EXPECT_FALSE(PpsParser::ParsePpsIds(buffer.data(), buffer.size(), nullptr, &sps_id));
}

MY_TEST_F(PpsParserTest, OutOfRangeValues) {
    std::vector<uint8_t> buffer;
    PpsParser::PpsState pps;
    pps.sps_id = 32;
    WritePps(pps, 0, 1, 0, buffer);
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), buffer.size()).has_value());

    pps = PpsParser::PpsState();
    pps.weighted_bipred_idc = 3;
    buffer.clear();
    WritePps(pps, 0, 1, 0, buffer);
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), buffer.size()).has_value());

    pps = PpsParser::PpsState();
    pps.chroma_qp_index_offset = 13;
    buffer.clear();
    WritePps(pps, 0, 1, 0, buffer);
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), buffer.size()).has_value());

    pps = PpsParser::PpsState();
    buffer.clear();
    WritePps(pps, 0, 9, 0, buffer);
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), buffer.size()).has_value());
}

MY_TEST_F(PpsParserTest, OptionalTail) {
    PpsParser::PpsState pps;
    pps.chroma_qp_index_offset = -3;
    PpsTail tail;
    tail.transform_8x8_mode_flag = true;
    tail.scaling_list_count = 8;
    tail.second_chroma_qp_index_offset = 4;
    std::vector<uint8_t> buffer;
    WritePps(pps, 0, 1, 0, buffer, &tail);

    auto parsed = PpsParser::ParsePps(buffer.data(), buffer.size(), 1);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->transform_8x8_mode_flag);
    EXPECT_TRUE(parsed->pic_scaling_matrix_present_flag);
    EXPECT_EQ(-3, parsed->chroma_qp_index_offset);
    EXPECT_EQ(4, parsed->second_chroma_qp_index_offset);
}

MY_TEST_F(PpsParserTest, ScalingListCountDependsOnChromaFormat) {
    PpsParser::PpsState pps;
    PpsTail tail;
    tail.transform_8x8_mode_flag = true;
    // 6 + 6 lists for 4:4:4.
    tail.scaling_list_count = 12;
    tail.second_chroma_qp_index_offset = 2;
    std::vector<uint8_t> buffer;
    WritePps(pps, 0, 1, 0, buffer, &tail);

    auto parsed = PpsParser::ParsePps(buffer.data(), buffer.size(), 3);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(2, parsed->second_chroma_qp_index_offset);

    // Read as 4:2:0, the last four lists are taken for the offset.
    parsed = PpsParser::ParsePps(buffer.data(), buffer.size(), 1);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_NE(2, parsed->second_chroma_qp_index_offset);
}

MY_TEST_F(PpsParserTest, TruncatedPps) {
    PpsParser::PpsState pps;
    pps.id = 1;
    std::vector<uint8_t> buffer;
    WritePps(pps, 0, 1, 0, buffer);
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), 0).has_value());
    EXPECT_FALSE(PpsParser::ParsePps(buffer.data(), 1).has_value());
}

} // namespace test
} // namespace avcparse
