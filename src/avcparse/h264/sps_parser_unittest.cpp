#include "avcparse/h264/sps_parser.hpp"
#include "avcparse/h264/nalunit.hpp"
#include "avcparse/base/memory/bit_io_writer.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
// Example SPS can be generated with ffmpeg:
// 1) Scale a video to the desired size:
// ffmpeg -i camera.mov -vf scale=640x360 scaled.mov
//
// 2) Get just the H.264 bitstream in AnnexB:
// ffmpeg -i scaled.mov -vcodec copy -vbsf h264_mp4toannexb -an out.h264
//
// 3) Open out.h264 and find the SPS, generally everything between the first
// two start codes (0 0 0 1 or 0 0 1). The first byte should be 0x67,
// which should be stripped out before being passed to the parser.

static const size_t kSpsBufferMaxSize = 256;

// Generates a fake baseline SPS with basically everything empty but the
// width/height, coded as field pictures.
// The fake SPS always has at least one emulation byte at offset 2, since the
// first two bytes are always 0, and has a 0x3 as the level_idc, to make sure
// the parser doesn't eat all 0x3 bytes.
void GenerateFakeSps(uint16_t width,
                     uint16_t height,
                     int id,
                     uint32_t log2_max_frame_num_minus4,
                     uint32_t log2_max_pic_order_cnt_lsb_minus4,
                     std::vector<uint8_t>& out_buffer) {
    uint8_t rbsp[kSpsBufferMaxSize] = {0};
    BitWriter bit_writer(rbsp, kSpsBufferMaxSize);
    
    // Profile byte.
    bit_writer.WriteByte(uint8_t(0));
    // Constraint sets and reserved zero bits.
    bit_writer.WriteByte(uint8_t(0));
    // level_idc.
    bit_writer.WriteByte(uint8_t(0x3u));
    // seq_paramter_set_id.
    bit_writer.WriteExpGolomb(id);
    // Profile is not special, so we skip all the chroma format settings.

    // log2_max_frame_num_minus4: ue(v).
    bit_writer.WriteExpGolomb(log2_max_frame_num_minus4);
    // pic_order_cnt_type: ue(v). 0 is the type we want.
    bit_writer.WriteExpGolomb(0);
    // log2_max_pic_order_cnt_lsb_minus4: ue(v).
    bit_writer.WriteExpGolomb(log2_max_pic_order_cnt_lsb_minus4);
    // max_num_ref_frames: ue(v). 0 is fine.
    bit_writer.WriteExpGolomb(0);
    // gaps_in_frame_num_value_allowed_flag: u(1).
    bit_writer.WriteBits(0, 1);
    // Next are width/height. First, calculate the mbs/map_units versions.
    uint16_t width_in_mbs_minus1 = (width + 15) / 16 - 1;
    // frame_mbs_only_flag is 0, a map unit is a pair of macroblocks.
    uint16_t height_in_map_units_minus1 = ((height + 15) / 16 - 1) / 2;
    bit_writer.WriteExpGolomb(width_in_mbs_minus1);
    bit_writer.WriteExpGolomb(height_in_map_units_minus1);
    // frame_mbs_only_flag: u(1). Needs to be false.
    bit_writer.WriteBits(0, 1);
    // mb_adaptive_frame_field_flag: u(1).
    bit_writer.WriteBits(0, 1);
    // direct_8x8_inferene_flag: u(1).
    bit_writer.WriteBits(0, 1);
    // frame_cropping_flag: u(1). 1, so we can supply crop.
    bit_writer.WriteBits(1, 1);
    // For simplicity, all the crop is at the left/top. In 4:2:0 the
    // horizontal crop unit is 2 samples, the vertical one 2 * 2 for fields.
    const uint32_t coded_width = 16 * (width_in_mbs_minus1 + 1);
    const uint32_t coded_height = 32 * (height_in_map_units_minus1 + 1);
    bit_writer.WriteExpGolomb((coded_width - width) / 2);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb((coded_height - height) / 4);
    bit_writer.WriteExpGolomb(0);

    // vui_parameters_present_flag: u(1)
    bit_writer.WriteBits(0, 1);

    size_t byte_count = bit_writer.WriteRbspTrailingBits();

    out_buffer.clear();
    NalUnit::WriteRbsp(rbsp, byte_count, out_buffer);
}

MY_TEST(SpsParserTest, TestSampleSPSHdLandscape) {
    // SPS for a 1280x720 camera capture from ffmpeg on osx. Contains
    // emulation bytes but no cropping.
    const uint8_t buffer[] = {0x7A, 0x00, 0x1F, 0xBC, 0xD9, 0x40, 0x50, 0x05,
                              0xBA, 0x10, 0x00, 0x00, 0x03, 0x00, 0xC0, 0x00,
                              0x00, 0x2A, 0xE0, 0xF1, 0x83, 0x19, 0x60};
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer, 23);
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(1280u, sps->width);
    EXPECT_EQ(720u, sps->height);
    EXPECT_EQ(122u, sps->profile_idc);
    EXPECT_EQ(31u, sps->level_idc);
    EXPECT_EQ(2u, sps->chroma_format_idc);
    EXPECT_EQ(6u, sps->log2_max_pic_order_cnt_lsb);
    EXPECT_EQ(4u, sps->max_num_ref_frames);
    EXPECT_EQ(1u, sps->frame_mbs_only_flag);
    EXPECT_EQ(1u, sps->vui_params_present);
}

MY_TEST(SpsParserTest, TestSampleSPSWeirdResolution) {
    // SPS for a 200x400 camera capture from ffmpeg on osx. Horizontal and
    // veritcal crop (neither dimension is divisible by 16).
    const uint8_t buffer[] = {0x7A, 0x00, 0x0D, 0xBC, 0xD9, 0x43, 0x43, 0x3E,
                              0x5E, 0x10, 0x00, 0x00, 0x03, 0x00, 0x60, 0x00,
                              0x00, 0x15, 0xA0, 0xF1, 0x42, 0x99, 0x60};
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer, 23);
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(200u, sps->width);
    EXPECT_EQ(400u, sps->height);
    EXPECT_EQ(4u, sps->frame_crop_right_offset);
}

MY_TEST(SpsParserTest, TestSyntheticSPSQvgaLandscape) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(320u, 180u, 1, 0, 0, buffer);
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(320u, sps->width);
    EXPECT_EQ(180u, sps->height);
    EXPECT_EQ(1u, sps->id);
    EXPECT_EQ(3u, sps->frame_crop_top_offset);
    EXPECT_EQ(0u, sps->frame_mbs_only_flag);
}

MY_TEST(SpsParserTest, TestSyntheticSPSWeirdResolution) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(200u, 400u, 2, 0, 0, buffer);
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(200u, sps->width);
    EXPECT_EQ(400u, sps->height);
    EXPECT_EQ(2u, sps->id);
}

MY_TEST(SpsParserTest, TestLog2MaxFrameNumMinus4) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(320u, 180u, 1, 0, 0, buffer);
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(4u, sps->log2_max_frame_num);

    GenerateFakeSps(320u, 180u, 1, 12, 0, buffer);
    sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(320u, sps->width);
    EXPECT_EQ(180u, sps->height);
    EXPECT_EQ(16u, sps->log2_max_frame_num);

    GenerateFakeSps(320u, 180u, 1, 13, 0, buffer);
    sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    EXPECT_FALSE(sps.has_value());
}

MY_TEST(SpsParserTest, TestLog2MaxPicOrderCntMinus4) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(320u, 180u, 1, 0, 0, buffer);
    std::optional<SpsParser::SpsState> sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(4u, sps->log2_max_pic_order_cnt_lsb);

    GenerateFakeSps(320u, 180u, 1, 0, 12, buffer);
    sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(16u, sps->log2_max_pic_order_cnt_lsb);

    GenerateFakeSps(320u, 180u, 1, 0, 13, buffer);
    sps = SpsParser::ParseSps(buffer.data(), buffer.size());
    EXPECT_FALSE(sps.has_value());
}

MY_TEST(SpsParserTest, InvalidSpsId) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(320u, 180u, 31, 0, 0, buffer);
    EXPECT_TRUE(SpsParser::ParseSps(buffer.data(), buffer.size()).has_value());
    GenerateFakeSps(320u, 180u, 32, 0, 0, buffer);
    EXPECT_FALSE(SpsParser::ParseSps(buffer.data(), buffer.size()).has_value());
}

MY_TEST(SpsParserTest, TruncatedSps) {
    std::vector<uint8_t> buffer;
    GenerateFakeSps(320u, 180u, 1, 0, 0, buffer);
    for (size_t size = 0; size + 1 < buffer.size(); ++size) {
        // The cut always lands before vui_parameters_present_flag.
        EXPECT_FALSE(SpsParser::ParseSps(buffer.data(), size).has_value()) << "size " << size;
    }
}

MY_TEST(SpsParserTest, HighProfileWithSeparateColourPlanes) {
    uint8_t rbsp[kSpsBufferMaxSize] = {0};
    BitWriter bit_writer(rbsp, kSpsBufferMaxSize);
    // profile_idc, constraint flags, level_idc
    bit_writer.WriteByte(uint8_t(244));
    bit_writer.WriteByte(uint8_t(0));
    bit_writer.WriteByte(uint8_t(40));
    // seq_parameter_set_id
    bit_writer.WriteExpGolomb(3);
    // chroma_format_idc, separate_colour_plane_flag
    bit_writer.WriteExpGolomb(3);
    bit_writer.WriteBits(1, 1);
    // bit_depth_luma_minus8, bit_depth_chroma_minus8
    bit_writer.WriteExpGolomb(2);
    bit_writer.WriteExpGolomb(2);
    // qpprime_y_zero_transform_bypass_flag, seq_scaling_matrix_present_flag
    bit_writer.WriteBits(0, 1);
    bit_writer.WriteBits(1, 1);
    for (int i = 0; i < 12; ++i) {
        if (i == 0 || i == 7) {
            // Present, a delta of -8 ends the list right away.
            bit_writer.WriteBits(1, 1);
            bit_writer.WriteSignedExpGolomb(-8);
        } else {
            bit_writer.WriteBits(0, 1);
        }
    }
    // log2_max_frame_num_minus4
    bit_writer.WriteExpGolomb(2);
    // pic_order_cnt_type 1
    bit_writer.WriteExpGolomb(1);
    // delta_pic_order_always_zero_flag, offset_for_non_ref_pic, offset_for_top_to_bottom_field
    bit_writer.WriteBits(0, 1);
    bit_writer.WriteSignedExpGolomb(-2);
    bit_writer.WriteSignedExpGolomb(1);
    // num_ref_frames_in_pic_order_cnt_cycle, offset_for_ref_frame
    bit_writer.WriteExpGolomb(3);
    bit_writer.WriteSignedExpGolomb(1);
    bit_writer.WriteSignedExpGolomb(-1);
    bit_writer.WriteSignedExpGolomb(5);
    // max_num_ref_frames, gaps_in_frame_num_value_allowed_flag
    bit_writer.WriteExpGolomb(2);
    bit_writer.WriteBits(0, 1);
    // 1280x720 coded
    bit_writer.WriteExpGolomb(79);
    bit_writer.WriteExpGolomb(44);
    // frame_mbs_only_flag, direct_8x8_inference_flag, frame_cropping_flag
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(1, 1);
    // Without chroma array the crop unit is one sample.
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(8);
    // vui_parameters_present_flag
    bit_writer.WriteBits(0, 1);
    size_t byte_count = bit_writer.WriteRbspTrailingBits();

    BitReader bit_reader(rbsp, byte_count);
    auto sps = SpsParser::ParseSpsUpToVui(bit_reader);
    ASSERT_TRUE(sps.has_value());
    EXPECT_EQ(3u, sps->id);
    EXPECT_EQ(3u, sps->chroma_format_idc);
    EXPECT_EQ(1u, sps->separate_colour_plane_flag);
    EXPECT_EQ(0u, sps->chroma_array_type());
    EXPECT_EQ(2u, sps->bit_depth_luma_minus8);
    EXPECT_EQ(1u, sps->seq_scaling_matrix_present_flag);
    EXPECT_EQ(6u, sps->log2_max_frame_num);
    EXPECT_EQ(1u, sps->pic_order_cnt_type);
    EXPECT_EQ(-2, sps->offset_for_non_ref_pic);
    EXPECT_EQ(1, sps->offset_for_top_to_bottom_field);
    EXPECT_THAT(sps->offset_for_ref_frame, testing::ElementsAre(1, -1, 5));
    EXPECT_EQ(2u, sps->max_num_ref_frames);
    EXPECT_EQ(1280u, sps->width);
    EXPECT_EQ(712u, sps->height);
    EXPECT_EQ(80u * 45u, sps->pic_size_in_map_units());
}

MY_TEST(SpsParserTest, CropLargerThanPicture) {
    uint8_t rbsp[kSpsBufferMaxSize] = {0};
    BitWriter bit_writer(rbsp, kSpsBufferMaxSize);
    bit_writer.WriteByte(uint8_t(66));
    bit_writer.WriteByte(uint8_t(0));
    bit_writer.WriteByte(uint8_t(30));
    // seq_parameter_set_id, log2_max_frame_num_minus4, pic_order_cnt_type 2
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(2);
    // max_num_ref_frames, gaps_in_frame_num_value_allowed_flag
    bit_writer.WriteExpGolomb(1);
    bit_writer.WriteBits(0, 1);
    // One macroblock.
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    // frame_mbs_only_flag, direct_8x8_inference_flag, frame_cropping_flag
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(1, 1);
    // 2 * (4 + 4) = 16 samples, the whole width.
    bit_writer.WriteExpGolomb(4);
    bit_writer.WriteExpGolomb(4);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteBits(0, 1);
    size_t byte_count = bit_writer.WriteRbspTrailingBits();

    BitReader bit_reader(rbsp, byte_count);
    EXPECT_FALSE(SpsParser::ParseSpsUpToVui(bit_reader).has_value());
}

} // namespace test
} // namespace avcparse
