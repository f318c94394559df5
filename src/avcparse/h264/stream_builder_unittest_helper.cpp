#include "avcparse/h264/stream_builder_unittest_helper.hpp"
#include "avcparse/base/memory/bit_io_writer.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {
constexpr size_t kMaxRbspSize = 128;
constexpr uint32_t kLog2MaxFrameNumMinus4 = 4;
constexpr uint32_t kLog2MaxPicOrderCntLsbMinus4 = 4;
constexpr uint8_t kStartSequence[] = {0x00, 0x00, 0x00, 0x01};

uint8_t NaluHeader(uint8_t nal_ref_idc, NaluType type) {
    return static_cast<uint8_t>((nal_ref_idc << 5) | static_cast<uint8_t>(type));
}

BinaryBuffer Finish(uint8_t header, const uint8_t* rbsp, size_t rbsp_size) {
    BinaryBuffer nalu;
    nalu.push_back(header);
    NalUnit::WriteRbsp(rbsp, rbsp_size, nalu);
    return nalu;
}

} // namespace

BinaryBuffer StreamBuilder::Sps(uint32_t id, uint32_t width_in_mbs, uint32_t height_in_mbs) {
    uint8_t rbsp[kMaxRbspSize] = {0};
    BitWriter bit_writer(rbsp, kMaxRbspSize);
    // profile_idc, constraint flags, level_idc
    bit_writer.WriteByte(uint8_t(66));
    bit_writer.WriteByte(uint8_t(0xC0));
    bit_writer.WriteByte(uint8_t(30));
    bit_writer.WriteExpGolomb(id);
    bit_writer.WriteExpGolomb(kLog2MaxFrameNumMinus4);
    // pic_order_cnt_type
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(kLog2MaxPicOrderCntLsbMinus4);
    // max_num_ref_frames, gaps_in_frame_num_value_allowed_flag
    bit_writer.WriteExpGolomb(1);
    bit_writer.WriteBits(0, 1);
    bit_writer.WriteExpGolomb(width_in_mbs - 1);
    bit_writer.WriteExpGolomb(height_in_mbs - 1);
    // frame_mbs_only_flag, direct_8x8_inference_flag, frame_cropping_flag,
    // vui_parameters_present_flag
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(1, 1);
    bit_writer.WriteBits(0, 1);
    bit_writer.WriteBits(0, 1);
    size_t size = bit_writer.WriteRbspTrailingBits();
    return Finish(NaluHeader(3, NaluType::SPS), rbsp, size);
}

BinaryBuffer StreamBuilder::Pps(uint32_t id, uint32_t sps_id, bool redundant_pic_cnt_present) {
    uint8_t rbsp[kMaxRbspSize] = {0};
    BitWriter bit_writer(rbsp, kMaxRbspSize);
    bit_writer.WriteExpGolomb(id);
    bit_writer.WriteExpGolomb(sps_id);
    // entropy_coding_mode_flag, bottom_field_pic_order_in_frame_present_flag
    bit_writer.WriteBits(0, 2);
    // num_slice_groups_minus1
    bit_writer.WriteExpGolomb(0);
    // num_ref_idx_l0/l1_default_active_minus1
    bit_writer.WriteExpGolomb(0);
    bit_writer.WriteExpGolomb(0);
    // weighted_pred_flag, weighted_bipred_idc
    bit_writer.WriteBits(0, 3);
    // pic_init_qp_minus26, pic_init_qs_minus26, chroma_qp_index_offset
    bit_writer.WriteSignedExpGolomb(0);
    bit_writer.WriteSignedExpGolomb(0);
    bit_writer.WriteSignedExpGolomb(0);
    // deblocking_filter_control_present_flag, constrained_intra_pred_flag
    bit_writer.WriteBits(0, 2);
    bit_writer.WriteBits(redundant_pic_cnt_present ? 1 : 0, 1);
    size_t size = bit_writer.WriteRbspTrailingBits();
    return Finish(NaluHeader(3, NaluType::PPS), rbsp, size);
}

BinaryBuffer StreamBuilder::SliceNalu(const Slice& slice) {
    uint8_t rbsp[kMaxRbspSize] = {0};
    BitWriter bit_writer(rbsp, kMaxRbspSize);
    const bool is_idr = slice.type == NaluType::IDR;
    const uint32_t slice_type = slice.slice_type % 5;
    bit_writer.WriteExpGolomb(slice.first_mb_in_slice);
    bit_writer.WriteExpGolomb(slice.slice_type);
    bit_writer.WriteExpGolomb(slice.pps_id);
    bit_writer.WriteBits(slice.frame_num, kLog2MaxFrameNumMinus4 + 4);
    if (is_idr) {
        bit_writer.WriteExpGolomb(slice.idr_pic_id);
    }
    bit_writer.WriteBits(slice.pic_order_cnt_lsb, kLog2MaxPicOrderCntLsbMinus4 + 4);
    if (slice.has_redundant_pic_cnt) {
        bit_writer.WriteExpGolomb(slice.redundant_pic_cnt);
    }
    if (slice_type == 1) {
        // direct_spatial_mv_pred_flag
        bit_writer.WriteBits(1, 1);
    }
    if (slice_type == 0 || slice_type == 1) {
        // num_ref_idx_active_override_flag, ref_pic_list_modification_flag_l0
        bit_writer.WriteBits(0, 2);
    }
    if (slice_type == 1) {
        // ref_pic_list_modification_flag_l1
        bit_writer.WriteBits(0, 1);
    }
    if (slice.nal_ref_idc != 0) {
        // no_output_of_prior_pics_flag and long_term_reference_flag, or
        // adaptive_ref_pic_marking_mode_flag.
        bit_writer.WriteBits(0, is_idr ? 2 : 1);
    }
    // slice_qp_delta
    bit_writer.WriteSignedExpGolomb(0);
    // Some slice data.
    bit_writer.WriteBits(0xABCD, 16);
    size_t size = bit_writer.WriteRbspTrailingBits();
    return Finish(NaluHeader(slice.nal_ref_idc, slice.type), rbsp, size);
}

BinaryBuffer StreamBuilder::Idr(uint32_t idr_pic_id, uint32_t first_mb_in_slice) {
    Slice slice;
    slice.type = NaluType::IDR;
    slice.nal_ref_idc = 3;
    slice.slice_type = 7;
    slice.idr_pic_id = idr_pic_id;
    slice.first_mb_in_slice = first_mb_in_slice;
    return SliceNalu(slice);
}

BinaryBuffer StreamBuilder::P(uint32_t frame_num, uint32_t first_mb_in_slice, uint8_t nal_ref_idc) {
    Slice slice;
    slice.nal_ref_idc = nal_ref_idc;
    slice.frame_num = frame_num;
    slice.pic_order_cnt_lsb = (2 * frame_num) % 256;
    slice.first_mb_in_slice = first_mb_in_slice;
    return SliceNalu(slice);
}

BinaryBuffer StreamBuilder::Aud() {
    // primary_pic_type 7, any slice type.
    return {NaluHeader(0, NaluType::AUD), 0xF0};
}

BinaryBuffer StreamBuilder::RecoveryPointSei(uint32_t recovery_frame_cnt) {
    uint8_t payload[8] = {0};
    BitWriter payload_writer(payload, sizeof(payload));
    payload_writer.WriteExpGolomb(recovery_frame_cnt);
    // exact_match_flag, broken_link_flag, changing_slice_group_idc
    payload_writer.WriteBits(0x8, 4);
    size_t payload_size = payload_writer.WriteRbspTrailingBits();

    BinaryBuffer rbsp;
    rbsp.push_back(6);
    rbsp.push_back(static_cast<uint8_t>(payload_size));
    rbsp.insert(rbsp.end(), payload, payload + payload_size);
    rbsp.push_back(0x80);
    return Finish(NaluHeader(0, NaluType::SEI), rbsp.data(), rbsp.size());
}

BinaryBuffer StreamBuilder::EndOfSequence() {
    return {NaluHeader(0, NaluType::END_OF_SEQUENCE)};
}

NalUnit StreamBuilder::ToNalUnit(const BinaryBuffer& nalu, size_t stream_offset) {
    return NalUnit(nalu.data(), nalu.size(), stream_offset, kNaluLongStartSequenceSize);
}

StreamBuilder& StreamBuilder::Add(const BinaryBuffer& nalu, size_t start_sequence_size) {
    nalu_offsets_.push_back(stream_.size());
    stream_.insert(stream_.end(), 
                   std::end(kStartSequence) - start_sequence_size, 
                   std::end(kStartSequence));
    stream_.insert(stream_.end(), nalu.begin(), nalu.end());
    return *this;
}

StreamBuilder& StreamBuilder::AddBytes(const BinaryBuffer& bytes) {
    stream_.insert(stream_.end(), bytes.begin(), bytes.end());
    return *this;
}

} // namespace test
} // namespace avcparse
