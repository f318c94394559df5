#ifndef _AVCPARSE_H264_STREAM_BUILDER_UNITTEST_HELPER_H_
#define _AVCPARSE_H264_STREAM_BUILDER_UNITTEST_HELPER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/h264/common.hpp"
#include "avcparse/h264/nalunit.hpp"

#include <vector>

namespace avcparse {
namespace test {

// Writes small but well-formed H.264 NAL units, and Annex B streams of them.
// Every SPS is baseline 4:2:0 progressive with 8 bits of frame_num and
// pic_order_cnt_lsb, every PPS is CAVLC without weighted prediction.
class StreamBuilder {
public:
    struct Slice {
        h264::NaluType type = h264::NaluType::SLICE;
        uint8_t nal_ref_idc = 2;
        uint32_t first_mb_in_slice = 0;
        // P = 0, B = 1, I = 2.
        uint32_t slice_type = 0;
        uint32_t pps_id = 0;
        uint32_t frame_num = 0;
        uint32_t idr_pic_id = 0;
        uint32_t pic_order_cnt_lsb = 0;
        // Written only if the PPS has redundant_pic_cnt_present_flag.
        bool has_redundant_pic_cnt = false;
        uint32_t redundant_pic_cnt = 0;
    };

    static BinaryBuffer Sps(uint32_t id, uint32_t width_in_mbs = 20, uint32_t height_in_mbs = 15);
    static BinaryBuffer Pps(uint32_t id, uint32_t sps_id, bool redundant_pic_cnt_present = false);
    static BinaryBuffer SliceNalu(const Slice& slice);
    static BinaryBuffer Idr(uint32_t idr_pic_id = 0, uint32_t first_mb_in_slice = 0);
    static BinaryBuffer P(uint32_t frame_num, uint32_t first_mb_in_slice = 0, uint8_t nal_ref_idc = 2);
    static BinaryBuffer Aud();
    static BinaryBuffer RecoveryPointSei(uint32_t recovery_frame_cnt);
    static BinaryBuffer EndOfSequence();

    static h264::NalUnit ToNalUnit(const BinaryBuffer& nalu, size_t stream_offset = 0);

public:
    StreamBuilder& Add(const BinaryBuffer& nalu, size_t start_sequence_size = h264::kNaluLongStartSequenceSize);
    StreamBuilder& AddBytes(const BinaryBuffer& bytes);

    const BinaryBuffer& stream() const { return stream_; }
    // Stream offsets of the start sequences, in order.
    const std::vector<size_t>& nalu_offsets() const { return nalu_offsets_; }

private:
    BinaryBuffer stream_;
    std::vector<size_t> nalu_offsets_;
};

} // namespace test
} // namespace avcparse

#endif
