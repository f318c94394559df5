#include "avcparse/h264/access_unit.hpp"

namespace avcparse {
namespace h264 {
namespace {
constexpr uint8_t kStartSequence[] = {0x00, 0x00, 0x00, 0x01};
} // namespace

const char* ToString(AccessUnitKind kind) {
    switch (kind) {
    case AccessUnitKind::IDR:
        return "IDR";
    case AccessUnitKind::RECOVERY_POINT:
        return "RecoveryPoint";
    case AccessUnitKind::NON_IDR:
        return "NonIDR";
    }
    return "Unknown";
}

AccessUnit::AccessUnit(bool keyframe_on_recovery_point) 
    : keyframe_on_recovery_point_(keyframe_on_recovery_point) {}

AccessUnit::AccessUnit(const AccessUnit&) = default;
AccessUnit::AccessUnit(AccessUnit&&) = default;
AccessUnit::~AccessUnit() = default;
AccessUnit& AccessUnit::operator=(const AccessUnit&) = default;
AccessUnit& AccessUnit::operator=(AccessUnit&&) = default;

const SliceHeader* AccessUnit::first_slice_header() const {
    for (const auto& nalu : nalus_) {
        if (const SliceHeader* header = nalu.slice_header()) {
            return header;
        }
    }
    return nullptr;
}

std::optional<size_t> AccessUnit::stream_offset() const {
    if (nalus_.empty()) {
        return std::nullopt;
    }
    return nalus_.front().stream_offset();
}

AccessUnitKind AccessUnit::kind() const {
    if (has_idr_) {
        return AccessUnitKind::IDR;
    }
    if (recovery_frame_cnt_) {
        return AccessUnitKind::RECOVERY_POINT;
    }
    return AccessUnitKind::NON_IDR;
}

bool AccessUnit::is_keyframe() const {
    if (has_idr_) {
        return true;
    }
    return keyframe_on_recovery_point_ && recovery_frame_cnt_ && *recovery_frame_cnt_ == 0;
}

BinaryBuffer AccessUnit::ToAnnexB() const {
    size_t total_size = 0;
    for (const auto& nalu : nalus_) {
        total_size += kNaluLongStartSequenceSize + nalu.size();
    }
    BinaryBuffer bytes;
    bytes.reserve(total_size);
    for (size_t i = 0; i < nalus_.size(); ++i) {
        const auto& nalu = nalus_[i];
        const NaluType type = nalu.type();
        size_t start_sequence_size = nalu.start_sequence_size();
        if (i == 0 || type == NaluType::SPS || type == NaluType::PPS || 
            start_sequence_size != kNaluShortStartSequenceSize) {
            start_sequence_size = kNaluLongStartSequenceSize;
        }
        bytes.insert(bytes.end(), 
                     std::end(kStartSequence) - start_sequence_size, 
                     std::end(kStartSequence));
        bytes.insert(bytes.end(), nalu.begin(), nalu.end());
    }
    return bytes;
}

void AccessUnit::AddNalUnit(NalUnit nalu) {
    const NaluType type = nalu.type();
    if (IsVcl(type)) {
        ++vcl_count_;
    }
    if (type == NaluType::IDR) {
        has_idr_ = true;
    } else if (const auto* messages = nalu.sei_messages()) {
        for (const auto& message : *messages) {
            if (message.recovery_point && !recovery_frame_cnt_) {
                recovery_frame_cnt_ = message.recovery_point->recovery_frame_cnt;
            }
        }
    }
    nalus_.push_back(std::move(nalu));
}

void AccessUnit::AddError(ParseError error) {
    errors_.push_back(std::move(error));
}

void AccessUnit::set_parameter_sets(std::shared_ptr<const SpsParser::SpsState> sps,
                                    std::shared_ptr<const PpsParser::PpsState> pps) {
    sps_ = std::move(sps);
    pps_ = std::move(pps);
}
    
} // namespace h264
} // namespace avcparse
