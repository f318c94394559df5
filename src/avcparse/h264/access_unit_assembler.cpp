#include "avcparse/h264/access_unit_assembler.hpp"
#include "avcparse/common/logger.hpp"

#include <sstream>

namespace avcparse {
namespace h264 {
namespace {

// One condition of 7.4.1.2.4 under which a slice is the first VCL unit of a new
// primary picture. `prev` is the last slice of the current access unit.
struct NewPictureRule {
    const char* name;
    bool (*test)(const SliceHeader& prev, const SliceHeader& curr);
};

bool BothFullyParsed(const SliceHeader& prev, const SliceHeader& curr) {
    return prev.fully_parsed && curr.fully_parsed;
}

// Evaluated in order, the first match decides.
const NewPictureRule kNewPictureRules[] = {
    {"frame_num", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) && prev.frame_num != curr.frame_num;
    }},
    {"pic_parameter_set_id", [](const SliceHeader& prev, const SliceHeader& curr) {
        return prev.pic_parameter_set_id != curr.pic_parameter_set_id;
    }},
    {"field_pic_flag", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) && prev.field_pic_flag != curr.field_pic_flag;
    }},
    {"bottom_field_flag", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) && prev.bottom_field_flag != curr.bottom_field_flag;
    }},
    {"nal_ref_idc", [](const SliceHeader& prev, const SliceHeader& curr) {
        return (prev.nal_ref_idc == 0) != (curr.nal_ref_idc == 0);
    }},
    // Fields absent from the bitstream are zero on both sides, so the
    // comparisons below only bite for the matching pic_order_cnt_type.
    {"pic_order_cnt_lsb/delta_pic_order_cnt_bottom", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) && 
               (prev.pic_order_cnt_lsb != curr.pic_order_cnt_lsb ||
                prev.delta_pic_order_cnt_bottom != curr.delta_pic_order_cnt_bottom);
    }},
    {"delta_pic_order_cnt", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) &&
               (prev.delta_pic_order_cnt[0] != curr.delta_pic_order_cnt[0] ||
                prev.delta_pic_order_cnt[1] != curr.delta_pic_order_cnt[1]);
    }},
    {"IdrPicFlag", [](const SliceHeader& prev, const SliceHeader& curr) {
        return prev.idr_pic_flag != curr.idr_pic_flag;
    }},
    {"idr_pic_id", [](const SliceHeader& prev, const SliceHeader& curr) {
        return BothFullyParsed(prev, curr) && prev.idr_pic_flag && curr.idr_pic_flag &&
               prev.idr_pic_id != curr.idr_pic_id;
    }},
    // Only the leading fields are known for one of them.
    {"first_mb_in_slice", [](const SliceHeader& prev, const SliceHeader& curr) {
        return !BothFullyParsed(prev, curr) && curr.first_mb_in_slice == 0;
    }},
};

// Non-VCL units which, after the last VCL unit of a picture, start the next access unit.
bool StartsAccessUnit(uint8_t unit_type) {
    return unit_type == static_cast<uint8_t>(NaluType::SEI) ||
           unit_type == static_cast<uint8_t>(NaluType::SPS) ||
           unit_type == static_cast<uint8_t>(NaluType::PPS) ||
           unit_type == static_cast<uint8_t>(NaluType::AUD) ||
           (unit_type >= 14 && unit_type <= 18);
}

bool HasSliceHeader(NaluType type) {
    return type == NaluType::SLICE || type == NaluType::IDR || type == NaluType::DATA_PARTITION_A;
}

ParseError MakeError(ErrorCode code, const NalUnit& nalu, const std::string& detail) {
    std::ostringstream oss;
    oss << ToString(nalu.type()) << " (type " << static_cast<int>(nalu.unit_type()) << "): " << detail;
    return ParseError{code, nalu.stream_offset(), oss.str()};
}

} // namespace

AccessUnitAssembler::AccessUnitAssembler() 
    : AccessUnitAssembler(Configuration()) {}

AccessUnitAssembler::AccessUnitAssembler(Configuration config) 
    : config_(config),
      current_(config.keyframe_on_recovery_point) {}

AccessUnitAssembler::~AccessUnitAssembler() = default;

void AccessUnitAssembler::OnError(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

std::shared_ptr<const SpsParser::SpsState> AccessUnitAssembler::sps(uint32_t id) const {
    auto it = sps_data_.find(id);
    return it != sps_data_.end() ? it->second : nullptr;
}

std::shared_ptr<const PpsParser::PpsState> AccessUnitAssembler::pps(uint32_t id) const {
    auto it = pps_data_.find(id);
    return it != pps_data_.end() ? it->second : nullptr;
}

std::optional<AccessUnit> AccessUnitAssembler::Insert(NalUnit nalu, bool trailing_fragment) {
    // Reported on the access unit the unit ends up in.
    std::vector<ParseError> errors;
    if (nalu.forbidden_bit()) {
        errors.push_back(MakeError(ErrorCode::INVALID_HEADER, nalu, "forbidden_zero_bit is set"));
    }

    std::optional<ParseError> decode_error = Decode(nalu);
    if (!config_.keep_rbsp) {
        nalu.ReleaseRbsp();
    }

    if (decode_error && trailing_fragment && decode_error->code != ErrorCode::UNRESOLVED_PARAMETER_SET) {
        // Cut by the end of the stream, the unit itself is dropped.
        errors.push_back(MakeError(ErrorCode::TRUNCATED_INPUT, nalu, 
                                   "cut by end of stream, " + decode_error->detail));
        AccessUnit* target = closed_ && current_.empty() ? &*closed_ : &current_;
        for (auto& error : errors) {
            ReportError(target, std::move(error));
        }
        return std::nullopt;
    }
    if (decode_error) {
        errors.push_back(std::move(*decode_error));
    }

    const NaluType type = nalu.type();
    if (type == NaluType::END_OF_SEQUENCE || type == NaluType::END_OF_STREAM) {
        if (state_ == State::ACCUMULATING) {
            Place(current_, std::move(nalu), std::move(errors));
            closed_ = FinalizeCurrent();
        } else if (closed_ && current_.empty()) {
            Place(*closed_, std::move(nalu), std::move(errors));
        } else {
            Place(current_, std::move(nalu), std::move(errors));
        }
        return std::nullopt;
    }

    std::optional<AccessUnit> completed;
    if (closed_) {
        completed = std::move(closed_);
        closed_.reset();
    }

    if (IsVcl(type)) {
        const SliceHeader* header = nalu.slice_header();
        if (state_ == State::ACCUMULATING && IsFirstVclOfNewPicture(header)) {
            completed = FinalizeCurrent();
        }
        if (state_ == State::AWAITING_FIRST_VCL) {
            if (header) {
                // Whatever resolved is recorded, the SPS may still be missing.
                auto pps_state = pps(header->pic_parameter_set_id);
                current_.set_parameter_sets(pps_state ? sps(pps_state->sps_id) : nullptr, pps_state);
            }
            PLOG_VERBOSE << "Primary picture starts at offset " << nalu.stream_offset()
                         << " with " << ToString(type);
            state_ = State::ACCUMULATING;
        }
        if (header) {
            last_slice_header_ = *header;
        }
    } else if (StartsAccessUnit(nalu.unit_type())) {
        if (state_ == State::ACCUMULATING) {
            completed = FinalizeCurrent();
        }
    }
    // The remaining types (filler, SPS extension, auxiliary slice and
    // the reserved ones) stay with the picture they follow.
    Place(current_, std::move(nalu), std::move(errors));
    return completed;
}

std::vector<AccessUnit> AccessUnitAssembler::Flush() {
    std::vector<AccessUnit> completed;
    if (closed_) {
        completed.push_back(std::move(*closed_));
        closed_.reset();
    }
    if (!current_.empty()) {
        if (!current_.has_vcl()) {
            PLOG_VERBOSE << "Access unit without primary picture flushed, " 
                         << current_.nalus().size() << " NAL units.";
        }
        completed.push_back(FinalizeCurrent());
    }
    state_ = State::AWAITING_FIRST_VCL;
    last_slice_header_.reset();
    return completed;
}

void AccessUnitAssembler::Reset() {
    state_ = State::AWAITING_FIRST_VCL;
    current_ = AccessUnit(config_.keyframe_on_recovery_point);
    closed_.reset();
    last_slice_header_.reset();
    sps_data_.clear();
    pps_data_.clear();
}

// Private methods
std::optional<ParseError> AccessUnitAssembler::Decode(NalUnit& nalu) {
    switch (nalu.type()) {
    case NaluType::SPS:
        return DecodeSps(nalu);
    case NaluType::PPS:
        return DecodePps(nalu);
    case NaluType::SEI:
        return DecodeSei(nalu);
    case NaluType::SLICE:
    case NaluType::IDR:
    case NaluType::DATA_PARTITION_A:
        return DecodeSliceHeader(nalu);
    default:
        return std::nullopt;
    }
}

std::optional<ParseError> AccessUnitAssembler::DecodeSps(NalUnit& nalu) {
    BitReader bit_reader(nalu.rbsp());
    auto sps_state = SpsParser::ParseSpsUpToVui(bit_reader);
    if (!sps_state) {
        return MakeError(ErrorCode::MALFORMED_SPS, nalu, "failed to parse SPS");
    }
    const uint32_t id = sps_state->id;
    PLOG_DEBUG << (sps_data_.count(id) > 0 ? "Redefined" : "Defined") << " SPS id=" << id
               << ", profile_idc=" << sps_state->profile_idc
               << ", level_idc=" << sps_state->level_idc
               << ", resolution=" << sps_state->width << "x" << sps_state->height;
    // Replaced rather than modified, access units holding the old one keep it.
    sps_data_[id] = std::make_shared<const SpsParser::SpsState>(*sps_state);
    nalu.set_syntax(std::move(*sps_state));
    return std::nullopt;
}

std::optional<ParseError> AccessUnitAssembler::DecodePps(NalUnit& nalu) {
    uint32_t pps_id = 0;
    uint32_t sps_id = 0;
    {
        BitReader bit_reader(nalu.rbsp());
        if (!PpsParser::ParsePpsIds(bit_reader, &pps_id, &sps_id)) {
            return MakeError(ErrorCode::MALFORMED_PPS, nalu, "failed to parse PPS ids");
        }
    }
    // The number of scaling lists in the tail depends on the SPS, a PPS
    // arriving before its SPS is parsed as 4:2:0.
    auto sps_state = sps(sps_id);
    const uint32_t chroma_format_idc = sps_state ? sps_state->chroma_format_idc : 1;
    BitReader bit_reader(nalu.rbsp());
    auto pps_state = PpsParser::ParsePps(bit_reader, chroma_format_idc);
    if (!pps_state) {
        return MakeError(ErrorCode::MALFORMED_PPS, nalu, "failed to parse PPS id=" + std::to_string(pps_id));
    }
    PLOG_DEBUG << (pps_data_.count(pps_id) > 0 ? "Redefined" : "Defined") << " PPS id=" << pps_id
               << " referring to SPS id=" << sps_id;
    pps_data_[pps_id] = std::make_shared<const PpsParser::PpsState>(*pps_state);
    nalu.set_syntax(std::move(*pps_state));
    return std::nullopt;
}

std::optional<ParseError> AccessUnitAssembler::DecodeSei(NalUnit& nalu) {
    std::vector<SeiMessage> messages;
    BitReader bit_reader(nalu.rbsp());
    const bool complete = SeiParser::ParseSei(bit_reader, messages);
    const size_t decoded_count = messages.size();
    nalu.set_syntax(std::move(messages));
    if (!complete) {
        return MakeError(ErrorCode::TRUNCATED_SEI, nalu, 
                         "message " + std::to_string(decoded_count) + " is truncated");
    }
    return std::nullopt;
}

std::optional<ParseError> AccessUnitAssembler::DecodeSliceHeader(NalUnit& nalu) {
    const NaluType type = nalu.type();
    const uint8_t nal_ref_idc = nalu.nri();
    BitReader leading_reader(nalu.rbsp());
    auto leading = SliceHeaderParser::ParseLeadingFields(leading_reader, type, nal_ref_idc);
    if (!leading) {
        return MakeError(ErrorCode::MALFORMED_CODE, nalu, "failed to parse slice header");
    }
    auto pps_state = pps(leading->pic_parameter_set_id);
    auto sps_state = pps_state ? sps(pps_state->sps_id) : nullptr;
    if (!pps_state || !sps_state) {
        nalu.set_syntax(*leading);
        if (!pps_state) {
            return MakeError(ErrorCode::UNRESOLVED_PARAMETER_SET, nalu, 
                             "unknown PPS id=" + std::to_string(leading->pic_parameter_set_id));
        }
        return MakeError(ErrorCode::UNRESOLVED_PARAMETER_SET, nalu, 
                         "unknown SPS id=" + std::to_string(pps_state->sps_id));
    }
    BitReader bit_reader(nalu.rbsp());
    auto header = SliceHeaderParser::Parse(bit_reader, type, nal_ref_idc, *sps_state, *pps_state);
    if (!header) {
        nalu.set_syntax(*leading);
        return MakeError(ErrorCode::MALFORMED_CODE, nalu, "failed to parse slice header");
    }
    nalu.set_syntax(std::move(*header));
    return std::nullopt;
}

bool AccessUnitAssembler::IsFirstVclOfNewPicture(const SliceHeader* header) const {
    // Data partitions B and C, and undecodable slices, carry no usable header.
    if (!header || !last_slice_header_) {
        return false;
    }
    // Redundant coded pictures belong to the primary picture before them.
    if (header->redundant_pic_cnt > 0) {
        return false;
    }
    for (const auto& rule : kNewPictureRules) {
        if (rule.test(*last_slice_header_, *header)) {
            PLOG_VERBOSE << "New primary picture detected by " << rule.name;
            return true;
        }
    }
    return false;
}

AccessUnit AccessUnitAssembler::FinalizeCurrent() {
    AccessUnit completed = std::move(current_);
    current_ = AccessUnit(config_.keyframe_on_recovery_point);
    state_ = State::AWAITING_FIRST_VCL;
    last_slice_header_.reset();
    PLOG_VERBOSE << "Access unit completed, kind=" << ToString(completed.kind())
                 << ", NAL units=" << completed.nalus().size()
                 << ", errors=" << completed.errors().size();
    return completed;
}

void AccessUnitAssembler::Place(AccessUnit& target, NalUnit nalu, std::vector<ParseError> errors) {
    target.AddNalUnit(std::move(nalu));
    for (auto& error : errors) {
        ReportError(&target, std::move(error));
    }
}

void AccessUnitAssembler::ReportError(AccessUnit* target, ParseError error) {
    PLOG_WARNING << error;
    if (error_callback_) {
        error_callback_(error);
    }
    if (target) {
        target->AddError(std::move(error));
    }
}
    
} // namespace h264
} // namespace avcparse
