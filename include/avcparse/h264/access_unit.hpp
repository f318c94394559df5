#ifndef _AVCPARSE_H264_ACCESS_UNIT_H_
#define _AVCPARSE_H264_ACCESS_UNIT_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/parse_error.hpp"
#include "avcparse/h264/nalunit.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace avcparse {
namespace h264 {

enum class AccessUnitKind {
    // Contains an IDR picture.
    IDR,
    // Preceded by a recovery point SEI.
    RECOVERY_POINT,
    NON_IDR
};

AVCPARSE_CPP_EXPORT const char* ToString(AccessUnitKind kind);

// The NAL units of one primary coded picture, with the non-VCL units leading
// and trailing it, in stream order.
class AVCPARSE_CPP_EXPORT AccessUnit {
public:
    explicit AccessUnit(bool keyframe_on_recovery_point = true);
    AccessUnit(const AccessUnit&);
    AccessUnit(AccessUnit&&);
    ~AccessUnit();

    AccessUnit& operator=(const AccessUnit&);
    AccessUnit& operator=(AccessUnit&&);

    const std::vector<NalUnit>& nalus() const { return nalus_; }
    const std::vector<ParseError>& errors() const { return errors_; }
    bool empty() const { return nalus_.empty() && errors_.empty(); }

    // The parameter sets the first slice resolved to, nullptr if unresolved.
    // Later redefinitions of the same ids leave them untouched.
    std::shared_ptr<const SpsParser::SpsState> sps() const { return sps_; }
    std::shared_ptr<const PpsParser::PpsState> pps() const { return pps_; }

    bool has_vcl() const { return vcl_count_ > 0; }
    size_t vcl_count() const { return vcl_count_; }
    // Header of the first slice, nullptr if there is none.
    const SliceHeader* first_slice_header() const;

    // Stream offset of the start sequence of the first NAL unit.
    std::optional<size_t> stream_offset() const;

    AccessUnitKind kind() const;
    // An IDR picture, or a recovery point with recovery_frame_cnt 0 when enabled.
    bool is_keyframe() const;
    std::optional<uint32_t> recovery_frame_cnt() const { return recovery_frame_cnt_; }

    // Re-serializes the access unit: a 4-byte start sequence precedes the first
    // NAL unit and the parameter sets, the others keep their original one.
    BinaryBuffer ToAnnexB() const;

    void AddNalUnit(NalUnit nalu);
    void AddError(ParseError error);
    void set_parameter_sets(std::shared_ptr<const SpsParser::SpsState> sps,
                            std::shared_ptr<const PpsParser::PpsState> pps);

private:
    bool keyframe_on_recovery_point_;
    std::vector<NalUnit> nalus_;
    std::vector<ParseError> errors_;
    std::shared_ptr<const SpsParser::SpsState> sps_;
    std::shared_ptr<const PpsParser::PpsState> pps_;
    size_t vcl_count_ = 0;
    bool has_idr_ = false;
    std::optional<uint32_t> recovery_frame_cnt_;
};
    
} // namespace h264
} // namespace avcparse

#endif
