#ifndef _AVCPARSE_H264_ACCESS_UNIT_ASSEMBLER_H_
#define _AVCPARSE_H264_ACCESS_UNIT_ASSEMBLER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/parse_error.hpp"
#include "avcparse/h264/access_unit.hpp"
#include "avcparse/h264/nalunit.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace avcparse {
namespace h264 {

// Decodes NAL units in stream order and groups them into access units,
// following the first-VCL-of-a-new-picture detection of 7.4.1.2.4. It owns
// the SPS/PPS tables, an access unit keeps snapshots of the ones it used.
class AVCPARSE_CPP_EXPORT AccessUnitAssembler {
public:
    enum class State {
        // No VCL unit seen yet, the non-VCL units lead the next picture.
        AWAITING_FIRST_VCL,
        // The primary picture has started.
        ACCUMULATING
    };

    struct Configuration {
        bool keyframe_on_recovery_point = true;
        bool keep_rbsp = true;
    };

    using ErrorCallback = std::function<void(const ParseError& error)>;
public:
    AccessUnitAssembler();
    explicit AccessUnitAssembler(Configuration config);
    ~AccessUnitAssembler();

    // Decodes `nalu` and places it. Returns the access unit this completed, if any.
    // `trailing_fragment` marks the unit cut by the end of the stream.
    std::optional<AccessUnit> Insert(NalUnit nalu, bool trailing_fragment = false);

    // Completes whatever is still open, at end of stream.
    std::vector<AccessUnit> Flush();

    // Drops the open access unit and the parameter sets.
    void Reset();

    void OnError(ErrorCallback callback);

    State state() const { return state_; }
    std::shared_ptr<const SpsParser::SpsState> sps(uint32_t id) const;
    std::shared_ptr<const PpsParser::PpsState> pps(uint32_t id) const;

private:
    std::optional<ParseError> Decode(NalUnit& nalu);
    std::optional<ParseError> DecodeSps(NalUnit& nalu);
    std::optional<ParseError> DecodePps(NalUnit& nalu);
    std::optional<ParseError> DecodeSei(NalUnit& nalu);
    std::optional<ParseError> DecodeSliceHeader(NalUnit& nalu);

    bool IsFirstVclOfNewPicture(const SliceHeader* header) const;
    AccessUnit FinalizeCurrent();
    void Place(AccessUnit& target, NalUnit nalu, std::vector<ParseError> errors);
    void ReportError(AccessUnit* target, ParseError error);

private:
    const Configuration config_;
    State state_ = State::AWAITING_FIRST_VCL;
    AccessUnit current_;
    // Completed by an end of sequence or end of stream unit, held back
    // until a unit which can not trail it arrives.
    std::optional<AccessUnit> closed_;
    std::optional<SliceHeader> last_slice_header_;
    ErrorCallback error_callback_ = nullptr;

    std::map<uint32_t, std::shared_ptr<const SpsParser::SpsState>> sps_data_;
    std::map<uint32_t, std::shared_ptr<const PpsParser::PpsState>> pps_data_;

    DISALLOW_COPY_AND_ASSIGN(AccessUnitAssembler);
};
    
} // namespace h264
} // namespace avcparse

#endif
