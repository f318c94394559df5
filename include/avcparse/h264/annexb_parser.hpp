#ifndef _AVCPARSE_H264_ANNEXB_PARSER_H_
#define _AVCPARSE_H264_ANNEXB_PARSER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/parse_error.hpp"
#include "avcparse/common/array_view.hpp"
#include "avcparse/h264/access_unit.hpp"
#include "avcparse/h264/access_unit_assembler.hpp"
#include "avcparse/h264/byte_scanner.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace avcparse {
namespace h264 {

// Turns an H.264 Annex B byte stream, pushed in arbitrary chunks, into access
// units. The result does not depend on how the stream is chunked.
//
//   AnnexBParser parser;
//   parser.Push(chunk.data(), chunk.size());
//   while (auto access_unit = parser.NextAccessUnit()) { ... }
//   ...
//   while (auto access_unit = parser.Flush()) { ... }
//
// Not thread safe, one instance serves one stream.
class AVCPARSE_CPP_EXPORT AnnexBParser {
public:
    struct Configuration {
        // Bytes retained without finding any start sequence before
        // NextAccessUnit() gives up with a BUFFER_OVERFLOW ParseException.
        size_t max_buffer_size = ByteScanner::kDefaultMaxBufferSize;
        // A recovery point SEI with recovery_frame_cnt 0 marks a keyframe.
        bool keyframe_on_recovery_point = true;
        // Keep the RBSP copy in the emitted NAL units.
        bool keep_rbsp = true;
    };

    using ErrorCallback = std::function<void(const ParseError& error)>;
public:
    AnnexBParser();
    explicit AnnexBParser(Configuration config);
    ~AnnexBParser();

    const Configuration& config() const { return config_; }

    // Appends a chunk, only start sequences are searched for here.
    void Push(const uint8_t* data, size_t size);
    void Push(ArrayView<const uint8_t> data);

    // Returns the next complete access unit, or nullopt when more input is
    // needed. Throws ParseException on BUFFER_OVERFLOW, the buffered data
    // is discarded then.
    std::optional<AccessUnit> NextAccessUnit();

    // Ends the stream: the unterminated tail and the open access unit are
    // completed. Returns the access units left one per call, nullopt when
    // drained. Data pushed afterwards is parsed as a new stream that shares 
    // the parameter sets.
    std::optional<AccessUnit> Flush();

    // Drops every buffered byte, pending access unit and parameter set.
    void Reset();

    // Every non-fatal error is delivered here, as well as logged and attached
    // to the access unit it belongs to.
    void OnError(ErrorCallback callback);

    std::shared_ptr<const SpsParser::SpsState> sps(uint32_t id) const;
    std::shared_ptr<const PpsParser::PpsState> pps(uint32_t id) const;

    size_t buffered_size() const { return scanner_.buffered_size(); }

private:
    void CheckOverflow();
    void ProcessScanResults();
    void ProcessNalu(const NaluIndex& index, bool trailing_fragment);
    void ReportError(const ParseError& error);
    std::optional<AccessUnit> PopReady();

private:
    const Configuration config_;
    ByteScanner scanner_;
    AccessUnitAssembler assembler_;
    std::deque<AccessUnit> ready_access_units_;
    ErrorCallback error_callback_ = nullptr;

    DISALLOW_COPY_AND_ASSIGN(AnnexBParser);
};
    
} // namespace h264
} // namespace avcparse

#endif
