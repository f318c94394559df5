#ifndef _AVCPARSE_H264_NAL_UNIT_H_
#define _AVCPARSE_H264_NAL_UNIT_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/common/array_view.hpp"
#include "avcparse/h264/common.hpp"
#include "avcparse/h264/sps_parser.hpp"
#include "avcparse/h264/pps_parser.hpp"
#include "avcparse/h264/sei_parser.hpp"
#include "avcparse/h264/slice_header_parser.hpp"

#include <variant>
#include <vector>

namespace avcparse {
namespace h264 {
// NAL unit header, 7.3.1
// +---------------+
// |0|1|2|3|4|5|6|7|
// +-+-+-+-+-+-+-+-+
// |F|NRI|  Type   |
// +---------------+
// F:
// 1 bit, forbidden_zero_bit, shall be 0.

// NRI: 
// 2 bits, nal_ref_idc, non-zero for units carrying reference pictures
// and parameter sets.

// Type:
// 5 bits, nal_unit_type, see NaluType.

// An owned copy of one NAL unit extracted from the byte stream, the bytes
// of the base class start with the header and keep the emulation prevention bytes.
class AVCPARSE_CPP_EXPORT NalUnit : public BinaryBuffer {
public:
    // The decoded syntax of the unit, if any.
    using Syntax = std::variant<std::monostate, 
                                SpsParser::SpsState, 
                                PpsParser::PpsState, 
                                SliceHeader, 
                                std::vector<SeiMessage>>;
public:
    NalUnit();
    NalUnit(const uint8_t* buffer, 
            size_t size, 
            size_t stream_offset = 0, 
            size_t start_sequence_size = kNaluLongStartSequenceSize);
    NalUnit(const NalUnit&);
    NalUnit(NalUnit&&);
    ~NalUnit();

    NalUnit& operator=(const NalUnit&);
    NalUnit& operator=(NalUnit&&);

    bool forbidden_bit() const;
    uint8_t nri() const;
    uint8_t unit_type() const;
    NaluType type() const;
    bool is_vcl() const;

    // The bytes after the header, emulation prevention bytes included.
    ArrayView<const uint8_t> payload() const;
    // The bytes after the header, emulation prevention bytes removed.
    // Empty once released.
    ArrayView<const uint8_t> rbsp() const;
    void ReleaseRbsp();

    size_t stream_offset() const { return stream_offset_; }
    size_t start_sequence_size() const { return start_sequence_size_; }

    const Syntax& syntax() const { return syntax_; }
    void set_syntax(Syntax syntax);

    // Shortcuts to the decoded syntax, nullptr if it is not of that kind.
    const SliceHeader* slice_header() const;
    const SpsParser::SpsState* sps() const;
    const PpsParser::PpsState* pps() const;
    const std::vector<SeiMessage>* sei_messages() const;

public:
    // SODB: String of Data Bits, the raw encoded data and unprocessed.
    // RBSP: Raw Byte Sequence Payload, SODB plus trailing bits (one stop bit + zero or more 0 bits).
    // EBSP: Encapsulated Byte Sequence Payload, RBSP with emulation bytes (0x03) inserted.
    
    // RBSP = SODB + RBSP Stop bit + 0 bits.
    // EBSP = RBSP Part_1 + 0x03 + RBSP Part_2 + 0x03 ... + RBSP + Part_n.
    // NALU = NALU Header + EBSP.
    // H264 Byte stream = start code + NALU + ... + start code + NALU.

    // Retrieve RBSP from EBSP by removing 0x03 emulation byte, which is
    // only an emulation byte when it follows 0x0000 and precedes a byte
    // in [0x00, 0x03] or the end of the unit. See section 7.4.1.
    static std::vector<uint8_t> RetrieveRbspFromEbsp(const uint8_t* ebsp_buffer, size_t ebsp_size);
    // Appends the EBSP of `rbsp_buffer` to `ebsp_buffer`.
    static void WriteRbsp(const uint8_t* rbsp_buffer, size_t rbsp_size, std::vector<uint8_t>& ebsp_buffer);

private:
    size_t stream_offset_;
    size_t start_sequence_size_;
    BinaryBuffer rbsp_;
    Syntax syntax_;
};
    
} // namespace h264
} // namespace avcparse

#endif
