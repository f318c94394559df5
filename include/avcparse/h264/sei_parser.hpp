#ifndef _AVCPARSE_H264_SEI_PARSER_H_
#define _AVCPARSE_H264_SEI_PARSER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/memory/bit_io_reader.hpp"

#include <array>
#include <optional>
#include <vector>

namespace avcparse {
namespace h264 {

// recovery_point(), D.1.8
struct AVCPARSE_CPP_EXPORT RecoveryPoint {
    uint32_t recovery_frame_cnt = 0;
    bool exact_match_flag = false;
    bool broken_link_flag = false;
    uint32_t changing_slice_group_idc = 0;
};

struct AVCPARSE_CPP_EXPORT SeiMessage {
    enum PayloadType : uint32_t {
        BUFFERING_PERIOD = 0,
        PIC_TIMING = 1,
        USER_DATA_REGISTERED = 4,
        USER_DATA_UNREGISTERED = 5,
        RECOVERY_POINT = 6
    };

    uint32_t payload_type = 0;
    BinaryBuffer payload;
    // Decoded for RECOVERY_POINT only.
    std::optional<RecoveryPoint> recovery_point;
    // uuid_iso_iec_11578 of USER_DATA_UNREGISTERED.
    std::optional<std::array<uint8_t, 16>> uuid;
};

class AVCPARSE_CPP_EXPORT SeiParser {
public:
    // Parses the sei_message() list of a SEI RBSP. Messages decoded before a
    // truncated one are kept in `messages` even if false is returned.
    static bool ParseSei(BitReader& bit_reader, std::vector<SeiMessage>& messages);
    static bool ParseSei(const uint8_t* rbsp, size_t size, std::vector<SeiMessage>& messages);

    static std::optional<RecoveryPoint> ParseRecoveryPoint(const uint8_t* payload, size_t size);
private:
    // ff_byte chain: a run of 0xFF bytes each adding 255, closed by a byte below 0xFF.
    static bool ReadPayloadValue(BitReader& bit_reader, uint32_t& value);
};
    
} // namespace h264
} // namespace avcparse

#endif
