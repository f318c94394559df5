#include "avcparse/h264/sei_parser.hpp"

#include <algorithm>

namespace avcparse {
namespace h264 {
namespace {
constexpr size_t kUuidSize = 16;
// Keeps the ff_byte sum inside uint32_t.
constexpr size_t kMaxFFBytes = 1 << 20;
} // namespace

bool SeiParser::ParseSei(const uint8_t* rbsp, size_t size, std::vector<SeiMessage>& messages) {
    BitReader bit_reader(rbsp, size);
    return ParseSei(bit_reader, messages);
}

bool SeiParser::ParseSei(BitReader& bit_reader, std::vector<SeiMessage>& messages) {
    // sei_rbsp(): do sei_message() while (more_rbsp_data())
    while (bit_reader.MoreRbspData()) {
        SeiMessage message;
        // last_payload_type_byte: u(8)
        if (!ReadPayloadValue(bit_reader, message.payload_type)) {
            return false;
        }
        // last_payload_size_byte: u(8)
        uint32_t payload_size = 0;
        if (!ReadPayloadValue(bit_reader, payload_size)) {
            return false;
        }
        if (payload_size > bit_reader.RemainingBitCount() / 8) {
            return false;
        }
        message.payload.reserve(payload_size);
        for (uint32_t i = 0; i < payload_size; ++i) {
            uint8_t byte;
            if (!bit_reader.ReadByte(byte)) {
                return false;
            }
            message.payload.push_back(byte);
        }
        if (message.payload_type == SeiMessage::RECOVERY_POINT) {
            message.recovery_point = ParseRecoveryPoint(message.payload.data(), message.payload.size());
        } else if (message.payload_type == SeiMessage::USER_DATA_UNREGISTERED &&
                   message.payload.size() >= kUuidSize) {
            std::array<uint8_t, kUuidSize> uuid;
            std::copy_n(message.payload.begin(), kUuidSize, uuid.begin());
            message.uuid = uuid;
        }
        messages.push_back(std::move(message));
    }
    return true;
}

std::optional<RecoveryPoint> SeiParser::ParseRecoveryPoint(const uint8_t* payload, size_t size) {
    BitReader bit_reader(payload, size);
    RecoveryPoint recovery_point;
    // recovery_frame_cnt: ue(v)
    if (!bit_reader.ReadExpGolomb(recovery_point.recovery_frame_cnt)) {
        return std::nullopt;
    }
    // exact_match_flag: u(1)
    // broken_link_flag: u(1)
    // changing_slice_group_idc: u(2)
    if (!bit_reader.ReadBit(recovery_point.exact_match_flag) ||
        !bit_reader.ReadBit(recovery_point.broken_link_flag) ||
        !bit_reader.ReadBits(2, recovery_point.changing_slice_group_idc)) {
        return std::nullopt;
    }
    return recovery_point;
}

// Private methods
bool SeiParser::ReadPayloadValue(BitReader& bit_reader, uint32_t& value) {
    value = 0;
    uint8_t byte = 0;
    size_t ff_byte_count = 0;
    do {
        if (!bit_reader.ReadByte(byte) || ++ff_byte_count > kMaxFFBytes) {
            return false;
        }
        value += byte;
    } while (byte == 0xFF);
    return true;
}
    
} // namespace h264
} // namespace avcparse
