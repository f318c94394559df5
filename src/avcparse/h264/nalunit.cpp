#include "avcparse/h264/nalunit.hpp"

namespace avcparse {
namespace h264 {
namespace {
constexpr uint8_t kForbiddenBitMask = 0x80;
constexpr uint8_t kNriMask = 0x60;
constexpr uint8_t kTypeMask = 0x1F;
constexpr uint8_t kEmulationByte = 0x03;
} // namespace

NalUnit::NalUnit() 
    : stream_offset_(0),
      start_sequence_size_(kNaluLongStartSequenceSize) {}

NalUnit::NalUnit(const uint8_t* buffer, 
                 size_t size, 
                 size_t stream_offset, 
                 size_t start_sequence_size) 
    : BinaryBuffer(buffer, buffer + size),
      stream_offset_(stream_offset),
      start_sequence_size_(start_sequence_size) {
    if (size > 1) {
        rbsp_ = RetrieveRbspFromEbsp(buffer + 1, size - 1);
    }
}

NalUnit::NalUnit(const NalUnit&) = default;
NalUnit::NalUnit(NalUnit&&) = default;
NalUnit::~NalUnit() = default;
NalUnit& NalUnit::operator=(const NalUnit&) = default;
NalUnit& NalUnit::operator=(NalUnit&&) = default;

bool NalUnit::forbidden_bit() const {
    return !empty() && (at(0) & kForbiddenBitMask) != 0;
}

uint8_t NalUnit::nri() const {
    return empty() ? 0 : (at(0) & kNriMask) >> 5;
}

uint8_t NalUnit::unit_type() const {
    return empty() ? 0 : at(0) & kTypeMask;
}

NaluType NalUnit::type() const {
    return ToNaluType(unit_type());
}

bool NalUnit::is_vcl() const {
    return IsVcl(type());
}

ArrayView<const uint8_t> NalUnit::payload() const {
    if (size() <= 1) {
        return ArrayView<const uint8_t>();
    }
    return ArrayView<const uint8_t>(data() + 1, size() - 1);
}

ArrayView<const uint8_t> NalUnit::rbsp() const {
    return ArrayView<const uint8_t>(rbsp_);
}

void NalUnit::ReleaseRbsp() {
    BinaryBuffer().swap(rbsp_);
}

void NalUnit::set_syntax(Syntax syntax) {
    syntax_ = std::move(syntax);
}

const SliceHeader* NalUnit::slice_header() const {
    return std::get_if<SliceHeader>(&syntax_);
}

const SpsParser::SpsState* NalUnit::sps() const {
    return std::get_if<SpsParser::SpsState>(&syntax_);
}

const PpsParser::PpsState* NalUnit::pps() const {
    return std::get_if<PpsParser::PpsState>(&syntax_);
}

const std::vector<SeiMessage>* NalUnit::sei_messages() const {
    return std::get_if<std::vector<SeiMessage>>(&syntax_);
}

std::vector<uint8_t> NalUnit::RetrieveRbspFromEbsp(const uint8_t* ebsp_buffer, size_t ebsp_size) {
    std::vector<uint8_t> rbsp_buffer;
    rbsp_buffer.reserve(ebsp_size);
    for (size_t i = 0; i < ebsp_size;) {
        if (ebsp_size - i >= 3 && 
            ebsp_buffer[i] == 0x00 && 
            ebsp_buffer[i + 1] == 0x00 && 
            ebsp_buffer[i + 2] == kEmulationByte &&
            (ebsp_size - i == 3 || ebsp_buffer[i + 3] <= kEmulationByte)) {
            // Two RBSP bytes
            rbsp_buffer.push_back(ebsp_buffer[i++]);
            rbsp_buffer.push_back(ebsp_buffer[i++]);
            // Skip the emulation byte.
            i++;
        } else {
            // Single RBSP byte.
            rbsp_buffer.push_back(ebsp_buffer[i++]);
        }
    }
    return rbsp_buffer;
}

void NalUnit::WriteRbsp(const uint8_t* rbsp_buffer, size_t rbsp_size, std::vector<uint8_t>& ebsp_buffer) {
    static const uint8_t kZerosInStartSequence = 2;
    size_t num_consecutive_zeros = 0;
    ebsp_buffer.reserve(ebsp_buffer.size() + rbsp_size);

    for (size_t i = 0; i < rbsp_size; ++i) {
        uint8_t byte = rbsp_buffer[i];
        // Insert emulation byte to escape.
        if (byte <= kEmulationByte &&
            num_consecutive_zeros >= kZerosInStartSequence) {
            ebsp_buffer.push_back(kEmulationByte);
            num_consecutive_zeros = 0;
        }
        ebsp_buffer.push_back(byte);
        if (byte == 0) {
            ++num_consecutive_zeros;
        } else {
            num_consecutive_zeros = 0;
        }
    }
    // Trailing cabac_zero_words are closed by an emulation byte, otherwise
    // they would be taken for trailing_zero_8bits of the byte stream.
    if (num_consecutive_zeros >= kZerosInStartSequence) {
        ebsp_buffer.push_back(kEmulationByte);
    }
}
    
} // namespace h264
} // namespace avcparse
