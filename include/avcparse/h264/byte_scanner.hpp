#ifndef _AVCPARSE_H264_BYTE_SCANNER_H_
#define _AVCPARSE_H264_BYTE_SCANNER_H_

#include "avcparse/base/defines.hpp"
#include "avcparse/base/parse_error.hpp"
#include "avcparse/common/array_view.hpp"
#include "avcparse/h264/common.hpp"

#include <deque>
#include <optional>
#include <variant>
#include <vector>

namespace avcparse {
namespace h264 {

// Splits an Annex B byte stream, pushed in chunks of any size, into NAL unit
// ranges. A range is only reported once the start sequence following it has 
// been seen, or at end of stream. All offsets are stream offsets, counted from
// the first byte ever appended, so they survive the buffer compaction.
class AVCPARSE_CPP_EXPORT ByteScanner {
public:
    static constexpr size_t kDefaultMaxBufferSize = 16 * 1024 * 1024;

    using ScanResult = std::variant<NaluIndex, ParseError>;
public:
    explicit ByteScanner(size_t max_buffer_size = kDefaultMaxBufferSize);
    ~ByteScanner();

    void Append(const uint8_t* data, size_t size);

    // Pops the next terminated range or scanning error, in stream order.
    std::optional<ScanResult> Next();

    // Ends the stream: returns the unterminated trailing range, if any. Errors
    // found in the tail are queued to Next().
    std::optional<NaluIndex> FlushTail();

    // The NALU bytes of `index`, header included. Valid until the next Compact().
    ArrayView<const uint8_t> View(const NaluIndex& index) const;

    // Drops the bytes no pending or queued range refers to.
    void Compact();

    // More than `max_buffer_size` bytes are retained since the last start sequence.
    bool overflowed() const { return overflowed_; }
    size_t buffered_size() const { return buffer_.size(); }
    size_t stream_size() const { return base_offset_ + buffer_.size(); }

    void Reset();

private:
    void Scan();
    void OnStartSequence(size_t offset);
    size_t TrimTrailingZeros(size_t begin, size_t end) const;
    bool HasNonZeroByte(size_t begin, size_t end) const;
    uint8_t ByteAt(size_t offset) const { return buffer_[offset - base_offset_]; }

private:
    const size_t max_buffer_size_;
    BinaryBuffer buffer_;
    // Stream offset of buffer_[0].
    size_t base_offset_ = 0;
    // Stream offset the scanning resumes from.
    size_t scan_offset_ = 0;
    // The NALU whose end is not known yet.
    std::optional<size_t> open_payload_offset_;
    size_t open_start_offset_ = 0;
    // Start of the bytes waiting for the first start sequence.
    size_t leading_offset_ = 0;
    // Some of those bytes were non-zero and compacted away already.
    bool leading_garbage_ = false;
    bool overflowed_ = false;
    std::deque<ScanResult> results_;

    DISALLOW_COPY_AND_ASSIGN(ByteScanner);
};
    
} // namespace h264
} // namespace avcparse

#endif
