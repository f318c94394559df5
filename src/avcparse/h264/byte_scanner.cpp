#include "avcparse/h264/byte_scanner.hpp"

#include <algorithm>
#include <string>

namespace avcparse {
namespace h264 {
namespace {
// Below that, compaction waits for half of the buffer to be consumed.
constexpr size_t kMinCompactionSize = 64 * 1024;
} // namespace

ByteScanner::ByteScanner(size_t max_buffer_size) 
    : max_buffer_size_(max_buffer_size) {}

ByteScanner::~ByteScanner() = default;

void ByteScanner::Append(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    buffer_.insert(buffer_.end(), data, data + size);
    Scan();
}

std::optional<ByteScanner::ScanResult> ByteScanner::Next() {
    if (results_.empty()) {
        return std::nullopt;
    }
    ScanResult result = std::move(results_.front());
    results_.pop_front();
    return result;
}

std::optional<NaluIndex> ByteScanner::FlushTail() {
    const size_t end = stream_size();
    std::optional<NaluIndex> tail;
    if (open_payload_offset_) {
        const size_t payload_offset = *open_payload_offset_;
        size_t payload_end = TrimTrailingZeros(payload_offset, end);
        if (payload_end > payload_offset) {
            tail = NaluIndex{open_start_offset_, payload_offset, payload_end - payload_offset};
        } else {
            results_.push_back(ParseError{ErrorCode::TRUNCATED_INPUT, 
                                          open_start_offset_, 
                                          "start sequence without NAL unit at end of stream"});
        }
        open_payload_offset_.reset();
    } else if (leading_garbage_ || HasNonZeroByte(std::max(leading_offset_, base_offset_), end)) {
        results_.push_back(ParseError{ErrorCode::MALFORMED_START_CODE, 
                                      leading_offset_, 
                                      "no start sequence in " + std::to_string(end - leading_offset_) + " bytes"});
    }
    // Data pushed after the flush starts a new stream.
    leading_offset_ = end;
    leading_garbage_ = false;
    scan_offset_ = end;
    return tail;
}

ArrayView<const uint8_t> ByteScanner::View(const NaluIndex& index) const {
    if (index.payload_start_offset < base_offset_ || 
        index.payload_start_offset + index.payload_size > stream_size()) {
        return ArrayView<const uint8_t>();
    }
    return ArrayView<const uint8_t>(buffer_.data() + (index.payload_start_offset - base_offset_), 
                                    index.payload_size);
}

void ByteScanner::Compact() {
    const size_t end = stream_size();
    // One byte before the resume position is needed to tell a 4-byte start sequence.
    size_t keep_from = open_payload_offset_ ? *open_payload_offset_ 
                                            : std::min(scan_offset_, end);
    keep_from = keep_from > base_offset_ ? keep_from - 1 : base_offset_;
    for (const auto& result : results_) {
        if (const auto* index = std::get_if<NaluIndex>(&result)) {
            keep_from = std::min(keep_from, index->start_offset);
            break;
        }
    }
    if (keep_from <= base_offset_) {
        return;
    }
    const size_t drop_count = keep_from - base_offset_;
    if (drop_count < kMinCompactionSize && drop_count < buffer_.size() / 2) {
        return;
    }
    if (!open_payload_offset_ && 
        HasNonZeroByte(std::max(leading_offset_, base_offset_), keep_from)) {
        leading_garbage_ = true;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + drop_count);
    base_offset_ = keep_from;
}

void ByteScanner::Reset() {
    buffer_.clear();
    base_offset_ = 0;
    scan_offset_ = 0;
    open_payload_offset_.reset();
    open_start_offset_ = 0;
    leading_offset_ = 0;
    leading_garbage_ = false;
    overflowed_ = false;
    results_.clear();
}

// Private methods
void ByteScanner::Scan() {
    // This is sorta like Boyer-Moore, but with only the first optimization step:
    // given a 3-byte sequence we are looking at, if the 3rd byte isn't 1 or 0, skip
    // ahead to the next 3-byte sequence. 0 and 1 are relatively rare, so this will
    // skip the majority of reads/checks.
    const size_t end = stream_size();
    size_t i = std::max(scan_offset_, base_offset_);
    while (i + 2 < end) {
        const uint8_t third = ByteAt(i + 2);
        if (third > 1) {
            i += 3;
        } else if (third == 1) {
            if (ByteAt(i + 1) == 0 && ByteAt(i) == 0) {
                OnStartSequence(i);
            }
            i += 3;
        } else {
            ++i;
        }
    }
    scan_offset_ = i;

    const size_t pending_offset = open_payload_offset_ ? *open_payload_offset_ : leading_offset_;
    if (end - std::min(pending_offset, end) > max_buffer_size_) {
        overflowed_ = true;
    }
}

void ByteScanner::OnStartSequence(size_t offset) {
    // The lower bound of the bytes which can belong to this start sequence.
    const size_t lower_bound = std::max(base_offset_, open_payload_offset_ ? *open_payload_offset_ 
                                                                            : leading_offset_);
    size_t start_offset = offset;
    if (offset > lower_bound && ByteAt(offset - 1) == 0) {
        // zero_byte of a 4-byte start sequence.
        --start_offset;
    }

    if (open_payload_offset_) {
        const size_t payload_offset = *open_payload_offset_;
        // Drops trailing_zero_8bits.
        const size_t payload_end = TrimTrailingZeros(payload_offset, start_offset);
        if (payload_end > payload_offset) {
            results_.push_back(NaluIndex{open_start_offset_, payload_offset, payload_end - payload_offset});
        } else {
            results_.push_back(ParseError{ErrorCode::MALFORMED_START_CODE, 
                                          open_start_offset_, 
                                          "empty NAL unit"});
        }
    } else if (leading_garbage_ || HasNonZeroByte(lower_bound, start_offset)) {
        results_.push_back(ParseError{ErrorCode::MALFORMED_START_CODE, 
                                      leading_offset_, 
                                      "skipped " + std::to_string(start_offset - leading_offset_) + 
                                      " bytes before the first start sequence"});
        leading_garbage_ = false;
    }

    open_start_offset_ = start_offset;
    open_payload_offset_ = offset + kNaluShortStartSequenceSize;
}

size_t ByteScanner::TrimTrailingZeros(size_t begin, size_t end) const {
    while (end > begin && ByteAt(end - 1) == 0) {
        --end;
    }
    return end;
}

bool ByteScanner::HasNonZeroByte(size_t begin, size_t end) const {
    for (size_t offset = begin; offset < end; ++offset) {
        if (ByteAt(offset) != 0) {
            return true;
        }
    }
    return false;
}
    
} // namespace h264
} // namespace avcparse
