#include "avcparse/h264/annexb_parser.hpp"
#include "avcparse/common/logger.hpp"

#include <string>

namespace avcparse {
namespace h264 {

AnnexBParser::AnnexBParser() 
    : AnnexBParser(Configuration()) {}

AnnexBParser::AnnexBParser(Configuration config) 
    : config_(config),
      scanner_(config.max_buffer_size),
      assembler_(AccessUnitAssembler::Configuration{config.keyframe_on_recovery_point, config.keep_rbsp}) {
    assembler_.OnError([this](const ParseError& error){
        if (error_callback_) {
            error_callback_(error);
        }
    });
}

AnnexBParser::~AnnexBParser() = default;

void AnnexBParser::Push(const uint8_t* data, size_t size) {
    scanner_.Append(data, size);
}

void AnnexBParser::Push(ArrayView<const uint8_t> data) {
    Push(data.data(), data.size());
}

std::optional<AccessUnit> AnnexBParser::NextAccessUnit() {
    if (!ready_access_units_.empty()) {
        return PopReady();
    }
    CheckOverflow();
    ProcessScanResults();
    scanner_.Compact();
    return PopReady();
}

std::optional<AccessUnit> AnnexBParser::Flush() {
    if (!ready_access_units_.empty()) {
        return PopReady();
    }
    CheckOverflow();
    ProcessScanResults();
    auto tail = scanner_.FlushTail();
    // Errors found in the tail come before it.
    ProcessScanResults();
    if (tail) {
        ProcessNalu(*tail, /*trailing_fragment=*/true);
    }
    for (auto& access_unit : assembler_.Flush()) {
        ready_access_units_.push_back(std::move(access_unit));
    }
    scanner_.Compact();
    return PopReady();
}

void AnnexBParser::Reset() {
    scanner_.Reset();
    assembler_.Reset();
    ready_access_units_.clear();
}

void AnnexBParser::OnError(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

std::shared_ptr<const SpsParser::SpsState> AnnexBParser::sps(uint32_t id) const {
    return assembler_.sps(id);
}

std::shared_ptr<const PpsParser::PpsState> AnnexBParser::pps(uint32_t id) const {
    return assembler_.pps(id);
}

// Private methods
void AnnexBParser::CheckOverflow() {
    if (!scanner_.overflowed()) {
        return;
    }
    ParseError error{ErrorCode::BUFFER_OVERFLOW, 
                     scanner_.stream_size(), 
                     "no start sequence found in more than " + std::to_string(config_.max_buffer_size) + " bytes"};
    PLOG_ERROR << error;
    Reset();
    throw ParseException(std::move(error));
}

void AnnexBParser::ProcessScanResults() {
    while (auto result = scanner_.Next()) {
        if (const auto* index = std::get_if<NaluIndex>(&*result)) {
            ProcessNalu(*index, /*trailing_fragment=*/false);
        } else {
            // Framing errors belong to no access unit.
            ReportError(std::get<ParseError>(*result));
        }
    }
}

void AnnexBParser::ProcessNalu(const NaluIndex& index, bool trailing_fragment) {
    ArrayView<const uint8_t> bytes = scanner_.View(index);
    NalUnit nalu(bytes.data(), bytes.size(), index.start_offset, index.start_sequence_size());
    auto completed = assembler_.Insert(std::move(nalu), trailing_fragment);
    if (completed) {
        ready_access_units_.push_back(std::move(*completed));
    }
}

void AnnexBParser::ReportError(const ParseError& error) {
    PLOG_WARNING << error;
    if (error_callback_) {
        error_callback_(error);
    }
}

std::optional<AccessUnit> AnnexBParser::PopReady() {
    if (ready_access_units_.empty()) {
        return std::nullopt;
    }
    AccessUnit access_unit = std::move(ready_access_units_.front());
    ready_access_units_.pop_front();
    return access_unit;
}
    
} // namespace h264
} // namespace avcparse
