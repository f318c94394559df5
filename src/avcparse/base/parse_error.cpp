#include "avcparse/base/parse_error.hpp"

#include <sstream>

namespace avcparse {
namespace {

std::string Describe(const ParseError& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

} // namespace

const char* ToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::TRUNCATED_INPUT:
        return "TruncatedInput";
    case ErrorCode::MALFORMED_START_CODE:
        return "MalformedStartCode";
    case ErrorCode::MALFORMED_CODE:
        return "MalformedCode";
    case ErrorCode::MALFORMED_SPS:
        return "MalformedSps";
    case ErrorCode::MALFORMED_PPS:
        return "MalformedPps";
    case ErrorCode::UNRESOLVED_PARAMETER_SET:
        return "UnresolvedParameterSet";
    case ErrorCode::TRUNCATED_SEI:
        return "TruncatedSei";
    case ErrorCode::INVALID_HEADER:
        return "InvalidHeader";
    case ErrorCode::BUFFER_OVERFLOW:
        return "BufferOverflow";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, const ParseError& error) {
    out << ToString(error.code) << " at offset " << error.offset;
    if (!error.detail.empty()) {
        out << ": " << error.detail;
    }
    return out;
}

ParseException::ParseException(ParseError error) 
    : std::runtime_error(Describe(error)),
      error_(std::move(error)) {}

} // namespace avcparse
