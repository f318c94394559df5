#ifndef _AVCPARSE_BASE_PARSE_ERROR_H_
#define _AVCPARSE_BASE_PARSE_ERROR_H_

#include "avcparse/base/defines.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace avcparse {

enum class ErrorCode {
    // Not enough bytes to finish a NAL unit, only reported at end of stream.
    TRUNCATED_INPUT,
    // Bytes which can not be framed by a start code were skipped.
    MALFORMED_START_CODE,
    // Exp-Golomb leading zero overrun or bits exhausted in the middle of a syntax element.
    MALFORMED_CODE,
    MALFORMED_SPS,
    MALFORMED_PPS,
    // A slice refers to a PPS (or a PPS to an SPS) which was never decoded successfully.
    UNRESOLVED_PARAMETER_SET,
    TRUNCATED_SEI,
    // forbidden_zero_bit is set, warning only.
    INVALID_HEADER,
    // Too many bytes buffered without any start code, fatal.
    BUFFER_OVERFLOW
};

AVCPARSE_CPP_EXPORT const char* ToString(ErrorCode code);

struct AVCPARSE_CPP_EXPORT ParseError {
    ErrorCode code = ErrorCode::TRUNCATED_INPUT;
    // Offset in the input stream of the start code preceding the NAL unit,
    // or of the first offending byte for errors raised by the scanner.
    size_t offset = 0;
    std::string detail;
};

AVCPARSE_CPP_EXPORT std::ostream& operator<<(std::ostream& out, const ParseError& error);

// Thrown for conditions which abort the whole stream.
class AVCPARSE_CPP_EXPORT ParseException : public std::runtime_error {
public:
    explicit ParseException(ParseError error);

    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

} // namespace avcparse

#endif
