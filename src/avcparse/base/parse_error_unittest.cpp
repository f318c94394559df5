#include "avcparse/base/parse_error.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

#include <sstream>

namespace avcparse {
namespace test {

MY_TEST(ParseErrorTest, DefaultInitialized) {
    ParseError error;
    EXPECT_EQ(ErrorCode::TRUNCATED_INPUT, error.code);
    EXPECT_EQ(0u, error.offset);
    EXPECT_TRUE(error.detail.empty());
}

MY_TEST(ParseErrorTest, Print) {
    std::ostringstream oss;
    oss << ParseError{ErrorCode::MALFORMED_SPS, 42, "failed to parse SPS"};
    EXPECT_EQ("MalformedSps at offset 42: failed to parse SPS", oss.str());

    oss.str("");
    oss << ParseError{ErrorCode::INVALID_HEADER, 7, ""};
    EXPECT_EQ("InvalidHeader at offset 7", oss.str());
}

MY_TEST(ParseErrorTest, Exception) {
    try {
        throw ParseException(ParseError{ErrorCode::BUFFER_OVERFLOW, 1024, "no start sequence"});
    } catch (const std::runtime_error& exception) {
        EXPECT_STREQ("BufferOverflow at offset 1024: no start sequence", exception.what());
        const auto* parse_exception = dynamic_cast<const ParseException*>(&exception);
        ASSERT_NE(nullptr, parse_exception);
        EXPECT_EQ(ErrorCode::BUFFER_OVERFLOW, parse_exception->error().code);
        EXPECT_EQ(1024u, parse_exception->error().offset);
    }
}

} // namespace test
} // namespace avcparse
