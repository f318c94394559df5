#include "avcparse/base/defines.hpp"

#include <gtest/gtest.h>

#include "testing/unittest_defines.hpp"

#include <string>
#include <variant>

namespace avcparse {
namespace test {

MY_TEST(DefinesTest, OverloadedVisitor) {
    using Value = std::variant<std::monostate, int, std::string>;
    auto describe = [](const Value& value) {
        return std::visit(utils::overloaded {
            [](const std::monostate&) { return std::string("none"); },
            [](int number) { return "int " + std::to_string(number); },
            [](const std::string& text) { return "string " + text; }
        }, value);
    };
    EXPECT_EQ("none", describe(Value()));
    EXPECT_EQ("int 3", describe(Value(3)));
    EXPECT_EQ("string sps", describe(Value(std::string("sps"))));
}

} // namespace test
} // namespace avcparse
