#include "avcparse/h264/sei_parser.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {

MY_TEST(SeiParserTest, RecoveryPoint) {
    // payloadType 6, payloadSize 1, recovery_frame_cnt 0, exact_match_flag 1,
    // broken_link_flag 0, changing_slice_group_idc 0 and the payload
    // trailing bits, then rbsp_trailing_bits.
    const uint8_t rbsp[] = {0x06, 0x01, 0xC4, 0x80};
    std::vector<SeiMessage> messages;
    ASSERT_TRUE(SeiParser::ParseSei(rbsp, sizeof(rbsp), messages));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ(SeiMessage::RECOVERY_POINT, messages[0].payload_type);
    EXPECT_THAT(messages[0].payload, testing::ElementsAre(0xC4));
    ASSERT_TRUE(messages[0].recovery_point.has_value());
    EXPECT_EQ(0u, messages[0].recovery_point->recovery_frame_cnt);
    EXPECT_TRUE(messages[0].recovery_point->exact_match_flag);
    EXPECT_FALSE(messages[0].recovery_point->broken_link_flag);
    EXPECT_EQ(0u, messages[0].recovery_point->changing_slice_group_idc);
}

MY_TEST(SeiParserTest, RecoveryPointWithFrameCount) {
    // recovery_frame_cnt 5: 00110, exact_match_flag 1, broken_link_flag 0,
    // changing_slice_group_idc 0.
    const uint8_t payload[] = {0x34, 0x40};
    auto recovery_point = SeiParser::ParseRecoveryPoint(payload, sizeof(payload));
    ASSERT_TRUE(recovery_point.has_value());
    EXPECT_EQ(5u, recovery_point->recovery_frame_cnt);
    EXPECT_TRUE(recovery_point->exact_match_flag);

    EXPECT_FALSE(SeiParser::ParseRecoveryPoint(payload, 0).has_value());
}

MY_TEST(SeiParserTest, MultipleMessages) {
    std::vector<uint8_t> rbsp;
    // user_data_unregistered with a 16 byte uuid and 2 bytes of data.
    rbsp.push_back(0x05);
    rbsp.push_back(18);
    for (uint8_t i = 0; i < 16; ++i) {
        rbsp.push_back(0xA0 + i);
    }
    rbsp.push_back('h');
    rbsp.push_back('i');
    // pic_timing, 2 bytes.
    rbsp.push_back(0x01);
    rbsp.push_back(0x02);
    rbsp.push_back(0x12);
    rbsp.push_back(0x34);
    rbsp.push_back(0x80);

    std::vector<SeiMessage> messages;
    ASSERT_TRUE(SeiParser::ParseSei(rbsp.data(), rbsp.size(), messages));
    ASSERT_EQ(2u, messages.size());
    EXPECT_EQ(SeiMessage::USER_DATA_UNREGISTERED, messages[0].payload_type);
    ASSERT_TRUE(messages[0].uuid.has_value());
    EXPECT_EQ(0xA0, (*messages[0].uuid)[0]);
    EXPECT_EQ(0xAF, (*messages[0].uuid)[15]);
    EXPECT_EQ(18u, messages[0].payload.size());
    EXPECT_FALSE(messages[0].recovery_point.has_value());
    EXPECT_EQ(SeiMessage::PIC_TIMING, messages[1].payload_type);
    EXPECT_THAT(messages[1].payload, testing::ElementsAre(0x12, 0x34));
    EXPECT_FALSE(messages[1].uuid.has_value());
}

MY_TEST(SeiParserTest, ExtendedPayloadTypeAndSize) {
    std::vector<uint8_t> rbsp;
    // payloadType 255 + 255 + 10 = 520.
    rbsp.push_back(0xFF);
    rbsp.push_back(0xFF);
    rbsp.push_back(10);
    // payloadSize 255 + 1 = 256.
    rbsp.push_back(0xFF);
    rbsp.push_back(0x01);
    rbsp.insert(rbsp.end(), 256, 0x11);
    rbsp.push_back(0x80);

    std::vector<SeiMessage> messages;
    ASSERT_TRUE(SeiParser::ParseSei(rbsp.data(), rbsp.size(), messages));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ(520u, messages[0].payload_type);
    EXPECT_EQ(256u, messages[0].payload.size());
}

MY_TEST(SeiParserTest, TruncatedMessageKeepsPreviousOnes) {
    // A complete pic_timing, then a recovery point claiming 8 bytes.
    const uint8_t rbsp[] = {0x01, 0x01, 0x55, 0x06, 0x08, 0x84, 0x80};
    std::vector<SeiMessage> messages;
    EXPECT_FALSE(SeiParser::ParseSei(rbsp, sizeof(rbsp), messages));
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ(SeiMessage::PIC_TIMING, messages[0].payload_type);
}

MY_TEST(SeiParserTest, TruncatedPayloadType) {
    const uint8_t rbsp[] = {0xFF, 0xFF};
    std::vector<SeiMessage> messages;
    EXPECT_FALSE(SeiParser::ParseSei(rbsp, sizeof(rbsp), messages));
    EXPECT_TRUE(messages.empty());
}

MY_TEST(SeiParserTest, EmptySei) {
    const uint8_t rbsp[] = {0x80};
    std::vector<SeiMessage> messages;
    EXPECT_TRUE(SeiParser::ParseSei(rbsp, sizeof(rbsp), messages));
    EXPECT_TRUE(messages.empty());
}

} // namespace test
} // namespace avcparse
