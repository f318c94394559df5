#include "avcparse/h264/nalunit.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {

namespace {
constexpr uint8_t kPacket[] = {
    0x6F, 0x12, 0x34, 0x56,
    0x78, 0x9a, 0x21, 0x22,
    0x23, 0x24};
constexpr size_t kPacketSize = sizeof(kPacket);

} // namespace

MY_TEST(NalUnitTest, Parse) {
    NalUnit nalu(kPacket, kPacketSize, 100, 3);

    EXPECT_FALSE(nalu.forbidden_bit());
    EXPECT_EQ(0x03, nalu.nri());
    EXPECT_EQ(0x0F, nalu.unit_type());
    EXPECT_EQ(NaluType::SUBSET_SPS, nalu.type());
    EXPECT_FALSE(nalu.is_vcl());
    EXPECT_EQ(100u, nalu.stream_offset());
    EXPECT_EQ(3u, nalu.start_sequence_size());

    EXPECT_THAT(nalu, testing::ElementsAreArray(kPacket));
    EXPECT_THAT(nalu.payload(), testing::ElementsAreArray(&kPacket[1], kPacketSize - 1));
    EXPECT_THAT(nalu.rbsp(), testing::ElementsAreArray(&kPacket[1], kPacketSize - 1));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(nalu.syntax()));
}

MY_TEST(NalUnitTest, HeaderOnly) {
    const uint8_t buffer[] = {0x89};
    NalUnit nalu(buffer, 1);
    EXPECT_TRUE(nalu.forbidden_bit());
    EXPECT_EQ(0x00, nalu.nri());
    EXPECT_EQ(NaluType::AUD, nalu.type());
    EXPECT_TRUE(nalu.payload().empty());
    EXPECT_TRUE(nalu.rbsp().empty());
}

MY_TEST(NalUnitTest, VclTypes) {
    for (uint8_t type = 0; type < 32; ++type) {
        const uint8_t header = 0x40 | type;
        NalUnit nalu(&header, 1);
        EXPECT_EQ(type >= 1 && type <= 5, nalu.is_vcl()) << "type " << int(type);
    }
}

MY_TEST(NalUnitTest, ReleaseRbsp) {
    const uint8_t buffer[] = {0x65, 0x00, 0x00, 0x03, 0x01, 0x88};
    NalUnit nalu(buffer, sizeof(buffer));
    EXPECT_THAT(nalu.rbsp(), testing::ElementsAre(0x00, 0x00, 0x01, 0x88));
    nalu.ReleaseRbsp();
    EXPECT_TRUE(nalu.rbsp().empty());
    EXPECT_EQ(sizeof(buffer), nalu.size());
}

MY_TEST(NalUnitTest, RetrieveRbspFromEbsp) {
    uint8_t ebsp_buffer_1[] = {0x00, 0x00, 0x03, 0x01};
    uint8_t ebsp_buffer_2[] = {0x00, 0x00, 0x03, 0x02};
    uint8_t ebsp_buffer_3[] = {0x00, 0x00, 0x03, 0x03};

    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_1, 4), testing::ElementsAre(0x00, 0x00, 0x01));
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_2, 4), testing::ElementsAre(0x00, 0x00, 0x02));
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_3, 4), testing::ElementsAre(0x00, 0x00, 0x03));
}

MY_TEST(NalUnitTest, RetrieveRbspKeepsNonEmulationBytes) {
    // 0x03 followed by a byte above 0x03 is data.
    uint8_t ebsp_buffer_1[] = {0x00, 0x00, 0x03, 0x04};
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_1, 4), testing::ElementsAre(0x00, 0x00, 0x03, 0x04));

    // Not preceded by two zeros.
    uint8_t ebsp_buffer_2[] = {0x00, 0x01, 0x03, 0x01, 0x03};
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_2, 5), testing::ElementsAre(0x00, 0x01, 0x03, 0x01, 0x03));

    // An emulation byte ending the unit is dropped.
    uint8_t ebsp_buffer_3[] = {0x11, 0x00, 0x00, 0x03};
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_3, 4), testing::ElementsAre(0x11, 0x00, 0x00));

    // Zeros after an emulation byte start counting again.
    uint8_t ebsp_buffer_4[] = {0x00, 0x00, 0x03, 0x00, 0x00, 0x03, 0x00};
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp_buffer_4, 7), testing::ElementsAre(0x00, 0x00, 0x00, 0x00, 0x00));
}

MY_TEST(NalUnitTest, WriteRbsp) {
    const uint8_t rbsp[] = {0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x04};
    std::vector<uint8_t> ebsp;
    NalUnit::WriteRbsp(rbsp, sizeof(rbsp), ebsp);
    EXPECT_THAT(ebsp, testing::ElementsAre(0x00, 0x00, 0x03, 0x01, 0x00, 0x00, 0x03, 0x00, 0x00, 0x04));
    EXPECT_EQ(NalUnit::RetrieveRbspFromEbsp(ebsp.data(), ebsp.size()), 
              std::vector<uint8_t>(rbsp, rbsp + sizeof(rbsp)));
}

MY_TEST(NalUnitTest, WriteRbspClosesTrailingZeros) {
    const uint8_t rbsp[] = {0x80, 0x00, 0x00};
    std::vector<uint8_t> ebsp;
    NalUnit::WriteRbsp(rbsp, sizeof(rbsp), ebsp);
    EXPECT_THAT(ebsp, testing::ElementsAre(0x80, 0x00, 0x00, 0x03));
    EXPECT_THAT(NalUnit::RetrieveRbspFromEbsp(ebsp.data(), ebsp.size()), testing::ElementsAre(0x80, 0x00, 0x00));
}

MY_TEST(NalUnitTest, Syntax) {
    const uint8_t buffer[] = {0x06, 0x80};
    NalUnit nalu(buffer, sizeof(buffer));
    EXPECT_EQ(nullptr, nalu.sei_messages());
    nalu.set_syntax(std::vector<SeiMessage>(2));
    ASSERT_NE(nullptr, nalu.sei_messages());
    EXPECT_EQ(2u, nalu.sei_messages()->size());
    EXPECT_EQ(nullptr, nalu.slice_header());
    EXPECT_EQ(nullptr, nalu.sps());
    EXPECT_EQ(nullptr, nalu.pps());

    NalUnit copied = nalu;
    ASSERT_NE(nullptr, copied.sei_messages());
    EXPECT_EQ(2u, copied.sei_messages()->size());
}
    
} // namespace test
} // namespace avcparse
