#include "avcparse/h264/access_unit_assembler.hpp"
#include "avcparse/h264/stream_builder_unittest_helper.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {

std::vector<NaluType> TypesOf(const AccessUnit& access_unit) {
    std::vector<NaluType> types;
    for (const auto& nalu : access_unit.nalus()) {
        types.push_back(nalu.type());
    }
    return types;
}

} // namespace

class T(AccessUnitAssemblerTest) : public ::testing::Test {
public:
    T(AccessUnitAssemblerTest)() {}
    ~T(AccessUnitAssemblerTest)() override {}

    void Recreate(AccessUnitAssembler::Configuration config) {
        assembler_ = std::make_unique<AccessUnitAssembler>(config);
        assembler_->OnError([this](const ParseError& error){
            reported_errors_.push_back(error);
        });
    }

    // Inserts `nalu`, the completed access unit, if any, is collected.
    void Insert(const BinaryBuffer& nalu, bool trailing_fragment = false) {
        auto completed = assembler_->Insert(StreamBuilder::ToNalUnit(nalu, next_offset_), trailing_fragment);
        next_offset_ += nalu.size() + kNaluLongStartSequenceSize;
        if (completed) {
            access_units_.push_back(std::move(*completed));
        }
    }

    void Flush() {
        for (auto& access_unit : assembler_->Flush()) {
            access_units_.push_back(std::move(access_unit));
        }
    }

    void InsertParameterSets() {
        Insert(StreamBuilder::Sps(0));
        Insert(StreamBuilder::Pps(0, 0));
    }

protected:
    std::unique_ptr<AccessUnitAssembler> assembler_;
    std::vector<AccessUnit> access_units_;
    std::vector<ParseError> reported_errors_;
    size_t next_offset_ = 0;
};

MY_TEST_F(AccessUnitAssemblerTest, KeyframeThenPredictedFrame) {
    Recreate(AccessUnitAssembler::Configuration());
    EXPECT_EQ(AccessUnitAssembler::State::AWAITING_FIRST_VCL, assembler_->state());
    Insert(StreamBuilder::Aud());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    EXPECT_EQ(AccessUnitAssembler::State::ACCUMULATING, assembler_->state());
    EXPECT_TRUE(access_units_.empty());

    Insert(StreamBuilder::Aud());
    ASSERT_EQ(1u, access_units_.size());
    EXPECT_EQ(AccessUnitAssembler::State::AWAITING_FIRST_VCL, assembler_->state());
    Insert(StreamBuilder::P(1));
    Flush();
    ASSERT_EQ(2u, access_units_.size());

    const AccessUnit& idr = access_units_[0];
    EXPECT_THAT(TypesOf(idr), testing::ElementsAre(NaluType::AUD, NaluType::SPS, NaluType::PPS, NaluType::IDR));
    EXPECT_EQ(AccessUnitKind::IDR, idr.kind());
    EXPECT_TRUE(idr.is_keyframe());
    EXPECT_TRUE(idr.errors().empty());
    EXPECT_EQ(1u, idr.vcl_count());
    EXPECT_EQ(0u, idr.stream_offset().value_or(1));
    ASSERT_NE(nullptr, idr.sps());
    EXPECT_EQ(320u, idr.sps()->width);
    EXPECT_EQ(240u, idr.sps()->height);
    ASSERT_NE(nullptr, idr.pps());
    ASSERT_NE(nullptr, idr.first_slice_header());
    EXPECT_TRUE(idr.first_slice_header()->fully_parsed);
    EXPECT_EQ(SliceType::I, idr.first_slice_header()->slice_type);
    ASSERT_NE(nullptr, idr.nalus()[1].sps());
    ASSERT_NE(nullptr, idr.nalus()[2].pps());

    const AccessUnit& predicted = access_units_[1];
    EXPECT_THAT(TypesOf(predicted), testing::ElementsAre(NaluType::AUD, NaluType::SLICE));
    EXPECT_EQ(AccessUnitKind::NON_IDR, predicted.kind());
    EXPECT_FALSE(predicted.is_keyframe());
    EXPECT_EQ(1u, predicted.first_slice_header()->frame_num);
    EXPECT_TRUE(reported_errors_.empty());
}

MY_TEST_F(AccessUnitAssemblerTest, SlicesOfOnePicture) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr(0, 0));
    Insert(StreamBuilder::Idr(0, 150));
    Insert(StreamBuilder::P(1, 0));
    Insert(StreamBuilder::P(1, 100));
    Insert(StreamBuilder::P(1, 200));
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    EXPECT_EQ(2u, access_units_[0].vcl_count());
    EXPECT_EQ(3u, access_units_[1].vcl_count());
}

MY_TEST_F(AccessUnitAssemblerTest, NewPictureDetection) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Pps(1, 0));
    // idr_pic_id differs.
    Insert(StreamBuilder::Idr(0));
    Insert(StreamBuilder::Idr(1));
    // IdrPicFlag differs.
    Insert(StreamBuilder::P(0));
    // nal_ref_idc becomes zero, same frame_num.
    Insert(StreamBuilder::P(0, 0, 0));
    // frame_num differs.
    Insert(StreamBuilder::P(1, 0, 0));
    // pic_order_cnt_lsb differs.
    StreamBuilder::Slice slice;
    slice.nal_ref_idc = 0;
    slice.frame_num = 1;
    slice.pic_order_cnt_lsb = 7;
    Insert(StreamBuilder::SliceNalu(slice));
    // pic_parameter_set_id differs.
    slice.pps_id = 1;
    Insert(StreamBuilder::SliceNalu(slice));
    Flush();
    ASSERT_EQ(7u, access_units_.size());
    for (const auto& access_unit : access_units_) {
        EXPECT_EQ(1u, access_unit.vcl_count());
        EXPECT_TRUE(access_unit.errors().empty());
    }
    EXPECT_EQ(1u, access_units_[6].pps()->id);
}

MY_TEST_F(AccessUnitAssemblerTest, RedundantPictureStaysWithPrimary) {
    Recreate(AccessUnitAssembler::Configuration());
    Insert(StreamBuilder::Sps(0));
    Insert(StreamBuilder::Pps(0, 0, true));
    StreamBuilder::Slice slice;
    slice.frame_num = 1;
    slice.has_redundant_pic_cnt = true;
    Insert(StreamBuilder::SliceNalu(slice));
    // A redundant picture differing from the primary one.
    slice.redundant_pic_cnt = 1;
    slice.nal_ref_idc = 0;
    slice.pic_order_cnt_lsb = 4;
    Insert(StreamBuilder::SliceNalu(slice));
    slice.redundant_pic_cnt = 0;
    slice.frame_num = 2;
    Insert(StreamBuilder::SliceNalu(slice));
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    EXPECT_EQ(2u, access_units_[0].vcl_count());
    EXPECT_EQ(1u, access_units_[1].vcl_count());
}

MY_TEST_F(AccessUnitAssemblerTest, UnresolvedParameterSet) {
    Recreate(AccessUnitAssembler::Configuration());
    StreamBuilder::Slice slice;
    slice.pps_id = 5;
    Insert(StreamBuilder::SliceNalu(slice));
    slice.first_mb_in_slice = 50;
    Insert(StreamBuilder::SliceNalu(slice));
    // Only the leading fields are known: first_mb_in_slice 0 starts a picture.
    slice.first_mb_in_slice = 0;
    Insert(StreamBuilder::SliceNalu(slice));
    Flush();

    ASSERT_EQ(2u, access_units_.size());
    EXPECT_EQ(2u, access_units_[0].vcl_count());
    EXPECT_EQ(1u, access_units_[1].vcl_count());
    ASSERT_EQ(2u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::UNRESOLVED_PARAMETER_SET, access_units_[0].errors()[0].code);
    EXPECT_EQ(nullptr, access_units_[0].pps());
    ASSERT_NE(nullptr, access_units_[0].first_slice_header());
    EXPECT_FALSE(access_units_[0].first_slice_header()->fully_parsed);
    EXPECT_EQ(5u, access_units_[0].first_slice_header()->pic_parameter_set_id);
    EXPECT_EQ(3u, reported_errors_.size());
}

MY_TEST_F(AccessUnitAssemblerTest, PpsBeforeItsSps) {
    Recreate(AccessUnitAssembler::Configuration());
    Insert(StreamBuilder::Pps(0, 2));
    EXPECT_NE(nullptr, assembler_->pps(0));
    Insert(StreamBuilder::Idr());
    // Resolved once the SPS is there.
    Insert(StreamBuilder::Sps(2));
    Insert(StreamBuilder::P(1));
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    ASSERT_EQ(1u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::UNRESOLVED_PARAMETER_SET, access_units_[0].errors()[0].code);
    // The PPS resolved, its SPS did not.
    ASSERT_NE(nullptr, access_units_[0].pps());
    EXPECT_EQ(2u, access_units_[0].pps()->sps_id);
    EXPECT_EQ(nullptr, access_units_[0].sps());
    EXPECT_FALSE(access_units_[0].first_slice_header()->fully_parsed);
    EXPECT_TRUE(access_units_[1].errors().empty());
    ASSERT_NE(nullptr, access_units_[1].sps());
    EXPECT_EQ(2u, access_units_[1].sps()->id);
}

MY_TEST_F(AccessUnitAssemblerTest, EndOfSequenceTrailsPicture) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    Insert(StreamBuilder::EndOfSequence());
    EXPECT_TRUE(access_units_.empty());
    EXPECT_EQ(AccessUnitAssembler::State::AWAITING_FIRST_VCL, assembler_->state());
    Insert(StreamBuilder::Idr(1));
    ASSERT_EQ(1u, access_units_.size());
    EXPECT_THAT(TypesOf(access_units_[0]), 
                testing::ElementsAre(NaluType::SPS, NaluType::PPS, NaluType::IDR, NaluType::END_OF_SEQUENCE));

    Insert(StreamBuilder::EndOfSequence());
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    EXPECT_THAT(TypesOf(access_units_[1]), testing::ElementsAre(NaluType::IDR, NaluType::END_OF_SEQUENCE));
}

MY_TEST_F(AccessUnitAssemblerTest, RecoveryPoint) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::RecoveryPointSei(0));
    Insert(StreamBuilder::P(4));
    Insert(StreamBuilder::RecoveryPointSei(3));
    Insert(StreamBuilder::P(5));
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, access_units_[0].kind());
    EXPECT_TRUE(access_units_[0].is_keyframe());
    EXPECT_EQ(0u, access_units_[0].recovery_frame_cnt().value_or(99));
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, access_units_[1].kind());
    EXPECT_FALSE(access_units_[1].is_keyframe());
    EXPECT_EQ(3u, access_units_[1].recovery_frame_cnt().value_or(99));
}

MY_TEST_F(AccessUnitAssemblerTest, RecoveryPointKeyframesDisabled) {
    AccessUnitAssembler::Configuration config;
    config.keyframe_on_recovery_point = false;
    Recreate(config);
    InsertParameterSets();
    Insert(StreamBuilder::RecoveryPointSei(0));
    Insert(StreamBuilder::P(4));
    Insert(StreamBuilder::RecoveryPointSei(0));
    Insert(StreamBuilder::Idr());
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, access_units_[0].kind());
    EXPECT_FALSE(access_units_[0].is_keyframe());
    // IDR wins over the recovery point.
    EXPECT_EQ(AccessUnitKind::IDR, access_units_[1].kind());
    EXPECT_TRUE(access_units_[1].is_keyframe());
}

MY_TEST_F(AccessUnitAssemblerTest, ParameterSetSnapshots) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    // Redefined with another size.
    Insert(StreamBuilder::Sps(0, 40, 30));
    Insert(StreamBuilder::Pps(0, 0));
    Insert(StreamBuilder::Idr(1));
    Flush();
    ASSERT_EQ(2u, access_units_.size());
    ASSERT_NE(nullptr, access_units_[0].sps());
    EXPECT_EQ(320u, access_units_[0].sps()->width);
    ASSERT_NE(nullptr, access_units_[1].sps());
    EXPECT_EQ(640u, access_units_[1].sps()->width);
    EXPECT_EQ(480u, assembler_->sps(0)->height);
}

MY_TEST_F(AccessUnitAssemblerTest, TruncatedTrailingFragment) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    // Only the header of a slice made it.
    Insert({0x41}, true);
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    EXPECT_EQ(3u, access_units_[0].nalus().size());
    ASSERT_EQ(1u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::TRUNCATED_INPUT, access_units_[0].errors()[0].code);
}

MY_TEST_F(AccessUnitAssemblerTest, MalformedUnitsAreKept) {
    Recreate(AccessUnitAssembler::Configuration());
    // profile_idc only.
    Insert({0x67, 0x42});
    Insert(StreamBuilder::Idr());
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    EXPECT_EQ(2u, access_units_[0].nalus().size());
    ASSERT_EQ(2u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::MALFORMED_SPS, access_units_[0].errors()[0].code);
    EXPECT_EQ(ErrorCode::UNRESOLVED_PARAMETER_SET, access_units_[0].errors()[1].code);
    EXPECT_EQ(nullptr, assembler_->sps(0));
}

MY_TEST_F(AccessUnitAssemblerTest, TruncatedSei) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    // A recovery point SEI claiming 8 bytes of payload.
    Insert({0x06, 0x06, 0x08, 0x84, 0x80});
    Insert(StreamBuilder::Idr());
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    ASSERT_EQ(1u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::TRUNCATED_SEI, access_units_[0].errors()[0].code);
    EXPECT_EQ(AccessUnitKind::IDR, access_units_[0].kind());
}

MY_TEST_F(AccessUnitAssemblerTest, ForbiddenBit) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert({0x89, 0xF0});
    Insert(StreamBuilder::Idr());
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    ASSERT_EQ(1u, access_units_[0].errors().size());
    EXPECT_EQ(ErrorCode::INVALID_HEADER, access_units_[0].errors()[0].code);
}

MY_TEST_F(AccessUnitAssemblerTest, ForbiddenBitReportedWithItsAccessUnit) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    // An AUD closing the picture before it.
    Insert({0x89, 0xF0});
    Insert(StreamBuilder::P(1));
    // A slice starting a new picture.
    BinaryBuffer slice = StreamBuilder::P(2);
    slice[0] |= 0x80;
    Insert(slice);
    // End of sequence, then end of stream trailing the closed picture.
    Insert({0x8A});
    Insert({0x8B});
    Flush();

    ASSERT_EQ(3u, access_units_.size());
    EXPECT_TRUE(access_units_[0].errors().empty());
    EXPECT_EQ(NaluType::IDR, access_units_[0].nalus().back().type());

    EXPECT_EQ(NaluType::AUD, access_units_[1].nalus().front().type());
    EXPECT_THAT(access_units_[1].errors(), testing::ElementsAre(
        testing::Field(&ParseError::code, ErrorCode::INVALID_HEADER)));
    EXPECT_EQ(access_units_[1].nalus().front().stream_offset(), access_units_[1].errors()[0].offset);

    EXPECT_THAT(TypesOf(access_units_[2]), 
                testing::ElementsAre(NaluType::SLICE, NaluType::END_OF_SEQUENCE, NaluType::END_OF_STREAM));
    ASSERT_EQ(3u, access_units_[2].errors().size());
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(ErrorCode::INVALID_HEADER, access_units_[2].errors()[i].code);
        EXPECT_EQ(access_units_[2].nalus()[i].stream_offset(), access_units_[2].errors()[i].offset);
    }
    EXPECT_EQ(4u, reported_errors_.size());
}

MY_TEST_F(AccessUnitAssemblerTest, NonVclUnitsFlushedAlone) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    EXPECT_FALSE(access_units_[0].has_vcl());
    EXPECT_EQ(2u, access_units_[0].nalus().size());
    EXPECT_EQ(nullptr, access_units_[0].first_slice_header());

    // Nothing left.
    Flush();
    EXPECT_EQ(1u, access_units_.size());
}

MY_TEST_F(AccessUnitAssemblerTest, ReleaseRbsp) {
    AccessUnitAssembler::Configuration config;
    config.keep_rbsp = false;
    Recreate(config);
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    Flush();
    ASSERT_EQ(1u, access_units_.size());
    for (const auto& nalu : access_units_[0].nalus()) {
        EXPECT_TRUE(nalu.rbsp().empty());
        EXPECT_FALSE(nalu.payload().empty());
    }
    EXPECT_NE(nullptr, access_units_[0].first_slice_header());
}

MY_TEST_F(AccessUnitAssemblerTest, Reset) {
    Recreate(AccessUnitAssembler::Configuration());
    InsertParameterSets();
    Insert(StreamBuilder::Idr());
    assembler_->Reset();
    EXPECT_EQ(nullptr, assembler_->sps(0));
    EXPECT_EQ(nullptr, assembler_->pps(0));
    EXPECT_EQ(AccessUnitAssembler::State::AWAITING_FIRST_VCL, assembler_->state());
    Flush();
    EXPECT_TRUE(access_units_.empty());
}

MY_TEST(AccessUnitTest, ToAnnexB) {
    AccessUnit access_unit;
    const BinaryBuffer aud = StreamBuilder::Aud();
    const BinaryBuffer sps = StreamBuilder::Sps(0);
    const BinaryBuffer idr = StreamBuilder::Idr();
    access_unit.AddNalUnit(NalUnit(aud.data(), aud.size(), 0, 3));
    access_unit.AddNalUnit(NalUnit(sps.data(), sps.size(), 5, 3));
    access_unit.AddNalUnit(NalUnit(idr.data(), idr.size(), 20, 3));

    BinaryBuffer expected = {0x00, 0x00, 0x00, 0x01};
    expected.insert(expected.end(), aud.begin(), aud.end());
    expected.insert(expected.end(), {0x00, 0x00, 0x00, 0x01});
    expected.insert(expected.end(), sps.begin(), sps.end());
    expected.insert(expected.end(), {0x00, 0x00, 0x01});
    expected.insert(expected.end(), idr.begin(), idr.end());
    EXPECT_EQ(expected, access_unit.ToAnnexB());
    EXPECT_EQ(0u, access_unit.stream_offset().value_or(1));
}

} // namespace test
} // namespace avcparse
