#include "avcparse/h264/annexb_parser.hpp"
#include "avcparse/h264/stream_builder_unittest_helper.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

#include <algorithm>

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {

struct ParseResult {
    std::vector<AccessUnit> access_units;
    std::vector<ParseError> errors;
};

// Pushes `stream` in chunks of `chunk_size` bytes, draining the parser after
// every chunk, then flushes it.
ParseResult Parse(const BinaryBuffer& stream, 
                  size_t chunk_size, 
                  AnnexBParser::Configuration config = AnnexBParser::Configuration()) {
    ParseResult result;
    AnnexBParser parser(config);
    parser.OnError([&result](const ParseError& error){
        result.errors.push_back(error);
    });
    for (size_t offset = 0; offset < stream.size(); offset += chunk_size) {
        parser.Push(stream.data() + offset, std::min(chunk_size, stream.size() - offset));
        while (auto access_unit = parser.NextAccessUnit()) {
            result.access_units.push_back(std::move(*access_unit));
        }
    }
    while (auto access_unit = parser.Flush()) {
        result.access_units.push_back(std::move(*access_unit));
    }
    return result;
}

std::vector<ErrorCode> CodesOf(const std::vector<ParseError>& errors) {
    std::vector<ErrorCode> codes;
    for (const auto& error : errors) {
        codes.push_back(error.code);
    }
    return codes;
}

BinaryBuffer MixedStream() {
    StreamBuilder::Slice unresolved;
    unresolved.pps_id = 5;
    unresolved.frame_num = 3;
    StreamBuilder builder;
    builder.AddBytes({0x00, 0x00})
           .Add(StreamBuilder::Aud())
           .Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr(0, 0))
           .Add(StreamBuilder::Idr(0, 150), kNaluShortStartSequenceSize)
           .AddBytes({0x00, 0x00, 0x00})
           .Add(StreamBuilder::Aud())
           .Add(StreamBuilder::P(1), kNaluShortStartSequenceSize)
           .Add(StreamBuilder::RecoveryPointSei(0))
           .Add(StreamBuilder::P(2, 0, 0), kNaluShortStartSequenceSize)
           // Refers to an unknown PPS.
           .Add(StreamBuilder::SliceNalu(unresolved))
           .Add(StreamBuilder::EndOfSequence())
           .Add(StreamBuilder::Idr(1))
           // Header only, cut by the end of the stream.
           .Add({0x21});
    return builder.stream();
}

} // namespace

MY_TEST(AnnexBParserTest, AccessUnitsOfStream) {
    StreamBuilder builder;
    builder.Add(StreamBuilder::Aud())
           .Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr())
           .Add(StreamBuilder::Aud())
           .Add(StreamBuilder::P(1))
           .Add(StreamBuilder::P(2));

    AnnexBParser parser;
    parser.Push(builder.stream().data(), builder.stream().size());
    auto access_unit = parser.NextAccessUnit();
    ASSERT_TRUE(access_unit);
    EXPECT_EQ(AccessUnitKind::IDR, access_unit->kind());
    EXPECT_EQ(4u, access_unit->nalus().size());
    // P(2) is not terminated yet.
    EXPECT_FALSE(parser.NextAccessUnit());

    access_unit = parser.Flush();
    ASSERT_TRUE(access_unit);
    EXPECT_EQ(2u, access_unit->nalus().size());
    EXPECT_EQ(1u, access_unit->first_slice_header()->frame_num);
    access_unit = parser.Flush();
    ASSERT_TRUE(access_unit);
    EXPECT_EQ(1u, access_unit->nalus().size());
    EXPECT_EQ(2u, access_unit->first_slice_header()->frame_num);
    EXPECT_FALSE(parser.Flush());
    EXPECT_NE(nullptr, parser.sps(0));
    EXPECT_NE(nullptr, parser.pps(0));
}

MY_TEST(AnnexBParserTest, ChunkingDoesNotChangeResult) {
    const BinaryBuffer stream = MixedStream();
    const ParseResult expected = Parse(stream, stream.size());
    ASSERT_EQ(5u, expected.access_units.size());
    EXPECT_EQ(AccessUnitKind::IDR, expected.access_units[0].kind());
    EXPECT_EQ(2u, expected.access_units[0].vcl_count());
    EXPECT_EQ(AccessUnitKind::NON_IDR, expected.access_units[1].kind());
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, expected.access_units[2].kind());
    EXPECT_TRUE(expected.access_units[2].is_keyframe());
    EXPECT_TRUE(expected.access_units[2].errors().empty());
    EXPECT_EQ(AccessUnitKind::NON_IDR, expected.access_units[3].kind());
    EXPECT_EQ(NaluType::END_OF_SEQUENCE, expected.access_units[3].nalus().back().type());
    EXPECT_THAT(CodesOf(expected.access_units[3].errors()), 
                testing::ElementsAre(ErrorCode::UNRESOLVED_PARAMETER_SET));
    EXPECT_EQ(AccessUnitKind::IDR, expected.access_units[4].kind());
    EXPECT_THAT(CodesOf(expected.access_units[4].errors()), 
                testing::ElementsAre(ErrorCode::TRUNCATED_INPUT));
    EXPECT_THAT(CodesOf(expected.errors), 
                testing::ElementsAre(ErrorCode::UNRESOLVED_PARAMETER_SET, ErrorCode::TRUNCATED_INPUT));

    for (size_t chunk_size : {1, 2, 3, 4, 5, 7, 16, 61}) {
        SCOPED_TRACE(chunk_size);
        const ParseResult result = Parse(stream, chunk_size);
        ASSERT_EQ(expected.access_units.size(), result.access_units.size());
        for (size_t i = 0; i < result.access_units.size(); ++i) {
            const AccessUnit& lhs = expected.access_units[i];
            const AccessUnit& rhs = result.access_units[i];
            EXPECT_EQ(lhs.ToAnnexB(), rhs.ToAnnexB());
            EXPECT_EQ(lhs.kind(), rhs.kind());
            EXPECT_EQ(lhs.is_keyframe(), rhs.is_keyframe());
            EXPECT_EQ(lhs.stream_offset(), rhs.stream_offset());
            EXPECT_EQ(CodesOf(lhs.errors()), CodesOf(rhs.errors()));
        }
        EXPECT_EQ(CodesOf(expected.errors), CodesOf(result.errors));
    }
}

MY_TEST(AnnexBParserTest, StreamOffsets) {
    StreamBuilder builder;
    builder.AddBytes({0x00})
           .Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0), kNaluShortStartSequenceSize)
           .Add(StreamBuilder::Idr())
           .Add(StreamBuilder::P(1), kNaluShortStartSequenceSize);
    const ParseResult result = Parse(builder.stream(), 3);
    ASSERT_EQ(2u, result.access_units.size());

    std::vector<size_t> offsets;
    std::vector<size_t> start_sequence_sizes;
    for (const auto& access_unit : result.access_units) {
        for (const auto& nalu : access_unit.nalus()) {
            offsets.push_back(nalu.stream_offset());
            start_sequence_sizes.push_back(nalu.start_sequence_size());
        }
    }
    EXPECT_EQ(builder.nalu_offsets(), offsets);
    EXPECT_THAT(start_sequence_sizes, testing::ElementsAre(4u, 3u, 4u, 3u));
    EXPECT_EQ(1u, result.access_units[0].stream_offset().value_or(0));
    EXPECT_EQ(builder.nalu_offsets()[3], result.access_units[1].stream_offset().value_or(0));
}

MY_TEST(AnnexBParserTest, ShortStartSequencesAreKept) {
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr(0, 0), kNaluShortStartSequenceSize)
           .Add(StreamBuilder::Idr(0, 150), kNaluShortStartSequenceSize);
    const ParseResult result = Parse(builder.stream(), builder.stream().size());
    ASSERT_EQ(1u, result.access_units.size());
    EXPECT_EQ(builder.stream(), result.access_units[0].ToAnnexB());
}

MY_TEST(AnnexBParserTest, ParameterSetsRedefinedMidStream) {
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr(0))
           .Add(StreamBuilder::Sps(0, 40, 30))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr(1));
    const ParseResult result = Parse(builder.stream(), 10);
    ASSERT_EQ(2u, result.access_units.size());
    EXPECT_EQ(320u, result.access_units[0].sps()->width);
    EXPECT_EQ(240u, result.access_units[0].sps()->height);
    EXPECT_EQ(640u, result.access_units[1].sps()->width);
    EXPECT_EQ(480u, result.access_units[1].sps()->height);
    EXPECT_TRUE(result.errors.empty());
}

MY_TEST(AnnexBParserTest, RecoveryPointKeyframes) {
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::RecoveryPointSei(0))
           .Add(StreamBuilder::P(3));

    const ParseResult enabled = Parse(builder.stream(), 8);
    ASSERT_EQ(1u, enabled.access_units.size());
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, enabled.access_units[0].kind());
    EXPECT_TRUE(enabled.access_units[0].is_keyframe());

    AnnexBParser::Configuration config;
    config.keyframe_on_recovery_point = false;
    const ParseResult disabled = Parse(builder.stream(), 8, config);
    ASSERT_EQ(1u, disabled.access_units.size());
    EXPECT_EQ(AccessUnitKind::RECOVERY_POINT, disabled.access_units[0].kind());
    EXPECT_FALSE(disabled.access_units[0].is_keyframe());
}

MY_TEST(AnnexBParserTest, GarbageBeforeFirstStartSequence) {
    StreamBuilder builder;
    builder.AddBytes({0xDE, 0xAD, 0xBE, 0xEF})
           .Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr());
    const ParseResult result = Parse(builder.stream(), 2);
    ASSERT_EQ(1u, result.errors.size());
    EXPECT_EQ(ErrorCode::MALFORMED_START_CODE, result.errors[0].code);
    EXPECT_EQ(0u, result.errors[0].offset);
    // Framing errors belong to no access unit.
    ASSERT_EQ(1u, result.access_units.size());
    EXPECT_TRUE(result.access_units[0].errors().empty());
    EXPECT_EQ(4u, result.access_units[0].stream_offset().value_or(0));
}

MY_TEST(AnnexBParserTest, StartSequenceAtEndOfStream) {
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr())
           .AddBytes({0x00, 0x00, 0x01});
    const ParseResult result = Parse(builder.stream(), 5);
    ASSERT_EQ(1u, result.access_units.size());
    EXPECT_TRUE(result.access_units[0].errors().empty());
    ASSERT_EQ(1u, result.errors.size());
    EXPECT_EQ(ErrorCode::TRUNCATED_INPUT, result.errors[0].code);
    EXPECT_EQ(builder.stream().size() - 3, result.errors[0].offset);
}

MY_TEST(AnnexBParserTest, BufferOverflow) {
    AnnexBParser::Configuration config;
    config.max_buffer_size = 64;
    AnnexBParser parser(config);
    const BinaryBuffer garbage(100, 0xAB);
    parser.Push(garbage.data(), garbage.size());
    try {
        parser.NextAccessUnit();
        FAIL() << "ParseException expected.";
    } catch (const ParseException& exception) {
        EXPECT_EQ(ErrorCode::BUFFER_OVERFLOW, exception.error().code);
    }
    EXPECT_EQ(0u, parser.buffered_size());

    // Usable again afterwards.
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(StreamBuilder::Pps(0, 0))
           .Add(StreamBuilder::Idr());
    parser.Push(builder.stream().data(), builder.stream().size());
    EXPECT_FALSE(parser.NextAccessUnit());
    auto access_unit = parser.Flush();
    ASSERT_TRUE(access_unit);
    EXPECT_TRUE(access_unit->is_keyframe());
    EXPECT_TRUE(access_unit->errors().empty());
}

MY_TEST(AnnexBParserTest, OversizedNalUnit) {
    AnnexBParser::Configuration config;
    config.max_buffer_size = 64;
    AnnexBParser parser(config);
    StreamBuilder builder;
    builder.Add(StreamBuilder::Sps(0))
           .Add(BinaryBuffer(80, 0x65));
    parser.Push(builder.stream().data(), builder.stream().size());
    EXPECT_THROW(parser.NextAccessUnit(), ParseException);
    EXPECT_EQ(nullptr, parser.sps(0));
}

MY_TEST(AnnexBParserTest, ParameterSetsSurviveFlush) {
    StreamBuilder first;
    first.Add(StreamBuilder::Sps(0))
         .Add(StreamBuilder::Pps(0, 0))
         .Add(StreamBuilder::Idr());
    StreamBuilder second;
    second.Add(StreamBuilder::P(1));

    AnnexBParser parser;
    parser.Push(ArrayView<const uint8_t>(first.stream()));
    ASSERT_TRUE(parser.Flush());
    EXPECT_FALSE(parser.Flush());

    parser.Push(ArrayView<const uint8_t>(second.stream()));
    auto access_unit = parser.Flush();
    ASSERT_TRUE(access_unit);
    EXPECT_TRUE(access_unit->errors().empty());
    ASSERT_NE(nullptr, access_unit->sps());
    EXPECT_EQ(first.stream().size(), access_unit->stream_offset().value_or(0));

    parser.Reset();
    EXPECT_EQ(nullptr, parser.sps(0));
    EXPECT_EQ(nullptr, parser.pps(0));
}

MY_TEST(AnnexBParserTest, EmptyStream) {
    AnnexBParser parser;
    EXPECT_FALSE(parser.NextAccessUnit());
    EXPECT_FALSE(parser.Flush());
    const BinaryBuffer zeros(10, 0x00);
    parser.Push(zeros.data(), zeros.size());
    EXPECT_FALSE(parser.NextAccessUnit());
    EXPECT_FALSE(parser.Flush());
}

} // namespace test
} // namespace avcparse
