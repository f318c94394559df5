#include "avcparse/h264/byte_scanner.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "testing/unittest_defines.hpp"

using namespace avcparse::h264;

namespace avcparse {
namespace test {
namespace {

struct ScannedNalu {
    size_t start_offset;
    size_t payload_start_offset;
    std::vector<uint8_t> bytes;
};

struct ScanOutput {
    std::vector<ScannedNalu> nalus;
    std::vector<ParseError> errors;
};

void Drain(ByteScanner& scanner, ScanOutput& output) {
    while (auto result = scanner.Next()) {
        if (const auto* index = std::get_if<NaluIndex>(&*result)) {
            auto view = scanner.View(*index);
            output.nalus.push_back({index->start_offset, 
                                    index->payload_start_offset, 
                                    std::vector<uint8_t>(view.begin(), view.end())});
        } else {
            output.errors.push_back(std::get<ParseError>(*result));
        }
    }
}

ScanOutput Scan(const std::vector<uint8_t>& stream, size_t chunk_size) {
    ByteScanner scanner;
    ScanOutput output;
    for (size_t offset = 0; offset < stream.size(); offset += chunk_size) {
        scanner.Append(stream.data() + offset, std::min(chunk_size, stream.size() - offset));
        Drain(scanner, output);
        scanner.Compact();
    }
    auto tail = scanner.FlushTail();
    Drain(scanner, output);
    if (tail) {
        auto view = scanner.View(*tail);
        output.nalus.push_back({tail->start_offset, 
                                tail->payload_start_offset, 
                                std::vector<uint8_t>(view.begin(), view.end())});
    }
    return output;
}

} // namespace

MY_TEST(ByteScannerTest, MixedStartSequences) {
    const std::vector<uint8_t> stream = {0x00, 0x00, 0x00, 0x01, 0x67, 0xAA, 
                                         0x00, 0x00, 0x01, 0x68, 0xBB};
    ScanOutput output = Scan(stream, stream.size());
    EXPECT_TRUE(output.errors.empty());
    ASSERT_EQ(2u, output.nalus.size());
    EXPECT_EQ(0u, output.nalus[0].start_offset);
    EXPECT_EQ(4u, output.nalus[0].payload_start_offset);
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x67, 0xAA));
    EXPECT_EQ(6u, output.nalus[1].start_offset);
    EXPECT_EQ(9u, output.nalus[1].payload_start_offset);
    EXPECT_THAT(output.nalus[1].bytes, testing::ElementsAre(0x68, 0xBB));
}

MY_TEST(ByteScannerTest, TrailingZerosAreTrimmed) {
    const std::vector<uint8_t> stream = {0x00, 0x00, 0x01, 0x65, 0x88, 
                                         0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x41, 0x99, 
                                         0x00, 0x00};
    ScanOutput output = Scan(stream, stream.size());
    EXPECT_TRUE(output.errors.empty());
    ASSERT_EQ(2u, output.nalus.size());
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x65, 0x88));
    // The zero byte right before 00 00 01 belongs to the start sequence.
    EXPECT_EQ(7u, output.nalus[1].start_offset);
    EXPECT_EQ(11u, output.nalus[1].payload_start_offset);
    EXPECT_THAT(output.nalus[1].bytes, testing::ElementsAre(0x41, 0x99));
}

MY_TEST(ByteScannerTest, LeadingZerosAreSilent) {
    const std::vector<uint8_t> stream = {0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x09, 0xF0};
    ScanOutput output = Scan(stream, stream.size());
    EXPECT_TRUE(output.errors.empty());
    ASSERT_EQ(1u, output.nalus.size());
    EXPECT_EQ(2u, output.nalus[0].start_offset);
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x09, 0xF0));
}

MY_TEST(ByteScannerTest, GarbageBeforeFirstStartSequence) {
    const std::vector<uint8_t> stream = {0xAA, 0xBB, 0x00, 0x00, 0x01, 0x65, 0x88};
    ScanOutput output = Scan(stream, stream.size());
    ASSERT_EQ(1u, output.errors.size());
    EXPECT_EQ(ErrorCode::MALFORMED_START_CODE, output.errors[0].code);
    EXPECT_EQ(0u, output.errors[0].offset);
    ASSERT_EQ(1u, output.nalus.size());
    EXPECT_EQ(2u, output.nalus[0].start_offset);
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x65, 0x88));
}

MY_TEST(ByteScannerTest, NoStartSequence) {
    const std::vector<uint8_t> stream = {0xAA, 0xBB, 0xCC, 0x00, 0x00};
    ScanOutput output = Scan(stream, stream.size());
    EXPECT_TRUE(output.nalus.empty());
    ASSERT_EQ(1u, output.errors.size());
    EXPECT_EQ(ErrorCode::MALFORMED_START_CODE, output.errors[0].code);
}

MY_TEST(ByteScannerTest, EmptyInput) {
    ScanOutput output = Scan({}, 1);
    EXPECT_TRUE(output.nalus.empty());
    EXPECT_TRUE(output.errors.empty());

    output = Scan({0x00, 0x00, 0x00}, 1);
    EXPECT_TRUE(output.nalus.empty());
    EXPECT_TRUE(output.errors.empty());
}

MY_TEST(ByteScannerTest, StartSequenceAtEndOfStream) {
    const std::vector<uint8_t> stream = {0x00, 0x00, 0x01, 0x65, 0x00, 0x00, 0x01};
    ScanOutput output = Scan(stream, stream.size());
    ASSERT_EQ(1u, output.nalus.size());
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x65));
    ASSERT_EQ(1u, output.errors.size());
    EXPECT_EQ(ErrorCode::TRUNCATED_INPUT, output.errors[0].code);
    EXPECT_EQ(4u, output.errors[0].offset);
}

MY_TEST(ByteScannerTest, EmptyNalUnit) {
    const std::vector<uint8_t> stream = {0x00, 0x00, 0x01, 0x00, 0x00, 0x01, 0x65};
    ScanOutput output = Scan(stream, stream.size());
    ASSERT_EQ(1u, output.errors.size());
    EXPECT_EQ(ErrorCode::MALFORMED_START_CODE, output.errors[0].code);
    EXPECT_EQ(0u, output.errors[0].offset);
    ASSERT_EQ(1u, output.nalus.size());
    EXPECT_THAT(output.nalus[0].bytes, testing::ElementsAre(0x65));
}

MY_TEST(ByteScannerTest, RangeReportedOnlyWhenTerminated) {
    ByteScanner scanner;
    const uint8_t first[] = {0x00, 0x00, 0x00, 0x01, 0x67, 0x42, 0x00};
    scanner.Append(first, sizeof(first));
    EXPECT_FALSE(scanner.Next());
    const uint8_t second[] = {0x00};
    scanner.Append(second, sizeof(second));
    EXPECT_FALSE(scanner.Next());
    const uint8_t third[] = {0x01, 0x68};
    scanner.Append(third, sizeof(third));
    auto result = scanner.Next();
    ASSERT_TRUE(result);
    ASSERT_TRUE(std::holds_alternative<NaluIndex>(*result));
    auto index = std::get<NaluIndex>(*result);
    EXPECT_EQ(4u, index.start_sequence_size());
    EXPECT_EQ(2u, index.payload_size);
    EXPECT_FALSE(scanner.Next());
}

MY_TEST(ByteScannerTest, ChunkingDoesNotChangeResult) {
    std::vector<uint8_t> stream = {0x12, 0x00, 0x00, 0x00, 0x01, 0x67, 0x64, 0x00, 0x00, 0x03, 0x01};
    for (int i = 0; i < 40; ++i) {
        stream.push_back(static_cast<uint8_t>(i * 37));
    }
    const uint8_t tail[] = {0x00, 0x00, 0x01, 0x68, 0xEE, 0x00, 0x00, 0x00, 0x01, 0x65, 
                            0x88, 0x00, 0x00, 0x01, 0x41, 0x00, 0x00, 0x00};
    stream.insert(stream.end(), std::begin(tail), std::end(tail));

    ScanOutput whole = Scan(stream, stream.size());
    EXPECT_EQ(1u, whole.errors.size());
    EXPECT_FALSE(whole.nalus.empty());
    for (size_t chunk_size : {1u, 2u, 3u, 5u, 7u, 13u}) {
        ScanOutput chunked = Scan(stream, chunk_size);
        ASSERT_EQ(whole.nalus.size(), chunked.nalus.size()) << "chunk size " << chunk_size;
        for (size_t i = 0; i < whole.nalus.size(); ++i) {
            EXPECT_EQ(whole.nalus[i].start_offset, chunked.nalus[i].start_offset);
            EXPECT_EQ(whole.nalus[i].payload_start_offset, chunked.nalus[i].payload_start_offset);
            EXPECT_EQ(whole.nalus[i].bytes, chunked.nalus[i].bytes);
        }
        ASSERT_EQ(whole.errors.size(), chunked.errors.size()) << "chunk size " << chunk_size;
        for (size_t i = 0; i < whole.errors.size(); ++i) {
            EXPECT_EQ(whole.errors[i].code, chunked.errors[i].code);
            EXPECT_EQ(whole.errors[i].offset, chunked.errors[i].offset);
        }
    }
}

MY_TEST(ByteScannerTest, OffsetsSurviveCompaction) {
    ByteScanner scanner;
    std::vector<uint8_t> first = {0x00, 0x00, 0x01, 0x65};
    first.insert(first.end(), 100, 0xAA);
    const uint8_t next[] = {0x00, 0x00, 0x01, 0x41, 0xBB};
    first.insert(first.end(), std::begin(next), std::end(next));
    scanner.Append(first.data(), first.size());

    auto result = scanner.Next();
    ASSERT_TRUE(result);
    auto index = std::get<NaluIndex>(*result);
    EXPECT_EQ(0u, index.start_offset);
    EXPECT_EQ(101u, index.payload_size);

    scanner.Compact();
    EXPECT_LT(scanner.buffered_size(), first.size());
    EXPECT_EQ(first.size(), scanner.stream_size());

    const uint8_t last[] = {0x00, 0x00, 0x01, 0x42, 0xCC};
    scanner.Append(last, sizeof(last));
    result = scanner.Next();
    ASSERT_TRUE(result);
    index = std::get<NaluIndex>(*result);
    EXPECT_EQ(104u, index.start_offset);
    EXPECT_EQ(107u, index.payload_start_offset);
    EXPECT_THAT(scanner.View(index), testing::ElementsAre(0x41, 0xBB));

    auto tail = scanner.FlushTail();
    ASSERT_TRUE(tail);
    EXPECT_EQ(109u, tail->start_offset);
    EXPECT_THAT(scanner.View(*tail), testing::ElementsAre(0x42, 0xCC));
}

MY_TEST(ByteScannerTest, Overflow) {
    ByteScanner scanner(16);
    const uint8_t start[] = {0x00, 0x00, 0x01, 0x65};
    scanner.Append(start, sizeof(start));
    std::vector<uint8_t> body(16, 0xAA);
    scanner.Append(body.data(), body.size());
    EXPECT_TRUE(scanner.overflowed());

    scanner.Reset();
    EXPECT_FALSE(scanner.overflowed());
    EXPECT_EQ(0u, scanner.buffered_size());
    scanner.Append(body.data(), 8);
    EXPECT_FALSE(scanner.overflowed());
    scanner.Append(body.data(), 9);
    EXPECT_TRUE(scanner.overflowed());
}
    
} // namespace test
} // namespace avcparse
