// =============================================================================
// fastx-io - Quality Offset Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "fastxio/algo/quality_offset.h"
#include "fastxio/io/fastq_codec.h"
#include "test_utils.h"

namespace fastxio::algo::test {

using fastxio::test::tempFilePath;
using fastxio::test::TempFileGuard;
using fastxio::test::writeGzipFile;
using fastxio::test::writeTextFile;

namespace {

std::optional<int> offsetOf(std::string_view content) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, content);
    return inferQualityOffset(path);
}

std::string record(std::string_view id, std::string_view residues, std::string_view quality) {
    return fmt::format("@{}\n{}\n+\n{}\n", id, residues, quality);
}

}  // namespace

// =============================================================================
// QualityHistogram
// =============================================================================

TEST(QualityHistogramTest, CountsCodesInRange) {
    QualityHistogram histogram;
    EXPECT_TRUE(histogram.empty());
    EXPECT_TRUE(histogram.add(kMinQualityCode));
    EXPECT_TRUE(histogram.add(kMaxQualityCode));
    EXPECT_TRUE(histogram.add(70));
    EXPECT_TRUE(histogram.add(70));
    EXPECT_FALSE(histogram.add(kMaxQualityCode + 1));
    EXPECT_FALSE(histogram.add(kMinQualityCode - 1));

    EXPECT_EQ(histogram.total(), 4u);
    EXPECT_EQ(histogram.count(70), 2u);
    EXPECT_EQ(histogram.count(71), 0u);
    EXPECT_EQ(histogram.count(500), 0u);

    histogram.clear();
    EXPECT_TRUE(histogram.empty());
    EXPECT_EQ(histogram.count(70), 0u);
}

TEST(QualityHistogramTest, PercentileOfEmptyHistogram) {
    QualityHistogram histogram;
    EXPECT_FALSE(histogram.percentileCode(30).has_value());
}

TEST(QualityHistogramTest, PercentileUsesFlooredIndex) {
    QualityHistogram histogram;
    for (int code = 60; code < 70; ++code) {
        histogram.add(code);
    }
    // 10 codes: index 3 is reached by the third smallest code.
    EXPECT_EQ(histogram.percentileCode(30), 62);
    EXPECT_EQ(histogram.percentileCode(100), 69);
    EXPECT_EQ(histogram.percentileCode(10), 60);
}

TEST(QualityHistogramTest, ZeroIndexPicksLowestTrackedCode) {
    QualityHistogram histogram;
    histogram.add(100);
    histogram.add(100);
    histogram.add(100);
    // floor(3 * 30 / 100) is 0, already reached before any counted code.
    EXPECT_EQ(histogram.percentileCode(30), kMinQualityCode);
}

RC_GTEST_PROP(QualityHistogramProperty, PercentileCodeIsNeverAboveMaximum, ()) {
    const auto codes = *rc::gen::nonEmpty(rc::gen::container<std::vector<int>>(
        rc::gen::inRange(kMinQualityCode, kMaxQualityCode + 1)));
    const auto percent = *rc::gen::inRange<std::uint32_t>(0, 101);

    QualityHistogram histogram;
    int highest = kMinQualityCode;
    for (int code : codes) {
        RC_ASSERT(histogram.add(code));
        highest = std::max(highest, code);
    }
    auto code = histogram.percentileCode(percent);
    RC_ASSERT(code.has_value());
    RC_ASSERT(*code <= highest);
}

// =============================================================================
// Options
// =============================================================================

TEST(QualityOffsetOptionsTest, DefaultsAreValid) {
    EXPECT_TRUE(QualityOffsetOptions{}.validate().has_value());
}

TEST(QualityOffsetOptionsTest, RejectsOutOfRangeValues) {
    QualityOffsetOptions percentile;
    percentile.percentile = 101;
    auto result = percentile.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);

    QualityOffsetOptions floor;
    floor.unambiguousFloor = 200;
    EXPECT_FALSE(floor.validate().has_value());

    QualityOffsetOptions highThreshold;
    highThreshold.highOffsetThreshold = 127;
    auto high = highThreshold.validate();
    ASSERT_FALSE(high.has_value());
    EXPECT_NE(high.error().message().find("High offset threshold 127"), std::string::npos);

    QualityOffsetOptions lowThreshold;
    lowThreshold.highOffsetThreshold = -6;
    EXPECT_FALSE(lowThreshold.validate().has_value());

    QualityOffsetOptions edgeThreshold;
    edgeThreshold.highOffsetThreshold = kMaxQualityCode;
    EXPECT_TRUE(edgeThreshold.validate().has_value());
}

TEST(QualityOffsetOptionsTest, InvalidOptionsThrowBeforeReading) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, record("r1", "ACGT", "!!!!"));

    QualityOffsetOptions options;
    options.percentile = 150;
    EXPECT_THROW((void)inferQualityOffset(path, options), UsageError);
}

// =============================================================================
// Inference
// =============================================================================

TEST(InferQualityOffsetTest, LowCodeMeansOffset33) {
    EXPECT_EQ(offsetOf(record("r1", "ACGT", "!!!!")), kPhredOffset33);
}

TEST(InferQualityOffsetTest, CodeJustBelowFloorMeansOffset33) {
    // ':' is 58, the highest code that only offset 33 can produce.
    EXPECT_EQ(offsetOf(record("r1", "ACGTACGTAC", "hhhhhhhhh:")), kPhredOffset33);
}

TEST(InferQualityOffsetTest, LowCodeOnNBaseStillCounts) {
    EXPECT_EQ(offsetOf(record("r1", "ACGTNACGTA", "hhhh#hhhhh")), kPhredOffset33);
}

TEST(InferQualityOffsetTest, HighCodesMeanOffset64) {
    // 'h' is 104: Q40 with offset 64.
    EXPECT_EQ(offsetOf(record("r1", "ACGTACGTAC", "hhhhhhhhhh")), kPhredOffset64);
}

TEST(InferQualityOffsetTest, MidRangeCodesMeanOffset33) {
    // 'I' is 73: Q40 with offset 33.
    EXPECT_EQ(offsetOf(record("r1", "ACGTACGTAC", "IIIIIIIIII")), kPhredOffset33);
}

TEST(InferQualityOffsetTest, PercentileDecidesMixedFiles) {
    // 3 of 10 codes at 'A' (65) put the 30th percentile below the threshold.
    EXPECT_EQ(offsetOf(record("r1", "ACGTACGTAC", "AAAhhhhhhh")), kPhredOffset33);
    // 2 of 10 keep it above.
    EXPECT_EQ(offsetOf(record("r1", "ACGTACGTAC", "AAhhhhhhhh")), kPhredOffset64);
}

TEST(InferQualityOffsetTest, NBasesAreIgnoredInHistogram) {
    // The low codes sit on N bases and do not drag the percentile down.
    EXPECT_EQ(offsetOf(record("r1", "NNNNACGTACGTAC", "AAAAhhhhhhhhhh")), kPhredOffset64);
}

TEST(InferQualityOffsetTest, EmptyFileIsUndetermined) {
    EXPECT_FALSE(offsetOf("").has_value());
}

TEST(InferQualityOffsetTest, OnlyNBasesIsUndetermined) {
    EXPECT_FALSE(offsetOf(record("r1", "NNNN", "hhhh")).has_value());
}

TEST(InferQualityOffsetTest, CodeAboveMaximumIsParseError) {
    std::string quality(4, 'h');
    quality[2] = '\x7f';
    EXPECT_THROW((void)offsetOf(record("r1", "ACGT", quality)), ParseError);
}

TEST(InferQualityOffsetTest, ReadsGzipInput) {
    auto path = tempFilePath(".fq.gz");
    TempFileGuard guard(path);
    writeGzipFile(path, record("r1", "ACGTACGTAC", "hhhhhhhhhh") +
                            record("r2", "ACGTACGTAC", "gggggggggg"));
    EXPECT_EQ(inferQualityOffset(path), kPhredOffset64);
}

TEST(InferQualityOffsetTest, UsesRemainingRecordsOfReader) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, record("r1", "ACGT", "!!!!") + record("r2", "ACGTACGTAC", "hhhhhhhhhh"));

    io::FastqCodec reader(path);
    ASSERT_TRUE(reader.nextSeq().has_value());
    EXPECT_EQ(inferQualityOffset(reader), kPhredOffset64);
}

TEST(InferQualityOffsetTest, MissingFileThrowsIOError) {
    EXPECT_THROW((void)inferQualityOffset("/nonexistent/fastxio/reads.fq"), IOError);
}

RC_GTEST_PROP(InferQualityOffsetProperty, Offset33CodesNeverGive64, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(1, 200);
    const auto residues =
        *rc::gen::container<std::string>(length, rc::gen::element('A', 'C', 'G', 'T'));
    // Offset 33 codes up to Q41.
    const auto quality =
        *rc::gen::container<std::string>(length, rc::gen::inRange<char>('!', 'K'));

    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, record("r", residues, quality));
    RC_ASSERT(inferQualityOffset(path) == std::optional<int>(kPhredOffset33));
}

}  // namespace fastxio::algo::test
