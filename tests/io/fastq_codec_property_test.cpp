// =============================================================================
// fastx-io - FASTQ Codec Property Tests
// =============================================================================
// Write/read round trips, truncation handling and plain/gzip transparency.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "fastxio/io/fastq_codec.h"
#include "test_utils.h"

namespace fastxio::io::test {

using fastxio::test::readGzipFile;
using fastxio::test::readRawFile;
using fastxio::test::tempFilePath;
using fastxio::test::TempFileGuard;
using fastxio::test::writeGzipFile;
using fastxio::test::writeTextFile;

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<char> base() {
    return rc::gen::element('A', 'C', 'G', 'T', 'N');
}

/// @brief Printable characters without whitespace.
[[nodiscard]] rc::Gen<char> token() {
    return rc::gen::inRange<char>('!', static_cast<char>('~' + 1));
}

[[nodiscard]] rc::Gen<std::string> word() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(token()));
}

/// @brief Record whose fields survive whitespace stripping and header splitting.
[[nodiscard]] rc::Gen<SequenceRecord> fastqRecord() {
    return rc::gen::exec([] {
        SequenceRecord record;
        record.id = *word();
        if (*rc::gen::arbitrary<bool>()) {
            auto words = *rc::gen::nonEmpty(rc::gen::container<std::vector<std::string>>(word()));
            std::string description = words.front();
            for (std::size_t i = 1; i < words.size(); ++i) {
                description += ' ' + words[i];
            }
            record.description = description;
        }
        const auto length = *rc::gen::inRange<std::size_t>(0, 300);
        record.residues = *rc::gen::container<std::string>(length, base());
        record.quality = *rc::gen::container<std::string>(length, token());
        return record;
    });
}

}  // namespace gen

// =============================================================================
// Reading
// =============================================================================

TEST(FastqCodecTest, ReadsRecordsAndStopsAtEnd) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1 lane 1\nACGT\n+\nIIII\n@r2\nNN\n+r2\n#!\n");

    FastqCodec reader(path);
    auto first = reader.nextSeq();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, "r1");
    EXPECT_EQ(first->description, "lane 1");
    EXPECT_EQ(first->residues, "ACGT");
    EXPECT_EQ(first->quality, "IIII");
    EXPECT_EQ(reader.lineNumber(), 5u);

    auto second = reader.nextSeq();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->id, "r2");
    EXPECT_FALSE(second->description.has_value());
    EXPECT_EQ(second->quality, "#!");

    EXPECT_FALSE(reader.nextSeq().has_value());
    EXPECT_FALSE(reader.nextSeq().has_value());
    EXPECT_EQ(reader.recordCount(), 2u);
}

TEST(FastqCodecTest, StripsWindowsLineEndings) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1 d\r\nACGT\r\n+\r\nIIII\r\n");

    FastqCodec reader(path);
    auto record = reader.nextSeq();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->description, "d");
    EXPECT_EQ(record->residues, "ACGT");
    EXPECT_EQ(record->quality, "IIII");
}

TEST(FastqCodecTest, EmptyFileHasNoRecord) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "");

    FastqCodec reader(path);
    EXPECT_FALSE(reader.nextSeq().has_value());
}

TEST(FastqCodecTest, LastRecordWithoutFinalNewline) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nACGT\n+\nIIII");

    FastqCodec reader(path);
    auto record = reader.nextSeq();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->quality, "IIII");
    EXPECT_FALSE(reader.nextSeq().has_value());
}

TEST(FastqCodecTest, TruncatedRecordIsParseError) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nACGT\n+\nIIII\n@r2\nACGT\n");

    FastqCodec reader(path);
    ASSERT_TRUE(reader.nextSeq().has_value());
    try {
        (void)reader.nextSeq();
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        ASSERT_TRUE(e.lineNumber().has_value());
        EXPECT_EQ(*e.lineNumber(), 7u);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->filePath, path.string());
    }
}

TEST(FastqCodecTest, HeaderWithoutIdIsParseError) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@ \nACGT\n+\nIIII\n");

    FastqCodec reader(path);
    EXPECT_THROW((void)reader.nextSeq(), ParseError);
}

TEST(FastqCodecTest, HeaderWithoutPrefixIsParseError) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, ">r1\nACGT\n+\nIIII\n");

    FastqCodec reader(path);
    EXPECT_THROW((void)reader.nextSeq(), ParseError);
}

TEST(FastqCodecTest, ShortQualityIsAcceptedWhenReading) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nACGT\n+\nII\n");

    FastqCodec reader(path);
    auto record = reader.nextSeq();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->residues, "ACGT");
    EXPECT_EQ(record->quality, "II");
}

TEST(FastqCodecTest, ReadsGzipInput) {
    auto path = tempFilePath(".fastq");
    TempFileGuard guard(path);
    writeGzipFile(path, "@r1\nACGT\n+\nIIII\n");
    writeGzipFile(path, "@r2\nGG\n+\nII\n", true);

    FastqCodec reader(path);
    EXPECT_TRUE(reader.isCompressed());
    auto records = reader.readAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].id, "r2");
}

TEST(FastqCodecTest, ForEachStopsWhenCallbackReturnsFalse) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nA\n+\nI\n@r2\nC\n+\nI\n@r3\nG\n+\nI\n");

    FastqCodec reader(path);
    std::vector<std::string> ids;
    auto count = reader.forEach([&](const SequenceRecord& record) {
        ids.push_back(record.id);
        return ids.size() < 2;
    });
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(ids, (std::vector<std::string>{"r1", "r2"}));

    auto rest = reader.nextSeq();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->id, "r3");
}

TEST(FastqCodecTest, MissingFileThrowsIOError) {
    EXPECT_THROW(FastqCodec("/nonexistent/fastxio/reads.fq"), IOError);
}

TEST(FastqCodecTest, ClosedCodecRejectsReads) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nA\n+\nI\n");

    FastqCodec reader(path);
    reader.close();
    EXPECT_FALSE(reader.isOpen());
    EXPECT_NO_THROW(reader.close());
    EXPECT_THROW((void)reader.nextSeq(), IOError);
}

// =============================================================================
// Writing
// =============================================================================

TEST(FastqCodecTest, WritesFourLines) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    {
        FastqCodec writer(path, OpenMode::kWrite);
        writer.write(SequenceRecord{"r1", "lane 1", "ACGT", "IIII"});
        writer.write(SequenceRecord{"r2", std::nullopt, "", ""});
    }
    EXPECT_EQ(readRawFile(path), "@r1 lane 1\nACGT\n+\nIIII\n@r2\n\n+\n\n");
}

TEST(FastqCodecTest, WriteWithoutQualityIsFormatError) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    FastqCodec writer(path, OpenMode::kWrite);
    EXPECT_THROW(writer.write(SequenceRecord{"r1", std::nullopt, "ACGT", std::nullopt}),
                 FormatError);
}

TEST(FastqCodecTest, ReaderRejectsWrites) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nA\n+\nI\n");

    FastqCodec reader(path);
    EXPECT_THROW(reader.write(SequenceRecord{"r2", std::nullopt, "A", "I"}), IOError);
}

TEST(FastqCodecTest, AppendToGzipKeepsEarlierRecords) {
    auto path = tempFilePath(".fq.gz");
    TempFileGuard guard(path);
    {
        FastqCodec writer(path, OpenMode::kWrite);
        writer.write(SequenceRecord{"r1", std::nullopt, "AC", "II"});
    }
    {
        FastqCodec writer(path, OpenMode::kAppend);
        writer.write(SequenceRecord{"r2", std::nullopt, "GT", "##"});
    }
    EXPECT_EQ(readGzipFile(path), "@r1\nAC\n+\nII\n@r2\nGT\n+\n##\n");
    EXPECT_EQ(FastqCodec::nbSeq(path), 2u);
}

TEST(FastqCodecTest, NbSeqIsLineCountOverFour) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nA\n+\nI\n@r2\nC\n+\nI\n@r3\n");
    EXPECT_EQ(FastqCodec::nbSeq(path), 2u);
}

TEST(FastqCodecTest, StaticHelpers) {
    auto path = tempFilePath(".fq");
    TempFileGuard guard(path);
    writeTextFile(path, "@r1\nACGT\n+\n!!!!\n");
    EXPECT_TRUE(FastqCodec::isValid(path));
    EXPECT_EQ(FastqCodec::qualOffset(path), 33);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(FastqCodecProperty, WriteThenReadPreservesRecords, ()) {
    const auto records = *rc::gen::container<std::vector<SequenceRecord>>(gen::fastqRecord());
    const bool compressed = *rc::gen::arbitrary<bool>();

    auto path = tempFilePath(compressed ? ".fq.gz" : ".fq");
    TempFileGuard guard(path);
    {
        FastqCodec writer(path, OpenMode::kWrite);
        for (const auto& record : records) {
            writer.write(record);
        }
        writer.close();
    }

    FastqCodec reader(path);
    RC_ASSERT(reader.isCompressed() == compressed);
    RC_ASSERT(reader.readAll() == records);
    RC_ASSERT(FastqCodec::nbSeq(path) == records.size());
}

RC_GTEST_PROP(FastqCodecProperty, FormattedRecordHasFourLines, ()) {
    const auto record = *gen::fastqRecord();
    const auto text = formatFastqRecord(record);
    RC_ASSERT(std::count(text.begin(), text.end(), '\n') == 4);
    RC_ASSERT(text.front() == '@');
}

}  // namespace fastxio::io::test
