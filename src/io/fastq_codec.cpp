// =============================================================================
// fastx-io - FASTQ Codec Implementation
// =============================================================================

#include "fastxio/io/fastq_codec.h"

#include <fmt/format.h>

#include "fastxio/algo/quality_offset.h"
#include "fastxio/algo/sequence_counter.h"
#include "fastxio/common/logger.h"
#include "fastxio/io/format_detector.h"

namespace fastxio::io {

FastqCodec::FastqCodec(std::filesystem::path path, OpenMode mode, TextStreamOptions options)
    : SequenceCodec(std::move(path), mode, options) {}

FastqCodec::~FastqCodec() {
    try {
        close();
    } catch (const FastxException& ex) {
        FASTXIO_LOG_ERROR("Failed to close FASTQ file {}: {}", path_.string(), ex.what());
    }
}

std::optional<SequenceRecord> FastqCodec::nextSeq() {
    TextStream& in = readStream();
    std::string line;

    if (!in.readLine(line)) {
        if (in.hasError()) {
            throwParseError("read error", lineNumber_);
        }
        return std::nullopt;
    }

    SequenceRecord record;
    auto header = strip(line);
    if (header.empty() || header.front() != kFastqHeaderPrefix) {
        throwParseError("expected '@' at start of header line", lineNumber_);
    }
    if (!parseHeader(header.substr(1), record.id, record.description)) {
        throwParseError("header holds no sequence id", lineNumber_);
    }
    ++lineNumber_;

    auto readBodyLine = [&](std::string_view what) {
        if (!in.readLine(line)) {
            throwParseError(in.hasError() ? "read error"
                                          : fmt::format("unexpected end of file, missing {} line", what),
                            lineNumber_);
        }
        ++lineNumber_;
        return std::string(strip(line));
    };

    record.residues = readBodyLine("sequence");
    (void)readBodyLine("separator");
    record.quality = readBodyLine("quality");

    ++recordCount_;
    return record;
}

void FastqCodec::write(const SequenceRecord& record) {
    auto text = formatFastqRecord(record);
    writeStream().write(text);
    lineNumber_ += 4;
    ++recordCount_;
}

std::optional<int> FastqCodec::qualOffset(const std::filesystem::path& path) {
    return algo::inferQualityOffset(path);
}

std::uint64_t FastqCodec::nbSeq(const std::filesystem::path& path) {
    return algo::countFastqRecords(path);
}

bool FastqCodec::isValid(const std::filesystem::path& path) {
    return isFastq(path);
}

std::string formatFastqRecord(const SequenceRecord& record) {
    if (!record.quality) {
        throw FormatError(fmt::format("FASTQ record '{}' has no quality", record.id));
    }
    return fmt::format("{}{}\n{}\n{}\n{}\n", kFastqHeaderPrefix, record.header(), record.residues,
                       kFastqSeparatorPrefix, *record.quality);
}

}  // namespace fastxio::io
