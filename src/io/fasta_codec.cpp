// =============================================================================
// fastx-io - FASTA Codec Implementation
// =============================================================================

#include "fastxio/io/fasta_codec.h"

#include <fmt/format.h>

#include "fastxio/algo/sequence_counter.h"
#include "fastxio/common/logger.h"
#include "fastxio/io/format_detector.h"

namespace fastxio::io {

FastaCodec::FastaCodec(std::filesystem::path path, OpenMode mode, TextStreamOptions options)
    : SequenceCodec(std::move(path), mode, options) {}

FastaCodec::~FastaCodec() {
    try {
        close();
    } catch (const FastxException& ex) {
        FASTXIO_LOG_ERROR("Failed to close FASTA file {}: {}", path_.string(), ex.what());
    }
}

bool FastaCodec::nextLine(std::string& line) {
    TextStream& in = readStream();
    if (!in.readLine(line)) {
        if (in.hasError()) {
            throwParseError("read error", lineNumber_);
        }
        return false;
    }
    ++lineNumber_;
    return true;
}

std::optional<SequenceRecord> FastaCodec::nextSeq() {
    std::string line;

    if (!started_) {
        started_ = true;
        if (!nextLine(line)) {
            exhausted_ = true;
            return std::nullopt;
        }
        pendingHeaderLine_ = lineNumber_ - 1;
        pendingHeader_ = std::string(strip(line));
    }
    if (!pendingHeader_) {
        (void)readStream();  // closed codecs still throw
        return std::nullopt;
    }

    const std::string header = std::move(*pendingHeader_);
    const auto headerLine = pendingHeaderLine_;
    pendingHeader_.reset();

    SequenceRecord record;
    while (!exhausted_) {
        if (!nextLine(line)) {
            exhausted_ = true;
            break;
        }
        if (!line.empty() && line.front() == kFastaHeaderPrefix) {
            pendingHeaderLine_ = lineNumber_ - 1;
            pendingHeader_ = std::string(strip(line));
            break;
        }
        record.residues += strip(line);
    }

    if (header.empty() || header.front() != kFastaHeaderPrefix) {
        throwParseError("expected '>' at start of header line", headerLine);
    }
    if (!parseHeader(std::string_view(header).substr(1), record.id, record.description)) {
        throwParseError("header holds no sequence id", headerLine);
    }

    ++recordCount_;
    return record;
}

void FastaCodec::write(const SequenceRecord& record) {
    writeStream().write(formatFastaRecord(record));
    lineNumber_ += 2;
    ++recordCount_;
}

std::uint64_t FastaCodec::nbSeq(const std::filesystem::path& path) {
    return algo::countFastaRecords(path);
}

bool FastaCodec::isValid(const std::filesystem::path& path) {
    return isFasta(path);
}

std::string formatFastaRecord(const SequenceRecord& record) {
    return fmt::format("{}{}\n{}\n", kFastaHeaderPrefix, record.header(), record.residues);
}

}  // namespace fastxio::io
