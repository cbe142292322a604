// =============================================================================
// fastx-io - Sequence Codec Base Implementation
// =============================================================================

#include "fastxio/io/sequence_codec.h"

#include <fmt/format.h>

namespace fastxio::io {

std::string_view sequenceFormatName(SequenceFormat format) noexcept {
    switch (format) {
        case SequenceFormat::kFasta:
            return "fasta";
        case SequenceFormat::kFastq:
            return "fastq";
        case SequenceFormat::kUnknown:
            return "unknown";
    }
    return "unknown";
}

SequenceCodec::SequenceCodec(std::filesystem::path path, OpenMode mode,
                             TextStreamOptions options)
    : path_(std::move(path)), mode_(mode) {
    stream_ = unwrapOrThrow(TextStream::open(path_, mode_, options));
}

std::uint64_t SequenceCodec::forEach(const RecordCallback& callback) {
    std::uint64_t count = 0;
    while (auto record = nextSeq()) {
        ++count;
        if (!callback(*record)) {
            break;
        }
    }
    return count;
}

std::vector<SequenceRecord> SequenceCodec::readAll() {
    std::vector<SequenceRecord> records;
    while (auto record = nextSeq()) {
        records.push_back(std::move(*record));
    }
    return records;
}

void SequenceCodec::close() {
    if (stream_) {
        stream_->close();
    }
}

TextStream& SequenceCodec::readStream() {
    if (!isOpen()) {
        throw IOError(ErrorCode::kInvalidState, "Cannot read from closed file: " + path_.string());
    }
    if (mode_ != OpenMode::kRead) {
        throw IOError(ErrorCode::kInvalidState,
                      fmt::format("Cannot read from {} opened in mode '{}'", path_.string(),
                                  openModeName(mode_)));
    }
    return *stream_;
}

TextStream& SequenceCodec::writeStream() {
    if (!isOpen()) {
        throw IOError(ErrorCode::kInvalidState, "Cannot write to closed file: " + path_.string());
    }
    if (mode_ == OpenMode::kRead) {
        throw IOError(ErrorCode::kInvalidState,
                      "Cannot write to file opened for reading: " + path_.string());
    }
    return *stream_;
}

void SequenceCodec::throwParseError(std::string_view message, std::uint64_t line) const {
    throw ParseError(fmt::format("{} cannot parse line {}: {}", sequenceFormatName(format()),
                                 line, message),
                     ErrorContext(path_.string()).withLine(line).withRecord(recordCount_ + 1));
}

}  // namespace fastxio::io
