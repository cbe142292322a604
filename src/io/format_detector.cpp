// =============================================================================
// fastx-io - Format Detector Implementation
// =============================================================================

#include "fastxio/io/format_detector.h"

#include <algorithm>

#include <fmt/format.h>

#include "fastxio/common/logger.h"
#include "fastxio/io/fasta_codec.h"
#include "fastxio/io/fastq_codec.h"

namespace fastxio::io {

namespace {

[[nodiscard]] bool isAsciiLetter(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

DetectionResult reject(DetectionIssue issue, std::uint64_t line, std::uint64_t records) {
    return DetectionResult{.issue = issue, .lineNumber = line, .recordsChecked = records};
}

/// @brief Line reader tracking line numbers for diagnostics.
class LineCursor {
public:
    explicit LineCursor(TextStream& stream) : stream_(stream) {}

    bool next(std::string& line) {
        if (!stream_.readLine(line)) {
            return false;
        }
        ++lineNumber_;
        return true;
    }

    [[nodiscard]] bool failed() const noexcept { return stream_.hasError(); }
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

private:
    TextStream& stream_;
    std::uint64_t lineNumber_ = 0;
};

DetectionResult logResult(std::string_view format, const std::filesystem::path& path,
                          DetectionResult result) {
    if (!result.valid()) {
        FASTXIO_LOG_DEBUG("{} is not {}: {}", path.string(), format, result.describe());
    }
    return result;
}

}  // namespace

std::string_view detectionIssueName(DetectionIssue issue) noexcept {
    switch (issue) {
        case DetectionIssue::kNone:
            return "valid";
        case DetectionIssue::kUnreadable:
            return "file cannot be opened";
        case DetectionIssue::kReadError:
            return "read error";
        case DetectionIssue::kInvalidHeader:
            return "header does not start with '@'";
        case DetectionIssue::kInvalidSequence:
            return "sequence holds a non-letter symbol";
        case DetectionIssue::kTruncatedRecord:
            return "record is truncated";
        case DetectionIssue::kLengthMismatch:
            return "quality and sequence lengths differ";
        case DetectionIssue::kMissingHeader:
            return "file does not start with a '>' header";
        case DetectionIssue::kEmptyRecord:
            return "header is followed by another header";
    }
    return "unknown issue";
}

std::string DetectionResult::describe() const {
    if (valid()) {
        return fmt::format("valid ({} records checked)", recordsChecked);
    }
    if (lineNumber == 0) {
        return std::string(detectionIssueName(issue));
    }
    return fmt::format("{} at line {}", detectionIssueName(issue), lineNumber);
}

// =============================================================================
// Validation
// =============================================================================

DetectionResult validateFastq(const std::filesystem::path& path, const DetectorOptions& options) {
    auto stream = TextStream::open(path, OpenMode::kRead, options.stream);
    if (!stream) {
        return logResult("FASTQ", path, reject(DetectionIssue::kUnreadable, 0, 0));
    }

    LineCursor cursor(**stream);
    std::string header;
    std::string sequence;
    std::string separator;
    std::string quality;
    std::uint64_t records = 0;

    while (records < options.maxRecords) {
        if (!cursor.next(header)) {
            break;
        }
        ++records;
        if (header.empty() || header.front() != kFastqHeaderPrefix) {
            return logResult("FASTQ", path,
                             reject(DetectionIssue::kInvalidHeader, cursor.lineNumber(), records));
        }

        if (!cursor.next(sequence)) {
            if (cursor.failed()) {
                break;
            }
            return logResult("FASTQ", path, reject(DetectionIssue::kTruncatedRecord,
                                                   cursor.lineNumber() + 1, records));
        }
        auto residues = strip(sequence);
        if (!std::all_of(residues.begin(), residues.end(), isAsciiLetter)) {
            return logResult("FASTQ", path,
                             reject(DetectionIssue::kInvalidSequence, cursor.lineNumber(), records));
        }

        if (!cursor.next(separator)) {
            if (cursor.failed()) {
                break;
            }
            return logResult("FASTQ", path, reject(DetectionIssue::kTruncatedRecord,
                                                   cursor.lineNumber() + 1, records));
        }

        // A missing quality line reads as an empty one.
        if (!cursor.next(quality) && cursor.failed()) {
            break;
        }
        if (strip(quality).size() != residues.size()) {
            return logResult("FASTQ", path,
                             reject(DetectionIssue::kLengthMismatch, cursor.lineNumber(), records));
        }
    }

    if (cursor.failed()) {
        return logResult("FASTQ", path,
                         reject(DetectionIssue::kReadError, cursor.lineNumber() + 1, records));
    }
    return DetectionResult{.recordsChecked = records};
}

DetectionResult validateFasta(const std::filesystem::path& path, const DetectorOptions& options) {
    auto stream = TextStream::open(path, OpenMode::kRead, options.stream);
    if (!stream) {
        return logResult("FASTA", path, reject(DetectionIssue::kUnreadable, 0, 0));
    }

    LineCursor cursor(**stream);
    std::string line;
    std::uint64_t headers = 0;
    bool previousIsHeader = false;

    while (headers < options.maxRecords && cursor.next(line)) {
        if (!line.empty() && line.front() == kFastaHeaderPrefix) {
            if (previousIsHeader) {
                return logResult("FASTA", path,
                                 reject(DetectionIssue::kEmptyRecord, cursor.lineNumber(), headers));
            }
            previousIsHeader = true;
            ++headers;
        } else {
            if (headers == 0) {
                return logResult("FASTA", path,
                                 reject(DetectionIssue::kMissingHeader, cursor.lineNumber(), 0));
            }
            previousIsHeader = false;
        }
    }

    if (cursor.failed()) {
        return logResult("FASTA", path,
                         reject(DetectionIssue::kReadError, cursor.lineNumber() + 1, headers));
    }
    return DetectionResult{.recordsChecked = headers};
}

bool isFastq(const std::filesystem::path& path) {
    return validateFastq(path).valid();
}

bool isFasta(const std::filesystem::path& path) {
    return validateFasta(path).valid();
}

// =============================================================================
// Factory
// =============================================================================

SequenceFormat detectSequenceFormat(const std::filesystem::path& path,
                                    const DetectorOptions& options) {
    if (validateFastq(path, options)) {
        return SequenceFormat::kFastq;
    }
    if (validateFasta(path, options)) {
        return SequenceFormat::kFasta;
    }
    return SequenceFormat::kUnknown;
}

std::unique_ptr<SequenceCodec> openSequenceCodec(const std::filesystem::path& path,
                                                 SequenceFormat format, OpenMode mode,
                                                 TextStreamOptions options) {
    switch (format) {
        case SequenceFormat::kFastq:
            return std::make_unique<FastqCodec>(path, mode, options);
        case SequenceFormat::kFasta:
            return std::make_unique<FastaCodec>(path, mode, options);
        case SequenceFormat::kUnknown:
            break;
    }
    throw FormatError("No codec for unknown sequence format", ErrorContext(path.string()));
}

std::unique_ptr<SequenceCodec> openSequenceReader(const std::filesystem::path& path,
                                                  const DetectorOptions& options) {
    auto format = detectSequenceFormat(path, options);
    if (format == SequenceFormat::kUnknown) {
        throw FormatError("The file " + path.string() + " has an unrecognized format",
                          ErrorContext(path.string()));
    }
    FASTXIO_LOG_DEBUG("Detected {} format for {}", sequenceFormatName(format), path.string());
    return openSequenceCodec(path, format, OpenMode::kRead, options.stream);
}

}  // namespace fastxio::io
