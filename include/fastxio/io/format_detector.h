// =============================================================================
// fastx-io - Format Detector
// =============================================================================
// Content-based FASTA/FASTQ recognition and reader factory.
//
// Validators inspect at most the first DetectorOptions::maxRecords records
// of a file (gzip or plain) and never throw for content or I/O problems:
// an unreadable file is simply not valid. An empty file is valid for both
// formats, so the factory opens it as FASTQ.
// =============================================================================

#ifndef FASTXIO_IO_FORMAT_DETECTOR_H
#define FASTXIO_IO_FORMAT_DETECTOR_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "fastxio/io/sequence_codec.h"
#include "fastxio/io/text_stream.h"

namespace fastxio::io {

/// @brief Default number of records inspected by the validators.
inline constexpr std::size_t kDefaultDetectionRecords = 10;

/// @brief Configuration options for format validation.
struct DetectorOptions {
    /// @brief Maximum number of records (FASTQ) or headers (FASTA) to inspect.
    std::size_t maxRecords = kDefaultDetectionRecords;

    /// @brief Options of the inspected stream.
    TextStreamOptions stream;
};

/// @brief Why a file was rejected.
enum class DetectionIssue : std::uint8_t {
    kNone = 0,
    kUnreadable,       ///< File cannot be opened
    kReadError,        ///< Read failed, e.g. corrupt gzip data
    kInvalidHeader,    ///< FASTQ header does not start with '@'
    kInvalidSequence,  ///< FASTQ sequence holds a non-letter
    kTruncatedRecord,  ///< FASTQ record ends before its separator line
    kLengthMismatch,   ///< FASTQ quality and sequence lengths differ
    kMissingHeader,    ///< FASTA does not start with a header
    kEmptyRecord       ///< FASTA header directly followed by another header
};

/// @brief Get a short description of a detection issue.
[[nodiscard]] std::string_view detectionIssueName(DetectionIssue issue) noexcept;

/// @brief Outcome of a format validation.
struct DetectionResult {
    DetectionIssue issue = DetectionIssue::kNone;

    /// @brief 1-based line where the problem was found, 0 if none.
    std::uint64_t lineNumber = 0;

    /// @brief Number of records (or headers) inspected.
    std::uint64_t recordsChecked = 0;

    [[nodiscard]] bool valid() const noexcept { return issue == DetectionIssue::kNone; }
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Human-readable summary.
    [[nodiscard]] std::string describe() const;
};

/// @brief Validate the first records of a file as FASTQ.
[[nodiscard]] DetectionResult validateFastq(const std::filesystem::path& path,
                                            const DetectorOptions& options = {});

/// @brief Validate the first headers of a file as FASTA.
[[nodiscard]] DetectionResult validateFasta(const std::filesystem::path& path,
                                            const DetectorOptions& options = {});

/// @brief Check if a file looks like FASTQ.
[[nodiscard]] bool isFastq(const std::filesystem::path& path);

/// @brief Check if a file looks like FASTA.
[[nodiscard]] bool isFasta(const std::filesystem::path& path);

/// @brief Detect the format of a file, FASTQ first.
[[nodiscard]] SequenceFormat detectSequenceFormat(const std::filesystem::path& path,
                                                  const DetectorOptions& options = {});

/// @brief Open a reader of the given format.
/// @throws FormatError for SequenceFormat::kUnknown.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<SequenceCodec> openSequenceCodec(
    const std::filesystem::path& path, SequenceFormat format, OpenMode mode = OpenMode::kRead,
    TextStreamOptions options = {});

/// @brief Detect the format of a file and open a reader for it.
/// @throws FormatError if the file is neither FASTQ nor FASTA.
[[nodiscard]] std::unique_ptr<SequenceCodec> openSequenceReader(
    const std::filesystem::path& path, const DetectorOptions& options = {});

}  // namespace fastxio::io

#endif  // FASTXIO_IO_FORMAT_DETECTOR_H
