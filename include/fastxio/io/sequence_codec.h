// =============================================================================
// fastx-io - Sequence Codec Base
// =============================================================================
// Common interface of the FASTA and FASTQ readers/writers.
//
// A codec owns one TextStream for its whole lifetime. Reading is pull-based:
// each nextSeq() call consumes exactly one record and returns std::nullopt
// once the file is exhausted. Iteration cannot be restarted; reopen the file
// instead. The stream is released by close() or by the destructor.
//
// Usage:
//   FastaCodec reader("/path/to/genome.fa");
//   while (auto record = reader.nextSeq()) {
//       // process *record ...
//   }
// =============================================================================

#ifndef FASTXIO_IO_SEQUENCE_CODEC_H
#define FASTXIO_IO_SEQUENCE_CODEC_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fastxio/common/error.h"
#include "fastxio/io/sequence_record.h"
#include "fastxio/io/text_stream.h"

namespace fastxio::io {

/// @brief Sequence file formats handled by the library.
enum class SequenceFormat : std::uint8_t {
    kUnknown = 0,
    kFasta = 1,
    kFastq = 2
};

/// @brief Get human-readable name for a sequence format.
[[nodiscard]] std::string_view sequenceFormatName(SequenceFormat format) noexcept;

/// @brief Abstract reader/writer of sequence records.
///
/// Thread Safety: not thread-safe; use one codec per thread.
class SequenceCodec {
public:
    /// @brief Callback for record processing. Return false to stop.
    using RecordCallback = std::function<bool(const SequenceRecord&)>;

    virtual ~SequenceCodec() = default;

    SequenceCodec(const SequenceCodec&) = delete;
    SequenceCodec& operator=(const SequenceCodec&) = delete;

    /// @brief Read the next record.
    /// @return The record, or std::nullopt at end of file.
    /// @throws ParseError if the record is malformed or truncated.
    [[nodiscard]] virtual std::optional<SequenceRecord> nextSeq() = 0;

    /// @brief Append a record to the file.
    /// @throws IOError on write failure or if the codec was opened for reading.
    virtual void write(const SequenceRecord& record) = 0;

    /// @brief Get the format handled by this codec.
    [[nodiscard]] virtual SequenceFormat format() const noexcept = 0;

    /// @brief Process all remaining records with a callback.
    /// @return Number of records passed to the callback.
    std::uint64_t forEach(const RecordCallback& callback);

    /// @brief Read all remaining records into memory.
    [[nodiscard]] std::vector<SequenceRecord> readAll();

    /// @brief Release the underlying file. Idempotent.
    /// @throws IOError if buffered output cannot be written.
    void close();

    /// @brief Check if the underlying file is still open.
    [[nodiscard]] bool isOpen() const noexcept { return stream_ && stream_->isOpen(); }

    /// @brief Line about to be parsed (1-based), for diagnostics.
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    /// @brief Number of records read or written so far.
    [[nodiscard]] std::uint64_t recordCount() const noexcept { return recordCount_; }

    /// @brief Get the file path.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Get the open mode.
    [[nodiscard]] OpenMode mode() const noexcept { return mode_; }

    /// @brief Check if the file is gzip compressed.
    [[nodiscard]] bool isCompressed() const noexcept { return stream_ && stream_->isCompressed(); }

protected:
    /// @brief Open the file.
    /// @throws IOError if the file cannot be opened.
    SequenceCodec(std::filesystem::path path, OpenMode mode, TextStreamOptions options);

    SequenceCodec(SequenceCodec&&) noexcept = default;
    SequenceCodec& operator=(SequenceCodec&&) noexcept = default;

    /// @brief Get the stream for reading.
    /// @throws IOError if the codec is closed or was opened for writing.
    [[nodiscard]] TextStream& readStream();

    /// @brief Get the stream for writing.
    /// @throws IOError if the codec is closed or was opened for reading.
    [[nodiscard]] TextStream& writeStream();

    /// @brief Throw a ParseError located at a line of this file.
    [[noreturn]] void throwParseError(std::string_view message, std::uint64_t line) const;

    std::filesystem::path path_;
    OpenMode mode_;
    std::unique_ptr<TextStream> stream_;
    std::uint64_t lineNumber_ = 1;
    std::uint64_t recordCount_ = 0;
};

}  // namespace fastxio::io

#endif  // FASTXIO_IO_SEQUENCE_CODEC_H
