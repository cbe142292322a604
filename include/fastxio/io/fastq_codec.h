// =============================================================================
// fastx-io - FASTQ Codec
// =============================================================================
// Streaming reader/writer for four-line FASTQ files:
//
//   @<id>[ <description>]
//   <residues>
//   +
//   <quality>
//
// Every line is stripped of surrounding whitespace when read. The separator
// line content is ignored. Reading does not compare quality and residue
// lengths; writing always emits "+" as the separator.
// =============================================================================

#ifndef FASTXIO_IO_FASTQ_CODEC_H
#define FASTXIO_IO_FASTQ_CODEC_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "fastxio/io/sequence_codec.h"

namespace fastxio::io {

/// @brief FASTQ header prefix.
inline constexpr char kFastqHeaderPrefix = '@';

/// @brief FASTQ separator line prefix.
inline constexpr char kFastqSeparatorPrefix = '+';

/// @brief Streaming FASTQ reader/writer.
class FastqCodec final : public SequenceCodec {
public:
    /// @brief Open a FASTQ file.
    /// @throws IOError if the file cannot be opened.
    explicit FastqCodec(std::filesystem::path path, OpenMode mode = OpenMode::kRead,
                        TextStreamOptions options = {});

    ~FastqCodec() override;

    FastqCodec(FastqCodec&&) noexcept = default;
    FastqCodec& operator=(FastqCodec&&) noexcept = default;

    /// @brief Read the next four-line record.
    /// @throws ParseError if the header holds no id or the file ends mid-record.
    [[nodiscard]] std::optional<SequenceRecord> nextSeq() override;

    /// @brief Write a record as four lines.
    /// @throws FormatError if the record has no quality.
    void write(const SequenceRecord& record) override;

    [[nodiscard]] SequenceFormat format() const noexcept override { return SequenceFormat::kFastq; }

    /// @brief Infer the quality encoding offset (33 or 64) of a file.
    /// @return std::nullopt if the file holds no quality evidence.
    [[nodiscard]] static std::optional<int> qualOffset(const std::filesystem::path& path);

    /// @brief Count the records of a file (line count / 4).
    [[nodiscard]] static std::uint64_t nbSeq(const std::filesystem::path& path);

    /// @brief Check if the first records of a file are valid FASTQ.
    [[nodiscard]] static bool isValid(const std::filesystem::path& path);
};

/// @brief Render a record as four newline-terminated FASTQ lines.
/// @throws FormatError if the record has no quality.
[[nodiscard]] std::string formatFastqRecord(const SequenceRecord& record);

}  // namespace fastxio::io

#endif  // FASTXIO_IO_FASTQ_CODEC_H
