// =============================================================================
// fastx-io - FASTA Codec
// =============================================================================
// Streaming reader/writer for FASTA files. A record is a '>' header line
// followed by any number of residue lines, which are stripped and
// concatenated. The reader keeps one header of lookahead: the header that
// terminates a record starts the next one.
//
// Records are written on two lines, residues unwrapped.
// =============================================================================

#ifndef FASTXIO_IO_FASTA_CODEC_H
#define FASTXIO_IO_FASTA_CODEC_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "fastxio/io/sequence_codec.h"

namespace fastxio::io {

/// @brief FASTA header prefix.
inline constexpr char kFastaHeaderPrefix = '>';

/// @brief Streaming FASTA reader/writer.
class FastaCodec final : public SequenceCodec {
public:
    /// @brief Open a FASTA file.
    /// @throws IOError if the file cannot be opened.
    explicit FastaCodec(std::filesystem::path path, OpenMode mode = OpenMode::kRead,
                        TextStreamOptions options = {});

    ~FastaCodec() override;

    FastaCodec(FastaCodec&&) noexcept = default;
    FastaCodec& operator=(FastaCodec&&) noexcept = default;

    /// @brief Read the next record.
    /// @return std::nullopt for an empty file or after the last record.
    /// @throws ParseError if a header is malformed.
    [[nodiscard]] std::optional<SequenceRecord> nextSeq() override;

    /// @brief Write a record as a header line and one residue line.
    void write(const SequenceRecord& record) override;

    [[nodiscard]] SequenceFormat format() const noexcept override { return SequenceFormat::kFasta; }

    /// @brief Count the records of a file (lines starting with '>').
    [[nodiscard]] static std::uint64_t nbSeq(const std::filesystem::path& path);

    /// @brief Check if the first records of a file are valid FASTA.
    [[nodiscard]] static bool isValid(const std::filesystem::path& path);

private:
    /// @brief Read the next line, counting it.
    /// @return false at end of file.
    bool nextLine(std::string& line);

    std::optional<std::string> pendingHeader_;
    std::uint64_t pendingHeaderLine_ = 0;
    bool started_ = false;
    bool exhausted_ = false;
};

/// @brief Render a record as a FASTA header line and residue line.
[[nodiscard]] std::string formatFastaRecord(const SequenceRecord& record);

}  // namespace fastxio::io

#endif  // FASTXIO_IO_FASTA_CODEC_H
