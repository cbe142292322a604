// =============================================================================
// fastx-io - Sequence Counter
// =============================================================================
// Record counting without parsing. Counts run over the decompressed text of
// plain or gzip files and never validate the content.
// =============================================================================

#ifndef FASTXIO_ALGO_SEQUENCE_COUNTER_H
#define FASTXIO_ALGO_SEQUENCE_COUNTER_H

#include <cstdint>
#include <filesystem>
#include <optional>

namespace fastxio::algo {

/// @brief Line counts of a file.
struct LineCounts {
    /// @brief Number of lines, a final line without '\n' included.
    std::uint64_t lines = 0;

    /// @brief Number of lines starting with the requested prefix.
    std::uint64_t prefixed = 0;
};

/// @brief Count the lines of a file, and those starting with a prefix.
/// @throws IOError if the file cannot be opened or read.
[[nodiscard]] LineCounts countLines(const std::filesystem::path& path,
                                    std::optional<char> prefix = std::nullopt);

/// @brief Number of FASTQ records: line count / 4, rounded down.
[[nodiscard]] std::uint64_t countFastqRecords(const std::filesystem::path& path);

/// @brief Number of FASTA records: lines starting with '>'.
[[nodiscard]] std::uint64_t countFastaRecords(const std::filesystem::path& path);

}  // namespace fastxio::algo

#endif  // FASTXIO_ALGO_SEQUENCE_COUNTER_H
