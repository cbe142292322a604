// =============================================================================
// fastx-io - Info Command
// =============================================================================
// Command handler summarizing a sequence file:
// - compression and detected format
// - record count
// - quality offset (FASTQ only)
// =============================================================================

#ifndef FASTXIO_COMMANDS_INFO_COMMAND_H
#define FASTXIO_COMMANDS_INFO_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "fastxio/io/compressed_stream.h"
#include "fastxio/io/sequence_codec.h"

namespace fastxio::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input sequence file path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Summary of a sequence file.
struct FileInfo {
    std::filesystem::path path;
    std::uintmax_t sizeBytes = 0;
    io::CompressionFormat compression = io::CompressionFormat::kNone;
    io::SequenceFormat format = io::SequenceFormat::kUnknown;
    std::uint64_t records = 0;

    /// @brief Phred offset, FASTQ with at least one counted quality only.
    std::optional<int> qualityOffset;
};

/// @brief Inspect a file.
/// @throws IOError if the file cannot be read, FormatError if it is neither
///         FASTQ nor FASTA.
[[nodiscard]] FileInfo collectFileInfo(const std::filesystem::path& path);

/// @brief Print a summary as aligned text.
void printTextInfo(const FileInfo& info, std::ostream& out);

/// @brief Print a summary as a JSON object.
void printJsonInfo(const FileInfo& info, std::ostream& out);

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying file information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    InfoOptions options_;
};

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath,
                                                             bool jsonOutput);

}  // namespace fastxio::commands

#endif  // FASTXIO_COMMANDS_INFO_COMMAND_H
