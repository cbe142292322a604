// =============================================================================
// fastx-io - Reverse Complement Command
// =============================================================================
// Writes the reverse complement of every record of a FASTA or FASTQ file to
// an output file of the same format. Qualities are reversed with their
// residues; ids and descriptions are kept.
// =============================================================================

#ifndef FASTXIO_COMMANDS_REVCOM_COMMAND_H
#define FASTXIO_COMMANDS_REVCOM_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace fastxio::commands {

/// @brief Configuration options for the revcom command.
struct RevcomOptions {
    std::filesystem::path inputPath;

    /// @brief Output path; gzip compressed when it ends with ".gz".
    std::filesystem::path outputPath;

    /// @brief Complement A to U instead of T.
    bool rna = false;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

/// @brief Reverse-complement all records of a file.
/// @return Number of records written.
/// @throws FormatError, ParseError, InvalidSymbolError or IOError.
/// @note A partially written output file is removed before rethrowing.
std::uint64_t reverseComplementFile(const RevcomOptions& options);

/// @brief Command handler for reverse complementing a file.
class RevcomCommand {
public:
    explicit RevcomCommand(RevcomOptions options);

    /// @brief Execute the command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const RevcomOptions& options() const noexcept { return options_; }

private:
    RevcomOptions options_;
};

}  // namespace fastxio::commands

#endif  // FASTXIO_COMMANDS_REVCOM_COMMAND_H
