// =============================================================================
// fastx-io - Sequence Record
// =============================================================================
// A FASTA or FASTQ record and its reverse-complement transforms.
//
// A record is a plain value: codecs build one per parsed entry, callers build
// them before writing. Transforms return new records.
// =============================================================================

#ifndef FASTXIO_IO_SEQUENCE_RECORD_H
#define FASTXIO_IO_SEQUENCE_RECORD_H

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "fastxio/common/error.h"

namespace fastxio::io {

// =============================================================================
// Complement Tables
// =============================================================================

/// @brief Lookup table from a symbol to its complement, 0 when undefined.
using ComplementTable = std::array<char, 256>;

namespace detail {

/// @brief Build a complement table from (symbol, complement) pairs.
template <std::size_t N>
constexpr ComplementTable makeComplementTable(const char (&pairs)[N][2]) {
    ComplementTable table{};
    for (std::size_t i = 0; i < N; ++i) {
        table[static_cast<unsigned char>(pairs[i][0])] = pairs[i][1];
    }
    return table;
}

inline constexpr char kDnaPairs[][2] = {
    {'A', 'T'}, {'T', 'A'}, {'G', 'C'}, {'C', 'G'}, {'U', 'A'}, {'N', 'N'},
    {'a', 't'}, {'t', 'a'}, {'g', 'c'}, {'c', 'g'}, {'u', 'a'}, {'n', 'n'},
    {'W', 'W'}, {'S', 'S'}, {'M', 'K'}, {'K', 'M'}, {'R', 'Y'}, {'Y', 'R'},
    {'B', 'V'}, {'V', 'B'}, {'D', 'H'}, {'H', 'D'},
    {'w', 'w'}, {'s', 's'}, {'m', 'k'}, {'k', 'm'}, {'r', 'y'}, {'y', 'r'},
    {'b', 'v'}, {'v', 'b'}, {'d', 'h'}, {'h', 'd'}};

inline constexpr char kRnaPairs[][2] = {
    {'A', 'U'}, {'T', 'A'}, {'G', 'C'}, {'C', 'G'}, {'U', 'A'}, {'N', 'N'},
    {'a', 'u'}, {'t', 'a'}, {'g', 'c'}, {'c', 'g'}, {'u', 'a'}, {'n', 'n'},
    {'W', 'W'}, {'S', 'S'}, {'M', 'K'}, {'K', 'M'}, {'R', 'Y'}, {'Y', 'R'},
    {'B', 'V'}, {'V', 'B'}, {'D', 'H'}, {'H', 'D'},
    {'w', 'w'}, {'s', 's'}, {'m', 'k'}, {'k', 'm'}, {'r', 'y'}, {'y', 'r'},
    {'b', 'v'}, {'v', 'b'}, {'d', 'h'}, {'h', 'd'}};

}  // namespace detail

/// @brief IUPAC DNA complements. U maps to A, like T.
inline constexpr ComplementTable kDnaComplement = detail::makeComplementTable(detail::kDnaPairs);

/// @brief IUPAC RNA complements. Same as DNA except A maps to U.
inline constexpr ComplementTable kRnaComplement = detail::makeComplementTable(detail::kRnaPairs);

/// @brief Reverse a residue string and complement each symbol.
/// @throws InvalidSymbolError if a symbol has no complement.
[[nodiscard]] std::string reverseComplement(std::string_view residues,
                                            const ComplementTable& table);

// =============================================================================
// SequenceRecord
// =============================================================================

/// @brief One FASTA or FASTQ record.
/// @note FASTQ records carry a quality string as long as the residues;
///       FASTA records never carry one.
struct SequenceRecord {
    /// @brief First whitespace-delimited token of the header, without prefix.
    std::string id;

    /// @brief Rest of the header after the first whitespace run.
    std::optional<std::string> description;

    /// @brief Residue symbols (nucleotides or amino acids).
    std::string residues;

    /// @brief Encoded qualities, FASTQ only.
    std::optional<std::string> quality;

    /// @brief Get the number of residues.
    [[nodiscard]] std::size_t length() const noexcept { return residues.size(); }

    /// @brief Check if the record carries qualities.
    [[nodiscard]] bool hasQuality() const noexcept { return quality.has_value(); }

    /// @brief Header text without the '>' or '@' prefix.
    [[nodiscard]] std::string header() const;

    /// @brief DNA reverse complement; quality is reversed, ids are kept.
    /// @throws InvalidSymbolError if a residue is not an IUPAC DNA symbol.
    [[nodiscard]] SequenceRecord dnaReverseComplement() const;

    /// @brief RNA reverse complement; quality is reversed, ids are kept.
    /// @throws InvalidSymbolError if a residue is not an IUPAC RNA symbol.
    [[nodiscard]] SequenceRecord rnaReverseComplement() const;

    bool operator==(const SequenceRecord&) const = default;
};

/// @brief Split header text (prefix already removed) into id and description.
/// @return false if the header holds no id.
[[nodiscard]] bool parseHeader(std::string_view header, std::string& id,
                               std::optional<std::string>& description);

}  // namespace fastxio::io

#endif  // FASTXIO_IO_SEQUENCE_RECORD_H
