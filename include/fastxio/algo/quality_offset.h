// =============================================================================
// fastx-io - Quality Offset Inference
// =============================================================================
// Infers whether a FASTQ file encodes Phred scores with offset 33 (Sanger,
// Illumina >= 1.8) or offset 64 (Solexa, Illumina < 1.8).
//
// Two stages:
// 1. Any quality code below 59 only exists with offset 33: stop there.
// 2. Otherwise take the code at the 30th percentile of the histogram of
//    qualities on non-N bases. Above 84 (Q20 with offset 64, but Q51 with
//    offset 33) means offset 64, else offset 33.
// =============================================================================

#ifndef FASTXIO_ALGO_QUALITY_OFFSET_H
#define FASTXIO_ALGO_QUALITY_OFFSET_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "fastxio/common/error.h"
#include "fastxio/io/sequence_codec.h"

namespace fastxio::algo {

// =============================================================================
// Constants
// =============================================================================

/// @brief Phred offset of Sanger and Illumina >= 1.8 files.
inline constexpr int kPhredOffset33 = 33;

/// @brief Phred offset of Solexa and Illumina < 1.8 files.
inline constexpr int kPhredOffset64 = 64;

/// @brief Lowest quality code tracked (Solexa scores go down to -5).
inline constexpr int kMinQualityCode = -5;

/// @brief Highest quality code tracked.
inline constexpr int kMaxQualityCode = 126;

/// @brief Lowest code any offset-64 file can hold.
inline constexpr int kDefaultUnambiguousFloor = 59;

/// @brief Percentile of the code histogram that is inspected.
inline constexpr std::uint32_t kDefaultPercentile = 30;

/// @brief Percentile codes above this value mean offset 64.
inline constexpr int kDefaultHighOffsetThreshold = 84;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Tunables of the offset heuristic.
struct QualityOffsetOptions {
    /// @brief Codes below the floor decide offset 33 immediately.
    int unambiguousFloor = kDefaultUnambiguousFloor;

    /// @brief Histogram percentile compared with the threshold (0-100).
    std::uint32_t percentile = kDefaultPercentile;

    /// @brief Percentile codes above the threshold decide offset 64.
    int highOffsetThreshold = kDefaultHighOffsetThreshold;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// QualityHistogram
// =============================================================================

/// @brief Counts of quality codes in [kMinQualityCode, kMaxQualityCode].
class QualityHistogram {
public:
    static constexpr std::size_t kNumCodes =
        static_cast<std::size_t>(kMaxQualityCode - kMinQualityCode + 1);

    /// @brief Count one code.
    /// @return false if the code is out of range (nothing is counted).
    bool add(int code) noexcept;

    /// @brief Get the count of a code, 0 when out of range.
    [[nodiscard]] std::uint64_t count(int code) const noexcept;

    /// @brief Get the number of counted codes.
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }

    [[nodiscard]] bool empty() const noexcept { return total_ == 0; }

    /// @brief Code at a percentile: the first code, in ascending order, whose
    ///        cumulative count reaches floor(total * percent / 100).
    /// @return std::nullopt if the histogram is empty.
    [[nodiscard]] std::optional<int> percentileCode(std::uint32_t percent) const noexcept;

    void clear() noexcept;

private:
    std::array<std::uint64_t, kNumCodes> counts_{};
    std::uint64_t total_ = 0;
};

// =============================================================================
// Inference
// =============================================================================

/// @brief Infer the quality offset from the remaining records of a reader.
/// @return 33, 64, or std::nullopt if no quality code was counted.
/// @throws ParseError if a quality code is above kMaxQualityCode.
[[nodiscard]] std::optional<int> inferQualityOffset(io::SequenceCodec& reader,
                                                    const QualityOffsetOptions& options = {});

/// @brief Infer the quality offset of a FASTQ file.
/// @throws IOError if the file cannot be opened, ParseError if it is malformed.
[[nodiscard]] std::optional<int> inferQualityOffset(const std::filesystem::path& path,
                                                    const QualityOffsetOptions& options = {});

}  // namespace fastxio::algo

#endif  // FASTXIO_ALGO_QUALITY_OFFSET_H
