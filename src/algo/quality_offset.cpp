// =============================================================================
// fastx-io - Quality Offset Inference Implementation
// =============================================================================

#include "fastxio/algo/quality_offset.h"

#include <algorithm>

#include <fmt/format.h>

#include "fastxio/common/logger.h"
#include "fastxio/io/fastq_codec.h"

namespace fastxio::algo {

VoidResult QualityOffsetOptions::validate() const {
    if (percentile > 100) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Percentile must be in [0, 100], got {}", percentile));
    }
    if (unambiguousFloor < kMinQualityCode || unambiguousFloor > kMaxQualityCode) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Unambiguous floor {} is outside [{}, {}]",
                                         unambiguousFloor, kMinQualityCode, kMaxQualityCode));
    }
    if (highOffsetThreshold < kMinQualityCode || highOffsetThreshold > kMaxQualityCode) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("High offset threshold {} is outside [{}, {}]",
                                         highOffsetThreshold, kMinQualityCode, kMaxQualityCode));
    }
    return makeVoidSuccess();
}

// =============================================================================
// QualityHistogram
// =============================================================================

bool QualityHistogram::add(int code) noexcept {
    if (code < kMinQualityCode || code > kMaxQualityCode) {
        return false;
    }
    ++counts_[static_cast<std::size_t>(code - kMinQualityCode)];
    ++total_;
    return true;
}

std::uint64_t QualityHistogram::count(int code) const noexcept {
    if (code < kMinQualityCode || code > kMaxQualityCode) {
        return 0;
    }
    return counts_[static_cast<std::size_t>(code - kMinQualityCode)];
}

std::optional<int> QualityHistogram::percentileCode(std::uint32_t percent) const noexcept {
    if (total_ == 0) {
        return std::nullopt;
    }

    const std::uint64_t target = total_ * percent / 100;
    std::uint64_t cumulative = 0;
    for (std::size_t i = 0; i < kNumCodes; ++i) {
        cumulative += counts_[i];
        if (cumulative >= target) {
            return static_cast<int>(i) + kMinQualityCode;
        }
    }
    return kMaxQualityCode;
}

void QualityHistogram::clear() noexcept {
    counts_.fill(0);
    total_ = 0;
}

// =============================================================================
// Inference
// =============================================================================

std::optional<int> inferQualityOffset(io::SequenceCodec& reader,
                                      const QualityOffsetOptions& options) {
    unwrapOrThrow(options.validate());

    QualityHistogram histogram;
    while (auto record = reader.nextSeq()) {
        if (!record->quality) {
            continue;
        }
        const std::string& quality = *record->quality;
        const std::size_t paired = std::min(record->residues.size(), quality.size());

        for (std::size_t i = 0; i < paired; ++i) {
            const int code = static_cast<unsigned char>(quality[i]);
            if (code < options.unambiguousFloor) {
                FASTXIO_LOG_INFO("Quality offset of {}: {} (code {} in record '{}')",
                                 reader.path().string(), kPhredOffset33, code, record->id);
                return kPhredOffset33;
            }
            if (record->residues[i] == 'N') {
                continue;
            }
            if (!histogram.add(code)) {
                throw ParseError(
                    fmt::format("Quality code {} of record '{}' is above {}", code, record->id,
                                kMaxQualityCode),
                    ErrorContext(reader.path().string())
                        .withLine(reader.lineNumber() - 1)
                        .withRecord(reader.recordCount()));
            }
        }
    }

    auto code = histogram.percentileCode(options.percentile);
    if (!code) {
        FASTXIO_LOG_INFO("Quality offset of {}: undetermined (no quality)", reader.path().string());
        return std::nullopt;
    }

    const int offset = *code > options.highOffsetThreshold ? kPhredOffset64 : kPhredOffset33;
    FASTXIO_LOG_INFO("Quality offset of {}: {} ({}th percentile code {} over {} qualities)",
                     reader.path().string(), offset, options.percentile, *code, histogram.total());
    return offset;
}

std::optional<int> inferQualityOffset(const std::filesystem::path& path,
                                      const QualityOffsetOptions& options) {
    io::FastqCodec reader(path);
    return inferQualityOffset(reader, options);
}

}  // namespace fastxio::algo
