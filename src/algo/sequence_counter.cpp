// =============================================================================
// fastx-io - Sequence Counter Implementation
// =============================================================================

#include "fastxio/algo/sequence_counter.h"

#include <string>

#include "fastxio/common/error.h"
#include "fastxio/common/logger.h"
#include "fastxio/io/fasta_codec.h"
#include "fastxio/io/text_stream.h"

namespace fastxio::algo {

namespace {

constexpr std::uint64_t kFastqLinesPerRecord = 4;

}  // namespace

LineCounts countLines(const std::filesystem::path& path, std::optional<char> prefix) {
    auto stream = unwrapOrThrow(io::TextStream::open(path, io::OpenMode::kRead));

    LineCounts counts;
    std::string line;
    while (stream->readLine(line)) {
        ++counts.lines;
        if (prefix && !line.empty() && line.front() == *prefix) {
            ++counts.prefixed;
        }
    }
    if (stream->hasError()) {
        throw IOError(ErrorCode::kDecompressionFailed,
                      "Failed to read " + path.string() + " after " +
                          std::to_string(counts.lines) + " lines",
                      ErrorContext(path.string()).withLine(counts.lines + 1));
    }

    FASTXIO_LOG_DEBUG("Counted {} lines in {}", counts.lines, path.string());
    return counts;
}

std::uint64_t countFastqRecords(const std::filesystem::path& path) {
    return countLines(path).lines / kFastqLinesPerRecord;
}

std::uint64_t countFastaRecords(const std::filesystem::path& path) {
    return countLines(path, io::kFastaHeaderPrefix).prefixed;
}

}  // namespace fastxio::algo
