// =============================================================================
// fastx-io - Reverse Complement Command Implementation
// =============================================================================

#include "revcom_command.h"

#include <system_error>

#include "fastxio/common/error.h"
#include "fastxio/common/logger.h"
#include "fastxio/io/format_detector.h"

namespace fastxio::commands {

namespace {

void removePartialOutput(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        FASTXIO_LOG_WARNING("Failed to remove partial output {}: {}", path.string(), ec.message());
    }
}

}  // namespace

std::uint64_t reverseComplementFile(const RevcomOptions& options) {
    std::error_code ec;
    if (std::filesystem::equivalent(options.inputPath, options.outputPath, ec)) {
        throw UsageError("Input and output are the same file: " + options.inputPath.string());
    }
    if (std::filesystem::exists(options.outputPath) && !options.forceOverwrite) {
        throw UsageError("Output file exists (use --force to overwrite): " +
                         options.outputPath.string());
    }

    auto reader = io::openSequenceReader(options.inputPath);
    auto writer = io::openSequenceCodec(options.outputPath, reader->format(), io::OpenMode::kWrite);

    std::uint64_t written = 0;
    try {
        while (auto record = reader->nextSeq()) {
            writer->write(options.rna ? record->rnaReverseComplement()
                                      : record->dnaReverseComplement());
            ++written;
        }
        writer->close();
    } catch (const FastxException&) {
        writer.reset();
        removePartialOutput(options.outputPath);
        throw;
    }

    FASTXIO_LOG_INFO("Wrote {} reverse-complemented {} records to {}", written,
                     io::sequenceFormatName(reader->format()), options.outputPath.string());
    return written;
}

RevcomCommand::RevcomCommand(RevcomOptions options) : options_(std::move(options)) {}

int RevcomCommand::execute() {
    try {
        (void)reverseComplementFile(options_);
        return 0;
    } catch (const FastxException& e) {
        FASTXIO_LOG_ERROR("Reverse complement failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace fastxio::commands
