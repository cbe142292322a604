// =============================================================================
// fastx-io - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iostream>
#include <ostream>

#include <fmt/format.h>

#include "fastxio/algo/quality_offset.h"
#include "fastxio/algo/sequence_counter.h"
#include "fastxio/common/error.h"
#include "fastxio/common/logger.h"
#include "fastxio/io/format_detector.h"

namespace fastxio::commands {

namespace {

/// @brief Escape a string for a JSON string literal.
std::string jsonEscape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

}  // namespace

FileInfo collectFileInfo(const std::filesystem::path& path) {
    FileInfo info;
    info.path = path;

    std::error_code ec;
    info.sizeBytes = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat " + path.string(), ec);
    }
    info.compression = unwrapOrThrow(io::sniffCompressionFormat(path));

    info.format = io::detectSequenceFormat(path);
    switch (info.format) {
        case io::SequenceFormat::kFastq:
            info.records = algo::countFastqRecords(path);
            info.qualityOffset = algo::inferQualityOffset(path);
            break;
        case io::SequenceFormat::kFasta:
            info.records = algo::countFastaRecords(path);
            break;
        case io::SequenceFormat::kUnknown:
            throw FormatError("The file " + path.string() + " has an unrecognized format",
                              ErrorContext(path.string()));
    }
    return info;
}

void printTextInfo(const FileInfo& info, std::ostream& out) {
    out << "=== Sequence File Information ===\n\n";
    out << fmt::format("File:           {}\n", info.path.string());
    out << fmt::format("Size:           {} bytes\n", info.sizeBytes);
    out << fmt::format("Compression:    {}\n", io::compressionFormatName(info.compression));
    out << fmt::format("Format:         {}\n", io::sequenceFormatName(info.format));
    out << fmt::format("Records:        {}\n", info.records);
    if (info.format == io::SequenceFormat::kFastq) {
        out << fmt::format("Quality offset: {}\n",
                           info.qualityOffset ? std::to_string(*info.qualityOffset)
                                              : std::string("undetermined"));
    }
}

void printJsonInfo(const FileInfo& info, std::ostream& out) {
    out << "{\n";
    out << fmt::format("  \"file\": \"{}\",\n", jsonEscape(info.path.string()));
    out << fmt::format("  \"size\": {},\n", info.sizeBytes);
    out << fmt::format("  \"compression\": \"{}\",\n", io::compressionFormatName(info.compression));
    out << fmt::format("  \"format\": \"{}\",\n", io::sequenceFormatName(info.format));
    out << fmt::format("  \"records\": {},\n", info.records);
    out << fmt::format("  \"quality_offset\": {}\n",
                       info.qualityOffset ? std::to_string(*info.qualityOffset)
                                          : std::string("null"));
    out << "}\n";
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

int InfoCommand::execute() {
    try {
        auto info = collectFileInfo(options_.inputPath);
        if (options_.jsonOutput) {
            printJsonInfo(info, std::cout);
        } else {
            printTextInfo(info, std::cout);
        }
        std::cout.flush();
        return 0;
    } catch (const FastxException& e) {
        FASTXIO_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    }
}

std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath, bool jsonOutput) {
    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace fastxio::commands
