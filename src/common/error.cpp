// =============================================================================
// fastx-io - Errors Implementation
// =============================================================================

#include "fastxio/common/error.h"

#include <cctype>

#include <fmt/format.h>

namespace fastxio {

std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kParseError:
            return "parse error";
        case ErrorCode::kInvalidSymbol:
            return "invalid symbol";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

std::string ErrorContext::format() const {
    std::string text;
    auto append = [&text](std::string_view part) {
        if (!text.empty()) {
            text += ", ";
        }
        text += part;
    };

    if (!filePath.empty()) {
        append("file: " + filePath);
    }
    if (lineNumber) {
        append(fmt::format("line: {}", *lineNumber));
    }
    if (recordNumber) {
        append(fmt::format("record: {}", *recordNumber));
    }
    return text;
}

void FastxException::buildWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_) {
        auto where = context_->format();
        if (!where.empty()) {
            what_ += fmt::format(" ({})", where);
        }
    }
}

std::string IOError::withSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {}", message, ec.message());
}

std::string InvalidSymbolError::describeSymbol(char symbol, std::size_t position) {
    const auto byte = static_cast<unsigned char>(symbol);
    if (std::isgraph(byte)) {
        return fmt::format("no complement for symbol '{}' at position {}", symbol, position);
    }
    return fmt::format("no complement for byte 0x{:02x} at position {}", byte, position);
}

Error::Error(const FastxException& ex) : code_(ex.code()), message_(ex.message()) {
    if (ex.context()) {
        auto where = ex.context()->format();
        if (!where.empty()) {
            message_ += fmt::format(" ({})", where);
        }
    }
}

void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kParseError:
            throw ParseError(message_);
        case ErrorCode::kInvalidSymbol:
            throw InvalidSymbolError(message_);
        case ErrorCode::kIOError:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kDecompressionFailed:
        case ErrorCode::kInvalidState:
            throw IOError(code_, message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw FastxException(code_, message_);
}

}  // namespace fastxio
