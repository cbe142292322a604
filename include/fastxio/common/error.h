// =============================================================================
// fastx-io - Errors
// =============================================================================
// Exception hierarchy and std::expected-based results shared by the library
// and the command-line tool.
//
// Library code throws a FastxException subclass when a record or file cannot
// be processed. Functions that are expected to fail in normal operation
// (opening a file, sniffing its compression) return Result<T> instead, and
// callers turn it into an exception with unwrapOrThrow() when they cannot
// recover.
//
// Every ErrorCode doubles as the process exit code of the fastxio tool:
//   0 success, 1 usage, 2 I/O, 3 unrecognized format, 4 parse failure,
//   5 symbol without complement, 6-8 refined I/O failures.
// =============================================================================

#ifndef FASTXIO_COMMON_ERROR_H
#define FASTXIO_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace fastxio {

// =============================================================================
// Error Codes
// =============================================================================

/// @brief Failure categories; the numeric value is the CLI exit code.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,
    kIOError = 2,
    kFormatError = 3,          ///< File is neither FASTQ nor FASTA
    kParseError = 4,           ///< Record lines missing or malformed
    kInvalidSymbol = 5,        ///< Residue absent from a complement table
    kFileOpenFailed = 6,
    kDecompressionFailed = 7,  ///< Corrupt or truncated gzip data
    kInvalidState = 8          ///< Operation on a closed or wrong-mode stream
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Short category label used as the prefix of what().
[[nodiscard]] std::string_view errorCodeToString(ErrorCode code) noexcept;

// =============================================================================
// ErrorContext
// =============================================================================

/// @brief Where in the input a failure happened.
struct ErrorContext {
    std::string filePath;

    /// @brief 1-based line of the decompressed text.
    std::optional<std::uint64_t> lineNumber;

    /// @brief 1-based index of the record being read.
    std::optional<std::uint64_t> recordNumber;

    ErrorContext() = default;
    explicit ErrorContext(std::string path) : filePath(std::move(path)) {}

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withRecord(std::uint64_t record) {
        recordNumber = record;
        return *this;
    }

    /// @brief Render as "file: x, line: n, record: m", omitting unset parts.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base class of every exception thrown by fastx-io.
class FastxException : public std::exception {
public:
    FastxException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        buildWhat();
    }

    FastxException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        buildWhat();
    }

    /// @brief "[category] message (context)".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message without category or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    void buildWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

/// @brief Bad command-line usage, e.g. an output that would clobber a file.
class UsageError : public FastxException {
public:
    explicit UsageError(std::string message)
        : FastxException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Open, read, write or decompression failure.
/// @note The code defaults to kIOError; streams refine it (kFileOpenFailed,
///       kDecompressionFailed, kInvalidState).
class IOError : public FastxException {
public:
    explicit IOError(std::string message)
        : FastxException(ErrorCode::kIOError, std::move(message)) {}

    IOError(ErrorCode code, std::string message) : FastxException(code, std::move(message)) {}

    IOError(ErrorCode code, std::string message, ErrorContext context)
        : FastxException(code, std::move(message), std::move(context)) {}

    /// @brief Append the system error text to the message.
    IOError(std::string message, std::error_code ec)
        : FastxException(ErrorCode::kIOError, withSystemError(message, ec)), systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief File content matches no supported sequence format.
class FormatError : public FastxException {
public:
    explicit FormatError(std::string message)
        : FastxException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : FastxException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief A record cannot be parsed. Codecs always attach file and line.
class ParseError : public FastxException {
public:
    explicit ParseError(std::string message)
        : FastxException(ErrorCode::kParseError, std::move(message)) {}

    ParseError(std::string message, ErrorContext context)
        : FastxException(ErrorCode::kParseError, std::move(message), std::move(context)) {}

    [[nodiscard]] std::optional<std::uint64_t> lineNumber() const noexcept {
        return context_ ? context_->lineNumber : std::nullopt;
    }
};

/// @brief A residue has no complement in the selected table.
class InvalidSymbolError : public FastxException {
public:
    explicit InvalidSymbolError(std::string message)
        : FastxException(ErrorCode::kInvalidSymbol, std::move(message)) {}

    /// @param position 0-based index of the symbol in the input residues.
    InvalidSymbolError(char symbol, std::size_t position)
        : FastxException(ErrorCode::kInvalidSymbol, describeSymbol(symbol, position)),
          symbol_(symbol) {}

    [[nodiscard]] std::optional<char> symbol() const noexcept { return symbol_; }

private:
    static std::string describeSymbol(char symbol, std::size_t position);

    std::optional<char> symbol_;
};

// =============================================================================
// Result
// =============================================================================

/// @brief Error half of a Result.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Capture an exception; its context is folded into the message.
    explicit Error(const FastxException& ex);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the FastxException subclass matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<std::monostate>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Take the value of a Result or throw its error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (!result) {
        result.error().throwException();
    }
    return std::move(*result);
}

inline void unwrapOrThrow(const VoidResult& result) {
    if (!result) {
        result.error().throwException();
    }
}

}  // namespace fastxio

#endif  // FASTXIO_COMMON_ERROR_H
