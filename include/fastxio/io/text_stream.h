// =============================================================================
// fastx-io - Text Stream
// =============================================================================
// Line-oriented file handle with transparent gzip support.
//
// A TextStream is opened in one of three modes:
// - kRead:   gzip detected from the file content
// - kWrite:  gzip selected by a ".gz" suffix, file truncated
// - kAppend: gzip selected by a ".gz" suffix, a new gzip member is appended
//
// Positions reported by tell() count bytes of the decompressed text consumed
// so far, so "no new bytes after a read attempt" means end of stream whatever
// the compression.
//
// Usage:
//   auto stream = TextStream::open("reads.fq.gz", OpenMode::kRead);
//   if (!stream) { ... stream.error() ... }
//   std::string line;
//   while ((*stream)->readLine(line)) { ... }
// =============================================================================

#ifndef FASTXIO_IO_TEXT_STREAM_H
#define FASTXIO_IO_TEXT_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "fastxio/common/error.h"
#include "fastxio/io/compressed_stream.h"

namespace fastxio::io {

/// @brief Open mode of a TextStream.
enum class OpenMode : std::uint8_t {
    kRead = 0,
    kWrite = 1,
    kAppend = 2
};

/// @brief Get a short name for an open mode ("r", "w", "a").
[[nodiscard]] std::string_view openModeName(OpenMode mode) noexcept;

/// @brief Configuration options for a TextStream.
struct TextStreamOptions {
    /// @brief zlib buffer size for gzip input.
    std::size_t bufferSize = kDefaultStreamBufferSize;

    /// @brief gzip compression level for ".gz" output.
    int gzipLevel = kDefaultGzipLevel;
};

/// @brief Line-oriented readable/writable file handle.
///
/// Thread Safety: not thread-safe; one owner at a time.
class TextStream {
public:
    /// @brief Open a file without throwing.
    /// @return The stream, or kFileOpenFailed / kIOError.
    [[nodiscard]] static Result<std::unique_ptr<TextStream>> open(
        const std::filesystem::path& path, OpenMode mode = OpenMode::kRead,
        TextStreamOptions options = {});

    /// @brief Open a file.
    /// @throws IOError if the file cannot be opened.
    explicit TextStream(std::filesystem::path path, OpenMode mode = OpenMode::kRead,
                        TextStreamOptions options = {});

    /// @brief Destructor; closes the stream if still open.
    ~TextStream();

    TextStream(const TextStream&) = delete;
    TextStream& operator=(const TextStream&) = delete;
    TextStream(TextStream&&) = delete;
    TextStream& operator=(TextStream&&) = delete;

    /// @brief Read the next line, without its line terminator.
    /// @param line Receives the line content.
    /// @return false at end of stream, on a read error, or in write modes.
    /// @note A final line without '\n' is still returned.
    [[nodiscard]] bool readLine(std::string& line);

    /// @brief Number of decompressed bytes consumed (read) or written.
    [[nodiscard]] std::uint64_t tell() const noexcept { return position_; }

    /// @brief Write text as-is.
    /// @throws IOError on write failure, or if the stream is closed or read-only.
    void write(std::string_view text);

    /// @brief Flush and close the stream. Idempotent.
    /// @throws IOError if buffered data cannot be written.
    void close();

    /// @brief Check if the stream is open.
    [[nodiscard]] bool isOpen() const noexcept { return isOpen_; }

    /// @brief Check if a read failed for a reason other than end of stream.
    /// @note Set by corrupt or truncated gzip input and I/O errors.
    [[nodiscard]] bool hasError() const noexcept { return hasError_; }

    /// @brief Check if the underlying file is gzip compressed.
    [[nodiscard]] bool isCompressed() const noexcept {
        return format_ != CompressionFormat::kNone;
    }

    /// @brief Get the compression format.
    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    /// @brief Get the file path.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Get the open mode.
    [[nodiscard]] OpenMode mode() const noexcept { return mode_; }

private:
    std::filesystem::path path_;
    OpenMode mode_;
    std::unique_ptr<CompressedInputStream> input_;
    std::unique_ptr<CompressedOutputStream> output_;
    CompressionFormat format_ = CompressionFormat::kNone;
    std::uint64_t position_ = 0;
    bool isOpen_ = false;
    bool hasError_ = false;
};

/// @brief Strip leading and trailing whitespace.
[[nodiscard]] std::string_view strip(std::string_view text) noexcept;

}  // namespace fastxio::io

#endif  // FASTXIO_IO_TEXT_STREAM_H
