// =============================================================================
// fastx-io - Compressed Stream Support
// =============================================================================
// Transparent gzip support for sequence files.
//
// This module provides:
// - Compression detection from magic bytes (read side) and from the file
//   name suffix (write side)
// - GzipStreamBuf: streaming inflate, multi-member aware
// - GzipOutputStreamBuf: streaming deflate with a gzip wrapper
// - CompressedInputStream / CompressedOutputStream: std::istream and
//   std::ostream that pick plain or gzip I/O for a path
//
// Read and write paths detect compression differently: reading sniffs the
// content, writing trusts the ".gz" suffix. Appending to a ".gz" file adds a
// new gzip member, which GzipStreamBuf reads back as one stream.
//
// Usage:
//   CompressedInputStream in("/path/to/reads.fastq.gz");
//   std::string line;
//   while (std::getline(in, line)) { ... }
// =============================================================================

#ifndef FASTXIO_IO_COMPRESSED_STREAM_H
#define FASTXIO_IO_COMPRESSED_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "fastxio/common/error.h"

namespace fastxio::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Uncompressed (plain text)
    kGzip = 1   ///< gzip (.gz)
};

/// @brief Default zlib buffer size for both directions.
inline constexpr std::size_t kDefaultStreamBufferSize = 64 * 1024;

/// @brief Default gzip compression level used when writing.
inline constexpr int kDefaultGzipLevel = 6;

/// @brief Detect compression format from file magic bytes.
/// @param data First bytes of the file.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept;

/// @brief Detect compression format from the file name suffix.
/// @note Only ".gz" selects gzip.
[[nodiscard]] CompressionFormat detectCompressionFormatFromExtension(
    const std::filesystem::path& path);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format) noexcept;

/// @brief Sniff the first bytes of a file.
/// @return The detected format, or an error if the file cannot be opened.
[[nodiscard]] Result<CompressionFormat> sniffCompressionFormat(const std::filesystem::path& path);

/// @brief Return true if the file content is gzip compressed.
/// @note Unreadable files report false.
[[nodiscard]] bool isGzip(const std::filesystem::path& path);

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Input stream buffer inflating gzip data from a source stream.
/// @note Concatenated gzip members are decoded as a single stream. NUL bytes
///       between or after members are skipped.
/// @note Corrupt or truncated input raises IOError from underflow(); the
///       owning std::istream turns it into badbit.
class GzipStreamBuf : public std::streambuf {
public:
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = kDefaultStreamBufferSize);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    int_type underflow() override;

private:
    void initZlib();
    void cleanupZlib() noexcept;

    /// @brief Refill compressed input from the source.
    /// @return false once the source is exhausted.
    bool fillInput();

    /// @brief Skip NUL padding after a finished member.
    /// @return true if another member starts in the remaining input.
    bool skipPadding();

    /// @brief Decompress more data into the output buffer.
    /// @return Number of bytes produced; 0 only at the end of the data.
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool streamEnd_ = false;
};

// =============================================================================
// GzipOutputStreamBuf
// =============================================================================

/// @brief Output stream buffer deflating into gzip format on a sink stream.
/// @note finish() must run before the sink is closed to write the trailer;
///       the destructor does it when nobody else did.
class GzipOutputStreamBuf : public std::streambuf {
public:
    GzipOutputStreamBuf(std::ostream& sink, int level = kDefaultGzipLevel,
                        std::size_t bufferSize = kDefaultStreamBufferSize);

    ~GzipOutputStreamBuf() override;

    GzipOutputStreamBuf(const GzipOutputStreamBuf&) = delete;
    GzipOutputStreamBuf& operator=(const GzipOutputStreamBuf&) = delete;
    GzipOutputStreamBuf(GzipOutputStreamBuf&&) = delete;
    GzipOutputStreamBuf& operator=(GzipOutputStreamBuf&&) = delete;

    /// @brief Flush pending input and write the gzip trailer.
    /// @throws IOError if compression or the sink write fails.
    void finish();

    /// @brief Check if the gzip trailer has been written.
    [[nodiscard]] bool finished() const noexcept { return finished_; }

protected:
    int_type overflow(int_type ch) override;
    int sync() override;

private:
    void initZlib(int level);
    void cleanupZlib() noexcept;

    /// @brief Compress the put area with the given zlib flush mode.
    void deflateBuffer(int flush);

    std::ostream* sink_ = nullptr;
    std::vector<char> inputBuffer_;
    std::vector<char> outputBuffer_;
    void* zlibStream_ = nullptr;
    bool finished_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent gzip decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file, sniffing its content for gzip.
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path,
                                   std::size_t bufferSize = kDefaultStreamBufferSize);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kNone;
};

// =============================================================================
// CompressedOutputStream
// =============================================================================

/// @brief Output stream writing plain text or gzip depending on the suffix.
class CompressedOutputStream : public std::ostream {
public:
    /// @brief Open a file for writing.
    /// @param path Output path; a ".gz" suffix selects gzip.
    /// @param append Append to the file instead of truncating it.
    /// @param level gzip compression level (1-9).
    /// @throws IOError if the file cannot be opened.
    CompressedOutputStream(const std::filesystem::path& path, bool append,
                           int level = kDefaultGzipLevel);

    ~CompressedOutputStream() override;

    CompressedOutputStream(const CompressedOutputStream&) = delete;
    CompressedOutputStream& operator=(const CompressedOutputStream&) = delete;
    CompressedOutputStream(CompressedOutputStream&&) = delete;
    CompressedOutputStream& operator=(CompressedOutputStream&&) = delete;

    /// @brief Finish compression and close the file.
    /// @throws IOError if pending data cannot be written.
    void close();

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    std::filesystem::path path_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::unique_ptr<GzipOutputStreamBuf> compressBuf_;
    CompressionFormat format_ = CompressionFormat::kNone;
};

}  // namespace fastxio::io

#endif  // FASTXIO_IO_COMPRESSED_STREAM_H
