// =============================================================================
// fastx-io - Compressed Stream Implementation
// =============================================================================
// gzip detection, inflate and deflate stream buffers using zlib.
// =============================================================================

#include "fastxio/io/compressed_stream.h"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <string>

#include <fmt/format.h>

#include "fastxio/common/logger.h"

namespace fastxio::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Window bits selecting the gzip wrapper for inflate/deflate.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

constexpr int kDeflateMemLevel = 8;

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept {
    if (data.size() >= sizeof(kGzipMagic) &&
        std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0) {
        return CompressionFormat::kGzip;
    }
    return CompressionFormat::kNone;
}

CompressionFormat detectCompressionFormatFromExtension(const std::filesystem::path& path) {
    // Case-sensitive: "reads.GZ" is written as plain text.
    return path.extension() == ".gz" ? CompressionFormat::kGzip : CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) noexcept {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kNone:
            return "none";
    }
    return "unknown";
}

Result<CompressionFormat> sniffCompressionFormat(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return makeError<CompressionFormat>(ErrorCode::kFileOpenFailed,
                                            "Failed to open file: " + path.string());
    }

    std::uint8_t magic[sizeof(kGzipMagic)] = {};
    file.read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(file.gcount());

    return detectCompressionFormat({magic, bytesRead});
}

bool isGzip(const std::filesystem::path& path) {
    auto format = sniffCompressionFormat(path);
    return format.has_value() && *format == CompressionFormat::kGzip;
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto stream = std::make_unique<z_stream>();
    std::memset(stream.get(), 0, sizeof(z_stream));

    int ret = inflateInit2(stream.get(), kGzipWindowBits);
    if (ret != Z_OK) {
        throw IOError(ErrorCode::kDecompressionFailed,
                      "Failed to initialize zlib inflate: " + std::string(zError(ret)));
    }

    zlibStream_ = stream.release();
}

void GzipStreamBuf::cleanupZlib() noexcept {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

bool GzipStreamBuf::fillInput() {
    if (!source_ || source_->eof() || source_->bad()) {
        return false;
    }

    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    if (bytesRead == 0) {
        return false;
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->next_in = inputBuffer_.data();
    stream->avail_in = static_cast<uInt>(bytesRead);
    return true;
}

bool GzipStreamBuf::skipPadding() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    while (true) {
        while (stream->avail_in > 0 && *stream->next_in == 0) {
            ++stream->next_in;
            --stream->avail_in;
        }
        if (stream->avail_in > 0) {
            return true;
        }
        if (!fillInput()) {
            return false;
        }
    }
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    while (true) {
        if (streamEnd_) {
            // Another gzip member may follow the one just finished.
            if (!skipPadding()) {
                return 0;
            }
            inflateReset(stream);
            streamEnd_ = false;
        }

        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());
        stream->avail_out = static_cast<uInt>(outputBuffer_.size());

        int ret = inflate(stream, Z_NO_FLUSH);
        std::size_t produced = outputBuffer_.size() - stream->avail_out;

        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw IOError(ErrorCode::kDecompressionFailed,
                          "Gzip decompression failed: " + std::string(zError(ret)));
        } else if (produced == 0 && stream->avail_in == 0 && !fillInput()) {
            throw IOError(ErrorCode::kDecompressionFailed, "Truncated gzip stream");
        }

        if (produced > 0) {
            return produced;
        }
    }
}

// =============================================================================
// GzipOutputStreamBuf Implementation
// =============================================================================

GzipOutputStreamBuf::GzipOutputStreamBuf(std::ostream& sink, int level, std::size_t bufferSize)
    : sink_(&sink), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib(level);
    setp(inputBuffer_.data(), inputBuffer_.data() + inputBuffer_.size());
}

GzipOutputStreamBuf::~GzipOutputStreamBuf() {
    if (!finished_ && zlibStream_) {
        try {
            finish();
        } catch (const IOError& ex) {
            FASTXIO_LOG_ERROR("Failed to finish gzip stream: {}", ex.what());
        }
    }
    cleanupZlib();
}

void GzipOutputStreamBuf::initZlib(int level) {
    auto stream = std::make_unique<z_stream>();
    std::memset(stream.get(), 0, sizeof(z_stream));

    int ret = deflateInit2(stream.get(), std::clamp(level, 1, 9), Z_DEFLATED, kGzipWindowBits,
                           kDeflateMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw IOError(ErrorCode::kIOError,
                      "Failed to initialize zlib deflate: " + std::string(zError(ret)));
    }

    zlibStream_ = stream.release();
}

void GzipOutputStreamBuf::cleanupZlib() noexcept {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        deflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

void GzipOutputStreamBuf::deflateBuffer(int flush) {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->next_in = reinterpret_cast<Bytef*>(pbase());
    stream->avail_in = static_cast<uInt>(pptr() - pbase());

    int ret = Z_OK;
    do {
        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());
        stream->avail_out = static_cast<uInt>(outputBuffer_.size());

        ret = deflate(stream, flush);
        if (ret == Z_STREAM_ERROR) {
            throw IOError(ErrorCode::kIOError, "Gzip compression failed");
        }

        auto have = outputBuffer_.size() - stream->avail_out;
        if (have > 0) {
            sink_->write(outputBuffer_.data(), static_cast<std::streamsize>(have));
            if (!*sink_) {
                throw IOError(ErrorCode::kIOError, "Failed to write compressed data");
            }
        }
    } while (stream->avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));

    setp(inputBuffer_.data(), inputBuffer_.data() + inputBuffer_.size());
}

GzipOutputStreamBuf::int_type GzipOutputStreamBuf::overflow(int_type ch) {
    if (finished_) {
        return traits_type::eof();
    }

    deflateBuffer(Z_NO_FLUSH);

    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int GzipOutputStreamBuf::sync() {
    if (finished_) {
        return 0;
    }
    deflateBuffer(Z_NO_FLUSH);
    return 0;
}

void GzipOutputStreamBuf::finish() {
    if (finished_) {
        return;
    }

    deflateBuffer(Z_FINISH);
    finished_ = true;

    sink_->flush();
    if (!*sink_) {
        throw IOError(ErrorCode::kIOError, "Failed to flush compressed data");
    }
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path,
                                             std::size_t bufferSize)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file: " + path.string());
    }

    std::uint8_t magic[sizeof(kGzipMagic)] = {};
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());

    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    if (format_ == CompressionFormat::kGzip) {
        decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_, bufferSize);
        rdbuf(decompressBuf_.get());
        FASTXIO_LOG_DEBUG("Opened gzip compressed input: {}", path.string());
    } else {
        rdbuf(fileStream_->rdbuf());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

// =============================================================================
// CompressedOutputStream Implementation
// =============================================================================

CompressedOutputStream::CompressedOutputStream(const std::filesystem::path& path, bool append,
                                               int level)
    : std::ostream(nullptr), path_(path) {
    auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    fileStream_ = std::make_unique<std::ofstream>(path, mode);
    if (!fileStream_->is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to open file for writing: " + path.string());
    }

    format_ = detectCompressionFormatFromExtension(path);

    if (format_ == CompressionFormat::kGzip) {
        compressBuf_ = std::make_unique<GzipOutputStreamBuf>(*fileStream_, level);
        rdbuf(compressBuf_.get());
        FASTXIO_LOG_DEBUG("Opened gzip compressed output: {} (level {})", path.string(), level);
    } else {
        rdbuf(fileStream_->rdbuf());
    }
}

CompressedOutputStream::~CompressedOutputStream() = default;

void CompressedOutputStream::close() {
    if (!fileStream_ || !fileStream_->is_open()) {
        return;
    }

    flush();
    if (compressBuf_) {
        compressBuf_->finish();
    }
    fileStream_->close();

    if (bad() || fileStream_->fail()) {
        throw IOError(ErrorCode::kIOError, "Failed to close output file: " + path_.string());
    }
}

}  // namespace fastxio::io
