// =============================================================================
// fastx-io - Text Stream Implementation
// =============================================================================

#include "fastxio/io/text_stream.h"

#include <cctype>
#include <istream>

#include "fastxio/common/logger.h"

namespace fastxio::io {

std::string_view openModeName(OpenMode mode) noexcept {
    switch (mode) {
        case OpenMode::kRead:
            return "r";
        case OpenMode::kWrite:
            return "w";
        case OpenMode::kAppend:
            return "a";
    }
    return "?";
}

// =============================================================================
// Opening and Closing
// =============================================================================

Result<std::unique_ptr<TextStream>> TextStream::open(const std::filesystem::path& path,
                                                     OpenMode mode, TextStreamOptions options) {
    try {
        return std::make_unique<TextStream>(path, mode, options);
    } catch (const FastxException& ex) {
        return std::unexpected(Error(ex));
    }
}

TextStream::TextStream(std::filesystem::path path, OpenMode mode, TextStreamOptions options)
    : path_(std::move(path)), mode_(mode) {
    if (mode_ == OpenMode::kRead) {
        input_ = std::make_unique<CompressedInputStream>(path_, options.bufferSize);
        format_ = input_->format();
    } else {
        output_ = std::make_unique<CompressedOutputStream>(path_, mode_ == OpenMode::kAppend,
                                                           options.gzipLevel);
        format_ = output_->format();
    }

    isOpen_ = true;
    FASTXIO_LOG_DEBUG("Opened {} in mode '{}' (compression: {})", path_.string(),
                      openModeName(mode_), compressionFormatName(format_));
}

TextStream::~TextStream() {
    if (!isOpen_) {
        return;
    }
    try {
        close();
    } catch (const FastxException& ex) {
        FASTXIO_LOG_ERROR("Failed to close {}: {}", path_.string(), ex.what());
    }
}

void TextStream::close() {
    if (!isOpen_) {
        return;
    }
    isOpen_ = false;

    input_.reset();
    if (output_) {
        output_->close();
        output_.reset();
    }
    FASTXIO_LOG_DEBUG("Closed {}", path_.string());
}

// =============================================================================
// Reading and Writing
// =============================================================================

bool TextStream::readLine(std::string& line) {
    line.clear();
    if (!isOpen_ || !input_ || hasError_) {
        return false;
    }

    if (!std::getline(*input_, line)) {
        if (input_->bad()) {
            hasError_ = true;
            FASTXIO_LOG_DEBUG("Read error in {} after {} bytes", path_.string(), position_);
        }
        line.clear();
        return false;
    }

    position_ += line.size();
    // getline stops at eof only when the last line has no terminator.
    if (!input_->eof()) {
        ++position_;
    }
    return true;
}

void TextStream::write(std::string_view text) {
    if (!isOpen_ || !output_) {
        throw IOError(ErrorCode::kInvalidState,
                      "Stream is not open for writing: " + path_.string());
    }

    output_->write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!*output_) {
        throw IOError(ErrorCode::kIOError, "Failed to write to " + path_.string());
    }
    position_ += text.size();
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string_view strip(std::string_view text) noexcept {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

}  // namespace fastxio::io
