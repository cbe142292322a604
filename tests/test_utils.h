// =============================================================================
// fastx-io - Test Utilities
// =============================================================================
// Temporary files and fixture writers shared by the test executables.
// =============================================================================

#ifndef FASTXIO_TESTS_TEST_UTILS_H
#define FASTXIO_TESTS_TEST_UTILS_H

#include <zlib.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace fastxio::test {

/// @brief Unique path in the temporary directory.
[[nodiscard]] inline std::filesystem::path tempFilePath(std::string_view suffix = ".txt") {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("fastxio_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + std::string(suffix));
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief Write bytes to a file, replacing it.
inline void writeTextFile(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("cannot write fixture " + path.string());
    }
}

/// @brief Write content as a single gzip member with zlib's gz* API.
/// @param append Add a new member instead of replacing the file.
inline void writeGzipFile(const std::filesystem::path& path, std::string_view content,
                          bool append = false) {
    gzFile file = gzopen(path.c_str(), append ? "ab" : "wb");
    if (file == nullptr) {
        throw std::runtime_error("cannot open gzip fixture " + path.string());
    }
    int written = content.empty()
                      ? 0
                      : gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
    int closed = gzclose(file);
    if (written != static_cast<int>(content.size()) || closed != Z_OK) {
        throw std::runtime_error("cannot write gzip fixture " + path.string());
    }
}

/// @brief Read a whole file as raw bytes.
[[nodiscard]] inline std::string readRawFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

/// @brief Read a whole gzip file (all members) with zlib's gz* API.
[[nodiscard]] inline std::string readGzipFile(const std::filesystem::path& path) {
    gzFile file = gzopen(path.c_str(), "rb");
    if (file == nullptr) {
        throw std::runtime_error("cannot open gzip file " + path.string());
    }
    std::string content;
    char buffer[4096];
    int n = 0;
    while ((n = gzread(file, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<std::size_t>(n));
    }
    gzclose(file);
    if (n < 0) {
        throw std::runtime_error("corrupt gzip file " + path.string());
    }
    return content;
}

}  // namespace fastxio::test

#endif  // FASTXIO_TESTS_TEST_UTILS_H
