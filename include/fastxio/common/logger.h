// =============================================================================
// fastx-io - Logging
// =============================================================================
// Process-wide Quill logger.
//
// Library code logs through the FASTXIO_LOG_* macros, which do nothing until
// init() has run: embedding applications and unit tests that never set up
// logging get silent codecs. The fastxio tool initializes it from its
// -v/-q/--log-level/--log-file options.
//
// Usage:
//   fastxio::log::Config config;
//   config.level = fastxio::log::Level::kDebug;
//   fastxio::log::init(config);
//   FASTXIO_LOG_INFO("Read {} records", count);
// =============================================================================

#ifndef FASTXIO_COMMON_LOGGER_H
#define FASTXIO_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace fastxio::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger setup.
struct Config {
    Level level = Level::kWarning;

    /// @brief Also write to this file when not empty.
    std::string logFile;

    /// @brief Write to the console. Forced on when no file is given.
    bool enableConsole = true;
};

/// @brief Start the Quill backend and create the logger.
/// @note Only the first call has an effect until shutdown().
void init(const Config& config);

/// @brief Get the logger, nullptr before init() or after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

/// @brief Parse a level name (case-insensitive). "warn" and "fatal" are
///        accepted aliases; unknown names give kInfo.
[[nodiscard]] Level levelFromString(std::string_view name) noexcept;

}  // namespace fastxio::log

#define FASTXIO_LOG_IMPL(macro, fmt, ...)                                   \
    do {                                                                    \
        if (quill::Logger* fastxioLogger = fastxio::log::logger()) {        \
            macro(fastxioLogger, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                   \
    } while (false)

#define FASTXIO_LOG_TRACE(fmt, ...) FASTXIO_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FASTXIO_LOG_DEBUG(fmt, ...) FASTXIO_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FASTXIO_LOG_INFO(fmt, ...) FASTXIO_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FASTXIO_LOG_WARNING(fmt, ...) FASTXIO_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FASTXIO_LOG_ERROR(fmt, ...) FASTXIO_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // FASTXIO_COMMON_LOGGER_H
