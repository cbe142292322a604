// =============================================================================
// fastx-io - Logging Implementation
// =============================================================================

#include "fastxio/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace fastxio::log {

namespace {

constexpr const char* kLoggerName = "fastxio";

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

struct LevelEntry {
    std::string_view name;
    Level level;
};

constexpr std::array<LevelEntry, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

quill::LogLevel quillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>("fastxio_console"));
    }
    return sinks;
}

}  // namespace

Level levelFromString(std::string_view name) noexcept {
    auto matches = [name](const LevelEntry& entry) {
        return std::equal(name.begin(), name.end(), entry.name.begin(), entry.name.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    };
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(), matches);
    return it != kLevelNames.end() ? it->level : Level::kInfo;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});
    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, makeSinks(config));
    created->set_log_level(quillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        current->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace fastxio::log
