// =============================================================================
// fastx-io - FASTA/FASTQ Toolkit
// =============================================================================
// Main entry point for the fastxio command-line tool.
//
// Subcommands:
// - info:   compression, format, record count and quality offset of a file
// - revcom: reverse complement every record of a file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "fastxio/common/error.h"
#include "fastxio/common/logger.h"

#include "commands/info_command.h"
#include "commands/revcom_command.h"

namespace {

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "fastxio: streaming FASTA/FASTQ toolkit\n"
    "Plain and gzip inputs are detected from their content.";

// =============================================================================
// Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = warnings, 1 = info, 2 = debug, 3 = trace
    bool quiet = false;
    std::string logFile;
    std::string logLevel;  // overrides -v/-q when set
};

GlobalOptions gOptions;

struct CliInfoOptions {
    std::string input;
    bool json = false;
};

CliInfoOptions gInfoOpts;

struct CliRevcomOptions {
    std::string input;
    std::string output;
    bool rna = false;
    bool force = false;
};

CliRevcomOptions gRevcomOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display sequence file information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input FASTA/FASTQ file (plain or gzip)")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

void setupRevcomCommand(CLI::App& app) {
    auto* revcom = app.add_subcommand("revcom", "Reverse complement every record of a file");
    revcom->alias("rc");

    revcom->add_option("-i,--input", gRevcomOpts.input, "Input FASTA/FASTQ file (plain or gzip)")
        ->required()
        ->check(CLI::ExistingFile);

    revcom->add_option("-o,--output", gRevcomOpts.output,
                       "Output file, same format as the input (gzip if it ends with .gz)")
        ->required();

    revcom->add_flag("--rna", gRevcomOpts.rna, "Use the RNA complement table (A -> U)");

    revcom->add_flag("-f,--force", gRevcomOpts.force, "Overwrite existing output file");
}

fastxio::log::Level selectLogLevel() {
    if (!gOptions.logLevel.empty()) {
        return fastxio::log::levelFromString(gOptions.logLevel);
    }
    if (gOptions.quiet) {
        return fastxio::log::Level::kError;
    }
    switch (gOptions.verbosity) {
        case 0:
            return fastxio::log::Level::kWarning;
        case 1:
            return fastxio::log::Level::kInfo;
        case 2:
            return fastxio::log::Level::kDebug;
        default:
            return fastxio::log::Level::kTrace;
    }
}

int runInfo() {
    auto cmd = fastxio::commands::createInfoCommand(gInfoOpts.input, gInfoOpts.json);
    return cmd->execute();
}

int runRevcom() {
    fastxio::commands::RevcomOptions opts;
    opts.inputPath = gRevcomOpts.input;
    opts.outputPath = gRevcomOpts.output;
    opts.rna = gRevcomOpts.rna;
    opts.forceOverwrite = gRevcomOpts.force;

    fastxio::commands::RevcomCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v info, -vv debug, -vvv trace)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");
    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");
    app.add_option("--log-level", gOptions.logLevel, "Log level (overrides -v/-q)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"}));

    setupInfoCommand(app);
    setupRevcomCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        fastxio::log::Config logConfig;
        logConfig.level = selectLogLevel();
        logConfig.logFile = gOptions.logFile;
        fastxio::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_FAILURE;
    try {
        if (app.got_subcommand("info")) {
            exitCode = runInfo();
        } else if (app.got_subcommand("revcom")) {
            exitCode = runRevcom();
        }
    } catch (const fastxio::FastxException& ex) {
        FASTXIO_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        FASTXIO_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    fastxio::log::shutdown();
    return exitCode;
}
