#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <lunafmt/core/types.h>
#include <lunafmt/format/formatter.h>
#include <lunafmt/run/run_options.h>

namespace lunafmt::cli {

/**
 * Command-line front end: owns the CLI11 app, turns arguments into RunOptions and
 * hands them to a RunController.
 */
class LunafmtCLI {
public:
    explicit LunafmtCLI(
        std::shared_ptr<const format::IFormatter> formatter = format::makeDefaultFormatter());
    ~LunafmtCLI();

    LunafmtCLI(const LunafmtCLI&) = delete;
    LunafmtCLI& operator=(const LunafmtCLI&) = delete;

    /**
     * Parse, configure logging, run, and return the process exit code.
     */
    int run(int argc, char* argv[]);

    /**
     * Parse arguments only. Usage errors, --help and --version surface as CLI::ParseError.
     */
    void parse(int argc, const char* const* argv);

    /**
     * Validate the parsed values and assemble the options for a run.
     */
    Result<run::RunOptions> buildOptions() const;

private:
    void registerOptions();
    void configureLogging() const;

    std::unique_ptr<CLI::App> app_;
    std::shared_ptr<const format::IFormatter> formatter_;

    std::vector<std::string> files_;
    bool check_ = false;
    std::vector<std::string> globs_;
    size_t rangeStart_ = 0;
    size_t rangeEnd_ = 0;
    size_t numThreads_ = run::defaultThreadCount();
    bool verbose_ = false;
    std::string color_ = "auto";

    std::string configPath_;
    bool searchParentDirectories_ = false;
    size_t columnWidth_ = 0;
    std::string lineEndings_;
    std::string indentType_;
    size_t indentWidth_ = 0;
    std::string quoteStyle_;
    std::string callParentheses_;

    CLI::Option* globOpt_ = nullptr;
    CLI::Option* rangeStartOpt_ = nullptr;
    CLI::Option* rangeEndOpt_ = nullptr;
    CLI::Option* configPathOpt_ = nullptr;
    CLI::Option* columnWidthOpt_ = nullptr;
    CLI::Option* lineEndingsOpt_ = nullptr;
    CLI::Option* indentTypeOpt_ = nullptr;
    CLI::Option* indentWidthOpt_ = nullptr;
    CLI::Option* quoteStyleOpt_ = nullptr;
    CLI::Option* callParenthesesOpt_ = nullptr;
};

/**
 * Map the --color argument to a ColorChoice. Case-insensitive.
 */
Result<common::ColorChoice> parseColorChoice(std::string_view value);

} // namespace lunafmt::cli
