#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <lunafmt/cli/lunafmt_cli.h>
#include <lunafmt/run/run_controller.h>
#include <lunafmt/run/run_status.h>
#include <lunafmt/version.hpp>

namespace lunafmt::cli {

namespace {

std::string lowercase(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool given(const CLI::Option* opt) {
    return opt != nullptr && opt->count() > 0;
}

// Parse an optional enum override; the returned error already names the flag
template <typename T, typename Parser>
Result<void> parseOverride(const CLI::Option* opt, const std::string& raw, const char* flag,
                           Parser parser, std::optional<T>& out) {
    if (!given(opt)) {
        return {};
    }
    auto parsed = parser(raw);
    if (!parsed) {
        return withContext(parsed.error(), fmt::format("error: invalid value for {}", flag));
    }
    out = parsed.value();
    return {};
}

} // namespace

Result<common::ColorChoice> parseColorChoice(std::string_view value) {
    const auto v = lowercase(value);
    if (v == "always")
        return common::ColorChoice::Always;
    if (v == "auto")
        return common::ColorChoice::Auto;
    if (v == "never")
        return common::ColorChoice::Never;
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("invalid color '{}' (expected one of: always, auto, never)", value)};
}

LunafmtCLI::LunafmtCLI(std::shared_ptr<const format::IFormatter> formatter)
    : formatter_(std::move(formatter)) {
    app_ = std::make_unique<CLI::App>("A formatter for Lua source files", "lunafmt");
    app_->set_version_flag("--version", std::string(version::string_v));
    registerOptions();
}

LunafmtCLI::~LunafmtCLI() = default;

void LunafmtCLI::registerOptions() {
    // Left optional so an empty list reaches the run and fails with its exit code
    app_->add_option("files", files_,
                     "Files or directories to format, or - to read from stdin");

    app_->add_flag("-c,--check", check_,
                   "Report a diff for files that need formatting instead of writing them");
    globOpt_ = app_->add_option("-g,--glob", globs_,
                                "Include glob replacing the default **/*.lua filter; "
                                "prefix with ! to exclude (repeatable)")
                   ->allow_extra_args(false);
    app_->add_option("--num-threads", numThreads_, "Number of formatting threads")
        ->check(CLI::PositiveNumber)
        ->default_val(run::defaultThreadCount());
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--color", color_, "Use colored output")
        ->transform(CLI::IsMember({"always", "auto", "never"}, CLI::ignore_case))
        ->default_val("auto");

    rangeStartOpt_ = app_->add_option("--range-start", rangeStart_,
                                      "Character offset to start formatting from");
    rangeEndOpt_ =
        app_->add_option("--range-end", rangeEnd_, "Character offset to stop formatting at");

    configPathOpt_ =
        app_->add_option("-f,--config-path", configPath_, "Path to a lunafmt.toml file");
    app_->add_flag("-s,--search-parent-directories", searchParentDirectories_,
                   "Look for a configuration file in parent directories");

    auto* group = app_->add_option_group("Formatting", "Override configuration file values");
    columnWidthOpt_ = group->add_option("--column-width", columnWidth_, "Target line width")
                          ->check(CLI::PositiveNumber);
    lineEndingsOpt_ =
        group->add_option("--line-endings", lineEndings_, "Line endings: Unix or Windows");
    indentTypeOpt_ =
        group->add_option("--indent-type", indentType_, "Indentation: Tabs or Spaces");
    indentWidthOpt_ = group->add_option("--indent-width", indentWidth_, "Width of one indent")
                          ->check(CLI::PositiveNumber);
    quoteStyleOpt_ = group->add_option(
        "--quote-style", quoteStyle_,
        "AutoPreferDouble, AutoPreferSingle, ForceDouble or ForceSingle");
    callParenthesesOpt_ = group->add_option("--call-parentheses", callParentheses_,
                                            "Always, NoSingleString, NoSingleTable or None");
}

void LunafmtCLI::parse(int argc, const char* const* argv) {
    app_->parse(argc, argv);
}

Result<run::RunOptions> LunafmtCLI::buildOptions() const {
    run::RunOptions options;
    options.files.reserve(files_.size());
    for (const auto& f : files_) {
        options.files.emplace_back(f);
    }
    options.check = check_;
    if (given(globOpt_)) {
        options.globs = globs_;
    }
    if (given(rangeStartOpt_)) {
        options.rangeStart = rangeStart_;
    }
    if (given(rangeEndOpt_)) {
        options.rangeEnd = rangeEnd_;
    }
    options.numThreads = numThreads_;
    options.verbose = verbose_;

    auto color = parseColorChoice(color_);
    if (!color) {
        return withContext(color.error(), "error: invalid value for --color");
    }
    options.color = color.value();

    if (given(configPathOpt_)) {
        options.configPath = std::filesystem::path(configPath_);
    }
    options.searchParentDirectories = searchParentDirectories_;

    auto& overrides = options.overrides;
    if (given(columnWidthOpt_)) {
        overrides.columnWidth = columnWidth_;
    }
    if (given(indentWidthOpt_)) {
        overrides.indentWidth = indentWidth_;
    }
    if (auto r = parseOverride(lineEndingsOpt_, lineEndings_, "--line-endings",
                               config::parseLineEndings, overrides.lineEndings);
        !r) {
        return r.error();
    }
    if (auto r = parseOverride(indentTypeOpt_, indentType_, "--indent-type",
                               config::parseIndentType, overrides.indentType);
        !r) {
        return r.error();
    }
    if (auto r = parseOverride(quoteStyleOpt_, quoteStyle_, "--quote-style",
                               config::parseQuoteStyle, overrides.quoteStyle);
        !r) {
        return r.error();
    }
    if (auto r = parseOverride(callParenthesesOpt_, callParentheses_, "--call-parentheses",
                               config::parseCallParentheses, overrides.callParentheses);
        !r) {
        return r.error();
    }
    return options;
}

void LunafmtCLI::configureLogging() const {
    auto parseLevel = [](std::string_view s) -> std::optional<spdlog::level::level_enum> {
        const auto v = lowercase(s);
        if (v == "trace")
            return spdlog::level::trace;
        if (v == "debug")
            return spdlog::level::debug;
        if (v == "info")
            return spdlog::level::info;
        if (v == "warn" || v == "warning")
            return spdlog::level::warn;
        if (v == "error" || v == "err")
            return spdlog::level::err;
        if (v == "off" || v == "none")
            return spdlog::level::off;
        return std::nullopt;
    };

    if (const char* envLvl = std::getenv("LUNAFMT_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int LunafmtCLI::run(int argc, char* argv[]) {
    try {
        parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    configureLogging();

    auto options = buildOptions();
    if (!options) {
        spdlog::error("{}", options.error().message);
        return run::RunStatus::kFailure;
    }

    try {
        run::RunController controller(formatter_);
        return controller.run(options.value());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return run::RunStatus::kFailure;
    }
}

} // namespace lunafmt::cli
