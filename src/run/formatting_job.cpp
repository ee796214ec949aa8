#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <lunafmt/common/utf8_utils.h>
#include <lunafmt/diff/diff_renderer.h>
#include <lunafmt/run/formatting_job.h>

namespace lunafmt::run {

namespace {

Error systemError(ErrorCode fallback) {
    const int err = errno;
    if (err == 0) {
        return Error{fallback};
    }
    const std::error_code ec(err, std::generic_category());
    ErrorCode code = fallback;
    if (ec == std::errc::no_such_file_or_directory)
        code = ErrorCode::FileNotFound;
    else if (ec == std::errc::permission_denied)
        code = ErrorCode::PermissionDenied;
    return Error{code, ec.message()};
}

Result<void> checkUtf8(std::string_view contents) {
    if (auto bad = common::firstInvalidUtf8(contents)) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("stream did not contain valid UTF-8 (byte offset {})", *bad)};
    }
    return {};
}

} // namespace

Result<std::string> readSourceFile(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return systemError(ErrorCode::IOError);
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return systemError(ErrorCode::IOError);
    }
    auto valid = checkUtf8(contents);
    if (!valid) {
        return valid.error();
    }
    return contents;
}

Result<void> writeSourceFile(const std::filesystem::path& path, std::string_view contents) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return systemError(ErrorCode::WriteError);
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
        return systemError(ErrorCode::WriteError);
    }
    return {};
}

JobOutcome FormattingJob::run() const {
    try {
        if (entry_.isStdin()) {
            return formatStdin();
        }
        return formatFile(entry_.path);
    } catch (const std::exception& e) {
        const auto what = entry_.isStdin() ? std::string("stdin") : entry_.path.string();
        return JobOutcome::failed(
            Error{ErrorCode::InternalError, fmt::format("Could not format {}: {}", what, e.what())});
    }
}

JobOutcome FormattingJob::formatFile(const std::filesystem::path& path) const {
    const auto& options = *context_->options;

    auto contents = readSourceFile(path);
    if (!contents) {
        return JobOutcome::failed(
            withContext(contents.error(), fmt::format("Failed to read {}", path.string())));
    }

    const auto beforeFormatting = std::chrono::steady_clock::now();
    auto formatted = context_->formatter->format(contents.value(), *context_->config,
                                                 context_->range);
    if (!formatted) {
        return JobOutcome::failed(
            withContext(formatted.error(), fmt::format("Could not format file {}", path.string())));
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - beforeFormatting);
    spdlog::debug("formatted {} in {}us", path.string(), elapsed.count());

    if (options.check) {
        auto diff = diff::renderDiff(contents.value(), formatted.value(), kDiffContextLines,
                                     fmt::format("Diff in {}:", path.string()),
                                     context_->useColor);
        if (!diff) {
            return JobOutcome::failed(withContext(
                diff.error(), fmt::format("Failed to create diff for {}", path.string())));
        }
        if (diff.value()) {
            return JobOutcome::diffAvailable(*std::move(diff).value());
        }
        return JobOutcome::completed();
    }

    if (formatted.value() == contents.value()) {
        spdlog::debug("{} is already formatted", path.string());
        return JobOutcome::completed();
    }

    auto written = writeSourceFile(path, formatted.value());
    if (!written) {
        return JobOutcome::failed(
            withContext(written.error(), fmt::format("Could not write to {}", path.string())));
    }
    return JobOutcome::completed();
}

JobOutcome FormattingJob::formatStdin() const {
    if (context_->options->check) {
        return JobOutcome::failed(Error{ErrorCode::InvalidOperation,
                                        "warning: `--check` cannot be used whilst reading from stdin"});
    }

    std::istream& in = context_->input ? *context_->input : std::cin;
    std::ostream& out = context_->output ? *context_->output : std::cout;

    std::string buffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return JobOutcome::failed(Error{ErrorCode::IOError, "Could not format from stdin: read failed"});
    }
    auto valid = checkUtf8(buffer);
    if (!valid) {
        return JobOutcome::failed(withContext(valid.error(), "Could not format from stdin"));
    }

    auto formatted = context_->formatter->format(buffer, *context_->config, context_->range);
    if (!formatted) {
        return JobOutcome::failed(withContext(formatted.error(), "Failed to format from stdin"));
    }

    out.write(formatted.value().data(), static_cast<std::streamsize>(formatted.value().size()));
    out.flush();
    if (!out) {
        return JobOutcome::failed(Error{ErrorCode::WriteError, "Could not output to stdout"});
    }
    return JobOutcome::completed();
}

} // namespace lunafmt::run
