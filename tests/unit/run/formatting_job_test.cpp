#include <gtest/gtest.h>
#include <sstream>
#include <lunafmt/run/formatting_job.h>

#include "../../common/test_helpers.h"

using namespace lunafmt;
using namespace lunafmt::run;
using discovery::DiscoveredEntry;

namespace {

// Fails every input with a fixed error
class RejectingFormatter final : public format::IFormatter {
public:
    std::string name() const override { return "rejecting"; }
    Result<std::string> format(std::string_view, const config::FormatConfig&,
                               const std::optional<config::FormatRange>&) const override {
        return Error{ErrorCode::ParseError, "unexpected token"};
    }
};

} // namespace

class FormattingJobTest : public ::testing::Test {
protected:
    FormattingJobTest() : tmp_(tests::TempDirScope::unique_under("lunafmt-job")) {}

    std::shared_ptr<const JobContext> context(bool check,
                                              std::shared_ptr<const format::IFormatter> formatter =
                                                  format::makeDefaultFormatter()) {
        auto options = std::make_shared<RunOptions>();
        options->check = check;
        auto ctx = std::make_shared<JobContext>();
        ctx->options = options;
        ctx->config = std::make_shared<const config::FormatConfig>();
        ctx->formatter = std::move(formatter);
        ctx->input = &in_;
        ctx->output = &out_;
        return ctx;
    }

    tests::TempDirScope tmp_;
    std::istringstream in_;
    std::ostringstream out_;
};

TEST_F(FormattingJobTest, WriteModeRewritesFile) {
    auto file = tests::write_file(tmp_ / "a.lua", "print('x')   \n");
    FormattingJob job(context(false), DiscoveredEntry::file(file, true));
    auto outcome = job.run();
    EXPECT_TRUE(outcome.isCompleted());
    EXPECT_EQ(tests::read_file(file), "print(\"x\")\n");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(FormattingJobTest, WriteModeLeavesFormattedFileUntouched) {
    auto file = tests::write_file(tmp_ / "a.lua", "print(\"x\")\n");
    const auto before = std::filesystem::last_write_time(file);
    FormattingJob job(context(false), DiscoveredEntry::file(file, true));
    EXPECT_TRUE(job.run().isCompleted());
    EXPECT_EQ(std::filesystem::last_write_time(file), before);
}

TEST_F(FormattingJobTest, CheckModeReportsDiffWithoutWriting) {
    const std::string original = "local a = 1   \n";
    auto file = tests::write_file(tmp_ / "a.lua", original);
    FormattingJob job(context(true), DiscoveredEntry::file(file, true));
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isDiff());
    EXPECT_EQ(outcome.diff().rfind("Diff in " + file.string() + ":\n", 0), 0u);
    EXPECT_NE(outcome.diff().find("-local a = 1   \n"), std::string::npos);
    EXPECT_NE(outcome.diff().find("+local a = 1\n"), std::string::npos);
    EXPECT_EQ(tests::read_file(file), original);
}

TEST_F(FormattingJobTest, CheckModeOnFormattedFileCompletes) {
    auto file = tests::write_file(tmp_ / "a.lua", "local a = 1\n");
    FormattingJob job(context(true), DiscoveredEntry::file(file, true));
    EXPECT_TRUE(job.run().isCompleted());
}

TEST_F(FormattingJobTest, MissingFileFailsWithPath) {
    auto file = tmp_ / "gone.lua";
    FormattingJob job(context(false), DiscoveredEntry::file(file, true));
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(outcome.error().message.rfind("Failed to read " + file.string(), 0), 0u);
}

TEST_F(FormattingJobTest, InvalidUtf8IsRejected) {
    auto file = tests::write_file(tmp_ / "bin.lua", std::string("x = '\xff\xfe'\n"));
    FormattingJob job(context(false), DiscoveredEntry::file(file, true));
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(tests::read_file(file), std::string("x = '\xff\xfe'\n"));
}

TEST_F(FormattingJobTest, FormatterErrorLeavesFileUntouched) {
    auto file = tests::write_file(tmp_ / "a.lua", "print('x')\n");
    FormattingJob job(context(false, std::make_shared<RejectingFormatter>()),
                      DiscoveredEntry::file(file, true));
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.error().message,
              "Could not format file " + file.string() + ": unexpected token");
    EXPECT_EQ(tests::read_file(file), "print('x')\n");
}

TEST_F(FormattingJobTest, StdinIsFormattedToOutput) {
    in_.str("print('x')");
    FormattingJob job(context(false), DiscoveredEntry::stdinMarker());
    EXPECT_TRUE(job.run().isCompleted());
    EXPECT_EQ(out_.str(), "print(\"x\")\n");
}

TEST_F(FormattingJobTest, StdinWithCheckFailsWithoutReading) {
    in_.str("print('x')");
    FormattingJob job(context(true), DiscoveredEntry::stdinMarker());
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidOperation);
    EXPECT_NE(outcome.error().message.find("--check"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(static_cast<std::streamoff>(in_.tellg()), 0);
}

TEST_F(FormattingJobTest, StdinFormatterErrorIsReported) {
    in_.str("x");
    FormattingJob job(context(false, std::make_shared<RejectingFormatter>()),
                      DiscoveredEntry::stdinMarker());
    auto outcome = job.run();
    ASSERT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.error().message, "Failed to format from stdin: unexpected token");
    EXPECT_TRUE(out_.str().empty());
}

TEST(SourceFileTest, WriteThenRead) {
    tests::TempDirScope tmp(tests::TempDirScope::unique_under("lunafmt-io"));
    auto path = tmp / "x.lua";
    ASSERT_TRUE(writeSourceFile(path, "return 1\n").has_value());
    auto read = readSourceFile(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read.value(), "return 1\n");

    auto bad = writeSourceFile(tmp / "no/such/dir/x.lua", "x");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::FileNotFound);
}
