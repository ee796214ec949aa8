#include <gtest/gtest.h>
#include <vector>
#include <lunafmt/cli/lunafmt_cli.h>

#include "../../common/test_helpers.h"

using namespace lunafmt;
using namespace lunafmt::cli;

namespace {

Result<run::RunOptions> parseArgs(LunafmtCLI& cli, std::vector<const char*> args) {
    args.insert(args.begin(), "lunafmt");
    cli.parse(static_cast<int>(args.size()), args.data());
    return cli.buildOptions();
}

} // namespace

TEST(LunafmtCLITest, DefaultsForPlainInvocation) {
    LunafmtCLI cli;
    auto options = parseArgs(cli, {"src"});
    ASSERT_TRUE(options.has_value());
    const auto& o = options.value();
    ASSERT_EQ(o.files.size(), 1u);
    EXPECT_EQ(o.files[0], "src");
    EXPECT_FALSE(o.check);
    EXPECT_FALSE(o.globs.has_value());
    EXPECT_FALSE(o.rangeStart.has_value());
    EXPECT_FALSE(o.rangeEnd.has_value());
    EXPECT_EQ(o.numThreads, run::defaultThreadCount());
    EXPECT_EQ(o.color, common::ColorChoice::Auto);
    EXPECT_FALSE(o.configPath.has_value());
    EXPECT_FALSE(o.overrides.indentType.has_value());
}

TEST(LunafmtCLITest, ParsesCoreFlags) {
    LunafmtCLI cli;
    auto options = parseArgs(cli, {"-c", "-g", "*.luau", "-g", "!gen/**", "--num-threads", "3",
                                   "--color", "NEVER", "--range-start", "5", "--range-end",
                                   "50", "-v", "a.lua", "-"});
    ASSERT_TRUE(options.has_value()) << options.error().message;
    const auto& o = options.value();
    EXPECT_TRUE(o.check);
    ASSERT_TRUE(o.globs.has_value());
    EXPECT_EQ(*o.globs, (std::vector<std::string>{"*.luau", "!gen/**"}));
    EXPECT_EQ(o.numThreads, 3u);
    EXPECT_EQ(o.color, common::ColorChoice::Never);
    EXPECT_EQ(o.rangeStart, 5u);
    EXPECT_EQ(o.rangeEnd, 50u);
    EXPECT_TRUE(o.verbose);
    ASSERT_EQ(o.files.size(), 2u);
    EXPECT_EQ(o.files[1], "-");
}

TEST(LunafmtCLITest, ParsesConfigOverrides) {
    LunafmtCLI cli;
    auto options = parseArgs(cli, {"-f", "custom.toml", "-s", "--column-width", "80",
                                   "--line-endings", "Windows", "--indent-type", "spaces",
                                   "--indent-width", "2", "--quote-style", "ForceSingle",
                                   "--call-parentheses", "None", "x.lua"});
    ASSERT_TRUE(options.has_value()) << options.error().message;
    const auto& o = options.value();
    EXPECT_EQ(o.configPath, std::filesystem::path("custom.toml"));
    EXPECT_TRUE(o.searchParentDirectories);
    EXPECT_EQ(o.overrides.columnWidth, 80u);
    EXPECT_EQ(o.overrides.lineEndings, config::LineEndings::Windows);
    EXPECT_EQ(o.overrides.indentType, config::IndentType::Spaces);
    EXPECT_EQ(o.overrides.indentWidth, 2u);
    EXPECT_EQ(o.overrides.quoteStyle, config::QuoteStyle::ForceSingle);
    EXPECT_EQ(o.overrides.callParentheses, config::CallParentheses::None);
}

TEST(LunafmtCLITest, InvalidEnumOverrideIsReported) {
    LunafmtCLI cli;
    auto options = parseArgs(cli, {"--indent-type", "Mixed", "x.lua"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(options.error().message.rfind("error: invalid value for --indent-type", 0), 0u);
}

TEST(LunafmtCLITest, UsageErrorsSurfaceAsParseErrors) {
    {
        LunafmtCLI cli;
        std::vector<const char*> args{"lunafmt", "--color", "sometimes", "x.lua"};
        EXPECT_THROW(cli.parse(static_cast<int>(args.size()), args.data()), CLI::ParseError);
    }
    {
        LunafmtCLI cli;
        std::vector<const char*> args{"lunafmt", "--num-threads", "0", "x.lua"};
        EXPECT_THROW(cli.parse(static_cast<int>(args.size()), args.data()), CLI::ParseError);
    }
}

TEST(LunafmtCLITest, NoFilesExitsWithFailure) {
    {
        LunafmtCLI cli;
        auto options = parseArgs(cli, {});
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options.value().files.empty());
    }
    {
        LunafmtCLI cli;
        std::vector<char*> argv{const_cast<char*>("lunafmt")};
        EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 1);
    }
}

TEST(LunafmtCLITest, ParseColorChoice) {
    EXPECT_EQ(parseColorChoice("always").value(), common::ColorChoice::Always);
    EXPECT_EQ(parseColorChoice("Auto").value(), common::ColorChoice::Auto);
    EXPECT_FALSE(parseColorChoice("rainbow").has_value());
}

TEST(LunafmtCLITest, RunReturnsExitCode) {
    tests::TempDirScope tmp(tests::TempDirScope::unique_under("lunafmt-cli"));
    auto clean = tests::write_file(tmp / "clean.lua", "return 1\n");
    auto dirty = tests::write_file(tmp / "dirty.lua", "return 1   \n");
    tests::CurrentPathGuard cwd(tmp.path());

    {
        LunafmtCLI cli;
        std::string path = clean.string();
        std::vector<char*> argv{const_cast<char*>("lunafmt"), const_cast<char*>("--check"),
                                const_cast<char*>("--color"), const_cast<char*>("never"),
                                path.data()};
        EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 0);
    }
    {
        LunafmtCLI cli;
        std::string path = dirty.string();
        std::vector<char*> argv{const_cast<char*>("lunafmt"), path.data()};
        EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 0);
        EXPECT_EQ(tests::read_file(dirty), "return 1\n");
    }
}
