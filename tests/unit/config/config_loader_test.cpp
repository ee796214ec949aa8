#include <gtest/gtest.h>
#include <lunafmt/config/config_helpers.h>
#include <lunafmt/config/config_loader.h>
#include <lunafmt/config/format_config.h>

#include "../../common/test_helpers.h"

using namespace lunafmt;
using namespace lunafmt::config;

TEST(SimpleTomlTest, ParsesKeysSectionsAndComments) {
    auto table = parse_simple_toml("# leading comment\n"
                                   "column_width = 80\n"
                                   "quote_style = \"ForceSingle\" # trailing\n"
                                   "[extra]\n"
                                   "name = 'hash # kept'\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table.value().at("column_width"), "80");
    EXPECT_EQ(table.value().at("quote_style"), "ForceSingle");
    EXPECT_EQ(table.value().at("extra.name"), "hash # kept");
}

TEST(SimpleTomlTest, RejectsMalformedLines) {
    auto missingEq = parse_simple_toml("column_width 80\n");
    ASSERT_FALSE(missingEq.has_value());
    EXPECT_EQ(missingEq.error().code, ErrorCode::ParseError);
    EXPECT_NE(missingEq.error().message.find("line 1"), std::string::npos);

    auto unterminated = parse_simple_toml("a = 1\nquote_style = \"Force\n");
    ASSERT_FALSE(unterminated.has_value());
    EXPECT_NE(unterminated.error().message.find("line 2"), std::string::npos);

    EXPECT_FALSE(parse_simple_toml("[section\n").has_value());
}

TEST(SimpleTomlTest, ParseSize) {
    EXPECT_EQ(parse_size("column_width", "120").value(), 120u);
    EXPECT_FALSE(parse_size("column_width", "").has_value());
    EXPECT_FALSE(parse_size("column_width", "-1").has_value());
    EXPECT_FALSE(parse_size("column_width", "12px").has_value());
}

TEST(FormatConfigTest, EnumParsingIsCaseInsensitive) {
    EXPECT_EQ(parseIndentType("spaces").value(), IndentType::Spaces);
    EXPECT_EQ(parseLineEndings("WINDOWS").value(), LineEndings::Windows);
    EXPECT_EQ(parseQuoteStyle("forcedouble").value(), QuoteStyle::ForceDouble);
    EXPECT_EQ(parseCallParentheses("NoSingleTable").value(), CallParentheses::NoSingleTable);

    auto bad = parseIndentType("Mixed");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(bad.error().message.find("Tabs, Spaces"), std::string::npos);
}

TEST(FormatConfigTest, DefaultsAndLineEndingSequence) {
    FormatConfig config;
    EXPECT_EQ(config.columnWidth, 120u);
    EXPECT_EQ(config.indentType, IndentType::Tabs);
    EXPECT_EQ(config.indentWidth, 4u);
    EXPECT_EQ(config.quoteStyle, QuoteStyle::AutoPreferDouble);
    EXPECT_STREQ(toString(config.callParentheses), "Always");
    EXPECT_STREQ(lineEndingSequence(LineEndings::Unix), "\n");
    EXPECT_STREQ(lineEndingSequence(LineEndings::Windows), "\r\n");
}

TEST(FormatConfigTest, RangeContainment) {
    auto open = FormatRange::fromValues(std::nullopt, std::nullopt);
    EXPECT_TRUE(open.contains(0));
    EXPECT_TRUE(open.contains(1000));

    auto bounded = FormatRange::fromValues(10, 20);
    EXPECT_FALSE(bounded.contains(9));
    EXPECT_TRUE(bounded.contains(10));
    EXPECT_TRUE(bounded.contains(19));
}

TEST(ConfigFromTomlTest, AppliesKnownKeys) {
    TomlTable table{{"column_width", "100"},   {"indent_type", "Spaces"},
                    {"indent_width", "2"},     {"line_endings", "Windows"},
                    {"quote_style", "ForceSingle"}, {"call_parentheses", "None"},
                    {"unknown_key", "ignored"}};
    auto config = configFromToml(table);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().columnWidth, 100u);
    EXPECT_EQ(config.value().indentType, IndentType::Spaces);
    EXPECT_EQ(config.value().indentWidth, 2u);
    EXPECT_EQ(config.value().lineEndings, LineEndings::Windows);
    EXPECT_EQ(config.value().quoteStyle, QuoteStyle::ForceSingle);
    EXPECT_EQ(config.value().callParentheses, CallParentheses::None);
}

TEST(ConfigFromTomlTest, LegacyNoCallParentheses) {
    auto config = configFromToml(TomlTable{{"no_call_parentheses", "true"}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().callParentheses, CallParentheses::None);
    EXPECT_FALSE(configFromToml(TomlTable{{"no_call_parentheses", "maybe"}}).has_value());
}

TEST(ConfigFromTomlTest, RejectsInvalidValues) {
    EXPECT_FALSE(configFromToml(TomlTable{{"indent_width", "0"}}).has_value());
    EXPECT_FALSE(configFromToml(TomlTable{{"column_width", "wide"}}).has_value());
    EXPECT_FALSE(configFromToml(TomlTable{{"quote_style", "Backticks"}}).has_value());
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    ConfigLoaderTest() : tmp_(tests::TempDirScope::unique_under("lunafmt-config")) {}

    tests::TempDirScope tmp_;
};

TEST_F(ConfigLoaderTest, NoFileMeansDefaults) {
    ConfigSource source;
    source.workingDirectory = tmp_.path();
    auto config = loadConfig(source);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value(), FormatConfig{});
}

TEST_F(ConfigLoaderTest, DiscoversFileInWorkingDirectory) {
    tests::write_file(tmp_ / "lunafmt.toml", "indent_type = \"Spaces\"\n");
    ConfigSource source;
    source.workingDirectory = tmp_.path();
    auto config = loadConfig(source);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().indentType, IndentType::Spaces);
}

TEST_F(ConfigLoaderTest, PrefersPlainNameOverDotfile) {
    tests::write_file(tmp_ / "lunafmt.toml", "indent_width = 2\n");
    tests::write_file(tmp_ / ".lunafmt.toml", "indent_width = 8\n");
    auto found = findConfigFile(tmp_.path(), false);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "lunafmt.toml");
}

TEST_F(ConfigLoaderTest, ParentSearchIsOptIn) {
    tests::write_file(tmp_ / ".lunafmt.toml", "column_width = 90\n");
    auto nested = tmp_ / "a/b";
    std::filesystem::create_directories(nested);

    ConfigSource source;
    source.workingDirectory = nested;
    EXPECT_EQ(loadConfig(source).value().columnWidth, 120u);

    source.searchParentDirectories = true;
    EXPECT_EQ(loadConfig(source).value().columnWidth, 90u);
}

TEST_F(ConfigLoaderTest, ExplicitPathMustExist) {
    ConfigSource source;
    source.workingDirectory = tmp_.path();
    source.configPath = tmp_ / "missing.toml";
    auto config = loadConfig(source);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(config.error().message.rfind("error: could not load config", 0), 0u);
}

TEST_F(ConfigLoaderTest, InvalidFileNamesThePath) {
    auto path = tests::write_file(tmp_ / "lunafmt.toml", "quote_style = \"Sideways\"\n");
    ConfigSource source;
    source.workingDirectory = tmp_.path();
    auto config = loadConfig(source);
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().message.find(path.string()), std::string::npos);
    EXPECT_NE(config.error().message.find("Sideways"), std::string::npos);
}

TEST_F(ConfigLoaderTest, OverridesApplyLast) {
    tests::write_file(tmp_ / "lunafmt.toml", "indent_type = \"Spaces\"\nindent_width = 2\n");
    ConfigSource source;
    source.workingDirectory = tmp_.path();
    source.overrides.indentWidth = 3;
    source.overrides.quoteStyle = QuoteStyle::ForceSingle;
    auto config = loadConfig(source);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().indentType, IndentType::Spaces);
    EXPECT_EQ(config.value().indentWidth, 3u);
    EXPECT_EQ(config.value().quoteStyle, QuoteStyle::ForceSingle);
}
