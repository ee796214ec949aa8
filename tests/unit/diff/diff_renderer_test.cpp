#include <gtest/gtest.h>
#include <lunafmt/common/ansi.h>
#include <lunafmt/diff/diff_renderer.h>
#include <string>
#include <vector>

using namespace lunafmt;
using namespace lunafmt::diff;

namespace {

std::string render(std::string_view a, std::string_view b, size_t context = 3) {
    auto result = renderDiff(a, b, context, "Diff in test.lua:", false);
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().has_value());
    return result.value().value_or("");
}

} // namespace

TEST(DiffLinesTest, ComputesShortestScript) {
    std::vector<std::string_view> a{"a", "b", "c"};
    std::vector<std::string_view> b{"a", "x", "c"};
    auto edits = diffLines(a, b);
    ASSERT_EQ(edits.size(), 4u);
    EXPECT_EQ(edits[0].kind, EditKind::Equal);
    EXPECT_EQ(edits[3].kind, EditKind::Equal);
    size_t deletes = 0;
    size_t inserts = 0;
    for (const auto& e : edits) {
        deletes += e.kind == EditKind::Delete;
        inserts += e.kind == EditKind::Insert;
    }
    EXPECT_EQ(deletes, 1u);
    EXPECT_EQ(inserts, 1u);
}

TEST(DiffLinesTest, EmptySides) {
    EXPECT_TRUE(diffLines({}, {}).empty());
    auto inserts = diffLines({}, {"a", "b"});
    ASSERT_EQ(inserts.size(), 2u);
    EXPECT_EQ(inserts[0].kind, EditKind::Insert);
    EXPECT_EQ(inserts[1].newIndex, 1u);
}

TEST(DiffLinesTest, ScriptIsMinimalAndReplaysTarget) {
    std::vector<std::string_view> a{"a", "b", "c", "a", "b", "b", "a"};
    std::vector<std::string_view> b{"c", "b", "a", "b", "a", "c"};
    auto edits = diffLines(a, b);

    std::vector<std::string_view> replayed;
    size_t equal = 0;
    size_t oldPos = 0;
    for (const auto& e : edits) {
        switch (e.kind) {
            case EditKind::Equal:
                ASSERT_EQ(e.oldIndex, oldPos++);
                ASSERT_EQ(a[e.oldIndex], b[e.newIndex]);
                replayed.push_back(a[e.oldIndex]);
                ++equal;
                break;
            case EditKind::Delete:
                ASSERT_EQ(e.oldIndex, oldPos++);
                break;
            case EditKind::Insert:
                replayed.push_back(b[e.newIndex]);
                break;
        }
    }
    EXPECT_EQ(oldPos, a.size());
    EXPECT_EQ(replayed, b);
    // Longest common subsequence of the two is 4 lines
    EXPECT_EQ(equal, 4u);
    EXPECT_EQ(edits.size(), a.size() + b.size() - equal);
}

TEST(DiffLinesTest, FullyChangedLargeInput) {
    constexpr size_t kLines = 8000;
    std::string crlf;
    std::string lf;
    for (size_t i = 0; i < kLines; ++i) {
        const auto line = "local v" + std::to_string(i) + " = " + std::to_string(i);
        crlf += line + "\r\n";
        lf += line + "\n";
    }
    auto result = renderDiff(crlf, lf, 3, "Diff in big.lua:", false);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_TRUE(result.value().has_value());
    const auto hunk = "@@ -1," + std::to_string(kLines) + " +1," + std::to_string(kLines) + " @@\n";
    EXPECT_NE(result.value()->find(hunk), std::string::npos);
}

TEST(RenderDiffTest, IdenticalTextsProduceNothing) {
    auto result = renderDiff("same\n", "same\n", 3, "header", true);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().has_value());
}

TEST(RenderDiffTest, SingleChangeWithContext) {
    const std::string before = "a\nb\nc\nd\ne\nf\ng\n";
    const std::string after = "a\nb\nc\nD\ne\nf\ng\n";
    EXPECT_EQ(render(before, after),
              "Diff in test.lua:\n"
              "@@ -1,7 +1,7 @@\n"
              " a\n b\n c\n-d\n+D\n e\n f\n g\n");
}

TEST(RenderDiffTest, ContextIsTrimmedAroundChange) {
    const std::string before = "1\n2\n3\n4\n5\n6\n7\n8\n9\n";
    const std::string after = "1\n2\n3\n4\n5\n6\n7\n8\nnine\n";
    EXPECT_EQ(render(before, after, 1),
              "Diff in test.lua:\n"
              "@@ -8,2 +8,2 @@\n"
              " 8\n-9\n+nine\n");
}

TEST(RenderDiffTest, DistantChangesGetSeparateHunks) {
    const std::string before = "a\n1\n2\n3\n4\n5\n6\n7\n8\nz\n";
    const std::string after = "A\n1\n2\n3\n4\n5\n6\n7\n8\nZ\n";
    EXPECT_EQ(render(before, after, 1),
              "Diff in test.lua:\n"
              "@@ -1,2 +1,2 @@\n"
              "-a\n+A\n 1\n"
              "@@ -9,2 +9,2 @@\n"
              " 8\n-z\n+Z\n");
}

TEST(RenderDiffTest, MarksMissingFinalNewline) {
    EXPECT_EQ(render("x = 1", "x = 1\n"),
              "Diff in test.lua:\n"
              "@@ -1,1 +1,1 @@\n"
              "-x = 1\n\\ No newline at end of file\n"
              "+x = 1\n");
}

TEST(RenderDiffTest, ColorsWhenEnabled) {
    auto result = renderDiff("a\n", "b\n", 3, "Diff in x.lua:", true);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result.value().has_value());
    const auto& text = *result.value();
    using common::Ansi;
    EXPECT_NE(text.find(std::string(Ansi::BOLD) + "Diff in x.lua:" + Ansi::RESET),
              std::string::npos);
    EXPECT_NE(text.find(std::string(Ansi::RED) + "-a" + Ansi::RESET), std::string::npos);
    EXPECT_NE(text.find(std::string(Ansi::GREEN) + "+b" + Ansi::RESET), std::string::npos);
    EXPECT_NE(text.find(Ansi::CYAN), std::string::npos);
}
