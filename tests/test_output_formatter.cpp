#include <gtest/gtest.h>
#include <cli/output_formatter.hpp>
#include <sstream>

// ── feed ────────────────────────────────────────────────────

TEST(OutputFormatter, CompleteLinesAreEmitted) {
    std::ostringstream out;
    OutputFormatter fmt(out, 4, false);
    auto lines = fmt.feed("web1", "one\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(fmt.pending("web1"), "");
}

TEST(OutputFormatter, FragmentWaitsForNextChunk) {
    std::ostringstream out;
    OutputFormatter fmt(out, 4, false);
    EXPECT_TRUE(fmt.feed("web1", "hel").empty());
    EXPECT_EQ(fmt.pending("web1"), "hel");

    auto lines = fmt.feed("web1", "lo\nwor");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "hello");
    EXPECT_EQ(fmt.pending("web1"), "wor");
}

TEST(OutputFormatter, EmptyLinesArePreserved) {
    std::ostringstream out;
    OutputFormatter fmt(out, 1, false);
    auto lines = fmt.feed("a", "\n\nx\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "x");
}

TEST(OutputFormatter, HostsKeepSeparateBuffers) {
    std::ostringstream out;
    OutputFormatter fmt(out, 2, false);
    fmt.feed("a", "from a ");
    fmt.feed("bb", "from bb\n");
    auto lines = fmt.feed("a", "done\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "from a done");
    EXPECT_EQ(fmt.pending("bb"), "");
}

TEST(OutputFormatter, LinesPlusPendingEqualInput) {
    std::ostringstream out;
    OutputFormatter fmt(out, 3, false);
    const std::vector<std::string> chunks = {
        "ab", "c\nde", "f\n\ng", "", "hij\nk", "\n", "tail",
    };

    std::string input;
    std::string rebuilt;
    for (const auto& c : chunks) {
        input += c;
        for (const auto& line : fmt.feed("h", c)) rebuilt += line + "\n";
    }
    rebuilt += fmt.pending("h");
    EXPECT_EQ(rebuilt, input);
}

// ── render / print ──────────────────────────────────────────

TEST(OutputFormatter, LabelsPadToLongestTarget) {
    std::ostringstream out;
    OutputFormatter fmt(out, 3, false);
    EXPECT_EQ(fmt.render("a", "hi"), "a   hi");
    EXPECT_EQ(fmt.render("bb", "hi"), "bb  hi");
    EXPECT_EQ(fmt.render("ccc", "hi"), "ccc hi");
}

TEST(OutputFormatter, ColorWrapsHostOnly) {
    std::ostringstream out;
    OutputFormatter fmt(out, 3, true);
    EXPECT_EQ(fmt.render("a", "hi"), "\033[36ma\033[0m   hi");
}

TEST(OutputFormatter, TrailingFragmentIsNeverPrinted) {
    std::ostringstream out;
    OutputFormatter fmt(out, 4, false);
    fmt.print("web1", "done\nPrompt$ ");
    EXPECT_EQ(out.str(), "web1 done\n");
    EXPECT_EQ(fmt.pending("web1"), "Prompt$ ");
}

TEST(OutputFormatter, PendingForUnknownHostIsEmpty) {
    std::ostringstream out;
    OutputFormatter fmt(out, 4, false);
    EXPECT_EQ(fmt.pending("nobody"), "");
}
