#include "fortune/utils/fortune-tool/output.h"
#include "fortune/test-utils/test-utils.h"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace fortune;
using namespace fortune::utils::fortune_tool;
namespace fs = boost::filesystem;

TEST(FortuneOutput, UngroupedListing)
{
    TempCorpusDir dir;
    fs::path alpha = dir.write_corpus("alpha", {"a"});
    fs::path beta = dir.write_corpus("beta", {"b"});

    std::ostringstream out;
    print_probabilities(
        {{alpha, 90.0, std::nullopt}, {beta, 10.0, std::nullopt}}, out);

    std::string expected = "90.00% " + fs::canonical(alpha).string() +
        "\n10.00% " + fs::canonical(beta).string() + "\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(FortuneOutput, GroupedListing)
{
    TempCorpusDir dir;
    fs::path group = dir.make_dir("set");
    fs::path one = dir.write_corpus("set/one", {"a"});
    fs::path two = dir.write_corpus("set/two", {"b"});
    fs::path solo = dir.write_corpus("solo", {"c"});

    std::ostringstream out;
    print_probabilities(
        {{one, 20.0, group}, {two, 60.0, group}, {solo, 20.0, std::nullopt}},
        out);

    std::string expected = "80.00% " + fs::canonical(group).string() +
        "\n    25.00% one\n    75.00% two\n20.00% " +
        fs::canonical(solo).string() + "\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(FortuneOutput, RecordGetsTrailingNewline)
{
    std::ostringstream out;
    print_record("no newline", out);
    print_record("has newline\n", out);
    EXPECT_EQ(out.str(), "no newline\nhas newline\n");
}

TEST(FortuneOutput, WaitSeconds)
{
    EXPECT_EQ(wait_seconds_for_text(""), MIN_WAIT_SECONDS);
    EXPECT_EQ(wait_seconds_for_text(std::string(100, 'x')), 6u);
    EXPECT_EQ(wait_seconds_for_text(std::string(141, 'x')), 8u);
    // Two-byte characters count once
    std::string umlauts;
    for (int i = 0; i < 141; ++i)
        umlauts += "\xC3\xBC";
    EXPECT_EQ(wait_seconds_for_text(umlauts), 8u);
}

TEST(FortuneOutput, AbsoluteDisplayPathOfMissingFile)
{
    fs::path relative("does/not/exist");
    EXPECT_EQ(absolute_display_path(relative), fs::current_path() / relative);
}
