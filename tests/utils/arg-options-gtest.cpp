#include "fortune/utils/fortune-tool/arg-options.h"
#include "fortune/utils/strfile-tool/arg-options.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace fortune;

namespace {

// Owns mutable argv storage for parse_argv
class Argv
{
public:
    Argv(std::initializer_list<std::string> args) : storage_(args)
    {
        for (auto& arg : storage_)
            pointers_.push_back(arg.data());
    }

    int
    argc() const
    {
        return static_cast<int>(pointers_.size());
    }

    char**
    argv()
    {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

utils::fortune_tool::CommandLineOptions
parse_fortune(Argv args)
{
    return utils::fortune_tool::parse_argv(args.argc(), args.argv());
}

utils::strfile_tool::CommandLineOptions
parse_strfile(Argv args)
{
    return utils::strfile_tool::parse_argv(args.argc(), args.argv());
}

}  // namespace

TEST(FortuneArgOptions, Defaults)
{
    auto options = parse_fortune({"fortune"});
    ASSERT_TRUE(options.valid);
    EXPECT_TRUE(options.sources.empty());
    EXPECT_EQ(options.length_threshold, 160u);
    EXPECT_EQ(options.log_level, "error");
    EXPECT_FALSE(options.pattern);

    auto request = utils::fortune_tool::to_selection_request(options);
    EXPECT_EQ(request.filter, selector::LengthFilter::All);
    EXPECT_EQ(request.offensive, catalogue::OffensiveMode::Exclude);
    EXPECT_EQ(request.weight_mode(), catalogue::WeightMode::Proportional);
}

TEST(FortuneArgOptions, FlagsAndSources)
{
    auto options = parse_fortune(
        {"fortune", "-e", "-s", "-n", "80", "-c", "30%", "jokes", "science"});
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_TRUE(options.equal_probability);
    EXPECT_TRUE(options.show_source);
    EXPECT_EQ(
        options.sources, (std::vector<std::string>{"30%", "jokes", "science"}));

    auto request = utils::fortune_tool::to_selection_request(options);
    EXPECT_EQ(request.filter, selector::LengthFilter::ShortOnly);
    EXPECT_EQ(request.length_threshold, 80u);
    EXPECT_EQ(request.weight_mode(), catalogue::WeightMode::Equal);
}

TEST(FortuneArgOptions, MatchAndIgnoreCase)
{
    auto options = parse_fortune({"fortune", "-i", "-m", "foo.*bar"});
    ASSERT_TRUE(options.valid);
    ASSERT_TRUE(options.pattern);
    EXPECT_EQ(*options.pattern, "foo.*bar");

    auto request = utils::fortune_tool::to_selection_request(options);
    EXPECT_TRUE(request.ignore_case);
    EXPECT_EQ(request.pattern, options.pattern);
}

TEST(FortuneArgOptions, OffensiveModes)
{
    using utils::fortune_tool::offensive_mode;
    EXPECT_EQ(
        offensive_mode(parse_fortune({"fortune", "-a"})),
        catalogue::OffensiveMode::All);
    EXPECT_EQ(
        offensive_mode(parse_fortune({"fortune", "-o"})),
        catalogue::OffensiveMode::Only);
    EXPECT_EQ(
        offensive_mode(parse_fortune({"fortune", "-a", "-o"})),
        catalogue::OffensiveMode::Only);
}

TEST(FortuneArgOptions, Rejections)
{
    auto conflicting = parse_fortune({"fortune", "-l", "-s"});
    EXPECT_FALSE(conflicting.valid);

    auto lonely_i = parse_fortune({"fortune", "-i"});
    EXPECT_FALSE(lonely_i.valid);

    auto bad_level = parse_fortune({"fortune", "--log-level", "loud"});
    EXPECT_FALSE(bad_level.valid);

    auto unknown = parse_fortune({"fortune", "--bogus"});
    EXPECT_FALSE(unknown.valid);
    EXPECT_TRUE(unknown.error_message);

    auto bad_length = parse_fortune({"fortune", "-n", "many"});
    EXPECT_FALSE(bad_length.valid);
}

TEST(FortuneArgOptions, HelpAndVersion)
{
    auto help = parse_fortune({"fortune", "--help"});
    EXPECT_TRUE(help.show_help);
    EXPECT_NE(help.help_text.find("Usage:"), std::string::npos);

    EXPECT_TRUE(parse_fortune({"fortune", "-v"}).show_version);
}

TEST(StrfileArgOptions, InputAndOutput)
{
    auto options = parse_strfile({"strfile", "-r", "-x", "in.txt", "out.dat"});
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(*options.input_file, "in.txt");
    EXPECT_EQ(*options.output_file, "out.dat");
    EXPECT_TRUE(options.randomize);
    EXPECT_TRUE(options.rotated);
    EXPECT_FALSE(options.silent);
    EXPECT_EQ(options.delimiter, '%');
}

TEST(StrfileArgOptions, Delimiter)
{
    auto options = parse_strfile({"strfile", "-c", "#", "-s", "in.txt"});
    ASSERT_TRUE(options.valid);
    EXPECT_EQ(options.delimiter, '#');
    EXPECT_TRUE(options.silent);
    EXPECT_FALSE(options.output_file);

    EXPECT_FALSE(parse_strfile({"strfile", "-c", "##", "in.txt"}).valid);
}

TEST(StrfileArgOptions, MissingInput)
{
    auto options = parse_strfile({"strfile"});
    EXPECT_FALSE(options.valid);
    EXPECT_TRUE(options.error_message);
}

TEST(StrfileArgOptions, OrderingOptionNotOffered)
{
    // Offset tables stay in file order, so there is no -o
    auto options = parse_strfile({"strfile", "-o", "in.txt"});
    EXPECT_FALSE(options.valid);
    EXPECT_TRUE(options.error_message);
    EXPECT_EQ(options.help_text.find("--order"), std::string::npos);
}
