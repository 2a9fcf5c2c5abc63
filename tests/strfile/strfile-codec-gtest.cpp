#include "fortune/strfile/strfile-codec.h"
#include "fortune/test-utils/test-utils.h"
#include <algorithm>
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fortune::strfile;
namespace fs = boost::filesystem;

namespace {

std::string
entry_at(const std::string& text, const StrfileIndex& index, uint32_t i)
{
    EntrySpan span = entry_span(text, index, i);
    return text.substr(span.start, span.size());
}

}  // namespace

TEST(StrfileCodec, BuildSplitsOnDelimiterLines)
{
    std::string text = "one\n%\ntwo\nlines\n%\nthree\n%\n";
    StrfileIndex index = build_index(text);

    EXPECT_EQ(index.header.version, STRFILE_VERSION);
    EXPECT_EQ(index.header.num_strings, 3u);
    EXPECT_EQ(index.header.flags, STR_ORDERED);
    EXPECT_EQ(index.header.delim_char, '%');
    EXPECT_EQ(index.header.longest_len, 10u);  // "two\nlines\n"
    EXPECT_EQ(index.header.shortest_len, 4u);  // "one\n"

    ASSERT_EQ(index.offsets.size(), 4u);
    EXPECT_EQ(index.offsets.back(), text.size());
    EXPECT_EQ(entry_at(text, index, 0), "one\n");
    EXPECT_EQ(entry_at(text, index, 1), "two\nlines\n");
    EXPECT_EQ(entry_at(text, index, 2), "three\n");
}

TEST(StrfileCodec, OffsetsAreMonotonicAndEndAtTextSize)
{
    std::string text = make_numbered_corpus("entry", 25);
    StrfileIndex index = build_index(text);
    ASSERT_EQ(index.offsets.size(), 26u);
    for (size_t i = 0; i + 1 < index.offsets.size(); ++i)
    {
        EXPECT_LE(index.offsets[i], index.offsets[i + 1]);
    }
    EXPECT_EQ(index.offsets.back(), text.size());
}

TEST(StrfileCodec, EmptyEntriesAndMissingTrailingDelimiter)
{
    std::string text = "%\n%\nfirst\n%\n%\nlast";
    StrfileIndex index = build_index(text);
    ASSERT_EQ(index.header.num_strings, 2u);
    EXPECT_EQ(entry_at(text, index, 0), "first\n");
    EXPECT_EQ(entry_at(text, index, 1), "last");

    BuildOptions keep_empty;
    keep_empty.allow_empty = true;
    EXPECT_EQ(build_index(text, keep_empty).header.num_strings, 5u);
}

TEST(StrfileCodec, CarriageReturnDelimiterTolerated)
{
    std::string text = "dos\r\n%\r\nstyle\r\n%\r\n";
    StrfileIndex index = build_index(text);
    ASSERT_EQ(index.header.num_strings, 2u);
    EXPECT_EQ(entry_at(text, index, 0), "dos\r\n");
    EXPECT_EQ(entry_at(text, index, 1), "style\r\n");
}

TEST(StrfileCodec, CustomDelimiterAndRotatedFlag)
{
    std::string text = "a\n#\nb\n#\n";
    BuildOptions options;
    options.delimiter = '#';
    options.rotated = true;
    StrfileIndex index = build_index(text, options);
    EXPECT_EQ(index.header.num_strings, 2u);
    EXPECT_EQ(index.header.delim_char, '#');
    EXPECT_TRUE(index.header.is_rotated());
    EXPECT_EQ(entry_at(text, index, 1), "b\n");
}

TEST(StrfileCodec, RandomizeRequiresDraw)
{
    BuildOptions options;
    options.randomize = true;
    EXPECT_THROW(build_index("a\n%\n", options), StrfileError);
}

TEST(StrfileCodec, RandomizedTablePermutesStarts)
{
    std::string text = make_numbered_corpus("q", 5);
    StrfileIndex ordered = build_index(text);

    BuildOptions options;
    options.randomize = true;
    // Always swap with the first slot
    options.draw = [](uint32_t) { return 0u; };
    StrfileIndex shuffled = build_index(text, options);

    EXPECT_TRUE(shuffled.header.is_random());
    EXPECT_EQ(shuffled.header.flags & STR_ORDERED, 0u);
    EXPECT_EQ(shuffled.offsets.back(), text.size());

    std::vector<uint32_t> a(ordered.offsets.begin(), ordered.offsets.end() - 1);
    std::vector<uint32_t> b(
        shuffled.offsets.begin(), shuffled.offsets.end() - 1);
    EXPECT_NE(a, b);
    std::sort(b.begin(), b.end());
    EXPECT_EQ(a, b);

    // Every entry is still recoverable through its own offset
    StrfileIndex decoded = decode(encode(shuffled.header, shuffled.offsets));
    for (uint32_t i = 0; i < decoded.header.num_strings; ++i)
    {
        std::string entry = entry_at(text, decoded, i);
        EXPECT_EQ(entry.substr(0, 2), "q ");
        EXPECT_EQ(entry.back(), '\n');
    }
}

TEST(StrfileCodec, EncodeDecodeRoundTrip)
{
    StrfileIndex index = build_index("x\n%\nyy\n%\nzzz\n%\n");
    std::vector<uint8_t> bytes = encode(index.header, index.offsets);
    ASSERT_EQ(bytes.size(), HEADER_SIZE + 4 * OFFSET_SIZE);

    // version 2, big-endian
    EXPECT_EQ(bytes[0], 0);
    EXPECT_EQ(bytes[3], 2);
    EXPECT_EQ(bytes[20], '%');
    EXPECT_EQ(bytes[21], 0);

    EXPECT_EQ(decode(bytes), index);
}

TEST(StrfileCodec, EncodeRejectsMismatchedTable)
{
    IndexHeader header;
    header.num_strings = 3;
    EXPECT_THROW(encode(header, {0, 4}), StrfileError);
}

TEST(StrfileCodec, DecodeRejectsShortHeader)
{
    std::vector<uint8_t> bytes(HEADER_SIZE - 1, 0);
    EXPECT_THROW(decode(bytes), CorruptIndexError);
}

TEST(StrfileCodec, DecodeRejectsTruncatedTable)
{
    StrfileIndex index = build_index("a\n%\nb\n%\n");
    std::vector<uint8_t> bytes = encode(index.header, index.offsets);
    bytes.resize(bytes.size() - 1);
    EXPECT_THROW(decode(bytes), CorruptIndexError);
}

TEST(StrfileCodec, DecodeRejectsHugeCount)
{
    IndexHeader header;
    std::vector<uint8_t> bytes = encode(header, {0});
    bytes[4] = bytes[5] = bytes[6] = bytes[7] = 0xFF;
    EXPECT_THROW(decode(bytes), CorruptIndexError);
}

TEST(StrfileCodec, DecodeRejectsOutOfOrderOffsets)
{
    IndexHeader header;
    header.num_strings = 2;
    header.flags = STR_ORDERED;
    EXPECT_THROW(decode(encode(header, {6, 2, 10})), CorruptIndexError);

    // Shuffled tables only need to stay below the sentinel
    header.flags = STR_RANDOM;
    EXPECT_NO_THROW(decode(encode(header, {6, 2, 10})));
    EXPECT_THROW(decode(encode(header, {12, 2, 10})), CorruptIndexError);
}

TEST(StrfileCodec, DecodeIgnoresTrailingBytes)
{
    StrfileIndex index = build_index("a\n%\n");
    std::vector<uint8_t> bytes = encode(index.header, index.offsets);
    bytes.push_back(0xAB);
    bytes.push_back(0xCD);
    EXPECT_EQ(decode(bytes), index);
}

TEST(StrfileCodec, ValidateAgainstText)
{
    StrfileIndex index = build_index("a\n%\nb\n%\n");
    EXPECT_NO_THROW(validate_against_text(index, 8));
    EXPECT_THROW(validate_against_text(index, 7), CorruptIndexError);
    EXPECT_THROW(validate_against_text(index, 9), CorruptIndexError);
}

TEST(StrfileCodec, EntrySpanOutOfRange)
{
    std::string text = "a\n%\n";
    StrfileIndex index = build_index(text);
    EXPECT_THROW(entry_span(text, index, 1), std::out_of_range);
    EXPECT_THROW(entry_span("a", index, 0), CorruptIndexError);
}

TEST(StrfileCodec, FileRoundTrip)
{
    TempCorpusDir dir;
    fs::path dat = dir.path() / "corpus.dat";
    StrfileIndex index = build_index("alpha\n%\nbeta\n%\n");

    write_index_file(dat, index);
    EXPECT_EQ(read_index_file(dat), index);

    // No temporary files left behind
    size_t files = 0;
    for (const auto& item : fs::directory_iterator(dir.path()))
    {
        (void)item;
        files++;
    }
    EXPECT_EQ(files, 1u);
}

TEST(StrfileCodec, ReadMissingFile)
{
    TempCorpusDir dir;
    EXPECT_THROW(read_index_file(dir.path() / "nope.dat"), StrfileError);
}

TEST(StrfileCodec, DatPathAppendsSuffix)
{
    EXPECT_EQ(dat_path_for("/a/b/fortunes"), fs::path("/a/b/fortunes.dat"));
}
