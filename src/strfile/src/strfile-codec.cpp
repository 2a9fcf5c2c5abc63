#include "fortune/strfile/strfile-codec.h"
#include "fortune/common/utils.h"
#include "fortune/core/logger.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = boost::filesystem;

namespace fortune::strfile {

using common::get_uint32_be;
using common::put_uint32_be;

namespace {

// End of the line starting at cursor (position of '\n' or text.size())
size_t
line_end_from(std::string_view text, size_t cursor)
{
    size_t pos = text.find('\n', cursor);
    return pos == std::string_view::npos ? text.size() : pos;
}

bool
is_delimiter_line(
    std::string_view text,
    size_t line_start,
    size_t line_end,
    char delimiter)
{
    size_t content_end = line_end;
    if (content_end > line_start && text[content_end - 1] == '\r')
        content_end--;
    return content_end - line_start == 1 && text[line_start] == delimiter;
}

std::vector<EntrySpan>
parse_entry_spans(std::string_view text, char delimiter, bool allow_empty)
{
    std::vector<EntrySpan> spans;
    size_t cursor = 0;
    size_t start = 0;

    while (cursor < text.size())
    {
        size_t line_end = line_end_from(text, cursor);
        size_t next = line_end < text.size() ? line_end + 1 : line_end;

        if (is_delimiter_line(text, cursor, line_end, delimiter))
        {
            if (allow_empty || cursor > start)
                spans.push_back({start, cursor});
            start = next;
        }
        cursor = next;
    }

    // A trailing delimiter line leaves start == text.size()
    if (allow_empty || start < text.size())
        spans.push_back({start, text.size()});

    return spans;
}

uint32_t
to_offset(size_t value)
{
    if (value > std::numeric_limits<uint32_t>::max())
    {
        throw StrfileError(
            "Offset " + std::to_string(value) +
            " exceeds the 32-bit index range");
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

StrfileIndex
decode(const uint8_t* data, size_t size)
{
    if (size < HEADER_SIZE)
    {
        throw CorruptIndexError(
            "Index too small for header: " + std::to_string(size) +
            " bytes, need " + std::to_string(HEADER_SIZE));
    }

    StrfileIndex index;
    IndexHeader& header = index.header;
    header.version = get_uint32_be(data);
    header.num_strings = get_uint32_be(data + 4);
    header.longest_len = get_uint32_be(data + 8);
    header.shortest_len = get_uint32_be(data + 12);
    header.flags = get_uint32_be(data + 16);
    header.delim_char = static_cast<char>(data[20]);

    // Computed in 64 bits so a hostile num_strings cannot wrap around
    uint64_t table_entries = static_cast<uint64_t>(header.num_strings) + 1;
    uint64_t required = HEADER_SIZE + table_entries * OFFSET_SIZE;
    if (required > size)
    {
        throw CorruptIndexError(
            "Index declares " + std::to_string(header.num_strings) +
            " strings but holds only " + std::to_string(size) + " bytes (" +
            std::to_string(required) + " required)");
    }

    index.offsets.reserve(static_cast<size_t>(table_entries));
    const uint8_t* cursor = data + HEADER_SIZE;
    for (uint64_t i = 0; i < table_entries; ++i, cursor += OFFSET_SIZE)
    {
        index.offsets.push_back(get_uint32_be(cursor));
    }

    const OffsetTable& offsets = index.offsets;
    uint32_t sentinel = offsets.back();
    for (size_t i = 0; i + 1 < offsets.size(); ++i)
    {
        if (header.is_random() ? offsets[i] > sentinel
                               : offsets[i] > offsets[i + 1])
        {
            std::ostringstream err;
            err << "Offset table out of order at entry " << i << " ("
                << offsets[i] << " > "
                << (header.is_random() ? sentinel : offsets[i + 1]) << ")";
            throw CorruptIndexError(err.str());
        }
    }

    LOGD(
        "Decoded index: ",
        header.num_strings,
        " strings, flags=",
        header.flags);
    return index;
}

StrfileIndex
decode(const std::vector<uint8_t>& bytes)
{
    return decode(bytes.data(), bytes.size());
}

std::vector<uint8_t>
encode(const IndexHeader& header, const OffsetTable& offsets)
{
    if (offsets.size() != static_cast<size_t>(header.num_strings) + 1)
    {
        throw StrfileError(
            "Offset table holds " + std::to_string(offsets.size()) +
            " entries but header declares " +
            std::to_string(header.num_strings) + " strings");
    }

    std::vector<uint8_t> out(HEADER_SIZE + offsets.size() * OFFSET_SIZE, 0);
    uint8_t* cursor = out.data();
    put_uint32_be(cursor, header.version);
    put_uint32_be(cursor + 4, header.num_strings);
    put_uint32_be(cursor + 8, header.longest_len);
    put_uint32_be(cursor + 12, header.shortest_len);
    put_uint32_be(cursor + 16, header.flags);
    cursor[20] = static_cast<uint8_t>(header.delim_char);
    // bytes 21..23 stay zero

    cursor += HEADER_SIZE;
    for (uint32_t offset : offsets)
    {
        put_uint32_be(cursor, offset);
        cursor += OFFSET_SIZE;
    }
    return out;
}

StrfileIndex
build_index(std::string_view text, const BuildOptions& options)
{
    if (options.randomize && !options.draw)
    {
        throw StrfileError("Randomized index requested without a draw source");
    }
    to_offset(text.size());

    std::vector<EntrySpan> spans =
        parse_entry_spans(text, options.delimiter, options.allow_empty);

    StrfileIndex index;
    IndexHeader& header = index.header;
    header.num_strings = to_offset(spans.size());
    header.delim_char = options.delimiter;

    if (!spans.empty())
    {
        auto [shortest, longest] = std::ranges::minmax_element(
            spans, {}, [](const EntrySpan& span) { return span.size(); });
        header.shortest_len = to_offset(shortest->size());
        header.longest_len = to_offset(longest->size());
    }

    if (options.randomize)
    {
        // Fisher-Yates
        for (size_t i = spans.size(); i > 1; --i)
        {
            uint32_t j = options.draw(static_cast<uint32_t>(i));
            std::swap(spans[i - 1], spans[j]);
        }
        header.flags |= STR_RANDOM;
    }
    else
    {
        header.flags |= STR_ORDERED;
    }
    if (options.rotated)
        header.flags |= STR_ROTATED;

    index.offsets.reserve(spans.size() + 1);
    for (const auto& span : spans)
        index.offsets.push_back(static_cast<uint32_t>(span.start));
    index.offsets.push_back(static_cast<uint32_t>(text.size()));

    LOGD(
        "Built index: ",
        header.num_strings,
        " strings, longest ",
        header.longest_len,
        ", shortest ",
        header.shortest_len);
    return index;
}

size_t
find_delimiter_line(
    std::string_view text,
    size_t start,
    size_t bound,
    char delimiter)
{
    bound = std::min(bound, text.size());
    size_t cursor = start;
    while (cursor < bound)
    {
        size_t line_end = std::min(line_end_from(text, cursor), bound);
        if (is_delimiter_line(text, cursor, line_end, delimiter))
            return cursor;
        cursor = line_end < bound ? line_end + 1 : line_end;
    }
    return bound;
}

EntrySpan
entry_span(std::string_view text, const StrfileIndex& index, uint32_t i)
{
    const IndexHeader& header = index.header;
    if (i >= header.num_strings)
    {
        throw std::out_of_range(
            "Entry " + std::to_string(i) + " out of range (" +
            std::to_string(header.num_strings) + " entries)");
    }

    size_t start = index.offsets[i];
    // In a shuffled table the next offset is not the next entry, so the scan
    // is bounded by the end of the text instead
    size_t bound =
        header.is_random() ? text.size() : size_t{index.offsets[i + 1]};
    if (start > text.size() || bound > text.size() || start > bound)
    {
        throw CorruptIndexError(
            "Entry " + std::to_string(i) + " spans [" + std::to_string(start) +
            ", " + std::to_string(bound) + ") beyond text of " +
            std::to_string(text.size()) + " bytes");
    }

    return {start, find_delimiter_line(text, start, bound, header.delim_char)};
}

void
validate_against_text(const StrfileIndex& index, size_t text_size)
{
    if (index.offsets.empty() || index.offsets.back() != text_size)
    {
        throw CorruptIndexError(
            "Index end offset does not match text size " +
            std::to_string(text_size));
    }
    for (size_t i = 0; i < index.offsets.size(); ++i)
    {
        if (index.offsets[i] > text_size)
        {
            throw CorruptIndexError(
                "Offset " + std::to_string(index.offsets[i]) + " at entry " +
                std::to_string(i) + " is beyond text size " +
                std::to_string(text_size));
        }
    }
}

fs::path
dat_path_for(const fs::path& text_path)
{
    return fs::path(text_path.string() + ".dat");
}

StrfileIndex
read_index_file(const fs::path& path)
{
    std::ifstream in(path.string(), std::ios::binary);
    if (!in)
    {
        throw StrfileError("Cannot open index file: " + path.string());
    }

    std::vector<uint8_t> bytes(
        (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw StrfileError("I/O error reading index file: " + path.string());
    }

    try
    {
        return decode(bytes);
    }
    catch (const CorruptIndexError& e)
    {
        throw CorruptIndexError(path.string() + ": " + e.what());
    }
}

void
write_index_file(const fs::path& path, const StrfileIndex& index)
{
    std::vector<uint8_t> bytes = encode(index.header, index.offsets);

    fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    fs::path tmp =
        dir / fs::unique_path(path.filename().string() + ".%%%%-%%%%.tmp");

    {
        std::ofstream out(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw StrfileError(
                "Cannot create temporary index file: " + tmp.string());
        }
        out.write(
            reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            boost::system::error_code ignored;
            fs::remove(tmp, ignored);
            throw StrfileError("Failed writing index file: " + tmp.string());
        }
    }

    boost::system::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        boost::system::error_code ignored;
        fs::remove(tmp, ignored);
        throw StrfileError(
            "Failed to move index into place at " + path.string() + ": " +
            ec.message());
    }
    LOGD("Wrote index ", path.string(), " (", bytes.size(), " bytes)");
}

}  // namespace fortune::strfile
