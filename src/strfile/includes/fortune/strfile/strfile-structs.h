#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fortune::strfile {

static constexpr uint32_t STRFILE_VERSION = 2;

// Header flag bits
static constexpr uint32_t STR_RANDOM = 0x1;
static constexpr uint32_t STR_ORDERED = 0x2;
static constexpr uint32_t STR_ROTATED = 0x4;

static constexpr char DEFAULT_DELIMITER = '%';

// version, num_strings, longest_len, shortest_len, flags, delim + 3 pad
static constexpr size_t HEADER_SIZE = 24;
static constexpr size_t OFFSET_SIZE = 4;

/**
 * In-memory form of the fixed .dat header. On disk every field is stored
 * big-endian; delim_char is followed by three zero pad bytes.
 */
struct IndexHeader
{
    uint32_t version = STRFILE_VERSION;
    uint32_t num_strings = 0;
    uint32_t longest_len = 0;
    uint32_t shortest_len = 0;
    uint32_t flags = 0;
    char delim_char = DEFAULT_DELIMITER;

    bool
    is_random() const
    {
        return (flags & STR_RANDOM) != 0;
    }

    bool
    is_rotated() const
    {
        return (flags & STR_ROTATED) != 0;
    }

    bool
    operator==(const IndexHeader&) const = default;
};

// num_strings + 1 entries; the last one is the source text's byte length
using OffsetTable = std::vector<uint32_t>;

struct StrfileIndex
{
    IndexHeader header;
    OffsetTable offsets;

    bool
    operator==(const StrfileIndex&) const = default;
};

// Byte range [start, end) of one entry, delimiter line excluded
struct EntrySpan
{
    size_t start = 0;
    size_t end = 0;

    size_t
    size() const
    {
        return end - start;
    }

    bool
    operator==(const EntrySpan&) const = default;
};

}  // namespace fortune::strfile
