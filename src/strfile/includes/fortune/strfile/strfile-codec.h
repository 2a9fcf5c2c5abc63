#pragma once

#include "fortune/strfile/strfile-errors.h"
#include "fortune/strfile/strfile-structs.h"
#include <boost/filesystem.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

namespace fortune::strfile {

/**
 * Options for build_index
 */
struct BuildOptions
{
    /** Byte that, alone on a line, separates two entries */
    char delimiter = DEFAULT_DELIMITER;

    /** Shuffle the offset table and flag the index RANDOM */
    bool randomize = false;

    /** Flag the index ROTATED (entries are stored ROT13-encoded) */
    bool rotated = false;

    /** Keep empty entries between consecutive delimiter lines */
    bool allow_empty = false;

    /**
     * Uniform draw in [0, bound) used to shuffle when randomize is set.
     * Callers usually bind this to an rng::RngProvider.
     */
    std::function<uint32_t(uint32_t bound)> draw;
};

/**
 * Parse a serialized index
 *
 * Trailing bytes after the offset table are ignored.
 *
 * @param data Pointer to the serialized bytes
 * @param size Number of bytes available
 * @return The parsed header and offset table
 * @throws CorruptIndexError if the data is truncated or the offsets violate
 * the ordering invariant
 */
StrfileIndex
decode(const uint8_t* data, size_t size);

StrfileIndex
decode(const std::vector<uint8_t>& bytes);

/**
 * Serialize an index, all integers big-endian
 *
 * @throws StrfileError if the offset table length is not num_strings + 1
 */
std::vector<uint8_t>
encode(const IndexHeader& header, const OffsetTable& offsets);

/**
 * Scan a corpus and produce its index
 *
 * @param text Full source text
 * @param options Delimiter and flag options
 * @return Header and offsets; offsets.back() == text.size()
 * @throws StrfileError if the text exceeds the 32-bit offset range or
 * randomize is requested without a draw function
 */
StrfileIndex
build_index(std::string_view text, const BuildOptions& options = {});

/**
 * Find the start of the first delimiter line in [start, bound)
 *
 * start must be at the beginning of a line. A trailing '\r' before the
 * newline is tolerated.
 *
 * @return Offset of the delimiter line, or bound when there is none
 */
size_t
find_delimiter_line(
    std::string_view text,
    size_t start,
    size_t bound,
    char delimiter);

/**
 * Byte range of entry i with its terminating delimiter line trimmed
 *
 * @throws std::out_of_range if i >= num_strings
 * @throws CorruptIndexError if the offset points past the text
 */
EntrySpan
entry_span(std::string_view text, const StrfileIndex& index, uint32_t i);

/**
 * Check every offset against the source text length and require the final
 * sentinel to equal it
 *
 * @throws CorruptIndexError naming the first offending offset
 */
void
validate_against_text(const StrfileIndex& index, size_t text_size);

// Path of the index sidecar for a corpus file ("<text>.dat")
boost::filesystem::path
dat_path_for(const boost::filesystem::path& text_path);

/**
 * Read and decode an index file
 *
 * @throws StrfileError if the file cannot be read
 * @throws CorruptIndexError if its contents do not decode
 */
StrfileIndex
read_index_file(const boost::filesystem::path& path);

/**
 * Encode and write an index file
 *
 * The bytes go to a uniquely named temporary file in the target directory
 * which is then renamed over path, so readers never observe a partial file.
 *
 * @throws StrfileError if the temporary file cannot be written or renamed
 */
void
write_index_file(
    const boost::filesystem::path& path,
    const StrfileIndex& index);

}  // namespace fortune::strfile
