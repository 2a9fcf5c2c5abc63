#pragma once

#include "fortune/catalogue/corpus-text.h"
#include "fortune/strfile/strfile-structs.h"
#include <boost/filesystem.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fortune::catalogue {

/**
 * One corpus file of the catalogue together with its index
 */
struct SourceEntry
{
    boost::filesystem::path path;
    boost::filesystem::path dat_path;

    /** Explicit weight as a fraction, nullopt for an implicit weight */
    std::optional<double> explicit_weight;

    bool is_offensive = false;

    /** Directory this file was discovered through, if any */
    std::optional<boost::filesystem::path> group;

    strfile::StrfileIndex index;
    CorpusText text;

    /** Normalized selection probability, filled by normalize_weights */
    double probability = 0.0;

    uint32_t
    entry_count() const
    {
        return index.header.num_strings;
    }

    const strfile::IndexHeader&
    header() const
    {
        return index.header;
    }

    /**
     * Byte range of entry i inside the text
     *
     * @throws std::out_of_range if i >= entry_count()
     */
    strfile::EntrySpan
    entry_span(uint32_t i) const;

    // Raw entry bytes as stored (still rotated for ROTATED sources)
    std::string_view
    entry_bytes(uint32_t i) const;

    // Entry text, ROT13-decoded when the index is flagged ROTATED
    std::string
    entry_text(uint32_t i) const;
};

}  // namespace fortune::catalogue
