#pragma once

#include "fortune/catalogue/catalogue.h"
#include <boost/filesystem.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fortune::selector {

using catalogue::DEFAULT_LENGTH_THRESHOLD;
using catalogue::LengthFilter;

/**
 * Everything the caller asked for in one invocation
 */
struct SelectionRequest
{
    LengthFilter filter = LengthFilter::All;

    /** Boundary used by LongOnly / ShortOnly */
    size_t length_threshold = DEFAULT_LENGTH_THRESHOLD;

    catalogue::OffensiveMode offensive = catalogue::OffensiveMode::Exclude;

    /** Give every unweighted source the same share regardless of size */
    bool equal_probability = false;

    /** Restrict to entries matching this ECMAScript regex */
    std::optional<std::string> pattern;

    bool ignore_case = false;

    /** Report sources and probabilities instead of selecting */
    bool list_sources = false;

    catalogue::WeightMode
    weight_mode() const
    {
        return equal_probability ? catalogue::WeightMode::Equal
                                 : catalogue::WeightMode::Proportional;
    }

    catalogue::LengthLimit
    length_limit() const
    {
        return catalogue::LengthLimit{filter, length_threshold};
    }

    bool
    accepts_length(size_t length) const
    {
        return length_limit().accepts(length);
    }
};

/**
 * A selected or enumerated entry
 */
struct Quotation
{
    std::string text;
    boost::filesystem::path source_path;
    uint32_t entry_index = 0;
};

/**
 * One line of the source listing
 */
struct SourceProbability
{
    boost::filesystem::path path;

    /** Full-precision percentage in [0, 100] */
    double percentage = 0.0;

    std::optional<boost::filesystem::path> group;
};

}  // namespace fortune::selector
