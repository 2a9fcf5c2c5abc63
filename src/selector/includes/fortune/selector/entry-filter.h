#pragma once

#include "fortune/catalogue/source-entry.h"
#include "fortune/selector/selection-request.h"
#include "fortune/selector/selector-errors.h"
#include <cstdint>
#include <optional>
#include <regex>
#include <vector>

namespace fortune::selector {

/**
 * Decides which entries of a source satisfy a request's length filter and
 * pattern
 */
class EntryFilter
{
public:
    /**
     * @throws InvalidPatternError if the request's pattern does not compile
     */
    explicit EntryFilter(const SelectionRequest& request);

    /**
     * Cheap header-only test: false when no entry of the source can pass the
     * length filter
     */
    bool
    may_match(const catalogue::SourceEntry& source) const;

    bool
    accepts(const catalogue::SourceEntry& source, uint32_t entry) const;

    // Passing entry indices in index order
    std::vector<uint32_t>
    eligible_entries(const catalogue::SourceEntry& source) const;

    bool
    has_pattern() const
    {
        return matcher_.has_value();
    }

private:
    SelectionRequest request_;
    std::optional<std::regex> matcher_;
};

}  // namespace fortune::selector
