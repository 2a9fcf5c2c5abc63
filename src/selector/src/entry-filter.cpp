#include "fortune/selector/entry-filter.h"
#include "fortune/core/logger.h"

#include <regex>
#include <string>
#include <vector>

namespace fortune::selector {

EntryFilter::EntryFilter(const SelectionRequest& request) : request_(request)
{
    if (!request_.pattern)
        return;

    auto flags = std::regex::ECMAScript;
    if (request_.ignore_case)
        flags |= std::regex::icase;
    try
    {
        matcher_.emplace(*request_.pattern, flags);
    }
    catch (const std::regex_error& e)
    {
        throw InvalidPatternError(
            "Invalid pattern '" + *request_.pattern + "': " + e.what());
    }
    LOGD(
        "Compiled pattern '",
        *request_.pattern,
        "'",
        request_.ignore_case ? " (case-insensitive)" : "");
}

bool
EntryFilter::may_match(const catalogue::SourceEntry& source) const
{
    if (source.entry_count() == 0)
        return false;

    const auto& header = source.header();
    switch (request_.filter)
    {
        case LengthFilter::LongOnly:
            return header.longest_len >= request_.length_threshold;
        case LengthFilter::ShortOnly:
            return header.shortest_len < request_.length_threshold;
        case LengthFilter::All:
            break;
    }
    return true;
}

bool
EntryFilter::accepts(const catalogue::SourceEntry& source, uint32_t entry) const
{
    if (!request_.accepts_length(source.entry_span(entry).size()))
        return false;
    if (!matcher_)
        return true;
    std::string text = source.entry_text(entry);
    return std::regex_search(text, *matcher_);
}

std::vector<uint32_t>
EntryFilter::eligible_entries(const catalogue::SourceEntry& source) const
{
    std::vector<uint32_t> eligible;
    if (!may_match(source))
        return eligible;

    for (uint32_t i = 0; i < source.entry_count(); ++i)
    {
        if (accepts(source, i))
            eligible.push_back(i);
    }
    return eligible;
}

}  // namespace fortune::selector
