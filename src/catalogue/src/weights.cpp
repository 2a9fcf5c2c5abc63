#include "fortune/catalogue/catalogue.h"
#include "fortune/core/logger.h"

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fortune::catalogue {

namespace {

// Tolerance for explicit percentages that add up to 100 in decimal but not
// exactly in binary
constexpr double WEIGHT_EPSILON = 1e-9;

}  // namespace

uint32_t
count_within_length(const SourceEntry& source, const LengthLimit& limit)
{
    if (limit.filter == LengthFilter::All)
        return source.entry_count();

    uint32_t count = 0;
    for (uint32_t i = 0; i < source.entry_count(); ++i)
    {
        if (limit.accepts(source.entry_span(i).size()))
            count++;
    }
    return count;
}

Catalogue
normalize_weights(
    const Catalogue& catalogue,
    WeightMode mode,
    const LengthLimit& limit)
{
    if (catalogue.empty())
    {
        throw NoSourcesFoundError("No fortune sources to weight");
    }

    std::vector<SourceEntry> entries;
    std::vector<uint32_t> counts;
    entries.reserve(catalogue.size());
    counts.reserve(catalogue.size());
    for (const auto& entry : catalogue.entries())
    {
        uint32_t count = count_within_length(entry, limit);
        if (count == 0)
        {
            LOGD("No usable entry in ", entry.path.string(), ", skipping it");
            continue;
        }
        entries.push_back(entry);
        counts.push_back(count);
    }
    if (entries.empty())
    {
        throw NoSourcesFoundError(
            limit.filter == LengthFilter::All
                ? "No fortunes found"
                : "No fortunes found within the length limit");
    }

    double explicit_total = 0.0;
    double implicit_total = 0.0;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (entries[i].explicit_weight)
            explicit_total += *entries[i].explicit_weight;
        else if (mode == WeightMode::Equal)
            implicit_total += 1.0;
        else
            implicit_total += static_cast<double>(counts[i]);
    }

    if (explicit_total > 1.0 + WEIGHT_EPSILON)
    {
        std::ostringstream err;
        err << "Specified percentages add up to " << explicit_total * 100.0
            << "%, more than 100%";
        throw WeightOverflowError(err.str());
    }

    double remaining = explicit_total >= 1.0 ? 0.0 : 1.0 - explicit_total;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        auto& entry = entries[i];
        if (entry.explicit_weight)
        {
            entry.probability = *entry.explicit_weight;
        }
        else if (implicit_total > 0.0)
        {
            double base = mode == WeightMode::Equal
                ? 1.0
                : static_cast<double>(counts[i]);
            entry.probability = remaining * base / implicit_total;
        }
        else
        {
            entry.probability = 0.0;
        }
    }

    // Nothing absorbed the remaining mass (only explicit weights left):
    // rescale so the total is still 1
    double total = std::accumulate(
        entries.begin(),
        entries.end(),
        0.0,
        [](double sum, const SourceEntry& entry) {
            return sum + entry.probability;
        });
    if (total <= 0.0)
    {
        throw NoSourcesFoundError("No fortune source carries any probability");
    }
    if (total < 1.0 - WEIGHT_EPSILON)
    {
        LOGI(
            "Probabilities add up to ",
            total * 100.0,
            "%, rescaling to 100%");
        for (auto& entry : entries)
            entry.probability /= total;
    }

    for (const auto& entry : entries)
    {
        LOGD(
            "Weight ",
            entry.probability * 100.0,
            "% for ",
            entry.path.string(),
            entry.explicit_weight ? " (explicit)" : "");
    }
    return Catalogue(std::move(entries), true);
}

}  // namespace fortune::catalogue
