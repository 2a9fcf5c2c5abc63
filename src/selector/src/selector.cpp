#include "fortune/selector/selector.h"
#include "fortune/selector/source-draw-table.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fortune::selector {

namespace {

void
require_normalized(const catalogue::Catalogue& catalogue)
{
    if (!catalogue.normalized())
    {
        throw std::invalid_argument(
            "Catalogue weights must be normalized before selection");
    }
}

}  // namespace

Selector::Selector(
    const catalogue::Catalogue& catalogue,
    SelectionRequest request)
    : catalogue_(catalogue)
    , request_(std::move(request))
    , filter_(request_)
{
    require_normalized(catalogue_);
}

Quotation
Selector::select_one(rng::RngProvider& rng) const
{
    std::vector<double> weights;
    weights.reserve(catalogue_.size());
    for (const auto& source : catalogue_.entries())
    {
        weights.push_back(filter_.may_match(source) ? source.probability : 0.0);
    }

    // Every failed attempt zeroes one source, so n attempts suffice
    for (size_t attempt = 0; attempt < catalogue_.size(); ++attempt)
    {
        SourceDrawTable table(weights);
        if (table.empty())
            break;

        size_t chosen = table.pick(rng.next_u32_below(table.domain()));
        const auto& source = catalogue_[chosen];

        std::vector<uint32_t> eligible = filter_.eligible_entries(source);
        if (eligible.empty())
        {
            OLOGD(
                "No eligible entry in ",
                source.path.string(),
                ", dropping it from the draw");
            weights[chosen] = 0.0;
            continue;
        }

        uint32_t pick = rng.next_u32_below(static_cast<uint32_t>(eligible.size()));
        uint32_t entry = eligible[pick];
        OLOGD(
            "Selected entry ",
            entry,
            " of ",
            source.path.string(),
            " (",
            eligible.size(),
            " eligible)");
        return Quotation{source.entry_text(entry), source.path, entry};
    }

    throw NoMatchingQuotationError("No fortunes found");
}

MatchSequence
Selector::enumerate_matches() const
{
    return MatchSequence(catalogue_, filter_);
}

Quotation
select_one(
    const catalogue::Catalogue& catalogue,
    const SelectionRequest& request,
    rng::RngProvider& rng)
{
    return Selector(catalogue, request).select_one(rng);
}

MatchSequence
enumerate_matches(
    const catalogue::Catalogue& catalogue,
    const SelectionRequest& request)
{
    return Selector(catalogue, request).enumerate_matches();
}

std::vector<SourceProbability>
list_probabilities(const catalogue::Catalogue& catalogue)
{
    require_normalized(catalogue);

    std::vector<SourceProbability> out;
    out.reserve(catalogue.size());
    for (const auto& source : catalogue.entries())
    {
        out.push_back({source.path, source.probability * 100.0, source.group});
    }
    return out;
}

}  // namespace fortune::selector
