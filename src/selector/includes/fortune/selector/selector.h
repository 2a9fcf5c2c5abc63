#pragma once

#include "fortune/catalogue/catalogue.h"
#include "fortune/core/logger.h"
#include "fortune/rng/rng-provider.h"
#include "fortune/selector/entry-filter.h"
#include "fortune/selector/match-sequence.h"
#include "fortune/selector/selection-request.h"
#include "fortune/selector/selector-errors.h"
#include <vector>

namespace fortune::selector {

/**
 * Picks quotations from a normalized catalogue
 *
 * Selection is two-stage: a source is drawn by probability, then an entry is
 * drawn uniformly among that source's eligible entries. A source without
 * eligible entries is dropped and the source draw repeated.
 *
 * The catalogue must outlive the selector and any sequence it returns.
 */
class Selector
{
public:
    /**
     * @throws std::invalid_argument if the catalogue is not normalized
     * @throws InvalidPatternError if the request's pattern does not compile
     */
    Selector(const catalogue::Catalogue& catalogue, SelectionRequest request);

    /**
     * Draw one quotation
     *
     * @param rng Provider for both draws
     * @throws NoMatchingQuotationError if no source has an eligible entry
     */
    Quotation
    select_one(rng::RngProvider& rng) const;

    // Every eligible entry, sources in catalogue order then offset order
    MatchSequence
    enumerate_matches() const;

    const SelectionRequest&
    request() const
    {
        return request_;
    }

    const catalogue::Catalogue&
    catalogue() const
    {
        return catalogue_;
    }

    static LogPartition&
    get_log_partition()
    {
        static LogPartition partition("selector");
        return partition;
    }

private:
    const catalogue::Catalogue& catalogue_;
    SelectionRequest request_;
    EntryFilter filter_;
};

Quotation
select_one(
    const catalogue::Catalogue& catalogue,
    const SelectionRequest& request,
    rng::RngProvider& rng);

MatchSequence
enumerate_matches(
    const catalogue::Catalogue& catalogue,
    const SelectionRequest& request);

/**
 * Sources with their probabilities as percentages, in catalogue order
 *
 * @throws std::invalid_argument if the catalogue is not normalized
 */
std::vector<SourceProbability>
list_probabilities(const catalogue::Catalogue& catalogue);

}  // namespace fortune::selector
