#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fortune::selector {

// Integer domain a stage-one draw is taken from
static constexpr uint32_t DRAW_DOMAIN = 0x80000000u;

/**
 * Integer cumulative distribution over sources
 *
 * Sources with positive weight are ordered heaviest first (catalogue order
 * breaks ties) and each owns a bucket [bounds[k-1], bounds[k]) of the draw
 * domain sized by its share of the total weight. The last bound is always the
 * full domain, so a draw of 0 selects the heaviest source and a draw of
 * domain - 1 the lightest.
 */
class SourceDrawTable
{
public:
    explicit SourceDrawTable(
        const std::vector<double>& weights,
        uint32_t domain = DRAW_DOMAIN);

    // True when no source has positive weight
    bool
    empty() const
    {
        return order_.empty();
    }

    uint32_t
    domain() const
    {
        return domain_;
    }

    /**
     * Source index owning draw
     *
     * @throws std::out_of_range if the table is empty or draw >= domain()
     */
    size_t
    pick(uint32_t draw) const;

    // Source indices in bucket order
    const std::vector<size_t>&
    order() const
    {
        return order_;
    }

    // Exclusive upper bound of each bucket
    const std::vector<uint32_t>&
    bounds() const
    {
        return bounds_;
    }

private:
    std::vector<size_t> order_;
    std::vector<uint32_t> bounds_;
    uint32_t domain_;
};

}  // namespace fortune::selector
