#include "fortune/selector/match-sequence.h"

#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

namespace fortune::selector {

std::vector<uint32_t>
offset_order(const catalogue::SourceEntry& source)
{
    std::vector<uint32_t> order(source.entry_count());
    std::iota(order.begin(), order.end(), 0u);
    if (source.header().is_random())
    {
        const auto& offsets = source.index.offsets;
        std::stable_sort(order.begin(), order.end(), [&](uint32_t a, uint32_t b) {
            return offsets[a] < offsets[b];
        });
    }
    return order;
}

MatchSequence::MatchSequence(
    const catalogue::Catalogue& catalogue,
    EntryFilter filter)
    : catalogue_(catalogue), filter_(std::move(filter))
{
}

MatchSequence::iterator::iterator(const MatchSequence* sequence)
    : sequence_(sequence)
{
    advance();
}

void
MatchSequence::iterator::advance()
{
    const auto& catalogue = sequence_->catalogue_;
    const auto& filter = sequence_->filter_;

    while (source_ < catalogue.size())
    {
        const auto& source = catalogue[source_];
        if (!order_loaded_)
        {
            order_ = filter.may_match(source) ? offset_order(source)
                                              : std::vector<uint32_t>{};
            order_loaded_ = true;
        }

        while (position_ < order_.size())
        {
            uint32_t entry = order_[position_];
            if (filter.accepts(source, entry))
            {
                current_ = Quotation{source.entry_text(entry), source.path, entry};
                return;
            }
            position_++;
        }

        source_++;
        position_ = 0;
        order_loaded_ = false;
    }

    // Exhausted: become the end iterator
    sequence_ = nullptr;
    source_ = 0;
    position_ = 0;
    order_.clear();
}

bool
MatchSequence::iterator::operator==(const iterator& other) const
{
    if (!sequence_ || !other.sequence_)
        return sequence_ == other.sequence_;
    return sequence_ == other.sequence_ && source_ == other.source_ &&
        position_ == other.position_;
}

}  // namespace fortune::selector
