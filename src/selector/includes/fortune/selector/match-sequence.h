#pragma once

#include "fortune/catalogue/catalogue.h"
#include "fortune/selector/entry-filter.h"
#include "fortune/selector/selection-request.h"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace fortune::selector {

/**
 * Entry indices of source in ascending offset order. Equal to index order
 * unless the index is shuffled (RANDOM).
 */
std::vector<uint32_t>
offset_order(const catalogue::SourceEntry& source);

/**
 * Lazy, restartable sequence of every entry passing a filter
 *
 * Iteration walks sources in catalogue order and entries in offset order.
 * Each begin() starts a fresh pass. The catalogue must outlive the sequence.
 */
class MatchSequence
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Quotation;
        using difference_type = std::ptrdiff_t;
        using pointer = const Quotation*;
        using reference = const Quotation&;

        // End iterator
        iterator() = default;

        reference
        operator*() const
        {
            return current_;
        }

        pointer
        operator->() const
        {
            return &current_;
        }

        iterator&
        operator++()
        {
            position_++;
            advance();
            return *this;
        }

        iterator
        operator++(int)
        {
            iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool
        operator==(const iterator& other) const;

    private:
        friend class MatchSequence;

        explicit iterator(const MatchSequence* sequence);

        // Move to the next passing entry at or after (source_, position_)
        void
        advance();

        const MatchSequence* sequence_ = nullptr;
        size_t source_ = 0;
        size_t position_ = 0;
        std::vector<uint32_t> order_;
        bool order_loaded_ = false;
        Quotation current_;
    };

    MatchSequence(const catalogue::Catalogue& catalogue, EntryFilter filter);

    iterator
    begin() const
    {
        return iterator(this);
    }

    iterator
    end() const
    {
        return iterator();
    }

private:
    const catalogue::Catalogue& catalogue_;
    EntryFilter filter_;
};

}  // namespace fortune::selector
