#include "fortune/selector/source-draw-table.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace fortune::selector {

SourceDrawTable::SourceDrawTable(
    const std::vector<double>& weights,
    uint32_t domain)
    : domain_(domain)
{
    if (domain_ == 0)
    {
        throw std::invalid_argument("Draw domain must be positive");
    }

    double total = 0.0;
    for (size_t i = 0; i < weights.size(); ++i)
    {
        if (weights[i] > 0.0)
        {
            order_.push_back(i);
            total += weights[i];
        }
    }
    std::stable_sort(order_.begin(), order_.end(), [&](size_t a, size_t b) {
        return weights[a] > weights[b];
    });

    bounds_.reserve(order_.size());
    double running = 0.0;
    for (size_t k = 0; k < order_.size(); ++k)
    {
        running += weights[order_[k]];
        uint32_t bound = domain_;
        if (k + 1 < order_.size())
        {
            double scaled = std::round(running / total * domain_);
            bound = static_cast<uint32_t>(
                std::min(scaled, static_cast<double>(domain_)));
        }
        bounds_.push_back(bound);
    }
}

size_t
SourceDrawTable::pick(uint32_t draw) const
{
    if (order_.empty())
    {
        throw std::out_of_range("Draw from an empty source table");
    }
    if (draw >= domain_)
    {
        throw std::out_of_range(
            "Draw " + std::to_string(draw) + " outside domain " +
            std::to_string(domain_));
    }
    auto it = std::upper_bound(bounds_.begin(), bounds_.end(), draw);
    return order_[static_cast<size_t>(it - bounds_.begin())];
}

}  // namespace fortune::selector
