/**
 * @file price_range.cpp
 * @brief Implementation of the price boundary searches
 */

#include "price_range.hpp"

namespace realty {

size_t lower_price_bound(std::span<const Record> sorted, double min_price) {
    std::ptrdiff_t left = 0;
    std::ptrdiff_t right = static_cast<std::ptrdiff_t>(sorted.size()) - 1;
    size_t result = sorted.size();

    while (left <= right) {
        std::ptrdiff_t mid = left + (right - left) / 2;
        if (sorted[mid].price() >= min_price) {
            result = static_cast<size_t>(mid);
            right = mid - 1;
        } else {
            left = mid + 1;
        }
    }

    return result;
}

std::ptrdiff_t upper_price_bound(std::span<const Record> sorted, double max_price) {
    std::ptrdiff_t left = 0;
    std::ptrdiff_t right = static_cast<std::ptrdiff_t>(sorted.size()) - 1;
    std::ptrdiff_t result = -1;

    while (left <= right) {
        std::ptrdiff_t mid = left + (right - left) / 2;
        if (sorted[mid].price() <= max_price) {
            result = mid;
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }

    return result;
}

std::vector<Record> price_range(std::span<const Record> sorted, double min_price, double max_price) {
    size_t first = lower_price_bound(sorted, min_price);
    std::ptrdiff_t last = upper_price_bound(sorted, max_price);

    if (first >= sorted.size() || last < 0 || first > static_cast<size_t>(last)) {
        return {};
    }

    auto slice = sorted.subspan(first, static_cast<size_t>(last) - first + 1);
    return std::vector<Record>(slice.begin(), slice.end());
}

} // namespace realty
