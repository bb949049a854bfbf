/**
 * @file price_sort.cpp
 * @brief Implementation of the price quicksort
 */

#include "price_sort.hpp"

#include <algorithm>
#include <utility>

namespace realty {

namespace {

std::ptrdiff_t partition_by_price(std::vector<Record>& items, std::ptrdiff_t low, std::ptrdiff_t high) {
    std::ptrdiff_t mid = low + (high - low) / 2;
    std::swap(items[mid], items[high]);
    const double pivot_price = items[high].price();

    std::ptrdiff_t boundary = low;
    for (std::ptrdiff_t current = low; current < high; ++current) {
        if (items[current].price() <= pivot_price) {
            std::swap(items[boundary], items[current]);
            ++boundary;
        }
    }

    std::swap(items[boundary], items[high]);
    return boundary;
}

} // namespace

void quick_sort_by_price(std::vector<Record>& items, std::ptrdiff_t low, std::ptrdiff_t high) {
    // Recurse into the smaller side, loop on the larger one so stack depth
    // stays logarithmic even when the partitions are lopsided.
    while (low < high) {
        std::ptrdiff_t pivot = partition_by_price(items, low, high);

        if (pivot - low < high - pivot) {
            quick_sort_by_price(items, low, pivot - 1);
            low = pivot + 1;
        } else {
            quick_sort_by_price(items, pivot + 1, high);
            high = pivot - 1;
        }
    }
}

std::vector<Record> sort_by_price(std::span<const Record> records, SortOrder order) {
    std::vector<Record> result(records.begin(), records.end());
    if (result.empty()) {
        return result;
    }

    quick_sort_by_price(result, 0, static_cast<std::ptrdiff_t>(result.size()) - 1);

    if (order == SortOrder::DESCENDING) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

} // namespace realty
