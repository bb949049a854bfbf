/**
 * @file price_sort.hpp
 * @brief Quicksort of records by price
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "record.hpp"

namespace realty {

enum class SortOrder : uint8_t {
    ASCENDING = 0,
    DESCENDING = 1,
};

/**
 * Sort items[low..high] (inclusive) ascending by price, in place.
 *
 * Middle-index pivot, swapped to the end, Lomuto partition with `<=`.
 * Not stable: records with equal prices may come out in any order.
 */
void quick_sort_by_price(std::vector<Record>& items, std::ptrdiff_t low, std::ptrdiff_t high);

/**
 * Return a sorted copy of `records`; the input is left untouched.
 * DESCENDING is the ascending result reversed, so ties come out in exactly
 * the reverse of their ascending order.
 */
std::vector<Record> sort_by_price(std::span<const Record> records,
                                  SortOrder order = SortOrder::ASCENDING);

} // namespace realty
