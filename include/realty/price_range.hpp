/**
 * @file price_range.hpp
 * @brief Boundary binary searches over price-sorted records
 *
 * Every function here requires its input to be sorted ascending by price,
 * as produced by sort_by_price(records, SortOrder::ASCENDING).
 */

#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "record.hpp"

namespace realty {

/**
 * Index of the first record with price >= min_price,
 * or sorted.size() if there is none.
 */
size_t lower_price_bound(std::span<const Record> sorted, double min_price);

/**
 * Index of the last record with price <= max_price, or -1 if there is none.
 */
std::ptrdiff_t upper_price_bound(std::span<const Record> sorted, double max_price);

/**
 * Records with min_price <= price <= max_price, ascending by price.
 * Empty when the bounds cross, which covers min_price > max_price and
 * ranges lying entirely above or below the data.
 */
std::vector<Record> price_range(std::span<const Record> sorted, double min_price, double max_price);

} // namespace realty
