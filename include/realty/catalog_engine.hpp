/**
 * @file catalog_engine.hpp
 * @brief Realty Catalog Engine - public operations over the listing index
 *
 * A CatalogEngine owns one ListingIndex and exposes:
 * - add / remove / get
 * - search by location (bucketed hash lookup)
 * - search by price range (quicksort snapshot + boundary binary searches)
 * - sort by price and list all
 *
 * Engines are independent of each other. An engine is single-threaded:
 * callers must not use one instance from several threads at once.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "listing_index.hpp"
#include "price_sort.hpp"
#include "record.hpp"

namespace realty {

class CatalogEngine {
public:
    CatalogEngine();
    explicit CatalogEngine(const EngineConfig& config);

    CatalogEngine(const CatalogEngine&) = delete;
    CatalogEngine& operator=(const CatalogEngine&) = delete;
    CatalogEngine(CatalogEngine&&) = default;
    CatalogEngine& operator=(CatalogEngine&&) = default;

    /**
     * Add a listing.
     * @return the new id, greater than every id handed out before
     * @throws std::invalid_argument if price is negative or not finite
     */
    RecordId add(std::string title, std::string location, double price, std::string category);

    /**
     * Delete a listing.
     * @return false if the id is unknown (already deleted or never issued)
     */
    bool remove(RecordId id);

    std::optional<Record> get(RecordId id) const;

    /**
     * Listings whose location shares a bucket with `location`.
     * Case and whitespace are ignored, so "New York" matches "new  york".
     */
    std::vector<Record> search_by_location(std::string_view location) const;

    /**
     * Listings with min_price <= price <= max_price, ascending by price.
     */
    std::vector<Record> search_by_price_range(double min_price, double max_price) const;

    /**
     * Sorted copy of every listing. Ties have no guaranteed order.
     */
    std::vector<Record> sort_by_price(SortOrder order = SortOrder::ASCENDING) const;

    /**
     * Every listing in insertion order.
     * The view is invalidated by the next add() or remove().
     */
    std::span<const Record> list_all() const { return index_.lookup_all(); }

    size_t size() const { return index_.size(); }
    const EngineConfig& config() const { return config_; }
    const ListingIndex& index() const { return index_; }

private:
    EngineConfig config_;
    ListingIndex index_;
};

} // namespace realty
