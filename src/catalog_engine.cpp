/**
 * @file catalog_engine.cpp
 * @brief Implementation of the Realty Catalog Engine
 */

#include "catalog_engine.hpp"
#include "logging.hpp"
#include "price_range.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace realty {

CatalogEngine::CatalogEngine()
    : CatalogEngine(EngineConfig{})
{
}

CatalogEngine::CatalogEngine(const EngineConfig& config)
    : config_(config)
{
    if (config_.reserve > 0) {
        index_.reserve(config_.reserve);
    }
    REALTY_LOG_DEBUG("Engine", "Created catalog engine (reserve=", config_.reserve, ")");
}

RecordId CatalogEngine::add(std::string title, std::string location, double price, std::string category) {
    if (!std::isfinite(price) || price < 0.0) {
        throw std::invalid_argument("Listing price must be a finite non-negative number");
    }

    RecordId id = index_.insert(std::move(title), std::move(location), price, std::move(category));

    REALTY_LOG_DEBUG("Engine", "Added listing ", id, " (", index_.size(), " live)");
    return id;
}

bool CatalogEngine::remove(RecordId id) {
    if (!index_.erase(id)) {
        REALTY_LOG_DEBUG("Engine", "Delete of unknown listing ", id, " ignored");
        return false;
    }

    REALTY_LOG_DEBUG("Engine", "Deleted listing ", id, " (", index_.size(), " live)");
    return true;
}

std::optional<Record> CatalogEngine::get(RecordId id) const {
    const Record* record = index_.lookup(id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::vector<Record> CatalogEngine::search_by_location(std::string_view location) const {
    return index_.lookup_by_location(location);
}

std::vector<Record> CatalogEngine::search_by_price_range(double min_price, double max_price) const {
    std::vector<Record> sorted = sort_by_price(SortOrder::ASCENDING);
    return price_range(sorted, min_price, max_price);
}

std::vector<Record> CatalogEngine::sort_by_price(SortOrder order) const {
    if (index_.empty()) {
        return {};
    }
    return realty::sort_by_price(index_.lookup_all(), order);
}

} // namespace realty
