/**
 * @file record.hpp
 * @brief Listing record stored by the Realty catalog
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace realty {

/**
 * Record identifier. Assigned by the index starting at 1, never reused.
 */
using RecordId = uint64_t;

constexpr RecordId FIRST_RECORD_ID = 1;

/**
 * One catalog entry.
 * Read-only once constructed; an update is a delete followed by a new add.
 */
class Record {
public:
    Record(RecordId id, std::string title, std::string location,
           double price, std::string category)
        : id_(id)
        , title_(std::move(title))
        , location_(std::move(location))
        , price_(price)
        , category_(std::move(category)) {}

    RecordId id() const { return id_; }
    const std::string& title() const { return title_; }
    const std::string& location() const { return location_; }
    double price() const { return price_; }
    const std::string& category() const { return category_; }

    /**
     * Serialize to a JSON object with keys id, title, location, price, category.
     */
    nlohmann::json to_json() const {
        return nlohmann::json{
            {"id", id_},
            {"title", title_},
            {"location", location_},
            {"price", price_},
            {"category", category_},
        };
    }

    bool operator==(const Record&) const = default;

private:
    RecordId id_;
    std::string title_;
    std::string location_;
    double price_;
    std::string category_;
};

} // namespace realty
