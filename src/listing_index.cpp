/**
 * @file listing_index.cpp
 * @brief Implementation of the record index
 */

#include "listing_index.hpp"
#include "logging.hpp"

#include <algorithm>
#include <utility>

namespace realty {

void ListingIndex::reserve(size_t entries) {
    records_.reserve(entries);
    positions_.reserve(entries);
}

RecordId ListingIndex::insert(std::string title, std::string location,
                              double price, std::string category) {
    RecordId id = next_id_++;
    LocationKey key = location_key(location);

    size_t pos = records_.size();
    records_.emplace_back(id, std::move(title), std::move(location), price, std::move(category));
    positions_.emplace(id, pos);
    buckets_[key].push_back(id);

    return id;
}

bool ListingIndex::erase(RecordId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return false;
    }

    size_t pos = it->second;
    LocationKey key = location_key(records_[pos].location());

    positions_.erase(it);
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(pos));

    // Everything after the hole moved down by one
    for (size_t i = pos; i < records_.size(); ++i) {
        positions_[records_[i].id()] = i;
    }

    // Emptied buckets are kept
    auto bucket = buckets_.find(key);
    if (bucket != buckets_.end()) {
        std::erase(bucket->second, id);
    }

    return true;
}

const Record* ListingIndex::lookup(RecordId id) const {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

std::vector<Record> ListingIndex::lookup_by_location(std::string_view location) const {
    std::vector<Record> result;

    auto bucket = buckets_.find(location_key(location));
    if (bucket == buckets_.end()) {
        return result;
    }

    result.reserve(bucket->second.size());
    for (RecordId id : bucket->second) {
        result.push_back(records_[positions_.at(id)]);
    }
    return result;
}

bool ListingIndex::is_consistent() const {
    if (positions_.size() != records_.size()) {
        REALTY_LOG_ERROR("Index", "id view has ", positions_.size(),
                         " entries, primary store has ", records_.size());
        return false;
    }

    RecordId previous = 0;
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];

        if (record.id() <= previous || record.id() >= next_id_) {
            REALTY_LOG_ERROR("Index", "id ", record.id(), " out of order at position ", i);
            return false;
        }
        previous = record.id();

        auto it = positions_.find(record.id());
        if (it == positions_.end() || it->second != i) {
            REALTY_LOG_ERROR("Index", "id view does not point at position ", i,
                             " for id ", record.id());
            return false;
        }

        auto bucket = buckets_.find(location_key(record.location()));
        if (bucket == buckets_.end() ||
            std::count(bucket->second.begin(), bucket->second.end(), record.id()) != 1) {
            REALTY_LOG_ERROR("Index", "id ", record.id(), " is not in its location bucket exactly once");
            return false;
        }
    }

    // Every bucket entry must be live; with the per-record check above this
    // also rules out an id sitting in a foreign bucket.
    size_t bucketed = 0;
    for (const auto& [key, ids] : buckets_) {
        for (RecordId id : ids) {
            if (!positions_.contains(id)) {
                REALTY_LOG_ERROR("Index", "bucket ", key, " holds deleted id ", id);
                return false;
            }
        }
        bucketed += ids.size();
    }
    if (bucketed != records_.size()) {
        REALTY_LOG_ERROR("Index", "buckets hold ", bucketed, " ids, primary store has ", records_.size());
        return false;
    }

    return true;
}

} // namespace realty
