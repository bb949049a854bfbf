/**
 * @file listing_index.hpp
 * @brief Primary store and lookup structures for catalog records
 *
 * The index owns every live Record in one insertion-ordered vector. Two
 * derived structures refer into it without copying record data:
 * - id view: RecordId -> position in the vector
 * - location buckets: LocationKey -> ids in bucket insertion order
 *
 * All mutation goes through insert() and erase(), which keep the three
 * structures in step.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "location_key.hpp"
#include "record.hpp"

namespace realty {

class ListingIndex {
public:
    ListingIndex() = default;

    /**
     * Pre-size the primary store and id view.
     */
    void reserve(size_t entries);

    /**
     * Create a record with the next id and index it. Always succeeds.
     * @return the assigned id
     */
    RecordId insert(std::string title, std::string location,
                    double price, std::string category);

    /**
     * Remove a record from every structure.
     * @return false, with nothing changed, if the id is not live
     */
    bool erase(RecordId id);

    /**
     * Point lookup by id. The pointer is invalidated by the next mutation.
     * @return nullptr if the id is not live
     */
    const Record* lookup(RecordId id) const;

    /**
     * Records whose location hashes to the same bucket as `location`,
     * in the order they were inserted.
     */
    std::vector<Record> lookup_by_location(std::string_view location) const;

    /**
     * Every live record in insertion order. The view is invalidated by the
     * next mutation.
     */
    std::span<const Record> lookup_all() const { return records_; }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /**
     * Id the next insert() will assign.
     */
    RecordId next_id() const { return next_id_; }

    /**
     * Number of location buckets, including ones emptied by erase().
     */
    size_t bucket_count() const { return buckets_.size(); }

    /**
     * Cross-check the primary store, id view and buckets.
     * Logs the first mismatch found at ERROR level.
     */
    bool is_consistent() const;

private:
    std::vector<Record> records_;
    absl::flat_hash_map<RecordId, size_t> positions_;
    absl::flat_hash_map<LocationKey, std::vector<RecordId>> buckets_;
    RecordId next_id_ = FIRST_RECORD_ID;
};

} // namespace realty
