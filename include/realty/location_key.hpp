/**
 * @file location_key.hpp
 * @brief Bucket key derivation for free-text locations
 *
 * Locations are normalized (ASCII lower-case, all whitespace removed) and then
 * reduced with a base-31 polynomial rolling hash modulo 2^32. Distinct inputs
 * that normalize to the same text, or that collide under the hash, share a
 * bucket.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace realty {

using LocationKey = uint32_t;

constexpr uint32_t LOCATION_HASH_BASE = 31;

/**
 * Lower-case and strip every whitespace character.
 */
std::string normalize_location(std::string_view location);

/**
 * Rolling hash of the normalized location.
 */
LocationKey location_key(std::string_view location);

} // namespace realty
