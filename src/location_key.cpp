/**
 * @file location_key.cpp
 * @brief Implementation of location normalization and hashing
 */

#include "location_key.hpp"

#include <cctype>

namespace realty {

std::string normalize_location(std::string_view location) {
    std::string result;
    result.reserve(location.size());

    for (char c : location) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            continue;
        }
        result += static_cast<char>(std::tolower(uc));
    }

    return result;
}

LocationKey location_key(std::string_view location) {
    // uint32_t arithmetic wraps, which is the mod 2^32 step
    LocationKey hash = 0;
    for (char c : normalize_location(location)) {
        hash = LOCATION_HASH_BASE * hash + static_cast<unsigned char>(c);
    }
    return hash;
}

} // namespace realty
