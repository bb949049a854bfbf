#include <realty/location_key.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
//------------------------------------------------------------------------------
namespace realty
{
//------------------------------------------------------------------------------

TEST(location_key_test, normalization) {
    EXPECT_EQ(normalize_location("New York"), "newyork");
    EXPECT_EQ(normalize_location("  new\tyork\n"), "newyork");
    EXPECT_EQ(normalize_location("SAN  Francisco"), "sanfrancisco");
    EXPECT_EQ(normalize_location(""), "");
    EXPECT_EQ(normalize_location(" \t "), "");
}

TEST(location_key_test, known_values) {
    EXPECT_EQ(location_key(""), 0u);
    EXPECT_EQ(location_key("a"), 97u);
    EXPECT_EQ(location_key("ab"), 31u * 97u + 98u);
    EXPECT_EQ(location_key("A B"), location_key("ab"));
}

TEST(location_key_test, case_and_whitespace_insensitive) {
    EXPECT_EQ(location_key("New York"), location_key("new  york"));
    EXPECT_EQ(location_key("Austin"), location_key("austin"));
    EXPECT_EQ(location_key("Los Angeles"), location_key("LOSANGELES"));
    EXPECT_NE(location_key("Austin"), location_key("Boston"));
}

TEST(location_key_test, order_sensitive) {
    EXPECT_NE(location_key("ab"), location_key("ba"));
}

TEST(location_key_test, wraps_modulo_2_32) {
    std::string const location(64, 'z');

    uint64_t expected = 0;
    for (char c : location) {
        expected = (31 * expected + static_cast<unsigned char>(c)) % (uint64_t{1} << 32);
    }

    EXPECT_EQ(location_key(location), static_cast<LocationKey>(expected));
}

TEST(location_key_test, polynomial_collisions_are_kept) {
    // 'a'*31 + '@' == 'b'*31 + '!'
    EXPECT_EQ(location_key("a@"), location_key("b!"));
    EXPECT_NE(normalize_location("a@"), normalize_location("b!"));
}

//------------------------------------------------------------------------------
} // namespace realty
//------------------------------------------------------------------------------
