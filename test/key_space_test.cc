/*
 * Copyright (C) Flamewing 2024 <flamewing.sonic@gmail.com>
 *
 * This program is free software: you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "polysub/alphabet.hh"
#include "polysub/cipher_error.hh"
#include "polysub/key_space.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using polysub::alphabet;
using polysub::cipher_error;
using polysub::error_code;
using polysub::key_space;

TEST(KeySpace, Count) {
    EXPECT_EQ(key_space::count(26, 1), 26U);
    EXPECT_EQ(key_space::count(26, 3), 17'576U);
    EXPECT_EQ(key_space::count(2, 10), 1'024U);
    EXPECT_EQ(key_space::count(7, 0), 1U);
    EXPECT_FALSE(key_space::count(26, 64).has_value());
    EXPECT_FALSE(key_space::count(std::numeric_limits<size_t>::max(), 2).has_value());
}

TEST(KeySpace, KeysAreBaseNDigitsMostSignificantFirst) {
    key_space const space(alphabet("ABCD"), 2);
    ASSERT_EQ(space.size(), 16U);
    EXPECT_EQ(space.key_length(), 2U);
    EXPECT_EQ(space[0], "AA");
    EXPECT_EQ(space[1], "AB");
    EXPECT_EQ(space[4], "BA");
    EXPECT_EQ(space[5], "BB");
    EXPECT_EQ(space[15], "DD");
}

TEST(KeySpace, EnumeratesEveryKeyOnce) {
    key_space const          space(alphabet("XYZ"), 3);
    std::vector<std::string> keys;
    for (auto const& entry : space.keys()) {
        keys.push_back(entry);
    }
    ASSERT_EQ(keys.size(), 27U);
    EXPECT_EQ(keys.front(), "XXX");
    EXPECT_EQ(keys.back(), "ZZZ");
    EXPECT_EQ(std::set<std::string>(keys.begin(), keys.end()).size(), 27U);
    EXPECT_TRUE(std::ranges::is_sorted(keys));
}

TEST(KeySpace, FillReusesBuffer) {
    key_space const space(alphabet("01"), 4);
    std::string     buffer = "leftover contents";
    space.fill(10, buffer);
    EXPECT_EQ(buffer, "1010");
    space.fill(3, buffer);
    EXPECT_EQ(buffer, "0011");
}

TEST(KeySpace, IndexPastEndThrows) {
    key_space const space(alphabet("AB"), 2);
    EXPECT_THROW(static_cast<void>(space[4]), std::out_of_range);
}

TEST(KeySpace, ZeroLengthIsInvalidKey) {
    try {
        key_space const space(alphabet("AB"), 0);
        FAIL() << "zero-length key space was accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::invalid_key);
    }
}

TEST(KeySpace, OverflowIsLimitExceeded) {
    try {
        key_space const space(alphabet::standard_english(), 100);
        FAIL() << "overflowing key space was accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::combinatorial_limit_exceeded);
    }
}
