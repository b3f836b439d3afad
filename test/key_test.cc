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
#include "polysub/key.hh"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

using polysub::alphabet;
using polysub::cipher_error;
using polysub::error_code;
using polysub::key;

TEST(Key, EmptyKeyIsRejected) {
    try {
        static_cast<void>(key(""));
        FAIL() << "empty key was accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::invalid_key);
        EXPECT_EQ(std::string(error.what()), "Key cannot be empty");
    }
}

TEST(Key, LenientFormAcceptsAnySymbols) {
    key const value("k3y!");
    EXPECT_EQ(value.symbols(), "k3y!");
    EXPECT_EQ(value.size(), 4U);
    EXPECT_FALSE(value.is_valid_for(alphabet::standard_english()));
}

TEST(Key, StrictFormChecksMembership) {
    auto const alpha = alphabet::standard_english();
    EXPECT_NO_THROW(static_cast<void>(key("SECRET", alpha)));
    try {
        static_cast<void>(key("SEcRET", alpha));
        FAIL() << "key with a non-member symbol was accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::invalid_key);
        EXPECT_EQ(
                std::string(error.what()),
                "Key contains characters not in alphabet: 'c' at position 2 of key "
                "'SEcRET'");
    }
}

TEST(Key, IndicesFollowAlphabetOrder) {
    alphabet const alpha("ZYXW");
    key const      value("WXZ");
    EXPECT_TRUE(value.is_valid_for(alpha));
    EXPECT_EQ(value.indices_in(alpha), (std::vector<size_t>{3, 2, 0}));
}

TEST(Key, Equality) {
    EXPECT_EQ(key("ABC"), key("ABC"));
    EXPECT_NE(key("ABC"), key("abc"));
}
