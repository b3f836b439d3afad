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
#include "polysub/text_utils.hh"
#include "polysub/word_list.hh"

#include <gtest/gtest.h>

#include <istream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

using polysub::alphabet;
using polysub::cipher_error;
using polysub::error_code;
using polysub::key;

namespace {
    std::vector<std::string> words_of(std::string const& content) {
        std::istringstream source(content);
        return polysub::parse_word_list(source);
    }

    using words = std::vector<std::string>;

    // Serves its contents once, like a pipe; every seek fails.
    class forward_only_buffer : public std::streambuf {
    public:
        explicit forward_only_buffer(std::string content_in)
                : content(std::move(content_in)) {
            setg(content.data(), content.data(), content.data() + content.size());
        }

    private:
        std::string content;
    };
}    // namespace

TEST(WordList, CommaSeparatedEntriesAreTrimmed) {
    EXPECT_EQ(words_of("  HELLO ,  WORLD ,CRYPTO  "), (words{"HELLO", "WORLD", "CRYPTO"}));
}

TEST(WordList, CommaWinsOverOtherSeparators) {
    EXPECT_EQ(words_of("ONE TWO,THREE\nFOUR"), (words{"ONE TWO", "THREE\nFOUR"}));
}

TEST(WordList, NewlineSeparated) {
    EXPECT_EQ(words_of("ALPHA\nBRAVO OSCAR\n\nCHARLIE\n"), (words{"ALPHA", "BRAVO OSCAR", "CHARLIE"}));
}

TEST(WordList, SpaceSeparated) {
    EXPECT_EQ(words_of("RED  GREEN BLUE"), (words{"RED", "GREEN", "BLUE"}));
}

TEST(WordList, SingleWord) {
    EXPECT_EQ(words_of("\n  SOLO \r\n"), (words{"SOLO"}));
}

TEST(WordList, BlankEntriesAreDropped) {
    EXPECT_EQ(words_of(",A,,B, ,"), (words{"A", "B"}));
}

TEST(WordList, EmptyListIsAnError) {
    EXPECT_THROW(static_cast<void>(words_of("")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(words_of(" \n\t ")), std::invalid_argument);
}

TEST(WordList, KeyListDropsRepeats) {
    std::istringstream source("KEY,LOCK,KEY,DOOR,LOCK");
    auto const         keys = polysub::parse_key_list(source);
    EXPECT_EQ(keys, (std::vector<key>{key("KEY"), key("LOCK"), key("DOOR")}));
}

TEST(WordList, AlphabetListIsOnePerLine) {
    std::istringstream source("ABC\n\n  XYZ  \nabc\n");
    auto const         alphabets = polysub::parse_alphabet_list(source);
    EXPECT_EQ(alphabets, (std::vector<alphabet>{alphabet("ABC"), alphabet("XYZ"), alphabet("abc")}));
}

TEST(WordList, AlphabetListRejectsBadLine) {
    std::istringstream source("ABC\nAAB\n");
    try {
        static_cast<void>(polysub::parse_alphabet_list(source));
        FAIL() << "duplicate symbols were accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::invalid_alphabet);
    }
}

TEST(KeyedAlphabet, WordLettersComeFirst) {
    words const input{"KEYWORD"};
    EXPECT_EQ(polysub::make_keyed_alphabet(input).symbols(), "KEYWORDABCFGHIJLMNPQSTUVXZ");
}

TEST(KeyedAlphabet, FoldsCaseAndDropsNonLetters) {
    words const input{"Hello, World 42"};
    EXPECT_EQ(polysub::make_keyed_alphabet(input).symbols(), "HELOWRDABCFGIJKMNPQSTUVXYZ");
}

TEST(KeyedAlphabet, CombinesSeveralWords) {
    words const input{"ZEBRA", "BAKER"};
    auto const  alpha = polysub::make_keyed_alphabet(input);
    EXPECT_EQ(alpha.symbols().substr(0, 6), "ZEBRAK");
    EXPECT_EQ(alpha.size(), 26U);
}

TEST(KeyedAlphabet, WordWithoutLettersIsAnError) {
    words const input{"1234 !!"};
    try {
        static_cast<void>(polysub::make_keyed_alphabet(input));
        FAIL() << "word without letters was accepted";
    } catch (cipher_error const& error) {
        EXPECT_EQ(error.code(), error_code::invalid_alphabet);
    }
}

TEST(KeyedAlphabet, OnePerWord) {
    words const input{"KEYWORD", "CIPHER"};
    auto const  alphabets = polysub::make_keyed_alphabets(input);
    ASSERT_EQ(alphabets.size(), 2U);
    EXPECT_EQ(alphabets[0].symbols().substr(0, 7), "KEYWORD");
    EXPECT_EQ(alphabets[1].symbols().substr(0, 7), "CIPHERA");
}

TEST(TextUtils, ToUpper) {
    EXPECT_EQ(polysub::to_upper("Hello, World 42"), "HELLO, WORLD 42");
}

TEST(TextUtils, GroupSymbols) {
    EXPECT_EQ(polysub::group_symbols("ABCDEFGHIJKL"), "ABCDE FGHIJ KL");
    EXPECT_EQ(polysub::group_symbols("ABCDEF", 3, "-"), "ABC-DEF");
    EXPECT_EQ(polysub::group_symbols("ABC", 0), "ABC");
    EXPECT_EQ(polysub::group_symbols("", 5), "");
}

TEST(TextUtils, Trim) {
    EXPECT_EQ(polysub::trim("  \tword \r\n"), "word");
    EXPECT_EQ(polysub::trim("   "), "");
}

TEST(TextUtils, ReadTextStripsTrailingLineBreaks) {
    std::istringstream source("HELLO WORLD\r\n\n");
    EXPECT_EQ(polysub::read_text(source), "HELLO WORLD");
    std::istringstream inner("  TWO\nLINES  \n");
    EXPECT_EQ(polysub::read_text(inner), "  TWO\nLINES  ");
}

TEST(TextUtils, ReadTextFromStreamThatCannotSeek) {
    forward_only_buffer buffer("HELLO WORLD\n");
    std::istream        source(&buffer);
    ASSERT_EQ(source.tellg(), std::istream::pos_type(-1));
    EXPECT_EQ(polysub::read_text(source), "HELLO WORLD");
}

TEST(WordList, ParsesStreamThatCannotSeek) {
    forward_only_buffer buffer("KEY, LOCK\n");
    std::istream        source(&buffer);
    EXPECT_EQ(polysub::parse_word_list(source), (words{"KEY", "LOCK"}));
}
