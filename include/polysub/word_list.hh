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

#ifndef POLYSUB_WORD_LIST_HH
#define POLYSUB_WORD_LIST_HH

#include <polysub/alphabet.hh>
#include <polysub/key.hh>

#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    // Splits on the first of ',', '\n' or ' ' that appears in the trimmed
    // stream contents; entries are trimmed and blanks dropped. Throws
    // std::invalid_argument if there is nothing but whitespace.
    [[nodiscard]] std::vector<std::string> parse_word_list(std::istream& source);

    // parse_word_list without repeats; first occurrence wins.
    [[nodiscard]] std::vector<key> parse_key_list(std::istream& source);

    // One alphabet per non-blank line.
    [[nodiscard]] std::vector<alphabet> parse_alphabet_list(std::istream& source);

    // Letters of words (upper-cased, non-letters dropped) in order of first
    // appearance, followed by the unused symbols of base.
    [[nodiscard]] alphabet make_keyed_alphabet(
            std::span<std::string const> words,
            std::string_view             base = "ABCDEFGHIJKLMNOPQRSTUVWXYZ");

    [[nodiscard]] std::vector<alphabet> make_keyed_alphabets(
            std::span<std::string const> words,
            std::string_view             base = "ABCDEFGHIJKLMNOPQRSTUVWXYZ");
}    // namespace polysub

#endif    // POLYSUB_WORD_LIST_HH
