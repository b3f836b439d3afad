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

#include "polysub/word_list.hh"

#include "polysub/alphabet.hh"
#include "polysub/cipher_error.hh"
#include "polysub/key.hh"
#include "polysub/text_utils.hh"

#include <array>
#include <bitset>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace polysub {
    namespace {
        std::vector<std::string> split_trimmed(
                std::string_view const content, char const separator) {
            std::vector<std::string> result;
            size_t                   start = 0;
            while (start <= content.size()) {
                size_t end = content.find(separator, start);
                if (end == std::string_view::npos) {
                    end = content.size();
                }
                auto const entry = trim(content.substr(start, end - start));
                if (!entry.empty()) {
                    result.emplace_back(entry);
                }
                start = end + 1;
            }
            return result;
        }
    }    // namespace

    std::vector<std::string> parse_word_list(std::istream& source) {
        std::string const text    = read_text(source);
        auto const        content = trim(text);
        if (content.empty()) {
            throw std::invalid_argument("Word list is empty");
        }
        for (char const separator : std::array{',', '\n', ' '}) {
            if (content.find(separator) == std::string_view::npos) {
                continue;
            }
            auto words = split_trimmed(content, separator);
            if (!words.empty()) {
                return words;
            }
        }
        return {std::string(content)};
    }

    std::vector<key> parse_key_list(std::istream& source) {
        std::vector<key>                result;
        std::unordered_set<std::string> seen;
        for (auto& word : parse_word_list(source)) {
            if (seen.insert(word).second) {
                result.emplace_back(word);
            }
        }
        return result;
    }

    std::vector<alphabet> parse_alphabet_list(std::istream& source) {
        std::vector<alphabet> result;
        std::string           line;
        while (std::getline(source, line)) {
            auto const entry = trim(line);
            if (!entry.empty()) {
                result.emplace_back(entry);
            }
        }
        return result;
    }

    alphabet make_keyed_alphabet(
            std::span<std::string const> const words, std::string_view const base) {
        std::string      symbols;
        std::bitset<256> used;
        auto const       add = [&](char const symbol) {
            auto const slot = static_cast<uint8_t>(symbol);
            if (!used[slot]) {
                used.set(slot);
                symbols.push_back(symbol);
            }
        };
        for (auto const& word : words) {
            for (char const symbol : word) {
                auto const value = static_cast<unsigned char>(symbol);
                if (std::isalpha(value) != 0) {
                    add(static_cast<char>(std::toupper(value)));
                }
            }
        }
        if (symbols.empty()) {
            throw cipher_error(
                    error_code::invalid_alphabet,
                    "No valid alphabetic characters found in words");
        }
        for (char const symbol : base) {
            add(symbol);
        }
        return alphabet(symbols);
    }

    std::vector<alphabet> make_keyed_alphabets(
            std::span<std::string const> const words, std::string_view const base) {
        std::vector<alphabet> result;
        result.reserve(words.size());
        for (auto const& word : words) {
            result.push_back(make_keyed_alphabet({&word, 1U}, base));
        }
        return result;
    }
}    // namespace polysub
