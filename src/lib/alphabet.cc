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

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace polysub {
    alphabet::alphabet(std::string_view const symbols_in) : symbol_list(symbols_in) {
        if (symbol_list.empty()) {
            throw cipher_error(error_code::invalid_alphabet, "Alphabet cannot be empty");
        }
        std::ranges::fill(reverse, not_member);
        for (size_t ii = 0; ii < symbol_list.size(); ii++) {
            auto& entry = reverse[slot(symbol_list[ii])];
            if (entry != not_member) {
                throw cipher_error(
                        error_code::invalid_alphabet,
                        "Alphabet must contain unique characters; '"
                                + std::string(1, symbol_list[ii])
                                + "' is repeated at position " + std::to_string(ii));
            }
            entry = static_cast<uint16_t>(ii);
        }
    }

    alphabet alphabet::standard_english() {
        return alphabet("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
    }

    alphabet alphabet::extended_english() {
        return alphabet(
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
                "!@#$%^&*()_+-=[]{}|;:,.<>?");
    }

    char alphabet::symbol_at(int64_t const index) const noexcept {
        auto const count = static_cast<int64_t>(symbol_list.size());
        int64_t    value = index % count;
        if (value < 0) {
            value += count;
        }
        return symbol_list[static_cast<size_t>(value)];
    }

    std::string alphabet::filter(std::string_view const text, bool const keep_spaces) const {
        std::string result;
        result.reserve(text.size());
        for (char const symbol : text) {
            if (contains(symbol)
                || (keep_spaces && std::isspace(static_cast<unsigned char>(symbol)) != 0)) {
                result.push_back(symbol);
            }
        }
        return result;
    }
}    // namespace polysub
