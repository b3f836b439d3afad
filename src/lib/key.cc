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

#include "polysub/key.hh"

#include "polysub/alphabet.hh"
#include "polysub/cipher_error.hh"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    key::key(std::string_view const symbols_in) : symbol_list(symbols_in) {
        if (symbol_list.empty()) {
            throw cipher_error(error_code::invalid_key, "Key cannot be empty");
        }
    }

    key::key(std::string_view const symbols_in, alphabet const& owner) : key(symbols_in) {
        // Result only matters for the exception it may throw.
        static_cast<void>(indices_in(owner));
    }

    bool key::is_valid_for(alphabet const& owner) const noexcept {
        return std::ranges::all_of(symbol_list, [&](char const symbol) {
            return owner.contains(symbol);
        });
    }

    std::vector<size_t> key::indices_in(alphabet const& owner) const {
        std::vector<size_t> result;
        result.reserve(symbol_list.size());
        for (size_t ii = 0; ii < symbol_list.size(); ii++) {
            auto const index = owner.index_of(symbol_list[ii]);
            if (!index) {
                throw cipher_error(
                        error_code::invalid_key,
                        "Key contains characters not in alphabet: '"
                                + std::string(1, symbol_list[ii]) + "' at position "
                                + std::to_string(ii) + " of key '" + symbol_list + "'");
            }
            result.push_back(*index);
        }
        return result;
    }
}    // namespace polysub
