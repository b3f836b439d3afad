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

#include "polysub/key_space.hh"

#include "polysub/alphabet.hh"
#include "polysub/cipher_error.hh"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace polysub {
    std::optional<size_t> key_space::count(
            size_t const alphabet_size, size_t const length) noexcept {
        size_t result = 1;
        for (size_t ii = 0; ii < length; ii++) {
            if (alphabet_size != 0
                && result > std::numeric_limits<size_t>::max() / alphabet_size) {
                return std::nullopt;
            }
            result *= alphabet_size;
        }
        return result;
    }

    key_space::key_space(alphabet alpha_in, size_t const length_in)
            : alpha(std::move(alpha_in)), length(length_in), total(0) {
        if (length == 0) {
            throw cipher_error(error_code::invalid_key, "Key length must be positive");
        }
        auto const value = count(alpha.size(), length);
        if (!value) {
            throw cipher_error(
                    error_code::combinatorial_limit_exceeded,
                    "Search space of " + std::to_string(alpha.size()) + "^"
                            + std::to_string(length) + " keys is too large");
        }
        total = *value;
    }

    std::string key_space::operator[](size_t const index) const {
        std::string result;
        fill(index, result);
        return result;
    }

    void key_space::fill(size_t index, std::string& buffer) const {
        if (index >= total) {
            throw std::out_of_range(
                    "Key index " + std::to_string(index) + " is past the end of a "
                    + std::to_string(total) + "-key space");
        }
        buffer.resize(length);
        size_t const base = alpha.size();
        for (size_t ii = length; ii > 0; ii--) {
            buffer[ii - 1] = alpha.symbol_at(static_cast<int64_t>(index % base));
            index /= base;
        }
    }
}    // namespace polysub
