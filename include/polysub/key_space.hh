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

#ifndef POLYSUB_KEY_SPACE_HH
#define POLYSUB_KEY_SPACE_HH

#include <polysub/alphabet.hh>

#include <cstddef>
#include <optional>
#include <ranges>
#include <string>

namespace polysub {
    // All keys of a fixed length over an alphabet, in lexicographic order of
    // their index tuples. Nothing is materialized: key number n is the
    // base-size() expansion of n, most significant digit first.
    class key_space {
    public:
        // Throws cipher_error(invalid_key) for a zero length, and
        // cipher_error(combinatorial_limit_exceeded) if the key count does not
        // fit in a size_t.
        key_space(alphabet alpha_in, size_t length_in);

        // alphabet_size ^ length, or nullopt on overflow.
        [[nodiscard]] static std::optional<size_t> count(
                size_t alphabet_size, size_t length) noexcept;

        [[nodiscard]] size_t size() const noexcept {
            return total;
        }

        [[nodiscard]] size_t key_length() const noexcept {
            return length;
        }

        [[nodiscard]] alphabet const& get_alphabet() const noexcept {
            return alpha;
        }

        [[nodiscard]] std::string operator[](size_t index) const;

        // Writes key number index into buffer, reusing its storage.
        void fill(size_t index, std::string& buffer) const;

        [[nodiscard]] auto keys() const {
            return std::views::iota(size_t{0}, total)
                   | std::views::transform([this](size_t const index) {
                         return (*this)[index];
                     });
        }

    private:
        alphabet alpha;
        size_t   length;
        size_t   total;
    };
}    // namespace polysub

#endif    // POLYSUB_KEY_SPACE_HH
