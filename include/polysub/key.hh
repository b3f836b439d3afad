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

#ifndef POLYSUB_KEY_HH
#define POLYSUB_KEY_HH

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    class alphabet;

    class key {
    public:
        // Only checks that the key is non-empty; membership is checked against
        // an alphabet later.
        explicit key(std::string_view symbols_in);
        // Strict form: every symbol must also belong to owner.
        key(std::string_view symbols_in, alphabet const& owner);

        [[nodiscard]] std::string_view symbols() const noexcept {
            return symbol_list;
        }

        [[nodiscard]] size_t size() const noexcept {
            return symbol_list.size();
        }

        [[nodiscard]] bool is_valid_for(alphabet const& owner) const noexcept;

        // Throws cipher_error(invalid_key) naming the first symbol that is not
        // in owner.
        [[nodiscard]] std::vector<size_t> indices_in(alphabet const& owner) const;

        friend bool operator==(key const& lhs, key const& rhs) noexcept = default;

    private:
        std::string symbol_list;
    };
}    // namespace polysub

#endif    // POLYSUB_KEY_HH
