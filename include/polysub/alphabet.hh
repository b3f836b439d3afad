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

#ifndef POLYSUB_ALPHABET_HH
#define POLYSUB_ALPHABET_HH

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace polysub {
    // Ordered, duplicate-free set of byte symbols. Immutable once built.
    class alphabet {
    public:
        // Throws cipher_error(invalid_alphabet) if symbols is empty or has a
        // repeated symbol. Nothing is normalized: case is significant. A single
        // symbol is accepted; every shift is then the identity.
        explicit alphabet(std::string_view symbols_in);

        [[nodiscard]] static alphabet standard_english();
        [[nodiscard]] static alphabet extended_english();

        [[nodiscard]] size_t size() const noexcept {
            return symbol_list.size();
        }

        [[nodiscard]] std::string_view symbols() const noexcept {
            return symbol_list;
        }

        [[nodiscard]] bool contains(char const symbol) const noexcept {
            return reverse[slot(symbol)] != not_member;
        }

        // Position of symbol, or nullopt if it is not a member.
        [[nodiscard]] std::optional<size_t> index_of(char const symbol) const noexcept {
            uint16_t const index = reverse[slot(symbol)];
            if (index == not_member) {
                return std::nullopt;
            }
            return index;
        }

        // Total over all integers; index is reduced modulo size().
        [[nodiscard]] char symbol_at(int64_t index) const noexcept;

        // Keeps member symbols, plus whitespace if keep_spaces is set.
        [[nodiscard]] std::string filter(
                std::string_view text, bool keep_spaces = true) const;

        friend bool operator==(alphabet const& lhs, alphabet const& rhs) noexcept {
            return lhs.symbol_list == rhs.symbol_list;
        }

    private:
        constexpr static uint16_t const not_member = std::numeric_limits<uint16_t>::max();

        constexpr static size_t slot(char const symbol) noexcept {
            return static_cast<uint8_t>(symbol);
        }

        std::string                symbol_list;
        std::array<uint16_t, 256U> reverse{};
    };
}    // namespace polysub

#endif    // POLYSUB_ALPHABET_HH
