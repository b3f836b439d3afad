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

#ifndef POLYSUB_TEXT_UTILS_HH
#define POLYSUB_TEXT_UTILS_HH

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace polysub {
    // ASCII upper-casing. The engine never folds case by itself.
    [[nodiscard]] std::string to_upper(std::string_view text);

    // "ABCDEFGH" -> "ABCDE FGH" for group_size 5.
    [[nodiscard]] std::string group_symbols(
            std::string_view text, size_t group_size = 5U,
            std::string_view separator = " ");

    // Whitespace trimmed from both ends.
    [[nodiscard]] std::string_view trim(std::string_view text) noexcept;

    // Rest of the stream, minus trailing CR/LF characters. Streams that
    // cannot seek are read to the end in one pass. Throws std::runtime_error
    // if a seekable stream comes back short.
    [[nodiscard]] std::string read_text(std::istream& source);
}    // namespace polysub

#endif    // POLYSUB_TEXT_UTILS_HH
