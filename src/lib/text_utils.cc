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

#include "polysub/text_utils.hh"

#include <cctype>
#include <cstddef>
#include <istream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace polysub {
    std::string to_upper(std::string_view const text) {
        std::string result(text);
        for (char& symbol : result) {
            symbol = static_cast<char>(std::toupper(static_cast<unsigned char>(symbol)));
        }
        return result;
    }

    std::string group_symbols(
            std::string_view const text, size_t const group_size,
            std::string_view const separator) {
        if (group_size == 0) {
            return std::string(text);
        }
        std::string result;
        result.reserve(text.size() + (text.size() / group_size) * separator.size());
        for (size_t start = 0; start < text.size(); start += group_size) {
            if (start != 0) {
                result.append(separator);
            }
            result.append(text.substr(start, group_size));
        }
        return result;
    }

    std::string_view trim(std::string_view text) noexcept {
        auto const is_space = [](char const symbol) noexcept {
            return std::isspace(static_cast<unsigned char>(symbol)) != 0;
        };
        while (!text.empty() && is_space(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && is_space(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    std::string read_text(std::istream& source) {
        std::string result;
        auto const  start = source.tellg();
        if (start == std::istream::pos_type(-1)) {
            // Pipes and terminals cannot be sized up front.
            source.clear();
            result.assign(
                    std::istreambuf_iterator<char>(source),
                    std::istreambuf_iterator<char>());
        } else {
            source.ignore(std::numeric_limits<std::streamsize>::max());
            auto const full_size = source.gcount();
            source.clear();
            source.seekg(start);
            result.resize(static_cast<size_t>(full_size));
            source.read(result.data(), full_size);
            if (source.gcount() != full_size) {
                throw std::runtime_error("Input stream could not be read back");
            }
        }
        while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
            result.pop_back();
        }
        return result;
    }
}    // namespace polysub
