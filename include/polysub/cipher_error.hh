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

#ifndef POLYSUB_CIPHER_ERROR_HH
#define POLYSUB_CIPHER_ERROR_HH

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace polysub {
    enum class error_code : uint8_t {
        invalid_alphabet,
        invalid_key,
        empty_input,
        combinatorial_limit_exceeded
    };

    [[nodiscard]] constexpr std::string_view to_string(error_code const code) noexcept {
        // NOLINTNEXTLINE(clang-diagnostic-switch-default)
        switch (code) {
            using enum error_code;
        case invalid_alphabet:
            return "invalid_alphabet";
        case invalid_key:
            return "invalid_key";
        case empty_input:
            return "empty_input";
        case combinatorial_limit_exceeded:
            return "combinatorial_limit_exceeded";
        }
        __builtin_unreachable();
    }

    class cipher_error : public std::runtime_error {
    public:
        cipher_error(error_code code_in, std::string const& message)
                : std::runtime_error(message), error(code_in) {}

        [[nodiscard]] error_code code() const noexcept {
            return error;
        }

    private:
        error_code error;
    };
}    // namespace polysub

#endif    // POLYSUB_CIPHER_ERROR_HH
