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

#include "polysub/cipher_engine.hh"
#include "polysub/key.hh"
#include "polysub/options_lib.hh"
#include "polysub/text_utils.hh"

#include <getopt.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <span>
#include <string>

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    constexpr static inline std::array const long_options{
            option{  "decrypt",       no_argument, nullptr, 'd'},
            option{      "key", required_argument, nullptr, 'k'},
            option{ "alphabet", required_argument, nullptr, 'a'},
            option{  "autokey",       no_argument, nullptr, 'A'},
            option{"uppercase",       no_argument, nullptr, 'u'},
            option{    "group", optional_argument, nullptr, 'g'},
            option{  "verbose",       no_argument, nullptr, 'v'},
            option{    nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options
            = polysub::make_short_options<&long_options>();

    constexpr static inline char const* synopsis
            = "[-d|--decrypt] -k|--key={key} [-a|--alphabet={symbols}] [-A|--autokey] "
              "[-u|--uppercase] [-g|--group[={size}]] [-v|--verbose]";
    constexpr static inline char const* description
            = "Encrypts (or with -d, decrypts) {input_filename} into {output_filename}.";

    std::filesystem::path program;
    std::span<char*>      arguments;
    std::span<char*>      positional;

    std::string alphabet_symbols;
    std::string key_symbols;
    bool        autokey    = false;
    bool        verbose    = false;
    bool        decrypt    = false;
    bool        uppercase  = false;
    size_t      group_size = 0;

    void parse_extra(int const option_char, char const* argument) {
        switch (option_char) {
        case 'd':
            decrypt = true;
            break;
        case 'u':
            uppercase = true;
            break;
        case 'g':
            group_size = 5;
            polysub::detail::parse_number(group_size, "group", argument);
            break;
        default:
            break;
        }
    }

    void print_extra_usage(std::ostream& out) const {
        out << "        -d,--decrypt    Decrypt instead of encrypting.\n"
            << "        -u,--uppercase  Upper-case the input before the transform.\n"
            << "        -g,--group      Split the output into groups of {size} symbols "
               "(default: 5).\n";
    }

    [[nodiscard]] int check() const {
        if (key_symbols.empty()) {
            std::cerr << "Error: a key must be given with -k|--key.\n\n";
            return 4;
        }
        return 0;
    }

    int process(std::string const& text, std::ostream& output) const {
        auto const alpha = polysub::detail::get_alphabet(*this);
        polysub::detail::print_summary(*this, alpha, key_symbols.size());

        polysub::cipher_engine const engine(
                alpha, polysub::key(key_symbols), polysub::detail::get_mode(*this));
        std::string const input  = uppercase ? polysub::to_upper(text) : text;
        std::string       result = decrypt ? engine.decrypt(input) : engine.encrypt(input);
        if (group_size != 0) {
            result = polysub::group_symbols(result, group_size);
        }
        output << result << '\n';
        return 0;
    }
};

int main(int argc, char* argv[]) {
    return polysub::run_cipher_tool(options_t({argv, static_cast<size_t>(argc)}));
}
