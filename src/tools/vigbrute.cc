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

#include "polysub/brute_force.hh"
#include "polysub/options_lib.hh"
#include "polysub/report.hh"

#include <getopt.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <span>
#include <string>
#include <vector>

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    constexpr static inline std::array const long_options{
            option{    "length", required_argument, nullptr, 'l'},
            option{"max-length", required_argument, nullptr, 'L'},
            option{  "alphabet", required_argument, nullptr, 'a'},
            option{   "autokey",       no_argument, nullptr, 'A'},
            option{      "jobs", required_argument, nullptr, 'j'},
            option{     "limit", required_argument, nullptr, 'n'},
            option{    "format", required_argument, nullptr, 'f'},
            option{   "verbose",       no_argument, nullptr, 'v'},
            option{     nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options
            = polysub::make_short_options<&long_options>();

    constexpr static inline char const* synopsis
            = "-l|--length={length}|-L|--max-length={length} [-a|--alphabet={symbols}] "
              "[-A|--autokey] [-j|--jobs={count}] [-n|--limit={count}] "
              "[-f|--format=text|csv] [-v|--verbose]";
    constexpr static inline char const* description
            = "Decrypts {input_filename} under every key of the given length and "
              "writes all candidates to {output_filename}.";

    std::filesystem::path program;
    std::span<char*>      arguments;
    std::span<char*>      positional;

    std::string           alphabet_symbols;
    bool                  autokey    = false;
    bool                  verbose    = false;
    size_t                jobs       = 1;
    size_t                limit      = polysub::run_options::default_max_candidates;
    polysub::report_format format    = polysub::report_format::text;
    size_t                key_length = 0;
    size_t                max_length = 0;

    void parse_extra(int const option_char, char const* argument) {
        switch (option_char) {
        case 'l':
            polysub::detail::parse_number(key_length, "length", argument);
            break;
        case 'L':
            polysub::detail::parse_number(max_length, "max-length", argument);
            break;
        default:
            break;
        }
    }

    void print_extra_usage(std::ostream& out) const {
        out << "        -l,--length     Try every key of exactly {length} symbols.\n"
            << "        -L,--max-length Try every key of 1 to {length} symbols.\n";
    }

    [[nodiscard]] int check() const {
        if ((key_length == 0) == (max_length == 0)) {
            std::cerr << "Error: exactly one of --length and --max-length must be "
                         "given, with a positive value.\n\n";
            return 4;
        }
        return 0;
    }

    int process(std::string const& text, std::ostream& output) const {
        auto const alpha   = polysub::detail::get_alphabet(*this);
        auto const mode    = polysub::detail::get_mode(*this);
        auto const options = polysub::detail::get_run_options(*this);
        polysub::detail::print_summary(*this, alpha, std::max(key_length, max_length));
        polysub::detail::install_interrupt_handler();

        std::vector<polysub::brute_force_result_set> results;
        if (key_length != 0) {
            results.push_back(
                    polysub::brute_force::run(text, alpha, key_length, mode, options));
        } else {
            results = polysub::brute_force::run_lengths(
                    text, alpha, 1U, max_length, mode, options);
        }
        polysub::write_report(output, format, results);

        if (!std::ranges::all_of(results, &polysub::brute_force_result_set::complete)) {
            std::cerr << "Interrupted: partial results were written.\n";
            return 7;
        }
        return 0;
    }
};

int main(int argc, char* argv[]) {
    return polysub::run_cipher_tool(options_t({argv, static_cast<size_t>(argc)}));
}
