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

#include "polysub/alphabet.hh"
#include "polysub/key.hh"
#include "polysub/options_lib.hh"
#include "polysub/orchestrator.hh"
#include "polysub/report.hh"
#include "polysub/word_list.hh"

#include <getopt.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <span>
#include <string>
#include <vector>

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    constexpr static inline std::array const long_options{
            option{  "alphabets", required_argument, nullptr, 'b'},
            option{"keyed-words", required_argument, nullptr, 'w'},
            option{       "keys", required_argument, nullptr, 'K'},
            option{        "key", required_argument, nullptr, 'k'},
            option{    "autokey",       no_argument, nullptr, 'A'},
            option{       "jobs", required_argument, nullptr, 'j'},
            option{     "format", required_argument, nullptr, 'f'},
            option{    "verbose",       no_argument, nullptr, 'v'},
            option{      nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options
            = polysub::make_short_options<&long_options>();

    constexpr static inline char const* synopsis
            = "[-b|--alphabets={filename}|-w|--keyed-words={filename}] "
              "-K|--keys={filename}|-k|--key={key} [-A|--autokey] [-j|--jobs={count}] "
              "[-f|--format=text|csv] [-v|--verbose]";
    constexpr static inline char const* description
            = "Decrypts {input_filename} under every pair of candidate alphabet and "
              "candidate key and writes all candidates to {output_filename}.";

    std::filesystem::path  program;
    std::span<char*>       arguments;
    std::span<char*>       positional;

    std::string            key_symbols;
    bool                   autokey = false;
    bool                   verbose = false;
    size_t                 jobs    = 1;
    polysub::report_format format  = polysub::report_format::text;
    std::filesystem::path  alphabets_file;
    std::filesystem::path  words_file;
    std::filesystem::path  keys_file;

    void parse_extra(int const option_char, char const* argument) {
        switch (option_char) {
        case 'b':
            alphabets_file = argument;
            break;
        case 'w':
            words_file = argument;
            break;
        case 'K':
            keys_file = argument;
            break;
        default:
            break;
        }
    }

    void print_extra_usage(std::ostream& out) const {
        out << "        -K,--keys       File with candidate keys, separated by commas, "
               "newlines or spaces.\n"
            << "        -b,--alphabets  File with one candidate alphabet per line "
               "(default: A-Z).\n"
            << "        -w,--keyed-words File with words; each one makes a keyed "
               "alphabet.\n";
    }

    [[nodiscard]] int check() const {
        if (key_symbols.empty() == keys_file.empty()) {
            std::cerr << "Error: exactly one of --key and --keys must be given.\n\n";
            return 4;
        }
        if (!alphabets_file.empty() && !words_file.empty()) {
            std::cerr << "Error: --alphabets and --keyed-words cannot be used "
                         "together.\n\n";
            return 4;
        }
        return 0;
    }

    [[nodiscard]] static std::ifstream open_list(std::filesystem::path const& name) {
        std::ifstream source(name, std::ios::in);
        if (!source.good()) {
            std::cerr << "Input file '" << name << "' could not be opened.\n\n";
            throw 2;
        }
        return source;
    }

    [[nodiscard]] std::vector<polysub::alphabet> load_alphabets() const {
        if (!alphabets_file.empty()) {
            auto source = open_list(alphabets_file);
            return polysub::parse_alphabet_list(source);
        }
        if (!words_file.empty()) {
            auto       source = open_list(words_file);
            auto const words  = polysub::parse_word_list(source);
            return polysub::make_keyed_alphabets(words);
        }
        return {polysub::alphabet::standard_english()};
    }

    [[nodiscard]] std::vector<polysub::key> load_keys() const {
        if (!key_symbols.empty()) {
            return {polysub::key(key_symbols)};
        }
        auto source = open_list(keys_file);
        return polysub::parse_key_list(source);
    }

    int process(std::string const& text, std::ostream& output) const {
        auto const alphabets = load_alphabets();
        auto const keys      = load_keys();
        auto const options   = polysub::detail::get_run_options(*this);
        if (verbose) {
            std::cerr << "Alphabets:      " << alphabets.size() << '\n'
                      << "Keys:           " << keys.size() << '\n'
                      << "Mode:           "
                      << polysub::to_string(polysub::detail::get_mode(*this)) << "\n\n";
        }
        polysub::detail::install_interrupt_handler();

        auto const result = polysub::orchestrator::run(
                text, alphabets, keys, polysub::detail::get_mode(*this), options);
        polysub::write_report(output, format, result);
        if (!result.complete) {
            std::cerr << "Interrupted: partial results were written.\n";
            return 7;
        }
        return 0;
    }
};

int main(int argc, char* argv[]) {
    return polysub::run_cipher_tool(options_t({argv, static_cast<size_t>(argc)}));
}
