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

#ifndef POLYSUB_OPTIONS_LIB_HH
#define POLYSUB_OPTIONS_LIB_HH

#include <polysub/alphabet.hh>
#include <polysub/cipher_engine.hh>
#include <polysub/cipher_error.hh>
#include <polysub/report.hh>
#include <polysub/text_utils.hh>
#include <polysub/trial_runner.hh>

#include <getopt.h>

#include <array>
#include <charconv>
#include <concepts>    // IWYU pragma: keep
#include <csignal>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace polysub {
    template <auto* long_options>
    requires requires(decltype(long_options) opt) {
        { opt->size() } -> std::same_as<size_t>;
        { opt->data() } -> std::same_as<option const*>;
    }
    consteval inline auto make_short_options() {
        static_assert(long_options->back().name == nullptr);
        constexpr auto const result = [&]() consteval noexcept {
            std::array<char, 3U * (long_options->size() - 1U)> intermediate{};

            size_t length = 0;
            for (auto const& opt : *long_options) {
                if (opt.name == nullptr) {
                    break;
                }
                char const val = static_cast<char>(opt.val);
                if (val == '\0') {
                    continue;
                }
                intermediate[length++] = val;
                switch (opt.has_arg) {
                case no_argument:
                    break;
                case optional_argument:
                    intermediate[length++] = ':';
                    intermediate[length++] = ':';
                    break;
                case required_argument:
                    intermediate[length++] = ':';
                    break;
                }
            }
            return std::pair{intermediate, length};
        }();
        auto const to_init = [&]<size_t... Is>(std::index_sequence<Is...>) {
            return std::array{result.first[Is]..., '\0'};
        };
        return to_init(std::make_index_sequence<result.second>());
    }

    namespace detail {
        // Set by SIGINT; batch tools hand it to the runner.
        inline cancellation interrupt_flag;

        inline void install_interrupt_handler() {
            std::signal(SIGINT, [](int) {
                interrupt_flag.request();
            });
        }

        [[noreturn]] inline void print_error(
                std::errc error, std::string_view const parameter, char const* value) {
            if (error == std::errc::invalid_argument) {
                std::cerr << "Invalid value '" << value << "' given for '" << parameter
                          << "' parameter!\n";
            } else if (error == std::errc::result_out_of_range) {
                std::cerr << "The value '" << value << "' given for '" << parameter
                          << "' parameter is out of range!\n";
            } else {
                std::cerr << "Unknown error happened when parsing value '" << value
                          << "' given for '" << parameter << "' parameter!\n";
            }
            throw 5;
        }

        template <std::integral T>
        inline void parse_number(
                T& target, std::string_view const parameter, char const* value_in) {
            if (value_in == nullptr) {
                return;
            }
            std::string_view const value(value_in);
            auto [ptr, ec] = std::from_chars(
                    std::ranges::cbegin(value), std::ranges::cend(value), target);
            if (ec == std::errc{} && ptr != std::ranges::cend(value)) {
                ec = std::errc::invalid_argument;
            }
            if (ec != std::errc{}) {
                print_error(ec, parameter, value_in);
            }
        }

        template <typename options_t>
        concept has_alphabet = requires(options_t opt) {
            { opt.alphabet_symbols } -> std::same_as<std::string&>;
        };
        template <typename options_t>
        concept has_key = requires(options_t opt) {
            { opt.key_symbols } -> std::same_as<std::string&>;
        };
        template <typename options_t>
        concept has_autokey = requires(options_t opt) {
            { opt.autokey } -> std::same_as<bool&>;
        };
        template <typename options_t>
        concept has_verbose = requires(options_t opt) {
            { opt.verbose } -> std::same_as<bool&>;
        };
        template <typename options_t>
        concept has_jobs = requires(options_t opt) {
            { opt.jobs } -> std::same_as<size_t&>;
        };
        template <typename options_t>
        concept has_limit = requires(options_t opt) {
            { opt.limit } -> std::same_as<size_t&>;
        };
        template <typename options_t>
        concept has_format = requires(options_t opt) {
            { opt.format } -> std::same_as<report_format&>;
        };
        template <typename options_t>
        concept has_parse_extra
                = requires(options_t opt, int option_char, char const* argument) {
                      { opt.parse_extra(option_char, argument) };
                  };
        template <typename options_t>
        concept has_extra_usage = requires(options_t const opt, std::ostream& out) {
            { opt.print_extra_usage(out) };
        };

        template <typename options_t>
        [[nodiscard]] inline cipher_mode get_mode(options_t const& options) noexcept {
            if constexpr (has_autokey<options_t>) {
                return options.autokey ? cipher_mode::autokey : cipher_mode::classic;
            } else {
                return cipher_mode::classic;
            }
        }

        template <typename options_t>
        [[nodiscard]] inline alphabet get_alphabet(options_t const& options) {
            if constexpr (has_alphabet<options_t>) {
                if (!options.alphabet_symbols.empty()) {
                    return alphabet(options.alphabet_symbols);
                }
            }
            return alphabet::standard_english();
        }

        template <typename options_t>
        [[nodiscard]] inline run_options get_run_options(options_t const& options) {
            run_options result;
            if constexpr (has_jobs<options_t>) {
                result.workers = options.jobs;
            }
            if constexpr (has_limit<options_t>) {
                result.max_candidates = options.limit;
            }
            result.cancel = &interrupt_flag;
            return result;
        }

        template <typename options_t>
        inline void print_summary(
                options_t const& options, alphabet const& alpha, size_t const key_length) {
            if constexpr (has_verbose<options_t>) {
                if (!options.verbose) {
                    return;
                }
                std::cerr << "Cipher:         Vigenere\n"
                          << "Alphabet:       " << alpha.symbols() << '\n'
                          << "Alphabet Size:  " << alpha.size() << '\n'
                          << "Mode:           " << to_string(get_mode(options)) << '\n';
                if (key_length != 0) {
                    std::cerr << "Key Length:     " << key_length << '\n';
                }
                std::cerr << '\n';
            }
        }

        template <typename options_t>
        inline void parse_format(options_t& options, char const* parameter) {
            if constexpr (has_format<options_t>) {
                if (parameter == nullptr) {
                    return;
                }
                auto const format = parse_report_format(parameter);
                if (!format) {
                    print_error(std::errc::invalid_argument, "format", parameter);
                }
                options.format = *format;
            }
        }

        template <typename options_t>
        inline void command_argument_parser(options_t& options) {
            options.program = options.arguments.front();
            int const count = static_cast<int>(std::ssize(options.arguments));
            while (true) {
                int       option_index = 0;
                int const option_char  = getopt_long(
                        count, options.arguments.data(), options_t::short_options.data(),
                        options_t::long_options.data(), &option_index);
                if (option_char == -1) {
                    break;
                }

                switch (option_char) {
                case 'a':
                    if constexpr (has_alphabet<options_t>) {
                        options.alphabet_symbols = optarg;
                    }
                    break;
                case 'k':
                    if constexpr (has_key<options_t>) {
                        options.key_symbols = optarg;
                    }
                    break;
                case 'A':
                    if constexpr (has_autokey<options_t>) {
                        options.autokey = true;
                    }
                    break;
                case 'v':
                    if constexpr (has_verbose<options_t>) {
                        options.verbose = true;
                    }
                    break;
                case 'j':
                    if constexpr (has_jobs<options_t>) {
                        parse_number(options.jobs, "jobs", optarg);
                    }
                    break;
                case 'n':
                    if constexpr (has_limit<options_t>) {
                        parse_number(options.limit, "limit", optarg);
                    }
                    break;
                case 'f':
                    parse_format(options, optarg);
                    break;
                case '?':
                    throw 1;
                default:
                    if constexpr (has_parse_extra<options_t>) {
                        options.parse_extra(option_char, optarg);
                    }
                    break;
                }
            }
            options.positional = options.arguments.subspan(static_cast<size_t>(optind));
        }

        template <typename options_t>
        int print_usage(options_t const& options, std::ostream& out) {
            using namespace std::string_view_literals;
            auto const program = options.program.filename().string();
            out << "Usage: " << program << ' ' << options_t::synopsis
                << " {input_filename} {output_filename}\n"sv;
            out << "    " << options_t::description << "\n\n"sv;
            if constexpr (has_key<options_t>) {
                out << "        -k,--key        Key to use.\n"sv;
            }
            if constexpr (has_alphabet<options_t>) {
                out << "        -a,--alphabet   Alphabet to use (default: A-Z).\n"sv;
            }
            if constexpr (has_autokey<options_t>) {
                out << "        -A,--autokey    Use autokey mode instead of a repeating key.\n"sv;
            }
            if constexpr (has_extra_usage<options_t>) {
                options.print_extra_usage(out);
            }
            if constexpr (has_jobs<options_t>) {
                out << "        -j,--jobs       Number of worker threads (0: one per core; default: 1).\n"sv;
            }
            if constexpr (has_limit<options_t>) {
                out << "        -n,--limit      Refuse searches of more than {limit} keys (default: "sv
                    << run_options::default_max_candidates << ").\n"sv;
            }
            if constexpr (has_format<options_t>) {
                out << "        -f,--format     Report format: text or csv (default: text).\n"sv;
            }
            if constexpr (has_verbose<options_t>) {
                out << "        -v,--verbose    Print cipher parameters to stderr.\n"sv;
            }
            return 1;
        }
    }    // namespace detail

    // Shared main() for the tools: parses options, reads the input file, and
    // hands the text to options.process() with the opened output file.
    template <typename options_t>
    inline int run_cipher_tool(options_t options) {
        try {
            detail::command_argument_parser(options);
            if (options.positional.size() != 2) {
                detail::print_usage(options, std::cout);
                return 1;
            }
            if (int const status = options.check(); status != 0) {
                return status;
            }

            std::filesystem::path infile{options.positional.front()};
            std::filesystem::path outfile{options.positional.back()};

            std::ifstream input(infile, std::ios::in | std::ios::binary);
            if (!input.good()) {
                std::cerr << "Input file '" << infile << "' could not be opened.\n\n";
                return 2;
            }
            std::string const text = read_text(input);
            input.close();

            std::ofstream output(outfile, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!output.good()) {
                std::cerr << "Output file '" << outfile << "' could not be opened.\n\n";
                return 3;
            }
            return options.process(text, output);
        } catch (int error) {
            return error;
        } catch (cipher_error const& error) {
            std::cerr << "Error: [" << to_string(error.code()) << "] " << error.what()
                      << "\n\n";
            return 6;
        } catch (std::exception const& error) {
            std::cerr << "Error: " << error.what() << "\n\n";
            return -1;
        }
    }
}    // namespace polysub

#endif    // POLYSUB_OPTIONS_LIB_HH
