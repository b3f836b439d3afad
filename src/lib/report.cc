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

#include "polysub/report.hh"

#include "polysub/brute_force.hh"
#include "polysub/cipher_engine.hh"
#include "polysub/cipher_error.hh"
#include "polysub/orchestrator.hh"

#include <boost/io/ios_state.hpp>

#include <algorithm>
#include <cstddef>
#include <ios>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace polysub {
    namespace {
        using namespace std::string_view_literals;

        constexpr std::string_view const double_rule = "============================================================"sv;
        constexpr std::string_view const single_rule = "------------------------------------------------------------"sv;

        void write_banner(std::ostream& out, std::string_view const title) {
            out << double_rule << '\n' << title << '\n' << double_rule << '\n';
        }

        void write_entries(
                std::ostream& out, std::span<transform_result const> const results,
                bool const with_alphabet) {
            for (auto const& entry : results) {
                if (with_alphabet) {
                    out << "Alphabet: " << entry.alphabet_symbols << '\n';
                }
                out << "Key: " << entry.key_symbols
                    << " (length: " << entry.key_symbols.size() << ')';
                if (entry.success) {
                    out << "\nDecrypted: " << entry.text << "\n\n";
                } else {
                    out << " - FAILED\nError: ";
                    if (entry.error) {
                        out << '[' << to_string(*entry.error) << "] ";
                    }
                    out << entry.error_message << "\n\n";
                }
            }
        }

        void write_csv_field(std::ostream& out, std::string_view const field) {
            if (field.find_first_of(",\"\r\n"sv) == std::string_view::npos) {
                out << field;
                return;
            }
            out << '"';
            for (char const symbol : field) {
                if (symbol == '"') {
                    out << '"';
                }
                out << symbol;
            }
            out << '"';
        }

        void write_csv_header(std::ostream& out) {
            out << "Alphabet,Key,Key Length,Success,Text,Error\r\n";
        }

        void write_csv_rows(std::ostream& out, std::span<transform_result const> results) {
            for (auto const& entry : results) {
                write_csv_field(out, entry.alphabet_symbols);
                out << ',';
                write_csv_field(out, entry.key_symbols);
                out << ',' << entry.key_symbols.size() << ','
                    << (entry.success ? "True"sv : "False"sv) << ',';
                write_csv_field(out, entry.success ? entry.text : std::string{});
                out << ',';
                write_csv_field(out, entry.error_message);
                out << "\r\n";
            }
        }
    }    // namespace

    std::optional<report_format> parse_report_format(std::string_view const name) noexcept {
        if (name == "text"sv || name == "txt"sv) {
            return report_format::text;
        }
        if (name == "csv"sv) {
            return report_format::csv;
        }
        return std::nullopt;
    }

    void write_text_report(std::ostream& out, transform_result const& result) {
        write_entries(out, std::span{&result, 1U}, false);
    }

    void write_text_report(std::ostream& out, brute_force_result_set const& result) {
        write_text_report(out, std::span{&result, 1U});
    }

    void write_text_report(
            std::ostream& out, std::span<brute_force_result_set const> const results) {
        boost::io::ios_all_saver const flags(out);
        size_t                         tried      = 0;
        size_t                         successful = 0;
        size_t                         max_length = 0;
        bool                           complete   = true;
        for (auto const& set : results) {
            tried += set.results.size();
            successful += set.successful();
            max_length = std::max(max_length, set.key_length);
            complete   = complete && set.complete;
        }

        write_banner(out, "BRUTE-FORCE DECRYPTION RESULTS"sv);
        out << std::boolalpha;
        if (!results.empty()) {
            out << "Ciphertext: " << results.front().ciphertext << '\n';
        }
        out << "Max Key Length: " << max_length << '\n';
        if (!results.empty()) {
            out << "Autokey Mode: " << (results.front().mode == cipher_mode::autokey)
                << '\n';
            out << "Alphabet: " << results.front().alphabet_symbols << '\n';
        }
        out << "Total Keys Tried: " << tried << '\n';
        out << "Successful Decryptions: " << successful << '\n';
        out << "Complete: " << complete << "\n\n";
        out << "RESULTS:\n" << single_rule << '\n';
        for (auto const& set : results) {
            write_entries(out, set.results, false);
        }
    }

    void write_text_report(std::ostream& out, orchestration_result_set const& result) {
        boost::io::ios_all_saver const flags(out);
        write_banner(out, "ORCHESTRATION DECRYPTION RESULTS"sv);
        out << std::boolalpha;
        out << "Ciphertext: " << result.ciphertext << '\n';
        out << "Max Key Length: " << result.max_key_length << '\n';
        out << "Autokey Mode: " << (result.mode == cipher_mode::autokey) << '\n';
        out << "Total Alphabets: " << result.alphabet_count << '\n';
        out << "Total Keys: " << result.key_count << '\n';
        out << "Successful Decryptions: " << result.successful() << '\n';
        out << "Complete: " << result.complete << "\n\n";
        out << "RESULTS:\n" << single_rule << '\n';
        write_entries(out, result.results, true);
    }

    void write_csv_report(std::ostream& out, std::span<transform_result const> const results) {
        write_csv_header(out);
        write_csv_rows(out, results);
    }

    void write_csv_report(
            std::ostream& out, std::span<brute_force_result_set const> const results) {
        write_csv_header(out);
        for (auto const& set : results) {
            write_csv_rows(out, set.results);
        }
    }

    void write_report(
            std::ostream& out, report_format const format,
            std::span<brute_force_result_set const> const results) {
        if (format == report_format::csv) {
            write_csv_report(out, results);
        } else {
            write_text_report(out, results);
        }
    }

    void write_report(
            std::ostream& out, report_format const format,
            orchestration_result_set const& result) {
        if (format == report_format::csv) {
            write_csv_report(out, result.results);
        } else {
            write_text_report(out, result);
        }
    }
}    // namespace polysub
