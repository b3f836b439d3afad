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

#ifndef POLYSUB_REPORT_HH
#define POLYSUB_REPORT_HH

#include <polysub/brute_force.hh>
#include <polysub/cipher_engine.hh>
#include <polysub/orchestrator.hh>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>

namespace polysub {
    enum class report_format : uint8_t {
        text,
        csv
    };

    [[nodiscard]] std::optional<report_format> parse_report_format(
            std::string_view name) noexcept;

    // Key line and outcome only, as used for each entry of the set reports.
    void write_text_report(std::ostream& out, transform_result const& result);
    void write_text_report(std::ostream& out, brute_force_result_set const& result);
    void write_text_report(
            std::ostream& out, std::span<brute_force_result_set const> results);
    void write_text_report(std::ostream& out, orchestration_result_set const& result);

    // Columns: Alphabet,Key,Key Length,Success,Text,Error
    void write_csv_report(std::ostream& out, std::span<transform_result const> results);
    void write_csv_report(
            std::ostream& out, std::span<brute_force_result_set const> results);

    void write_report(
            std::ostream& out, report_format format,
            std::span<brute_force_result_set const> results);
    void write_report(
            std::ostream& out, report_format format,
            orchestration_result_set const& result);
}    // namespace polysub

#endif    // POLYSUB_REPORT_HH
