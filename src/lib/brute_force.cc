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

#include "polysub/alphabet.hh"
#include "polysub/cipher_engine.hh"
#include "polysub/cipher_error.hh"
#include "polysub/key_space.hh"
#include "polysub/trial_runner.hh"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polysub {
    namespace {
        [[noreturn]] void throw_limit_exceeded(
                std::string const& space, size_t const max_candidates) {
            throw cipher_error(
                    error_code::combinatorial_limit_exceeded,
                    "Search space of " + space + " keys exceeds the limit of "
                            + std::to_string(max_candidates) + " candidates");
        }

        brute_force_result_set search(
                std::string_view const ciphertext, key_space const& space,
                cipher_mode const mode, run_options const& options) {
            brute_force_result_set result{
                    .ciphertext       = std::string(ciphertext),
                    .alphabet_symbols = std::string(space.get_alphabet().symbols()),
                    .key_length       = space.key_length(),
                    .mode             = mode,
                    .expected_count   = space.size()};
            auto batch = run_trials(space.size(), options, [&](size_t const index) {
                return cipher_engine::run(
                        space.get_alphabet(), space[index], mode, ciphertext,
                        cipher_direction::decrypt);
            });
            result.results  = std::move(batch.results);
            result.complete = batch.complete;
            return result;
        }
    }    // namespace

    size_t brute_force_result_set::successful() const noexcept {
        return static_cast<size_t>(std::ranges::count_if(
                results, [](transform_result const& entry) noexcept {
                    return entry.success;
                }));
    }

    brute_force_result_set brute_force::run(
            std::string_view const ciphertext, alphabet const& alpha,
            size_t const key_length, cipher_mode const mode, run_options const& options) {
        key_space const space(alpha, key_length);
        if (space.size() > options.max_candidates) {
            throw_limit_exceeded(
                    std::to_string(alpha.size()) + "^" + std::to_string(key_length),
                    options.max_candidates);
        }
        return search(ciphertext, space, mode, options);
    }

    std::vector<brute_force_result_set> brute_force::run_lengths(
            std::string_view const ciphertext, alphabet const& alpha,
            size_t const min_length, size_t const max_length, cipher_mode const mode,
            run_options const& options) {
        if (min_length == 0 || min_length > max_length) {
            throw cipher_error(
                    error_code::invalid_key,
                    "Invalid key length range " + std::to_string(min_length) + ".."
                            + std::to_string(max_length));
        }
        std::string const range = std::to_string(alpha.size()) + "^"
                                  + std::to_string(min_length) + ".."
                                  + std::to_string(alpha.size()) + "^"
                                  + std::to_string(max_length);

        std::vector<key_space> spaces;
        size_t                 total = 0;
        for (size_t length = min_length; length <= max_length; length++) {
            auto const count = key_space::count(alpha.size(), length);
            if (!count || *count > std::numeric_limits<size_t>::max() - total) {
                throw_limit_exceeded(range, options.max_candidates);
            }
            total += *count;
            if (total > options.max_candidates) {
                throw_limit_exceeded(range, options.max_candidates);
            }
            spaces.emplace_back(alpha, length);
        }

        std::vector<brute_force_result_set> result;
        result.reserve(spaces.size());
        for (auto const& space : spaces) {
            result.push_back(search(ciphertext, space, mode, options));
            if (!result.back().complete) {
                break;
            }
        }
        return result;
    }
}    // namespace polysub
