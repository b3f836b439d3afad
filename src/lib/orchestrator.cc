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

#include "polysub/orchestrator.hh"

#include "polysub/alphabet.hh"
#include "polysub/cipher_engine.hh"
#include "polysub/key.hh"
#include "polysub/trial_runner.hh"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace polysub {
    size_t orchestration_result_set::successful() const noexcept {
        return static_cast<size_t>(std::ranges::count_if(
                results, [](transform_result const& entry) noexcept {
                    return entry.success;
                }));
    }

    orchestration_result_set orchestrator::run(
            std::string_view const ciphertext, std::span<alphabet const> const alphabets,
            std::span<key const> const keys, cipher_mode const mode,
            run_options const& options) {
        orchestration_result_set result{
                .ciphertext     = std::string(ciphertext),
                .mode           = mode,
                .alphabet_count = alphabets.size(),
                .key_count      = keys.size()};
        if (!keys.empty()) {
            result.max_key_length
                    = std::ranges::max(keys, {}, [](key const& entry) noexcept {
                          return entry.size();
                      }).size();
        }

        // Pair n is alphabet n / key count, key n % key count.
        auto batch = run_trials(result.expected_count(), options, [&](size_t const index) {
            alphabet const& alpha = alphabets[index / keys.size()];
            key const&      entry = keys[index % keys.size()];
            return cipher_engine::run(
                    alpha, entry.symbols(), mode, ciphertext, cipher_direction::decrypt);
        });
        result.results  = std::move(batch.results);
        result.complete = batch.complete;
        return result;
    }
}    // namespace polysub
