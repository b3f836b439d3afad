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

#ifndef POLYSUB_ORCHESTRATOR_HH
#define POLYSUB_ORCHESTRATOR_HH

#include <polysub/alphabet.hh>
#include <polysub/cipher_engine.hh>
#include <polysub/key.hh>
#include <polysub/trial_runner.hh>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    struct orchestration_result_set {
        std::string                   ciphertext;
        cipher_mode                   mode           = cipher_mode::classic;
        size_t                        alphabet_count = 0;
        size_t                        key_count      = 0;
        size_t                        max_key_length = 0;
        // Alphabet-major, key-minor; failed pairs are kept in place.
        std::vector<transform_result> results;
        bool                          complete = true;

        [[nodiscard]] size_t expected_count() const noexcept {
            return alphabet_count * key_count;
        }

        [[nodiscard]] size_t successful() const noexcept;
    };

    class orchestrator {
    public:
        // Decrypts ciphertext under every (alphabet, key) pair. A key that does
        // not fit an alphabet, or any other cipher error, only fails its own
        // pair.
        [[nodiscard]] static orchestration_result_set run(
                std::string_view ciphertext, std::span<alphabet const> alphabets,
                std::span<key const> keys, cipher_mode mode,
                run_options const& options = {});
    };
}    // namespace polysub

#endif    // POLYSUB_ORCHESTRATOR_HH
