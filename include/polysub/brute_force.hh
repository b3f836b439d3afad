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

#ifndef POLYSUB_BRUTE_FORCE_HH
#define POLYSUB_BRUTE_FORCE_HH

#include <polysub/alphabet.hh>
#include <polysub/cipher_engine.hh>
#include <polysub/trial_runner.hh>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    struct brute_force_result_set {
        std::string                   ciphertext;
        std::string                   alphabet_symbols;
        size_t                        key_length = 0;
        cipher_mode                   mode       = cipher_mode::classic;
        // alphabet size ^ key length; results.size() is less only when the
        // run was cancelled.
        size_t                        expected_count = 0;
        std::vector<transform_result> results;
        bool                          complete = true;

        [[nodiscard]] size_t successful() const noexcept;
    };

    // Decrypts one ciphertext under every key of a given length. The success
    // flag of each result only says that the decryption ran; no attempt is
    // made to judge the plaintext.
    class brute_force {
    public:
        // Throws cipher_error(combinatorial_limit_exceeded) before doing any
        // work if the key count is over options.max_candidates, and
        // cipher_error(invalid_key) for a zero key_length.
        [[nodiscard]] static brute_force_result_set run(
                std::string_view ciphertext, alphabet const& alpha, size_t key_length,
                cipher_mode mode, run_options const& options = {});

        // One set per length in [min_length, max_length]. The ceiling applies
        // to the sum over all lengths. Lengths after a cancelled one are not
        // started.
        [[nodiscard]] static std::vector<brute_force_result_set> run_lengths(
                std::string_view ciphertext, alphabet const& alpha, size_t min_length,
                size_t max_length, cipher_mode mode, run_options const& options = {});
    };
}    // namespace polysub

#endif    // POLYSUB_BRUTE_FORCE_HH
