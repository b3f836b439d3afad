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

#ifndef POLYSUB_CIPHER_ENGINE_HH
#define POLYSUB_CIPHER_ENGINE_HH

#include <polysub/alphabet.hh>
#include <polysub/cipher_error.hh>
#include <polysub/key.hh>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polysub {
    enum class cipher_mode : uint8_t {
        classic,
        autokey
    };

    enum class cipher_direction : uint8_t {
        encrypt,
        decrypt
    };

    [[nodiscard]] constexpr std::string_view to_string(cipher_mode const mode) noexcept {
        return mode == cipher_mode::autokey ? "autokey" : "classic";
    }

    [[nodiscard]] constexpr std::string_view to_string(
            cipher_direction const direction) noexcept {
        return direction == cipher_direction::decrypt ? "decrypt" : "encrypt";
    }

    // Outcome of one engine invocation, echoing what produced it.
    struct transform_result {
        std::string               text;
        bool                      success = false;
        std::optional<error_code> error;
        std::string               error_message;
        std::string               alphabet_symbols;
        std::string               key_symbols;
        cipher_mode               mode      = cipher_mode::classic;
        cipher_direction          direction = cipher_direction::decrypt;
        // Position in the batch run that produced it; 0 outside batch runs.
        size_t                    index = 0;
    };

    // Vigenere transform over an arbitrary alphabet. Symbols outside the
    // alphabet are copied unchanged and do not advance the key cursor.
    // All transform members are const, so one engine can serve any number of
    // threads at once.
    class cipher_engine {
    public:
        // Throws cipher_error(invalid_key) if a key symbol is not in the
        // alphabet.
        cipher_engine(alphabet alpha_in, key key_in, cipher_mode mode_in);

        // Both throw cipher_error(empty_input) for empty text.
        [[nodiscard]] std::string encrypt(std::string_view plaintext) const;
        [[nodiscard]] std::string decrypt(std::string_view ciphertext) const;

        [[nodiscard]] std::string transform(
                std::string_view text, cipher_direction direction) const;

        // Like transform, but cipher errors are recorded in the result.
        [[nodiscard]] transform_result run(
                std::string_view text, cipher_direction direction) const;

        // Builds the engine too, so construction errors are also recorded.
        [[nodiscard]] static transform_result run(
                alphabet const& alpha_in, std::string_view key_symbols,
                cipher_mode mode_in, std::string_view text,
                cipher_direction direction);

        // Encrypt-direction key stream for the alphabet members of plaintext.
        [[nodiscard]] std::vector<size_t> key_stream(std::string_view plaintext) const;

        [[nodiscard]] alphabet const& get_alphabet() const noexcept {
            return alpha;
        }

        [[nodiscard]] key const& get_key() const noexcept {
            return cipher_key;
        }

        [[nodiscard]] cipher_mode mode() const noexcept {
            return cipher_kind;
        }

    private:
        [[nodiscard]] std::string classic_transform(
                std::string_view text, cipher_direction direction) const;
        [[nodiscard]] std::string autokey_transform(
                std::string_view text, cipher_direction direction) const;

        alphabet            alpha;
        key                 cipher_key;
        std::vector<size_t> key_indices;
        cipher_mode         cipher_kind;
    };
}    // namespace polysub

#endif    // POLYSUB_CIPHER_ENGINE_HH
