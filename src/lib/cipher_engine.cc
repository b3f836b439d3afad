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

#include "polysub/cipher_engine.hh"

#include "polysub/alphabet.hh"
#include "polysub/cipher_error.hh"
#include "polysub/key.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polysub {
    namespace {
        inline char shift_symbol(
                alphabet const& alpha, size_t const index, size_t const shift,
                cipher_direction const direction) noexcept {
            auto const value = static_cast<int64_t>(index);
            auto const delta = static_cast<int64_t>(shift);
            return alpha.symbol_at(
                    direction == cipher_direction::encrypt ? value + delta : value - delta);
        }
    }    // namespace

    cipher_engine::cipher_engine(alphabet alpha_in, key key_in, cipher_mode const mode_in)
            : alpha(std::move(alpha_in)), cipher_key(std::move(key_in)),
              key_indices(cipher_key.indices_in(alpha)), cipher_kind(mode_in) {}

    std::string cipher_engine::encrypt(std::string_view const plaintext) const {
        return transform(plaintext, cipher_direction::encrypt);
    }

    std::string cipher_engine::decrypt(std::string_view const ciphertext) const {
        return transform(ciphertext, cipher_direction::decrypt);
    }

    std::string cipher_engine::transform(
            std::string_view const text, cipher_direction const direction) const {
        if (text.empty()) {
            throw cipher_error(error_code::empty_input, "Text cannot be empty");
        }
        // NOLINTNEXTLINE(clang-diagnostic-switch-default)
        switch (cipher_kind) {
            using enum cipher_mode;
        case classic:
            return classic_transform(text, direction);
        case autokey:
            return autokey_transform(text, direction);
        }
        __builtin_unreachable();
    }

    std::string cipher_engine::classic_transform(
            std::string_view const text, cipher_direction const direction) const {
        std::string result;
        result.reserve(text.size());
        size_t cursor = 0;
        for (char const symbol : text) {
            auto const index = alpha.index_of(symbol);
            if (!index) {
                result.push_back(symbol);
                continue;
            }
            result.push_back(shift_symbol(alpha, *index, key_indices[cursor], direction));
            cursor = (cursor + 1) % key_indices.size();
        }
        return result;
    }

    // The key stream is the key followed by the plaintext. Position ii of the
    // stream is used once and then replaced by plaintext symbol ii, which is
    // exactly what position ii + key length needs. When decrypting, that
    // plaintext symbol is the one just recovered, so the loop must run in
    // order.
    std::string cipher_engine::autokey_transform(
            std::string_view const text, cipher_direction const direction) const {
        std::vector<size_t> window(key_indices);
        std::string         result;
        result.reserve(text.size());
        size_t position = 0;
        for (char const symbol : text) {
            auto const index = alpha.index_of(symbol);
            if (!index) {
                result.push_back(symbol);
                continue;
            }
            size_t&    slot    = window[position % window.size()];
            char const shifted = shift_symbol(alpha, *index, slot, direction);
            result.push_back(shifted);
            slot = direction == cipher_direction::encrypt ? *index
                                                          : *alpha.index_of(shifted);
            position++;
        }
        return result;
    }

    transform_result cipher_engine::run(
            std::string_view const text, cipher_direction const direction) const {
        transform_result result{
                .alphabet_symbols = std::string(alpha.symbols()),
                .key_symbols      = std::string(cipher_key.symbols()),
                .mode             = cipher_kind,
                .direction        = direction};
        try {
            result.text    = transform(text, direction);
            result.success = true;
        } catch (cipher_error const& error) {
            result.error         = error.code();
            result.error_message = error.what();
        }
        return result;
    }

    transform_result cipher_engine::run(
            alphabet const& alpha_in, std::string_view const key_symbols,
            cipher_mode const mode_in, std::string_view const text,
            cipher_direction const direction) {
        try {
            cipher_engine const engine(alpha_in, key(key_symbols), mode_in);
            return engine.run(text, direction);
        } catch (cipher_error const& error) {
            return transform_result{
                    .success          = false,
                    .error            = error.code(),
                    .error_message    = error.what(),
                    .alphabet_symbols = std::string(alpha_in.symbols()),
                    .key_symbols      = std::string(key_symbols),
                    .mode             = mode_in,
                    .direction        = direction};
        }
    }

    std::vector<size_t> cipher_engine::key_stream(std::string_view const plaintext) const {
        std::vector<size_t> stream;
        std::vector<size_t> members;
        for (char const symbol : plaintext) {
            if (auto const index = alpha.index_of(symbol); index) {
                members.push_back(*index);
            }
        }
        stream.reserve(members.size());
        for (size_t ii = 0; ii < members.size(); ii++) {
            if (cipher_kind == cipher_mode::classic) {
                stream.push_back(key_indices[ii % key_indices.size()]);
            } else if (ii < key_indices.size()) {
                stream.push_back(key_indices[ii]);
            } else {
                stream.push_back(members[ii - key_indices.size()]);
            }
        }
        return stream;
    }
}    // namespace polysub
