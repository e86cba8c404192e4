/*
 * BinSight - Binary Content Analysis Toolkit
 * Copyright (C) 2026 BinSight Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "NameValidator.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <array>
#include <cstddef>

namespace BinSight::ContentAnalysis {

    namespace {

        constexpr std::string_view kFunctionNamePunctuation = "_?@$()";
        constexpr std::string_view kDosFilenamePunctuation = "!/$%&'()`-@^_{}~+,.;=[]";

        using AsciiTable = std::array<bool, 128>;

        /// ASCII allow-list: digits, letters and @p punctuation
        [[nodiscard]] constexpr AsciiTable MakeAsciiTable(std::string_view punctuation) noexcept {
            AsciiTable table = {};
            for (char c = '0'; c <= '9'; ++c) table[static_cast<size_t>(c)] = true;
            for (char c = 'A'; c <= 'Z'; ++c) table[static_cast<size_t>(c)] = true;
            for (char c = 'a'; c <= 'z'; ++c) table[static_cast<size_t>(c)] = true;
            for (const char c : punctuation) {
                table[static_cast<unsigned char>(c)] = true;
            }
            return table;
        }

        constexpr AsciiTable kFunctionNameTable = MakeAsciiTable(kFunctionNamePunctuation);
        constexpr AsciiTable kDosFilenameTable = MakeAsciiTable(kDosFilenamePunctuation);

        static_assert(kFunctionNameTable['?'] && !kFunctionNameTable[' '] && !kFunctionNameTable['.']);
        static_assert(kDosFilenameTable['.'] && kDosFilenameTable['/'] && !kDosFilenameTable['?']);

        [[nodiscard]] constexpr const AsciiTable& TableFor(NameKind kind) noexcept {
            return kind == NameKind::DosFilename ? kDosFilenameTable : kFunctionNameTable;
        }

        /// Unicode general category L* or N*
        [[nodiscard]] bool IsLetterOrNumber(UChar32 cp) noexcept {
            return (U_GET_GC_MASK(cp) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
        }

    } // namespace

    std::string_view AllowedPunctuation(NameKind kind) noexcept {
        return kind == NameKind::DosFilename ? kDosFilenamePunctuation : kFunctionNamePunctuation;
    }

    bool IsValidName(std::span<const uint8_t> token, NameKind kind) noexcept {
        if (token.empty()) {
            return false;
        }

        const AsciiTable& ascii = TableFor(kind);
        const uint8_t* s = token.data();
        const size_t length = token.size();
        size_t i = 0;

        while (i < length) {
            if (s[i] < 0x80) {
                if (!ascii[s[i]]) {
                    return false;
                }
                ++i;
                continue;
            }

            UChar32 cp = 0;
            U8_NEXT(s, i, length, cp);
            if (cp < 0 || !IsLetterOrNumber(cp)) {
                return false;   // ill-formed UTF-8 or disallowed code point
            }
        }

        return true;
    }

    bool IsValidName(std::string_view token, NameKind kind) noexcept {
        return IsValidName(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(token.data()),
                                                    token.size()),
                           kind);
    }

} // namespace BinSight::ContentAnalysis
