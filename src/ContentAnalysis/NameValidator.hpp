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
/**
 * ============================================================================
 * BinSight - Import/Export Name Validation
 * ============================================================================
 *
 * @file NameValidator.hpp
 * @brief Character-set checks for names pulled out of import/export tables
 *
 * Corrupted or obfuscated images often carry garbage where a symbol or DLL
 * name is expected. A token is accepted only if it is non-empty, valid UTF-8,
 * and every code point is a Unicode letter (L*), a Unicode number (N*), or
 * one of the punctuation characters allowed for its kind:
 *
 *   FunctionName   _ ? @ $ ( )                          (mangled C++ names)
 *   DosFilename    ! / $ % & ' ( ) ` - @ ^ _ { } ~ + , . ; = [ ]
 *                                                       (FAT 8.3 legal set)
 *
 * This is a heuristic filter with known false positives and negatives, not
 * a grammar. Token length is not checked: DLL names in modern images
 * routinely exceed 8.3.
 *
 * Thread Safety:
 *   All functions are thread-safe; the allow-lists are compile-time tables.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace BinSight::ContentAnalysis {

    enum class NameKind : uint8_t {
        FunctionName,   ///< Imported/exported symbol name
        DosFilename     ///< DLL name in 8.3 short-filename character set
    };

    /// Punctuation accepted for @p kind, in addition to letters and numbers
    [[nodiscard]] std::string_view AllowedPunctuation(NameKind kind) noexcept;

    [[nodiscard]] bool IsValidName(std::span<const uint8_t> token, NameKind kind) noexcept;
    [[nodiscard]] bool IsValidName(std::string_view token, NameKind kind) noexcept;

    [[nodiscard]] inline bool IsValidFunctionName(std::span<const uint8_t> token) noexcept {
        return IsValidName(token, NameKind::FunctionName);
    }

    [[nodiscard]] inline bool IsValidFunctionName(std::string_view token) noexcept {
        return IsValidName(token, NameKind::FunctionName);
    }

    [[nodiscard]] inline bool IsValidDosFilename(std::span<const uint8_t> token) noexcept {
        return IsValidName(token, NameKind::DosFilename);
    }

    [[nodiscard]] inline bool IsValidDosFilename(std::string_view token) noexcept {
        return IsValidName(token, NameKind::DosFilename);
    }

} // namespace BinSight::ContentAnalysis
