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
#pragma once
/**
 * @file PEConstants.hpp
 * @brief PE container constants shared with the container parser.
 *
 * Downstream parsing logic compares raw header fields against these
 * values directly, so every value here is bit-exact with the on-disk format.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace BinSight {
namespace PEFormat {

// ============================================================================
// Executable Signatures
// ============================================================================

/// DOS signature "MZ" (little-endian)
inline constexpr uint16_t DOS_SIGNATURE = 0x5A4D;

/// Byte-swapped DOS signature "ZM", accepted by the legacy loader
inline constexpr uint16_t DOSZM_SIGNATURE = 0x4D5A;

/// 16-bit New Executable "NE"
inline constexpr uint16_t NE_SIGNATURE = 0x454E;

/// Linear Executable "LE"
inline constexpr uint16_t LE_SIGNATURE = 0x454C;

/// Linear Executable (OS/2) "LX"
inline constexpr uint16_t LX_SIGNATURE = 0x584C;

/// Terse Executable "VZ"
inline constexpr uint16_t TE_SIGNATURE = 0x5A56;

/// PE signature "PE\0\0" (little-endian)
inline constexpr uint32_t NT_SIGNATURE = 0x00004550;

// ============================================================================
// Optional Header
// ============================================================================

/// Optional header magic for PE32
inline constexpr uint16_t PE32_MAGIC = 0x10B;

/// Optional header magic for PE32+
inline constexpr uint16_t PE64_MAGIC = 0x20B;

/// Number of data directory entries in the optional header
inline constexpr uint32_t NUMBER_OF_DIRECTORY_ENTRIES = 16;

/// Section data offsets are rounded down to this value regardless of the declared FileAlignment
inline constexpr uint32_t FILE_ALIGNMENT_HARDCODED_VALUE = 0x200;

// ============================================================================
// Import Tables
// ============================================================================

/// High bit of a PE32 thunk: import by ordinal
inline constexpr uint32_t ORDINAL_FLAG32 = 0x80000000u;

/// High bit of a PE32+ thunk: import by ordinal
inline constexpr uint64_t ORDINAL_FLAG64 = 0x8000000000000000ull;

/// Placeholder recorded for an import name that fails validation
inline constexpr std::string_view INVALID_IMPORT_NAME = "*invalid*";

// ============================================================================
// Limits
// ============================================================================

namespace Limits {
    /// Maximum length of a string read out of a mapped image (1MB)
    inline constexpr size_t MAX_STRING_LENGTH = 0x100000;
} // namespace Limits

// ============================================================================
// Helpers
// ============================================================================

/// True if @p value is a nonzero power of two (alignment fields)
[[nodiscard]] constexpr bool IsPowerOfTwo(uint32_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

} // namespace PEFormat
} // namespace BinSight
