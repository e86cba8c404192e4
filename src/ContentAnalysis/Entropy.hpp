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
 * BinSight - Shannon Entropy
 * ============================================================================
 *
 * @file Entropy.hpp
 * @brief Byte-level Shannon entropy of a buffer (0.0 - 8.0 bits per byte)
 *
 * Packed, compressed or encrypted sections score close to 8.0, plain code
 * and padding score low. The computation is one pass over the input with a
 * fixed 256-entry histogram; the input is never copied.
 *
 * Thread Safety:
 *   All functions are thread-safe. No global or static mutable state.
 * ============================================================================
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace BinSight::ContentAnalysis {

    /// Maximum entropy for an 8-bit alphabet
    inline constexpr double kMaxByteEntropy = 8.0;

    /// Occurrence count per byte value
    using ByteHistogram = std::array<uint64_t, 256>;

    /**
     * @brief Count occurrences of every byte value in @p data.
     */
    [[nodiscard]] ByteHistogram BuildHistogram(std::span<const uint8_t> data) noexcept;

    /**
     * @brief Shannon entropy from an existing histogram.
     *
     * The sample size is the sum of the counts.
     *
     * @param histogram Byte counts
     * @return Entropy in [0, 8]; 0.0 when every count is zero
     */
    [[nodiscard]] double EntropyFromHistogram(const ByteHistogram& histogram) noexcept;

    /**
     * @brief Shannon entropy of a byte buffer.
     *
     * @param data Input buffer (may be empty)
     * @return Entropy in [0, 8]; 0.0 for an empty buffer
     */
    [[nodiscard]] double CalculateEntropy(std::span<const uint8_t> data) noexcept;

    /**
     * @brief Raw pointer overload for mapped ranges.
     *
     * A null pointer is only valid together with @p size == 0.
     */
    [[nodiscard]] double CalculateEntropy(const void* data, size_t size) noexcept;

} // namespace BinSight::ContentAnalysis
