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
 * BinSight - Content Digests
 * ============================================================================
 *
 * @file Digest.hpp
 * @brief Exact-match fingerprints (MD5 / SHA-1 / SHA-256) of byte ranges
 *
 * Usage:
 * @code
 *   #include "ContentAnalysis/Digest.hpp"
 *
 *   std::string sha = ComputeDigest(section, DigestAlgorithm::SHA256);
 *   // 64 lowercase hex characters
 * @endcode
 *
 * Digests are lowercase hex with a fixed length per algorithm, so they can
 * be compared directly against the identifiers sample repositories publish.
 *
 * Thread Safety:
 *   All functions are thread-safe. Each call owns its digest context.
 * ============================================================================
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace BinSight::ContentAnalysis {

    /// Digest algorithms offered to the container parser
    enum class DigestAlgorithm : uint8_t {
        MD5,        ///< 128-bit, 32 hex characters
        SHA1,       ///< 160-bit, 40 hex characters
        SHA256      ///< 256-bit, 64 hex characters
    };

    /// Length of the hex encoding produced for @p alg
    [[nodiscard]] size_t DigestHexLength(DigestAlgorithm alg) noexcept;

    /// Lowercase algorithm name: "md5", "sha1", "sha256"
    [[nodiscard]] std::string_view DigestAlgorithmName(DigestAlgorithm alg) noexcept;

    /**
     * @brief Digest a byte buffer and return its lowercase hex encoding.
     *
     * Defined for every input, including an empty buffer.
     *
     * @throws std::runtime_error only if the crypto backend itself fails
     *         (context allocation); never for any property of @p data.
     */
    [[nodiscard]] std::string ComputeDigest(std::span<const uint8_t> data, DigestAlgorithm alg);

    [[nodiscard]] inline std::string Md5Hex(std::span<const uint8_t> data) {
        return ComputeDigest(data, DigestAlgorithm::MD5);
    }

    [[nodiscard]] inline std::string Sha1Hex(std::span<const uint8_t> data) {
        return ComputeDigest(data, DigestAlgorithm::SHA1);
    }

    [[nodiscard]] inline std::string Sha256Hex(std::span<const uint8_t> data) {
        return ComputeDigest(data, DigestAlgorithm::SHA256);
    }

} // namespace BinSight::ContentAnalysis
