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
 * @file SsdeepProvider.hpp
 * @brief IFuzzyHashProvider backed by libfuzzy (ssdeep).
 *
 * Digests have the usual ssdeep form "blocksize:hash1:hash2".
 */

#pragma once

#include "FuzzyFingerprint.hpp"

namespace BinSight::ContentAnalysis {

    class SsdeepProvider final : public IFuzzyHashProvider {
    public:
        [[nodiscard]] std::string_view Name() const noexcept override { return "ssdeep"; }

        /// Calls fuzzy_hash_buf; @p status is its return code on failure
        [[nodiscard]] bool Hash(std::span<const uint8_t> data,
                                std::string& digest,
                                int& status,
                                std::string& cause) const override;
    };

    /// Adapter wired to the libfuzzy provider
    [[nodiscard]] FuzzyFingerprintAdapter MakeSsdeepFingerprintAdapter(FuzzyFingerprintConfig config = {});

} // namespace BinSight::ContentAnalysis
