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

#include "Digest.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"

#include <stdexcept>

namespace BinSight::ContentAnalysis {

    namespace {

        namespace HashUtils = ::BinSight::Utils::HashUtils;

        [[nodiscard]] HashUtils::Algorithm ToHashAlgorithm(DigestAlgorithm alg) noexcept {
            switch (alg) {
            case DigestAlgorithm::MD5:    return HashUtils::Algorithm::MD5;
            case DigestAlgorithm::SHA1:   return HashUtils::Algorithm::SHA1;
            case DigestAlgorithm::SHA256: return HashUtils::Algorithm::SHA256;
            }
            return HashUtils::Algorithm::SHA256;
        }

    } // namespace

    size_t DigestHexLength(DigestAlgorithm alg) noexcept {
        return HashUtils::DigestSize(ToHashAlgorithm(alg)) * 2;
    }

    std::string_view DigestAlgorithmName(DigestAlgorithm alg) noexcept {
        switch (alg) {
        case DigestAlgorithm::MD5:    return "md5";
        case DigestAlgorithm::SHA1:   return "sha1";
        case DigestAlgorithm::SHA256: return "sha256";
        }
        return "unknown";
    }

    std::string ComputeDigest(std::span<const uint8_t> data, DigestAlgorithm alg) {
        HashUtils::Error err;
        std::string hex;

        if (!HashUtils::ComputeHex(ToHashAlgorithm(alg), data.data(), data.size(), hex, &err)) {
            BS_LOG_FATAL("Digest", "%.*s digest backend failure: %s",
                         static_cast<int>(DigestAlgorithmName(alg).size()),
                         DigestAlgorithmName(alg).data(),
                         err.message.c_str());
            throw std::runtime_error("digest backend failure: " + err.message);
        }

        return hex;
    }

} // namespace BinSight::ContentAnalysis
