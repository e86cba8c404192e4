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

#include "SsdeepProvider.hpp"

// Fuzzy hashing library
extern "C" {
#include <fuzzy.h>
}

#include <cerrno>
#include <cstring>
#include <memory>

namespace BinSight::ContentAnalysis {

    bool SsdeepProvider::Hash(std::span<const uint8_t> data,
                              std::string& digest,
                              int& status,
                              std::string& cause) const {
        if (data.size() > kMaxProviderInputSize) {
            status = -1;
            cause = "input exceeds the 32-bit length libfuzzy accepts";
            return false;
        }

        // FUZZY_MAX_RESULT already counts the terminator
        char hashBuffer[FUZZY_MAX_RESULT] = { 0 };

        errno = 0;
        const int result = fuzzy_hash_buf(data.data(),
                                          static_cast<uint32_t>(data.size()),
                                          hashBuffer);
        if (result != 0) {
            status = result;
            cause = "fuzzy_hash_buf failed";
            if (errno != 0) {
                cause += ": ";
                cause += std::strerror(errno);
            }
            return false;
        }

        digest.assign(hashBuffer);
        status = 0;
        return true;
    }

    FuzzyFingerprintAdapter MakeSsdeepFingerprintAdapter(FuzzyFingerprintConfig config) {
        return FuzzyFingerprintAdapter(std::make_shared<SsdeepProvider>(), config);
    }

} // namespace BinSight::ContentAnalysis
