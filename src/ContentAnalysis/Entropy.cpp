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

#include "Entropy.hpp"

#include <cmath>
#include <numeric>

namespace BinSight::ContentAnalysis {

    ByteHistogram BuildHistogram(std::span<const uint8_t> data) noexcept {
        ByteHistogram freq = {};
        for (const uint8_t byte : data) {
            ++freq[byte];
        }
        return freq;
    }

    double EntropyFromHistogram(const ByteHistogram& histogram) noexcept {
        const uint64_t total = std::accumulate(histogram.begin(), histogram.end(), uint64_t{0});
        if (total == 0) {
            return 0.0;
        }

        double entropy = 0.0;
        const double length = static_cast<double>(total);

        for (const uint64_t count : histogram) {
            if (count > 0) {
                const double p = static_cast<double>(count) / length;
                entropy -= p * std::log2(p);
            }
        }

        // clamp rounding noise into [0, 8]
        if (entropy <= 0.0) {
            return 0.0;
        }
        return entropy > kMaxByteEntropy ? kMaxByteEntropy : entropy;
    }

    double CalculateEntropy(std::span<const uint8_t> data) noexcept {
        if (data.empty()) {
            return 0.0;
        }
        return EntropyFromHistogram(BuildHistogram(data));
    }

    double CalculateEntropy(const void* data, size_t size) noexcept {
        if (!data || size == 0) {
            return 0.0;
        }
        return CalculateEntropy(std::span<const uint8_t>(static_cast<const uint8_t*>(data), size));
    }

} // namespace BinSight::ContentAnalysis
