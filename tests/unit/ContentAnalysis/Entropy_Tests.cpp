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

#include <gtest/gtest.h>
#include "../../../src/ContentAnalysis/Entropy.hpp"

#include <cstdint>
#include <random>
#include <vector>

using namespace BinSight::ContentAnalysis;

class EntropyTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> AllByteValues() {
        std::vector<uint8_t> buf(256);
        for (size_t i = 0; i < buf.size(); ++i) buf[i] = static_cast<uint8_t>(i);
        return buf;
    }
};

TEST_F(EntropyTest, EmptyBufferIsZero) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(CalculateEntropy(empty), 0.0);
    EXPECT_EQ(CalculateEntropy(nullptr, 0), 0.0);
}

TEST_F(EntropyTest, RepeatedByteIsZero) {
    for (size_t n : {1u, 2u, 17u, 4096u}) {
        std::vector<uint8_t> buf(n, 0x41);
        EXPECT_EQ(CalculateEntropy(buf), 0.0) << "length " << n;
    }
}

TEST_F(EntropyTest, EveryByteValueOnceIsExactlyEight) {
    EXPECT_EQ(CalculateEntropy(AllByteValues()), 8.0);
}

TEST_F(EntropyTest, UniformRepetitionsStayAtEight) {
    std::vector<uint8_t> buf;
    for (int round = 0; round < 16; ++round) {
        auto all = AllByteValues();
        buf.insert(buf.end(), all.begin(), all.end());
    }
    EXPECT_DOUBLE_EQ(CalculateEntropy(buf), 8.0);
}

TEST_F(EntropyTest, TwoEquallyLikelyValuesIsOneBit) {
    std::vector<uint8_t> buf = { 0x00, 0xFF, 0x00, 0xFF, 0x00, 0xFF };
    EXPECT_DOUBLE_EQ(CalculateEntropy(buf), 1.0);
}

TEST_F(EntropyTest, SkewedDistribution) {
    // p = {0.75, 0.25}: H = 0.811278...
    std::vector<uint8_t> buf = { 'a', 'a', 'a', 'b' };
    EXPECT_NEAR(CalculateEntropy(buf), 0.8112781244591328, 1e-12);
}

TEST_F(EntropyTest, RandomDataStaysInRange) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> dist(0, 255);

    for (size_t len : {1u, 7u, 255u, 1000u, 65536u}) {
        std::vector<uint8_t> buf(len);
        for (auto& b : buf) b = static_cast<uint8_t>(dist(rng));

        const double h = CalculateEntropy(buf);
        EXPECT_GE(h, 0.0);
        EXPECT_LE(h, kMaxByteEntropy);
    }
}

TEST_F(EntropyTest, LargeRandomBufferIsHighEntropy) {
    std::mt19937 rng(42);
    std::vector<uint8_t> buf(1 << 20);
    for (auto& b : buf) b = static_cast<uint8_t>(rng());

    EXPECT_GT(CalculateEntropy(buf), 7.99);
}

TEST_F(EntropyTest, PointerOverloadMatchesSpan) {
    std::vector<uint8_t> buf = { 1, 2, 3, 3, 4, 4, 4, 4 };
    EXPECT_DOUBLE_EQ(CalculateEntropy(buf.data(), buf.size()), CalculateEntropy(buf));
}

TEST_F(EntropyTest, HistogramCountsEveryByte) {
    std::vector<uint8_t> buf = { 0x00, 0x00, 0x7F, 0xFF, 0xFF, 0xFF };
    const ByteHistogram h = BuildHistogram(buf);

    EXPECT_EQ(h[0x00], 2u);
    EXPECT_EQ(h[0x7F], 1u);
    EXPECT_EQ(h[0xFF], 3u);
    EXPECT_EQ(h[0x01], 0u);
    EXPECT_DOUBLE_EQ(EntropyFromHistogram(h), CalculateEntropy(buf));
}

TEST_F(EntropyTest, EmptyHistogramIsZero) {
    ByteHistogram h = {};
    EXPECT_EQ(EntropyFromHistogram(h), 0.0);
}

TEST_F(EntropyTest, HandBuiltHistogramUsesItsOwnCounts) {
    // two values, 4 of each: exactly one bit regardless of how it was built
    ByteHistogram h = {};
    h['A'] = 4;
    h['B'] = 4;
    EXPECT_DOUBLE_EQ(EntropyFromHistogram(h), 1.0);

    // 256 values once each
    ByteHistogram flat = {};
    flat.fill(1);
    EXPECT_DOUBLE_EQ(EntropyFromHistogram(flat), 8.0);
}

TEST_F(EntropyTest, InputIsNotModified) {
    std::vector<uint8_t> buf = { 9, 8, 7, 6, 5 };
    const auto copy = buf;
    (void)CalculateEntropy(buf);
    EXPECT_EQ(buf, copy);
}
