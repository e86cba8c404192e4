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
#include "../../../src/PEFormat/PEConstants.hpp"

using namespace BinSight::PEFormat;

namespace {

    uint16_t ReadLE16(const char* s) {
        return static_cast<uint16_t>(static_cast<uint8_t>(s[0]) |
                                     (static_cast<uint8_t>(s[1]) << 8));
    }

} // namespace

TEST(PEConstantsTest, SignaturesMatchOnDiskBytes) {
    EXPECT_EQ(DOS_SIGNATURE, ReadLE16("MZ"));
    EXPECT_EQ(DOSZM_SIGNATURE, ReadLE16("ZM"));
    EXPECT_EQ(NE_SIGNATURE, ReadLE16("NE"));
    EXPECT_EQ(LE_SIGNATURE, ReadLE16("LE"));
    EXPECT_EQ(LX_SIGNATURE, ReadLE16("LX"));
    EXPECT_EQ(TE_SIGNATURE, ReadLE16("VZ"));

    const unsigned char pe[4] = { 'P', 'E', 0, 0 };
    const uint32_t nt = static_cast<uint32_t>(pe[0]) | (static_cast<uint32_t>(pe[1]) << 8);
    EXPECT_EQ(NT_SIGNATURE, nt);
}

TEST(PEConstantsTest, ExactValues) {
    static_assert(DOS_SIGNATURE == 0x5A4D);
    static_assert(DOSZM_SIGNATURE == 0x4D5A);
    static_assert(NE_SIGNATURE == 0x454E);
    static_assert(LE_SIGNATURE == 0x454C);
    static_assert(LX_SIGNATURE == 0x584C);
    static_assert(TE_SIGNATURE == 0x5A56);
    static_assert(NT_SIGNATURE == 0x00004550);
    static_assert(PE32_MAGIC == 0x10B);
    static_assert(PE64_MAGIC == 0x20B);
    static_assert(NUMBER_OF_DIRECTORY_ENTRIES == 16);
    static_assert(FILE_ALIGNMENT_HARDCODED_VALUE == 0x200);
    static_assert(ORDINAL_FLAG32 == 0x80000000u);
    static_assert(ORDINAL_FLAG64 == 0x8000000000000000ull);
    static_assert(Limits::MAX_STRING_LENGTH == 0x100000);

    EXPECT_EQ(INVALID_IMPORT_NAME, "*invalid*");
}

TEST(PEConstantsTest, OrdinalFlagIsTopBit) {
    EXPECT_EQ(ORDINAL_FLAG32, uint32_t{1} << 31);
    EXPECT_EQ(ORDINAL_FLAG64, uint64_t{1} << 63);

    const uint32_t thunk32 = ORDINAL_FLAG32 | 0x0042;
    EXPECT_NE(thunk32 & ORDINAL_FLAG32, 0u);
    EXPECT_EQ(thunk32 & 0xFFFF, 0x42u);
}

TEST(PEConstantsTest, IsPowerOfTwo) {
    EXPECT_FALSE(IsPowerOfTwo(0));
    EXPECT_TRUE(IsPowerOfTwo(1));
    EXPECT_TRUE(IsPowerOfTwo(2));
    EXPECT_FALSE(IsPowerOfTwo(3));
    EXPECT_TRUE(IsPowerOfTwo(FILE_ALIGNMENT_HARDCODED_VALUE));
    EXPECT_TRUE(IsPowerOfTwo(0x1000));
    EXPECT_FALSE(IsPowerOfTwo(0x1001));
    EXPECT_TRUE(IsPowerOfTwo(0x80000000u));
    EXPECT_FALSE(IsPowerOfTwo(0xFFFFFFFFu));

    static_assert(IsPowerOfTwo(0x200));
}
