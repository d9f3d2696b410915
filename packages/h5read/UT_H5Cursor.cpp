/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <gtest/gtest.h>
#include <memory>

#include "H5Cursor.h"
#include "H5Exception.h"

using namespace H5Read;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static H5Cursor* memoryCursor (const std::vector<uint8_t>& bytes)
{
    return new H5Cursor(new H5Cursor::MemoryIODriver(bytes, "cursor-test"));
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5Cursor, ReadsLittleEndianFields)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0xFF}));

    uint64_t pos = 0;
    EXPECT_EQ(cursor->readField(2, &pos), 0x0201ULL);
    EXPECT_EQ(pos, 2ULL);
    EXPECT_EQ(cursor->readField(4, &pos), 0x06050403ULL);
    EXPECT_EQ(cursor->readField(1, &pos), 0x07ULL);

    pos = 0;
    EXPECT_EQ(cursor->readField(8, &pos), 0x0807060504030201ULL);
    EXPECT_EQ(cursor->tell(), 8ULL);
}

TEST(H5Cursor, OffsetAndLengthSizes)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({0x10, 0x00, 0x00, 0x00, 0x20, 0x00}));
    cursor->setSizes(4, 2);
    EXPECT_EQ(cursor->offsetSize(), 4);
    EXPECT_EQ(cursor->lengthSize(), 2);

    uint64_t pos = 0;
    EXPECT_EQ(cursor->readOffset(&pos), 0x10ULL);
    EXPECT_EQ(cursor->readLength(&pos), 0x20ULL);

    EXPECT_TRUE(cursor->isUndefined(0xFFFFFFFFULL));
    EXPECT_FALSE(cursor->isUndefined(0xFFFFFFFFFFFFFFFFULL));
}

TEST(H5Cursor, BaseAddressIsAppliedToReads)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({0xAA, 0xBB, 0x11, 0x22}));
    cursor->setBaseAddress(2);
    EXPECT_EQ(cursor->getBaseAddress(), 2ULL);

    uint64_t pos = 0;
    EXPECT_EQ(cursor->readField(2, &pos), 0x2211ULL);
    EXPECT_THROW(cursor->readField(1, &pos), DataReadError);
}

TEST(H5Cursor, ReadsNulTerminatedStrings)
{
    const std::vector<uint8_t> bytes = {'a', 'b', 'c', 0, 'x', 'y'};
    std::unique_ptr<H5Cursor> cursor(memoryCursor(bytes));

    uint64_t pos = 0;
    EXPECT_EQ(cursor->readString(&pos, 0), "abc");
    EXPECT_EQ(pos, 4ULL);

    /* no terminator before limit */
    pos = 0;
    EXPECT_THROW(cursor->readString(&pos, 2), DataReadError);

    /* runs off the end of the source */
    pos = 4;
    EXPECT_THROW(cursor->readString(&pos, 0), DataReadError);
}

TEST(H5Cursor, ReadPastEndFails)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({1, 2, 3}));
    EXPECT_EQ(cursor->size(), 3ULL);

    uint8_t buffer[4];
    uint64_t pos = 0;
    EXPECT_THROW(cursor->readByteArray(buffer, 4, &pos), DataReadError);
    EXPECT_EQ(pos, 0ULL);

    pos = 3;
    cursor->readByteArray(buffer, 0, &pos);
    EXPECT_EQ(pos, 3ULL);
}

TEST(H5Cursor, RangeChecks)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({1, 2, 3, 4}));
    cursor->checkRange(0, 4);
    cursor->checkRange(4, 0);
    EXPECT_THROW(cursor->checkRange(1, 4), DataReadError);
    EXPECT_THROW(cursor->checkRange(0, 1ULL << 60), DataReadError);
    EXPECT_THROW(cursor->checkRange(0xFFFFFFFFFFFFFFF0ULL, 0x20), DataReadError);

    cursor->setBaseAddress(2);
    cursor->checkRange(0, 2);
    EXPECT_THROW(cursor->checkRange(0, 3), DataReadError);

    cursor->close();
    EXPECT_THROW(cursor->checkRange(0, 0), DataReadError);
}

TEST(H5Cursor, ClosedCursorRefusesReads)
{
    std::unique_ptr<H5Cursor> cursor(memoryCursor({1, 2, 3, 4}));
    EXPECT_TRUE(cursor->isOpen());
    EXPECT_STREQ(cursor->getName(), "cursor-test");

    cursor->close();
    EXPECT_FALSE(cursor->isOpen());

    uint64_t pos = 0;
    EXPECT_THROW(cursor->readField(1, &pos), DataReadError);
}

TEST(H5Cursor, MissingFileFails)
{
    EXPECT_THROW(H5Cursor::FileIODriver driver("/nonexistent/h5read/file.h5"), DataReadError);
}
