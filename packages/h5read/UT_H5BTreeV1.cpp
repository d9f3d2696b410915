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

#include "H5BTreeV1.h"
#include "H5Exception.h"
#include "UT_H5Builder.h"

using namespace H5Read;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/* 4x4 grid of 2x2 chunks with fake addresses */
static std::vector<H5Builder::chunk_entry_t> gridEntries (void)
{
    std::vector<H5Builder::chunk_entry_t> entries;
    for(uint64_t r = 0; r < 8; r += 2)
    {
        for(uint64_t c = 0; c < 8; c += 2)
        {
            H5Builder::chunk_entry_t e = {{r, c}, 16, 0, 0x1000 + (r * 8) + c};
            entries.push_back(e);
        }
    }
    return entries;
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5BTreeV1, SingleLeafLookup)
{
    H5Builder builder;
    const uint64_t root = builder.chunkTree(2, gridEntries());
    H5Cursor cursor(new H5Cursor::MemoryIODriver(builder.image));
    H5BTreeV1 btree(&cursor, root, 2);

    H5BTreeV1::chunk_t chunk;
    ASSERT_TRUE(btree.findChunk({4, 6}, &chunk));
    EXPECT_EQ(chunk.address, 0x1000ULL + 32 + 6);
    EXPECT_EQ(chunk.size, 16U);
    EXPECT_EQ(chunk.filter_mask, 0U);

    /* only chunk origins are keys */
    EXPECT_FALSE(btree.findChunk({4, 5}, &chunk));
    EXPECT_FALSE(btree.findChunk({8, 0}, &chunk));
}

TEST(H5BTreeV1, InternalNodesDescendByKey)
{
    H5Builder builder;
    const uint64_t root = builder.chunkTree(2, gridEntries(), 3);
    H5Cursor cursor(new H5Cursor::MemoryIODriver(builder.image));
    H5BTreeV1 btree(&cursor, root, 2);

    const std::vector<H5Builder::chunk_entry_t> entries = gridEntries();
    for(const H5Builder::chunk_entry_t& e: entries)
    {
        H5BTreeV1::chunk_t chunk;
        ASSERT_TRUE(btree.findChunk(e.offsets, &chunk));
        EXPECT_EQ(chunk.address, e.address);
    }

    const std::vector<H5BTreeV1::chunk_t> all = btree.readChunks();
    ASSERT_EQ(all.size(), entries.size());
    for(size_t i = 0; i < all.size(); i++)
    {
        EXPECT_EQ(all[i].offsets, entries[i].offsets);
        EXPECT_EQ(all[i].address, entries[i].address);
    }
}

TEST(H5BTreeV1, MissingChunkBeforeFirstKey)
{
    std::vector<H5Builder::chunk_entry_t> entries = gridEntries();
    entries.erase(entries.begin(), entries.begin() + 5);

    H5Builder builder;
    const uint64_t root = builder.chunkTree(2, entries, 4);
    H5Cursor cursor(new H5Cursor::MemoryIODriver(builder.image));
    H5BTreeV1 btree(&cursor, root, 2);

    H5BTreeV1::chunk_t chunk;
    EXPECT_FALSE(btree.findChunk({0, 0}, &chunk));
    EXPECT_FALSE(btree.findChunk({2, 0}, &chunk));
    EXPECT_TRUE(btree.findChunk({2, 2}, &chunk));
}

TEST(H5BTreeV1, FilterMaskIsReported)
{
    std::vector<H5Builder::chunk_entry_t> entries = {{{0}, 40, 0x1, 0x2000}, {{10}, 44, 0x0, 0x3000}};
    H5Builder builder;
    const uint64_t root = builder.chunkTree(1, entries);
    H5Cursor cursor(new H5Cursor::MemoryIODriver(builder.image));
    H5BTreeV1 btree(&cursor, root, 1);

    const std::vector<H5BTreeV1::chunk_t> chunks = btree.readChunks();
    ASSERT_EQ(chunks.size(), 2U);
    EXPECT_EQ(chunks[0].filter_mask, 1U);
    EXPECT_EQ(chunks[1].size, 44U);
}

TEST(H5BTreeV1, MalformedNodes)
{
    H5Builder builder;
    const uint64_t root = builder.chunkTree(1, {{{0}, 8, 0, 0x2000}});

    /* nonzero trailing key value */
    {
        H5Builder::bytes_t image = builder.image;
        const uint64_t first_key_tail = root + 24 + 4 + 4 + 8;
        image[first_key_tail] = 1;
        H5Cursor cursor(new H5Cursor::MemoryIODriver(image));
        H5BTreeV1 btree(&cursor, root, 1);
        EXPECT_THROW(btree.readChunks(), FormatError);
    }

    /* wrong node type */
    {
        H5Builder::bytes_t image = builder.image;
        image[root + 4] = 0;
        H5Cursor cursor(new H5Cursor::MemoryIODriver(image));
        H5BTreeV1 btree(&cursor, root, 1);
        EXPECT_THROW(btree.readChunks(), FormatError);
    }

    /* version 2 b-tree */
    {
        H5Builder::bytes_t image = builder.image;
        memcpy(&image[root], "BTHD", 4);
        H5Cursor cursor(new H5Cursor::MemoryIODriver(image));
        H5BTreeV1 btree(&cursor, root, 1);
        H5BTreeV1::chunk_t chunk;
        EXPECT_THROW(btree.findChunk({0}, &chunk), UnsupportedFeatureError);
    }
}
