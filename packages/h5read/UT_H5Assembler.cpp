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
#include <numeric>

#include "H5Assembler.h"
#include "H5Exception.h"

using namespace H5Read;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/* contents of a chunk cut from a row major grid, padded past the edge with -1 */
static std::vector<int32_t> cutChunk (const std::vector<int32_t>& grid, uint64_t rows, uint64_t cols,
                                      uint64_t r0, uint64_t c0, uint64_t crows, uint64_t ccols)
{
    std::vector<int32_t> chunk(crows * ccols, -1);
    for(uint64_t r = 0; r < crows; r++)
    {
        for(uint64_t c = 0; c < ccols; c++)
        {
            if(r0 + r < rows && c0 + c < cols) chunk[(r * ccols) + c] = grid[((r0 + r) * cols) + c0 + c];
        }
    }
    return chunk;
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5Assembler, EdgeChunksAreClipped)
{
    const uint64_t rows = 10, cols = 10;
    std::vector<int32_t> grid(rows * cols);
    std::iota(grid.begin(), grid.end(), 0);

    std::vector<int32_t> output(rows * cols, 0);
    const std::vector<range_t> box = {{0, 10, 1}, {0, 10, 1}};
    H5Assembler assembler({rows, cols}, {3, 3}, sizeof(int32_t), box, reinterpret_cast<uint8_t*>(output.data()));
    EXPECT_EQ(assembler.outputSize(), rows * cols * sizeof(int32_t));

    const std::vector<std::vector<uint64_t>> origins = assembler.chunkOrigins();
    EXPECT_EQ(origins.size(), 16U);

    uint64_t placed = 0;
    for(const std::vector<uint64_t>& origin: origins)
    {
        const std::vector<int32_t> chunk = cutChunk(grid, rows, cols, origin[0], origin[1], 3, 3);
        placed += assembler.placeChunk(origin, reinterpret_cast<const uint8_t*>(chunk.data()));
    }

    EXPECT_EQ(placed, 100ULL);
    EXPECT_EQ(output, grid);
}

TEST(H5Assembler, BoxSelectsSubregion)
{
    const uint64_t rows = 6, cols = 8;
    std::vector<int32_t> grid(rows * cols);
    std::iota(grid.begin(), grid.end(), 100);

    const std::vector<range_t> box = {{1, 4, 1}, {3, 7, 1}};
    std::vector<int32_t> output(3 * 4, 0);
    H5Assembler assembler({rows, cols}, {4, 4}, sizeof(int32_t), box, reinterpret_cast<uint8_t*>(output.data()));

    EXPECT_FALSE(assembler.intersects({4, 0}));
    EXPECT_TRUE(assembler.intersects({0, 4}));

    for(const std::vector<uint64_t>& origin: assembler.chunkOrigins())
    {
        const std::vector<int32_t> chunk = cutChunk(grid, rows, cols, origin[0], origin[1], 4, 4);
        assembler.placeChunk(origin, reinterpret_cast<const uint8_t*>(chunk.data()));
    }

    for(uint64_t r = 0; r < 3; r++)
    {
        for(uint64_t c = 0; c < 4; c++)
        {
            EXPECT_EQ(output[(r * 4) + c], grid[((r + 1) * cols) + c + 3]);
        }
    }
}

TEST(H5Assembler, ThreeDimensionalChunks)
{
    const std::vector<uint64_t> shape = {2, 3, 4};
    std::vector<int16_t> cube(24);
    std::iota(cube.begin(), cube.end(), 0);

    /* one chunk covers the cube padded to 2x2x2 blocks */
    const std::vector<range_t> box = {{0, 2, 1}, {0, 3, 1}, {0, 4, 1}};
    std::vector<int16_t> output(24, -1);
    H5Assembler assembler(shape, {2, 2, 2}, sizeof(int16_t), box, reinterpret_cast<uint8_t*>(output.data()));

    uint64_t placed = 0;
    for(const std::vector<uint64_t>& origin: assembler.chunkOrigins())
    {
        std::vector<int16_t> chunk(8, -1);
        for(uint64_t i = 0; i < 2; i++)
            for(uint64_t j = 0; j < 2; j++)
                for(uint64_t k = 0; k < 2; k++)
                {
                    const uint64_t z = origin[0] + i, y = origin[1] + j, x = origin[2] + k;
                    if(y < 3) chunk[(i * 4) + (j * 2) + k] = cube[(z * 12) + (y * 4) + x];
                }
        placed += assembler.placeChunk(origin, reinterpret_cast<const uint8_t*>(chunk.data()));
    }

    EXPECT_EQ(placed, 24ULL);
    EXPECT_EQ(output, cube);
}

TEST(H5Assembler, ScalarCopiesOneElement)
{
    const double value = 2.5;
    double output = 0.0;
    H5Assembler assembler({}, {}, sizeof(double), {}, reinterpret_cast<uint8_t*>(&output));
    EXPECT_TRUE(assembler.chunkOrigins().empty());
    EXPECT_EQ(assembler.placeChunk({}, reinterpret_cast<const uint8_t*>(&value)), 1ULL);
    EXPECT_DOUBLE_EQ(output, 2.5);
}

TEST(H5Assembler, InvalidChunkShape)
{
    uint8_t output[4];
    const std::vector<range_t> box = {{0, 4, 1}};
    EXPECT_THROW(H5Assembler({4}, {0}, 1, box, output), FormatError);
    EXPECT_THROW(H5Assembler({4}, {2, 2}, 1, box, output), FormatError);
}

TEST(H5Assembler, StrideGathersEveryNth)
{
    std::vector<int32_t> grid(5 * 6);
    std::iota(grid.begin(), grid.end(), 0);

    std::vector<uint64_t> dims;
    const std::vector<uint8_t> out = H5Assembler::applyStride(reinterpret_cast<const uint8_t*>(grid.data()), {5, 6}, {2, 4}, sizeof(int32_t), &dims);
    ASSERT_EQ(dims, (std::vector<uint64_t>{3, 2}));

    const int32_t* values = reinterpret_cast<const int32_t*>(out.data());
    const std::vector<int32_t> expected = {0, 4, 12, 16, 24, 28};
    EXPECT_EQ(std::vector<int32_t>(values, values + 6), expected);
}
