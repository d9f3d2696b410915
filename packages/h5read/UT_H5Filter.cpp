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

#include "H5Filter.h"
#include "H5Exception.h"
#include "UT_H5Builder.h"

using namespace H5Read;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static H5Builder::bytes_t ramp (size_t count)
{
    std::vector<int32_t> values;
    for(size_t i = 0; i < count; i++) values.push_back((int32_t)(i * 3) - 50);
    return H5Builder::values(values);
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5Filter, DeflateRoundTrip)
{
    const H5Builder::bytes_t plain = ramp(256);
    const std::vector<H5Filter::filter_t> pipeline = {H5Builder::filter(H5Filter::DEFLATE_FILTER, {6})};

    const std::vector<uint8_t> out = H5Filter::decode(pipeline, 0, H5Builder::deflate(plain), plain.size(), 4);
    EXPECT_EQ(out, plain);
}

TEST(H5Filter, LzfRoundTrip)
{
    /* repeated runs exercise back references */
    H5Builder::bytes_t plain;
    for(int i = 0; i < 40; i++)
    {
        const std::string word = "abcabcabc-" + std::to_string(i % 4);
        plain.insert(plain.end(), word.begin(), word.end());
    }
    plain.insert(plain.end(), 300, 0x5A);

    const H5Builder::bytes_t packed = H5Builder::lzf(plain);
    EXPECT_LT(packed.size(), plain.size());

    const std::vector<H5Filter::filter_t> pipeline = {H5Builder::filter(H5Filter::LZF_FILTER)};
    EXPECT_EQ(H5Filter::decode(pipeline, 0, packed, plain.size(), 1), plain);
}

TEST(H5Filter, LzfRejectsCorruptInput)
{
    std::vector<uint8_t> output(16);

    /* back reference before any output */
    const uint8_t backref[] = {0x20, 0x00};
    EXPECT_THROW(H5Filter::lzfChunk(backref, sizeof(backref), output.data(), (uint32_t)output.size()), DataReadError);

    /* literal run longer than input */
    const uint8_t literal[] = {0x05, 'a', 'b'};
    EXPECT_THROW(H5Filter::lzfChunk(literal, sizeof(literal), output.data(), (uint32_t)output.size()), DataReadError);
}

TEST(H5Filter, ShuffleRoundTrip)
{
    const H5Builder::bytes_t plain = ramp(33);
    std::vector<uint8_t> out(plain.size());
    H5Filter::shuffleChunk(H5Builder::shuffle(plain, 4).data(), (uint32_t)plain.size(), out.data(), 4);
    EXPECT_EQ(out, plain);
}

TEST(H5Filter, ShuffleThenDeflate)
{
    const H5Builder::bytes_t plain = ramp(100);
    const std::vector<H5Filter::filter_t> pipeline = {
        H5Builder::filter(H5Filter::SHUFFLE_FILTER, {4}),
        H5Builder::filter(H5Filter::DEFLATE_FILTER, {4})
    };

    /* filters are applied in order on write and reversed on read */
    const H5Builder::bytes_t stored = H5Builder::deflate(H5Builder::shuffle(plain, 4));
    EXPECT_EQ(H5Filter::decode(pipeline, 0, stored, plain.size(), 4), plain);
}

TEST(H5Filter, MaskSkipsFilters)
{
    const H5Builder::bytes_t plain = ramp(64);
    const std::vector<H5Filter::filter_t> pipeline = {
        H5Builder::filter(H5Filter::SHUFFLE_FILTER, {4}),
        H5Builder::filter(H5Filter::DEFLATE_FILTER, {4})
    };

    /* chunk written without shuffle */
    EXPECT_EQ(H5Filter::decode(pipeline, 0x1, H5Builder::deflate(plain), plain.size(), 4), plain);

    /* chunk written without any filter */
    EXPECT_EQ(H5Filter::decode(pipeline, 0x3, plain, plain.size(), 4), plain);
}

TEST(H5Filter, Fletcher32Checksum)
{
    const H5Builder::bytes_t plain = ramp(17);
    const std::vector<H5Filter::filter_t> pipeline = {H5Builder::filter(H5Filter::FLETCHER32_FILTER)};
    EXPECT_EQ(H5Filter::decode(pipeline, 0, H5Builder::fletcher(plain), plain.size(), 4), plain);

    H5Builder::bytes_t corrupt = H5Builder::fletcher(plain);
    corrupt[3] ^= 0x40;
    EXPECT_THROW(H5Filter::decode(pipeline, 0, corrupt, plain.size(), 4), DataReadError);
}

TEST(H5Filter, DecodedSizeMustMatch)
{
    const H5Builder::bytes_t plain = ramp(10);
    const std::vector<H5Filter::filter_t> pipeline = {H5Builder::filter(H5Filter::DEFLATE_FILTER)};

    EXPECT_THROW(H5Filter::decode(pipeline, 0, H5Builder::deflate(plain), plain.size() + 4, 4), DataReadError);
    EXPECT_THROW(H5Filter::decode(pipeline, 0, H5Builder::deflate(plain), plain.size() - 4, 4), DataReadError);

    const std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04};
    EXPECT_THROW(H5Filter::decode(pipeline, 0, garbage, plain.size(), 4), DataReadError);
}

TEST(H5Filter, UnsupportedFilter)
{
    const std::vector<H5Filter::filter_t> pipeline = {H5Builder::filter(H5Filter::SZIP_FILTER)};
    EXPECT_THROW(H5Filter::decode(pipeline, 0, ramp(4), 16, 4), UnsupportedFeatureError);

    EXPECT_TRUE(H5Filter::isSupported(H5Filter::LZF_FILTER));
    EXPECT_FALSE(H5Filter::isSupported(H5Filter::NBIT_FILTER));
    EXPECT_STREQ(H5Filter::filter2str(H5Filter::LZF_FILTER), "lzf");
}
