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

#include "H5Datatype.h"
#include "H5Exception.h"
#include "UT_H5Builder.h"

using namespace H5Read;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

static std::shared_ptr<H5Datatype> decodeType (const std::vector<uint8_t>& bytes, uint64_t* consumed=NULL)
{
    H5Cursor cursor(new H5Cursor::MemoryIODriver(bytes));
    uint64_t pos = 0;
    std::shared_ptr<H5Datatype> dt = H5Datatype::decode(&cursor, &pos);
    if(consumed) *consumed = pos;
    return dt;
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5Datatype, SignedFixedPoint)
{
    uint64_t consumed = 0;
    std::shared_ptr<H5Datatype> dt = decodeType(H5Builder::fixedType(2, true), &consumed);
    EXPECT_EQ(consumed, 12ULL);
    EXPECT_EQ(dt->typeClass, H5Datatype::FIXED_POINT_TYPE);
    EXPECT_EQ(dt->size, 2U);
    EXPECT_TRUE(dt->signedval);
    EXPECT_FALSE(dt->bigendian);
    EXPECT_EQ(dt->bitPrecision, 16);
    EXPECT_EQ(dt->describe(), "int16");

    const uint8_t data[2] = {0xFE, 0xFF};
    const H5Value value = dt->decodeValue(data, NULL);
    EXPECT_EQ(value.kind(), H5Value::INTEGER);
    EXPECT_EQ(value.asInt(), -2);
}

TEST(H5Datatype, BigEndianUnsigned)
{
    std::shared_ptr<H5Datatype> dt = decodeType(H5Builder::fixedType(4, false, true));
    EXPECT_TRUE(dt->bigendian);
    EXPECT_EQ(dt->describe(), "uint32");

    const uint8_t data[4] = {0x00, 0x00, 0x01, 0x02};
    EXPECT_EQ(dt->decodeValue(data, NULL).asUInt(), 0x0102ULL);
}

TEST(H5Datatype, IeeeFloatingPoint)
{
    std::shared_ptr<H5Datatype> f32 = decodeType(H5Builder::floatType(4));
    EXPECT_EQ(f32->typeClass, H5Datatype::FLOATING_POINT_TYPE);
    EXPECT_EQ(f32->signLocation, 31);
    EXPECT_EQ(f32->expBias, 127U);
    const float fval = -1.5f;
    EXPECT_DOUBLE_EQ(f32->decodeValue(reinterpret_cast<const uint8_t*>(&fval), NULL).asDouble(), -1.5);

    std::shared_ptr<H5Datatype> f64 = decodeType(H5Builder::floatType(8));
    EXPECT_EQ(f64->describe(), "float64");
    const double dval = 6.02e23;
    EXPECT_DOUBLE_EQ(f64->decodeValue(reinterpret_cast<const uint8_t*>(&dval), NULL).asDouble(), 6.02e23);
}

TEST(H5Datatype, HalfPrecisionUsesBitLayout)
{
    H5Builder::bytes_t b;
    H5Builder::u32(b, 1 | (1 << 4) | ((0x20 | (15 << 8)) << 8));
    H5Builder::u32(b, 2);
    H5Builder::u16(b, 0);
    H5Builder::u16(b, 16);
    H5Builder::u8(b, 10);   // exponent location
    H5Builder::u8(b, 5);    // exponent size
    H5Builder::u8(b, 0);    // mantissa location
    H5Builder::u8(b, 10);   // mantissa size
    H5Builder::u32(b, 15);

    std::shared_ptr<H5Datatype> dt = decodeType(b);
    const uint8_t one[2] = {0x00, 0x3C};
    const uint8_t minus_two[2] = {0x00, 0xC0};
    const uint8_t half[2] = {0x00, 0x38};
    EXPECT_DOUBLE_EQ(dt->decodeValue(one, NULL).asDouble(), 1.0);
    EXPECT_DOUBLE_EQ(dt->decodeValue(minus_two, NULL).asDouble(), -2.0);
    EXPECT_DOUBLE_EQ(dt->decodeValue(half, NULL).asDouble(), 0.5);
}

TEST(H5Datatype, FixedLengthStrings)
{
    std::shared_ptr<H5Datatype> nullterm = decodeType(H5Builder::stringType(8, H5Datatype::NULL_TERMINATED));
    EXPECT_EQ(nullterm->describe(), "string(8, nullterm, ascii)");
    const uint8_t text[8] = {'h', 'i', 0, 'x', 'x', 0, 0, 0};
    EXPECT_EQ(nullterm->decodeValue(text, NULL).asString(), "hi");

    std::shared_ptr<H5Datatype> spacepad = decodeType(H5Builder::stringType(6, H5Datatype::SPACE_PADDED));
    const uint8_t padded[6] = {'a', 'b', 'c', ' ', ' ', ' '};
    EXPECT_EQ(spacepad->decodeValue(padded, NULL).asString(), "abc");
}

TEST(H5Datatype, CompoundWithArrayMember)
{
    const std::vector<H5Builder::member_t> members = {
        {"id", 0, H5Builder::fixedType(4, true)},
        {"vals", 4, H5Builder::arrayType({3}, H5Builder::fixedType(4, true), 4)}
    };
    std::shared_ptr<H5Datatype> dt = decodeType(H5Builder::compoundType(members, 16));
    ASSERT_EQ(dt->members.size(), 2U);
    EXPECT_EQ(dt->members[1].name, "vals");
    EXPECT_EQ(dt->members[1].offset, 4U);
    EXPECT_EQ(dt->members[1].type->typeClass, H5Datatype::ARRAY_TYPE);
    EXPECT_EQ(dt->describe(), "compound{id: int32 @0, vals: array[3] of int32 @4}");

    const std::vector<int32_t> element = {7, 10, 20, 30};
    const H5Value record = dt->decodeValue(H5Builder::values(element).data(), NULL);
    EXPECT_EQ(record.kind(), H5Value::RECORD);
    EXPECT_EQ(record.field("id").asInt(), 7);
    ASSERT_EQ(record.field("vals").size(), 3U);
    EXPECT_EQ(record.field("vals")[2].asInt(), 30);
}

TEST(H5Datatype, CompoundMemberOutsideCompound)
{
    const std::vector<H5Builder::member_t> members = {{"big", 4, H5Builder::fixedType(8, true)}};
    EXPECT_THROW(decodeType(H5Builder::compoundType(members, 8)), FormatError);
}

TEST(H5Datatype, EnumerationNamesThenValues)
{
    std::shared_ptr<H5Datatype> dt = decodeType(H5Builder::enumType(H5Builder::fixedType(1, true), 1, {"RED", "GREEN", "BLUE"}, {0, 1, 2}));
    ASSERT_EQ(dt->enumMembers.size(), 3U);
    EXPECT_EQ(dt->enumMembers[2].name, "BLUE");
    EXPECT_EQ(dt->enumMembers[2].value, 2);
    EXPECT_EQ(dt->describe(), "enum(int8){RED=0, GREEN=1, BLUE=2}");

    const uint8_t raw = 1;
    EXPECT_EQ(dt->decodeValue(&raw, NULL).asInt(), 1);
}

TEST(H5Datatype, ArraySizeMustMatchElements)
{
    H5Builder::bytes_t bytes = H5Builder::arrayType({2, 3}, H5Builder::fixedType(2, false), 2);
    std::shared_ptr<H5Datatype> dt = decodeType(bytes);
    EXPECT_EQ(dt->arrayElements(), 6ULL);
    EXPECT_EQ(dt->size, 12U);

    bytes[4] = 10; // declared size
    EXPECT_THROW(decodeType(bytes), FormatError);
}

TEST(H5Datatype, InvalidVersionAndClass)
{
    H5Builder::bytes_t bad_version = H5Builder::fixedType(4, true);
    bad_version[0] = 0x00; // version 0
    EXPECT_THROW(decodeType(bad_version), FormatError);

    H5Builder::bytes_t bad_class = H5Builder::fixedType(4, true);
    bad_class[0] = 0x1C; // version 1, class 12
    EXPECT_THROW(decodeType(bad_class), UnsupportedFeatureError);
}

TEST(H5Datatype, NestingDepthIsBounded)
{
    H5Builder::bytes_t nested = H5Builder::fixedType(4, true);
    for(int i = 0; i <= MAX_TYPE_DEPTH; i++)
    {
        H5Builder::bytes_t outer;
        H5Builder::u32(outer, 9 | (1 << 4)); // variable length sequence
        H5Builder::u32(outer, 16);
        H5Builder::cat(outer, nested);
        nested = outer;
    }
    EXPECT_THROW(decodeType(nested), UnsupportedFeatureError);
}

TEST(H5Datatype, NestedArraysAreUnsupported)
{
    const H5Builder::bytes_t inner = H5Builder::arrayType({2}, H5Builder::fixedType(4, true), 4);
    EXPECT_THROW(decodeType(H5Builder::arrayType({2}, inner, 8)), UnsupportedFeatureError);

    const std::vector<H5Builder::member_t> members = {{"x", 0, H5Builder::fixedType(4, true)}};
    EXPECT_THROW(decodeType(H5Builder::arrayType({2}, H5Builder::compoundType(members, 4), 4)), UnsupportedFeatureError);
}

TEST(H5Datatype, VariableLengthStringFromGlobalHeap)
{
    H5Builder builder;
    const std::string hello = "hello";
    const uint64_t collection = builder.globalHeap({H5Builder::bytes_t(hello.begin(), hello.end())});
    const H5Builder::bytes_t type_bytes = H5Builder::vlenStringType();
    const uint64_t type_addr = builder.append(type_bytes);

    H5Cursor cursor(new H5Cursor::MemoryIODriver(builder.image));
    uint64_t pos = type_addr;
    std::shared_ptr<H5Datatype> dt = H5Datatype::decode(&cursor, &pos);
    EXPECT_TRUE(dt->isVariableString());
    EXPECT_EQ(dt->describe(), "vlen string");

    const H5Builder::bytes_t ref = H5Builder::vlenRef(5, collection, 1);
    EXPECT_EQ(dt->decodeValue(ref.data(), &cursor).asString(), "hello");

    const H5Builder::bytes_t empty = H5Builder::vlenRef(0, 0, 0);
    EXPECT_EQ(dt->decodeValue(empty.data(), &cursor).asString(), "");

    const H5Builder::bytes_t missing = H5Builder::vlenRef(3, collection, 9);
    EXPECT_THROW(dt->decodeValue(missing.data(), &cursor), DataReadError);
}

TEST(H5Datatype, IntegersWiderThanEightBytes)
{
    const uint8_t data[16] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x80};

    std::shared_ptr<H5Datatype> wide = decodeType(H5Builder::fixedType(16, true));
    EXPECT_EQ(wide->size, 16U);
    EXPECT_EQ(wide->describe(), "int128");
    EXPECT_THROW(wide->decodeValue(data, NULL), UnsupportedFeatureError);

    std::shared_ptr<H5Datatype> zero = decodeType(H5Builder::fixedType(0, false));
    EXPECT_THROW(zero->decodeValue(data, NULL), UnsupportedFeatureError);

    std::shared_ptr<H5Datatype> widest = decodeType(H5Builder::fixedType(8, true));
    EXPECT_EQ(widest->decodeValue(data, NULL).asInt(), 0x0807060504030201LL);
}

TEST(H5Datatype, VariableLengthElementSize)
{
    H5Builder::bytes_t short_id = H5Builder::vlenStringType();
    short_id[4] = 4; // declared element size
    EXPECT_THROW(decodeType(short_id), FormatError);

    /* heap ids shrink with the offset size */
    H5Builder::bytes_t narrow_id = H5Builder::vlenStringType();
    narrow_id[4] = 12;
    H5Cursor narrow(new H5Cursor::MemoryIODriver(narrow_id));
    narrow.setSizes(4, 8);
    uint64_t pos = 0;
    EXPECT_EQ(H5Datatype::decode(&narrow, &pos)->size, 12U);

    H5Cursor wide(new H5Cursor::MemoryIODriver(H5Builder::vlenStringType()));
    wide.setSizes(4, 8);
    pos = 0;
    EXPECT_THROW(H5Datatype::decode(&wide, &pos), FormatError);
}
