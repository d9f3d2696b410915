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
#include <stdint.h>

#include "H5Value.h"
#include "H5Exception.h"
#include "RunTimeException.h"

using namespace H5Read;

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(H5Value, NumericConversions)
{
    const H5Value negative = H5Value::makeInteger(-5);
    EXPECT_EQ(negative.kind(), H5Value::INTEGER);
    EXPECT_EQ(negative.asInt(), -5);
    EXPECT_DOUBLE_EQ(negative.asDouble(), -5.0);
    EXPECT_TRUE(negative.isNumeric());

    const H5Value real = H5Value::makeReal(2.75);
    EXPECT_EQ(real.asInt(), 2);
    EXPECT_EQ(real.toString(), "2.75");

    EXPECT_THROW(H5Value::makeText("x").asInt(), RunTimeException);
    EXPECT_THROW(H5Value().asDouble(), RunTimeException);
}

TEST(H5Value, BooleansFromOneByteIntegers)
{
    EXPECT_FALSE(H5Value::makeUnsigned(0).asBool());
    EXPECT_TRUE(H5Value::makeUnsigned(1).asBool());
    EXPECT_TRUE(H5Value::makeInteger(-1).asBool());
    EXPECT_THROW(H5Value::makeReal(1.0).asBool(), RunTimeException);
}

TEST(H5Value, TimeInSeconds)
{
    const gmt_time_t t = H5Value::makeInteger(1700000000).asTime();
    EXPECT_EQ(t.year, 2023);
    EXPECT_EQ(t.month, 11);
    EXPECT_EQ(t.day, 14);
    EXPECT_EQ(t.hour, 22);
    EXPECT_EQ(t.minute, 13);
    EXPECT_EQ(t.second, 20);
    EXPECT_EQ(t.millisecond, 0);
}

TEST(H5Value, TimeInMilliseconds)
{
    const gmt_time_t t = H5Value::makeInteger(1700000000123LL).asTime();
    EXPECT_EQ(t.year, 2023);
    EXPECT_EQ(t.second, 20);
    EXPECT_EQ(t.millisecond, 123);

    /* threshold itself is milliseconds */
    const gmt_time_t edge = H5Value::makeInteger(H5READ_TIME_UNIT_THRESHOLD).asTime();
    EXPECT_EQ(edge.year, 1970);
    EXPECT_EQ(edge.month, 4);
    EXPECT_EQ(edge.day, 26);

    const gmt_time_t below = H5Value::makeInteger(H5READ_TIME_UNIT_THRESHOLD - 1).asTime();
    EXPECT_EQ(below.year, 2286);
}

TEST(H5Value, ForcedTimeUnits)
{
    const gmt_time_t secs = H5Value::makeInteger(60).asTime(UNIT_SECONDS);
    EXPECT_EQ(secs.minute, 1);

    const gmt_time_t millis = H5Value::makeInteger(60).asTime(UNIT_MILLISECONDS);
    EXPECT_EQ(millis.minute, 0);
    EXPECT_EQ(millis.millisecond, 60);

    const gmt_time_t before_epoch = H5Value::makeInteger(-1500).asTime(UNIT_MILLISECONDS);
    EXPECT_EQ(before_epoch.year, 1969);
    EXPECT_EQ(before_epoch.second, 58);
    EXPECT_EQ(before_epoch.millisecond, 500);

    EXPECT_THROW(H5Value::makeReal(1.0).asTime(), RunTimeException);
}

TEST(H5Value, TimeOutsideCalendarRange)
{
    /* year does not fit the calendar */
    EXPECT_THROW(H5Value::makeInteger(100000000000000000LL).asTime(UNIT_SECONDS), DataReadError);
    EXPECT_THROW(ticks2gmt(INT64_MAX, UNIT_SECONDS), DataReadError);

    /* most negative tick count selects milliseconds */
    const gmt_time_t earliest = ticks2gmt(INT64_MIN, UNIT_AUTO);
    EXPECT_LT(earliest.year, 0);
    EXPECT_EQ(earliest.millisecond, 192);
}

TEST(H5Value, RecordsKeepMemberOrder)
{
    H5Value vals = H5Value::makeList();
    vals.append(H5Value::makeInteger(1));
    vals.append(H5Value::makeInteger(2));

    H5Value record = H5Value::makeRecord();
    record.addField("z", H5Value::makeText("last"));
    record.addField("a", vals);

    EXPECT_EQ(record.fieldNames(), (std::vector<std::string>{"z", "a"}));
    EXPECT_TRUE(record.hasField("a"));
    EXPECT_FALSE(record.hasField("b"));
    EXPECT_EQ(record.field("a")[1].asInt(), 2);
    EXPECT_EQ(record.toString(), "{z: \"last\", a: [1, 2]}");

    EXPECT_THROW(record.field("b"), RunTimeException);
    EXPECT_THROW(vals[2], RunTimeException);
    EXPECT_THROW(vals.addField("x", H5Value()), RunTimeException);
    EXPECT_THROW(record.append(H5Value()), RunTimeException);
}

TEST(H5Value, Equality)
{
    EXPECT_EQ(H5Value::makeInteger(3), H5Value::makeInteger(3));
    EXPECT_NE(H5Value::makeInteger(3), H5Value::makeUnsigned(3));
    EXPECT_NE(H5Value::makeText("a"), H5Value::makeText("b"));
    EXPECT_EQ(H5Value(), H5Value());

    const uint8_t raw[] = {1, 2, 3};
    EXPECT_EQ(H5Value::makeBytes(raw, 3).asBytes().size(), 3U);
    EXPECT_EQ(H5Value::makeBytes(raw, 3).toString(), "<3 bytes>");
}
