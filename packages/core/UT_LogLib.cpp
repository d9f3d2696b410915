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
#include <string>
#include <vector>

#include "LogLib.h"

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * captureHandler
 *----------------------------------------------------------------------------*/
static int captureHandler (const char* str, int size, void* parm)
{
    std::vector<std::string>* entries = static_cast<std::vector<std::string>*>(parm);
    entries->push_back(std::string(str));
    return size;
}

/*----------------------------------------------------------------------------
 * tagHandler - records which handler saw the entry
 *----------------------------------------------------------------------------*/
typedef struct {
    std::vector<std::string>*   order;
    const char*                 tag;
} tag_t;

static int tagHandler (const char* str, int size, void* parm)
{
    (void)str;
    tag_t* tag = static_cast<tag_t*>(parm);
    tag->order->push_back(tag->tag);
    return size;
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

TEST(LogLib, HandlerReceivesEntriesAtOrAboveLevel)
{
    LogLib::init();

    std::vector<std::string> entries;
    const okey_t id = LogLib::createLog(WARNING, captureHandler, &entries);

    mlog(DEBUG, "hidden %d", 1);
    mlog(WARNING, "shown %d", 2);
    mlog(ERROR, "shown %s", "three");

    ASSERT_EQ(entries.size(), 2U);
    EXPECT_NE(entries[0].find("UT_LogLib.cpp"), std::string::npos);
    EXPECT_NE(entries[0].find(":WARNING: shown 2\n"), std::string::npos);
    EXPECT_NE(entries[1].find(":ERROR: shown three\n"), std::string::npos);

    EXPECT_TRUE(LogLib::deleteLog(id));
    EXPECT_FALSE(LogLib::deleteLog(id));
    LogLib::deinit();
}

TEST(LogLib, RawEntriesAreUnformatted)
{
    LogLib::init();

    std::vector<std::string> entries;
    LogLib::createLog(DEBUG, captureHandler, &entries);
    mlog(RAW, "plain text");

    ASSERT_EQ(entries.size(), 1U);
    EXPECT_EQ(entries[0], "plain text");
    LogLib::deinit();
}

TEST(LogLib, LevelsCanBeChanged)
{
    LogLib::init();

    std::vector<std::string> entries;
    const okey_t id = LogLib::createLog(CRITICAL, captureHandler, &entries);
    EXPECT_EQ(LogLib::getLevel(id), CRITICAL);

    mlog(INFO, "before");
    EXPECT_TRUE(entries.empty());

    EXPECT_TRUE(LogLib::setLevel(id, INFO));
    mlog(INFO, "after");
    EXPECT_EQ(entries.size(), 1U);

    EXPECT_FALSE(LogLib::setLevel(id + 100, DEBUG));
    EXPECT_EQ(LogLib::getLevel(id + 100), INVALID_LOG_LEVEL);
    LogLib::deinit();
}

TEST(LogLib, HandlersRunInRegistrationOrder)
{
    LogLib::init();

    std::vector<std::string> order;
    tag_t first = {&order, "first"};
    tag_t second = {&order, "second"};
    tag_t third = {&order, "third"};
    const okey_t first_id = LogLib::createLog(INFO, tagHandler, &first);
    const okey_t second_id = LogLib::createLog(INFO, tagHandler, &second);
    const okey_t third_id = LogLib::createLog(INFO, tagHandler, &third);
    EXPECT_LT(first_id, second_id);
    EXPECT_LT(second_id, third_id);

    mlog(INFO, "entry");
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second", "third"}));

    order.clear();
    EXPECT_TRUE(LogLib::deleteLog(second_id));
    mlog(INFO, "entry");
    EXPECT_EQ(order, (std::vector<std::string>{"first", "third"}));

    EXPECT_TRUE(LogLib::deleteLog(first_id));
    EXPECT_TRUE(LogLib::deleteLog(third_id));
    LogLib::deinit();
}

TEST(LogLib, CountsEveryLevel)
{
    LogLib::init();

    mlog(DEBUG, "one");
    mlog(DEBUG, "two");
    mlog(CRITICAL, "three");

    EXPECT_EQ(LogLib::getLvlCnts(DEBUG), 2);
    EXPECT_EQ(LogLib::getLvlCnts(CRITICAL), 1);
    EXPECT_EQ(LogLib::getLvlCnts(INFO), 0);
    EXPECT_EQ(LogLib::getLvlCnts(INVALID_LOG_LEVEL), -1);
    LogLib::deinit();
}

TEST(LogLib, LevelNames)
{
    log_lvl_t lvl = INVALID_LOG_LEVEL;
    EXPECT_TRUE(LogLib::str2lvl("warning", &lvl));
    EXPECT_EQ(lvl, WARNING);
    EXPECT_TRUE(LogLib::str2lvl("RAW", &lvl));
    EXPECT_EQ(lvl, RAW);
    EXPECT_FALSE(LogLib::str2lvl("verbose", &lvl));
    EXPECT_FALSE(LogLib::str2lvl(NULL, &lvl));

    EXPECT_STREQ(LogLib::lvl2str(ERROR), "ERROR");
    EXPECT_STREQ(LogLib::lvl2str(INVALID_LOG_LEVEL), "INVALID");
}
