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

#include <ctime>

#include "H5Read.h"
#include "H5Exception.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

static okey_t termLog = INVALID_KEY;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void H5Read::init (log_lvl_t lvl)
{
    LogLib::init();
    termLog = LogLib::createLog(lvl, LogLib::termHandler, NULL);
    mlog(INFO, "h5read initialized");
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void H5Read::deinit (void)
{
    mlog(INFO, "h5read shutting down");
    if(termLog != INVALID_KEY)
    {
        LogLib::deleteLog(termLog);
        termLog = INVALID_KEY;
    }
    LogLib::deinit();
}

/*----------------------------------------------------------------------------
 * layout2str
 *----------------------------------------------------------------------------*/
const char* H5Read::layout2str (layout_t layout)
{
    switch(layout)
    {
        case COMPACT_LAYOUT:    return "COMPACT_LAYOUT";
        case CONTIGUOUS_LAYOUT: return "CONTIGUOUS_LAYOUT";
        case CHUNKED_LAYOUT:    return "CHUNKED_LAYOUT";
        case VIRTUAL_LAYOUT:    return "VIRTUAL_LAYOUT";
        default:                return "UNKNOWN_LAYOUT";
    }
}

/*----------------------------------------------------------------------------
 * object2str
 *----------------------------------------------------------------------------*/
const char* H5Read::object2str (object_type_t type)
{
    switch(type)
    {
        case OBJECT_GROUP:      return "GROUP";
        case OBJECT_DATASET:    return "DATASET";
        case OBJECT_DATATYPE:   return "DATATYPE";
        default:                return "UNKNOWN";
    }
}

/*----------------------------------------------------------------------------
 * link2str
 *----------------------------------------------------------------------------*/
const char* H5Read::link2str (link_type_t type)
{
    switch(type)
    {
        case HARD_LINK:         return "HARD";
        case SOFT_LINK:         return "SOFT";
        case EXTERNAL_LINK:     return "EXTERNAL";
        default:                return "UNKNOWN";
    }
}

/*----------------------------------------------------------------------------
 * ticks2gmt
 *
 *  UNIT_AUTO treats magnitudes below the threshold as seconds and
 *  everything at or above it as milliseconds
 *----------------------------------------------------------------------------*/
H5Read::gmt_time_t H5Read::ticks2gmt (int64_t ticks, time_unit_t unit)
{
    if(unit == UNIT_AUTO)
    {
        const uint64_t magnitude = (ticks < 0) ? (0ULL - (uint64_t)ticks) : (uint64_t)ticks;
        unit = (magnitude < (uint64_t)H5READ_TIME_UNIT_THRESHOLD) ? UNIT_SECONDS : UNIT_MILLISECONDS;
    }

    /* Split into Seconds and Milliseconds */
    int64_t seconds = ticks;
    int64_t millis = 0;
    if(unit == UNIT_MILLISECONDS)
    {
        seconds = ticks / 1000;
        millis = ticks % 1000;
        if(millis < 0)
        {
            millis += 1000;
            seconds -= 1;
        }
    }

    /* Convert to Calendar Time */
    const time_t rawtime = static_cast<time_t>(seconds);
    struct tm timeinfo;
    if(gmtime_r(&rawtime, &timeinfo) == NULL)
    {
        throw DataReadError("time value out of calendar range: %ld", (long)ticks);
    }

    gmt_time_t gmt;
    gmt.year = timeinfo.tm_year + 1900;
    gmt.month = timeinfo.tm_mon + 1;
    gmt.day = timeinfo.tm_mday;
    gmt.hour = timeinfo.tm_hour;
    gmt.minute = timeinfo.tm_min;
    gmt.second = timeinfo.tm_sec;
    gmt.millisecond = static_cast<int>(millis);
    return gmt;
}

/*----------------------------------------------------------------------------
 * multiply
 *
 *  returns false when the product does not fit in 64 bits
 *----------------------------------------------------------------------------*/
bool H5Read::multiply (uint64_t a, uint64_t b, uint64_t* product)
{
    if((a != 0) && (b > (UINT64_MAX / a)))
    {
        return false;
    }
    *product = a * b;
    return true;
}

/*----------------------------------------------------------------------------
 * elements
 *----------------------------------------------------------------------------*/
uint64_t H5Read::elements (const dataspace_t& space)
{
    if(space.null) return 0;
    uint64_t num_elements = 1;
    for(const uint64_t dim: space.dims)
    {
        if(!multiply(num_elements, dim, &num_elements))
        {
            throw DataReadError("number of elements in dataspace %s overflows", dims2str(space.dims).c_str());
        }
    }
    return num_elements;
}

/*----------------------------------------------------------------------------
 * dims2str
 *----------------------------------------------------------------------------*/
std::string H5Read::dims2str (const std::vector<uint64_t>& dims)
{
    std::string str = "[";
    for(size_t d = 0; d < dims.size(); d++)
    {
        if(d > 0) str += ", ";
        str += std::to_string(dims[d]);
    }
    str += "]";
    return str;
}
