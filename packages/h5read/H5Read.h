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

#ifndef __h5read__
#define __h5read__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>

#include "OsApi.h"
#include "LogLib.h"

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#ifndef H5READ_VERBOSE
#define H5READ_VERBOSE false
#endif

#ifndef H5READ_ERROR_CHECKING
#define H5READ_ERROR_CHECKING true
#endif

#ifndef H5READ_MAXIMUM_DIMENSIONS
#define H5READ_MAXIMUM_DIMENSIONS 32
#endif

#ifndef H5READ_MAXIMUM_TYPE_DEPTH
#define H5READ_MAXIMUM_TYPE_DEPTH 8
#endif

#ifndef H5READ_MAXIMUM_LINK_DEPTH
#define H5READ_MAXIMUM_LINK_DEPTH 32
#endif

#ifndef H5READ_TIME_UNIT_THRESHOLD
#define H5READ_TIME_UNIT_THRESHOLD 10000000000LL
#endif

#ifndef H5READ_MAXIMUM_READ_SIZE
#define H5READ_MAXIMUM_READ_SIZE 0x400000000ULL // 16GB
#endif

#ifndef H5READ_SIGNATURE_OFFSETS
#define H5READ_SIGNATURE_OFFSETS 0, 512, 1024, 2048
#endif

/******************************************************************************
 * H5READ NAMESPACE
 ******************************************************************************/

namespace H5Read
{
    /*--------------------------------------------------------------------
     * Constants
     *--------------------------------------------------------------------*/

    const int MAX_NDIMS = H5READ_MAXIMUM_DIMENSIONS;
    const int MAX_TYPE_DEPTH = H5READ_MAXIMUM_TYPE_DEPTH;
    const int MAX_LINK_DEPTH = H5READ_MAXIMUM_LINK_DEPTH;
    const int64_t EOR = -1L; // end of range - read rest of the span of a dimension

    const uint64_t H5_SIGNATURE_LE     = 0x0A1A0A0D46444889LL;
    const uint32_t H5_OHDR_SIGNATURE_LE = 0x5244484F; // object header
    const uint32_t H5_OCHK_SIGNATURE_LE = 0x4B48434F; // object header continuation
    const uint32_t H5_TREE_SIGNATURE_LE = 0x45455254; // version 1 b-tree
    const uint32_t H5_BTHD_SIGNATURE_LE = 0x44485442; // version 2 b-tree header
    const uint32_t H5_HEAP_SIGNATURE_LE = 0x50414548; // local heap
    const uint32_t H5_SNOD_SIGNATURE_LE = 0x444F4E53; // symbol table node
    const uint32_t H5_GCOL_SIGNATURE_LE = 0x4C4F4347; // global heap collection

    /*--------------------------------------------------------------------
     * Typedefs
     *--------------------------------------------------------------------*/

    typedef enum {
        OBJECT_UNKNOWN      = -1,
        OBJECT_GROUP        = 0,
        OBJECT_DATASET      = 1,
        OBJECT_DATATYPE     = 2
    } object_type_t;

    typedef enum {
        UNKNOWN_LAYOUT      = -1,
        COMPACT_LAYOUT      = 0,
        CONTIGUOUS_LAYOUT   = 1,
        CHUNKED_LAYOUT      = 2,
        VIRTUAL_LAYOUT      = 3
    } layout_t;

    typedef enum {
        HARD_LINK           = 0,
        SOFT_LINK           = 1,
        EXTERNAL_LINK       = 64
    } link_type_t;

    typedef enum {
        UNIT_AUTO           = 0,
        UNIT_SECONDS        = 1,
        UNIT_MILLISECONDS   = 2
    } time_unit_t;

    typedef struct {                    // [r0, r1)
        int64_t     r0;                 // start of slice
        int64_t     r1;                 // end of slice (EOR for end of dimension)
        int64_t     step;               // stride, 1 for every element
    } range_t;

    typedef struct {
        bool                    scalar; // rank 0, one element
        bool                    null;   // no elements
        std::vector<uint64_t>   dims;
        std::vector<uint64_t>   maxdims;
    } dataspace_t;

    struct link_info_t {
        link_type_t             type;
        std::string             name;
        uint64_t                address;    // hard links
        std::string             target;     // soft and external links
        std::string             filename;   // external links
    };

    typedef struct {
        int         year;
        int         month;
        int         day;
        int         hour;
        int         minute;
        int         second;
        int         millisecond;
    } gmt_time_t;

    /*--------------------------------------------------------------------
     * Methods
     *--------------------------------------------------------------------*/

    void        init            (log_lvl_t lvl=INFO);
    void        deinit          (void);

    const char* layout2str      (layout_t layout);
    const char* object2str      (object_type_t type);
    const char* link2str        (link_type_t type);
    gmt_time_t  ticks2gmt       (int64_t ticks, time_unit_t unit);
    bool        multiply        (uint64_t a, uint64_t b, uint64_t* product);
    uint64_t    elements        (const dataspace_t& space);
    std::string dims2str        (const std::vector<uint64_t>& dims);
}

#endif  /* __h5read__ */
