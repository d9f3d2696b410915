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

#ifndef __h5_btree_v1__
#define __h5_btree_v1__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"

/******************************************************************************
 * HDF5 VERSION 1 B-TREE CLASS
 ******************************************************************************/

/*
 * Navigates the version 1 b-tree used to index raw data chunks (node type 1)
 * and the one used to index symbol table nodes of old style groups (node
 * type 0). Chunk keys hold the element offset of the chunk in each dimension
 * plus a trailing offset into the datatype, and are ordered lexicographically
 * with the slowest varying dimension first.
 */
class H5BTreeV1
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            std::vector<uint64_t>   offsets;        // element offset of chunk per dimension
            uint32_t                size;           // stored (filtered) size in bytes
            uint32_t                filter_mask;    // filters skipped when chunk was written
            uint64_t                address;
        } chunk_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                    H5BTreeV1       (H5Cursor* _cursor, uint64_t _root, int _ndims);

        bool                        findChunk       (const std::vector<uint64_t>& offsets, chunk_t* chunk);
        std::vector<chunk_t>        readChunks      (void);

        static std::vector<uint64_t> readGroupNodes (H5Cursor* cursor, uint64_t root);

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            GROUP_NODE_TYPE     = 0,
            CHUNK_NODE_TYPE     = 1
        } node_type_t;

        typedef struct {
            int                     level;
            std::vector<chunk_t>    keys;       // entries + 1 keys
            std::vector<uint64_t>   children;   // entries
        } node_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        node_t                      readBTreeV1     (uint64_t pos, int expected_level);
        chunk_t                     readBTreeNodeV1 (uint64_t* pos);
        void                        readSubtree     (uint64_t pos, int expected_level, int depth, std::vector<chunk_t>& chunks);
        static int                  compareKeys     (const std::vector<uint64_t>& a, const std::vector<uint64_t>& b);
        static int                  readHeader      (H5Cursor* cursor, uint64_t* pos, node_type_t node_type);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Cursor*                   cursor;
        uint64_t                    root;
        int                         ndims;
};

#endif  /* __h5_btree_v1__ */
