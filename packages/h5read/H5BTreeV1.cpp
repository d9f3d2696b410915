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

#include "H5BTreeV1.h"
#include "H5Exception.h"

using H5Read::FormatError;
using H5Read::UnsupportedFeatureError;

// NOLINTBEGIN(misc-no-recursion)

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5BTreeV1::H5BTreeV1 (H5Cursor* _cursor, uint64_t _root, int _ndims):
    cursor(_cursor),
    root(_root),
    ndims(_ndims)
{
}

/*----------------------------------------------------------------------------
 * findChunk
 *
 *  descends from the root through the child with the largest key not
 *  greater than the target; the leaf must hold an exact match
 *----------------------------------------------------------------------------*/
bool H5BTreeV1::findChunk (const std::vector<uint64_t>& offsets, chunk_t* chunk)
{
    uint64_t pos = root;
    int expected_level = -1;

    while(true)
    {
        const node_t node = readBTreeV1(pos, expected_level);
        const int entries = static_cast<int>(node.children.size());

        /* Leaf Node */
        if(node.level == 0)
        {
            for(int e = 0; e < entries; e++)
            {
                if(compareKeys(node.keys[e].offsets, offsets) == 0)
                {
                    *chunk = node.keys[e];
                    chunk->address = node.children[e];
                    return true;
                }
            }
            return false;
        }

        /* Internal Node */
        int selected = -1;
        for(int e = 0; e < entries; e++)
        {
            if(compareKeys(node.keys[e].offsets, offsets) <= 0) selected = e;
            else break;
        }

        if(selected < 0)
        {
            return false; // precedes every chunk in tree
        }

        pos = node.children[selected];
        expected_level = node.level - 1;
    }
}

/*----------------------------------------------------------------------------
 * readChunks - all chunks in key order
 *----------------------------------------------------------------------------*/
std::vector<H5BTreeV1::chunk_t> H5BTreeV1::readChunks (void)
{
    std::vector<chunk_t> chunks;
    readSubtree(root, -1, 0, chunks);
    return chunks;
}

/*----------------------------------------------------------------------------
 * readGroupNodes - addresses of symbol table nodes in key order
 *----------------------------------------------------------------------------*/
std::vector<uint64_t> H5BTreeV1::readGroupNodes (H5Cursor* cursor, uint64_t root)
{
    std::vector<uint64_t> snod_addrs;

    /* Stack of (Address, Expected Level) */
    std::vector<std::pair<uint64_t, int>> stack;
    stack.emplace_back(root, -1);

    while(!stack.empty())
    {
        const std::pair<uint64_t, int> entry = stack.back();
        stack.pop_back();

        uint64_t pos = entry.first;
        const int node_level = readHeader(cursor, &pos, GROUP_NODE_TYPE);
        if(entry.second >= 0 && node_level != entry.second)
        {
            throw FormatError("group b-tree node at 0x%lx has level %d, expected %d", (unsigned long)entry.first, node_level, entry.second);
        }

        const uint16_t entries_used = (uint16_t)cursor->readField(2, &pos);
        pos += 2 * cursor->offsetSize(); // sibling addresses
        pos += cursor->lengthSize(); // first key

        std::vector<uint64_t> children;
        for(int e = 0; e < entries_used; e++)
        {
            children.push_back(cursor->readOffset(&pos));
            pos += cursor->lengthSize(); // next key
        }

        if(node_level == 0)
        {
            snod_addrs.insert(snod_addrs.end(), children.begin(), children.end());
        }
        else
        {
            for(auto iter = children.rbegin(); iter != children.rend(); ++iter)
            {
                stack.emplace_back(*iter, node_level - 1);
            }
        }
    }

    return snod_addrs;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readBTreeV1
 *----------------------------------------------------------------------------*/
H5BTreeV1::node_t H5BTreeV1::readBTreeV1 (uint64_t pos, int expected_level)
{
    const uint64_t starting_position = pos;
    node_t node;

    /* Read Node Level and Number of Entries */
    node.level = readHeader(cursor, &pos, CHUNK_NODE_TYPE);
    if(expected_level >= 0 && node.level != expected_level)
    {
        throw FormatError("chunk b-tree node at 0x%lx has level %d, expected %d", (unsigned long)starting_position, node.level, expected_level);
    }
    const uint16_t entries_used = (uint16_t)cursor->readField(2, &pos);

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "B-Tree Node: 0x%lx, level %d, %d entries", (unsigned long)starting_position, node.level, (int)entries_used);
    }

    /* Skip Sibling Addresses */
    pos += cursor->offsetSize() * 2;

    /* Read Keys and Children */
    node.keys.push_back(readBTreeNodeV1(&pos));
    for(int e = 0; e < entries_used; e++)
    {
        node.children.push_back(cursor->readOffset(&pos));
        node.keys.push_back(readBTreeNodeV1(&pos));
    }

    return node;
}

/*----------------------------------------------------------------------------
 * readBTreeNodeV1 - one chunk key
 *----------------------------------------------------------------------------*/
H5BTreeV1::chunk_t H5BTreeV1::readBTreeNodeV1 (uint64_t* pos)
{
    chunk_t key;

    key.size = (uint32_t)cursor->readField(4, pos);
    key.filter_mask = (uint32_t)cursor->readField(4, pos);
    for(int d = 0; d < ndims; d++)
    {
        key.offsets.push_back(cursor->readField(8, pos));
    }
    key.address = 0;

    /* Read Trailing Zero */
    const uint64_t trailing_zero = cursor->readField(8, pos);
    if(H5READ_ERROR_CHECKING && trailing_zero != 0)
    {
        throw FormatError("chunk key did not include a trailing zero: %lu", (unsigned long)trailing_zero);
    }

    return key;
}

/*----------------------------------------------------------------------------
 * readSubtree
 *----------------------------------------------------------------------------*/
void H5BTreeV1::readSubtree (uint64_t pos, int expected_level, int depth, std::vector<chunk_t>& chunks)
{
    if(depth > 64)
    {
        throw FormatError("chunk b-tree exceeds maximum depth at 0x%lx", (unsigned long)pos);
    }

    const node_t node = readBTreeV1(pos, expected_level);
    const int entries = static_cast<int>(node.children.size());

    for(int e = 0; e < entries; e++)
    {
        if(node.level == 0)
        {
            chunk_t chunk = node.keys[e];
            chunk.address = node.children[e];
            chunks.push_back(chunk);
        }
        else
        {
            readSubtree(node.children[e], node.level - 1, depth + 1, chunks);
        }
    }
}

/*----------------------------------------------------------------------------
 * compareKeys - lexicographic, most significant dimension first
 *----------------------------------------------------------------------------*/
int H5BTreeV1::compareKeys (const std::vector<uint64_t>& a, const std::vector<uint64_t>& b)
{
    const size_t n = MIN(a.size(), b.size());
    for(size_t d = 0; d < n; d++)
    {
        if(a[d] < b[d]) return -1;
        if(a[d] > b[d]) return 1;
    }
    return 0;
}

/*----------------------------------------------------------------------------
 * readHeader - signature, node type, and level
 *----------------------------------------------------------------------------*/
int H5BTreeV1::readHeader (H5Cursor* cursor, uint64_t* pos, node_type_t node_type)
{
    const uint64_t starting_position = *pos;

    const uint32_t signature = (uint32_t)cursor->readField(4, pos);
    if(signature == H5Read::H5_BTHD_SIGNATURE_LE)
    {
        throw UnsupportedFeatureError("version 2 b-tree at 0x%lx is not supported", (unsigned long)starting_position);
    }
    if(signature != H5Read::H5_TREE_SIGNATURE_LE)
    {
        throw FormatError("invalid b-tree signature at 0x%lx: 0x%X", (unsigned long)starting_position, (unsigned)signature);
    }

    const uint8_t type = (uint8_t)cursor->readField(1, pos);
    if(type != node_type)
    {
        throw FormatError("unexpected b-tree node type at 0x%lx: %d != %d", (unsigned long)starting_position, (int)type, (int)node_type);
    }

    return (int)cursor->readField(1, pos);
}

// NOLINTEND(misc-no-recursion)
