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

#include "H5Heap.h"
#include "H5Exception.h"

using H5Read::FormatError;
using H5Read::DataReadError;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readLocalHeap
 *
 *  returns the address of the heap's data segment
 *----------------------------------------------------------------------------*/
uint64_t H5Heap::readLocalHeap (H5Cursor* cursor, uint64_t heap_addr)
{
    uint64_t pos = heap_addr;

    if(!H5READ_ERROR_CHECKING)
    {
        pos += 5;
    }
    else
    {
        const uint32_t signature = (uint32_t)cursor->readField(4, &pos);
        if(signature != H5Read::H5_HEAP_SIGNATURE_LE)
        {
            throw FormatError("invalid heap signature at 0x%lx: 0x%X", (unsigned long)heap_addr, (unsigned)signature);
        }

        const uint8_t version = (uint8_t)cursor->readField(1, &pos);
        if(version != 0)
        {
            throw FormatError("incorrect version of heap: %d", version);
        }
    }

    /* Skip Reserved, Data Segment Size, and Free List Offset */
    pos += 3 + (2 * cursor->lengthSize());
    const uint64_t data_addr = cursor->readOffset(&pos);

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Local Heap: 0x%lx, data segment at 0x%lx", (unsigned long)heap_addr, (unsigned long)data_addr);
    }

    return data_addr;
}

/*----------------------------------------------------------------------------
 * readLocalString
 *----------------------------------------------------------------------------*/
std::string H5Heap::readLocalString (H5Cursor* cursor, uint64_t data_addr, uint64_t offset)
{
    uint64_t pos = data_addr + offset;
    return cursor->readString(&pos, 0);
}

/*----------------------------------------------------------------------------
 * readGlobalObject
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Heap::readGlobalObject (H5Cursor* cursor, uint64_t collection_addr, uint32_t index)
{
    uint64_t pos = collection_addr;

    /* Read Collection Header */
    const uint32_t signature = (uint32_t)cursor->readField(4, &pos);
    if(signature != H5Read::H5_GCOL_SIGNATURE_LE)
    {
        throw FormatError("invalid global heap signature at 0x%lx: 0x%X", (unsigned long)collection_addr, (unsigned)signature);
    }

    const uint8_t version = (uint8_t)cursor->readField(1, &pos);
    if(version != 1)
    {
        throw FormatError("incorrect version of global heap: %d", version);
    }

    pos += 3; // reserved
    const uint64_t collection_size = cursor->readLength(&pos);
    const uint64_t end_of_collection = collection_addr + collection_size;

    /* Walk Heap Objects */
    const uint64_t object_header_size = 8 + cursor->lengthSize();
    while(pos + object_header_size <= end_of_collection)
    {
        const uint16_t obj_index = (uint16_t)cursor->readField(2, &pos);
        pos += 6; // reference count and reserved
        const uint64_t obj_size = cursor->readLength(&pos);

        /* Free Space Marks End of Objects */
        if(obj_index == 0) break;

        if(obj_index == index)
        {
            if((pos > end_of_collection) || (obj_size > (end_of_collection - pos)))
            {
                throw FormatError("global heap object %u of %lu bytes overruns collection at 0x%lx", (unsigned)index, (unsigned long)obj_size, (unsigned long)collection_addr);
            }
            cursor->checkRange(pos, obj_size);
            std::vector<uint8_t> data(obj_size);
            cursor->readByteArray(data.data(), obj_size, &pos);
            return data;
        }

        /* Objects are Padded to 8-byte Boundary */
        pos += obj_size + ((8 - (obj_size % 8)) % 8);
    }

    throw DataReadError("global heap object %u not found in collection at 0x%lx", (unsigned)index, (unsigned long)collection_addr);
}
