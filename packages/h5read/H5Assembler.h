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

#ifndef __h5_assembler__
#define __h5_assembler__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <vector>

#include "H5Read.h"

/******************************************************************************
 * HDF5 CHUNK ASSEMBLER CLASS
 ******************************************************************************/

/*
 * Places decoded chunks into a row-major output buffer covering a box of the
 * dataset. The part of a chunk that falls outside the box (or overhangs the
 * dataset shape) is dropped.
 */
class H5Assembler
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            H5Assembler     (const std::vector<uint64_t>& _shape, const std::vector<uint64_t>& _chunkdims,
                                             int _typesize, const std::vector<H5Read::range_t>& _box, uint8_t* _output);

        bool                intersects      (const std::vector<uint64_t>& chunk_offsets) const;
        uint64_t            placeChunk      (const std::vector<uint64_t>& chunk_offsets, const uint8_t* chunk);
        std::vector<std::vector<uint64_t>> chunkOrigins (void) const;
        uint64_t            outputSize      (void) const;

        static void         readSlice       (uint8_t* output_buffer, const uint64_t* output_dimensions, const H5Read::range_t* output_slice,
                                             const uint8_t* input_buffer, const uint64_t* input_dimensions, const H5Read::range_t* input_slice,
                                             int ndims, int typesize);
        static std::vector<uint8_t> applyStride (const uint8_t* input, const std::vector<uint64_t>& input_dims,
                                             const std::vector<int64_t>& steps, int typesize, std::vector<uint64_t>* output_dims);

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::vector<uint64_t>       shape;
        std::vector<uint64_t>       chunkdims;
        std::vector<H5Read::range_t> box;
        std::vector<uint64_t>       boxdims;
        int                         typesize;
        int                         ndims;
        uint8_t*                    output;
};

#endif  /* __h5_assembler__ */
