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

#include <cstring>

#include "H5Assembler.h"
#include "H5Exception.h"

using H5Read::range_t;
using H5Read::FormatError;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Assembler::H5Assembler (const std::vector<uint64_t>& _shape, const std::vector<uint64_t>& _chunkdims,
                          int _typesize, const std::vector<range_t>& _box, uint8_t* _output):
    shape(_shape),
    chunkdims(_chunkdims),
    box(_box),
    typesize(_typesize),
    ndims(static_cast<int>(_shape.size())),
    output(_output)
{
    if(chunkdims.size() != shape.size() || box.size() != shape.size())
    {
        throw FormatError("chunk dimensions do not match data dimensions: %d, %d != %d", (int)chunkdims.size(), (int)box.size(), ndims);
    }

    for(int d = 0; d < ndims; d++)
    {
        if(chunkdims[d] == 0)
        {
            throw FormatError("invalid chunk dimension %d: 0", d);
        }
        boxdims.push_back(box[d].r1 - box[d].r0);
    }
}

/*----------------------------------------------------------------------------
 * intersects
 *----------------------------------------------------------------------------*/
bool H5Assembler::intersects (const std::vector<uint64_t>& chunk_offsets) const
{
    for(int d = 0; d < ndims; d++)
    {
        const uint64_t lo = MAX(chunk_offsets[d], (uint64_t)box[d].r0);
        const uint64_t hi = MIN(MIN(chunk_offsets[d] + chunkdims[d], (uint64_t)box[d].r1), shape[d]);
        if(lo >= hi) return false;
    }
    return true;
}

/*----------------------------------------------------------------------------
 * placeChunk
 *
 *  chunk points to a full decoded chunk (product of chunk dimensions times
 *  type size); returns number of elements written to the output
 *----------------------------------------------------------------------------*/
uint64_t H5Assembler::placeChunk (const std::vector<uint64_t>& chunk_offsets, const uint8_t* chunk)
{
    if(static_cast<int>(chunk_offsets.size()) < ndims)
    {
        throw FormatError("chunk offset has %d dimensions, expected %d", (int)chunk_offsets.size(), ndims);
    }

    /* Scalar */
    if(ndims == 0)
    {
        memcpy(output, chunk, typesize);
        return 1;
    }

    // get truncated slice to pull out of chunk
    // (intersection of chunk, box, and dataset shape)
    std::vector<range_t> read_slice(ndims);
    std::vector<range_t> write_slice(ndims);
    uint64_t num_elements = 1;
    for(int d = 0; d < ndims; d++)
    {
        const int64_t lo = MAX(chunk_offsets[d], (uint64_t)box[d].r0);
        const int64_t hi = MIN(MIN(chunk_offsets[d] + chunkdims[d], (uint64_t)box[d].r1), shape[d]);
        if(lo >= hi) return 0; // chunk lies entirely outside

        read_slice[d].r0 = lo - chunk_offsets[d];
        read_slice[d].r1 = hi - chunk_offsets[d];
        read_slice[d].step = 1;
        write_slice[d].r0 = lo - box[d].r0;
        write_slice[d].r1 = hi - box[d].r0;
        write_slice[d].step = 1;
        num_elements *= hi - lo;
    }

    readSlice(output, boxdims.data(), write_slice.data(), chunk, chunkdims.data(), read_slice.data(), ndims, typesize);

    return num_elements;
}

/*----------------------------------------------------------------------------
 * chunkOrigins
 *
 *  element offsets of every chunk touching the box, row-major
 *----------------------------------------------------------------------------*/
std::vector<std::vector<uint64_t>> H5Assembler::chunkOrigins (void) const
{
    std::vector<std::vector<uint64_t>> origins;
    if(ndims == 0) return origins;

    std::vector<uint64_t> first(ndims);
    std::vector<uint64_t> last(ndims);
    for(int d = 0; d < ndims; d++)
    {
        if(box[d].r1 <= box[d].r0) return origins;
        first[d] = box[d].r0 / chunkdims[d];
        last[d] = (box[d].r1 - 1) / chunkdims[d];
    }

    std::vector<uint64_t> coord = first;
    while(true)
    {
        std::vector<uint64_t> origin(ndims);
        for(int d = 0; d < ndims; d++) origin[d] = coord[d] * chunkdims[d];
        origins.push_back(origin);

        /* Advance Coordinate - last dimension fastest */
        int d = ndims - 1;
        while(d >= 0)
        {
            if(++coord[d] <= last[d]) break;
            coord[d] = first[d];
            d--;
        }
        if(d < 0) break;
    }

    return origins;
}

/*----------------------------------------------------------------------------
 * outputSize
 *----------------------------------------------------------------------------*/
uint64_t H5Assembler::outputSize (void) const
{
    uint64_t bytes = typesize;
    for(const uint64_t dim: boxdims) bytes *= dim;
    return bytes;
}

/*----------------------------------------------------------------------------
 * readSlice
 *
 *  copies input_slice of the input buffer into output_slice of the output
 *  buffer; both slices have the same extent in each dimension
 *----------------------------------------------------------------------------*/
void H5Assembler::readSlice (uint8_t* output_buffer, const uint64_t* output_dimensions, const range_t* output_slice,
                             const uint8_t* input_buffer, const uint64_t* input_dimensions, const range_t* input_slice,
                             int ndims, int typesize)
{
    if(ndims <= 0)
    {
        memcpy(output_buffer, input_buffer, typesize);
        return;
    }

    // build serialized size of each input and output dimension
    // ... for example a 4x4x4 cube of unsigned chars would be 16,4,1
    std::vector<int64_t> input_dim_step(ndims, typesize);
    std::vector<int64_t> output_dim_step(ndims, typesize);
    for(int d = ndims - 1; d > 0; d--)
    {
        input_dim_step[d - 1] = input_dimensions[d] * input_dim_step[d];
        output_dim_step[d - 1] = output_dimensions[d] * output_dim_step[d];
    }

    // initialize dimension indices
    std::vector<int64_t> input_dim_index(ndims);
    std::vector<int64_t> output_dim_index(ndims);
    for(int d = 0; d < ndims; d++)
    {
        input_dim_index[d] = input_slice[d].r0;
        output_dim_index[d] = output_slice[d].r0;
    }

    // calculate amount to read each time
    const int64_t read_slice = input_slice[ndims - 1].r1 - input_slice[ndims - 1].r0;
    const int64_t read_size = input_dim_step[ndims - 1] * read_slice;

    // read each input_slice
    while(input_dim_index[0] < input_slice[0].r1)
    {
        int64_t src_offset = 0;
        int64_t dst_offset = 0;
        for(int d = 0; d < ndims; d++)
        {
            src_offset += (input_dim_index[d] * input_dim_step[d]);
            dst_offset += (output_dim_index[d] * output_dim_step[d]);
        }

        memcpy(&output_buffer[dst_offset], &input_buffer[src_offset], read_size);

        // go to next set of input indices
        input_dim_index[ndims - 1] += read_slice;
        int i = ndims - 1;
        while(i > 0 && input_dim_index[i] == input_slice[i].r1)
        {
            input_dim_index[i] = input_slice[i].r0;
            input_dim_index[i - 1] += 1;
            i -= 1;
        }

        // update output indices
        output_dim_index[ndims - 1] += read_slice;
        int j = ndims - 1;
        while(j > 0 && output_dim_index[j] == output_slice[j].r1)
        {
            output_dim_index[j] = output_slice[j].r0;
            output_dim_index[j - 1] += 1;
            j -= 1;
        }
    }
}

/*----------------------------------------------------------------------------
 * applyStride
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Assembler::applyStride (const uint8_t* input, const std::vector<uint64_t>& input_dims,
                                               const std::vector<int64_t>& steps, int typesize, std::vector<uint64_t>* output_dims)
{
    const int ndims = static_cast<int>(input_dims.size());

    /* Output Shape */
    uint64_t num_elements = 1;
    output_dims->resize(ndims);
    for(int d = 0; d < ndims; d++)
    {
        (*output_dims)[d] = (input_dims[d] + steps[d] - 1) / steps[d];
        num_elements *= (*output_dims)[d];
    }

    std::vector<uint8_t> result(num_elements * typesize);
    if(num_elements == 0) return result;

    /* Input Strides */
    std::vector<uint64_t> input_dim_step(ndims, 1);
    for(int d = ndims - 1; d > 0; d--)
    {
        input_dim_step[d - 1] = input_dims[d] * input_dim_step[d];
    }

    /* Gather Elements */
    std::vector<uint64_t> index(ndims, 0);
    for(uint64_t e = 0; e < num_elements; e++)
    {
        uint64_t src_element = 0;
        for(int d = 0; d < ndims; d++)
        {
            src_element += index[d] * steps[d] * input_dim_step[d];
        }
        memcpy(&result[e * typesize], &input[src_element * typesize], typesize);

        for(int d = ndims - 1; d >= 0; d--)
        {
            if(++index[d] < (*output_dims)[d]) break;
            index[d] = 0;
        }
    }

    return result;
}
