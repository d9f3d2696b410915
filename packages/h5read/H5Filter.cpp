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
#include <zlib.h>

#include "H5Filter.h"
#include "H5Exception.h"

using H5Read::DataReadError;
using H5Read::UnsupportedFeatureError;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * decode
 *
 *  reverses the write-time pipeline: the filter applied last at write time
 *  is undone first; filters whose bit is set in the chunk's filter mask
 *  were skipped at write time and are skipped here
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Filter::decode (const std::vector<filter_t>& filters, uint32_t filter_mask,
                                       std::vector<uint8_t> input, uint64_t expected_size, int type_size)
{
    if(expected_size > 0xFFFFFFFFULL || input.size() > 0xFFFFFFFFULL)
    {
        throw UnsupportedFeatureError("chunk too large to filter: %lu bytes", (unsigned long)MAX(expected_size, (uint64_t)input.size()));
    }

    std::vector<uint8_t> buffer = std::move(input);

    for(int f = static_cast<int>(filters.size()) - 1; f >= 0; f--)
    {
        const filter_t& filter = filters[f];

        /* Skip Filters Not Applied to Chunk */
        if(f < 32 && (filter_mask & (1u << f)))
        {
            continue;
        }

        switch(filter.id)
        {
            case DEFLATE_FILTER:
            {
                std::vector<uint8_t> output(expected_size);
                const uint32_t bytes = inflateChunk(buffer.data(), (uint32_t)buffer.size(), output.data(), (uint32_t)expected_size);
                output.resize(bytes);
                buffer = std::move(output);
                break;
            }

            case LZF_FILTER:
            {
                std::vector<uint8_t> output(expected_size);
                const uint32_t bytes = lzfChunk(buffer.data(), (uint32_t)buffer.size(), output.data(), (uint32_t)expected_size);
                output.resize(bytes);
                buffer = std::move(output);
                break;
            }

            case SHUFFLE_FILTER:
            {
                std::vector<uint8_t> output(buffer.size());
                shuffleChunk(buffer.data(), (uint32_t)buffer.size(), output.data(), type_size);
                buffer = std::move(output);
                break;
            }

            case FLETCHER32_FILTER:
            {
                const uint32_t bytes = checksumChunk(buffer.data(), (uint32_t)buffer.size());
                buffer.resize(bytes);
                break;
            }

            default:
            {
                throw UnsupportedFeatureError("unsupported filter required to read chunk: %d (%s)", (int)filter.id, filter.name.empty() ? filter2str(filter.id) : filter.name.c_str());
            }
        }
    }

    /* Check Decoded Size */
    if(buffer.size() != expected_size)
    {
        throw DataReadError("decoded chunk size does not match expected size: %lu != %lu", (unsigned long)buffer.size(), (unsigned long)expected_size);
    }

    return buffer;
}

/*----------------------------------------------------------------------------
 * filter2str
 *----------------------------------------------------------------------------*/
const char* H5Filter::filter2str (int id)
{
    switch(id)
    {
        case DEFLATE_FILTER:        return "deflate";
        case SHUFFLE_FILTER:        return "shuffle";
        case FLETCHER32_FILTER:     return "fletcher32";
        case SZIP_FILTER:           return "szip";
        case NBIT_FILTER:           return "nbit";
        case SCALEOFFSET_FILTER:    return "scaleoffset";
        case LZF_FILTER:            return "lzf";
        default:                    return "unknown";
    }
}

/*----------------------------------------------------------------------------
 * isSupported
 *----------------------------------------------------------------------------*/
bool H5Filter::isSupported (int id)
{
    return (id == DEFLATE_FILTER) || (id == SHUFFLE_FILTER) || (id == FLETCHER32_FILTER) || (id == LZF_FILTER);
}

/*----------------------------------------------------------------------------
 * inflateChunk
 *
 *  returns number of bytes written to output
 *----------------------------------------------------------------------------*/
uint32_t H5Filter::inflateChunk (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size)
{
    int status;
    z_stream strm;

    /* Initialize z_stream State */
    strm.zalloc     = Z_NULL;
    strm.zfree      = Z_NULL;
    strm.opaque     = Z_NULL;
    strm.avail_in   = 0;
    strm.next_in    = Z_NULL;

    /* Initialize z_stream */
    status = inflateInit(&strm);
    if(status != Z_OK)
    {
        throw DataReadError("failed to initialize z_stream: %d", status);
    }

    /* Decompress Chunk */
    strm.avail_in = input_size;
    strm.next_in = const_cast<Bytef*>(input);
    strm.avail_out = output_size;
    strm.next_out = output;
    status = inflate(&strm, Z_FINISH);
    const uint32_t bytes_written = output_size - strm.avail_out;

    /* Clean Up z_stream */
    inflateEnd(&strm);

    /* Check Decompression Complete */
    if(status != Z_STREAM_END)
    {
        if(strm.avail_out == 0)
        {
            throw DataReadError("inflated chunk exceeds expected size of %u bytes", (unsigned)output_size);
        }
        throw DataReadError("failed to inflate entire z_stream: %d", status);
    }

    return bytes_written;
}

/*----------------------------------------------------------------------------
 * lzfChunk
 *
 *  each control byte either starts a literal run (ctrl < 32, run of ctrl+1
 *  bytes) or a back reference (length in the top 3 bits, extended by a byte
 *  when 7, and a 13-bit distance)
 *----------------------------------------------------------------------------*/
uint32_t H5Filter::lzfChunk (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size)
{
    uint32_t ip = 0;
    uint32_t op = 0;

    while(ip < input_size)
    {
        uint32_t ctrl = input[ip++];

        if(ctrl < (1 << 5))
        {
            /* Literal Run */
            ctrl++;
            if(op + ctrl > output_size)
            {
                throw DataReadError("lzf decompressed chunk exceeds expected size of %u bytes", (unsigned)output_size);
            }
            if(ip + ctrl > input_size)
            {
                throw DataReadError("lzf literal run exceeds input at %u", (unsigned)ip);
            }
            memcpy(&output[op], &input[ip], ctrl);
            op += ctrl;
            ip += ctrl;
        }
        else
        {
            /* Back Reference */
            uint32_t len = ctrl >> 5;
            if(ip >= input_size)
            {
                throw DataReadError("lzf back reference truncated at %u", (unsigned)ip);
            }
            if(len == 7)
            {
                len += input[ip++];
                if(ip >= input_size)
                {
                    throw DataReadError("lzf back reference truncated at %u", (unsigned)ip);
                }
            }
            const uint32_t distance = ((ctrl & 0x1f) << 8) + input[ip++] + 1;
            len += 2;

            if(op + len > output_size)
            {
                throw DataReadError("lzf decompressed chunk exceeds expected size of %u bytes", (unsigned)output_size);
            }
            if(distance > op)
            {
                throw DataReadError("lzf back reference before start of output: %u > %u", (unsigned)distance, (unsigned)op);
            }

            /* Byte Copy - regions may overlap */
            for(uint32_t i = 0; i < len; i++)
            {
                output[op] = output[op - distance];
                op++;
            }
        }
    }

    return op;
}

/*----------------------------------------------------------------------------
 * shuffleChunk
 *
 *  input holds byte planes (all first bytes, then all second bytes, ...);
 *  trailing bytes that do not form a full element are copied as is
 *----------------------------------------------------------------------------*/
void H5Filter::shuffleChunk (const uint8_t* input, uint32_t input_size, uint8_t* output, int type_size)
{
    if(H5READ_ERROR_CHECKING)
    {
        if(type_size <= 0)
        {
            throw DataReadError("invalid data size to perform shuffle on: %d", type_size);
        }
    }

    int64_t dst_index = 0;
    const int64_t num_elements = input_size / type_size;
    for(int64_t element_index = 0; element_index < num_elements; element_index++)
    {
        for(int64_t val_index = 0; val_index < type_size; val_index++)
        {
            const int64_t src_index = (val_index * num_elements) + element_index;
            output[dst_index++] = input[src_index];
        }
    }

    /* Leftover Bytes */
    const int64_t leftover = input_size - (num_elements * type_size);
    if(leftover > 0)
    {
        memcpy(&output[dst_index], &input[dst_index], leftover);
    }
}

/*----------------------------------------------------------------------------
 * checksumChunk
 *
 *  verifies and strips the trailing fletcher32 checksum; returns the size
 *  of the data without the checksum
 *----------------------------------------------------------------------------*/
uint32_t H5Filter::checksumChunk (const uint8_t* input, uint32_t input_size)
{
    if(input_size < 4)
    {
        throw DataReadError("chunk too small to contain a checksum: %u", (unsigned)input_size);
    }

    const uint32_t data_size = input_size - 4;
    const uint32_t stored = (uint32_t)input[data_size] |
                            ((uint32_t)input[data_size + 1] << 8) |
                            ((uint32_t)input[data_size + 2] << 16) |
                            ((uint32_t)input[data_size + 3] << 24);

    /* Older writers stored the checksum with bytes swapped in each half */
    const uint32_t computed = fletcher32(input, data_size);
    const uint32_t reversed = ((computed & 0x00FF00FF) << 8) | ((computed & 0xFF00FF00) >> 8);

    if(stored != computed && stored != reversed)
    {
        throw DataReadError("fletcher32 checksum mismatch: 0x%08X != 0x%08X", (unsigned)stored, (unsigned)computed);
    }

    return data_size;
}

/*----------------------------------------------------------------------------
 * fletcher32
 *----------------------------------------------------------------------------*/
uint32_t H5Filter::fletcher32 (const uint8_t* data, size_t len)
{
    uint32_t sum1 = 0xffff;
    uint32_t sum2 = 0xffff;
    size_t words = len / 2;

    while(words > 0)
    {
        size_t tlen = words > 360 ? 360 : words;
        words -= tlen;
        do
        {
            sum1 += (((uint32_t)data[0]) << 8) | ((uint32_t)data[1]);
            data += 2;
            sum2 += sum1;
        } while(--tlen);
        sum1 = (sum1 & 0xffff) + (sum1 >> 16);
        sum2 = (sum2 & 0xffff) + (sum2 >> 16);
    }

    /* Odd Trailing Byte */
    if(len % 2)
    {
        sum1 += ((uint32_t)data[0]) << 8;
        sum2 += sum1;
        sum1 = (sum1 & 0xffff) + (sum1 >> 16);
        sum2 = (sum2 & 0xffff) + (sum2 >> 16);
    }

    /* Second Reduction Step */
    sum1 = (sum1 & 0xffff) + (sum1 >> 16);
    sum2 = (sum2 & 0xffff) + (sum2 >> 16);

    return (sum2 << 16) | sum1;
}
