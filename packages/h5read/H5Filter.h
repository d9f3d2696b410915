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

#ifndef __h5_filter__
#define __h5_filter__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>

#include "H5Read.h"

/******************************************************************************
 * HDF5 FILTER PIPELINE CLASS
 ******************************************************************************/

class H5Filter
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            INVALID_FILTER      = 0,
            DEFLATE_FILTER      = 1,
            SHUFFLE_FILTER      = 2,
            FLETCHER32_FILTER   = 3,
            SZIP_FILTER         = 4,
            NBIT_FILTER         = 5,
            SCALEOFFSET_FILTER  = 6,
            LZF_FILTER          = 32000
        } filter_id_t;

        typedef struct {
            uint16_t                id;
            uint16_t                flags;      // bit 0: optional
            std::string             name;
            std::vector<uint32_t>   parms;
        } filter_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static std::vector<uint8_t> decode          (const std::vector<filter_t>& filters, uint32_t filter_mask,
                                                     std::vector<uint8_t> input, uint64_t expected_size, int type_size);
        static const char*          filter2str      (int id);
        static bool                 isSupported     (int id);

        static uint32_t             inflateChunk    (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size);
        static uint32_t             lzfChunk        (const uint8_t* input, uint32_t input_size, uint8_t* output, uint32_t output_size);
        static void                 shuffleChunk    (const uint8_t* input, uint32_t input_size, uint8_t* output, int type_size);
        static uint32_t             checksumChunk   (const uint8_t* input, uint32_t input_size);
        static uint32_t             fletcher32      (const uint8_t* data, size_t len);
};

#endif  /* __h5_filter__ */
