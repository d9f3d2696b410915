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

#ifndef __h5_dataset__
#define __h5_dataset__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Header.h"
#include "H5Datatype.h"
#include "H5Filter.h"
#include "H5Attribute.h"
#include "H5Value.h"

/******************************************************************************
 * HDF5 DATASET CLASS
 ******************************************************************************/

class H5Dataset
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                    H5Dataset       (std::shared_ptr<H5Cursor> _cursor, std::shared_ptr<H5Header> _header, const std::string& _path);

        const std::string&          getPath         (void) const;
        uint64_t                    getAddress      (void) const;
        const std::vector<uint64_t>& shape          (void) const;
        uint64_t                    elements        (void) const;
        bool                        isScalar        (void) const;
        const H5Datatype&           datatype        (void) const;
        H5Read::layout_t            layout          (void) const;
        const std::vector<uint64_t>& chunkShape     (void) const;
        const std::vector<H5Filter::filter_t>& filters (void) const;

        std::vector<uint8_t>        readRaw         (void);
        std::vector<H5Value>        readData        (void);
        std::vector<H5Value>        readSlice       (const std::vector<H5Read::range_t>& slices, std::vector<uint64_t>* dims=NULL);
        std::vector<bool>           readAsBool      (void);
        std::vector<H5Read::gmt_time_t> readAsTime  (H5Read::time_unit_t unit=H5Read::UNIT_AUTO);

        std::vector<H5Attribute>    findAttributes  (void) const;
        const H5Attribute&          attribute       (const std::string& name) const;
        std::vector<std::string>    listAttributes  (void) const;
        std::string                 inspect         (void) const;

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        std::vector<uint8_t>        readBox         (const std::vector<H5Read::range_t>& box, bool full);
        void                        readChunked     (const std::vector<H5Read::range_t>& box, bool full, uint8_t* buffer);
        std::vector<uint8_t>        readChunk       (uint64_t address, uint32_t size, uint32_t filter_mask);
        std::vector<H5Value>        decodeElements  (const std::vector<uint8_t>& buffer) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::shared_ptr<H5Cursor>   cursor;
        std::shared_ptr<H5Header>   header;
        std::string                 path;
        int                         typesize;
        uint64_t                    chunkBytes;
};

#endif  /* __h5_dataset__ */
