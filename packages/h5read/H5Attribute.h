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

#ifndef __h5_attribute__
#define __h5_attribute__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Datatype.h"
#include "H5Value.h"

/******************************************************************************
 * HDF5 ATTRIBUTE CLASS
 ******************************************************************************/

class H5Attribute
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                    H5Attribute     (void);

        bool                        isScalar        (void) const;
        bool                        isArray         (void) const;
        uint64_t                    elements        (void) const;
        const std::vector<uint64_t>& shape          (void) const;
        H5Value                     value           (void) const;
        std::string                 describe        (void) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::string                 name;
        std::shared_ptr<H5Datatype> datatype;
        H5Read::dataspace_t         dataspace;
        std::vector<uint8_t>        data;       // raw element bytes
        std::shared_ptr<H5Cursor>   cursor;     // for values held in the global heap
};

#endif  /* __h5_attribute__ */
