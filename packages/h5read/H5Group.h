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

#ifndef __h5_group__
#define __h5_group__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Header.h"
#include "H5Attribute.h"

/******************************************************************************
 * HDF5 GROUP CLASS
 ******************************************************************************/

class H5Group
{
    public:

                                    H5Group         (std::shared_ptr<H5Cursor> _cursor, std::shared_ptr<H5Header> _header, const std::string& _path);

        const std::string&          getPath         (void) const;
        uint64_t                    getAddress      (void) const;
        std::vector<std::string>    children        (void) const;
        const std::vector<H5Read::link_info_t>& links (void) const;
        bool                        hasDenseLinks   (void) const;

        std::vector<H5Attribute>    findAttributes  (void) const;
        const H5Attribute&          attribute       (const std::string& name) const;
        std::vector<std::string>    listAttributes  (void) const;
        std::string                 inspect         (void) const;

    private:

        std::shared_ptr<H5Cursor>   cursor;
        std::shared_ptr<H5Header>   header;
        std::string                 path;
};

#endif  /* __h5_group__ */
