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

#ifndef __h5_link_resolver__
#define __h5_link_resolver__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Header.h"

/******************************************************************************
 * HDF5 LINK RESOLVER CLASS
 ******************************************************************************/

class H5LinkResolver
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            UNVISITED           = 0,
            VISITING            = 1,
            RESOLVED            = 2,
            BROKEN              = 3,
            CIRCULAR            = 4
        } state_t;

        typedef struct {
            state_t                     state;
            uint64_t                    address;
            std::string                 path;       // canonical path after following soft links
            std::shared_ptr<H5Header>   header;
        } resolution_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                    H5LinkResolver  (std::shared_ptr<H5Cursor> _cursor, uint64_t _root);

        resolution_t                resolve         (const std::string& path, H5Read::object_type_t expected);
        bool                        lookupLink      (const std::string& path, H5Read::link_info_t* link);

        static std::vector<std::string> splitPath   (const std::string& path);
        static std::string          joinPath        (const std::vector<std::string>& segments);
        static std::vector<std::string> normalize   (const std::string& target, const std::vector<std::string>& group);
        static const char*          state2str       (state_t state);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void                 notFound        (const std::string& path, H5Read::object_type_t expected, const std::string& reason);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::shared_ptr<H5Cursor>   cursor;
        uint64_t                    root;
};

#endif  /* __h5_link_resolver__ */
