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

#ifndef __h5_file__
#define __h5_file__

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
#include "H5Dataset.h"
#include "H5Group.h"
#include "H5Value.h"

/******************************************************************************
 * HDF5 FILE CLASS
 ******************************************************************************/

class H5File
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit                    H5File          (const char* filename);
                                    H5File          (std::vector<uint8_t> buffer, const char* name="memory");
                                    ~H5File         (void);
                                    H5File          (const H5File&) = delete;
        H5File&                     operator=       (const H5File&) = delete;

        H5Dataset                   dataset         (const std::string& path);
        H5Group                     group           (const std::string& path);
        H5Group                     root            (void);
        std::vector<H5Value>        readData        (const std::string& path);
        std::vector<bool>           readAsBool      (const std::string& path);
        std::vector<H5Read::gmt_time_t> readAsTime  (const std::string& path, H5Read::time_unit_t unit=H5Read::UNIT_AUTO);

        H5Read::object_type_t       getObjectType   (const std::string& path);
        bool                        isSoftLink      (const std::string& path);
        bool                        isHardLink      (const std::string& path);
        bool                        isExternalLink  (const std::string& path);
        bool                        getLinkInfo     (const std::string& path, H5Read::link_info_t* info);

        std::vector<std::string>    listRecursive   (const std::string& path=PATH_DELIMETER_STR);
        std::string                 structure       (void);
        std::string                 dereference     (uint64_t address);

        void                        close           (void);
        bool                        isOpen          (void) const;
        const char*                 getName         (void) const;
        int                         superblockVersion (void) const;
        uint64_t                    rootAddress     (void) const;

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            std::string             path;
            H5Read::link_info_t     link;
        } entry_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                        readSuperblock  (void);
        void                        walk            (const std::string& group_path, const H5Header& group_header, std::set<uint64_t>& visited,
                                                     int level, std::vector<entry_t>* entries, std::string* desc);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::shared_ptr<H5Cursor>   cursor;
        std::string                 name;
        int                         sbVersion;
        uint64_t                    rootAddr;
};

#endif  /* __h5_file__ */
