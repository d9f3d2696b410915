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

#ifndef __h5_header__
#define __h5_header__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Datatype.h"
#include "H5Filter.h"
#include "H5Attribute.h"

/******************************************************************************
 * HDF5 OBJECT HEADER CLASS
 ******************************************************************************/

class H5Header
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int MAX_COMMITTED_DEPTH = 4;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            DATASPACE_MSG           = 0x1,
            LINK_INFO_MSG           = 0x2,
            DATATYPE_MSG            = 0x3,
            FILL_VALUE_OLD_MSG      = 0x4,
            FILL_VALUE_MSG          = 0x5,
            LINK_MSG                = 0x6,
            DATA_LAYOUT_MSG         = 0x8,
            FILTER_MSG              = 0xB,
            ATTRIBUTE_MSG           = 0xC,
            HEADER_CONT_MSG         = 0x10,
            SYMBOL_TABLE_MSG        = 0x11,
            ATTRIBUTE_INFO_MSG      = 0x15
        } msg_type_t;

        typedef struct {
            uint16_t                type;
            uint8_t                 flags;
            uint64_t                size;
            uint64_t                pos;        // start of message body
        } message_t;

        typedef struct {
            H5Read::layout_t        layout;
            int                     version;
            uint64_t                address;    // contiguous data or chunk b-tree root
            uint64_t                size;       // contiguous size in bytes
            std::vector<uint64_t>   chunkdims;
            uint32_t                elementsize;
            std::vector<uint8_t>    compact;    // compact data stored in the header
        } layout_info_t;

        typedef struct {
            bool                    defined;
            std::vector<uint8_t>    value;
        } fill_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                    H5Header        (std::shared_ptr<H5Cursor> _cursor, uint64_t _address, int _depth=0);

        H5Read::object_type_t       objectType      (void) const;
        bool                        findLink        (const std::string& name, H5Read::link_info_t* link) const;
        const H5Attribute*          findAttribute   (const std::string& name) const;
        static const char*          msg2str         (int msg_type);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        uint64_t                    address;
        int                         version;
        std::vector<message_t>      messages;

        std::shared_ptr<H5Datatype> datatype;
        bool                        hasDataspace;
        H5Read::dataspace_t         dataspace;
        bool                        hasLayout;
        layout_info_t               layout;
        std::vector<H5Filter::filter_t> filters;
        fill_t                      fill;

        std::vector<H5Read::link_info_t> links;
        std::vector<H5Attribute>    attributes;

        bool                        hasSymbolTable;
        bool                        hasLinkInfo;
        bool                        denseLinks;         // links held in a fractal heap
        bool                        denseAttributes;    // attributes held in a fractal heap

    private:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint8_t CUSTOM_V1_FLAG             = 0x80; // not part of the format, marks version 1 continuation blocks
        static const uint8_t SIZE_OF_CHUNK_0_MASK       = 0x03;
        static const uint8_t ATTR_CREATION_TRACK_BIT    = 0x04;
        static const uint8_t STORE_CHANGE_PHASE_BIT     = 0x10;
        static const uint8_t FILE_STATS_BIT             = 0x20;
        static const uint8_t SHARED_MSG_FLAG            = 0x02;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        int                         readObjHdr          (uint64_t pos);
        int                         readObjHdrV1        (uint64_t pos);
        int                         readMessages        (uint64_t pos, uint64_t end, uint8_t hdr_flags);
        int                         readMessagesV1      (uint64_t pos, uint64_t end, uint8_t hdr_flags);
        int                         readMessage         (msg_type_t msg_type, uint64_t size, uint64_t pos, uint8_t hdr_flags, uint8_t msg_flags);

        int                         readDataspaceMsg    (uint64_t pos, H5Read::dataspace_t* space);
        int                         readLinkInfoMsg     (uint64_t pos);
        int                         readDatatypeMsg     (uint64_t pos, bool shared, std::shared_ptr<H5Datatype>* type);
        int                         readFillValueMsg    (uint64_t pos, msg_type_t msg_type, uint64_t size);
        int                         readLinkMsg         (uint64_t pos, uint64_t size);
        int                         readDataLayoutMsg   (uint64_t pos, uint64_t size);
        int                         readFilterMsg       (uint64_t pos);
        int                         readAttributeMsg    (uint64_t pos, uint64_t size);
        int                         readAttributeInfoMsg(uint64_t pos);
        int                         readHeaderContMsg   (uint64_t pos, uint8_t hdr_flags);
        int                         readSymbolTableMsg  (uint64_t pos);
        int                         readSymbolTable     (uint64_t pos, uint64_t heap_data_addr);
        int                         readSharedMsg       (uint64_t pos, uint64_t* object_addr);

        static void                 checkLength         (uint64_t length, uint64_t pos, uint64_t end, const char* field);

        void                        addLink             (const H5Read::link_info_t& link);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::shared_ptr<H5Cursor>   cursorRef;
        H5Cursor*                   cursor;
        int                         depth;          // committed datatype nesting
        std::set<uint64_t>          continuations;  // continuation blocks already read
};

#endif  /* __h5_header__ */
