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

#ifndef __h5_datatype__
#define __h5_datatype__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <memory>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Cursor.h"
#include "H5Value.h"

/******************************************************************************
 * HDF5 DATATYPE CLASS
 ******************************************************************************/

class H5Datatype
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            FIXED_POINT_TYPE        = 0,
            FLOATING_POINT_TYPE     = 1,
            TIME_TYPE               = 2,
            STRING_TYPE             = 3,
            BIT_FIELD_TYPE          = 4,
            OPAQUE_TYPE             = 5,
            COMPOUND_TYPE           = 6,
            REFERENCE_TYPE          = 7,
            ENUMERATED_TYPE         = 8,
            VARIABLE_LENGTH_TYPE    = 9,
            ARRAY_TYPE              = 10,
            UNKNOWN_TYPE            = 11
        } type_class_t;

        typedef enum {
            NULL_TERMINATED         = 0,
            NULL_PADDED             = 1,
            SPACE_PADDED            = 2
        } string_pad_t;

        typedef enum {
            CHARSET_ASCII           = 0,
            CHARSET_UTF8            = 1
        } charset_t;

        typedef enum {
            VLEN_SEQUENCE           = 0,
            VLEN_STRING             = 1
        } vlen_type_t;

        typedef enum {
            OBJECT_REFERENCE        = 0,
            REGION_REFERENCE        = 1
        } reference_type_t;

        struct member_t {
            std::string                 name;
            uint32_t                    offset;     // byte offset within compound
            std::shared_ptr<H5Datatype> type;
        };

        struct enum_member_t {
            std::string                 name;
            int64_t                     value;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                            H5Datatype      (void);

        static std::shared_ptr<H5Datatype>  decode          (H5Cursor* cursor, uint64_t* pos, int depth=0);
        static const char*                  type2str        (type_class_t type_class);

        H5Value                             decodeValue     (const uint8_t* data, H5Cursor* cursor) const;
        std::string                         describe        (void) const;
        uint64_t                            arrayElements   (void) const;
        bool                                isVariableString(void) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        type_class_t                        typeClass;
        int                                 version;
        uint32_t                            size;
        bool                                signedval;
        bool                                bigendian;
        string_pad_t                        pad;
        charset_t                           charset;
        vlen_type_t                         vlentype;
        reference_type_t                    reftype;
        std::string                         tag;            // opaque

        /* bit layout (fixed point, floating point, bitfield, time) */
        uint16_t                            bitOffset;
        uint16_t                            bitPrecision;
        uint8_t                             signLocation;
        uint8_t                             expLocation;
        uint8_t                             expSize;
        uint8_t                             mantLocation;
        uint8_t                             mantSize;
        uint32_t                            expBias;

        std::vector<member_t>               members;        // compound
        std::vector<enum_member_t>          enumMembers;    // enum
        std::vector<uint32_t>               dims;           // array
        std::shared_ptr<H5Datatype>         base;           // enum, array, variable length

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                                readCompound    (H5Cursor* cursor, uint64_t* pos, uint32_t databits, int depth);
        void                                readEnum        (H5Cursor* cursor, uint64_t* pos, uint32_t databits, int depth);
        void                                readArray       (H5Cursor* cursor, uint64_t* pos, int depth);
        uint64_t                            readRaw         (const uint8_t* data) const;
        double                              readFloat       (const uint8_t* data) const;
        static std::string                  readPaddedName  (H5Cursor* cursor, uint64_t* pos);
        static int                          highestBit      (uint64_t value);
};

#endif  /* __h5_datatype__ */
