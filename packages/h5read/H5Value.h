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

#ifndef __h5_value__
#define __h5_value__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>

#include "H5Read.h"

/******************************************************************************
 * HDF5 VALUE CLASS
 ******************************************************************************/

/*
 * Dynamically typed element decoded from a dataset or attribute. Compound
 * elements are RECORDs whose fields keep the member order of the datatype;
 * arrays and variable length sequences are LISTs; enums decode to the integer
 * code of the member.
 */
class H5Value
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            NIL         = 0,
            INTEGER     = 1,
            UNSIGNED    = 2,
            REAL        = 3,
            TEXT        = 4,
            BYTES       = 5,
            LIST        = 6,
            RECORD      = 7
        } kind_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                H5Value         (void);

        static H5Value          makeInteger     (int64_t value);
        static H5Value          makeUnsigned    (uint64_t value);
        static H5Value          makeReal        (double value);
        static H5Value          makeText        (const std::string& value);
        static H5Value          makeBytes       (const uint8_t* data, size_t size);
        static H5Value          makeList        (void);
        static H5Value          makeRecord      (void);
        static const char*      kind2str        (kind_t kind);

        void                    append          (const H5Value& item);
        void                    addField        (const std::string& field_name, const H5Value& item);

        kind_t                  kind            (void) const;
        bool                    isNil           (void) const;
        bool                    isNumeric       (void) const;
        int64_t                 asInt           (void) const;
        uint64_t                asUInt          (void) const;
        double                  asDouble        (void) const;
        bool                    asBool          (void) const;
        const std::string&      asString        (void) const;
        const std::vector<uint8_t>& asBytes     (void) const;
        H5Read::gmt_time_t      asTime          (H5Read::time_unit_t unit=H5Read::UNIT_AUTO) const;

        size_t                  size            (void) const;
        const H5Value&          operator[]      (size_t index) const;
        const H5Value&          field           (const std::string& field_name) const;
        bool                    hasField        (const std::string& field_name) const;
        const std::vector<std::string>& fieldNames (void) const;
        const std::vector<H5Value>& items       (void) const;

        bool                    operator==      (const H5Value& other) const;
        bool                    operator!=      (const H5Value& other) const;
        std::string             toString        (void) const;

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        kind_t                  valueKind;
        union {
            int64_t             lval;
            uint64_t            uval;
            double              dval;
        } scalar;
        std::string             text;
        std::vector<uint8_t>    bytes;
        std::vector<std::string> names;     // RECORD field names, parallel to elements
        std::vector<H5Value>    elements;   // LIST items or RECORD field values
};

#endif  /* __h5_value__ */
