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

#ifndef __h5_cursor__
#define __h5_cursor__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <string>
#include <vector>

#include "OsApi.h"
#include "H5Read.h"

/******************************************************************************
 * HDF5 BYTE CURSOR CLASS
 ******************************************************************************/

class H5Cursor
{
    public:

        /*--------------------------------------------------------------------
         * IODriver Subclass
         *--------------------------------------------------------------------*/

        class IODriver
        {
            public:
                virtual             ~IODriver   (void) = default;
                virtual void        ioRead      (uint8_t* data, int64_t size, uint64_t pos) = 0;
                virtual uint64_t    ioSize      (void) const = 0;
                virtual const char* ioName      (void) const = 0;
        };

        /*--------------------------------------------------------------------
         * FileIODriver Subclass
         *--------------------------------------------------------------------*/

        class FileIODriver: public IODriver
        {
            public:
                explicit            FileIODriver    (const char* filename);
                                    ~FileIODriver   (void) override;
                void                ioRead          (uint8_t* data, int64_t size, uint64_t pos) override;
                uint64_t            ioSize          (void) const override;
                const char*         ioName          (void) const override;

            private:
                std::string         name;
                fileptr_t           ioFile;
                uint64_t            fileSize;
        };

        /*--------------------------------------------------------------------
         * MemoryIODriver Subclass
         *--------------------------------------------------------------------*/

        class MemoryIODriver: public IODriver
        {
            public:
                explicit            MemoryIODriver  (std::vector<uint8_t> _buffer, const char* _name="memory");
                void                ioRead          (uint8_t* data, int64_t size, uint64_t pos) override;
                uint64_t            ioSize          (void) const override;
                const char*         ioName          (void) const override;

            private:
                std::vector<uint8_t> buffer;
                std::string         name;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            H5Cursor        (IODriver* _driver); // takes ownership
                            ~H5Cursor       (void);

                            H5Cursor        (const H5Cursor&) = delete;
        H5Cursor&           operator=       (const H5Cursor&) = delete;

        void                checkRange      (uint64_t pos, uint64_t size) const;
        void                readByteArray   (uint8_t* data, int64_t size, uint64_t* pos);
        uint64_t            readField       (int64_t size, uint64_t* pos);
        uint64_t            readField       (int64_t size);
        std::string         readString      (uint64_t* pos, int64_t maxlen);
        uint64_t            readOffset      (uint64_t* pos);
        uint64_t            readLength      (uint64_t* pos);

        void                seek            (uint64_t pos);
        uint64_t            tell            (void) const;

        void                setBaseAddress  (uint64_t address);
        uint64_t            getBaseAddress  (void) const;
        void                setSizes        (int _offsetsize, int _lengthsize);
        int                 offsetSize      (void) const;
        int                 lengthSize      (void) const;
        bool                isUndefined     (uint64_t address) const;

        uint64_t            size            (void) const;
        const char*         getName         (void) const;
        void                close           (void);
        bool                isOpen          (void) const;

    private:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int64_t MAX_STRING_SIZE = 0x10000;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        IODriver*           driver;
        std::string         name;
        uint64_t            position;
        uint64_t            baseAddress;
        int                 offsetsize;
        int                 lengthsize;
};

#endif  /* __h5_cursor__ */
