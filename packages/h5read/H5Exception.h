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

#ifndef __h5_exception__
#define __h5_exception__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "RunTimeException.h"

/******************************************************************************
 * H5READ EXCEPTIONS
 ******************************************************************************/

namespace H5Read
{
    /* bad or missing signature, corrupt header */
    class FormatError: public RunTimeException
    {
        public:
            explicit FormatError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };

    /* path does not resolve to a dataset */
    class DatasetNotFoundError: public RunTimeException
    {
        public:
            explicit DatasetNotFoundError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };

    /* path does not resolve to a group */
    class GroupNotFoundError: public RunTimeException
    {
        public:
            explicit GroupNotFoundError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };

    /* valid format variant that this reader does not implement */
    class UnsupportedFeatureError: public RunTimeException
    {
        public:
            explicit UnsupportedFeatureError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };

    /* soft link cycle */
    class CircularLinkError: public RunTimeException
    {
        public:
            explicit CircularLinkError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };

    /* size mismatch, truncated data, malformed message body */
    class DataReadError: public RunTimeException
    {
        public:
            explicit DataReadError (const char* _errmsg, ...) VARG_CHECK(printf, 2, 3);
    };
}

#endif  /* __h5_exception__ */
