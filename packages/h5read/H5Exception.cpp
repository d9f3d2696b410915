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

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "H5Exception.h"

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * FormatError
 *----------------------------------------------------------------------------*/
H5Read::FormatError::FormatError (const char* _errmsg, ...):
    RunTimeException(CRITICAL, RTE_FORMAT)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * DatasetNotFoundError
 *----------------------------------------------------------------------------*/
H5Read::DatasetNotFoundError::DatasetNotFoundError (const char* _errmsg, ...):
    RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * GroupNotFoundError
 *----------------------------------------------------------------------------*/
H5Read::GroupNotFoundError::GroupNotFoundError (const char* _errmsg, ...):
    RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * UnsupportedFeatureError
 *----------------------------------------------------------------------------*/
H5Read::UnsupportedFeatureError::UnsupportedFeatureError (const char* _errmsg, ...):
    RunTimeException(CRITICAL, RTE_UNSUPPORTED)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * CircularLinkError
 *----------------------------------------------------------------------------*/
H5Read::CircularLinkError::CircularLinkError (const char* _errmsg, ...):
    RunTimeException(ERROR, RTE_CIRCULAR_LINK)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}

/*----------------------------------------------------------------------------
 * DataReadError
 *----------------------------------------------------------------------------*/
H5Read::DataReadError::DataReadError (const char* _errmsg, ...):
    RunTimeException(CRITICAL, RTE_DATA_READ)
{
    va_list args;
    va_start(args, _errmsg);
    setMessage(_errmsg, args);
    va_end(args);
}
