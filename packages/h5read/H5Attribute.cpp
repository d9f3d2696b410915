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

#include "H5Attribute.h"
#include "H5Exception.h"

using H5Read::DataReadError;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Attribute::H5Attribute (void)
{
    dataspace.scalar = true;
    dataspace.null = false;
}

/*----------------------------------------------------------------------------
 * isScalar
 *
 *  a single element is scalar whether or not it carries dimensions
 *----------------------------------------------------------------------------*/
bool H5Attribute::isScalar (void) const
{
    return !dataspace.null && (elements() == 1);
}

/*----------------------------------------------------------------------------
 * isArray
 *----------------------------------------------------------------------------*/
bool H5Attribute::isArray (void) const
{
    return !dataspace.null && (elements() != 1);
}

/*----------------------------------------------------------------------------
 * elements
 *----------------------------------------------------------------------------*/
uint64_t H5Attribute::elements (void) const
{
    return H5Read::elements(dataspace);
}

/*----------------------------------------------------------------------------
 * shape
 *----------------------------------------------------------------------------*/
const std::vector<uint64_t>& H5Attribute::shape (void) const
{
    return dataspace.dims;
}

/*----------------------------------------------------------------------------
 * value
 *
 *  scalar attributes decode to a single value, array attributes to a flat
 *  row-major list, null attributes to NIL
 *----------------------------------------------------------------------------*/
H5Value H5Attribute::value (void) const
{
    if(dataspace.null)
    {
        return H5Value();
    }

    const uint64_t num_elements = elements();
    if(data.size() < num_elements * datatype->size)
    {
        throw DataReadError("attribute %s holds %lu bytes, expected %lu", name.c_str(), (unsigned long)data.size(), (unsigned long)(num_elements * datatype->size));
    }

    if(isScalar())
    {
        return datatype->decodeValue(data.data(), cursor.get());
    }

    H5Value list = H5Value::makeList();
    for(uint64_t i = 0; i < num_elements; i++)
    {
        list.append(datatype->decodeValue(&data[i * datatype->size], cursor.get()));
    }
    return list;
}

/*----------------------------------------------------------------------------
 * describe
 *----------------------------------------------------------------------------*/
std::string H5Attribute::describe (void) const
{
    std::string kind = isScalar() ? "scalar" : (isArray() ? "array" + H5Read::dims2str(dataspace.dims) : "null");
    return name + ": " + datatype->describe() + " " + kind;
}
