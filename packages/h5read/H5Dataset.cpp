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

#include <cstring>

#include "H5Dataset.h"
#include "H5Exception.h"
#include "H5BTreeV1.h"
#include "H5Assembler.h"

using H5Read::range_t;
using H5Read::FormatError;
using H5Read::DataReadError;
using H5Read::UnsupportedFeatureError;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Dataset::H5Dataset (std::shared_ptr<H5Cursor> _cursor, std::shared_ptr<H5Header> _header, const std::string& _path):
    cursor(std::move(_cursor)),
    header(std::move(_header)),
    path(_path),
    typesize(0),
    chunkBytes(0)
{
    /* Required Messages */
    if(!header->datatype)
    {
        throw DataReadError("dataset %s is missing its datatype message", path.c_str());
    }
    if(!header->hasDataspace)
    {
        throw DataReadError("dataset %s is missing its dataspace message", path.c_str());
    }
    if(!header->hasLayout)
    {
        throw DataReadError("dataset %s is missing its data layout message", path.c_str());
    }

    typesize = static_cast<int>(header->datatype->size);
    if(typesize <= 0)
    {
        throw FormatError("dataset %s has an invalid element size: %d", path.c_str(), typesize);
    }

    /* Layout Specific Checks */
    if(header->layout.layout == H5Read::CHUNKED_LAYOUT)
    {
        if(header->layout.chunkdims.size() != header->dataspace.dims.size())
        {
            throw FormatError("number of chunk dimensions does not match data dimensions for %s: %d != %d", path.c_str(), (int)header->layout.chunkdims.size(), (int)header->dataspace.dims.size());
        }

        if(header->layout.elementsize != header->datatype->size)
        {
            throw FormatError("chunk element size does not match data element size for %s: %u != %u", path.c_str(), header->layout.elementsize, header->datatype->size);
        }

        chunkBytes = typesize;
        for(const uint64_t dim: header->layout.chunkdims)
        {
            if(dim == 0)
            {
                throw FormatError("dataset %s has a zero chunk dimension", path.c_str());
            }
            if(!H5Read::multiply(chunkBytes, dim, &chunkBytes) || (chunkBytes > H5READ_MAXIMUM_READ_SIZE))
            {
                throw DataReadError("chunk size of %s exceeds maximum read size", path.c_str());
            }
        }
    }
    else if(!header->filters.empty())
    {
        throw FormatError("filters unsupported on non-chunked layouts: %s is %s", path.c_str(), H5Read::layout2str(header->layout.layout));
    }

    uint64_t data_size = 0;
    if(!H5Read::multiply(elements(), typesize, &data_size))
    {
        throw DataReadError("size of dataset %s overflows: %s elements of %d bytes", path.c_str(), H5Read::dims2str(shape()).c_str(), typesize);
    }

    if(header->fill.defined && (header->fill.value.size() != (size_t)typesize))
    {
        throw FormatError("fill value size does not match element size for %s: %lu != %d", path.c_str(), (unsigned long)header->fill.value.size(), typesize);
    }
}

/*----------------------------------------------------------------------------
 * getPath
 *----------------------------------------------------------------------------*/
const std::string& H5Dataset::getPath (void) const
{
    return path;
}

/*----------------------------------------------------------------------------
 * getAddress
 *----------------------------------------------------------------------------*/
uint64_t H5Dataset::getAddress (void) const
{
    return header->address;
}

/*----------------------------------------------------------------------------
 * shape
 *----------------------------------------------------------------------------*/
const std::vector<uint64_t>& H5Dataset::shape (void) const
{
    return header->dataspace.dims;
}

/*----------------------------------------------------------------------------
 * elements
 *----------------------------------------------------------------------------*/
uint64_t H5Dataset::elements (void) const
{
    return H5Read::elements(header->dataspace);
}

/*----------------------------------------------------------------------------
 * isScalar
 *----------------------------------------------------------------------------*/
bool H5Dataset::isScalar (void) const
{
    return !header->dataspace.null && header->dataspace.dims.empty();
}

/*----------------------------------------------------------------------------
 * datatype
 *----------------------------------------------------------------------------*/
const H5Datatype& H5Dataset::datatype (void) const
{
    return *header->datatype;
}

/*----------------------------------------------------------------------------
 * layout
 *----------------------------------------------------------------------------*/
H5Read::layout_t H5Dataset::layout (void) const
{
    return header->layout.layout;
}

/*----------------------------------------------------------------------------
 * chunkShape
 *----------------------------------------------------------------------------*/
const std::vector<uint64_t>& H5Dataset::chunkShape (void) const
{
    return header->layout.chunkdims;
}

/*----------------------------------------------------------------------------
 * filters
 *----------------------------------------------------------------------------*/
const std::vector<H5Filter::filter_t>& H5Dataset::filters (void) const
{
    return header->filters;
}

/*----------------------------------------------------------------------------
 * readRaw
 *
 *  returns the full dataset as packed elements in row-major order
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Dataset::readRaw (void)
{
    std::vector<range_t> box;
    for(const uint64_t dim: shape())
    {
        const range_t range = {0, (int64_t)dim, 1};
        box.push_back(range);
    }

    return readBox(box, true);
}

/*----------------------------------------------------------------------------
 * readData
 *----------------------------------------------------------------------------*/
std::vector<H5Value> H5Dataset::readData (void)
{
    return decodeElements(readRaw());
}

/*----------------------------------------------------------------------------
 * readSlice
 *
 *  one range per dimension; EOR as the end of a range selects the rest of
 *  the dimension, steps greater than one select every n-th element
 *----------------------------------------------------------------------------*/
std::vector<H5Value> H5Dataset::readSlice (const std::vector<range_t>& slices, std::vector<uint64_t>* dims)
{
    const std::vector<uint64_t>& dataset_shape = shape();
    const int ndims = static_cast<int>(dataset_shape.size());

    if(static_cast<int>(slices.size()) != ndims)
    {
        throw DataReadError("slice of %s has %d dimensions, dataset has %d", path.c_str(), (int)slices.size(), ndims);
    }

    /* Resolve and Check Ranges */
    std::vector<range_t> box(ndims);
    std::vector<int64_t> steps(ndims);
    std::vector<uint64_t> boxdims(ndims);
    bool full = true;
    bool strided = false;
    for(int d = 0; d < ndims; d++)
    {
        const int64_t r0 = slices[d].r0;
        const int64_t r1 = (slices[d].r1 == H5Read::EOR) ? (int64_t)dataset_shape[d] : slices[d].r1;
        if((r0 < 0) || (r1 < r0) || ((uint64_t)r1 > dataset_shape[d]) || (slices[d].step < 1))
        {
            throw DataReadError("invalid slice of %s at dimension %d [%lu]: [%ld, %ld) step %ld", path.c_str(), d,
                                (unsigned long)dataset_shape[d], (long)slices[d].r0, (long)slices[d].r1, (long)slices[d].step);
        }

        box[d].r0 = r0;
        box[d].r1 = r1;
        box[d].step = 1;
        steps[d] = slices[d].step;
        boxdims[d] = r1 - r0;

        if((r0 != 0) || ((uint64_t)r1 != dataset_shape[d])) full = false;
        if(steps[d] > 1) strided = true;
    }

    std::vector<uint8_t> buffer = readBox(box, full);

    /* Apply Strides */
    if(strided)
    {
        std::vector<uint64_t> strided_dims;
        buffer = H5Assembler::applyStride(buffer.data(), boxdims, steps, typesize, &strided_dims);
        boxdims = strided_dims;
    }

    if(dims) *dims = boxdims;
    return decodeElements(buffer);
}

/*----------------------------------------------------------------------------
 * readAsBool
 *
 *  booleans are stored as 1-byte fixed point values
 *----------------------------------------------------------------------------*/
std::vector<bool> H5Dataset::readAsBool (void)
{
    const H5Datatype& type = datatype();
    if((type.typeClass != H5Datatype::FIXED_POINT_TYPE) || (type.size != 1))
    {
        throw UnsupportedFeatureError("dataset %s of type %s cannot be read as booleans", path.c_str(), type.describe().c_str());
    }

    const std::vector<uint8_t> buffer = readRaw();
    std::vector<bool> values;
    values.reserve(buffer.size());
    for(const uint8_t byte: buffer)
    {
        values.push_back(byte != 0);
    }
    return values;
}

/*----------------------------------------------------------------------------
 * readAsTime
 *
 *  integer ticks since the epoch converted to calendar time
 *----------------------------------------------------------------------------*/
std::vector<H5Read::gmt_time_t> H5Dataset::readAsTime (H5Read::time_unit_t unit)
{
    const H5Datatype& type = datatype();
    if((type.typeClass != H5Datatype::FIXED_POINT_TYPE) && (type.typeClass != H5Datatype::TIME_TYPE))
    {
        throw UnsupportedFeatureError("dataset %s of type %s cannot be read as times", path.c_str(), type.describe().c_str());
    }

    const std::vector<H5Value> ticks = readData();
    std::vector<H5Read::gmt_time_t> values;
    values.reserve(ticks.size());
    for(const H5Value& tick: ticks)
    {
        values.push_back(tick.asTime(unit));
    }
    return values;
}

/*----------------------------------------------------------------------------
 * findAttributes
 *----------------------------------------------------------------------------*/
std::vector<H5Attribute> H5Dataset::findAttributes (void) const
{
    return header->attributes;
}

/*----------------------------------------------------------------------------
 * attribute
 *----------------------------------------------------------------------------*/
const H5Attribute& H5Dataset::attribute (const std::string& name) const
{
    const H5Attribute* attr = header->findAttribute(name);
    if(attr == NULL)
    {
        if(header->denseAttributes)
        {
            throw UnsupportedFeatureError("attributes of %s are stored in a fractal heap, cannot find %s", path.c_str(), name.c_str());
        }
        throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "attribute %s not found on %s", name.c_str(), path.c_str());
    }
    return *attr;
}

/*----------------------------------------------------------------------------
 * listAttributes
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5Dataset::listAttributes (void) const
{
    std::vector<std::string> names;
    for(const H5Attribute& attr: header->attributes)
    {
        names.push_back(attr.name);
    }
    return names;
}

/*----------------------------------------------------------------------------
 * inspect
 *----------------------------------------------------------------------------*/
std::string H5Dataset::inspect (void) const
{
    std::string desc = "dataset " + path + "\n";
    desc += "  shape: " + (header->dataspace.null ? std::string("null") : H5Read::dims2str(shape())) + "\n";
    desc += "  datatype: " + header->datatype->describe() + "\n";
    desc += "  layout: " + std::string(H5Read::layout2str(layout())) + "\n";

    if(layout() == H5Read::CHUNKED_LAYOUT)
    {
        desc += "  chunks: " + H5Read::dims2str(chunkShape()) + "\n";
    }

    if(!header->filters.empty())
    {
        desc += "  filters:";
        for(const H5Filter::filter_t& filter: header->filters)
        {
            desc += " " + std::string(H5Filter::filter2str(filter.id));
        }
        desc += "\n";
    }

    if(!header->attributes.empty())
    {
        desc += "  attributes:";
        for(const H5Attribute& attr: header->attributes)
        {
            desc += " " + attr.name;
        }
        desc += "\n";
    }

    return desc;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readBox
 *
 *  reads the elements inside the box (resolved [r0, r1) ranges with unit
 *  step) into a packed buffer initialized with the fill value
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Dataset::readBox (const std::vector<range_t>& box, bool full)
{
    if(header->dataspace.null)
    {
        return std::vector<uint8_t>();
    }

    /* Allocate Data Buffer */
    uint64_t num_elements = 1;
    uint64_t buffer_size = 0;
    for(const range_t& range: box)
    {
        if(!H5Read::multiply(num_elements, range.r1 - range.r0, &num_elements))
        {
            throw DataReadError("number of elements requested from %s overflows", path.c_str());
        }
    }
    if(!H5Read::multiply(num_elements, typesize, &buffer_size) || (buffer_size > H5READ_MAXIMUM_READ_SIZE))
    {
        throw DataReadError("read of %lu elements from %s exceeds maximum read size", (unsigned long)num_elements, path.c_str());
    }
    std::vector<uint8_t> buffer(buffer_size, 0);
    if(buffer_size == 0)
    {
        return buffer;
    }

    /* Fill Buffer with Fill Value */
    if(header->fill.defined)
    {
        for(uint64_t i = 0; i < buffer_size; i += typesize)
        {
            memcpy(&buffer[i], header->fill.value.data(), typesize);
        }
    }

    const uint64_t data_size = elements() * typesize;
    const std::vector<uint64_t> origin(shape().size(), 0);

    switch(header->layout.layout)
    {
        case H5Read::COMPACT_LAYOUT:
        {
            if(header->layout.compact.size() < data_size)
            {
                throw DataReadError("compact data of %s too small: %lu < %lu", path.c_str(), (unsigned long)header->layout.compact.size(), (unsigned long)data_size);
            }

            H5Assembler assembler(shape(), shape(), typesize, box, buffer.data());
            assembler.placeChunk(origin, header->layout.compact.data());
            break;
        }

        case H5Read::CONTIGUOUS_LAYOUT:
        {
            /* Storage never allocated, data is all fill */
            if(cursor->isUndefined(header->layout.address))
            {
                break;
            }

            if((header->layout.size != 0) && (header->layout.size < data_size))
            {
                throw DataReadError("read exceeds available data for %s: %lu < %lu", path.c_str(), (unsigned long)header->layout.size, (unsigned long)data_size);
            }

            uint64_t data_addr = header->layout.address;
            cursor->checkRange(data_addr, full ? buffer_size : data_size);
            if(data_size > H5READ_MAXIMUM_READ_SIZE)
            {
                throw DataReadError("contiguous data of %s exceeds maximum read size: %lu bytes", path.c_str(), (unsigned long)data_size);
            }

            if(full)
            {
                cursor->readByteArray(buffer.data(), buffer_size, &data_addr);
            }
            else
            {
                std::vector<uint8_t> contiguous(data_size);
                cursor->readByteArray(contiguous.data(), data_size, &data_addr);
                H5Assembler assembler(shape(), shape(), typesize, box, buffer.data());
                assembler.placeChunk(origin, contiguous.data());
            }
            break;
        }

        case H5Read::CHUNKED_LAYOUT:
        {
            readChunked(box, full, buffer.data());
            break;
        }

        default:
        {
            throw FormatError("invalid data layout for %s: %d", path.c_str(), (int)header->layout.layout);
        }
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Read %s: %lu elements, %s", path.c_str(), (unsigned long)num_elements, H5Read::layout2str(header->layout.layout));
    }

    return buffer;
}

/*----------------------------------------------------------------------------
 * readChunked
 *
 *  full reads walk every chunk in key order, partial reads look up only
 *  the chunks touching the box; chunks missing from the index keep the
 *  fill value
 *----------------------------------------------------------------------------*/
void H5Dataset::readChunked (const std::vector<range_t>& box, bool full, uint8_t* buffer)
{
    if(shape().empty())
    {
        throw FormatError("invalid number of dimensions for chunked layout of %s: 0", path.c_str());
    }

    H5Assembler assembler(shape(), chunkShape(), typesize, box, buffer);
    if(cursor->isUndefined(header->layout.address))
    {
        return;
    }

    H5BTreeV1 btree(cursor.get(), header->layout.address, static_cast<int>(shape().size()));
    uint64_t chunks_read = 0;

    if(full)
    {
        const std::vector<H5BTreeV1::chunk_t> chunks = btree.readChunks();
        for(const H5BTreeV1::chunk_t& chunk: chunks)
        {
            for(size_t d = 0; d < chunkShape().size(); d++)
            {
                if(chunk.offsets[d] % chunkShape()[d] != 0)
                {
                    throw FormatError("chunk of %s at 0x%lx not aligned to chunk shape in dimension %d: %lu", path.c_str(), (unsigned long)chunk.address, (int)d, (unsigned long)chunk.offsets[d]);
                }
            }

            if(!assembler.intersects(chunk.offsets)) continue;
            const std::vector<uint8_t> data = readChunk(chunk.address, chunk.size, chunk.filter_mask);
            assembler.placeChunk(chunk.offsets, data.data());
            chunks_read++;
        }
    }
    else
    {
        const std::vector<std::vector<uint64_t>> origins = assembler.chunkOrigins();
        for(const std::vector<uint64_t>& origin: origins)
        {
            H5BTreeV1::chunk_t chunk;
            if(!btree.findChunk(origin, &chunk)) continue;
            const std::vector<uint8_t> data = readChunk(chunk.address, chunk.size, chunk.filter_mask);
            assembler.placeChunk(origin, data.data());
            chunks_read++;
        }
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Read %lu chunks of %s", (unsigned long)chunks_read, path.c_str());
    }
}

/*----------------------------------------------------------------------------
 * readChunk
 *----------------------------------------------------------------------------*/
std::vector<uint8_t> H5Dataset::readChunk (uint64_t address, uint32_t size, uint32_t filter_mask)
{
    cursor->checkRange(address, size);
    std::vector<uint8_t> raw(size);
    uint64_t pos = address;
    cursor->readByteArray(raw.data(), size, &pos);

    if(header->filters.empty())
    {
        if(size != chunkBytes)
        {
            throw DataReadError("unfiltered chunk of %s at 0x%lx has %u bytes, expected %lu", path.c_str(), (unsigned long)address, size, (unsigned long)chunkBytes);
        }
        return raw;
    }

    return H5Filter::decode(header->filters, filter_mask, std::move(raw), chunkBytes, typesize);
}

/*----------------------------------------------------------------------------
 * decodeElements
 *----------------------------------------------------------------------------*/
std::vector<H5Value> H5Dataset::decodeElements (const std::vector<uint8_t>& buffer) const
{
    const uint64_t num_elements = buffer.size() / typesize;

    std::vector<H5Value> values;
    values.reserve(num_elements);
    for(uint64_t i = 0; i < num_elements; i++)
    {
        values.push_back(header->datatype->decodeValue(&buffer[i * typesize], cursor.get()));
    }

    return values;
}
