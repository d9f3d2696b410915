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

#include "H5Cursor.h"
#include "H5Exception.h"

using H5Read::DataReadError;
using H5Read::FormatError;

/******************************************************************************
 * FILE IO DRIVER METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Cursor::FileIODriver::FileIODriver (const char* filename):
    name(filename),
    ioFile(NULL),
    fileSize(0)
{
    ioFile = fopen(filename, "rb");
    if(ioFile == NULL)
    {
        throw DataReadError("failed to open file: %s", filename);
    }

    /* Determine Size of File */
    if(fseeko(ioFile, 0, SEEK_END) != 0)
    {
        fclose(ioFile);
        throw DataReadError("failed to determine size of file: %s", filename);
    }
    fileSize = static_cast<uint64_t>(ftello(ioFile));
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Cursor::FileIODriver::~FileIODriver (void)
{
    fclose(ioFile);
}

/*----------------------------------------------------------------------------
 * ioRead
 *----------------------------------------------------------------------------*/
void H5Cursor::FileIODriver::ioRead (uint8_t* data, int64_t size, uint64_t pos)
{
    if(fseeko(ioFile, static_cast<off_t>(pos), SEEK_SET) != 0)
    {
        throw DataReadError("failed to seek to 0x%lx in %s", static_cast<unsigned long>(pos), name.c_str());
    }

    const size_t bytes_read = fread(data, 1, size, ioFile);
    if(static_cast<int64_t>(bytes_read) != size)
    {
        throw DataReadError("short read of %ld bytes at 0x%lx in %s: %ld", static_cast<long>(size), static_cast<unsigned long>(pos), name.c_str(), static_cast<long>(bytes_read));
    }
}

/*----------------------------------------------------------------------------
 * ioSize
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::FileIODriver::ioSize (void) const
{
    return fileSize;
}

/*----------------------------------------------------------------------------
 * ioName
 *----------------------------------------------------------------------------*/
const char* H5Cursor::FileIODriver::ioName (void) const
{
    return name.c_str();
}

/******************************************************************************
 * MEMORY IO DRIVER METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Cursor::MemoryIODriver::MemoryIODriver (std::vector<uint8_t> _buffer, const char* _name):
    buffer(std::move(_buffer)),
    name(_name)
{
}

/*----------------------------------------------------------------------------
 * ioRead
 *----------------------------------------------------------------------------*/
void H5Cursor::MemoryIODriver::ioRead (uint8_t* data, int64_t size, uint64_t pos)
{
    memcpy(data, &buffer[pos], size);
}

/*----------------------------------------------------------------------------
 * ioSize
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::MemoryIODriver::ioSize (void) const
{
    return buffer.size();
}

/*----------------------------------------------------------------------------
 * ioName
 *----------------------------------------------------------------------------*/
const char* H5Cursor::MemoryIODriver::ioName (void) const
{
    return name.c_str();
}

/******************************************************************************
 * CURSOR METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Cursor::H5Cursor (IODriver* _driver):
    driver(_driver),
    name(_driver->ioName()),
    position(0),
    baseAddress(0),
    offsetsize(8),
    lengthsize(8)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Cursor::~H5Cursor (void)
{
    delete driver;
}

/*----------------------------------------------------------------------------
 * checkRange
 *
 *  throws unless size bytes starting at pos lie inside the source; called
 *  before allocating buffers whose length comes from the file
 *----------------------------------------------------------------------------*/
void H5Cursor::checkRange (uint64_t pos, uint64_t size) const
{
    if(driver == NULL)
    {
        throw DataReadError("attempted read of closed source: %s", name.c_str());
    }

    const uint64_t absolute_pos = baseAddress + pos;
    const uint64_t source_size = driver->ioSize();
    if((absolute_pos < pos) || (absolute_pos > source_size) || (size > (source_size - absolute_pos)))
    {
        throw DataReadError("read of %lu bytes at 0x%lx exceeds size of %s (%lu bytes)", static_cast<unsigned long>(size), static_cast<unsigned long>(pos), name.c_str(), static_cast<unsigned long>(source_size));
    }
}

/*----------------------------------------------------------------------------
 * readByteArray
 *
 *  positions are relative to the base address of the container
 *----------------------------------------------------------------------------*/
void H5Cursor::readByteArray (uint8_t* data, int64_t size, uint64_t* pos)
{
    if(size < 0)
    {
        throw DataReadError("invalid read size at 0x%lx: %ld", static_cast<unsigned long>(*pos), static_cast<long>(size));
    }

    checkRange(*pos, static_cast<uint64_t>(size));

    /* Read Data */
    if(size > 0)
    {
        driver->ioRead(data, size, baseAddress + *pos);
    }

    *pos += size;
    position = *pos;
}

/*----------------------------------------------------------------------------
 * readField
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::readField (int64_t size, uint64_t* pos)
{
    if(size <= 0 || size > 8)
    {
        throw FormatError("invalid field size at 0x%lx: %ld", static_cast<unsigned long>(*pos), static_cast<long>(size));
    }

    uint8_t data_ptr[8];
    readByteArray(data_ptr, size, pos);

    /* Assemble Little Endian Value */
    uint64_t value = 0;
    for(int64_t i = size - 1; i >= 0; i--)
    {
        value = (value << 8) | data_ptr[i];
    }

    return value;
}

/*----------------------------------------------------------------------------
 * readField - at current position
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::readField (int64_t size)
{
    uint64_t pos = position;
    return readField(size, &pos);
}

/*----------------------------------------------------------------------------
 * readString - null terminated
 *----------------------------------------------------------------------------*/
std::string H5Cursor::readString (uint64_t* pos, int64_t maxlen)
{
    if(maxlen <= 0 || maxlen > MAX_STRING_SIZE) maxlen = MAX_STRING_SIZE;

    std::string str;
    while(true)
    {
        if(static_cast<int64_t>(str.size()) >= maxlen)
        {
            throw DataReadError("string at 0x%lx exceeded maximum length: %ld", static_cast<unsigned long>(*pos), static_cast<long>(maxlen));
        }

        const char c = static_cast<char>(readField(1, pos));
        if(c == '\0') break;
        str.push_back(c);
    }

    return str;
}

/*----------------------------------------------------------------------------
 * readOffset
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::readOffset (uint64_t* pos)
{
    return readField(offsetsize, pos);
}

/*----------------------------------------------------------------------------
 * readLength
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::readLength (uint64_t* pos)
{
    return readField(lengthsize, pos);
}

/*----------------------------------------------------------------------------
 * seek
 *----------------------------------------------------------------------------*/
void H5Cursor::seek (uint64_t pos)
{
    position = pos;
}

/*----------------------------------------------------------------------------
 * tell
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::tell (void) const
{
    return position;
}

/*----------------------------------------------------------------------------
 * setBaseAddress
 *----------------------------------------------------------------------------*/
void H5Cursor::setBaseAddress (uint64_t address)
{
    baseAddress = address;
}

/*----------------------------------------------------------------------------
 * getBaseAddress
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::getBaseAddress (void) const
{
    return baseAddress;
}

/*----------------------------------------------------------------------------
 * setSizes
 *----------------------------------------------------------------------------*/
void H5Cursor::setSizes (int _offsetsize, int _lengthsize)
{
    if((_offsetsize != 2 && _offsetsize != 4 && _offsetsize != 8) ||
       (_lengthsize != 2 && _lengthsize != 4 && _lengthsize != 8))
    {
        throw FormatError("unsupported size of offsets/lengths in %s: %d/%d", name.c_str(), _offsetsize, _lengthsize);
    }

    offsetsize = _offsetsize;
    lengthsize = _lengthsize;
}

/*----------------------------------------------------------------------------
 * offsetSize
 *----------------------------------------------------------------------------*/
int H5Cursor::offsetSize (void) const
{
    return offsetsize;
}

/*----------------------------------------------------------------------------
 * lengthSize
 *----------------------------------------------------------------------------*/
int H5Cursor::lengthSize (void) const
{
    return lengthsize;
}

/*----------------------------------------------------------------------------
 * isUndefined - all bits set at the width of an offset
 *----------------------------------------------------------------------------*/
bool H5Cursor::isUndefined (uint64_t address) const
{
    return address == (0xFFFFFFFFFFFFFFFFllu >> (64 - (offsetsize * 8)));
}

/*----------------------------------------------------------------------------
 * size
 *----------------------------------------------------------------------------*/
uint64_t H5Cursor::size (void) const
{
    if(driver == NULL) return 0;
    return driver->ioSize();
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* H5Cursor::getName (void) const
{
    return name.c_str();
}

/*----------------------------------------------------------------------------
 * close
 *----------------------------------------------------------------------------*/
void H5Cursor::close (void)
{
    delete driver;
    driver = NULL;
}

/*----------------------------------------------------------------------------
 * isOpen
 *----------------------------------------------------------------------------*/
bool H5Cursor::isOpen (void) const
{
    return driver != NULL;
}
