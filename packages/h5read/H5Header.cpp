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

#include "H5Header.h"
#include "H5Exception.h"
#include "H5Heap.h"
#include "H5BTreeV1.h"

using H5Read::FormatError;
using H5Read::UnsupportedFeatureError;

// NOLINTBEGIN(misc-no-recursion)

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Header::H5Header (std::shared_ptr<H5Cursor> _cursor, uint64_t _address, int _depth):
    address(_address),
    version(0),
    hasDataspace(false),
    hasLayout(false),
    hasSymbolTable(false),
    hasLinkInfo(false),
    denseLinks(false),
    denseAttributes(false),
    cursorRef(std::move(_cursor)),
    cursor(cursorRef.get()),
    depth(_depth)
{
    dataspace.scalar = false;
    dataspace.null = false;

    layout.layout = H5Read::UNKNOWN_LAYOUT;
    layout.version = 0;
    layout.address = 0;
    layout.size = 0;
    layout.elementsize = 0;

    fill.defined = false;

    if(depth > MAX_COMMITTED_DEPTH)
    {
        throw FormatError("committed datatype chain too deep at 0x%lx", (unsigned long)address);
    }

    readObjHdr(address);
}

/*----------------------------------------------------------------------------
 * objectType
 *----------------------------------------------------------------------------*/
H5Read::object_type_t H5Header::objectType (void) const
{
    if(hasLayout || (datatype && hasDataspace))
    {
        return H5Read::OBJECT_DATASET;
    }

    if(hasSymbolTable || hasLinkInfo || !links.empty())
    {
        return H5Read::OBJECT_GROUP;
    }

    if(datatype)
    {
        return H5Read::OBJECT_DATATYPE;
    }

    return H5Read::OBJECT_UNKNOWN;
}

/*----------------------------------------------------------------------------
 * findLink
 *----------------------------------------------------------------------------*/
bool H5Header::findLink (const std::string& name, H5Read::link_info_t* link) const
{
    for(const H5Read::link_info_t& entry: links)
    {
        if(entry.name == name)
        {
            if(link) *link = entry;
            return true;
        }
    }
    return false;
}

/*----------------------------------------------------------------------------
 * findAttribute
 *----------------------------------------------------------------------------*/
const H5Attribute* H5Header::findAttribute (const std::string& name) const
{
    for(const H5Attribute& attr: attributes)
    {
        if(attr.name == name) return &attr;
    }
    return NULL;
}

/*----------------------------------------------------------------------------
 * msg2str
 *----------------------------------------------------------------------------*/
const char* H5Header::msg2str (int msg_type)
{
    switch(msg_type)
    {
        case DATASPACE_MSG:         return "DATASPACE";
        case LINK_INFO_MSG:         return "LINK_INFO";
        case DATATYPE_MSG:          return "DATATYPE";
        case FILL_VALUE_OLD_MSG:    return "FILL_VALUE_OLD";
        case FILL_VALUE_MSG:        return "FILL_VALUE";
        case LINK_MSG:              return "LINK";
        case DATA_LAYOUT_MSG:       return "DATA_LAYOUT";
        case FILTER_MSG:            return "FILTER";
        case ATTRIBUTE_MSG:         return "ATTRIBUTE";
        case HEADER_CONT_MSG:       return "HEADER_CONTINUATION";
        case SYMBOL_TABLE_MSG:      return "SYMBOL_TABLE";
        case ATTRIBUTE_INFO_MSG:    return "ATTRIBUTE_INFO";
        default:                    return "UNKNOWN";
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * checkLength
 *
 *  declared lengths must fit inside the message that declares them
 *----------------------------------------------------------------------------*/
void H5Header::checkLength (uint64_t length, uint64_t pos, uint64_t end, const char* field)
{
    if((pos > end) || (length > (end - pos)))
    {
        throw FormatError("%s of %lu bytes at 0x%lx overruns its message", field, (unsigned long)length, (unsigned long)pos);
    }
}

/*----------------------------------------------------------------------------
 * readObjHdr
 *----------------------------------------------------------------------------*/
int H5Header::readObjHdr (uint64_t pos)
{
    const uint64_t starting_position = pos;

    /* Peek at Version / Process Version 1 */
    uint64_t peeking_position = pos;
    const uint8_t peek = (uint8_t)cursor->readField(1, &peeking_position);
    if(peek == 1) return readObjHdrV1(starting_position);

    /* Read Object Header */
    const uint32_t signature = (uint32_t)cursor->readField(4, &pos);
    if(signature != H5Read::H5_OHDR_SIGNATURE_LE)
    {
        throw FormatError("invalid object header signature at 0x%lx: 0x%X", (unsigned long)starting_position, (unsigned)signature);
    }

    version = (int)cursor->readField(1, &pos);
    if(version != 2)
    {
        throw FormatError("invalid object header version at 0x%lx: %d", (unsigned long)starting_position, version);
    }

    /* Skip Optional Time and Phase Fields */
    const uint8_t obj_hdr_flags = (uint8_t)cursor->readField(1, &pos);
    if(obj_hdr_flags & FILE_STATS_BIT)
    {
        pos += 16; // access, modification, change and birth times
    }
    if(obj_hdr_flags & STORE_CHANGE_PHASE_BIT)
    {
        pos += 4; // maximum compact and minimum dense attribute counts
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Object Header: 0x%lx, flags 0x%x", (unsigned long)starting_position, (unsigned)obj_hdr_flags);
    }

    /* Read Header Messages */
    const uint64_t size_of_chunk0 = cursor->readField(1 << (obj_hdr_flags & SIZE_OF_CHUNK_0_MASK), &pos);
    const uint64_t end_of_hdr = pos + size_of_chunk0;
    pos += readMessages(pos, end_of_hdr, obj_hdr_flags);

    /* Skip Checksum */
    pos += 4;

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readObjHdrV1
 *----------------------------------------------------------------------------*/
int H5Header::readObjHdrV1 (uint64_t pos)
{
    const uint64_t starting_position = pos;

    version = (int)cursor->readField(1, &pos);
    const uint8_t reserved0 = (uint8_t)cursor->readField(1, &pos);
    if(H5READ_ERROR_CHECKING && (reserved0 != 0))
    {
        throw FormatError("invalid reserved field in object header at 0x%lx: %d", (unsigned long)starting_position, (int)reserved0);
    }

    const uint16_t num_hdr_msgs = (uint16_t)cursor->readField(2, &pos);
    const uint32_t obj_ref_count = (uint32_t)cursor->readField(4, &pos);
    const uint32_t obj_hdr_size = (uint32_t)cursor->readField(4, &pos);
    pos += 4; // messages start on an 8-byte boundary

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Object Header V1: 0x%lx, %d messages, %u references, %u bytes", (unsigned long)starting_position, (int)num_hdr_msgs, obj_ref_count, obj_hdr_size);
    }

    /* Read Header Messages */
    const uint64_t end_of_hdr = pos + obj_hdr_size;
    pos += readMessagesV1(pos, end_of_hdr, CUSTOM_V1_FLAG);

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readMessages
 *----------------------------------------------------------------------------*/
int H5Header::readMessages (uint64_t pos, uint64_t end, uint8_t hdr_flags)
{
    const uint64_t starting_position = pos;
    const uint64_t msg_hdr_size = (hdr_flags & ATTR_CREATION_TRACK_BIT) ? 6 : 4;

    /* A gap smaller than a message header may trail the last message */
    while(pos + msg_hdr_size <= end)
    {
        /* Read Message Info */
        const uint8_t   msg_type    = (uint8_t)cursor->readField(1, &pos);
        const uint16_t  msg_size    = (uint16_t)cursor->readField(2, &pos);
        const uint8_t   msg_flags   = (uint8_t)cursor->readField(1, &pos);
        if(hdr_flags & ATTR_CREATION_TRACK_BIT)
        {
            pos += 2; // creation order
        }

        if(pos + msg_size > end)
        {
            throw FormatError("%s message at 0x%lx overruns object header: %u bytes", msg2str(msg_type), (unsigned long)pos, (unsigned)msg_size);
        }

        /* Read Each Message */
        const int bytes_read = readMessage((msg_type_t)msg_type, msg_size, pos, hdr_flags, msg_flags);
        if(H5READ_ERROR_CHECKING && (bytes_read > msg_size))
        {
            throw FormatError("%s message at 0x%lx longer than specified: %d > %d", msg2str(msg_type), (unsigned long)pos, bytes_read, (int)msg_size);
        }

        /* Update Position */
        pos += msg_size;
    }

    /* Move Past Gap */
    pos = end;

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readMessagesV1
 *----------------------------------------------------------------------------*/
int H5Header::readMessagesV1 (uint64_t pos, uint64_t end, uint8_t hdr_flags)
{
    static const int SIZE_OF_V1_PREFIX = 8;

    const uint64_t starting_position = pos;

    while(pos + SIZE_OF_V1_PREFIX <= end)
    {
        const uint16_t  msg_type    = (uint16_t)cursor->readField(2, &pos);
        const uint16_t  msg_size    = (uint16_t)cursor->readField(2, &pos);
        const uint8_t   msg_flags   = (uint8_t)cursor->readField(1, &pos);
        pos += 3; // reserved

        if(pos + msg_size > end)
        {
            throw FormatError("%s message at 0x%lx overruns object header: %u bytes", msg2str(msg_type), (unsigned long)pos, (unsigned)msg_size);
        }

        /* Read Each Message */
        const int bytes_read = readMessage((msg_type_t)msg_type, msg_size, pos, hdr_flags, msg_flags);
        if(H5READ_ERROR_CHECKING && (bytes_read > msg_size))
        {
            throw FormatError("%s message at 0x%lx longer than specified: %d > %d", msg2str(msg_type), (unsigned long)pos, bytes_read, (int)msg_size);
        }

        /* Update Position */
        pos += msg_size;
    }

    /* Move Past Gap */
    pos = end;

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readMessage
 *----------------------------------------------------------------------------*/
int H5Header::readMessage (msg_type_t msg_type, uint64_t size, uint64_t pos, uint8_t hdr_flags, uint8_t msg_flags)
{
    message_t msg = {(uint16_t)msg_type, msg_flags, size, pos};
    messages.push_back(msg);

    /* Shared Messages */
    if(msg_flags & SHARED_MSG_FLAG)
    {
        switch(msg_type)
        {
            case DATATYPE_MSG:
            {
                if(datatype) throw FormatError("duplicate datatype message at 0x%lx", (unsigned long)pos);
                return readDatatypeMsg(pos, true, &datatype);
            }

            case DATASPACE_MSG:
            case FILTER_MSG:
            {
                throw UnsupportedFeatureError("shared %s message at 0x%lx is not supported", msg2str(msg_type), (unsigned long)pos);
            }

            default:
            {
                if(H5READ_VERBOSE)
                {
                    mlog(WARNING, "Skipped shared %s message: 0x%lx, %lu bytes", msg2str(msg_type), (unsigned long)pos, (unsigned long)size);
                }
                return size;
            }
        }
    }

    switch(msg_type)
    {
        case DATASPACE_MSG:
        {
            hasDataspace = true;
            return readDataspaceMsg(pos, &dataspace);
        }

        case DATATYPE_MSG:
        {
            if(datatype) throw FormatError("duplicate datatype message at 0x%lx", (unsigned long)pos);
            return readDatatypeMsg(pos, false, &datatype);
        }

        case LINK_INFO_MSG:         return readLinkInfoMsg(pos);
        case FILL_VALUE_OLD_MSG:    return readFillValueMsg(pos, msg_type, size);
        case FILL_VALUE_MSG:        return readFillValueMsg(pos, msg_type, size);
        case LINK_MSG:              return readLinkMsg(pos, size);
        case DATA_LAYOUT_MSG:       return readDataLayoutMsg(pos, size);
        case FILTER_MSG:            return readFilterMsg(pos);
        case ATTRIBUTE_MSG:         return readAttributeMsg(pos, size);
        case ATTRIBUTE_INFO_MSG:    return readAttributeInfoMsg(pos);
        case HEADER_CONT_MSG:       return readHeaderContMsg(pos, hdr_flags);
        case SYMBOL_TABLE_MSG:      return readSymbolTableMsg(pos);

        default:
        {
            if(H5READ_VERBOSE)
            {
                mlog(WARNING, "Skipped message: 0x%x, %lu bytes, 0x%lx", (unsigned)msg_type, (unsigned long)size, (unsigned long)pos);
            }
            return size;
        }
    }
}

/*----------------------------------------------------------------------------
 * readDataspaceMsg
 *----------------------------------------------------------------------------*/
int H5Header::readDataspaceMsg (uint64_t pos, H5Read::dataspace_t* space)
{
    static const int MAX_DIM_PRESENT    = 0x1;
    static const int PERM_INDEX_PRESENT = 0x2;

    static const int SCALAR_SPACE       = 0;
    static const int NULL_SPACE         = 2;

    const uint64_t starting_position = pos;

    const uint8_t msg_version     = (uint8_t)cursor->readField(1, &pos);
    const uint8_t dimensionality  = (uint8_t)cursor->readField(1, &pos);
    const uint8_t flags           = (uint8_t)cursor->readField(1, &pos);

    if(msg_version != 1 && msg_version != 2)
    {
        throw FormatError("invalid dataspace version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    if(dimensionality > H5Read::MAX_NDIMS)
    {
        throw UnsupportedFeatureError("unsupported number of dimensions: %d", (int)dimensionality);
    }

    int space_type = dimensionality == 0 ? SCALAR_SPACE : 1;
    if(msg_version == 1)
    {
        pos += 5; // reserved
    }
    else
    {
        space_type = (int)cursor->readField(1, &pos);
    }

    space->null = (space_type == NULL_SPACE);
    space->scalar = (space_type == SCALAR_SPACE);
    space->dims.clear();
    space->maxdims.clear();

    /* Read Dimensions */
    for(int d = 0; d < dimensionality; d++)
    {
        space->dims.push_back(cursor->readLength(&pos));
    }

    /* Read Maximum Dimensions */
    if(flags & MAX_DIM_PRESENT)
    {
        for(int d = 0; d < dimensionality; d++)
        {
            space->maxdims.push_back(cursor->readLength(&pos));
        }
    }

    /* Number of Elements Must Be Addressable */
    H5Read::elements(*space);

    /* Skip Permutation Indexes */
    if((msg_version == 1) && (flags & PERM_INDEX_PRESENT))
    {
        pos += dimensionality * cursor->lengthSize();
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Dataspace Message: 0x%lx, %s%s", (unsigned long)starting_position,
             space->null ? "null" : (space->scalar ? "scalar" : "simple "),
             (space->null || space->scalar) ? "" : H5Read::dims2str(space->dims).c_str());
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readLinkInfoMsg
 *----------------------------------------------------------------------------*/
int H5Header::readLinkInfoMsg (uint64_t pos)
{
    static const int MAX_CREATE_PRESENT_BIT     = 0x01;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    const uint8_t flags = (uint8_t)cursor->readField(1, &pos);
    if(msg_version != 0)
    {
        throw FormatError("invalid link info version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    if(flags & MAX_CREATE_PRESENT_BIT)
    {
        pos += 8; // maximum creation index
    }

    const uint64_t heap_address = cursor->readOffset(&pos);
    const uint64_t name_index_address = cursor->readOffset(&pos);
    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        pos += cursor->offsetSize(); // creation order index
    }

    hasLinkInfo = true;
    if(!cursor->isUndefined(heap_address))
    {
        denseLinks = true;
        mlog(DEBUG, "Object at 0x%lx stores links in a fractal heap at 0x%lx (name index 0x%lx)", (unsigned long)address, (unsigned long)heap_address, (unsigned long)name_index_address);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readDatatypeMsg
 *----------------------------------------------------------------------------*/
int H5Header::readDatatypeMsg (uint64_t pos, bool shared, std::shared_ptr<H5Datatype>* type)
{
    const uint64_t starting_position = pos;

    if(shared)
    {
        /* Follow to Committed Datatype */
        uint64_t committed_addr = 0;
        pos += readSharedMsg(pos, &committed_addr);

        const H5Header committed(cursorRef, committed_addr, depth + 1);
        if(!committed.datatype)
        {
            throw FormatError("committed datatype at 0x%lx has no datatype message", (unsigned long)committed_addr);
        }
        *type = committed.datatype;

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Shared Datatype Message: 0x%lx -> 0x%lx", (unsigned long)starting_position, (unsigned long)committed_addr);
        }
    }
    else
    {
        *type = H5Datatype::decode(cursor, &pos);

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Datatype Message: 0x%lx, %s", (unsigned long)starting_position, (*type)->describe().c_str());
        }
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readSharedMsg
 *----------------------------------------------------------------------------*/
int H5Header::readSharedMsg (uint64_t pos, uint64_t* object_addr)
{
    static const int SOHM_SHARE_TYPE = 1;

    const uint64_t starting_position = pos;

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    const uint8_t share_type = (uint8_t)cursor->readField(1, &pos);

    if(msg_version == 1)
    {
        pos += 6; // reserved
        pos += cursor->lengthSize(); // unused heap field of the old symbol table entry
    }
    else if(msg_version == 3)
    {
        if(share_type == SOHM_SHARE_TYPE)
        {
            throw UnsupportedFeatureError("shared message at 0x%lx lives in the shared message heap", (unsigned long)starting_position);
        }
    }
    else if(msg_version != 2)
    {
        throw FormatError("invalid shared message version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    *object_addr = cursor->readOffset(&pos);

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readFillValueMsg
 *----------------------------------------------------------------------------*/
int H5Header::readFillValueMsg (uint64_t pos, msg_type_t msg_type, uint64_t size)
{
    static const uint8_t FILL_VALUE_DEFINED_BIT = 0x20;

    const uint64_t starting_position = pos;
    const uint64_t end_of_msg = starting_position + size;

    if(msg_type == FILL_VALUE_OLD_MSG)
    {
        const uint32_t fill_size = (uint32_t)cursor->readField(4, &pos);
        checkLength(fill_size, pos, end_of_msg, "fill value");
        std::vector<uint8_t> value(fill_size);
        if(fill_size > 0) cursor->readByteArray(value.data(), fill_size, &pos);

        /* The newer message takes precedence */
        if(!fill.defined && fill_size > 0)
        {
            fill.defined = true;
            fill.value = value;
        }
    }
    else
    {
        const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
        bool value_present = false;

        if(msg_version == 1 || msg_version == 2)
        {
            pos += 2; // space allocation and fill value write times
            const uint8_t fill_value_defined = (uint8_t)cursor->readField(1, &pos);
            value_present = (msg_version == 1) || (fill_value_defined != 0);
        }
        else if(msg_version == 3)
        {
            const uint8_t flags = (uint8_t)cursor->readField(1, &pos);
            value_present = (flags & FILL_VALUE_DEFINED_BIT) != 0;
        }
        else
        {
            throw FormatError("invalid fill value version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
        }

        if(value_present)
        {
            const uint32_t fill_size = (uint32_t)cursor->readField(4, &pos);
            checkLength(fill_size, pos, end_of_msg, "fill value");
            if(fill_size > 0)
            {
                fill.value.resize(fill_size);
                cursor->readByteArray(fill.value.data(), fill_size, &pos);
                fill.defined = true;
            }
        }
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Fill Value Message: 0x%lx, %s, %lu bytes", (unsigned long)starting_position, fill.defined ? "defined" : "undefined", (unsigned long)fill.value.size());
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readLinkMsg
 *----------------------------------------------------------------------------*/
int H5Header::readLinkMsg (uint64_t pos, uint64_t size)
{
    static const int SIZE_OF_LEN_OF_NAME_MASK   = 0x03;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x04;
    static const int LINK_TYPE_PRESENT_BIT      = 0x08;
    static const int CHAR_SET_PRESENT_BIT       = 0x10;

    const uint64_t starting_position = pos;
    const uint64_t end_of_msg = starting_position + size;

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    const uint8_t flags = (uint8_t)cursor->readField(1, &pos);
    if(msg_version != 1)
    {
        throw FormatError("invalid link version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    /* Read Link Type */
    int link_type = H5Read::HARD_LINK;
    if(flags & LINK_TYPE_PRESENT_BIT)
    {
        link_type = (int)cursor->readField(1, &pos);
    }

    /* Skip Creation Order and Character Set */
    if(flags & CREATE_ORDER_PRESENT_BIT) pos += 8;
    if(flags & CHAR_SET_PRESENT_BIT) pos += 1;

    /* Read Link Name */
    const int link_name_len_of_len = 1 << (flags & SIZE_OF_LEN_OF_NAME_MASK);
    const uint64_t link_name_len = cursor->readField(link_name_len_of_len, &pos);
    if(link_name_len == 0)
    {
        throw FormatError("empty link name at 0x%lx", (unsigned long)starting_position);
    }
    checkLength(link_name_len, pos, end_of_msg, "link name");

    std::vector<uint8_t> name_bytes(link_name_len);
    cursor->readByteArray(name_bytes.data(), link_name_len, &pos);

    H5Read::link_info_t link;
    link.type = (H5Read::link_type_t)link_type;
    link.name.assign(reinterpret_cast<const char*>(name_bytes.data()), link_name_len);
    link.address = 0;

    /* Process Link Type */
    if(link_type == H5Read::HARD_LINK)
    {
        link.address = cursor->readOffset(&pos);
    }
    else if(link_type == H5Read::SOFT_LINK)
    {
        const uint16_t soft_link_len = (uint16_t)cursor->readField(2, &pos);
        checkLength(soft_link_len, pos, end_of_msg, "soft link target");
        std::vector<uint8_t> soft_link(soft_link_len);
        cursor->readByteArray(soft_link.data(), soft_link_len, &pos);
        link.target.assign(reinterpret_cast<const char*>(soft_link.data()), soft_link_len);
    }
    else if(link_type == H5Read::EXTERNAL_LINK)
    {
        /* Version and flags byte, then NUL terminated file name and object path */
        const uint16_t ext_link_len = (uint16_t)cursor->readField(2, &pos);
        const uint64_t end_of_link = pos + ext_link_len;
        if(ext_link_len < 1)
        {
            throw FormatError("empty external link %s", link.name.c_str());
        }
        checkLength(ext_link_len, pos, end_of_msg, "external link");
        pos += 1;
        link.filename = cursor->readString(&pos, end_of_link - pos);
        link.target = cursor->readString(&pos, end_of_link - pos);
        pos = end_of_link;
    }
    else
    {
        throw UnsupportedFeatureError("unsupported link type for %s: %d", link.name.c_str(), link_type);
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Link Message: 0x%lx, %s link %s", (unsigned long)starting_position, H5Read::link2str(link.type), link.name.c_str());
    }

    addLink(link);

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readDataLayoutMsg
 *----------------------------------------------------------------------------*/
int H5Header::readDataLayoutMsg (uint64_t pos, uint64_t size)
{
    const uint64_t starting_position = pos;

    if(hasLayout)
    {
        throw FormatError("duplicate data layout message at 0x%lx", (unsigned long)starting_position);
    }

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    if(msg_version == 4)
    {
        throw UnsupportedFeatureError("data layout version 4 at 0x%lx is not supported", (unsigned long)starting_position);
    }
    if(msg_version < 1 || msg_version > 4)
    {
        throw FormatError("invalid data layout version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    layout.version = msg_version;

    if(msg_version < 3)
    {
        /* Dimensionality, Class and Reserved Bytes */
        const uint8_t dimensionality = (uint8_t)cursor->readField(1, &pos);
        layout.layout = (H5Read::layout_t)cursor->readField(1, &pos);
        pos += 5;

        if(layout.layout != H5Read::COMPACT_LAYOUT)
        {
            layout.address = cursor->readOffset(&pos);
        }

        std::vector<uint64_t> dims;
        for(int d = 0; d < dimensionality; d++)
        {
            dims.push_back(cursor->readField(4, &pos));
        }

        switch(layout.layout)
        {
            case H5Read::COMPACT_LAYOUT:
            {
                const uint32_t compact_size = (uint32_t)cursor->readField(4, &pos);
                checkLength(compact_size, pos, starting_position + size, "compact data");
                layout.size = compact_size;
                layout.compact.resize(compact_size);
                cursor->readByteArray(layout.compact.data(), compact_size, &pos);
                break;
            }

            case H5Read::CONTIGUOUS_LAYOUT:
            {
                layout.size = 0; // derived from the dataspace and datatype
                break;
            }

            case H5Read::CHUNKED_LAYOUT:
            {
                /* Last dimension is the size of a data element */
                if(dims.empty())
                {
                    throw FormatError("chunked layout at 0x%lx has no dimensions", (unsigned long)starting_position);
                }
                layout.elementsize = (uint32_t)dims.back();
                dims.pop_back();
                layout.chunkdims = dims;
                break;
            }

            default:
            {
                throw FormatError("invalid data layout class at 0x%lx: %d", (unsigned long)starting_position, (int)layout.layout);
            }
        }
    }
    else
    {
        layout.layout = (H5Read::layout_t)cursor->readField(1, &pos);
        switch(layout.layout)
        {
            case H5Read::COMPACT_LAYOUT:
            {
                const uint16_t compact_size = (uint16_t)cursor->readField(2, &pos);
                checkLength(compact_size, pos, starting_position + size, "compact data");
                layout.size = compact_size;
                layout.compact.resize(compact_size);
                cursor->readByteArray(layout.compact.data(), compact_size, &pos);
                break;
            }

            case H5Read::CONTIGUOUS_LAYOUT:
            {
                layout.address = cursor->readOffset(&pos);
                layout.size = cursor->readLength(&pos);
                break;
            }

            case H5Read::CHUNKED_LAYOUT:
            {
                /* Dimensionality is one more than the number of dataset dimensions */
                const int chunk_num_dim = (int)cursor->readField(1, &pos) - 1;
                if(chunk_num_dim < 0 || chunk_num_dim > H5Read::MAX_NDIMS)
                {
                    throw FormatError("invalid number of chunk dimensions at 0x%lx: %d", (unsigned long)starting_position, chunk_num_dim);
                }

                layout.address = cursor->readOffset(&pos);
                for(int d = 0; d < chunk_num_dim; d++)
                {
                    layout.chunkdims.push_back(cursor->readField(4, &pos));
                }
                layout.elementsize = (uint32_t)cursor->readField(4, &pos);
                break;
            }

            case H5Read::VIRTUAL_LAYOUT:
            {
                throw UnsupportedFeatureError("virtual dataset layout at 0x%lx is not supported", (unsigned long)starting_position);
            }

            default:
            {
                throw FormatError("invalid data layout class at 0x%lx: %d", (unsigned long)starting_position, (int)layout.layout);
            }
        }
    }

    hasLayout = true;

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Data Layout Message: 0x%lx, version %d, %s, address 0x%lx, %lu of %lu bytes",
             (unsigned long)starting_position, (int)msg_version, H5Read::layout2str(layout.layout),
             (unsigned long)layout.address, (unsigned long)(pos - starting_position), (unsigned long)size);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readFilterMsg
 *----------------------------------------------------------------------------*/
int H5Header::readFilterMsg (uint64_t pos)
{
    const uint64_t starting_position = pos;

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    const uint8_t num_filters = (uint8_t)cursor->readField(1, &pos);
    if(msg_version != 1 && msg_version != 2)
    {
        throw FormatError("invalid filter version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    /* Move past reserved bytes in version 1 */
    if(msg_version == 1)
    {
        pos += 6;
    }

    /* Read Filters */
    for(int f = 0; f < num_filters; f++)
    {
        H5Filter::filter_t filter;
        filter.id = (uint16_t)cursor->readField(2, &pos);

        /* Read Filter Name Length */
        uint16_t name_len = 0;
        if(msg_version == 1 || filter.id >= 256)
        {
            name_len = (uint16_t)cursor->readField(2, &pos);
        }

        filter.flags = (uint16_t)cursor->readField(2, &pos);
        const uint16_t num_parms = (uint16_t)cursor->readField(2, &pos);

        if(H5READ_ERROR_CHECKING && (filter.flags & ~1))
        {
            throw FormatError("invalid flags in filter message at 0x%lx: %02X", (unsigned long)starting_position, (unsigned)filter.flags);
        }

        /* Read Name (padded to 8 bytes in version 1) */
        if(name_len > 0)
        {
            std::vector<uint8_t> name_bytes(name_len);
            cursor->readByteArray(name_bytes.data(), name_len, &pos);
            filter.name = std::string(reinterpret_cast<const char*>(name_bytes.data()), name_len).c_str();
            if(msg_version == 1)
            {
                pos += (8 - (name_len % 8)) % 8;
            }
        }
        else
        {
            filter.name = H5Filter::filter2str(filter.id);
        }

        /* Client Data */
        for(int p = 0; p < num_parms; p++)
        {
            filter.parms.push_back((uint32_t)cursor->readField(4, &pos));
        }

        /* Handle Padding (version 1 only) */
        if(msg_version == 1 && (num_parms % 2 == 1))
        {
            pos += 4;
        }

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Filter: %d, %s, flags 0x%x, %d parameters", (int)filter.id, filter.name.c_str(), (unsigned)filter.flags, (int)num_parms);
        }

        filters.push_back(filter);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readAttributeMsg
 *----------------------------------------------------------------------------*/
int H5Header::readAttributeMsg (uint64_t pos, uint64_t size)
{
    static const uint8_t SHARED_DATATYPE_BIT    = 0x01;
    static const uint8_t SHARED_DATASPACE_BIT   = 0x02;

    const uint64_t starting_position = pos;
    const uint64_t end_of_msg = pos + size;

    /* Read Message Info */
    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    if(msg_version < 1 || msg_version > 3)
    {
        throw FormatError("invalid attribute version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    const uint8_t flags = (uint8_t)cursor->readField(1, &pos); // reserved in version 1
    const uint16_t name_size = (uint16_t)cursor->readField(2, &pos);
    const uint16_t datatype_size = (uint16_t)cursor->readField(2, &pos);
    const uint16_t dataspace_size = (uint16_t)cursor->readField(2, &pos);
    if(msg_version == 3)
    {
        pos += 1; // name character set
    }

    if(name_size == 0)
    {
        throw FormatError("attribute at 0x%lx has an empty name", (unsigned long)starting_position);
    }

    H5Attribute attr;
    attr.cursor = cursorRef;

    /* Read Attribute Name */
    const uint64_t name_pos = pos;
    attr.name = cursor->readString(&pos, name_size);
    pos = name_pos + name_size;
    if(msg_version == 1)
    {
        pos += (8 - (name_size % 8)) % 8;
    }

    /* Read Datatype */
    const uint64_t datatype_pos = pos;
    const int datatype_bytes_read = readDatatypeMsg(pos, (msg_version > 1) && (flags & SHARED_DATATYPE_BIT), &attr.datatype);
    if(H5READ_ERROR_CHECKING && datatype_bytes_read > datatype_size)
    {
        throw FormatError("attribute %s datatype longer than specified: %d > %d", attr.name.c_str(), datatype_bytes_read, (int)datatype_size);
    }
    pos = datatype_pos + datatype_size;
    if(msg_version == 1)
    {
        pos += (8 - (datatype_size % 8)) % 8;
    }

    /* Read Dataspace */
    if((msg_version > 1) && (flags & SHARED_DATASPACE_BIT))
    {
        throw UnsupportedFeatureError("attribute %s has a shared dataspace", attr.name.c_str());
    }
    const uint64_t dataspace_pos = pos;
    const int dataspace_bytes_read = readDataspaceMsg(pos, &attr.dataspace);
    if(H5READ_ERROR_CHECKING && dataspace_bytes_read > dataspace_size)
    {
        throw FormatError("attribute %s dataspace longer than specified: %d > %d", attr.name.c_str(), dataspace_bytes_read, (int)dataspace_size);
    }
    pos = dataspace_pos + dataspace_size;
    if(msg_version == 1)
    {
        pos += (8 - (dataspace_size % 8)) % 8;
    }

    /* Read Data */
    uint64_t data_size = 0;
    if(!H5Read::multiply(H5Read::elements(attr.dataspace), attr.datatype->size, &data_size) || (pos > end_of_msg) || (data_size > (end_of_msg - pos)))
    {
        throw FormatError("attribute %s data overruns message: %lu bytes at 0x%lx", attr.name.c_str(), (unsigned long)data_size, (unsigned long)pos);
    }
    attr.data.resize(data_size);
    if(data_size > 0) cursor->readByteArray(attr.data.data(), data_size, &pos);

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Attribute Message: 0x%lx, %s", (unsigned long)starting_position, attr.describe().c_str());
    }

    attributes.push_back(attr);

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readAttributeInfoMsg
 *----------------------------------------------------------------------------*/
int H5Header::readAttributeInfoMsg (uint64_t pos)
{
    static const int MAX_CREATE_PRESENT_BIT     = 0x01;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint8_t msg_version = (uint8_t)cursor->readField(1, &pos);
    const uint8_t flags = (uint8_t)cursor->readField(1, &pos);
    if(msg_version != 0)
    {
        throw FormatError("invalid attribute info version at 0x%lx: %d", (unsigned long)starting_position, (int)msg_version);
    }

    if(flags & MAX_CREATE_PRESENT_BIT)
    {
        pos += 2; // maximum creation index
    }

    const uint64_t heap_address = cursor->readOffset(&pos);
    const uint64_t name_bt2_address = cursor->readOffset(&pos);
    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        pos += cursor->offsetSize(); // creation order index
    }

    if(!cursor->isUndefined(heap_address))
    {
        denseAttributes = true;
        mlog(DEBUG, "Object at 0x%lx stores attributes in a fractal heap at 0x%lx (name index 0x%lx)", (unsigned long)address, (unsigned long)heap_address, (unsigned long)name_bt2_address);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readHeaderContMsg
 *----------------------------------------------------------------------------*/
int H5Header::readHeaderContMsg (uint64_t pos, uint8_t hdr_flags)
{
    const uint64_t starting_position = pos;

    /* Continuation Info */
    const uint64_t hc_offset = cursor->readOffset(&pos);
    const uint64_t hc_length = cursor->readLength(&pos);

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Header Continuation Message: 0x%lx -> 0x%lx, %lu bytes", (unsigned long)starting_position, (unsigned long)hc_offset, (unsigned long)hc_length);
    }

    if(!continuations.insert(hc_offset).second)
    {
        throw FormatError("object header continuation at 0x%lx already read", (unsigned long)hc_offset);
    }

    /* Read Continuation Block */
    uint64_t cont_pos = hc_offset;
    if(hdr_flags & CUSTOM_V1_FLAG)
    {
        const uint64_t end_of_chdr = hc_offset + hc_length;
        readMessagesV1(cont_pos, end_of_chdr, hdr_flags);
    }
    else
    {
        const uint32_t signature = (uint32_t)cursor->readField(4, &cont_pos);
        if(signature != H5Read::H5_OCHK_SIGNATURE_LE)
        {
            throw FormatError("invalid header continuation signature at 0x%lx: 0x%X", (unsigned long)hc_offset, (unsigned)signature);
        }

        if(hc_length < 8)
        {
            throw FormatError("header continuation at 0x%lx too short: %lu", (unsigned long)hc_offset, (unsigned long)hc_length);
        }

        /* Leave 4 bytes for checksum */
        const uint64_t end_of_chdr = hc_offset + hc_length - 4;
        readMessages(cont_pos, end_of_chdr, hdr_flags);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readSymbolTableMsg
 *----------------------------------------------------------------------------*/
int H5Header::readSymbolTableMsg (uint64_t pos)
{
    const uint64_t starting_position = pos;

    /* Symbol Table Info */
    const uint64_t btree_addr = cursor->readOffset(&pos);
    const uint64_t heap_addr = cursor->readOffset(&pos);

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Symbol Table Message: 0x%lx, b-tree 0x%lx, heap 0x%lx", (unsigned long)starting_position, (unsigned long)btree_addr, (unsigned long)heap_addr);
    }

    hasSymbolTable = true;

    /* Read Symbol Table Nodes in Key Order */
    const uint64_t heap_data_addr = H5Heap::readLocalHeap(cursor, heap_addr);
    const std::vector<uint64_t> nodes = H5BTreeV1::readGroupNodes(cursor, btree_addr);
    for(const uint64_t node: nodes)
    {
        readSymbolTable(node, heap_data_addr);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readSymbolTable
 *----------------------------------------------------------------------------*/
int H5Header::readSymbolTable (uint64_t pos, uint64_t heap_data_addr)
{
    static const uint32_t SOFT_LINK_CACHE_TYPE = 2;

    const uint64_t starting_position = pos;

    /* Check Signature and Version */
    const uint32_t signature = (uint32_t)cursor->readField(4, &pos);
    if(signature != H5Read::H5_SNOD_SIGNATURE_LE)
    {
        throw FormatError("invalid symbol table signature at 0x%lx: 0x%X", (unsigned long)starting_position, (unsigned)signature);
    }

    const uint8_t snod_version = (uint8_t)cursor->readField(1, &pos);
    if(snod_version != 1)
    {
        throw FormatError("incorrect version of symbol table at 0x%lx: %d", (unsigned long)starting_position, (int)snod_version);
    }
    pos += 1; // reserved

    /* Read Symbols */
    const uint16_t num_symbols = (uint16_t)cursor->readField(2, &pos);
    for(int s = 0; s < num_symbols; s++)
    {
        /* Read Symbol Entry */
        const uint64_t link_name_offset = cursor->readOffset(&pos);
        const uint64_t obj_hdr_addr = cursor->readOffset(&pos);
        const uint32_t cache_type = (uint32_t)cursor->readField(4, &pos);
        pos += 4; // reserved
        uint64_t scratch_pos = pos;
        pos += 16; // scratch pad

        H5Read::link_info_t link;
        link.name = H5Heap::readLocalString(cursor, heap_data_addr, link_name_offset);
        link.address = obj_hdr_addr;
        link.type = H5Read::HARD_LINK;

        /* Soft link value lives in the local heap at the offset held in the scratch pad */
        if(cache_type == SOFT_LINK_CACHE_TYPE)
        {
            const uint64_t link_value_offset = cursor->readField(4, &scratch_pos);
            link.type = H5Read::SOFT_LINK;
            link.address = 0;
            link.target = H5Heap::readLocalString(cursor, heap_data_addr, link_value_offset);
        }

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Symbol: %s, %s, 0x%lx", link.name.c_str(), H5Read::link2str(link.type), (unsigned long)obj_hdr_addr);
        }

        addLink(link);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * addLink
 *----------------------------------------------------------------------------*/
void H5Header::addLink (const H5Read::link_info_t& link)
{
    if(!findLink(link.name, NULL))
    {
        links.push_back(link);
    }
}

// NOLINTEND(misc-no-recursion)
