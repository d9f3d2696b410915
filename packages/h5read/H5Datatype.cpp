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

#include <cmath>
#include <cstring>

#include "H5Datatype.h"
#include "H5Exception.h"
#include "H5Heap.h"

using H5Read::FormatError;
using H5Read::UnsupportedFeatureError;
using H5Read::DataReadError;

// NOLINTBEGIN(misc-no-recursion)

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Datatype::H5Datatype (void):
    typeClass(UNKNOWN_TYPE),
    version(0),
    size(0),
    signedval(false),
    bigendian(false),
    pad(NULL_TERMINATED),
    charset(CHARSET_ASCII),
    vlentype(VLEN_SEQUENCE),
    reftype(OBJECT_REFERENCE),
    bitOffset(0),
    bitPrecision(0),
    signLocation(0),
    expLocation(0),
    expSize(0),
    mantLocation(0),
    mantSize(0),
    expBias(0)
{
}

/*----------------------------------------------------------------------------
 * decode
 *
 *  decodes a datatype message starting at pos; pos is advanced past the
 *  message including all nested member and base types
 *----------------------------------------------------------------------------*/
std::shared_ptr<H5Datatype> H5Datatype::decode (H5Cursor* cursor, uint64_t* pos, int depth)
{
    if(depth > H5Read::MAX_TYPE_DEPTH)
    {
        throw UnsupportedFeatureError("datatype nesting at 0x%lx exceeds maximum depth of %d", (unsigned long)*pos, H5Read::MAX_TYPE_DEPTH);
    }

    const uint64_t starting_position = *pos;
    std::shared_ptr<H5Datatype> dt = std::make_shared<H5Datatype>();

    /* Read Message Info */
    const uint64_t version_class = cursor->readField(4, pos);
    dt->size = (uint32_t)cursor->readField(4, pos);
    dt->version = (int)((version_class & 0xF0) >> 4);
    const uint32_t databits = (uint32_t)(version_class >> 8);
    const int type_class = (int)(version_class & 0x0F);

    if(H5READ_ERROR_CHECKING)
    {
        if(dt->version < 1 || dt->version > 5)
        {
            throw FormatError("invalid datatype version at 0x%lx: %d", (unsigned long)starting_position, dt->version);
        }
    }

    if(type_class >= UNKNOWN_TYPE)
    {
        throw UnsupportedFeatureError("unsupported datatype class at 0x%lx: %d", (unsigned long)starting_position, type_class);
    }

    dt->typeClass = (type_class_t)type_class;

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Datatype Message [%d]: 0x%lx, version %d, class %s, size %u", depth, (unsigned long)starting_position, dt->version, type2str(dt->typeClass), (unsigned)dt->size);
    }

    /* Read Data Class Properties */
    switch(dt->typeClass)
    {
        case FIXED_POINT_TYPE:
        {
            dt->bigendian = (databits & 0x01) != 0;
            dt->signedval = ((databits & 0x08) >> 3) == 1;
            dt->bitOffset = (uint16_t)cursor->readField(2, pos);
            dt->bitPrecision = (uint16_t)cursor->readField(2, pos);
            break;
        }

        case FLOATING_POINT_TYPE:
        {
            if(databits & 0x40)
            {
                throw UnsupportedFeatureError("VAX floating point byte order is not supported");
            }
            dt->bigendian = (databits & 0x01) != 0;
            dt->signedval = true;
            dt->signLocation = (uint8_t)((databits & 0xFF00) >> 8);
            dt->bitOffset = (uint16_t)cursor->readField(2, pos);
            dt->bitPrecision = (uint16_t)cursor->readField(2, pos);
            dt->expLocation = (uint8_t)cursor->readField(1, pos);
            dt->expSize = (uint8_t)cursor->readField(1, pos);
            dt->mantLocation = (uint8_t)cursor->readField(1, pos);
            dt->mantSize = (uint8_t)cursor->readField(1, pos);
            dt->expBias = (uint32_t)cursor->readField(4, pos);
            break;
        }

        case TIME_TYPE:
        {
            dt->bigendian = (databits & 0x01) != 0;
            dt->signedval = true;
            dt->bitPrecision = (uint16_t)cursor->readField(2, pos);
            break;
        }

        case STRING_TYPE:
        {
            dt->pad = (string_pad_t)(databits & 0x0F);
            dt->charset = (charset_t)((databits & 0xF0) >> 4);
            break;
        }

        case BIT_FIELD_TYPE:
        {
            dt->bigendian = (databits & 0x01) != 0;
            dt->bitOffset = (uint16_t)cursor->readField(2, pos);
            dt->bitPrecision = (uint16_t)cursor->readField(2, pos);
            break;
        }

        case OPAQUE_TYPE:
        {
            const uint32_t tag_len = databits & 0xFF;
            cursor->checkRange(*pos, tag_len);
            std::vector<uint8_t> tag_bytes(tag_len);
            cursor->readByteArray(tag_bytes.data(), tag_len, pos);
            dt->tag.assign(tag_bytes.begin(), tag_bytes.end());
            dt->tag.erase(dt->tag.find_last_not_of('\0') + 1);
            break;
        }

        case COMPOUND_TYPE:
        {
            dt->readCompound(cursor, pos, databits, depth);
            break;
        }

        case REFERENCE_TYPE:
        {
            dt->reftype = (reference_type_t)(databits & 0x0F);
            break;
        }

        case ENUMERATED_TYPE:
        {
            dt->readEnum(cursor, pos, databits, depth);
            break;
        }

        case VARIABLE_LENGTH_TYPE:
        {
            dt->vlentype = (vlen_type_t)(databits & 0x0F);
            dt->pad = (string_pad_t)((databits & 0xF0) >> 4);
            dt->charset = (charset_t)((databits & 0xF00) >> 8);

            /* Elements are Global Heap IDs: length, collection address, object index */
            const uint32_t heap_id_size = 4 + cursor->offsetSize() + 4;
            if(dt->size != heap_id_size)
            {
                throw FormatError("variable length element of %u bytes, expected %u", (unsigned)dt->size, (unsigned)heap_id_size);
            }

            dt->base = decode(cursor, pos, depth + 1);
            break;
        }

        case ARRAY_TYPE:
        {
            dt->readArray(cursor, pos, depth);
            break;
        }

        default:
        {
            throw UnsupportedFeatureError("unsupported datatype class: %d", type_class);
        }
    }

    return dt;
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* H5Datatype::type2str (type_class_t type_class)
{
    switch(type_class)
    {
        case FIXED_POINT_TYPE:      return "FIXED_POINT_TYPE";
        case FLOATING_POINT_TYPE:   return "FLOATING_POINT_TYPE";
        case TIME_TYPE:             return "TIME_TYPE";
        case STRING_TYPE:           return "STRING_TYPE";
        case BIT_FIELD_TYPE:        return "BIT_FIELD_TYPE";
        case OPAQUE_TYPE:           return "OPAQUE_TYPE";
        case COMPOUND_TYPE:         return "COMPOUND_TYPE";
        case REFERENCE_TYPE:        return "REFERENCE_TYPE";
        case ENUMERATED_TYPE:       return "ENUMERATED_TYPE";
        case VARIABLE_LENGTH_TYPE:  return "VARIABLE_LENGTH_TYPE";
        case ARRAY_TYPE:            return "ARRAY_TYPE";
        default:                    return "UNKNOWN_TYPE";
    }
}

/*----------------------------------------------------------------------------
 * decodeValue
 *
 *  data points to one element of this type; the cursor is only needed for
 *  variable length types which live in the global heap
 *----------------------------------------------------------------------------*/
H5Value H5Datatype::decodeValue (const uint8_t* data, H5Cursor* cursor) const
{
    switch(typeClass)
    {
        case FIXED_POINT_TYPE:
        case TIME_TYPE:
        {
            const uint64_t raw = readRaw(data);
            if(!signedval)
            {
                return H5Value::makeUnsigned(raw);
            }

            /* Sign Extend */
            if(size < 8)
            {
                const uint64_t sign_bit = 1ULL << ((size * 8) - 1);
                if(raw & sign_bit)
                {
                    return H5Value::makeInteger((int64_t)(raw | ~((sign_bit << 1) - 1)));
                }
            }
            return H5Value::makeInteger((int64_t)raw);
        }

        case FLOATING_POINT_TYPE:
        {
            return H5Value::makeReal(readFloat(data));
        }

        case STRING_TYPE:
        {
            std::string str(reinterpret_cast<const char*>(data), size);
            if(pad == SPACE_PADDED)
            {
                str.erase(str.find_last_not_of(' ') + 1);
            }
            else
            {
                const size_t nul = str.find('\0');
                if(nul != std::string::npos) str.erase(nul);
            }
            return H5Value::makeText(str);
        }

        case BIT_FIELD_TYPE:
        {
            return H5Value::makeUnsigned(readRaw(data));
        }

        case OPAQUE_TYPE:
        {
            return H5Value::makeBytes(data, size);
        }

        case COMPOUND_TYPE:
        {
            H5Value record = H5Value::makeRecord();
            for(const member_t& member: members)
            {
                record.addField(member.name, member.type->decodeValue(data + member.offset, cursor));
            }
            return record;
        }

        case REFERENCE_TYPE:
        {
            if(reftype == OBJECT_REFERENCE)
            {
                return H5Value::makeUnsigned(readRaw(data));
            }
            return H5Value::makeBytes(data, size);
        }

        case ENUMERATED_TYPE:
        {
            return base->decodeValue(data, cursor);
        }

        case VARIABLE_LENGTH_TYPE:
        {
            if(cursor == NULL)
            {
                throw DataReadError("variable length value requires an open source");
            }

            /* Read Global Heap ID */
            const int offsetsize = cursor->offsetSize();
            uint32_t length = 0;
            uint64_t collection_addr = 0;
            uint32_t index = 0;
            for(int i = 3; i >= 0; i--) length = (length << 8) | data[i];
            for(int i = offsetsize - 1; i >= 0; i--) collection_addr = (collection_addr << 8) | data[4 + i];
            for(int i = 3; i >= 0; i--) index = (index << 8) | data[4 + offsetsize + i];

            /* Empty or Unset */
            const bool empty = (length == 0) || (collection_addr == 0) || cursor->isUndefined(collection_addr);
            if(vlentype == VLEN_STRING)
            {
                if(empty) return H5Value::makeText("");
                const std::vector<uint8_t> obj = H5Heap::readGlobalObject(cursor, collection_addr, index);
                std::string str(obj.begin(), obj.begin() + MIN(obj.size(), (size_t)length));
                const size_t nul = str.find('\0');
                if(nul != std::string::npos) str.erase(nul);
                return H5Value::makeText(str);
            }

            H5Value list = H5Value::makeList();
            if(empty) return list;
            const std::vector<uint8_t> obj = H5Heap::readGlobalObject(cursor, collection_addr, index);
            if(obj.size() < (uint64_t)length * base->size)
            {
                throw DataReadError("variable length sequence truncated: %lu < %lu", (unsigned long)obj.size(), (unsigned long)length * base->size);
            }
            for(uint32_t i = 0; i < length; i++)
            {
                list.append(base->decodeValue(&obj[(size_t)i * base->size], cursor));
            }
            return list;
        }

        case ARRAY_TYPE:
        {
            H5Value list = H5Value::makeList();
            const uint64_t num_elements = arrayElements();
            for(uint64_t i = 0; i < num_elements; i++)
            {
                list.append(base->decodeValue(data + (i * base->size), cursor));
            }
            return list;
        }

        default:
        {
            throw UnsupportedFeatureError("cannot decode value of datatype class: %s", type2str(typeClass));
        }
    }
}

/*----------------------------------------------------------------------------
 * describe
 *----------------------------------------------------------------------------*/
std::string H5Datatype::describe (void) const
{
    const std::string bits = std::to_string(size * 8);

    switch(typeClass)
    {
        case FIXED_POINT_TYPE:      return (signedval ? "int" : "uint") + bits;
        case FLOATING_POINT_TYPE:   return "float" + bits;
        case TIME_TYPE:             return "time" + bits;
        case BIT_FIELD_TYPE:        return "bitfield" + bits;
        case OPAQUE_TYPE:           return "opaque(" + std::to_string(size) + (tag.empty() ? "" : ", " + tag) + ")";
        case REFERENCE_TYPE:        return reftype == OBJECT_REFERENCE ? "reference(object)" : "reference(region)";

        case STRING_TYPE:
        {
            const char* pad_str = pad == NULL_TERMINATED ? "nullterm" : (pad == NULL_PADDED ? "nullpad" : "spacepad");
            return "string(" + std::to_string(size) + ", " + pad_str + ", " + (charset == CHARSET_UTF8 ? "utf-8" : "ascii") + ")";
        }

        case COMPOUND_TYPE:
        {
            std::string str = "compound{";
            for(size_t m = 0; m < members.size(); m++)
            {
                if(m > 0) str += ", ";
                str += members[m].name + ": " + members[m].type->describe() + " @" + std::to_string(members[m].offset);
            }
            return str + "}";
        }

        case ENUMERATED_TYPE:
        {
            std::string str = "enum(" + base->describe() + "){";
            for(size_t m = 0; m < enumMembers.size(); m++)
            {
                if(m > 0) str += ", ";
                str += enumMembers[m].name + "=" + std::to_string(enumMembers[m].value);
            }
            return str + "}";
        }

        case VARIABLE_LENGTH_TYPE:
        {
            if(vlentype == VLEN_STRING) return "vlen string";
            return "vlen sequence of " + base->describe();
        }

        case ARRAY_TYPE:
        {
            std::string str = "array[";
            for(size_t d = 0; d < dims.size(); d++)
            {
                if(d > 0) str += "x";
                str += std::to_string(dims[d]);
            }
            return str + "] of " + base->describe();
        }

        default:                    return "unknown";
    }
}

/*----------------------------------------------------------------------------
 * arrayElements
 *----------------------------------------------------------------------------*/
uint64_t H5Datatype::arrayElements (void) const
{
    uint64_t num_elements = 1;
    for(const uint32_t dim: dims)
    {
        if(!H5Read::multiply(num_elements, dim, &num_elements))
        {
            throw FormatError("number of array elements overflows with %d dimensions", (int)dims.size());
        }
    }
    return num_elements;
}

/*----------------------------------------------------------------------------
 * isVariableString
 *----------------------------------------------------------------------------*/
bool H5Datatype::isVariableString (void) const
{
    return (typeClass == VARIABLE_LENGTH_TYPE) && (vlentype == VLEN_STRING);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readCompound
 *----------------------------------------------------------------------------*/
void H5Datatype::readCompound (H5Cursor* cursor, uint64_t* pos, uint32_t databits, int depth)
{
    const int num_members = (int)(databits & 0xFFFF);

    for(int m = 0; m < num_members; m++)
    {
        member_t member;

        /* Read Member Name and Offset */
        if(version < 3)
        {
            member.name = readPaddedName(cursor, pos);
            member.offset = (uint32_t)cursor->readField(4, pos);
        }
        else
        {
            member.name = cursor->readString(pos, 0);
            const int offset_size = (highestBit(size) / 8) + 1;
            member.offset = (uint32_t)cursor->readField(offset_size, pos);
        }

        /* Version 1 Carries Array Dimensions Inline */
        std::vector<uint32_t> member_dims;
        if(version == 1)
        {
            const uint8_t dimensionality = (uint8_t)cursor->readField(1, pos);
            *pos += 3 + 4 + 4; // reserved, permutation index, reserved
            for(int d = 0; d < 4; d++)
            {
                const uint32_t dim = (uint32_t)cursor->readField(4, pos);
                if(d < dimensionality) member_dims.push_back(dim);
            }
        }

        /* Read Member Type */
        member.type = decode(cursor, pos, depth + 1);
        if(!member_dims.empty())
        {
            std::shared_ptr<H5Datatype> array_type = std::make_shared<H5Datatype>();
            array_type->typeClass = ARRAY_TYPE;
            array_type->version = version;
            array_type->dims = member_dims;
            array_type->base = member.type;
            uint64_t array_size = 0;
            if(!H5Read::multiply(array_type->arrayElements(), member.type->size, &array_size) || (array_size > size))
            {
                throw FormatError("compound member %s array exceeds compound size %u", member.name.c_str(), (unsigned)size);
            }
            array_type->size = (uint32_t)array_size;
            member.type = array_type;
        }

        /* Check Member Fits in Compound */
        if((uint64_t)member.offset + member.type->size > size)
        {
            throw FormatError("compound member %s at offset %u with size %u exceeds compound size %u", member.name.c_str(), (unsigned)member.offset, (unsigned)member.type->size, (unsigned)size);
        }

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Compound Member [%d]: %s @%u, %s", depth, member.name.c_str(), (unsigned)member.offset, type2str(member.type->typeClass));
        }

        members.push_back(member);
    }
}

/*----------------------------------------------------------------------------
 * readEnum
 *
 *  base type, then all member names, then all member values
 *----------------------------------------------------------------------------*/
void H5Datatype::readEnum (H5Cursor* cursor, uint64_t* pos, uint32_t databits, int depth)
{
    const int num_members = (int)(databits & 0xFFFF);

    base = decode(cursor, pos, depth + 1);
    if(base->typeClass == COMPOUND_TYPE || base->typeClass == ARRAY_TYPE || base->typeClass == ENUMERATED_TYPE)
    {
        throw UnsupportedFeatureError("enumeration base type not supported: %s", type2str(base->typeClass));
    }

    if(base->size == 0 || base->size > 8 || base->size > size)
    {
        throw FormatError("invalid enumeration base size: %u", (unsigned)base->size);
    }

    /* Read Names */
    enumMembers.resize(num_members);
    for(int m = 0; m < num_members; m++)
    {
        if(version < 3) enumMembers[m].name = readPaddedName(cursor, pos);
        else            enumMembers[m].name = cursor->readString(pos, 0);
    }

    /* Read Values */
    std::vector<uint8_t> value_bytes(base->size);
    for(int m = 0; m < num_members; m++)
    {
        cursor->readByteArray(value_bytes.data(), base->size, pos);
        enumMembers[m].value = base->decodeValue(value_bytes.data(), cursor).asInt();
    }
}

/*----------------------------------------------------------------------------
 * readArray
 *----------------------------------------------------------------------------*/
void H5Datatype::readArray (H5Cursor* cursor, uint64_t* pos, int depth)
{
    const uint8_t dimensionality = (uint8_t)cursor->readField(1, pos);
    if(dimensionality > H5Read::MAX_NDIMS)
    {
        throw UnsupportedFeatureError("unsupported number of array dimensions: %d", (int)dimensionality);
    }

    if(version < 3)
    {
        *pos += 3; // reserved
    }

    for(int d = 0; d < dimensionality; d++)
    {
        dims.push_back((uint32_t)cursor->readField(4, pos));
    }

    if(version < 3)
    {
        *pos += 4 * dimensionality; // permutation indices
    }

    base = decode(cursor, pos, depth + 1);
    if(base->typeClass == ARRAY_TYPE)
    {
        throw UnsupportedFeatureError("nested array datatypes are not supported");
    }
    if(base->typeClass == COMPOUND_TYPE)
    {
        throw UnsupportedFeatureError("arrays of compound datatypes are not supported");
    }

    uint64_t array_size = 0;
    if(!H5Read::multiply(arrayElements(), base->size, &array_size) || (array_size > size) || (H5READ_ERROR_CHECKING && (array_size != size)))
    {
        throw FormatError("array datatype size %u does not match %lu elements of %u bytes", (unsigned)size, (unsigned long)arrayElements(), (unsigned)base->size);
    }
}

/*----------------------------------------------------------------------------
 * readRaw - integer of this type's size and byte order
 *----------------------------------------------------------------------------*/
uint64_t H5Datatype::readRaw (const uint8_t* data) const
{
    if(size == 0 || size > 8)
    {
        throw UnsupportedFeatureError("%u byte %s values are not supported", (unsigned)size, type2str(typeClass));
    }

    const uint32_t nbytes = size;
    uint64_t value = 0;
    if(bigendian)
    {
        for(uint32_t i = 0; i < nbytes; i++) value = (value << 8) | data[i];
    }
    else
    {
        for(int i = (int)nbytes - 1; i >= 0; i--) value = (value << 8) | data[i];
    }
    return value;
}

/*----------------------------------------------------------------------------
 * readFloat
 *----------------------------------------------------------------------------*/
double H5Datatype::readFloat (const uint8_t* data) const
{
    const uint64_t raw = readRaw(data);

    if(size == 4 && expSize == 8 && mantSize == 23)
    {
        const uint32_t bits = (uint32_t)raw;
        float value;
        memcpy(&value, &bits, sizeof(value));
        return value;
    }

    if(size == 8 && expSize == 11 && mantSize == 52)
    {
        double value;
        memcpy(&value, &raw, sizeof(value));
        return value;
    }

    /* Generic Decode from Bit Layout */
    if(size > 8 || expSize == 0 || expSize > 32 || mantSize > 63)
    {
        throw UnsupportedFeatureError("unsupported floating point layout: size %u, exponent %d bits, mantissa %d bits", (unsigned)size, (int)expSize, (int)mantSize);
    }

    const bool negative = ((raw >> signLocation) & 1) != 0;
    const uint64_t exp_max = (1ULL << expSize) - 1;
    const uint64_t exponent = (raw >> expLocation) & exp_max;
    const uint64_t mantissa = (raw >> mantLocation) & ((1ULL << mantSize) - 1);

    double value;
    if(exponent == exp_max)
    {
        value = (mantissa == 0) ? INFINITY : NAN;
    }
    else if(exponent == 0)
    {
        value = ldexp((double)mantissa, 1 - (int)expBias - mantSize);
    }
    else
    {
        value = ldexp((double)((1ULL << mantSize) | mantissa), (int)exponent - (int)expBias - mantSize);
    }

    return negative ? -value : value;
}

/*----------------------------------------------------------------------------
 * readPaddedName - null terminated and padded to an 8-byte boundary
 *----------------------------------------------------------------------------*/
std::string H5Datatype::readPaddedName (H5Cursor* cursor, uint64_t* pos)
{
    const uint64_t name_position = *pos;
    std::string name = cursor->readString(pos, 0);
    const uint64_t name_size = name.size() + 1;
    *pos = name_position + name_size + ((8 - (name_size % 8)) % 8);
    return name;
}

/*----------------------------------------------------------------------------
 * highestBit
 *----------------------------------------------------------------------------*/
int H5Datatype::highestBit (uint64_t value)
{
    int bit = 0;
    while(value >>= 1) bit++;
    return bit;
}

// NOLINTEND(misc-no-recursion)
