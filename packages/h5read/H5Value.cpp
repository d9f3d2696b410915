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

#include "H5Value.h"
#include "RunTimeException.h"

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Value::H5Value (void):
    valueKind(NIL)
{
    scalar.uval = 0;
}

/*----------------------------------------------------------------------------
 * makeInteger
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeInteger (int64_t value)
{
    H5Value v;
    v.valueKind = INTEGER;
    v.scalar.lval = value;
    return v;
}

/*----------------------------------------------------------------------------
 * makeUnsigned
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeUnsigned (uint64_t value)
{
    H5Value v;
    v.valueKind = UNSIGNED;
    v.scalar.uval = value;
    return v;
}

/*----------------------------------------------------------------------------
 * makeReal
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeReal (double value)
{
    H5Value v;
    v.valueKind = REAL;
    v.scalar.dval = value;
    return v;
}

/*----------------------------------------------------------------------------
 * makeText
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeText (const std::string& value)
{
    H5Value v;
    v.valueKind = TEXT;
    v.text = value;
    return v;
}

/*----------------------------------------------------------------------------
 * makeBytes
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeBytes (const uint8_t* data, size_t size)
{
    H5Value v;
    v.valueKind = BYTES;
    v.bytes.assign(data, data + size);
    return v;
}

/*----------------------------------------------------------------------------
 * makeList
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeList (void)
{
    H5Value v;
    v.valueKind = LIST;
    return v;
}

/*----------------------------------------------------------------------------
 * makeRecord
 *----------------------------------------------------------------------------*/
H5Value H5Value::makeRecord (void)
{
    H5Value v;
    v.valueKind = RECORD;
    return v;
}

/*----------------------------------------------------------------------------
 * kind2str
 *----------------------------------------------------------------------------*/
const char* H5Value::kind2str (kind_t kind)
{
    switch(kind)
    {
        case NIL:       return "NIL";
        case INTEGER:   return "INTEGER";
        case UNSIGNED:  return "UNSIGNED";
        case REAL:      return "REAL";
        case TEXT:      return "TEXT";
        case BYTES:     return "BYTES";
        case LIST:      return "LIST";
        case RECORD:    return "RECORD";
        default:        return "UNKNOWN";
    }
}

/*----------------------------------------------------------------------------
 * append
 *----------------------------------------------------------------------------*/
void H5Value::append (const H5Value& item)
{
    if(valueKind != LIST)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "cannot append to %s value", kind2str(valueKind));
    }
    elements.push_back(item);
}

/*----------------------------------------------------------------------------
 * addField
 *----------------------------------------------------------------------------*/
void H5Value::addField (const std::string& field_name, const H5Value& item)
{
    if(valueKind != RECORD)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "cannot add field %s to %s value", field_name.c_str(), kind2str(valueKind));
    }
    names.push_back(field_name);
    elements.push_back(item);
}

/*----------------------------------------------------------------------------
 * kind
 *----------------------------------------------------------------------------*/
H5Value::kind_t H5Value::kind (void) const
{
    return valueKind;
}

/*----------------------------------------------------------------------------
 * isNil
 *----------------------------------------------------------------------------*/
bool H5Value::isNil (void) const
{
    return valueKind == NIL;
}

/*----------------------------------------------------------------------------
 * isNumeric
 *----------------------------------------------------------------------------*/
bool H5Value::isNumeric (void) const
{
    return (valueKind == INTEGER) || (valueKind == UNSIGNED) || (valueKind == REAL);
}

/*----------------------------------------------------------------------------
 * asInt
 *----------------------------------------------------------------------------*/
int64_t H5Value::asInt (void) const
{
    switch(valueKind)
    {
        case INTEGER:   return scalar.lval;
        case UNSIGNED:  return static_cast<int64_t>(scalar.uval);
        case REAL:      return static_cast<int64_t>(scalar.dval);
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value is not numeric", kind2str(valueKind));
    }
}

/*----------------------------------------------------------------------------
 * asUInt
 *----------------------------------------------------------------------------*/
uint64_t H5Value::asUInt (void) const
{
    switch(valueKind)
    {
        case INTEGER:   return static_cast<uint64_t>(scalar.lval);
        case UNSIGNED:  return scalar.uval;
        case REAL:      return static_cast<uint64_t>(scalar.dval);
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value is not numeric", kind2str(valueKind));
    }
}

/*----------------------------------------------------------------------------
 * asDouble
 *----------------------------------------------------------------------------*/
double H5Value::asDouble (void) const
{
    switch(valueKind)
    {
        case INTEGER:   return static_cast<double>(scalar.lval);
        case UNSIGNED:  return static_cast<double>(scalar.uval);
        case REAL:      return scalar.dval;
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value is not numeric", kind2str(valueKind));
    }
}

/*----------------------------------------------------------------------------
 * asBool
 *
 *  booleans are stored as 1-byte fixed point values: 0 is false, anything
 *  else is true
 *----------------------------------------------------------------------------*/
bool H5Value::asBool (void) const
{
    switch(valueKind)
    {
        case INTEGER:   return scalar.lval != 0;
        case UNSIGNED:  return scalar.uval != 0;
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value cannot be decoded as a boolean", kind2str(valueKind));
    }
}

/*----------------------------------------------------------------------------
 * asString
 *----------------------------------------------------------------------------*/
const std::string& H5Value::asString (void) const
{
    if(valueKind != TEXT)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value is not text", kind2str(valueKind));
    }
    return text;
}

/*----------------------------------------------------------------------------
 * asBytes
 *----------------------------------------------------------------------------*/
const std::vector<uint8_t>& H5Value::asBytes (void) const
{
    if(valueKind != BYTES)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value is not a byte sequence", kind2str(valueKind));
    }
    return bytes;
}

/*----------------------------------------------------------------------------
 * asTime
 *----------------------------------------------------------------------------*/
H5Read::gmt_time_t H5Value::asTime (H5Read::time_unit_t unit) const
{
    if(valueKind != INTEGER && valueKind != UNSIGNED)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value cannot be decoded as a time", kind2str(valueKind));
    }
    return H5Read::ticks2gmt(asInt(), unit);
}

/*----------------------------------------------------------------------------
 * size
 *----------------------------------------------------------------------------*/
size_t H5Value::size (void) const
{
    switch(valueKind)
    {
        case NIL:       return 0;
        case TEXT:      return text.size();
        case BYTES:     return bytes.size();
        case LIST:      return elements.size();
        case RECORD:    return elements.size();
        default:        return 1;
    }
}

/*----------------------------------------------------------------------------
 * operator[]
 *----------------------------------------------------------------------------*/
const H5Value& H5Value::operator[] (size_t index) const
{
    if(valueKind != LIST && valueKind != RECORD)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "%s value cannot be indexed", kind2str(valueKind));
    }

    if(index >= elements.size())
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "index %lu out of range (%lu items)", static_cast<unsigned long>(index), static_cast<unsigned long>(elements.size()));
    }

    return elements[index];
}

/*----------------------------------------------------------------------------
 * field
 *----------------------------------------------------------------------------*/
const H5Value& H5Value::field (const std::string& field_name) const
{
    for(size_t i = 0; i < names.size(); i++)
    {
        if(names[i] == field_name)
        {
            return elements[i];
        }
    }

    throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "field %s not found in %s value", field_name.c_str(), kind2str(valueKind));
}

/*----------------------------------------------------------------------------
 * hasField
 *----------------------------------------------------------------------------*/
bool H5Value::hasField (const std::string& field_name) const
{
    for(const std::string& n: names)
    {
        if(n == field_name) return true;
    }
    return false;
}

/*----------------------------------------------------------------------------
 * fieldNames
 *----------------------------------------------------------------------------*/
const std::vector<std::string>& H5Value::fieldNames (void) const
{
    return names;
}

/*----------------------------------------------------------------------------
 * items
 *----------------------------------------------------------------------------*/
const std::vector<H5Value>& H5Value::items (void) const
{
    return elements;
}

/*----------------------------------------------------------------------------
 * operator==
 *----------------------------------------------------------------------------*/
bool H5Value::operator== (const H5Value& other) const
{
    if(valueKind != other.valueKind) return false;

    switch(valueKind)
    {
        case NIL:       return true;
        case INTEGER:   return scalar.lval == other.scalar.lval;
        case UNSIGNED:  return scalar.uval == other.scalar.uval;
        case REAL:      return memcmp(&scalar.dval, &other.scalar.dval, sizeof(double)) == 0;
        case TEXT:      return text == other.text;
        case BYTES:     return bytes == other.bytes;
        case LIST:      return elements == other.elements;
        case RECORD:    return (names == other.names) && (elements == other.elements);
        default:        return false;
    }
}

/*----------------------------------------------------------------------------
 * operator!=
 *----------------------------------------------------------------------------*/
bool H5Value::operator!= (const H5Value& other) const
{
    return !(*this == other);
}

/*----------------------------------------------------------------------------
 * toString
 *----------------------------------------------------------------------------*/
std::string H5Value::toString (void) const
{
    switch(valueKind)
    {
        case NIL:       return "nil";
        case INTEGER:   return std::to_string(scalar.lval);
        case UNSIGNED:  return std::to_string(scalar.uval);
        case REAL:
        {
            char buf[32];
            snprintf(buf, sizeof(buf), "%g", scalar.dval);
            return buf;
        }
        case TEXT:      return "\"" + text + "\"";
        case BYTES:     return "<" + std::to_string(bytes.size()) + " bytes>";
        case LIST:
        {
            std::string str = "[";
            for(size_t i = 0; i < elements.size(); i++)
            {
                if(i > 0) str += ", ";
                str += elements[i].toString();
            }
            return str + "]";
        }
        case RECORD:
        {
            std::string str = "{";
            for(size_t i = 0; i < elements.size(); i++)
            {
                if(i > 0) str += ", ";
                str += names[i] + ": " + elements[i].toString();
            }
            return str + "}";
        }
        default:        return "?";
    }
}
