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

#include "H5Group.h"
#include "H5Exception.h"

using H5Read::UnsupportedFeatureError;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Group::H5Group (std::shared_ptr<H5Cursor> _cursor, std::shared_ptr<H5Header> _header, const std::string& _path):
    cursor(std::move(_cursor)),
    header(std::move(_header)),
    path(_path)
{
    if(header->denseLinks)
    {
        mlog(WARNING, "Group %s stores links in a fractal heap, only links held in its header are listed", path.c_str());
    }
}

/*----------------------------------------------------------------------------
 * getPath
 *----------------------------------------------------------------------------*/
const std::string& H5Group::getPath (void) const
{
    return path;
}

/*----------------------------------------------------------------------------
 * getAddress
 *----------------------------------------------------------------------------*/
uint64_t H5Group::getAddress (void) const
{
    return header->address;
}

/*----------------------------------------------------------------------------
 * children
 *
 *  link names in storage order
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5Group::children (void) const
{
    std::vector<std::string> names;
    for(const H5Read::link_info_t& link: header->links)
    {
        names.push_back(link.name);
    }
    return names;
}

/*----------------------------------------------------------------------------
 * links
 *----------------------------------------------------------------------------*/
const std::vector<H5Read::link_info_t>& H5Group::links (void) const
{
    return header->links;
}

/*----------------------------------------------------------------------------
 * hasDenseLinks
 *----------------------------------------------------------------------------*/
bool H5Group::hasDenseLinks (void) const
{
    return header->denseLinks;
}

/*----------------------------------------------------------------------------
 * findAttributes
 *----------------------------------------------------------------------------*/
std::vector<H5Attribute> H5Group::findAttributes (void) const
{
    return header->attributes;
}

/*----------------------------------------------------------------------------
 * attribute
 *----------------------------------------------------------------------------*/
const H5Attribute& H5Group::attribute (const std::string& name) const
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
std::vector<std::string> H5Group::listAttributes (void) const
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
std::string H5Group::inspect (void) const
{
    std::string desc = "group " + path + "\n";
    desc += "  children: " + std::to_string(header->links.size()) + "\n";

    for(const H5Read::link_info_t& link: header->links)
    {
        desc += "    " + link.name;
        if(link.type == H5Read::SOFT_LINK)
        {
            desc += " -> " + link.target;
        }
        else if(link.type == H5Read::EXTERNAL_LINK)
        {
            desc += " -> " + link.filename + ":" + link.target;
        }
        desc += " (" + std::string(H5Read::link2str(link.type)) + ")\n";
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
