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

#include <cctype>
#include <exception>

#include "H5File.h"
#include "H5Exception.h"
#include "H5LinkResolver.h"

using H5Read::FormatError;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor - file
 *----------------------------------------------------------------------------*/
H5File::H5File (const char* filename):
    cursor(std::make_shared<H5Cursor>(new H5Cursor::FileIODriver(filename))),
    name(filename),
    sbVersion(-1),
    rootAddr(0)
{
    readSuperblock();
    mlog(INFO, "Opened %s: superblock version %d, root group at 0x%lx", name.c_str(), sbVersion, (unsigned long)rootAddr);
}

/*----------------------------------------------------------------------------
 * Constructor - memory
 *----------------------------------------------------------------------------*/
H5File::H5File (std::vector<uint8_t> buffer, const char* _name):
    cursor(std::make_shared<H5Cursor>(new H5Cursor::MemoryIODriver(std::move(buffer), _name))),
    name(_name),
    sbVersion(-1),
    rootAddr(0)
{
    readSuperblock();
    mlog(INFO, "Opened %s: superblock version %d, root group at 0x%lx", name.c_str(), sbVersion, (unsigned long)rootAddr);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5File::~H5File (void)
{
    close();
}

/*----------------------------------------------------------------------------
 * dataset
 *----------------------------------------------------------------------------*/
H5Dataset H5File::dataset (const std::string& path)
{
    H5LinkResolver resolver(cursor, rootAddr);
    const H5LinkResolver::resolution_t resolution = resolver.resolve(path, H5Read::OBJECT_DATASET);
    return H5Dataset(cursor, resolution.header, resolution.path);
}

/*----------------------------------------------------------------------------
 * group
 *----------------------------------------------------------------------------*/
H5Group H5File::group (const std::string& path)
{
    H5LinkResolver resolver(cursor, rootAddr);
    const H5LinkResolver::resolution_t resolution = resolver.resolve(path, H5Read::OBJECT_GROUP);
    return H5Group(cursor, resolution.header, resolution.path);
}

/*----------------------------------------------------------------------------
 * root
 *----------------------------------------------------------------------------*/
H5Group H5File::root (void)
{
    return group(PATH_DELIMETER_STR);
}

/*----------------------------------------------------------------------------
 * readData
 *----------------------------------------------------------------------------*/
std::vector<H5Value> H5File::readData (const std::string& path)
{
    return dataset(path).readData();
}

/*----------------------------------------------------------------------------
 * readAsBool
 *----------------------------------------------------------------------------*/
std::vector<bool> H5File::readAsBool (const std::string& path)
{
    return dataset(path).readAsBool();
}

/*----------------------------------------------------------------------------
 * readAsTime
 *----------------------------------------------------------------------------*/
std::vector<H5Read::gmt_time_t> H5File::readAsTime (const std::string& path, H5Read::time_unit_t unit)
{
    return dataset(path).readAsTime(unit);
}

/*----------------------------------------------------------------------------
 * getObjectType
 *----------------------------------------------------------------------------*/
H5Read::object_type_t H5File::getObjectType (const std::string& path)
{
    try
    {
        H5LinkResolver resolver(cursor, rootAddr);
        const H5LinkResolver::resolution_t resolution = resolver.resolve(path, H5Read::OBJECT_UNKNOWN);
        const H5Read::object_type_t type = resolution.header->objectType();
        if((type == H5Read::OBJECT_UNKNOWN) && (resolution.address == rootAddr))
        {
            return H5Read::OBJECT_GROUP;
        }
        return type;
    }
    catch(const RunTimeException& e)
    {
        mlog(DEBUG, "Unable to determine object type of %s: %s", path.c_str(), e.what());
        return H5Read::OBJECT_UNKNOWN;
    }
    catch(const std::exception& e)
    {
        mlog(DEBUG, "Unable to determine object type of %s: %s", path.c_str(), e.what());
        return H5Read::OBJECT_UNKNOWN;
    }
}

/*----------------------------------------------------------------------------
 * isSoftLink
 *----------------------------------------------------------------------------*/
bool H5File::isSoftLink (const std::string& path)
{
    H5Read::link_info_t link;
    return getLinkInfo(path, &link) && (link.type == H5Read::SOFT_LINK);
}

/*----------------------------------------------------------------------------
 * isHardLink
 *----------------------------------------------------------------------------*/
bool H5File::isHardLink (const std::string& path)
{
    H5Read::link_info_t link;
    return getLinkInfo(path, &link) && (link.type == H5Read::HARD_LINK);
}

/*----------------------------------------------------------------------------
 * isExternalLink
 *----------------------------------------------------------------------------*/
bool H5File::isExternalLink (const std::string& path)
{
    H5Read::link_info_t link;
    return getLinkInfo(path, &link) && (link.type == H5Read::EXTERNAL_LINK);
}

/*----------------------------------------------------------------------------
 * getLinkInfo
 *
 *  returns false when the path does not name a link, never throws
 *----------------------------------------------------------------------------*/
bool H5File::getLinkInfo (const std::string& path, H5Read::link_info_t* info)
{
    try
    {
        H5LinkResolver resolver(cursor, rootAddr);
        H5Read::link_info_t link;
        if(!resolver.lookupLink(path, &link))
        {
            return false;
        }
        if(info) *info = link;
        return true;
    }
    catch(const RunTimeException& e)
    {
        mlog(DEBUG, "No link information for %s: %s", path.c_str(), e.what());
        return false;
    }
    catch(const std::exception& e)
    {
        mlog(DEBUG, "No link information for %s: %s", path.c_str(), e.what());
        return false;
    }
}

/*----------------------------------------------------------------------------
 * listRecursive
 *
 *  depth first list of full paths below a group; soft and external links
 *  are listed but not followed
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5File::listRecursive (const std::string& path)
{
    H5LinkResolver resolver(cursor, rootAddr);
    const H5LinkResolver::resolution_t resolution = resolver.resolve(path, H5Read::OBJECT_GROUP);

    std::set<uint64_t> visited;
    visited.insert(resolution.address);

    std::vector<entry_t> entries;
    walk(resolution.path, *resolution.header, visited, 0, &entries, NULL);

    std::vector<std::string> paths;
    for(const entry_t& entry: entries)
    {
        paths.push_back(entry.path);
    }
    return paths;
}

/*----------------------------------------------------------------------------
 * structure
 *----------------------------------------------------------------------------*/
std::string H5File::structure (void)
{
    const H5Header root_header(cursor, rootAddr);

    std::set<uint64_t> visited;
    visited.insert(rootAddr);

    std::string desc = name + " " + PATH_DELIMETER_STR + " (group)\n";
    walk(PATH_DELIMETER_STR, root_header, visited, 1, NULL, &desc);
    return desc;
}

/*----------------------------------------------------------------------------
 * dereference
 *
 *  path of the first object reached through hard links whose header lives
 *  at the address
 *----------------------------------------------------------------------------*/
std::string H5File::dereference (uint64_t address)
{
    if(address == rootAddr)
    {
        return PATH_DELIMETER_STR;
    }

    const H5Header root_header(cursor, rootAddr);

    std::set<uint64_t> visited;
    visited.insert(rootAddr);

    std::vector<entry_t> entries;
    walk(PATH_DELIMETER_STR, root_header, visited, 0, &entries, NULL);

    for(const entry_t& entry: entries)
    {
        if((entry.link.type == H5Read::HARD_LINK) && (entry.link.address == address))
        {
            return entry.path;
        }
    }

    throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "no object in %s at address 0x%lx", name.c_str(), (unsigned long)address);
}

/*----------------------------------------------------------------------------
 * close
 *----------------------------------------------------------------------------*/
void H5File::close (void)
{
    if(cursor && cursor->isOpen())
    {
        cursor->close();
        mlog(INFO, "Closed %s", name.c_str());
    }
}

/*----------------------------------------------------------------------------
 * isOpen
 *----------------------------------------------------------------------------*/
bool H5File::isOpen (void) const
{
    return cursor && cursor->isOpen();
}

/*----------------------------------------------------------------------------
 * getName
 *----------------------------------------------------------------------------*/
const char* H5File::getName (void) const
{
    return name.c_str();
}

/*----------------------------------------------------------------------------
 * superblockVersion
 *----------------------------------------------------------------------------*/
int H5File::superblockVersion (void) const
{
    return sbVersion;
}

/*----------------------------------------------------------------------------
 * rootAddress
 *----------------------------------------------------------------------------*/
uint64_t H5File::rootAddress (void) const
{
    return rootAddr;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readSuperblock
 *----------------------------------------------------------------------------*/
void H5File::readSuperblock (void)
{
    static const uint64_t signature_offsets[] = { H5READ_SIGNATURE_OFFSETS };
    static const int num_signature_offsets = sizeof(signature_offsets) / sizeof(signature_offsets[0]);

    /* Locate Signature */
    bool found = false;
    for(int i = 0; i < num_signature_offsets && !found; i++)
    {
        uint64_t pos = signature_offsets[i];
        if(pos + 8 > cursor->size()) break;

        const uint64_t signature = cursor->readField(8, &pos);
        if(signature == H5Read::H5_SIGNATURE_LE)
        {
            cursor->setBaseAddress(signature_offsets[i]);
            found = true;
        }
    }

    if(!found)
    {
        throw FormatError("invalid h5 file signature: %s", name.c_str());
    }

    /* Addresses Are Relative to the Signature */
    uint64_t pos = 8;
    sbVersion = (int)cursor->readField(1, &pos);

    if(sbVersion == 0 || sbVersion == 1)
    {
        /* Read and Verify Superblock Info */
        if(H5READ_ERROR_CHECKING)
        {
            const uint8_t freespace_version = (uint8_t)cursor->readField(1, &pos);
            if(freespace_version != 0)
            {
                throw FormatError("unsupported h5 file free space version: %d", (int)freespace_version);
            }

            const uint8_t roottable_version = (uint8_t)cursor->readField(1, &pos);
            if(roottable_version != 0)
            {
                throw FormatError("unsupported h5 file root table version: %d", (int)roottable_version);
            }
        }

        /* Read Sizes */
        pos = 13;
        const int offsetsize = (int)cursor->readField(1, &pos);
        const int lengthsize = (int)cursor->readField(1, &pos);
        cursor->setSizes(offsetsize, lengthsize);

        /* Version 1 adds the indexed storage K value and two reserved bytes */
        const uint64_t addresses = (sbVersion == 1) ? 28 : 24;

        /* Read Root Group Symbol Table Entry */
        pos = addresses + (4 * offsetsize);
        pos += offsetsize; // link name offset
        rootAddr = cursor->readOffset(&pos);
    }
    else if(sbVersion == 2 || sbVersion == 3)
    {
        /* Read Sizes */
        pos = 9;
        const int offsetsize = (int)cursor->readField(1, &pos);
        const int lengthsize = (int)cursor->readField(1, &pos);
        cursor->setSizes(offsetsize, lengthsize);

        /* Read Root Group Object Header Address */
        pos = 12 + (3 * offsetsize);
        rootAddr = cursor->readOffset(&pos);
    }
    else
    {
        throw FormatError("unsupported h5 file superblock version: %d", sbVersion);
    }

    if(H5READ_VERBOSE)
    {
        mlog(DEBUG, "Superblock: version %d, offsets %d, lengths %d, base 0x%lx, root 0x%lx", sbVersion,
             cursor->offsetSize(), cursor->lengthSize(), (unsigned long)cursor->getBaseAddress(), (unsigned long)rootAddr);
    }
}

/*----------------------------------------------------------------------------
 * walk
 *
 *  depth first over the links of a group, descending into groups reached
 *  through hard links that have not been visited yet
 *----------------------------------------------------------------------------*/
// NOLINTBEGIN(misc-no-recursion)
void H5File::walk (const std::string& group_path, const H5Header& group_header, std::set<uint64_t>& visited,
                   int level, std::vector<entry_t>* entries, std::string* desc)
{
    const std::string indent(level * 2, ' ');
    const std::string prefix = (group_path == PATH_DELIMETER_STR) ? std::string() : group_path;

    for(const H5Read::link_info_t& link: group_header.links)
    {
        const std::string child_path = prefix + PATH_DELIMETER_STR + link.name;
        if(entries)
        {
            const entry_t entry = {child_path, link};
            entries->push_back(entry);
        }

        if(link.type == H5Read::SOFT_LINK)
        {
            if(desc) *desc += indent + link.name + " -> " + link.target + " (soft link)\n";
        }
        else if(link.type == H5Read::EXTERNAL_LINK)
        {
            if(desc) *desc += indent + link.name + " -> " + link.filename + ":" + link.target + " (external link)\n";
        }
        else
        {
            const H5Header child(cursor, link.address);
            const H5Read::object_type_t type = child.objectType();

            if(desc)
            {
                if(type == H5Read::OBJECT_DATASET)
                {
                    const std::string dims = child.dataspace.null ? std::string("null") : H5Read::dims2str(child.dataspace.dims);
                    *desc += indent + link.name + " (dataset " + (child.datatype ? child.datatype->describe() : std::string("?")) + " " + dims + ")\n";
                }
                else
                {
                    std::string kind = H5Read::object2str(type);
                    for(char& c: kind) c = (char)tolower(c);
                    *desc += indent + link.name + " (" + kind + ")\n";
                }
            }

            if((type == H5Read::OBJECT_GROUP) && visited.insert(link.address).second)
            {
                walk(child_path, child, visited, level + 1, entries, desc);
            }
        }
    }
}
// NOLINTEND(misc-no-recursion)
