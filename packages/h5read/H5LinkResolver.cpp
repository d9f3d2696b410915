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

#include "H5LinkResolver.h"
#include "H5Exception.h"

using H5Read::FormatError;
using H5Read::UnsupportedFeatureError;
using H5Read::CircularLinkError;
using H5Read::DatasetNotFoundError;
using H5Read::GroupNotFoundError;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5LinkResolver::H5LinkResolver (std::shared_ptr<H5Cursor> _cursor, uint64_t _root):
    cursor(std::move(_cursor)),
    root(_root)
{
}

/*----------------------------------------------------------------------------
 * resolve
 *
 *  walks the path one segment at a time from the root group; hard links
 *  replace the current object, soft links restart the walk from the root
 *  with the link target followed by the segments not yet walked
 *----------------------------------------------------------------------------*/
H5LinkResolver::resolution_t H5LinkResolver::resolve (const std::string& path, H5Read::object_type_t expected)
{
    resolution_t result;
    result.state = UNVISITED;
    result.address = root;

    std::vector<std::string> segments = splitPath(path);
    std::vector<std::string> walked;
    std::set<std::string> visited;
    visited.insert(joinPath(segments));

    std::string last_soft_link;
    uint64_t current = root;
    size_t s = 0;
    int hops = 0;

    result.state = VISITING;
    while(s < segments.size())
    {
        const H5Header group(cursor, current);

        H5Read::link_info_t link;
        if(!group.findLink(segments[s], &link))
        {
            const std::string walked_path = joinPath(walked);
            if(group.denseLinks)
            {
                throw UnsupportedFeatureError("group %s stores its links in a fractal heap, cannot find %s", walked_path.c_str(), segments[s].c_str());
            }

            result.state = BROKEN;
            if(group.objectType() == H5Read::OBJECT_DATASET)
            {
                notFound(path, expected, walked_path + " is a dataset, not a group");
            }
            else if(!last_soft_link.empty())
            {
                notFound(path, expected, "soft link " + last_soft_link + " points to missing object " + joinPath(segments));
            }
            else
            {
                notFound(path, expected, segments[s] + " does not exist in " + walked_path);
            }
        }

        if(H5READ_VERBOSE)
        {
            mlog(DEBUG, "Resolve %s: %s link %s at %s", path.c_str(), H5Read::link2str(link.type), segments[s].c_str(), joinPath(walked).c_str());
        }

        if(link.type == H5Read::HARD_LINK)
        {
            current = link.address;
            walked.push_back(segments[s]);
            s++;
        }
        else if(link.type == H5Read::SOFT_LINK)
        {
            std::vector<std::string> target = normalize(link.target, walked);
            target.insert(target.end(), segments.begin() + s + 1, segments.end());

            std::vector<std::string> link_segments = walked;
            link_segments.push_back(segments[s]);
            last_soft_link = joinPath(link_segments);

            const std::string target_path = joinPath(target);
            if(!visited.insert(target_path).second || (++hops > H5Read::MAX_LINK_DEPTH))
            {
                result.state = CIRCULAR;
                throw CircularLinkError("soft link %s -> %s revisits %s while resolving %s after %d hops",
                                        last_soft_link.c_str(), link.target.c_str(), target_path.c_str(), path.c_str(), hops);
            }

            /* Restart From Root */
            segments = target;
            walked.clear();
            current = root;
            s = 0;
        }
        else if(link.type == H5Read::EXTERNAL_LINK)
        {
            throw UnsupportedFeatureError("external link %s -> %s:%s is not followed", segments[s].c_str(), link.filename.c_str(), link.target.c_str());
        }
        else
        {
            throw FormatError("invalid link type for %s: %d", segments[s].c_str(), (int)link.type);
        }
    }

    /* Check Object Kind */
    result.header = std::make_shared<H5Header>(cursor, current);
    result.address = current;
    result.path = joinPath(walked);

    H5Read::object_type_t type = result.header->objectType();
    if((type == H5Read::OBJECT_UNKNOWN) && (current == root))
    {
        type = H5Read::OBJECT_GROUP; // an empty root group carries no group messages
    }

    if((expected == H5Read::OBJECT_DATASET) && (type != H5Read::OBJECT_DATASET))
    {
        result.state = BROKEN;
        throw DatasetNotFoundError("%s is a %s, not a dataset", path.c_str(), H5Read::object2str(type));
    }

    if((expected == H5Read::OBJECT_GROUP) && (type != H5Read::OBJECT_GROUP))
    {
        result.state = BROKEN;
        throw GroupNotFoundError("%s is a %s, not a group", path.c_str(), H5Read::object2str(type));
    }

    result.state = RESOLVED;
    return result;
}

/*----------------------------------------------------------------------------
 * lookupLink
 *
 *  returns the link record naming the last segment of the path, without
 *  following it
 *----------------------------------------------------------------------------*/
bool H5LinkResolver::lookupLink (const std::string& path, H5Read::link_info_t* link)
{
    std::vector<std::string> segments = splitPath(path);
    if(segments.empty())
    {
        return false; // root is not named by a link
    }

    const std::string name = segments.back();
    segments.pop_back();

    const resolution_t parent = resolve(joinPath(segments), H5Read::OBJECT_GROUP);
    return parent.header->findLink(name, link);
}

/*----------------------------------------------------------------------------
 * splitPath
 *
 *  empty and "." segments are dropped, ".." removes the previous segment
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5LinkResolver::splitPath (const std::string& path)
{
    std::vector<std::string> segments;

    size_t start = 0;
    while(start <= path.size())
    {
        size_t end = path.find(PATH_DELIMETER, start);
        if(end == std::string::npos) end = path.size();

        const std::string segment = path.substr(start, end - start);
        if(segment == "..")
        {
            if(!segments.empty()) segments.pop_back();
        }
        else if(!segment.empty() && segment != ".")
        {
            segments.push_back(segment);
        }

        start = end + 1;
    }

    return segments;
}

/*----------------------------------------------------------------------------
 * joinPath
 *----------------------------------------------------------------------------*/
std::string H5LinkResolver::joinPath (const std::vector<std::string>& segments)
{
    if(segments.empty()) return PATH_DELIMETER_STR;

    std::string path;
    for(const std::string& segment: segments)
    {
        path += PATH_DELIMETER_STR + segment;
    }
    return path;
}

/*----------------------------------------------------------------------------
 * normalize
 *
 *  converts a soft link target into absolute segments; relative targets
 *  start from the group holding the link
 *----------------------------------------------------------------------------*/
std::vector<std::string> H5LinkResolver::normalize (const std::string& target, const std::vector<std::string>& group)
{
    if(!target.empty() && target[0] == PATH_DELIMETER)
    {
        return splitPath(target);
    }

    return splitPath(joinPath(group) + PATH_DELIMETER_STR + target);
}

/*----------------------------------------------------------------------------
 * state2str
 *----------------------------------------------------------------------------*/
const char* H5LinkResolver::state2str (state_t state)
{
    switch(state)
    {
        case UNVISITED:     return "UNVISITED";
        case VISITING:      return "VISITING";
        case RESOLVED:      return "RESOLVED";
        case BROKEN:        return "BROKEN";
        case CIRCULAR:      return "CIRCULAR";
        default:            return "UNKNOWN";
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * notFound
 *----------------------------------------------------------------------------*/
void H5LinkResolver::notFound (const std::string& path, H5Read::object_type_t expected, const std::string& reason)
{
    if(expected == H5Read::OBJECT_GROUP)
    {
        throw GroupNotFoundError("group %s not found: %s", path.c_str(), reason.c_str());
    }

    throw DatasetNotFoundError("dataset %s not found: %s", path.c_str(), reason.c_str());
}
