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

#ifndef __ut_h5builder__
#define __ut_h5builder__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "H5Read.h"
#include "H5Filter.h"

/******************************************************************************
 * H5 BUILDER CLASS
 *
 *  writes minimal but well formed h5 images into memory for the unit tests;
 *  offsets and lengths are 8 bytes and objects are appended on 8-byte
 *  boundaries, children before their parents
 ******************************************************************************/

class H5Builder
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::vector<uint8_t> bytes_t;

        struct message_t {
            uint8_t     type;
            bytes_t     body;
            uint8_t     flags;
        };

        struct chunk_entry_t {
            std::vector<uint64_t>   offsets;
            uint32_t                size;
            uint32_t                mask;
            uint64_t                address;
        };

        struct member_t {
            std::string name;
            uint32_t    offset;
            bytes_t     type;
        };

        struct symbol_t {
            std::string name;
            uint64_t    address;
            std::string soft;       // non-empty for a soft link
        };

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static constexpr uint64_t UNDEF = 0xFFFFFFFFFFFFFFFFULL;

        static constexpr uint8_t DATASPACE      = 0x01;
        static constexpr uint8_t LINK_INFO      = 0x02;
        static constexpr uint8_t DATATYPE       = 0x03;
        static constexpr uint8_t FILL_VALUE     = 0x05;
        static constexpr uint8_t LINK           = 0x06;
        static constexpr uint8_t DATA_LAYOUT    = 0x08;
        static constexpr uint8_t FILTER         = 0x0B;
        static constexpr uint8_t ATTRIBUTE      = 0x0C;
        static constexpr uint8_t HEADER_CONT    = 0x10;
        static constexpr uint8_t SYMBOL_TABLE   = 0x11;
        static constexpr uint8_t ATTRIBUTE_INFO = 0x15;

        /*--------------------------------------------------------------------
         * Image
         *--------------------------------------------------------------------*/

        explicit H5Builder (int sbversion=2):
            rootField(0),
            eofField(0)
        {
            if(sbversion == 0) superblockV0();
            else superblockV2();
        }

        uint64_t size (void) const
        {
            return image.size();
        }

        /* appends on an 8-byte boundary and returns the address */
        uint64_t append (const bytes_t& data)
        {
            while(image.size() % 8) image.push_back(0);
            const uint64_t address = image.size();
            image.insert(image.end(), data.begin(), data.end());
            return address;
        }

        void patch (uint64_t pos, uint64_t value, int nbytes)
        {
            for(int i = 0; i < nbytes; i++)
            {
                image[pos + i] = (uint8_t)(value >> (8 * i));
            }
        }

        bytes_t finish (uint64_t root_address)
        {
            patch(rootField, root_address, 8);
            patch(eofField, image.size(), 8);
            return image;
        }

        /*--------------------------------------------------------------------
         * Object Headers
         *--------------------------------------------------------------------*/

        uint64_t objectHeader (const std::vector<message_t>& msgs)
        {
            const bytes_t block = messageBlock(msgs);
            bytes_t b;
            put(b, "OHDR");
            u8(b, 2);
            u8(b, 0x02); // four byte chunk 0 size
            u32(b, (uint32_t)block.size());
            cat(b, block);
            u32(b, 0); // checksum
            return append(b);
        }

        /* second half of the messages lives in an OCHK block */
        uint64_t objectHeaderWithContinuation (const std::vector<message_t>& msgs, const std::vector<message_t>& more)
        {
            const bytes_t more_block = messageBlock(more);
            bytes_t chk;
            put(chk, "OCHK");
            cat(chk, more_block);
            u32(chk, 0); // checksum
            const uint64_t chk_addr = append(chk);

            std::vector<message_t> first = msgs;
            first.push_back(message(HEADER_CONT, continuation(chk_addr, chk.size())));
            return objectHeader(first);
        }

        uint64_t objectHeaderV1 (const std::vector<message_t>& msgs, const std::vector<message_t>& more=std::vector<message_t>())
        {
            std::vector<message_t> first = msgs;
            if(!more.empty())
            {
                const bytes_t more_block = messageBlockV1(more);
                const uint64_t cont_addr = append(more_block);
                first.push_back(message(HEADER_CONT, continuation(cont_addr, more_block.size())));
            }

            const bytes_t block = messageBlockV1(first);
            bytes_t b;
            u8(b, 1);
            u8(b, 0);
            u16(b, (uint16_t)first.size());
            u32(b, 1); // reference count
            u32(b, (uint32_t)block.size());
            u32(b, 0); // alignment
            cat(b, block);
            return append(b);
        }

        static message_t message (uint8_t type, const bytes_t& body, uint8_t flags=0)
        {
            message_t msg = {type, body, flags};
            return msg;
        }

        /*--------------------------------------------------------------------
         * Datatypes
         *--------------------------------------------------------------------*/

        static bytes_t fixedType (uint32_t nbytes, bool is_signed, bool big_endian=false)
        {
            bytes_t b;
            typeHeader(b, 0, 1, (is_signed ? 0x08 : 0) | (big_endian ? 0x01 : 0), nbytes);
            u16(b, 0);
            u16(b, (uint16_t)(nbytes * 8));
            return b;
        }

        static bytes_t floatType (uint32_t nbytes)
        {
            const bool dbl = (nbytes == 8);
            bytes_t b;
            typeHeader(b, 1, 1, 0x20 | ((dbl ? 63 : 31) << 8), nbytes);
            u16(b, 0);
            u16(b, (uint16_t)(nbytes * 8));
            u8(b, dbl ? 52 : 23);   // exponent location
            u8(b, dbl ? 11 : 8);    // exponent size
            u8(b, 0);               // mantissa location
            u8(b, dbl ? 52 : 23);   // mantissa size
            u32(b, dbl ? 1023 : 127);
            return b;
        }

        static bytes_t stringType (uint32_t nbytes, int pad=0)
        {
            bytes_t b;
            typeHeader(b, 3, 1, pad & 0xF, nbytes);
            return b;
        }

        static bytes_t compoundType (const std::vector<member_t>& members, uint32_t nbytes)
        {
            /* Member offsets are as wide as needed to hold the compound size */
            int bit = 0;
            for(uint64_t v = nbytes; v >>= 1;) bit++;
            const int offset_size = (bit / 8) + 1;

            bytes_t b;
            typeHeader(b, 6, 3, (uint32_t)members.size(), nbytes);
            for(const member_t& m: members)
            {
                put(b, m.name);
                u8(b, 0);
                field(b, m.offset, offset_size);
                cat(b, m.type);
            }
            return b;
        }

        static bytes_t enumType (const bytes_t& base, uint32_t base_size, const std::vector<std::string>& names, const std::vector<int64_t>& values)
        {
            bytes_t b;
            typeHeader(b, 8, 3, (uint32_t)names.size(), base_size);
            cat(b, base);
            for(const std::string& name: names)
            {
                put(b, name);
                u8(b, 0);
            }
            for(const int64_t value: values)
            {
                field(b, (uint64_t)value, base_size);
            }
            return b;
        }

        static bytes_t arrayType (const std::vector<uint32_t>& dims, const bytes_t& base, uint32_t base_size)
        {
            uint32_t count = 1;
            for(const uint32_t d: dims) count *= d;

            bytes_t b;
            typeHeader(b, 10, 3, 0, count * base_size);
            u8(b, (uint8_t)dims.size());
            for(const uint32_t d: dims) u32(b, d);
            cat(b, base);
            return b;
        }

        static bytes_t vlenStringType (void)
        {
            bytes_t b;
            typeHeader(b, 9, 1, 0x01, 16);
            cat(b, fixedType(1, false));
            return b;
        }

        /* element of a variable length string held in a global heap */
        static bytes_t vlenRef (uint32_t length, uint64_t collection, uint32_t index)
        {
            bytes_t b;
            u32(b, length);
            u64(b, collection);
            u32(b, index);
            return b;
        }

        /*--------------------------------------------------------------------
         * Messages
         *--------------------------------------------------------------------*/

        static bytes_t dataspace (const std::vector<uint64_t>& dims)
        {
            bytes_t b;
            u8(b, 2);
            u8(b, (uint8_t)dims.size());
            u8(b, 0);
            u8(b, 1); // simple
            for(const uint64_t d: dims) u64(b, d);
            return b;
        }

        static bytes_t dataspaceV1 (const std::vector<uint64_t>& dims)
        {
            bytes_t b;
            u8(b, 1);
            u8(b, (uint8_t)dims.size());
            u8(b, 0);
            pad(b, 5);
            for(const uint64_t d: dims) u64(b, d);
            return b;
        }

        static bytes_t scalarSpace (void)
        {
            bytes_t b;
            u8(b, 2); u8(b, 0); u8(b, 0); u8(b, 0);
            return b;
        }

        static bytes_t nullSpace (void)
        {
            bytes_t b;
            u8(b, 2); u8(b, 0); u8(b, 0); u8(b, 2);
            return b;
        }

        static bytes_t compactLayout (const bytes_t& data)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 0);
            u16(b, (uint16_t)data.size());
            cat(b, data);
            return b;
        }

        static bytes_t contiguousLayout (uint64_t address, uint64_t nbytes)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 1);
            u64(b, address);
            u64(b, nbytes);
            return b;
        }

        static bytes_t chunkedLayout (uint64_t btree, const std::vector<uint32_t>& chunkdims, uint32_t element_size)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 2);
            u8(b, (uint8_t)(chunkdims.size() + 1));
            u64(b, btree);
            for(const uint32_t d: chunkdims) u32(b, d);
            u32(b, element_size);
            return b;
        }

        static bytes_t filterPipeline (const std::vector<H5Filter::filter_t>& filters)
        {
            bytes_t b;
            u8(b, 2);
            u8(b, (uint8_t)filters.size());
            for(const H5Filter::filter_t& f: filters)
            {
                u16(b, f.id);
                if(f.id >= 256)
                {
                    u16(b, (uint16_t)(f.name.size() + 1));
                }
                u16(b, f.flags);
                u16(b, (uint16_t)f.parms.size());
                if(f.id >= 256)
                {
                    put(b, f.name);
                    u8(b, 0);
                }
                for(const uint32_t p: f.parms) u32(b, p);
            }
            return b;
        }

        static H5Filter::filter_t filter (uint16_t id, const std::vector<uint32_t>& parms=std::vector<uint32_t>(), uint16_t flags=0)
        {
            H5Filter::filter_t f;
            f.id = id;
            f.flags = flags;
            f.name = H5Filter::filter2str(id);
            f.parms = parms;
            return f;
        }

        static bytes_t hardLink (const std::string& name, uint64_t address)
        {
            bytes_t b;
            u8(b, 1);
            u8(b, 0);
            u8(b, (uint8_t)name.size());
            put(b, name);
            u64(b, address);
            return b;
        }

        static bytes_t softLink (const std::string& name, const std::string& target)
        {
            bytes_t b;
            u8(b, 1);
            u8(b, 0x08);
            u8(b, H5Read::SOFT_LINK);
            u8(b, (uint8_t)name.size());
            put(b, name);
            u16(b, (uint16_t)target.size());
            put(b, target);
            return b;
        }

        static bytes_t externalLink (const std::string& name, const std::string& filename, const std::string& path)
        {
            bytes_t b;
            u8(b, 1);
            u8(b, 0x08);
            u8(b, H5Read::EXTERNAL_LINK);
            u8(b, (uint8_t)name.size());
            put(b, name);
            u16(b, (uint16_t)(1 + filename.size() + 1 + path.size() + 1));
            u8(b, 0);
            put(b, filename); u8(b, 0);
            put(b, path); u8(b, 0);
            return b;
        }

        static bytes_t linkInfo (bool dense=false)
        {
            bytes_t b;
            u8(b, 0);
            u8(b, 0);
            u64(b, dense ? 0x100 : UNDEF);  // fractal heap
            u64(b, dense ? 0x200 : UNDEF);  // name index
            return b;
        }

        static bytes_t attributeInfo (bool dense=false)
        {
            bytes_t b;
            u8(b, 0);
            u8(b, 0);
            u64(b, dense ? 0x100 : UNDEF);
            u64(b, dense ? 0x200 : UNDEF);
            return b;
        }

        static bytes_t attribute (const std::string& name, const bytes_t& type, const bytes_t& space, const bytes_t& data)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 0);
            u16(b, (uint16_t)(name.size() + 1));
            u16(b, (uint16_t)type.size());
            u16(b, (uint16_t)space.size());
            u8(b, 0); // ascii
            put(b, name);
            u8(b, 0);
            cat(b, type);
            cat(b, space);
            cat(b, data);
            return b;
        }

        static bytes_t fillValue (const bytes_t& value)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 0x20 | 0x02); // value defined, late allocation
            u32(b, (uint32_t)value.size());
            cat(b, value);
            return b;
        }

        static bytes_t continuation (uint64_t address, uint64_t length)
        {
            bytes_t b;
            u64(b, address);
            u64(b, length);
            return b;
        }

        static bytes_t sharedType (uint64_t address)
        {
            bytes_t b;
            u8(b, 3);
            u8(b, 2); // committed
            u64(b, address);
            return b;
        }

        /*--------------------------------------------------------------------
         * Storage Structures
         *--------------------------------------------------------------------*/

        /* version 1 chunk b-tree; fanout > 0 splits leaves under one internal node */
        uint64_t chunkTree (size_t rank, const std::vector<chunk_entry_t>& entries, size_t fanout=0)
        {
            if(fanout == 0 || entries.size() <= fanout)
            {
                return treeNode(rank, 0, entries);
            }

            std::vector<chunk_entry_t> children;
            for(size_t start = 0; start < entries.size(); start += fanout)
            {
                const size_t stop = start + fanout < entries.size() ? start + fanout : entries.size();
                const std::vector<chunk_entry_t> leaf(entries.begin() + start, entries.begin() + stop);
                chunk_entry_t child = leaf.front();
                child.address = treeNode(rank, 0, leaf);
                children.push_back(child);
            }
            return treeNode(rank, 1, children);
        }

        /* global heap collection; object n is index n+1 */
        uint64_t globalHeap (const std::vector<bytes_t>& objects)
        {
            bytes_t body;
            for(size_t i = 0; i < objects.size(); i++)
            {
                u16(body, (uint16_t)(i + 1));
                u16(body, 1);
                u32(body, 0);
                u64(body, objects[i].size());
                cat(body, objects[i]);
                pad(body, (8 - (objects[i].size() % 8)) % 8);
            }

            /* free space */
            u16(body, 0);
            u16(body, 0);
            u32(body, 0);
            u64(body, 0);

            bytes_t b;
            put(b, "GCOL");
            u8(b, 1);
            pad(b, 3);
            u64(b, 16 + body.size());
            cat(b, body);
            return append(b);
        }

        /* writes local heap, symbol table node and group b-tree; returns message body */
        bytes_t symbolTable (const std::vector<symbol_t>& symbols)
        {
            /* Heap Data Segment */
            bytes_t heap_data(8, 0);
            std::vector<uint64_t> name_offsets;
            std::vector<uint64_t> soft_offsets;
            for(const symbol_t& s: symbols)
            {
                name_offsets.push_back(heap_data.size());
                heapString(heap_data, s.name);
                soft_offsets.push_back(heap_data.size());
                if(!s.soft.empty()) heapString(heap_data, s.soft);
            }
            const uint64_t data_addr = append(heap_data);

            bytes_t heap;
            put(heap, "HEAP");
            u8(heap, 0);
            pad(heap, 3);
            u64(heap, heap_data.size());
            u64(heap, UNDEF);
            u64(heap, data_addr);
            const uint64_t heap_addr = append(heap);

            /* Symbol Table Node */
            bytes_t snod;
            put(snod, "SNOD");
            u8(snod, 1);
            u8(snod, 0);
            u16(snod, (uint16_t)symbols.size());
            for(size_t i = 0; i < symbols.size(); i++)
            {
                const bool soft = !symbols[i].soft.empty();
                u64(snod, name_offsets[i]);
                u64(snod, soft ? UNDEF : symbols[i].address);
                u32(snod, soft ? 2 : 0);
                u32(snod, 0);
                u32(snod, soft ? (uint32_t)soft_offsets[i] : 0);
                pad(snod, 12);
            }
            const uint64_t snod_addr = append(snod);

            /* Group B-Tree */
            bytes_t tree;
            put(tree, "TREE");
            u8(tree, 0);
            u8(tree, 0);
            u16(tree, 1);
            u64(tree, UNDEF);
            u64(tree, UNDEF);
            u64(tree, 0);
            u64(tree, snod_addr);
            u64(tree, symbols.empty() ? 0 : name_offsets.back());
            const uint64_t tree_addr = append(tree);

            bytes_t b;
            u64(b, tree_addr);
            u64(b, heap_addr);
            return b;
        }

        /*--------------------------------------------------------------------
         * Codecs
         *--------------------------------------------------------------------*/

        static bytes_t deflate (const bytes_t& input, int level=6)
        {
            uLongf dst_len = compressBound((uLong)input.size());
            bytes_t out(dst_len);
            compress2(out.data(), &dst_len, input.data(), (uLong)input.size(), level);
            out.resize(dst_len);
            return out;
        }

        /* greedy lzf compressor with literal runs and back references */
        static bytes_t lzf (const bytes_t& input)
        {
            static const size_t MAX_LIT = 32;
            static const size_t MAX_OFF = 8192;
            static const size_t MAX_REF = 264;

            bytes_t out;
            bytes_t literals;
            size_t ip = 0;

            while(ip < input.size())
            {
                size_t best_len = 0;
                size_t best_off = 0;
                const size_t window = ip < MAX_OFF ? ip : MAX_OFF;
                for(size_t off = 1; off <= window; off++)
                {
                    size_t len = 0;
                    while(ip + len < input.size() && len < MAX_REF && input[ip + len] == input[ip - off + len]) len++;
                    if(len > best_len)
                    {
                        best_len = len;
                        best_off = off;
                    }
                }

                if(best_len >= 3)
                {
                    flushLiterals(out, literals);
                    const size_t len = best_len - 2;
                    const size_t dist = best_off - 1;
                    if(len < 7)
                    {
                        out.push_back((uint8_t)((len << 5) | (dist >> 8)));
                    }
                    else
                    {
                        out.push_back((uint8_t)((7 << 5) | (dist >> 8)));
                        out.push_back((uint8_t)(len - 7));
                    }
                    out.push_back((uint8_t)(dist & 0xFF));
                    ip += best_len;
                }
                else
                {
                    literals.push_back(input[ip++]);
                    if(literals.size() == MAX_LIT) flushLiterals(out, literals);
                }
            }

            flushLiterals(out, literals);
            return out;
        }

        static bytes_t shuffle (const bytes_t& input, int type_size)
        {
            bytes_t out(input.size());
            const size_t n = input.size() / type_size;
            for(size_t e = 0; e < n; e++)
            {
                for(int b = 0; b < type_size; b++)
                {
                    out[(b * n) + e] = input[(e * type_size) + b];
                }
            }
            return out;
        }

        static bytes_t fletcher (const bytes_t& input)
        {
            bytes_t out = input;
            u32(out, H5Filter::fletcher32(input.data(), input.size()));
            return out;
        }

        /*--------------------------------------------------------------------
         * Little Endian Values
         *--------------------------------------------------------------------*/

        template <typename T>
        static bytes_t values (const std::vector<T>& v)
        {
            bytes_t b(v.size() * sizeof(T));
            if(!v.empty()) memcpy(b.data(), v.data(), b.size());
            return b;
        }

        static void field (bytes_t& b, uint64_t value, int nbytes)
        {
            for(int i = 0; i < nbytes; i++) b.push_back((uint8_t)(value >> (8 * i)));
        }

        static void u8  (bytes_t& b, uint8_t value)     { b.push_back(value); }
        static void u16 (bytes_t& b, uint16_t value)    { field(b, value, 2); }
        static void u32 (bytes_t& b, uint32_t value)    { field(b, value, 4); }
        static void u64 (bytes_t& b, uint64_t value)    { field(b, value, 8); }
        static void pad (bytes_t& b, size_t n)          { b.insert(b.end(), n, 0); }
        static void put (bytes_t& b, const std::string& s) { b.insert(b.end(), s.begin(), s.end()); }
        static void cat (bytes_t& b, const bytes_t& s)  { b.insert(b.end(), s.begin(), s.end()); }

        bytes_t image;

    private:

        /*--------------------------------------------------------------------
         * Superblocks
         *--------------------------------------------------------------------*/

        void superblockV2 (void)
        {
            u64(image, H5Read::H5_SIGNATURE_LE);
            u8(image, 2);
            u8(image, 8);
            u8(image, 8);
            u8(image, 0);
            u64(image, 0);      // base address
            u64(image, UNDEF);  // superblock extension
            eofField = image.size();
            u64(image, 0);
            rootField = image.size();
            u64(image, 0);
            u32(image, 0);      // checksum
        }

        void superblockV0 (void)
        {
            u64(image, H5Read::H5_SIGNATURE_LE);
            u8(image, 0);       // superblock
            u8(image, 0);       // free space
            u8(image, 0);       // root group symbol table
            u8(image, 0);
            u8(image, 0);       // shared header
            u8(image, 8);
            u8(image, 8);
            u8(image, 0);
            u16(image, 4);      // group leaf k
            u16(image, 16);     // group internal k
            u32(image, 0);      // consistency flags
            u64(image, 0);      // base address
            u64(image, UNDEF);  // free space info
            eofField = image.size();
            u64(image, 0);
            u64(image, UNDEF);  // driver info

            /* Root Group Symbol Table Entry */
            u64(image, 0);
            rootField = image.size();
            u64(image, 0);
            u32(image, 0);
            u32(image, 0);
            pad(image, 16);
        }

        /*--------------------------------------------------------------------
         * Helpers
         *--------------------------------------------------------------------*/

        static void typeHeader (bytes_t& b, int type_class, int version, uint32_t databits, uint32_t nbytes)
        {
            u32(b, (uint32_t)type_class | ((uint32_t)version << 4) | (databits << 8));
            u32(b, nbytes);
        }

        static bytes_t messageBlock (const std::vector<message_t>& msgs)
        {
            bytes_t b;
            for(const message_t& m: msgs)
            {
                u8(b, m.type);
                u16(b, (uint16_t)m.body.size());
                u8(b, m.flags);
                cat(b, m.body);
            }
            return b;
        }

        static bytes_t messageBlockV1 (const std::vector<message_t>& msgs)
        {
            bytes_t b;
            for(const message_t& m: msgs)
            {
                const size_t padded = m.body.size() + ((8 - (m.body.size() % 8)) % 8);
                u16(b, m.type);
                u16(b, (uint16_t)padded);
                u8(b, m.flags);
                pad(b, 3);
                cat(b, m.body);
                pad(b, padded - m.body.size());
            }
            return b;
        }

        uint64_t treeNode (size_t rank, int level, const std::vector<chunk_entry_t>& entries)
        {
            bytes_t b;
            put(b, "TREE");
            u8(b, 1);
            u8(b, (uint8_t)level);
            u16(b, (uint16_t)entries.size());
            u64(b, UNDEF);
            u64(b, UNDEF);
            for(const chunk_entry_t& e: entries)
            {
                chunkKey(b, rank, e);
                u64(b, e.address);
            }

            /* Final Key */
            chunk_entry_t last = entries.back();
            last.size = 0;
            last.mask = 0;
            chunkKey(b, rank, last);
            return append(b);
        }

        static void chunkKey (bytes_t& b, size_t rank, const chunk_entry_t& e)
        {
            u32(b, e.size);
            u32(b, e.mask);
            for(size_t d = 0; d < rank; d++) u64(b, e.offsets[d]);
            u64(b, 0);
        }

        static void heapString (bytes_t& b, const std::string& s)
        {
            put(b, s);
            u8(b, 0);
            while(b.size() % 8) b.push_back(0);
        }

        static void flushLiterals (bytes_t& out, bytes_t& literals)
        {
            if(literals.empty()) return;
            out.push_back((uint8_t)(literals.size() - 1));
            cat(out, literals);
            literals.clear();
        }

        uint64_t    rootField;
        uint64_t    eofField;
};

#endif  /* __ut_h5builder__ */
