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

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <functional>
#include <numeric>

#include "H5File.h"
#include "H5Exception.h"
#include "UT_H5Builder.h"

using namespace H5Read;

typedef H5Builder::bytes_t bytes_t;
typedef std::vector<H5Builder::message_t> messages_t;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * cutChunk - one chunk of a row major array, zero padded past the edges
 *----------------------------------------------------------------------------*/
static bytes_t cutChunk (const bytes_t& data, const std::vector<uint64_t>& shape, const std::vector<uint64_t>& chunk,
                         const std::vector<uint64_t>& origin, int typesize)
{
    const size_t rank = shape.size();
    uint64_t count = 1;
    for(const uint64_t c: chunk) count *= c;

    bytes_t out(count * typesize, 0);
    std::vector<uint64_t> index(rank, 0);
    for(uint64_t e = 0; e < count; e++)
    {
        bool inside = true;
        uint64_t src = 0;
        for(size_t d = 0; d < rank; d++)
        {
            const uint64_t coord = origin[d] + index[d];
            if(coord >= shape[d]) inside = false;
            src = (src * shape[d]) + coord;
        }
        if(inside) memcpy(&out[e * typesize], &data[src * typesize], typesize);

        for(int d = (int)rank - 1; d >= 0; d--)
        {
            if(++index[d] < chunk[d]) break;
            index[d] = 0;
        }
    }
    return out;
}

/*----------------------------------------------------------------------------
 * writeDataset
 *----------------------------------------------------------------------------*/
static uint64_t writeDataset (H5Builder& b, const bytes_t& type, const bytes_t& space, const bytes_t& layout,
                              const messages_t& extra=messages_t())
{
    messages_t msgs = {
        H5Builder::message(H5Builder::DATASPACE, space),
        H5Builder::message(H5Builder::DATATYPE, type),
        H5Builder::message(H5Builder::DATA_LAYOUT, layout)
    };
    msgs.insert(msgs.end(), extra.begin(), extra.end());
    return b.objectHeader(msgs);
}

/*----------------------------------------------------------------------------
 * writeChunked - every chunk of the array is stored, optionally encoded
 *----------------------------------------------------------------------------*/
static uint64_t writeChunked (H5Builder& b, const bytes_t& type, int typesize, const std::vector<uint64_t>& shape,
                              const std::vector<uint64_t>& chunk, const bytes_t& data,
                              const std::vector<H5Filter::filter_t>& filters=std::vector<H5Filter::filter_t>(),
                              const std::function<bytes_t(const bytes_t&)>& encode=std::function<bytes_t(const bytes_t&)>(), size_t fanout=0)
{
    const size_t rank = shape.size();
    std::vector<H5Builder::chunk_entry_t> entries;

    std::vector<uint64_t> origin(rank, 0);
    while(true)
    {
        const bytes_t raw = cutChunk(data, shape, chunk, origin, typesize);
        const bytes_t stored = encode ? encode(raw) : raw;
        const H5Builder::chunk_entry_t entry = {origin, (uint32_t)stored.size(), 0, b.append(stored)};
        entries.push_back(entry);

        int d = (int)rank - 1;
        while(d >= 0)
        {
            origin[d] += chunk[d];
            if(origin[d] < shape[d]) break;
            origin[d] = 0;
            d--;
        }
        if(d < 0) break;
    }

    const uint64_t tree = b.chunkTree(rank, entries, fanout);
    std::vector<uint32_t> chunkdims(chunk.begin(), chunk.end());

    messages_t extra;
    if(!filters.empty()) extra.push_back(H5Builder::message(H5Builder::FILTER, H5Builder::filterPipeline(filters)));
    return writeDataset(b, type, H5Builder::dataspace(shape), H5Builder::chunkedLayout(tree, chunkdims, typesize), extra);
}

/*----------------------------------------------------------------------------
 * writeGroup
 *----------------------------------------------------------------------------*/
static uint64_t writeGroup (H5Builder& b, const std::vector<bytes_t>& links, const messages_t& extra=messages_t())
{
    messages_t msgs = {H5Builder::message(H5Builder::LINK_INFO, H5Builder::linkInfo())};
    for(const bytes_t& link: links) msgs.push_back(H5Builder::message(H5Builder::LINK, link));
    msgs.insert(msgs.end(), extra.begin(), extra.end());
    return b.objectHeader(msgs);
}

static std::vector<int64_t> toInts (const std::vector<H5Value>& values)
{
    std::vector<int64_t> out;
    for(const H5Value& v: values) out.push_back(v.asInt());
    return out;
}

static std::vector<double> toDoubles (const std::vector<H5Value>& values)
{
    std::vector<double> out;
    for(const H5Value& v: values) out.push_back(v.asDouble());
    return out;
}

template <typename T>
static std::vector<T> sequence (size_t count, T start=0)
{
    std::vector<T> out(count);
    std::iota(out.begin(), out.end(), start);
    return out;
}

/*----------------------------------------------------------------------------
 * sampleFile
 *
 *  /contig         float64[4] contiguous
 *  /grid           int32[10,10] in 3x3 chunks
 *  /grid_contig    int32[10,10] contiguous, same values
 *  /gzip           float64[100] deflate, two level chunk tree
 *  /lzf            int32[50] shuffle + lzf
 *  /cube           int16[2,3,4] in 2x2x2 chunks
 *  /colors         enum int8[5] compact
 *  /records        compound{id, vals[3]}[2] compact
 *  /scalar         int64 scalar with attributes
 *  /sparse         int32[8] with only the second chunk written
 *  /unwritten      int32[3] contiguous with undefined address
 *  /names          vlen string[2]
 *  /text           string(5)[2] compact
 *  /empty          null dataspace
 *  /typed          uint16[3] with a committed datatype
 *  /continued      int32[2] with messages in a continuation block
 *  /ctype          committed datatype
 *  /grp            group {values, rel -> values, up -> ../contig, nested/deep}
 *  /alias          hard link to /grid
 *  /soft           -> /grp/values
 *  /gsoft          -> /grp
 *  /dangling       -> /nowhere
 *  /loop_a, loop_b -> each other
 *  /ext            external link other.h5:/data
 *----------------------------------------------------------------------------*/
static bytes_t sampleFile (void)
{
    H5Builder b;
    std::vector<bytes_t> links;

    /* contig */
    const bytes_t contig_data = H5Builder::values(std::vector<double>{1.5, 2.5, 3.5, 4.5});
    const uint64_t contig_addr = b.append(contig_data);
    links.push_back(H5Builder::hardLink("contig", writeDataset(b, H5Builder::floatType(8), H5Builder::dataspace({4}), H5Builder::contiguousLayout(contig_addr, contig_data.size()))));

    /* grid */
    const bytes_t grid_data = H5Builder::values(sequence<int32_t>(100));
    const uint64_t grid = writeChunked(b, H5Builder::fixedType(4, true), 4, {10, 10}, {3, 3}, grid_data);
    links.push_back(H5Builder::hardLink("grid", grid));

    /* grid_contig */
    const uint64_t grid_data_addr = b.append(grid_data);
    links.push_back(H5Builder::hardLink("grid_contig", writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({10, 10}), H5Builder::contiguousLayout(grid_data_addr, grid_data.size()))));

    /* gzip */
    const std::vector<H5Filter::filter_t> deflate = {H5Builder::filter(H5Filter::DEFLATE_FILTER, {6})};
    links.push_back(H5Builder::hardLink("gzip", writeChunked(b, H5Builder::floatType(8), 8, {100}, {10}, H5Builder::values(sequence<double>(100)),
                                                              deflate, [](const bytes_t& raw) { return H5Builder::deflate(raw); }, 4)));

    /* lzf */
    std::vector<int32_t> lzf_values;
    for(int32_t i = 0; i < 50; i++) lzf_values.push_back((i * 7) % 13);
    const std::vector<H5Filter::filter_t> shuffle_lzf = {H5Builder::filter(H5Filter::SHUFFLE_FILTER, {4}), H5Builder::filter(H5Filter::LZF_FILTER)};
    links.push_back(H5Builder::hardLink("lzf", writeChunked(b, H5Builder::fixedType(4, true), 4, {50}, {20}, H5Builder::values(lzf_values),
                                                             shuffle_lzf, [](const bytes_t& raw) { return H5Builder::lzf(H5Builder::shuffle(raw, 4)); })));

    /* cube */
    links.push_back(H5Builder::hardLink("cube", writeChunked(b, H5Builder::fixedType(2, true), 2, {2, 3, 4}, {2, 2, 2}, H5Builder::values(sequence<int16_t>(24)))));

    /* colors */
    const bytes_t color_type = H5Builder::enumType(H5Builder::fixedType(1, true), 1, {"RED", "GREEN", "BLUE"}, {0, 1, 2});
    links.push_back(H5Builder::hardLink("colors", writeDataset(b, color_type, H5Builder::dataspace({5}), H5Builder::compactLayout({0, 1, 2, 1, 0}))));

    /* records */
    const std::vector<H5Builder::member_t> members = {
        {"id", 0, H5Builder::fixedType(4, true)},
        {"vals", 4, H5Builder::arrayType({3}, H5Builder::fixedType(4, true), 4)}
    };
    const bytes_t record_data = H5Builder::values(std::vector<int32_t>{1, 10, 11, 12, 2, 20, 21, 22});
    links.push_back(H5Builder::hardLink("records", writeDataset(b, H5Builder::compoundType(members, 16), H5Builder::dataspace({2}), H5Builder::compactLayout(record_data))));

    /* scalar */
    bytes_t label(8, 0);
    memcpy(label.data(), "alpha", 5);
    const messages_t scalar_attrs = {
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("count", H5Builder::fixedType(4, true), H5Builder::scalarSpace(), H5Builder::values(std::vector<int32_t>{7}))),
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("weights", H5Builder::floatType(8), H5Builder::dataspace({3}), H5Builder::values(std::vector<double>{0.5, 1.5, 2.5}))),
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("label", H5Builder::stringType(8), H5Builder::scalarSpace(), label)),
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("none", H5Builder::fixedType(4, true), H5Builder::nullSpace(), bytes_t()))
    };
    links.push_back(H5Builder::hardLink("scalar", writeDataset(b, H5Builder::fixedType(8, true), H5Builder::scalarSpace(), H5Builder::compactLayout(H5Builder::values(std::vector<int64_t>{42})), scalar_attrs)));

    /* sparse */
    const bytes_t sparse_chunk = H5Builder::values(std::vector<int32_t>{4, 5, 6, 7});
    const std::vector<H5Builder::chunk_entry_t> sparse_entries = {{{4}, (uint32_t)sparse_chunk.size(), 0, b.append(sparse_chunk)}};
    const uint64_t sparse_tree = b.chunkTree(1, sparse_entries);
    const messages_t sparse_fill = {H5Builder::message(H5Builder::FILL_VALUE, H5Builder::fillValue(H5Builder::values(std::vector<int32_t>{-7})))};
    links.push_back(H5Builder::hardLink("sparse", writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({8}), H5Builder::chunkedLayout(sparse_tree, {4}, 4), sparse_fill)));

    /* unwritten */
    const messages_t unwritten_fill = {H5Builder::message(H5Builder::FILL_VALUE, H5Builder::fillValue(H5Builder::values(std::vector<int32_t>{9})))};
    links.push_back(H5Builder::hardLink("unwritten", writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({3}), H5Builder::contiguousLayout(H5Builder::UNDEF, 0), unwritten_fill)));

    /* names */
    const std::string one = "one", three = "three";
    const uint64_t heap = b.globalHeap({bytes_t(one.begin(), one.end()), bytes_t(three.begin(), three.end())});
    bytes_t name_refs = H5Builder::vlenRef(3, heap, 1);
    H5Builder::cat(name_refs, H5Builder::vlenRef(5, heap, 2));
    const uint64_t name_refs_addr = b.append(name_refs);
    links.push_back(H5Builder::hardLink("names", writeDataset(b, H5Builder::vlenStringType(), H5Builder::dataspace({2}), H5Builder::contiguousLayout(name_refs_addr, name_refs.size()))));

    /* text */
    const std::string text = std::string("abc\0\0", 5) + "hello";
    links.push_back(H5Builder::hardLink("text", writeDataset(b, H5Builder::stringType(5, H5Datatype::NULL_PADDED), H5Builder::dataspace({2}), H5Builder::compactLayout(bytes_t(text.begin(), text.end())))));

    /* empty */
    links.push_back(H5Builder::hardLink("empty", writeDataset(b, H5Builder::fixedType(4, true), H5Builder::nullSpace(), H5Builder::contiguousLayout(H5Builder::UNDEF, 0))));

    /* ctype and typed */
    const uint64_t ctype = b.objectHeader({H5Builder::message(H5Builder::DATATYPE, H5Builder::fixedType(2, false))});
    const uint64_t typed = b.objectHeader({
        H5Builder::message(H5Builder::DATASPACE, H5Builder::dataspace({3})),
        H5Builder::message(H5Builder::DATATYPE, H5Builder::sharedType(ctype), 0x02),
        H5Builder::message(H5Builder::DATA_LAYOUT, H5Builder::compactLayout(H5Builder::values(std::vector<uint16_t>{1, 2, 3})))
    });
    links.push_back(H5Builder::hardLink("typed", typed));
    links.push_back(H5Builder::hardLink("ctype", ctype));

    /* continued */
    const uint64_t continued = b.objectHeaderWithContinuation(
        {H5Builder::message(H5Builder::DATASPACE, H5Builder::dataspace({2})), H5Builder::message(H5Builder::DATATYPE, H5Builder::fixedType(4, true))},
        {H5Builder::message(H5Builder::DATA_LAYOUT, H5Builder::compactLayout(H5Builder::values(std::vector<int32_t>{-1, -2}))),
         H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("where", H5Builder::fixedType(1, false), H5Builder::scalarSpace(), {2}))});
    links.push_back(H5Builder::hardLink("continued", continued));

    /* grp */
    const bytes_t values_data = H5Builder::values(std::vector<int32_t>{10, 20, 30});
    const uint64_t values_addr = b.append(values_data);
    const uint64_t values = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({3}), H5Builder::contiguousLayout(values_addr, values_data.size()));
    const uint64_t deep = writeDataset(b, H5Builder::fixedType(1, true), H5Builder::dataspace({2}), H5Builder::compactLayout({5, 6}));
    const uint64_t nested = writeGroup(b, {H5Builder::hardLink("deep", deep)});
    bytes_t units(6, 0);
    memcpy(units.data(), "meters", 6);
    const uint64_t grp = writeGroup(b, {H5Builder::hardLink("values", values), H5Builder::softLink("rel", "values"),
                                        H5Builder::softLink("up", "../contig"), H5Builder::hardLink("nested", nested)},
                                    {H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("units", H5Builder::stringType(6, H5Datatype::NULL_PADDED), H5Builder::scalarSpace(), units))});
    links.push_back(H5Builder::hardLink("grp", grp));

    /* links */
    links.push_back(H5Builder::hardLink("alias", grid));
    links.push_back(H5Builder::softLink("soft", "/grp/values"));
    links.push_back(H5Builder::softLink("gsoft", "/grp"));
    links.push_back(H5Builder::softLink("dangling", "/nowhere"));
    links.push_back(H5Builder::softLink("loop_a", "/loop_b"));
    links.push_back(H5Builder::softLink("loop_b", "/loop_a"));
    links.push_back(H5Builder::externalLink("ext", "other.h5", "/data"));

    return b.finish(writeGroup(b, links));
}

/*----------------------------------------------------------------------------
 * legacyFile - version 0 superblock, version 1 headers and symbol tables
 *----------------------------------------------------------------------------*/
static bytes_t legacyFile (void)
{
    H5Builder b(0);

    const bytes_t data = H5Builder::values(std::vector<int32_t>{3, 1, 4, 1});
    const uint64_t data_addr = b.append(data);
    const uint64_t v1data = b.objectHeaderV1(
        {H5Builder::message(H5Builder::DATASPACE, H5Builder::dataspaceV1({4})), H5Builder::message(H5Builder::DATATYPE, H5Builder::fixedType(4, true))},
        {H5Builder::message(H5Builder::DATA_LAYOUT, H5Builder::contiguousLayout(data_addr, data.size()))});

    const uint64_t inner = b.objectHeaderV1({
        H5Builder::message(H5Builder::DATASPACE, H5Builder::dataspaceV1({2})),
        H5Builder::message(H5Builder::DATATYPE, H5Builder::floatType(4)),
        H5Builder::message(H5Builder::DATA_LAYOUT, H5Builder::compactLayout(H5Builder::values(std::vector<float>{0.25f, -8.0f})))
    });

    const bytes_t g_table = b.symbolTable({{"inner", inner, ""}});
    const uint64_t g = b.objectHeaderV1({H5Builder::message(H5Builder::SYMBOL_TABLE, g_table)});

    const bytes_t root_table = b.symbolTable({{"v1data", v1data, ""}, {"g", g, ""}, {"link", 0, "/g/inner"}});
    return b.finish(b.objectHeaderV1({H5Builder::message(H5Builder::SYMBOL_TABLE, root_table)}));
}

/******************************************************************************
 * TESTS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Opening
 *----------------------------------------------------------------------------*/

TEST(H5File, OpensMemoryImage)
{
    H5File file(sampleFile(), "sample.h5");
    EXPECT_TRUE(file.isOpen());
    EXPECT_STREQ(file.getName(), "sample.h5");
    EXPECT_EQ(file.superblockVersion(), 2);
    EXPECT_GT(file.rootAddress(), 0ULL);
}

TEST(H5File, OpensFileOnDisk)
{
    const std::string path = testing::TempDir() + "h5read_sample.h5";
    const bytes_t image = sampleFile();
    FILE* fp = fopen(path.c_str(), "wb");
    ASSERT_NE(fp, (FILE*)NULL);
    ASSERT_EQ(fwrite(image.data(), 1, image.size(), fp), image.size());
    fclose(fp);

    {
        H5File file(path.c_str());
        EXPECT_EQ(toDoubles(file.readData("/contig")), (std::vector<double>{1.5, 2.5, 3.5, 4.5}));
    }

    remove(path.c_str());
}

TEST(H5File, SignatureAtUserBlockOffset)
{
    bytes_t image(512, 0xEE);
    const bytes_t sample = sampleFile();
    image.insert(image.end(), sample.begin(), sample.end());

    H5File file(image);
    EXPECT_EQ(toDoubles(file.readData("/contig")), (std::vector<double>{1.5, 2.5, 3.5, 4.5}));
    EXPECT_EQ(toInts(file.readData("/grp/values")), (std::vector<int64_t>{10, 20, 30}));
}

TEST(H5File, RejectsInvalidImages)
{
    EXPECT_THROW(H5File blank(bytes_t(1024, 0)), FormatError);
    EXPECT_THROW(H5File tiny(bytes_t(4, 0)), FormatError);

    bytes_t bad_version = sampleFile();
    bad_version[8] = 4;
    EXPECT_THROW(H5File file(bad_version), FormatError);

    EXPECT_THROW(H5File missing("/nonexistent/h5read/missing.h5"), DataReadError);
}

TEST(H5File, TruncatedImage)
{
    bytes_t image = sampleFile();
    image.resize(64);
    H5File file(image);
    EXPECT_THROW(file.dataset("/contig"), DataReadError);
}

/*----------------------------------------------------------------------------
 * Reading
 *----------------------------------------------------------------------------*/

TEST(H5File, ContiguousFloats)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/contig");
    EXPECT_EQ(ds.shape(), (std::vector<uint64_t>{4}));
    EXPECT_EQ(ds.elements(), 4ULL);
    EXPECT_EQ(ds.layout(), CONTIGUOUS_LAYOUT);
    EXPECT_EQ(ds.datatype().describe(), "float64");
    EXPECT_EQ(toDoubles(ds.readData()), (std::vector<double>{1.5, 2.5, 3.5, 4.5}));
}

TEST(H5File, ChunkedGridHasEveryElement)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/grid");
    EXPECT_EQ(ds.layout(), CHUNKED_LAYOUT);
    EXPECT_EQ(ds.chunkShape(), (std::vector<uint64_t>{3, 3}));

    const std::vector<H5Value> values = ds.readData();
    ASSERT_EQ(values.size(), 100U);
    EXPECT_EQ(toInts(values), toInts(file.readData("/grid_contig")));
    for(int64_t i = 0; i < 100; i++) EXPECT_EQ(values[i].asInt(), i);
}

TEST(H5File, ChunkedSliceMatchesContiguousSlice)
{
    H5File file(sampleFile());
    const std::vector<range_t> slice = {{2, 7, 1}, {4, EOR, 1}};

    std::vector<uint64_t> chunked_dims;
    std::vector<uint64_t> contig_dims;
    const std::vector<H5Value> chunked = file.dataset("/grid").readSlice(slice, &chunked_dims);
    const std::vector<H5Value> contig = file.dataset("/grid_contig").readSlice(slice, &contig_dims);

    EXPECT_EQ(chunked_dims, (std::vector<uint64_t>{5, 6}));
    EXPECT_EQ(contig_dims, chunked_dims);
    EXPECT_EQ(toInts(chunked), toInts(contig));
    EXPECT_EQ(chunked[0].asInt(), 24);
    EXPECT_EQ(chunked[29].asInt(), 69);
}

TEST(H5File, StridedSlice)
{
    H5File file(sampleFile());
    std::vector<uint64_t> dims;
    const std::vector<H5Value> values = file.dataset("/grid").readSlice({{1, 10, 4}, {0, 10, 3}}, &dims);
    EXPECT_EQ(dims, (std::vector<uint64_t>{3, 4}));
    EXPECT_EQ(toInts(values), (std::vector<int64_t>{10, 13, 16, 19, 50, 53, 56, 59, 90, 93, 96, 99}));
}

TEST(H5File, InvalidSlices)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/grid");
    EXPECT_THROW(ds.readSlice({{0, 5, 1}}), DataReadError);
    EXPECT_THROW(ds.readSlice({{0, 11, 1}, {0, 5, 1}}), DataReadError);
    EXPECT_THROW(ds.readSlice({{5, 2, 1}, {0, 5, 1}}), DataReadError);
    EXPECT_THROW(ds.readSlice({{0, 5, 0}, {0, 5, 1}}), DataReadError);
    EXPECT_TRUE(ds.readSlice({{3, 3, 1}, {0, 5, 1}}).empty());
}

TEST(H5File, DeflatedChunks)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/gzip");
    ASSERT_EQ(ds.filters().size(), 1U);
    EXPECT_EQ(ds.filters()[0].id, H5Filter::DEFLATE_FILTER);
    EXPECT_EQ(toDoubles(ds.readData()), sequence<double>(100));

    std::vector<uint64_t> dims;
    EXPECT_EQ(toDoubles(ds.readSlice({{95, EOR, 1}}, &dims)), (std::vector<double>{95, 96, 97, 98, 99}));
}

TEST(H5File, ShuffledLzfChunks)
{
    H5File file(sampleFile());
    const std::vector<H5Value> values = file.readData("/lzf");
    ASSERT_EQ(values.size(), 50U);
    for(int64_t i = 0; i < 50; i++) EXPECT_EQ(values[i].asInt(), (i * 7) % 13);
}

TEST(H5File, ThreeDimensionalChunks)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/cube");
    EXPECT_EQ(ds.shape(), (std::vector<uint64_t>{2, 3, 4}));
    EXPECT_EQ(ds.datatype().describe(), "int16");
    EXPECT_EQ(toInts(ds.readData()), sequence<int64_t>(24));

    std::vector<uint64_t> dims;
    EXPECT_EQ(toInts(ds.readSlice({{1, 2, 1}, {1, 3, 1}, {2, 4, 1}}, &dims)), (std::vector<int64_t>{18, 19, 22, 23}));
}

TEST(H5File, EnumerationValues)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/colors");
    EXPECT_EQ(ds.datatype().typeClass, H5Datatype::ENUMERATED_TYPE);
    EXPECT_EQ(ds.layout(), COMPACT_LAYOUT);
    EXPECT_EQ(toInts(ds.readData()), (std::vector<int64_t>{0, 1, 2, 1, 0}));
}

TEST(H5File, CompoundWithArrayField)
{
    H5File file(sampleFile());
    const std::vector<H5Value> records = file.readData("/records");
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[1].field("id").asInt(), 2);
    ASSERT_EQ(records[1].field("vals").size(), 3U);
    EXPECT_EQ(records[1].field("vals")[0].asInt(), 20);
    EXPECT_EQ(records[0].field("vals").toString(), "[10, 11, 12]");
}

TEST(H5File, ScalarDataset)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/scalar");
    EXPECT_TRUE(ds.isScalar());
    EXPECT_TRUE(ds.shape().empty());
    const std::vector<H5Value> values = ds.readData();
    ASSERT_EQ(values.size(), 1U);
    EXPECT_EQ(values[0].asInt(), 42);
}

TEST(H5File, FillValues)
{
    H5File file(sampleFile());
    EXPECT_EQ(toInts(file.readData("/sparse")), (std::vector<int64_t>{-7, -7, -7, -7, 4, 5, 6, 7}));
    EXPECT_EQ(toInts(file.dataset("/sparse").readSlice({{2, 6, 1}})), (std::vector<int64_t>{-7, -7, 4, 5}));
    EXPECT_EQ(toInts(file.readData("/unwritten")), (std::vector<int64_t>{9, 9, 9}));
}

TEST(H5File, Strings)
{
    H5File file(sampleFile());

    const std::vector<H5Value> names = file.readData("/names");
    ASSERT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0].asString(), "one");
    EXPECT_EQ(names[1].asString(), "three");

    const std::vector<H5Value> text = file.readData("/text");
    ASSERT_EQ(text.size(), 2U);
    EXPECT_EQ(text[0].asString(), "abc");
    EXPECT_EQ(text[1].asString(), "hello");
}

TEST(H5File, NullDataspace)
{
    H5File file(sampleFile());
    EXPECT_TRUE(file.readData("/empty").empty());
    EXPECT_EQ(file.dataset("/empty").elements(), 0ULL);
}

TEST(H5File, CommittedDatatype)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/typed");
    EXPECT_EQ(ds.datatype().describe(), "uint16");
    EXPECT_EQ(toInts(ds.readData()), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(file.getObjectType("/ctype"), OBJECT_DATATYPE);
    EXPECT_THROW(file.dataset("/ctype"), DatasetNotFoundError);
}

TEST(H5File, HeaderContinuation)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/continued");
    EXPECT_EQ(toInts(ds.readData()), (std::vector<int64_t>{-1, -2}));
    EXPECT_EQ(ds.attribute("where").value().asInt(), 2);
}

TEST(H5File, ReadsAreDeterministic)
{
    const bytes_t image = sampleFile();
    H5File first(image);
    H5File second(image);

    const char* paths[] = {"/grid", "/gzip", "/lzf", "/cube", "/records", "/names", "/sparse"};
    for(const char* path: paths)
    {
        const std::vector<H5Value> a = first.readData(path);
        EXPECT_EQ(a, first.readData(path)) << path;
        EXPECT_EQ(a, second.readData(path)) << path;
    }
}

/*----------------------------------------------------------------------------
 * Navigation
 *----------------------------------------------------------------------------*/

TEST(H5File, GroupChildrenInStorageOrder)
{
    H5File file(sampleFile());
    H5Group grp = file.group("/grp");
    EXPECT_EQ(grp.getPath(), "/grp");
    EXPECT_EQ(grp.children(), (std::vector<std::string>{"values", "rel", "up", "nested"}));
    EXPECT_FALSE(grp.hasDenseLinks());

    const std::vector<std::string> root_children = file.root().children();
    ASSERT_FALSE(root_children.empty());
    EXPECT_EQ(root_children.front(), "contig");
    EXPECT_EQ(root_children.back(), "ext");
}

TEST(H5File, PathNormalization)
{
    H5File file(sampleFile());
    const std::vector<int64_t> expected = {10, 20, 30};
    EXPECT_EQ(toInts(file.readData("grp/values")), expected);
    EXPECT_EQ(toInts(file.readData("/grp//values")), expected);
    EXPECT_EQ(toInts(file.readData("/grp/./values")), expected);
    EXPECT_EQ(toInts(file.readData("/grp/nested/../values")), expected);
    EXPECT_EQ(file.group("/grp/").getPath(), "/grp");
}

TEST(H5File, HardLinkReadsOriginal)
{
    H5File file(sampleFile());
    EXPECT_EQ(file.readData("/alias"), file.readData("/grid"));
    EXPECT_EQ(file.dataset("/alias").getAddress(), file.dataset("/grid").getAddress());
    EXPECT_TRUE(file.isHardLink("/alias"));
}

TEST(H5File, SoftLinks)
{
    H5File file(sampleFile());
    const std::vector<int64_t> expected = {10, 20, 30};
    EXPECT_EQ(toInts(file.readData("/soft")), expected);
    EXPECT_EQ(toInts(file.readData("/grp/rel")), expected);
    EXPECT_EQ(toInts(file.readData("/gsoft/values")), expected);
    EXPECT_EQ(toDoubles(file.readData("/grp/up")), (std::vector<double>{1.5, 2.5, 3.5, 4.5}));
    EXPECT_EQ(file.dataset("/soft").getPath(), "/grp/values");
}

TEST(H5File, DanglingSoftLink)
{
    H5File file(sampleFile());
    EXPECT_THROW(file.dataset("/dangling"), DatasetNotFoundError);
    EXPECT_THROW(file.group("/dangling"), GroupNotFoundError);
    EXPECT_TRUE(file.isSoftLink("/dangling"));
    EXPECT_EQ(file.getObjectType("/dangling"), OBJECT_UNKNOWN);
}

TEST(H5File, CircularSoftLinks)
{
    H5File file(sampleFile());
    EXPECT_THROW(file.dataset("/loop_a"), CircularLinkError);
    EXPECT_THROW(file.group("/loop_b/x"), CircularLinkError);
    EXPECT_EQ(file.getObjectType("/loop_a"), OBJECT_UNKNOWN);
}

TEST(H5File, LongSoftLinkChain)
{
    H5Builder b;
    const bytes_t data = H5Builder::values(std::vector<int32_t>{1});
    std::vector<bytes_t> links = {H5Builder::hardLink("target", writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({1}), H5Builder::compactLayout(data)))};

    /* s0 -> s1 -> ... -> sN -> target */
    const int hops = MAX_LINK_DEPTH + 2;
    for(int i = 0; i < hops; i++)
    {
        const std::string next = (i == hops - 1) ? "/target" : "/s" + std::to_string(i + 1);
        links.push_back(H5Builder::softLink("s" + std::to_string(i), next));
    }

    H5File file(b.finish(writeGroup(b, links)));
    EXPECT_EQ(toInts(file.readData("/s" + std::to_string(hops - 4))), (std::vector<int64_t>{1}));
    EXPECT_THROW(file.dataset("/s0"), CircularLinkError);
}

TEST(H5File, ExternalLinks)
{
    H5File file(sampleFile());
    EXPECT_TRUE(file.isExternalLink("/ext"));
    EXPECT_FALSE(file.isSoftLink("/ext"));

    link_info_t info;
    ASSERT_TRUE(file.getLinkInfo("/ext", &info));
    EXPECT_EQ(info.type, EXTERNAL_LINK);
    EXPECT_EQ(info.filename, "other.h5");
    EXPECT_EQ(info.target, "/data");

    EXPECT_THROW(file.dataset("/ext"), UnsupportedFeatureError);
}

TEST(H5File, LinkQueriesAreTotal)
{
    H5File file(sampleFile());
    EXPECT_TRUE(file.isSoftLink("/soft"));
    EXPECT_FALSE(file.isHardLink("/soft"));
    EXPECT_TRUE(file.isHardLink("/grid"));
    EXPECT_TRUE(file.isHardLink("/grp/nested/deep"));
    EXPECT_TRUE(file.isSoftLink("/grp/rel"));

    EXPECT_FALSE(file.isSoftLink("/missing"));
    EXPECT_FALSE(file.isHardLink("/missing/deeper"));
    EXPECT_FALSE(file.isExternalLink("/loop_a/x"));
    EXPECT_FALSE(file.isHardLink("/"));

    link_info_t info;
    ASSERT_TRUE(file.getLinkInfo("/soft", &info));
    EXPECT_EQ(info.type, SOFT_LINK);
    EXPECT_EQ(info.target, "/grp/values");
    EXPECT_FALSE(file.getLinkInfo("/nothing", &info));
}

TEST(H5File, NotFoundErrors)
{
    H5File file(sampleFile());
    EXPECT_THROW(file.dataset("/missing"), DatasetNotFoundError);
    EXPECT_THROW(file.dataset("/grp"), DatasetNotFoundError);
    EXPECT_THROW(file.dataset("/grid/below"), DatasetNotFoundError);
    EXPECT_THROW(file.group("/grid"), GroupNotFoundError);
    EXPECT_THROW(file.group("/grp/missing"), GroupNotFoundError);
}

TEST(H5File, ObjectTypes)
{
    H5File file(sampleFile());
    EXPECT_EQ(file.getObjectType("/"), OBJECT_GROUP);
    EXPECT_EQ(file.getObjectType("/grp"), OBJECT_GROUP);
    EXPECT_EQ(file.getObjectType("/grp/nested/deep"), OBJECT_DATASET);
    EXPECT_EQ(file.getObjectType("/soft"), OBJECT_DATASET);
    EXPECT_EQ(file.getObjectType("/nowhere"), OBJECT_UNKNOWN);
}

/*----------------------------------------------------------------------------
 * Attributes
 *----------------------------------------------------------------------------*/

TEST(H5File, DatasetAttributes)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/scalar");

    const std::vector<H5Attribute> attrs = ds.findAttributes();
    ASSERT_EQ(attrs.size(), 4U);
    EXPECT_EQ(ds.listAttributes(), (std::vector<std::string>{"count", "weights", "label", "none"}));

    const H5Attribute& count = ds.attribute("count");
    EXPECT_TRUE(count.isScalar());
    EXPECT_FALSE(count.isArray());
    EXPECT_EQ(count.value().asInt(), 7);

    const H5Attribute& weights = ds.attribute("weights");
    EXPECT_TRUE(weights.isArray());
    EXPECT_FALSE(weights.isScalar());
    EXPECT_EQ(weights.shape(), (std::vector<uint64_t>{3}));
    const H5Value list = weights.value();
    ASSERT_EQ(list.size(), 3U);
    EXPECT_DOUBLE_EQ(list[2].asDouble(), 2.5);

    EXPECT_EQ(ds.attribute("label").value().asString(), "alpha");

    const H5Attribute& none = ds.attribute("none");
    EXPECT_FALSE(none.isScalar());
    EXPECT_FALSE(none.isArray());
    EXPECT_TRUE(none.value().isNil());

    EXPECT_THROW(ds.attribute("missing"), RunTimeException);
    EXPECT_TRUE(file.dataset("/grid").findAttributes().empty());
}

TEST(H5File, GroupAttributes)
{
    H5File file(sampleFile());
    H5Group grp = file.group("/grp");
    ASSERT_EQ(grp.findAttributes().size(), 1U);
    EXPECT_EQ(grp.attribute("units").value().asString(), "meters");
    EXPECT_TRUE(grp.attribute("units").isScalar());
}

/*----------------------------------------------------------------------------
 * Introspection
 *----------------------------------------------------------------------------*/

TEST(H5File, InspectDataset)
{
    H5File file(sampleFile());
    const std::string gzip = file.dataset("/gzip").inspect();
    EXPECT_NE(gzip.find("dataset /gzip\n"), std::string::npos);
    EXPECT_NE(gzip.find("shape: [100]"), std::string::npos);
    EXPECT_NE(gzip.find("layout: CHUNKED_LAYOUT"), std::string::npos);
    EXPECT_NE(gzip.find("chunks: [10]"), std::string::npos);
    EXPECT_NE(gzip.find("filters: deflate"), std::string::npos);

    const std::string scalar = file.dataset("/scalar").inspect();
    EXPECT_NE(scalar.find("attributes: count weights label none"), std::string::npos);
}

TEST(H5File, InspectGroup)
{
    H5File file(sampleFile());
    const std::string desc = file.group("/grp").inspect();
    EXPECT_NE(desc.find("group /grp\n"), std::string::npos);
    EXPECT_NE(desc.find("children: 4"), std::string::npos);
    EXPECT_NE(desc.find("values (HARD)"), std::string::npos);
    EXPECT_NE(desc.find("rel -> values (SOFT)"), std::string::npos);
    EXPECT_NE(desc.find("attributes: units"), std::string::npos);

    const std::string root = file.root().inspect();
    EXPECT_NE(root.find("ext -> other.h5:/data (EXTERNAL)"), std::string::npos);
}

TEST(H5File, ListRecursive)
{
    H5File file(sampleFile());
    EXPECT_EQ(file.listRecursive("/grp"), (std::vector<std::string>{"/grp/values", "/grp/rel", "/grp/up", "/grp/nested", "/grp/nested/deep"}));

    const std::vector<std::string> all = file.listRecursive();
    EXPECT_NE(std::find(all.begin(), all.end(), "/grp/nested/deep"), all.end());
    EXPECT_NE(std::find(all.begin(), all.end(), "/loop_a"), all.end());
    EXPECT_EQ(all.front(), "/contig");

    EXPECT_THROW(file.listRecursive("/grid"), GroupNotFoundError);
}

TEST(H5File, Structure)
{
    H5File file(sampleFile(), "sample.h5");
    const std::string desc = file.structure();
    EXPECT_EQ(desc.find("sample.h5 / (group)\n"), 0U);
    EXPECT_NE(desc.find("  grid (dataset int32 [10, 10])\n"), std::string::npos);
    EXPECT_NE(desc.find("  ctype (datatype)\n"), std::string::npos);
    EXPECT_NE(desc.find("  grp (group)\n"), std::string::npos);
    EXPECT_NE(desc.find("    nested (group)\n"), std::string::npos);
    EXPECT_NE(desc.find("      deep (dataset int8 [2])\n"), std::string::npos);
    EXPECT_NE(desc.find("  soft -> /grp/values (soft link)\n"), std::string::npos);
    EXPECT_NE(desc.find("  ext -> other.h5:/data (external link)\n"), std::string::npos);
}

TEST(H5File, Dereference)
{
    H5File file(sampleFile());
    EXPECT_EQ(file.dereference(file.rootAddress()), "/");
    EXPECT_EQ(file.dereference(file.dataset("/alias").getAddress()), "/grid");
    EXPECT_EQ(file.dereference(file.dataset("/soft").getAddress()), "/grp/values");
    EXPECT_THROW(file.dereference(1), RunTimeException);
}

/*----------------------------------------------------------------------------
 * Legacy Layout
 *----------------------------------------------------------------------------*/

TEST(H5File, SymbolTableGroups)
{
    H5File file(legacyFile());
    EXPECT_EQ(file.superblockVersion(), 0);
    EXPECT_EQ(file.root().children(), (std::vector<std::string>{"v1data", "g", "link"}));
    EXPECT_EQ(toInts(file.readData("/v1data")), (std::vector<int64_t>{3, 1, 4, 1}));
    EXPECT_EQ(toDoubles(file.readData("/g/inner")), (std::vector<double>{0.25, -8.0}));
    EXPECT_EQ(toDoubles(file.readData("/link")), (std::vector<double>{0.25, -8.0}));
    EXPECT_TRUE(file.isSoftLink("/link"));
    EXPECT_EQ(file.getObjectType("/g"), OBJECT_GROUP);
    EXPECT_EQ(file.listRecursive(), (std::vector<std::string>{"/v1data", "/g", "/g/inner", "/link"}));
}

/*----------------------------------------------------------------------------
 * Malformed Datasets
 *----------------------------------------------------------------------------*/

TEST(H5File, ChunkSizeMismatch)
{
    H5Builder b;
    const bytes_t short_chunk(12, 0);
    const std::vector<H5Builder::chunk_entry_t> entries = {{{0}, (uint32_t)short_chunk.size(), 0, b.append(short_chunk)}};
    const uint64_t tree = b.chunkTree(1, entries);
    const uint64_t ds = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({4}), H5Builder::chunkedLayout(tree, {4}, 4));
    H5File file(b.finish(writeGroup(b, {H5Builder::hardLink("ds", ds)})));
    EXPECT_THROW(file.readData("/ds"), DataReadError);
}

TEST(H5File, CorruptCompressedChunk)
{
    H5Builder b;
    const bytes_t garbage = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x11};
    const std::vector<H5Builder::chunk_entry_t> entries = {{{0}, (uint32_t)garbage.size(), 0, b.append(garbage)}};
    const uint64_t tree = b.chunkTree(1, entries);
    const messages_t filters = {H5Builder::message(H5Builder::FILTER, H5Builder::filterPipeline({H5Builder::filter(H5Filter::DEFLATE_FILTER, {6})}))};
    const uint64_t ds = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({4}), H5Builder::chunkedLayout(tree, {4}, 4), filters);
    H5File file(b.finish(writeGroup(b, {H5Builder::hardLink("ds", ds)})));
    EXPECT_THROW(file.readData("/ds"), DataReadError);
}

TEST(H5File, InconsistentLayouts)
{
    H5Builder b;
    const uint64_t elem_mismatch = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({4}), H5Builder::chunkedLayout(H5Builder::UNDEF, {2}, 8));
    const uint64_t rank_mismatch = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({4}), H5Builder::chunkedLayout(H5Builder::UNDEF, {2, 2}, 4));
    const messages_t filters = {H5Builder::message(H5Builder::FILTER, H5Builder::filterPipeline({H5Builder::filter(H5Filter::DEFLATE_FILTER)}))};
    const uint64_t filtered_contig = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({4}), H5Builder::contiguousLayout(H5Builder::UNDEF, 0), filters);
    const uint64_t short_compact = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({2}), H5Builder::compactLayout({1, 2, 3}));
    const uint64_t missing_layout = b.objectHeader({H5Builder::message(H5Builder::DATASPACE, H5Builder::dataspace({2})),
                                                    H5Builder::message(H5Builder::DATATYPE, H5Builder::fixedType(4, true)),
                                                    H5Builder::message(H5Builder::FILL_VALUE, H5Builder::fillValue({0, 0, 0, 0}))});
    const uint64_t virtual_layout = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({2}), {3, 3, 0, 0});
    const uint64_t layout_v4 = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({2}), {4, 1, 0, 0});

    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("elem_mismatch", elem_mismatch),
        H5Builder::hardLink("rank_mismatch", rank_mismatch),
        H5Builder::hardLink("filtered_contig", filtered_contig),
        H5Builder::hardLink("short_compact", short_compact),
        H5Builder::hardLink("missing_layout", missing_layout),
        H5Builder::hardLink("virtual_layout", virtual_layout),
        H5Builder::hardLink("layout_v4", layout_v4)
    })));

    EXPECT_THROW(file.dataset("/elem_mismatch"), FormatError);
    EXPECT_THROW(file.dataset("/rank_mismatch"), FormatError);
    EXPECT_THROW(file.dataset("/filtered_contig"), FormatError);
    EXPECT_THROW(file.readData("/short_compact"), DataReadError);
    EXPECT_THROW(file.dataset("/virtual_layout"), UnsupportedFeatureError);
    EXPECT_THROW(file.dataset("/layout_v4"), UnsupportedFeatureError);

    /* datatype and dataspace still classify it as a dataset */
    EXPECT_EQ(file.getObjectType("/missing_layout"), OBJECT_DATASET);
    EXPECT_THROW(file.dataset("/missing_layout"), DataReadError);
}

TEST(H5File, DenseLinkStorage)
{
    H5Builder b;
    const uint64_t dense = b.objectHeader({H5Builder::message(H5Builder::LINK_INFO, H5Builder::linkInfo(true))});
    H5File file(b.finish(writeGroup(b, {H5Builder::hardLink("dense", dense)})));

    H5Group grp = file.group("/dense");
    EXPECT_TRUE(grp.hasDenseLinks());
    EXPECT_TRUE(grp.children().empty());
    EXPECT_THROW(file.dataset("/dense/anything"), UnsupportedFeatureError);
}

TEST(H5File, OverflowingDataspace)
{
    const uint64_t rows = (1ULL << 62) + 1;

    H5Builder b;
    const uint64_t chunked = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({rows, 4}), H5Builder::chunkedLayout(H5Builder::UNDEF, {1, 1}, 1));
    const uint64_t contig = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({rows, 4}), H5Builder::contiguousLayout(0, 0));
    const uint64_t wide = writeDataset(b, H5Builder::fixedType(8, false), H5Builder::dataspace({1ULL << 61, 4}), H5Builder::contiguousLayout(0, 0));
    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("chunked", chunked),
        H5Builder::hardLink("contig", contig),
        H5Builder::hardLink("wide", wide)
    })));

    EXPECT_THROW(file.dataset("/chunked"), DataReadError);
    EXPECT_THROW(file.dataset("/contig"), DataReadError);
    EXPECT_EQ(file.getObjectType("/chunked"), OBJECT_UNKNOWN);
    EXPECT_EQ(file.getObjectType("/contig"), OBJECT_UNKNOWN);

    /* element count fits, byte count does not */
    EXPECT_EQ(file.getObjectType("/wide"), OBJECT_DATASET);
    EXPECT_THROW(file.dataset("/wide"), DataReadError);
}

TEST(H5File, ReadsBeyondMaximumSize)
{
    const uint64_t side = 1ULL << 31;

    H5Builder b;
    const messages_t fill = {H5Builder::message(H5Builder::FILL_VALUE, H5Builder::fillValue({5}))};
    const uint64_t sparse = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({side, side}), H5Builder::chunkedLayout(H5Builder::UNDEF, {1024, 1024}, 1), fill);
    const uint64_t contig = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({1ULL << 40}), H5Builder::contiguousLayout(0, 0));
    const uint64_t huge_chunk = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({side, side}), H5Builder::chunkedLayout(H5Builder::UNDEF, {0x80000000U, 0x80000000U}, 1));
    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("sparse", sparse),
        H5Builder::hardLink("contig", contig),
        H5Builder::hardLink("huge_chunk", huge_chunk)
    })));

    H5Dataset ds = file.dataset("/sparse");
    EXPECT_EQ(ds.elements(), 1ULL << 62);
    EXPECT_THROW(ds.readData(), DataReadError);

    std::vector<uint64_t> dims;
    const std::vector<H5Value> corner = ds.readSlice({{0, 2, 1}, {0, 2, 1}}, &dims);
    EXPECT_EQ(dims, (std::vector<uint64_t>{2, 2}));
    EXPECT_EQ(toInts(corner), (std::vector<int64_t>{5, 5, 5, 5}));

    /* storage declared larger than the image */
    H5Dataset big = file.dataset("/contig");
    EXPECT_THROW(big.readSlice({{0, 2, 1}}), DataReadError);

    EXPECT_THROW(file.dataset("/huge_chunk"), DataReadError);
}

TEST(H5File, DeclaredLengthsBeyondMessage)
{
    H5Builder b;

    /* eight byte link name length */
    bytes_t long_name;
    H5Builder::u8(long_name, 1);
    H5Builder::u8(long_name, 0x03);
    H5Builder::u64(long_name, 1ULL << 60);
    H5Builder::put(long_name, "x");
    H5Builder::u64(long_name, 0);

    bytes_t long_target;
    H5Builder::u8(long_target, 1);
    H5Builder::u8(long_target, 0x08);
    H5Builder::u8(long_target, SOFT_LINK);
    H5Builder::u8(long_target, 1);
    H5Builder::put(long_target, "y");
    H5Builder::u16(long_target, 0xFFFF);
    H5Builder::put(long_target, "/ok");

    bytes_t long_fill;
    H5Builder::u8(long_fill, 3);
    H5Builder::u8(long_fill, 0x20 | 0x02);
    H5Builder::u32(long_fill, 0xFFFFFFF0U);
    H5Builder::u8(long_fill, 0);

    const uint64_t ok = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({2}), H5Builder::compactLayout({3, 4}));
    const uint64_t filled = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({2}), H5Builder::compactLayout({3, 4}),
                                         {H5Builder::message(H5Builder::FILL_VALUE, long_fill)});
    const uint64_t bad_name = writeGroup(b, {long_name});
    const uint64_t bad_target = writeGroup(b, {long_target});
    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("ok", ok),
        H5Builder::hardLink("filled", filled),
        H5Builder::hardLink("bad_name", bad_name),
        H5Builder::hardLink("bad_target", bad_target)
    })));

    EXPECT_FALSE(file.isSoftLink("/bad_name/x"));
    EXPECT_FALSE(file.isHardLink("/bad_name/x"));
    EXPECT_EQ(file.getObjectType("/bad_name"), OBJECT_UNKNOWN);
    EXPECT_EQ(file.getObjectType("/bad_name/x"), OBJECT_UNKNOWN);
    EXPECT_THROW(file.dataset("/bad_name/x"), FormatError);
    EXPECT_THROW(file.group("/bad_name"), FormatError);

    EXPECT_FALSE(file.isSoftLink("/bad_target/y"));
    EXPECT_THROW(file.group("/bad_target"), FormatError);

    EXPECT_EQ(file.getObjectType("/filled"), OBJECT_UNKNOWN);
    EXPECT_THROW(file.dataset("/filled"), FormatError);

    /* siblings are unaffected */
    EXPECT_EQ(toInts(file.readData("/ok")), (std::vector<int64_t>{3, 4}));
}

/*----------------------------------------------------------------------------
 * Typed Reads
 *----------------------------------------------------------------------------*/

TEST(H5File, BooleanDatasets)
{
    H5Builder b;
    const uint64_t flags = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({4}), H5Builder::compactLayout({0, 1, 2, 0}));
    const uint64_t ints = writeDataset(b, H5Builder::fixedType(4, true), H5Builder::dataspace({1}), H5Builder::compactLayout({1, 0, 0, 0}));
    const uint64_t text = writeDataset(b, H5Builder::stringType(1), H5Builder::dataspace({1}), H5Builder::compactLayout({'t'}));
    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("flags", flags),
        H5Builder::hardLink("ints", ints),
        H5Builder::hardLink("text", text)
    })));

    EXPECT_EQ(file.readAsBool("/flags"), (std::vector<bool>{false, true, true, false}));
    EXPECT_THROW(file.readAsBool("/ints"), UnsupportedFeatureError);
    EXPECT_THROW(file.readAsBool("/text"), UnsupportedFeatureError);
}

TEST(H5File, TimeDatasets)
{
    H5Builder b;
    const uint64_t stamps = writeDataset(b, H5Builder::fixedType(8, true), H5Builder::dataspace({2}),
                                         H5Builder::compactLayout(H5Builder::values(std::vector<int64_t>{1700000000LL, 1700000000123LL})));
    const uint64_t reals = writeDataset(b, H5Builder::floatType(8), H5Builder::dataspace({1}),
                                        H5Builder::compactLayout(H5Builder::values(std::vector<double>{1.0})));
    H5File file(b.finish(writeGroup(b, {
        H5Builder::hardLink("stamps", stamps),
        H5Builder::hardLink("reals", reals)
    })));

    const std::vector<gmt_time_t> times = file.readAsTime("/stamps");
    ASSERT_EQ(times.size(), 2U);
    EXPECT_EQ(times[0].year, 2023);
    EXPECT_EQ(times[0].second, 20);
    EXPECT_EQ(times[0].millisecond, 0);
    EXPECT_EQ(times[1].second, 20);
    EXPECT_EQ(times[1].millisecond, 123);

    const std::vector<gmt_time_t> forced = file.dataset("/stamps").readAsTime(UNIT_MILLISECONDS);
    EXPECT_EQ(forced[0].year, 1970);
    EXPECT_EQ(forced[0].month, 1);
    EXPECT_EQ(forced[0].day, 20);

    EXPECT_THROW(file.readAsTime("/reals"), UnsupportedFeatureError);
}

TEST(H5File, SingleElementAttributes)
{
    H5Builder b;
    const uint64_t ds = writeDataset(b, H5Builder::fixedType(1, false), H5Builder::dataspace({1}), H5Builder::compactLayout({1}), {
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("single", H5Builder::floatType(8), H5Builder::dataspace({1}), H5Builder::values(std::vector<double>{1.5}))),
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("matrix", H5Builder::fixedType(2, true), H5Builder::dataspace({1, 1}), H5Builder::values(std::vector<int16_t>{-3}))),
        H5Builder::message(H5Builder::ATTRIBUTE, H5Builder::attribute("zero", H5Builder::fixedType(2, true), H5Builder::dataspace({0}), bytes_t()))
    });
    H5File file(b.finish(writeGroup(b, {H5Builder::hardLink("ds", ds)})));
    H5Dataset dataset = file.dataset("/ds");

    const H5Attribute& single = dataset.attribute("single");
    EXPECT_TRUE(single.isScalar());
    EXPECT_FALSE(single.isArray());
    EXPECT_EQ(single.shape(), (std::vector<uint64_t>{1}));
    EXPECT_DOUBLE_EQ(single.value().asDouble(), 1.5);

    const H5Attribute& matrix = dataset.attribute("matrix");
    EXPECT_TRUE(matrix.isScalar());
    EXPECT_EQ(matrix.value().asInt(), -3);

    const H5Attribute& zero = dataset.attribute("zero");
    EXPECT_FALSE(zero.isScalar());
    EXPECT_TRUE(zero.isArray());
    EXPECT_EQ(zero.value().size(), 0U);
}

/*----------------------------------------------------------------------------
 * Lifecycle
 *----------------------------------------------------------------------------*/

TEST(H5File, ReadAfterClose)
{
    H5File file(sampleFile());
    H5Dataset ds = file.dataset("/grid");
    H5Group grp = file.group("/grp");

    file.close();
    EXPECT_FALSE(file.isOpen());
    EXPECT_THROW(ds.readData(), DataReadError);
    EXPECT_THROW(file.dataset("/contig"), DataReadError);

    /* metadata already parsed stays available */
    EXPECT_EQ(ds.shape(), (std::vector<uint64_t>{10, 10}));
    EXPECT_EQ(grp.children().size(), 4U);

    file.close();
}
