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

#include "UT_Reader.h"
#include "H5TestFile.h"
#include "MemoryRangeSource.h"
#include "H5Reader.h"
#include "H5ChunkCache.h"
#include "StreamConfig.h"

#include <dirent.h>
#include <unistd.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

using H5Stream::H5Reader;

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Reader::SUITE_NAME = "reader";
const UnitTest::test_t UT_Reader::TESTS[] = {
    {"end_to_end",              testEndToEnd},
    {"region_matches_chunks",   testRegionMatchesChunks},
    {"edge_chunks",             testEdgeChunks},
    {"single_flight",           testSingleFlight},
    {"region_gap",              testRegionGap},
    {"small_dataset",           testSmallDataset},
    {"attributes",              testAttributes},
    {"open_bandwidth",          testOpenBandwidth},
    {"bad_signature",           testBadSignature},
    {"closed",                  testClosed},
    {"list_datasets",           testListDatasets},
    {"stale_cached_chunk",      testStaleCachedChunk},
    {"corrupt_chunk_size",      testCorruptChunkSize},
    {NULL,                      NULL}
};

/******************************************************************************
 * LOCAL TYPES
 ******************************************************************************/

/*
 * /data            float32 5x7 in 2x3 chunks, shuffle + deflate, v1 b-tree
 * /grid/counts     int32 4x4 in 2x2 chunks, fixed array, fill -1, chunk (1,0) unwritten
 * /grid/name       compact fixed length string
 * /grid/scalar     contiguous float64 scalar
 * /grid/labels     variable length strings
 * /grid/bad        chunked with an unknown filter
 */
struct Granule
{
    H5TestFile              file;
    std::vector<uint64_t>   dataChunks;     // addresses in grid order
    std::vector<uint64_t>   countChunks;

    static constexpr uint64_t ROWS = 5;
    static constexpr uint64_t COLS = 7;

    Granule (void);
};

struct ReadJob
{
    H5Reader*           reader;
    H5Reader::chunk_t   chunk;
    int                 code;
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * int32Bytes
 *----------------------------------------------------------------------------*/
static H5TestFile::bytes_t int32Bytes (const std::vector<int32_t>& values)
{
    H5TestFile::bytes_t data(values.size() * sizeof(int32_t));
    if(!values.empty()) memcpy(data.data(), values.data(), data.size());
    return data;
}

/*----------------------------------------------------------------------------
 * Granule Constructor
 *----------------------------------------------------------------------------*/
Granule::Granule (void)
{
    /* /data: value at (r,c) is r*100 + c, edge chunks padded with zeros */
    const std::vector<H5TestFile::filter_spec_t> pipeline = {
        {H5Stream::SHUFFLE_FILTER, {4}},
        {H5Stream::DEFLATE_FILTER, {6}}
    };
    std::vector<H5TestFile::chunk_entry_t> entries;
    for(uint64_t cr = 0; cr < 3; cr++)
    {
        for(uint64_t cc = 0; cc < 3; cc++)
        {
            std::vector<float> values(6, 0.0f);
            for(uint64_t r = 0; r < 2; r++)
            {
                for(uint64_t c = 0; c < 3; c++)
                {
                    const uint64_t row = (cr * 2) + r;
                    const uint64_t col = (cc * 3) + c;
                    if(row < ROWS && col < COLS) values[(r * 3) + c] = static_cast<float>((row * 100) + col);
                }
            }
            entries.push_back(file.writeChunk({cr * 2, cc * 3}, H5TestFile::float32Bytes(values), pipeline, 4));
            dataChunks.push_back(entries.back().address);
        }
    }
    const uint64_t data_tree = file.chunkTreeNode(0, 2, entries);
    const uint64_t data = file.objectHeader({
        H5TestFile::dataspaceMsg({ROWS, COLS}),
        H5TestFile::floatMsg(4),
        H5TestFile::filterMsg(pipeline),
        H5TestFile::chunkedLayoutV3Msg(data_tree, {2, 3}, 4),
        H5TestFile::attributeMsg("units", H5TestFile::stringMsg(6), H5TestFile::dataspaceMsg({}), {'m', 'e', 't', 'e', 'r', 's'}),
        H5TestFile::attributeMsg("scale", H5TestFile::floatMsg(4), H5TestFile::dataspaceMsg({2}), H5TestFile::float32Bytes({0.5f, 2.0f}))
    });

    /* /grid/counts: value at (r,c) is r*10 + c */
    std::vector<H5TestFile::chunk_entry_t> count_entries;
    for(uint64_t cr = 0; cr < 2; cr++)
    {
        for(uint64_t cc = 0; cc < 2; cc++)
        {
            if(cr == 1 && cc == 0)
            {
                H5TestFile::chunk_entry_t unwritten = {{}, H5TestFile::UNDEFINED, 0, 0};
                count_entries.push_back(unwritten);
                countChunks.push_back(H5TestFile::UNDEFINED + 0);
                continue;
            }
            std::vector<int32_t> values;
            for(uint64_t r = 0; r < 2; r++)
            {
                for(uint64_t c = 0; c < 2; c++)
                {
                    values.push_back(static_cast<int32_t>((((cr * 2) + r) * 10) + (cc * 2) + c));
                }
            }
            count_entries.push_back(file.writeChunk({}, int32Bytes(values), {}, 4));
            countChunks.push_back(count_entries.back().address);
        }
    }
    const uint64_t count_array = file.fixedArray(count_entries, false);
    const uint64_t counts = file.objectHeader({
        H5TestFile::dataspaceMsg({4, 4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::fillValueMsg(int32Bytes({-1})),
        H5TestFile::chunkedLayoutV4Msg(3, count_array, {2, 2}, 4)
    });

    /* /grid/name */
    const uint64_t name = file.objectHeader({
        H5TestFile::dataspaceMsg({}),
        H5TestFile::stringMsg(8),
        H5TestFile::compactLayoutMsg({'h', 'e', 'l', 'l', 'o', 0, 0, 0})
    });

    /* /grid/scalar */
    const double scalar_value = 3.25;
    H5TestFile::bytes_t scalar_bytes(sizeof(double));
    memcpy(scalar_bytes.data(), &scalar_value, sizeof(double));
    const uint64_t scalar_data = file.append(scalar_bytes);
    const uint64_t scalar = file.objectHeader({
        H5TestFile::dataspaceMsg({}),
        H5TestFile::floatMsg(8),
        H5TestFile::contiguousLayoutMsg(scalar_data, sizeof(double))
    });

    /* /grid/labels */
    const uint64_t collection = file.globalHeap({"alpha", "beta"});
    H5TestFile::bytes_t label_bytes = H5TestFile::vlenElement(5, collection, 1);
    const H5TestFile::bytes_t second = H5TestFile::vlenElement(4, collection, 2);
    label_bytes.insert(label_bytes.end(), second.begin(), second.end());
    const uint64_t label_data = file.append(label_bytes);
    const uint64_t labels = file.objectHeader({
        H5TestFile::dataspaceMsg({2}),
        H5TestFile::vlenStringMsg(),
        H5TestFile::contiguousLayoutMsg(label_data, label_bytes.size())
    });

    /* /grid/bad */
    const uint64_t bad = file.objectHeader({
        H5TestFile::dataspaceMsg({8}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::filterMsg({{32001, {1, 2}}}),
        H5TestFile::chunkedLayoutV3Msg(H5TestFile::UNDEFINED, {4}, 4)
    });

    const uint64_t grid = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"counts", counts, ""}),
        H5TestFile::linkMsg({"name", name, ""}),
        H5TestFile::linkMsg({"scalar", scalar, ""}),
        H5TestFile::linkMsg({"labels", labels, ""}),
        H5TestFile::linkMsg({"bad", bad, ""})
    });

    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"grid", grid, ""}),
        H5TestFile::linkMsg({"data", data, ""})
    });

    file.superblockV2(root);
}

/*----------------------------------------------------------------------------
 * readWorker
 *----------------------------------------------------------------------------*/
static void* readWorker (void* parm)
{
    ReadJob* job = static_cast<ReadJob*>(parm);
    try
    {
        job->chunk = job->reader->readChunk("/data", 1, 1);
    }
    catch(const RunTimeException& e)
    {
        job->code = e.code();
    }
    return NULL;
}

/*----------------------------------------------------------------------------
 * chunkCode - error code of reading a chunk, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int chunkCode (H5Reader* reader, const char* id, uint64_t row, uint64_t col)
{
    try
    {
        reader->readChunk(id, row, col);
    }
    catch(const RunTimeException& e)
    {
        return e.code();
    }
    return RTE_INFO;
}

/*----------------------------------------------------------------------------
 * vectorCode - error code of reading a chunk by coordinate, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int vectorCode (H5Reader* reader, const char* id, const std::vector<uint64_t>& coord)
{
    try
    {
        reader->readChunk(id, coord);
    }
    catch(const RunTimeException& e)
    {
        return e.code();
    }
    return RTE_INFO;
}

/*----------------------------------------------------------------------------
 * removeDirectory
 *----------------------------------------------------------------------------*/
static void removeDirectory (const std::string& path)
{
    DIR* dir = opendir(path.c_str());
    if(dir)
    {
        struct dirent* ent;
        while((ent = readdir(dir)) != NULL)
        {
            if(strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
            const std::string file = path + "/" + ent->d_name;
            unlink(file.c_str());
        }
        closedir(dir);
    }
    rmdir(path.c_str());
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_Reader::UT_Reader (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testEndToEnd - open, find, fetch and decode one filtered chunk
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testEndToEnd (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    ut_assert(ut, reader.superblock().version == 2, "wrong superblock version: %d", reader.superblock().version);
    ut_assert(ut, strcmp(reader.origin(), "memory://test.h5") == 0, "wrong origin: %s", reader.origin());

    H5Reader::chunk_t chunk = reader.readChunk("/data", 1, 2);
    ut_assert(ut, chunk != nullptr, "chunk (1,2) missing");
    if(chunk)
    {
        ut_assert(ut, chunk->dtype() == H5Stream::FLOAT32, "wrong type: %s", H5Stream::type2str(chunk->dtype()));
        ut_assert(ut, chunk->size() == 6, "wrong element count: %lu", (unsigned long)chunk->size());
        ut_assert(ut, chunk->value(0) == 206.0, "wrong first value: %lf", chunk->value(0));
        ut_assert(ut, chunk->value(3) == 306.0, "wrong second row: %lf", chunk->value(3));
        ut_assert(ut, chunk->value(1) == 0.0, "padding not zero: %lf", chunk->value(1));
    }

    /* Same chunk again comes from the cache */
    H5Reader::chunk_t again = reader.readChunk("data", 1, 2);
    ut_assert(ut, again.get() == chunk.get(), "repeated read not shared");

    const H5Stream::StreamingStats stats = reader.getStreamingStats();
    ut_assert(ut, stats.chunksLoaded == 1, "wrong chunk count: %ld", (long)stats.chunksLoaded);
    ut_assert(ut, stats.cacheHits == 1, "wrong cache hits: %ld", (long)stats.cacheHits);
    ut_assert(ut, stats.metadataBytes >= 4096, "metadata bytes not counted: %ld", (long)stats.metadataBytes);

    /* Errors */
    ut_assert(ut, chunkCode(&reader, "/missing", 0, 0) == RTE_RESOURCE_DOES_NOT_EXIST, "missing dataset");
    ut_assert(ut, chunkCode(&reader, "/grid", 0, 0) == RTE_RESOURCE_DOES_NOT_EXIST, "group read as dataset");
    ut_assert(ut, chunkCode(&reader, "/data", 3, 0) == RTE_RESOURCE_DOES_NOT_EXIST, "chunk outside grid");
    ut_assert(ut, chunkCode(&reader, "/grid/scalar", 0, 0) == RTE_UNSUPPORTED_FORMAT, "contiguous dataset read as chunked");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testRegionMatchesChunks - a region is the union of the chunks under it
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testRegionMatchesChunks (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    const H5Stream::TypedArray region = reader.readRegion("/data", 1, 2, 3, 4);
    ut_assert(ut, region.size() == 12, "wrong region size: %lu", (unsigned long)region.size());

    bool mismatch = false;
    for(uint64_t r = 0; r < 3 && !mismatch; r++)
    {
        for(uint64_t c = 0; c < 4; c++)
        {
            const double expected = static_cast<double>(((r + 1) * 100) + (c + 2));
            if(region.value((r * 4) + c) != expected)
            {
                ut_assert(ut, false, "cell (%lu,%lu): %lf != %lf", (unsigned long)r, (unsigned long)c, region.value((r * 4) + c), expected);
                mismatch = true;
                break;
            }
        }
    }

    /* Region spans chunks (0..1, 0..1) */
    H5Stream::StreamingStats stats = reader.getStreamingStats();
    ut_assert(ut, stats.chunksLoaded == 4, "wrong chunk count: %ld", (long)stats.chunksLoaded);

    /* Cell of the region equals the cell of its chunk */
    H5Reader::chunk_t chunk = reader.readChunk("/data", 1, 1);
    ut_assert(ut, chunk && chunk->value(2) == region.value((1 * 4) + 3), "chunk and region disagree");

    const H5Stream::TypedArray empty = reader.readRegion("/data", 0, 0, 0, 5);
    ut_assert(ut, empty.empty(), "empty region has %lu elements", (unsigned long)empty.size());

    stats = reader.getStreamingStats();
    ut_assert(ut, stats.chunksLoaded == 4 && stats.cacheHits >= 1, "chunks reloaded: %ld loaded, %ld hits", (long)stats.chunksLoaded, (long)stats.cacheHits);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testEdgeChunks - partial chunks and cells past the dataset
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testEdgeChunks (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    const H5Stream::TypedArray region = reader.readRegion("/data", 3, 5, 4, 4);
    ut_assert(ut, region.size() == 16, "wrong region size: %lu", (unsigned long)region.size());
    ut_assert(ut, region.value(0) == 305.0, "cell (3,5): %lf", region.value(0));
    ut_assert(ut, region.value(5) == 406.0, "cell (4,6): %lf", region.value(5));
    ut_assert(ut, std::isnan(region.value(2)), "cell past last column: %lf", region.value(2));
    ut_assert(ut, std::isnan(region.value(8)), "cell past last row: %lf", region.value(8));

    /* Whole dataset */
    const H5Stream::TypedArray full = reader.readRegion("/data", 0, 0, Granule::ROWS, Granule::COLS);
    ut_assert(ut, full.value((4 * Granule::COLS) + 6) == 406.0, "last cell: %lf", full.value((4 * Granule::COLS) + 6));
    ut_assert(ut, full.value(0) == 0.0, "first cell: %lf", full.value(0));

    /* Region entirely outside */
    const H5Stream::TypedArray outside = reader.readRegion("/data", 10, 10, 2, 2);
    ut_assert(ut, outside.size() == 4 && std::isnan(outside.value(3)), "outside region not sentinel");

    /* Region reads on contiguous data */
    int code = RTE_INFO;
    try
    {
        reader.readRegion("/grid/labels", 0, 0, 1, 1);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_UNSUPPORTED_FORMAT, "rank 1 region: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSingleFlight - concurrent requests for one chunk share one fetch
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testSingleFlight (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    MemoryRangeSource* source = new MemoryRangeSource(granule.file.image());
    H5Reader reader(source, 0x100000);
    source->setLatency(0.05);

    ReadJob jobs[4];
    for(int i = 0; i < 4; i++)
    {
        jobs[i].reader = &reader;
        jobs[i].code = RTE_INFO;
    }

    {
        Thread t0(readWorker, &jobs[0]);
        Thread t1(readWorker, &jobs[1]);
        Thread t2(readWorker, &jobs[2]);
        Thread t3(readWorker, &jobs[3]);
    }

    const uint64_t chunk_address = granule.dataChunks[(1 * 3) + 1];
    ut_assert(ut, source->readsAt(chunk_address) == 1, "chunk fetched %d times", source->readsAt(chunk_address));

    for(int i = 0; i < 4; i++)
    {
        ut_assert(ut, jobs[i].code == RTE_INFO, "reader %d failed: %s", i, RunTimeException::code2str(jobs[i].code));
        ut_assert(ut, jobs[i].chunk && jobs[i].chunk.get() == jobs[0].chunk.get(), "reader %d got a different chunk", i);
    }
    if(jobs[0].chunk)
    {
        ut_assert(ut, jobs[0].chunk->value(4) == 304.0, "wrong value: %lf", jobs[0].chunk->value(4));
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testRegionGap - failed and unwritten chunks leave the sentinel
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testRegionGap (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    MemoryRangeSource* source = new MemoryRangeSource(granule.file.image());
    H5Reader reader(source, 0x100000);

    /* Chunk (0,1) never arrives */
    source->failAt(granule.countChunks[1]);

    const H5Stream::TypedArray region = reader.readRegion("/grid/counts", 0, 0, 4, 4);
    ut_assert(ut, region.dtype() == H5Stream::INT32, "wrong type: %s", H5Stream::type2str(region.dtype()));

    const int32_t* cells = region.as<int32_t>();
    ut_assert(ut, cells[(0 * 4) + 0] == 0 && cells[(1 * 4) + 1] == 11, "chunk (0,0) wrong: %d, %d", cells[0], cells[5]);
    ut_assert(ut, cells[(0 * 4) + 2] == -1 && cells[(1 * 4) + 3] == -1, "failed chunk not filled: %d, %d", cells[2], cells[7]);
    ut_assert(ut, cells[(2 * 4) + 0] == -1 && cells[(3 * 4) + 1] == -1, "unwritten chunk not filled: %d, %d", cells[8], cells[13]);
    ut_assert(ut, cells[(2 * 4) + 2] == 22 && cells[(3 * 4) + 3] == 33, "chunk (1,1) wrong: %d, %d", cells[10], cells[15]);

    const H5Stream::StreamingStats stats = reader.getStreamingStats();
    ut_assert(ut, stats.failedRequests >= 1, "failure not counted");

    /* Single chunk reads still report the error */
    ut_assert(ut, chunkCode(&reader, "/grid/counts", 0, 1) == RTE_IO_ERROR, "failed chunk read");
    ut_assert(ut, reader.readChunk("/grid/counts", 1, 0) == nullptr, "unwritten chunk returned data");

    /* Recovers once the source does */
    source->failAt(MemoryRangeSource::NO_POSITION);
    H5Reader::chunk_t chunk = reader.readChunk("/grid/counts", 0, 1);
    ut_assert(ut, chunk && chunk->value(0) == 2.0, "chunk (0,1) not recovered");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSmallDataset
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testSmallDataset (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    const H5Stream::SmallValue scalar = reader.readSmallDataset("/grid/scalar");
    ut_assert(ut, scalar.shape.empty() && !scalar.isString, "scalar has a shape");
    ut_assert(ut, scalar.array.size() == 1 && scalar.array.value(0) == 3.25, "wrong scalar value");

    const H5Stream::SmallValue name = reader.readSmallDataset("/grid/name");
    ut_assert(ut, name.isString && name.strings.size() == 1, "fixed string not decoded");
    ut_assert(ut, !name.strings.empty() && name.strings[0] == "hello", "wrong string: %s", name.strings.empty() ? "" : name.strings[0].c_str());

    const H5Stream::SmallValue labels = reader.readSmallDataset("/grid/labels");
    ut_assert(ut, labels.isString && labels.strings.size() == 2, "variable length strings not decoded");
    ut_assert(ut, labels.strings.size() == 2 && labels.strings[0] == "alpha" && labels.strings[1] == "beta", "wrong labels");

    /* Chunked datasets are assembled */
    const H5Stream::SmallValue data = reader.readSmallDataset("/data");
    ut_assert(ut, data.shape.size() == 2 && data.shape[0] == 5 && data.shape[1] == 7, "wrong shape");
    ut_assert(ut, data.array.size() == 35, "wrong element count: %lu", (unsigned long)data.array.size());
    ut_assert(ut, data.array.value((1 * 7) + 2) == 102.0, "wrong value: %lf", data.array.value(9));
    ut_assert(ut, data.array.value((4 * 7) + 6) == 406.0, "wrong edge value: %lf", data.array.value(34));

    /* Over the limit */
    const long limit = StreamConfig::settings().smallDatasetLimit;
    StreamConfig::settings().smallDatasetLimit = 16;
    int code = RTE_INFO;
    try
    {
        reader.readSmallDataset("/data");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    StreamConfig::settings().smallDatasetLimit = limit;
    ut_assert(ut, code == RTE_ERROR, "oversized dataset: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testAttributes
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testAttributes (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    const std::vector<H5Stream::AttributeValue> attributes = reader.listAttributes("/data");
    ut_assert(ut, attributes.size() == 2, "wrong attribute count: %ld", (long)attributes.size());
    if(attributes.size() == 2)
    {
        ut_assert(ut, attributes[0].name == "units", "wrong name: %s", attributes[0].name.c_str());
        ut_assert(ut, attributes[0].value.isString && !attributes[0].value.strings.empty() && attributes[0].value.strings[0] == "meters", "wrong units");
        ut_assert(ut, attributes[1].name == "scale", "wrong name: %s", attributes[1].name.c_str());
        ut_assert(ut, attributes[1].value.array.size() == 2, "wrong scale size");
        ut_assert(ut, attributes[1].value.array.value(0) == 0.5 && attributes[1].value.array.value(1) == 2.0, "wrong scale values");
    }

    ut_assert(ut, reader.listAttributes("/grid").empty(), "group has attributes");

    int code = RTE_INFO;
    try
    {
        reader.listAttributes("/grid/nothing");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing object: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testOpenBandwidth - opening reads the metadata budget and nothing else
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testOpenBandwidth (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t elements = 0x40000;
    const uint64_t bulk = file.append(H5TestFile::bytes_t(elements * 4, 0x7F));
    const uint64_t data = file.objectHeader({
        H5TestFile::dataspaceMsg({elements}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::contiguousLayoutMsg(bulk, elements * 4)
    });
    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"bulk", data, ""})
    });
    file.superblockV2(root);

    MemoryRangeSource* source = new MemoryRangeSource(file.image());
    H5Reader reader(source, 4096);

    ut_assert(ut, source->reads() == 1, "open issued %ld reads", source->reads());
    ut_assert(ut, source->bytesRead() == 4096, "open read %ld bytes", (long)source->bytesRead());

    /* Listing touches headers only */
    const std::vector<H5Stream::DatasetDescriptor> datasets = reader.listDatasets();
    ut_assert(ut, datasets.size() == 1 && datasets[0].shape[0] == elements, "wrong listing");
    ut_assert(ut, source->bytesRead() < static_cast<int64_t>(elements * 4), "listing read the data: %ld bytes", (long)source->bytesRead());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBadSignature
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testBadSignature (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string text = "this is not an hdf5 file\n";
    const std::vector<uint8_t> image(text.begin(), text.end());

    int code = RTE_INFO;
    try
    {
        H5Reader reader(new MemoryRangeSource(image), 4096);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "text file: %s", RunTimeException::code2str(code));

    code = RTE_INFO;
    try
    {
        H5Reader reader(new MemoryRangeSource(std::vector<uint8_t>()), 4096);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "empty file: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testClosed
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testClosed (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);
    ut_assert(ut, reader.readChunk("/data", 0, 0) != nullptr, "chunk (0,0) missing");

    reader.close();
    reader.close();

    ut_assert(ut, chunkCode(&reader, "/data", 0, 0) == RTE_ERROR, "read after close");

    int code = RTE_INFO;
    try
    {
        reader.listDatasets();
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_ERROR, "listing after close: %s", RunTimeException::code2str(code));

    /* Counters start over once the file is closed */
    const H5Stream::StreamingStats stats = reader.getStreamingStats();
    ut_assert(ut, stats.chunksLoaded == 0, "chunk count kept after close: %ld", (long)stats.chunksLoaded);
    ut_assert(ut, stats.totalBytes == 0 && stats.totalRequests == 0, "transfer totals kept after close: %ld bytes, %ld requests", (long)stats.totalBytes, (long)stats.totalRequests);
    ut_assert(ut, stats.metadataBytes == 0, "metadata bytes kept after close: %ld", (long)stats.metadataBytes);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testListDatasets
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testListDatasets (UnitTest* ut)
{
    ut_initialize(ut);

    Granule granule;
    H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

    const std::vector<H5Stream::DatasetDescriptor> datasets = reader.listDatasets();
    const char* expected[] = {"/data", "/grid/bad", "/grid/counts", "/grid/labels", "/grid/name", "/grid/scalar"};
    ut_assert(ut, datasets.size() == 6, "wrong dataset count: %ld", (long)datasets.size());
    for(size_t i = 0; i < datasets.size() && i < 6; i++)
    {
        ut_assert(ut, datasets[i].path == expected[i], "dataset %ld: %s != %s", (long)i, datasets[i].path.c_str(), expected[i]);
    }
    if(datasets.size() != 6) return ut_status(ut);

    const H5Stream::DatasetDescriptor& data = datasets[0];
    ut_assert(ut, data.chunked && data.dtype == H5Stream::FLOAT32, "wrong /data type");
    ut_assert(ut, data.indexKind == H5Stream::BTREE_V1_INDEX, "wrong index: %s", H5Stream::index2str(data.indexKind));
    ut_assert(ut, data.numChunks == 9, "wrong chunk count: %lu", (unsigned long)data.numChunks);
    ut_assert(ut, data.chunkDims.size() == 2 && data.chunkDims[0] == 2 && data.chunkDims[1] == 3, "wrong chunk dims");
    ut_assert(ut, data.filters.size() == 2 && data.filters[0] == H5Stream::SHUFFLE_FILTER && data.filters[1] == H5Stream::DEFLATE_FILTER, "wrong filters");
    ut_assert(ut, data.readable, "/data not readable: %s", data.error.c_str());

    const H5Stream::DatasetDescriptor& bad = datasets[1];
    ut_assert(ut, !bad.readable && bad.errorCode == RTE_UNSUPPORTED_FORMAT, "unknown filter not flagged");

    const H5Stream::DatasetDescriptor& counts = datasets[2];
    ut_assert(ut, counts.indexKind == H5Stream::FIXED_ARRAY_INDEX, "wrong index: %s", H5Stream::index2str(counts.indexKind));
    ut_assert(ut, counts.fillValue.size() == 4, "fill value missing");

    ut_assert(ut, datasets[3].isString && datasets[4].isString, "strings not flagged");
    ut_assert(ut, datasets[5].dtype == H5Stream::FLOAT64 && datasets[5].shape.empty(), "wrong scalar descriptor");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testStaleCachedChunk - a persisted chunk of another shape is refetched
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testStaleCachedChunk (UnitTest* ut)
{
    ut_initialize(ut);

    char dir[] = "/tmp/h5stream-ut-XXXXXX";
    if(mkdtemp(dir) == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to create temporary directory: %s", strerror(errno));
    }

    /* Left behind by an earlier file at the same origin */
    const std::string key = H5ChunkCache::makeKey("memory://test.h5", "/data", {0, 0});
    {
        H5ChunkCache seed(4, dir, 16);
        std::shared_ptr<H5Stream::TypedArray> stale = std::make_shared<H5Stream::TypedArray>(H5Stream::INT8, 1);
        stale->setValue(0, 7);
        seed.put(key, stale);
    }

    StreamConfig& config = StreamConfig::settings();
    const std::string saved_dir = config.persistentCacheDir;
    config.persistentCacheDir = dir;

    {
        Granule granule;
        H5Reader reader(new MemoryRangeSource(granule.file.image()), 4096);

        const H5Stream::TypedArray region = reader.readRegion("/data", 0, 0, 2, 3);
        ut_assert(ut, region.size() == 6, "wrong region size: %lu", (unsigned long)region.size());
        ut_assert(ut, region.value(0) == 0.0, "cell (0,0): %lf", region.value(0));
        ut_assert(ut, region.value(5) == 102.0, "cell (1,2): %lf", region.value(5));

        const H5Stream::StreamingStats stats = reader.getStreamingStats();
        ut_assert(ut, stats.chunksLoaded == 1, "stale chunk not refetched: %ld loaded", (long)stats.chunksLoaded);
        ut_assert(ut, stats.cacheHits == 0, "stale chunk counted as a hit: %ld", (long)stats.cacheHits);

        H5Reader::chunk_t chunk = reader.readChunk("/data", 0, 0);
        ut_assert(ut, chunk && chunk->dtype() == H5Stream::FLOAT32 && chunk->size() == 6, "refetched chunk has the wrong shape");
    }

    /* The refetched chunk replaced the stale one on disk */
    H5ChunkCache restarted(4, dir, 16);
    H5ChunkCache::chunk_t persisted = restarted.get(key, H5Stream::FLOAT32, 6);
    ut_assert(ut, persisted && persisted->value(4) == 101.0, "refetched chunk not persisted");

    config.persistentCacheDir = saved_dir;
    removeDirectory(dir);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testCorruptChunkSize - stored sizes outside the chunk and file are format errors
 *--------------------------------------------------------------------------------------*/
bool UT_Reader::testCorruptChunkSize (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const std::vector<H5TestFile::filter_spec_t> deflate = {{H5Stream::DEFLATE_FILTER, {6}}};

    /* Filtered chunk claiming nearly 4GB */
    H5TestFile::chunk_entry_t huge_entry = file.writeChunk({0}, H5TestFile::float32Bytes(std::vector<float>(10, 1.0f)), deflate, 4);
    huge_entry.size = 0xFFFFFFF0;
    const uint64_t huge_array = file.fixedArray({huge_entry}, true);
    const uint64_t huge = file.objectHeader({
        H5TestFile::dataspaceMsg({10}),
        H5TestFile::floatMsg(4),
        H5TestFile::filterMsg(deflate),
        H5TestFile::chunkedLayoutV4Msg(3, huge_array, {10}, 4)
    });

    /* Unfiltered chunk shorter than the chunk shape */
    H5TestFile::chunk_entry_t short_entry = file.writeChunk({0}, int32Bytes({1, 2, 3, 4}), {}, 4);
    short_entry.size = 8;
    const uint64_t short_tree = file.chunkTreeNode(0, 1, {short_entry});
    const uint64_t shortened = file.objectHeader({
        H5TestFile::dataspaceMsg({4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::chunkedLayoutV3Msg(short_tree, {4}, 4)
    });

    /* Chunk addressed past the end of the file */
    H5TestFile::chunk_entry_t past_entry = file.writeChunk({0}, int32Bytes({5, 6, 7, 8}), {}, 4);
    past_entry.address = 0x10000000;
    const uint64_t past_tree = file.chunkTreeNode(0, 1, {past_entry});
    const uint64_t past = file.objectHeader({
        H5TestFile::dataspaceMsg({4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::chunkedLayoutV3Msg(past_tree, {4}, 4)
    });

    /* Intact chunk */
    const H5TestFile::chunk_entry_t good_entry = file.writeChunk({0}, int32Bytes({9, 10, 11, 12}), {}, 4);
    const uint64_t good_tree = file.chunkTreeNode(0, 1, {good_entry});
    const uint64_t good = file.objectHeader({
        H5TestFile::dataspaceMsg({4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::chunkedLayoutV3Msg(good_tree, {4}, 4)
    });

    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"huge", huge, ""}),
        H5TestFile::linkMsg({"short", shortened, ""}),
        H5TestFile::linkMsg({"past", past, ""}),
        H5TestFile::linkMsg({"good", good, ""})
    });
    file.superblockV2(root);

    H5Reader reader(new MemoryRangeSource(file.image()), 4096);

    ut_assert(ut, vectorCode(&reader, "/huge", {0}) == RTE_FORMAT_ERROR, "oversized filtered chunk");
    ut_assert(ut, vectorCode(&reader, "/short", {0}) == RTE_FORMAT_ERROR, "short unfiltered chunk");
    ut_assert(ut, vectorCode(&reader, "/past", {0}) == RTE_FORMAT_ERROR, "chunk past end of file");

    /* Failures leave nothing pending */
    ut_assert(ut, vectorCode(&reader, "/huge", {0}) == RTE_FORMAT_ERROR, "second read of oversized chunk");

    H5Reader::chunk_t chunk = reader.readChunk("/good", {0});
    ut_assert(ut, chunk && chunk->size() == 4 && chunk->value(3) == 12.0, "intact chunk unreadable");

    const H5Stream::StreamingStats stats = reader.getStreamingStats();
    ut_assert(ut, stats.chunksLoaded == 1, "wrong chunk count: %ld", (long)stats.chunksLoaded);

    return ut_status(ut);
}
