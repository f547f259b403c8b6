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

#include "UT_ChunkIndex.h"
#include "H5TestFile.h"
#include "MemoryRangeSource.h"
#include "H5ChunkIndex.h"
#include "H5ObjectHeader.h"
#include "H5Context.h"
#include "H5Concurrency.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_ChunkIndex::SUITE_NAME = "chunkindex";
const UnitTest::test_t UT_ChunkIndex::TESTS[] = {
    {"btree_v1",                testBTreeV1},
    {"btree_v1_two_level",      testBTreeV1TwoLevel},
    {"btree_v2",                testBTreeV2},
    {"btree_v2_filtered",       testBTreeV2Filtered},
    {"fixed_array",             testFixedArray},
    {"fixed_array_filtered",    testFixedArrayFiltered},
    {"single_chunk",            testSingleChunk},
    {"implicit",                testImplicit},
    {"extensible_array",        testExtensibleArray},
    {"unaligned_key",           testUnalignedKey},
    {"missing_chunk",           testMissingChunk},
    {"retry_after_io_error",    testRetryAfterIoError},
    {NULL,                      NULL}
};

/******************************************************************************
 * LOCAL TYPES
 ******************************************************************************/

struct Fixture
{
    MemoryRangeSource   source;
    H5Concurrency       controller;
    H5Context           context;

    explicit Fixture (const H5TestFile& file):
        source(file.image()),
        controller(1, 1, 1),
        context(&source, &controller) {}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * chunked - int32 dataset header with the given layout message
 *----------------------------------------------------------------------------*/
static uint64_t chunked (H5TestFile* file, const std::vector<uint64_t>& dims, const H5TestFile::msg_t& layout)
{
    return file->objectHeader({
        H5TestFile::dataspaceMsg(dims),
        H5TestFile::fixedPointMsg(4, true),
        layout
    });
}

/*----------------------------------------------------------------------------
 * entry
 *----------------------------------------------------------------------------*/
static H5TestFile::chunk_entry_t entry (const std::vector<uint64_t>& offsets, uint64_t address, uint64_t size=24, uint32_t mask=0)
{
    H5TestFile::chunk_entry_t e = {offsets, address, size, mask};
    return e;
}

/*----------------------------------------------------------------------------
 * findCode - error code of a lookup, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int findCode (H5ChunkIndex* index, const std::vector<uint64_t>& coord)
{
    try
    {
        H5ChunkIndex::chunk_t chunk;
        index->find(coord, &chunk);
    }
    catch(const RunTimeException& e)
    {
        return e.code();
    }
    return RTE_INFO;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_ChunkIndex::UT_ChunkIndex (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testBTreeV1 - keys hold element offsets, lookups take chunk coordinates
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testBTreeV1 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t node = file.chunkTreeNode(0, 2, {entry({0, 0}, 0x1000), entry({0, 3}, 0x2000)});
    const uint64_t address = chunked(&file, {4, 6}, H5TestFile::chunkedLayoutV3Msg(node, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    ut_assert(ut, index.status() == H5ChunkIndex::NOT_LOADED, "index loaded before first use");
    ut_assert(ut, index.grid().size() == 2 && index.grid()[0] == 2 && index.grid()[1] == 2, "wrong grid");
    ut_assert(ut, index.chunkBytes() == 24, "wrong chunk bytes: %lu", (unsigned long)index.chunkBytes());

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({0, 0}, &chunk) && chunk.address == 0x1000, "chunk (0,0) not at 0x1000");
    ut_assert(ut, index.find({0, 1}, &chunk) && chunk.address == 0x2000, "chunk (0,1) not at 0x2000");
    ut_assert(ut, chunk.size == 24 && chunk.filterMask == 0, "wrong stored size or mask");
    ut_assert(ut, !index.find({1, 0}, &chunk), "unallocated chunk (1,0) found");
    ut_assert(ut, index.status() == H5ChunkIndex::LOADED, "wrong state: %s", H5ChunkIndex::state2str(index.status()));
    ut_assert(ut, index.allocated() == 2, "wrong allocated count: %lu", (unsigned long)index.allocated());

    const int code = findCode(&index, {2, 0});
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "coordinate outside the grid: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBTreeV1TwoLevel
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testBTreeV1TwoLevel (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t upper = file.chunkTreeNode(0, 2, {entry({0, 0}, 0x1000), entry({0, 3}, 0x2000)});
    const uint64_t lower = file.chunkTreeNode(0, 2, {entry({2, 0}, 0x3000), entry({2, 3}, 0x4000)});
    const uint64_t root = file.chunkTreeNode(1, 2, {entry({0, 0}, upper), entry({2, 0}, lower)});
    const uint64_t address = chunked(&file, {4, 6}, H5TestFile::chunkedLayoutV3Msg(root, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    const uint64_t expected[2][2] = {{0x1000, 0x2000}, {0x3000, 0x4000}};
    for(uint64_t r = 0; r < 2; r++)
    {
        for(uint64_t c = 0; c < 2; c++)
        {
            H5ChunkIndex::chunk_t chunk;
            const bool found = index.find({r, c}, &chunk);
            ut_assert(ut, found && chunk.address == expected[r][c], "chunk (%lu,%lu) wrong", (unsigned long)r, (unsigned long)c);
        }
    }
    ut_assert(ut, index.allocated() == 4, "wrong allocated count: %lu", (unsigned long)index.allocated());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBTreeV2
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testBTreeV2 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const std::vector<H5TestFile::bytes_t> left = {
        H5TestFile::chunkRecord(0x1000, {0, 0}),
        H5TestFile::chunkRecord(0x2000, {0, 1})
    };
    const H5TestFile::bytes_t middle = H5TestFile::chunkRecord(0x3000, {1, 0});
    const std::vector<H5TestFile::bytes_t> right = {
        H5TestFile::chunkRecord(0x4000, {1, 1}),
        H5TestFile::chunkRecord(0x5000, {1, 2})
    };
    const uint64_t btree = file.btreeV2Deep(10, 8 + (2 * 8), left, middle, right);
    const uint64_t address = chunked(&file, {4, 9}, H5TestFile::chunkedLayoutV4Msg(5, btree, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    ut_assert(ut, header.layout.indexKind == H5Stream::BTREE_V2_INDEX, "wrong index: %s", H5Stream::index2str(header.layout.indexKind));
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({0, 0}, &chunk) && chunk.address == 0x1000, "chunk (0,0) wrong");
    ut_assert(ut, index.find({1, 0}, &chunk) && chunk.address == 0x3000, "internal record (1,0) wrong");
    ut_assert(ut, index.find({1, 2}, &chunk) && chunk.address == 0x5000, "chunk (1,2) wrong");
    ut_assert(ut, chunk.size == index.chunkBytes(), "unfiltered size %lu", (unsigned long)chunk.size);
    ut_assert(ut, !index.find({0, 2}, &chunk), "unallocated chunk (0,2) found");
    ut_assert(ut, index.allocated() == 5, "wrong allocated count: %lu", (unsigned long)index.allocated());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBTreeV2Filtered
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testBTreeV2Filtered (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t btree = file.btreeV2(11, 8 + 4 + 4 + 8, {
        H5TestFile::filteredChunkRecord(0x1000, 17, 0, {0}),
        H5TestFile::filteredChunkRecord(0x2000, 19, 1, {1}),
        H5TestFile::filteredChunkRecord(0x3000, 23, 0, {3})
    });
    const uint64_t address = chunked(&file, {40}, H5TestFile::chunkedLayoutV4Msg(5, btree, {10}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({1}, &chunk), "chunk 1 missing");
    ut_assert(ut, chunk.address == 0x2000 && chunk.size == 19 && chunk.filterMask == 1, "chunk 1 wrong: 0x%lx, %lu, %u", (unsigned long)chunk.address, (unsigned long)chunk.size, chunk.filterMask);
    ut_assert(ut, index.find({3}, &chunk) && chunk.size == 23, "chunk 3 wrong");
    ut_assert(ut, !index.find({2}, &chunk), "unallocated chunk 2 found");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFixedArray
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testFixedArray (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t array = file.fixedArray({
        entry({}, 0x1000),
        entry({}, 0x2000),
        entry({}, H5TestFile::UNDEFINED),
        entry({}, 0x4000)
    }, false);
    const uint64_t address = chunked(&file, {4, 6}, H5TestFile::chunkedLayoutV4Msg(3, array, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({0, 1}, &chunk) && chunk.address == 0x2000, "chunk (0,1) wrong");
    ut_assert(ut, index.find({1, 1}, &chunk) && chunk.address == 0x4000, "chunk (1,1) wrong");
    ut_assert(ut, !index.find({1, 0}, &chunk), "undefined entry reported as a chunk");
    ut_assert(ut, index.allocated() == 3, "wrong allocated count: %lu", (unsigned long)index.allocated());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFixedArrayFiltered
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testFixedArrayFiltered (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t array = file.fixedArray({
        entry({}, 0x1000, 11, 0),
        entry({}, 0x2000, 13, 2),
        entry({}, 0x3000, 15, 0)
    }, true);
    const uint64_t address = chunked(&file, {25}, H5TestFile::chunkedLayoutV4Msg(3, array, {10}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({1}, &chunk), "chunk 1 missing");
    ut_assert(ut, chunk.address == 0x2000 && chunk.size == 13 && chunk.filterMask == 2, "chunk 1 wrong: 0x%lx, %lu, %u", (unsigned long)chunk.address, (unsigned long)chunk.size, chunk.filterMask);
    ut_assert(ut, index.find({2}, &chunk) && chunk.size == 15, "edge chunk 2 wrong");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSingleChunk
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testSingleChunk (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t plain = chunked(&file, {10}, H5TestFile::chunkedLayoutV4Msg(1, 0x1000, {10}, 4));
    const uint64_t filtered = chunked(&file, {10}, H5TestFile::chunkedLayoutV4Msg(1, 0x2000, {10}, 4, 0x02, 123, 1));

    Fixture f(file);

    const H5ObjectHeader plain_header(&f.context, plain);
    H5ChunkIndex plain_index(&f.context, plain_header);
    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, plain_index.find({0}, &chunk), "single chunk missing");
    ut_assert(ut, chunk.address == 0x1000 && chunk.size == 40 && chunk.filterMask == 0, "single chunk wrong: 0x%lx, %lu", (unsigned long)chunk.address, (unsigned long)chunk.size);

    const H5ObjectHeader filtered_header(&f.context, filtered);
    H5ChunkIndex filtered_index(&f.context, filtered_header);
    ut_assert(ut, filtered_index.find({0}, &chunk), "filtered single chunk missing");
    ut_assert(ut, chunk.address == 0x2000 && chunk.size == 123 && chunk.filterMask == 1, "filtered single chunk wrong: 0x%lx, %lu, %u", (unsigned long)chunk.address, (unsigned long)chunk.size, chunk.filterMask);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testImplicit - chunks stored back to back in grid order
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testImplicit (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t address = chunked(&file, {10, 10}, H5TestFile::chunkedLayoutV4Msg(2, 0x8000, {5, 5}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({0, 0}, &chunk) && chunk.address == 0x8000, "chunk (0,0) wrong");
    ut_assert(ut, index.find({1, 1}, &chunk) && chunk.address == 0x8000 + (3 * 100), "chunk (1,1) wrong: 0x%lx", (unsigned long)chunk.address);
    ut_assert(ut, chunk.size == 100, "wrong chunk size: %lu", (unsigned long)chunk.size);
    ut_assert(ut, index.allocated() == 4, "wrong allocated count: %lu", (unsigned long)index.allocated());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testExtensibleArray - unsupported, and stays that way
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testExtensibleArray (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t address = chunked(&file, {100}, H5TestFile::chunkedLayoutV4Msg(4, 0x1000, {10}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    ut_assert(ut, header.layout.indexKind == H5Stream::EXTENSIBLE_ARRAY_INDEX, "wrong index: %s", H5Stream::index2str(header.layout.indexKind));
    H5ChunkIndex index(&f.context, header);

    int code = findCode(&index, {0});
    ut_assert(ut, code == RTE_UNSUPPORTED_FORMAT, "first lookup: %s", RunTimeException::code2str(code));
    ut_assert(ut, index.status() == H5ChunkIndex::UNSUPPORTED, "wrong state: %s", H5ChunkIndex::state2str(index.status()));

    code = findCode(&index, {1});
    ut_assert(ut, code == RTE_UNSUPPORTED_FORMAT, "second lookup: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUnalignedKey
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testUnalignedKey (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t node = file.chunkTreeNode(0, 2, {entry({0, 0}, 0x1000), entry({0, 2}, 0x2000)});
    const uint64_t address = chunked(&file, {4, 6}, H5TestFile::chunkedLayoutV3Msg(node, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    const int code = findCode(&index, {0, 0});
    ut_assert(ut, code == RTE_FORMAT_ERROR, "unaligned key: %s", RunTimeException::code2str(code));
    ut_assert(ut, index.status() == H5ChunkIndex::FAILED, "wrong state: %s", H5ChunkIndex::state2str(index.status()));

    /* Same coordinate twice */
    H5TestFile dup_file;
    const uint64_t dup_node = dup_file.chunkTreeNode(0, 2, {entry({0, 3}, 0x1000), entry({0, 3}, 0x2000)});
    const uint64_t dup_address = chunked(&dup_file, {4, 6}, H5TestFile::chunkedLayoutV3Msg(dup_node, {2, 3}, 4));

    Fixture dup(dup_file);
    const H5ObjectHeader dup_header(&dup.context, dup_address);
    H5ChunkIndex dup_index(&dup.context, dup_header);
    const int dup_code = findCode(&dup_index, {0, 1});
    ut_assert(ut, dup_code == RTE_FORMAT_ERROR, "duplicate key: %s", RunTimeException::code2str(dup_code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testMissingChunk - nothing written yet
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testMissingChunk (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t address = chunked(&file, {4, 6}, H5TestFile::chunkedLayoutV3Msg(H5TestFile::UNDEFINED, {2, 3}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, !index.find({1, 1}, &chunk), "chunk found in an empty index");
    ut_assert(ut, index.allocated() == 0, "wrong allocated count: %lu", (unsigned long)index.allocated());

    const int code = findCode(&index, {1});
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "coordinate of the wrong rank: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testRetryAfterIoError - a transport failure does not stick
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkIndex::testRetryAfterIoError (UnitTest* ut)
{
    ut_initialize(ut);

    /* Node sits below the header so the header's cache line does not cover it */
    H5TestFile file;
    const uint64_t node = file.chunkTreeNode(0, 1, {entry({0}, 0x1000), entry({10}, 0x2000)});
    const uint64_t address = chunked(&file, {20}, H5TestFile::chunkedLayoutV3Msg(node, {10}, 4));

    Fixture f(file);
    const H5ObjectHeader header(&f.context, address);
    H5ChunkIndex index(&f.context, header);

    f.source.failAt(node);
    const int code = findCode(&index, {1});
    ut_assert(ut, code == RTE_IO_ERROR, "failed load: %s", RunTimeException::code2str(code));
    ut_assert(ut, index.status() == H5ChunkIndex::NOT_LOADED, "wrong state after i/o error: %s", H5ChunkIndex::state2str(index.status()));
    ut_assert(ut, f.source.readsAt(node) > 1, "read was not retried: %d", f.source.readsAt(node));

    f.source.failAt(MemoryRangeSource::NO_POSITION);
    H5ChunkIndex::chunk_t chunk;
    ut_assert(ut, index.find({1}, &chunk) && chunk.address == 0x2000, "chunk 1 wrong after recovery");
    ut_assert(ut, index.status() == H5ChunkIndex::LOADED, "wrong state after recovery: %s", H5ChunkIndex::state2str(index.status()));

    return ut_status(ut);
}
