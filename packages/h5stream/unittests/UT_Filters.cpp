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

#include "UT_Filters.h"
#include "H5TestFile.h"
#include "H5ChunkFetcher.h"
#include "H5ObjectHeader.h"
#include "H5Stream.h"

#include <cstring>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Filters::SUITE_NAME = "filters";
const UnitTest::test_t UT_Filters::TESTS[] = {
    {"shuffle",             testShuffle},
    {"fletcher32",          testFletcher32},
    {"fletcher32_mismatch", testFletcher32Mismatch},
    {"deflate",             testDeflate},
    {"filter_mask",         testFilterMask},
    {"unsupported_filter",  testUnsupportedFilter},
    {"pipeline",            testPipeline},
    {NULL,                  NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * counting - int32 values 0..n-1 as bytes
 *----------------------------------------------------------------------------*/
static std::vector<uint8_t> counting (int32_t n)
{
    std::vector<uint8_t> raw(n * sizeof(int32_t));
    for(int32_t i = 0; i < n; i++)
    {
        memcpy(&raw[i * sizeof(int32_t)], &i, sizeof(int32_t));
    }
    return raw;
}

/*----------------------------------------------------------------------------
 * stored - bytes the test file wrote for a chunk
 *----------------------------------------------------------------------------*/
static std::vector<uint8_t> stored (const H5TestFile& file, const H5TestFile::chunk_entry_t& entry)
{
    const uint8_t* start = file.image().data() + entry.address;
    return std::vector<uint8_t>(start, start + entry.size);
}

/*----------------------------------------------------------------------------
 * filter
 *----------------------------------------------------------------------------*/
static H5ObjectHeader::filter_t filter (int id, const std::vector<uint32_t>& parms={})
{
    H5ObjectHeader::filter_t f;
    f.id = id;
    f.flags = 0;
    f.name = H5Stream::filter2str(id);
    f.parms = parms;
    return f;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_Filters::UT_Filters (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testShuffle
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testShuffle (UnitTest* ut)
{
    ut_initialize(ut);

    /* Two 4-byte elements as byte planes, plus a trailing odd byte */
    const std::vector<uint8_t> planes = {0x01, 0x05, 0x02, 0x06, 0x03, 0x07, 0x04, 0x08, 0xAA};
    std::vector<uint8_t> output;
    H5ChunkFetcher::shuffleChunk(planes, 4, &output);

    const std::vector<uint8_t> expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0xAA};
    ut_assert(ut, output == expected, "unshuffled bytes wrong");

    int code = RTE_INFO;
    try
    {
        H5ChunkFetcher::shuffleChunk(planes, 0, &output);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "zero element size: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFletcher32
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testFletcher32 (UnitTest* ut)
{
    ut_initialize(ut);

    const std::vector<uint8_t> raw = counting(16);
    const uint32_t sum = H5Stream::checksumFletcher32(raw.data(), raw.size());

    std::vector<uint8_t> buffer = raw;
    H5TestFile::put(&buffer, sum, 4);
    H5ChunkFetcher::checkFletcher32(&buffer);
    ut_assert(ut, buffer == raw, "checksum not stripped");

    /* Halves stored byte swapped are accepted */
    const uint32_t reversed = ((sum & 0x00FF00FF) << 8) | ((sum & 0xFF00FF00) >> 8);
    buffer = raw;
    H5TestFile::put(&buffer, reversed, 4);
    H5ChunkFetcher::checkFletcher32(&buffer);
    ut_assert(ut, buffer.size() == raw.size(), "byte swapped checksum not stripped");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFletcher32Mismatch
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testFletcher32Mismatch (UnitTest* ut)
{
    ut_initialize(ut);

    const std::vector<uint8_t> raw = counting(16);
    std::vector<uint8_t> buffer = raw;
    H5TestFile::put(&buffer, H5Stream::checksumFletcher32(raw.data(), raw.size()), 4);
    buffer[5] ^= 0x40;

    int code = RTE_INFO;
    try
    {
        H5ChunkFetcher::checkFletcher32(&buffer);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "corrupted chunk: %s", RunTimeException::code2str(code));

    std::vector<uint8_t> tiny = {0x01, 0x02};
    code = RTE_INFO;
    try
    {
        H5ChunkFetcher::checkFletcher32(&tiny);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "short chunk: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testDeflate
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testDeflate (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const std::vector<uint8_t> raw = counting(1000);
    const H5TestFile::chunk_entry_t entry = file.writeChunk({0}, raw, {{H5Stream::DEFLATE_FILTER, {4}}}, 4);
    ut_assert(ut, entry.size < raw.size(), "chunk did not compress: %lu", (unsigned long)entry.size);

    std::vector<uint8_t> output;
    H5ChunkFetcher::inflateChunk(stored(file, entry), raw.size(), &output);
    ut_assert(ut, output == raw, "inflated chunk differs");

    /* Expected size too small still inflates everything */
    H5ChunkFetcher::inflateChunk(stored(file, entry), 16, &output);
    ut_assert(ut, output.size() == raw.size(), "inflate stopped at %lu bytes", (unsigned long)output.size());

    /* Truncated stream */
    std::vector<uint8_t> truncated = stored(file, entry);
    truncated.resize(truncated.size() / 2);
    int code = RTE_INFO;
    try
    {
        H5ChunkFetcher::inflateChunk(truncated, raw.size(), &output);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "truncated stream: %s", RunTimeException::code2str(code));

    /* Stream inflating far past the chunk size */
    const H5TestFile::chunk_entry_t large = file.writeChunk({1}, counting(16384), {{H5Stream::DEFLATE_FILTER, {9}}}, 4);
    code = RTE_INFO;
    try
    {
        H5ChunkFetcher::inflateChunk(stored(file, large), 16, &output);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "oversized stream: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFilterMask - a set bit skips that filter
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testFilterMask (UnitTest* ut)
{
    ut_initialize(ut);

    /* Writer skipped the deflate stage, only shuffle was applied */
    H5TestFile file;
    const std::vector<uint8_t> raw = counting(64);
    const H5TestFile::chunk_entry_t entry = file.writeChunk({0}, raw, {{H5Stream::SHUFFLE_FILTER, {}}}, 4);

    const std::vector<H5ObjectHeader::filter_t> filters = {filter(H5Stream::SHUFFLE_FILTER), filter(H5Stream::DEFLATE_FILTER, {6})};
    std::vector<uint8_t> buffer = stored(file, entry);
    H5ChunkFetcher::applyFilters(filters, 0x2, 4, raw.size(), &buffer);
    ut_assert(ut, buffer == raw, "masked pipeline output differs");

    /* Everything masked leaves the bytes alone */
    buffer = raw;
    H5ChunkFetcher::applyFilters(filters, 0x3, 4, raw.size(), &buffer);
    ut_assert(ut, buffer == raw, "fully masked pipeline changed the chunk");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUnsupportedFilter
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testUnsupportedFilter (UnitTest* ut)
{
    ut_initialize(ut);

    const std::vector<H5ObjectHeader::filter_t> filters = {filter(32001)};
    std::vector<uint8_t> buffer = counting(8);

    int code = RTE_INFO;
    try
    {
        H5ChunkFetcher::applyFilters(filters, 0, 4, buffer.size(), &buffer);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_UNSUPPORTED_FORMAT, "unknown filter: %s", RunTimeException::code2str(code));

    /* Masked out, the unknown filter is never needed */
    code = RTE_INFO;
    try
    {
        H5ChunkFetcher::applyFilters(filters, 0x1, 4, buffer.size(), &buffer);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_INFO, "masked unknown filter: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testPipeline - shuffle, deflate, fletcher32 undone in reverse
 *--------------------------------------------------------------------------------------*/
bool UT_Filters::testPipeline (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const std::vector<uint8_t> raw = counting(500);
    const std::vector<H5TestFile::filter_spec_t> specs = {
        {H5Stream::SHUFFLE_FILTER, {4}},
        {H5Stream::DEFLATE_FILTER, {9}},
        {H5Stream::FLETCHER32_FILTER, {}}
    };
    const H5TestFile::chunk_entry_t entry = file.writeChunk({0}, raw, specs, 4);

    const std::vector<H5ObjectHeader::filter_t> filters = {
        filter(H5Stream::SHUFFLE_FILTER, {4}),
        filter(H5Stream::DEFLATE_FILTER, {9}),
        filter(H5Stream::FLETCHER32_FILTER)
    };
    std::vector<uint8_t> buffer = stored(file, entry);
    H5ChunkFetcher::applyFilters(filters, 0, 4, raw.size(), &buffer);
    ut_assert(ut, buffer == raw, "pipeline output differs");

    /* Byte swapping a big endian chunk */
    std::vector<uint8_t> be = {0x00, 0x00, 0x01, 0x02, 0xFF, 0xFF, 0xFF, 0xFE};
    H5ChunkFetcher::swapBytes(be.data(), 2, 4);
    int32_t values[2];
    memcpy(values, be.data(), sizeof(values));
    ut_assert(ut, values[0] == 0x0102 && values[1] == -2, "swapped values: %d, %d", values[0], values[1]);

    return ut_status(ut);
}
