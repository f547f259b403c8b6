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

#include "UT_ObjectHeader.h"
#include "H5TestFile.h"
#include "MemoryRangeSource.h"
#include "H5ObjectHeader.h"
#include "H5Context.h"
#include "H5Concurrency.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_ObjectHeader::SUITE_NAME = "objheader";
const UnitTest::test_t UT_ObjectHeader::TESTS[] = {
    {"dataset_messages",        testDatasetMessages},
    {"header_flags",            testHeaderFlags},
    {"continuation",            testContinuation},
    {"version1",                testVersion1},
    {"checksum_mismatch",       testChecksumMismatch},
    {"bad_attribute_skipped",   testBadAttributeSkipped},
    {"big_endian",              testBigEndian},
    {NULL,                      NULL}
};

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_ObjectHeader::UT_ObjectHeader (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testDatasetMessages
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testDatasetMessages (UnitTest* ut)
{
    ut_initialize(ut);

    const H5TestFile::bytes_t fill = {0x00, 0x00, 0x80, 0xBF}; // -1.0f
    const std::vector<H5TestFile::filter_spec_t> filters = {
        {H5Stream::SHUFFLE_FILTER, {4}},
        {H5Stream::DEFLATE_FILTER, {4}}
    };

    H5TestFile file;
    const uint64_t address = file.objectHeader({
        H5TestFile::dataspaceMsg({4, 6}),
        H5TestFile::floatMsg(4),
        H5TestFile::fillValueMsg(fill),
        H5TestFile::filterMsg(filters),
        H5TestFile::contiguousLayoutMsg(0x1000, 96)
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader header(&context, address);

    ut_assert(ut, header.version == 2, "wrong version: %d", header.version);
    ut_assert(ut, header.isDataset(), "not a dataset");
    ut_assert(ut, !header.isGroup(), "dataset reported as a group");

    ut_assert(ut, header.dataspace.present && header.dataspace.rank == 2, "wrong rank: %d", header.dataspace.rank);
    ut_assert(ut, header.dataspace.dims.size() == 2 && header.dataspace.dims[0] == 4 && header.dataspace.dims[1] == 6, "wrong dimensions");

    ut_assert(ut, header.datatype.typeClass == H5ObjectHeader::FLOATING_POINT_TYPE, "wrong class: %s", H5ObjectHeader::class2str(header.datatype.typeClass));
    ut_assert(ut, header.datatype.dtype == H5Stream::FLOAT32, "wrong type: %s", H5Stream::type2str(header.datatype.dtype));
    ut_assert(ut, !header.datatype.bigEndian, "float reported as big endian");

    ut_assert(ut, header.fill.defined && header.fill.value == fill, "wrong fill value");

    ut_assert(ut, header.filters.size() == 2, "wrong number of filters: %d", (int)header.filters.size());
    if(header.filters.size() == 2)
    {
        ut_assert(ut, header.filters[0].id == H5Stream::SHUFFLE_FILTER, "wrong first filter: %d", header.filters[0].id);
        ut_assert(ut, header.filters[1].id == H5Stream::DEFLATE_FILTER, "wrong second filter: %d", header.filters[1].id);
        ut_assert(ut, header.filters[1].parms.size() == 1 && header.filters[1].parms[0] == 4, "wrong deflate level");
    }

    ut_assert(ut, header.layout.layout == H5Stream::CONTIGUOUS_LAYOUT, "wrong layout: %s", H5Stream::layout2str(header.layout.layout));
    ut_assert(ut, header.layout.address == 0x1000 && header.layout.size == 96, "wrong contiguous storage: 0x%lx, %lu", (unsigned long)header.layout.address, (unsigned long)header.layout.size);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testHeaderFlags - times, phase change values, creation order, 4 byte chunk size
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testHeaderFlags (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t address = file.objectHeader({
        H5TestFile::dataspaceMsg({10}),
        H5TestFile::fixedPointMsg(8, false),
        H5TestFile::chunkedLayoutV4Msg(2, 0x2000, {5}, 8)
    }, 0x20 | 0x10 | 0x04 | 0x02);

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader header(&context, address);

    ut_assert(ut, header.messages.size() == 3, "wrong number of messages: %d", (int)header.messages.size());
    ut_assert(ut, header.datatype.dtype == H5Stream::UINT64, "wrong type: %s", H5Stream::type2str(header.datatype.dtype));
    ut_assert(ut, header.layout.layout == H5Stream::CHUNKED_LAYOUT, "wrong layout: %s", H5Stream::layout2str(header.layout.layout));
    ut_assert(ut, header.layout.indexKind == H5Stream::IMPLICIT_INDEX, "wrong index: %s", H5Stream::index2str(header.layout.indexKind));
    ut_assert(ut, header.layout.chunkDims.size() == 1 && header.layout.chunkDims[0] == 5, "wrong chunk dimensions");
    ut_assert(ut, header.layout.elementSize == 8, "wrong element size: %u", header.layout.elementSize);
    ut_assert(ut, header.layout.address == 0x2000, "wrong index address: 0x%lx", (unsigned long)header.layout.address);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testContinuation
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testContinuation (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    uint64_t length = 0;
    const uint64_t block = file.continuationBlock({
        H5TestFile::floatMsg(8),
        H5TestFile::contiguousLayoutMsg(0x3000, 800)
    }, &length);
    const uint64_t address = file.objectHeader({
        H5TestFile::dataspaceMsg({100}),
        H5TestFile::continuationMsg(block, length)
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader header(&context, address);

    ut_assert(ut, header.datatype.dtype == H5Stream::FLOAT64, "continued datatype missing: %s", H5Stream::type2str(header.datatype.dtype));
    ut_assert(ut, header.layout.present && header.layout.size == 800, "continued layout missing");
    ut_assert(ut, header.dataspace.dims.size() == 1 && header.dataspace.dims[0] == 100, "wrong dimensions");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testVersion1
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testVersion1 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    uint64_t length = 0;
    const uint64_t block = file.continuationBlockV1({
        H5TestFile::fillValueMsg({0xFF, 0x7F})
    }, &length);
    const uint64_t address = file.objectHeaderV1({
        H5TestFile::dataspaceMsg({6, 9}, 1),
        H5TestFile::fixedPointMsg(2, true),
        H5TestFile::chunkedLayoutV3Msg(0x4000, {2, 3}, 2),
        H5TestFile::continuationMsg(block, length)
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader header(&context, address);

    ut_assert(ut, header.version == 1, "wrong version: %d", header.version);
    ut_assert(ut, header.dataspace.rank == 2 && header.dataspace.dims[1] == 9, "wrong dataspace");
    ut_assert(ut, header.datatype.dtype == H5Stream::INT16, "wrong type: %s", H5Stream::type2str(header.datatype.dtype));
    ut_assert(ut, header.layout.indexKind == H5Stream::BTREE_V1_INDEX, "wrong index: %s", H5Stream::index2str(header.layout.indexKind));
    ut_assert(ut, header.layout.chunkDims.size() == 2 && header.layout.chunkDims[0] == 2 && header.layout.chunkDims[1] == 3, "wrong chunk dimensions");
    ut_assert(ut, header.layout.elementSize == 2, "wrong element size: %u", header.layout.elementSize);
    ut_assert(ut, header.fill.defined && header.fill.value.size() == 2 && header.fill.value[1] == 0x7F, "continued fill value missing");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testChecksumMismatch
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testChecksumMismatch (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t address = file.objectHeader({
        H5TestFile::dataspaceMsg({4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::contiguousLayoutMsg(0x1000, 16)
    });

    /* Low byte of the dataspace dimension */
    file.patch(address + 6 + 4 + 4 + 4, {0x05});

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);

    int code = RTE_INFO;
    try
    {
        H5ObjectHeader header(&context, address);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_FORMAT_ERROR, "expected format error, got %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBadAttributeSkipped
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testBadAttributeSkipped (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile::msg_t shared = H5TestFile::attributeMsg("shared", H5TestFile::fixedPointMsg(4, true), H5TestFile::dataspaceMsg({}), {1, 0, 0, 0}, 2);
    shared.body[1] = 0x01; // shared datatype

    H5TestFile file;
    const uint64_t address = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        shared,
        H5TestFile::attributeMsg("units", H5TestFile::stringMsg(6), H5TestFile::dataspaceMsg({}), {'m', 'e', 't', 'e', 'r', 0})
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader header(&context, address);

    ut_assert(ut, header.attributes.size() == 1, "wrong number of attributes: %d", (int)header.attributes.size());
    if(header.attributes.size() == 1)
    {
        const H5ObjectHeader::attribute_t& attr = header.attributes[0];
        ut_assert(ut, attr.name == "units", "wrong attribute: %s", attr.name.c_str());
        ut_assert(ut, attr.datatype.typeClass == H5ObjectHeader::STRING_TYPE, "wrong class: %s", H5ObjectHeader::class2str(attr.datatype.typeClass));
        ut_assert(ut, attr.dataSize == 6, "wrong data size: %lu", (unsigned long)attr.dataSize);
        ut_assert(ut, attr.dataspace.rank == 0, "scalar reported with rank %d", attr.dataspace.rank);
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBigEndian
 *--------------------------------------------------------------------------------------*/
bool UT_ObjectHeader::testBigEndian (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t int_address = file.objectHeader({
        H5TestFile::dataspaceMsg({3}),
        H5TestFile::fixedPointMsg(4, true, true),
        H5TestFile::contiguousLayoutMsg(0x1000, 12)
    });
    const uint64_t float_address = file.objectHeader({
        H5TestFile::dataspaceMsg({3}),
        H5TestFile::floatMsg(8, true),
        H5TestFile::contiguousLayoutMsg(0x1000, 24)
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5ObjectHeader int_header(&context, int_address);
    const H5ObjectHeader float_header(&context, float_address);

    ut_assert(ut, int_header.datatype.bigEndian && int_header.datatype.signedval, "int32 flags not decoded");
    ut_assert(ut, int_header.datatype.dtype == H5Stream::INT32, "wrong type: %s", H5Stream::type2str(int_header.datatype.dtype));
    ut_assert(ut, float_header.datatype.bigEndian, "float64 byte order not decoded");
    ut_assert(ut, float_header.datatype.dtype == H5Stream::FLOAT64, "wrong type: %s", H5Stream::type2str(float_header.datatype.dtype));

    return ut_status(ut);
}
