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

#include "UT_Superblock.h"
#include "H5TestFile.h"
#include "MemoryRangeSource.h"
#include "H5Superblock.h"
#include "H5Context.h"
#include "H5Concurrency.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Superblock::SUITE_NAME = "superblock";
const UnitTest::test_t UT_Superblock::TESTS[] = {
    {"version0",            testVersion0},
    {"version2",            testVersion2},
    {"bad_signature",       testBadSignature},
    {"checksum_mismatch",   testChecksumMismatch},
    {"unsupported_version", testUnsupportedVersion},
    {NULL,                  NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readCode - error code of reading the superblock, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int readCode (const H5TestFile& file)
{
    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    try
    {
        H5Superblock::read(&context);
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
UT_Superblock::UT_Superblock (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testVersion0
 *--------------------------------------------------------------------------------------*/
bool UT_Superblock::testVersion0 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t root = file.objectHeader({H5TestFile::groupInfoMsg()});
    file.superblockV0(root);

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5Superblock sb = H5Superblock::read(&context);

    ut_assert(ut, sb.version == 0, "wrong version: %d", sb.version);
    ut_assert(ut, sb.offsetSize == 8 && sb.lengthSize == 8, "wrong sizes: %d, %d", sb.offsetSize, sb.lengthSize);
    ut_assert(ut, sb.baseAddress == 0, "wrong base address: %lu", (unsigned long)sb.baseAddress);
    ut_assert(ut, sb.eofAddress == file.size(), "wrong end of file: %lu != %lu", (unsigned long)sb.eofAddress, (unsigned long)file.size());
    ut_assert(ut, sb.rootGroupAddress == root, "wrong root: 0x%lx != 0x%lx", (unsigned long)sb.rootGroupAddress, (unsigned long)root);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testVersion2
 *--------------------------------------------------------------------------------------*/
bool UT_Superblock::testVersion2 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t root = file.objectHeader({H5TestFile::groupInfoMsg()});
    file.superblockV2(root);

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    const H5Superblock sb = H5Superblock::read(&context);

    ut_assert(ut, sb.version == 2, "wrong version: %d", sb.version);
    ut_assert(ut, sb.rootGroupAddress == root, "wrong root: 0x%lx != 0x%lx", (unsigned long)sb.rootGroupAddress, (unsigned long)root);
    ut_assert(ut, sb.eofAddress == file.size(), "wrong end of file: %lu", (unsigned long)sb.eofAddress);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBadSignature
 *--------------------------------------------------------------------------------------*/
bool UT_Superblock::testBadSignature (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    file.superblockV2(file.objectHeader({H5TestFile::groupInfoMsg()}));
    file.patch(1, {'X'});

    const int code = readCode(file);
    ut_assert(ut, code == RTE_FORMAT_ERROR, "expected format error, got %s", RunTimeException::code2str(code));

    /* Not an h5 file at all */
    H5TestFile text;
    text.patch(0, {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '\n'});
    const int text_code = readCode(text);
    ut_assert(ut, text_code == RTE_FORMAT_ERROR, "expected format error for text, got %s", RunTimeException::code2str(text_code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testChecksumMismatch
 *--------------------------------------------------------------------------------------*/
bool UT_Superblock::testChecksumMismatch (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t root = file.objectHeader({H5TestFile::groupInfoMsg()});
    file.superblockV2(root);

    /* Move the root group after the checksum was taken */
    H5TestFile::bytes_t moved;
    H5TestFile::put(&moved, root + 8, 8);
    file.patch(36, moved);

    const int code = readCode(file);
    ut_assert(ut, code == RTE_FORMAT_ERROR, "expected format error, got %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUnsupportedVersion
 *--------------------------------------------------------------------------------------*/
bool UT_Superblock::testUnsupportedVersion (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    file.superblockV2(file.objectHeader({H5TestFile::groupInfoMsg()}));
    file.patch(8, {4});

    const int code = readCode(file);
    ut_assert(ut, code == RTE_UNSUPPORTED_FORMAT, "expected unsupported format, got %s", RunTimeException::code2str(code));

    return ut_status(ut);
}
