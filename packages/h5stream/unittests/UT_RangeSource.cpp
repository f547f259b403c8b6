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

#include "UT_RangeSource.h"
#include "FileRangeSource.h"
#include "CurlRangeSource.h"

#include <curl/curl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using H5Stream::FileRangeSource;
using H5Stream::CurlRangeSource;

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_RangeSource::SUITE_NAME = "rangesource";
const UnitTest::test_t UT_RangeSource::TESTS[] = {
    {"file_short_read",     testFileShortRead},
    {"file_missing",        testFileMissing},
    {"url_read",            testUrlRead},
    {"url_missing",         testUrlMissing},
    {"response_codes",      testResponseCodes},
    {"content_range",       testContentRange},
    {NULL,                  NULL}
};

static const int64_t FILE_SIZE = 100;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * makeFile - FILE_SIZE bytes where each byte is its own offset
 *----------------------------------------------------------------------------*/
static std::string makeFile (void)
{
    char path[] = "/tmp/h5stream-ut-XXXXXX";
    const int fd = mkstemp(path);
    if(fd < 0)
    {
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to create temporary file: %s", strerror(errno));
    }

    uint8_t data[FILE_SIZE];
    for(int64_t i = 0; i < FILE_SIZE; i++) data[i] = static_cast<uint8_t>(i);
    const ssize_t written = write(fd, data, sizeof(data));
    close(fd);
    if(written != FILE_SIZE)
    {
        unlink(path);
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to write temporary file %s", path);
    }

    return std::string(path);
}

/*----------------------------------------------------------------------------
 * responseCode - error code of a transfer result, RTE_INFO when accepted
 *----------------------------------------------------------------------------*/
static int responseCode (int res, long http_code, uint64_t pos=0)
{
    try
    {
        CurlRangeSource::checkResponse("http://localhost/test.h5", res, http_code, pos);
    }
    catch(const RunTimeException& e)
    {
        return e.code();
    }
    return RTE_INFO;
}

/*----------------------------------------------------------------------------
 * sequential - true when each byte equals its file offset
 *----------------------------------------------------------------------------*/
static bool sequential (const uint8_t* data, int64_t size, uint64_t pos)
{
    for(int64_t i = 0; i < size; i++)
    {
        if(data[i] != static_cast<uint8_t>(pos + i)) return false;
    }
    return true;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_RangeSource::UT_RangeSource (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testFileShortRead - reads past the end return what is there
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testFileShortRead (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string path = makeFile();
    {
        FileRangeSource source(path.c_str());
        uint8_t data[32];

        ut_assert(ut, source.length() == FILE_SIZE, "wrong length: %ld", (long)source.length());
        ut_assert(ut, strcmp(source.origin(), path.c_str()) == 0, "wrong origin: %s", source.origin());

        int64_t bytes = source.read(data, 16, 10);
        ut_assert(ut, bytes == 16 && sequential(data, bytes, 10), "interior read returned %ld bytes", (long)bytes);

        bytes = source.read(data, 32, 80);
        ut_assert(ut, bytes == 20, "short read returned %ld bytes", (long)bytes);
        ut_assert(ut, sequential(data, 20, 80), "short read data");

        bytes = source.read(data, 32, 200);
        ut_assert(ut, bytes == 0, "read past end returned %ld bytes", (long)bytes);
    }
    unlink(path.c_str());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testFileMissing
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testFileMissing (UnitTest* ut)
{
    ut_initialize(ut);

    int code = RTE_INFO;
    try
    {
        FileRangeSource source("/tmp/h5stream-ut-does-not-exist.h5");
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing file reported as %d", code);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUrlRead - byte ranges over a file:// url
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testUrlRead (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string path = makeFile();
    const std::string url = "file://" + path;
    {
        CurlRangeSource source(url.c_str());
        uint8_t data[32];
        memset(data, 0xFF, sizeof(data));

        ut_assert(ut, strcmp(source.origin(), url.c_str()) == 0, "wrong origin: %s", source.origin());

        int64_t bytes = source.read(data, 16, 10);
        ut_assert(ut, bytes == 16 && sequential(data, bytes, 10), "range read returned %ld bytes", (long)bytes);

        bytes = source.read(data, 4, 0);
        ut_assert(ut, bytes == 4 && sequential(data, bytes, 0), "leading read returned %ld bytes", (long)bytes);
    }
    unlink(path.c_str());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUrlMissing
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testUrlMissing (UnitTest* ut)
{
    ut_initialize(ut);

    CurlRangeSource source("file:///tmp/h5stream-ut-does-not-exist.h5");
    uint8_t data[8];

    int code = RTE_INFO;
    try
    {
        source.read(data, sizeof(data), 0);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing url reported as %d", code);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testResponseCodes
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testResponseCodes (UnitTest* ut)
{
    ut_initialize(ut);

    ut_assert(ut, responseCode(CURLE_OK, 206, 4096) == RTE_INFO, "partial content");
    ut_assert(ut, responseCode(CURLE_OK, 0, 4096) == RTE_INFO, "response without status line");
    ut_assert(ut, responseCode(CURLE_OK, 200, 0) == RTE_INFO, "full content from the start");
    ut_assert(ut, responseCode(CURLE_OK, 200, 4096) == RTE_IO_ERROR, "range ignored past the start");
    ut_assert(ut, responseCode(CURLE_OK, 404) == RTE_RESOURCE_DOES_NOT_EXIST, "not found");
    ut_assert(ut, responseCode(CURLE_OK, 403) == RTE_RESOURCE_DOES_NOT_EXIST, "forbidden");
    ut_assert(ut, responseCode(CURLE_OK, 416) == RTE_IO_ERROR, "range not satisfiable");
    ut_assert(ut, responseCode(CURLE_OK, 500) == RTE_IO_ERROR, "server error");
    ut_assert(ut, responseCode(CURLE_WRITE_ERROR, 0) == RTE_IO_ERROR, "response larger than requested");
    ut_assert(ut, responseCode(CURLE_OPERATION_TIMEDOUT, 0) == RTE_IO_ERROR, "timeout");
    ut_assert(ut, responseCode(CURLE_COULDNT_CONNECT, 0) == RTE_IO_ERROR, "connection refused");
    ut_assert(ut, responseCode(CURLE_FILE_COULDNT_READ_FILE, 0) == RTE_RESOURCE_DOES_NOT_EXIST, "unreadable file");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testContentRange
 *--------------------------------------------------------------------------------------*/
bool UT_RangeSource::testContentRange (UnitTest* ut)
{
    ut_initialize(ut);

    ut_assert(ut, CurlRangeSource::parseContentRange(" bytes 0-0/1234") == 1234, "total");
    ut_assert(ut, CurlRangeSource::parseContentRange("bytes 0-0/8589934592") == 8589934592LL, "total over 4GB");
    ut_assert(ut, CurlRangeSource::parseContentRange(" bytes 0-0/*") == -1, "unknown total");
    ut_assert(ut, CurlRangeSource::parseContentRange("bytes */1234") == 1234, "unsatisfied range");
    ut_assert(ut, CurlRangeSource::parseContentRange("") == -1, "empty header");
    ut_assert(ut, CurlRangeSource::parseContentRange("bytes 0-0/12ab") == -1, "trailing garbage");

    return ut_status(ut);
}
