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

#include "UT_StreamConfig.h"
#include "StreamConfig.h"
#include "EventLib.h"

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <string>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_StreamConfig::SUITE_NAME = "config";
const UnitTest::test_t UT_StreamConfig::TESTS[] = {
    {"load_file",       testLoadFile},
    {"unknown_key",     testUnknownKey},
    {"bad_value",       testBadValue},
    {"environment",     testEnvironment},
    {"reset",           testReset},
    {NULL,              NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * writeScript - temporary lua file holding the script
 *----------------------------------------------------------------------------*/
static std::string writeScript (const char* script)
{
    char path[] = "/tmp/h5stream-config-XXXXXX";
    const int fd = mkstemp(path);
    if(fd < 0)
    {
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to create temporary configuration file");
    }

    FILE* fp = fdopen(fd, "w");
    if(!fp)
    {
        close(fd);
        unlink(path);
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to open temporary configuration file %s", path);
    }
    fputs(script, fp);
    fclose(fp);

    return std::string(path);
}

/*----------------------------------------------------------------------------
 * loadCode - error code of loading the script, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int loadCode (const char* script)
{
    const std::string path = writeScript(script);
    int code = RTE_INFO;
    try
    {
        StreamConfig::settings().loadFile(path.c_str());
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
    }
    unlink(path.c_str());
    return code;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_StreamConfig::UT_StreamConfig (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testLoadFile
 *--------------------------------------------------------------------------------------*/
bool UT_StreamConfig::testLoadFile (UnitTest* ut)
{
    ut_initialize(ut);

    StreamConfig& config = StreamConfig::settings();
    config.reset();

    const int code = loadCode(
        "local mib = 1024 * 1024\n"
        "h5stream = {\n"
        "    metadata_budget = 4 * mib,\n"
        "    persistent_cache_dir = \"/var/cache/h5stream\",\n"
        "    max_concurrency = 32,\n"
        "    log_level = \"WARNING\",\n"
        "}\n");

    ut_assert(ut, code == RTE_INFO, "load failed: %s", RunTimeException::code2str(code));
    ut_assert(ut, config.metadataBudget == 0x400000, "wrong budget: %ld", config.metadataBudget);
    ut_assert(ut, config.persistentCacheDir == "/var/cache/h5stream", "wrong cache dir: %s", config.persistentCacheDir.c_str());
    ut_assert(ut, config.maxConcurrency == 32, "wrong maximum concurrency: %ld", config.maxConcurrency);
    ut_assert(ut, config.logLevel == WARNING, "wrong log level: %s", EventLib::lvl2str(config.logLevel));
    ut_assert(ut, config.minConcurrency == 1, "untouched field changed: %ld", config.minConcurrency);

    /* Numeric log level */
    const int numeric = loadCode("h5stream = { log_level = 0 }\n");
    ut_assert(ut, numeric == RTE_INFO && config.logLevel == DEBUG, "numeric log level not applied");

    config.reset();

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testUnknownKey - warned about and skipped
 *--------------------------------------------------------------------------------------*/
bool UT_StreamConfig::testUnknownKey (UnitTest* ut)
{
    ut_initialize(ut);

    StreamConfig& config = StreamConfig::settings();
    config.reset();

    const int code = loadCode("h5stream = { colour = \"blue\", io_retries = 7, [1] = 5 }\n");
    ut_assert(ut, code == RTE_INFO, "unknown key rejected: %s", RunTimeException::code2str(code));
    ut_assert(ut, config.ioRetries == 7, "known key not applied: %ld", config.ioRetries);

    config.reset();

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testBadValue
 *--------------------------------------------------------------------------------------*/
bool UT_StreamConfig::testBadValue (UnitTest* ut)
{
    ut_initialize(ut);

    StreamConfig::settings().reset();

    int code = loadCode("h5stream = { metadata_budget = \"lots\" }\n");
    ut_assert(ut, code == RTE_ERROR, "string for integer: %s", RunTimeException::code2str(code));

    code = loadCode("h5stream = { persistent_cache_dir = 12 }\n");
    ut_assert(ut, code == RTE_ERROR, "integer for string: %s", RunTimeException::code2str(code));

    code = loadCode("h5stream = { log_level = \"LOUD\" }\n");
    ut_assert(ut, code == RTE_ERROR, "invalid log level: %s", RunTimeException::code2str(code));

    code = loadCode("settings = { io_retries = 1 }\n");
    ut_assert(ut, code == RTE_ERROR, "missing table: %s", RunTimeException::code2str(code));

    code = loadCode("h5stream = {\n");
    ut_assert(ut, code == RTE_ERROR, "syntax error: %s", RunTimeException::code2str(code));

    int missing = RTE_INFO;
    try
    {
        StreamConfig::settings().loadFile("/nonexistent/h5stream.lua");
    }
    catch(const RunTimeException& e)
    {
        missing = e.code();
    }
    ut_assert(ut, missing == RTE_ERROR, "missing file: %s", RunTimeException::code2str(missing));

    StreamConfig::settings().reset();

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testEnvironment - overrides the file
 *--------------------------------------------------------------------------------------*/
bool UT_StreamConfig::testEnvironment (UnitTest* ut)
{
    ut_initialize(ut);

    StreamConfig& config = StreamConfig::settings();
    config.reset();

    setenv(StreamConfig::METADATA_BUDGET_ENV, "65536", 1);
    setenv(StreamConfig::CACHE_DIR_ENV, "/tmp/h5stream-env-cache", 1);
    setenv(StreamConfig::READER_THREADS_ENV, "many", 1);
    setenv(StreamConfig::LOG_LEVEL_ENV, "error", 1);

    const int code = loadCode("h5stream = { metadata_budget = 1024, reader_threads = 3 }\n");

    unsetenv(StreamConfig::METADATA_BUDGET_ENV);
    unsetenv(StreamConfig::CACHE_DIR_ENV);
    unsetenv(StreamConfig::READER_THREADS_ENV);
    unsetenv(StreamConfig::LOG_LEVEL_ENV);

    ut_assert(ut, code == RTE_INFO, "load failed: %s", RunTimeException::code2str(code));
    ut_assert(ut, config.metadataBudget == 65536, "environment did not override file: %ld", config.metadataBudget);
    ut_assert(ut, config.persistentCacheDir == "/tmp/h5stream-env-cache", "wrong cache dir: %s", config.persistentCacheDir.c_str());
    ut_assert(ut, config.readerThreads == 3, "non-integer environment value applied: %ld", config.readerThreads);
    ut_assert(ut, config.logLevel == ERROR, "wrong log level: %s", EventLib::lvl2str(config.logLevel));

    config.reset();

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testReset
 *--------------------------------------------------------------------------------------*/
bool UT_StreamConfig::testReset (UnitTest* ut)
{
    ut_initialize(ut);

    StreamConfig& config = StreamConfig::settings();
    config.metadataBudget = 1;
    config.persistentCacheDir = "/somewhere";
    config.smallDatasetLimit = 2;
    config.reset();

    ut_assert(ut, config.metadataBudget == 0x100000, "wrong default budget: %ld", config.metadataBudget);
    ut_assert(ut, config.persistentCacheDir.empty(), "cache dir not cleared: %s", config.persistentCacheDir.c_str());
    ut_assert(ut, config.smallDatasetLimit == 0x1000000, "wrong default limit: %ld", config.smallDatasetLimit);
    ut_assert(ut, config.persistentCacheEntries == 2000, "wrong default entries: %ld", config.persistentCacheEntries);

    config.dump();

    return ut_status(ut);
}
