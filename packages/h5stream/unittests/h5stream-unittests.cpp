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
 INCLUDES
 ******************************************************************************/

#include "core.h"
#include "h5stream.h"
#include "StreamConfig.h"

#include "UT_StreamConfig.h"
#include "UT_Superblock.h"
#include "UT_ObjectHeader.h"
#include "UT_GroupWalker.h"
#include "UT_ChunkIndex.h"
#include "UT_Filters.h"
#include "UT_ChunkCache.h"
#include "UT_Concurrency.h"
#include "UT_RangeSource.h"
#include "UT_Reader.h"

#include <stdlib.h>
#include <string.h>

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * run_suite
 */
template<class T>
static bool run_suite (const char* name, bool* found)
{
    if(name && strcmp(name, T::SUITE_NAME) != 0) return true;
    *found = true;
    T suite;
    return suite.run(T::TESTS);
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    const char* name = (argc > 1) ? argv[1] : NULL;

    /* Fast retries, no persistent tier, quiet logs */
    StreamConfig& config = StreamConfig::settings();
    config.ioBackoffMs = 1;
    config.readerThreads = 4;
    config.persistentCacheDir = "";
    if(getenv(StreamConfig::LOG_LEVEL_ENV) == NULL) config.logLevel = CRITICAL;

    initcore();
    inith5stream();

    bool found = false;
    bool status = true;
    status = run_suite<UT_Superblock>(name, &found) && status;
    status = run_suite<UT_ObjectHeader>(name, &found) && status;
    status = run_suite<UT_GroupWalker>(name, &found) && status;
    status = run_suite<UT_ChunkIndex>(name, &found) && status;
    status = run_suite<UT_Filters>(name, &found) && status;
    status = run_suite<UT_ChunkCache>(name, &found) && status;
    status = run_suite<UT_Concurrency>(name, &found) && status;
    status = run_suite<UT_RangeSource>(name, &found) && status;
    status = run_suite<UT_Reader>(name, &found) && status;
    status = run_suite<UT_StreamConfig>(name, &found) && status; // resets the settings

    deinith5stream();
    deinitcore();

    if(!found)
    {
        print2term("Unknown test suite: %s\n", name);
        return 2;
    }

    return status ? 0 : 1;
}
