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

#include "UT_Concurrency.h"
#include "H5Concurrency.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_Concurrency::SUITE_NAME = "concurrency";
const UnitTest::test_t UT_Concurrency::TESTS[] = {
    {"growth",          testGrowth},
    {"halving",         testHalving},
    {"minimum_bound",   testMinimumBound},
    {"round_trips",     testRoundTrips},
    {"stats",           testStats},
    {"reset",           testReset},
    {NULL,              NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * complete - runs count requests of the given size through the controller
 *----------------------------------------------------------------------------*/
static void complete (H5Concurrency* controller, int count, int64_t bytes, bool success=true, int64_t duration_us=10)
{
    for(int i = 0; i < count; i++)
    {
        controller->acquire();
        controller->release(bytes, duration_us, success);
    }
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_Concurrency::UT_Concurrency (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testGrowth - one step per improving window, capped at the maximum
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testGrowth (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(1, 1, 3);
    ut_assert(ut, controller.target() == 1, "wrong initial target: %d", controller.target());

    /* Slow first window */
    OsApi::sleep(0.02);
    complete(&controller, H5Concurrency::MIN_WINDOW, 1000);
    ut_assert(ut, controller.target() == 2, "no growth after first window: %d", controller.target());

    /* Each following window is much faster than the last */
    int64_t bytes = 100000000;
    for(int window = 0; window < 4; window++)
    {
        complete(&controller, H5Concurrency::MIN_WINDOW, bytes);
        bytes *= 100;
    }
    ut_assert(ut, controller.target() == 3, "target not capped at maximum: %d", controller.target());

    /* Initial target clamped into range */
    H5Concurrency clamped(20, 2, 6);
    ut_assert(ut, clamped.target() == 6, "initial target not clamped: %d", clamped.target());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testHalving - errors and stalls cut the target in half
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testHalving (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(8, 1, 8);

    /* A failed request closes the window immediately */
    complete(&controller, 1, 0, false);
    ut_assert(ut, controller.target() == 4, "failure did not halve: %d", controller.target());
    complete(&controller, 1, 0, false);
    ut_assert(ut, controller.target() == 2, "second failure did not halve: %d", controller.target());

    /* Fast window followed by a stalled one */
    H5Concurrency stalled(4, 1, 4);
    complete(&stalled, H5Concurrency::MIN_WINDOW, 1000000000);
    ut_assert(ut, stalled.target() == 4, "target moved past maximum: %d", stalled.target());
    OsApi::sleep(0.05);
    complete(&stalled, H5Concurrency::MIN_WINDOW, 10);
    ut_assert(ut, stalled.target() == 2, "stall did not halve: %d", stalled.target());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testMinimumBound
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testMinimumBound (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(8, 3, 8);
    complete(&controller, 1, 0, false);
    ut_assert(ut, controller.target() == 4, "failure did not halve: %d", controller.target());
    complete(&controller, 1, 0, false);
    ut_assert(ut, controller.target() == 3, "target not held at minimum: %d", controller.target());
    complete(&controller, 1, 0, false);
    ut_assert(ut, controller.target() == 3, "target dropped below minimum: %d", controller.target());

    /* A floor of zero still allows one request */
    H5Concurrency single(1, 0, 1);
    complete(&single, 1, 0, false);
    ut_assert(ut, single.target() == 1, "target dropped to %d", single.target());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testRoundTrips - no growth while round trips are slowing down
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testRoundTrips (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(1, 1, 8);

    OsApi::sleep(0.02);
    complete(&controller, H5Concurrency::MIN_WINDOW, 1000, true, 100);
    ut_assert(ut, controller.target() == 2, "no growth after first window: %d", controller.target());

    /* Throughput rises but each request takes ten times longer */
    complete(&controller, H5Concurrency::MIN_WINDOW, 100000000, true, 1000);
    ut_assert(ut, controller.target() == 2, "grew while round trips slowed: %d", controller.target());

    /* Round trips hold steady and throughput keeps rising */
    complete(&controller, H5Concurrency::MIN_WINDOW, 10000000000LL, true, 1000);
    ut_assert(ut, controller.target() == 3, "no growth with steady round trips: %d", controller.target());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testStats
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testStats (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(2, 1, 4);
    complete(&controller, 3, 500);
    complete(&controller, 1, 700, false);
    controller.countCacheHit();
    controller.countCacheHit();
    controller.countChunk();
    controller.countFailure();
    controller.countMetadata(4096);

    controller.acquire();
    const H5Stream::StreamingStats stats = controller.snapshot();
    controller.release(0, 0, true);

    ut_assert(ut, stats.totalBytes == 1500, "wrong total bytes: %ld", (long)stats.totalBytes);
    ut_assert(ut, stats.totalRequests == 4, "wrong request count: %ld", (long)stats.totalRequests);
    ut_assert(ut, stats.failedRequests == 2, "wrong failure count: %ld", (long)stats.failedRequests);
    ut_assert(ut, stats.cacheHits == 2, "wrong cache hits: %ld", (long)stats.cacheHits);
    ut_assert(ut, stats.chunksLoaded == 1, "wrong chunk count: %ld", (long)stats.chunksLoaded);
    ut_assert(ut, stats.metadataBytes == 4096, "wrong metadata bytes: %ld", (long)stats.metadataBytes);
    ut_assert(ut, stats.activeFetches == 1, "wrong active count: %d", (int)stats.activeFetches);
    ut_assert(ut, stats.concurrency == controller.target(), "concurrency %d != target %d", (int)stats.concurrency, controller.target());
    ut_assert(ut, stats.avgMbps >= 0.0, "negative average: %lf", stats.avgMbps);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testReset
 *--------------------------------------------------------------------------------------*/
bool UT_Concurrency::testReset (UnitTest* ut)
{
    ut_initialize(ut);

    H5Concurrency controller(4, 1, 8);
    complete(&controller, 1, 100, false);
    complete(&controller, 2, 100);
    controller.countCacheHit();
    ut_assert(ut, controller.target() == 2, "failure did not halve: %d", controller.target());

    controller.reset();
    const H5Stream::StreamingStats stats = controller.snapshot();
    ut_assert(ut, controller.target() == 4, "target not restored: %d", controller.target());
    ut_assert(ut, stats.totalBytes == 0 && stats.totalRequests == 0, "totals not cleared");
    ut_assert(ut, stats.failedRequests == 0 && stats.cacheHits == 0, "counters not cleared");
    ut_assert(ut, stats.currentMbps == 0.0, "throughput not cleared: %lf", stats.currentMbps);

    return ut_status(ut);
}
