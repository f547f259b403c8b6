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

#include "H5Concurrency.h"
#include "EventLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const double H5Concurrency::RISE_FACTOR = 1.05;
const double H5Concurrency::STALL_FACTOR = 0.5;
const double H5Concurrency::LATENCY_FACTOR = 2.0;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Concurrency::H5Concurrency (int initial, int minimum, int maximum):
    initialConcurrency(MAX(MIN(initial, maximum), MAX(minimum, 1))),
    minConcurrency(MAX(minimum, 1)),
    maxConcurrency(MAX(maximum, MAX(minimum, 1)))
{
    reset();
}

/*----------------------------------------------------------------------------
 * acquire - blocks until fewer than target requests are outstanding
 *----------------------------------------------------------------------------*/
void H5Concurrency::acquire (void)
{
    gate.lock();
    {
        while(active >= targetConcurrency)
        {
            gate.wait(0, IO_PEND);
        }
        active++;
    }
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * release
 *----------------------------------------------------------------------------*/
void H5Concurrency::release (int64_t bytes, int64_t duration_us, bool success)
{
    const int64_t now = OsApi::time(OsApi::CPU_CLK);

    gate.lock();
    {
        active--;
        totalRequests++;
        if(success)
        {
            totalBytes += bytes;
            windowBytes += bytes;
        }
        else
        {
            failedRequests++;
            windowError = true;
        }
        windowCompletions++;
        windowLatency += MAX(duration_us, (int64_t)0);

        const bool window_full = windowCompletions >= MAX(static_cast<int>(MIN_WINDOW), targetConcurrency);
        if(window_full || !success || (now - windowStart) >= MAX_WINDOW_US)
        {
            adapt(now);
        }

        gate.signal();
    }
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * countCacheHit
 *----------------------------------------------------------------------------*/
void H5Concurrency::countCacheHit (void)
{
    gate.lock();
    cacheHits++;
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * countChunk
 *----------------------------------------------------------------------------*/
void H5Concurrency::countChunk (void)
{
    gate.lock();
    chunksLoaded++;
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * countFailure - a failure the caller absorbed, e.g. a region gap
 *----------------------------------------------------------------------------*/
void H5Concurrency::countFailure (void)
{
    gate.lock();
    failedRequests++;
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * countMetadata
 *----------------------------------------------------------------------------*/
void H5Concurrency::countMetadata (int64_t bytes)
{
    gate.lock();
    metadataBytes += bytes;
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * target
 *----------------------------------------------------------------------------*/
int H5Concurrency::target (void)
{
    gate.lock();
    const int t = targetConcurrency;
    gate.unlock();
    return t;
}

/*----------------------------------------------------------------------------
 * snapshot
 *----------------------------------------------------------------------------*/
H5Stream::StreamingStats H5Concurrency::snapshot (void)
{
    H5Stream::StreamingStats stats;
    const int64_t now = OsApi::time(OsApi::CPU_CLK);

    gate.lock();
    {
        const int64_t elapsed_us = now - startTime;
        stats.currentMbps       = currentMbps;
        stats.avgMbps           = elapsed_us > 0 ? (totalBytes * 8.0) / elapsed_us : 0.0; // bits per us is Mbps
        stats.totalBytes        = totalBytes;
        stats.totalRequests     = totalRequests;
        stats.elapsedMs         = elapsed_us / 1000;
        stats.concurrency       = targetConcurrency;
        stats.activeFetches     = active;
        stats.chunksLoaded      = chunksLoaded;
        stats.failedRequests    = failedRequests;
        stats.cacheHits         = cacheHits;
        stats.metadataBytes     = metadataBytes;
    }
    gate.unlock();

    return stats;
}

/*----------------------------------------------------------------------------
 * reset
 *----------------------------------------------------------------------------*/
void H5Concurrency::reset (void)
{
    gate.lock();
    {
        targetConcurrency   = initialConcurrency;
        active              = 0;
        startTime           = OsApi::time(OsApi::CPU_CLK);
        totalBytes          = 0;
        totalRequests       = 0;
        chunksLoaded        = 0;
        failedRequests      = 0;
        cacheHits           = 0;
        metadataBytes       = 0;
        windowStart         = startTime;
        windowBytes         = 0;
        windowCompletions   = 0;
        windowError         = false;
        windowLatency       = 0;
        lastWindowMbps      = 0.0;
        lastWindowLatency   = 0.0;
        currentMbps         = 0.0;
    }
    gate.unlock();
}

/*----------------------------------------------------------------------------
 * adapt - must be called with gate locked
 *----------------------------------------------------------------------------*/
void H5Concurrency::adapt (int64_t now)
{
    const int64_t window_us = MAX(now - windowStart, (int64_t)1);
    const double mbps = (windowBytes * 8.0) / window_us;
    const double latency = (windowCompletions > 0) ? static_cast<double>(windowLatency) / windowCompletions : 0.0;
    const bool round_trips_slowing = lastWindowLatency > 0.0 && latency > (lastWindowLatency * LATENCY_FACTOR);
    const int previous = targetConcurrency;

    if(windowError)
    {
        targetConcurrency = MAX(minConcurrency, targetConcurrency / 2);
    }
    else if(lastWindowMbps > 0.0 && mbps < (lastWindowMbps * STALL_FACTOR))
    {
        targetConcurrency = MAX(minConcurrency, targetConcurrency / 2);
    }
    else if(mbps > (lastWindowMbps * RISE_FACTOR) && !round_trips_slowing)
    {
        targetConcurrency = MIN(maxConcurrency, targetConcurrency + 1);
    }

    if(targetConcurrency != previous)
    {
        mlog(DEBUG, "Concurrency %d -> %d at %.1f Mbps, %.0fus round trips", previous, targetConcurrency, mbps, latency);
    }

    currentMbps = mbps;
    lastWindowMbps = mbps;
    if(windowCompletions > 0) lastWindowLatency = latency;
    windowStart = now;
    windowBytes = 0;
    windowCompletions = 0;
    windowLatency = 0;
    windowError = false;

    gauge_metric(DEBUG, "h5stream.concurrency", targetConcurrency);
    gauge_metric(DEBUG, "h5stream.throughput_mbps", currentMbps);
}
