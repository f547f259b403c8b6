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

#ifndef __h5_concurrency__
#define __h5_concurrency__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"

/******************************************************************************
 * H5 CONCURRENCY CLASS
 ******************************************************************************/

/*
 * Gates outstanding range requests against a target that adapts to the
 * observed throughput: additive increase while throughput keeps rising and
 * round trips are not slowing down, halving on a failed request or when a
 * window's throughput collapses. Completions are grouped into windows of
 * at least MIN_WINDOW requests.
 */
class H5Concurrency
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int        MIN_WINDOW      = 4;
        static const int64_t    MAX_WINDOW_US   = 1000000;  // close a window after 1s regardless
        static const double     RISE_FACTOR;                // required gain to grow
        static const double     STALL_FACTOR;               // loss treated as a stall
        static const double     LATENCY_FACTOR;             // round trip growth that holds the target

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                H5Concurrency   (int initial, int minimum, int maximum);
                                ~H5Concurrency  (void) = default;

        void                    acquire         (void);
        void                    release         (int64_t bytes, int64_t duration_us, bool success);

        void                    countCacheHit   (void);
        void                    countChunk      (void);
        void                    countFailure    (void);
        void                    countMetadata   (int64_t bytes);

        int                     target          (void);
        H5Stream::StreamingStats snapshot       (void);
        void                    reset           (void);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                    adapt           (int64_t now);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        Cond                    gate;
        int                     targetConcurrency;
        const int               initialConcurrency;
        const int               minConcurrency;
        const int               maxConcurrency;
        int                     active;

        int64_t                 startTime;      // us
        int64_t                 totalBytes;
        int64_t                 totalRequests;
        int64_t                 chunksLoaded;
        int64_t                 failedRequests;
        int64_t                 cacheHits;
        int64_t                 metadataBytes;

        int64_t                 windowStart;    // us
        int64_t                 windowBytes;
        int                     windowCompletions;
        bool                    windowError;
        int64_t                 windowLatency;  // us, summed over completions
        double                  lastWindowMbps;
        double                  lastWindowLatency;  // us, mean round trip
        double                  currentMbps;
};

#endif  /* __h5_concurrency__ */
