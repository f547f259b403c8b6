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

#ifndef __memory_range_source__
#define __memory_range_source__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "ByteRangeSource.h"

#include <map>
#include <vector>

/******************************************************************************
 * MEMORY RANGE SOURCE CLASS
 ******************************************************************************/

/*
 * Serves an in-memory image and records every request made against it.
 * Failures and latency can be injected to exercise retries and gaps.
 */
class MemoryRangeSource: public H5Stream::ByteRangeSource
{
    public:

        static const uint64_t NO_POSITION = 0xFFFFFFFFFFFFFFFFULL;

                            MemoryRangeSource   (const std::vector<uint8_t>& _image, const char* _name="memory://test.h5");
                            ~MemoryRangeSource  (void) override = default;

        int64_t             read                (uint8_t* data, int64_t size, uint64_t pos) override;
        const char*         origin              (void) const override;
        int64_t             length              (void) override;

        void                setLatency          (double secs);
        void                failNext            (int count);
        void                failAt              (uint64_t pos);

        long                reads               (void);
        int64_t             bytesRead           (void);
        int                 readsAt             (uint64_t pos);

    private:

        std::vector<uint8_t>    image;
        const char*             name;
        Mutex                   mut;
        double                  latency;
        int                     failures;
        uint64_t                failPosition;
        long                    numReads;
        int64_t                 numBytes;
        std::map<uint64_t, int> positions;
};

#endif  /* __memory_range_source__ */
