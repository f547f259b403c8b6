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

#ifndef __h5_context__
#define __h5_context__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "ByteRangeSource.h"
#include "H5Concurrency.h"

#include <list>
#include <map>
#include <vector>

/******************************************************************************
 * H5 CONTEXT CLASS
 ******************************************************************************/

/*
 * All reads of one open file go through its context. Metadata reads are
 * served from a bounded line cache seeded by the metadata budget prefetch;
 * chunk data is read directly. Every range request is retried on I/O errors
 * and gated by the concurrency controller.
 */
class H5Context
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const long IO_CACHE_ENTRIES = 256;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                        H5Context       (H5Stream::ByteRangeSource* _source, H5Concurrency* _controller);
                        ~H5Context      (void) = default;

        void            prefetch        (int64_t budget);
        void            ioRequest       (uint64_t* pos, int64_t size, uint8_t* buffer);
        uint64_t        readField       (int64_t size, uint64_t* pos);
        void            readByteArray   (uint8_t* data, int64_t size, uint64_t* pos);
        void            readRange       (uint8_t* data, int64_t size, uint64_t pos);
        void            verifyChecksum  (uint64_t start, uint64_t end, const char* structure);
        void            checkExtent     (uint64_t address, uint64_t size, const char* structure) const;

        void            setSizes        (int offset_size, int length_size);
        bool            isUndefined     (uint64_t address) const;
        const char*     name            (void) const;
        H5Concurrency*  controller      (void) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        int             offsetSize;
        int             lengthSize;
        uint64_t        endOfFile;      // zero when unknown

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            std::vector<uint8_t>    data;
            uint64_t                pos;
        } cache_entry_t;

        typedef std::map<uint64_t, cache_entry_t> cache_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        int64_t         fetch           (uint8_t* data, int64_t size, uint64_t pos);
        bool            checkCache      (uint64_t pos, int64_t size, uint8_t* buffer);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Stream::ByteRangeSource*  source;
        H5Concurrency*              ioController;
        Mutex                       mut;
        cache_entry_t               budgetLine;     // pinned
        cache_t                     cache;
        std::list<uint64_t>         cacheOrder;     // oldest first
        const int64_t               lineSize;
        const int                   ioRetries;
        const int64_t               ioBackoffMs;
        long                        cacheMiss;
        long                        cacheReplace;
};

#endif  /* __h5_context__ */
