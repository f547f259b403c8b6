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

#ifndef __h5_chunk_fetcher__
#define __h5_chunk_fetcher__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "H5Context.h"
#include "H5ObjectHeader.h"
#include "H5ChunkIndex.h"
#include "H5ChunkCache.h"
#include "H5Future.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 * H5 CHUNK FETCHER CLASS
 ******************************************************************************/

/*
 * Reads and decodes chunks. Requests for a chunk already in flight attach
 * to the pending future instead of issuing a second read; the pending entry
 * is dropped on completion, success or failure, so a later request retries.
 */
class H5ChunkFetcher
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t FILTER_EXPANSION = 2;     // stored or inflated bytes per chunk byte
        static const uint64_t FILTER_OVERHEAD = 4096;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef H5Future::result_t          result_t;
        typedef std::shared_ptr<H5Future>   future_t;

        typedef struct {
            std::string                             path;
            std::shared_ptr<const H5ObjectHeader>   header;
            std::shared_ptr<H5ChunkIndex>           index;
        } dataset_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            H5ChunkFetcher  (H5Context* _context, H5ChunkCache* _cache);
                            ~H5ChunkFetcher (void);

        result_t            read            (const dataset_t& dataset, const std::vector<uint64_t>& coord);
        future_t            request         (const dataset_t& dataset, const std::vector<uint64_t>& coord);
        void                drain           (void);

        static void         applyFilters    (const std::vector<H5ObjectHeader::filter_t>& filters, uint32_t filter_mask, int type_size, uint64_t expected, std::vector<uint8_t>* buffer);
        static void         inflateChunk    (const std::vector<uint8_t>& input, uint64_t expected, std::vector<uint8_t>* output);
        static void         shuffleChunk    (const std::vector<uint8_t>& input, int type_size, std::vector<uint8_t>* output);
        static void         checkFletcher32 (std::vector<uint8_t>* buffer);
        static void         swapBytes       (uint8_t* data, uint64_t elements, int type_size);
        static uint64_t     filteredLimit   (uint64_t chunk_bytes);

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            H5ChunkFetcher*         fetcher;
            dataset_t               dataset;
            std::vector<uint64_t>   coord;
            std::string             key;
            future_t                future;
        } job_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        future_t            submit          (const dataset_t& dataset, const std::vector<uint64_t>& coord, bool async);
        void                execute         (job_t* job);
        result_t            load            (const dataset_t& dataset, const std::vector<uint64_t>& coord);

        static void         fetchJob        (void* parm);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Context*                          context;
        H5ChunkCache*                       cache;
        Cond                                pendingCond;
        std::map<std::string, future_t>     pending;
        int                                 outstanding;
};

#endif  /* __h5_chunk_fetcher__ */
