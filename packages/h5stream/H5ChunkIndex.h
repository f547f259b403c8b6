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

#ifndef __h5_chunk_index__
#define __h5_chunk_index__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "H5Context.h"
#include "H5ObjectHeader.h"

#include <map>
#include <string>
#include <vector>

/******************************************************************************
 * H5 CHUNK INDEX CLASS
 ******************************************************************************/

/*
 * Maps chunk grid coordinates to stored chunk locations for one dataset.
 * The index is built on first use; concurrent first uses wait on the single
 * build in progress. Transport failures leave the index unloaded so a later
 * call may retry; format and unsupported errors stick.
 */
class H5ChunkIndex
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t H5_TREE_SIGNATURE_LE = 0x45455254LL;
        static const uint64_t H5_FAHD_SIGNATURE_LE = 0x44484146LL;
        static const uint64_t H5_FADB_SIGNATURE_LE = 0x42444146LL;

        static const int CHUNK_NODE_TYPE    = 1;
        static const int MAX_TREE_NODES     = 1048576;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            NOT_LOADED,
            LOADING,
            LOADED,
            UNSUPPORTED,
            FAILED
        } state_t;

        typedef struct {
            uint64_t    address;
            uint64_t    size;       // stored bytes
            uint32_t    filterMask; // bit i set skips filter i
        } chunk_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                        H5ChunkIndex    (H5Context* _context, const H5ObjectHeader& header);
                                        ~H5ChunkIndex   (void) = default;

        void                            load            (void);
        bool                            find            (const std::vector<uint64_t>& coord, chunk_t* chunk);
        uint64_t                        allocated       (void);
        state_t                         status          (void);
        uint64_t                        chunkBytes      (void) const;
        const std::vector<uint64_t>&    grid            (void) const;
        uint64_t                        gridSize        (void) const;

        static const char*              state2str       (state_t index_state);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void        build           (std::map<uint64_t, chunk_t>* chunks);
        void        readBTreeV1     (std::map<uint64_t, chunk_t>* chunks);
        void        readBTreeV2     (std::map<uint64_t, chunk_t>* chunks);
        void        readFixedArray  (std::map<uint64_t, chunk_t>* chunks);
        void        addChunk        (std::map<uint64_t, chunk_t>* chunks, const std::vector<uint64_t>& coord, const chunk_t& chunk);
        uint64_t    linearIndex     (const std::vector<uint64_t>& coord) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Context*                      context;
        const uint64_t                  headerAddress;
        const H5ObjectHeader::layout_t  layout;
        const int                       rank;
        std::vector<uint64_t>           gridDims;

        Cond                            cond;
        state_t                         state;
        std::map<uint64_t, chunk_t>     chunks;     // keyed by linear grid index
        int                             errorCode;
        std::string                     error;
};

#endif  /* __h5_chunk_index__ */
