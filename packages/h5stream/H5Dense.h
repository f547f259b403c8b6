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

#ifndef __h5_dense__
#define __h5_dense__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "H5Context.h"

#include <string>
#include <vector>

/******************************************************************************
 * H5 FRACTAL HEAP CLASS
 ******************************************************************************/

/*
 * Locates managed objects by heap ID, reading only the indirect block rows
 * and the direct block on the path to the object.
 */
class H5FractalHeap
{
    public:

        static const uint64_t H5_FRHP_SIGNATURE_LE = 0x50485246LL;
        static const uint64_t H5_FHDB_SIGNATURE_LE = 0x42444846LL;
        static const uint64_t H5_FHIB_SIGNATURE_LE = 0x42494846LL;

        static const uint8_t ID_VERSION_MASK    = 0xC0;
        static const uint8_t ID_TYPE_MASK       = 0x30;
        static const uint8_t ID_TYPE_MANAGED    = 0x00;
        static const uint8_t ID_TYPE_HUGE       = 0x10;
        static const uint8_t ID_TYPE_TINY       = 0x20;

                    H5FractalHeap   (H5Context* _context, uint64_t _address);
                    ~H5FractalHeap  (void) = default;

        void        locate          (const uint8_t* id, int id_size, uint64_t* pos, uint64_t* size);

        const uint64_t  address;
        uint16_t        heapIdLength;

    private:

        uint64_t    rowOffset       (int row) const;
        uint64_t    rowBlockSize    (int row) const;
        int         entryPosition   (uint64_t iblock, int entry, uint64_t* pos) const;

        H5Context*  context;
        uint16_t    tableWidth;
        uint64_t    startingBlockSize;
        uint64_t    maxDirectBlockSize;
        uint16_t    maxHeapSize;        // bits
        uint64_t    rootBlockAddress;
        uint16_t    currNumRows;        // zero when the root is a direct block
        int         blockOffsetSize;
        int         heapOffsetSize;
        int         heapLengthSize;
        int         firstRowBits;
        int         maxDirectRows;
};

/******************************************************************************
 * H5 BTREE V2 CLASS
 ******************************************************************************/

/*
 * Version 2 B-tree. Records are left in the file; visitors receive the file
 * position of each record and decode it for the tree's record type.
 * Descent uses an explicit worklist so tree depth never grows the stack.
 */
class H5BTreeV2
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t H5_BTHD_SIGNATURE_LE = 0x44485442LL;
        static const uint64_t H5_BTIN_SIGNATURE_LE = 0x4E495442LL;
        static const uint64_t H5_BTLF_SIGNATURE_LE = 0x464C5442LL;

        static const int METADATA_PREFIX_SIZE = 10; // signature, version, type, checksum

        typedef enum {
            GROUP_NAME_RECORD           = 5,
            GROUP_CORDER_RECORD         = 6,
            ATTRIBUTE_NAME_RECORD       = 8,
            ATTRIBUTE_CORDER_RECORD     = 9,
            CHUNK_RECORD                = 10,
            FILTERED_CHUNK_RECORD       = 11
        } record_type_t;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        /* return false to stop the walk */
        typedef bool (*visitor_t) (H5Context* context, uint64_t record_pos, void* parm);

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                    H5BTreeV2       (H5Context* _context, uint64_t _address);
                    ~H5BTreeV2      (void) = default;

        void        forEachRecord   (visitor_t visitor, void* parm);
        void        findByHash      (uint32_t hash, visitor_t visitor, void* parm);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const uint64_t  address;
        int             type;
        uint32_t        nodeSize;
        uint16_t        recordSize;
        uint16_t        depth;
        uint64_t        totalRecords;

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            uint64_t    address;
            uint16_t    numRecords;
            int         depth;
        } node_ptr_t;

        typedef struct {
            uint64_t    maxRecords;
            uint64_t    cumMaxRecords;
            int         cumMaxRecordsSize;
        } node_info_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        uint64_t    readNode        (const node_ptr_t& node, std::vector<node_ptr_t>* children);
        static int  limitEncSize    (uint64_t value);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Context*                  context;
        node_ptr_t                  root;
        int                         maxRecordsSize;
        std::vector<node_info_t>    nodeInfo;
};

/******************************************************************************
 * H5 GLOBAL HEAP CLASS
 ******************************************************************************/

struct H5GlobalHeap
{
    static const uint64_t H5_GCOL_SIGNATURE_LE = 0x4C4F4347LL;

    static std::string readObject (H5Context* context, uint64_t collection, uint32_t index);
};

#endif  /* __h5_dense__ */
