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

#ifndef __h5_group_walker__
#define __h5_group_walker__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "H5Context.h"
#include "H5ObjectHeader.h"

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 * H5 GROUP WALKER CLASS
 ******************************************************************************/

/*
 * Resolves paths one segment at a time, reading only the object headers and
 * group index structures on the path. Parsed headers are kept in an arena
 * keyed by file address and shared with the caller.
 */
class H5GroupWalker
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t H5_HEAP_SIGNATURE_LE = 0x50414548LL;
        static const uint64_t H5_TREE_SIGNATURE_LE = 0x45455254LL;
        static const uint64_t H5_SNOD_SIGNATURE_LE = 0x444F4E53LL;

        static const int GROUP_NODE_TYPE    = 0;
        static const int SOFT_LINK_CACHE    = 2;
        static const int MAX_TREE_NODES     = 65536;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::shared_ptr<const H5ObjectHeader> header_t;

        typedef struct {
            std::string     path;
            uint64_t        address;
            header_t        header;     // null when the object could not be read
            int             errorCode;
            std::string     error;
        } object_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                    H5GroupWalker   (H5Context* _context, uint64_t _root_address);
                    ~H5GroupWalker  (void) = default;

        header_t    header          (uint64_t address);
        uint64_t    resolve         (const char* path);
        void        links           (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result);
        void        attributes      (const H5ObjectHeader& object, std::vector<H5ObjectHeader::attribute_t>* result);
        void        walk            (std::vector<object_t>* objects);

        static void splitPath       (const char* path, std::deque<std::string>* segments);

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            uint64_t    dataSegment;
            uint64_t    dataSize;
        } local_heap_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        bool            lookup              (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link);
        bool            symbolTableLookup   (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link);
        bool            denseLookup         (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link);
        void            symbolTableLinks    (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result);
        void            denseLinks          (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result);

        local_heap_t    readLocalHeap       (uint64_t address);
        std::string     readHeapString      (const local_heap_t& heap, uint64_t offset);
        void            readSymbolNode      (uint64_t address, const local_heap_t& heap, std::vector<H5ObjectHeader::link_t>* result);
        uint64_t        readGroupNode       (uint64_t address, int* level, int* entries);

        static bool     readLinkRecord      (H5Context* context, uint64_t record_pos, void* parm);
        static bool     readAttributeRecord (H5Context* context, uint64_t record_pos, void* parm);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Context*                      context;
        const uint64_t                  rootAddress;
        Mutex                           arenaMut;
        std::map<uint64_t, header_t>    arena;
};

#endif  /* __h5_group_walker__ */
