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

#ifndef __h5_chunk_cache__
#define __h5_chunk_cache__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"

#include <list>
#include <map>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 * H5 CHUNK CACHE CLASS
 ******************************************************************************/

/*
 * Decoded chunks keyed by origin, dataset and chunk coordinate. The memory
 * tier holds a bounded number of entries and evicts the oldest. The optional
 * persistent tier keeps one file per entry in a directory so chunks survive
 * a restart; any fault in it is treated as a miss. An entry is only returned
 * when its type and element count match what the caller expects.
 */
class H5ChunkCache
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* VERSION_TAG;
        static const char* ENTRY_SUFFIX;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::shared_ptr<const H5Stream::TypedArray> chunk_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            H5ChunkCache    (long memory_entries, const char* persistent_dir, long persistent_entries);
                            ~H5ChunkCache   (void) = default;

        chunk_t             get             (const std::string& key, H5Stream::DataType dtype, uint64_t elements);
        void                put             (const std::string& key, const chunk_t& chunk);
        void                clear           (void);
        long                memoryEntries   (void);
        long                persistentEntries (void);

        static std::string  makeKey         (const char* origin, const char* dataset, const std::vector<uint64_t>& coord);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                store           (const std::string& key, const chunk_t& chunk);
        void                scanDirectory   (void);
        chunk_t             readEntry       (const std::string& key, H5Stream::DataType dtype, uint64_t elements);
        void                dropEntry       (const std::string& file_name);
        void                writeEntry      (const std::string& key, const H5Stream::TypedArray& chunk);
        std::string         entryPath       (const std::string& file_name) const;
        static std::string  entryName       (const std::string& key);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        Mutex                           mut;
        const long                      maxMemoryEntries;
        std::map<std::string, chunk_t>  memory;
        std::list<std::string>          memoryOrder;        // oldest first

        std::string                     directory;          // empty when the persistent tier is off
        const long                      maxPersistentEntries;
        std::list<std::string>          persistentOrder;    // file names, oldest first
};

#endif  /* __h5_chunk_cache__ */
