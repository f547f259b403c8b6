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

#ifndef __h5_reader__
#define __h5_reader__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "ByteRangeSource.h"
#include "H5Concurrency.h"
#include "H5Context.h"
#include "H5Superblock.h"
#include "H5ObjectHeader.h"
#include "H5GroupWalker.h"
#include "H5ChunkCache.h"
#include "H5ChunkFetcher.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 * H5 READER CLASS
 ******************************************************************************/

namespace H5Stream
{
    /*
     * One open file. Opening reads the metadata budget and the superblock;
     * everything else is resolved on demand. Failures below the superblock
     * are confined to the dataset, attribute or chunk they occur in.
     */
    class H5Reader
    {
        public:

            /*----------------------------------------------------------------
             * Typedefs
             *----------------------------------------------------------------*/

            typedef std::shared_ptr<const TypedArray> chunk_t;

            /*----------------------------------------------------------------
             * Methods
             *----------------------------------------------------------------*/

                                            H5Reader            (ByteRangeSource* _source, int64_t metadata_budget);
                                            ~H5Reader           (void);

            std::vector<DatasetDescriptor>  listDatasets        (void);
            chunk_t                         readChunk           (const char* id, uint64_t chunk_row, uint64_t chunk_col);
            chunk_t                         readChunk           (const char* id, const std::vector<uint64_t>& coord);
            TypedArray                      readRegion          (const char* id, uint64_t row, uint64_t col, uint64_t height, uint64_t width);
            SmallValue                      readSmallDataset    (const char* id);
            std::vector<AttributeValue>     listAttributes      (const char* path);
            StreamingStats                  getStreamingStats   (void);
            void                            close               (void);

            const H5Superblock&             superblock          (void) const;
            const char*                     origin              (void) const;

        private:

            /*----------------------------------------------------------------
             * Methods
             *----------------------------------------------------------------*/

            void                            checkOpen           (void) const;
            H5ChunkFetcher::dataset_t       openDataset         (const char* id);
            DatasetDescriptor               describe            (const std::string& path, const H5ObjectHeader& header) const;
            void                            readStorage         (const H5ChunkFetcher::dataset_t& dataset, uint64_t elements, std::vector<uint8_t>* raw);
            void                            regionFromChunks    (const H5ChunkFetcher::dataset_t& dataset, uint64_t row, uint64_t col, uint64_t height, uint64_t width, TypedArray* region);
            void                            regionFromStorage   (const H5ChunkFetcher::dataset_t& dataset, uint64_t row, uint64_t col, uint64_t height, uint64_t width, TypedArray* region);
            void                            decodeValue         (const H5ObjectHeader::datatype_t& datatype, const H5ObjectHeader::dataspace_t& dataspace, const std::vector<uint8_t>& raw, SmallValue* value);

            static std::string              normalize           (const char* id);
            static void                     fillSentinel        (const H5ObjectHeader& header, TypedArray* array);

            /*----------------------------------------------------------------
             * Data
             *----------------------------------------------------------------*/

            ByteRangeSource*                                    source;
            H5Concurrency                                       controller;
            H5Context                                           context;
            H5ChunkCache                                        cache;
            H5ChunkFetcher                                      fetcher;
            H5Superblock                                        sb;
            H5GroupWalker*                                      walker;
            Mutex                                               datasetMut;
            std::map<std::string, H5ChunkFetcher::dataset_t>    datasets;
            bool                                                closed;
    };
}

#endif  /* __h5_reader__ */
