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

#ifndef __h5_test_file__
#define __h5_test_file__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <string>
#include <vector>

/******************************************************************************
 * H5 TEST FILE CLASS
 ******************************************************************************/

/*
 * Builds HDF5 images in memory for the unit tests. Structures are appended
 * in whatever order a test needs them and the superblock is written last,
 * once the root group address is known. Offsets and lengths are 8 bytes.
 */
class H5TestFile
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t UNDEFINED = 0xFFFFFFFFFFFFFFFFULL;
        static const int SUPERBLOCK_SPACE = 96;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef std::vector<uint8_t> bytes_t;

        typedef struct {
            uint8_t     type;
            bytes_t     body;
        } msg_t;

        typedef struct {
            std::vector<uint64_t>   offsets;    // element offset per dimension
            uint64_t                address;    // chunk data, or child node for level > 0
            uint64_t                size;       // stored bytes
            uint32_t                mask;
        } chunk_entry_t;

        typedef struct {
            int             id;
            std::vector<uint32_t> parms;
        } filter_spec_t;

        typedef struct {
            std::string     name;
            uint64_t        address;
            std::string     target;     // soft links when not empty
        } link_spec_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                        H5TestFile          (void);

        /* raw space */
        uint64_t        append              (const bytes_t& data);
        void            patch               (uint64_t pos, const bytes_t& data);
        const bytes_t&  image               (void) const { return buffer; }
        uint64_t        size                (void) const { return buffer.size(); }

        /* finishing */
        void            superblockV0        (uint64_t root);
        void            superblockV2        (uint64_t root);

        /* object headers */
        uint64_t        objectHeader        (const std::vector<msg_t>& msgs, uint8_t flags=0x02);
        uint64_t        objectHeaderV1      (const std::vector<msg_t>& msgs);
        uint64_t        continuationBlock   (const std::vector<msg_t>& msgs, uint64_t* length);
        uint64_t        continuationBlockV1 (const std::vector<msg_t>& msgs, uint64_t* length);

        /* groups */
        uint64_t        symbolTableGroup    (const std::vector<link_spec_t>& links, uint64_t* heap);
        uint64_t        fractalHeap         (const std::vector<bytes_t>& objects, uint16_t id_length, std::vector<bytes_t>* ids);
        uint64_t        btreeV2             (int type, uint16_t record_size, const std::vector<bytes_t>& records);
        uint64_t        btreeV2Deep         (int type, uint16_t record_size, const std::vector<bytes_t>& left, const bytes_t& middle, const std::vector<bytes_t>& right);
        uint64_t        globalHeap          (const std::vector<std::string>& objects);

        /* chunk indexes */
        uint64_t        chunkTreeNode       (int level, int rank, const std::vector<chunk_entry_t>& entries);
        uint64_t        fixedArray          (const std::vector<chunk_entry_t>& entries, bool filtered);
        chunk_entry_t   writeChunk          (const std::vector<uint64_t>& offsets, const bytes_t& raw, const std::vector<filter_spec_t>& filters, int type_size);

        /* messages */
        static msg_t    dataspaceMsg        (const std::vector<uint64_t>& dims, int version=2);
        static msg_t    fixedPointMsg       (int size, bool is_signed, bool big_endian=false);
        static msg_t    floatMsg            (int size, bool big_endian=false);
        static msg_t    stringMsg           (int size);
        static msg_t    vlenStringMsg       (void);
        static msg_t    fillValueMsg        (const bytes_t& value);
        static msg_t    compactLayoutMsg    (const bytes_t& data);
        static msg_t    contiguousLayoutMsg (uint64_t address, uint64_t size);
        static msg_t    chunkedLayoutV3Msg  (uint64_t btree, const std::vector<uint64_t>& chunk_dims, uint32_t element_size);
        static msg_t    chunkedLayoutV4Msg  (int index_type, uint64_t address, const std::vector<uint64_t>& chunk_dims, uint32_t element_size, uint8_t flags=0, uint64_t filtered_size=0, uint32_t filter_mask=0);
        static msg_t    filterMsg           (const std::vector<filter_spec_t>& filters, int version=2);
        static msg_t    linkMsg             (const link_spec_t& link);
        static msg_t    linkInfoMsg         (uint64_t heap, uint64_t name_index);
        static msg_t    attributeInfoMsg    (uint64_t heap, uint64_t name_index);
        static msg_t    groupInfoMsg        (void);
        static msg_t    symbolTableMsg      (uint64_t btree, uint64_t heap);
        static msg_t    continuationMsg     (uint64_t address, uint64_t length);
        static msg_t    attributeMsg        (const std::string& name, const msg_t& datatype, const msg_t& dataspace, const bytes_t& data, int version=3);

        /* encodings */
        static void     put                 (bytes_t* data, uint64_t value, int size);
        static bytes_t  linkBody            (const link_spec_t& link);
        static bytes_t  vlenElement         (uint32_t length, uint64_t collection, uint32_t index);
        static bytes_t  nameRecord          (const std::string& name, const bytes_t& heap_id);
        static bytes_t  attributeRecord     (const std::string& name, const bytes_t& heap_id, uint32_t order);
        static bytes_t  chunkRecord         (uint64_t address, const std::vector<uint64_t>& scaled);
        static bytes_t  filteredChunkRecord (uint64_t address, uint64_t size, uint32_t mask, const std::vector<uint64_t>& scaled);
        static bytes_t  float32Bytes        (const std::vector<float>& values);

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        uint64_t        btreeV2Leaf         (int type, const std::vector<bytes_t>& records);
        uint64_t        btreeV2Header       (int type, uint16_t record_size, uint16_t depth, uint64_t root, uint16_t root_records, uint64_t total);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        bytes_t         buffer;
};

#endif  /* __h5_test_file__ */
