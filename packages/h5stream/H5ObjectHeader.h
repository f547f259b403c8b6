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

#ifndef __h5_object_header__
#define __h5_object_header__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"
#include "H5Context.h"

#include <string>
#include <vector>

/******************************************************************************
 * H5 OBJECT HEADER CLASS
 ******************************************************************************/

/*
 * Decodes one object header, following continuation blocks, into its
 * message list plus the decoded messages the reader consumes. Unknown
 * message types are recorded and skipped by their declared size.
 */
class H5ObjectHeader
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint64_t H5_OHDR_SIGNATURE_LE    = 0x5244484FLL; // object header
        static const uint64_t H5_OCHK_SIGNATURE_LE    = 0x4B48434FLL; // object header continuation block

        static const uint8_t SIZE_OF_CHUNK_0_MASK     = 0x03;
        static const uint8_t ATTR_CREATION_TRACK_BIT  = 0x04;
        static const uint8_t STORE_CHANGE_PHASE_BIT   = 0x10;
        static const uint8_t FILE_STATS_BIT           = 0x20;

        static const uint8_t SHARED_MSG_BIT           = 0x02;

        static const int MAX_CONTINUATIONS            = 1024;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef enum {
            DATASPACE_MSG           = 0x1,
            LINK_INFO_MSG           = 0x2,
            DATATYPE_MSG            = 0x3,
            FILL_VALUE_OLD_MSG      = 0x4,
            FILL_VALUE_MSG          = 0x5,
            LINK_MSG                = 0x6,
            DATA_LAYOUT_MSG         = 0x8,
            GROUP_INFO_MSG          = 0xA,
            FILTER_MSG              = 0xB,
            ATTRIBUTE_MSG           = 0xC,
            HEADER_CONT_MSG         = 0x10,
            SYMBOL_TABLE_MSG        = 0x11,
            ATTRIBUTE_INFO_MSG      = 0x15
        } msg_type_t;

        typedef enum {
            FIXED_POINT_TYPE        = 0,
            FLOATING_POINT_TYPE     = 1,
            TIME_TYPE               = 2,
            STRING_TYPE             = 3,
            BIT_FIELD_TYPE          = 4,
            OPAQUE_TYPE             = 5,
            COMPOUND_TYPE           = 6,
            REFERENCE_TYPE          = 7,
            ENUMERATED_TYPE         = 8,
            VARIABLE_LENGTH_TYPE    = 9,
            ARRAY_TYPE              = 10,
            UNKNOWN_TYPE            = 11
        } type_class_t;

        typedef enum {
            HARD_LINK               = 0,
            SOFT_LINK               = 1,
            EXTERNAL_LINK           = 64
        } link_type_t;

        typedef struct {
            uint16_t                type;
            uint16_t                size;
            uint8_t                 flags;
            uint64_t                pos;        // start of message body
        } message_t;

        typedef struct {
            bool                    present;
            int                     rank;       // 0 for scalar
            bool                    null;       // no elements
            std::vector<uint64_t>   dims;
        } dataspace_t;

        typedef struct {
            bool                    present;
            type_class_t            typeClass;
            int                     size;
            bool                    signedval;
            bool                    bigEndian;
            bool                    vlenString;
            H5Stream::DataType      dtype;      // INVALID_TYPE outside the numeric classes
        } datatype_t;

        typedef struct {
            bool                    defined;
            std::vector<uint8_t>    value;
        } fill_t;

        typedef struct {
            bool                    present;
            H5Stream::layout_t      layout;
            H5Stream::index_t       indexKind;
            uint64_t                address;        // data, chunk index, or compact data position
            uint64_t                size;           // contiguous or compact byte size
            std::vector<uint64_t>   chunkDims;      // element size dimension removed
            uint32_t                elementSize;
            uint8_t                 flags;          // version 4 chunked flags
            uint64_t                filteredSize;   // single chunk index
            uint32_t                filterMask;     // single chunk index
            uint8_t                 pageBits;       // fixed array index
        } layout_t;

        typedef struct {
            int                     id;
            uint16_t                flags;
            std::string             name;
            std::vector<uint32_t>   parms;
        } filter_t;

        typedef struct {
            std::string             name;
            link_type_t             type;
            uint64_t                address;        // hard links
            std::string             target;         // soft and external links
        } link_t;

        typedef struct {
            bool                    present;
            uint64_t                heapAddress;
            uint64_t                nameIndexAddress;
            uint64_t                orderIndexAddress;
        } link_info_t;

        typedef struct {
            bool                    present;
            uint64_t                btreeAddress;
            uint64_t                heapAddress;
        } symbol_table_t;

        typedef struct {
            std::string             name;
            datatype_t              datatype;
            dataspace_t             dataspace;
            uint64_t                dataPos;
            uint64_t                dataSize;
        } attribute_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            H5ObjectHeader      (H5Context* _context, uint64_t _address);
                            ~H5ObjectHeader     (void) = default;

        bool                isDataset           (void) const;
        bool                isGroup             (void) const;

        static int          readDatatype        (H5Context* context, uint64_t pos, datatype_t* datatype);
        static int          readDataspace       (H5Context* context, uint64_t pos, dataspace_t* dataspace);
        static int          readLink            (H5Context* context, uint64_t pos, link_t* link);
        static int          readAttribute       (H5Context* context, uint64_t pos, uint64_t size, attribute_t* attribute);
        static const char*  class2str           (type_class_t type_class);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const uint64_t              address;
        int                         version;
        std::vector<message_t>      messages;
        dataspace_t                 dataspace;
        datatype_t                  datatype;
        fill_t                      fill;
        layout_t                    layout;
        std::vector<filter_t>       filters;
        std::vector<link_t>         links;
        link_info_t                 linkInfo;
        symbol_table_t              symbolTable;
        std::vector<attribute_t>    attributes;
        link_info_t                 attributeInfo;
        bool                        groupInfo;
        bool                        sharedDatatype;

    private:

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef struct {
            uint64_t    pos;
            uint64_t    length;
        } block_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                readObjHdr          (std::vector<block_t>& continuations);
        void                readObjHdrV1        (std::vector<block_t>& continuations);
        void                readContinuation    (const block_t& block, std::vector<block_t>& continuations);
        void                readMessages        (uint64_t pos, uint64_t end, uint8_t hdr_flags, std::vector<block_t>& continuations);
        void                readMessagesV1      (uint64_t pos, uint64_t end, std::vector<block_t>& continuations);
        void                readMessage         (const message_t& msg, std::vector<block_t>& continuations);

        int                 readFillValueMsg    (uint64_t pos, int type);
        int                 readDataLayoutMsg   (uint64_t pos);
        int                 readFilterMsg       (uint64_t pos);
        int                 readLinkInfoMsg     (uint64_t pos, link_info_t* info, bool attributes);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        H5Context*          context;
        uint8_t             hdrFlags;
        int                 messageIndex;
};

#endif  /* __h5_object_header__ */
