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

#ifndef __h5stream__
#define __h5stream__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <string>
#include <vector>

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#ifndef H5STREAM_MAXIMUM_DIMENSIONS
#define H5STREAM_MAXIMUM_DIMENSIONS 8
#endif

#ifndef H5STREAM_MAXIMUM_NAME_SIZE
#define H5STREAM_MAXIMUM_NAME_SIZE 1024
#endif

#ifndef H5STREAM_VERBOSE
#define H5STREAM_VERBOSE false
#endif

#ifndef H5STREAM_ERROR_CHECKING
#define H5STREAM_ERROR_CHECKING true
#endif

/******************************************************************************
 * H5STREAM NAMESPACE
 ******************************************************************************/

namespace H5Stream
{
    /*--------------------------------------------------------------------
     * Constants
     *--------------------------------------------------------------------*/

    const int MAX_NDIMS = H5STREAM_MAXIMUM_DIMENSIONS;
    const int MAX_LINK_HOPS = 16;

    /*--------------------------------------------------------------------
     * Typedefs
     *--------------------------------------------------------------------*/

    typedef enum {
        INVALID_TYPE    = 0,
        INT8            = 1,
        INT16           = 2,
        INT32           = 3,
        INT64           = 4,
        UINT8           = 5,
        UINT16          = 6,
        UINT32          = 7,
        UINT64          = 8,
        FLOAT16         = 9,
        FLOAT32         = 10,
        FLOAT64         = 11
    } DataType;

    typedef enum {
        COMPACT_LAYOUT      = 0,
        CONTIGUOUS_LAYOUT   = 1,
        CHUNKED_LAYOUT      = 2,
        VIRTUAL_LAYOUT      = 3,
        UNKNOWN_LAYOUT      = 4
    } layout_t;

    typedef enum {
        NO_INDEX                = 0,
        BTREE_V1_INDEX          = 1,
        SINGLE_CHUNK_INDEX      = 2,
        IMPLICIT_INDEX          = 3,
        FIXED_ARRAY_INDEX       = 4,
        EXTENSIBLE_ARRAY_INDEX  = 5,
        BTREE_V2_INDEX          = 6
    } index_t;

    typedef enum {
        INVALID_FILTER      = 0,
        DEFLATE_FILTER      = 1,
        SHUFFLE_FILTER      = 2,
        FLETCHER32_FILTER   = 3,
        SZIP_FILTER         = 4,
        NBIT_FILTER         = 5,
        SCALEOFFSET_FILTER  = 6
    } filter_t;

    /*--------------------------------------------------------------------
     * TypedArray
     *--------------------------------------------------------------------*/

    class TypedArray
    {
        public:

                            TypedArray      (void);
                            TypedArray      (DataType _dtype, uint64_t _elements);

            DataType        dtype           (void) const { return type; }
            uint64_t        size            (void) const { return elements; }
            int64_t         bytes           (void) const { return static_cast<int64_t>(buffer.size()); }
            bool            empty           (void) const { return elements == 0; }
            uint8_t*        data            (void) { return buffer.data(); }
            const uint8_t*  data            (void) const { return buffer.data(); }

            double          value           (uint64_t i) const;
            void            setValue        (uint64_t i, double v);
            void            fill            (double v);
            void            fill            (const uint8_t* pattern, int pattern_size);

            template<typename T>
            const T*        as              (void) const { return reinterpret_cast<const T*>(buffer.data()); }
            template<typename T>
            T*              as              (void) { return reinterpret_cast<T*>(buffer.data()); }

        private:

            DataType                type;
            uint64_t                elements;
            std::vector<uint8_t>    buffer;     // native byte order, float16 kept as raw half bits
    };

    /*--------------------------------------------------------------------
     * Descriptors
     *--------------------------------------------------------------------*/

    struct DatasetDescriptor
    {
        std::string             path;
        std::vector<uint64_t>   shape;
        DataType                dtype           {INVALID_TYPE};
        int                     typeSize        {0};
        bool                    isString        {false};
        bool                    chunked         {false};
        std::vector<uint64_t>   chunkDims;
        layout_t                layout          {UNKNOWN_LAYOUT};
        index_t                 indexKind       {NO_INDEX};
        std::vector<int>        filters;                        // pipeline order
        std::vector<uint8_t>    fillValue;                      // empty when undefined
        uint64_t                headerAddress   {0};
        uint64_t                numChunks       {0};
        bool                    readable        {true};
        int                     errorCode       {0};            // RTE_* when not readable
        std::string             error;
    };

    struct StreamingStats
    {
        double      currentMbps     {0.0};
        double      avgMbps         {0.0};
        int64_t     totalBytes      {0};
        int64_t     totalRequests   {0};
        int64_t     elapsedMs       {0};
        int         concurrency     {0};
        int         activeFetches   {0};
        int64_t     chunksLoaded    {0};
        int64_t     failedRequests  {0};
        int64_t     cacheHits       {0};
        int64_t     metadataBytes   {0};
    };

    struct SmallValue
    {
        std::vector<uint64_t>       shape;      // empty for scalars
        bool                        isString    {false};
        std::vector<std::string>    strings;
        TypedArray                  array;
    };

    struct AttributeValue
    {
        std::string                 name;
        SmallValue                  value;
    };

    /*--------------------------------------------------------------------
     * Reader Pool
     *--------------------------------------------------------------------*/

    typedef void (*job_func_t) (void* parm);

    void            init            (int num_threads);
    void            deinit          (void);
    bool            post            (job_func_t func, void* parm);
    int             poolSize        (void);

    /*--------------------------------------------------------------------
     * Utilities
     *--------------------------------------------------------------------*/

    const char*     type2str        (DataType dtype);
    const char*     layout2str      (layout_t layout);
    const char*     index2str       (index_t index);
    const char*     filter2str      (int filter);
    int             typeSize        (DataType dtype);
    bool            isFloat         (DataType dtype);
    float           halfToFloat     (uint16_t h);
    uint16_t        floatToHalf     (float f);
    uint32_t        checksumLookup3 (const uint8_t* data, uint64_t size, uint32_t initval);
    uint32_t        checksumFletcher32 (const uint8_t* data, uint64_t size);
    uint32_t        fnv1a           (const char* str);
    int             highestBit      (uint64_t value);
}

#endif  /* __h5stream__ */
