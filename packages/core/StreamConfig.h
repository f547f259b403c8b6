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

#ifndef __stream_config__
#define __stream_config__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <string>
#include <vector>

/******************************************************************************
 * SINGLETON CLASS
 ******************************************************************************/

class StreamConfig
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* CONFIG_TABLE_NAME;
        static const char* LOG_LEVEL_ENV;
        static const char* METADATA_BUDGET_ENV;
        static const char* CACHE_DIR_ENV;
        static const char* READER_THREADS_ENV;

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef enum {
            INTEGER_FIELD,
            STRING_FIELD,
            LEVEL_FIELD
        } field_type_t;

        typedef struct {
            const char*     key;
            field_type_t    type;
            void*           value;
        } field_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static StreamConfig& settings(void) {
            static StreamConfig instance;
            return instance;
        }

        // Delete copy and move semantics
        StreamConfig(const StreamConfig&) = delete;
        StreamConfig& operator=(const StreamConfig&) = delete;
        StreamConfig(StreamConfig&&) = delete;
        StreamConfig& operator=(StreamConfig&&) = delete;

        void    loadFile        (const char* path);
        void    loadEnvironment (void);
        void    reset           (void);
        void    dump            (void) const;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        event_level_t   logLevel                {INFO};
        long            metadataBudget          {0x100000};     // bytes read in one request at open
        long            metadataLineSize        {0x10000};      // bytes per metadata cache line after the budget
        long            memoryCacheEntries      {256};
        std::string     persistentCacheDir      {""};           // empty disables the persistent tier
        long            persistentCacheEntries  {2000};
        long            initialConcurrency      {4};
        long            minConcurrency          {1};
        long            maxConcurrency          {16};
        long            readerThreads           {8};
        long            ioRetries               {3};
        long            ioBackoffMs             {100};
        long            connectTimeout          {5};            // seconds
        long            readTimeout             {600};          // seconds
        long            lowSpeedLimit           {32768};        // bytes per second
        long            lowSpeedTime            {5};            // seconds
        long            smallDatasetLimit       {0x1000000};    // bytes

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                        StreamConfig    (void);
                        ~StreamConfig   (void) = default;

        const field_t*  findField       (const char* key) const;
        static void     setIfProvided   (long& field, const char* env);
        static void     setIfProvided   (std::string& field, const char* env);
        static void     setIfProvided   (event_level_t& field, const char* env);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::vector<field_t> fields;
};

#endif  /* __stream_config__ */
