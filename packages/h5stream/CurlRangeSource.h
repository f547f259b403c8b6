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

#ifndef __curl_range_source__
#define __curl_range_source__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "ByteRangeSource.h"

#include <string>

/******************************************************************************
 * CURL RANGE SOURCE CLASS
 ******************************************************************************/

namespace H5Stream
{
    class CurlRangeSource: public ByteRangeSource
    {
        public:

            /*--------------------------------------------------------------------
             * Constants
             *--------------------------------------------------------------------*/

            static const long SSL_VERIFYPEER = 1L;
            static const long SSL_VERIFYHOST = 2L;

            /*--------------------------------------------------------------------
             * Methods
             *--------------------------------------------------------------------*/

            explicit            CurlRangeSource     (const char* _url);
                                ~CurlRangeSource    (void) override = default;

            int64_t             read                (uint8_t* data, int64_t size, uint64_t pos) override;
            const char*         origin              (void) const override;
            int64_t             length              (void) override;

            static bool         isUrl               (const char* path);
            static int64_t      parseContentRange   (const char* content_range);
            static void         checkResponse       (const char* url, int res, long http_code, uint64_t pos);

        private:

            /*--------------------------------------------------------------------
             * Types
             *--------------------------------------------------------------------*/

            typedef struct {
                uint8_t*    buffer;
                int64_t     size;
                int64_t     index;
            } fixed_data_t;

            /*--------------------------------------------------------------------
             * Methods
             *--------------------------------------------------------------------*/

            int64_t             rangeRequest        (uint8_t* data, int64_t size, uint64_t pos, std::string* content_range);
            static size_t       curlWriteFixed      (void* buffer, size_t size, size_t nmemb, void* userp);
            static size_t       curlHeader          (char* buffer, size_t size, size_t nitems, void* userp);

            /*--------------------------------------------------------------------
             * Data
             *--------------------------------------------------------------------*/

            std::string         url;
    };
}

#endif  /* __curl_range_source__ */
