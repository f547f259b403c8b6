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

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "CurlRangeSource.h"
#include "StreamConfig.h"
#include "EventLib.h"

#include <curl/curl.h>
#include <strings.h>
#include <stdlib.h>

using H5Stream::CurlRangeSource;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
CurlRangeSource::CurlRangeSource (const char* _url):
    url(_url)
{
}

/*----------------------------------------------------------------------------
 * read
 *----------------------------------------------------------------------------*/
int64_t CurlRangeSource::read (uint8_t* data, int64_t size, uint64_t pos)
{
    return rangeRequest(data, size, pos, NULL);
}

/*----------------------------------------------------------------------------
 * origin
 *----------------------------------------------------------------------------*/
const char* CurlRangeSource::origin (void) const
{
    return url.c_str();
}

/*----------------------------------------------------------------------------
 * length
 *
 *  a single byte range request, with the total taken from the
 *  Content-Range response header: "bytes 0-0/<total>"
 *----------------------------------------------------------------------------*/
int64_t CurlRangeSource::length (void)
{
    uint8_t byte;
    std::string content_range;
    rangeRequest(&byte, 1, 0, &content_range);

    return parseContentRange(content_range.c_str());
}

/*----------------------------------------------------------------------------
 * isUrl
 *----------------------------------------------------------------------------*/
bool CurlRangeSource::isUrl (const char* path)
{
    return (strncasecmp(path, "http://", 7) == 0) || (strncasecmp(path, "https://", 8) == 0);
}

/*----------------------------------------------------------------------------
 * parseContentRange
 *
 *  "bytes <first>-<last>/<total>", returns -1 when the total is unknown
 *----------------------------------------------------------------------------*/
int64_t CurlRangeSource::parseContentRange (const char* content_range)
{
    const char* slash = strrchr(content_range, '/');
    if(!slash || slash[1] < '0' || slash[1] > '9') return -1;

    char* end = NULL;
    const long long total = strtoll(slash + 1, &end, 10);
    if(*end != '\0' && *end != ' ' && *end != '\r') return -1;

    return total;
}

/*----------------------------------------------------------------------------
 * checkResponse
 *
 *  maps a completed transfer to an error code; http_code is zero for
 *  protocols without a status line (file://)
 *----------------------------------------------------------------------------*/
void CurlRangeSource::checkResponse (const char* url, int res, long http_code, uint64_t pos)
{
    if(res == CURLE_OPERATION_TIMEDOUT)
    {
        throw RunTimeException(ERROR, RTE_IO_ERROR, "cURL request timed out for %s at 0x%lx", url, (unsigned long)pos);
    }
    else if(res == CURLE_WRITE_ERROR)
    {
        throw RunTimeException(ERROR, RTE_IO_ERROR, "%s returned more data than requested at 0x%lx", url, (unsigned long)pos);
    }
    else if(res == CURLE_FILE_COULDNT_READ_FILE || res == CURLE_REMOTE_FILE_NOT_FOUND)
    {
        throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "%s not found: %s", url, curl_easy_strerror(static_cast<CURLcode>(res)));
    }
    else if(res != CURLE_OK)
    {
        throw RunTimeException(ERROR, RTE_IO_ERROR, "cURL request failed (%d) for %s: %s", res, url, curl_easy_strerror(static_cast<CURLcode>(res)));
    }
    else if(http_code == 404 || http_code == 403)
    {
        throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "%s returned http error <%ld>", url, http_code);
    }
    else if(http_code == 200)
    {
        /* Server ignored the range; only usable when it covered exactly what was asked */
        if(pos != 0)
        {
            throw RunTimeException(ERROR, RTE_IO_ERROR, "%s does not honor range requests", url);
        }
    }
    else if(http_code != 206 && http_code != 0)
    {
        throw RunTimeException(ERROR, RTE_IO_ERROR, "%s returned http error <%ld>", url, http_code);
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * rangeRequest
 *----------------------------------------------------------------------------*/
int64_t CurlRangeSource::rangeRequest (uint8_t* data, int64_t size, uint64_t pos, std::string* content_range)
{
    const StreamConfig& config = StreamConfig::settings();

    /* Setup Buffer for Callback */
    fixed_data_t info = {
        .buffer = data,
        .size = size,
        .index = 0
    };

    /* Build Byte Range */
    char range[64];
    snprintf(range, sizeof(range), "%lu-%lu", (unsigned long)pos, (unsigned long)(pos + size - 1));

    /* Initialize cURL Request */
    CURL* curl = curl_easy_init();
    if(!curl)
    {
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "failed to initialize cURL request for %s", url.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_RANGE, range);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.readTimeout);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connectTimeout);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, config.lowSpeedTime);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, config.lowSpeedLimit);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, SSL_VERIFYPEER);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, SSL_VERIFYHOST);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteFixed);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &info);
    if(content_range)
    {
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curlHeader);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, content_range);
    }

    /* Perform Request */
    const CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if(res == CURLE_OK)
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    /* Clean Up cURL */
    curl_easy_cleanup(curl);

    /* Check Result */
    checkResponse(url.c_str(), res, http_code, pos);

    return info.index;
}

/*----------------------------------------------------------------------------
 * curlWriteFixed
 *
 *  a response larger than the buffer aborts the transfer with CURLE_WRITE_ERROR
 *----------------------------------------------------------------------------*/
size_t CurlRangeSource::curlWriteFixed (void* buffer, size_t size, size_t nmemb, void* userp)
{
    fixed_data_t* data = static_cast<fixed_data_t*>(userp);
    const size_t rsps_size = size * nmemb;
    const size_t bytes_available = data->size - data->index;
    if(rsps_size > bytes_available) return 0;
    memcpy(&data->buffer[data->index], buffer, rsps_size);
    data->index += rsps_size;
    return rsps_size;
}

/*----------------------------------------------------------------------------
 * curlHeader
 *----------------------------------------------------------------------------*/
size_t CurlRangeSource::curlHeader (char* buffer, size_t size, size_t nitems, void* userp)
{
    static const char* CONTENT_RANGE = "content-range:";
    const size_t len = size * nitems;
    const size_t key_len = strlen(CONTENT_RANGE);

    if(len > key_len && strncasecmp(buffer, CONTENT_RANGE, key_len) == 0)
    {
        std::string* content_range = static_cast<std::string*>(userp);
        content_range->assign(buffer + key_len, len - key_len);
        while(!content_range->empty() && (content_range->back() == '\r' || content_range->back() == '\n' || content_range->back() == ' '))
        {
            content_range->pop_back();
        }
    }

    return len;
}
