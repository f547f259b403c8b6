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

#include "H5Context.h"
#include "StreamConfig.h"
#include "EventLib.h"

using H5Stream::ByteRangeSource;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *  - source and controller must remain in scope for the life of the context
 *----------------------------------------------------------------------------*/
H5Context::H5Context (ByteRangeSource* _source, H5Concurrency* _controller):
    offsetSize      (8),
    lengthSize      (8),
    endOfFile       (0),
    source          (_source),
    ioController    (_controller),
    lineSize        (MAX(StreamConfig::settings().metadataLineSize, 512L)),
    ioRetries       (static_cast<int>(MAX(StreamConfig::settings().ioRetries, 0L))),
    ioBackoffMs     (StreamConfig::settings().ioBackoffMs),
    cacheMiss       (0),
    cacheReplace    (0)
{
    budgetLine.pos = 0;
}

/*----------------------------------------------------------------------------
 * prefetch - reads the start of the file in a single request
 *----------------------------------------------------------------------------*/
void H5Context::prefetch (int64_t budget)
{
    if(budget <= 0) return;

    std::vector<uint8_t> data(budget);
    const int64_t bytes = fetch(data.data(), budget, 0);
    data.resize(bytes);
    ioController->countMetadata(bytes);

    mut.lock();
    {
        budgetLine.data.swap(data);
        budgetLine.pos = 0;
    }
    mut.unlock();

    mlog(DEBUG, "Prefetched %ld bytes of metadata from %s", (long)bytes, source->origin());
}

/*----------------------------------------------------------------------------
 * ioRequest - cached metadata read
 *----------------------------------------------------------------------------*/
void H5Context::ioRequest (uint64_t* pos, int64_t size, uint8_t* buffer)
{
    const uint64_t file_position = *pos;

    if(!checkCache(file_position, size, buffer))
    {
        /* Read a full line starting at the requested position */
        cache_entry_t entry;
        const int64_t read_size = MAX(size, lineSize);
        entry.data.resize(read_size);
        entry.pos = file_position;

        const int64_t bytes = fetch(entry.data.data(), read_size, file_position);
        if(bytes < size)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "truncated metadata: read %ld of %ld bytes at 0x%lx", (long)bytes, (long)size, (unsigned long)file_position);
        }
        entry.data.resize(bytes);
        memcpy(buffer, entry.data.data(), size);
        ioController->countMetadata(bytes);

        mut.lock();
        {
            cacheMiss++;

            /* Replace Oldest Entry */
            if(cache.size() >= IO_CACHE_ENTRIES && !cacheOrder.empty())
            {
                cache.erase(cacheOrder.front());
                cacheOrder.pop_front();
                cacheReplace++;
            }

            /* Add Cache Entry; a concurrent reader may have added it first */
            if(cache.emplace(file_position, std::move(entry)).second)
            {
                cacheOrder.push_back(file_position);
            }
        }
        mut.unlock();
    }

    *pos += size;
}

/*----------------------------------------------------------------------------
 * readField
 *----------------------------------------------------------------------------*/
uint64_t H5Context::readField (int64_t size, uint64_t* pos)
{
    uint64_t value = 0;
    uint8_t data_ptr[8];

    if(size <= 0 || size > 8)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid field size %ld at 0x%lx", (long)size, (unsigned long)*pos);
    }

    ioRequest(pos, size, data_ptr);

    /* Little endian of any width */
    for(int64_t i = size - 1; i >= 0; i--)
    {
        value = (value << 8) | data_ptr[i];
    }

    return value;
}

/*----------------------------------------------------------------------------
 * readByteArray
 *----------------------------------------------------------------------------*/
void H5Context::readByteArray (uint8_t* data, int64_t size, uint64_t* pos)
{
    if(size <= 0) return;
    ioRequest(pos, size, data);
}

/*----------------------------------------------------------------------------
 * readRange - uncached read of exactly size bytes
 *----------------------------------------------------------------------------*/
void H5Context::readRange (uint8_t* data, int64_t size, uint64_t pos)
{
    const int64_t bytes = fetch(data, size, pos);
    if(bytes < size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "truncated data: read %ld of %ld bytes at 0x%lx", (long)bytes, (long)size, (unsigned long)pos);
    }
}

/*----------------------------------------------------------------------------
 * verifyChecksum - lookup3 over [start, end) against the value stored at end
 *----------------------------------------------------------------------------*/
void H5Context::verifyChecksum (uint64_t start, uint64_t end, const char* structure)
{
    if(end < start)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "%s at 0x%lx ends before it starts at 0x%lx", structure, (unsigned long)start, (unsigned long)end);
    }
    checkExtent(start, end - start, structure);

    std::vector<uint8_t> block(end - start);
    uint64_t pos = start;
    readByteArray(block.data(), block.size(), &pos);
    const uint32_t checksum = static_cast<uint32_t>(readField(4, &pos));
    const uint32_t computed = H5Stream::checksumLookup3(block.data(), block.size(), 0);
    if(checksum != computed)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "%s checksum mismatch at 0x%lx: 0x%08X != 0x%08X", structure, (unsigned long)end, checksum, computed);
    }
}

/*----------------------------------------------------------------------------
 * checkExtent - a structure must lie inside the end of file address
 *----------------------------------------------------------------------------*/
void H5Context::checkExtent (uint64_t address, uint64_t size, const char* structure) const
{
    if(endOfFile == 0) return;

    if(address > endOfFile || size > endOfFile - address)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "%s of %lu bytes at 0x%lx extends past the end of file at 0x%lx",
                               structure, (unsigned long)size, (unsigned long)address, (unsigned long)endOfFile);
    }
}

/*----------------------------------------------------------------------------
 * setSizes
 *----------------------------------------------------------------------------*/
void H5Context::setSizes (int offset_size, int length_size)
{
    offsetSize = offset_size;
    lengthSize = length_size;
}

/*----------------------------------------------------------------------------
 * isUndefined - the undefined address is all ones at the offset width
 *----------------------------------------------------------------------------*/
bool H5Context::isUndefined (uint64_t address) const
{
    const uint64_t undefined = 0xFFFFFFFFFFFFFFFFllu >> (64 - (offsetSize * 8));
    return address == undefined;
}

/*----------------------------------------------------------------------------
 * name
 *----------------------------------------------------------------------------*/
const char* H5Context::name (void) const
{
    return source->origin();
}

/*----------------------------------------------------------------------------
 * controller
 *----------------------------------------------------------------------------*/
H5Concurrency* H5Context::controller (void) const
{
    return ioController;
}

/*----------------------------------------------------------------------------
 * fetch
 *----------------------------------------------------------------------------*/
int64_t H5Context::fetch (uint8_t* data, int64_t size, uint64_t pos)
{
    const int attempts = ioRetries + 1;
    for(int attempt = 1; attempt <= attempts; attempt++)
    {
        ioController->acquire();
        const int64_t start = OsApi::time(OsApi::CPU_CLK);
        try
        {
            const int64_t bytes = source->read(data, size, pos);
            ioController->release(bytes, OsApi::time(OsApi::CPU_CLK) - start, true);
            return bytes;
        }
        catch(const RunTimeException& e)
        {
            ioController->release(0, OsApi::time(OsApi::CPU_CLK) - start, false);

            /* Only transport failures are worth repeating */
            if(e.code() != RTE_IO_ERROR && e.code() != RTE_TIMEOUT) throw;
            if(attempt == attempts)
            {
                throw RunTimeException(ERROR, RTE_IO_ERROR, "read of %ld bytes at 0x%lx from %s failed after %d attempts: %s", (long)size, (unsigned long)pos, source->origin(), attempts, e.what());
            }

            const int64_t backoff_ms = ioBackoffMs << (attempt - 1);
            mlog(INFO, "Attempt %d of %d to read 0x%lx from %s failed, retrying in %ldms: %s", attempt, attempts, (unsigned long)pos, source->origin(), (long)backoff_ms, e.what());
            OsApi::sleep(backoff_ms / 1000.0);
        }
    }

    throw RunTimeException(ERROR, RTE_IO_ERROR, "no attempts made to read 0x%lx from %s", (unsigned long)pos, source->origin());
}

/*----------------------------------------------------------------------------
 * checkCache
 *----------------------------------------------------------------------------*/
bool H5Context::checkCache (uint64_t pos, int64_t size, uint8_t* buffer)
{
    bool cached = false;

    mut.lock();
    {
        /* Budget Line */
        if(pos >= budgetLine.pos && (pos + size) <= (budgetLine.pos + budgetLine.data.size()))
        {
            memcpy(buffer, &budgetLine.data[pos - budgetLine.pos], size);
            cached = true;
        }
        else
        {
            /* Nearest line starting at or under the position, then the one before it */
            cache_t::iterator iter = cache.upper_bound(pos);
            for(int i = 0; i < 2 && iter != cache.begin() && !cached; i++)
            {
                --iter;
                const cache_entry_t& entry = iter->second;
                if(pos >= entry.pos && (pos + size) <= (entry.pos + entry.data.size()))
                {
                    memcpy(buffer, &entry.data[pos - entry.pos], size);
                    cached = true;
                }
            }
        }
    }
    mut.unlock();

    return cached;
}
