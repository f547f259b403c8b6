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

#include "H5ChunkFetcher.h"
#include "EventLib.h"

#include <zlib.h>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *  - context and cache must remain in scope for the life of the fetcher
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::H5ChunkFetcher (H5Context* _context, H5ChunkCache* _cache):
    context     (_context),
    cache       (_cache),
    outstanding (0)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::~H5ChunkFetcher (void)
{
    drain();
}

/*----------------------------------------------------------------------------
 * read - blocks until the chunk is available; null when not allocated
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::result_t H5ChunkFetcher::read (const dataset_t& dataset, const std::vector<uint64_t>& coord)
{
    future_t future = submit(dataset, coord, false);
    return future->get();
}

/*----------------------------------------------------------------------------
 * request - queues the fetch on the reader pool when one is running
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::future_t H5ChunkFetcher::request (const dataset_t& dataset, const std::vector<uint64_t>& coord)
{
    return submit(dataset, coord, true);
}

/*----------------------------------------------------------------------------
 * drain - waits for every fetch this object started
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::drain (void)
{
    pendingCond.lock();
    {
        while(outstanding > 0)
        {
            pendingCond.wait(0, IO_PEND);
        }
    }
    pendingCond.unlock();
}

/*----------------------------------------------------------------------------
 * applyFilters - undoes the pipeline in reverse order
 *
 *  bit i of the filter mask set means filter i was not applied
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::applyFilters (const std::vector<H5ObjectHeader::filter_t>& filters, uint32_t filter_mask, int type_size, uint64_t expected, std::vector<uint8_t>* buffer)
{
    for(int i = static_cast<int>(filters.size()) - 1; i >= 0; i--)
    {
        if(filter_mask & (1u << i)) continue;

        const H5ObjectHeader::filter_t& filter = filters[i];
        switch(filter.id)
        {
            case H5Stream::DEFLATE_FILTER:
            {
                std::vector<uint8_t> output;
                inflateChunk(*buffer, expected, &output);
                buffer->swap(output);
                break;
            }

            case H5Stream::SHUFFLE_FILTER:
            {
                /* Element size is the first client value, else the datatype */
                const int element_size = filter.parms.empty() ? type_size : static_cast<int>(filter.parms[0]);
                std::vector<uint8_t> output;
                shuffleChunk(*buffer, element_size, &output);
                buffer->swap(output);
                break;
            }

            case H5Stream::FLETCHER32_FILTER:
            {
                checkFletcher32(buffer);
                break;
            }

            default:
            {
                throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s filter (id %d) is not supported", H5Stream::filter2str(filter.id), filter.id);
            }
        }
    }
}

/*----------------------------------------------------------------------------
 * inflateChunk
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::inflateChunk (const std::vector<uint8_t>& input, uint64_t expected, std::vector<uint8_t>* output)
{
    int status;
    z_stream strm;

    /* Initialize z_stream State */
    strm.zalloc     = Z_NULL;
    strm.zfree      = Z_NULL;
    strm.opaque     = Z_NULL;
    strm.avail_in   = 0;
    strm.next_in    = Z_NULL;

    status = inflateInit(&strm);
    if(status != Z_OK)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "failed to initialize z_stream: %d", status);
    }

    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = const_cast<Bytef*>(input.data());

    /* Output grows when an earlier filter left more than one chunk of data */
    const uint64_t limit = filteredLimit(expected);
    output->resize(MAX(expected, static_cast<uint64_t>(64)));
    uint64_t produced = 0;
    do
    {
        if(produced == output->size())
        {
            if(output->size() >= limit)
            {
                inflateEnd(&strm);
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "z_stream inflates past %lu bytes for a chunk of %lu bytes", (unsigned long)limit, (unsigned long)expected);
            }
            output->resize(MIN(output->size() * 2, limit));
        }
        strm.avail_out = static_cast<uInt>(output->size() - produced);
        strm.next_out = output->data() + produced;
        status = inflate(&strm, Z_NO_FLUSH);
        produced = output->size() - strm.avail_out;
    } while(status == Z_OK);

    inflateEnd(&strm);

    if(status != Z_STREAM_END)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "failed to inflate entire z_stream: %d", status);
    }

    output->resize(produced);
}

/*----------------------------------------------------------------------------
 * shuffleChunk - byte planes back to interleaved elements
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::shuffleChunk (const std::vector<uint8_t>& input, int type_size, std::vector<uint8_t>* output)
{
    if(H5STREAM_ERROR_CHECKING)
    {
        if(type_size <= 0 || type_size > 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid data size to perform shuffle on: %d", type_size);
        }
    }

    output->resize(input.size());

    const uint64_t num_elements = input.size() / type_size;
    for(uint64_t element_index = 0; element_index < num_elements; element_index++)
    {
        for(int val_index = 0; val_index < type_size; val_index++)
        {
            const uint64_t src_index = (val_index * num_elements) + element_index;
            (*output)[(element_index * type_size) + val_index] = input[src_index];
        }
    }

    /* Leftover bytes are stored unshuffled */
    const uint64_t tail = num_elements * type_size;
    for(uint64_t i = tail; i < input.size(); i++)
    {
        (*output)[i] = input[i];
    }
}

/*----------------------------------------------------------------------------
 * checkFletcher32 - verifies and strips the trailing checksum
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::checkFletcher32 (std::vector<uint8_t>* buffer)
{
    if(buffer->size() < 4)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk of %ld bytes too small for fletcher32 checksum", (long)buffer->size());
    }

    const uint64_t data_size = buffer->size() - 4;
    const uint8_t* stored_bytes = &(*buffer)[data_size];
    const uint32_t stored = static_cast<uint32_t>(stored_bytes[0]) |
                            (static_cast<uint32_t>(stored_bytes[1]) << 8) |
                            (static_cast<uint32_t>(stored_bytes[2]) << 16) |
                            (static_cast<uint32_t>(stored_bytes[3]) << 24);

    const uint32_t computed = H5Stream::checksumFletcher32(buffer->data(), data_size);

    /* Older writers stored each 16-bit half byte swapped */
    const uint32_t reversed = ((computed & 0x00FF00FF) << 8) | ((computed & 0xFF00FF00) >> 8);

    if(stored != computed && stored != reversed)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "fletcher32 checksum mismatch: 0x%08X != 0x%08X", stored, computed);
    }

    buffer->resize(data_size);
}

/*----------------------------------------------------------------------------
 * swapBytes - big endian storage to native order
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::swapBytes (uint8_t* data, uint64_t elements, int type_size)
{
    switch(type_size)
    {
        case 2:
        {
            uint16_t* v = reinterpret_cast<uint16_t*>(data);
            for(uint64_t i = 0; i < elements; i++) v[i] = OsApi::swaps(v[i]);
            break;
        }

        case 4:
        {
            uint32_t* v = reinterpret_cast<uint32_t*>(data);
            for(uint64_t i = 0; i < elements; i++) v[i] = OsApi::swapl(v[i]);
            break;
        }

        case 8:
        {
            uint64_t* v = reinterpret_cast<uint64_t*>(data);
            for(uint64_t i = 0; i < elements; i++) v[i] = OsApi::swapll(v[i]);
            break;
        }

        default:
        {
            break; // single bytes
        }
    }
}

/*----------------------------------------------------------------------------
 * filteredLimit - largest stored or inflated size accepted for a chunk
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkFetcher::filteredLimit (uint64_t chunk_bytes)
{
    return (chunk_bytes * FILTER_EXPANSION) + FILTER_OVERHEAD;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * submit
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::future_t H5ChunkFetcher::submit (const dataset_t& dataset, const std::vector<uint64_t>& coord, bool async)
{
    const std::string key = H5ChunkCache::makeKey(context->name(), dataset.path.c_str(), coord);
    const H5Stream::DataType dtype = dataset.header->datatype.dtype;
    const uint64_t type_size = H5Stream::typeSize(dtype);
    const uint64_t elements = (type_size > 0) ? dataset.index->chunkBytes() / type_size : 0;

    future_t future;
    result_t cached;
    bool owner = false;

    pendingCond.lock();
    {
        std::map<std::string, future_t>::iterator iter = pending.find(key);
        if(iter != pending.end())
        {
            future = iter->second;
        }
        else
        {
            future = std::make_shared<H5Future>();
            if(type_size > 0) cached = cache->get(key, dtype, elements);
            if(!cached)
            {
                pending[key] = future;
                outstanding++;
                owner = true;
            }
        }
    }
    pendingCond.unlock();

    if(cached)
    {
        context->controller()->countCacheHit();
        future->finish(cached);
    }
    else if(owner)
    {
        job_t* job = new job_t {this, dataset, coord, key, future};
        if(!async || !H5Stream::post(fetchJob, job))
        {
            fetchJob(job);
        }
    }

    return future;
}

/*----------------------------------------------------------------------------
 * execute
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::execute (job_t* job)
{
    result_t result;
    int code = RTE_INFO;
    std::string msg;

    try
    {
        result = load(job->dataset, job->coord);
        if(result) cache->put(job->key, result);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        msg = e.what();
        mlog(DEBUG, "Failed to fetch chunk %s: %s", job->key.c_str(), e.what());
    }
    catch(const std::exception& e)
    {
        code = RTE_FORMAT_ERROR;
        msg = e.what();
        mlog(ERROR, "Failed to decode chunk %s: %s", job->key.c_str(), e.what());
    }

    /* Future outlives the fetcher through the job's reference */
    future_t future = job->future;

    pendingCond.lock();
    {
        pending.erase(job->key);
        outstanding--;
        pendingCond.signal(0, Cond::NOTIFY_ALL);
    }
    pendingCond.unlock();

    if(code == RTE_INFO)    future->finish(result);
    else                    future->fail(code, msg.c_str());
}

/*----------------------------------------------------------------------------
 * load - reads, filters and decodes one chunk
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::result_t H5ChunkFetcher::load (const dataset_t& dataset, const std::vector<uint64_t>& coord)
{
    const H5ObjectHeader& header = *dataset.header;

    H5ChunkIndex::chunk_t chunk;
    if(!dataset.index->find(coord, &chunk))
    {
        return nullptr;
    }

    const H5Stream::DataType dtype = header.datatype.dtype;
    if(dtype == H5Stream::INVALID_TYPE)
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s has unsupported %s datatype of %d bytes",
                               dataset.path.c_str(), H5ObjectHeader::class2str(header.datatype.typeClass), header.datatype.size);
    }

    /* Check Stored Size */
    const uint64_t chunk_bytes = dataset.index->chunkBytes();
    context->checkExtent(chunk.address, chunk.size, "chunk");
    if(header.filters.empty() && chunk.size != chunk_bytes)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unfiltered chunk at 0x%lx of %s stores %lu bytes, expected %lu",
                               (unsigned long)chunk.address, dataset.path.c_str(), (unsigned long)chunk.size, (unsigned long)chunk_bytes);
    }
    else if(chunk.size > filteredLimit(chunk_bytes))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "filtered chunk at 0x%lx of %s stores %lu bytes, more than %lu allowed for %lu chunk bytes",
                               (unsigned long)chunk.address, dataset.path.c_str(), (unsigned long)chunk.size, (unsigned long)filteredLimit(chunk_bytes), (unsigned long)chunk_bytes);
    }

    /* Read Stored Chunk */
    std::vector<uint8_t> buffer(chunk.size);
    context->readRange(buffer.data(), chunk.size, chunk.address);

    /* Undo Filters */
    applyFilters(header.filters, chunk.filterMask, H5Stream::typeSize(dtype), chunk_bytes, &buffer);
    if(buffer.size() < chunk_bytes)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk at 0x%lx of %s decoded to %ld bytes, expected %ld",
                               (unsigned long)chunk.address, dataset.path.c_str(), (long)buffer.size(), (long)chunk_bytes);
    }

    /* Decode Elements */
    const uint64_t elements = chunk_bytes / H5Stream::typeSize(dtype);
    std::shared_ptr<H5Stream::TypedArray> array = std::make_shared<H5Stream::TypedArray>(dtype, elements);
    memcpy(array->data(), buffer.data(), array->bytes());
    if(header.datatype.bigEndian) swapBytes(array->data(), elements, H5Stream::typeSize(dtype));

    context->controller()->countChunk();

    if(H5STREAM_VERBOSE)
    {
        print2term("Chunk %s [", dataset.path.c_str());
        for(size_t d = 0; d < coord.size(); d++) print2term("%s%lu", d ? "," : "", (unsigned long)coord[d]);
        print2term("]: %lu stored bytes at 0x%lx, %lu elements\n", (unsigned long)chunk.size, (unsigned long)chunk.address, (unsigned long)elements);
    }

    return array;
}

/*----------------------------------------------------------------------------
 * fetchJob
 *----------------------------------------------------------------------------*/
void H5ChunkFetcher::fetchJob (void* parm)
{
    job_t* job = static_cast<job_t*>(parm);
    job->fetcher->execute(job);
    delete job;
}
