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

#include "H5Reader.h"
#include "H5Dense.h"
#include "StreamConfig.h"
#include "EventLib.h"

#include <cmath>
#include <cstring>
#include <deque>
#include <limits>

using H5Stream::H5Reader;
using H5Stream::TypedArray;
using H5Stream::DatasetDescriptor;
using H5Stream::SmallValue;
using H5Stream::AttributeValue;
using H5Stream::StreamingStats;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * getField - little endian field from a buffer
 *----------------------------------------------------------------------------*/
static uint64_t getField (const uint8_t* p, int size)
{
    uint64_t value = 0;
    for(int i = size - 1; i >= 0; i--)
    {
        value = (value << 8) | p[i];
    }
    return value;
}

/*----------------------------------------------------------------------------
 * elementCount - 1 for scalars, 0 for null dataspaces
 *----------------------------------------------------------------------------*/
static uint64_t elementCount (const H5ObjectHeader::dataspace_t& dataspace)
{
    if(dataspace.null) return 0;
    uint64_t count = 1;
    for(uint64_t dim: dataspace.dims) count *= dim;
    return count;
}

/*----------------------------------------------------------------------------
 * assembleChunk - copies the in-bounds part of a chunk into a full array
 *----------------------------------------------------------------------------*/
static void assembleChunk (const TypedArray& chunk, const std::vector<uint64_t>& chunk_dims, const std::vector<uint64_t>& origin, const std::vector<uint64_t>& shape, uint8_t* dst)
{
    const int rank = static_cast<int>(shape.size());
    const int last = rank - 1;
    const int esize = H5Stream::typeSize(chunk.dtype());

    if(origin[last] >= shape[last]) return;
    const uint64_t row_elements = MIN(chunk_dims[last], shape[last] - origin[last]);

    uint64_t rows = 1;
    for(int d = 0; d < last; d++) rows *= chunk_dims[d];

    for(uint64_t r = 0; r < rows; r++)
    {
        /* Dataset offset of this chunk row, skipping rows past the edge */
        uint64_t remainder = r;
        uint64_t offset = 0;
        bool inside = true;
        std::vector<uint64_t> index(last, 0);
        for(int d = last - 1; d >= 0; d--)
        {
            index[d] = remainder % chunk_dims[d];
            remainder /= chunk_dims[d];
        }
        for(int d = 0; d < last; d++)
        {
            const uint64_t c = origin[d] + index[d];
            if(c >= shape[d]) inside = false;
            offset = (offset * shape[d]) + c;
        }
        if(!inside) continue;
        offset = (offset * shape[last]) + origin[last];

        memcpy(&dst[offset * esize], &chunk.data()[r * chunk_dims[last] * esize], row_elements * esize);
    }
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *  - takes ownership of the source
 *----------------------------------------------------------------------------*/
H5Reader::H5Reader (ByteRangeSource* _source, int64_t metadata_budget):
    source      (_source),
    controller  (static_cast<int>(StreamConfig::settings().initialConcurrency), static_cast<int>(StreamConfig::settings().minConcurrency), static_cast<int>(StreamConfig::settings().maxConcurrency)),
    context     (_source, &controller),
    cache       (StreamConfig::settings().memoryCacheEntries, StreamConfig::settings().persistentCacheDir.c_str(), StreamConfig::settings().persistentCacheEntries),
    fetcher     (&context, &cache),
    sb          (),
    walker      (NULL),
    closed      (false)
{
    try
    {
        context.prefetch(metadata_budget);
        sb = H5Superblock::read(&context);
        walker = new H5GroupWalker(&context, sb.rootGroupAddress);
    }
    catch(const RunTimeException& e)
    {
        mlog(CRITICAL, "Failed to open %s: %s", source->origin(), e.what());
        delete source;
        throw;
    }

    mlog(INFO, "Opened %s: superblock v%d, root group at 0x%lx", source->origin(), sb.version, (unsigned long)sb.rootGroupAddress);
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
H5Reader::~H5Reader (void)
{
    fetcher.drain();
    delete walker;
    delete source;
}

/*----------------------------------------------------------------------------
 * listDatasets
 *----------------------------------------------------------------------------*/
std::vector<DatasetDescriptor> H5Reader::listDatasets (void)
{
    checkOpen();

    std::vector<H5GroupWalker::object_t> objects;
    walker->walk(&objects);

    std::vector<DatasetDescriptor> descriptors;
    for(const H5GroupWalker::object_t& object: objects)
    {
        if(object.header)
        {
            descriptors.push_back(describe(object.path, *object.header));
        }
        else
        {
            DatasetDescriptor descriptor;
            descriptor.path = object.path;
            descriptor.headerAddress = object.address;
            descriptor.readable = false;
            descriptor.errorCode = object.errorCode;
            descriptor.error = object.error;
            descriptors.push_back(descriptor);
        }
    }

    mlog(DEBUG, "Listed %ld datasets in %s", (long)descriptors.size(), source->origin());

    return descriptors;
}

/*----------------------------------------------------------------------------
 * readChunk
 *----------------------------------------------------------------------------*/
H5Reader::chunk_t H5Reader::readChunk (const char* id, uint64_t chunk_row, uint64_t chunk_col)
{
    const std::vector<uint64_t> coord = {chunk_row, chunk_col};
    return readChunk(id, coord);
}

/*----------------------------------------------------------------------------
 * readChunk - null when the chunk is not allocated
 *----------------------------------------------------------------------------*/
H5Reader::chunk_t H5Reader::readChunk (const char* id, const std::vector<uint64_t>& coord)
{
    checkOpen();

    const H5ChunkFetcher::dataset_t dataset = openDataset(id);
    if(!dataset.index)
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s has %s layout, not chunked", dataset.path.c_str(), H5Stream::layout2str(dataset.header->layout.layout));
    }

    return fetcher.read(dataset, coord);
}

/*----------------------------------------------------------------------------
 * readRegion
 *
 *  cells not covered by a stored chunk, outside the dataset, or in a chunk
 *  that failed to read are left at the sentinel
 *----------------------------------------------------------------------------*/
TypedArray H5Reader::readRegion (const char* id, uint64_t row, uint64_t col, uint64_t height, uint64_t width)
{
    checkOpen();

    const H5ChunkFetcher::dataset_t dataset = openDataset(id);
    const H5ObjectHeader& header = *dataset.header;

    if(header.dataspace.rank != 2)
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s has rank %d, region reads need 2 dimensions", dataset.path.c_str(), header.dataspace.rank);
    }

    if(header.datatype.dtype == H5Stream::INVALID_TYPE)
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s has unsupported %s datatype", dataset.path.c_str(), H5ObjectHeader::class2str(header.datatype.typeClass));
    }

    TypedArray region(header.datatype.dtype, height * width);
    fillSentinel(header, &region);
    if(region.empty()) return region;

    if(dataset.index)   regionFromChunks(dataset, row, col, height, width, &region);
    else                regionFromStorage(dataset, row, col, height, width, &region);

    return region;
}

/*----------------------------------------------------------------------------
 * readSmallDataset
 *----------------------------------------------------------------------------*/
SmallValue H5Reader::readSmallDataset (const char* id)
{
    checkOpen();

    const H5ChunkFetcher::dataset_t dataset = openDataset(id);
    const H5ObjectHeader& header = *dataset.header;

    const uint64_t elements = elementCount(header.dataspace);
    const uint64_t bytes = elements * header.datatype.size;
    if(bytes > static_cast<uint64_t>(StreamConfig::settings().smallDatasetLimit))
    {
        throw RunTimeException(ERROR, RTE_ERROR, "%s holds %lu bytes, over the small dataset limit of %ld",
                               dataset.path.c_str(), (unsigned long)bytes, StreamConfig::settings().smallDatasetLimit);
    }

    SmallValue value;

    if(dataset.index)
    {
        /* Chunks arrive decoded, so assemble the typed array directly */
        if(header.datatype.dtype == H5Stream::INVALID_TYPE)
        {
            throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "chunked %s values in %s", H5ObjectHeader::class2str(header.datatype.typeClass), dataset.path.c_str());
        }

        value.shape = header.dataspace.dims;
        value.array = TypedArray(header.datatype.dtype, elements);
        fillSentinel(header, &value.array);

        const std::vector<uint64_t>& grid = dataset.index->grid();
        const std::vector<uint64_t>& chunk_dims = header.layout.chunkDims;
        const int rank = static_cast<int>(grid.size());
        const uint64_t num_chunks = dataset.index->gridSize();

        std::vector<H5ChunkFetcher::future_t> futures;
        std::vector<std::vector<uint64_t>> origins;
        for(uint64_t n = 0; n < num_chunks && elements > 0; n++)
        {
            std::vector<uint64_t> coord(rank);
            uint64_t remainder = n;
            for(int d = rank - 1; d >= 0; d--)
            {
                coord[d] = remainder % grid[d];
                remainder /= grid[d];
            }

            std::vector<uint64_t> chunk_origin(rank);
            for(int d = 0; d < rank; d++) chunk_origin[d] = coord[d] * chunk_dims[d];

            futures.push_back(fetcher.request(dataset, coord));
            origins.push_back(chunk_origin);
        }

        for(size_t i = 0; i < futures.size(); i++)
        {
            const H5ChunkFetcher::result_t chunk = futures[i]->get();
            if(chunk) assembleChunk(*chunk, chunk_dims, origins[i], header.dataspace.dims, value.array.data());
        }
    }
    else
    {
        std::vector<uint8_t> raw;
        readStorage(dataset, elements, &raw);
        decodeValue(header.datatype, header.dataspace, raw, &value);
    }

    return value;
}

/*----------------------------------------------------------------------------
 * listAttributes
 *----------------------------------------------------------------------------*/
std::vector<AttributeValue> H5Reader::listAttributes (const char* path)
{
    checkOpen();

    const uint64_t address = walker->resolve(path);
    const H5GroupWalker::header_t object = walker->header(address);

    std::vector<H5ObjectHeader::attribute_t> attributes;
    walker->attributes(*object, &attributes);

    std::vector<AttributeValue> values;
    for(const H5ObjectHeader::attribute_t& attribute: attributes)
    {
        try
        {
            std::vector<uint8_t> raw(attribute.dataSize);
            uint64_t pos = attribute.dataPos;
            context.readByteArray(raw.data(), raw.size(), &pos);

            AttributeValue value;
            value.name = attribute.name;
            decodeValue(attribute.datatype, attribute.dataspace, raw, &value.value);
            values.push_back(value);
        }
        catch(const RunTimeException& e)
        {
            mlog(WARNING, "Skipping attribute %s of %s: %s", attribute.name.c_str(), path, e.what());
        }
    }

    return values;
}

/*----------------------------------------------------------------------------
 * getStreamingStats
 *----------------------------------------------------------------------------*/
StreamingStats H5Reader::getStreamingStats (void)
{
    return controller.snapshot();
}

/*----------------------------------------------------------------------------
 * close - releases cached state; later calls fail
 *----------------------------------------------------------------------------*/
void H5Reader::close (void)
{
    if(closed) return;

    fetcher.drain();
    cache.clear();

    datasetMut.lock();
    {
        datasets.clear();
        closed = true;
    }
    datasetMut.unlock();

    const StreamingStats stats = controller.snapshot();
    mlog(INFO, "Closed %s: %ld bytes in %ld requests, %ld chunks, %ld cache hits, %ld failures",
         source->origin(), (long)stats.totalBytes, (long)stats.totalRequests, (long)stats.chunksLoaded, (long)stats.cacheHits, (long)stats.failedRequests);

    controller.reset();
}

/*----------------------------------------------------------------------------
 * superblock
 *----------------------------------------------------------------------------*/
const H5Superblock& H5Reader::superblock (void) const
{
    return sb;
}

/*----------------------------------------------------------------------------
 * origin
 *----------------------------------------------------------------------------*/
const char* H5Reader::origin (void) const
{
    return source->origin();
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * checkOpen
 *----------------------------------------------------------------------------*/
void H5Reader::checkOpen (void) const
{
    if(closed)
    {
        throw RunTimeException(ERROR, RTE_ERROR, "reader for %s is closed", source->origin());
    }
}

/*----------------------------------------------------------------------------
 * openDataset - resolves once, later calls share the header and index
 *----------------------------------------------------------------------------*/
H5ChunkFetcher::dataset_t H5Reader::openDataset (const char* id)
{
    const std::string path = normalize(id);

    datasetMut.lock();
    {
        std::map<std::string, H5ChunkFetcher::dataset_t>::const_iterator iter = datasets.find(path);
        if(iter != datasets.end())
        {
            H5ChunkFetcher::dataset_t dataset = iter->second;
            datasetMut.unlock();
            return dataset;
        }
    }
    datasetMut.unlock();

    const uint64_t address = walker->resolve(path.c_str());
    H5ChunkFetcher::dataset_t dataset;
    dataset.path = path;
    dataset.header = walker->header(address);
    if(!dataset.header->isDataset())
    {
        throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "%s is not a dataset", path.c_str());
    }

    if(dataset.header->layout.layout == H5Stream::CHUNKED_LAYOUT)
    {
        dataset.index = std::make_shared<H5ChunkIndex>(&context, *dataset.header);
    }
    else if(dataset.header->layout.layout == H5Stream::VIRTUAL_LAYOUT)
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s has a virtual layout", path.c_str());
    }

    /* First one stored wins */
    datasetMut.lock();
    {
        std::pair<std::map<std::string, H5ChunkFetcher::dataset_t>::iterator, bool> entry = datasets.insert(std::make_pair(path, dataset));
        dataset = entry.first->second;
    }
    datasetMut.unlock();

    return dataset;
}

/*----------------------------------------------------------------------------
 * describe
 *----------------------------------------------------------------------------*/
DatasetDescriptor H5Reader::describe (const std::string& path, const H5ObjectHeader& header) const
{
    DatasetDescriptor descriptor;
    descriptor.path = path;
    descriptor.shape = header.dataspace.dims;
    descriptor.dtype = header.datatype.dtype;
    descriptor.typeSize = header.datatype.size;
    descriptor.isString = (header.datatype.typeClass == H5ObjectHeader::STRING_TYPE) || header.datatype.vlenString;
    descriptor.layout = header.layout.layout;
    descriptor.indexKind = header.layout.indexKind;
    descriptor.chunked = (header.layout.layout == H5Stream::CHUNKED_LAYOUT);
    descriptor.headerAddress = header.address;
    if(header.fill.defined) descriptor.fillValue = header.fill.value;
    for(const H5ObjectHeader::filter_t& filter: header.filters) descriptor.filters.push_back(filter.id);

    if(descriptor.chunked)
    {
        descriptor.chunkDims = header.layout.chunkDims;
        descriptor.numChunks = 1;
        for(size_t d = 0; d < descriptor.shape.size() && d < descriptor.chunkDims.size(); d++)
        {
            descriptor.numChunks *= (descriptor.shape[d] + descriptor.chunkDims[d] - 1) / descriptor.chunkDims[d];
        }
    }

    /* Flag what no read of this dataset could succeed on */
    if(descriptor.dtype == H5Stream::INVALID_TYPE && !descriptor.isString)
    {
        descriptor.readable = false;
        descriptor.errorCode = RTE_UNSUPPORTED_FORMAT;
        descriptor.error = std::string("unsupported ") + H5ObjectHeader::class2str(header.datatype.typeClass) + " datatype";
    }
    else if(descriptor.layout == H5Stream::VIRTUAL_LAYOUT)
    {
        descriptor.readable = false;
        descriptor.errorCode = RTE_UNSUPPORTED_FORMAT;
        descriptor.error = "virtual layout";
    }
    else if(descriptor.indexKind == H5Stream::EXTENSIBLE_ARRAY_INDEX)
    {
        descriptor.readable = false;
        descriptor.errorCode = RTE_UNSUPPORTED_FORMAT;
        descriptor.error = "extensible array chunk index";
    }
    else
    {
        for(int filter: descriptor.filters)
        {
            if(filter != H5Stream::DEFLATE_FILTER && filter != H5Stream::SHUFFLE_FILTER && filter != H5Stream::FLETCHER32_FILTER)
            {
                descriptor.readable = false;
                descriptor.errorCode = RTE_UNSUPPORTED_FORMAT;
                descriptor.error = std::string(H5Stream::filter2str(filter)) + " filter";
                break;
            }
        }
    }

    return descriptor;
}

/*----------------------------------------------------------------------------
 * readStorage - raw bytes of a contiguous or compact dataset
 *----------------------------------------------------------------------------*/
void H5Reader::readStorage (const H5ChunkFetcher::dataset_t& dataset, uint64_t elements, std::vector<uint8_t>* raw)
{
    const H5ObjectHeader& header = *dataset.header;
    const H5ObjectHeader::layout_t& layout = header.layout;
    const uint64_t bytes = elements * header.datatype.size;

    raw->assign(bytes, 0);
    if(bytes == 0) return;

    if(layout.layout == H5Stream::COMPACT_LAYOUT)
    {
        if(layout.size < bytes)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "compact data of %s holds %lu bytes, expected %lu", dataset.path.c_str(), (unsigned long)layout.size, (unsigned long)bytes);
        }
        uint64_t pos = layout.address;
        context.readByteArray(raw->data(), bytes, &pos);
    }
    else if(layout.layout == H5Stream::CONTIGUOUS_LAYOUT)
    {
        if(context.isUndefined(layout.address))
        {
            /* Never written */
            if(header.fill.defined && header.fill.value.size() == static_cast<size_t>(header.datatype.size))
            {
                for(uint64_t i = 0; i < elements; i++)
                {
                    memcpy(&(*raw)[i * header.datatype.size], header.fill.value.data(), header.datatype.size);
                }
            }
            return;
        }
        context.readRange(raw->data(), bytes, layout.address);
    }
    else
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s layout of %s", H5Stream::layout2str(layout.layout), dataset.path.c_str());
    }
}

/*----------------------------------------------------------------------------
 * regionFromChunks
 *----------------------------------------------------------------------------*/
void H5Reader::regionFromChunks (const H5ChunkFetcher::dataset_t& dataset, uint64_t row, uint64_t col, uint64_t height, uint64_t width, TypedArray* region)
{
    const H5ObjectHeader& header = *dataset.header;
    const std::vector<uint64_t>& shape = header.dataspace.dims;
    const std::vector<uint64_t>& chunk_dims = header.layout.chunkDims;
    const std::vector<uint64_t>& grid = dataset.index->grid();
    const int esize = H5Stream::typeSize(region->dtype());

    /* Clip to the dataset */
    if(row >= shape[0] || col >= shape[1]) return;
    const uint64_t row_end = MIN(row + height, shape[0]);
    const uint64_t col_end = MIN(col + width, shape[1]);

    /* Index errors are not gaps */
    dataset.index->load();

    typedef struct {
        uint64_t                    chunkRow;
        uint64_t                    chunkCol;
        H5ChunkFetcher::future_t    future;
    } pending_chunk_t;

    std::vector<pending_chunk_t> chunks;
    const uint64_t last_chunk_row = MIN((row_end - 1) / chunk_dims[0], grid[0] - 1);
    const uint64_t last_chunk_col = MIN((col_end - 1) / chunk_dims[1], grid[1] - 1);
    for(uint64_t cr = row / chunk_dims[0]; cr <= last_chunk_row; cr++)
    {
        for(uint64_t cc = col / chunk_dims[1]; cc <= last_chunk_col; cc++)
        {
            const std::vector<uint64_t> coord = {cr, cc};
            chunks.push_back({cr, cc, fetcher.request(dataset, coord)});
        }
    }

    for(const pending_chunk_t& pc: chunks)
    {
        H5ChunkFetcher::result_t chunk;
        try
        {
            chunk = pc.future->get();
        }
        catch(const RunTimeException& e)
        {
            mlog(WARNING, "Leaving gap for chunk (%lu,%lu) of %s: %s", (unsigned long)pc.chunkRow, (unsigned long)pc.chunkCol, dataset.path.c_str(), e.what());
            controller.countFailure();
            continue;
        }

        if(!chunk) continue; // not allocated

        /* Overlap of the chunk and the clipped region */
        const uint64_t chunk_row0 = pc.chunkRow * chunk_dims[0];
        const uint64_t chunk_col0 = pc.chunkCol * chunk_dims[1];
        const uint64_t r0 = MAX(row, chunk_row0);
        const uint64_t r1 = MIN(row_end, chunk_row0 + chunk_dims[0]);
        const uint64_t c0 = MAX(col, chunk_col0);
        const uint64_t c1 = MIN(col_end, chunk_col0 + chunk_dims[1]);
        if(r0 >= r1 || c0 >= c1) continue;

        for(uint64_t r = r0; r < r1; r++)
        {
            const uint64_t src = ((r - chunk_row0) * chunk_dims[1]) + (c0 - chunk_col0);
            const uint64_t dst = ((r - row) * width) + (c0 - col);
            memcpy(&region->data()[dst * esize], &chunk->data()[src * esize], (c1 - c0) * esize);
        }
    }
}

/*----------------------------------------------------------------------------
 * regionFromStorage - one range per row of a contiguous dataset
 *----------------------------------------------------------------------------*/
void H5Reader::regionFromStorage (const H5ChunkFetcher::dataset_t& dataset, uint64_t row, uint64_t col, uint64_t height, uint64_t width, TypedArray* region)
{
    const H5ObjectHeader& header = *dataset.header;
    const H5ObjectHeader::layout_t& layout = header.layout;
    const std::vector<uint64_t>& shape = header.dataspace.dims;
    const int esize = H5Stream::typeSize(region->dtype());

    if(row >= shape[0] || col >= shape[1]) return;
    const uint64_t row_end = MIN(row + height, shape[0]);
    const uint64_t col_end = MIN(col + width, shape[1]);
    const uint64_t row_bytes = (col_end - col) * esize;

    if(layout.layout == H5Stream::COMPACT_LAYOUT)
    {
        std::vector<uint8_t> raw;
        readStorage(dataset, elementCount(header.dataspace), &raw);
        for(uint64_t r = row; r < row_end; r++)
        {
            uint8_t* dst = &region->data()[((r - row) * width) * esize];
            memcpy(dst, &raw[((r * shape[1]) + col) * esize], row_bytes);
            if(header.datatype.bigEndian) H5ChunkFetcher::swapBytes(dst, col_end - col, esize);
        }
    }
    else if(layout.layout == H5Stream::CONTIGUOUS_LAYOUT)
    {
        if(context.isUndefined(layout.address)) return;

        for(uint64_t r = row; r < row_end; r++)
        {
            const uint64_t pos = layout.address + (((r * shape[1]) + col) * esize);
            uint8_t* dst = &region->data()[((r - row) * width) * esize];
            try
            {
                context.readRange(dst, row_bytes, pos);
                if(header.datatype.bigEndian) H5ChunkFetcher::swapBytes(dst, col_end - col, esize);
            }
            catch(const RunTimeException& e)
            {
                mlog(WARNING, "Leaving gap for row %lu of %s: %s", (unsigned long)r, dataset.path.c_str(), e.what());
                controller.countFailure();

                /* Partial reads leave garbage behind */
                TypedArray sentinel(region->dtype(), 1);
                fillSentinel(header, &sentinel);
                for(uint64_t c = 0; c < (col_end - col); c++)
                {
                    memcpy(&dst[c * esize], sentinel.data(), esize);
                }
            }
        }
    }
    else
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s layout of %s", H5Stream::layout2str(layout.layout), dataset.path.c_str());
    }
}

/*----------------------------------------------------------------------------
 * decodeValue - raw file bytes to numbers or strings
 *----------------------------------------------------------------------------*/
void H5Reader::decodeValue (const H5ObjectHeader::datatype_t& datatype, const H5ObjectHeader::dataspace_t& dataspace, const std::vector<uint8_t>& raw, SmallValue* value)
{
    const uint64_t elements = elementCount(dataspace);
    value->shape = dataspace.dims;

    if(datatype.typeClass == H5ObjectHeader::STRING_TYPE)
    {
        value->isString = true;
        if(raw.size() < elements * datatype.size)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "string data of %ld bytes, expected %lu", (long)raw.size(), (unsigned long)(elements * datatype.size));
        }

        for(uint64_t i = 0; i < elements; i++)
        {
            const char* start = reinterpret_cast<const char*>(&raw[i * datatype.size]);
            value->strings.push_back(std::string(start, strnlen(start, datatype.size)));
        }
    }
    else if(datatype.typeClass == H5ObjectHeader::VARIABLE_LENGTH_TYPE && datatype.vlenString)
    {
        /* Each element: length, global heap collection, object index */
        value->isString = true;
        const int element_size = 4 + context.offsetSize + 4;
        if(raw.size() < elements * element_size)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "variable length data of %ld bytes, expected %lu", (long)raw.size(), (unsigned long)(elements * element_size));
        }

        for(uint64_t i = 0; i < elements; i++)
        {
            const uint8_t* element = &raw[i * element_size];
            const uint64_t length = getField(element, 4);
            const uint64_t collection = getField(element + 4, context.offsetSize);
            const uint32_t index = static_cast<uint32_t>(getField(element + 4 + context.offsetSize, 4));

            std::string str;
            if(length > 0 && collection != 0 && !context.isUndefined(collection))
            {
                str = H5GlobalHeap::readObject(&context, collection, index);
                if(str.size() > length) str.resize(length);
            }
            value->strings.push_back(str);
        }
    }
    else if(datatype.dtype != H5Stream::INVALID_TYPE)
    {
        value->array = TypedArray(datatype.dtype, elements);
        if(raw.size() < static_cast<size_t>(value->array.bytes()))
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "numeric data of %ld bytes, expected %ld", (long)raw.size(), (long)value->array.bytes());
        }

        memcpy(value->array.data(), raw.data(), value->array.bytes());
        if(datatype.bigEndian) H5ChunkFetcher::swapBytes(value->array.data(), elements, datatype.size);
    }
    else
    {
        throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s values of %d bytes", H5ObjectHeader::class2str(datatype.typeClass), datatype.size);
    }
}

/*----------------------------------------------------------------------------
 * normalize - one leading slash, no empty segments
 *----------------------------------------------------------------------------*/
std::string H5Reader::normalize (const char* id)
{
    std::deque<std::string> segments;
    H5GroupWalker::splitPath(id, &segments);

    std::string path;
    for(const std::string& segment: segments) path += "/" + segment;
    if(path.empty()) path = "/";

    return path;
}

/*----------------------------------------------------------------------------
 * fillSentinel - fill value when defined, else NaN or zero
 *----------------------------------------------------------------------------*/
void H5Reader::fillSentinel (const H5ObjectHeader& header, TypedArray* array)
{
    const int esize = H5Stream::typeSize(array->dtype());

    if(header.fill.defined && header.fill.value.size() == static_cast<size_t>(esize))
    {
        TypedArray element(array->dtype(), 1);
        memcpy(element.data(), header.fill.value.data(), esize);
        if(header.datatype.bigEndian) H5ChunkFetcher::swapBytes(element.data(), 1, esize);
        array->fill(element.data(), esize);
    }
    else if(H5Stream::isFloat(array->dtype()))
    {
        array->fill(std::numeric_limits<double>::quiet_NaN());
    }
    else
    {
        array->fill(0.0);
    }
}
