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

#include "H5ChunkIndex.h"
#include "H5Dense.h"
#include "EventLib.h"

#include <set>

/******************************************************************************
 * LOCAL TYPES
 ******************************************************************************/

typedef struct {
    H5ChunkIndex*                               index;
    std::map<uint64_t, H5ChunkIndex::chunk_t>*  chunks;
    bool                                        filtered;
    int                                         sizeLength;     // filtered records only
    uint64_t                                    chunkBytes;
    std::vector<uint64_t>                       coord;
} record_parms_t;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5ChunkIndex::H5ChunkIndex (H5Context* _context, const H5ObjectHeader& header):
    context         (_context),
    headerAddress   (header.address),
    layout          (header.layout),
    rank            (header.dataspace.rank),
    state           (NOT_LOADED),
    errorCode       (RTE_INFO)
{
    if(layout.layout != H5Stream::CHUNKED_LAYOUT)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "dataset at 0x%lx is not chunked", (unsigned long)headerAddress);
    }

    if(static_cast<int>(layout.chunkDims.size()) != rank)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "dataset at 0x%lx has %d chunk dimensions for a rank %d dataspace",
                               (unsigned long)headerAddress, (int)layout.chunkDims.size(), rank);
    }

    for(int d = 0; d < rank; d++)
    {
        const uint64_t dim = header.dataspace.dims[d];
        gridDims.push_back((dim + layout.chunkDims[d] - 1) / layout.chunkDims[d]);
    }
}

/*----------------------------------------------------------------------------
 * load - builds the index once
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::load (void)
{
    cond.lock();
    {
        while(state == LOADING)
        {
            cond.wait(0, IO_PEND);
        }

        if(state == LOADED)
        {
            cond.unlock();
            return;
        }

        if(state == UNSUPPORTED || state == FAILED)
        {
            const int code = errorCode;
            const std::string msg = error;
            cond.unlock();
            throw RunTimeException(ERROR, code, "%s", msg.c_str());
        }

        state = LOADING;
    }
    cond.unlock();

    /* Build Outside the Lock */
    std::map<uint64_t, chunk_t> built;
    int code = RTE_INFO;
    std::string msg;
    try
    {
        build(&built);
    }
    catch(const RunTimeException& e)
    {
        code = e.code();
        msg = e.what();
    }

    cond.lock();
    {
        if(code == RTE_INFO)
        {
            chunks.swap(built);
            state = LOADED;
        }
        else if(code == RTE_IO_ERROR || code == RTE_TIMEOUT)
        {
            state = NOT_LOADED;
        }
        else
        {
            state = (code == RTE_UNSUPPORTED_FORMAT) ? UNSUPPORTED : FAILED;
            errorCode = code;
            error = msg;
        }
        cond.signal(0, Cond::NOTIFY_ALL);
    }
    cond.unlock();

    if(code != RTE_INFO)
    {
        throw RunTimeException(ERROR, code, "%s", msg.c_str());
    }

    mlog(DEBUG, "Loaded %s chunk index of dataset 0x%lx from %s", H5Stream::index2str(layout.indexKind), (unsigned long)headerAddress, context->name());
}

/*----------------------------------------------------------------------------
 * find - false when the chunk is not allocated
 *----------------------------------------------------------------------------*/
bool H5ChunkIndex::find (const std::vector<uint64_t>& coord, chunk_t* chunk)
{
    load();

    if(static_cast<int>(coord.size()) != rank)
    {
        throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "chunk coordinate of rank %d for rank %d dataset", (int)coord.size(), rank);
    }

    for(int d = 0; d < rank; d++)
    {
        if(coord[d] >= gridDims[d])
        {
            throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "chunk coordinate %lu outside grid of %lu in dimension %d", (unsigned long)coord[d], (unsigned long)gridDims[d], d);
        }
    }

    const uint64_t index = linearIndex(coord);

    /* Implicit chunks are laid out back to back */
    if(layout.indexKind == H5Stream::IMPLICIT_INDEX)
    {
        if(context->isUndefined(layout.address)) return false;
        chunk->address = layout.address + (index * chunkBytes());
        chunk->size = chunkBytes();
        chunk->filterMask = 0;
        return true;
    }

    bool found = false;
    cond.lock();
    {
        std::map<uint64_t, chunk_t>::const_iterator iter = chunks.find(index);
        if(iter != chunks.end())
        {
            *chunk = iter->second;
            found = true;
        }
    }
    cond.unlock();

    return found;
}

/*----------------------------------------------------------------------------
 * allocated - number of stored chunks
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkIndex::allocated (void)
{
    load();

    if(layout.indexKind == H5Stream::IMPLICIT_INDEX)
    {
        return context->isUndefined(layout.address) ? 0 : gridSize();
    }

    cond.lock();
    const uint64_t count = chunks.size();
    cond.unlock();

    return count;
}

/*----------------------------------------------------------------------------
 * status
 *----------------------------------------------------------------------------*/
H5ChunkIndex::state_t H5ChunkIndex::status (void)
{
    cond.lock();
    const state_t current = state;
    cond.unlock();

    return current;
}

/*----------------------------------------------------------------------------
 * chunkBytes - uncompressed size of one chunk
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkIndex::chunkBytes (void) const
{
    uint64_t bytes = layout.elementSize;
    for(uint64_t dim: layout.chunkDims) bytes *= dim;
    return bytes;
}

/*----------------------------------------------------------------------------
 * grid
 *----------------------------------------------------------------------------*/
const std::vector<uint64_t>& H5ChunkIndex::grid (void) const
{
    return gridDims;
}

/*----------------------------------------------------------------------------
 * gridSize
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkIndex::gridSize (void) const
{
    uint64_t size = 1;
    for(uint64_t dim: gridDims) size *= dim;
    return size;
}

/*----------------------------------------------------------------------------
 * state2str
 *----------------------------------------------------------------------------*/
const char* H5ChunkIndex::state2str (state_t index_state)
{
    switch(index_state)
    {
        case NOT_LOADED:    return "NOT_LOADED";
        case LOADING:       return "LOADING";
        case LOADED:        return "LOADED";
        case UNSUPPORTED:   return "UNSUPPORTED";
        case FAILED:        return "FAILED";
        default:            return "UNKNOWN";
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * build
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::build (std::map<uint64_t, chunk_t>* result)
{
    switch(layout.indexKind)
    {
        case H5Stream::BTREE_V1_INDEX:
        {
            readBTreeV1(result);
            break;
        }

        case H5Stream::BTREE_V2_INDEX:
        {
            readBTreeV2(result);
            break;
        }

        case H5Stream::FIXED_ARRAY_INDEX:
        {
            readFixedArray(result);
            break;
        }

        case H5Stream::SINGLE_CHUNK_INDEX:
        {
            if(context->isUndefined(layout.address)) break;
            const bool filtered = (layout.flags & 0x02) != 0;
            const chunk_t chunk = {layout.address, filtered ? layout.filteredSize : chunkBytes(), filtered ? layout.filterMask : 0};
            addChunk(result, std::vector<uint64_t>(rank, 0), chunk);
            break;
        }

        case H5Stream::IMPLICIT_INDEX:
        {
            break; // computed on lookup
        }

        case H5Stream::EXTENSIBLE_ARRAY_INDEX:
        {
            throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "extensible array chunk index of dataset 0x%lx", (unsigned long)headerAddress);
        }

        default:
        {
            throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "dataset 0x%lx has no chunk index", (unsigned long)headerAddress);
        }
    }
}

/*----------------------------------------------------------------------------
 * readBTreeV1 - entries carry rank + 1 offsets, the last for the element
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::readBTreeV1 (std::map<uint64_t, chunk_t>* result)
{
    if(context->isUndefined(layout.address)) return; // nothing written yet

    const int num_offsets = rank + 1;
    std::set<uint64_t> visited;
    std::vector<uint64_t> worklist;
    worklist.push_back(layout.address);

    while(!worklist.empty())
    {
        const uint64_t node = worklist.back();
        worklist.pop_back();

        if(!visited.insert(node).second)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk b-tree node 0x%lx referenced twice", (unsigned long)node);
        }

        if(visited.size() > static_cast<size_t>(MAX_TREE_NODES))
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk b-tree 0x%lx exceeds %d nodes", (unsigned long)layout.address, MAX_TREE_NODES);
        }

        uint64_t pos = node;
        const uint32_t signature = (uint32_t)context->readField(4, &pos);
        if(signature != H5_TREE_SIGNATURE_LE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk b-tree signature at 0x%lx: 0x%llX", (unsigned long)node, (unsigned long long)signature);
        }

        const uint8_t node_type = (uint8_t)context->readField(1, &pos);
        if(node_type != CHUNK_NODE_TYPE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "b-tree at 0x%lx is not a chunk node: %d", (unsigned long)node, (int)node_type);
        }

        const uint8_t node_level = (uint8_t)context->readField(1, &pos);
        const uint16_t entries_used = (uint16_t)context->readField(2, &pos);
        pos += context->offsetSize * 2; // siblings

        if(H5STREAM_VERBOSE)
        {
            print2term("\n----------------\n");
            print2term("Chunk B-Tree Node: 0x%lx\n", (unsigned long)node);
            print2term("----------------\n");
            print2term("Node Level:                                                      %d\n", (int)node_level);
            print2term("Entries Used:                                                    %d\n", (int)entries_used);
        }

        for(int e = 0; e < entries_used; e++)
        {
            chunk_t chunk;
            chunk.size = context->readField(4, &pos);
            chunk.filterMask = (uint32_t)context->readField(4, &pos);

            std::vector<uint64_t> coord(rank);
            for(int d = 0; d < num_offsets; d++)
            {
                const uint64_t offset = context->readField(8, &pos);
                if(d == rank) break; // element offset
                if(offset % layout.chunkDims[d] != 0)
                {
                    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk offset %lu in node 0x%lx not aligned to chunk dimension %lu",
                                           (unsigned long)offset, (unsigned long)node, (unsigned long)layout.chunkDims[d]);
                }
                coord[d] = offset / layout.chunkDims[d];
            }

            const uint64_t child = context->readField(context->offsetSize, &pos);
            if(node_level == 0)
            {
                chunk.address = child;
                addChunk(result, coord, chunk);
            }
            else
            {
                worklist.push_back(child);
            }
        }
    }
}

/*----------------------------------------------------------------------------
 * readBTreeV2 - chunk records of type 10 (unfiltered) and 11 (filtered)
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::readBTreeV2 (std::map<uint64_t, chunk_t>* result)
{
    if(context->isUndefined(layout.address)) return;

    H5BTreeV2 tree(context, layout.address);

    record_parms_t parms = {this, result, false, 0, chunkBytes(), std::vector<uint64_t>(rank)};
    if(tree.type == H5BTreeV2::FILTERED_CHUNK_RECORD)
    {
        parms.filtered = true;
        parms.sizeLength = tree.recordSize - context->offsetSize - 4 - (rank * 8);
        if(parms.sizeLength < 1 || parms.sizeLength > 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "filtered chunk record size %u invalid for rank %d", (unsigned)tree.recordSize, rank);
        }
    }
    else if(tree.type == H5BTreeV2::CHUNK_RECORD)
    {
        if(tree.recordSize != context->offsetSize + (rank * 8))
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk record size %u invalid for rank %d", (unsigned)tree.recordSize, rank);
        }
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "b-tree 0x%lx of record type %d is not a chunk index", (unsigned long)layout.address, tree.type);
    }

    tree.forEachRecord([](H5Context* ctx, uint64_t record_pos, void* parm) -> bool {
        record_parms_t* p = static_cast<record_parms_t*>(parm);

        uint64_t pos = record_pos;
        chunk_t chunk;
        chunk.address = ctx->readField(ctx->offsetSize, &pos);
        chunk.size = p->chunkBytes;
        chunk.filterMask = 0;
        if(p->filtered)
        {
            chunk.size = ctx->readField(p->sizeLength, &pos);
            chunk.filterMask = (uint32_t)ctx->readField(4, &pos);
        }

        /* Scaled offsets are already chunk coordinates */
        for(int d = 0; d < p->index->rank; d++)
        {
            p->coord[d] = ctx->readField(8, &pos);
        }

        p->index->addChunk(p->chunks, p->coord, chunk);
        return true;
    }, &parms);
}

/*----------------------------------------------------------------------------
 * readFixedArray - non-paged fixed arrays, one element per grid cell
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::readFixedArray (std::map<uint64_t, chunk_t>* result)
{
    if(context->isUndefined(layout.address)) return;

    uint64_t pos = layout.address;
    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_FAHD_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fixed array header signature at 0x%lx: 0x%llX", (unsigned long)layout.address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    const uint8_t client_id = (uint8_t)context->readField(1, &pos);
    const uint8_t entry_size = (uint8_t)context->readField(1, &pos);
    const uint8_t page_bits = (uint8_t)context->readField(1, &pos);
    const uint64_t max_entries = context->readField(context->lengthSize, &pos);
    const uint64_t data_block = context->readField(context->offsetSize, &pos);
    context->verifyChecksum(layout.address, pos, "fixed array header");

    if(version != 0 || client_id > 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fixed array header at 0x%lx: version %d, client %d", (unsigned long)layout.address, (int)version, (int)client_id);
    }

    if(page_bits < 64 && max_entries > (1ULL << page_bits))
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "paged fixed array at 0x%lx: %lu entries, %d page bits", (unsigned long)layout.address, (unsigned long)max_entries, (int)page_bits);
    }

    const bool filtered = client_id == 1;
    const int size_length = entry_size - context->offsetSize - 4;
    if(( filtered && (size_length < 1 || size_length > 8)) ||
       (!filtered && entry_size != context->offsetSize))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fixed array entry size %d at 0x%lx", (int)entry_size, (unsigned long)layout.address);
    }

    if(context->isUndefined(data_block)) return;

    /* Data Block */
    pos = data_block;
    const uint32_t block_signature = (uint32_t)context->readField(4, &pos);
    if(block_signature != H5_FADB_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fixed array data block signature at 0x%lx: 0x%llX", (unsigned long)data_block, (unsigned long long)block_signature);
    }
    pos += 2 + context->offsetSize; // version, client id, header address

    const uint64_t grid_size = gridSize();
    std::vector<uint64_t> coord(rank);
    for(uint64_t i = 0; i < max_entries; i++)
    {
        chunk_t chunk;
        chunk.address = context->readField(context->offsetSize, &pos);
        chunk.size = chunkBytes();
        chunk.filterMask = 0;
        if(filtered)
        {
            chunk.size = context->readField(size_length, &pos);
            chunk.filterMask = (uint32_t)context->readField(4, &pos);
        }

        if(context->isUndefined(chunk.address) || i >= grid_size) continue;

        /* Row major grid position */
        uint64_t remainder = i;
        for(int d = rank - 1; d >= 0; d--)
        {
            coord[d] = remainder % gridDims[d];
            remainder /= gridDims[d];
        }
        addChunk(result, coord, chunk);
    }

    context->verifyChecksum(data_block, pos, "fixed array data block");
}

/*----------------------------------------------------------------------------
 * addChunk
 *----------------------------------------------------------------------------*/
void H5ChunkIndex::addChunk (std::map<uint64_t, chunk_t>* result, const std::vector<uint64_t>& coord, const chunk_t& chunk)
{
    for(int d = 0; d < rank; d++)
    {
        if(coord[d] >= gridDims[d])
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk coordinate %lu outside grid of %lu in dimension %d of dataset 0x%lx",
                                   (unsigned long)coord[d], (unsigned long)gridDims[d], d, (unsigned long)headerAddress);
        }
    }

    if(!result->emplace(linearIndex(coord), chunk).second)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "chunk at 0x%lx indexed twice in dataset 0x%lx", (unsigned long)chunk.address, (unsigned long)headerAddress);
    }
}

/*----------------------------------------------------------------------------
 * linearIndex - row major position in the chunk grid
 *----------------------------------------------------------------------------*/
uint64_t H5ChunkIndex::linearIndex (const std::vector<uint64_t>& coord) const
{
    uint64_t index = 0;
    for(int d = 0; d < rank; d++)
    {
        index = (index * gridDims[d]) + coord[d];
    }
    return index;
}
