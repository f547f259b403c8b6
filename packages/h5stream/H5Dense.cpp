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

#include "H5Dense.h"

/******************************************************************************
 * H5 FRACTAL HEAP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5FractalHeap::H5FractalHeap (H5Context* _context, uint64_t _address):
    address (_address),
    context (_context)
{
    uint64_t pos = address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_FRHP_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap version at 0x%lx: %d", (unsigned long)address, (int)version);
    }

    /* Read Fractal Heap Header */
    heapIdLength                        = (uint16_t)context->readField(2, &pos); // Heap ID Length
    const uint16_t  io_filter_len       = (uint16_t)context->readField(2, &pos); // I/O Filters' Encoded Length
    const uint8_t   flags               =  (uint8_t)context->readField(1, &pos); // Flags
    const uint32_t  max_size_mg_obj     = (uint32_t)context->readField(4, &pos); // Maximum Size of Managed Objects
    pos += context->lengthSize;                                                  // Next Huge Object ID
    pos += context->offsetSize;                                                  // v2 B-tree Address of Huge Objects
    pos += context->lengthSize;                                                  // Amount of Free Space in Managed Blocks
    pos += context->offsetSize;                                                  // Address of Managed Block Free Space Manager
    pos += context->lengthSize * 3;                                              // Managed Space, Allocated Managed Space, Allocation Iterator
    const uint64_t  mg_objs             = context->readField(context->lengthSize, &pos); // Number of Managed Objects in Heap
    pos += context->lengthSize * 4;                                              // Huge and Tiny Object Sizes and Counts
    tableWidth                          = (uint16_t)context->readField(2, &pos); // Table Width
    startingBlockSize                   = context->readField(context->lengthSize, &pos); // Starting Block Size
    maxDirectBlockSize                  = context->readField(context->lengthSize, &pos); // Maximum Direct Block Size
    maxHeapSize                         = (uint16_t)context->readField(2, &pos); // Maximum Heap Size
    const uint16_t  start_num_rows      = (uint16_t)context->readField(2, &pos); // Starting # of Rows in Root Indirect Block
    rootBlockAddress                    = context->readField(context->offsetSize, &pos); // Address of Root Block
    currNumRows                         = (uint16_t)context->readField(2, &pos); // Current # of Rows in Root Indirect Block

    if(io_filter_len > 0)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "filtered fractal heap at 0x%lx", (unsigned long)address);
    }

    context->verifyChecksum(address, pos, "fractal heap header");

    if(tableWidth == 0 || startingBlockSize == 0 || maxDirectBlockSize < startingBlockSize)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid doubling table in heap 0x%lx: width %d, start %lu, max %lu",
                               (unsigned long)address, (int)tableWidth, (unsigned long)startingBlockSize, (unsigned long)maxDirectBlockSize);
    }

    /* Derived Sizes */
    blockOffsetSize     = (maxHeapSize + 7) / 8;
    heapOffsetSize      = (maxHeapSize + 7) / 8;
    const int max_dblk_offset_size = (H5Stream::highestBit(maxDirectBlockSize) + 7) / 8;
    heapLengthSize      = MIN(max_dblk_offset_size, (H5Stream::highestBit(max_size_mg_obj) / 8) + 1);
    firstRowBits        = H5Stream::highestBit(startingBlockSize) + H5Stream::highestBit(tableWidth);
    maxDirectRows       = (H5Stream::highestBit(maxDirectBlockSize) - H5Stream::highestBit(startingBlockSize)) + 2;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Fractal Heap: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Heap ID Length:                                                  %lu\n", (unsigned long)heapIdLength);
        print2term("Flags:                                                           0x%lx\n", (unsigned long)flags);
        print2term("Number of Managed Objects in Heap:                               %lu\n", (unsigned long)mg_objs);
        print2term("Table Width:                                                     %lu\n", (unsigned long)tableWidth);
        print2term("Starting Block Size:                                             %lu\n", (unsigned long)startingBlockSize);
        print2term("Maximum Direct Block Size:                                       %lu\n", (unsigned long)maxDirectBlockSize);
        print2term("Maximum Heap Size:                                               %lu\n", (unsigned long)maxHeapSize);
        print2term("Starting # of Rows in Root Indirect Block:                       %lu\n", (unsigned long)start_num_rows);
        print2term("Address of Root Block:                                           0x%lx\n", (unsigned long)rootBlockAddress);
        print2term("Current # of Rows in Root Indirect Block:                        %lu\n", (unsigned long)currNumRows);
    }
    else
    {
        (void)flags;
        (void)mg_objs;
        (void)start_num_rows;
    }
}

/*----------------------------------------------------------------------------
 * locate - file position and size of a managed object
 *----------------------------------------------------------------------------*/
void H5FractalHeap::locate (const uint8_t* id, int id_size, uint64_t* pos, uint64_t* size)
{
    static const int MAX_HEAP_DEPTH = 64;

    if(id_size < 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "empty heap ID for heap 0x%lx", (unsigned long)address);
    }

    const uint8_t id_flags = id[0];
    if((id_flags & ID_VERSION_MASK) != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap ID version in heap 0x%lx: 0x%02X", (unsigned long)address, id_flags);
    }

    const uint8_t id_type = id_flags & ID_TYPE_MASK;
    if(id_type == ID_TYPE_HUGE)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "huge objects in heap 0x%lx", (unsigned long)address);
    }
    else if(id_type == ID_TYPE_TINY)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "tiny objects in heap 0x%lx", (unsigned long)address);
    }
    else if(id_type != ID_TYPE_MANAGED)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid heap ID type in heap 0x%lx: 0x%02X", (unsigned long)address, id_flags);
    }

    if(1 + heapOffsetSize + heapLengthSize > id_size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "heap ID of %d bytes too short for heap 0x%lx", id_size, (unsigned long)address);
    }

    /* Decode Offset and Length */
    uint64_t obj_off = 0;
    uint64_t obj_len = 0;
    for(int i = heapOffsetSize - 1; i >= 0; i--) obj_off = (obj_off << 8) | id[1 + i];
    for(int i = heapLengthSize - 1; i >= 0; i--) obj_len = (obj_len << 8) | id[1 + heapOffsetSize + i];

    /* Root Direct Block */
    if(currNumRows == 0)
    {
        *pos = rootBlockAddress + obj_off;
        *size = obj_len;
        return;
    }

    /* Walk Indirect Blocks Down to the Direct Block */
    uint64_t iblock = rootBlockAddress;
    int nrows = currNumRows;
    uint64_t off = obj_off;
    for(int level = 0; level < MAX_HEAP_DEPTH; level++)
    {
        int row;
        uint64_t col;
        if(off < (startingBlockSize * tableWidth))
        {
            row = 0;
            col = off / startingBlockSize;
        }
        else
        {
            const int high_bit = H5Stream::highestBit(off);
            row = (high_bit - firstRowBits) + 1;
            col = (off - (1ULL << high_bit)) / rowBlockSize(row);
        }

        if(row >= nrows || col >= tableWidth)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "heap offset 0x%lx outside indirect block 0x%lx", (unsigned long)obj_off, (unsigned long)iblock);
        }

        uint64_t entry_pos;
        entryPosition(iblock, (row * tableWidth) + static_cast<int>(col), &entry_pos);
        const uint64_t child = context->readField(context->offsetSize, &entry_pos);
        if(context->isUndefined(child))
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "heap offset 0x%lx in unallocated block of heap 0x%lx", (unsigned long)obj_off, (unsigned long)address);
        }

        const uint64_t child_off = off - (rowOffset(row) + (col * rowBlockSize(row)));
        if(row < maxDirectRows)
        {
            uint64_t sig_pos = child;
            const uint32_t signature = (uint32_t)context->readField(4, &sig_pos);
            if(signature != H5_FHDB_SIGNATURE_LE)
            {
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid direct block signature at 0x%lx: 0x%llX", (unsigned long)child, (unsigned long long)signature);
            }

            *pos = child + child_off;
            *size = obj_len;
            return;
        }

        nrows = (H5Stream::highestBit(rowBlockSize(row)) - firstRowBits) + 1;
        off = child_off;
        iblock = child;
    }

    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "heap 0x%lx nested deeper than %d indirect blocks", (unsigned long)address, MAX_HEAP_DEPTH);
}

/*----------------------------------------------------------------------------
 * rowOffset
 *----------------------------------------------------------------------------*/
uint64_t H5FractalHeap::rowOffset (int row) const
{
    if(row == 0) return 0;
    return (startingBlockSize * tableWidth) << (row - 1);
}

/*----------------------------------------------------------------------------
 * rowBlockSize
 *----------------------------------------------------------------------------*/
uint64_t H5FractalHeap::rowBlockSize (int row) const
{
    if(row == 0) return startingBlockSize;
    return startingBlockSize << (row - 1);
}

/*----------------------------------------------------------------------------
 * entryPosition - unfiltered heaps carry one address per entry
 *----------------------------------------------------------------------------*/
int H5FractalHeap::entryPosition (uint64_t iblock, int entry, uint64_t* pos) const
{
    uint64_t sig_pos = iblock;
    const uint32_t signature = (uint32_t)context->readField(4, &sig_pos);
    if(signature != H5_FHIB_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid indirect block signature at 0x%lx: 0x%llX", (unsigned long)iblock, (unsigned long long)signature);
    }

    /* signature, version, heap header address, block offset */
    *pos = iblock + 5 + context->offsetSize + blockOffsetSize + (static_cast<uint64_t>(entry) * context->offsetSize);
    return entry;
}

/******************************************************************************
 * H5 BTREE V2 METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5BTreeV2::H5BTreeV2 (H5Context* _context, uint64_t _address):
    address (_address),
    context (_context)
{
    uint64_t pos = address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_BTHD_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree header signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree header version at 0x%lx: %d", (unsigned long)address, (int)version);
    }

    type            = (int)context->readField(1, &pos);
    nodeSize        = (uint32_t)context->readField(4, &pos);
    recordSize      = (uint16_t)context->readField(2, &pos);
    depth           = (uint16_t)context->readField(2, &pos);
    pos += 2; // split and merge percents
    root.address    = context->readField(context->offsetSize, &pos);
    root.numRecords = (uint16_t)context->readField(2, &pos);
    root.depth      = depth;
    totalRecords    = context->readField(context->lengthSize, &pos);

    context->verifyChecksum(address, pos, "b-tree header");

    if(recordSize == 0 || nodeSize <= static_cast<uint32_t>(METADATA_PREFIX_SIZE))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree sizes at 0x%lx: node %u, record %u", (unsigned long)address, nodeSize, (unsigned)recordSize);
    }

    /* Node Geometry per Depth */
    node_info_t leaf_info;
    leaf_info.maxRecords = (nodeSize - METADATA_PREFIX_SIZE) / recordSize;
    leaf_info.cumMaxRecords = leaf_info.maxRecords;
    leaf_info.cumMaxRecordsSize = 0;
    nodeInfo.push_back(leaf_info);
    maxRecordsSize = limitEncSize(leaf_info.maxRecords);

    for(int d = 1; d <= depth; d++)
    {
        const uint64_t pointer_size = context->offsetSize + maxRecordsSize + (d > 1 ? nodeInfo[d - 1].cumMaxRecordsSize : 0);
        if(nodeSize < METADATA_PREFIX_SIZE + pointer_size)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "b-tree 0x%lx too deep for node size %u", (unsigned long)address, nodeSize);
        }

        node_info_t info;
        info.maxRecords = (nodeSize - (METADATA_PREFIX_SIZE + pointer_size)) / (recordSize + pointer_size);
        info.cumMaxRecords = ((info.maxRecords + 1) * nodeInfo[d - 1].cumMaxRecords) + info.maxRecords;
        info.cumMaxRecordsSize = limitEncSize(info.cumMaxRecords);
        nodeInfo.push_back(info);
    }

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("B-Tree V2 Header: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Type:                                                            %d\n", type);
        print2term("Node Size:                                                       %u\n", nodeSize);
        print2term("Record Size:                                                     %u\n", (unsigned)recordSize);
        print2term("Depth:                                                           %u\n", (unsigned)depth);
        print2term("Root Node Address:                                               0x%lx\n", (unsigned long)root.address);
        print2term("Number of Records in Root Node:                                  %u\n", (unsigned)root.numRecords);
        print2term("Total Number of Records:                                         %lu\n", (unsigned long)totalRecords);
    }
}

/*----------------------------------------------------------------------------
 * forEachRecord
 *----------------------------------------------------------------------------*/
void H5BTreeV2::forEachRecord (visitor_t visitor, void* parm)
{
    if(totalRecords == 0 || context->isUndefined(root.address)) return;

    std::vector<node_ptr_t> worklist;
    worklist.push_back(root);
    while(!worklist.empty())
    {
        const node_ptr_t node = worklist.back();
        worklist.pop_back();

        std::vector<node_ptr_t> children;
        const uint64_t records = readNode(node, &children);
        for(int r = 0; r < node.numRecords; r++)
        {
            if(!visitor(context, records + (static_cast<uint64_t>(r) * recordSize), parm)) return;
        }

        worklist.insert(worklist.end(), children.rbegin(), children.rend());
    }
}

/*----------------------------------------------------------------------------
 * findByHash - visits every name record whose hash matches
 *----------------------------------------------------------------------------*/
void H5BTreeV2::findByHash (uint32_t hash, visitor_t visitor, void* parm)
{
    int hash_offset;
    if(type == GROUP_NAME_RECORD)           hash_offset = 0;
    else if(type == ATTRIBUTE_NAME_RECORD)  hash_offset = 13; // heap id, flags, creation order
    else throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "b-tree 0x%lx of type %d is not a name index", (unsigned long)address, type);

    if(totalRecords == 0 || context->isUndefined(root.address)) return;

    std::vector<node_ptr_t> worklist;
    worklist.push_back(root);
    while(!worklist.empty())
    {
        const node_ptr_t node = worklist.back();
        worklist.pop_back();

        std::vector<node_ptr_t> children;
        const uint64_t records = readNode(node, &children);

        /* Records are ordered by hash; equal hashes may straddle children */
        bool passed = false;
        for(int r = 0; r < node.numRecords && !passed; r++)
        {
            const uint64_t record_pos = records + (static_cast<uint64_t>(r) * recordSize);
            uint64_t hash_pos = record_pos + hash_offset;
            const uint32_t record_hash = (uint32_t)context->readField(4, &hash_pos);
            if(record_hash < hash) continue;

            if(!children.empty()) worklist.push_back(children[r]);
            if(record_hash == hash)
            {
                if(!visitor(context, record_pos, parm)) return;
            }
            else
            {
                passed = true;
            }
        }

        if(!passed && !children.empty())
        {
            worklist.push_back(children.back());
        }
    }
}

/*----------------------------------------------------------------------------
 * readNode - returns position of first record, collects child pointers
 *----------------------------------------------------------------------------*/
uint64_t H5BTreeV2::readNode (const node_ptr_t& node, std::vector<node_ptr_t>* children)
{
    uint64_t pos = node.address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    const uint32_t expected = static_cast<uint32_t>((node.depth > 0) ? H5_BTIN_SIGNATURE_LE + 0 : H5_BTLF_SIGNATURE_LE + 0);
    if(signature != expected)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree %s signature at 0x%lx: 0x%llX", node.depth > 0 ? "internal node" : "leaf", (unsigned long)node.address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    const uint8_t node_type = (uint8_t)context->readField(1, &pos);
    if(version != 0 || node_type != type)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid b-tree node at 0x%lx: version %d, type %d", (unsigned long)node.address, (int)version, (int)node_type);
    }

    if(node.numRecords > nodeInfo[node.depth].maxRecords)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "b-tree node at 0x%lx holds %u records, max %lu", (unsigned long)node.address, (unsigned)node.numRecords, (unsigned long)nodeInfo[node.depth].maxRecords);
    }

    const uint64_t records = pos;
    pos += static_cast<uint64_t>(node.numRecords) * recordSize;

    /* Child Node Pointers */
    if(node.depth > 0)
    {
        for(int c = 0; c <= node.numRecords; c++)
        {
            node_ptr_t child;
            child.address = context->readField(context->offsetSize, &pos);
            child.numRecords = (uint16_t)context->readField(maxRecordsSize, &pos);
            child.depth = node.depth - 1;
            if(node.depth > 1) pos += nodeInfo[node.depth - 1].cumMaxRecordsSize; // total records below child
            children->push_back(child);
        }
    }

    context->verifyChecksum(node.address, pos, "b-tree node");

    return records;
}

/*----------------------------------------------------------------------------
 * limitEncSize - bytes needed to encode value
 *----------------------------------------------------------------------------*/
int H5BTreeV2::limitEncSize (uint64_t value)
{
    return (H5Stream::highestBit(value) / 8) + 1;
}

/******************************************************************************
 * H5 GLOBAL HEAP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readObject
 *----------------------------------------------------------------------------*/
std::string H5GlobalHeap::readObject (H5Context* context, uint64_t collection, uint32_t index)
{
    uint64_t pos = collection;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_GCOL_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid global heap signature at 0x%lx: 0x%llX", (unsigned long)collection, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    if(version != 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid global heap version at 0x%lx: %d", (unsigned long)collection, (int)version);
    }

    pos += 3; // reserved
    const uint64_t collection_size = context->readField(context->lengthSize, &pos);
    const uint64_t end = collection + collection_size;

    /* Objects are aligned to 8 bytes; index zero is the free space */
    while(pos + 8 + context->lengthSize <= end)
    {
        const uint16_t obj_index = (uint16_t)context->readField(2, &pos);
        pos += 6; // reference count and reserved
        const uint64_t obj_size = context->readField(context->lengthSize, &pos);
        if(obj_index == 0) break;

        if(obj_index == index)
        {
            if(pos + obj_size > end)
            {
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "global heap object %u overruns collection 0x%lx", index, (unsigned long)collection);
            }

            std::vector<char> data(obj_size);
            context->readByteArray(reinterpret_cast<uint8_t*>(data.data()), obj_size, &pos);
            return std::string(data.data(), obj_size);
        }

        pos += (obj_size + 7) & ~0x7ULL;
    }

    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "global heap object %u not found in collection 0x%lx", index, (unsigned long)collection);
}
