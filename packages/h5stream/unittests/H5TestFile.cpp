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

#include "H5TestFile.h"
#include "H5Stream.h"

#include <algorithm>
#include <cstring>
#include <zlib.h>

/******************************************************************************
 * LOCAL DATA
 ******************************************************************************/

static const uint8_t H5_SIGNATURE[8] = {0x89, 0x48, 0x44, 0x46, 0x0D, 0x0A, 0x1A, 0x0A};

static const uint32_t BTREE_NODE_SIZE = 512;
static const uint16_t HEAP_MAX_SIZE_BITS = 32;
static const uint32_t HEAP_MAX_MANAGED_OBJECT = 4096;
static const uint64_t HEAP_MAX_DIRECT_BLOCK = 65536;
static const int FIXED_ARRAY_PAGE_BITS = 10;
static const int FILTERED_SIZE_LENGTH = 4;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * tag - four character signature
 *----------------------------------------------------------------------------*/
static void tag (H5TestFile::bytes_t* data, const char* signature)
{
    data->insert(data->end(), signature, signature + 4);
}

/*----------------------------------------------------------------------------
 * pad8 - zero pad to an eight byte boundary
 *----------------------------------------------------------------------------*/
static void pad8 (H5TestFile::bytes_t* data)
{
    while(data->size() % 8 != 0) data->push_back(0);
}

/*----------------------------------------------------------------------------
 * checksum - appends the lookup3 checksum of everything so far
 *----------------------------------------------------------------------------*/
static void checksum (H5TestFile::bytes_t* data)
{
    const uint32_t value = H5Stream::checksumLookup3(data->data(), data->size(), 0);
    H5TestFile::put(data, value, 4);
}

/*----------------------------------------------------------------------------
 * encodeMessages - version 2 message prefixes
 *----------------------------------------------------------------------------*/
static void encodeMessages (H5TestFile::bytes_t* data, const std::vector<H5TestFile::msg_t>& msgs, bool creation_order)
{
    for(const H5TestFile::msg_t& msg: msgs)
    {
        H5TestFile::put(data, msg.type, 1);
        H5TestFile::put(data, msg.body.size(), 2);
        H5TestFile::put(data, 0, 1);
        if(creation_order) H5TestFile::put(data, 0, 2);
        data->insert(data->end(), msg.body.begin(), msg.body.end());
    }
}

/*----------------------------------------------------------------------------
 * encodeMessagesV1 - version 1 prefixes, bodies padded to eight bytes
 *----------------------------------------------------------------------------*/
static void encodeMessagesV1 (H5TestFile::bytes_t* data, const std::vector<H5TestFile::msg_t>& msgs)
{
    for(const H5TestFile::msg_t& msg: msgs)
    {
        H5TestFile::bytes_t body = msg.body;
        pad8(&body);
        H5TestFile::put(data, msg.type, 2);
        H5TestFile::put(data, body.size(), 2);
        H5TestFile::put(data, 0, 4); // flags and reserved
        data->insert(data->end(), body.begin(), body.end());
    }
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5TestFile::H5TestFile (void):
    buffer(SUPERBLOCK_SPACE, 0)
{
}

/*----------------------------------------------------------------------------
 * append - eight byte aligned, returns the address
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::append (const bytes_t& data)
{
    pad8(&buffer);
    const uint64_t address = buffer.size();
    buffer.insert(buffer.end(), data.begin(), data.end());
    return address;
}

/*----------------------------------------------------------------------------
 * patch
 *----------------------------------------------------------------------------*/
void H5TestFile::patch (uint64_t pos, const bytes_t& data)
{
    if(pos + data.size() > buffer.size()) buffer.resize(pos + data.size(), 0);
    std::copy(data.begin(), data.end(), buffer.begin() + pos);
}

/*----------------------------------------------------------------------------
 * superblockV0
 *----------------------------------------------------------------------------*/
void H5TestFile::superblockV0 (uint64_t root)
{
    bytes_t sb(H5_SIGNATURE, H5_SIGNATURE + 8);
    put(&sb, 0, 1);             // superblock version
    put(&sb, 0, 1);             // free space version
    put(&sb, 0, 1);             // root group symbol table version
    put(&sb, 0, 1);             // reserved
    put(&sb, 0, 1);             // shared header version
    put(&sb, 8, 1);             // size of offsets
    put(&sb, 8, 1);             // size of lengths
    put(&sb, 0, 1);             // reserved
    put(&sb, 4, 2);             // group leaf node K
    put(&sb, 16, 2);            // group internal node K
    put(&sb, 0, 4);             // file consistency flags
    put(&sb, 0, 8);             // base address
    put(&sb, UNDEFINED, 8);     // free space info
    put(&sb, buffer.size(), 8); // end of file
    put(&sb, UNDEFINED, 8);     // driver info
    put(&sb, 0, 8);             // root link name offset
    put(&sb, root, 8);          // root object header
    put(&sb, 0, 4);             // cache type
    put(&sb, 0, 4);             // reserved
    sb.resize(SUPERBLOCK_SPACE, 0);
    patch(0, sb);
}

/*----------------------------------------------------------------------------
 * superblockV2
 *----------------------------------------------------------------------------*/
void H5TestFile::superblockV2 (uint64_t root)
{
    bytes_t sb(H5_SIGNATURE, H5_SIGNATURE + 8);
    put(&sb, 2, 1);
    put(&sb, 8, 1);
    put(&sb, 8, 1);
    put(&sb, 0, 1);
    put(&sb, 0, 8);
    put(&sb, UNDEFINED, 8);     // superblock extension
    put(&sb, buffer.size(), 8);
    put(&sb, root, 8);
    checksum(&sb);
    patch(0, sb);
}

/*----------------------------------------------------------------------------
 * objectHeader - version 2, chunk 0 size width from the flags
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::objectHeader (const std::vector<msg_t>& msgs, uint8_t flags)
{
    bytes_t messages;
    encodeMessages(&messages, msgs, (flags & 0x04) != 0);

    bytes_t hdr;
    tag(&hdr, "OHDR");
    put(&hdr, 2, 1);
    put(&hdr, flags, 1);
    if(flags & 0x20) hdr.insert(hdr.end(), 16, 0);  // access, modification, change, birth times
    if(flags & 0x10)
    {
        put(&hdr, 8, 2);    // max compact attributes
        put(&hdr, 6, 2);    // min dense attributes
    }
    put(&hdr, messages.size(), 1 << (flags & 0x03));
    hdr.insert(hdr.end(), messages.begin(), messages.end());
    checksum(&hdr);

    return append(hdr);
}

/*----------------------------------------------------------------------------
 * objectHeaderV1
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::objectHeaderV1 (const std::vector<msg_t>& msgs)
{
    bytes_t messages;
    encodeMessagesV1(&messages, msgs);

    bytes_t hdr;
    put(&hdr, 1, 1);                // version
    put(&hdr, 0, 1);                // reserved
    put(&hdr, msgs.size(), 2);
    put(&hdr, 1, 4);                // reference count
    put(&hdr, messages.size(), 4);
    put(&hdr, 0, 4);                // pad to 16
    hdr.insert(hdr.end(), messages.begin(), messages.end());

    return append(hdr);
}

/*----------------------------------------------------------------------------
 * continuationBlock - length includes the signature and checksum
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::continuationBlock (const std::vector<msg_t>& msgs, uint64_t* length)
{
    bytes_t block;
    tag(&block, "OCHK");
    encodeMessages(&block, msgs, false);
    checksum(&block);

    *length = block.size();
    return append(block);
}

/*----------------------------------------------------------------------------
 * continuationBlockV1
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::continuationBlockV1 (const std::vector<msg_t>& msgs, uint64_t* length)
{
    bytes_t block;
    encodeMessagesV1(&block, msgs);

    *length = block.size();
    return append(block);
}

/*----------------------------------------------------------------------------
 * symbolTableGroup - local heap, one group node, one symbol node
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::symbolTableGroup (const std::vector<link_spec_t>& links, uint64_t* heap)
{
    std::vector<link_spec_t> sorted = links;
    std::sort(sorted.begin(), sorted.end(), [](const link_spec_t& a, const link_spec_t& b) { return a.name < b.name; });

    /* Heap Data Segment: empty string first */
    bytes_t segment(8, 0);
    std::vector<uint64_t> name_offsets;
    std::vector<uint64_t> target_offsets;
    for(const link_spec_t& link: sorted)
    {
        name_offsets.push_back(segment.size());
        segment.insert(segment.end(), link.name.begin(), link.name.end());
        segment.push_back(0);
        pad8(&segment);

        target_offsets.push_back(segment.size());
        if(!link.target.empty())
        {
            segment.insert(segment.end(), link.target.begin(), link.target.end());
            segment.push_back(0);
            pad8(&segment);
        }
    }
    const uint64_t data_segment = append(segment);

    /* Local Heap */
    bytes_t local;
    tag(&local, "HEAP");
    put(&local, 0, 1);
    put(&local, 0, 3);
    put(&local, segment.size(), 8);
    put(&local, UNDEFINED, 8);  // free list
    put(&local, data_segment, 8);
    *heap = append(local);

    /* Symbol Node */
    bytes_t snod;
    tag(&snod, "SNOD");
    put(&snod, 1, 1);
    put(&snod, 0, 1);
    put(&snod, sorted.size(), 2);
    for(size_t i = 0; i < sorted.size(); i++)
    {
        const bool soft = !sorted[i].target.empty();
        put(&snod, name_offsets[i], 8);
        put(&snod, soft ? UNDEFINED : sorted[i].address, 8);
        put(&snod, soft ? 2 : 0, 4);
        put(&snod, 0, 4);
        put(&snod, soft ? target_offsets[i] : 0, 4);
        put(&snod, 0, 12);
    }
    const uint64_t symbol_node = append(snod);

    /* Group Node: key 0, child, key 1 names the last entry */
    bytes_t tree;
    tag(&tree, "TREE");
    put(&tree, 0, 1);           // group node
    put(&tree, 0, 1);           // leaf level
    put(&tree, 1, 2);
    put(&tree, UNDEFINED, 8);
    put(&tree, UNDEFINED, 8);
    put(&tree, 0, 8);
    put(&tree, symbol_node, 8);
    put(&tree, name_offsets.empty() ? 0 : name_offsets.back(), 8);

    return append(tree);
}

/*----------------------------------------------------------------------------
 * fractalHeap - header and a root direct block holding every object
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::fractalHeap (const std::vector<bytes_t>& objects, uint16_t id_length, std::vector<bytes_t>* ids)
{
    static const int BLOCK_OFFSET_SIZE = (HEAP_MAX_SIZE_BITS + 7) / 8;

    const int length_size = MIN((H5Stream::highestBit(HEAP_MAX_DIRECT_BLOCK) + 7) / 8, (H5Stream::highestBit(HEAP_MAX_MANAGED_OBJECT) / 8) + 1);

    /* Direct Block */
    bytes_t block;
    tag(&block, "FHDB");
    put(&block, 0, 1);
    put(&block, 0, 8);                      // heap header, patched below
    put(&block, 0, BLOCK_OFFSET_SIZE);

    ids->clear();
    for(const bytes_t& object: objects)
    {
        bytes_t id;
        put(&id, 0, 1);                     // managed object
        put(&id, block.size(), BLOCK_OFFSET_SIZE);
        put(&id, object.size(), length_size);
        id.resize(MAX(static_cast<size_t>(id_length), id.size()), 0);
        ids->push_back(id);
        block.insert(block.end(), object.begin(), object.end());
    }

    const uint64_t used = block.size();
    uint64_t block_size = 512;
    while(block_size < used) block_size <<= 1;
    block.resize(block_size, 0);
    const uint64_t root = append(block);

    /* Header */
    bytes_t hdr;
    tag(&hdr, "FRHP");
    put(&hdr, 0, 1);
    put(&hdr, id_length, 2);
    put(&hdr, 0, 2);                        // i/o filters
    put(&hdr, 0, 1);                        // flags
    put(&hdr, HEAP_MAX_MANAGED_OBJECT, 4);
    put(&hdr, 0, 8);                        // next huge id
    put(&hdr, UNDEFINED, 8);                // huge object b-tree
    put(&hdr, block_size - used, 8);        // free space
    put(&hdr, UNDEFINED, 8);                // free space manager
    put(&hdr, block_size, 8);               // managed space
    put(&hdr, block_size, 8);               // allocated managed space
    put(&hdr, used, 8);                     // allocation iterator
    put(&hdr, objects.size(), 8);           // managed objects
    put(&hdr, 0, 8 * 4);                    // huge and tiny sizes and counts
    put(&hdr, 4, 2);                        // table width
    put(&hdr, block_size, 8);               // starting block size
    put(&hdr, MAX(HEAP_MAX_DIRECT_BLOCK, block_size), 8);
    put(&hdr, HEAP_MAX_SIZE_BITS, 2);
    put(&hdr, 1, 2);                        // starting rows
    put(&hdr, root, 8);
    put(&hdr, 0, 2);                        // root is a direct block
    checksum(&hdr);
    const uint64_t address = append(hdr);

    bytes_t owner;
    put(&owner, address, 8);
    patch(root + 5, owner);

    return address;
}

/*----------------------------------------------------------------------------
 * btreeV2 - header and a single leaf
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::btreeV2 (int type, uint16_t record_size, const std::vector<bytes_t>& records)
{
    if(records.empty())
    {
        return btreeV2Header(type, record_size, 0, UNDEFINED, 0, 0);
    }

    const uint64_t leaf = btreeV2Leaf(type, records);
    return btreeV2Header(type, record_size, 0, leaf, records.size(), records.size());
}

/*----------------------------------------------------------------------------
 * btreeV2Deep - one internal record between two leaves
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::btreeV2Deep (int type, uint16_t record_size, const std::vector<bytes_t>& left, const bytes_t& middle, const std::vector<bytes_t>& right)
{
    const uint64_t left_leaf = btreeV2Leaf(type, left);
    const uint64_t right_leaf = btreeV2Leaf(type, right);

    const uint64_t max_leaf_records = (BTREE_NODE_SIZE - 10) / record_size;
    const int records_size = (H5Stream::highestBit(max_leaf_records) / 8) + 1;

    bytes_t node;
    tag(&node, "BTIN");
    put(&node, 0, 1);
    put(&node, type, 1);
    node.insert(node.end(), middle.begin(), middle.end());
    put(&node, left_leaf, 8);
    put(&node, left.size(), records_size);
    put(&node, right_leaf, 8);
    put(&node, right.size(), records_size);
    checksum(&node);
    const uint64_t root = append(node);

    return btreeV2Header(type, record_size, 1, root, 1, left.size() + 1 + right.size());
}

/*----------------------------------------------------------------------------
 * globalHeap - objects are indexed from 1
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::globalHeap (const std::vector<std::string>& objects)
{
    bytes_t body;
    for(size_t i = 0; i < objects.size(); i++)
    {
        put(&body, i + 1, 2);
        put(&body, 1, 2);               // reference count
        put(&body, 0, 4);
        put(&body, objects[i].size(), 8);
        body.insert(body.end(), objects[i].begin(), objects[i].end());
        pad8(&body);
    }

    const uint64_t collection_size = MAX(static_cast<uint64_t>(4096), 16 + body.size() + 16);

    bytes_t gcol;
    tag(&gcol, "GCOL");
    put(&gcol, 1, 1);
    put(&gcol, 0, 3);
    put(&gcol, collection_size, 8);
    gcol.insert(gcol.end(), body.begin(), body.end());

    /* Free space object */
    const uint64_t free_size = collection_size - gcol.size();
    put(&gcol, 0, 2);
    put(&gcol, 0, 2);
    put(&gcol, 0, 4);
    put(&gcol, free_size, 8);
    gcol.resize(collection_size, 0);

    return append(gcol);
}

/*----------------------------------------------------------------------------
 * chunkTreeNode - version 1 b-tree node of chunk keys
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::chunkTreeNode (int level, int rank, const std::vector<chunk_entry_t>& entries)
{
    bytes_t node;
    tag(&node, "TREE");
    put(&node, 1, 1);
    put(&node, level, 1);
    put(&node, entries.size(), 2);
    put(&node, UNDEFINED, 8);
    put(&node, UNDEFINED, 8);

    for(const chunk_entry_t& entry: entries)
    {
        put(&node, entry.size, 4);
        put(&node, entry.mask, 4);
        for(int d = 0; d < rank; d++) put(&node, entry.offsets[d], 8);
        put(&node, 0, 8);       // element offset
        put(&node, entry.address, 8);
    }

    /* Final key bounds the last child */
    put(&node, 0, 8);
    for(int d = 0; d <= rank; d++) put(&node, 0, 8);

    return append(node);
}

/*----------------------------------------------------------------------------
 * fixedArray - entries in row major grid order
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::fixedArray (const std::vector<chunk_entry_t>& entries, bool filtered)
{
    static const int HEADER_SIZE = 4 + 4 + 8 + 8 + 4;
    const int entry_size = filtered ? 8 + FILTERED_SIZE_LENGTH + 4 : 8;

    const uint64_t header = append(bytes_t(HEADER_SIZE, 0));

    bytes_t block;
    tag(&block, "FADB");
    put(&block, 0, 1);
    put(&block, filtered ? 1 : 0, 1);
    put(&block, header, 8);
    for(const chunk_entry_t& entry: entries)
    {
        put(&block, entry.address, 8);
        if(filtered)
        {
            put(&block, entry.size, FILTERED_SIZE_LENGTH);
            put(&block, entry.mask, 4);
        }
    }
    checksum(&block);
    const uint64_t data_block = append(block);

    bytes_t hdr;
    tag(&hdr, "FAHD");
    put(&hdr, 0, 1);
    put(&hdr, filtered ? 1 : 0, 1);
    put(&hdr, entry_size, 1);
    put(&hdr, FIXED_ARRAY_PAGE_BITS, 1);
    put(&hdr, entries.size(), 8);
    put(&hdr, data_block, 8);
    checksum(&hdr);
    patch(header, hdr);

    return header;
}

/*----------------------------------------------------------------------------
 * writeChunk - runs the filter pipeline forward and stores the result
 *----------------------------------------------------------------------------*/
H5TestFile::chunk_entry_t H5TestFile::writeChunk (const std::vector<uint64_t>& offsets, const bytes_t& raw, const std::vector<filter_spec_t>& filters, int type_size)
{
    bytes_t data = raw;

    for(const filter_spec_t& filter: filters)
    {
        if(filter.id == H5Stream::SHUFFLE_FILTER)
        {
            const int esize = filter.parms.empty() ? type_size : static_cast<int>(filter.parms[0]);
            const uint64_t elements = data.size() / esize;
            bytes_t shuffled(data.size());
            for(uint64_t e = 0; e < elements; e++)
            {
                for(int b = 0; b < esize; b++)
                {
                    shuffled[(b * elements) + e] = data[(e * esize) + b];
                }
            }
            for(uint64_t i = elements * esize; i < data.size(); i++) shuffled[i] = data[i];
            data.swap(shuffled);
        }
        else if(filter.id == H5Stream::DEFLATE_FILTER)
        {
            uLongf compressed_size = compressBound(data.size());
            bytes_t compressed(compressed_size);
            const int level = filter.parms.empty() ? 6 : static_cast<int>(filter.parms[0]);
            if(compress2(compressed.data(), &compressed_size, data.data(), data.size(), level) != Z_OK)
            {
                throw RunTimeException(CRITICAL, RTE_ERROR, "failed to compress %ld byte test chunk", (long)data.size());
            }
            compressed.resize(compressed_size);
            data.swap(compressed);
        }
        else if(filter.id == H5Stream::FLETCHER32_FILTER)
        {
            const uint32_t sum = H5Stream::checksumFletcher32(data.data(), data.size());
            put(&data, sum, 4);
        }
    }

    chunk_entry_t entry;
    entry.offsets = offsets;
    entry.address = append(data);
    entry.size = data.size();
    entry.mask = 0;
    return entry;
}

/*----------------------------------------------------------------------------
 * dataspaceMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::dataspaceMsg (const std::vector<uint64_t>& dims, int version)
{
    msg_t msg = {0x1, {}};
    put(&msg.body, version, 1);
    put(&msg.body, dims.size(), 1);
    put(&msg.body, 0, 1);           // no maximum dimensions
    if(version == 1)    put(&msg.body, 0, 5);
    else                put(&msg.body, dims.empty() ? 0 : 1, 1);
    for(uint64_t dim: dims) put(&msg.body, dim, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * fixedPointMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::fixedPointMsg (int size, bool is_signed, bool big_endian)
{
    msg_t msg = {0x3, {}};
    put(&msg.body, 0x10, 1);
    put(&msg.body, (big_endian ? 0x01 : 0x00) | (is_signed ? 0x08 : 0x00), 1);
    put(&msg.body, 0, 2);
    put(&msg.body, size, 4);
    put(&msg.body, 0, 2);           // bit offset
    put(&msg.body, size * 8, 2);    // precision
    return msg;
}

/*----------------------------------------------------------------------------
 * floatMsg - IEEE layouts for 2, 4 and 8 byte floats
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::floatMsg (int size, bool big_endian)
{
    int exp_location = 23, exp_size = 8, mant_size = 23;
    uint32_t bias = 127;
    if(size == 2)       { exp_location = 10; exp_size = 5;  mant_size = 10; bias = 15; }
    else if(size == 8)  { exp_location = 52; exp_size = 11; mant_size = 52; bias = 1023; }

    msg_t msg = {0x3, {}};
    put(&msg.body, 0x11, 1);
    put(&msg.body, big_endian ? 0x21 : 0x20, 1);
    put(&msg.body, (size * 8) - 1, 1);  // sign location
    put(&msg.body, 0, 1);
    put(&msg.body, size, 4);
    put(&msg.body, 0, 2);
    put(&msg.body, size * 8, 2);
    put(&msg.body, exp_location, 1);
    put(&msg.body, exp_size, 1);
    put(&msg.body, 0, 1);
    put(&msg.body, mant_size, 1);
    put(&msg.body, bias, 4);
    return msg;
}

/*----------------------------------------------------------------------------
 * stringMsg - fixed length, null terminated
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::stringMsg (int size)
{
    msg_t msg = {0x3, {}};
    put(&msg.body, 0x13, 1);
    put(&msg.body, 0, 3);
    put(&msg.body, size, 4);
    return msg;
}

/*----------------------------------------------------------------------------
 * vlenStringMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::vlenStringMsg (void)
{
    msg_t msg = {0x3, {}};
    put(&msg.body, 0x19, 1);
    put(&msg.body, 0x01, 1);        // string
    put(&msg.body, 0, 2);
    put(&msg.body, 4 + 8 + 4, 4);

    const msg_t base = fixedPointMsg(1, false);
    msg.body.insert(msg.body.end(), base.body.begin(), base.body.end());
    return msg;
}

/*----------------------------------------------------------------------------
 * fillValueMsg - version 2, undefined when the value is empty
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::fillValueMsg (const bytes_t& value)
{
    msg_t msg = {0x5, {}};
    put(&msg.body, 2, 1);
    put(&msg.body, 2, 1);           // allocation time
    put(&msg.body, 2, 1);           // write time
    put(&msg.body, value.empty() ? 0 : 1, 1);
    if(!value.empty())
    {
        put(&msg.body, value.size(), 4);
        msg.body.insert(msg.body.end(), value.begin(), value.end());
    }
    return msg;
}

/*----------------------------------------------------------------------------
 * compactLayoutMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::compactLayoutMsg (const bytes_t& data)
{
    msg_t msg = {0x8, {}};
    put(&msg.body, 3, 1);
    put(&msg.body, 0, 1);
    put(&msg.body, data.size(), 2);
    msg.body.insert(msg.body.end(), data.begin(), data.end());
    return msg;
}

/*----------------------------------------------------------------------------
 * contiguousLayoutMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::contiguousLayoutMsg (uint64_t address, uint64_t size)
{
    msg_t msg = {0x8, {}};
    put(&msg.body, 3, 1);
    put(&msg.body, 1, 1);
    put(&msg.body, address, 8);
    put(&msg.body, size, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * chunkedLayoutV3Msg - version 1 b-tree index
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::chunkedLayoutV3Msg (uint64_t btree, const std::vector<uint64_t>& chunk_dims, uint32_t element_size)
{
    msg_t msg = {0x8, {}};
    put(&msg.body, 3, 1);
    put(&msg.body, 2, 1);
    put(&msg.body, chunk_dims.size() + 1, 1);
    put(&msg.body, btree, 8);
    for(uint64_t dim: chunk_dims) put(&msg.body, dim, 4);
    put(&msg.body, element_size, 4);
    return msg;
}

/*----------------------------------------------------------------------------
 * chunkedLayoutV4Msg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::chunkedLayoutV4Msg (int index_type, uint64_t address, const std::vector<uint64_t>& chunk_dims, uint32_t element_size, uint8_t flags, uint64_t filtered_size, uint32_t filter_mask)
{
    msg_t msg = {0x8, {}};
    put(&msg.body, 4, 1);
    put(&msg.body, 2, 1);
    put(&msg.body, flags, 1);
    put(&msg.body, chunk_dims.size() + 1, 1);
    put(&msg.body, 4, 1);           // dimension encoding size
    for(uint64_t dim: chunk_dims) put(&msg.body, dim, 4);
    put(&msg.body, element_size, 4);
    put(&msg.body, index_type, 1);
    switch(index_type)
    {
        case 1:
        {
            if(flags & 0x02)
            {
                put(&msg.body, filtered_size, 8);
                put(&msg.body, filter_mask, 4);
            }
            break;
        }
        case 3:
        {
            put(&msg.body, FIXED_ARRAY_PAGE_BITS, 1);
            break;
        }
        case 4:
        {
            put(&msg.body, 32, 1);  // max bits
            put(&msg.body, 4, 1);   // index elements
            put(&msg.body, 4, 1);   // min pointers
            put(&msg.body, 16, 1);  // min elements
            put(&msg.body, 10, 1);  // page bits
            break;
        }
        case 5:
        {
            put(&msg.body, BTREE_NODE_SIZE, 4);
            put(&msg.body, 100, 1);
            put(&msg.body, 40, 1);
            break;
        }
        default:
        {
            break;
        }
    }
    put(&msg.body, address, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * filterMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::filterMsg (const std::vector<filter_spec_t>& filters, int version)
{
    msg_t msg = {0xB, {}};
    put(&msg.body, version, 1);
    put(&msg.body, filters.size(), 1);
    if(version == 1) put(&msg.body, 0, 6);

    for(const filter_spec_t& filter: filters)
    {
        const std::string name = (filter.id >= 256) ? "test filter" : "";
        bytes_t padded_name(name.begin(), name.end());
        if(!padded_name.empty())
        {
            padded_name.push_back(0);
            if(version == 1) pad8(&padded_name);
        }

        put(&msg.body, filter.id, 2);
        if(version == 1 || filter.id >= 256) put(&msg.body, padded_name.size(), 2);
        put(&msg.body, 0, 2);       // flags
        put(&msg.body, filter.parms.size(), 2);
        msg.body.insert(msg.body.end(), padded_name.begin(), padded_name.end());
        for(uint32_t parm: filter.parms) put(&msg.body, parm, 4);
        if(version == 1 && (filter.parms.size() % 2 == 1)) put(&msg.body, 0, 4);
    }

    return msg;
}

/*----------------------------------------------------------------------------
 * linkMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::linkMsg (const link_spec_t& link)
{
    msg_t msg = {0x6, linkBody(link)};
    return msg;
}

/*----------------------------------------------------------------------------
 * linkInfoMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::linkInfoMsg (uint64_t heap, uint64_t name_index)
{
    msg_t msg = {0x2, {}};
    put(&msg.body, 0, 1);
    put(&msg.body, 0, 1);
    put(&msg.body, heap, 8);
    put(&msg.body, name_index, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * attributeInfoMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::attributeInfoMsg (uint64_t heap, uint64_t name_index)
{
    msg_t msg = linkInfoMsg(heap, name_index);
    msg.type = 0x15;
    return msg;
}

/*----------------------------------------------------------------------------
 * groupInfoMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::groupInfoMsg (void)
{
    msg_t msg = {0xA, {0, 0}};
    return msg;
}

/*----------------------------------------------------------------------------
 * symbolTableMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::symbolTableMsg (uint64_t btree, uint64_t heap)
{
    msg_t msg = {0x11, {}};
    put(&msg.body, btree, 8);
    put(&msg.body, heap, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * continuationMsg
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::continuationMsg (uint64_t address, uint64_t length)
{
    msg_t msg = {0x10, {}};
    put(&msg.body, address, 8);
    put(&msg.body, length, 8);
    return msg;
}

/*----------------------------------------------------------------------------
 * attributeMsg - data is whatever follows the dataspace
 *----------------------------------------------------------------------------*/
H5TestFile::msg_t H5TestFile::attributeMsg (const std::string& name, const msg_t& datatype, const msg_t& dataspace, const bytes_t& data, int version)
{
    msg_t msg = {0xC, {}};
    put(&msg.body, version, 1);
    put(&msg.body, 0, 1);
    put(&msg.body, name.size() + 1, 2);
    put(&msg.body, datatype.body.size(), 2);
    put(&msg.body, dataspace.body.size(), 2);
    if(version == 3) put(&msg.body, 0, 1);

    bytes_t name_bytes(name.begin(), name.end());
    name_bytes.push_back(0);
    bytes_t type_bytes = datatype.body;
    bytes_t space_bytes = dataspace.body;
    if(version == 1)
    {
        pad8(&name_bytes);
        pad8(&type_bytes);
        pad8(&space_bytes);
    }

    msg.body.insert(msg.body.end(), name_bytes.begin(), name_bytes.end());
    msg.body.insert(msg.body.end(), type_bytes.begin(), type_bytes.end());
    msg.body.insert(msg.body.end(), space_bytes.begin(), space_bytes.end());
    msg.body.insert(msg.body.end(), data.begin(), data.end());
    return msg;
}

/*----------------------------------------------------------------------------
 * put - little endian field
 *----------------------------------------------------------------------------*/
void H5TestFile::put (bytes_t* data, uint64_t value, int size)
{
    for(int i = 0; i < size; i++)
    {
        data->push_back(i < 8 ? static_cast<uint8_t>(value >> (8 * i)) : 0);
    }
}

/*----------------------------------------------------------------------------
 * linkBody - one byte name length
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::linkBody (const link_spec_t& link)
{
    const bool soft = !link.target.empty();

    bytes_t body;
    put(&body, 1, 1);
    put(&body, soft ? 0x08 : 0x00, 1);
    if(soft) put(&body, 1, 1);
    put(&body, link.name.size(), 1);
    body.insert(body.end(), link.name.begin(), link.name.end());
    if(soft)
    {
        put(&body, link.target.size(), 2);
        body.insert(body.end(), link.target.begin(), link.target.end());
    }
    else
    {
        put(&body, link.address, 8);
    }
    return body;
}

/*----------------------------------------------------------------------------
 * vlenElement
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::vlenElement (uint32_t length, uint64_t collection, uint32_t index)
{
    bytes_t element;
    put(&element, length, 4);
    put(&element, collection, 8);
    put(&element, index, 4);
    return element;
}

/*----------------------------------------------------------------------------
 * nameRecord - type 5
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::nameRecord (const std::string& name, const bytes_t& heap_id)
{
    bytes_t record;
    put(&record, H5Stream::checksumLookup3(reinterpret_cast<const uint8_t*>(name.c_str()), name.size(), 0), 4);
    record.insert(record.end(), heap_id.begin(), heap_id.begin() + 7);
    return record;
}

/*----------------------------------------------------------------------------
 * attributeRecord - type 8
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::attributeRecord (const std::string& name, const bytes_t& heap_id, uint32_t order)
{
    bytes_t record(heap_id.begin(), heap_id.begin() + 8);
    put(&record, 0, 1);
    put(&record, order, 4);
    put(&record, H5Stream::checksumLookup3(reinterpret_cast<const uint8_t*>(name.c_str()), name.size(), 0), 4);
    return record;
}

/*----------------------------------------------------------------------------
 * chunkRecord - type 10
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::chunkRecord (uint64_t address, const std::vector<uint64_t>& scaled)
{
    bytes_t record;
    put(&record, address, 8);
    for(uint64_t s: scaled) put(&record, s, 8);
    return record;
}

/*----------------------------------------------------------------------------
 * filteredChunkRecord - type 11 with a four byte chunk size
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::filteredChunkRecord (uint64_t address, uint64_t size, uint32_t mask, const std::vector<uint64_t>& scaled)
{
    bytes_t record;
    put(&record, address, 8);
    put(&record, size, FILTERED_SIZE_LENGTH);
    put(&record, mask, 4);
    for(uint64_t s: scaled) put(&record, s, 8);
    return record;
}

/*----------------------------------------------------------------------------
 * float32Bytes
 *----------------------------------------------------------------------------*/
H5TestFile::bytes_t H5TestFile::float32Bytes (const std::vector<float>& values)
{
    bytes_t data(values.size() * sizeof(float));
    if(!values.empty()) memcpy(data.data(), values.data(), data.size());
    return data;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * btreeV2Leaf
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::btreeV2Leaf (int type, const std::vector<bytes_t>& records)
{
    bytes_t leaf;
    tag(&leaf, "BTLF");
    put(&leaf, 0, 1);
    put(&leaf, type, 1);
    for(const bytes_t& record: records) leaf.insert(leaf.end(), record.begin(), record.end());
    checksum(&leaf);
    return append(leaf);
}

/*----------------------------------------------------------------------------
 * btreeV2Header
 *----------------------------------------------------------------------------*/
uint64_t H5TestFile::btreeV2Header (int type, uint16_t record_size, uint16_t depth, uint64_t root, uint16_t root_records, uint64_t total)
{
    bytes_t hdr;
    tag(&hdr, "BTHD");
    put(&hdr, 0, 1);
    put(&hdr, type, 1);
    put(&hdr, BTREE_NODE_SIZE, 4);
    put(&hdr, record_size, 2);
    put(&hdr, depth, 2);
    put(&hdr, 100, 1);      // split percent
    put(&hdr, 40, 1);       // merge percent
    put(&hdr, root, 8);
    put(&hdr, root_records, 2);
    put(&hdr, total, 8);
    checksum(&hdr);
    return append(hdr);
}
