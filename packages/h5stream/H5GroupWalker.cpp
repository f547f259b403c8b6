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

#include "H5GroupWalker.h"
#include "H5Dense.h"
#include "EventLib.h"

#include <algorithm>
#include <set>

/******************************************************************************
 * LOCAL TYPES
 ******************************************************************************/

typedef struct {
    H5FractalHeap*                          heap;
    const std::string*                      name;       // null when collecting
    H5ObjectHeader::link_t*                 link;
    bool                                    found;
    std::vector<H5ObjectHeader::link_t>*    all;
} link_search_t;

typedef struct {
    H5FractalHeap*                              heap;
    uint64_t                                    owner;
    std::vector<H5ObjectHeader::attribute_t>*   all;
} attribute_search_t;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5GroupWalker::H5GroupWalker (H5Context* _context, uint64_t _root_address):
    context     (_context),
    rootAddress (_root_address)
{
}

/*----------------------------------------------------------------------------
 * header - parsed object header from the arena
 *----------------------------------------------------------------------------*/
H5GroupWalker::header_t H5GroupWalker::header (uint64_t address)
{
    header_t hdr;

    arenaMut.lock();
    {
        std::map<uint64_t, header_t>::iterator iter = arena.find(address);
        if(iter != arena.end()) hdr = iter->second;
    }
    arenaMut.unlock();

    if(!hdr)
    {
        /* Parse outside the lock; first one stored wins */
        header_t parsed = std::make_shared<const H5ObjectHeader>(context, address);
        arenaMut.lock();
        {
            hdr = arena.emplace(address, parsed).first->second;
        }
        arenaMut.unlock();
    }

    return hdr;
}

/*----------------------------------------------------------------------------
 * resolve - object header address of path
 *----------------------------------------------------------------------------*/
uint64_t H5GroupWalker::resolve (const char* path)
{
    std::deque<std::string> remaining;
    splitPath(path, &remaining);

    uint64_t address = rootAddress;
    int hops = 0;
    while(!remaining.empty())
    {
        const std::string segment = remaining.front();
        remaining.pop_front();

        const header_t group = header(address);
        if(!group->isGroup())
        {
            throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "%s: object at 0x%lx before %s is not a group", path, (unsigned long)address, segment.c_str());
        }

        H5ObjectHeader::link_t link;
        if(!lookup(*group, segment, &link))
        {
            throw RunTimeException(ERROR, RTE_RESOURCE_DOES_NOT_EXIST, "%s: %s not found in group 0x%lx", path, segment.c_str(), (unsigned long)address);
        }

        if(link.type == H5ObjectHeader::HARD_LINK)
        {
            address = link.address;
        }
        else if(link.type == H5ObjectHeader::SOFT_LINK)
        {
            if(++hops > H5Stream::MAX_LINK_HOPS)
            {
                throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "%s: more than %d soft link hops", path, H5Stream::MAX_LINK_HOPS);
            }

            /* Splice the target in front of what is left */
            std::deque<std::string> target;
            splitPath(link.target.c_str(), &target);
            remaining.insert(remaining.begin(), target.begin(), target.end());
            if(!link.target.empty() && link.target[0] == '/') address = rootAddress;

            mlog(DEBUG, "Following soft link %s to %s", segment.c_str(), link.target.c_str());
        }
        else if(link.type == H5ObjectHeader::EXTERNAL_LINK)
        {
            throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s: %s is an external link", path, segment.c_str());
        }
        else
        {
            throw RunTimeException(ERROR, RTE_UNSUPPORTED_FORMAT, "%s: %s has unsupported link type %d", path, segment.c_str(), (int)link.type);
        }
    }

    return address;
}

/*----------------------------------------------------------------------------
 * links - every link stored by a group
 *----------------------------------------------------------------------------*/
void H5GroupWalker::links (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result)
{
    result->insert(result->end(), group.links.begin(), group.links.end());

    if(group.symbolTable.present)
    {
        symbolTableLinks(group, result);
    }

    if(group.linkInfo.present && !context->isUndefined(group.linkInfo.heapAddress))
    {
        denseLinks(group, result);
    }
}

/*----------------------------------------------------------------------------
 * attributes - compact and dense attributes of an object
 *----------------------------------------------------------------------------*/
void H5GroupWalker::attributes (const H5ObjectHeader& object, std::vector<H5ObjectHeader::attribute_t>* result)
{
    result->insert(result->end(), object.attributes.begin(), object.attributes.end());

    const H5ObjectHeader::link_info_t& info = object.attributeInfo;
    if(!info.present || context->isUndefined(info.heapAddress)) return;

    if(context->isUndefined(info.nameIndexAddress))
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "dense attributes of 0x%lx have no name index", (unsigned long)object.address);
    }

    H5FractalHeap heap(context, info.heapAddress);
    H5BTreeV2 index(context, info.nameIndexAddress);
    if(index.type != H5BTreeV2::ATTRIBUTE_NAME_RECORD)
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "attribute name index 0x%lx has record type %d", (unsigned long)index.address, index.type);
    }

    attribute_search_t search = {&heap, object.address, result};
    index.forEachRecord(readAttributeRecord, &search);
}

/*----------------------------------------------------------------------------
 * walk - every dataset reachable through hard links
 *----------------------------------------------------------------------------*/
void H5GroupWalker::walk (std::vector<object_t>* objects)
{
    std::set<uint64_t> visited;
    std::vector<std::pair<std::string, uint64_t>> worklist;
    worklist.push_back(std::make_pair(std::string(""), rootAddress));

    while(!worklist.empty())
    {
        const std::pair<std::string, uint64_t> item = worklist.back();
        worklist.pop_back();

        const std::string& path = item.first;
        const uint64_t address = item.second;
        if(!visited.insert(address).second) continue;

        header_t hdr;
        try
        {
            hdr = header(address);
        }
        catch(const RunTimeException& e)
        {
            mlog(WARNING, "Unable to read object %s at 0x%lx: %s", path.c_str(), (unsigned long)address, e.what());
            objects->push_back({path, address, nullptr, e.code(), e.what()});
            continue;
        }

        if(hdr->isDataset())
        {
            objects->push_back({path, address, hdr, RTE_INFO, ""});
        }
        else if(hdr->isGroup())
        {
            std::vector<H5ObjectHeader::link_t> children;
            try
            {
                links(*hdr, &children);
            }
            catch(const RunTimeException& e)
            {
                mlog(WARNING, "Unable to list group %s at 0x%lx: %s", path.empty() ? "/" : path.c_str(), (unsigned long)address, e.what());
                continue;
            }

            for(std::vector<H5ObjectHeader::link_t>::reverse_iterator child = children.rbegin(); child != children.rend(); ++child)
            {
                if(child->type == H5ObjectHeader::HARD_LINK)
                {
                    worklist.push_back(std::make_pair(path + "/" + child->name, child->address));
                }
                else
                {
                    mlog(DEBUG, "Not listing %s link %s/%s", child->type == H5ObjectHeader::SOFT_LINK ? "soft" : "external", path.c_str(), child->name.c_str());
                }
            }
        }
    }

    std::sort(objects->begin(), objects->end(), [](const object_t& a, const object_t& b) { return a.path < b.path; });
}

/*----------------------------------------------------------------------------
 * splitPath
 *----------------------------------------------------------------------------*/
void H5GroupWalker::splitPath (const char* path, std::deque<std::string>* segments)
{
    std::string segment;
    for(const char* c = path; ; c++)
    {
        if(*c == '/' || *c == '\0')
        {
            if(!segment.empty() && segment != ".") segments->push_back(segment);
            segment.clear();
            if(*c == '\0') break;
        }
        else
        {
            segment += *c;
        }
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * lookup
 *----------------------------------------------------------------------------*/
bool H5GroupWalker::lookup (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link)
{
    /* Compact Storage */
    for(const H5ObjectHeader::link_t& candidate: group.links)
    {
        if(candidate.name == name)
        {
            *link = candidate;
            return true;
        }
    }

    /* Symbol Table */
    if(group.symbolTable.present && symbolTableLookup(group, name, link))
    {
        return true;
    }

    /* Dense Storage */
    if(group.linkInfo.present && !context->isUndefined(group.linkInfo.heapAddress))
    {
        return denseLookup(group, name, link);
    }

    return false;
}

/*----------------------------------------------------------------------------
 * symbolTableLookup - descends the group b-tree by name key
 *----------------------------------------------------------------------------*/
bool H5GroupWalker::symbolTableLookup (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link)
{
    const local_heap_t heap = readLocalHeap(group.symbolTable.heapAddress);

    uint64_t node = group.symbolTable.btreeAddress;
    for(int visited = 0; visited < MAX_TREE_NODES; visited++)
    {
        int level;
        int entries;
        uint64_t pos = readGroupNode(node, &level, &entries);
        pos += context->lengthSize; // key 0 sorts before every name

        /* Child i holds names after key i up to and including key i+1 */
        bool found = false;
        uint64_t child = 0;
        for(int e = 0; e < entries && !found; e++)
        {
            child = context->readField(context->offsetSize, &pos);
            const uint64_t key = context->readField(context->lengthSize, &pos);
            if(strcmp(name.c_str(), readHeapString(heap, key).c_str()) <= 0) found = true; // unsigned byte order
        }

        if(!found) return false;

        if(level == 0)
        {
            std::vector<H5ObjectHeader::link_t> symbols;
            readSymbolNode(child, heap, &symbols);
            for(const H5ObjectHeader::link_t& symbol: symbols)
            {
                if(symbol.name == name)
                {
                    *link = symbol;
                    return true;
                }
            }
            return false;
        }

        node = child;
    }

    throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "group b-tree 0x%lx exceeds %d nodes", (unsigned long)group.symbolTable.btreeAddress, MAX_TREE_NODES);
}

/*----------------------------------------------------------------------------
 * denseLookup - name index lookup by lookup3 hash
 *----------------------------------------------------------------------------*/
bool H5GroupWalker::denseLookup (const H5ObjectHeader& group, const std::string& name, H5ObjectHeader::link_t* link)
{
    if(context->isUndefined(group.linkInfo.nameIndexAddress))
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "dense links of 0x%lx have no name index", (unsigned long)group.address);
    }

    H5FractalHeap heap(context, group.linkInfo.heapAddress);
    H5BTreeV2 index(context, group.linkInfo.nameIndexAddress);
    if(index.type != H5BTreeV2::GROUP_NAME_RECORD)
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "link name index 0x%lx has record type %d", (unsigned long)index.address, index.type);
    }

    const uint32_t hash = H5Stream::checksumLookup3(reinterpret_cast<const uint8_t*>(name.c_str()), name.size(), 0);
    link_search_t search = {&heap, &name, link, false, NULL};
    index.findByHash(hash, readLinkRecord, &search);

    return search.found;
}

/*----------------------------------------------------------------------------
 * symbolTableLinks
 *----------------------------------------------------------------------------*/
void H5GroupWalker::symbolTableLinks (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result)
{
    const local_heap_t heap = readLocalHeap(group.symbolTable.heapAddress);

    std::vector<uint64_t> worklist;
    worklist.push_back(group.symbolTable.btreeAddress);
    int visited = 0;
    while(!worklist.empty())
    {
        if(++visited > MAX_TREE_NODES)
        {
            throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "group b-tree 0x%lx exceeds %d nodes", (unsigned long)group.symbolTable.btreeAddress, MAX_TREE_NODES);
        }

        const uint64_t node = worklist.back();
        worklist.pop_back();

        int level;
        int entries;
        uint64_t pos = readGroupNode(node, &level, &entries);
        pos += context->lengthSize;

        std::vector<uint64_t> children;
        for(int e = 0; e < entries; e++)
        {
            children.push_back(context->readField(context->offsetSize, &pos));
            pos += context->lengthSize;
        }

        if(level == 0)
        {
            for(uint64_t child: children) readSymbolNode(child, heap, result);
        }
        else
        {
            worklist.insert(worklist.end(), children.rbegin(), children.rend());
        }
    }
}

/*----------------------------------------------------------------------------
 * denseLinks
 *----------------------------------------------------------------------------*/
void H5GroupWalker::denseLinks (const H5ObjectHeader& group, std::vector<H5ObjectHeader::link_t>* result)
{
    if(context->isUndefined(group.linkInfo.nameIndexAddress))
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "dense links of 0x%lx have no name index", (unsigned long)group.address);
    }

    H5FractalHeap heap(context, group.linkInfo.heapAddress);
    H5BTreeV2 index(context, group.linkInfo.nameIndexAddress);
    if(index.type != H5BTreeV2::GROUP_NAME_RECORD)
    {
        throw RunTimeException(ERROR, RTE_FORMAT_ERROR, "link name index 0x%lx has record type %d", (unsigned long)index.address, index.type);
    }

    H5ObjectHeader::link_t link;
    link_search_t search = {&heap, NULL, &link, false, result};
    index.forEachRecord(readLinkRecord, &search);
}

/*----------------------------------------------------------------------------
 * readLocalHeap
 *----------------------------------------------------------------------------*/
H5GroupWalker::local_heap_t H5GroupWalker::readLocalHeap (uint64_t address)
{
    uint64_t pos = address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_HEAP_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid local heap signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    if(version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid local heap version at 0x%lx: %d", (unsigned long)address, (int)version);
    }

    pos += 3; // reserved

    local_heap_t heap;
    heap.dataSize = context->readField(context->lengthSize, &pos);
    pos += context->lengthSize; // offset to head of free list
    heap.dataSegment = context->readField(context->offsetSize, &pos);

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Local Heap: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Data Segment Size:                                               %lu\n", (unsigned long)heap.dataSize);
        print2term("Address of Data Segment:                                         0x%lx\n", (unsigned long)heap.dataSegment);
    }

    return heap;
}

/*----------------------------------------------------------------------------
 * readHeapString - null terminated string in a local heap
 *----------------------------------------------------------------------------*/
std::string H5GroupWalker::readHeapString (const local_heap_t& heap, uint64_t offset)
{
    if(offset >= heap.dataSize)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "local heap offset %lu beyond data segment of %lu bytes", (unsigned long)offset, (unsigned long)heap.dataSize);
    }

    std::string str;
    uint64_t pos = heap.dataSegment + offset;
    const uint64_t max_len = MIN(heap.dataSize - offset, static_cast<uint64_t>(H5STREAM_MAXIMUM_NAME_SIZE));
    for(uint64_t i = 0; i < max_len; i++)
    {
        const char c = static_cast<char>(context->readField(1, &pos));
        if(c == '\0') return str;
        str += c;
    }

    throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "unterminated local heap string at offset %lu", (unsigned long)offset);
}

/*----------------------------------------------------------------------------
 * readSymbolNode
 *----------------------------------------------------------------------------*/
void H5GroupWalker::readSymbolNode (uint64_t address, const local_heap_t& heap, std::vector<H5ObjectHeader::link_t>* result)
{
    uint64_t pos = address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_SNOD_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid symbol table node signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    const uint8_t version = (uint8_t)context->readField(1, &pos);
    if(version != 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid symbol table node version at 0x%lx: %d", (unsigned long)address, (int)version);
    }

    pos += 1; // reserved
    const uint16_t num_symbols = (uint16_t)context->readField(2, &pos);

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Symbol Table Node: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Number of Symbols:                                               %d\n", (int)num_symbols);
    }

    for(int s = 0; s < num_symbols; s++)
    {
        const uint64_t name_offset = context->readField(context->offsetSize, &pos);
        const uint64_t obj_hdr_addr = context->readField(context->offsetSize, &pos);
        const uint32_t cache_type = (uint32_t)context->readField(4, &pos);
        pos += 4; // reserved

        H5ObjectHeader::link_t link;
        link.name = readHeapString(heap, name_offset);
        if(cache_type == SOFT_LINK_CACHE)
        {
            uint64_t scratch = pos;
            const uint32_t value_offset = (uint32_t)context->readField(4, &scratch);
            link.type = H5ObjectHeader::SOFT_LINK;
            link.address = 0;
            link.target = readHeapString(heap, value_offset);
        }
        else
        {
            link.type = H5ObjectHeader::HARD_LINK;
            link.address = obj_hdr_addr;
        }
        pos += 16; // scratch pad

        if(H5STREAM_VERBOSE)
        {
            print2term("Symbol %d:                                                        %s -> 0x%lx\n", s, link.name.c_str(), (unsigned long)link.address);
        }

        result->push_back(link);
    }
}

/*----------------------------------------------------------------------------
 * readGroupNode - returns position of the first key
 *----------------------------------------------------------------------------*/
uint64_t H5GroupWalker::readGroupNode (uint64_t address, int* level, int* entries)
{
    uint64_t pos = address;

    const uint32_t signature = (uint32_t)context->readField(4, &pos);
    if(signature != H5_TREE_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid group b-tree signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    const uint8_t node_type = (uint8_t)context->readField(1, &pos);
    if(node_type != GROUP_NODE_TYPE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "b-tree at 0x%lx is not a group node: %d", (unsigned long)address, (int)node_type);
    }

    *level = (int)context->readField(1, &pos);
    *entries = (int)context->readField(2, &pos);
    pos += context->offsetSize * 2; // siblings

    return pos;
}

/*----------------------------------------------------------------------------
 * readLinkRecord - type 5 record: name hash then 7 byte heap ID
 *----------------------------------------------------------------------------*/
bool H5GroupWalker::readLinkRecord (H5Context* context, uint64_t record_pos, void* parm)
{
    static const int LINK_HEAP_ID_SIZE = 7;

    link_search_t* search = static_cast<link_search_t*>(parm);

    uint8_t id[LINK_HEAP_ID_SIZE];
    uint64_t pos = record_pos + 4;
    context->readByteArray(id, LINK_HEAP_ID_SIZE, &pos);

    uint64_t obj_pos;
    uint64_t obj_size;
    search->heap->locate(id, LINK_HEAP_ID_SIZE, &obj_pos, &obj_size);

    H5ObjectHeader::link_t link;
    const uint64_t bytes_read = H5ObjectHeader::readLink(context, obj_pos, &link);
    if(bytes_read > obj_size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "link at 0x%lx overruns heap object: %lu > %lu", (unsigned long)obj_pos, (unsigned long)bytes_read, (unsigned long)obj_size);
    }

    if(search->all)
    {
        search->all->push_back(link);
        return true;
    }

    if(link.name == *search->name)
    {
        *search->link = link;
        search->found = true;
        return false;
    }

    return true;
}

/*----------------------------------------------------------------------------
 * readAttributeRecord - type 8 record: 8 byte heap ID, flags, order, hash
 *----------------------------------------------------------------------------*/
bool H5GroupWalker::readAttributeRecord (H5Context* context, uint64_t record_pos, void* parm)
{
    static const int ATTR_HEAP_ID_SIZE = 8;

    attribute_search_t* search = static_cast<attribute_search_t*>(parm);

    uint8_t id[ATTR_HEAP_ID_SIZE];
    uint64_t pos = record_pos;
    context->readByteArray(id, ATTR_HEAP_ID_SIZE, &pos);

    try
    {
        uint64_t obj_pos;
        uint64_t obj_size;
        search->heap->locate(id, ATTR_HEAP_ID_SIZE, &obj_pos, &obj_size);

        H5ObjectHeader::attribute_t attr;
        H5ObjectHeader::readAttribute(context, obj_pos, obj_size, &attr);
        search->all->push_back(attr);
    }
    catch(const RunTimeException& e)
    {
        mlog(WARNING, "Skipping dense attribute of 0x%lx at record 0x%lx: %s", (unsigned long)search->owner, (unsigned long)record_pos, e.what());
    }

    return true;
}
