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

#include "H5ObjectHeader.h"
#include "EventLib.h"

using H5Stream::MAX_NDIMS;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5ObjectHeader::H5ObjectHeader (H5Context* _context, uint64_t _address):
    address         (_address),
    version         (0),
    groupInfo       (false),
    sharedDatatype  (false),
    context         (_context),
    hdrFlags        (0),
    messageIndex    (0)
{
    dataspace       = {false, 0, false, {}};
    datatype        = {false, UNKNOWN_TYPE, 0, false, false, false, H5Stream::INVALID_TYPE};
    fill            = {false, {}};
    layout          = {false, H5Stream::UNKNOWN_LAYOUT, H5Stream::NO_INDEX, 0, 0, {}, 0, 0, 0, 0, 0};
    linkInfo        = {false, 0, 0, 0};
    symbolTable     = {false, 0, 0};
    attributeInfo   = {false, 0, 0, 0};

    std::vector<block_t> continuations;

    /* Peek at Version */
    uint64_t peek_pos = address;
    const uint8_t peek = static_cast<uint8_t>(context->readField(1, &peek_pos));
    if(peek == 1)   readObjHdrV1(continuations);
    else            readObjHdr(continuations);

    /* Continuation blocks may themselves carry continuations */
    for(size_t c = 0; c < continuations.size(); c++)
    {
        if(continuations.size() > MAX_CONTINUATIONS)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "object header 0x%lx exceeds %d continuation blocks", (unsigned long)address, MAX_CONTINUATIONS);
        }

        for(size_t p = 0; p < c; p++)
        {
            if(continuations[p].pos == continuations[c].pos)
            {
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "object header 0x%lx continuation block 0x%lx is repeated", (unsigned long)address, (unsigned long)continuations[c].pos);
            }
        }

        const block_t block = continuations[c];
        readContinuation(block, continuations);
    }
}

/*----------------------------------------------------------------------------
 * isDataset
 *----------------------------------------------------------------------------*/
bool H5ObjectHeader::isDataset (void) const
{
    return layout.present;
}

/*----------------------------------------------------------------------------
 * isGroup
 *----------------------------------------------------------------------------*/
bool H5ObjectHeader::isGroup (void) const
{
    return symbolTable.present || linkInfo.present || groupInfo || !links.empty();
}

/*----------------------------------------------------------------------------
 * readDatatype
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readDatatype (H5Context* context, uint64_t pos, datatype_t* dt)
{
    const uint64_t starting_position = pos;

    /* Read Message Info */
    const uint64_t version_class = context->readField(4, &pos);
    const int size = static_cast<int>(context->readField(4, &pos));
    const uint64_t type_version = (version_class & 0xF0) >> 4;
    const uint64_t databits = version_class >> 8;

    if(type_version < 1 || type_version > 5)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid datatype version %d at 0x%lx", (int)type_version, (unsigned long)starting_position);
    }

    dt->present     = true;
    dt->typeClass   = static_cast<type_class_t>(version_class & 0x0F);
    dt->size        = size;
    dt->signedval   = false;
    dt->bigEndian   = false;
    dt->vlenString  = false;
    dt->dtype       = H5Stream::INVALID_TYPE;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Datatype Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Version:                                                         %d\n", (int)type_version);
        print2term("Data Class:                                                      %d, %s\n", (int)dt->typeClass, class2str(dt->typeClass));
        print2term("Data Size:                                                       %d\n", size);
    }

    /* Read Data Class Properties */
    switch(dt->typeClass)
    {
        case FIXED_POINT_TYPE:
        {
            dt->signedval = (databits & 0x08) != 0;
            dt->bigEndian = (databits & 0x01) != 0;
            pos += 4; // bit offset and precision

            switch(size)
            {
                case 1: dt->dtype = dt->signedval ? H5Stream::INT8  : H5Stream::UINT8;   break;
                case 2: dt->dtype = dt->signedval ? H5Stream::INT16 : H5Stream::UINT16;  break;
                case 4: dt->dtype = dt->signedval ? H5Stream::INT32 : H5Stream::UINT32;  break;
                case 8: dt->dtype = dt->signedval ? H5Stream::INT64 : H5Stream::UINT64;  break;
                default: break;
            }
            break;
        }

        case FLOATING_POINT_TYPE:
        {
            const unsigned int byte_order = ((databits & 0x40) >> 5) | (databits & 0x1);
            if(byte_order > 1)
            {
                throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported floating point byte order %u at 0x%lx", byte_order, (unsigned long)starting_position);
            }
            dt->bigEndian = byte_order == 1;

            if(!H5STREAM_VERBOSE)
            {
                pos += 12;
            }
            else
            {
                const uint16_t bit_offset     = (uint16_t)context->readField(2, &pos);
                const uint16_t bit_precision  = (uint16_t)context->readField(2, &pos);
                const uint8_t  exp_location   =  (uint8_t)context->readField(1, &pos);
                const uint8_t  exp_size       =  (uint8_t)context->readField(1, &pos);
                const uint8_t  mant_location  =  (uint8_t)context->readField(1, &pos);
                const uint8_t  mant_size      =  (uint8_t)context->readField(1, &pos);
                const uint32_t exp_bias       = (uint32_t)context->readField(4, &pos);

                print2term("Byte Order:                                                      %d\n", (int)byte_order);
                print2term("Bit Offset:                                                      %d\n", (int)bit_offset);
                print2term("Bit Precision:                                                   %d\n", (int)bit_precision);
                print2term("Exponent Location:                                               %d\n", (int)exp_location);
                print2term("Exponent Size:                                                   %d\n", (int)exp_size);
                print2term("Mantissa Location:                                               %d\n", (int)mant_location);
                print2term("Mantissa Size:                                                   %d\n", (int)mant_size);
                print2term("Exponent Bias:                                                   %d\n", (int)exp_bias);
            }

            switch(size)
            {
                case 2: dt->dtype = H5Stream::FLOAT16; break;
                case 4: dt->dtype = H5Stream::FLOAT32; break;
                case 8: dt->dtype = H5Stream::FLOAT64; break;
                default: break;
            }
            break;
        }

        case STRING_TYPE:
        {
            break; // padding and character set carried in the class bits
        }

        case VARIABLE_LENGTH_TYPE:
        {
            dt->vlenString = (databits & 0xF) == 1;

            /* Base Type */
            datatype_t base;
            pos += readDatatype(context, pos, &base);
            break;
        }

        default:
        {
            /* properties not decoded, callers skip by the declared size */
            break;
        }
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readDataspace
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readDataspace (H5Context* context, uint64_t pos, dataspace_t* ds)
{
    static const int MAX_DIM_PRESENT    = 0x1;
    static const int PERM_INDEX_PRESENT = 0x2;

    const uint64_t starting_position = pos;

    const uint8_t ds_version      = (uint8_t)context->readField(1, &pos);
    const uint8_t dimensionality  = (uint8_t)context->readField(1, &pos);
    const uint8_t flags           = (uint8_t)context->readField(1, &pos);

    bool null_space = false;
    if(ds_version == 1)
    {
        pos += 5; // reserved
    }
    else if(ds_version == 2)
    {
        null_space = context->readField(1, &pos) == 2;
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid dataspace version %d at 0x%lx", (int)ds_version, (unsigned long)starting_position);
    }

    if(dimensionality > MAX_NDIMS)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported number of dimensions: %d", dimensionality);
    }

    ds->present = true;
    ds->rank = dimensionality;
    ds->null = null_space;
    ds->dims.clear();
    for(int d = 0; d < dimensionality; d++)
    {
        ds->dims.push_back(context->readField(context->lengthSize, &pos));
    }

    /* Skip Over Maximum Dimensions */
    if(flags & MAX_DIM_PRESENT)
    {
        pos += dimensionality * context->lengthSize;
    }

    /* Skip Over Permutation Indexes */
    if((ds_version == 1) && (flags & PERM_INDEX_PRESENT))
    {
        pos += dimensionality * context->lengthSize;
    }

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Dataspace Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Version:                                                         %d\n", (int)ds_version);
        print2term("Dimensionality:                                                  %d\n", (int)dimensionality);
        for(int d = 0; d < dimensionality; d++)
        {
            print2term("Dimension %d:                                                     %lu\n", d, (unsigned long)ds->dims[d]);
        }
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readLink
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readLink (H5Context* context, uint64_t pos, link_t* link)
{
    static const int SIZE_OF_LEN_OF_NAME_MASK   = 0x03;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x04;
    static const int LINK_TYPE_PRESENT_BIT      = 0x08;
    static const int CHAR_SET_PRESENT_BIT       = 0x10;

    const uint64_t starting_position = pos;

    const uint64_t link_version = context->readField(1, &pos);
    const uint64_t flags = context->readField(1, &pos);
    if(link_version != 1)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid link version %d at 0x%lx", (int)link_version, (unsigned long)starting_position);
    }

    /* Read Link Type */
    uint8_t link_type = HARD_LINK;
    if(flags & LINK_TYPE_PRESENT_BIT)
    {
        link_type = (uint8_t)context->readField(1, &pos);
    }

    /* Skip Creation Order and Character Set */
    if(flags & CREATE_ORDER_PRESENT_BIT) pos += 8;
    if(flags & CHAR_SET_PRESENT_BIT) pos += 1;

    /* Read Link Name */
    const int link_name_len_of_len = 1 << (flags & SIZE_OF_LEN_OF_NAME_MASK);
    const uint64_t link_name_len = context->readField(link_name_len_of_len, &pos);
    if(link_name_len == 0 || link_name_len > H5STREAM_MAXIMUM_NAME_SIZE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid link name length %lu at 0x%lx", (unsigned long)link_name_len, (unsigned long)starting_position);
    }

    std::vector<char> link_name(link_name_len);
    context->readByteArray(reinterpret_cast<uint8_t*>(link_name.data()), link_name_len, &pos);
    link->name.assign(link_name.data(), link_name_len);
    link->type = static_cast<link_type_t>(link_type);
    link->address = 0;
    link->target.clear();

    /* Process Link Type */
    if(link_type == HARD_LINK)
    {
        link->address = context->readField(context->offsetSize, &pos);
    }
    else
    {
        /* soft, external and user defined links carry a length prefixed value */
        const uint16_t value_len = (uint16_t)context->readField(2, &pos);
        if(value_len > 0)
        {
            std::vector<char> value(value_len);
            context->readByteArray(reinterpret_cast<uint8_t*>(value.data()), value_len, &pos);
            link->target.assign(value.data(), value_len);
        }
    }

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Link Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Link Type:                                                       %d\n", (int)link_type);
        print2term("Link Name:                                                       %s\n", link->name.c_str());
        if(link_type == HARD_LINK)  print2term("Hard Link - Object Header Address:                               0x%lx\n", (unsigned long)link->address);
        else                        print2term("Link Value:                                                      %s\n", link->target.c_str());
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readAttribute
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readAttribute (H5Context* context, uint64_t pos, uint64_t size, attribute_t* attr)
{
    static const int SHARED_PARTS_MASK = 0x03;

    const uint64_t starting_position = pos;

    /* Read Message Info */
    const uint64_t attr_version = context->readField(1, &pos);
    const uint64_t flags = context->readField(1, &pos);
    if(attr_version < 1 || attr_version > 3)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid attribute version %d at 0x%lx", (int)attr_version, (unsigned long)starting_position);
    }

    /* Get Sizes */
    const uint64_t name_size = context->readField(2, &pos);
    const uint64_t datatype_size = context->readField(2, &pos);
    const uint64_t dataspace_size = context->readField(2, &pos);
    if(attr_version == 3) pos += 1; // name character set

    /* Read Attribute Name */
    if(name_size == 0 || name_size > H5STREAM_MAXIMUM_NAME_SIZE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid attribute name length %lu at 0x%lx", (unsigned long)name_size, (unsigned long)starting_position);
    }
    std::vector<char> attr_name(name_size);
    context->readByteArray(reinterpret_cast<uint8_t*>(attr_name.data()), name_size, &pos);
    attr->name.assign(attr_name.data(), strnlen(attr_name.data(), name_size));
    if(attr_version == 1) pos += (8 - (name_size % 8)) % 8;

    if((attr_version >= 2) && (flags & SHARED_PARTS_MASK))
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "attribute %s uses a shared datatype or dataspace", attr->name.c_str());
    }

    /* Read Datatype and Dataspace */
    readDatatype(context, pos, &attr->datatype);
    pos += datatype_size;
    if(attr_version == 1) pos += (8 - (datatype_size % 8)) % 8;

    readDataspace(context, pos, &attr->dataspace);
    pos += dataspace_size;
    if(attr_version == 1) pos += (8 - (dataspace_size % 8)) % 8;

    /* Locate Data */
    const uint64_t header_size = pos - starting_position;
    if(header_size > size)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "attribute %s overruns its message: %lu > %lu", attr->name.c_str(), (unsigned long)header_size, (unsigned long)size);
    }
    attr->dataPos = pos;
    attr->dataSize = size - header_size;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Attribute Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Version:                                                         %d\n", (int)attr_version);
        print2term("Name:                                                            %s\n", attr->name.c_str());
        print2term("Data Size:                                                       %lu\n", (unsigned long)attr->dataSize);
    }

    return size;
}

/*----------------------------------------------------------------------------
 * class2str
 *----------------------------------------------------------------------------*/
const char* H5ObjectHeader::class2str (type_class_t type_class)
{
    switch(type_class)
    {
        case FIXED_POINT_TYPE:      return "FIXED_POINT_TYPE";
        case FLOATING_POINT_TYPE:   return "FLOATING_POINT_TYPE";
        case TIME_TYPE:             return "TIME_TYPE";
        case STRING_TYPE:           return "STRING_TYPE";
        case BIT_FIELD_TYPE:        return "BIT_FIELD_TYPE";
        case OPAQUE_TYPE:           return "OPAQUE_TYPE";
        case COMPOUND_TYPE:         return "COMPOUND_TYPE";
        case REFERENCE_TYPE:        return "REFERENCE_TYPE";
        case ENUMERATED_TYPE:       return "ENUMERATED_TYPE";
        case VARIABLE_LENGTH_TYPE:  return "VARIABLE_LENGTH_TYPE";
        case ARRAY_TYPE:            return "ARRAY_TYPE";
        default:                    return "UNKNOWN_TYPE";
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readObjHdr
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readObjHdr (std::vector<block_t>& continuations)
{
    uint64_t pos = address;

    const uint64_t signature = context->readField(4, &pos);
    if(signature != H5_OHDR_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid header signature at 0x%lx: 0x%llX", (unsigned long)address, (unsigned long long)signature);
    }

    version = static_cast<int>(context->readField(1, &pos));
    if(version != 2)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid header version at 0x%lx: %d", (unsigned long)address, version);
    }

    /* Skip Optional Time Fields and Phase Attributes */
    hdrFlags = (uint8_t)context->readField(1, &pos);
    if(hdrFlags & FILE_STATS_BIT) pos += 16;
    if(hdrFlags & STORE_CHANGE_PHASE_BIT) pos += 4;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Object Information: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Header Flags:                                                    0x%x\n", (unsigned)hdrFlags);
    }

    /* Read Header Messages */
    const uint64_t size_of_chunk0 = context->readField(1 << (hdrFlags & SIZE_OF_CHUNK_0_MASK), &pos);
    const uint64_t end_of_hdr = pos + size_of_chunk0;
    readMessages(pos, end_of_hdr, hdrFlags, continuations);

    context->verifyChecksum(address, end_of_hdr, "object header");
}

/*----------------------------------------------------------------------------
 * readObjHdrV1
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readObjHdrV1 (std::vector<block_t>& continuations)
{
    static const int SIZE_OF_V1_PROLOGUE = 16;

    uint64_t pos = address;

    version = static_cast<int>(context->readField(1, &pos));
    const uint8_t reserved0 = (uint8_t)context->readField(1, &pos);
    if(H5STREAM_ERROR_CHECKING && (reserved0 != 0))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid reserved field at 0x%lx: %d", (unsigned long)address, (int)reserved0);
    }

    const uint16_t num_hdr_msgs = (uint16_t)context->readField(2, &pos);
    const uint32_t obj_ref_count = (uint32_t)context->readField(4, &pos);
    const uint32_t obj_hdr_size = (uint32_t)context->readField(4, &pos);

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Object Information V1: 0x%lx\n", (unsigned long)address);
        print2term("----------------\n");
        print2term("Number of Header Messages:                                       %d\n", (int)num_hdr_msgs);
        print2term("Object Reference Count:                                          %d\n", (int)obj_ref_count);
        print2term("Object Header Size:                                              %d\n", (int)obj_hdr_size);
    }
    else
    {
        (void)num_hdr_msgs;
        (void)obj_ref_count;
    }

    /* Messages start on the next 8 byte boundary */
    pos = address + SIZE_OF_V1_PROLOGUE;
    readMessagesV1(pos, pos + obj_hdr_size, continuations);
}

/*----------------------------------------------------------------------------
 * readContinuation
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readContinuation (const block_t& block, std::vector<block_t>& continuations)
{
    uint64_t pos = block.pos;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Header Continuation: 0x%lx, %lu\n", (unsigned long)block.pos, (unsigned long)block.length);
        print2term("----------------\n");
    }

    if(version == 1)
    {
        readMessagesV1(pos, block.pos + block.length, continuations);
    }
    else
    {
        const uint64_t signature = context->readField(4, &pos);
        if(signature != H5_OCHK_SIGNATURE_LE)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid header continuation signature at 0x%lx: 0x%llX", (unsigned long)block.pos, (unsigned long long)signature);
        }

        if(block.length < 8)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "header continuation at 0x%lx too small: %lu", (unsigned long)block.pos, (unsigned long)block.length);
        }

        /* Leave 4 bytes for checksum */
        const uint64_t end_of_chdr = block.pos + block.length - 4;
        readMessages(pos, end_of_chdr, hdrFlags, continuations);
        context->verifyChecksum(block.pos, end_of_chdr, "object header continuation");
    }
}

/*----------------------------------------------------------------------------
 * readMessages
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readMessages (uint64_t pos, uint64_t end, uint8_t hdr_flags, std::vector<block_t>& continuations)
{
    const int prefix_size = (hdr_flags & ATTR_CREATION_TRACK_BIT) ? 6 : 4;

    /* A gap smaller than a message prefix may follow the last message */
    while(pos + prefix_size <= end)
    {
        message_t msg;
        msg.type    = (uint16_t)context->readField(1, &pos);
        msg.size    = (uint16_t)context->readField(2, &pos);
        msg.flags   = (uint8_t)context->readField(1, &pos);
        if(hdr_flags & ATTR_CREATION_TRACK_BIT) pos += 2; // creation order
        msg.pos     = pos;

        if(pos + msg.size > end)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "object header 0x%lx message %d (type 0x%x) at 0x%lx overruns block end 0x%lx",
                                   (unsigned long)address, messageIndex, (unsigned)msg.type, (unsigned long)pos, (unsigned long)end);
        }

        readMessage(msg, continuations);
        pos += msg.size;
    }
}

/*----------------------------------------------------------------------------
 * readMessagesV1
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readMessagesV1 (uint64_t pos, uint64_t end, std::vector<block_t>& continuations)
{
    static const int SIZE_OF_V1_PREFIX = 8;

    while(pos + SIZE_OF_V1_PREFIX <= end)
    {
        message_t msg;
        msg.type    = (uint16_t)context->readField(2, &pos);
        msg.size    = (uint16_t)context->readField(2, &pos);
        msg.flags   = (uint8_t)context->readField(1, &pos);
        pos += 3; // reserved
        msg.pos     = pos;

        if(pos + msg.size > end)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "object header 0x%lx message %d (type 0x%x) at 0x%lx overruns block end 0x%lx",
                                   (unsigned long)address, messageIndex, (unsigned)msg.type, (unsigned long)pos, (unsigned long)end);
        }

        readMessage(msg, continuations);
        pos += msg.size;
    }
}

/*----------------------------------------------------------------------------
 * readMessage
 *----------------------------------------------------------------------------*/
void H5ObjectHeader::readMessage (const message_t& msg, std::vector<block_t>& continuations)
{
    const int index = messageIndex++;
    messages.push_back(msg);

    try
    {
        int bytes_read = msg.size;
        switch(msg.type)
        {
            case DATASPACE_MSG:
            {
                bytes_read = readDataspace(context, msg.pos, &dataspace);
                break;
            }

            case LINK_INFO_MSG:
            {
                bytes_read = readLinkInfoMsg(msg.pos, &linkInfo, false);
                break;
            }

            case DATATYPE_MSG:
            {
                if(msg.flags & SHARED_MSG_BIT)  sharedDatatype = true;
                else                            bytes_read = readDatatype(context, msg.pos, &datatype);
                break;
            }

            case FILL_VALUE_OLD_MSG:
            case FILL_VALUE_MSG:
            {
                bytes_read = readFillValueMsg(msg.pos, msg.type);
                break;
            }

            case LINK_MSG:
            {
                link_t link;
                bytes_read = readLink(context, msg.pos, &link);
                links.push_back(link);
                break;
            }

            case DATA_LAYOUT_MSG:
            {
                bytes_read = readDataLayoutMsg(msg.pos);
                break;
            }

            case GROUP_INFO_MSG:
            {
                groupInfo = true;
                break;
            }

            case FILTER_MSG:
            {
                bytes_read = readFilterMsg(msg.pos);
                break;
            }

            case ATTRIBUTE_MSG:
            {
                /* a bad attribute costs only that attribute */
                try
                {
                    attribute_t attr;
                    readAttribute(context, msg.pos, msg.size, &attr);
                    attributes.push_back(attr);
                }
                catch(const RunTimeException& e)
                {
                    mlog(WARNING, "Skipping attribute in object header 0x%lx message %d: %s", (unsigned long)address, index, e.what());
                }
                break;
            }

            case HEADER_CONT_MSG:
            {
                uint64_t pos = msg.pos;
                block_t block;
                block.pos = context->readField(context->offsetSize, &pos);
                block.length = context->readField(context->lengthSize, &pos);
                continuations.push_back(block);
                bytes_read = context->offsetSize + context->lengthSize;
                break;
            }

            case SYMBOL_TABLE_MSG:
            {
                uint64_t pos = msg.pos;
                symbolTable.present = true;
                symbolTable.btreeAddress = context->readField(context->offsetSize, &pos);
                symbolTable.heapAddress = context->readField(context->offsetSize, &pos);
                bytes_read = context->offsetSize * 2;
                break;
            }

            case ATTRIBUTE_INFO_MSG:
            {
                bytes_read = readLinkInfoMsg(msg.pos, &attributeInfo, true);
                break;
            }

            default:
            {
                if(H5STREAM_VERBOSE)
                {
                    print2term("Skipped Message [%d]: 0x%x, %d, 0x%lx\n", index, (int)msg.type, (int)msg.size, (unsigned long)msg.pos);
                }
                break;
            }
        }

        if(bytes_read > msg.size)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "decoded %d bytes of a %d byte message", bytes_read, (int)msg.size);
        }
    }
    catch(const RunTimeException& e)
    {
        throw RunTimeException(e.level(), e.code(), "object header 0x%lx message %d (type 0x%x): %s", (unsigned long)address, index, (unsigned)msg.type, e.what());
    }
}

/*----------------------------------------------------------------------------
 * readFillValueMsg
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readFillValueMsg (uint64_t pos, int type)
{
    static const uint8_t FILL_VALUE_DEFINED_BIT = 0x20;

    const uint64_t starting_position = pos;
    uint32_t fill_size = 0;

    if(type == FILL_VALUE_OLD_MSG)
    {
        fill_size = (uint32_t)context->readField(4, &pos);
    }
    else
    {
        const uint64_t fill_version = context->readField(1, &pos);
        if(fill_version == 1 || fill_version == 2)
        {
            pos += 2; // space allocation and fill value write times
            const uint8_t fill_value_defined = (uint8_t)context->readField(1, &pos);
            if(fill_version == 1 || fill_value_defined)
            {
                fill_size = (uint32_t)context->readField(4, &pos);
            }
        }
        else if(fill_version == 3)
        {
            const uint8_t flags = (uint8_t)context->readField(1, &pos);
            if(flags & FILL_VALUE_DEFINED_BIT)
            {
                fill_size = (uint32_t)context->readField(4, &pos);
            }
        }
        else
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid fill value version: %d", (int)fill_version);
        }
    }

    if(fill_size > 0)
    {
        fill.defined = true;
        fill.value.resize(fill_size);
        context->readByteArray(fill.value.data(), fill_size, &pos);
    }

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Fill Value Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Fill Value Size:                                                 %u\n", fill_size);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readDataLayoutMsg
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readDataLayoutMsg (uint64_t pos)
{
    static const uint8_t SINGLE_INDEX_WITH_FILTER = 0x02;

    const uint64_t starting_position = pos;

    /* Read Message Info */
    const uint64_t layout_version = context->readField(1, &pos);
    std::vector<uint64_t> dims;

    if(layout_version == 1 || layout_version == 2)
    {
        const int dimensionality = (int)context->readField(1, &pos);
        layout.layout = static_cast<H5Stream::layout_t>(context->readField(1, &pos));
        pos += 5; // reserved

        if(layout.layout != H5Stream::COMPACT_LAYOUT)
        {
            layout.address = context->readField(context->offsetSize, &pos);
        }

        for(int d = 0; d < dimensionality; d++)
        {
            dims.push_back(context->readField(4, &pos));
        }

        if(layout.layout == H5Stream::COMPACT_LAYOUT)
        {
            layout.size = context->readField(4, &pos);
            layout.address = pos;
            pos += layout.size;
        }
        else if(layout.layout == H5Stream::CONTIGUOUS_LAYOUT)
        {
            layout.size = 1;
            for(uint64_t dim: dims) layout.size *= dim;
        }
        else if(layout.layout == H5Stream::CHUNKED_LAYOUT)
        {
            layout.indexKind = H5Stream::BTREE_V1_INDEX;
        }
        else
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid data layout class: %d", (int)layout.layout);
        }
    }
    else if(layout_version == 3 || layout_version == 4)
    {
        layout.layout = static_cast<H5Stream::layout_t>(context->readField(1, &pos));
        switch(layout.layout)
        {
            case H5Stream::COMPACT_LAYOUT:
            {
                layout.size = (uint16_t)context->readField(2, &pos);
                layout.address = pos;
                pos += layout.size;
                break;
            }

            case H5Stream::CONTIGUOUS_LAYOUT:
            {
                layout.address = context->readField(context->offsetSize, &pos);
                layout.size = context->readField(context->lengthSize, &pos);
                break;
            }

            case H5Stream::CHUNKED_LAYOUT:
            {
                if(layout_version == 3)
                {
                    const int dimensionality = (int)context->readField(1, &pos);
                    layout.address = context->readField(context->offsetSize, &pos);
                    for(int d = 0; d < dimensionality; d++)
                    {
                        dims.push_back(context->readField(4, &pos));
                    }
                    layout.indexKind = H5Stream::BTREE_V1_INDEX;
                }
                else
                {
                    layout.flags = (uint8_t)context->readField(1, &pos);
                    const int dimensionality = (int)context->readField(1, &pos);
                    const int dim_size = (int)context->readField(1, &pos);
                    if(dim_size < 1 || dim_size > 8)
                    {
                        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk dimension encoding size: %d", dim_size);
                    }

                    for(int d = 0; d < dimensionality; d++)
                    {
                        dims.push_back(context->readField(dim_size, &pos));
                    }

                    const int index_type = (int)context->readField(1, &pos);
                    switch(index_type)
                    {
                        case 1:
                        {
                            layout.indexKind = H5Stream::SINGLE_CHUNK_INDEX;
                            if(layout.flags & SINGLE_INDEX_WITH_FILTER)
                            {
                                layout.filteredSize = context->readField(context->lengthSize, &pos);
                                layout.filterMask = (uint32_t)context->readField(4, &pos);
                            }
                            break;
                        }
                        case 2: layout.indexKind = H5Stream::IMPLICIT_INDEX; break;
                        case 3:
                        {
                            layout.indexKind = H5Stream::FIXED_ARRAY_INDEX;
                            layout.pageBits = (uint8_t)context->readField(1, &pos);
                            break;
                        }
                        case 4:
                        {
                            layout.indexKind = H5Stream::EXTENSIBLE_ARRAY_INDEX;
                            pos += 5; // max bits, index elements, min pointers, min elements, page bits
                            break;
                        }
                        case 5:
                        {
                            layout.indexKind = H5Stream::BTREE_V2_INDEX;
                            pos += 6; // node size, split and merge percents
                            break;
                        }
                        default:
                        {
                            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk index type: %d", index_type);
                        }
                    }

                    layout.address = context->readField(context->offsetSize, &pos);
                }
                break;
            }

            case H5Stream::VIRTUAL_LAYOUT:
            {
                pos += context->offsetSize + 4; // global heap address and index
                break;
            }

            default:
            {
                throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid data layout class: %d", (int)layout.layout);
            }
        }
    }
    else
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported data layout version: %d", (int)layout_version);
    }

    /* Chunk dimensions carry a trailing element size dimension */
    if(layout.layout == H5Stream::CHUNKED_LAYOUT)
    {
        if(dims.size() < 2)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid chunk dimensionality: %d", (int)dims.size());
        }
        if(dims.size() - 1 > static_cast<size_t>(MAX_NDIMS))
        {
            throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported number of chunk dimensions: %d", (int)dims.size() - 1);
        }

        layout.elementSize = static_cast<uint32_t>(dims.back());
        layout.chunkDims.assign(dims.begin(), dims.end() - 1);
        for(uint64_t dim: layout.chunkDims)
        {
            if(dim == 0) throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "zero chunk dimension");
        }
    }

    layout.present = true;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("Data Layout Message: 0x%lx\n", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Version:                                                         %d\n", (int)layout_version);
        print2term("Layout:                                                          %d, %s\n", (int)layout.layout, H5Stream::layout2str(layout.layout));
        print2term("Index:                                                           %s\n", H5Stream::index2str(layout.indexKind));
        print2term("Address:                                                         0x%lx\n", (unsigned long)layout.address);
        for(size_t d = 0; d < layout.chunkDims.size(); d++)
        {
            print2term("Chunk Dimension %d:                                               %lu\n", (int)d, (unsigned long)layout.chunkDims[d]);
        }
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readFilterMsg
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readFilterMsg (uint64_t pos)
{
    const uint64_t starting_position = pos;

    /* Read Message Info */
    const uint64_t filter_version = context->readField(1, &pos);
    const uint32_t num_filters = (uint32_t)context->readField(1, &pos);
    if((filter_version != 1) && (filter_version != 2))
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid filter version: %d", (int)filter_version);
    }

    /* Move past reserved bytes in version 1 */
    if(filter_version == 1) pos += 6;

    /* Read Filters */
    filters.clear();
    for(uint32_t f = 0; f < num_filters; f++)
    {
        filter_t filter;
        filter.id = (int)context->readField(2, &pos);

        uint16_t name_len = 0;
        if(filter_version == 1 || filter.id >= 256)
        {
            name_len = (uint16_t)context->readField(2, &pos);
        }

        filter.flags = (uint16_t)context->readField(2, &pos);
        const uint16_t num_parms = (uint16_t)context->readField(2, &pos);

        /* Read Name */
        if(name_len > 0)
        {
            std::vector<char> filter_name(name_len);
            context->readByteArray(reinterpret_cast<uint8_t*>(filter_name.data()), name_len, &pos);
            filter.name.assign(filter_name.data(), strnlen(filter_name.data(), name_len));
            if(filter_version == 1) pos += (8 - (name_len % 8)) % 8;
        }

        /* Client Data */
        for(uint16_t p = 0; p < num_parms; p++)
        {
            filter.parms.push_back((uint32_t)context->readField(4, &pos));
        }

        /* Handle Padding (version 1 only) */
        if((filter_version == 1) && (num_parms % 2 == 1))
        {
            pos += 4;
        }

        if(H5STREAM_VERBOSE)
        {
            print2term("Filter Identification Value:                                     %d, %s\n", filter.id, H5Stream::filter2str(filter.id));
            print2term("Flags:                                                           0x%x\n", (int)filter.flags);
            print2term("Number Client Data Values:                                       %d\n", (int)num_parms);
        }

        filters.push_back(filter);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}

/*----------------------------------------------------------------------------
 * readLinkInfoMsg - link info and attribute info share a layout
 *----------------------------------------------------------------------------*/
int H5ObjectHeader::readLinkInfoMsg (uint64_t pos, link_info_t* info, bool attributes)
{
    static const int MAX_CREATE_PRESENT_BIT     = 0x01;
    static const int CREATE_ORDER_PRESENT_BIT   = 0x02;

    const uint64_t starting_position = pos;

    const uint64_t info_version = context->readField(1, &pos);
    const uint64_t flags = context->readField(1, &pos);
    if(info_version != 0)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid %s info version: %d", attributes ? "attribute" : "link", (int)info_version);
    }

    /* Skip Maximum Creation Index */
    if(flags & MAX_CREATE_PRESENT_BIT)
    {
        pos += attributes ? 2 : 8;
    }

    /* Read Heap and Name Index Addresses */
    info->present = true;
    info->heapAddress = context->readField(context->offsetSize, &pos);
    info->nameIndexAddress = context->readField(context->offsetSize, &pos);
    info->orderIndexAddress = 0;
    if(flags & CREATE_ORDER_PRESENT_BIT)
    {
        info->orderIndexAddress = context->readField(context->offsetSize, &pos);
    }

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("%s Information Message: 0x%lx\n", attributes ? "Attribute" : "Link", (unsigned long)starting_position);
        print2term("----------------\n");
        print2term("Heap Address:                                                    %lX\n", (unsigned long)info->heapAddress);
        print2term("Name Index:                                                      %lX\n", (unsigned long)info->nameIndexAddress);
    }

    /* Return Bytes Read */
    const uint64_t ending_position = pos;
    return ending_position - starting_position;
}
