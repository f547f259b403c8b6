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

#include "H5Superblock.h"
#include "H5Stream.h"

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * read
 *
 *  sets the context's field widths as a side effect
 *----------------------------------------------------------------------------*/
H5Superblock H5Superblock::read (H5Context* context)
{
    H5Superblock sb;
    uint64_t pos = 0;

    /* Signature and Version */
    const uint64_t signature = context->readField(8, &pos);
    if(signature != H5_SIGNATURE_LE)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid h5 file signature: 0x%llX", (unsigned long long)signature);
    }

    sb.version = static_cast<int>(context->readField(1, &pos));
    if(sb.version > 3)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported h5 file superblock version: %d", sb.version);
    }

    /* Super Block Version 0 and 1 */
    if(sb.version <= 1)
    {
        if(H5STREAM_ERROR_CHECKING)
        {
            const uint64_t freespace_version = context->readField(1, &pos);
            if(freespace_version != 0)
            {
                throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported h5 file free space version: %d", (int)freespace_version);
            }

            const uint64_t roottable_version = context->readField(1, &pos);
            if(roottable_version != 0)
            {
                throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported h5 file root table version: %d", (int)roottable_version);
            }
        }

        /* Read Sizes */
        pos = 13;
        sb.offsetSize = static_cast<int>(context->readField(1, &pos));
        sb.lengthSize = static_cast<int>(context->readField(1, &pos));
    }
    /* Super Block Version 2 and 3 */
    else
    {
        pos = 9;
        sb.offsetSize = static_cast<int>(context->readField(1, &pos));
        sb.lengthSize = static_cast<int>(context->readField(1, &pos));
    }

    /* Check Sizes */
    if(sb.offsetSize < 2 || sb.offsetSize > 8 || sb.lengthSize < 2 || sb.lengthSize > 8)
    {
        throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "invalid h5 field sizes: offsets %d, lengths %d", sb.offsetSize, sb.lengthSize);
    }
    context->setSizes(sb.offsetSize, sb.lengthSize);

    /* Read Addresses */
    if(sb.version <= 1)
    {
        /* version 1 adds the indexed storage K and two reserved bytes */
        const uint64_t addr_start = (sb.version == 0) ? 24 : 28;
        pos = addr_start;
        sb.baseAddress = context->readField(sb.offsetSize, &pos);
        pos = addr_start + (2 * sb.offsetSize);
        sb.eofAddress = context->readField(sb.offsetSize, &pos);

        /* root group symbol table entry: link name offset, then header address */
        pos = addr_start + (5 * sb.offsetSize);
        sb.rootGroupAddress = context->readField(sb.offsetSize, &pos);
    }
    else
    {
        pos = 12;
        sb.baseAddress = context->readField(sb.offsetSize, &pos);
        pos = 12 + (2 * sb.offsetSize);
        sb.eofAddress = context->readField(sb.offsetSize, &pos);
        sb.rootGroupAddress = context->readField(sb.offsetSize, &pos);

        /* Verify Checksum */
        const int64_t checked_size = 12 + (4 * sb.offsetSize);
        uint8_t buffer[12 + (4 * 8)];
        uint64_t buffer_pos = 0;
        context->readByteArray(buffer, checked_size, &buffer_pos);
        const uint32_t checksum = static_cast<uint32_t>(context->readField(4, &buffer_pos));
        const uint32_t computed = H5Stream::checksumLookup3(buffer, checked_size, 0);
        if(checksum != computed)
        {
            throw RunTimeException(CRITICAL, RTE_FORMAT_ERROR, "superblock checksum mismatch: 0x%08X != 0x%08X", checksum, computed);
        }
    }

    if(sb.baseAddress != 0)
    {
        throw RunTimeException(CRITICAL, RTE_UNSUPPORTED_FORMAT, "unsupported h5 file base address: %lu", (unsigned long)sb.baseAddress);
    }

    context->endOfFile = context->isUndefined(sb.eofAddress) ? 0 : sb.eofAddress;

    if(H5STREAM_VERBOSE)
    {
        print2term("\n----------------\n");
        print2term("File Information\n");
        print2term("----------------\n");
        print2term("Superblock Version:                                              %d\n",      sb.version);
        print2term("Size of Offsets:                                                 %d\n",      sb.offsetSize);
        print2term("Size of Lengths:                                                 %d\n",      sb.lengthSize);
        print2term("End of File Address:                                             0x%lX\n",   (unsigned long)sb.eofAddress);
        print2term("Root Object Header Address:                                      0x%lX\n",   (unsigned long)sb.rootGroupAddress);
    }

    return sb;
}
