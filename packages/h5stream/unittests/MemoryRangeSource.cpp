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

#include "MemoryRangeSource.h"

#include <cstring>

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
MemoryRangeSource::MemoryRangeSource (const std::vector<uint8_t>& _image, const char* _name):
    image(_image),
    name(_name),
    latency(0.0),
    failures(0),
    failPosition(NO_POSITION),
    numReads(0),
    numBytes(0)
{
}

/*----------------------------------------------------------------------------
 * read
 *----------------------------------------------------------------------------*/
int64_t MemoryRangeSource::read (uint8_t* data, int64_t size, uint64_t pos)
{
    bool fail = false;
    double delay = 0.0;

    mut.lock();
    {
        numReads++;
        positions[pos]++;
        if(failures > 0)
        {
            failures--;
            fail = true;
        }
        if(pos == failPosition) fail = true;
        delay = latency;
    }
    mut.unlock();

    if(delay > 0.0) OsApi::sleep(delay);

    if(fail)
    {
        throw RunTimeException(ERROR, RTE_IO_ERROR, "injected failure reading %ld bytes at 0x%lx", (long)size, (unsigned long)pos);
    }

    if(pos >= image.size()) return 0;
    const int64_t bytes = MIN(size, static_cast<int64_t>(image.size() - pos));
    memcpy(data, &image[pos], bytes);

    mut.lock();
    numBytes += bytes;
    mut.unlock();

    return bytes;
}

/*----------------------------------------------------------------------------
 * origin
 *----------------------------------------------------------------------------*/
const char* MemoryRangeSource::origin (void) const
{
    return name;
}

/*----------------------------------------------------------------------------
 * length
 *----------------------------------------------------------------------------*/
int64_t MemoryRangeSource::length (void)
{
    return static_cast<int64_t>(image.size());
}

/*----------------------------------------------------------------------------
 * setLatency
 *----------------------------------------------------------------------------*/
void MemoryRangeSource::setLatency (double secs)
{
    mut.lock();
    latency = secs;
    mut.unlock();
}

/*----------------------------------------------------------------------------
 * failNext - the next count reads throw
 *----------------------------------------------------------------------------*/
void MemoryRangeSource::failNext (int count)
{
    mut.lock();
    failures = count;
    mut.unlock();
}

/*----------------------------------------------------------------------------
 * failAt - every read starting at pos throws
 *----------------------------------------------------------------------------*/
void MemoryRangeSource::failAt (uint64_t pos)
{
    mut.lock();
    failPosition = pos;
    mut.unlock();
}

/*----------------------------------------------------------------------------
 * reads
 *----------------------------------------------------------------------------*/
long MemoryRangeSource::reads (void)
{
    mut.lock();
    const long n = numReads;
    mut.unlock();
    return n;
}

/*----------------------------------------------------------------------------
 * bytesRead
 *----------------------------------------------------------------------------*/
int64_t MemoryRangeSource::bytesRead (void)
{
    mut.lock();
    const int64_t n = numBytes;
    mut.unlock();
    return n;
}

/*----------------------------------------------------------------------------
 * readsAt
 *----------------------------------------------------------------------------*/
int MemoryRangeSource::readsAt (uint64_t pos)
{
    int n = 0;
    mut.lock();
    {
        std::map<uint64_t, int>::const_iterator iter = positions.find(pos);
        if(iter != positions.end()) n = iter->second;
    }
    mut.unlock();
    return n;
}
