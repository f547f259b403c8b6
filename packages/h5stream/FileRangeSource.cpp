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

#include "FileRangeSource.h"
#include "EventLib.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using H5Stream::FileRangeSource;

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
FileRangeSource::FileRangeSource (const char* _path):
    path(_path),
    fd(-1)
{
    fd = open(_path, O_RDONLY);
    if(fd < 0)
    {
        const int rc = (errno == ENOENT) ? RTE_RESOURCE_DOES_NOT_EXIST : RTE_IO_ERROR;
        throw RunTimeException(CRITICAL, rc, "failed to open %s: %s", _path, strerror(errno));
    }
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
FileRangeSource::~FileRangeSource (void)
{
    if(fd >= 0) close(fd);
}

/*----------------------------------------------------------------------------
 * read
 *----------------------------------------------------------------------------*/
int64_t FileRangeSource::read (uint8_t* data, int64_t size, uint64_t pos)
{
    int64_t bytes_read = 0;
    while(bytes_read < size)
    {
        const ssize_t ret = pread(fd, &data[bytes_read], size - bytes_read, pos + bytes_read);
        if(ret < 0)
        {
            if(errno == EINTR) continue;
            throw RunTimeException(CRITICAL, RTE_IO_ERROR, "failed to read %ld bytes at 0x%lx from %s: %s", (long)size, (unsigned long)pos, path.c_str(), strerror(errno));
        }
        if(ret == 0) break; // end of file
        bytes_read += ret;
    }

    return bytes_read;
}

/*----------------------------------------------------------------------------
 * origin
 *----------------------------------------------------------------------------*/
const char* FileRangeSource::origin (void) const
{
    return path.c_str();
}

/*----------------------------------------------------------------------------
 * length
 *----------------------------------------------------------------------------*/
int64_t FileRangeSource::length (void)
{
    struct stat st;
    if(fstat(fd, &st) != 0)
    {
        mlog(WARNING, "Unable to stat %s: %s", path.c_str(), strerror(errno));
        return -1;
    }
    return st.st_size;
}
