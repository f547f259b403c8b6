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

#include "H5Future.h"
#include "OsApi.h"

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Future::H5Future (void):
    complete    (false),
    valid       (false),
    errorCode   (RTE_INFO)
{
}

/*----------------------------------------------------------------------------
 * wait
 *----------------------------------------------------------------------------*/
H5Future::rc_t H5Future::wait (int timeout)
{
    rc_t rc;

    sync.lock();
    {
        if(timeout == IO_PEND)
        {
            while(!complete) sync.wait(0, IO_PEND);
        }
        else if(!complete)
        {
            sync.wait(0, timeout);
        }

        if      (!complete) rc = TIMEOUT;
        else if (!valid)    rc = INVALID;
        else                rc = COMPLETE;
    }
    sync.unlock();

    return rc;
}

/*----------------------------------------------------------------------------
 * finish
 *----------------------------------------------------------------------------*/
void H5Future::finish (result_t _result)
{
    sync.lock();
    {
        result = _result;
        valid = true;
        complete = true;
        sync.signal(0, Cond::NOTIFY_ALL);
    }
    sync.unlock();
}

/*----------------------------------------------------------------------------
 * fail
 *----------------------------------------------------------------------------*/
void H5Future::fail (int code, const char* msg)
{
    sync.lock();
    {
        errorCode = code;
        error = msg;
        valid = false;
        complete = true;
        sync.signal(0, Cond::NOTIFY_ALL);
    }
    sync.unlock();
}

/*----------------------------------------------------------------------------
 * get - waits for completion, rethrows the fetch error
 *----------------------------------------------------------------------------*/
H5Future::result_t H5Future::get (void)
{
    if(wait(IO_PEND) != COMPLETE)
    {
        sync.lock();
        const int code = errorCode;
        const std::string msg = error;
        sync.unlock();

        throw RunTimeException(ERROR, code, "%s", msg.c_str());
    }

    sync.lock();
    result_t chunk = result;
    sync.unlock();

    return chunk;
}
