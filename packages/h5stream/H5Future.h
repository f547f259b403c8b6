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

#ifndef __h5future__
#define __h5future__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "H5Stream.h"

#include <memory>
#include <string>

/******************************************************************************
 * H5FUTURE CLASS
 ******************************************************************************/

/*
 * Result of one chunk fetch, shared by every caller that asked for the same
 * chunk while it was in flight. A completed future holds either a chunk, no
 * chunk (not allocated), or the error that ended the fetch.
 */
class H5Future
{
    public:

        /*--------------------------------------------------------------------
        * Typedefs
        *--------------------------------------------------------------------*/

        typedef std::shared_ptr<const H5Stream::TypedArray> result_t;

        typedef enum {
            INVALID     = -1,
            TIMEOUT     = 0,
            COMPLETE    = 1
        } rc_t;

        /*--------------------------------------------------------------------
        * Methods
        *--------------------------------------------------------------------*/

                    H5Future    (void);
                    ~H5Future   (void) = default;

        rc_t        wait        (int timeout);
        void        finish      (result_t _result);
        void        fail        (int code, const char* msg);
        result_t    get         (void);

    private:

        /*--------------------------------------------------------------------
        * Data
        *--------------------------------------------------------------------*/

        Cond        sync;
        bool        complete;
        bool        valid;      // set when the fetch did not fail
        result_t    result;
        int         errorCode;
        std::string error;
};

#endif  /* __h5future__ */
