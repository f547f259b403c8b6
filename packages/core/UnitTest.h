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

#ifndef __unittest__
#define __unittest__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#define ut_initialize(obj)      (obj)->_ut_initialize()
#define ut_assert(obj,e,...)    (obj)->_ut_assert(e,__FILE__,__LINE__,__VA_ARGS__)
#define ut_status(obj)          (obj)->_ut_status()

/******************************************************************************
 * CLASS
 ******************************************************************************/

class UnitTest
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int UT_MAX_ASSERT = 256;

        /*--------------------------------------------------------------------
         * Types
         *--------------------------------------------------------------------*/

        typedef bool (*test_func_t) (UnitTest* ut);

        typedef struct {
            const char*     name;
            test_func_t     func;
        } test_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit    UnitTest        (const char* _suite);
        virtual     ~UnitTest       (void) = default;

        bool        _ut_initialize  (void);
        bool        _ut_assert      (bool e, const char* file, int line, const char* fmt, ...) VARG_CHECK(printf, 5, 6);
        bool        _ut_status      (void);

        bool        run             (const test_t* tests);

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const char* suite;
        int failures;
        Mutex lock;
};

#endif  /* __unittest__ */
