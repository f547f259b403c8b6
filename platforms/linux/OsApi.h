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

#ifndef __osapi__
#define __osapi__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <stdio.h>
#include <stdint.h>
#include <string.h>
#include <assert.h>

/******************************************************************************
 * MACROS
 ******************************************************************************/

#ifndef MIN
#define MIN(a,b)    ((a) < (b) ? (a) : (b))
#endif

#ifndef MAX
#define MAX(a,b)    ((a) > (b) ? (a) : (b))
#endif

#ifdef __GNUC__
#define VARG_CHECK(f, a, b) __attribute__((format(f, a, b)))
#else
#define VARG_CHECK(f, a, b)
#endif

#define PATH_DELIMETER '/'
#define PATH_DELIMETER_STR "/"

/******************************************************************************
 * TYPEDEFS
 ******************************************************************************/

typedef enum {
    DEBUG               = 0,
    INFO                = 1,
    WARNING             = 2,
    ERROR               = 3,
    CRITICAL            = 4,
    INVALID_EVENT_LEVEL = 5
} event_level_t;

/******************************************************************************
 * DEFINES
 ******************************************************************************/

/* Return Codes */
#define TIMEOUT_RC                  (0)
#define INVALID_RC                  (-1)
#define PARM_ERR_RC                 (-8)

/* I/O Definitions */
#define IO_PEND                     (-1)
#define IO_CHECK                    (0)
#define IO_DEFAULT_TIMEOUT          (1000) // ms

/* Ordered Keys */
#define INVALID_KEY                 0xFFFFFFFFFFFFFFFFLL

/* Debug Logging */
#define dlog(...)                   OsApi::print(__FILE__,__LINE__,__VA_ARGS__)
#define print2term(...)             OsApi::printTerm(__VA_ARGS__)

/******************************************************************************
 * OSAPI CLASS
 ******************************************************************************/

class OsApi
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int SYS_CLK = 0; // system clock that can be converted into civil time
        static const int CPU_CLK = 1; // processor clock that only counts ticks
        static const int MAX_PRINT_MESSAGE = 256;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef void (*print_func_t) (const char* file_name, unsigned int line_number, const char* message);

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void         init                (print_func_t _print_func);
        static void         deinit              (void);
        static void         print               (const char* file_name, unsigned int line_number, const char* format_string, ...) VARG_CHECK(printf, 3, 4);
        static void         printTerm           (const char* format_string, ...) VARG_CHECK(printf, 1, 2);
        static void         sleep               (double secs); // sleep at highest resolution available on system
        static int64_t      time                (int clkid); // microseconds
        static uint16_t     swaps               (uint16_t val);
        static uint32_t     swapl               (uint32_t val);
        static uint64_t     swapll              (uint64_t val);

    private:

        static print_func_t print_func;
};

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "RunTimeException.h"
#include "Thread.h"
#include "Mutex.h"
#include "Cond.h"

#endif  /* __osapi__ */
