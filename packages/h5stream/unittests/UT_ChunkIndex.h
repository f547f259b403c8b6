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

#ifndef __ut_chunk_index__
#define __ut_chunk_index__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "UnitTest.h"
#include "OsApi.h"

/******************************************************************************
 * CLASS
 ******************************************************************************/

class UT_ChunkIndex: public UnitTest
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* SUITE_NAME;
        static const test_t TESTS[];

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        UT_ChunkIndex (void);
        ~UT_ChunkIndex (void) override = default;

    private:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static bool testBTreeV1 (UnitTest* ut);
        static bool testBTreeV1TwoLevel (UnitTest* ut);
        static bool testBTreeV2 (UnitTest* ut);
        static bool testBTreeV2Filtered (UnitTest* ut);
        static bool testFixedArray (UnitTest* ut);
        static bool testFixedArrayFiltered (UnitTest* ut);
        static bool testSingleChunk (UnitTest* ut);
        static bool testImplicit (UnitTest* ut);
        static bool testExtensibleArray (UnitTest* ut);
        static bool testUnalignedKey (UnitTest* ut);
        static bool testMissingChunk (UnitTest* ut);
        static bool testRetryAfterIoError (UnitTest* ut);
};

#endif  /* __ut_chunk_index__ */
