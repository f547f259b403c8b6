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

#include "UT_ChunkCache.h"
#include "H5ChunkCache.h"
#include "H5Stream.h"

#include <dirent.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_ChunkCache::SUITE_NAME = "chunkcache";
const UnitTest::test_t UT_ChunkCache::TESTS[] = {
    {"memory_eviction",     testMemoryEviction},
    {"persistent_reload",   testPersistentRoundTrip},
    {"corrupt_entry",       testCorruptEntry},
    {"persistent_eviction", testPersistentEviction},
    {"shape_mismatch",      testShapeMismatch},
    {"make_key",            testMakeKey},
    {NULL,                  NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * makeChunk - float32 values starting at base
 *----------------------------------------------------------------------------*/
static H5ChunkCache::chunk_t makeChunk (double base, uint64_t elements=8)
{
    std::shared_ptr<H5Stream::TypedArray> array = std::make_shared<H5Stream::TypedArray>(H5Stream::FLOAT32, elements);
    for(uint64_t i = 0; i < elements; i++) array->setValue(i, base + i);
    return array;
}

/*----------------------------------------------------------------------------
 * makeDirectory
 *----------------------------------------------------------------------------*/
static std::string makeDirectory (void)
{
    char path[] = "/tmp/h5stream-ut-XXXXXX";
    if(mkdtemp(path) == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_IO_ERROR, "unable to create temporary directory: %s", strerror(errno));
    }
    return std::string(path);
}

/*----------------------------------------------------------------------------
 * removeDirectory
 *----------------------------------------------------------------------------*/
static void removeDirectory (const std::string& path)
{
    DIR* dir = opendir(path.c_str());
    if(dir)
    {
        struct dirent* ent;
        while((ent = readdir(dir)) != NULL)
        {
            if(strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
            const std::string file = path + "/" + ent->d_name;
            unlink(file.c_str());
        }
        closedir(dir);
    }
    rmdir(path.c_str());
}

/*----------------------------------------------------------------------------
 * entryFile - where an entry for the key is persisted
 *----------------------------------------------------------------------------*/
static std::string entryFile (const std::string& dir, const std::string& key)
{
    char name[32];
    snprintf(name, sizeof(name), "%08x%s", H5Stream::fnv1a(key.c_str()), H5ChunkCache::ENTRY_SUFFIX);
    return dir + "/" + name;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_ChunkCache::UT_ChunkCache (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testMemoryEviction - oldest entry goes first
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testMemoryEviction (UnitTest* ut)
{
    ut_initialize(ut);

    H5ChunkCache cache(2, NULL, 0);
    cache.put("/a/0", makeChunk(0));
    cache.put("/a/1", makeChunk(10));
    cache.put("/a/2", makeChunk(20));

    ut_assert(ut, cache.memoryEntries() == 2, "wrong entry count: %ld", cache.memoryEntries());
    ut_assert(ut, cache.get("/a/0", H5Stream::FLOAT32, 8) == nullptr, "oldest entry not evicted");

    H5ChunkCache::chunk_t chunk = cache.get("/a/2", H5Stream::FLOAT32, 8);
    ut_assert(ut, chunk != nullptr, "newest entry missing");
    if(chunk)
    {
        ut_assert(ut, chunk->value(3) == 23.0, "wrong value: %lf", chunk->value(3));
    }

    /* Entries are shared, not copied */
    ut_assert(ut, cache.get("/a/2", H5Stream::FLOAT32, 8).get() == chunk.get(), "cache returned a different instance");

    cache.clear();
    ut_assert(ut, cache.memoryEntries() == 0, "clear left %ld entries", cache.memoryEntries());
    ut_assert(ut, chunk->size() == 8, "cleared chunk lost its data");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testPersistentRoundTrip - entries survive a new cache instance
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testPersistentRoundTrip (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string dir = makeDirectory();
    const std::string key = H5ChunkCache::makeKey("https://example.com/granule.h5", "/gt1l/heights/h_ph", {3, 1});

    {
        H5ChunkCache cache(4, dir.c_str(), 16);
        cache.put(key, makeChunk(100, 32));
        ut_assert(ut, cache.persistentEntries() == 1, "wrong persistent count: %ld", cache.persistentEntries());
    }

    H5ChunkCache restarted(4, dir.c_str(), 16);
    ut_assert(ut, restarted.persistentEntries() == 1, "existing entry not found at startup: %ld", restarted.persistentEntries());
    ut_assert(ut, restarted.memoryEntries() == 0, "memory tier not empty at startup");

    H5ChunkCache::chunk_t chunk = restarted.get(key, H5Stream::FLOAT32, 32);
    ut_assert(ut, chunk != nullptr, "persisted chunk not found");
    if(chunk)
    {
        ut_assert(ut, chunk->dtype() == H5Stream::FLOAT32, "wrong type: %s", H5Stream::type2str(chunk->dtype()));
        ut_assert(ut, chunk->size() == 32, "wrong size: %lu", (unsigned long)chunk->size());
        ut_assert(ut, chunk->value(31) == 131.0, "wrong value: %lf", chunk->value(31));
    }
    ut_assert(ut, restarted.memoryEntries() == 1, "persisted hit not promoted to memory");

    ut_assert(ut, restarted.get(H5ChunkCache::makeKey("https://example.com/granule.h5", "/gt1l/heights/h_ph", {3, 2}), H5Stream::FLOAT32, 32) == nullptr, "unknown key found");

    removeDirectory(dir);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testCorruptEntry - bad files are misses, never errors
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testCorruptEntry (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string dir = makeDirectory();
    const std::string stale = H5ChunkCache::makeKey("file:///data/a.h5", "/x", {0});
    const std::string truncated = H5ChunkCache::makeKey("file:///data/a.h5", "/x", {1});

    {
        H5ChunkCache cache(4, dir.c_str(), 16);
        cache.put(stale, makeChunk(0));
        cache.put(truncated, makeChunk(8));
    }

    /* Unknown version tag */
    FILE* fp = fopen(entryFile(dir, stale).c_str(), "r+b");
    ut_assert(ut, fp != NULL, "persisted entry not at expected path");
    if(fp)
    {
        fputs("garbage", fp);
        fclose(fp);
    }

    /* Data cut short */
    ut_assert(ut, truncate(entryFile(dir, truncated).c_str(), 40) == 0, "unable to truncate entry: %s", strerror(errno));

    H5ChunkCache cache(4, dir.c_str(), 16);
    ut_assert(ut, cache.get(stale, H5Stream::FLOAT32, 8) == nullptr, "stale entry returned");
    ut_assert(ut, cache.get(truncated, H5Stream::FLOAT32, 8) == nullptr, "truncated entry returned");

    /* Unusable directory disables the tier */
    H5ChunkCache unusable(4, "/proc/h5stream-not-writable", 16);
    unusable.put(stale, makeChunk(0));
    ut_assert(ut, unusable.persistentEntries() == 0, "unusable directory holds entries");
    ut_assert(ut, unusable.get(stale, H5Stream::FLOAT32, 8) != nullptr, "memory tier lost with persistent tier");

    removeDirectory(dir);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testPersistentEviction
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testPersistentEviction (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string dir = makeDirectory();
    const std::string first = H5ChunkCache::makeKey("file:///data/b.h5", "/y", {0});
    const std::string second = H5ChunkCache::makeKey("file:///data/b.h5", "/y", {1});
    const std::string third = H5ChunkCache::makeKey("file:///data/b.h5", "/y", {2});

    H5ChunkCache cache(8, dir.c_str(), 2);
    cache.put(first, makeChunk(0));
    cache.put(second, makeChunk(1));
    cache.put(third, makeChunk(2));

    ut_assert(ut, cache.persistentEntries() == 2, "wrong persistent count: %ld", cache.persistentEntries());
    ut_assert(ut, access(entryFile(dir, first).c_str(), F_OK) != 0, "oldest persisted entry not removed");
    ut_assert(ut, access(entryFile(dir, third).c_str(), F_OK) == 0, "newest persisted entry missing");

    cache.clear();
    ut_assert(ut, cache.get(first, H5Stream::FLOAT32, 8) == nullptr, "evicted entry returned");
    ut_assert(ut, cache.get(second, H5Stream::FLOAT32, 8) != nullptr, "retained entry missing");

    removeDirectory(dir);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testShapeMismatch - entries of another type or size are dropped, not returned
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testShapeMismatch (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string dir = makeDirectory();
    const std::string replaced = H5ChunkCache::makeKey("file:///data/c.h5", "/z", {0, 0});
    const std::string resized = H5ChunkCache::makeKey("file:///data/c.h5", "/z", {0, 1});
    const std::string oversized = H5ChunkCache::makeKey("file:///data/c.h5", "/z", {0, 2});

    {
        H5ChunkCache cache(4, dir.c_str(), 16);
        cache.put(replaced, makeChunk(0));
    }

    /* Persisted entry from before the file changed type */
    H5ChunkCache cache(4, dir.c_str(), 16);
    ut_assert(ut, cache.persistentEntries() == 1, "wrong persistent count: %ld", cache.persistentEntries());
    ut_assert(ut, cache.get(replaced, H5Stream::INT32, 8) == nullptr, "entry of another type returned");
    ut_assert(ut, access(entryFile(dir, replaced).c_str(), F_OK) != 0, "mismatched entry left on disk");
    ut_assert(ut, cache.persistentEntries() == 0, "mismatched entry still counted: %ld", cache.persistentEntries());
    ut_assert(ut, cache.memoryEntries() == 0, "mismatched entry promoted to memory");

    /* Memory tier entry of another size */
    cache.put(resized, makeChunk(0, 8));
    ut_assert(ut, cache.get(resized, H5Stream::FLOAT32, 6) == nullptr, "entry of another size returned");
    ut_assert(ut, cache.memoryEntries() == 0, "mismatched memory entry kept: %ld", cache.memoryEntries());

    /* Header claims far more elements than the file holds */
    FILE* fp = fopen(entryFile(dir, oversized).c_str(), "wb");
    ut_assert(ut, fp != NULL, "unable to create entry: %s", strerror(errno));
    if(fp)
    {
        const uint32_t key_len = static_cast<uint32_t>(oversized.size());
        const uint32_t dtype = static_cast<uint32_t>(H5Stream::FLOAT32);
        const uint64_t elements = 1ULL << 40;
        const float values[8] = {0};
        fwrite(H5ChunkCache::VERSION_TAG, 1, strlen(H5ChunkCache::VERSION_TAG), fp);
        fwrite(&key_len, sizeof(key_len), 1, fp);
        fwrite(oversized.data(), 1, key_len, fp);
        fwrite(&dtype, sizeof(dtype), 1, fp);
        fwrite(&elements, sizeof(elements), 1, fp);
        fwrite(values, sizeof(float), 8, fp);
        fclose(fp);
    }
    ut_assert(ut, cache.get(oversized, H5Stream::FLOAT32, 1ULL << 40) == nullptr, "oversized entry returned");
    ut_assert(ut, access(entryFile(dir, oversized).c_str(), F_OK) != 0, "oversized entry left on disk");

    removeDirectory(dir);

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testMakeKey
 *--------------------------------------------------------------------------------------*/
bool UT_ChunkCache::testMakeKey (UnitTest* ut)
{
    ut_initialize(ut);

    const std::string key = H5ChunkCache::makeKey("s3://bucket/file.h5", "/group/data", {12, 0, 7});
    const std::string other = H5ChunkCache::makeKey("s3://bucket/other.h5", "/group/data", {12, 0, 7});
    const std::string relative = H5ChunkCache::makeKey("s3://bucket/file.h5", "group/data", {12, 0, 7});

    char expected[64];
    snprintf(expected, sizeof(expected), "/%08x/group/data/12,0,7", H5Stream::fnv1a("s3://bucket/file.h5"));

    ut_assert(ut, key == expected, "wrong key: %s != %s", key.c_str(), expected);
    ut_assert(ut, key != other, "origins share a key");
    ut_assert(ut, key == relative, "relative dataset path changes the key: %s", relative.c_str());

    return ut_status(ut);
}
