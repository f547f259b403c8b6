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

#include "H5ChunkCache.h"
#include "EventLib.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* H5ChunkCache::VERSION_TAG = "h5stream-chunks-v1";
const char* H5ChunkCache::ENTRY_SUFFIX = ".chunk";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5ChunkCache::H5ChunkCache (long memory_entries, const char* persistent_dir, long persistent_entries):
    maxMemoryEntries        (MAX(memory_entries, 1L)),
    directory               (persistent_dir ? persistent_dir : ""),
    maxPersistentEntries    (MAX(persistent_entries, 1L))
{
    if(!directory.empty())
    {
        if(mkdir(directory.c_str(), 0755) != 0 && errno != EEXIST)
        {
            mlog(DEBUG, "Persistent chunk cache disabled, unable to create %s: %s", directory.c_str(), strerror(errno));
            directory.clear();
        }
        else
        {
            scanDirectory();
        }
    }
}

/*----------------------------------------------------------------------------
 * get - null on a miss or when the entry does not have the expected shape
 *----------------------------------------------------------------------------*/
H5ChunkCache::chunk_t H5ChunkCache::get (const std::string& key, H5Stream::DataType dtype, uint64_t elements)
{
    mut.lock();
    {
        std::map<std::string, chunk_t>::iterator iter = memory.find(key);
        if(iter != memory.end())
        {
            chunk_t chunk = iter->second;
            if(chunk->dtype() == dtype && chunk->size() == elements)
            {
                mut.unlock();
                return chunk;
            }

            mlog(DEBUG, "Dropping cached chunk %s of %lu %s elements, expected %lu %s", key.c_str(),
                 (unsigned long)chunk->size(), H5Stream::type2str(chunk->dtype()), (unsigned long)elements, H5Stream::type2str(dtype));
            memory.erase(iter);
            memoryOrder.remove(key);
        }
    }
    mut.unlock();

    if(directory.empty()) return nullptr;

    chunk_t chunk = readEntry(key, dtype, elements);
    if(chunk) store(key, chunk);

    return chunk;
}

/*----------------------------------------------------------------------------
 * put
 *----------------------------------------------------------------------------*/
void H5ChunkCache::put (const std::string& key, const chunk_t& chunk)
{
    if(!chunk) return;

    store(key, chunk);

    if(directory.empty()) return;

    try
    {
        writeEntry(key, *chunk);
    }
    catch(const RunTimeException& e)
    {
        mlog(DEBUG, "Unable to persist chunk %s: %s", key.c_str(), e.what());
        return;
    }

    /* Record the entry and trim the oldest */
    const std::string file_name = entryName(key);
    std::vector<std::string> evicted;
    mut.lock();
    {
        persistentOrder.remove(file_name);
        persistentOrder.push_back(file_name);
        while(static_cast<long>(persistentOrder.size()) > maxPersistentEntries)
        {
            evicted.push_back(persistentOrder.front());
            persistentOrder.pop_front();
        }
    }
    mut.unlock();

    for(const std::string& name: evicted)
    {
        if(unlink(entryPath(name).c_str()) != 0)
        {
            mlog(DEBUG, "Unable to evict persisted chunk %s: %s", name.c_str(), strerror(errno));
        }
    }
}

/*----------------------------------------------------------------------------
 * clear - empties the memory tier only
 *----------------------------------------------------------------------------*/
void H5ChunkCache::clear (void)
{
    mut.lock();
    {
        memory.clear();
        memoryOrder.clear();
    }
    mut.unlock();
}

/*----------------------------------------------------------------------------
 * memoryEntries
 *----------------------------------------------------------------------------*/
long H5ChunkCache::memoryEntries (void)
{
    mut.lock();
    const long count = memory.size();
    mut.unlock();
    return count;
}

/*----------------------------------------------------------------------------
 * persistentEntries
 *----------------------------------------------------------------------------*/
long H5ChunkCache::persistentEntries (void)
{
    mut.lock();
    const long count = persistentOrder.size();
    mut.unlock();
    return count;
}

/*----------------------------------------------------------------------------
 * makeKey - /<origin hash>/<dataset>/<c0>,<c1>,...
 *----------------------------------------------------------------------------*/
std::string H5ChunkCache::makeKey (const char* origin, const char* dataset, const std::vector<uint64_t>& coord)
{
    char hash_str[16];
    snprintf(hash_str, sizeof(hash_str), "%08x", H5Stream::fnv1a(origin));

    std::string key = "/";
    key += hash_str;
    if(dataset[0] != '/') key += "/";
    key += dataset;
    key += "/";
    for(size_t d = 0; d < coord.size(); d++)
    {
        if(d > 0) key += ",";
        key += std::to_string(coord[d]);
    }

    return key;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * store - memory tier
 *----------------------------------------------------------------------------*/
void H5ChunkCache::store (const std::string& key, const chunk_t& chunk)
{
    mut.lock();
    {
        if(memory.find(key) == memory.end())
        {
            while(static_cast<long>(memory.size()) >= maxMemoryEntries && !memoryOrder.empty())
            {
                memory.erase(memoryOrder.front());
                memoryOrder.pop_front();
            }
            memoryOrder.push_back(key);
        }
        memory[key] = chunk;
    }
    mut.unlock();
}

/*----------------------------------------------------------------------------
 * scanDirectory - orders existing entries by modification time
 *----------------------------------------------------------------------------*/
void H5ChunkCache::scanDirectory (void)
{
    DIR* dir = opendir(directory.c_str());
    if(!dir)
    {
        mlog(DEBUG, "Persistent chunk cache disabled, unable to open %s: %s", directory.c_str(), strerror(errno));
        directory.clear();
        return;
    }

    std::vector<std::pair<int64_t, std::string>> entries;
    const size_t suffix_len = strlen(ENTRY_SUFFIX);
    struct dirent* ent;
    while((ent = readdir(dir)) != NULL)
    {
        const size_t name_len = strlen(ent->d_name);
        if(name_len <= suffix_len || strcmp(&ent->d_name[name_len - suffix_len], ENTRY_SUFFIX) != 0) continue;

        struct stat st;
        if(stat(entryPath(ent->d_name).c_str(), &st) == 0)
        {
            entries.push_back(std::make_pair(static_cast<int64_t>(st.st_mtime), std::string(ent->d_name)));
        }
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end());

    mut.lock();
    {
        for(const auto& entry: entries) persistentOrder.push_back(entry.second);
    }
    mut.unlock();

    mlog(DEBUG, "Persistent chunk cache %s holds %ld entries", directory.c_str(), (long)entries.size());
}

/*----------------------------------------------------------------------------
 * readEntry - null when absent, stale or unreadable
 *----------------------------------------------------------------------------*/
H5ChunkCache::chunk_t H5ChunkCache::readEntry (const std::string& key, H5Stream::DataType dtype, uint64_t elements)
{
    const std::string file_name = entryName(key);
    const std::string path = entryPath(file_name);
    FILE* fp = fopen(path.c_str(), "rb");
    if(!fp) return nullptr;

    struct stat st;
    if(fstat(fileno(fp), &st) != 0)
    {
        mlog(DEBUG, "Unable to stat persisted chunk %s: %s", path.c_str(), strerror(errno));
        fclose(fp);
        return nullptr;
    }

    chunk_t chunk = nullptr;
    bool mismatch = false;
    const size_t tag_len = strlen(VERSION_TAG);
    std::vector<char> tag(tag_len);
    uint32_t key_len = 0;

    if(fread(tag.data(), 1, tag_len, fp) != tag_len || memcmp(tag.data(), VERSION_TAG, tag_len) != 0)
    {
        mlog(DEBUG, "Ignoring persisted chunk %s with unknown version", path.c_str());
    }
    else if(fread(&key_len, sizeof(key_len), 1, fp) != 1 || key_len != key.size())
    {
        /* Hash collision with another key */
    }
    else
    {
        std::string stored_key(key_len, '\0');
        uint32_t stored_dtype = 0;
        uint64_t stored_elements = 0;
        if(fread(&stored_key[0], 1, key_len, fp) == key_len && stored_key == key &&
           fread(&stored_dtype, sizeof(stored_dtype), 1, fp) == 1 &&
           fread(&stored_elements, sizeof(stored_elements), 1, fp) == 1)
        {
            const int64_t header_bytes = static_cast<int64_t>(tag_len + sizeof(key_len) + key_len + sizeof(stored_dtype) + sizeof(stored_elements));
            const int64_t data_bytes = static_cast<int64_t>(st.st_size) - header_bytes;
            const uint64_t type_size = H5Stream::typeSize(static_cast<H5Stream::DataType>(stored_dtype));

            if(stored_dtype != static_cast<uint32_t>(dtype) || stored_elements != elements)
            {
                mlog(DEBUG, "Ignoring persisted chunk %s of %lu %s elements, expected %lu %s", path.c_str(), (unsigned long)stored_elements,
                     H5Stream::type2str(static_cast<H5Stream::DataType>(stored_dtype)), (unsigned long)elements, H5Stream::type2str(dtype));
                mismatch = true;
            }
            else if(type_size == 0 || data_bytes < 0 || stored_elements != static_cast<uint64_t>(data_bytes) / type_size ||
                    static_cast<uint64_t>(data_bytes) % type_size != 0)
            {
                mlog(DEBUG, "Ignoring persisted chunk %s holding %ld bytes for %lu elements", path.c_str(), (long)data_bytes, (unsigned long)stored_elements);
                mismatch = true;
            }
            else
            {
                std::shared_ptr<H5Stream::TypedArray> array = std::make_shared<H5Stream::TypedArray>(dtype, elements);
                const size_t bytes = static_cast<size_t>(array->bytes());
                if(fread(array->data(), 1, bytes, fp) == bytes)
                {
                    chunk = array;
                }
                else
                {
                    mlog(DEBUG, "Ignoring truncated persisted chunk %s", path.c_str());
                }
            }
        }
        else
        {
            mlog(DEBUG, "Ignoring truncated persisted chunk %s", path.c_str());
        }
    }

    fclose(fp);

    if(mismatch) dropEntry(file_name);

    return chunk;
}

/*----------------------------------------------------------------------------
 * dropEntry - removes a persisted file that no longer matches its dataset
 *----------------------------------------------------------------------------*/
void H5ChunkCache::dropEntry (const std::string& file_name)
{
    mut.lock();
    {
        persistentOrder.remove(file_name);
    }
    mut.unlock();

    if(unlink(entryPath(file_name).c_str()) != 0)
    {
        mlog(DEBUG, "Unable to remove persisted chunk %s: %s", file_name.c_str(), strerror(errno));
    }
}

/*----------------------------------------------------------------------------
 * writeEntry - written aside and renamed into place
 *----------------------------------------------------------------------------*/
void H5ChunkCache::writeEntry (const std::string& key, const H5Stream::TypedArray& chunk)
{
    const std::string path = entryPath(entryName(key));
    const std::string tmp_path = path + ".tmp" + std::to_string(static_cast<long>(getpid()));

    FILE* fp = fopen(tmp_path.c_str(), "wb");
    if(!fp)
    {
        throw RunTimeException(DEBUG, RTE_IO_ERROR, "unable to create %s: %s", tmp_path.c_str(), strerror(errno));
    }

    const uint32_t key_len = static_cast<uint32_t>(key.size());
    const uint32_t dtype = static_cast<uint32_t>(chunk.dtype());
    const uint64_t elements = chunk.size();
    const size_t bytes = static_cast<size_t>(chunk.bytes());

    bool ok = fwrite(VERSION_TAG, 1, strlen(VERSION_TAG), fp) == strlen(VERSION_TAG);
    ok = ok && fwrite(&key_len, sizeof(key_len), 1, fp) == 1;
    ok = ok && fwrite(key.data(), 1, key_len, fp) == key_len;
    ok = ok && fwrite(&dtype, sizeof(dtype), 1, fp) == 1;
    ok = ok && fwrite(&elements, sizeof(elements), 1, fp) == 1;
    ok = ok && fwrite(chunk.data(), 1, bytes, fp) == bytes;
    ok = (fclose(fp) == 0) && ok;

    if(!ok || rename(tmp_path.c_str(), path.c_str()) != 0)
    {
        const int err = errno;
        unlink(tmp_path.c_str());
        throw RunTimeException(DEBUG, RTE_IO_ERROR, "unable to write %s: %s", path.c_str(), strerror(err));
    }
}

/*----------------------------------------------------------------------------
 * entryPath
 *----------------------------------------------------------------------------*/
std::string H5ChunkCache::entryPath (const std::string& file_name) const
{
    return directory + "/" + file_name;
}

/*----------------------------------------------------------------------------
 * entryName - file name from the key hash
 *----------------------------------------------------------------------------*/
std::string H5ChunkCache::entryName (const std::string& key)
{
    char name[32];
    snprintf(name, sizeof(name), "%08x%s", H5Stream::fnv1a(key.c_str()), ENTRY_SUFFIX);
    return std::string(name);
}
