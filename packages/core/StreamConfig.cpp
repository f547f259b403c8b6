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

#include "OsApi.h"
#include "EventLib.h"
#include "StreamConfig.h"

#include <stdlib.h>
#include <string.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* StreamConfig::CONFIG_TABLE_NAME = "h5stream";
const char* StreamConfig::LOG_LEVEL_ENV = "H5STREAM_LOG_LEVEL";
const char* StreamConfig::METADATA_BUDGET_ENV = "H5STREAM_METADATA_BUDGET";
const char* StreamConfig::CACHE_DIR_ENV = "H5STREAM_CACHE_DIR";
const char* StreamConfig::READER_THREADS_ENV = "H5STREAM_READER_THREADS";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * loadFile
 *
 *  executes a lua file and copies the fields of its global h5stream table
 *----------------------------------------------------------------------------*/
void StreamConfig::loadFile (const char* path)
{
    lua_State* L = luaL_newstate();
    if(!L)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "failed to create lua state for %s", path);
    }
    luaL_openlibs(L);

    try
    {
        /* Run Configuration Script */
        if(luaL_dofile(L, path) != LUA_OK)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "failed to load configuration %s: %s", path, lua_tostring(L, -1));
        }

        /* Get Configuration Table */
        lua_getglobal(L, CONFIG_TABLE_NAME);
        if(!lua_istable(L, -1))
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "configuration %s does not define table '%s'", path, CONFIG_TABLE_NAME);
        }

        /* Populate Fields */
        lua_pushnil(L);
        while(lua_next(L, -2) != 0)
        {
            const char* key = lua_type(L, -2) == LUA_TSTRING ? lua_tostring(L, -2) : NULL;
            const field_t* field = key ? findField(key) : NULL;
            if(!field)
            {
                mlog(WARNING, "Ignoring unknown configuration key in %s: %s", path, key ? key : "<non-string>");
                lua_pop(L, 1);
                continue;
            }

            switch(field->type)
            {
                case INTEGER_FIELD:
                {
                    int isnum = 0;
                    const lua_Integer value = lua_tointegerx(L, -1, &isnum);
                    if(!isnum) throw RunTimeException(CRITICAL, RTE_ERROR, "configuration key %s must be an integer", key);
                    *static_cast<long*>(field->value) = static_cast<long>(value);
                    break;
                }

                case STRING_FIELD:
                {
                    if(lua_type(L, -1) != LUA_TSTRING) throw RunTimeException(CRITICAL, RTE_ERROR, "configuration key %s must be a string", key);
                    *static_cast<std::string*>(field->value) = lua_tostring(L, -1);
                    break;
                }

                case LEVEL_FIELD:
                {
                    event_level_t lvl = INVALID_EVENT_LEVEL;
                    if(lua_type(L, -1) == LUA_TSTRING)
                    {
                        if(!EventLib::str2lvl(lua_tostring(L, -1), &lvl))
                        {
                            throw RunTimeException(CRITICAL, RTE_ERROR, "invalid event level for %s: %s", key, lua_tostring(L, -1));
                        }
                    }
                    else
                    {
                        int isnum = 0;
                        const lua_Integer value = lua_tointegerx(L, -1, &isnum);
                        if(!isnum || value < DEBUG || value >= INVALID_EVENT_LEVEL)
                        {
                            throw RunTimeException(CRITICAL, RTE_ERROR, "invalid event level for %s", key);
                        }
                        lvl = static_cast<event_level_t>(value);
                    }
                    *static_cast<event_level_t*>(field->value) = lvl;
                    break;
                }
            }

            lua_pop(L, 1);
        }
    }
    catch(const RunTimeException&)
    {
        lua_close(L);
        throw;
    }

    lua_close(L);

    /* Environment Takes Precedence */
    loadEnvironment();
}

/*----------------------------------------------------------------------------
 * loadEnvironment
 *----------------------------------------------------------------------------*/
void StreamConfig::loadEnvironment (void)
{
    setIfProvided(logLevel, LOG_LEVEL_ENV);
    setIfProvided(metadataBudget, METADATA_BUDGET_ENV);
    setIfProvided(persistentCacheDir, CACHE_DIR_ENV);
    setIfProvided(readerThreads, READER_THREADS_ENV);
}

/*----------------------------------------------------------------------------
 * reset
 *----------------------------------------------------------------------------*/
void StreamConfig::reset (void)
{
    logLevel                = INFO;
    metadataBudget          = 0x100000;
    metadataLineSize        = 0x10000;
    memoryCacheEntries      = 256;
    persistentCacheDir      = "";
    persistentCacheEntries  = 2000;
    initialConcurrency      = 4;
    minConcurrency          = 1;
    maxConcurrency          = 16;
    readerThreads           = 8;
    ioRetries               = 3;
    ioBackoffMs             = 100;
    connectTimeout          = 5;
    readTimeout             = 600;
    lowSpeedLimit           = 32768;
    lowSpeedTime            = 5;
    smallDatasetLimit       = 0x1000000;
}

/*----------------------------------------------------------------------------
 * dump
 *----------------------------------------------------------------------------*/
void StreamConfig::dump (void) const
{
    for(const field_t& field: fields)
    {
        switch(field.type)
        {
            case INTEGER_FIELD: mlog(DEBUG, "%s = %ld", field.key, *static_cast<const long*>(field.value)); break;
            case STRING_FIELD:  mlog(DEBUG, "%s = \"%s\"", field.key, static_cast<const std::string*>(field.value)->c_str()); break;
            case LEVEL_FIELD:   mlog(DEBUG, "%s = %s", field.key, EventLib::lvl2str(*static_cast<const event_level_t*>(field.value))); break;
        }
    }
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
StreamConfig::StreamConfig(void):
    fields ({
        {"log_level",                   LEVEL_FIELD,    &logLevel},
        {"metadata_budget",             INTEGER_FIELD,  &metadataBudget},
        {"metadata_line_size",          INTEGER_FIELD,  &metadataLineSize},
        {"memory_cache_entries",        INTEGER_FIELD,  &memoryCacheEntries},
        {"persistent_cache_dir",        STRING_FIELD,   &persistentCacheDir},
        {"persistent_cache_entries",    INTEGER_FIELD,  &persistentCacheEntries},
        {"initial_concurrency",         INTEGER_FIELD,  &initialConcurrency},
        {"min_concurrency",             INTEGER_FIELD,  &minConcurrency},
        {"max_concurrency",             INTEGER_FIELD,  &maxConcurrency},
        {"reader_threads",              INTEGER_FIELD,  &readerThreads},
        {"io_retries",                  INTEGER_FIELD,  &ioRetries},
        {"io_backoff_ms",               INTEGER_FIELD,  &ioBackoffMs},
        {"connect_timeout",             INTEGER_FIELD,  &connectTimeout},
        {"read_timeout",                INTEGER_FIELD,  &readTimeout},
        {"low_speed_limit",             INTEGER_FIELD,  &lowSpeedLimit},
        {"low_speed_time",              INTEGER_FIELD,  &lowSpeedTime},
        {"small_dataset_limit",         INTEGER_FIELD,  &smallDatasetLimit}
    })
{
    // populate environment variables
    loadEnvironment();
}

/*----------------------------------------------------------------------------
 * findField
 *----------------------------------------------------------------------------*/
const StreamConfig::field_t* StreamConfig::findField (const char* key) const
{
    for(const field_t& field: fields)
    {
        if(strcmp(field.key, key) == 0) return &field;
    }
    return NULL;
}

/*----------------------------------------------------------------------------
 * setIfProvided
 *----------------------------------------------------------------------------*/
void StreamConfig::setIfProvided(long& field, const char* env)
{
    const char* str = getenv(env);
    if(str)
    {
        char* endptr = NULL;
        const long value = strtol(str, &endptr, 0);
        if(endptr && *endptr == '\0') field = value;
        else mlog(WARNING, "Ignoring non-integer value of %s: %s", env, str);
    }
}

/*----------------------------------------------------------------------------
 * setIfProvided
 *----------------------------------------------------------------------------*/
void StreamConfig::setIfProvided(std::string& field, const char* env)
{
    const char* str = getenv(env);
    if(str) field = str;
}

/*----------------------------------------------------------------------------
 * setIfProvided
 *----------------------------------------------------------------------------*/
void StreamConfig::setIfProvided(event_level_t& field, const char* env)
{
    const char* str = getenv(env);
    if(str)
    {
        event_level_t lvl;
        if(EventLib::str2lvl(str, &lvl)) field = lvl;
        else mlog(WARNING, "Ignoring invalid event level in %s: %s", env, str);
    }
}
