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
 INCLUDES
 ******************************************************************************/

#include "core.h"
#include "h5stream.h"

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <memory>
#include <string>
#include <vector>

/******************************************************************************
 DEFINES
 ******************************************************************************/

#define MAX_PRINTED_VALUES  16

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * print_usage
 */
static void print_usage (const char* exe)
{
    print2term("Usage: %s [-c config.lua] [-v] <path|url> <command> ...\n", exe);
    print2term("Commands:\n");
    print2term("  list                          datasets with shape, type and layout\n");
    print2term("  chunk <ds> <row> <col>        one chunk by grid coordinate\n");
    print2term("  region <ds> <r0> <c0> <h> <w> a rectangle of a 2-D dataset\n");
    print2term("  small <ds>                    a whole small dataset\n");
    print2term("  attrs <path>                  attributes of a dataset or group\n");
    print2term("  stats                         open the file and report transfer statistics\n");
}

/*
 * parse_u64
 */
static uint64_t parse_u64 (const char* str)
{
    char* endptr = NULL;
    errno = 0;
    const unsigned long long value = strtoull(str, &endptr, 0);
    if(errno != 0 || endptr == str || *endptr != '\0' || str[0] == '-')
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid number: %s", str);
    }
    return static_cast<uint64_t>(value);
}

/*
 * dims2str
 */
static std::string dims2str (const std::vector<uint64_t>& dims)
{
    std::string str = "[";
    for(size_t d = 0; d < dims.size(); d++)
    {
        if(d > 0) str += ",";
        str += std::to_string(dims[d]);
    }
    return str + "]";
}

/*
 * print_array - first values and a summary of the finite ones
 */
static void print_array (const H5Stream::TypedArray& array)
{
    double min = 0.0, max = 0.0, sum = 0.0;
    uint64_t finite = 0;
    for(uint64_t i = 0; i < array.size(); i++)
    {
        const double v = array.value(i);
        if(v != v) continue; // NaN
        if(finite == 0 || v < min) min = v;
        if(finite == 0 || v > max) max = v;
        sum += v;
        finite++;
    }

    print2term("%s x %lu:", H5Stream::type2str(array.dtype()), (unsigned long)array.size());
    for(uint64_t i = 0; i < array.size() && i < MAX_PRINTED_VALUES; i++)
    {
        print2term(" %g", array.value(i));
    }
    if(array.size() > MAX_PRINTED_VALUES) print2term(" ...");
    print2term("\n");

    if(finite > 0) print2term("min %g, max %g, mean %g over %lu values\n", min, max, sum / finite, (unsigned long)finite);
    else           print2term("no finite values\n");
}

/*
 * print_value
 */
static void print_value (const H5Stream::SmallValue& value)
{
    if(value.isString)
    {
        for(size_t i = 0; i < value.strings.size() && i < MAX_PRINTED_VALUES; i++)
        {
            print2term("%s\"%s\"", i ? ", " : "", value.strings[i].c_str());
        }
        if(value.strings.size() > MAX_PRINTED_VALUES) print2term(", ...");
        print2term("\n");
    }
    else
    {
        print_array(value.array);
    }
}

/*
 * print_stats
 */
static void print_stats (const H5Stream::StreamingStats& stats)
{
    print2term("stats: %ld bytes in %ld requests over %ldms (%.2f Mbps avg, %.2f Mbps current), concurrency %d, "
               "%ld chunks, %ld cache hits, %ld failed, %ld metadata bytes\n",
               (long)stats.totalBytes, (long)stats.totalRequests, (long)stats.elapsedMs, stats.avgMbps, stats.currentMbps,
               stats.concurrency, (long)stats.chunksLoaded, (long)stats.cacheHits, (long)stats.failedRequests, (long)stats.metadataBytes);
}

/*
 * run_command
 */
static int run_command (H5Stream::H5Reader& reader, const char* command, int argc, char* argv[])
{
    if(strcmp(command, "list") == 0)
    {
        const std::vector<H5Stream::DatasetDescriptor> datasets = reader.listDatasets();
        for(const H5Stream::DatasetDescriptor& ds: datasets)
        {
            if(!ds.readable)
            {
                print2term("%s  unreadable (%s): %s\n", ds.path.c_str(), RunTimeException::code2str(ds.errorCode), ds.error.c_str());
                continue;
            }

            print2term("%s  %s %s %s", ds.path.c_str(), ds.isString ? "string" : H5Stream::type2str(ds.dtype),
                       dims2str(ds.shape).c_str(), H5Stream::layout2str(ds.layout));
            if(ds.chunked)
            {
                print2term(" chunks %s x %lu (%s)", dims2str(ds.chunkDims).c_str(), (unsigned long)ds.numChunks, H5Stream::index2str(ds.indexKind));
            }
            for(int filter: ds.filters) print2term(" %s", H5Stream::filter2str(filter));
            print2term("\n");
        }
        print2term("%ld datasets\n", (long)datasets.size());
    }
    else if(strcmp(command, "chunk") == 0 && argc == 3)
    {
        const H5Stream::H5Reader::chunk_t chunk = reader.readChunk(argv[0], parse_u64(argv[1]), parse_u64(argv[2]));
        if(chunk)   print_array(*chunk);
        else        print2term("chunk not allocated\n");
    }
    else if(strcmp(command, "region") == 0 && argc == 5)
    {
        const H5Stream::TypedArray region = reader.readRegion(argv[0], parse_u64(argv[1]), parse_u64(argv[2]), parse_u64(argv[3]), parse_u64(argv[4]));
        print_array(region);
    }
    else if(strcmp(command, "small") == 0 && argc == 1)
    {
        const H5Stream::SmallValue value = reader.readSmallDataset(argv[0]);
        print2term("%s %s ", argv[0], dims2str(value.shape).c_str());
        print_value(value);
    }
    else if(strcmp(command, "attrs") == 0 && argc == 1)
    {
        const std::vector<H5Stream::AttributeValue> attributes = reader.listAttributes(argv[0]);
        for(const H5Stream::AttributeValue& attr: attributes)
        {
            print2term("%s %s = ", attr.name.c_str(), dims2str(attr.value.shape).c_str());
            print_value(attr.value);
        }
    }
    else if(strcmp(command, "stats") != 0)
    {
        print2term("Unknown command or wrong arguments: %s\n", command);
        return -1;
    }

    return 0;
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    const char* config_file = NULL;
    bool verbose = false;

    /* Parse Options */
    int argi = 1;
    while(argi < argc && argv[argi][0] == '-')
    {
        if(strcmp(argv[argi], "-c") == 0 && (argi + 1) < argc)
        {
            config_file = argv[++argi];
        }
        else if(strcmp(argv[argi], "-v") == 0)
        {
            verbose = true;
        }
        else
        {
            print_usage(argv[0]);
            return -1;
        }
        argi++;
    }

    if((argc - argi) < 2)
    {
        print_usage(argv[0]);
        return -1;
    }

    const char* path = argv[argi];
    const char* command = argv[argi + 1];

    /* Load Configuration */
    try
    {
        if(config_file) StreamConfig::settings().loadFile(config_file);
    }
    catch(const RunTimeException& e)
    {
        print2term("Failed to load configuration: %s\n", e.what());
        return -1;
    }
    if(verbose) StreamConfig::settings().logLevel = DEBUG;

    /* Initialize Packages */
    initcore();
    inith5stream();
    if(verbose) StreamConfig::settings().dump();

    int status = 0;
    try
    {
        H5Stream::ByteRangeSource* source;
        if(H5Stream::CurlRangeSource::isUrl(path))  source = new H5Stream::CurlRangeSource(path);
        else                                        source = new H5Stream::FileRangeSource(path);

        H5Stream::H5Reader reader(source, StreamConfig::settings().metadataBudget);
        status = run_command(reader, command, argc - argi - 2, &argv[argi + 2]);
        print_stats(reader.getStreamingStats());
        reader.close();
    }
    catch(const RunTimeException& e)
    {
        print2term("Error (%s): %s\n", RunTimeException::code2str(e.code()), e.what());
        status = -1;
    }

    /* Clean Up */
    deinith5stream();
    deinitcore();

    return status;
}
