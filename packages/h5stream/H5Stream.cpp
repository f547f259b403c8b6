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

#include "H5Stream.h"
#include "EventLib.h"

#include <curl/curl.h>
#include <cmath>
#include <deque>
#include <limits>

/******************************************************************************
 * FILE DATA
 ******************************************************************************/

typedef struct {
    H5Stream::job_func_t    func;
    void*                   parm;
} job_t;

static Cond                 jobCond;
static std::deque<job_t>    jobQueue;
static bool                 readerActive = false;
static Thread**             readerPids = NULL;
static int                  threadPoolSize = 0;

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readerThread
 *----------------------------------------------------------------------------*/
static void* readerThread (void* parm)
{
    (void)parm;

    while(true)
    {
        job_t job = {NULL, NULL};

        jobCond.lock();
        {
            while(readerActive && jobQueue.empty())
            {
                jobCond.wait(0, IO_PEND);
            }

            if(!jobQueue.empty())
            {
                job = jobQueue.front();
                jobQueue.pop_front();
            }
        }
        jobCond.unlock();

        /* Queue is drained before exiting */
        if(job.func == NULL) break;

        job.func(job.parm);
    }

    return NULL;
}

/*----------------------------------------------------------------------------
 * lookup3Rot
 *----------------------------------------------------------------------------*/
static inline uint32_t lookup3Rot (uint32_t x, uint32_t k)
{
    return (x << k) ^ (x >> (32 - k));
}

/*----------------------------------------------------------------------------
 * lookup3Mix
 *----------------------------------------------------------------------------*/
static inline void lookup3Mix (uint32_t& a, uint32_t& b, uint32_t& c)
{
    a -= c;  a ^= lookup3Rot(c, 4);  c += b;
    b -= a;  b ^= lookup3Rot(a, 6);  a += c;
    c -= b;  c ^= lookup3Rot(b, 8);  b += a;
    a -= c;  a ^= lookup3Rot(c, 16); c += b;
    b -= a;  b ^= lookup3Rot(a, 19); a += c;
    c -= b;  c ^= lookup3Rot(b, 4);  b += a;
}

/*----------------------------------------------------------------------------
 * lookup3Final
 *----------------------------------------------------------------------------*/
static inline void lookup3Final (uint32_t& a, uint32_t& b, uint32_t& c)
{
    c ^= b; c -= lookup3Rot(b, 14);
    a ^= c; a -= lookup3Rot(c, 11);
    b ^= a; b -= lookup3Rot(a, 25);
    c ^= b; c -= lookup3Rot(b, 16);
    a ^= c; a -= lookup3Rot(c, 4);
    b ^= a; b -= lookup3Rot(a, 14);
    c ^= b; c -= lookup3Rot(b, 24);
}

/******************************************************************************
 * TYPED ARRAY METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Stream::TypedArray::TypedArray (void):
    type(INVALID_TYPE),
    elements(0)
{
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
H5Stream::TypedArray::TypedArray (DataType _dtype, uint64_t _elements):
    type(_dtype),
    elements(_elements),
    buffer(_elements * typeSize(_dtype), 0)
{
}

/*----------------------------------------------------------------------------
 * value
 *----------------------------------------------------------------------------*/
double H5Stream::TypedArray::value (uint64_t i) const
{
    if(i >= elements)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "element %lu out of range of %lu", (unsigned long)i, (unsigned long)elements);
    }

    switch(type)
    {
        case INT8:      return as<int8_t>()[i];
        case INT16:     return as<int16_t>()[i];
        case INT32:     return as<int32_t>()[i];
        case INT64:     return static_cast<double>(as<int64_t>()[i]);
        case UINT8:     return as<uint8_t>()[i];
        case UINT16:    return as<uint16_t>()[i];
        case UINT32:    return as<uint32_t>()[i];
        case UINT64:    return static_cast<double>(as<uint64_t>()[i]);
        case FLOAT16:   return halfToFloat(as<uint16_t>()[i]);
        case FLOAT32:   return as<float>()[i];
        case FLOAT64:   return as<double>()[i];
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid data type %d", static_cast<int>(type));
    }
}

/*----------------------------------------------------------------------------
 * setValue
 *----------------------------------------------------------------------------*/
void H5Stream::TypedArray::setValue (uint64_t i, double v)
{
    if(i >= elements)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "element %lu out of range of %lu", (unsigned long)i, (unsigned long)elements);
    }

    /* Integer types cannot hold NaN */
    if(!isFloat(type) && std::isnan(v)) v = 0.0;

    switch(type)
    {
        case INT8:      as<int8_t>()[i]     = static_cast<int8_t>(v);   break;
        case INT16:     as<int16_t>()[i]    = static_cast<int16_t>(v);  break;
        case INT32:     as<int32_t>()[i]    = static_cast<int32_t>(v);  break;
        case INT64:     as<int64_t>()[i]    = static_cast<int64_t>(v);  break;
        case UINT8:     as<uint8_t>()[i]    = static_cast<uint8_t>(v);  break;
        case UINT16:    as<uint16_t>()[i]   = static_cast<uint16_t>(v); break;
        case UINT32:    as<uint32_t>()[i]   = static_cast<uint32_t>(v); break;
        case UINT64:    as<uint64_t>()[i]   = static_cast<uint64_t>(v); break;
        case FLOAT16:   as<uint16_t>()[i]   = floatToHalf(static_cast<float>(v)); break;
        case FLOAT32:   as<float>()[i]      = static_cast<float>(v);    break;
        case FLOAT64:   as<double>()[i]     = v;                        break;
        default:        throw RunTimeException(CRITICAL, RTE_ERROR, "invalid data type %d", static_cast<int>(type));
    }
}

/*----------------------------------------------------------------------------
 * fill
 *----------------------------------------------------------------------------*/
void H5Stream::TypedArray::fill (double v)
{
    if(elements == 0) return;
    setValue(0, v);
    fill(buffer.data(), typeSize(type));
}

/*----------------------------------------------------------------------------
 * fill
 *----------------------------------------------------------------------------*/
void H5Stream::TypedArray::fill (const uint8_t* pattern, int pattern_size)
{
    if(pattern_size != typeSize(type))
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "fill pattern of %d bytes does not match %s", pattern_size, type2str(type));
    }

    /* Copy pattern aside since it may alias the buffer */
    uint8_t element[8];
    memcpy(element, pattern, pattern_size);
    for(uint64_t i = 0; i < elements; i++)
    {
        memcpy(&buffer[i * pattern_size], element, pattern_size);
    }
}

/******************************************************************************
 * H5STREAM FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void H5Stream::init (int num_threads)
{
    curl_global_init(CURL_GLOBAL_ALL);

    if(num_threads > 0)
    {
        readerActive = true;
        threadPoolSize = num_threads;
        readerPids = new Thread* [threadPoolSize];
        for(int t = 0; t < threadPoolSize; t++)
        {
            readerPids[t] = new Thread(readerThread, NULL);
        }
    }
    else
    {
        readerActive = false;
        threadPoolSize = 0;
        readerPids = NULL;
    }

    mlog(DEBUG, "H5Stream initialized with %d reader threads", threadPoolSize);
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void H5Stream::deinit (void)
{
    if(readerPids)
    {
        jobCond.lock();
        {
            readerActive = false;
            jobCond.signal();
        }
        jobCond.unlock();

        for(int t = 0; t < threadPoolSize; t++)
        {
            delete readerPids[t];
        }
        delete [] readerPids;
        readerPids = NULL;
        threadPoolSize = 0;
    }

    curl_global_cleanup();
}

/*----------------------------------------------------------------------------
 * post
 *
 *  returns false when no reader threads are running; the caller
 *  then executes the job itself
 *----------------------------------------------------------------------------*/
bool H5Stream::post (job_func_t func, void* parm)
{
    bool posted = false;

    jobCond.lock();
    {
        if(readerActive)
        {
            jobQueue.push_back({func, parm});
            jobCond.signal(0, Cond::NOTIFY_ONE);
            posted = true;
        }
    }
    jobCond.unlock();

    return posted;
}

/*----------------------------------------------------------------------------
 * poolSize
 *----------------------------------------------------------------------------*/
int H5Stream::poolSize (void)
{
    return threadPoolSize;
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* H5Stream::type2str (DataType dtype)
{
    switch(dtype)
    {
        case INT8:      return "int8";
        case INT16:     return "int16";
        case INT32:     return "int32";
        case INT64:     return "int64";
        case UINT8:     return "uint8";
        case UINT16:    return "uint16";
        case UINT32:    return "uint32";
        case UINT64:    return "uint64";
        case FLOAT16:   return "float16";
        case FLOAT32:   return "float32";
        case FLOAT64:   return "float64";
        default:        return "invalid";
    }
}

/*----------------------------------------------------------------------------
 * layout2str
 *----------------------------------------------------------------------------*/
const char* H5Stream::layout2str (layout_t layout)
{
    switch(layout)
    {
        case COMPACT_LAYOUT:    return "compact";
        case CONTIGUOUS_LAYOUT: return "contiguous";
        case CHUNKED_LAYOUT:    return "chunked";
        case VIRTUAL_LAYOUT:    return "virtual";
        default:                return "unknown";
    }
}

/*----------------------------------------------------------------------------
 * index2str
 *----------------------------------------------------------------------------*/
const char* H5Stream::index2str (index_t index)
{
    switch(index)
    {
        case BTREE_V1_INDEX:            return "btree-v1";
        case SINGLE_CHUNK_INDEX:        return "single-chunk";
        case IMPLICIT_INDEX:            return "implicit";
        case FIXED_ARRAY_INDEX:         return "fixed-array";
        case EXTENSIBLE_ARRAY_INDEX:    return "extensible-array";
        case BTREE_V2_INDEX:            return "btree-v2";
        default:                        return "none";
    }
}

/*----------------------------------------------------------------------------
 * filter2str
 *----------------------------------------------------------------------------*/
const char* H5Stream::filter2str (int filter)
{
    switch(filter)
    {
        case DEFLATE_FILTER:        return "deflate";
        case SHUFFLE_FILTER:        return "shuffle";
        case FLETCHER32_FILTER:     return "fletcher32";
        case SZIP_FILTER:           return "szip";
        case NBIT_FILTER:           return "nbit";
        case SCALEOFFSET_FILTER:    return "scaleoffset";
        default:                    return "unknown";
    }
}

/*----------------------------------------------------------------------------
 * typeSize
 *----------------------------------------------------------------------------*/
int H5Stream::typeSize (DataType dtype)
{
    switch(dtype)
    {
        case INT8:
        case UINT8:     return 1;
        case INT16:
        case UINT16:
        case FLOAT16:   return 2;
        case INT32:
        case UINT32:
        case FLOAT32:   return 4;
        case INT64:
        case UINT64:
        case FLOAT64:   return 8;
        default:        return 0;
    }
}

/*----------------------------------------------------------------------------
 * isFloat
 *----------------------------------------------------------------------------*/
bool H5Stream::isFloat (DataType dtype)
{
    return (dtype == FLOAT16) || (dtype == FLOAT32) || (dtype == FLOAT64);
}

/*----------------------------------------------------------------------------
 * halfToFloat
 *----------------------------------------------------------------------------*/
float H5Stream::halfToFloat (uint16_t h)
{
    const int sign = (h >> 15) & 0x1;
    const int exponent = (h >> 10) & 0x1F;
    const int mantissa = h & 0x3FF;

    float value;
    if(exponent == 0)
    {
        value = std::ldexp(static_cast<float>(mantissa), -24); // subnormal
    }
    else if(exponent == 0x1F)
    {
        value = mantissa ? std::numeric_limits<float>::quiet_NaN() : std::numeric_limits<float>::infinity();
    }
    else
    {
        value = std::ldexp(static_cast<float>(mantissa + 0x400), exponent - 25);
    }

    return sign ? -value : value;
}

/*----------------------------------------------------------------------------
 * floatToHalf
 *----------------------------------------------------------------------------*/
uint16_t H5Stream::floatToHalf (float f)
{
    const uint16_t sign = std::signbit(f) ? 0x8000 : 0x0000;

    if(std::isnan(f)) return sign | 0x7E00;

    const float a = std::fabs(f);
    if(a >= 65520.0f) return sign | 0x7C00;   // rounds past the largest half
    if(a < std::ldexp(1.0f, -25)) return sign; // rounds to zero

    int exponent;
    std::frexp(a, &exponent); // a = m * 2^exponent, m in [0.5, 1)
    if(exponent < -13)
    {
        /* Subnormal: units of 2^-24 */
        const long m = std::lround(std::ldexp(a, 24));
        return sign | static_cast<uint16_t>(m);
    }

    /* Normal: 11 significant bits, rounding may carry into the exponent */
    const long m = std::lround(std::ldexp(a, 11 - exponent));
    const uint32_t bits = (static_cast<uint32_t>(exponent + 14) << 10) + (static_cast<uint32_t>(m) - 0x400);
    return sign | static_cast<uint16_t>(bits);
}

/*----------------------------------------------------------------------------
 * checksumLookup3 - Jenkins lookup3 as used by HDF5 metadata checksums
 *----------------------------------------------------------------------------*/
uint32_t H5Stream::checksumLookup3 (const uint8_t* data, uint64_t size, uint32_t initval)
{
    const uint8_t* k = data;
    uint64_t length = size;
    uint32_t a, b, c;

    a = b = c = 0xdeadbeef + static_cast<uint32_t>(length) + initval;

    while(length > 12)
    {
        a += k[0] + (static_cast<uint32_t>(k[1]) << 8) + (static_cast<uint32_t>(k[2]) << 16) + (static_cast<uint32_t>(k[3]) << 24);
        b += k[4] + (static_cast<uint32_t>(k[5]) << 8) + (static_cast<uint32_t>(k[6]) << 16) + (static_cast<uint32_t>(k[7]) << 24);
        c += k[8] + (static_cast<uint32_t>(k[9]) << 8) + (static_cast<uint32_t>(k[10]) << 16) + (static_cast<uint32_t>(k[11]) << 24);
        lookup3Mix(a, b, c);
        length -= 12;
        k += 12;
    }

    switch(length) // cases fall through
    {
        case 12: c += static_cast<uint32_t>(k[11]) << 24;   // fall through
        case 11: c += static_cast<uint32_t>(k[10]) << 16;   // fall through
        case 10: c += static_cast<uint32_t>(k[9]) << 8;     // fall through
        case 9:  c += k[8];                                 // fall through
        case 8:  b += static_cast<uint32_t>(k[7]) << 24;    // fall through
        case 7:  b += static_cast<uint32_t>(k[6]) << 16;    // fall through
        case 6:  b += static_cast<uint32_t>(k[5]) << 8;     // fall through
        case 5:  b += k[4];                                 // fall through
        case 4:  a += static_cast<uint32_t>(k[3]) << 24;    // fall through
        case 3:  a += static_cast<uint32_t>(k[2]) << 16;    // fall through
        case 2:  a += static_cast<uint32_t>(k[1]) << 8;     // fall through
        case 1:  a += k[0];
                 break;
        default: return c;
    }

    lookup3Final(a, b, c);
    return c;
}

/*----------------------------------------------------------------------------
 * checksumFletcher32 - over big endian 16-bit words, as the fletcher32 filter
 *----------------------------------------------------------------------------*/
uint32_t H5Stream::checksumFletcher32 (const uint8_t* data, uint64_t size)
{
    const uint8_t* p = data;
    uint64_t words = size / 2;
    uint32_t sum1 = 0;
    uint32_t sum2 = 0;

    while(words > 0)
    {
        /* Fold before the sums can overflow */
        uint64_t block = MIN(words, 360UL);
        words -= block;
        while(block-- > 0)
        {
            sum1 += (static_cast<uint32_t>(p[0]) << 8) | p[1];
            sum2 += sum1;
            p += 2;
        }
        sum1 = (sum1 & 0xFFFF) + (sum1 >> 16);
        sum2 = (sum2 & 0xFFFF) + (sum2 >> 16);
    }

    if(size % 2)
    {
        sum1 += static_cast<uint32_t>(*p) << 8;
        sum2 += sum1;
        sum1 = (sum1 & 0xFFFF) + (sum1 >> 16);
        sum2 = (sum2 & 0xFFFF) + (sum2 >> 16);
    }

    sum1 = (sum1 & 0xFFFF) + (sum1 >> 16);
    sum2 = (sum2 & 0xFFFF) + (sum2 >> 16);

    return (sum2 << 16) | sum1;
}

/*----------------------------------------------------------------------------
 * fnv1a - 32-bit FNV-1a over a null terminated string
 *----------------------------------------------------------------------------*/
uint32_t H5Stream::fnv1a (const char* str)
{
    uint32_t hash = 0x811c9dc5;
    for(const uint8_t* p = reinterpret_cast<const uint8_t*>(str); *p; p++)
    {
        hash ^= *p;
        hash *= 0x01000193;
    }
    return hash;
}

/*----------------------------------------------------------------------------
 * highestBit
 *----------------------------------------------------------------------------*/
int H5Stream::highestBit (uint64_t value)
{
    int bit = 0;
    while(value >>= 1) bit++;
    return bit;
}
