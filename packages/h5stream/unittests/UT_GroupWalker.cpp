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

#include "UT_GroupWalker.h"
#include "H5TestFile.h"
#include "MemoryRangeSource.h"
#include "H5GroupWalker.h"
#include "H5Context.h"
#include "H5Concurrency.h"

#include <algorithm>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* UT_GroupWalker::SUITE_NAME = "walker";
const UnitTest::test_t UT_GroupWalker::TESTS[] = {
    {"compact_links",       testCompactLinks},
    {"symbol_table",        testSymbolTable},
    {"symbol_table_utf8",   testSymbolTableUtf8},
    {"dense_links",         testDenseLinks},
    {"deep_name_index",     testDeepNameIndex},
    {"soft_link",           testSoftLink},
    {"walk_sorted",         testWalkSorted},
    {"missing_path",        testMissingPath},
    {"dense_attributes",    testDenseAttributes},
    {NULL,                  NULL}
};

/******************************************************************************
 * LOCAL FUNCTIONS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * dataset - smallest header the walker treats as a dataset
 *----------------------------------------------------------------------------*/
static uint64_t dataset (H5TestFile* file, uint64_t elements)
{
    return file->objectHeader({
        H5TestFile::dataspaceMsg({elements}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::contiguousLayoutMsg(H5TestFile::UNDEFINED, elements * 4)
    });
}

/*----------------------------------------------------------------------------
 * hashOf
 *----------------------------------------------------------------------------*/
static uint32_t hashOf (const std::string& name)
{
    return H5Stream::checksumLookup3(reinterpret_cast<const uint8_t*>(name.c_str()), name.size(), 0);
}

/*----------------------------------------------------------------------------
 * denseLinks - fractal heap of link messages and its name records, by hash
 *----------------------------------------------------------------------------*/
static uint64_t denseLinks (H5TestFile* file, std::vector<H5TestFile::link_spec_t> links, std::vector<H5TestFile::bytes_t>* records)
{
    std::sort(links.begin(), links.end(), [](const H5TestFile::link_spec_t& a, const H5TestFile::link_spec_t& b) { return hashOf(a.name) < hashOf(b.name); });

    std::vector<H5TestFile::bytes_t> objects;
    for(const H5TestFile::link_spec_t& link: links) objects.push_back(H5TestFile::linkBody(link));

    std::vector<H5TestFile::bytes_t> ids;
    const uint64_t heap = file->fractalHeap(objects, 7, &ids);

    records->clear();
    for(size_t i = 0; i < links.size(); i++)
    {
        records->push_back(H5TestFile::nameRecord(links[i].name, ids[i]));
    }

    return heap;
}

/*----------------------------------------------------------------------------
 * resolveCode - error code of resolving a path, RTE_INFO on success
 *----------------------------------------------------------------------------*/
static int resolveCode (H5GroupWalker* walker, const char* path)
{
    try
    {
        walker->resolve(path);
    }
    catch(const RunTimeException& e)
    {
        return e.code();
    }
    return RTE_INFO;
}

/******************************************************************************
 * METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
UT_GroupWalker::UT_GroupWalker (void):
    UnitTest(SUITE_NAME)
{
}

/*--------------------------------------------------------------------------------------
 * testCompactLinks
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testCompactLinks (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t data = dataset(&file, 10);
    const uint64_t inner = dataset(&file, 20);
    const uint64_t grp = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"inner", inner, ""})
    });
    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"data", data, ""}),
        H5TestFile::linkMsg({"grp", grp, ""})
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    ut_assert(ut, walker.resolve("/data") == data, "wrong address for /data");
    ut_assert(ut, walker.resolve("data") == data, "wrong address for relative data");
    ut_assert(ut, walker.resolve("/grp/inner") == inner, "wrong address for /grp/inner");
    ut_assert(ut, walker.resolve("//grp/./inner/") == inner, "wrong address for an untidy path");
    ut_assert(ut, walker.resolve("/") == root, "root did not resolve to itself");

    std::vector<H5ObjectHeader::link_t> links;
    walker.links(*walker.header(root), &links);
    ut_assert(ut, links.size() == 2, "wrong number of root links: %d", (int)links.size());

    /* Headers are parsed once */
    ut_assert(ut, walker.header(inner) == walker.header(inner), "header not shared");

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSymbolTable
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testSymbolTable (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t alpha = dataset(&file, 1);
    const uint64_t beta = dataset(&file, 2);
    const uint64_t gamma = dataset(&file, 3);

    uint64_t heap = 0;
    const uint64_t btree = file.symbolTableGroup({
        {"gamma", gamma, ""},
        {"alpha", alpha, ""},
        {"beta", beta, ""},
        {"link", 0, "/beta"}
    }, &heap);
    const uint64_t root = file.objectHeaderV1({H5TestFile::symbolTableMsg(btree, heap)});
    file.superblockV0(root);

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    ut_assert(ut, walker.resolve("/alpha") == alpha, "wrong address for /alpha");
    ut_assert(ut, walker.resolve("/beta") == beta, "wrong address for /beta");
    ut_assert(ut, walker.resolve("/gamma") == gamma, "wrong address for /gamma");
    ut_assert(ut, walker.resolve("/link") == beta, "soft link did not resolve to /beta");

    int code = resolveCode(&walker, "/aardvark");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "name before every key: %s", RunTimeException::code2str(code));
    code = resolveCode(&walker, "/zeta");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "name after every key: %s", RunTimeException::code2str(code));

    std::vector<H5GroupWalker::object_t> objects;
    walker.walk(&objects);
    ut_assert(ut, objects.size() == 3, "wrong number of datasets: %d", (int)objects.size());
    if(objects.size() == 3)
    {
        ut_assert(ut, objects[0].path == "/alpha" && objects[2].path == "/gamma", "wrong order: %s, %s", objects[0].path.c_str(), objects[2].path.c_str());
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testDenseLinks
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testDenseLinks (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    std::vector<H5TestFile::link_spec_t> links;
    char name[32];
    for(int i = 0; i < 12; i++)
    {
        snprintf(name, sizeof(name), "beam_%02d", i);
        links.push_back({name, dataset(&file, i + 1), ""});
    }

    std::vector<H5TestFile::bytes_t> records;
    const uint64_t heap = denseLinks(&file, links, &records);
    const uint64_t btree = file.btreeV2(5, 11, records);
    const uint64_t root = file.objectHeader({
        H5TestFile::linkInfoMsg(heap, btree),
        H5TestFile::groupInfoMsg()
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    for(const H5TestFile::link_spec_t& link: links)
    {
        const std::string path = "/" + link.name;
        ut_assert(ut, walker.resolve(path.c_str()) == link.address, "wrong address for %s", path.c_str());
    }

    const int code = resolveCode(&walker, "/beam_99");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing dense link: %s", RunTimeException::code2str(code));

    std::vector<H5ObjectHeader::link_t> found;
    walker.links(*walker.header(root), &found);
    ut_assert(ut, found.size() == links.size(), "wrong number of links: %d", (int)found.size());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testDeepNameIndex - records in an internal node and two leaves
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testDeepNameIndex (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    std::vector<H5TestFile::link_spec_t> links = {
        {"lat", dataset(&file, 5), ""},
        {"lon", dataset(&file, 5), ""},
        {"height", dataset(&file, 5), ""},
        {"time", dataset(&file, 5), ""},
        {"quality", dataset(&file, 5), ""}
    };

    std::vector<H5TestFile::bytes_t> records;
    const uint64_t heap = denseLinks(&file, links, &records);

    const std::vector<H5TestFile::bytes_t> left(records.begin(), records.begin() + 2);
    const std::vector<H5TestFile::bytes_t> right(records.begin() + 3, records.end());
    const uint64_t btree = file.btreeV2Deep(5, 11, left, records[2], right);
    const uint64_t root = file.objectHeader({H5TestFile::linkInfoMsg(heap, btree)});

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    for(const H5TestFile::link_spec_t& link: links)
    {
        const std::string path = "/" + link.name;
        ut_assert(ut, walker.resolve(path.c_str()) == link.address, "wrong address for %s", path.c_str());
    }

    std::vector<H5GroupWalker::object_t> objects;
    walker.walk(&objects);
    ut_assert(ut, objects.size() == links.size(), "wrong number of datasets: %d", (int)objects.size());

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSoftLink
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testSoftLink (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t data = dataset(&file, 8);
    const uint64_t grp = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"data", data, ""}),
        H5TestFile::linkMsg({"relative", 0, "data"})
    });
    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"grp", grp, ""}),
        H5TestFile::linkMsg({"alias", 0, "/grp/data"}),
        H5TestFile::linkMsg({"folder", 0, "/grp"}),
        H5TestFile::linkMsg({"loop", 0, "/loop"})
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    ut_assert(ut, walker.resolve("/alias") == data, "absolute soft link not followed");
    ut_assert(ut, walker.resolve("/folder/data") == data, "soft link to a group not followed");
    ut_assert(ut, walker.resolve("/grp/relative") == data, "relative soft link not followed");

    const int code = resolveCode(&walker, "/loop");
    ut_assert(ut, code == RTE_FORMAT_ERROR, "soft link cycle: %s", RunTimeException::code2str(code));

    /* Soft links are not listed */
    std::vector<H5GroupWalker::object_t> objects;
    walker.walk(&objects);
    ut_assert(ut, objects.size() == 1, "wrong number of datasets: %d", (int)objects.size());
    if(!objects.empty())
    {
        ut_assert(ut, objects[0].path == "/grp/data", "wrong path: %s", objects[0].path.c_str());
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testWalkSorted
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testWalkSorted (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t a = dataset(&file, 1);
    const uint64_t b = dataset(&file, 1);
    const uint64_t mid = dataset(&file, 1);
    const uint64_t zeta = dataset(&file, 1);
    const uint64_t alpha = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"b", b, ""}),
        H5TestFile::linkMsg({"a", a, ""})
    });
    const uint64_t broken = 0x50; // zeros inside the superblock space
    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"zeta", zeta, ""}),
        H5TestFile::linkMsg({"alpha", alpha, ""}),
        H5TestFile::linkMsg({"mid", mid, ""}),
        H5TestFile::linkMsg({"broken", broken, ""}),
        H5TestFile::linkMsg({"again", alpha, ""})
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    std::vector<H5GroupWalker::object_t> objects;
    walker.walk(&objects);

    const char* expected[] = {"/alpha/a", "/alpha/b", "/broken", "/mid", "/zeta"};
    ut_assert(ut, objects.size() == 5, "wrong number of objects: %d", (int)objects.size());
    for(size_t i = 0; i < objects.size() && i < 5; i++)
    {
        ut_assert(ut, objects[i].path == expected[i], "object %d is %s, expected %s", (int)i, objects[i].path.c_str(), expected[i]);
    }

    if(objects.size() == 5)
    {
        ut_assert(ut, !objects[2].header, "broken object has a header");
        ut_assert(ut, objects[2].errorCode == RTE_FORMAT_ERROR, "broken object error: %s", RunTimeException::code2str(objects[2].errorCode));
        ut_assert(ut, objects[3].header && objects[3].address == mid, "wrong object for /mid");
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testMissingPath
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testMissingPath (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t data = dataset(&file, 4);
    const uint64_t root = file.objectHeader({
        H5TestFile::groupInfoMsg(),
        H5TestFile::linkMsg({"data", data, ""})
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    int code = resolveCode(&walker, "/nothing");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "missing link: %s", RunTimeException::code2str(code));

    code = resolveCode(&walker, "/data/child");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "path through a dataset: %s", RunTimeException::code2str(code));

    code = resolveCode(&walker, "/Data");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "names are case sensitive: %s", RunTimeException::code2str(code));

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testDenseAttributes
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testDenseAttributes (UnitTest* ut)
{
    ut_initialize(ut);

    const std::vector<std::string> names = {"scale_factor", "add_offset", "valid_min", "valid_max"};

    H5TestFile file;
    std::vector<H5TestFile::bytes_t> objects;
    for(size_t i = 0; i < names.size(); i++)
    {
        H5TestFile::bytes_t value;
        H5TestFile::put(&value, i * 10, 4);
        objects.push_back(H5TestFile::attributeMsg(names[i], H5TestFile::fixedPointMsg(4, true), H5TestFile::dataspaceMsg({}), value).body);
    }

    std::vector<H5TestFile::bytes_t> ids;
    const uint64_t heap = file.fractalHeap(objects, 8, &ids);

    std::vector<H5TestFile::bytes_t> records;
    for(size_t i = 0; i < names.size(); i++)
    {
        records.push_back(H5TestFile::attributeRecord(names[i], ids[i], static_cast<uint32_t>(i)));
    }
    std::sort(records.begin(), records.end(), [](const H5TestFile::bytes_t& x, const H5TestFile::bytes_t& y) {
        uint32_t hx = 0, hy = 0;
        for(int i = 3; i >= 0; i--) { hx = (hx << 8) | x[13 + i]; hy = (hy << 8) | y[13 + i]; }
        return hx < hy;
    });
    const uint64_t btree = file.btreeV2(8, 17, records);

    const uint64_t object = file.objectHeader({
        H5TestFile::dataspaceMsg({4}),
        H5TestFile::fixedPointMsg(4, true),
        H5TestFile::contiguousLayoutMsg(H5TestFile::UNDEFINED, 16),
        H5TestFile::attributeMsg("units", H5TestFile::stringMsg(2), H5TestFile::dataspaceMsg({}), {'m', 0}),
        H5TestFile::attributeInfoMsg(heap, btree)
    });

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, object);

    std::vector<H5ObjectHeader::attribute_t> attributes;
    walker.attributes(*walker.header(object), &attributes);

    ut_assert(ut, attributes.size() == names.size() + 1, "wrong number of attributes: %d", (int)attributes.size());
    for(const std::string& name: names)
    {
        bool found = false;
        for(const H5ObjectHeader::attribute_t& attr: attributes)
        {
            if(attr.name == name)
            {
                found = true;
                ut_assert(ut, attr.dataSize == 4, "wrong size for %s: %lu", name.c_str(), (unsigned long)attr.dataSize);
            }
        }
        ut_assert(ut, found, "dense attribute %s missing", name.c_str());
    }

    return ut_status(ut);
}

/*--------------------------------------------------------------------------------------
 * testSymbolTableUtf8 - multibyte names sort after ascii ones
 *--------------------------------------------------------------------------------------*/
bool UT_GroupWalker::testSymbolTableUtf8 (UnitTest* ut)
{
    ut_initialize(ut);

    H5TestFile file;
    const uint64_t alpha = dataset(&file, 1);
    const uint64_t zeta = dataset(&file, 2);
    const uint64_t ete = dataset(&file, 3);

    uint64_t heap = 0;
    const uint64_t btree = file.symbolTableGroup({
        {"zeta", zeta, ""},
        {"\xC3\xA9t\xC3\xA9", ete, ""},
        {"alpha", alpha, ""}
    }, &heap);
    const uint64_t root = file.objectHeaderV1({H5TestFile::symbolTableMsg(btree, heap)});
    file.superblockV0(root);

    MemoryRangeSource source(file.image());
    H5Concurrency controller(1, 1, 1);
    H5Context context(&source, &controller);
    H5GroupWalker walker(&context, root);

    /* The last key is the multibyte name, so every ascii name falls under it */
    ut_assert(ut, walker.resolve("/zeta") == zeta, "wrong address for /zeta");
    ut_assert(ut, walker.resolve("/alpha") == alpha, "wrong address for /alpha");
    ut_assert(ut, walker.resolve("/\xC3\xA9t\xC3\xA9") == ete, "wrong address for multibyte name");

    const int code = resolveCode(&walker, "/\xC3\xBF");
    ut_assert(ut, code == RTE_RESOURCE_DOES_NOT_EXIST, "name after every key: %s", RunTimeException::code2str(code));

    std::vector<H5GroupWalker::object_t> objects;
    walker.walk(&objects);
    ut_assert(ut, objects.size() == 3, "wrong number of datasets: %d", (int)objects.size());
    if(objects.size() == 3)
    {
        ut_assert(ut, objects[2].path == "/\xC3\xA9t\xC3\xA9", "multibyte name not last: %s", objects[2].path.c_str());
    }

    return ut_status(ut);
}
