/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <fstream>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "libcarrier/Utility.hpp"
#include "libcarrier/PathRAII.hpp"
#include "aux/unitTestMain.hpp"


namespace libcarrier {
namespace test {

TEST_GROUP(UtilityTestGroup) {
};

TEST(UtilityTestGroup, generateRandom) {
    auto s = string::generateRandom(16);
    CHECK_EQUAL(s.size(), 16);
    for(auto c : s) {
        CHECK(c >= 'a' && c <= 'z');
    }
}

TEST(UtilityTestGroup, join) {
    CHECK_EQUAL(string::join({}, ", "), std::string{});
    CHECK_EQUAL(string::join({"a"}, ", "), std::string{"a"});
    CHECK_EQUAL(string::join({"a", "b", "c"}, ", "), std::string{"a, b, c"});
}

TEST(UtilityTestGroup, quote) {
    CHECK_EQUAL(string::quote("gzip"), std::string{"\"gzip\""});
    CHECK_EQUAL(string::quote("a\"b"), std::string{"\"a\\\"b\""});
    CHECK_EQUAL(string::quote("line\n"), std::string{"\"line\\n\""});
}

TEST(UtilityTestGroup, base64) {
    CHECK_EQUAL(base64::encode(""), std::string{});
    CHECK_EQUAL(base64::encode("f"), std::string{"Zg=="});
    CHECK_EQUAL(base64::encode("foobar"), std::string{"Zm9vYmFy"});
    CHECK_EQUAL(base64::decode("Zg=="), std::string{"f"});
    CHECK_EQUAL(base64::decode("Zm9vYg=="), std::string{"foob"});
    CHECK_EQUAL(base64::decodeURL("Zm9vYg"), std::string{"foob"});
    CHECK_EQUAL(base64::decodeURL("_-8"), std::string{"\xff\xef"});
    CHECK_THROWS(libcarrier::Error, base64::decode("Zm9"));
    CHECK_THROWS(libcarrier::Error, base64::decode("Z!9v"));
}

TEST(UtilityTestGroup, temporaryDirectoryIsRemoved) {
    auto path = boost::filesystem::path{};
    {
        auto directory = makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test");
        path = directory.getPath();
        CHECK(boost::filesystem::is_directory(path));
        filesystem::writeTextFile("content", path / "nested/file");
    }
    CHECK(!boost::filesystem::exists(path));
}

TEST(UtilityTestGroup, writeFileAtomically) {
    auto directory = makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test");
    auto file = directory.getPath() / "index.json";
    filesystem::writeFileAtomically("first", file);
    filesystem::writeFileAtomically("second", file);
    CHECK_EQUAL(filesystem::readFile(file), std::string{"second"});
    CHECK_EQUAL(filesystem::getFileSize(file), 6);

    auto entries = 0;
    for(auto it = boost::filesystem::directory_iterator{directory.getPath()};
        it != boost::filesystem::directory_iterator{};
        ++it) {
        ++entries;
    }
    CHECK_EQUAL(entries, 1);
}

TEST(UtilityTestGroup, readFileOfMissingPath) {
    CHECK_THROWS(libcarrier::Error, filesystem::readFile("/carrier-nonexistent-file"));
}

TEST(UtilityTestGroup, jsonAccessors) {
    auto json = libcarrier::json::parse(R"({"name": "value", "size": 42, "annotations": {"a": "1"}})");
    CHECK_EQUAL(json::getString(json, "name"), std::string{"value"});
    CHECK_EQUAL(json::getStringOrDefault(json, "missing", "default"), std::string{"default"});
    CHECK_EQUAL(json::getInt64(json, "size"), 42);
    CHECK_THROWS(libcarrier::Error, json::getString(json, "size"));
    CHECK_THROWS(libcarrier::Error, json::getInt64(json, "name"));

    auto annotations = json::getStringMap(json, "annotations");
    CHECK_EQUAL(annotations.size(), 1);
    CHECK_EQUAL(annotations["a"], std::string{"1"});
    CHECK(json::getStringMap(json, "missing").empty());

    json::setStringMap(json, "annotations", {{"b", "2"}, {"c", "3"}}, json.GetAllocator());
    CHECK_EQUAL(json::serialize(json), std::string{R"({"name":"value","size":42,"annotations":{"b":"2","c":"3"}})"});
}

TEST(UtilityTestGroup, jsonParseError) {
    CHECK_THROWS(libcarrier::Error, json::parse("{not json"));
}

TEST(UtilityTestGroup, jsonReadAndValidate) {
    auto directory = makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "carrier-test");
    auto schema = directory.getPath() / "schema.json";
    filesystem::writeTextFile(R"({
        "type": "object",
        "properties": {"tempDir": {"type": "string"}},
        "required": ["tempDir"]
    })", schema);

    auto valid = directory.getPath() / "valid.json";
    filesystem::writeTextFile(R"({"tempDir": "/tmp"})", valid);
    auto json = json::readAndValidate(valid, schema);
    CHECK_EQUAL(json::getString(json, "tempDir"), std::string{"/tmp"});

    auto invalid = directory.getPath() / "invalid.json";
    filesystem::writeTextFile(R"({"tempDir": 1})", invalid);
    CHECK_THROWS(libcarrier::Error, json::readAndValidate(invalid, schema));
}

}}

CARRIER_UNITTEST_MAIN_FUNCTION();
