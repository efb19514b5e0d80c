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
#include <vector>

#include <boost/format.hpp>

#include "image/ManifestList.hpp"
#include "image/Schema2List.hpp"
#include "image/OCI1Index.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace image {
namespace test {

static Digest digestOf(char c) {
    return Digest::parse("sha256:" + std::string(64, c));
}

static std::string makeSchema2List() {
    auto list = boost::format(
        "{\"schemaVersion\":2,\"mediaType\":\"%1%\",\"manifests\":["
        "{\"mediaType\":\"%2%\",\"size\":527,\"digest\":\"%3%\",\"platform\":{\"architecture\":\"amd64\",\"os\":\"linux\"}},"
        "{\"mediaType\":\"%2%\",\"size\":527,\"digest\":\"%4%\",\"platform\":{\"architecture\":\"arm64\",\"os\":\"linux\",\"variant\":\"v8\"}},"
        "{\"mediaType\":\"%2%\",\"size\":527,\"digest\":\"%5%\",\"platform\":{\"architecture\":\"ppc64le\",\"os\":\"linux\",\"features\":[\"sse4\"]}}]}")
        % mediatype::dockerV2List % mediatype::dockerV2Schema2
        % digestOf('1') % digestOf('2') % digestOf('3');
    return list.str();
}

static std::string makeOCI1Index() {
    auto index = boost::format(
        "{\"schemaVersion\":2,\"mediaType\":\"%1%\",\"manifests\":["
        "{\"mediaType\":\"%2%\",\"digest\":\"%3%\",\"size\":700,\"platform\":{\"architecture\":\"amd64\",\"os\":\"linux\"}},"
        "{\"mediaType\":\"%2%\",\"digest\":\"%4%\",\"size\":700,"
        "\"annotations\":{\"io.github.containers.compression.zstd\":\"true\"},"
        "\"platform\":{\"architecture\":\"amd64\",\"os\":\"linux\"}}]}")
        % mediatype::ociImageIndex % mediatype::ociImageManifest
        % digestOf('a') % digestOf('b');
    return index.str();
}

static PlatformChoice makeChoice(const std::string& architecture, const std::string& variant = "") {
    auto choice = PlatformChoice{};
    choice.os = "linux";
    choice.architecture = architecture;
    choice.variant = variant;
    return choice;
}

TEST_GROUP(ManifestListTestGroup) {
};

TEST(ManifestListTestGroup, schema2ListInstances) {
    auto list = listFromBlob(makeSchema2List(), mediatype::dockerV2List);
    CHECK_EQUAL(list->getMIMEType(), mediatype::dockerV2List);
    CHECK_EQUAL(list->getInstances().size(), 3);

    auto instance = list->getInstance(digestOf('2'));
    CHECK_EQUAL(instance.size, 527);
    CHECK_EQUAL(instance.mediaType, mediatype::dockerV2Schema2);
    CHECK_EQUAL(instance.readOnly.platform->architecture, std::string{"arm64"});
    CHECK_EQUAL(instance.readOnly.platform->variant, std::string{"v8"});
    CHECK_EQUAL(instance.readOnly.compressionAlgorithmNames.size(), 1);
    CHECK_EQUAL(instance.readOnly.compressionAlgorithmNames[0], compression::GZIP_ALGORITHM_NAME);

    CHECK_THROWS(libcarrier::Error, list->getInstance(digestOf('9')));
    CHECK_EQUAL(list->serialize(), makeSchema2List());
}

TEST(ManifestListTestGroup, schema2ListChooseInstance) {
    auto list = listFromBlob(makeSchema2List(), mediatype::dockerV2List);
    CHECK(list->chooseInstance(makeChoice("amd64")) == digestOf('1'));
    CHECK(list->chooseInstance(makeChoice("arm64", "v8")) == digestOf('2'));
    CHECK(list->chooseInstance(makeChoice("ppc64le")) == digestOf('3'));
    CHECK_THROWS(libcarrier::Error, list->chooseInstance(makeChoice("s390x")));
}

TEST(ManifestListTestGroup, updateInstances) {
    auto list = listFromBlob(makeSchema2List(), mediatype::dockerV2List);
    auto updates = std::vector<ListUpdate>(3);
    updates[0].digest = digestOf('4');
    updates[0].size = 100;
    updates[0].mediaType = mediatype::dockerV2Schema2;
    updates[1].digest = digestOf('5');
    updates[1].size = 200;
    updates[1].mediaType = mediatype::dockerV2Schema2;
    updates[2].digest = digestOf('6');
    updates[2].size = 300;
    updates[2].mediaType = mediatype::dockerV2Schema2;
    list->updateInstances(updates);

    auto instances = list->getInstances();
    CHECK(instances[0] == digestOf('4'));
    CHECK(instances[2] == digestOf('6'));
    CHECK_EQUAL(list->getInstance(digestOf('5')).size, 200);
    // platforms are kept
    CHECK_EQUAL(list->getInstance(digestOf('5')).readOnly.platform->architecture, std::string{"arm64"});

    updates.pop_back();
    CHECK_THROWS(libcarrier::Error, list->updateInstances(updates));
}

TEST(ManifestListTestGroup, editInstancesErrors) {
    auto list = listFromBlob(makeSchema2List(), mediatype::dockerV2List);

    auto edit = ListEdit{};
    edit.operation = ListOperation::Update;
    edit.updateOldDigest = digestOf('9');
    edit.updateDigest = digestOf('8');
    edit.updateSize = 1;
    edit.updateMediaType = mediatype::dockerV2Schema2;
    CHECK_THROWS(libcarrier::Error, list->editInstances({edit}));

    edit.updateOldDigest = digestOf('1');
    edit.updateSize = -1;
    CHECK_THROWS(libcarrier::Error, list->editInstances({edit}));

    edit.updateSize = 1;
    edit.updateMediaType = "";
    CHECK_THROWS(libcarrier::Error, list->editInstances({edit}));

    auto add = ListEdit{};
    add.operation = ListOperation::Add;
    add.addDigest = digestOf('7');
    add.addSize = 10;
    add.addMediaType = mediatype::dockerV2Schema2;
    CHECK_THROWS(libcarrier::Error, list->editInstances({add}));
}

TEST(ManifestListTestGroup, ociIndexChooseInstanceByCompression) {
    auto index = listFromBlob(makeOCI1Index(), mediatype::ociImageIndex);
    auto choice = makeChoice("amd64");
    CHECK(index->chooseInstanceByCompression(choice, true) == digestOf('a'));
    CHECK(index->chooseInstanceByCompression(choice, false) == digestOf('b'));
    CHECK(index->chooseInstance(choice) == digestOf('b'));

    auto instance = index->getInstance(digestOf('b'));
    CHECK_EQUAL(instance.readOnly.compressionAlgorithmNames[0], compression::ZSTD_ALGORITHM_NAME);
}

TEST(ManifestListTestGroup, ociIndexAddZstdInstance) {
    auto index = listFromBlob(makeOCI1Index(), mediatype::ociImageIndex);

    auto add = ListEdit{};
    add.operation = ListOperation::Add;
    add.addDigest = digestOf('c');
    add.addSize = 800;
    add.addMediaType = mediatype::ociImageManifest;
    add.addPlatform = Platform{};
    add.addPlatform->architecture = "arm64";
    add.addPlatform->os = "linux";
    add.addCompressionAlgorithms = {compression::Gzip};
    index->editInstances({add});

    // gzip instances are listed before zstd ones
    auto instances = index->getInstances();
    CHECK_EQUAL(instances.size(), 3);
    CHECK(instances[0] == digestOf('a'));
    CHECK(instances[1] == digestOf('c'));
    CHECK(instances[2] == digestOf('b'));

    add.addDigest = digestOf('d');
    add.addCompressionAlgorithms = {compression::ZstdChunked};
    index->editInstances({add});
    auto zstdInstance = index->getInstance(digestOf('d'));
    CHECK_EQUAL(zstdInstance.readOnly.annotations.at(OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD),
                OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD_VALUE);
}

TEST(ManifestListTestGroup, ociIndexUpdateAnnotations) {
    auto index = listFromBlob(makeOCI1Index(), mediatype::ociImageIndex);

    auto edit = ListEdit{};
    edit.operation = ListOperation::Update;
    edit.updateOldDigest = digestOf('a');
    edit.updateDigest = digestOf('e');
    edit.updateSize = 701;
    edit.updateMediaType = mediatype::ociImageManifest;
    edit.updateAnnotations = std::map<std::string, std::string>{{"org.example.key", "value"}};
    index->editInstances({edit});

    auto instance = index->getInstance(digestOf('e'));
    CHECK_EQUAL(instance.size, 701);
    CHECK_EQUAL(instance.readOnly.annotations.at("org.example.key"), std::string{"value"});

    edit.updateOldDigest = digestOf('e');
    edit.updateAnnotations = std::map<std::string, std::string>{{"org.example.other", "x"}};
    edit.updateAffectAnnotations = true;
    index->editInstances({edit});
    instance = index->getInstance(digestOf('e'));
    CHECK_EQUAL(instance.readOnly.annotations.size(), 1);
    CHECK(instance.readOnly.annotations.count("org.example.key") == 0);
}

TEST(ManifestListTestGroup, conversions) {
    auto list = listFromBlob(makeSchema2List(), mediatype::dockerV2List);
    auto index = list->convertToMIMEType(mediatype::ociImageIndex);
    CHECK_EQUAL(index->getMIMEType(), mediatype::ociImageIndex);
    CHECK_EQUAL(index->getInstances().size(), 3);
    // OCI platforms have no CPU features
    CHECK(index->getInstance(digestOf('3')).readOnly.platform->features.empty());

    auto back = index->convertToMIMEType(mediatype::dockerV2List);
    CHECK_EQUAL(back->getMIMEType(), mediatype::dockerV2List);
    CHECK_EQUAL(back->getInstance(digestOf('2')).readOnly.platform->variant, std::string{"v8"});

    CHECK_THROWS(libcarrier::Error, list->convertToMIMEType(mediatype::dockerV2Schema2));
    CHECK_THROWS(libcarrier::Error, index->convertToMIMEType(mediatype::ociImageManifest));
}

TEST(ManifestListTestGroup, listFromBlobRejectsSingleImages) {
    CHECK_THROWS(libcarrier::Error, listFromBlob("{\"schemaVersion\":2}", mediatype::dockerV2Schema2));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
