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

#include "image/Manifest.hpp"
#include "image/Schema1.hpp"
#include "image/Schema2.hpp"
#include "image/OCI1.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace image {
namespace test {

static std::string digestOf(char c) {
    return "sha256:" + std::string(64, c);
}

static std::string makeSchema2Manifest() {
    auto manifest = boost::format(
        "{\"schemaVersion\":2,\"mediaType\":\"%s\","
        "\"config\":{\"mediaType\":\"%s\",\"size\":1470,\"digest\":\"%s\"},"
        "\"layers\":["
        "{\"mediaType\":\"%s\",\"size\":2811947,\"digest\":\"%s\"},"
        "{\"mediaType\":\"%s\",\"size\":1024,\"digest\":\"%s\"}]}")
        % mediatype::dockerV2Schema2
        % mediatype::dockerV2Schema2Config % digestOf('c')
        % mediatype::dockerV2Schema2Layer % digestOf('1')
        % mediatype::dockerV2SchemaLayerUncompressed % digestOf('2');
    return manifest.str();
}

static std::string makeOCI1Manifest(const std::string& layerMediaType) {
    auto manifest = boost::format(
        "{\"schemaVersion\":2,\"mediaType\":\"%s\","
        "\"config\":{\"mediaType\":\"%s\",\"digest\":\"%s\",\"size\":600},"
        "\"layers\":[{\"mediaType\":\"%s\",\"digest\":\"%s\",\"size\":3000}],"
        "\"annotations\":{\"org.opencontainers.image.title\":\"test\"}}")
        % mediatype::ociImageManifest
        % mediatype::ociImageConfig % digestOf('c')
        % layerMediaType % digestOf('1');
    return manifest.str();
}

static std::string makeV1Compatibility(const std::string& id, const std::string& parent, bool throwAway) {
    auto entry = std::string{"{\\\"id\\\":\\\""} + id + "\\\"";
    if(!parent.empty()) {
        entry += ",\\\"parent\\\":\\\"" + parent + "\\\"";
    }
    entry += ",\\\"created\\\":\\\"2023-01-01T00:00:00Z\\\"";
    if(throwAway) {
        entry += ",\\\"throwaway\\\":true";
    }
    entry += "}";
    return entry;
}

static std::string makeSchema1Manifest() {
    auto top = std::string(64, 'b');
    auto base = std::string(64, 'a');
    auto manifest = boost::format(
        "{\"schemaVersion\":1,\"name\":\"library/busybox\",\"tag\":\"latest\",\"architecture\":\"amd64\","
        "\"fsLayers\":[{\"blobSum\":\"%s\"},{\"blobSum\":\"%s\"}],"
        "\"history\":[{\"v1Compatibility\":\"%s\"},{\"v1Compatibility\":\"%s\"}]}")
        % digestOf('e') % digestOf('1')
        % makeV1Compatibility(top, base, true) % makeV1Compatibility(base, "", false);
    return manifest.str();
}

TEST_GROUP(ManifestTestGroup) {
};

TEST(ManifestTestGroup, guessMIMEType) {
    CHECK_EQUAL(guessMIMEType(makeSchema2Manifest()), mediatype::dockerV2Schema2);
    CHECK_EQUAL(guessMIMEType(makeOCI1Manifest(mediatype::ociImageLayerGzip)), mediatype::ociImageManifest);
    CHECK_EQUAL(guessMIMEType(makeSchema1Manifest()), mediatype::dockerV2Schema1);
    CHECK_EQUAL(guessMIMEType("not JSON"), std::string{""});

    auto ociWithoutMediaType = boost::format(
        "{\"schemaVersion\":2,\"config\":{\"mediaType\":\"%s\",\"digest\":\"%s\",\"size\":1},\"layers\":[]}")
        % mediatype::ociImageConfig % digestOf('c');
    CHECK_EQUAL(guessMIMEType(ociWithoutMediaType.str()), mediatype::ociImageManifest);
}

TEST(ManifestTestGroup, normalizedMIMEType) {
    CHECK_EQUAL(normalizedMIMEType(mediatype::dockerV2Schema2), mediatype::dockerV2Schema2);
    CHECK_EQUAL(normalizedMIMEType("application/json"), mediatype::dockerV2Schema1Signed);
    CHECK_EQUAL(normalizedMIMEType("text/plain"), mediatype::dockerV2Schema1Signed);
}

TEST(ManifestTestGroup, schema2) {
    auto blob = makeSchema2Manifest();
    auto manifest = Schema2::fromBlob(blob);
    CHECK_EQUAL(manifest->getMIMEType(), mediatype::dockerV2Schema2);
    CHECK_EQUAL(manifest->getConfigInfo().digest.string(), digestOf('c'));
    CHECK_EQUAL(manifest->getConfigInfo().size, 1470);

    auto layers = manifest->getLayerInfos();
    CHECK_EQUAL(layers.size(), 2);
    CHECK_EQUAL(layers[0].digest.string(), digestOf('1'));
    CHECK_EQUAL(layers[0].size, 2811947);
    CHECK_EQUAL(layers[0].mediaType, mediatype::dockerV2Schema2Layer);
    CHECK(!layers[0].emptyLayer);

    // compact input with the canonical member order is reproduced exactly
    CHECK_EQUAL(manifest->serialize(), blob);
}

TEST(ManifestTestGroup, schema2RejectsAmbiguousManifest) {
    auto blob = makeSchema2Manifest();
    blob.insert(blob.size() - 1, ",\"manifests\":[]");
    CHECK_THROWS(libcarrier::Error, Schema2::fromBlob(blob));
}

TEST(ManifestTestGroup, schema2RejectsUnknownLayerMediaType) {
    auto blob = makeSchema2Manifest();
    auto position = blob.find(mediatype::dockerV2SchemaLayerUncompressed);
    blob.replace(position, mediatype::dockerV2SchemaLayerUncompressed.size(), "application/octet-stream");
    CHECK_THROWS(libcarrier::Error, Schema2::fromBlob(blob));
}

TEST(ManifestTestGroup, schema2UpdateLayerInfos) {
    auto manifest = Schema2::fromBlob(makeSchema2Manifest());
    auto infos = toBlobInfos(manifest->getLayerInfos());
    infos[1].compressionOperation = CompressionOperation::Compress;
    infos[1].compressionAlgorithm = compression::Gzip;
    infos[1].digest = Digest::parse(digestOf('3'));
    infos[1].size = 512;
    manifest->updateLayerInfos(infos);

    auto updated = manifest->getLayerInfos();
    CHECK_EQUAL(updated[1].mediaType, mediatype::dockerV2Schema2Layer);
    CHECK_EQUAL(updated[1].digest.string(), digestOf('3'));
    CHECK_EQUAL(updated[1].size, 512);

    infos.pop_back();
    CHECK_THROWS(libcarrier::Error, manifest->updateLayerInfos(infos));
}

TEST(ManifestTestGroup, schema2RejectsZstd) {
    auto manifest = Schema2::fromBlob(makeSchema2Manifest());
    auto infos = toBlobInfos(manifest->getLayerInfos());
    infos[0].compressionOperation = CompressionOperation::Compress;
    infos[0].compressionAlgorithm = compression::Zstd;
    CHECK_THROWS(libcarrier::CompressionIncompatibleError, manifest->updateLayerInfos(infos));
}

TEST(ManifestTestGroup, schema2RejectsEncryption) {
    auto manifest = Schema2::fromBlob(makeSchema2Manifest());
    auto infos = toBlobInfos(manifest->getLayerInfos());
    infos[0].cryptoOperation = CryptoOperation::Encrypt;
    CHECK_THROWS(libcarrier::Error, manifest->updateLayerInfos(infos));
}

TEST(ManifestTestGroup, oci1) {
    auto blob = makeOCI1Manifest(mediatype::ociImageLayerGzip);
    auto manifest = OCI1::fromBlob(blob);
    CHECK_EQUAL(manifest->getMIMEType(), mediatype::ociImageManifest);
    CHECK_EQUAL(manifest->getAnnotations().at("org.opencontainers.image.title"), std::string{"test"});
    CHECK_EQUAL(manifest->serialize(), blob);
    CHECK(manifest->canChangeLayerCompression(mediatype::ociImageLayerGzip));
    CHECK(!manifest->canChangeLayerCompression("application/vnd.example.data"));
}

TEST(ManifestTestGroup, oci1CompressionChanges) {
    auto manifest = OCI1::fromBlob(makeOCI1Manifest(mediatype::ociImageLayerGzip));
    auto infos = toBlobInfos(manifest->getLayerInfos());

    infos[0].compressionOperation = CompressionOperation::Compress;
    infos[0].compressionAlgorithm = compression::ZstdChunked;
    manifest->updateLayerInfos(infos);
    CHECK_EQUAL(manifest->getLayerInfos()[0].mediaType, mediatype::ociImageLayerZstd);

    infos[0].compressionOperation = CompressionOperation::Decompress;
    infos[0].compressionAlgorithm = boost::none;
    manifest->updateLayerInfos(infos);
    CHECK_EQUAL(manifest->getLayerInfos()[0].mediaType, mediatype::ociImageLayer);
}

TEST(ManifestTestGroup, oci1Encryption) {
    auto manifest = OCI1::fromBlob(makeOCI1Manifest(mediatype::ociImageLayerGzip));
    auto infos = toBlobInfos(manifest->getLayerInfos());
    infos[0].cryptoOperation = CryptoOperation::Encrypt;
    manifest->updateLayerInfos(infos);
    CHECK_EQUAL(manifest->getLayerInfos()[0].mediaType, mediatype::ociImageLayerGzip + "+encrypted");

    // decrypting a layer which is not encrypted fails
    auto plain = OCI1::fromBlob(makeOCI1Manifest(mediatype::ociImageLayerGzip));
    infos = toBlobInfos(plain->getLayerInfos());
    infos[0].cryptoOperation = CryptoOperation::Decrypt;
    CHECK_THROWS(libcarrier::Error, plain->updateLayerInfos(infos));

    infos = toBlobInfos(manifest->getLayerInfos());
    infos[0].cryptoOperation = CryptoOperation::Decrypt;
    manifest->updateLayerInfos(infos);
    CHECK_EQUAL(manifest->getLayerInfos()[0].mediaType, mediatype::ociImageLayerGzip);
}

TEST(ManifestTestGroup, encryptedMediaTypes) {
    CHECK_EQUAL(getEncryptedMediaType(mediatype::ociImageLayer), mediatype::ociImageLayer + "+encrypted");
    CHECK_EQUAL(getEncryptedMediaType(mediatype::ociImageLayerZstd), mediatype::ociImageLayerZstd + "+encrypted");
    CHECK_THROWS(libcarrier::Error, getEncryptedMediaType(mediatype::ociImageLayerGzip + "+encrypted"));
    CHECK_THROWS(libcarrier::Error, getEncryptedMediaType(mediatype::ociImageConfig));
    CHECK_EQUAL(getDecryptedMediaType(mediatype::ociImageLayerGzip + "+encrypted"), mediatype::ociImageLayerGzip);
    CHECK_THROWS(libcarrier::Error, getDecryptedMediaType(mediatype::ociImageLayerGzip));
}

TEST(ManifestTestGroup, schema1) {
    auto manifest = Schema1::fromBlob(makeSchema1Manifest());
    CHECK_EQUAL(manifest->getName(), std::string{"library/busybox"});
    CHECK_EQUAL(manifest->getTag(), std::string{"latest"});
    CHECK(manifest->getConfigInfo().digest.empty());

    // layer infos are listed base layer first
    auto layers = manifest->getLayerInfos();
    CHECK_EQUAL(layers.size(), 2);
    CHECK_EQUAL(layers[0].digest.string(), digestOf('1'));
    CHECK(!layers[0].emptyLayer);
    CHECK_EQUAL(layers[1].digest.string(), digestOf('e'));
    CHECK(layers[1].emptyLayer);
    CHECK_EQUAL(layers[1].size, -1);
}

TEST(ManifestTestGroup, schema1InvalidParent) {
    auto blob = makeSchema1Manifest();
    auto position = blob.find(std::string(64, 'a'));
    blob.replace(position, 64, std::string(64, 'f'));
    CHECK_THROWS(libcarrier::Error, Schema1::fromBlob(blob));
}

TEST(ManifestTestGroup, schema1ToSchema2Config) {
    auto manifest = Schema1::fromBlob(makeSchema1Manifest());
    auto config = manifest->toSchema2Config({Digest::parse(digestOf('d'))});
    auto document = libcarrier::json::parse(config);
    CHECK(!document.HasMember("id"));
    CHECK(!document.HasMember("parent"));
    CHECK(!document.HasMember("throwaway"));
    CHECK_EQUAL(document["rootfs"]["type"].GetString(), std::string{"layers"});
    CHECK_EQUAL(document["rootfs"]["diff_ids"][0].GetString(), digestOf('d'));
    CHECK_EQUAL(document["history"].Size(), 2);
    CHECK(document["history"][1]["empty_layer"].GetBool());
}

TEST(ManifestTestGroup, schema1UpdateLayerInfos) {
    auto manifest = Schema1::fromBlob(makeSchema1Manifest());
    auto infos = toBlobInfos(manifest->getLayerInfos());
    infos[0].digest = Digest::parse(digestOf('5'));
    manifest->updateLayerInfos(infos);
    CHECK_EQUAL(manifest->getLayerInfos()[0].digest.string(), digestOf('5'));

    infos[0].compressionOperation = CompressionOperation::Compress;
    infos[0].compressionAlgorithm = compression::Zstd;
    CHECK_THROWS(libcarrier::CompressionIncompatibleError, manifest->updateLayerInfos(infos));
}

TEST(ManifestTestGroup, manifestFromBlob) {
    auto manifest = manifestFromBlob(makeSchema2Manifest(), mediatype::dockerV2Schema2);
    CHECK_EQUAL(manifest->getMIMEType(), mediatype::dockerV2Schema2);
    CHECK_THROWS(libcarrier::Error, manifestFromBlob("{}", mediatype::dockerV2List));
}

TEST(ManifestTestGroup, manifestDigest) {
    auto blob = makeSchema2Manifest();
    CHECK(manifestDigest(blob) == Digest::fromBytes(blob));
    CHECK(manifestMatchesDigest(blob, Digest::fromBytes(blob)));
    CHECK(!manifestMatchesDigest(blob + " ", Digest::fromBytes(blob)));
}

TEST(ManifestTestGroup, supportsCompressionAlgorithm) {
    CHECK(mimeTypeSupportsCompressionAlgorithm(mediatype::dockerV2Schema2, compression::Gzip));
    CHECK(!mimeTypeSupportsCompressionAlgorithm(mediatype::dockerV2Schema2, compression::Zstd));
    CHECK(mimeTypeSupportsCompressionAlgorithm(mediatype::ociImageManifest, compression::ZstdChunked));
    CHECK(!mimeTypeSupportsCompressionAlgorithm(mediatype::ociImageManifest, compression::Xz));
}

TEST(ManifestTestGroup, reuseConditions) {
    auto conditions = ReuseConditions{};
    CHECK(candidateCompressionMatchesReuseConditions(conditions, boost::none));

    conditions.requiredCompression = compression::Zstd;
    CHECK(!candidateCompressionMatchesReuseConditions(conditions, boost::none));
    CHECK(!candidateCompressionMatchesReuseConditions(conditions, compression::Gzip));
    CHECK(candidateCompressionMatchesReuseConditions(conditions, compression::ZstdChunked));

    conditions = ReuseConditions{};
    conditions.possibleManifestFormats = std::vector<std::string>{mediatype::dockerV2Schema2};
    CHECK(!candidateCompressionMatchesReuseConditions(conditions, compression::Zstd));
    CHECK(candidateCompressionMatchesReuseConditions(conditions, compression::Gzip));
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
