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
#include <memory>
#include <chrono>
#include <algorithm>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/json.hpp"
#include "image/Digest.hpp"
#include "image/DockerReference.hpp"
#include "image/ManifestList.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "crypto/EncryptConfig.hpp"
#include "crypto/LayerEncryption.hpp"
#include "signature/Policy.hpp"
#include "signature/PolicyContext.hpp"
#include "signature/Signer.hpp"
#include "copy/Copier.hpp"
#include "copy/MultipleImageCopier.hpp"
#include "test_utility/memoryTransport.hpp"
#include "test_utility/images.hpp"
#include "test_utility/crypto.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace copy {
namespace test {

namespace mt = image::mediatype;
using test_utility::memory::MemoryReference;
using test_utility::memory::makeMemoryReference;
using test_utility::images::TestImage;

static signature::PolicyContext makePolicyContext(std::shared_ptr<const signature::PolicyRequirement> requirement) {
    auto policy = signature::Policy{};
    policy.defaultRequirements = {requirement};
    return signature::PolicyContext{policy};
}

static signature::PolicyContext acceptAnything() {
    return makePolicyContext(std::make_shared<signature::InsecureAcceptAnything>());
}

static std::vector<std::string> makeLayers(size_t count) {
    auto layers = std::vector<std::string>{};
    for(size_t i = 0; i < count; ++i) {
        layers.push_back((boost::format("layer %d ") % i).str() + std::string(4096 + i, 'a' + i));
    }
    return layers;
}

static size_t countOccurrences(const std::string& text, const std::string& pattern) {
    auto count = size_t{0};
    for(auto position = text.find(pattern); position != std::string::npos; position = text.find(pattern, position + 1)) {
        ++count;
    }
    return count;
}

static crypto::DecryptConfig makeDecryptConfig(const test_utility::crypto::KeyPairPEM& keys) {
    auto config = crypto::DecryptConfig{};
    config.privateKeys.push_back(crypto::DecryptConfig::PrivateKey{keys.privateKey, boost::none});
    return config;
}

// Copies the image of source to a new store, with all of its layers encrypted for keys
static std::unique_ptr<MemoryReference> makeEncryptedCopy(const MemoryReference& source,
                                                          const test_utility::crypto::KeyPairPEM& keys) {
    auto encrypted = makeMemoryReference("encrypted");
    auto options = Options{};
    options.ociEncryptLayers = std::vector<int>{};
    options.ociEncryptConfig = crypto::EncryptConfig{{keys.publicKey}};
    copyImage(acceptAnything(), *encrypted, source, options);
    return encrypted;
}

static std::string copyErrorMessage(MemoryReference& destination, MemoryReference& source, const Options& options) {
    try {
        copyImage(acceptAnything(), destination, source, options);
    }
    catch(const libcarrier::Error& e) {
        return e.what();
    }
    FAIL("expected the copy to fail");
    return "";
}

// Appends a signature made of the digest of the manifest
class DigestSigner : public signature::Signer {
public:
    std::string getProgressMessage() const override {
        return "Signing with digest signer";
    }
    std::string signImageManifest(const std::string& manifest, const image::DockerReference& identity) override {
        return identity.string() + "@" + image::Digest::fromBytes(manifest).string();
    }
};

TEST_GROUP(CopierTestGroup) {
};

TEST(CopierTestGroup, singleImageIsCopiedUnchanged) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(3));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto manifest = copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK_EQUAL(manifest, testImage.manifest);
    CHECK_EQUAL(store.manifest.first, testImage.manifest);
    CHECK_EQUAL(store.manifest.second, mt::ociImageManifest);
    CHECK(store.committed);
    for(const auto& digest : testImage.layerDigests) {
        CHECK(store.hasBlob(digest));
        CHECK_EQUAL(store.getBlob(digest), testImage.blobs.at(digest.string()));
    }
    CHECK(store.hasBlob(testImage.configDigest));
    CHECK_EQUAL(store.getBlobCount(), testImage.layerDigests.size() + 1);
}

TEST(CopierTestGroup, blobsPresentAtDestinationAreNotRead) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(3));
    test_utility::images::storeImage(*source->getStore(), testImage);
    for(const auto& digest : testImage.layerDigests) {
        destination->getStore()->blobs[digest.string()] = testImage.blobs.at(digest.string());
    }

    copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    for(const auto& digest : testImage.layerDigests) {
        CHECK_EQUAL(source->getStore()->getBlobReads(digest), 0);
        CHECK(std::find(store.putBlobDigests.cbegin(), store.putBlobDigests.cend(), digest.string())
              == store.putBlobDigests.cend());
    }
}

TEST(CopierTestGroup, parallelBlobCopiesAreBounded) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(8));
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->putBlobDelay = std::chrono::milliseconds{20};

    auto options = Options{};
    options.maxParallelDownloads = 2;
    copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK(store.maxConcurrentPutBlobs >= 1);
    CHECK(store.maxConcurrentPutBlobs <= 2);
    CHECK_EQUAL(store.manifest.first, testImage.manifest);
}

TEST(CopierTestGroup, copiesAreSerializedForThreadUnsafeDestinations) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(4));
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->threadSafe = false;
    destination->getStore()->putBlobDelay = std::chrono::milliseconds{10};

    copyImage(acceptAnything(), *destination, *source);

    CHECK_EQUAL(destination->getStore()->maxConcurrentPutBlobs, 1);
}

TEST(CopierTestGroup, preservedDigestsPreventCompression) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2), "amd64", false);
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->desiredLayerCompression = transports::LayerCompression::Compress;

    auto options = Options{};
    options.preserveDigests = true;
    copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    CHECK_EQUAL(store.manifest.first, testImage.manifest);
    for(const auto& digest : testImage.layerDigests) {
        CHECK_EQUAL(store.getBlob(digest), testImage.blobs.at(digest.string()));
    }
}

TEST(CopierTestGroup, layersAreCompressedForTheDestination) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2), "amd64", false);
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->desiredLayerCompression = transports::LayerCompression::Compress;

    auto manifest = copyImage(acceptAnything(), *destination, *source);

    CHECK(manifest != testImage.manifest);
    CHECK(manifest.find(mt::ociImageLayerGzip) != std::string::npos);
    for(const auto& digest : testImage.layerDigests) {
        CHECK_FALSE(destination->getStore()->hasBlob(digest));
    }
}

TEST(CopierTestGroup, forcedFormatConflictingWithCompressionFails) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.forceManifestMIMEType = mt::dockerV2Schema2;
    options.destinationCompressionFormat = compression::Zstd;

    try {
        copyImage(acceptAnything(), *destination, *source, options);
        FAIL("expected the copy to fail");
    }
    catch(const libcarrier::Error& e) {
        auto message = std::string{e.what()};
        CHECK(message.find(compression::ZSTD_ALGORITHM_NAME) != std::string::npos);
        CHECK(message.find(mt::dockerV2Schema2) != std::string::npos);
    }
    CHECK_FALSE(destination->getStore()->committed);
    CHECK(destination->getStore()->manifest.first.empty());
}

TEST(CopierTestGroup, presentCompressionVariantsAreNotCloned) {
    auto images = std::vector<TestImage>{
        test_utility::images::makeOCIImage(makeLayers(1), "amd64"),
        test_utility::images::makeOCIImage(makeLayers(1), "arm64")
    };
    test_utility::memory::MemoryStore store;
    auto listBlob = test_utility::images::storeList(store, images, mt::ociImageIndex);
    auto list = image::listFromBlob(listBlob, mt::ociImageIndex);

    auto options = Options{};
    options.imageListSelection = ImageListSelection::CopyAllImages;
    options.ensureCompressionVariantsExist = {CompressionVariant{compression::Gzip, boost::none}};
    auto copies = prepareInstanceCopies(*list, list->getInstances(), options);

    CHECK_EQUAL(copies.size(), 2);
    for(const auto& copy : copies) {
        CHECK(copy.kind == InstanceCopyKind::Copy);
    }

    options.ensureCompressionVariantsExist = {CompressionVariant{compression::Zstd, boost::none}};
    copies = prepareInstanceCopies(*list, list->getInstances(), options);
    CHECK_EQUAL(copies.size(), 4);
    CHECK(copies[1].kind == InstanceCopyKind::Clone);
    CHECK(copies[1].sourceDigest == images[0].digest);
}

TEST(CopierTestGroup, existingDestinationImageIsNotUploadedAgain) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(3));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.optimizeDestinationImageAlreadyExists = true;
    auto firstManifest = copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    auto putBlobs = store.putBlobDigests.size();
    auto putManifests = store.putManifestCalls;

    auto secondManifest = copyImage(acceptAnything(), *destination, *source, options);

    CHECK_EQUAL(store.putBlobDigests.size(), putBlobs);
    CHECK_EQUAL(store.putManifestCalls, putManifests);
    CHECK(image::Digest::fromBytes(secondManifest) == image::Digest::fromBytes(firstManifest));
    CHECK(image::Digest::fromBytes(store.manifest.first) == testImage.digest);
}

TEST(CopierTestGroup, rejectedManifestTypeFallsBackToOtherCandidate) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeSchema2Image(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->supportedManifestMIMETypes = {mt::dockerV2Schema2, mt::ociImageManifest};
    destination->getStore()->rejectedManifestMIMETypes = {mt::dockerV2Schema2};

    copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(store.manifest.second, mt::ociImageManifest);
    CHECK_EQUAL(store.putManifestCalls, 2);
}

TEST(CopierTestGroup, allImagesOfListAreCopied) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto images = std::vector<TestImage>{
        test_utility::images::makeOCIImage(makeLayers(2), "amd64"),
        test_utility::images::makeOCIImage(makeLayers(3), "arm64")
    };
    test_utility::images::storeList(*source->getStore(), images, mt::ociImageIndex);

    auto options = Options{};
    options.imageListSelection = ImageListSelection::CopyAllImages;
    auto manifest = copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(store.manifest.second, mt::ociImageIndex);
    auto list = image::listFromBlob(manifest, mt::ociImageIndex);
    auto instances = list->getInstances();
    CHECK_EQUAL(instances.size(), 2);
    for(const auto& testImage : images) {
        CHECK(std::find(instances.cbegin(), instances.cend(), testImage.digest) != instances.cend());
        CHECK_EQUAL(store.instanceManifests.at(testImage.digest.string()).first, testImage.manifest);
        for(const auto& digest : testImage.layerDigests) {
            CHECK(store.hasBlob(digest));
        }
    }
}

TEST(CopierTestGroup, systemImageIsPickedFromList) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto images = std::vector<TestImage>{
        test_utility::images::makeOCIImage(makeLayers(2), "amd64"),
        test_utility::images::makeOCIImage(makeLayers(2), "arm64")
    };
    test_utility::images::storeList(*source->getStore(), images, mt::ociImageIndex);

    auto options = Options{};
    options.platformChoice.architecture = "arm64";
    options.platformChoice.os = "linux";
    auto manifest = copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    CHECK_EQUAL(manifest, images[1].manifest);
    CHECK_EQUAL(store.manifest.first, images[1].manifest);
    for(const auto& digest : images[0].layerDigests) {
        CHECK_FALSE(store.hasBlob(digest));
    }
}

TEST(CopierTestGroup, signaturesAreCopiedAndCreated) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1));
    test_utility::images::storeImage(*source->getStore(), testImage);
    source->getStore()->signatures = {"source-signature"};

    auto options = Options{};
    options.signers = {std::make_shared<DigestSigner>()};
    options.signIdentity = image::DockerReference::parse("registry.example.com/library/test:latest");
    copyImage(acceptAnything(), *destination, *source, options);

    const auto& signatures = destination->getStore()->signatures;
    CHECK_EQUAL(signatures.size(), 2);
    CHECK_EQUAL(signatures[0], "source-signature");
    CHECK(signatures[1].find(testImage.digest.string()) != std::string::npos);
    // signed images keep their manifest
    CHECK_EQUAL(destination->getStore()->manifest.first, testImage.manifest);
}

TEST(CopierTestGroup, signaturesRequireDestinationSupport) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1));
    test_utility::images::storeImage(*source->getStore(), testImage);
    source->getStore()->signatures = {"source-signature"};
    destination->getStore()->acceptsSignatures = false;

    CHECK_THROWS(libcarrier::Error, copyImage(acceptAnything(), *destination, *source));
    CHECK_FALSE(destination->getStore()->committed);

    auto options = Options{};
    options.removeSignatures = true;
    copyImage(acceptAnything(), *destination, *source, options);
    CHECK(destination->getStore()->committed);
    CHECK(destination->getStore()->signatures.empty());
}

TEST(CopierTestGroup, policyRejectionStopsCopy) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto policyContext = makePolicyContext(std::make_shared<signature::Reject>());
    CHECK_THROWS(libcarrier::PolicyRejectedError, copyImage(policyContext, *destination, *source));
    CHECK_EQUAL(destination->getStore()->getBlobCount(), 0);
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, cancelledCopyFails) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.cancellation = std::make_shared<CancellationToken>();
    options.cancellation->cancel();

    CHECK_THROWS(libcarrier::Error, copyImage(acceptAnything(), *destination, *source, options));
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, layersArePulledInChunks) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(3));
    test_utility::images::storeImage(*source->getStore(), testImage);
    source->getStore()->rangedReads = true;
    destination->getStore()->partialUploads = true;

    auto manifest = copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(manifest, testImage.manifest);
    CHECK_EQUAL(store.partialBlobDigests.size(), testImage.layerDigests.size());
    for(const auto& digest : testImage.layerDigests) {
        CHECK_EQUAL(source->getStore()->getBlobReads(digest), 0);
        CHECK_EQUAL(source->getStore()->getBlobChunkReads(digest), 2);
        CHECK_EQUAL(store.getBlob(digest), testImage.blobs.at(digest.string()));
    }
}

TEST(CopierTestGroup, refusedChunkedPullFallsBackToFullCopy) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);
    source->getStore()->rangedReads = true;
    destination->getStore()->partialUploads = true;
    destination->getStore()->partialUploadFallbackReason = "blob is not in a chunked format";

    auto manifest = copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(manifest, testImage.manifest);
    CHECK(store.partialBlobDigests.empty());
    for(const auto& digest : testImage.layerDigests) {
        CHECK_EQUAL(source->getStore()->getBlobReads(digest), 1);
        CHECK_EQUAL(source->getStore()->getBlobChunkReads(digest), 0);
        CHECK(std::find(store.putBlobDigests.cbegin(), store.putBlobDigests.cend(), digest.string())
              != store.putBlobDigests.cend());
    }
}

TEST(CopierTestGroup, manifestErrorsOtherThanRejectionsAreNotRetried) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1));
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->supportedManifestMIMETypes = {mt::ociImageManifest, mt::dockerV2Schema2, mt::dockerV2Schema1Signed};
    destination->getStore()->rejectedManifestMIMETypes = {mt::ociImageManifest};
    destination->getStore()->failingManifestMIMETypes = {mt::dockerV2Schema2};

    auto message = copyErrorMessage(*destination, *source, Options{});

    CHECK(message.find("failed to store manifest of type " + mt::dockerV2Schema2) != std::string::npos);
    CHECK(message.find("attempted the following formats") == std::string::npos);
    CHECK_EQUAL(destination->getStore()->putManifestCalls, 2);
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, selectedLayersAreEncrypted) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.ociEncryptLayers = std::vector<int>{-1};
    options.ociEncryptConfig = crypto::EncryptConfig{{keys.publicKey}};
    auto manifest = copyImage(acceptAnything(), *destination, *source, options);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(countOccurrences(manifest, mt::ociImageLayerGzip + mt::encryptedSuffix), 1);
    CHECK_EQUAL(countOccurrences(manifest, crypto::ANNOTATION_KEYS_PKCS1), 1);
    // only the top layer is encrypted
    CHECK(manifest.find(testImage.layerDigests[0].string()) != std::string::npos);
    CHECK(store.hasBlob(testImage.layerDigests[0]));
    CHECK(manifest.find(testImage.layerDigests[1].string()) == std::string::npos);
    CHECK_FALSE(store.hasBlob(testImage.layerDigests[1]));
}

TEST(CopierTestGroup, encryptedLayersAreDecrypted) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(2));
    test_utility::images::storeImage(*source->getStore(), testImage);
    auto encrypted = makeEncryptedCopy(*source, keys);
    CHECK_EQUAL(countOccurrences(encrypted->getStore()->manifest.first, mt::encryptedSuffix), 2);

    // without keys, encrypted layers are copied as they are
    auto unchanged = makeMemoryReference("unchanged");
    auto unchangedManifest = copyImage(acceptAnything(), *unchanged, *encrypted);
    CHECK_EQUAL(unchangedManifest, encrypted->getStore()->manifest.first);

    auto decrypted = makeMemoryReference("decrypted");
    auto options = Options{};
    options.ociDecryptConfig = makeDecryptConfig(keys);
    auto manifest = copyImage(acceptAnything(), *decrypted, *encrypted, options);

    const auto& store = *decrypted->getStore();
    CHECK(store.committed);
    CHECK(manifest.find(mt::encryptedSuffix) == std::string::npos);
    CHECK(manifest.find(crypto::ANNOTATION_KEYS_PKCS1) == std::string::npos);
    CHECK_EQUAL(countOccurrences(manifest, mt::ociImageLayerGzip), 2);
    for(const auto& digest : testImage.layerDigests) {
        CHECK(manifest.find(digest.string()) != std::string::npos);
        CHECK_EQUAL(store.getBlob(digest), testImage.blobs.at(digest.string()));
    }
}

TEST(CopierTestGroup, encryptionNeedsModifiableManifest) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1));
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.ociEncryptLayers = std::vector<int>{};
    options.ociEncryptConfig = crypto::EncryptConfig{{keys.publicKey}};
    options.preserveDigests = true;
    auto destination = makeMemoryReference("destination");
    auto message = copyErrorMessage(*destination, *source, options);
    CHECK(message.find("should be encrypted") != std::string::npos);
    CHECK(message.find("Instructed to preserve digests") != std::string::npos);
    CHECK_FALSE(destination->getStore()->committed);

    options.preserveDigests = false;
    source->getStore()->signatures = {"source-signature"};
    destination = makeMemoryReference("destination");
    message = copyErrorMessage(*destination, *source, options);
    CHECK(message.find("Would invalidate signatures") != std::string::npos);
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, decryptionNeedsModifiableManifest) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    test_utility::images::storeImage(*source->getStore(), test_utility::images::makeOCIImage(makeLayers(1)));
    auto encrypted = makeEncryptedCopy(*source, keys);

    auto options = Options{};
    options.ociDecryptConfig = makeDecryptConfig(keys);
    options.preserveDigests = true;
    auto destination = makeMemoryReference("destination");
    auto message = copyErrorMessage(*destination, *encrypted, options);
    CHECK(message.find("should be decrypted") != std::string::npos);
    CHECK(message.find("Instructed to preserve digests") != std::string::npos);
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, decryptionAndEncryptionAreExclusive) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    test_utility::images::storeImage(*source->getStore(), test_utility::images::makeOCIImage(makeLayers(1)));
    auto encrypted = makeEncryptedCopy(*source, keys);

    auto options = Options{};
    options.ociDecryptConfig = makeDecryptConfig(keys);
    options.ociEncryptLayers = std::vector<int>{};
    options.ociEncryptConfig = crypto::EncryptConfig{{keys.publicKey}};
    auto destination = makeMemoryReference("destination");
    auto message = copyErrorMessage(*destination, *encrypted, options);
    CHECK(message.find("both decryption and encryption") != std::string::npos);
    CHECK_FALSE(destination->getStore()->committed);
}

TEST(CopierTestGroup, chunkedCompressionIsNotCombinedWithEncryption) {
    auto keys = test_utility::crypto::generateRSAKeyPair();
    auto source = makeMemoryReference("source");
    auto testImage = test_utility::images::makeOCIImage(makeLayers(1), "amd64", false);
    test_utility::images::storeImage(*source->getStore(), testImage);

    auto options = Options{};
    options.ociEncryptLayers = std::vector<int>{};
    options.ociEncryptConfig = crypto::EncryptConfig{{keys.publicKey}};
    options.destinationCompressionFormat = compression::ZstdChunked;
    options.forceCompressionFormat = true;
    auto destination = makeMemoryReference("destination");
    auto message = copyErrorMessage(*destination, *source, options);
    CHECK(message.find("zstd:chunked") != std::string::npos);
    CHECK_FALSE(destination->getStore()->committed);

    // without forcing the format, plain zstd is used
    options.forceCompressionFormat = false;
    destination = makeMemoryReference("destination");
    destination->getStore()->desiredLayerCompression = transports::LayerCompression::Compress;
    auto manifest = copyImage(acceptAnything(), *destination, *source, options);
    CHECK_EQUAL(countOccurrences(manifest, mt::ociImageLayerZstd + mt::encryptedSuffix), 1);
    CHECK(manifest.find(compression::ZSTD_CHUNKED_CONTENT_DIGEST_KEY) == std::string::npos);
    CHECK(manifest.find(compression::ZSTD_CHUNKED_MANIFEST_CHECKSUM_KEY) == std::string::npos);
}

TEST(CopierTestGroup, schema1ConversionComputesDiffIDs) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto contents = makeLayers(2);
    auto blobs = std::vector<std::string>{};
    for(const auto& content : contents) {
        blobs.push_back(test_utility::images::gzipped(content));
    }
    auto testImage = test_utility::images::makeSchema1Image(blobs);
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->supportedManifestMIMETypes = {mt::dockerV2Schema2};

    auto manifest = copyImage(acceptAnything(), *destination, *source);

    const auto& store = *destination->getStore();
    CHECK(store.committed);
    CHECK_EQUAL(store.manifest.second, mt::dockerV2Schema2);
    for(const auto& digest : testImage.layerDigests) {
        CHECK(manifest.find(digest.string()) != std::string::npos);
    }
    auto document = libcarrier::json::parse(manifest);
    auto configDigest = image::Digest::parse(libcarrier::json::getString(document["config"], "digest"));
    auto config = store.getBlob(configDigest);
    for(const auto& content : contents) {
        CHECK(config.find(image::Digest::fromBytes(content).string()) != std::string::npos);
    }
}

TEST(CopierTestGroup, failedDiffIDComputationFailsCopy) {
    auto source = makeMemoryReference("source");
    auto destination = makeMemoryReference("destination");
    auto contents = makeLayers(2);
    auto blobs = std::vector<std::string>{
        test_utility::images::gzipped(contents[0]),
        // more trailing data than the pipe to the DiffID computation holds
        test_utility::images::gzipped(contents[1]) + std::string(3 * 1024 * 1024, '\0')
    };
    auto testImage = test_utility::images::makeSchema1Image(blobs);
    test_utility::images::storeImage(*source->getStore(), testImage);
    destination->getStore()->supportedManifestMIMETypes = {mt::dockerV2Schema2};

    CHECK_THROWS(libcarrier::Error, copyImage(acceptAnything(), *destination, *source));
    CHECK_FALSE(destination->getStore()->committed);
    CHECK(destination->getStore()->manifest.first.empty());
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
