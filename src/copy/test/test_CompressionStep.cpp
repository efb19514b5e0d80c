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
#include <map>
#include <memory>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "compression/Compressor.hpp"
#include "blobinfocache/MemoryCache.hpp"
#include "stream/StringReader.hpp"
#include "stream/PeekableReader.hpp"
#include "copy/CompressionStep.hpp"
#include "test_utility/images.hpp"
#include "libcarrier/test/aux/unitTestMain.hpp"


namespace carrier {
namespace copy {
namespace test {

static const auto layerContent = std::string(50000, 'l') + "end of layer";

static std::string decompressed(const std::string& blob, const compression::Algorithm& algorithm) {
    stream::StringReader source{blob};
    auto decompressor = compression::newDecompressor(algorithm, source);
    return stream::readAll(*decompressor);
}

static CompressionStepSettings makeSettings(transports::LayerCompression desired) {
    auto settings = CompressionStepSettings{};
    settings.desiredLayerCompression = desired;
    settings.canModifyBlob = true;
    settings.layerCompressionChangeSupported = true;
    return settings;
}

// Runs a blob through a compression step, returning the output
struct StepRun {
    StepRun(const std::string& blob, const std::string& mediaType, const CompressionStepSettings& settings)
        : source{blob}
        , peekable{source}
    {
        info.digest = image::Digest::fromBytes(blob);
        info.size = blob.size();
        info.mediaType = mediaType;
        auto detected = detectCompressionStep(peekable, info);
        step.reset(new CompressionStep{peekable, info, detected, settings});
        output = stream::readAll(step->getReader());
    }

    stream::StringReader source;
    stream::PeekableReader peekable;
    image::BlobInfo info;
    std::unique_ptr<CompressionStep> step;
    std::string output;
};

TEST_GROUP(CompressionStepTestGroup) {
};

TEST(CompressionStepTestGroup, detection) {
    stream::StringReader source{test_utility::images::gzipped(layerContent)};
    stream::PeekableReader peekable{source};
    auto info = image::BlobInfo{};
    info.mediaType = image::mediatype::ociImageLayerGzip;
    auto detected = detectCompressionStep(peekable, info);
    CHECK(detected.isCompressed());
    CHECK_EQUAL(detected.format->getName(), compression::GZIP_ALGORITHM_NAME);
    CHECK_EQUAL(detected.srcCompressorBaseVariantName, compression::GZIP_ALGORITHM_NAME);

    stream::StringReader plain{layerContent};
    stream::PeekableReader plainPeekable{plain};
    auto plainDetected = detectCompressionStep(plainPeekable, info);
    CHECK_FALSE(plainDetected.isCompressed());
    CHECK_EQUAL(plainDetected.srcCompressorBaseVariantName, blobinfocache::UNCOMPRESSED);
    // detection doesn't consume the stream
    CHECK_EQUAL(stream::readAll(plainPeekable), layerContent);
}

TEST(CompressionStepTestGroup, compressUncompressed) {
    auto run = StepRun{layerContent, image::mediatype::ociImageLayer,
                       makeSettings(transports::LayerCompression::Compress)};
    CHECK(run.step->getOperation() == CompressionStepOperation::CompressUncompressed);
    CHECK(run.step->changesBlob());
    CHECK_EQUAL(decompressed(run.output, compression::Gzip), layerContent);

    auto uploaded = image::BlobInfo{};
    run.step->updateCompressionEdits(uploaded);
    CHECK(uploaded.compressionOperation == image::CompressionOperation::Compress);
    CHECK_EQUAL(uploaded.compressionAlgorithm->getName(), compression::GZIP_ALGORITHM_NAME);

    blobinfocache::MemoryCache cache{};
    auto uploadedDigest = image::Digest::fromBytes(run.output);
    run.step->recordValidatedDigestData(cache, uploadedDigest, run.info.digest, false);
    CHECK(cache.uncompressedDigest(uploadedDigest) == run.info.digest);
}

TEST(CompressionStepTestGroup, explicitFormatIsUsed) {
    auto settings = makeSettings(transports::LayerCompression::Compress);
    settings.compressionFormat = compression::Zstd;
    auto run = StepRun{layerContent, image::mediatype::ociImageLayer, settings};
    CHECK(run.step->getOperation() == CompressionStepOperation::CompressUncompressed);
    CHECK_EQUAL(decompressed(run.output, compression::Zstd), layerContent);

    auto uploaded = image::BlobInfo{};
    run.step->updateCompressionEdits(uploaded);
    CHECK_EQUAL(uploaded.compressionAlgorithm->getName(), compression::ZSTD_ALGORITHM_NAME);
}

TEST(CompressionStepTestGroup, recompressCompressed) {
    auto settings = makeSettings(transports::LayerCompression::Compress);
    settings.compressionFormat = compression::Zstd;
    auto run = StepRun{test_utility::images::gzipped(layerContent), image::mediatype::ociImageLayerGzip, settings};
    CHECK(run.step->getOperation() == CompressionStepOperation::RecompressCompressed);
    CHECK(run.step->changesBlob());
    CHECK_EQUAL(decompressed(run.output, compression::Zstd), layerContent);

    auto uploaded = image::BlobInfo{};
    run.step->updateCompressionEdits(uploaded);
    CHECK(uploaded.compressionOperation == image::CompressionOperation::PreserveOriginal);
    CHECK_EQUAL(uploaded.compressionAlgorithm->getName(), compression::ZSTD_ALGORITHM_NAME);
}

TEST(CompressionStepTestGroup, compressedBlobWithoutExplicitFormatIsPreserved) {
    auto blob = test_utility::images::gzipped(layerContent);
    auto run = StepRun{blob, image::mediatype::ociImageLayerGzip, makeSettings(transports::LayerCompression::Compress)};
    CHECK(run.step->getOperation() == CompressionStepOperation::PreserveCompressed);
    CHECK_FALSE(run.step->changesBlob());
    CHECK_EQUAL(run.output, blob);
}

TEST(CompressionStepTestGroup, decompressCompressed) {
    auto run = StepRun{test_utility::images::gzipped(layerContent), image::mediatype::ociImageLayerGzip,
                       makeSettings(transports::LayerCompression::Decompress)};
    CHECK(run.step->getOperation() == CompressionStepOperation::DecompressCompressed);
    CHECK_EQUAL(run.output, layerContent);

    auto uploaded = image::BlobInfo{};
    run.step->updateCompressionEdits(uploaded);
    CHECK(uploaded.compressionOperation == image::CompressionOperation::Decompress);
    CHECK_FALSE(uploaded.compressionAlgorithm);

    blobinfocache::MemoryCache cache{};
    auto uploadedDigest = image::Digest::fromBytes(run.output);
    run.step->recordValidatedDigestData(cache, uploadedDigest, run.info.digest, false);
    CHECK(cache.uncompressedDigest(run.info.digest) == uploadedDigest);
}

TEST(CompressionStepTestGroup, blobIsPreservedIfManifestCannotChange) {
    auto settings = makeSettings(transports::LayerCompression::Compress);
    settings.canModifyBlob = false;
    auto run = StepRun{layerContent, image::mediatype::ociImageLayer, settings};
    CHECK(run.step->getOperation() == CompressionStepOperation::PreserveUncompressed);
    CHECK_FALSE(run.step->changesBlob());
    CHECK_EQUAL(run.output, layerContent);

    blobinfocache::MemoryCache cache{};
    run.step->recordValidatedDigestData(cache, run.info.digest, run.info.digest, false);
    CHECK(cache.uncompressedDigest(run.info.digest) == run.info.digest);
}

TEST(CompressionStepTestGroup, encryptedBlobIsOpaque) {
    auto run = StepRun{layerContent, image::mediatype::ociImageLayerGzip + image::mediatype::encryptedSuffix,
                       makeSettings(transports::LayerCompression::Compress)};
    CHECK(run.step->getOperation() == CompressionStepOperation::PreserveOpaque);
    CHECK_EQUAL(run.output, layerContent);

    // nothing is learned about encrypted data
    blobinfocache::MemoryCache cache{};
    run.step->recordValidatedDigestData(cache, run.info.digest, run.info.digest, true);
    CHECK(cache.uncompressedDigest(run.info.digest).empty());
}

TEST(CompressionStepTestGroup, unsupportedCompressionChangeIsOpaque) {
    auto settings = makeSettings(transports::LayerCompression::Decompress);
    settings.layerCompressionChangeSupported = false;
    auto blob = test_utility::images::gzipped(layerContent);
    auto run = StepRun{blob, image::mediatype::ociImageLayerGzip, settings};
    CHECK(run.step->getOperation() == CompressionStepOperation::PreserveOpaque);
    CHECK_EQUAL(run.output, blob);
}

}}}

CARRIER_UNITTEST_MAIN_FUNCTION();
