/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CompressionStep.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "image/mediaTypes.hpp"
#include "compression/Algorithms.hpp"
#include "compression/Compressor.hpp"
#include "compression/Detection.hpp"
#include "crypto/LayerEncryption.hpp"


namespace carrier {
namespace copy {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Copy", level);
}

const compression::Algorithm& DEFAULT_COMPRESSION_FORMAT = compression::Gzip;

// The compression that blobs of these media types are expected to use
static const std::map<std::string, std::string>& getExpectedBaseCompressionFormats() {
    static const auto formats = std::map<std::string, std::string>{
        {image::mediatype::ociImageLayerGzip, compression::GZIP_ALGORITHM_NAME},
        {image::mediatype::ociImageLayerZstd, compression::ZSTD_ALGORITHM_NAME},
        {image::mediatype::dockerV2Schema2Layer, compression::GZIP_ALGORITHM_NAME},
        {image::mediatype::dockerV2SchemaLayerZstd, compression::ZSTD_ALGORITHM_NAME}
    };
    return formats;
}

DetectedCompression detectCompressionStep(stream::PeekableReader& reader, const image::BlobInfo& srcInfo) {
    auto detected = DetectedCompression{};
    try {
        detected.format = compression::detectCompressionFormat(reader, srcInfo.annotations);
    }
    catch(libcarrier::Error& e) {
        auto message = boost::format("reading blob %s") % srcInfo.digest;
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    if(detected.isCompressed()) {
        detected.srcCompressorBaseVariantName = detected.format->getBaseVariantName();
    }
    else {
        detected.srcCompressorBaseVariantName = blobinfocache::UNCOMPRESSED;
    }

    const auto& expectedFormats = getExpectedBaseCompressionFormats();
    auto expected = expectedFormats.find(srcInfo.mediaType);
    if(expected != expectedFormats.cend()
       && detected.isCompressed()
       && detected.format->getBaseVariantName() != expected->second) {
        printLog(boost::format("blob %s with type %s should be compressed with %s, but compressor appears to be %s")
                    % srcInfo.digest % srcInfo.mediaType % expected->second % detected.format->getName(),
                 libcarrier::LogLevel::DEBUG);
    }
    return detected;
}

// The blob info cache doesn't record a specific variant equal to its base
static std::string specificVariantName(const compression::Algorithm& algorithm) {
    if(algorithm.getName() == algorithm.getBaseVariantName()) {
        return "";
    }
    return algorithm.getName();
}

CompressionStep::CompressionStep(stream::Reader& input,
                                 const image::BlobInfo& inputInfo,
                                 const DetectedCompression& detected,
                                 const CompressionStepSettings& settings)
    : output{&input}
{
    if(!settings.layerCompressionChangeSupported) {
        printLog(boost::format("Compression change for blob %s (%s) not supported") % inputInfo.digest % inputInfo.mediaType,
                 libcarrier::LogLevel::DEBUG);
    }

    if(settings.canModifyBlob && settings.layerCompressionChangeSupported) {
        auto wantsCompression = settings.desiredLayerCompression == transports::LayerCompression::Compress;
        auto wantsDecompression = settings.desiredLayerCompression == transports::LayerCompression::Decompress;

        if(crypto::isEncryptedMediaType(inputInfo.mediaType)) {
            printLog(boost::format("Using original blob without modification for encrypted blob"), libcarrier::LogLevel::DEBUG);
            operation = CompressionStepOperation::PreserveOpaque;
            uploadedOperation = image::CompressionOperation::PreserveOriginal;
            srcCompressorBaseVariantName = blobinfocache::UNKNOWN_COMPRESSION;
            uploadedCompressorBaseVariantName = blobinfocache::UNKNOWN_COMPRESSION;
            return;
        }
        if(wantsCompression && !detected.isCompressed()) {
            const auto& algorithm = settings.compressionFormat ? *settings.compressionFormat : DEFAULT_COMPRESSION_FORMAT;
            compressUncompressed(input, algorithm, detected, settings);
            return;
        }
        if(wantsCompression && detected.isCompressed() && settings.compressionFormat
           && settings.compressionFormat->getName() != detected.format->getName()
           && settings.compressionFormat->getName() != detected.format->getBaseVariantName()) {
            recompressCompressed(input, detected, settings);
            return;
        }
        if(wantsDecompression && detected.isCompressed()) {
            decompressCompressed(input, detected);
            return;
        }
    }
    preserveOriginal(input, detected, settings.layerCompressionChangeSupported);
}

void CompressionStep::compressUncompressed(stream::Reader& input, const compression::Algorithm& algorithm,
                                           const DetectedCompression& detected, const CompressionStepSettings& settings) {
    printLog(boost::format("Compressing blob on the fly"), libcarrier::LogLevel::DEBUG);
    compressor = compression::newCompressor(algorithm, input, settings.compressionLevel, uploadedAnnotations);
    output = compressor.get();

    operation = CompressionStepOperation::CompressUncompressed;
    uploadedOperation = image::CompressionOperation::Compress;
    uploadedAlgorithm = algorithm;
    srcCompressorBaseVariantName = detected.srcCompressorBaseVariantName;
    uploadedCompressorBaseVariantName = algorithm.getBaseVariantName();
    uploadedCompressorSpecificVariantName = specificVariantName(algorithm);
}

void CompressionStep::recompressCompressed(stream::Reader& input, const DetectedCompression& detected,
                                           const CompressionStepSettings& settings) {
    printLog(boost::format("Blob will be converted"), libcarrier::LogLevel::DEBUG);
    const auto& algorithm = *settings.compressionFormat;
    decompressor = compression::newDecompressor(*detected.format, input);
    compressor = compression::newCompressor(algorithm, *decompressor, settings.compressionLevel, uploadedAnnotations);
    output = compressor.get();

    operation = CompressionStepOperation::RecompressCompressed;
    uploadedOperation = image::CompressionOperation::PreserveOriginal;
    uploadedAlgorithm = algorithm;
    srcCompressorBaseVariantName = detected.srcCompressorBaseVariantName;
    uploadedCompressorBaseVariantName = algorithm.getBaseVariantName();
    uploadedCompressorSpecificVariantName = specificVariantName(algorithm);
}

void CompressionStep::decompressCompressed(stream::Reader& input, const DetectedCompression& detected) {
    printLog(boost::format("Blob will be decompressed"), libcarrier::LogLevel::DEBUG);
    decompressor = compression::newDecompressor(*detected.format, input);
    output = decompressor.get();

    operation = CompressionStepOperation::DecompressCompressed;
    uploadedOperation = image::CompressionOperation::Decompress;
    srcCompressorBaseVariantName = detected.srcCompressorBaseVariantName;
    uploadedCompressorBaseVariantName = blobinfocache::UNCOMPRESSED;
}

void CompressionStep::preserveOriginal(stream::Reader&, const DetectedCompression& detected,
                                       bool layerCompressionChangeSupported) {
    printLog(boost::format("Using original blob without modification"), libcarrier::LogLevel::DEBUG);
    // Blobs of manifests which can't change compression are left alone, so that
    // updating the manifest doesn't try to edit their media type
    if(!layerCompressionChangeSupported) {
        operation = CompressionStepOperation::PreserveOpaque;
        uploadedOperation = image::CompressionOperation::PreserveOriginal;
    }
    else if(detected.isCompressed()) {
        operation = CompressionStepOperation::PreserveCompressed;
        uploadedOperation = image::CompressionOperation::PreserveOriginal;
        uploadedAlgorithm = detected.format;
    }
    else {
        operation = CompressionStepOperation::PreserveUncompressed;
        uploadedOperation = image::CompressionOperation::Decompress;
    }
    srcCompressorBaseVariantName = detected.srcCompressorBaseVariantName;
    // Only the base variant is recorded: the TOC was not verified against the blob digest
    uploadedCompressorBaseVariantName = detected.srcCompressorBaseVariantName;
}

bool CompressionStep::changesBlob() const {
    return operation == CompressionStepOperation::CompressUncompressed
        || operation == CompressionStepOperation::RecompressCompressed
        || operation == CompressionStepOperation::DecompressCompressed;
}

void CompressionStep::updateCompressionEdits(image::BlobInfo& uploadedInfo) const {
    uploadedInfo.compressionOperation = uploadedOperation;
    uploadedInfo.compressionAlgorithm = uploadedAlgorithm;
    for(const auto& annotation : uploadedAnnotations) {
        uploadedInfo.annotations[annotation.first] = annotation.second;
    }
}

void CompressionStep::recordValidatedDigestData(blobinfocache::BlobInfoCache& cache,
                                                const image::Digest& uploadedDigest,
                                                const image::Digest& srcDigest,
                                                bool encryptingOrDecrypting) const {
    // associations involving encrypted data are never recorded
    if(!encryptingOrDecrypting) {
        switch(operation) {
        case CompressionStepOperation::PreserveOpaque:
            break;
        case CompressionStepOperation::CompressUncompressed: {
            cache.recordDigestUncompressedPair(uploadedDigest, srcDigest);
            auto tocDigest = image::Digest{};
            try {
                tocDigest = compression::getTOCDigest(uploadedAnnotations);
            }
            catch(libcarrier::Error& e) {
                CARRIER_RETHROW_ERROR(e, "parsing just-created compression annotations");
            }
            if(!tocDigest.empty()) {
                cache.recordTOCUncompressedPair(tocDigest, srcDigest);
            }
            break;
        }
        case CompressionStepOperation::DecompressCompressed:
            cache.recordDigestUncompressedPair(srcDigest, uploadedDigest);
            break;
        case CompressionStepOperation::RecompressCompressed:
        case CompressionStepOperation::PreserveCompressed:
            // neither digest is known to relate to an uncompressed digest
            break;
        case CompressionStepOperation::PreserveUncompressed:
            cache.recordDigestUncompressedPair(srcDigest, srcDigest);
            break;
        }
    }

    if(srcCompressorBaseVariantName.empty() || uploadedCompressorBaseVariantName.empty()) {
        auto message = boost::format("Internal error: missing compressor names (src base: \"%s\", uploaded base: \"%s\")")
            % srcCompressorBaseVariantName % uploadedCompressorBaseVariantName;
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError, message.str());
    }
    if(uploadedCompressorBaseVariantName != blobinfocache::UNKNOWN_COMPRESSION) {
        cache.recordDigestCompressorData(uploadedDigest, blobinfocache::DigestCompressorData{
            uploadedCompressorBaseVariantName,
            uploadedCompressorSpecificVariantName,
            uploadedAnnotations
        });
    }
    // The TOC of a source in a chunked variant was not verified, only its base variant is recorded
    if(!srcDigest.empty() && srcDigest != uploadedDigest
       && srcCompressorBaseVariantName != blobinfocache::UNKNOWN_COMPRESSION) {
        cache.recordDigestCompressorData(srcDigest, blobinfocache::DigestCompressorData{
            srcCompressorBaseVariantName, "", {}
        });
    }
}

}
}
