/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_CompressionStep_hpp
#define carrier_copy_CompressionStep_hpp

#include <string>
#include <map>
#include <memory>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "compression/Algorithm.hpp"
#include "stream/Reader.hpp"
#include "stream/PeekableReader.hpp"
#include "blobinfocache/BlobInfoCache.hpp"
#include "transports/ImageDestination.hpp"


namespace carrier {
namespace copy {

// Used if the destination wants compressed layers and the user didn't pick an algorithm
extern const compression::Algorithm& DEFAULT_COMPRESSION_FORMAT;

struct DetectedCompression {
    // Not set if the blob is not compressed
    boost::optional<compression::Algorithm> format;
    // Compressor name to possibly record in the blob info cache for the source blob
    std::string srcCompressorBaseVariantName;

    bool isCompressed() const { return static_cast<bool>(format); }
};

// Peeks at the blob to detect its compression. srcInfo provides the annotations and error context.
DetectedCompression detectCompressionStep(stream::PeekableReader& reader, const image::BlobInfo& srcInfo);

enum class CompressionStepOperation {
    // Compression doesn't apply, e.g. to encrypted blobs
    PreserveOpaque,
    PreserveCompressed,
    PreserveUncompressed,
    CompressUncompressed,
    RecompressCompressed,
    DecompressCompressed
};

struct CompressionStepSettings {
    transports::LayerCompression desiredLayerCompression = transports::LayerCompression::PreserveOriginal;
    // Only if explicitly requested
    boost::optional<compression::Algorithm> compressionFormat;
    boost::optional<int> compressionLevel;
    // False for configs and for manifests which can't be modified
    bool canModifyBlob = false;
    // Whether the manifest format can describe a different compression of this layer
    bool layerCompressionChangeSupported = false;
};

/**
 * Chooses the compression transformation of a blob and applies it to the stream.
 * The stream returned by getReader must be fully consumed before the uploaded
 * annotations are complete.
 */
class CompressionStep {
public:
    CompressionStep(stream::Reader& input,
                    const image::BlobInfo& inputInfo,
                    const DetectedCompression& detected,
                    const CompressionStepSettings& settings);
    CompressionStep(const CompressionStep&) = delete;
    CompressionStep& operator=(const CompressionStep&) = delete;

    stream::Reader& getReader() { return *output; }
    CompressionStepOperation getOperation() const { return operation; }
    // Whether the bytes produced differ from the input, making its digest and size unknown
    bool changesBlob() const;

    // Sets the compression edits of the uploaded blob, merging the uploaded annotations
    void updateCompressionEdits(image::BlobInfo& uploadedInfo) const;

    /**
     * Records what the copy learned about the uploaded and source blobs.
     * Must only be called after our own code validated srcDigest.
     */
    void recordValidatedDigestData(blobinfocache::BlobInfoCache& cache,
                                   const image::Digest& uploadedDigest,
                                   const image::Digest& srcDigest,
                                   bool encryptingOrDecrypting) const;

private:
    void compressUncompressed(stream::Reader& input, const compression::Algorithm& algorithm,
                              const DetectedCompression& detected, const CompressionStepSettings& settings);
    void recompressCompressed(stream::Reader& input, const DetectedCompression& detected,
                              const CompressionStepSettings& settings);
    void decompressCompressed(stream::Reader& input, const DetectedCompression& detected);
    void preserveOriginal(stream::Reader& input, const DetectedCompression& detected,
                          bool layerCompressionChangeSupported);

private:
    CompressionStepOperation operation = CompressionStepOperation::PreserveOpaque;
    // The edits describing the end state, not necessarily what was done
    image::CompressionOperation uploadedOperation = image::CompressionOperation::PreserveOriginal;
    boost::optional<compression::Algorithm> uploadedAlgorithm;
    // Filled by the compressor, complete only at end of stream
    std::map<std::string, std::string> uploadedAnnotations;
    std::string srcCompressorBaseVariantName;
    std::string uploadedCompressorBaseVariantName;
    std::string uploadedCompressorSpecificVariantName;

    std::unique_ptr<stream::Reader> decompressor;
    std::unique_ptr<stream::Reader> compressor;
    stream::Reader* output;
};

}
}

#endif
