/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_ImageDestination_hpp
#define carrier_transports_ImageDestination_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "stream/Reader.hpp"
#include "blobinfocache/BlobInfoCache.hpp"
#include "compression/Algorithm.hpp"
#include "transports/ImageReference.hpp"
#include "transports/ImageSource.hpp"


namespace carrier {
namespace transports {

enum class LayerCompression {
    PreserveOriginal,
    Compress,
    Decompress
};

struct UploadedBlob {
    image::Digest digest;
    int64_t size = -1;
};

struct PutBlobOptions {
    blobinfocache::BlobInfoCache* cache = nullptr;
    bool isConfig = false;
    bool emptyLayer = false;
    // Index of the layer in the manifest, not set for configs
    boost::optional<size_t> layerIndex;
};

// Outcome of a partial pull. FallbackRequested asks the caller to copy the full blob instead.
struct PartialBlobResult {
    enum class Status {
        Uploaded,
        FallbackRequested
    };
    Status status = Status::FallbackRequested;
    UploadedBlob blob;
    std::string fallbackReason;
};

// Ranged access to the source blob, handed to destinations which assemble blobs from chunks
class BlobChunkAccessor {
public:
    virtual ~BlobChunkAccessor() = default;
    virtual std::vector<std::unique_ptr<stream::Reader>> getBlobAt(const image::BlobInfo& info,
                                                                   const std::vector<ImageSourceChunk>& chunks) = 0;
};

struct PutBlobPartialOptions {
    blobinfocache::BlobInfoCache* cache = nullptr;
    bool emptyLayer = false;
    size_t layerIndex = 0;
};

struct TryReusingBlobOptions {
    blobinfocache::BlobInfoCache* cache = nullptr;
    // Reusing a blob with a different digest (other compression) is acceptable
    bool canSubstitute = false;
    bool emptyLayer = false;
    boost::optional<size_t> layerIndex;
    const ImageReference* srcReference = nullptr;
    image::ReuseConditions reuseConditions;
    boost::optional<compression::Algorithm> originalCompression;
    // Table of contents digest of a chunked layer, empty if not chunked
    image::Digest tocDigest;
};

struct ReusedBlob {
    image::Digest digest;
    int64_t size = -1;
    image::CompressionOperation compressionOperation = image::CompressionOperation::PreserveOriginal;
    boost::optional<compression::Algorithm> compressionAlgorithm;
    std::map<std::string, std::string> compressionAnnotations;
    bool matchedByTOCDigest = false;
};

/**
 * Write access to an image location. Nothing written is guaranteed to be visible
 * before commit() succeeds. Resources are released by the destructor.
 */
// Whether the blob as originally compressed satisfies the reuse conditions
bool originalCandidateMatchesTryReusingBlobOptions(const TryReusingBlobOptions& options);

class ImageDestination {
public:
    virtual ~ImageDestination() = default;

    virtual const ImageReference& getReference() const = 0;
    // Empty if any MIME type is accepted
    virtual std::vector<std::string> getSupportedManifestMIMETypes() const = 0;
    // Throws if signatures can't be stored
    virtual void supportsSignatures() const = 0;
    virtual LayerCompression getDesiredLayerCompression() const = 0;
    virtual bool acceptsForeignLayerURLs() const = 0;
    virtual bool mustMatchRuntimeOS() const = 0;
    // Whether the Docker reference embedded in schema1 manifests is irrelevant for this destination
    virtual bool ignoresEmbeddedDockerReference() const = 0;
    virtual bool hasThreadSafePutBlob() const = 0;
    virtual bool supportsPutBlobPartial() const = 0;

    // Writes the stream, whose digest and size in inputInfo are optional. Returns what was stored.
    virtual UploadedBlob putBlob(stream::Reader& stream, const image::BlobInfo& inputInfo,
                                 const PutBlobOptions& options) = 0;
    virtual PartialBlobResult putBlobPartial(BlobChunkAccessor& chunkAccessor, const image::BlobInfo& srcInfo,
                                             const PutBlobPartialOptions& options);
    // Returns the blob to use instead of uploading info, if the destination already has one
    virtual boost::optional<ReusedBlob> tryReusingBlob(const image::BlobInfo& info,
                                                       const TryReusingBlobOptions& options) = 0;
    // Writes the manifest of the image, or of the instanceDigest instance of a list
    virtual void putManifest(const std::string& manifest, const std::string& mimeType,
                             const boost::optional<image::Digest>& instanceDigest) = 0;
    virtual void putSignatures(const std::vector<std::string>& signatures,
                               const boost::optional<image::Digest>& instanceDigest) = 0;
    virtual void commit() = 0;
};

}
}

#endif
