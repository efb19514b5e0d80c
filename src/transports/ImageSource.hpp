/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_ImageSource_hpp
#define carrier_transports_ImageSource_hpp

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <cstdint>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "stream/Reader.hpp"
#include "blobinfocache/BlobInfoCache.hpp"
#include "transports/ImageReference.hpp"


namespace carrier {
namespace transports {

struct BlobStream {
    std::unique_ptr<stream::Reader> reader;
    // -1 if unknown
    int64_t size = -1;
};

// A byte range of a blob. A length of UINT64_MAX reads until the end of the blob.
struct ImageSourceChunk {
    uint64_t offset = 0;
    uint64_t length = 0;
};

/**
 * Read access to one image (or image list) and the blobs it references.
 * Resources are released by the destructor.
 */
class ImageSource {
public:
    virtual ~ImageSource() = default;

    virtual const ImageReference& getReference() const = 0;
    // Returns the manifest blob and its MIME type. Without instanceDigest, returns the
    // top-level manifest, which may be a list.
    virtual std::pair<std::string, std::string> getManifest(const boost::optional<image::Digest>& instanceDigest) = 0;
    // Whether getBlob may be called concurrently
    virtual bool hasThreadSafeGetBlob() const = 0;
    virtual BlobStream getBlob(const image::BlobInfo& info, blobinfocache::BlobInfoCache& cache) = 0;
    virtual bool supportsGetBlobAt() const {
        return false;
    }
    // One reader per chunk, in the order of the chunks
    virtual std::vector<std::unique_ptr<stream::Reader>> getBlobAt(const image::BlobInfo& info,
                                                                   const std::vector<ImageSourceChunk>& chunks);
    // Serialized signatures of the instance (or of the top-level manifest)
    virtual std::vector<std::string> getSignatures(const boost::optional<image::Digest>& instanceDigest) = 0;
};

}
}

#endif
