/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_OCILayoutDestination_hpp
#define carrier_transports_OCILayoutDestination_hpp

#include <mutex>

#include "transports/ImageDestination.hpp"
#include "transports/OCILayout.hpp"


namespace carrier {
namespace transports {

class OCILayoutDestination : public ImageDestination {
public:
    explicit OCILayoutDestination(const OCIReference& reference);

    const ImageReference& getReference() const override;
    std::vector<std::string> getSupportedManifestMIMETypes() const override;
    void supportsSignatures() const override;
    LayerCompression getDesiredLayerCompression() const override;
    bool acceptsForeignLayerURLs() const override;
    bool mustMatchRuntimeOS() const override;
    bool ignoresEmbeddedDockerReference() const override;
    bool hasThreadSafePutBlob() const override;
    bool supportsPutBlobPartial() const override;

    UploadedBlob putBlob(stream::Reader& stream, const image::BlobInfo& inputInfo,
                         const PutBlobOptions& options) override;
    boost::optional<ReusedBlob> tryReusingBlob(const image::BlobInfo& info,
                                               const TryReusingBlobOptions& options) override;
    void putManifest(const std::string& manifest, const std::string& mimeType,
                     const boost::optional<image::Digest>& instanceDigest) override;
    void putSignatures(const std::vector<std::string>& signatures,
                       const boost::optional<image::Digest>& instanceDigest) override;
    void commit() override;

private:
    void addManifest(const image::Descriptor& descriptor);
    boost::optional<int64_t> getBlobSize(const image::Digest& digest) const;
    blobinfocache::TransportScope getCacheScope() const;

private:
    OCIReference reference;
    std::mutex mutex;
    OCIIndex index;
};

}
}

#endif
