/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_OCILayoutSource_hpp
#define carrier_transports_OCILayoutSource_hpp

#include "transports/ImageSource.hpp"
#include "transports/OCILayout.hpp"


namespace carrier {
namespace transports {

class OCILayoutSource : public ImageSource {
public:
    explicit OCILayoutSource(const OCIReference& reference);

    const ImageReference& getReference() const override;
    std::pair<std::string, std::string> getManifest(const boost::optional<image::Digest>& instanceDigest) override;
    bool hasThreadSafeGetBlob() const override;
    BlobStream getBlob(const image::BlobInfo& info, blobinfocache::BlobInfoCache& cache) override;
    bool supportsGetBlobAt() const override;
    std::vector<std::unique_ptr<stream::Reader>> getBlobAt(const image::BlobInfo& info,
                                                           const std::vector<ImageSourceChunk>& chunks) override;
    std::vector<std::string> getSignatures(const boost::optional<image::Digest>& instanceDigest) override;

private:
    boost::filesystem::path getExistingBlobPath(const image::BlobInfo& info) const;

private:
    OCIReference reference;
    image::Descriptor descriptor;
};

}
}

#endif
