/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_DirectorySource_hpp
#define carrier_transports_DirectorySource_hpp

#include "transports/ImageSource.hpp"
#include "transports/Directory.hpp"


namespace carrier {
namespace transports {

class DirectorySource : public ImageSource {
public:
    explicit DirectorySource(const DirectoryReference& reference);

    const ImageReference& getReference() const override;
    std::pair<std::string, std::string> getManifest(const boost::optional<image::Digest>& instanceDigest) override;
    bool hasThreadSafeGetBlob() const override;
    BlobStream getBlob(const image::BlobInfo& info, blobinfocache::BlobInfoCache& cache) override;
    std::vector<std::string> getSignatures(const boost::optional<image::Digest>& instanceDigest) override;

private:
    DirectoryReference reference;
};

}
}

#endif
