/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Schema2List_hpp
#define carrier_image_Schema2List_hpp

#include <string>
#include <vector>
#include <memory>

#include "image/ManifestList.hpp"
#include "image/Descriptor.hpp"


namespace carrier {
namespace image {

class OCI1Index;

// Docker manifest list, every instance carries a platform
class Schema2List : public ManifestList {
public:
    explicit Schema2List(const std::vector<Descriptor>& manifests);
    static std::unique_ptr<Schema2List> fromBlob(const std::string& manifestBlob);

    std::string getMIMEType() const override;
    std::vector<Digest> getInstances() const override;
    ListUpdate getInstance(const Digest& instanceDigest) const override;
    void editInstances(const std::vector<ListEdit>& edits) override;
    Digest chooseInstanceByCompression(const PlatformChoice& choice, bool preferGzip) const override;
    std::string serialize() const override;
    std::unique_ptr<ManifestList> convertToMIMEType(const std::string& mimeType) const override;
    std::unique_ptr<ManifestList> clone() const override;

    std::unique_ptr<OCI1Index> toOCI1Index() const;
    const std::vector<Descriptor>& getManifests() const { return manifests; }

private:
    Schema2List() = default;

private:
    int64_t schemaVersion = 2;
    std::string mediaType;
    std::vector<Descriptor> manifests;
};

}
}

#endif
