/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_OCI1Index_hpp
#define carrier_image_OCI1Index_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/optional.hpp>

#include "image/ManifestList.hpp"
#include "image/Descriptor.hpp"


namespace carrier {
namespace image {

class Schema2List;

// Annotation of index entries whose layers are zstd compressed
extern const std::string OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD;
extern const std::string OCI1_INSTANCE_ANNOTATION_COMPRESSION_ZSTD_VALUE;

// OCI image index
class OCI1Index : public ManifestList {
public:
    OCI1Index(const std::vector<Descriptor>& manifests, const std::map<std::string, std::string>& annotations);
    static std::unique_ptr<OCI1Index> fromBlob(const std::string& manifestBlob);

    std::string getMIMEType() const override;
    std::vector<Digest> getInstances() const override;
    ListUpdate getInstance(const Digest& instanceDigest) const override;
    void editInstances(const std::vector<ListEdit>& edits) override;
    Digest chooseInstanceByCompression(const PlatformChoice& choice, bool preferGzip) const override;
    std::string serialize() const override;
    std::unique_ptr<ManifestList> convertToMIMEType(const std::string& mimeType) const override;
    std::unique_ptr<ManifestList> clone() const override;

    std::unique_ptr<Schema2List> toSchema2List() const;
    const std::vector<Descriptor>& getManifests() const { return manifests; }
    const std::map<std::string, std::string>& getAnnotations() const { return annotations; }

private:
    OCI1Index() = default;

private:
    int64_t schemaVersion = 2;
    std::string mediaType;
    std::string artifactType;
    std::vector<Descriptor> manifests;
    boost::optional<Descriptor> subject;
    std::map<std::string, std::string> annotations;
};

}
}

#endif
