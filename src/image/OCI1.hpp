/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_OCI1_hpp
#define carrier_image_OCI1_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/optional.hpp>

#include "image/Manifest.hpp"
#include "image/Descriptor.hpp"


namespace carrier {
namespace image {

// OCI image manifest
class OCI1 : public Manifest {
public:
    OCI1(const Descriptor& config, const std::vector<Descriptor>& layers);
    static std::unique_ptr<OCI1> fromBlob(const std::string& manifestBlob);

    std::string getMIMEType() const override;
    BlobInfo getConfigInfo() const override;
    std::vector<LayerInfo> getLayerInfos() const override;
    void updateLayerInfos(const std::vector<BlobInfo>& layerInfos) override;
    std::string serialize() const override;
    bool canChangeLayerCompression(const std::string& mimeType) const override;
    std::unique_ptr<Manifest> clone() const override;

    const Descriptor& getConfig() const { return config; }
    const std::vector<Descriptor>& getLayers() const { return layers; }
    const std::map<std::string, std::string>& getAnnotations() const { return annotations; }
    void setAnnotations(const std::map<std::string, std::string>& annotations) { this->annotations = annotations; }

private:
    OCI1() = default;

private:
    int64_t schemaVersion = 2;
    std::string mediaType;
    std::string artifactType;
    Descriptor config;
    std::vector<Descriptor> layers;
    boost::optional<Descriptor> subject;
    std::map<std::string, std::string> annotations;
};

std::string getEncryptedMediaType(const std::string& mediaType);
std::string getDecryptedMediaType(const std::string& mediaType);

}
}

#endif
