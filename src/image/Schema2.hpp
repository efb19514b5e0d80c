/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Schema2_hpp
#define carrier_image_Schema2_hpp

#include <string>
#include <vector>
#include <memory>

#include "image/Manifest.hpp"
#include "image/Descriptor.hpp"


namespace carrier {
namespace image {

// Docker image manifest, schema version 2
class Schema2 : public Manifest {
public:
    Schema2(const Descriptor& config, const std::vector<Descriptor>& layers);
    static std::unique_ptr<Schema2> fromBlob(const std::string& manifestBlob);

    std::string getMIMEType() const override;
    BlobInfo getConfigInfo() const override;
    std::vector<LayerInfo> getLayerInfos() const override;
    void updateLayerInfos(const std::vector<BlobInfo>& layerInfos) override;
    std::string serialize() const override;
    bool canChangeLayerCompression(const std::string& mimeType) const override;
    std::unique_ptr<Manifest> clone() const override;

    const Descriptor& getConfig() const { return config; }
    const std::vector<Descriptor>& getLayers() const { return layers; }

    static bool isSupportedMediaType(const std::string& mediaType);

private:
    Schema2() = default;

private:
    int64_t schemaVersion = 2;
    std::string mediaType;
    Descriptor config;
    std::vector<Descriptor> layers;
};

}
}

#endif
