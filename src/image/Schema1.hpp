/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Schema1_hpp
#define carrier_image_Schema1_hpp

#include <string>
#include <vector>
#include <memory>

#include "image/Manifest.hpp"
#include "image/Digest.hpp"


namespace carrier {
namespace image {

/**
 * Legacy Docker image manifest, schema version 1.
 *
 * Layers are listed top-most first. The v1Compatibility strings of the
 * history entries are parsed into V1Compatibility records on construction.
 */
class Schema1 : public Manifest {
public:
    struct V1Compatibility {
        std::string id;
        std::string parent;
        std::string comment;
        std::string created;
        std::vector<std::string> cmd;
        std::string author;
        bool throwAway = false;
    };

public:
    static std::unique_ptr<Schema1> fromBlob(const std::string& manifestBlob);

    std::string getMIMEType() const override;
    BlobInfo getConfigInfo() const override;
    std::vector<LayerInfo> getLayerInfos() const override;
    void updateLayerInfos(const std::vector<BlobInfo>& layerInfos) override;
    // Produces an unsigned manifest, the signatures of the original blob don't survive edits
    std::string serialize() const override;
    bool canChangeLayerCompression(const std::string& mimeType) const override;
    std::unique_ptr<Manifest> clone() const override;

    const std::string& getName() const { return name; }
    const std::string& getTag() const { return tag; }
    void setEmbeddedReference(const std::string& name, const std::string& tag);
    const std::vector<V1Compatibility>& getV1Compatibility() const { return extractedV1Compatibility; }

    // Builds a schema2-style image configuration from the top-most history entry
    std::string toSchema2Config(const std::vector<Digest>& diffIDs) const;

private:
    Schema1() = default;
    void initialize();
    void fixManifestLayers();

private:
    std::string name;
    std::string tag;
    std::string architecture;
    std::vector<Digest> fsLayers;
    std::vector<std::string> history;
    std::vector<V1Compatibility> extractedV1Compatibility;
    int64_t schemaVersion = 1;
};

}
}

#endif
