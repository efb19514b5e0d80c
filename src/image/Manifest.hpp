/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Manifest_hpp
#define carrier_image_Manifest_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "compression/Algorithm.hpp"


namespace carrier {
namespace image {

/**
 * A single-image manifest in one of the supported formats (Docker schema1,
 * Docker schema2, OCI image manifest).
 */
class Manifest {
public:
    virtual ~Manifest() = default;

    virtual std::string getMIMEType() const = 0;
    // Empty BlobInfo if the format has no separate config blob (schema1)
    virtual BlobInfo getConfigInfo() const = 0;
    virtual std::vector<LayerInfo> getLayerInfos() const = 0;
    // Replaces the layer descriptors, adapting media types to the compression and crypto edits
    virtual void updateLayerInfos(const std::vector<BlobInfo>& layerInfos) = 0;
    virtual std::string serialize() const = 0;
    // Whether a layer of the given media type can be recompressed without the manifest
    // losing the ability to describe it
    virtual bool canChangeLayerCompression(const std::string& mimeType) const = 0;
    virtual std::unique_ptr<Manifest> clone() const = 0;
};

std::unique_ptr<Manifest> manifestFromBlob(const std::string& manifestBlob, const std::string& mimeType);

std::string guessMIMEType(const std::string& manifestBlob);
std::string normalizedMIMEType(const std::string& mimeType);
// The digest of a signed schema1 manifest is computed over its payload, excluding the signatures
Digest manifestDigest(const std::string& manifestBlob);
bool manifestMatchesDigest(const std::string& manifestBlob, const Digest& expected);
bool isMultiImage(const std::string& mimeType);
bool supportsEncryption(const std::string& mimeType);
const std::vector<std::string>& getDefaultRequestedManifestMIMETypes();

bool compressionAlgorithmIsUniversallySupported(const compression::Algorithm&);
bool mimeTypeSupportsCompressionAlgorithm(const std::string& mimeType, const compression::Algorithm&);

// Restrictions on blobs a destination may reuse in place of the requested one
struct ReuseConditions {
    // At least one of these formats must be able to describe the reused layer
    boost::optional<std::vector<std::string>> possibleManifestFormats;
    boost::optional<compression::Algorithm> requiredCompression;
};

// Rejects manifests carrying members of other formats, e.g. both "layers" and "manifests"
enum AllowedManifestField : unsigned {
    AllowedFieldConfig = 1 << 0,
    AllowedFieldFSLayers = 1 << 1,
    AllowedFieldHistory = 1 << 2,
    AllowedFieldLayers = 1 << 3,
    AllowedFieldManifests = 1 << 4
};
void validateUnambiguousManifestFormat(const std::string& manifestBlob, const std::string& expectedMIMEType,
                                       unsigned allowedFields);

bool candidateCompressionMatchesReuseConditions(const ReuseConditions& conditions,
                                                const boost::optional<compression::Algorithm>& candidateCompression);

}
}

#endif
