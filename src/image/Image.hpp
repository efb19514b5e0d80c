/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_image_Image_hpp
#define carrier_image_Image_hpp

#include <string>
#include <vector>
#include <memory>
#include <utility>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/Manifest.hpp"
#include "image/DockerReference.hpp"


namespace carrier {

namespace transports {
class ImageSource;
}

namespace image {

// Information about the copied layers, needed by some conversions
struct ManifestUpdateInformation {
    // The layers as stored at the destination, in manifest order
    std::vector<BlobInfo> layerInfos;
    // Uncompressed digests of the layers, in manifest order
    std::vector<Digest> layerDiffIDs;
};

struct ManifestUpdateOptions {
    // Replacement layers, in manifest order
    boost::optional<std::vector<BlobInfo>> layerInfos;
    // Reference to embed in schema1 manifests
    boost::optional<DockerReference> embeddedDockerReference;
    // Convert to this MIME type, empty for no conversion
    std::string manifestMIMEType;
    ManifestUpdateInformation informationOnly;
};

/**
 * A single image: its parsed manifest and access to its config blob.
 * Images are never modified, updatedImage returns a new Image.
 */
class Image {
public:
    Image(std::unique_ptr<Manifest> manifest,
          transports::ImageSource* source,
          const boost::optional<std::string>& configBlob = boost::none);
    virtual ~Image() = default;

    // Manifest blob and MIME type
    virtual std::pair<std::string, std::string> getManifest() const;
    const Manifest& getParsedManifest() const { return *manifest; }
    BlobInfo getConfigInfo() const;
    // Reads (once) and verifies the config blob, empty if the format has no config blob
    std::string getConfigBlob();
    std::vector<BlobInfo> getLayerInfos() const;
    bool embeddedDockerReferenceConflicts(const DockerReference& reference) const;
    bool updatedImageNeedsLayerDiffIDs(const ManifestUpdateOptions& options) const;
    std::unique_ptr<Image> updatedImage(const ManifestUpdateOptions& options);
    bool supportsEncryption() const;
    bool canChangeLayerCompression(const std::string& mimeType) const;

private:
    std::unique_ptr<Image> convert(ManifestUpdateOptions& options);
    std::unique_ptr<Image> convertOCI1ToSchema2(ManifestUpdateOptions& options) const;
    std::unique_ptr<Image> convertSchema2ToOCI1();
    std::unique_ptr<Image> convertSchema1ToSchema2(ManifestUpdateOptions& options) const;
    void applyUpdates(const ManifestUpdateOptions& options);

protected:
    std::unique_ptr<Manifest> manifest;
    // Not owned, may be null if the config blob is known
    transports::ImageSource* source;
    boost::optional<std::string> configBlob;
};

/**
 * An image as read from a source: getManifest returns the original bytes,
 * which may differ from what the parsed manifest would serialize to.
 */
class SourcedImage : public Image {
public:
    static std::unique_ptr<SourcedImage> fromSource(transports::ImageSource& source,
                                                    const boost::optional<Digest>& instanceDigest);

    std::pair<std::string, std::string> getManifest() const override;
    const Digest& getManifestDigest() const { return manifestDigest; }

private:
    SourcedImage(std::unique_ptr<Manifest> manifest, transports::ImageSource& source,
                 const std::string& manifestBlob, const std::string& manifestMIMEType);

private:
    std::string manifestBlob;
    std::string manifestMIMEType;
    Digest manifestDigest;
};

// Re-encodes a Docker image configuration, keeping only the members known to OCI
std::string ociConfigFromDockerConfig(const std::string& dockerConfig);

}
}

#endif
