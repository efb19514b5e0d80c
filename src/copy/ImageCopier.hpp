/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_ImageCopier_hpp
#define carrier_copy_ImageCopier_hpp

#include <string>
#include <vector>
#include <memory>
#include <utility>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/BlobInfo.hpp"
#include "image/Image.hpp"
#include "compression/Algorithm.hpp"
#include "copy/ManifestConversion.hpp"
#include "copy/BlobCopier.hpp"
#include "copy/UnparsedInstance.hpp"


namespace carrier {
namespace copy {

class Copier;

struct CopySingleImageOptions {
    // Reuse only blobs compressed with compressionFormat
    bool requireCompressionFormatMatch = false;
    // Override the compression of the copy options
    boost::optional<compression::Algorithm> compressionFormat;
    boost::optional<int> compressionLevel;
};

struct CopySingleImageResult {
    std::string manifest;
    std::string manifestMIMEType;
    image::Digest manifestDigest;
    // Compression algorithms of the layers at the destination
    std::vector<compression::Algorithm> compressionAlgorithms;
};

/**
 * Copies a single image (not a list) from the source of the session to its destination.
 * With a targetInstance, the manifest is written as an instance of a list.
 */
CopySingleImageResult copySingleImage(Copier& session,
                                      UnparsedInstance& unparsedImage,
                                      const boost::optional<image::Digest>& targetInstance,
                                      const CopySingleImageOptions& options);

// The compression edits implied by the media type of a source layer
std::pair<image::CompressionOperation, boost::optional<compression::Algorithm>>
compressionEditsFromBlobInfo(const image::BlobInfo& info);

/**
 * State of the copy of one image.
 */
class ImageCopier {
public:
    ImageCopier(Copier& session,
                image::SourcedImage& sourceImage,
                const std::string& cannotModifyManifestReason,
                const CopySingleImageOptions& options);
    ImageCopier(const ImageCopier&) = delete;
    ImageCopier& operator=(const ImageCopier&) = delete;

    CopySingleImageResult copy(const boost::optional<image::Digest>& targetInstance,
                               const std::vector<std::string>& sourceSignatures);

private:
    struct CopiedLayer {
        image::BlobInfo destInfo;
        // Empty unless needed
        image::Digest diffID;
    };

    void updateEmbeddedDockerReference();
    bool noPendingManifestUpdates() const;
    boost::optional<CopySingleImageResult> compareImageDestinationManifestEqual(
        const boost::optional<image::Digest>& targetInstance);
    std::vector<compression::Algorithm> copyLayers();
    CopiedLayer copyLayerOrSkipForeign(const image::LayerInfo& srcLayer, bool toEncrypt, size_t layerIndex);
    CopiedLayer copyLayer(const image::BlobInfo& srcLayer, bool toEncrypt, size_t layerIndex, bool emptyLayer);
    std::pair<std::string, image::Digest> copyUpdatedConfigAndManifest(
        const boost::optional<image::Digest>& targetInstance);
    void copyConfig(image::Image& pendingImage);

private:
    Copier& session;
    image::SourcedImage& sourceImage;
    BlobPipelineSettings settings;
    bool requireCompressionFormatMatch;
    bool canSubstituteBlobs = false;
    bool diffIDsAreNeeded = false;
    image::ManifestUpdateOptions manifestUpdates;
    ManifestConversionPlan manifestConversionPlan;
    BlobCopier blobCopier;
};

}
}

#endif
