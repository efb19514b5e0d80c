/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_copy_Options_hpp
#define carrier_copy_Options_hpp

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include <boost/optional.hpp>

#include "image/Digest.hpp"
#include "image/Platform.hpp"
#include "image/DockerReference.hpp"
#include "compression/Algorithm.hpp"
#include "crypto/EncryptConfig.hpp"
#include "signature/Signer.hpp"
#include "blobinfocache/BlobInfoCache.hpp"
#include "transports/ImageReference.hpp"
#include "copy/Semaphore.hpp"
#include "copy/CancellationToken.hpp"
#include "copy/ProgressChannel.hpp"


namespace carrier {
namespace copy {

// Which instances to copy when the source is a manifest list
enum class ImageListSelection {
    // Only the instance matching the runtime platform, without the list
    CopySystemImage,
    // The list and all of its instances
    CopyAllImages,
    // The list and the instances named in Options::instances
    CopySpecificImages
};

struct CompressionVariant {
    compression::Algorithm algorithm;
    // Only used when a new instance is created with this algorithm
    boost::optional<int> level;
};

// Parallel blob copies of a copy operation, unless the caller supplies a semaphore
const size_t DEFAULT_MAX_PARALLEL_DOWNLOADS = 6;

struct Options {
    // Drop the signatures of the source, new ones are still created by the signers
    bool removeSignatures = false;
    std::vector<std::shared_ptr<signature::Signer>> signers;
    // Identity to sign, defaults to the Docker reference of the destination
    boost::optional<image::DockerReference> signIdentity;

    transports::TransportContext sourceContext;
    transports::TransportContext destinationContext;

    // Compression of the layers at the destination, if the destination wants them compressed
    boost::optional<compression::Algorithm> destinationCompressionFormat;
    boost::optional<int> destinationCompressionLevel;
    // Use destinationCompressionFormat exclusively, never reuse blobs compressed otherwise
    bool forceCompressionFormat = false;
    // Empty to pick the manifest type automatically
    std::string forceManifestMIMEType;

    ImageListSelection imageListSelection = ImageListSelection::CopySystemImage;
    // Instances copied with CopySpecificImages
    std::vector<image::Digest> instances;
    // When picking the system image, prefer gzip over zstd compressed instances
    bool preferGzipInstances = true;
    image::PlatformChoice platformChoice;

    // Indexes of the layers to encrypt, negative ones count from the top layer.
    // Empty means all layers, none means no encryption.
    boost::optional<std::vector<int>> ociEncryptLayers;
    boost::optional<crypto::EncryptConfig> ociEncryptConfig;
    // Encrypted layers are decrypted only if set
    boost::optional<crypto::DecryptConfig> ociDecryptConfig;

    // Shared with other copy operations, maxParallelDownloads is ignored if set
    std::shared_ptr<Semaphore> concurrentBlobCopiesSemaphore;
    // 0 means DEFAULT_MAX_PARALLEL_DOWNLOADS
    size_t maxParallelDownloads = 0;

    // Skip the copy if the destination already holds an identical manifest
    bool optimizeDestinationImageAlreadyExists = false;
    // Copy the contents of foreign layers instead of keeping their URLs
    bool downloadForeignLayers = false;
    // Compression variants which must exist for every platform of a copied list
    std::vector<CompressionVariant> ensureCompressionVariantsExist;
    // Fail instead of changing any manifest digest
    bool preserveDigests = false;

    std::shared_ptr<ProgressChannel> progress;
    // Events are only reported if positive
    std::chrono::milliseconds progressInterval{0};
    std::shared_ptr<CancellationToken> cancellation;
    // An in-memory cache private to the copy operation if not set
    std::shared_ptr<blobinfocache::BlobInfoCache> blobInfoCache;
};

}
}

#endif
