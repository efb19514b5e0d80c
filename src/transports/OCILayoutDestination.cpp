/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCILayoutDestination.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "image/mediaTypes.hpp"
#include "transports/BlobFile.hpp"


namespace carrier {
namespace transports {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "OCILayout", level);
}

OCILayoutDestination::OCILayoutDestination(const OCIReference& reference)
    : reference(reference)
{
    if(reference.getSourceIndex() != OCIReference::NO_SOURCE_INDEX) {
        auto message = boost::format("Destination reference must not contain a manifest index @%d") % reference.getSourceIndex();
        CARRIER_THROW_ERROR(message.str());
    }
    if(boost::filesystem::exists(reference.getIndexPath())) {
        index = OCIIndex::read(reference.getIndexPath());
    }
    libcarrier::filesystem::createFoldersIfNecessary(reference.getDirectory() / "blobs");
}

const ImageReference& OCILayoutDestination::getReference() const {
    return reference;
}

std::vector<std::string> OCILayoutDestination::getSupportedManifestMIMETypes() const {
    return {image::mediatype::ociImageManifest, image::mediatype::ociImageIndex};
}

void OCILayoutDestination::supportsSignatures() const {
    CARRIER_THROW_ERROR("Pushing signatures for OCI images is not supported");
}

LayerCompression OCILayoutDestination::getDesiredLayerCompression() const {
    return LayerCompression::Compress;
}

bool OCILayoutDestination::acceptsForeignLayerURLs() const {
    return false;
}

bool OCILayoutDestination::mustMatchRuntimeOS() const {
    return false;
}

bool OCILayoutDestination::ignoresEmbeddedDockerReference() const {
    return false;
}

bool OCILayoutDestination::hasThreadSafePutBlob() const {
    return true;
}

bool OCILayoutDestination::supportsPutBlobPartial() const {
    return false;
}

blobinfocache::TransportScope OCILayoutDestination::getCacheScope() const {
    return blobinfocache::TransportScope{reference.getResolvedDirectory().string()};
}

UploadedBlob OCILayoutDestination::putBlob(stream::Reader& stream, const image::BlobInfo& inputInfo,
                                           const PutBlobOptions& options) {
    auto file = BlobFile{reference.getDirectory(), "oci-put-blob"};
    auto blob = file.write(stream, inputInfo);
    auto path = reference.getBlobPath(blob.digest);
    file.commit(path);
    if(options.cache) {
        options.cache->recordKnownLocation(reference.getTransport().getName(), getCacheScope(),
                                           blob.digest, blobinfocache::LocationReference{path.string()});
    }
    printLog(boost::format("Stored blob %s (%d bytes)") % blob.digest % blob.size, libcarrier::LogLevel::DEBUG);
    return blob;
}

boost::optional<int64_t> OCILayoutDestination::getBlobSize(const image::Digest& digest) const {
    auto path = reference.getBlobPath(digest);
    if(!boost::filesystem::exists(path)) {
        return boost::none;
    }
    return static_cast<int64_t>(libcarrier::filesystem::getFileSize(path));
}

boost::optional<ReusedBlob> OCILayoutDestination::tryReusingBlob(const image::BlobInfo& info,
                                                                 const TryReusingBlobOptions& options) {
    if(info.digest.empty()) {
        CARRIER_THROW_ERROR("Can not check for a blob with unknown digest");
    }

    if(originalCandidateMatchesTryReusingBlobOptions(options)) {
        auto size = getBlobSize(info.digest);
        if(size) {
            auto blob = ReusedBlob{};
            blob.digest = info.digest;
            blob.size = *size;
            return blob;
        }
    }

    if(!options.cache) {
        return boost::none;
    }

    // a chunked layer can be reused as the uncompressed layer with the same table of contents
    if(!options.tocDigest.empty()
       && image::candidateCompressionMatchesReuseConditions(options.reuseConditions, boost::none)) {
        auto uncompressed = options.cache->uncompressedDigestForTOC(options.tocDigest);
        if(!uncompressed.empty() && options.canSubstitute) {
            auto size = getBlobSize(uncompressed);
            if(size) {
                auto blob = ReusedBlob{};
                blob.digest = uncompressed;
                blob.size = *size;
                blob.compressionOperation = image::CompressionOperation::Decompress;
                blob.matchedByTOCDigest = true;
                return blob;
            }
        }
    }

    auto candidateOptions = blobinfocache::CandidateLocationsOptions{};
    candidateOptions.canSubstitute = options.canSubstitute;
    candidateOptions.reuseConditions = options.reuseConditions;
    auto candidates = options.cache->candidateLocations(reference.getTransport().getName(), getCacheScope(),
                                                        info.digest, candidateOptions);
    for(const auto& candidate : candidates) {
        auto size = getBlobSize(candidate.digest);
        if(!size) {
            continue;
        }
        printLog(boost::format("Reusing blob %s in place of %s") % candidate.digest % info.digest,
                 libcarrier::LogLevel::DEBUG);
        auto blob = ReusedBlob{};
        blob.digest = candidate.digest;
        blob.size = *size;
        blob.compressionOperation = candidate.compressionOperation;
        blob.compressionAlgorithm = candidate.compressionAlgorithm;
        blob.compressionAnnotations = candidate.compressionAnnotations;
        return blob;
    }
    return boost::none;
}

void OCILayoutDestination::putManifest(const std::string& manifest, const std::string& mimeType,
                                       const boost::optional<image::Digest>& instanceDigest) {
    auto digest = instanceDigest ? *instanceDigest : image::manifestDigest(manifest);
    writeBlobFile(manifest, reference.getBlobPath(digest));
    if(instanceDigest) {
        return;
    }

    auto descriptor = image::Descriptor{};
    descriptor.digest = digest;
    descriptor.size = static_cast<int64_t>(manifest.size());
    descriptor.mediaType = mimeType.empty() ? image::guessMIMEType(manifest) : mimeType;
    if(!reference.getImageName().empty()) {
        descriptor.annotations[OCI_REF_NAME_ANNOTATION] = reference.getImageName();
    }
    addManifest(descriptor);
}

/**
 * A descriptor with a reference name takes the name away from any other
 * descriptor. A descriptor with the same digest and no name is replaced.
 */
void OCILayoutDestination::addManifest(const image::Descriptor& descriptor) {
    std::lock_guard<std::mutex> lock{mutex};
    auto name = descriptor.annotations.find(OCI_REF_NAME_ANNOTATION);
    if(name != descriptor.annotations.cend()) {
        for(auto& manifest : index.manifests) {
            auto it = manifest.annotations.find(OCI_REF_NAME_ANNOTATION);
            if(it != manifest.annotations.end() && it->second == name->second) {
                manifest.annotations.erase(it);
                break;
            }
        }
    }
    for(auto& manifest : index.manifests) {
        if(manifest.digest == descriptor.digest && manifest.annotations.count(OCI_REF_NAME_ANNOTATION) == 0) {
            manifest = descriptor;
            return;
        }
    }
    index.manifests.push_back(descriptor);
}

void OCILayoutDestination::putSignatures(const std::vector<std::string>& signatures,
                                         const boost::optional<image::Digest>&) {
    if(!signatures.empty()) {
        CARRIER_THROW_ERROR("Pushing signatures for OCI images is not supported");
    }
}

void OCILayoutDestination::commit() {
    std::lock_guard<std::mutex> lock{mutex};
    writeBlobFile(R"({"imageLayoutVersion":"1.0.0"})", reference.getLayoutPath());
    writeBlobFile(index.serialize(), reference.getIndexPath());
    printLog(boost::format("Committed OCI layout %s") % reference.getDirectory(), libcarrier::LogLevel::DEBUG);
}

}
}
