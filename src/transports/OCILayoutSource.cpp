/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCILayoutSource.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "stream/FileReader.hpp"


namespace carrier {
namespace transports {

OCILayoutSource::OCILayoutSource(const OCIReference& reference)
    : reference(reference)
    , descriptor{reference.getManifestDescriptor()}
{}

const ImageReference& OCILayoutSource::getReference() const {
    return reference;
}

std::pair<std::string, std::string> OCILayoutSource::getManifest(const boost::optional<image::Digest>& instanceDigest) {
    auto digest = instanceDigest ? *instanceDigest : descriptor.digest;
    auto manifest = std::string{};
    try {
        manifest = libcarrier::filesystem::readFile(reference.getBlobPath(digest));
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to read manifest %s from %s") % digest % reference.getDirectory();
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    auto mimeType = instanceDigest || descriptor.mediaType.empty()
        ? image::guessMIMEType(manifest)
        : descriptor.mediaType;
    return {manifest, mimeType};
}

bool OCILayoutSource::hasThreadSafeGetBlob() const {
    return true;
}

boost::filesystem::path OCILayoutSource::getExistingBlobPath(const image::BlobInfo& info) const {
    auto path = reference.getBlobPath(info.digest);
    if(!boost::filesystem::exists(path)) {
        if(!info.urls.empty()) {
            auto message = boost::format("Blob %s is a foreign layer, which is not supported by the oci transport") % info.digest;
            CARRIER_THROW_ERROR(message.str());
        }
        auto message = boost::format("Blob %s not found in %s") % info.digest % reference.getDirectory();
        CARRIER_THROW_ERROR(message.str());
    }
    return path;
}

BlobStream OCILayoutSource::getBlob(const image::BlobInfo& info, blobinfocache::BlobInfoCache&) {
    auto path = getExistingBlobPath(info);
    auto blob = BlobStream{};
    blob.reader.reset(new stream::FileReader{path});
    blob.size = static_cast<int64_t>(libcarrier::filesystem::getFileSize(path));
    return blob;
}

bool OCILayoutSource::supportsGetBlobAt() const {
    return true;
}

std::vector<std::unique_ptr<stream::Reader>> OCILayoutSource::getBlobAt(const image::BlobInfo& info,
                                                                        const std::vector<ImageSourceChunk>& chunks) {
    auto path = getExistingBlobPath(info);
    auto readers = std::vector<std::unique_ptr<stream::Reader>>{};
    for(const auto& chunk : chunks) {
        readers.emplace_back(new stream::FileReader{path, chunk.offset, chunk.length});
    }
    return readers;
}

std::vector<std::string> OCILayoutSource::getSignatures(const boost::optional<image::Digest>&) {
    return {};
}

}
}
