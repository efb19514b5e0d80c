/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DirectorySource.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "stream/FileReader.hpp"


namespace carrier {
namespace transports {

DirectorySource::DirectorySource(const DirectoryReference& reference)
    : reference(reference)
{}

const ImageReference& DirectorySource::getReference() const {
    return reference;
}

std::pair<std::string, std::string> DirectorySource::getManifest(const boost::optional<image::Digest>& instanceDigest) {
    auto path = reference.getManifestPath(instanceDigest);
    auto manifest = std::string{};
    try {
        manifest = libcarrier::filesystem::readFile(path);
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to read manifest %s") % path;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    return {manifest, image::guessMIMEType(manifest)};
}

bool DirectorySource::hasThreadSafeGetBlob() const {
    return false;
}

BlobStream DirectorySource::getBlob(const image::BlobInfo& info, blobinfocache::BlobInfoCache&) {
    auto path = reference.getBlobPath(info.digest);
    if(!boost::filesystem::exists(path)) {
        auto message = boost::format("Blob %s not found in %s") % info.digest % reference.getDirectory();
        CARRIER_THROW_ERROR(message.str());
    }
    auto blob = BlobStream{};
    blob.reader.reset(new stream::FileReader{path});
    blob.size = static_cast<int64_t>(libcarrier::filesystem::getFileSize(path));
    return blob;
}

std::vector<std::string> DirectorySource::getSignatures(const boost::optional<image::Digest>& instanceDigest) {
    auto signatures = std::vector<std::string>{};
    for(size_t i=0; ; ++i) {
        auto path = reference.getSignaturePath(i, instanceDigest);
        if(!boost::filesystem::exists(path)) {
            break;
        }
        signatures.push_back(libcarrier::filesystem::readFile(path));
    }
    return signatures;
}

}
}
