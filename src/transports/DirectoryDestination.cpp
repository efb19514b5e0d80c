/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "DirectoryDestination.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "transports/BlobFile.hpp"


namespace carrier {
namespace transports {

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Directory", level);
}

DirectoryDestination::DirectoryDestination(const DirectoryReference& reference)
    : reference(reference)
{
    prepareDirectory();
}

void DirectoryDestination::prepareDirectory() const {
    namespace fs = boost::filesystem;
    const auto& directory = reference.getResolvedDirectory();

    if(!fs::exists(directory)) {
        libcarrier::filesystem::createFoldersIfNecessary(directory);
    }
    else if(!fs::is_empty(directory)) {
        auto versionPath = reference.getVersionPath();
        if(!fs::exists(versionPath)
           || libcarrier::filesystem::readFile(versionPath) != DIRECTORY_TRANSPORT_VERSION) {
            auto message = boost::format("%s is not a containers image directory, don't want to overwrite important data")
                % directory;
            CARRIER_THROW_ERROR(message.str());
        }
        // only one image is kept in the directory at a time
        for(fs::directory_iterator it{directory}, end; it != end; ++it) {
            fs::remove_all(it->path());
        }
        printLog(boost::format("Overwriting existing image directory %s") % directory, libcarrier::LogLevel::DEBUG);
    }

    libcarrier::filesystem::writeTextFile(DIRECTORY_TRANSPORT_VERSION, reference.getVersionPath());
}

const ImageReference& DirectoryDestination::getReference() const {
    return reference;
}

std::vector<std::string> DirectoryDestination::getSupportedManifestMIMETypes() const {
    return {};
}

void DirectoryDestination::supportsSignatures() const {}

LayerCompression DirectoryDestination::getDesiredLayerCompression() const {
    return LayerCompression::PreserveOriginal;
}

bool DirectoryDestination::acceptsForeignLayerURLs() const {
    return false;
}

bool DirectoryDestination::mustMatchRuntimeOS() const {
    return false;
}

bool DirectoryDestination::ignoresEmbeddedDockerReference() const {
    return false;
}

bool DirectoryDestination::hasThreadSafePutBlob() const {
    return false;
}

bool DirectoryDestination::supportsPutBlobPartial() const {
    return false;
}

UploadedBlob DirectoryDestination::putBlob(stream::Reader& stream, const image::BlobInfo& inputInfo,
                                           const PutBlobOptions&) {
    auto file = BlobFile{reference.getResolvedDirectory(), "dir-put-blob"};
    auto blob = file.write(stream, inputInfo);
    file.commit(reference.getBlobPath(blob.digest));
    return blob;
}

boost::optional<ReusedBlob> DirectoryDestination::tryReusingBlob(const image::BlobInfo& info,
                                                                 const TryReusingBlobOptions& options) {
    if(info.digest.empty()) {
        CARRIER_THROW_ERROR("Can not check for a blob with unknown digest");
    }
    if(!originalCandidateMatchesTryReusingBlobOptions(options)) {
        return boost::none;
    }
    auto path = reference.getBlobPath(info.digest);
    if(!boost::filesystem::exists(path)) {
        return boost::none;
    }
    auto blob = ReusedBlob{};
    blob.digest = info.digest;
    blob.size = static_cast<int64_t>(libcarrier::filesystem::getFileSize(path));
    return blob;
}

void DirectoryDestination::putManifest(const std::string& manifest, const std::string&,
                                       const boost::optional<image::Digest>& instanceDigest) {
    writeBlobFile(manifest, reference.getManifestPath(instanceDigest));
}

void DirectoryDestination::putSignatures(const std::vector<std::string>& signatures,
                                         const boost::optional<image::Digest>& instanceDigest) {
    for(size_t i=0; i<signatures.size(); ++i) {
        writeBlobFile(signatures[i], reference.getSignaturePath(i, instanceDigest));
    }
}

void DirectoryDestination::commit() {}

}
}
