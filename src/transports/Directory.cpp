/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Directory.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "transports/localPaths.hpp"
#include "transports/DirectorySource.hpp"
#include "transports/DirectoryDestination.hpp"


namespace carrier {
namespace transports {

const std::string DIRECTORY_TRANSPORT_VERSION{"Directory Transport Version: 1.1\n"};

const DirectoryTransport& DirectoryTransport::getInstance() {
    static const DirectoryTransport transport;
    return transport;
}

std::string DirectoryTransport::getName() const {
    return "dir";
}

std::unique_ptr<ImageReference> DirectoryTransport::parseReference(const std::string& reference) const {
    if(reference.empty()) {
        CARRIER_THROW_ERROR("Invalid dir reference: path is empty");
    }
    return std::unique_ptr<ImageReference>{new DirectoryReference{reference}};
}

void DirectoryTransport::validatePolicyConfigurationScope(const std::string& scope) const {
    localpaths::validatePathScope(scope);
}

DirectoryReference::DirectoryReference(const boost::filesystem::path& directory)
    : directory{directory}
    , resolvedDirectory{localpaths::resolvePath(directory)}
{}

const ImageTransport& DirectoryReference::getTransport() const {
    return DirectoryTransport::getInstance();
}

std::string DirectoryReference::stringWithinTransport() const {
    return directory.string();
}

boost::optional<image::DockerReference> DirectoryReference::getDockerReference() const {
    return boost::none;
}

std::string DirectoryReference::getPolicyConfigurationIdentity() const {
    return resolvedDirectory.string();
}

std::vector<std::string> DirectoryReference::getPolicyConfigurationNamespaces() const {
    return localpaths::pathNamespaces(resolvedDirectory.string());
}

std::unique_ptr<ImageSource> DirectoryReference::newImageSource(const TransportContext&) const {
    return std::unique_ptr<ImageSource>{new DirectorySource{*this}};
}

std::unique_ptr<ImageDestination> DirectoryReference::newImageDestination(const TransportContext&) const {
    return std::unique_ptr<ImageDestination>{new DirectoryDestination{*this}};
}

boost::filesystem::path DirectoryReference::getManifestPath(const boost::optional<image::Digest>& instanceDigest) const {
    if(instanceDigest) {
        return resolvedDirectory / (instanceDigest->getEncoded() + ".manifest.json");
    }
    return resolvedDirectory / "manifest.json";
}

boost::filesystem::path DirectoryReference::getBlobPath(const image::Digest& digest) const {
    if(digest.empty()) {
        CARRIER_THROW_ERROR("unexpected empty digest reference");
    }
    // sha256 blobs are named by their hex value only
    if(digest.getAlgorithm() == image::Digest::SHA256) {
        return resolvedDirectory / digest.getEncoded();
    }
    return resolvedDirectory / (digest.getAlgorithm() + "-" + digest.getEncoded());
}

boost::filesystem::path DirectoryReference::getSignaturePath(size_t index,
                                                             const boost::optional<image::Digest>& instanceDigest) const {
    auto name = "signature-" + std::to_string(index + 1);
    if(instanceDigest) {
        return resolvedDirectory / (instanceDigest->getEncoded() + "." + name);
    }
    return resolvedDirectory / name;
}

boost::filesystem::path DirectoryReference::getVersionPath() const {
    return resolvedDirectory / "version";
}

}
}
