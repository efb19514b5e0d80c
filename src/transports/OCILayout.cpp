/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCILayout.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/mediaTypes.hpp"
#include "image/OCI1Index.hpp"
#include "transports/localPaths.hpp"
#include "transports/OCILayoutSource.hpp"
#include "transports/OCILayoutDestination.hpp"


namespace carrier {
namespace transports {

const std::string OCI_REF_NAME_ANNOTATION{"org.opencontainers.image.ref.name"};

void validateOCIImageName(const std::string& image) {
    // grammar of the org.opencontainers.image.ref.name annotation
    static const auto component = std::string{"[A-Za-z0-9]+(?:(?:[-._:@+]|--)[A-Za-z0-9]+)*"};
    static const auto pattern = boost::regex{"^" + component + "(?:/" + component + ")*$"};
    if(!image.empty() && !boost::regex_match(image, pattern)) {
        auto message = boost::format("Invalid image %s") % image;
        CARRIER_THROW_ERROR(message.str());
    }
}

const OCITransport& OCITransport::getInstance() {
    static const OCITransport transport;
    return transport;
}

std::string OCITransport::getName() const {
    return "oci";
}

std::unique_ptr<ImageReference> OCITransport::parseReference(const std::string& reference) const {
    auto separator = reference.find(':');
    auto directory = reference.substr(0, separator);
    auto image = separator == std::string::npos ? std::string{} : reference.substr(separator + 1);
    if(directory.empty()) {
        auto message = boost::format("Invalid OCI reference %s: path is empty") % reference;
        CARRIER_THROW_ERROR(message.str());
    }

    auto sourceIndex = OCIReference::NO_SOURCE_INDEX;
    if(!image.empty() && image[0] == '@') {
        try {
            sourceIndex = boost::lexical_cast<int>(image.substr(1));
        }
        catch(const boost::bad_lexical_cast&) {
            auto message = boost::format("Invalid OCI reference %s: index %s is not a number") % reference % image.substr(1);
            CARRIER_THROW_ERROR(message.str());
        }
        if(sourceIndex < 0) {
            auto message = boost::format("Invalid OCI reference %s: index @%d must not be negative") % reference % sourceIndex;
            CARRIER_THROW_ERROR(message.str());
        }
        image.clear();
    }
    return std::unique_ptr<ImageReference>{new OCIReference{directory, image, sourceIndex}};
}

void OCITransport::validatePolicyConfigurationScope(const std::string& scope) const {
    auto separator = scope.find(':');
    localpaths::validatePathScope(scope.substr(0, separator));
    if(separator != std::string::npos) {
        validateOCIImageName(scope.substr(separator + 1));
    }
}

OCIReference::OCIReference(const boost::filesystem::path& directory, const std::string& imageName, int sourceIndex)
    : directory{directory}
    , resolvedDirectory{localpaths::resolvePath(directory)}
    , imageName{imageName}
    , sourceIndex{sourceIndex}
{
    validateOCIImageName(imageName);
    if(sourceIndex != NO_SOURCE_INDEX && !imageName.empty()) {
        auto message = boost::format("Invalid oci: layout reference: cannot use both an image %s and a source index @%d")
            % imageName % sourceIndex;
        CARRIER_THROW_ERROR(message.str());
    }
}

const ImageTransport& OCIReference::getTransport() const {
    return OCITransport::getInstance();
}

std::string OCIReference::stringWithinTransport() const {
    if(sourceIndex == NO_SOURCE_INDEX) {
        return directory.string() + ":" + imageName;
    }
    return directory.string() + ":@" + std::to_string(sourceIndex);
}

boost::optional<image::DockerReference> OCIReference::getDockerReference() const {
    return boost::none;
}

std::string OCIReference::getPolicyConfigurationIdentity() const {
    return resolvedDirectory.string();
}

std::vector<std::string> OCIReference::getPolicyConfigurationNamespaces() const {
    return localpaths::pathNamespaces(resolvedDirectory.string());
}

std::unique_ptr<ImageSource> OCIReference::newImageSource(const TransportContext&) const {
    return std::unique_ptr<ImageSource>{new OCILayoutSource{*this}};
}

std::unique_ptr<ImageDestination> OCIReference::newImageDestination(const TransportContext&) const {
    return std::unique_ptr<ImageDestination>{new OCILayoutDestination{*this}};
}

boost::filesystem::path OCIReference::getIndexPath() const {
    return directory / "index.json";
}

boost::filesystem::path OCIReference::getLayoutPath() const {
    return directory / "oci-layout";
}

boost::filesystem::path OCIReference::getBlobPath(const image::Digest& digest) const {
    if(digest.empty()) {
        CARRIER_THROW_ERROR("unexpected empty digest reference");
    }
    return directory / "blobs" / digest.getAlgorithm() / digest.getEncoded();
}

image::Descriptor OCIReference::getManifestDescriptor() const {
    auto index = OCIIndex::read(getIndexPath());

    if(sourceIndex != NO_SOURCE_INDEX) {
        if(static_cast<size_t>(sourceIndex) >= index.manifests.size()) {
            auto message = boost::format("index %d is too large, only %d entries available") % sourceIndex % index.manifests.size();
            CARRIER_THROW_ERROR(message.str());
        }
        return index.manifests[sourceIndex];
    }

    if(!imageName.empty()) {
        auto unsupportedMIMETypes = std::vector<std::string>{};
        for(const auto& descriptor : index.manifests) {
            auto it = descriptor.annotations.find(OCI_REF_NAME_ANNOTATION);
            if(it == descriptor.annotations.cend() || it->second != imageName) {
                continue;
            }
            if(descriptor.mediaType == image::mediatype::ociImageManifest
               || descriptor.mediaType == image::mediatype::ociImageIndex
               || descriptor.mediaType == image::mediatype::dockerV2Schema2
               || descriptor.mediaType == image::mediatype::dockerV2List) {
                return descriptor;
            }
            unsupportedMIMETypes.push_back(descriptor.mediaType);
        }
        if(!unsupportedMIMETypes.empty()) {
            auto message = boost::format("reference \"%s\" matches unsupported manifest MIME types %s")
                % imageName % boost::algorithm::join(unsupportedMIMETypes, ", ");
            CARRIER_THROW_ERROR(message.str());
        }
        auto message = boost::format("no descriptor found for reference \"%s\"") % imageName;
        CARRIER_THROW_ERROR(message.str());
    }

    if(index.manifests.size() != 1) {
        CARRIER_THROW_ERROR("more than one image in oci, choose an image");
    }
    return index.manifests.front();
}

OCIIndex OCIIndex::read(const boost::filesystem::path& file) {
    auto content = std::string{};
    try {
        content = libcarrier::filesystem::readFile(file);
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to read OCI index %s") % file;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
    auto parsed = image::OCI1Index::fromBlob(content);
    auto index = OCIIndex{};
    index.manifests = parsed->getManifests();
    index.annotations = parsed->getAnnotations();
    return index;
}

std::string OCIIndex::serialize() const {
    return image::OCI1Index{manifests, annotations}.serialize();
}

}
}
