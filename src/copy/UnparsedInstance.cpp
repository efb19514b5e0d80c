/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "UnparsedInstance.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "image/Manifest.hpp"


namespace carrier {
namespace copy {

UnparsedInstance::UnparsedInstance(transports::ImageSource& source, const boost::optional<image::Digest>& instanceDigest)
    : source(source)
    , instanceDigest{instanceDigest}
{}

std::string UnparsedInstance::getTransportName() const {
    return source.getReference().getTransport().getName();
}

std::string UnparsedInstance::getPolicyConfigurationIdentity() const {
    return source.getReference().getPolicyConfigurationIdentity();
}

std::vector<std::string> UnparsedInstance::getPolicyConfigurationNamespaces() const {
    return source.getReference().getPolicyConfigurationNamespaces();
}

boost::optional<image::DockerReference> UnparsedInstance::getDockerReference() const {
    return source.getReference().getDockerReference();
}

std::pair<std::string, std::string> UnparsedInstance::getManifest() {
    if(!cachedManifest) {
        auto manifest = source.getManifest(instanceDigest);
        if(instanceDigest && !image::manifestMatchesDigest(manifest.first, *instanceDigest)) {
            auto message = boost::format("Manifest does not match expected digest %s") % *instanceDigest;
            CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, message.str());
        }
        if(manifest.second.empty()) {
            manifest.second = image::guessMIMEType(manifest.first);
        }
        cachedManifest = std::move(manifest);
    }
    return *cachedManifest;
}

std::vector<std::string> UnparsedInstance::getSignatures() {
    return source.getSignatures(instanceDigest);
}

}
}
