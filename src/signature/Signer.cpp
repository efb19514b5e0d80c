/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Signer.hpp"

#include <ctime>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "image/Manifest.hpp"
#include "signature/Signature.hpp"


namespace carrier {
namespace signature {

static const std::string CREATOR{"carrier"};

PEMSigner::PEMSigner(const boost::filesystem::path& privateKeyFile, const boost::optional<std::string>& passphrase)
    : privateKeyFile{privateKeyFile}
{
    if(!boost::filesystem::exists(privateKeyFile)) {
        auto message = boost::format("Signing key %s does not exist") % privateKeyFile;
        CARRIER_THROW_ERROR(message.str());
    }
    try {
        privateKey = crypto::loadPrivateKeyPEM(libcarrier::filesystem::readFile(privateKeyFile), passphrase);
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to load signing key %s") % privateKeyFile;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

std::string PEMSigner::getProgressMessage() const {
    return (boost::format("Signing manifest using key %s") % privateKeyFile.string()).str();
}

std::string PEMSigner::signImageManifest(const std::string& manifest, const image::DockerReference& identity) {
    auto payload = SimpleSigningPayload{};
    payload.manifestDigest = image::manifestDigest(manifest);
    payload.dockerReference = identity.string();
    payload.creator = CREATOR;
    payload.timestamp = static_cast<int64_t>(std::time(nullptr));

    auto result = Signature{};
    result.payload = payload.serialize();
    result.signature = crypto::sign(privateKey.get(), result.payload);

    libcarrier::Logger::getInstance().log(
        boost::format("Signed manifest %s for %s") % payload.manifestDigest % payload.dockerReference,
        "Signature", libcarrier::LogLevel::DEBUG);
    return result.serialize();
}

}
}
