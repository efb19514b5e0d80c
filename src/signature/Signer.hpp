/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_signature_Signer_hpp
#define carrier_signature_Signer_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "image/DockerReference.hpp"
#include "crypto/OpenSSL.hpp"


namespace carrier {
namespace signature {

class Signer {
public:
    virtual ~Signer() = default;
    // Shown to the user before signing
    virtual std::string getProgressMessage() const = 0;
    // Returns the serialized signature of the manifest for the given identity
    virtual std::string signImageManifest(const std::string& manifest, const image::DockerReference& identity) = 0;
};

/**
 * Signs simple-signing payloads with a PEM encoded private key (RSA or EC).
 */
class PEMSigner : public Signer {
public:
    PEMSigner(const boost::filesystem::path& privateKeyFile, const boost::optional<std::string>& passphrase);
    std::string getProgressMessage() const override;
    std::string signImageManifest(const std::string& manifest, const image::DockerReference& identity) override;

private:
    boost::filesystem::path privateKeyFile;
    crypto::PKey privateKey;
};

}
}

#endif
