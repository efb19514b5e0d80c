/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_crypto_EncryptConfig_hpp
#define carrier_crypto_EncryptConfig_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>


namespace carrier {
namespace crypto {

// Recipients of encrypted layers, as PEM encoded public keys
struct EncryptConfig {
    std::vector<std::string> publicKeysPEM;

    static EncryptConfig fromKeyFiles(const std::vector<boost::filesystem::path>& files);
};

// Keys available to decrypt layers, as PEM encoded private keys
struct DecryptConfig {
    struct PrivateKey {
        std::string pem;
        boost::optional<std::string> passphrase;
    };
    std::vector<PrivateKey> privateKeys;

    static DecryptConfig fromKeyFiles(const std::vector<boost::filesystem::path>& files);
};

}
}

#endif
