/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_test_utility_crypto_hpp
#define carrier_test_utility_crypto_hpp

#include <string>

#include <boost/filesystem.hpp>


namespace test_utility {
namespace crypto {

struct KeyPairPEM {
    std::string publicKey;
    std::string privateKey;
};

KeyPairPEM generateRSAKeyPair(int bits = 2048);
KeyPairPEM generateECKeyPair();

// Writes "<prefix>.pub" and "<prefix>.key" in the given directory
void writeKeyPair(const KeyPairPEM& keys, const boost::filesystem::path& directory, const std::string& prefix);

}
}

#endif
