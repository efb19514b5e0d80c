/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "crypto.hpp"

#include <memory>

#include <openssl/evp.h>
#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/obj_mac.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "crypto/OpenSSL.hpp"


namespace test_utility {
namespace crypto {

namespace {

struct BIODeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct PKeyContextDeleter {
    void operator()(EVP_PKEY_CTX* context) const { EVP_PKEY_CTX_free(context); }
};

std::string readBIO(BIO* bio) {
    char* data = nullptr;
    auto size = BIO_get_mem_data(bio, &data);
    return std::string(data, size);
}

KeyPairPEM toPEM(EVP_PKEY* key) {
    auto publicBIO = std::unique_ptr<BIO, BIODeleter>{BIO_new(BIO_s_mem())};
    auto privateBIO = std::unique_ptr<BIO, BIODeleter>{BIO_new(BIO_s_mem())};
    if(!publicBIO || !privateBIO
       || PEM_write_bio_PUBKEY(publicBIO.get(), key) != 1
       || PEM_write_bio_PrivateKey(privateBIO.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        CARRIER_THROW_ERROR("Failed to serialize test key pair: " + carrier::crypto::getOpenSSLErrors());
    }
    return KeyPairPEM{readBIO(publicBIO.get()), readBIO(privateBIO.get())};
}

}

KeyPairPEM generateRSAKeyPair(int bits) {
    auto context = std::unique_ptr<EVP_PKEY_CTX, PKeyContextDeleter>{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr)};
    EVP_PKEY* key = nullptr;
    if(!context
       || EVP_PKEY_keygen_init(context.get()) <= 0
       || EVP_PKEY_CTX_set_rsa_keygen_bits(context.get(), bits) <= 0
       || EVP_PKEY_keygen(context.get(), &key) <= 0) {
        CARRIER_THROW_ERROR("Failed to generate RSA test key: " + carrier::crypto::getOpenSSLErrors());
    }
    auto owner = carrier::crypto::PKey{key};
    return toPEM(owner.get());
}

KeyPairPEM generateECKeyPair() {
    auto context = std::unique_ptr<EVP_PKEY_CTX, PKeyContextDeleter>{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
    EVP_PKEY* key = nullptr;
    if(!context
       || EVP_PKEY_keygen_init(context.get()) <= 0
       || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(context.get(), NID_X9_62_prime256v1) <= 0
       || EVP_PKEY_keygen(context.get(), &key) <= 0) {
        CARRIER_THROW_ERROR("Failed to generate EC test key: " + carrier::crypto::getOpenSSLErrors());
    }
    auto owner = carrier::crypto::PKey{key};
    return toPEM(owner.get());
}

void writeKeyPair(const KeyPairPEM& keys, const boost::filesystem::path& directory, const std::string& prefix) {
    libcarrier::filesystem::createFoldersIfNecessary(directory);
    libcarrier::filesystem::writeTextFile(keys.publicKey, directory / (prefix + ".pub"));
    libcarrier::filesystem::writeTextFile(keys.privateKey, directory / (prefix + ".key"));
}

}
}
