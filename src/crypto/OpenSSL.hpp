/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_crypto_OpenSSL_hpp
#define carrier_crypto_OpenSSL_hpp

#include <string>
#include <memory>

#include <boost/optional.hpp>
#include <openssl/evp.h>


namespace carrier {
namespace crypto {

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using PKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct MDContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};
using MDContext = std::unique_ptr<EVP_MD_CTX, MDContextDeleter>;

// Returns (and clears) the messages queued in the OpenSSL error stack
std::string getOpenSSLErrors();

PKey loadPublicKeyPEM(const std::string& pem);
PKey loadPrivateKeyPEM(const std::string& pem, const boost::optional<std::string>& passphrase = boost::none);

std::string randomBytes(size_t size);

// RSA-OAEP with SHA-256
std::string wrapKey(EVP_PKEY* publicKey, const std::string& plaintext);
std::string unwrapKey(EVP_PKEY* privateKey, const std::string& ciphertext);

// SHA-256 signature (PKCS#1 v1.5 for RSA keys, ECDSA for EC keys)
std::string sign(EVP_PKEY* privateKey, const std::string& data);
bool verify(EVP_PKEY* publicKey, const std::string& data, const std::string& signature);

// Incremental HMAC-SHA256
class HMAC {
public:
    explicit HMAC(const std::string& key);
    void update(const char* data, size_t size);
    std::string final();

private:
    PKey key;
    MDContext context;
};

// Constant time comparison
bool equalSecrets(const std::string& lhs, const std::string& rhs);

}
}

#endif
