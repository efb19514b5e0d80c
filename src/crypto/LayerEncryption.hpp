/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_crypto_LayerEncryption_hpp
#define carrier_crypto_LayerEncryption_hpp

#include <string>
#include <map>
#include <memory>

#include "stream/Reader.hpp"
#include "crypto/EncryptConfig.hpp"


namespace carrier {
namespace crypto {

extern const std::string ANNOTATION_KEYS_PKCS1;
extern const std::string ANNOTATION_PUBOPTS;
extern const std::string CIPHER_AES_256_CTR_HMAC_SHA256;

bool isEncryptedMediaType(const std::string& mediaType);

// True if the annotations carry a wrapped key that the layer can be decrypted with
bool hasEncryptionAnnotations(const std::map<std::string, std::string>& annotations);

/**
 * Encrypts a layer with a fresh AES-256 key. The annotations describing the
 * wrapped key and the HMAC of the ciphertext are known only at end of stream.
 */
class EncryptingReader : public stream::Reader {
public:
    EncryptingReader(stream::Reader& source, const EncryptConfig& config);
    ~EncryptingReader();
    size_t read(char* buffer, size_t size) override;
    const std::map<std::string, std::string>& getAnnotations() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

/**
 * Decrypts a layer encrypted by EncryptingReader (or any OCI producer using the
 * same scheme). The HMAC is verified at end of stream.
 */
class DecryptingReader : public stream::Reader {
public:
    DecryptingReader(stream::Reader& source,
                     const std::map<std::string, std::string>& annotations,
                     const DecryptConfig& config);
    ~DecryptingReader();
    size_t read(char* buffer, size_t size) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

// Strips the encryption annotations, as needed by a decrypted layer
std::map<std::string, std::string> removeEncryptionAnnotations(std::map<std::string, std::string> annotations);

}
}

#endif
