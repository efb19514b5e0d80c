/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OpenSSL.hpp"

#include <vector>

#include <boost/format.hpp>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/crypto.h>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace crypto {

namespace {

struct BIODeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
using BIOPtr = std::unique_ptr<BIO, BIODeleter>;

struct PKeyContextDeleter {
    void operator()(EVP_PKEY_CTX* context) const { EVP_PKEY_CTX_free(context); }
};
using PKeyContext = std::unique_ptr<EVP_PKEY_CTX, PKeyContextDeleter>;

BIOPtr makeMemoryBIO(const std::string& data) {
    auto bio = BIOPtr{BIO_new_mem_buf(data.data(), static_cast<int>(data.size()))};
    if(!bio) {
        auto message = boost::format("Failed to allocate OpenSSL BIO: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return bio;
}

}

std::string getOpenSSLErrors() {
    auto messages = std::string{};
    unsigned long code;
    while((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if(!messages.empty()) {
            messages += "; ";
        }
        messages += buffer;
    }
    return messages.empty() ? std::string{"unknown OpenSSL error"} : messages;
}

PKey loadPublicKeyPEM(const std::string& pem) {
    auto bio = makeMemoryBIO(pem);
    auto key = PKey{PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)};
    if(!key) {
        auto message = boost::format("Failed to parse PEM public key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return key;
}

PKey loadPrivateKeyPEM(const std::string& pem, const boost::optional<std::string>& passphrase) {
    auto bio = makeMemoryBIO(pem);
    // without a passphrase, an empty one is passed so that OpenSSL doesn't prompt on the terminal
    auto secret = passphrase ? *passphrase : std::string{};
    auto key = PKey{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, const_cast<char*>(secret.c_str()))};
    if(!key) {
        auto message = boost::format("Failed to parse PEM private key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return key;
}

std::string randomBytes(size_t size) {
    auto bytes = std::string(size, '\0');
    if(RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]), static_cast<int>(size)) != 1) {
        auto message = boost::format("Failed to generate random bytes: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return bytes;
}

static PKeyContext makeOAEPContext(EVP_PKEY* key, bool encrypt) {
    auto context = PKeyContext{EVP_PKEY_CTX_new(key, nullptr)};
    if(!context
       || (encrypt ? EVP_PKEY_encrypt_init(context.get()) : EVP_PKEY_decrypt_init(context.get())) <= 0
       || EVP_PKEY_CTX_set_rsa_padding(context.get(), RSA_PKCS1_OAEP_PADDING) <= 0
       || EVP_PKEY_CTX_set_rsa_oaep_md(context.get(), EVP_sha256()) <= 0) {
        auto message = boost::format("Failed to set up RSA-OAEP: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return context;
}

std::string wrapKey(EVP_PKEY* publicKey, const std::string& plaintext) {
    auto context = makeOAEPContext(publicKey, true);
    const auto* in = reinterpret_cast<const unsigned char*>(plaintext.data());
    auto outSize = size_t{0};
    if(EVP_PKEY_encrypt(context.get(), nullptr, &outSize, in, plaintext.size()) <= 0) {
        auto message = boost::format("Failed to wrap key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    auto out = std::vector<unsigned char>(outSize);
    if(EVP_PKEY_encrypt(context.get(), out.data(), &outSize, in, plaintext.size()) <= 0) {
        auto message = boost::format("Failed to wrap key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return std::string(reinterpret_cast<const char*>(out.data()), outSize);
}

std::string unwrapKey(EVP_PKEY* privateKey, const std::string& ciphertext) {
    auto context = makeOAEPContext(privateKey, false);
    const auto* in = reinterpret_cast<const unsigned char*>(ciphertext.data());
    auto outSize = size_t{0};
    if(EVP_PKEY_decrypt(context.get(), nullptr, &outSize, in, ciphertext.size()) <= 0) {
        auto message = boost::format("Failed to unwrap key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    auto out = std::vector<unsigned char>(outSize);
    if(EVP_PKEY_decrypt(context.get(), out.data(), &outSize, in, ciphertext.size()) <= 0) {
        auto message = boost::format("Failed to unwrap key: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str(), libcarrier::LogLevel::DEBUG);
    }
    return std::string(reinterpret_cast<const char*>(out.data()), outSize);
}

std::string sign(EVP_PKEY* privateKey, const std::string& data) {
    auto context = MDContext{EVP_MD_CTX_new()};
    auto size = size_t{0};
    if(!context
       || EVP_DigestSignInit(context.get(), nullptr, EVP_sha256(), nullptr, privateKey) != 1
       || EVP_DigestSignUpdate(context.get(), data.data(), data.size()) != 1
       || EVP_DigestSignFinal(context.get(), nullptr, &size) != 1) {
        auto message = boost::format("Failed to sign: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    auto signature = std::vector<unsigned char>(size);
    if(EVP_DigestSignFinal(context.get(), signature.data(), &size) != 1) {
        auto message = boost::format("Failed to sign: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return std::string(reinterpret_cast<const char*>(signature.data()), size);
}

bool verify(EVP_PKEY* publicKey, const std::string& data, const std::string& signature) {
    auto context = MDContext{EVP_MD_CTX_new()};
    if(!context
       || EVP_DigestVerifyInit(context.get(), nullptr, EVP_sha256(), nullptr, publicKey) != 1
       || EVP_DigestVerifyUpdate(context.get(), data.data(), data.size()) != 1) {
        auto message = boost::format("Failed to set up signature verification: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    auto result = EVP_DigestVerifyFinal(context.get(),
                                        reinterpret_cast<const unsigned char*>(signature.data()),
                                        signature.size());
    // a bad signature is not an error, only a negative verdict
    ERR_clear_error();
    return result == 1;
}

HMAC::HMAC(const std::string& key)
    : key{EVP_PKEY_new_mac_key(EVP_PKEY_HMAC, nullptr,
                               reinterpret_cast<const unsigned char*>(key.data()), static_cast<int>(key.size()))}
    , context{EVP_MD_CTX_new()}
{
    if(!this->key || !context
       || EVP_DigestSignInit(context.get(), nullptr, EVP_sha256(), nullptr, this->key.get()) != 1) {
        auto message = boost::format("Failed to set up HMAC: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
}

void HMAC::update(const char* data, size_t size) {
    if(EVP_DigestSignUpdate(context.get(), data, size) != 1) {
        auto message = boost::format("Failed to update HMAC: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
}

std::string HMAC::final() {
    unsigned char mac[EVP_MAX_MD_SIZE];
    auto size = sizeof(mac);
    if(EVP_DigestSignFinal(context.get(), mac, &size) != 1) {
        auto message = boost::format("Failed to compute HMAC: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return std::string(reinterpret_cast<const char*>(mac), size);
}

bool equalSecrets(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() && CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}
}
