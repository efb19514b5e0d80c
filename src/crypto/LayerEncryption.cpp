/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "LayerEncryption.hpp"

#include <vector>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include <rapidjson/document.h>
#include <openssl/evp.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/Logger.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/base64.hpp"
#include "libcarrier/utility/string.hpp"
#include "image/mediaTypes.hpp"
#include "crypto/OpenSSL.hpp"


namespace carrier {
namespace crypto {

namespace json = libcarrier::json;
namespace base64 = libcarrier::base64;

const std::string ANNOTATION_KEYS_PKCS1{"org.opencontainers.image.enc.keys.pkcs1"};
const std::string ANNOTATION_PUBOPTS{"org.opencontainers.image.enc.pubopts"};
const std::string CIPHER_AES_256_CTR_HMAC_SHA256{"AES_256_CTR_HMAC_SHA256"};

static const size_t SYMMETRIC_KEY_SIZE = 32;
static const size_t NONCE_SIZE = 16;

static void printLog(const boost::format& message, libcarrier::LogLevel level) {
    libcarrier::Logger::getInstance().log(message.str(), "Crypto", level);
}

bool isEncryptedMediaType(const std::string& mediaType) {
    return boost::ends_with(mediaType, image::mediatype::encryptedSuffix);
}

bool hasEncryptionAnnotations(const std::map<std::string, std::string>& annotations) {
    return annotations.count(ANNOTATION_KEYS_PKCS1) > 0;
}

std::map<std::string, std::string> removeEncryptionAnnotations(std::map<std::string, std::string> annotations) {
    for(auto it = annotations.begin(); it != annotations.end(); ) {
        if(boost::starts_with(it->first, "org.opencontainers.image.enc.")) {
            it = annotations.erase(it);
        }
        else {
            ++it;
        }
    }
    return annotations;
}

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* context) const { EVP_CIPHER_CTX_free(context); }
};
using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

// AES-256-CTR is a stream cipher: every update produces as many bytes as it consumes
CipherContext makeCTRContext(const std::string& key, const std::string& nonce, bool encrypt) {
    auto context = CipherContext{EVP_CIPHER_CTX_new()};
    if(!context
       || EVP_CipherInit_ex(context.get(), EVP_aes_256_ctr(), nullptr,
                            reinterpret_cast<const unsigned char*>(key.data()),
                            reinterpret_cast<const unsigned char*>(nonce.data()),
                            encrypt ? 1 : 0) != 1) {
        auto message = boost::format("Failed to set up AES-256-CTR: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
    return context;
}

void transform(EVP_CIPHER_CTX* context, const char* in, char* out, size_t size) {
    auto outSize = int{0};
    if(EVP_CipherUpdate(context,
                        reinterpret_cast<unsigned char*>(out), &outSize,
                        reinterpret_cast<const unsigned char*>(in), static_cast<int>(size)) != 1
       || static_cast<size_t>(outSize) != size) {
        auto message = boost::format("AES-256-CTR transformation failed: %s") % getOpenSSLErrors();
        CARRIER_THROW_ERROR(message.str());
    }
}

std::string makePrivateOptions(const std::string& key, const std::string& nonce) {
    auto document = rapidjson::Document{};
    document.SetObject();
    auto& allocator = document.GetAllocator();
    auto cipherOptions = rapidjson::Value{rapidjson::kObjectType};
    cipherOptions.AddMember("nonce", rapidjson::Value{base64::encode(nonce).c_str(), allocator}, allocator);
    document.AddMember("symkey", rapidjson::Value{base64::encode(key).c_str(), allocator}, allocator);
    document.AddMember("cipheroptions", cipherOptions, allocator);
    document.AddMember("cipher", rapidjson::Value{CIPHER_AES_256_CTR_HMAC_SHA256.c_str(), allocator}, allocator);
    return json::serialize(document);
}

std::string makePublicOptions(const std::string& hmac) {
    auto document = rapidjson::Document{};
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("cipher", rapidjson::Value{CIPHER_AES_256_CTR_HMAC_SHA256.c_str(), allocator}, allocator);
    document.AddMember("hmac", rapidjson::Value{base64::encode(hmac).c_str(), allocator}, allocator);
    document.AddMember("cipheroptions", rapidjson::Value{rapidjson::kObjectType}, allocator);
    return base64::encode(json::serialize(document));
}

}

class EncryptingReader::Impl {
public:
    Impl(stream::Reader& source, const EncryptConfig& config)
        : source(source)
        , config(config)
        , key{randomBytes(SYMMETRIC_KEY_SIZE)}
        , nonce{randomBytes(NONCE_SIZE)}
        , context{makeCTRContext(key, nonce, true)}
        , hmac{key}
    {
        if(config.publicKeysPEM.empty()) {
            CARRIER_THROW_ERROR("No recipient public keys specified for layer encryption");
        }
    }

    size_t read(char* buffer, size_t size) {
        if(size == 0) {
            return 0;
        }
        auto plaintext = std::vector<char>(size);
        auto bytes = source.read(plaintext.data(), size);
        if(bytes == 0) {
            finalize();
            return 0;
        }
        transform(context.get(), plaintext.data(), buffer, bytes);
        hmac.update(buffer, bytes);
        return bytes;
    }

    void finalize() {
        if(finalized) {
            return;
        }
        auto privateOptions = makePrivateOptions(key, nonce);
        auto wrappedKeys = std::vector<std::string>{};
        for(const auto& pem : config.publicKeysPEM) {
            auto publicKey = loadPublicKeyPEM(pem);
            wrappedKeys.push_back(base64::encode(wrapKey(publicKey.get(), privateOptions)));
        }
        annotations[ANNOTATION_KEYS_PKCS1] = libcarrier::string::join(wrappedKeys, ",");
        annotations[ANNOTATION_PUBOPTS] = makePublicOptions(hmac.final());
        finalized = true;
        printLog(boost::format("Encrypted layer for %d recipient(s)") % wrappedKeys.size(), libcarrier::LogLevel::DEBUG);
    }

    stream::Reader& source;
    EncryptConfig config;
    std::string key;
    std::string nonce;
    CipherContext context;
    HMAC hmac;
    bool finalized = false;
    std::map<std::string, std::string> annotations;
};

EncryptingReader::EncryptingReader(stream::Reader& source, const EncryptConfig& config)
    : impl{new Impl{source, config}}
{}

EncryptingReader::~EncryptingReader() = default;

size_t EncryptingReader::read(char* buffer, size_t size) {
    return impl->read(buffer, size);
}

const std::map<std::string, std::string>& EncryptingReader::getAnnotations() const {
    if(!impl->finalized) {
        CARRIER_THROW_TYPED_ERROR(libcarrier::InternalError,
                                  "Internal error: encryption annotations requested before end of stream");
    }
    return impl->annotations;
}

class DecryptingReader::Impl {
public:
    Impl(stream::Reader& source,
         const std::map<std::string, std::string>& annotations,
         const DecryptConfig& config)
        : source(source)
    {
        unwrapPrivateOptions(annotations, config);
        parsePublicOptions(annotations);
        context = makeCTRContext(key, nonce, false);
        hmac.reset(new HMAC{key});
    }

    size_t read(char* buffer, size_t size) {
        if(size == 0) {
            return 0;
        }
        auto ciphertext = std::vector<char>(size);
        auto bytes = source.read(ciphertext.data(), size);
        if(bytes == 0) {
            verify();
            return 0;
        }
        hmac->update(ciphertext.data(), bytes);
        transform(context.get(), ciphertext.data(), buffer, bytes);
        return bytes;
    }

private:
    void unwrapPrivateOptions(const std::map<std::string, std::string>& annotations, const DecryptConfig& config) {
        auto it = annotations.find(ANNOTATION_KEYS_PKCS1);
        if(it == annotations.cend() || it->second.empty()) {
            auto message = boost::format("Layer is missing the %s annotation") % ANNOTATION_KEYS_PKCS1;
            CARRIER_THROW_ERROR(message.str());
        }
        if(config.privateKeys.empty()) {
            CARRIER_THROW_ERROR("No private keys specified for layer decryption");
        }

        auto wrappedKeys = std::vector<std::string>{};
        boost::split(wrappedKeys, it->second, boost::is_any_of(","));

        for(const auto& privateKey : config.privateKeys) {
            auto pkey = loadPrivateKeyPEM(privateKey.pem, privateKey.passphrase);
            for(const auto& wrapped : wrappedKeys) {
                try {
                    auto options = unwrapKey(pkey.get(), base64::decode(wrapped));
                    parsePrivateOptions(options);
                    return;
                }
                catch(const libcarrier::Error& e) {
                    printLog(boost::format("Wrapped layer key does not match private key: %s") % e.what(),
                             libcarrier::LogLevel::DEBUG);
                }
            }
        }
        CARRIER_THROW_ERROR("No suitable private key found for decrypting the layer key");
    }

    void parsePrivateOptions(const std::string& options) {
        auto document = rapidjson::Document{};
        document = json::parse(options);
        auto cipher = json::getString(document, "cipher");
        if(cipher != CIPHER_AES_256_CTR_HMAC_SHA256) {
            auto message = boost::format("Unsupported layer cipher \"%s\"") % cipher;
            CARRIER_THROW_ERROR(message.str());
        }
        key = base64::decode(json::getString(document, "symkey"));
        if(!document.HasMember("cipheroptions")) {
            CARRIER_THROW_ERROR("Layer cipher options are missing the nonce");
        }
        nonce = base64::decode(json::getString(document["cipheroptions"], "nonce"));
        if(key.size() != SYMMETRIC_KEY_SIZE || nonce.size() != NONCE_SIZE) {
            auto message = boost::format("Invalid layer key or nonce size (%d, %d)") % key.size() % nonce.size();
            CARRIER_THROW_ERROR(message.str());
        }
    }

    void parsePublicOptions(const std::map<std::string, std::string>& annotations) {
        auto it = annotations.find(ANNOTATION_PUBOPTS);
        if(it == annotations.cend()) {
            auto message = boost::format("Layer is missing the %s annotation") % ANNOTATION_PUBOPTS;
            CARRIER_THROW_ERROR(message.str());
        }
        auto document = rapidjson::Document{};
        document = json::parse(base64::decode(it->second));
        expectedHMAC = base64::decode(json::getString(document, "hmac"));
    }

    void verify() {
        if(verified) {
            return;
        }
        if(!equalSecrets(hmac->final(), expectedHMAC)) {
            CARRIER_THROW_TYPED_ERROR(libcarrier::DigestMismatchError, "HMAC of encrypted layer does not match");
        }
        verified = true;
    }

    stream::Reader& source;
    std::string key;
    std::string nonce;
    std::string expectedHMAC;
    CipherContext context;
    std::unique_ptr<HMAC> hmac;
    bool verified = false;
};

DecryptingReader::DecryptingReader(stream::Reader& source,
                                   const std::map<std::string, std::string>& annotations,
                                   const DecryptConfig& config)
    : impl{new Impl{source, annotations, config}}
{}

DecryptingReader::~DecryptingReader() = default;

size_t DecryptingReader::read(char* buffer, size_t size) {
    return impl->read(buffer, size);
}

}
}
