/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Digester.hpp"

#include <vector>
#include <iomanip>
#include <sstream>

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace image {

static const EVP_MD* getMessageDigest(const std::string& algorithm) {
    if(algorithm == Digest::SHA256) {
        return EVP_sha256();
    }
    else if(algorithm == Digest::SHA512) {
        return EVP_sha512();
    }
    auto message = boost::format("unsupported digest algorithm %s") % algorithm;
    CARRIER_THROW_ERROR(message.str());
}

Digester::Digester(const std::string& algorithm)
    : algorithm{algorithm}
    , context{EVP_MD_CTX_new()}
{
    if(!context) {
        CARRIER_THROW_ERROR("Failed to allocate message digest context");
    }
    if(EVP_DigestInit_ex(context.get(), getMessageDigest(algorithm), nullptr) != 1) {
        auto message = boost::format("Failed to initialize %s message digest") % algorithm;
        CARRIER_THROW_ERROR(message.str());
    }
}

void Digester::update(const char* data, size_t size) {
    if(size == 0) {
        return;
    }
    if(EVP_DigestUpdate(context.get(), data, size) != 1) {
        auto message = boost::format("Failed to update %s message digest") % algorithm;
        CARRIER_THROW_ERROR(message.str());
    }
}

Digest Digester::digest() const {
    auto copy = std::unique_ptr<EVP_MD_CTX, ContextDeleter>{EVP_MD_CTX_new()};
    if(!copy || EVP_MD_CTX_copy_ex(copy.get(), context.get()) != 1) {
        CARRIER_THROW_ERROR("Failed to copy message digest context");
    }

    auto hash = std::vector<unsigned char>(EVP_MAX_MD_SIZE);
    auto length = 0u;
    if(EVP_DigestFinal_ex(copy.get(), hash.data(), &length) != 1) {
        auto message = boost::format("Failed to finalize %s message digest") % algorithm;
        CARRIER_THROW_ERROR(message.str());
    }

    auto hex = std::ostringstream{};
    hex << std::hex << std::setfill('0');
    for(auto i=0u; i<length; ++i) {
        hex << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return Digest::parse(algorithm + ":" + hex.str());
}

}
}
