/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "base64.hpp"

#include <vector>
#include <algorithm>

#include <boost/format.hpp>
#include <openssl/evp.h>

#include "libcarrier/Error.hpp"


namespace libcarrier {
namespace base64 {

std::string encode(const std::string& data) {
    auto buffer = std::vector<unsigned char>(4 * ((data.size() + 2) / 3) + 1);
    auto length = EVP_EncodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

std::string decode(const std::string& encoded) {
    if(encoded.size() % 4 != 0) {
        auto message = boost::format("Failed to decode base64 data: invalid length %d") % encoded.size();
        CARRIER_THROW_ERROR(message.str());
    }
    if(encoded.empty()) {
        return "";
    }

    auto buffer = std::vector<unsigned char>(3 * encoded.size() / 4 + 1);
    auto length = EVP_DecodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(length < 0) {
        CARRIER_THROW_ERROR("Failed to decode base64 data: invalid character in input");
    }

    // EVP_DecodeBlock counts padding characters as zero-valued output bytes
    auto padding = encoded.size() - encoded.find_last_not_of('=') - 1;
    return std::string(reinterpret_cast<const char*>(buffer.data()), length - padding);
}

std::string decodeURL(const std::string& encoded) {
    auto standard = encoded;
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    while(standard.size() % 4 != 0) {
        standard += '=';
    }
    return decode(standard);
}

}}
