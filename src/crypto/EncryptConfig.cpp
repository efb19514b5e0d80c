/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "EncryptConfig.hpp"

#include <boost/format.hpp>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"


namespace carrier {
namespace crypto {

static std::string readKeyFile(const boost::filesystem::path& file) {
    if(!boost::filesystem::exists(file)) {
        auto message = boost::format("Key file %s does not exist") % file;
        CARRIER_THROW_ERROR(message.str());
    }
    try {
        return libcarrier::filesystem::readFile(file);
    }
    catch(const libcarrier::Error& e) {
        auto message = boost::format("Failed to read key file %s") % file;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

EncryptConfig EncryptConfig::fromKeyFiles(const std::vector<boost::filesystem::path>& files) {
    auto config = EncryptConfig{};
    for(const auto& file : files) {
        config.publicKeysPEM.push_back(readKeyFile(file));
    }
    return config;
}

DecryptConfig DecryptConfig::fromKeyFiles(const std::vector<boost::filesystem::path>& files) {
    auto config = DecryptConfig{};
    for(const auto& file : files) {
        config.privateKeys.push_back(PrivateKey{readKeyFile(file), boost::none});
    }
    return config;
}

}
}
