/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_test_utility_config_hpp
#define carrier_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "libcarrier/PathRAII.hpp"
#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * A configuration read from a temporary installation prefix,
 * which is removed together with this object.
 */
struct ConfigRAII {
    libcarrier::PathRAII prefixDir;
    libcarrier::PathRAII tempDir;
    std::shared_ptr<carrier::common::Config> config;
};

// Members of extraMembers (a JSON object) are added to the generated carrier.json
ConfigRAII makeConfig(const std::string& extraMembers = "{}");

boost::filesystem::path getRepoRootDir();

}
}

#endif
