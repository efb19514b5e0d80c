/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef carrier_transports_localPaths_hpp
#define carrier_transports_localPaths_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>


namespace carrier {
namespace transports {
namespace localpaths {

// Absolute path with the symlinks of the existing part resolved
boost::filesystem::path resolvePath(const boost::filesystem::path& path);

// The parent directories of the path, most specific first, excluding "/"
std::vector<std::string> pathNamespaces(const std::string& resolvedPath);

// Throws unless scope is an absolute, canonical path other than "/"
void validatePathScope(const std::string& scope);

}
}
}

#endif
