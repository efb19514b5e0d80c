/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "localPaths.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libcarrier/Error.hpp"


namespace carrier {
namespace transports {
namespace localpaths {

boost::filesystem::path resolvePath(const boost::filesystem::path& path) {
    try {
        return boost::filesystem::weakly_canonical(boost::filesystem::absolute(path));
    }
    catch(const boost::filesystem::filesystem_error& e) {
        auto message = boost::format("Failed to resolve path %s: %s") % path % e.what();
        CARRIER_THROW_ERROR(message.str());
    }
}

std::vector<std::string> pathNamespaces(const std::string& resolvedPath) {
    auto namespaces = std::vector<std::string>{};
    auto path = resolvedPath;
    while(true) {
        auto lastSlash = path.rfind('/');
        if(lastSlash == std::string::npos || lastSlash == 0) {
            break;
        }
        path = path.substr(0, lastSlash);
        namespaces.push_back(path);
    }
    return namespaces;
}

void validatePathScope(const std::string& scope) {
    if(scope.empty() || scope[0] != '/') {
        auto message = boost::format("Invalid scope %s: Must be an absolute path") % scope;
        CARRIER_THROW_ERROR(message.str());
    }
    if(scope == "/") {
        CARRIER_THROW_ERROR("Invalid scope \"/\": Use the generic default scope \"\"");
    }
    auto cleaned = boost::filesystem::path{scope}.lexically_normal().string();
    // a trailing separator is normalized to "/."
    if(cleaned.size() > 2 && boost::ends_with(cleaned, "/.")) {
        cleaned.resize(cleaned.size() - 2);
    }
    if(cleaned != scope) {
        auto message = boost::format("Invalid scope %s: Uses non-canonical format, perhaps try %s") % scope % cleaned;
        CARRIER_THROW_ERROR(message.str());
    }
}

}
}
}
