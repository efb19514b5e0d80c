/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "libcarrier/utility/logging.hpp"

namespace libcarrier {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    path = std::move(rhs.path);
    rhs.release();
    return *this;
}

PathRAII::~PathRAII() {
    if(path) {
        // destructors must not throw: report the failure and leave the leftovers behind
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(*path, ec);
        if(ec) {
            logMessage(boost::format("Failed to remove %s: %s") % *path % ec.message(), LogLevel::WARN);
        }
    }
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

void PathRAII::release() {
    path.reset();
}

PathRAII makeTemporaryDirectory(const boost::filesystem::path& parent, const std::string& prefix) {
    auto directory = filesystem::makeUniquePathWithRandomSuffix(parent / prefix);
    filesystem::createFoldersIfNecessary(directory);
    return PathRAII{directory};
}

}
